#include "cradle/config/config.h"
#include "cradle/config/validator.h"

#include "cradle/host/host_environment.h"
#include "cradle/subsys/cni_manager.h"
#include "cradle/utils/logger.h"
#include "cradle/utils/string_utils.h"

#include <algorithm>
#include <filesystem>

namespace cradle {

namespace {

bool is_absolute(const std::string& path) {
    return std::filesystem::path(path).is_absolute();
}

std::string parent_directory(const std::string& path) {
    auto parent = std::filesystem::path(path).parent_path();
    return parent.empty() ? "." : parent.string();
}

/// Duration setting that must be strictly positive.
Status validate_positive_duration(const std::string& key, const std::string& value) {
    auto duration = parse_duration(value);
    if (!duration || duration->count() <= 0) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "invalid " + key + " \"" + value + "\"");
    }
    return {};
}

} // anonymous namespace

// ============================================================================
// Root
// ============================================================================

Status RootConfig::validate(const ValidationContext& ctx) {
    if (!ctx.on_execution()) {
        return {};
    }

    if (!is_absolute(log_dir)) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "log_dir is not an absolute path");
    }
    if (auto status = ctx.host->mkdir_all(log_dir, 0700); !status) {
        return wrap_error(status.error(), "invalid log_dir");
    }

    if (!ctx.store) {
        return make_error(ErrorCode::INTERNAL, "failed to get store to set defaults: no storage store configured");
    }

    StoreOptions options;
    options.graph_root = root;
    options.run_root = runroot;
    options.image_store = imagestore;
    options.driver = storage_driver;
    options.driver_options = storage_option;

    auto store = ctx.store->open(options);
    if (!store) {
        return wrap_error(store.error(), "failed to get store to set defaults");
    }

    // Once the store is open its view wins over the configured values.
    runroot = store->run_root;
    root = store->graph_root;
    storage_driver = store->driver;
    storage_option = store->driver_options;
    return {};
}

std::string RootConfig::clean_shutdown_supported_file_name() const {
    return clean_shutdown_file + ".supported";
}

// ============================================================================
// API
// ============================================================================

Status ApiConfig::validate(const ValidationContext& ctx) {
    if (grpc_max_send_msg_size <= 0) {
        grpc_max_send_msg_size = DEFAULT_GRPC_MAX_MSG_SIZE;
    }
    if (grpc_max_recv_msg_size <= 0) {
        grpc_max_recv_msg_size = DEFAULT_GRPC_MAX_MSG_SIZE;
    }

    if (!stream_idle_timeout.empty() && !parse_duration(stream_idle_timeout)) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "invalid stream_idle_timeout \"" + stream_idle_timeout + "\"");
    }

    if (ctx.on_execution()) {
        return remove_unused_socket(listen, *ctx.host);
    }
    return {};
}

Status remove_unused_socket(const std::string& path, HostEnvironment& host) {
    if (auto status = host.mkdir_all(parent_directory(path), 0755); !status) {
        return wrap_error(status.error(), "creating socket directories");
    }

    if (!host.exists(path)) {
        return {};
    }
    if (host.dial_unix(path)) {
        return make_error(ErrorCode::ALREADY_EXISTS, "already existing connection on " + path);
    }
    if (auto status = host.remove(path); !status) {
        return wrap_error(status.error(), "removing " + path);
    }
    return {};
}

// ============================================================================
// Image
// ============================================================================

Status ImageConfig::validate(const ValidationContext& ctx) {
    if (!is_absolute(signature_policy_dir)) {
        return make_error(ErrorCode::INVALID_ARGUMENT,
                          "signature policy dir \"" + signature_policy_dir + "\" is not absolute");
    }
    if (auto reference = parse_pause_image(); !reference) {
        return wrap_error(reference.error(), "invalid pause image \"" + pause_image + "\"");
    }
    if (!parse_duration(pull_progress_timeout)) {
        return make_error(ErrorCode::INVALID_ARGUMENT,
                          "invalid pull_progress_timeout \"" + pull_progress_timeout + "\"");
    }

    if (ctx.on_execution()) {
        if (auto status = ctx.host->mkdir_all(signature_policy_dir, 0755); !status) {
            return wrap_error(status.error(), "cannot create signature policy dir");
        }
    }
    return {};
}

Result<ImageReference> ImageConfig::parse_pause_image() const {
    return parse_image_reference(pause_image);
}

// ============================================================================
// Network
// ============================================================================

Status NetworkConfig::validate(const ValidationContext& ctx, Subsystems& subsystems) {
    if (!ctx.on_execution()) {
        return {};
    }
    auto& host = *ctx.host;

    if (!host.is_directory(network_dir)) {
        if (host.exists(network_dir)) {
            return make_error(ErrorCode::INVALID_ARGUMENT,
                              "invalid network_dir: " + network_dir + ": not a directory");
        }
        if (auto status = host.mkdir_all(network_dir, 0755); !status) {
            return wrap_error(status.error(), "cannot create network_dir: " + network_dir);
        }
    }

    for (const auto& dir : plugin_dirs) {
        if (auto status = host.mkdir_all(dir, 0755); !status) {
            return wrap_error(status.error(), "invalid plugin_dirs entry");
        }
    }

    // The deprecated single directory is folded into plugin_dirs and then cleared.
    if (!plugin_dir.empty()) {
        LoggerFactory::get_logger("cradle.network").warn(
            "The config field plugin_dir is being deprecated. Please use plugin_dirs instead");
        if (auto status = host.mkdir_all(plugin_dir, 0755); !status) {
            return wrap_error(status.error(), "invalid plugin_dir entry");
        }
        plugin_dirs.push_back(plugin_dir);
        plugin_dir.clear();
    }

    auto manager = std::make_shared<CniManager>(cni_default_network, network_dir, plugin_dirs, ctx.host);
    manager->start();
    subsystems.cni_manager = std::move(manager);
    return {};
}

// ============================================================================
// Metrics, Tracing and Stats
// ============================================================================

const std::vector<std::string>& MetricsConfig::all_collectors() {
    static const std::vector<std::string> collectors = {
        "image_pulls_layer_size",
        "containers_events_dropped_total",
        "containers_oom_total",
        "processes_defunct",
        "operations_total",
        "operations_latency_seconds",
        "operations_latency_seconds_total",
        "operations_errors_total",
        "image_pulls_bytes_total",
        "image_pulls_skipped_bytes_total",
        "image_pulls_failure_total",
        "image_pulls_success_total",
        "image_layer_reuse_total",
        "containers_oom_count_total",
        "containers_seccomp_notifier_count_total",
        "resources_stalled_at_stage",
    };
    return collectors;
}

Status MetricsConfig::validate(const ValidationContext&) const {
    const auto& known = all_collectors();
    for (const auto& collector : metrics_collectors) {
        std::string name = collector;
        for (const std::string prefix : {"cradle_", "container_runtime_"}) {
            if (name.starts_with(prefix)) {
                name = name.substr(prefix.size());
                break;
            }
        }
        if (std::find(known.begin(), known.end(), name) == known.end()) {
            return make_error(ErrorCode::INVALID_ARGUMENT, "invalid metrics collector \"" + collector + "\"");
        }
    }

    if (metrics_port < 0 || metrics_port > 65535) {
        return make_error(ErrorCode::INVALID_ARGUMENT,
                          "metrics_port " + std::to_string(metrics_port) + " is out of range");
    }
    return {};
}

Status TracingConfig::validate(const ValidationContext&) const {
    if (tracing_sampling_rate_per_million < 0 || tracing_sampling_rate_per_million > 1000000) {
        return make_error(ErrorCode::INVALID_ARGUMENT,
                          "tracing_sampling_rate_per_million must be between 0 and 1000000");
    }
    return {};
}

Status StatsConfig::validate(const ValidationContext&) const {
    if (stats_collection_period < 0) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "stats_collection_period must not be negative");
    }
    if (collection_period < 0) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "collection_period must not be negative");
    }
    return {};
}

// ============================================================================
// NRI
// ============================================================================

Status NriConfig::validate(const ValidationContext& ctx) {
    if (!enable_nri) {
        return {};
    }

    if (auto status = validate_positive_duration("nri_plugin_registration_timeout",
                                                 nri_plugin_registration_timeout); !status) {
        return status;
    }
    if (auto status = validate_positive_duration("nri_plugin_request_timeout", nri_plugin_request_timeout);
        !status) {
        return status;
    }

    if (ctx.on_execution()) {
        auto& host = *ctx.host;
        for (const auto& dir : {nri_plugin_dir, nri_plugin_config_dir, parent_directory(nri_listen)}) {
            if (auto status = host.mkdir_all(dir, 0755); !status) {
                return wrap_error(status.error(), "create NRI directory " + dir);
            }
        }
    }
    return {};
}

} // namespace cradle
