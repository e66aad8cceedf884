#include "cradle/config/toml_codec.h"

#include "cradle/config/config.h"
#include "cradle/utils/logger.h"

#include <cstdint>
#include <cstdio>
#include <map>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <toml.hpp>

namespace cradle {

namespace {

/// Thrown while walking a parsed document; converted to PARSE_ERROR by decode_toml.
class DecodeError : public std::runtime_error {
public:
    DecodeError(const std::string& key, const std::string& what)
        : std::runtime_error("key \"" + key + "\": " + what) {}
};

template <typename T>
void read_key(const toml::value& table, const std::string& key, T& out) {
    if (!table.contains(key)) {
        return;
    }
    try {
        out = toml::find<T>(table, key);
    } catch (const std::exception& e) {
        throw DecodeError(key, e.what());
    }
}

/// Sub-table of parent, or nullptr when absent.
const toml::value* find_table(const toml::value& parent, const std::string& key) {
    if (!parent.contains(key)) {
        return nullptr;
    }
    const auto& value = toml::find(parent, key);
    if (!value.is_table()) {
        throw DecodeError(key, "expected a table");
    }
    return &value;
}

// ============================================================================
// Decoding
// ============================================================================

void decode_root(const toml::value& table, RootConfig& root) {
    read_key(table, "root", root.root);
    read_key(table, "runroot", root.runroot);
    read_key(table, "imagestore", root.imagestore);
    read_key(table, "storage_driver", root.storage_driver);
    read_key(table, "storage_option", root.storage_option);
    read_key(table, "log_dir", root.log_dir);
    read_key(table, "version_file", root.version_file);
    read_key(table, "version_file_persist", root.version_file_persist);
    read_key(table, "clean_shutdown_file", root.clean_shutdown_file);
    read_key(table, "internal_wipe", root.internal_wipe);
    read_key(table, "internal_repair", root.internal_repair);
}

void decode_api(const toml::value& table, ApiConfig& api) {
    read_key(table, "listen", api.listen);
    read_key(table, "stream_address", api.stream_address);
    read_key(table, "stream_port", api.stream_port);
    read_key(table, "stream_enable_tls", api.stream_enable_tls);
    read_key(table, "stream_tls_cert", api.stream_tls_cert);
    read_key(table, "stream_tls_key", api.stream_tls_key);
    read_key(table, "stream_tls_ca", api.stream_tls_ca);
    read_key(table, "stream_idle_timeout", api.stream_idle_timeout);
    read_key(table, "grpc_max_send_msg_size", api.grpc_max_send_msg_size);
    read_key(table, "grpc_max_recv_msg_size", api.grpc_max_recv_msg_size);
}

void decode_handler(const toml::value& table, RuntimeHandler& handler) {
    read_key(table, "runtime_path", handler.runtime_path);
    read_key(table, "runtime_config_path", handler.runtime_config_path);
    read_key(table, "runtime_type", handler.runtime_type);
    read_key(table, "runtime_root", handler.runtime_root);
    read_key(table, "privileged_without_host_devices", handler.privileged_without_host_devices);
    read_key(table, "allowed_annotations", handler.allowed_annotations);
    read_key(table, "monitor_path", handler.monitor_path);
    read_key(table, "monitor_cgroup", handler.monitor_cgroup);
    read_key(table, "monitor_env", handler.monitor_env);
    read_key(table, "monitor_exec_cgroup", handler.monitor_exec_cgroup);
    read_key(table, "platform_runtime_paths", handler.platform_runtime_paths);
    read_key(table, "runtime_pull_image", handler.runtime_pull_image);
}

void decode_workload(const toml::value& table, WorkloadConfig& workload) {
    read_key(table, "activation_annotation", workload.activation_annotation);
    read_key(table, "annotation_prefix", workload.annotation_prefix);
    read_key(table, "allowed_annotations", workload.allowed_annotations);

    if (const auto* resources = find_table(table, "resources")) {
        read_key(*resources, "cpushares", workload.resources.cpushares);
        read_key(*resources, "cpuquota", workload.resources.cpuquota);
        read_key(*resources, "cpuperiod", workload.resources.cpuperiod);
        read_key(*resources, "cpuset", workload.resources.cpuset);
    }
}

void decode_runtime(const toml::value& table, RuntimeConfig& runtime) {
    read_key(table, "default_runtime", runtime.default_runtime);

    read_key(table, "conmon", runtime.conmon);
    read_key(table, "conmon_cgroup", runtime.conmon_cgroup);
    read_key(table, "conmon_env", runtime.conmon_env);

    read_key(table, "selinux", runtime.selinux);
    read_key(table, "seccomp_profile", runtime.seccomp_profile);
    read_key(table, "seccomp_use_default_when_empty", runtime.seccomp_use_default_when_empty);
    read_key(table, "apparmor_profile", runtime.apparmor_profile);
    read_key(table, "blockio_config_file", runtime.blockio_config_file);
    read_key(table, "blockio_reload", runtime.blockio_reload);
    read_key(table, "rdt_config_file", runtime.rdt_config_file);
    read_key(table, "default_capabilities", runtime.default_capabilities);
    read_key(table, "add_inheritable_capabilities", runtime.add_inheritable_capabilities);
    read_key(table, "hostnetwork_disable_selinux", runtime.hostnetwork_disable_selinux);

    read_key(table, "cgroup_manager", runtime.cgroup_manager);
    read_key(table, "separate_pull_cgroup", runtime.separate_pull_cgroup);
    read_key(table, "default_ulimits", runtime.default_ulimits);
    read_key(table, "default_sysctls", runtime.default_sysctls);
    read_key(table, "allowed_devices", runtime.allowed_devices);
    read_key(table, "additional_devices", runtime.additional_devices);
    read_key(table, "cdi_spec_dirs", runtime.cdi_spec_dirs);
    read_key(table, "device_ownership_from_security_context", runtime.device_ownership_from_security_context);
    read_key(table, "pids_limit", runtime.pids_limit);
    read_key(table, "infra_ctr_cpuset", runtime.infra_ctr_cpuset);
    read_key(table, "shared_cpuset", runtime.shared_cpuset);
    read_key(table, "irqbalance_config_file", runtime.irqbalance_config_file);
    read_key(table, "irqbalance_config_restore_file", runtime.irqbalance_config_restore_file);

    read_key(table, "default_env", runtime.default_env);
    read_key(table, "hooks_dir", runtime.hooks_dir);
    read_key(table, "default_mounts_file", runtime.default_mounts_file);
    read_key(table, "absent_mount_sources_to_reject", runtime.absent_mount_sources_to_reject);
    read_key(table, "no_pivot", runtime.no_pivot);
    read_key(table, "decryption_keys_path", runtime.decryption_keys_path);
    read_key(table, "container_exits_dir", runtime.container_exits_dir);
    read_key(table, "container_attach_socket_dir", runtime.container_attach_socket_dir);
    read_key(table, "bind_mount_prefix", runtime.bind_mount_prefix);
    read_key(table, "read_only", runtime.read_only);
    read_key(table, "log_size_max", runtime.log_size_max);
    read_key(table, "log_to_journald", runtime.log_to_journald);
    read_key(table, "ctr_stop_timeout", runtime.ctr_stop_timeout);
    read_key(table, "minimum_mappable_uid", runtime.minimum_mappable_uid);
    read_key(table, "minimum_mappable_gid", runtime.minimum_mappable_gid);
    read_key(table, "timezone", runtime.timezone);

    read_key(table, "drop_infra_ctr", runtime.drop_infra_ctr);
    read_key(table, "namespaces_dir", runtime.namespaces_dir);
    read_key(table, "pinns_path", runtime.pinns_path);
    read_key(table, "enable_criu_support", runtime.enable_criu_support);
    read_key(table, "enable_pod_events", runtime.enable_pod_events);
    read_key(table, "disable_hostport_mapping", runtime.disable_hostport_mapping);

    read_key(table, "log_level", runtime.log_level);
    read_key(table, "log_filter", runtime.log_filter);

    // Entries merge onto an existing handler or workload of the same name.
    if (const auto* runtimes = find_table(table, "runtimes")) {
        for (const auto& [name, value] : runtimes->as_table()) {
            if (!value.is_table()) {
                throw DecodeError("runtimes." + name, "expected a table");
            }
            decode_handler(value, runtime.runtimes[name]);
        }
    }
    if (const auto* workloads = find_table(table, "workloads")) {
        for (const auto& [name, value] : workloads->as_table()) {
            if (!value.is_table()) {
                throw DecodeError("workloads." + name, "expected a table");
            }
            decode_workload(value, runtime.workloads[name]);
        }
    }
}

void decode_image(const toml::value& table, ImageConfig& image, const std::string& source) {
    read_key(table, "default_transport", image.default_transport);
    read_key(table, "global_auth_file", image.global_auth_file);
    read_key(table, "pause_image", image.pause_image);
    read_key(table, "pause_image_auth_file", image.pause_image_auth_file);
    read_key(table, "pause_command", image.pause_command);
    read_key(table, "pinned_images", image.pinned_images);
    read_key(table, "signature_policy", image.signature_policy);
    read_key(table, "signature_policy_dir", image.signature_policy_dir);
    read_key(table, "insecure_registries", image.insecure_registries);
    read_key(table, "image_volumes", image.image_volumes);
    read_key(table, "big_files_temporary_dir", image.big_files_temporary_dir);
    read_key(table, "auto_reload_registries", image.auto_reload_registries);
    read_key(table, "pull_progress_timeout", image.pull_progress_timeout);

    // Accepted for old fragments, never applied.
    std::vector<std::string> registries;
    read_key(table, "registries", registries);
    if (!registries.empty()) {
        LoggerFactory::get_logger("cradle.config").warn(
            "Support for the 'registries' option has been dropped but it is referenced in " + source +
            ". Please use unqualified-search-registries in registries.conf instead");
    }
}

void decode_network(const toml::value& table, NetworkConfig& network) {
    read_key(table, "cni_default_network", network.cni_default_network);
    read_key(table, "network_dir", network.network_dir);
    read_key(table, "plugin_dir", network.plugin_dir);
    read_key(table, "plugin_dirs", network.plugin_dirs);
}

void decode_metrics(const toml::value& table, MetricsConfig& metrics) {
    read_key(table, "enable_metrics", metrics.enable_metrics);
    read_key(table, "metrics_collectors", metrics.metrics_collectors);
    read_key(table, "metrics_host", metrics.metrics_host);
    read_key(table, "metrics_port", metrics.metrics_port);
    read_key(table, "metrics_socket", metrics.metrics_socket);
    read_key(table, "metrics_cert", metrics.metrics_cert);
    read_key(table, "metrics_key", metrics.metrics_key);
}

void decode_tracing(const toml::value& table, TracingConfig& tracing) {
    read_key(table, "enable_tracing", tracing.enable_tracing);
    read_key(table, "tracing_endpoint", tracing.tracing_endpoint);
    read_key(table, "tracing_sampling_rate_per_million", tracing.tracing_sampling_rate_per_million);
}

void decode_stats(const toml::value& table, StatsConfig& stats) {
    read_key(table, "stats_collection_period", stats.stats_collection_period);
    read_key(table, "collection_period", stats.collection_period);
}

void decode_nri(const toml::value& table, NriConfig& nri) {
    read_key(table, "enable_nri", nri.enable_nri);
    read_key(table, "nri_listen", nri.nri_listen);
    read_key(table, "nri_plugin_dir", nri.nri_plugin_dir);
    read_key(table, "nri_plugin_config_dir", nri.nri_plugin_config_dir);
    read_key(table, "nri_plugin_registration_timeout", nri.nri_plugin_registration_timeout);
    read_key(table, "nri_plugin_request_timeout", nri.nri_plugin_request_timeout);
    read_key(table, "nri_disable_connections", nri.nri_disable_connections);
}

// ============================================================================
// Encoding
// ============================================================================

/**
 * @brief Line-oriented TOML emitter
 */
class TomlWriter {
public:
    void table(const std::vector<std::string>& path) {
        if (!first_table_) {
            oss_ << "\n";
        }
        first_table_ = false;
        oss_ << "[";
        for (size_t i = 0; i < path.size(); ++i) {
            if (i > 0) {
                oss_ << ".";
            }
            oss_ << toml_key(path[i]);
        }
        oss_ << "]\n";
    }

    void put(const std::string& key, const std::string& value) {
        oss_ << toml_key(key) << " = " << quote_toml_string(value) << "\n";
    }

    void put(const std::string& key, bool value) {
        oss_ << toml_key(key) << " = " << (value ? "true" : "false") << "\n";
    }

    void put(const std::string& key, int64_t value) {
        oss_ << toml_key(key) << " = " << value << "\n";
    }

    void put(const std::string& key, const std::vector<std::string>& values) {
        oss_ << toml_key(key) << " = [";
        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) {
                oss_ << ", ";
            }
            oss_ << quote_toml_string(values[i]);
        }
        oss_ << "]\n";
    }

    void put(const std::string& key, const std::map<std::string, std::string>& values) {
        oss_ << toml_key(key) << " = {";
        bool first = true;
        for (const auto& [name, value] : values) {
            oss_ << (first ? " " : ", ") << toml_key(name) << " = " << quote_toml_string(value);
            first = false;
        }
        oss_ << (values.empty() ? "}" : " }") << "\n";
    }

    [[nodiscard]] std::string str() const { return oss_.str(); }

private:
    std::ostringstream oss_;
    bool first_table_ = true;
};

void encode_handler(TomlWriter& out, const std::string& name, const RuntimeHandler& handler) {
    out.table({"cradle", "runtime", "runtimes", name});
    out.put("runtime_path", handler.runtime_path);
    out.put("runtime_config_path", handler.runtime_config_path);
    out.put("runtime_type", handler.runtime_type);
    out.put("runtime_root", handler.runtime_root);
    out.put("privileged_without_host_devices", handler.privileged_without_host_devices);
    out.put("allowed_annotations", handler.allowed_annotations);
    out.put("monitor_path", handler.monitor_path);
    out.put("monitor_cgroup", handler.monitor_cgroup);
    out.put("monitor_env", handler.monitor_env);
    out.put("monitor_exec_cgroup", handler.monitor_exec_cgroup);
    out.put("platform_runtime_paths", handler.platform_runtime_paths);
    out.put("runtime_pull_image", handler.runtime_pull_image);
}

void encode_workload(TomlWriter& out, const std::string& name, const WorkloadConfig& workload) {
    out.table({"cradle", "runtime", "workloads", name});
    out.put("activation_annotation", workload.activation_annotation);
    out.put("annotation_prefix", workload.annotation_prefix);
    out.put("allowed_annotations", workload.allowed_annotations);

    out.table({"cradle", "runtime", "workloads", name, "resources"});
    out.put("cpushares", workload.resources.cpushares);
    out.put("cpuquota", workload.resources.cpuquota);
    out.put("cpuperiod", workload.resources.cpuperiod);
    out.put("cpuset", workload.resources.cpuset);
}

void encode_runtime(TomlWriter& out, const RuntimeConfig& runtime) {
    out.table({"cradle", "runtime"});
    out.put("default_runtime", runtime.default_runtime);
    out.put("conmon", runtime.conmon);
    out.put("conmon_cgroup", runtime.conmon_cgroup);
    out.put("conmon_env", runtime.conmon_env);

    out.put("selinux", runtime.selinux);
    out.put("seccomp_profile", runtime.seccomp_profile);
    out.put("seccomp_use_default_when_empty", runtime.seccomp_use_default_when_empty);
    out.put("apparmor_profile", runtime.apparmor_profile);
    out.put("blockio_config_file", runtime.blockio_config_file);
    out.put("blockio_reload", runtime.blockio_reload);
    out.put("rdt_config_file", runtime.rdt_config_file);
    out.put("default_capabilities", runtime.default_capabilities);
    out.put("add_inheritable_capabilities", runtime.add_inheritable_capabilities);
    out.put("hostnetwork_disable_selinux", runtime.hostnetwork_disable_selinux);

    out.put("cgroup_manager", runtime.cgroup_manager);
    out.put("separate_pull_cgroup", runtime.separate_pull_cgroup);
    out.put("default_ulimits", runtime.default_ulimits);
    out.put("default_sysctls", runtime.default_sysctls);
    out.put("allowed_devices", runtime.allowed_devices);
    out.put("additional_devices", runtime.additional_devices);
    out.put("cdi_spec_dirs", runtime.cdi_spec_dirs);
    out.put("device_ownership_from_security_context", runtime.device_ownership_from_security_context);
    out.put("pids_limit", runtime.pids_limit);
    out.put("infra_ctr_cpuset", runtime.infra_ctr_cpuset);
    out.put("shared_cpuset", runtime.shared_cpuset);
    out.put("irqbalance_config_file", runtime.irqbalance_config_file);
    out.put("irqbalance_config_restore_file", runtime.irqbalance_config_restore_file);

    out.put("default_env", runtime.default_env);
    out.put("hooks_dir", runtime.hooks_dir);
    out.put("default_mounts_file", runtime.default_mounts_file);
    out.put("absent_mount_sources_to_reject", runtime.absent_mount_sources_to_reject);
    out.put("no_pivot", runtime.no_pivot);
    out.put("decryption_keys_path", runtime.decryption_keys_path);
    out.put("container_exits_dir", runtime.container_exits_dir);
    out.put("container_attach_socket_dir", runtime.container_attach_socket_dir);
    out.put("bind_mount_prefix", runtime.bind_mount_prefix);
    out.put("read_only", runtime.read_only);
    out.put("log_size_max", runtime.log_size_max);
    out.put("log_to_journald", runtime.log_to_journald);
    out.put("ctr_stop_timeout", runtime.ctr_stop_timeout);
    out.put("minimum_mappable_uid", runtime.minimum_mappable_uid);
    out.put("minimum_mappable_gid", runtime.minimum_mappable_gid);
    out.put("timezone", runtime.timezone);

    out.put("drop_infra_ctr", runtime.drop_infra_ctr);
    out.put("namespaces_dir", runtime.namespaces_dir);
    out.put("pinns_path", runtime.pinns_path);
    out.put("enable_criu_support", runtime.enable_criu_support);
    out.put("enable_pod_events", runtime.enable_pod_events);
    out.put("disable_hostport_mapping", runtime.disable_hostport_mapping);

    out.put("log_level", runtime.log_level);
    out.put("log_filter", runtime.log_filter);

    for (const auto& [name, handler] : runtime.runtimes) {
        encode_handler(out, name, handler);
    }
    for (const auto& [name, workload] : runtime.workloads) {
        encode_workload(out, name, workload);
    }
}

bool is_bare_key(const std::string& key) {
    if (key.empty()) {
        return false;
    }
    for (char c : key) {
        bool bare = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!bare) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

std::string quote_toml_string(const std::string& value) {
    std::string quoted = "\"";
    for (unsigned char c : value) {
        switch (c) {
            case '"':  quoted += "\\\""; break;
            case '\\': quoted += "\\\\"; break;
            case '\b': quoted += "\\b"; break;
            case '\t': quoted += "\\t"; break;
            case '\n': quoted += "\\n"; break;
            case '\f': quoted += "\\f"; break;
            case '\r': quoted += "\\r"; break;
            default:
                if (c < 0x20 || c == 0x7f) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    quoted += buf;
                } else {
                    quoted += static_cast<char>(c);
                }
        }
    }
    quoted += "\"";
    return quoted;
}

std::string toml_key(const std::string& key) {
    return is_bare_key(key) ? key : quote_toml_string(key);
}

Status decode_toml(const std::string& content, const std::string& source, Configuration& config) {
    try {
        std::istringstream stream(content);
        auto data = toml::parse(stream, source);

        const auto* product = find_table(data, "cradle");
        if (product == nullptr) {
            return {};
        }

        decode_root(*product, config.root);
        if (const auto* api = find_table(*product, "api")) {
            decode_api(*api, config.api);
        }
        if (const auto* runtime = find_table(*product, "runtime")) {
            decode_runtime(*runtime, config.runtime);
        }
        if (const auto* image = find_table(*product, "image")) {
            decode_image(*image, config.image, source);
        }
        if (const auto* network = find_table(*product, "network")) {
            decode_network(*network, config.network);
        }
        if (const auto* metrics = find_table(*product, "metrics")) {
            decode_metrics(*metrics, config.metrics);
        }
        if (const auto* tracing = find_table(*product, "tracing")) {
            decode_tracing(*tracing, config.tracing);
        }
        if (const auto* stats = find_table(*product, "stats")) {
            decode_stats(*stats, config.stats);
        }
        if (const auto* nri = find_table(*product, "nri")) {
            decode_nri(*nri, config.nri);
        }
    } catch (const std::exception& e) {
        return make_error(ErrorCode::PARSE_ERROR, "unable to decode configuration " + source + ": " + e.what());
    }
    return {};
}

std::string encode_toml(const Configuration& config) {
    TomlWriter out;

    out.table({"cradle"});
    out.put("root", config.root.root);
    out.put("runroot", config.root.runroot);
    out.put("imagestore", config.root.imagestore);
    out.put("storage_driver", config.root.storage_driver);
    out.put("storage_option", config.root.storage_option);
    out.put("log_dir", config.root.log_dir);
    out.put("version_file", config.root.version_file);
    out.put("version_file_persist", config.root.version_file_persist);
    out.put("clean_shutdown_file", config.root.clean_shutdown_file);
    out.put("internal_wipe", config.root.internal_wipe);
    out.put("internal_repair", config.root.internal_repair);

    out.table({"cradle", "api"});
    out.put("listen", config.api.listen);
    out.put("stream_address", config.api.stream_address);
    out.put("stream_port", config.api.stream_port);
    out.put("stream_enable_tls", config.api.stream_enable_tls);
    out.put("stream_tls_cert", config.api.stream_tls_cert);
    out.put("stream_tls_key", config.api.stream_tls_key);
    out.put("stream_tls_ca", config.api.stream_tls_ca);
    out.put("stream_idle_timeout", config.api.stream_idle_timeout);
    out.put("grpc_max_send_msg_size", config.api.grpc_max_send_msg_size);
    out.put("grpc_max_recv_msg_size", config.api.grpc_max_recv_msg_size);

    encode_runtime(out, config.runtime);

    out.table({"cradle", "image"});
    out.put("default_transport", config.image.default_transport);
    out.put("global_auth_file", config.image.global_auth_file);
    out.put("pause_image", config.image.pause_image);
    out.put("pause_image_auth_file", config.image.pause_image_auth_file);
    out.put("pause_command", config.image.pause_command);
    out.put("pinned_images", config.image.pinned_images);
    out.put("signature_policy", config.image.signature_policy);
    out.put("signature_policy_dir", config.image.signature_policy_dir);
    out.put("insecure_registries", config.image.insecure_registries);
    out.put("image_volumes", config.image.image_volumes);
    out.put("big_files_temporary_dir", config.image.big_files_temporary_dir);
    out.put("auto_reload_registries", config.image.auto_reload_registries);
    out.put("pull_progress_timeout", config.image.pull_progress_timeout);

    out.table({"cradle", "network"});
    out.put("cni_default_network", config.network.cni_default_network);
    out.put("network_dir", config.network.network_dir);
    out.put("plugin_dir", config.network.plugin_dir);
    out.put("plugin_dirs", config.network.plugin_dirs);

    out.table({"cradle", "metrics"});
    out.put("enable_metrics", config.metrics.enable_metrics);
    out.put("metrics_collectors", config.metrics.metrics_collectors);
    out.put("metrics_host", config.metrics.metrics_host);
    out.put("metrics_port", config.metrics.metrics_port);
    out.put("metrics_socket", config.metrics.metrics_socket);
    out.put("metrics_cert", config.metrics.metrics_cert);
    out.put("metrics_key", config.metrics.metrics_key);

    out.table({"cradle", "tracing"});
    out.put("enable_tracing", config.tracing.enable_tracing);
    out.put("tracing_endpoint", config.tracing.tracing_endpoint);
    out.put("tracing_sampling_rate_per_million", config.tracing.tracing_sampling_rate_per_million);

    out.table({"cradle", "stats"});
    out.put("stats_collection_period", config.stats.stats_collection_period);
    out.put("collection_period", config.stats.collection_period);

    out.table({"cradle", "nri"});
    out.put("enable_nri", config.nri.enable_nri);
    out.put("nri_listen", config.nri.nri_listen);
    out.put("nri_plugin_dir", config.nri.nri_plugin_dir);
    out.put("nri_plugin_config_dir", config.nri.nri_plugin_config_dir);
    out.put("nri_plugin_registration_timeout", config.nri.nri_plugin_registration_timeout);
    out.put("nri_plugin_request_timeout", config.nri.nri_plugin_request_timeout);
    out.put("nri_disable_connections", config.nri.nri_disable_connections);

    return out.str();
}

} // namespace cradle
