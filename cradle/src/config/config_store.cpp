#include "cradle/config/config_store.h"

#include "cradle/utils/logger.h"

#include <optional>
#include <regex>

namespace cradle {

Result<Configuration> load_configuration(const ConfigSources& sources) {
    auto storage = StorageDefaults::load(sources.storage_conf);
    if (!storage) {
        return std::unexpected(storage.error());
    }

    auto config = Configuration::defaults(*storage);
    if (!sources.config_file.empty()) {
        if (auto status = config.update_from_file(sources.config_file); !status) {
            return std::unexpected(status.error());
        }
    }
    if (!sources.config_dir.empty()) {
        if (auto status = config.update_from_path(sources.config_dir); !status) {
            return std::unexpected(status.error());
        }
    }
    if (sources.apply_environment) {
        config.apply_environment_overrides();
    }
    return config;
}

Status apply_logging_settings(const RuntimeConfig& runtime) {
    auto level = log_level_from_string(runtime.log_level);
    if (!level) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "invalid log_level \"" + runtime.log_level + "\"");
    }

    std::optional<std::regex> filter;
    if (!runtime.log_filter.empty()) {
        try {
            filter.emplace(runtime.log_filter);
        } catch (const std::regex_error& e) {
            return make_error(ErrorCode::INVALID_ARGUMENT,
                              "invalid log_filter \"" + runtime.log_filter + "\": " + e.what());
        }
    }

    LoggerFactory::set_global_level(*level);
    LoggerFactory::set_message_filter(std::move(filter));
    return {};
}

// ============================================================================
// ConfigStore
// ============================================================================

ConfigStore::ConfigStore(ConfigSources sources, ValidationContext ctx)
    : sources_(std::move(sources))
    , ctx_(std::move(ctx)) {
}

Status ConfigStore::load() {
    return load_from(sources_);
}

Status ConfigStore::reload() {
    ConfigSources sources = sources_;
    if (auto snapshot = current()) {
        sources.config_file = snapshot->config().single_config_path();
        sources.config_dir = snapshot->config().drop_in_config_dir();
    }

    LoggerFactory::get_logger("cradle.config").info("Reloading configuration");
    if (auto status = load_from(sources); !status) {
        LoggerFactory::get_logger("cradle.config").error("Configuration reload failed: " + status.error().message);
        return status;
    }
    return {};
}

std::shared_ptr<const ResolvedConfig> ConfigStore::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

Status ConfigStore::load_from(const ConfigSources& sources) {
    auto config = load_configuration(sources);
    if (!config) {
        return std::unexpected(config.error());
    }

    auto resolved = resolve(*config, ctx_);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }

    if (auto status = apply_logging_settings(resolved->runtime()); !status) {
        return status;
    }

    auto snapshot = std::make_shared<const ResolvedConfig>(std::move(*resolved));
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = std::move(snapshot);
    return {};
}

} // namespace cradle
