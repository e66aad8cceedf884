#include "cradle/config/storage.h"

#include "cradle/host/host_environment.h"
#include "cradle/utils/logger.h"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <sstream>

#include <toml.hpp>

namespace cradle {

namespace {

/// Render a scalar or array option value the way storage.conf users write it.
std::optional<std::string> option_value_to_string(const toml::value& value) {
    if (value.is_string()) {
        return toml::get<std::string>(value);
    }
    if (value.is_boolean()) {
        return toml::get<bool>(value) ? "true" : "false";
    }
    if (value.is_integer()) {
        return std::to_string(toml::get<std::int64_t>(value));
    }
    if (value.is_array()) {
        std::string joined;
        for (const auto& item : value.as_array()) {
            auto rendered = option_value_to_string(item);
            if (!rendered) {
                return std::nullopt;
            }
            if (!joined.empty()) {
                joined += ",";
            }
            joined += *rendered;
        }
        return joined;
    }
    return std::nullopt;
}

Result<StorageDefaults> from_toml_data(const toml::value& data) {
    StorageDefaults defaults;

    if (!data.contains("storage")) {
        return defaults;
    }

    const auto& storage = toml::find(data, "storage");
    if (storage.contains("driver")) {
        defaults.driver = toml::find<std::string>(storage, "driver");
    }
    if (storage.contains("graphroot")) {
        defaults.graph_root = toml::find<std::string>(storage, "graphroot");
    }
    if (storage.contains("runroot")) {
        defaults.run_root = toml::find<std::string>(storage, "runroot");
    }
    if (storage.contains("imagestore")) {
        defaults.image_store = toml::find<std::string>(storage, "imagestore");
    }

    if (!defaults.driver.empty() && storage.contains("options")) {
        const auto& options = toml::find(storage, "options");
        if (options.is_table() && options.contains(defaults.driver)) {
            const auto& driver_options = toml::find(options, defaults.driver);
            if (driver_options.is_table()) {
                std::vector<std::string> keys;
                for (const auto& [key, value] : driver_options.as_table()) {
                    keys.push_back(key);
                }
                std::sort(keys.begin(), keys.end());
                for (const auto& key : keys) {
                    auto rendered = option_value_to_string(toml::find(driver_options, key));
                    if (rendered) {
                        defaults.driver_options.push_back(defaults.driver + "." + key + "=" + *rendered);
                    }
                }
            }
        }
    }

    return defaults;
}

} // anonymous namespace

// ============================================================================
// StorageDefaults
// ============================================================================

Result<StorageDefaults> StorageDefaults::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        CRADLE_DEBUG(LoggerFactory::get_logger("cradle.storage"),
                     "Storage configuration " + path + " not found, using built-in defaults");
        return StorageDefaults{};
    }

    try {
        auto data = toml::parse(path);
        return from_toml_data(data);
    } catch (const std::exception& e) {
        return make_error(ErrorCode::PARSE_ERROR, "unable to decode storage configuration " + path + ": " + e.what());
    }
}

Result<StorageDefaults> StorageDefaults::parse(const std::string& content, const std::string& source) {
    try {
        std::istringstream stream(content);
        auto data = toml::parse(stream, source);
        return from_toml_data(data);
    } catch (const std::exception& e) {
        return make_error(ErrorCode::PARSE_ERROR, "unable to decode storage configuration " + source + ": " + e.what());
    }
}

// ============================================================================
// LocalStore
// ============================================================================

LocalStore::LocalStore(std::shared_ptr<HostEnvironment> host)
    : host_(std::move(host)) {
}

Result<StoreInfo> LocalStore::open(const StoreOptions& options) {
    if (options.graph_root.empty() || options.run_root.empty()) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "the storage root and runroot must both be set");
    }

    if (auto status = host_->mkdir_all(options.graph_root, 0700); !status) {
        return wrap_error(status.error(), "create storage graph root");
    }
    if (auto status = host_->mkdir_all(options.run_root, 0700); !status) {
        return wrap_error(status.error(), "create storage run root");
    }
    if (!options.image_store.empty()) {
        if (auto status = host_->mkdir_all(options.image_store, 0700); !status) {
            return wrap_error(status.error(), "create image store");
        }
    }

    StoreInfo info;
    info.graph_root = options.graph_root;
    info.run_root = options.run_root;
    info.driver = options.driver.empty() ? detect_driver() : options.driver;
    info.driver_options = options.driver_options;

    LoggerFactory::get_logger("cradle.storage").info(
        "Using storage driver " + info.driver + " with graph root " + info.graph_root +
        " and run root " + info.run_root);
    return info;
}

std::string LocalStore::detect_driver() const {
    auto filesystems = host_->read_file("/proc/filesystems");
    if (filesystems && filesystems->find("overlay") != std::string::npos) {
        return "overlay";
    }
    return "vfs";
}

} // namespace cradle
