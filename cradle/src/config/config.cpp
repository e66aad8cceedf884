#include "cradle/config/config.h"

#include "cradle/config/toml_codec.h"
#include "cradle/utils/logger.h"
#include "cradle/utils/string_utils.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace cradle {

namespace {

Logger& config_logger() {
    return LoggerFactory::get_logger("cradle.config");
}

Result<std::string> read_config_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        auto code = errno == ENOENT ? ErrorCode::NOT_FOUND : ErrorCode::IO_ERROR;
        return make_error(code, "open " + path + ": " + std::strerror(errno));
    }
    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        return make_error(ErrorCode::IO_ERROR, "read " + path);
    }
    return content.str();
}

/// Regular files below dir, visiting entries in path order and descending into subdirectories in place.
Status collect_files(const std::filesystem::path& dir, std::vector<std::string>& files) {
    std::error_code ec;
    std::vector<std::filesystem::path> entries;
    for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        entries.push_back(it->path());
    }
    if (ec) {
        return make_error(ErrorCode::IO_ERROR, "walk " + dir.string() + ": " + ec.message());
    }
    std::sort(entries.begin(), entries.end());

    for (const auto& entry : entries) {
        auto status = std::filesystem::symlink_status(entry, ec);
        if (ec) {
            return make_error(ErrorCode::IO_ERROR, "stat " + entry.string() + ": " + ec.message());
        }
        if (std::filesystem::is_directory(status)) {
            if (auto walked = collect_files(entry, files); !walked) {
                return walked;
            }
            continue;
        }
        files.push_back(entry.string());
    }
    return {};
}

} // anonymous namespace

// ============================================================================
// Enum Conversions
// ============================================================================

std::string to_string(ImageVolumes volumes) {
    switch (volumes) {
        case ImageVolumes::MKDIR:  return "mkdir";
        case ImageVolumes::IGNORE: return "ignore";
        case ImageVolumes::BIND:   return "bind";
        default:                   return "unknown";
    }
}

std::optional<ImageVolumes> image_volumes_from_string(const std::string& volumes_str) {
    if (volumes_str == "mkdir")  return ImageVolumes::MKDIR;
    if (volumes_str == "ignore") return ImageVolumes::IGNORE;
    if (volumes_str == "bind")   return ImageVolumes::BIND;
    return std::nullopt;
}

std::vector<std::string> remove_dup_storage_opts(const std::vector<std::string>& options) {
    std::vector<std::string> result;
    std::set<std::string> seen;
    for (auto it = options.rbegin(); it != options.rend(); ++it) {
        if (seen.insert(*it).second) {
            result.push_back(*it);
        }
    }
    std::reverse(result.begin(), result.end());
    return result;
}

// ============================================================================
// Configuration
// ============================================================================

Configuration Configuration::defaults(const StorageDefaults& storage) {
    Configuration config;

    config.root.root = storage.graph_root;
    config.root.runroot = storage.run_root;
    config.root.imagestore = storage.image_store;
    config.root.storage_driver = storage.driver;
    config.root.storage_option = storage.driver_options;

    config.runtime.runtimes.emplace(std::string(DEFAULT_RUNTIME_NAME), RuntimeHandler::defaults());
    config.runtime.default_capabilities = Capabilities::defaults();

    config.metrics.metrics_collectors = MetricsConfig::all_collectors();

    return config;
}

Status Configuration::update_from_file(const std::string& path) {
    if (auto status = update_from_drop_in_file(path); !status) {
        return status;
    }
    single_config_path_ = path;
    return {};
}

Status Configuration::update_from_drop_in_file(const std::string& path) {
    auto content = read_config_file(path);
    if (!content) {
        return std::unexpected(content.error());
    }
    return update_from_string(*content, path);
}

Status Configuration::update_from_string(const std::string& content, const std::string& source) {
    Configuration merged = *this;

    if (auto status = decode_toml(content, source, merged); !status) {
        return status;
    }

    // Driver options accumulate; the fragment's list restates or extends the current one.
    std::vector<std::string> options = root.storage_option;
    options.insert(options.end(), merged.root.storage_option.begin(), merged.root.storage_option.end());
    merged.root.storage_option = remove_dup_storage_opts(options);

    // An empty value inherits rather than clears.
    if (merged.root.root.empty()) {
        merged.root.root = root.root;
    }
    if (merged.root.runroot.empty()) {
        merged.root.runroot = root.runroot;
    }
    if (merged.root.storage_driver.empty()) {
        merged.root.storage_driver = root.storage_driver;
    }

    *this = std::move(merged);
    CRADLE_DEBUG(config_logger(), "Merged configuration from " + source);
    return {};
}

Status Configuration::update_from_path(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        CRADLE_DEBUG(config_logger(), "Drop-in directory " + path + " does not exist, skipping");
        return {};
    }

    std::vector<std::string> files;
    if (std::filesystem::is_directory(path, ec)) {
        if (auto status = collect_files(path, files); !status) {
            return status;
        }
    } else {
        files.push_back(path);
    }

    Configuration merged = *this;
    for (const auto& file : files) {
        if (auto status = merged.update_from_drop_in_file(file); !status) {
            return status;
        }
    }
    merged.drop_in_config_dir_ = path;

    *this = std::move(merged);
    return {};
}

void Configuration::apply_environment_overrides() {
    if (auto level = get_env("CRADLE_LOG_LEVEL")) {
        runtime.log_level = *level;
    }
    if (auto listen = get_env("CRADLE_LISTEN")) {
        api.listen = *listen;
    }
    if (auto default_runtime = get_env("CRADLE_DEFAULT_RUNTIME")) {
        runtime.default_runtime = *default_runtime;
    }
    if (auto manager = get_env("CRADLE_CGROUP_MANAGER")) {
        runtime.cgroup_manager = *manager;
    }
    if (auto graph_root = get_env("CRADLE_ROOT")) {
        root.root = *graph_root;
    }
    if (auto run_root = get_env("CRADLE_RUNROOT")) {
        root.runroot = *run_root;
    }
    if (auto driver = get_env("CRADLE_STORAGE_DRIVER")) {
        root.storage_driver = *driver;
    }
}

std::string Configuration::to_toml() const {
    return encode_toml(*this);
}

Status Configuration::to_file(const std::string& path) const {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return make_error(ErrorCode::IO_ERROR, "open " + path + " for writing: " + std::strerror(errno));
    }
    file << to_toml();
    file.flush();
    if (!file) {
        return make_error(ErrorCode::IO_ERROR, "write " + path);
    }
    return {};
}

bool Configuration::operator==(const Configuration& other) const {
    return root == other.root &&
           api == other.api &&
           runtime == other.runtime &&
           image == other.image &&
           network == other.network &&
           metrics == other.metrics &&
           tracing == other.tracing &&
           stats == other.stats &&
           nri == other.nri;
}

} // namespace cradle
