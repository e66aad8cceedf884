#include "cradle/subsys/monitor_manager.h"

#include "cradle/config/constants.h"
#include "cradle/host/host_environment.h"
#include "cradle/utils/logger.h"
#include "cradle/utils/string_utils.h"

#include <regex>

namespace cradle {

namespace {

constexpr MonitorVersion SYNC_SUPPORT_VERSION{2, 0, 19};
constexpr MonitorVersion LOG_GLOBAL_SIZE_MAX_VERSION{2, 1, 2};

} // anonymous namespace

std::string MonitorVersion::to_string() const {
    return std::to_string(major_num) + "." + std::to_string(minor_num) + "." + std::to_string(patch_num);
}

Result<MonitorVersion> parse_monitor_version(const std::string& output) {
    static const std::regex version_regex(R"(version\s+(\d+)\.(\d+)\.(\d+))");
    std::smatch match;
    if (!std::regex_search(output, match, version_regex)) {
        return make_error(ErrorCode::PARSE_ERROR, "unable to parse monitor version from \"" + output + "\"");
    }

    auto major_num = parse_int(match[1].str());
    auto minor_num = parse_int(match[2].str());
    auto patch_num = parse_int(match[3].str());
    if (!major_num || !minor_num || !patch_num ||
        *major_num > 1 << 20 || *minor_num > 1 << 20 || *patch_num > 1 << 20) {
        return make_error(ErrorCode::PARSE_ERROR, "monitor version out of range in \"" + output + "\"");
    }
    return MonitorVersion{static_cast<int>(*major_num), static_cast<int>(*minor_num),
                          static_cast<int>(*patch_num)};
}

Result<MonitorManager> MonitorManager::create(const std::string& path, const HostEnvironment& host) {
    auto output = host.run_command(path, {"--version"}, MONITOR_VERSION_TIMEOUT);
    if (!output) {
        return wrap_error(output.error(), "get monitor version");
    }
    if (output->exit_code != 0) {
        return make_error(ErrorCode::IO_ERROR,
                          "get monitor version: " + path + " exited with status " +
                          std::to_string(output->exit_code));
    }

    auto version = parse_monitor_version(output->output);
    if (!version) {
        return std::unexpected(version.error());
    }

    MonitorManager manager(path, *version);
    auto& logger = LoggerFactory::get_logger("cradle.monitor");
    CRADLE_DEBUG(logger, "Using monitor " + path + " version " + version->to_string() +
                         (manager.supports_sync() ? "" : " (sync exit unsupported)"));
    return manager;
}

MonitorManager::MonitorManager(std::string path, MonitorVersion version)
    : path_(std::move(path))
    , version_(version) {
}

bool MonitorManager::supports_sync() const {
    return version_ >= SYNC_SUPPORT_VERSION;
}

bool MonitorManager::supports_log_global_size_max() const {
    return version_ >= LOG_GLOBAL_SIZE_MAX_VERSION;
}

} // namespace cradle
