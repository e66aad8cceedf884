#pragma once

#include "cradle/utils/error.h"

#include <compare>
#include <string>

namespace cradle {

class HostEnvironment;

/**
 * @brief Semantic version of a monitor executable
 */
struct MonitorVersion {
    int major_num = 0;
    int minor_num = 0;
    int patch_num = 0;

    auto operator<=>(const MonitorVersion&) const = default;

    [[nodiscard]] std::string to_string() const;
};

/**
 * @brief Parse "version X.Y.Z" out of "<monitor> --version" output
 */
[[nodiscard]] Result<MonitorVersion> parse_monitor_version(const std::string& output);

/**
 * @brief Feature gates of one monitor executable, derived from its version
 */
class MonitorManager {
public:
    /**
     * @brief Run "<path> --version" and record what the monitor supports
     */
    [[nodiscard]] static Result<MonitorManager> create(const std::string& path, const HostEnvironment& host);

    MonitorManager(std::string path, MonitorVersion version);

    [[nodiscard]] const std::string& path() const { return path_; }
    [[nodiscard]] const MonitorVersion& version() const { return version_; }

    /// Monitor can relay exit status synchronously (2.0.19+).
    [[nodiscard]] bool supports_sync() const;

    /// Monitor honors --log-global-size-max (2.1.2+).
    [[nodiscard]] bool supports_log_global_size_max() const;

private:
    std::string path_;
    MonitorVersion version_;
};

} // namespace cradle
