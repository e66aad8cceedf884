#pragma once

#include "cradle/utils/error.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cradle {

class HostEnvironment;

/**
 * @brief Block I/O parameters one class applies to a set of devices
 */
struct BlockIODeviceParams {
    std::vector<std::string> devices;           ///< Device paths or globs
    std::optional<int64_t> weight;              ///< 10..1000
    std::optional<std::string> throttle_read_bps;
    std::optional<std::string> throttle_write_bps;
    std::optional<std::string> throttle_read_iops;
    std::optional<std::string> throttle_write_iops;
};

/**
 * @brief Block I/O classes containers can be assigned to
 *
 * The file is a JSON object mapping class name to an array of device
 * parameter objects.
 */
class BlockIOConfig {
public:
    BlockIOConfig() = default;

    /**
     * @brief Load class definitions; an empty path disables block I/O classes
     */
    Status load(const std::string& path, const HostEnvironment& host);

    [[nodiscard]] bool enabled() const { return enabled_; }
    [[nodiscard]] const std::string& config_path() const { return config_path_; }
    [[nodiscard]] std::vector<std::string> class_names() const;
    [[nodiscard]] const std::vector<BlockIODeviceParams>* find_class(const std::string& name) const;

    void set_reload(bool reload) { reload_ = reload; }
    [[nodiscard]] bool reload() const { return reload_; }

private:
    bool enabled_ = false;
    bool reload_ = false;
    std::string config_path_;
    std::map<std::string, std::vector<BlockIODeviceParams>> classes_;
};

} // namespace cradle
