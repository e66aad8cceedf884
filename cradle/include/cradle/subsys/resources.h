#pragma once

#include "cradle/utils/error.h"

#include <cstdint>
#include <string>
#include <vector>

namespace cradle {

// ============================================================================
// Ulimits
// ============================================================================

/**
 * @brief One default rlimit applied to every container ("nofile=1024:2048")
 */
struct Ulimit {
    std::string name;   ///< RLIMIT name without prefix, lowercase
    int64_t soft = 0;   ///< -1 means unlimited
    int64_t hard = 0;   ///< -1 means unlimited

    bool operator==(const Ulimit&) const = default;
};

/**
 * @brief Parse "name=soft:hard" or "name=value"
 */
[[nodiscard]] Result<Ulimit> parse_ulimit(const std::string& entry);

class UlimitsConfig {
public:
    Status load(const std::vector<std::string>& entries);
    [[nodiscard]] const std::vector<Ulimit>& ulimits() const { return ulimits_; }

private:
    std::vector<Ulimit> ulimits_;
};

// ============================================================================
// Devices
// ============================================================================

/**
 * @brief Host device added to every container
 */
struct Device {
    std::string source;
    std::string destination;
    std::string permissions = "rwm";

    bool operator==(const Device&) const = default;
};

/**
 * @brief Parse "source[:destination[:permissions]]"
 */
[[nodiscard]] Result<Device> parse_device(const std::string& entry);

class DeviceConfig {
public:
    Status load(const std::vector<std::string>& entries);
    [[nodiscard]] const std::vector<Device>& devices() const { return devices_; }

private:
    std::vector<Device> devices_;
};

// ============================================================================
// Sysctls
// ============================================================================

struct Sysctl {
    std::string key;
    std::string value;

    bool operator==(const Sysctl&) const = default;
};

/**
 * @brief Parse "key=value"; the value may itself contain '='
 */
[[nodiscard]] Result<Sysctl> parse_sysctl(const std::string& entry);
[[nodiscard]] Result<std::vector<Sysctl>> parse_sysctls(const std::vector<std::string>& entries);

} // namespace cradle
