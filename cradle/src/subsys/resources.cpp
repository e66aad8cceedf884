#include "cradle/subsys/resources.h"

#include "cradle/utils/string_utils.h"

#include <algorithm>
#include <array>
#include <string_view>

namespace cradle {

namespace {

constexpr std::array<std::string_view, 16> rlimit_names = {
    "as", "core", "cpu", "data", "fsize", "locks", "memlock", "msgqueue",
    "nice", "nofile", "nproc", "rss", "rtprio", "rttime", "sigpending", "stack",
};

Result<int64_t> parse_limit_value(const std::string& value, const std::string& entry) {
    auto parsed = parse_int(trim(value));
    if (!parsed || *parsed < -1) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "invalid ulimit value in \"" + entry + "\"");
    }
    return *parsed;
}

bool valid_permissions(const std::string& permissions) {
    if (permissions.empty() || permissions.size() > 3) {
        return false;
    }
    for (char c : permissions) {
        if (c != 'r' && c != 'w' && c != 'm') {
            return false;
        }
        if (std::count(permissions.begin(), permissions.end(), c) > 1) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// Ulimits
// ============================================================================

Result<Ulimit> parse_ulimit(const std::string& entry) {
    auto eq = entry.find('=');
    if (eq == std::string::npos) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "ulimit \"" + entry + "\" must be of the form name=soft:hard");
    }

    Ulimit ulimit;
    ulimit.name = to_lower(trim(entry.substr(0, eq)));
    if (ulimit.name.starts_with("rlimit_")) {
        ulimit.name = ulimit.name.substr(7);
    }
    if (std::find(rlimit_names.begin(), rlimit_names.end(), ulimit.name) == rlimit_names.end()) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "invalid ulimit type: " + entry.substr(0, eq));
    }

    std::string values = entry.substr(eq + 1);
    auto colon = values.find(':');
    if (colon == std::string::npos) {
        auto value = parse_limit_value(values, entry);
        if (!value) {
            return std::unexpected(value.error());
        }
        ulimit.soft = *value;
        ulimit.hard = *value;
        return ulimit;
    }

    auto soft = parse_limit_value(values.substr(0, colon), entry);
    if (!soft) {
        return std::unexpected(soft.error());
    }
    auto hard = parse_limit_value(values.substr(colon + 1), entry);
    if (!hard) {
        return std::unexpected(hard.error());
    }

    bool soft_unlimited = *soft == -1;
    bool hard_unlimited = *hard == -1;
    if ((soft_unlimited && !hard_unlimited) || (!hard_unlimited && *soft > *hard)) {
        return make_error(ErrorCode::INVALID_ARGUMENT,
                          "ulimit soft limit must be less than or equal to hard limit: " + entry);
    }

    ulimit.soft = *soft;
    ulimit.hard = *hard;
    return ulimit;
}

Status UlimitsConfig::load(const std::vector<std::string>& entries) {
    std::vector<Ulimit> parsed;
    for (const auto& entry : entries) {
        auto ulimit = parse_ulimit(entry);
        if (!ulimit) {
            return wrap_error(ulimit.error(), "unrecognized ulimit " + entry);
        }
        parsed.push_back(std::move(*ulimit));
    }
    ulimits_ = std::move(parsed);
    return {};
}

// ============================================================================
// Devices
// ============================================================================

Result<Device> parse_device(const std::string& entry) {
    auto parts = split(entry, ':');
    if (parts.size() > 3) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "invalid device specification: " + entry);
    }

    Device device;
    device.source = parts[0];
    device.destination = parts[0];

    if (parts.size() == 2) {
        if (valid_permissions(parts[1])) {
            device.permissions = parts[1];
        } else {
            device.destination = parts[1];
        }
    } else if (parts.size() == 3) {
        device.destination = parts[1];
        device.permissions = parts[2];
    }

    if (device.source.empty() || device.source.front() != '/') {
        return make_error(ErrorCode::INVALID_ARGUMENT, "device source must be an absolute path: " + entry);
    }
    if (device.destination.empty() || device.destination.front() != '/') {
        return make_error(ErrorCode::INVALID_ARGUMENT, "device destination must be an absolute path: " + entry);
    }
    if (!valid_permissions(device.permissions)) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "invalid device mode: " + device.permissions);
    }
    return device;
}

Status DeviceConfig::load(const std::vector<std::string>& entries) {
    std::vector<Device> parsed;
    for (const auto& entry : entries) {
        auto device = parse_device(entry);
        if (!device) {
            return wrap_error(device.error(), "invalid additional_devices entry");
        }
        parsed.push_back(std::move(*device));
    }
    devices_ = std::move(parsed);
    return {};
}

// ============================================================================
// Sysctls
// ============================================================================

Result<Sysctl> parse_sysctl(const std::string& entry) {
    auto eq = entry.find('=');
    if (eq == std::string::npos) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "sysctl \"" + entry + "\" is not of the form key=value");
    }

    Sysctl sysctl{trim(entry.substr(0, eq)), trim(entry.substr(eq + 1))};
    if (sysctl.key.empty() || sysctl.value.empty()) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "sysctl \"" + entry + "\" must have a key and a value");
    }
    if (sysctl.key.find_first_of(" \t") != std::string::npos) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "sysctl key \"" + sysctl.key + "\" contains whitespace");
    }
    return sysctl;
}

Result<std::vector<Sysctl>> parse_sysctls(const std::vector<std::string>& entries) {
    std::vector<Sysctl> sysctls;
    for (const auto& entry : entries) {
        auto sysctl = parse_sysctl(entry);
        if (!sysctl) {
            return std::unexpected(sysctl.error());
        }
        sysctls.push_back(std::move(*sysctl));
    }
    return sysctls;
}

} // namespace cradle
