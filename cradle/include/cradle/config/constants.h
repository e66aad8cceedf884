#pragma once

#include <chrono>
#include <cstdint>
#include <string_view>

namespace cradle {

// ============================================================================
// Resolution Constants
// ============================================================================

/// Smallest accepted non-negative log_size_max; matches the monitor's read buffer.
inline constexpr int64_t OCI_BUF_SIZE = 8192;

/// Floor for ctr_stop_timeout, in seconds.
inline constexpr int64_t DEFAULT_CTR_STOP_TIMEOUT = 30;

inline constexpr int64_t DEFAULT_GRPC_MAX_MSG_SIZE = 80 * 1024 * 1024;

inline constexpr std::string_view DEFAULT_RUNTIME_NAME = "runc";
inline constexpr std::string_view DEFAULT_RUNTIME_ROOT = "/run/runc";
inline constexpr std::string_view DEFAULT_MONITOR_CGROUP = "system.slice";
inline constexpr std::string_view DEFAULT_APPARMOR_PROFILE = "cradle-default";

inline constexpr std::string_view DEFAULT_MONITOR_PATH_ENV =
    "PATH=/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

/// Monitor cgroup value that places the monitor in the pod cgroup.
inline constexpr std::string_view POD_CGROUP_TOKEN = "pod";

/// Suffix of a systemd slice unit.
inline constexpr std::string_view SYSTEMD_SLICE_SUFFIX = ".slice";

/// Base-name pattern every vm-type runtime executable must match.
inline constexpr std::string_view VM_SHIM_PATTERN = R"(containerd-shim-([a-zA-Z0-9\-\+])+-v2)";

/// Argument that makes an OCI runtime print its feature document.
inline constexpr std::string_view FEATURES_ARGUMENT = "features";

inline constexpr std::chrono::milliseconds FEATURE_PROBE_TIMEOUT{10000};
inline constexpr std::chrono::milliseconds MONITOR_VERSION_TIMEOUT{10000};

inline constexpr std::string_view CGROUP_MANAGER_SYSTEMD = "systemd";
inline constexpr std::string_view CGROUP_MANAGER_CGROUPFS = "cgroupfs";

} // namespace cradle
