#include "cradle/subsys/capabilities.h"

#include "cradle/utils/string_utils.h"

#include <algorithm>
#include <array>
#include <string_view>

namespace cradle {

namespace {

constexpr std::array<std::string_view, 41> known_capabilities = {
    "CHOWN", "DAC_OVERRIDE", "DAC_READ_SEARCH", "FOWNER", "FSETID", "KILL",
    "SETGID", "SETUID", "SETPCAP", "LINUX_IMMUTABLE", "NET_BIND_SERVICE",
    "NET_BROADCAST", "NET_ADMIN", "NET_RAW", "IPC_LOCK", "IPC_OWNER",
    "SYS_MODULE", "SYS_RAWIO", "SYS_CHROOT", "SYS_PTRACE", "SYS_PACCT",
    "SYS_ADMIN", "SYS_BOOT", "SYS_NICE", "SYS_RESOURCE", "SYS_TIME",
    "SYS_TTY_CONFIG", "MKNOD", "LEASE", "AUDIT_WRITE", "AUDIT_CONTROL",
    "SETFCAP", "MAC_OVERRIDE", "MAC_ADMIN", "SYSLOG", "WAKE_ALARM",
    "BLOCK_SUSPEND", "AUDIT_READ", "PERFMON", "BPF", "CHECKPOINT_RESTORE",
};

} // anonymous namespace

Result<std::string> normalize_capability(const std::string& name) {
    std::string upper = to_upper(trim(name));
    if (upper.starts_with("CAP_")) {
        upper = upper.substr(4);
    }

    if (std::find(known_capabilities.begin(), known_capabilities.end(), upper) == known_capabilities.end()) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "unknown capability \"" + name + "\"");
    }
    return "CAP_" + upper;
}

Result<Capabilities> Capabilities::parse(const std::vector<std::string>& names) {
    Capabilities caps;
    for (const auto& name : names) {
        auto normalized = normalize_capability(name);
        if (!normalized) {
            return std::unexpected(normalized.error());
        }
        if (!caps.contains(*normalized)) {
            caps.names_.push_back(*normalized);
        }
    }
    return caps;
}

const std::vector<std::string>& Capabilities::defaults() {
    static const std::vector<std::string> default_caps = {
        "CHOWN",
        "DAC_OVERRIDE",
        "FSETID",
        "FOWNER",
        "SETGID",
        "SETUID",
        "SETPCAP",
        "NET_BIND_SERVICE",
        "KILL",
    };
    return default_caps;
}

bool Capabilities::contains(const std::string& name) const {
    return std::find(names_.begin(), names_.end(), name) != names_.end();
}

} // namespace cradle
