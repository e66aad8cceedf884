#include "cradle/subsys/seccomp.h"

#include "cradle/host/host_environment.h"

namespace cradle {

namespace {

Status validate_profile(const nlohmann::json& profile) {
    if (!profile.is_object()) {
        return make_error(ErrorCode::PARSE_ERROR, "seccomp profile must be a JSON object");
    }

    auto action = profile.find("defaultAction");
    if (action == profile.end() || !action->is_string() || action->get<std::string>().empty()) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "seccomp profile has no defaultAction");
    }

    auto syscalls = profile.find("syscalls");
    if (syscalls == profile.end()) {
        return {};
    }
    if (!syscalls->is_array()) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "seccomp profile syscalls must be an array");
    }
    for (const auto& rule : *syscalls) {
        if (!rule.is_object()) {
            return make_error(ErrorCode::INVALID_ARGUMENT, "seccomp syscall rule must be an object");
        }
        bool has_names = rule.contains("names") && rule["names"].is_array();
        bool has_name = rule.contains("name") && rule["name"].is_string();
        if (!has_names && !has_name) {
            return make_error(ErrorCode::INVALID_ARGUMENT, "seccomp syscall rule names no syscalls");
        }
        if (!rule.contains("action") || !rule["action"].is_string()) {
            return make_error(ErrorCode::INVALID_ARGUMENT, "seccomp syscall rule has no action");
        }
    }
    return {};
}

} // anonymous namespace

SeccompConfig::SeccompConfig()
    : profile_(default_profile()) {
}

Status SeccompConfig::load_profile(const std::string& path, const HostEnvironment& host) {
    if (path.empty()) {
        load_default_profile();
        return {};
    }

    auto content = host.read_file(path);
    if (!content) {
        return wrap_error(content.error(), "read seccomp profile");
    }

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(*content);
    } catch (const nlohmann::json::exception& e) {
        return make_error(ErrorCode::PARSE_ERROR, "decode seccomp profile " + path + ": " + e.what());
    }

    if (auto status = validate_profile(parsed); !status) {
        return wrap_error(status.error(), path);
    }

    profile_ = std::move(parsed);
    profile_path_ = path;
    return {};
}

void SeccompConfig::load_default_profile() {
    profile_ = default_profile();
    profile_path_.clear();
}

std::string SeccompConfig::default_action() const {
    return profile_.value("defaultAction", "");
}

size_t SeccompConfig::syscall_rule_count() const {
    auto syscalls = profile_.find("syscalls");
    return syscalls != profile_.end() && syscalls->is_array() ? syscalls->size() : 0;
}

const nlohmann::json& SeccompConfig::default_profile() {
    static const nlohmann::json profile = {
        {"defaultAction", "SCMP_ACT_ERRNO"},
        {"defaultErrnoRet", 38},
        {"archMap", nlohmann::json::array({
            {{"architecture", "SCMP_ARCH_X86_64"}, {"subArchitectures", nlohmann::json::array({"SCMP_ARCH_X86", "SCMP_ARCH_X32"})}},
            {{"architecture", "SCMP_ARCH_AARCH64"}, {"subArchitectures", nlohmann::json::array({"SCMP_ARCH_ARM"})}},
        })},
        {"syscalls", nlohmann::json::array({
            {
                {"names", nlohmann::json::array({
                    "accept", "accept4", "access", "bind", "brk", "capget", "capset",
                    "chdir", "chmod", "chown", "clock_gettime", "clock_nanosleep", "clone",
                    "clone3", "close", "connect", "dup", "dup2", "dup3", "epoll_create1",
                    "epoll_ctl", "epoll_pwait", "epoll_wait", "eventfd2", "execve",
                    "execveat", "exit", "exit_group", "faccessat", "faccessat2", "fchdir",
                    "fchmod", "fchmodat", "fchown", "fchownat", "fcntl", "fstat", "fstatfs",
                    "fsync", "ftruncate", "futex", "getcwd", "getdents64", "getegid",
                    "geteuid", "getgid", "getpid", "getppid", "getrandom", "getsockname",
                    "getsockopt", "gettid", "getuid", "ioctl", "kill", "listen", "lseek",
                    "madvise", "mkdirat", "mmap", "mprotect", "munmap", "nanosleep",
                    "newfstatat", "openat", "openat2", "pipe2", "poll", "ppoll", "prctl",
                    "pread64", "prlimit64", "pselect6", "pwrite64", "read", "readlinkat",
                    "recvfrom", "recvmsg", "renameat2", "rt_sigaction", "rt_sigprocmask",
                    "rt_sigreturn", "sched_getaffinity", "sched_yield", "sendmsg", "sendto",
                    "set_robust_list", "set_tid_address", "setgid", "setgroups", "setsockopt",
                    "setuid", "shutdown", "sigaltstack", "socket", "socketpair", "statfs",
                    "statx", "symlinkat", "tgkill", "umask", "uname", "unlinkat", "wait4",
                    "write", "writev",
                })},
                {"action", "SCMP_ACT_ALLOW"},
            },
            {
                {"names", nlohmann::json::array({"personality"})},
                {"action", "SCMP_ACT_ALLOW"},
                {"args", nlohmann::json::array({
                    {{"index", 0}, {"value", 0}, {"op", "SCMP_CMP_EQ"}},
                })},
            },
        })},
    };
    return profile;
}

} // namespace cradle
