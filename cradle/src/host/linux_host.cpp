#include "cradle/host/host_environment.h"

#include "cradle/utils/string_utils.h"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <numa.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cradle {

namespace {

std::atomic<bool>& selinux_disabled_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

bool is_executable_file(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) {
        return false;
    }
    return S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

std::string errno_message(int err) {
    return std::strerror(err);
}

/**
 * @brief RAII wrapper for a file descriptor
 */
class FileDescriptor {
public:
    explicit FileDescriptor(int fd = -1) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] int get() const { return fd_; }
    [[nodiscard]] bool valid() const { return fd_ >= 0; }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

private:
    int fd_;
};

} // anonymous namespace

// ============================================================================
// Executables and Files
// ============================================================================

Result<std::string> LinuxHost::look_path(const std::string& name) const {
    if (name.empty()) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "exec: empty executable name");
    }

    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name)) {
            return name;
        }
        return make_error(ErrorCode::NOT_FOUND, "exec: \"" + name + "\": not an executable file");
    }

    auto path_env = get_env("PATH").value_or("");
    for (auto dir : split(path_env, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + name;
        if (is_executable_file(candidate)) {
            return candidate;
        }
    }

    return make_error(ErrorCode::NOT_FOUND,
                      "exec: \"" + name + "\": executable file not found in $PATH");
}

bool LinuxHost::exists(const std::string& path) const {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0;
}

bool LinuxHost::is_directory(const std::string& path) const {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

Status LinuxHost::mkdir_all(const std::string& path, mode_t mode) {
    if (path.empty()) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "mkdir: empty path");
    }
    if (is_directory(path)) {
        return {};
    }

    std::string current = path.front() == '/' ? "" : ".";
    for (const auto& part : split(path, '/')) {
        if (part.empty()) {
            continue;
        }
        current += "/" + part;
        if (::mkdir(current.c_str(), mode) == 0) {
            continue;
        }
        int err = errno;
        if (err == EEXIST && is_directory(current)) {
            continue;
        }
        auto code = err == EACCES || err == EPERM ? ErrorCode::PERMISSION_DENIED : ErrorCode::IO_ERROR;
        return make_error(code, "mkdir " + current + ": " + errno_message(err));
    }
    return {};
}

Status LinuxHost::remove(const std::string& path) {
    if (::unlink(path.c_str()) == 0) {
        return {};
    }
    int err = errno;
    if (err == EISDIR && ::rmdir(path.c_str()) == 0) {
        return {};
    }
    auto code = err == ENOENT ? ErrorCode::NOT_FOUND : ErrorCode::IO_ERROR;
    return make_error(code, "remove " + path + ": " + errno_message(err));
}

Result<std::string> LinuxHost::read_file(const std::string& path) const {
    if (!exists(path)) {
        return make_error(ErrorCode::NOT_FOUND, "open " + path + ": no such file or directory");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return make_error(ErrorCode::IO_ERROR, "open " + path + ": " + errno_message(errno));
    }

    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) {
        return make_error(ErrorCode::IO_ERROR, "read " + path + ": read failed");
    }
    return oss.str();
}

Result<std::vector<std::string>> LinuxHost::list_directory(const std::string& path) const {
    std::error_code ec;
    std::filesystem::directory_iterator it(path, ec);
    if (ec) {
        auto code = ec == std::errc::no_such_file_or_directory ? ErrorCode::NOT_FOUND : ErrorCode::IO_ERROR;
        return make_error(code, "read dir " + path + ": " + ec.message());
    }

    std::vector<std::string> entries;
    for (const auto& entry : it) {
        entries.push_back(entry.path().string());
    }
    std::sort(entries.begin(), entries.end());
    return entries;
}

bool LinuxHost::dial_unix(const std::string& path) const {
    sockaddr_un addr{};
    if (path.size() >= sizeof(addr.sun_path)) {
        return false;
    }
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);

    FileDescriptor fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0));
    if (!fd.valid()) {
        return false;
    }

    if (::connect(fd.get(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
        return true;
    }
    // A full backlog still means someone is listening
    return errno == EAGAIN;
}

Result<CommandOutput> LinuxHost::run_command(const std::string& path,
                                             const std::vector<std::string>& args,
                                             std::chrono::milliseconds timeout) const {
    int pipe_fds[2];
    if (::pipe2(pipe_fds, O_CLOEXEC) != 0) {
        return make_error(ErrorCode::IO_ERROR, "pipe: " + errno_message(errno));
    }
    FileDescriptor read_end(pipe_fds[0]);
    FileDescriptor write_end(pipe_fds[1]);

    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back(path);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());

    std::vector<char*> argv;
    for (auto& arg : argv_storage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        return make_error(ErrorCode::IO_ERROR, "fork: " + errno_message(errno));
    }

    if (pid == 0) {
        ::dup2(write_end.get(), STDOUT_FILENO);
        ::dup2(write_end.get(), STDERR_FILENO);
        ::execv(path.c_str(), argv.data());
        ::_exit(127);
    }

    write_end.reset();

    CommandOutput result;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool timed_out = false;
    char buffer[4096];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }

        pollfd pfd{read_end.get(), POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) {
            timed_out = true;
            break;
        }

        ssize_t n = ::read(read_end.get(), buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) {
            break;
        }
        result.output.append(buffer, static_cast<size_t>(n));
    }

    // The child may close its output and keep running; the wait shares the read deadline.
    int status = 0;
    while (!timed_out) {
        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            break;
        }
        if (waited < 0) {
            if (errno == EINTR) continue;
            return make_error(ErrorCode::IO_ERROR, "wait " + path + ": " + errno_message(errno));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            timed_out = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    if (timed_out) {
        ::kill(pid, SIGKILL);
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                return make_error(ErrorCode::IO_ERROR, "wait " + path + ": " + errno_message(errno));
            }
        }
    }

    if (timed_out) {
        return make_error(ErrorCode::UNAVAILABLE,
                          path + ": timed out after " + std::to_string(timeout.count()) + "ms");
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }
    return result;
}

// ============================================================================
// Kernel Features
// ============================================================================

Status LinuxHost::check_node_requirements() const {
    static const char* const required_namespaces[] = {"ipc", "mnt", "net", "pid", "uts"};
    for (const char* ns : required_namespaces) {
        std::string ns_path = std::string("/proc/self/ns/") + ns;
        if (!exists(ns_path)) {
            return make_error(ErrorCode::UNAVAILABLE,
                              std::string("kernel does not support ") + ns + " namespaces");
        }
    }

    if (!is_directory("/sys/fs/cgroup")) {
        return make_error(ErrorCode::UNAVAILABLE, "cgroup filesystem is not mounted at /sys/fs/cgroup");
    }
    return {};
}

bool LinuxHost::timezone_exists(const std::string& name) const {
    if (name == "UTC" || name == "Local") {
        return true;
    }
    if (name.empty() || name.front() == '/' || name.find("..") != std::string::npos) {
        return false;
    }

    auto zoneinfo = get_env("TZDIR").value_or("/usr/share/zoneinfo");
    struct stat st{};
    std::string zone_path = zoneinfo + "/" + name;
    return ::stat(zone_path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool LinuxHost::apparmor_enabled() const {
    auto content = read_file("/sys/module/apparmor/parameters/enabled");
    return content && !content->empty() && content->front() == 'Y';
}

bool LinuxHost::apparmor_profile_loaded(const std::string& name) const {
    auto content = read_file("/sys/kernel/security/apparmor/profiles");
    if (!content) {
        return false;
    }

    // Each line reads "<profile> (<mode>)"
    std::istringstream lines(*content);
    std::string line;
    while (std::getline(lines, line)) {
        auto mode_pos = line.rfind(" (");
        std::string profile = trim(mode_pos == std::string::npos ? line : line.substr(0, mode_pos));
        if (profile == name) {
            return true;
        }
    }
    return false;
}

bool LinuxHost::resctrl_mounted() const {
    auto content = read_file("/proc/mounts");
    if (!content) {
        return false;
    }

    std::istringstream lines(*content);
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream fields(line);
        std::string device, mount_point, fs_type;
        if (fields >> device >> mount_point >> fs_type && fs_type == "resctrl") {
            return true;
        }
    }
    return false;
}

void LinuxHost::set_selinux_disabled(bool disabled) {
    selinux_disabled_flag() = disabled;
}

bool LinuxHost::selinux_disabled() const {
    return selinux_disabled_flag().load();
}

HardwareInfo LinuxHost::hardware_info() const {
    HardwareInfo info;

    info.cpu_count = std::thread::hardware_concurrency();
    if (info.cpu_count == 0) {
        info.cpu_count = 1;
    }

    if (numa_available() != -1) {
        info.has_numa = true;
        info.numa_nodes = static_cast<size_t>(numa_max_node() + 1);
        int configured = numa_num_configured_cpus();
        if (configured > 0) {
            info.cpu_count = static_cast<size_t>(configured);
        }
    }

    return info;
}

std::shared_ptr<HostEnvironment> make_linux_host() {
    return std::make_shared<LinuxHost>();
}

} // namespace cradle
