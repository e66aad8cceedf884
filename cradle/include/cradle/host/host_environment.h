#pragma once

#include "cradle/utils/error.h"

#include <chrono>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

namespace cradle {

// ============================================================================
// Host Information Types
// ============================================================================

/**
 * @brief CPU and NUMA topology of the node
 */
struct HardwareInfo {
    size_t cpu_count = 0;     ///< Configured CPUs
    size_t numa_nodes = 0;    ///< NUMA nodes (0 when NUMA is unavailable)
    bool has_numa = false;    ///< libnuma reported a usable NUMA API
};

/**
 * @brief Exit status and combined stdout/stderr of a finished subprocess
 */
struct CommandOutput {
    int exit_code = -1;
    std::string output;
};

// ============================================================================
// Host Environment Interface
// ============================================================================

/**
 * @brief Everything configuration resolution needs from the node
 *
 * Resolution never touches the process environment, the filesystem or
 * the kernel directly; it goes through this interface so that tests can
 * substitute an in-memory host.
 */
class HostEnvironment {
public:
    virtual ~HostEnvironment() = default;

    // Executables and files
    [[nodiscard]] virtual Result<std::string> look_path(const std::string& name) const = 0;
    [[nodiscard]] virtual bool exists(const std::string& path) const = 0;
    [[nodiscard]] virtual bool is_directory(const std::string& path) const = 0;
    virtual Status mkdir_all(const std::string& path, mode_t mode) = 0;
    virtual Status remove(const std::string& path) = 0;
    [[nodiscard]] virtual Result<std::string> read_file(const std::string& path) const = 0;

    /**
     * @brief Regular files and directories directly under a path, sorted
     */
    [[nodiscard]] virtual Result<std::vector<std::string>> list_directory(const std::string& path) const = 0;

    /**
     * @brief Zero-timeout connect to a unix socket
     * @return true when a peer accepted the connection
     */
    [[nodiscard]] virtual bool dial_unix(const std::string& path) const = 0;

    /**
     * @brief Run an executable and capture combined stdout and stderr
     *
     * The child is killed and UNAVAILABLE returned once the timeout expires.
     */
    [[nodiscard]] virtual Result<CommandOutput> run_command(const std::string& path,
                                                            const std::vector<std::string>& args,
                                                            std::chrono::milliseconds timeout) const = 0;

    // Kernel features
    [[nodiscard]] virtual Status check_node_requirements() const = 0;
    [[nodiscard]] virtual bool timezone_exists(const std::string& name) const = 0;
    [[nodiscard]] virtual bool apparmor_enabled() const = 0;
    [[nodiscard]] virtual bool apparmor_profile_loaded(const std::string& name) const = 0;
    [[nodiscard]] virtual bool resctrl_mounted() const = 0;

    /**
     * @brief Switch SELinux labeling off for the whole process
     */
    virtual void set_selinux_disabled(bool disabled) = 0;
    [[nodiscard]] virtual bool selinux_disabled() const = 0;

    [[nodiscard]] virtual HardwareInfo hardware_info() const = 0;
};

// ============================================================================
// Real Linux Host
// ============================================================================

class LinuxHost : public HostEnvironment {
public:
    LinuxHost() = default;

    [[nodiscard]] Result<std::string> look_path(const std::string& name) const override;
    [[nodiscard]] bool exists(const std::string& path) const override;
    [[nodiscard]] bool is_directory(const std::string& path) const override;
    Status mkdir_all(const std::string& path, mode_t mode) override;
    Status remove(const std::string& path) override;
    [[nodiscard]] Result<std::string> read_file(const std::string& path) const override;
    [[nodiscard]] Result<std::vector<std::string>> list_directory(const std::string& path) const override;
    [[nodiscard]] bool dial_unix(const std::string& path) const override;
    [[nodiscard]] Result<CommandOutput> run_command(const std::string& path,
                                                    const std::vector<std::string>& args,
                                                    std::chrono::milliseconds timeout) const override;

    [[nodiscard]] Status check_node_requirements() const override;
    [[nodiscard]] bool timezone_exists(const std::string& name) const override;
    [[nodiscard]] bool apparmor_enabled() const override;
    [[nodiscard]] bool apparmor_profile_loaded(const std::string& name) const override;
    [[nodiscard]] bool resctrl_mounted() const override;

    void set_selinux_disabled(bool disabled) override;
    [[nodiscard]] bool selinux_disabled() const override;

    [[nodiscard]] HardwareInfo hardware_info() const override;
};

/**
 * @brief Shared handle to the real host
 */
[[nodiscard]] std::shared_ptr<HostEnvironment> make_linux_host();

} // namespace cradle
