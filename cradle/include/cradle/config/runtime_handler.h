#pragma once

#include "cradle/utils/error.h"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cradle {

class HostEnvironment;

// ============================================================================
// Runtime Types
// ============================================================================

/**
 * @brief Kind of OCI-compatible execution backend
 */
enum class RuntimeType : int {
    OCI = 0,  ///< Runtime invoked per container through a monitor process
    VM = 1,   ///< containerd shim v2 runtime (VM isolation)
    POD = 2   ///< One runtime process per pod
};

[[nodiscard]] std::string to_string(RuntimeType type);

/**
 * @brief Parse runtime_type; an empty value means OCI
 */
[[nodiscard]] std::optional<RuntimeType> runtime_type_from_string(const std::string& type_str);

// ============================================================================
// Runtime Features
// ============================================================================

/**
 * @brief Capabilities a runtime advertises through its "features" command
 *
 * Only held in memory, never serialized with the configuration.
 */
struct RuntimeFeatures {
    std::string oci_version_min;
    std::string oci_version_max;
    std::vector<std::string> hooks;
    std::vector<std::string> mount_options;
    std::map<std::string, std::string> annotations;

    struct Linux {
        std::vector<std::string> namespaces;
        std::vector<std::string> capabilities;
        std::optional<bool> cgroup_v1;
        std::optional<bool> cgroup_v2;
        std::optional<bool> cgroup_systemd;
        std::optional<bool> seccomp_enabled;
        std::optional<bool> apparmor_enabled;
        std::optional<bool> selinux_enabled;
        std::optional<bool> intel_rdt_enabled;
        std::optional<bool> idmap_enabled;  ///< linux.mountExtensions.idmap.enabled
    };
    std::optional<Linux> linux_features;

    /**
     * @brief Decode the JSON document printed by "<runtime> features"
     */
    [[nodiscard]] static Result<RuntimeFeatures> from_json(const std::string& document);
};

// ============================================================================
// Runtime Handler
// ============================================================================

/**
 * @brief One named execution backend ([cradle.runtime.runtimes.<name>])
 */
struct RuntimeHandler {
    std::string runtime_path;                 ///< Executable; looked up by handler name when empty
    std::string runtime_config_path;          ///< Backend config file, vm type only
    std::string runtime_type;                 ///< "oci" (or empty), "vm" or "pod"
    std::string runtime_root;                 ///< State directory of the runtime
    bool privileged_without_host_devices = false;
    std::vector<std::string> allowed_annotations;
    std::string monitor_path;
    std::string monitor_cgroup;
    std::vector<std::string> monitor_env;
    std::string monitor_exec_cgroup;          ///< "" or "container"
    std::map<std::string, std::string> platform_runtime_paths;
    bool runtime_pull_image = false;          ///< Backend pulls images itself

    // Derived during validation, never serialized
    std::vector<std::string> disallowed_annotations;
    std::optional<RuntimeFeatures> features;

    /**
     * @brief Built-in handler used when no default runtime is configured
     */
    [[nodiscard]] static RuntimeHandler defaults();

    [[nodiscard]] RuntimeType type() const;
    [[nodiscard]] bool is_default_type() const;

    /**
     * @brief Checks that need no host access
     *
     * Runtime type, config-path/type compatibility, allowed annotations
     * (which computes the disallowed set) and monitor_exec_cgroup.
     */
    Status validate_static(const std::string& name);

    /**
     * @brief Resolve the executable and check configured paths exist
     */
    Status validate_execution(const std::string& name, const HostEnvironment& host);

    Status validate_runtime_type(const std::string& name) const;
    Status validate_runtime_config_path(const std::string& name) const;
    Status validate_allowed_annotations();
    Status validate_monitor_exec_cgroup(const std::string& name) const;
    Status validate_runtime_path(const std::string& name, const HostEnvironment& host);

    /**
     * @brief vm-type executables must follow the containerd shim naming scheme
     */
    [[nodiscard]] bool matches_vm_binary_pattern() const;

    /**
     * @brief Ask the runtime for its feature document
     *
     * Failures are logged and leave features empty.
     */
    void probe_features(const HostEnvironment& host, std::chrono::milliseconds timeout);

    [[nodiscard]] bool supports_idmap() const;

    /**
     * @brief Executable for a platform ("linux/arm64"), falling back to runtime_path
     */
    [[nodiscard]] const std::string& runtime_path_for_platform(const std::string& platform) const;

    /// Compares serialized fields only.
    bool operator==(const RuntimeHandler& other) const;
};

/**
 * @brief Handlers keyed by name; ordered so iteration is deterministic
 */
using Runtimes = std::map<std::string, RuntimeHandler>;

/**
 * @brief Resolve an executable: explicit paths must exist, empty ones are searched in PATH
 */
[[nodiscard]] Result<std::string> validate_executable_path(const std::string& executable,
                                                           const std::string& current_path,
                                                           const HostEnvironment& host);

} // namespace cradle
