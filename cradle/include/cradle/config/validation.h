#pragma once

#include "cradle/config/constants.h"
#include "cradle/subsys/apparmor.h"
#include "cradle/subsys/blockio.h"
#include "cradle/subsys/capabilities.h"
#include "cradle/subsys/cgroup_manager.h"
#include "cradle/subsys/cni_manager.h"
#include "cradle/subsys/cpuset.h"
#include "cradle/subsys/monitor_manager.h"
#include "cradle/subsys/namespace_manager.h"
#include "cradle/subsys/rdt.h"
#include "cradle/subsys/resources.h"
#include "cradle/subsys/seccomp.h"

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cradle {

class HostEnvironment;
class StorageStore;

// ============================================================================
// Validation Mode and Context
// ============================================================================

enum class ValidationMode : int {
    STATIC = 0,     ///< Parse-time checks only; no filesystem writes or subprocesses
    EXECUTION = 1   ///< Everything needed right before serving; may touch the host
};

[[nodiscard]] std::string to_string(ValidationMode mode);

/**
 * @brief What a validation pass may use from the outside world
 */
struct ValidationContext {
    ValidationMode mode = ValidationMode::STATIC;
    std::shared_ptr<HostEnvironment> host;     ///< Required in both modes
    std::shared_ptr<StorageStore> store;       ///< Required in execution mode
    std::chrono::milliseconds feature_probe_timeout = FEATURE_PROBE_TIMEOUT;

    [[nodiscard]] bool on_execution() const noexcept { return mode == ValidationMode::EXECUTION; }
};

// ============================================================================
// Subsystem Handles
// ============================================================================

/**
 * @brief Helpers built from the configuration during validation
 *
 * Static validation fills the parsed lists (capabilities, ulimits,
 * devices, sysctls, infra cpuset); the rest is only built in execution
 * mode and stays empty otherwise.
 */
struct Subsystems {
    std::shared_ptr<const Capabilities> capabilities;
    std::shared_ptr<const UlimitsConfig> ulimits;
    std::shared_ptr<const DeviceConfig> devices;
    std::shared_ptr<const std::vector<Sysctl>> sysctls;
    std::optional<CpuSet> infra_ctr_cpuset;

    std::shared_ptr<const SeccompConfig> seccomp;
    std::shared_ptr<const AppArmorConfig> apparmor;
    std::shared_ptr<const BlockIOConfig> blockio;
    std::shared_ptr<const RdtConfig> rdt;
    std::shared_ptr<const CgroupManager> cgroup_manager;
    std::shared_ptr<const NamespaceManager> namespace_manager;
    std::map<std::string, std::shared_ptr<const MonitorManager>> monitor_managers;  ///< By handler name
    std::shared_ptr<CniManager> cni_manager;

    /// "taskset --cpu-list <set>" prefix for commands run on behalf of infra containers.
    std::vector<std::string> cpu_pinning_prefix;
};

} // namespace cradle
