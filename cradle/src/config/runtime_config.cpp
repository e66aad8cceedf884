#include "cradle/config/config.h"

#include "cradle/host/host_environment.h"
#include "cradle/utils/logger.h"
#include "cradle/utils/string_utils.h"

#include <future>
#include <memory>
#include <regex>
#include <system_error>

namespace cradle {

namespace {

Logger& runtime_logger() {
    return LoggerFactory::get_logger("cradle.runtime");
}

constexpr const char* TASKSET_BINARY = "taskset";
constexpr const char* PINNS_BINARY = "pinns";
constexpr const char* CRIU_BINARY = "criu";
constexpr const char* MONITOR_BINARY = "conmon";

} // anonymous namespace

// ============================================================================
// RuntimeConfig
// ============================================================================

Status RuntimeConfig::validate(const ValidationContext& ctx, Subsystems& subsystems) {
    const auto& host = *ctx.host;

    auto ulimits = std::make_shared<UlimitsConfig>();
    if (auto status = ulimits->load(default_ulimits); !status) {
        return status;
    }
    subsystems.ulimits = ulimits;

    auto devices = std::make_shared<DeviceConfig>();
    if (auto status = devices->load(additional_devices); !status) {
        return status;
    }
    subsystems.devices = devices;

    if (auto status = validate_default_runtime(); !status) {
        return status;
    }

    if (!timezone.empty() && to_lower(timezone) != "local" && !host.timezone_exists(timezone)) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "invalid timezone: " + timezone);
    }

    if (log_size_max >= 0 && log_size_max < OCI_BUF_SIZE) {
        return make_error(ErrorCode::INVALID_ARGUMENT,
                          "log size max should be negative or >= " + std::to_string(OCI_BUF_SIZE));
    }

    // Containers need time to exit on their own before being killed.
    if (ctr_stop_timeout < DEFAULT_CTR_STOP_TIMEOUT) {
        ctr_stop_timeout = DEFAULT_CTR_STOP_TIMEOUT;
        runtime_logger().warn("Forcing ctr_stop_timeout to lowest possible value of " +
                              std::to_string(ctr_stop_timeout) + "s");
    }

    auto sysctls = parse_sysctls(default_sysctls);
    if (!sysctls) {
        return wrap_error(sysctls.error(), "invalid default_sysctls");
    }
    subsystems.sysctls = std::make_shared<const std::vector<Sysctl>>(std::move(*sysctls));

    auto capabilities = Capabilities::parse(default_capabilities);
    if (!capabilities) {
        return wrap_error(capabilities.error(), "invalid capabilities");
    }
    subsystems.capabilities = std::make_shared<const Capabilities>(std::move(*capabilities));

    if (!log_level_from_string(log_level)) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "invalid log_level \"" + log_level + "\"");
    }
    if (!log_filter.empty()) {
        try {
            std::regex filter(log_filter);
        } catch (const std::regex_error& e) {
            return make_error(ErrorCode::INVALID_ARGUMENT,
                              "invalid log_filter \"" + log_filter + "\": " + e.what());
        }
    }

    if (!CgroupManager::is_valid_name(cgroup_manager)) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "invalid cgroup manager \"" + cgroup_manager + "\"");
    }

    if (minimum_mappable_uid < -1) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "minimum_mappable_uid must be -1 or greater");
    }
    if (minimum_mappable_gid < -1) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "minimum_mappable_gid must be -1 or greater");
    }

    if (!infra_ctr_cpuset.empty()) {
        auto set = CpuSet::parse(infra_ctr_cpuset);
        if (!set) {
            return wrap_error(set.error(), "invalid infra_ctr_cpuset");
        }
        if (set->empty()) {
            return make_error(ErrorCode::INVALID_ARGUMENT,
                              "invalid infra_ctr_cpuset \"" + infra_ctr_cpuset + "\": no CPUs listed");
        }

        auto hardware = host.hardware_info();
        if (hardware.cpu_count > 0 && static_cast<size_t>(set->max_cpu()) >= hardware.cpu_count) {
            runtime_logger().warn("infra_ctr_cpuset " + set->to_string() + " names CPUs beyond the " +
                                  std::to_string(hardware.cpu_count) + " configured on this host");
        }

        if (ctx.on_execution()) {
            auto taskset = host.look_path(TASKSET_BINARY);
            if (!taskset) {
                return wrap_error(taskset.error(), "\"" + std::string(TASKSET_BINARY) + "\" not found in $PATH");
            }
            subsystems.cpu_pinning_prefix = {*taskset, "--cpu-list", set->to_string()};
        }
        subsystems.infra_ctr_cpuset = std::move(*set);
    }

    if (!shared_cpuset.empty()) {
        if (auto set = CpuSet::parse(shared_cpuset); !set) {
            return wrap_error(set.error(), "invalid shared_cpuset");
        }
    }

    if (auto status = validate_workloads(workloads); !status) {
        return wrap_error(status.error(), "workloads validation");
    }

    if (ctx.on_execution()) {
        // The monitor cgroup rules depend on the selected manager.
        auto manager = CgroupManager::create(cgroup_manager);
        if (!manager) {
            return wrap_error(manager.error(), "unable to update cgroup manager");
        }
        subsystems.cgroup_manager = *manager;
    }

    if (auto status = validate_runtimes(ctx); !status) {
        return wrap_error(status.error(), "runtime validation");
    }

    if (ctx.on_execution()) {
        validate_hooks_dirs(ctx);

        auto pinns = validate_executable_path(PINNS_BINARY, pinns_path, host);
        if (!pinns) {
            return wrap_error(pinns.error(), "pinns validation");
        }
        pinns_path = *pinns;

        auto namespaces = std::make_shared<NamespaceManager>(namespaces_dir, pinns_path, ctx.host);
        if (auto status = namespaces->initialize(); !status) {
            return wrap_error(status.error(), "initialize namespace manager");
        }
        subsystems.namespace_manager = namespaces;

        if (enable_criu_support) {
            if (auto criu = validate_executable_path(CRIU_BINARY, "", host); !criu) {
                enable_criu_support = false;
                return make_error(ErrorCode::NOT_FOUND,
                                  "cannot enable checkpoint/restore support without the criu binary in $PATH");
            }
            runtime_logger().info("Checkpoint/restore support enabled");
        } else {
            runtime_logger().info("Checkpoint/restore support disabled");
        }

        auto seccomp = std::make_shared<SeccompConfig>();
        seccomp->set_use_default_when_empty(seccomp_use_default_when_empty);
        if (auto status = seccomp->load_profile(seccomp_profile, host); !status) {
            if (!status.error().is(ErrorCode::NOT_FOUND)) {
                return wrap_error(status.error(), "unable to load seccomp profile");
            }
            runtime_logger().info("Specified profile does not exist on disk");
            seccomp->load_default_profile();
        }
        subsystems.seccomp = seccomp;

        auto apparmor = std::make_shared<AppArmorConfig>();
        if (auto status = apparmor->load_profile(apparmor_profile, host); !status) {
            return wrap_error(status.error(), "unable to load AppArmor profile");
        }
        subsystems.apparmor = apparmor;

        auto blockio = std::make_shared<BlockIOConfig>();
        if (auto status = blockio->load(blockio_config_file, host); !status) {
            return wrap_error(status.error(), "blockio configuration");
        }
        blockio->set_reload(blockio_reload);
        subsystems.blockio = blockio;

        auto rdt = std::make_shared<RdtConfig>();
        if (auto status = rdt->load(rdt_config_file, host); !status) {
            return wrap_error(status.error(), "rdt configuration");
        }
        subsystems.rdt = rdt;
    }

    if (auto status = translate_monitor_fields(ctx, subsystems); !status) {
        return wrap_error(status.error(), "monitor fields translation");
    }

    return {};
}

Status RuntimeConfig::validate_default_runtime() {
    if (runtimes.contains(default_runtime)) {
        return {};
    }

    if (!default_runtime.empty()) {
        return make_error(ErrorCode::NOT_FOUND,
                          "default_runtime set to \"" + default_runtime +
                          "\", but no runtime entry table [cradle.runtime.runtimes." + default_runtime +
                          "] was found");
    }

    const std::string builtin(DEFAULT_RUNTIME_NAME);
    CRADLE_DEBUG(runtime_logger(),
                 "Defaulting to \"" + builtin + "\" as the runtime since default_runtime is not set");
    if (!runtimes.contains(builtin)) {
        runtimes.emplace(builtin, RuntimeHandler::defaults());
    }
    default_runtime = builtin;
    return {};
}

Status RuntimeConfig::validate_runtimes(const ValidationContext& ctx) {
    std::vector<std::string> failed_validation;

    for (auto& [name, handler] : runtimes) {
        auto status = handler.validate_static(name);
        if (status && ctx.on_execution()) {
            status = handler.validate_execution(name, *ctx.host);
        }
        if (!status) {
            if (name == default_runtime) {
                return status;
            }
            runtime_logger().warn("'" + name + "' is being ignored due to: \"" + status.error().message + "\"");
            failed_validation.push_back(name);
        }
    }

    for (const auto& name : failed_validation) {
        runtimes.erase(name);
    }

    if (ctx.on_execution()) {
        probe_runtime_features(ctx);
    }
    return {};
}

void RuntimeConfig::probe_runtime_features(const ValidationContext& ctx) {
    const auto& host = *ctx.host;
    const auto timeout = ctx.feature_probe_timeout;

    std::vector<std::future<void>> probes;
    for (auto& [name, handler] : runtimes) {
        handler.features.reset();
        if (!handler.is_default_type()) {
            continue;
        }

        RuntimeHandler* target = &handler;
        try {
            probes.push_back(std::async(std::launch::async, [target, &host, timeout] {
                target->probe_features(host, timeout);
            }));
        } catch (const std::system_error& e) {
            CRADLE_DEBUG(runtime_logger(), "Probing features of " + name + " inline: " + e.what());
            target->probe_features(host, timeout);
        }
    }

    for (auto& probe : probes) {
        probe.get();
    }
}

void RuntimeConfig::validate_hooks_dirs(const ValidationContext& ctx) {
    auto& host = *ctx.host;

    // Use a hooks directory if it exists or can be created; skip it otherwise.
    std::vector<std::string> usable;
    for (const auto& dir : hooks_dir) {
        if (!host.is_directory(dir)) {
            if (host.exists(dir)) {
                runtime_logger().warn("Skipping invalid hooks directory: " + dir + " exists but is not a directory");
                continue;
            }
            if (auto status = host.mkdir_all(dir, 0755); !status) {
                CRADLE_DEBUG(runtime_logger(), "Failed to create requested hooks dir: " + status.error().message);
                continue;
            }
        }
        CRADLE_DEBUG(runtime_logger(), "Using hooks directory: " + dir);
        usable.push_back(dir);
    }
    hooks_dir = std::move(usable);
}

Status RuntimeConfig::translate_monitor_fields(const ValidationContext& ctx, Subsystems& subsystems) {
    std::vector<std::string> failed_translation;

    for (auto& [name, handler] : runtimes) {
        if (!handler.is_default_type()) {
            continue;
        }
        if (auto status = translate_monitor_fields_for_handler(name, handler, ctx, subsystems); !status) {
            if (name == default_runtime) {
                return wrap_error(status.error(), "failed to translate monitor fields for runtime " + name);
            }
            runtime_logger().warn("'" + name + "' is being ignored due to: \"" + status.error().message + "\"");
            failed_translation.push_back(name);
        }
    }

    for (const auto& name : failed_translation) {
        runtimes.erase(name);
        subsystems.monitor_managers.erase(name);
    }
    return {};
}

Status RuntimeConfig::translate_monitor_fields_for_handler(const std::string& name, RuntimeHandler& handler,
                                                           const ValidationContext& ctx,
                                                           Subsystems& subsystems) {
    if (!conmon_cgroup.empty()) {
        CRADLE_DEBUG(runtime_logger(),
                     "Monitor cgroup " + handler.monitor_cgroup + " is becoming " + conmon_cgroup);
        handler.monitor_cgroup = conmon_cgroup;
    }
    if (!conmon.empty()) {
        CRADLE_DEBUG(runtime_logger(), "Monitor path " + handler.monitor_path + " is becoming " + conmon);
        handler.monitor_path = conmon;
    }
    if (!conmon_env.empty()) {
        handler.monitor_env = conmon_env;
    }
    if (handler.monitor_cgroup.empty()) {
        handler.monitor_cgroup = std::string(DEFAULT_MONITOR_CGROUP);
    }

    if (!ctx.on_execution()) {
        return {};
    }

    auto monitor_path = validate_executable_path(MONITOR_BINARY, handler.monitor_path, *ctx.host);
    if (!monitor_path) {
        return std::unexpected(monitor_path.error());
    }
    handler.monitor_path = *monitor_path;

    auto monitor = MonitorManager::create(handler.monitor_path, *ctx.host);
    if (!monitor) {
        return std::unexpected(monitor.error());
    }
    subsystems.monitor_managers[name] = std::make_shared<const MonitorManager>(std::move(*monitor));

    if (!subsystems.cgroup_manager) {
        return make_error(ErrorCode::INTERNAL, "cgroup manager must be selected before monitor validation");
    }
    return subsystems.cgroup_manager->validate_monitor_cgroup(handler.monitor_cgroup);
}

const RuntimeHandler* RuntimeConfig::default_handler() const {
    auto it = runtimes.find(default_runtime);
    return it == runtimes.end() ? nullptr : &it->second;
}

} // namespace cradle
