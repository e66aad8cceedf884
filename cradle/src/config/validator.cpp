#include "cradle/config/validator.h"

#include "cradle/host/host_environment.h"
#include "cradle/utils/logger.h"

#include <filesystem>

namespace cradle {

std::string to_string(ValidationMode mode) {
    switch (mode) {
        case ValidationMode::STATIC:    return "static";
        case ValidationMode::EXECUTION: return "execution";
        default:                        return "unknown";
    }
}

// ============================================================================
// ResolvedConfig
// ============================================================================

const RuntimeHandler* ResolvedConfig::find_handler(const std::string& name) const {
    auto it = config_.runtime.runtimes.find(name);
    return it == config_.runtime.runtimes.end() ? nullptr : &it->second;
}

std::shared_ptr<const MonitorManager> ResolvedConfig::monitor_for(const std::string& handler) const {
    auto it = subsystems_.monitor_managers.find(handler);
    return it == subsystems_.monitor_managers.end() ? nullptr : it->second;
}

Status ResolvedConfig::network_ready_or_error() const {
    if (!subsystems_.cni_manager) {
        return make_error(ErrorCode::UNAVAILABLE, "network plugin manager is not initialized");
    }
    return subsystems_.cni_manager->ready_or_error();
}

// ============================================================================
// resolve
// ============================================================================

Result<ResolvedConfig> resolve(const Configuration& input, const ValidationContext& ctx) {
    if (!ctx.host) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "validation requires a host environment");
    }

    auto& logger = LoggerFactory::get_logger("cradle.config");
    CRADLE_DEBUG(logger, "Validating configuration in " + to_string(ctx.mode) + " mode");

    Configuration config = input;
    Subsystems subsystems;

    if (!image_volumes_from_string(config.image.image_volumes)) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "unrecognized image volume type specified");
    }

    if (ctx.on_execution()) {
        if (auto status = ctx.host->check_node_requirements(); !status) {
            return std::unexpected(status.error());
        }
    }

    if (auto status = config.root.validate(ctx); !status) {
        return wrap_error(status.error(), "validating root config");
    }

    if (auto status = config.runtime.validate(ctx, subsystems); !status) {
        return wrap_error(status.error(), "validating runtime config");
    }

    if (subsystems.seccomp) {
        auto seccomp = std::make_shared<SeccompConfig>(*subsystems.seccomp);
        seccomp->set_notifier_path(
            (std::filesystem::path(config.api.listen).parent_path() / "seccomp").string());
        subsystems.seccomp = std::move(seccomp);
    }

    if (auto status = config.image.validate(ctx); !status) {
        return wrap_error(status.error(), "validating image config");
    }

    if (auto status = config.network.validate(ctx, subsystems); !status) {
        return wrap_error(status.error(), "validating network config");
    }

    if (auto status = config.api.validate(ctx); !status) {
        return wrap_error(status.error(), "validating api config");
    }

    if (ctx.on_execution() && !config.runtime.selinux) {
        ctx.host->set_selinux_disabled(true);
    }

    if (auto status = config.nri.validate(ctx); !status) {
        return wrap_error(status.error(), "validating NRI config");
    }

    if (auto status = config.metrics.validate(ctx); !status) {
        return wrap_error(status.error(), "validating metrics config");
    }
    if (auto status = config.tracing.validate(ctx); !status) {
        return wrap_error(status.error(), "validating tracing config");
    }
    if (auto status = config.stats.validate(ctx); !status) {
        return wrap_error(status.error(), "validating stats config");
    }

    logger.info("Configuration validated in " + to_string(ctx.mode) + " mode with default runtime " +
                config.runtime.default_runtime);
    return ResolvedConfig(std::move(config), std::move(subsystems), ctx.mode);
}

} // namespace cradle
