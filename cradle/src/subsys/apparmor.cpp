#include "cradle/subsys/apparmor.h"

#include "cradle/config/constants.h"
#include "cradle/host/host_environment.h"
#include "cradle/utils/logger.h"

namespace cradle {

Status AppArmorConfig::load_profile(const std::string& name, const HostEnvironment& host) {
    auto& logger = LoggerFactory::get_logger("cradle.apparmor");

    if (!host.apparmor_enabled()) {
        enabled_ = false;
        profile_ = name;
        CRADLE_DEBUG(logger, "AppArmor is disabled by the system or at build time");
        return {};
    }

    enabled_ = true;

    if (name.empty() || name == UNCONFINED) {
        profile_ = UNCONFINED;
        logger.info("AppArmor profile is unconfined");
        return {};
    }

    if (name == DEFAULT_APPARMOR_PROFILE) {
        profile_ = name;
        logger.info("Installing default AppArmor profile: " + name);
        return {};
    }

    if (!host.apparmor_profile_loaded(name)) {
        return make_error(ErrorCode::NOT_FOUND, "find AppArmor profile \"" + name + "\": profile is not loaded");
    }

    profile_ = name;
    logger.info("Using AppArmor profile: " + name);
    return {};
}

} // namespace cradle
