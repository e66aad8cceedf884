#pragma once

#include "cradle/utils/error.h"

#include <string>

namespace cradle {

class HostEnvironment;

/**
 * @brief AppArmor profile applied to containers by default
 */
class AppArmorConfig {
public:
    AppArmorConfig() = default;

    /**
     * @brief Select the default profile
     *
     * A host without AppArmor turns this into a no-op. Empty or
     * "unconfined" disables confinement. The built-in profile name is
     * always accepted; any other name must already be loaded.
     */
    Status load_profile(const std::string& name, const HostEnvironment& host);

    [[nodiscard]] bool is_enabled() const { return enabled_; }
    [[nodiscard]] bool is_unconfined() const { return profile_ == UNCONFINED; }
    [[nodiscard]] const std::string& profile() const { return profile_; }

    static constexpr const char* UNCONFINED = "unconfined";

private:
    bool enabled_ = false;
    std::string profile_;
};

} // namespace cradle
