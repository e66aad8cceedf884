#pragma once

#include "cradle/utils/error.h"

#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace cradle {

class HostEnvironment;

/**
 * @brief Seccomp profile applied to containers that do not bring their own
 */
class SeccompConfig {
public:
    /// Starts with the built-in default profile loaded.
    SeccompConfig();

    /**
     * @brief Load a JSON seccomp profile
     *
     * An empty path loads the built-in default. A path that does not exist
     * returns NOT_FOUND and leaves the current profile untouched; the
     * caller decides whether to fall back. Any other failure is fatal.
     */
    Status load_profile(const std::string& path, const HostEnvironment& host);
    void load_default_profile();

    [[nodiscard]] bool is_default_profile() const { return profile_path_.empty(); }
    [[nodiscard]] const std::string& profile_path() const { return profile_path_; }
    [[nodiscard]] const nlohmann::json& profile() const { return profile_; }
    [[nodiscard]] std::string default_action() const;
    [[nodiscard]] size_t syscall_rule_count() const;

    void set_use_default_when_empty(bool value) { use_default_when_empty_ = value; }
    [[nodiscard]] bool use_default_when_empty() const { return use_default_when_empty_; }

    /// Socket the seccomp notifier listens on.
    void set_notifier_path(std::string path) { notifier_path_ = std::move(path); }
    [[nodiscard]] const std::string& notifier_path() const { return notifier_path_; }

    [[nodiscard]] static const nlohmann::json& default_profile();

private:
    nlohmann::json profile_;
    std::string profile_path_;
    std::string notifier_path_;
    bool use_default_when_empty_ = true;
};

} // namespace cradle
