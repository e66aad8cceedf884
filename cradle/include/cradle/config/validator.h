#pragma once

#include "cradle/config/config.h"
#include "cradle/config/validation.h"
#include "cradle/utils/error.h"

#include <string>

namespace cradle {

class HostEnvironment;

// ============================================================================
// Resolved Configuration
// ============================================================================

/**
 * @brief A validated configuration and the subsystem handles built for it
 *
 * Treated as immutable once returned; collaborators share it through a
 * std::shared_ptr<const ResolvedConfig>.
 */
class ResolvedConfig {
public:
    ResolvedConfig(Configuration config, Subsystems subsystems, ValidationMode mode)
        : config_(std::move(config)), subsystems_(std::move(subsystems)), mode_(mode) {}

    [[nodiscard]] const Configuration& config() const { return config_; }
    [[nodiscard]] const Subsystems& subsystems() const { return subsystems_; }
    [[nodiscard]] ValidationMode mode() const { return mode_; }

    [[nodiscard]] const RootConfig& root() const { return config_.root; }
    [[nodiscard]] const ApiConfig& api() const { return config_.api; }
    [[nodiscard]] const RuntimeConfig& runtime() const { return config_.runtime; }
    [[nodiscard]] const ImageConfig& image() const { return config_.image; }
    [[nodiscard]] const NetworkConfig& network() const { return config_.network; }

    [[nodiscard]] const RuntimeHandler* default_handler() const { return config_.runtime.default_handler(); }
    [[nodiscard]] const RuntimeHandler* find_handler(const std::string& name) const;

    /// Monitor of a handler; null for handlers without one or in static mode.
    [[nodiscard]] std::shared_ptr<const MonitorManager> monitor_for(const std::string& handler) const;

    [[nodiscard]] bool checkpoint_restore() const { return config_.runtime.enable_criu_support; }

    /// Network plugin readiness; UNAVAILABLE when no manager was built.
    [[nodiscard]] Status network_ready_or_error() const;

private:
    Configuration config_;
    Subsystems subsystems_;
    ValidationMode mode_;
};

// ============================================================================
// Resolution
// ============================================================================

/**
 * @brief Validate a merged configuration
 *
 * Works on a private copy; the input is never changed. Checks run per
 * domain in a fixed order: image volumes, node requirements (execution
 * only), root, runtime, image, network, api, SELinux toggle (execution
 * only), NRI, then metrics, tracing and stats.
 */
[[nodiscard]] Result<ResolvedConfig> resolve(const Configuration& config, const ValidationContext& ctx);

/**
 * @brief Prepare a listen socket path
 *
 * Creates the parent directory and removes a leftover socket. A socket
 * that still accepts a connection is reported as ALREADY_EXISTS and left
 * in place. A peer that starts listening between the probe and the
 * removal loses its socket; that window is accepted.
 */
Status remove_unused_socket(const std::string& path, HostEnvironment& host);

} // namespace cradle
