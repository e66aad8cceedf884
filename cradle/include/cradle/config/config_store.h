#pragma once

#include "cradle/config/config.h"
#include "cradle/config/storage.h"
#include "cradle/config/validator.h"
#include "cradle/utils/error.h"

#include <memory>
#include <mutex>
#include <string>

namespace cradle {

/**
 * @brief Where a configuration is assembled from
 */
struct ConfigSources {
    std::string config_file;                          ///< Primary file; skipped when empty
    std::string config_dir;                           ///< Drop-in directory; skipped when empty
    std::string storage_conf = DEFAULT_STORAGE_CONF;  ///< Storage subsystem defaults
    bool apply_environment = true;                    ///< Apply CRADLE_* overrides last
};

/**
 * @brief Defaults, then the primary file, then the drop-in directory, then the environment
 */
[[nodiscard]] Result<Configuration> load_configuration(const ConfigSources& sources);

/**
 * @brief Install runtime.log_level and runtime.log_filter on the logger factory
 */
Status apply_logging_settings(const RuntimeConfig& runtime);

/**
 * @brief Owner of the process-wide resolved configuration
 *
 * Readers take a snapshot with current() and keep using it; reload()
 * swaps in a new snapshot only when the new configuration resolves.
 *
 * @example
 * ```cpp
 * ConfigStore store(sources, ctx);
 * if (auto status = store.load(); !status) { ... }
 * auto snapshot = store.current();
 * ```
 */
class ConfigStore {
public:
    ConfigStore(ConfigSources sources, ValidationContext ctx);

    /**
     * @brief Assemble from the configured sources and resolve
     */
    Status load();

    /**
     * @brief Re-read the remembered primary file and drop-in directory onto fresh defaults
     *
     * A failed reload keeps the previous snapshot.
     */
    Status reload();

    [[nodiscard]] std::shared_ptr<const ResolvedConfig> current() const;

    [[nodiscard]] const ConfigSources& sources() const { return sources_; }

private:
    ConfigSources sources_;
    ValidationContext ctx_;

    mutable std::mutex mutex_;
    std::shared_ptr<const ResolvedConfig> current_;

    Status load_from(const ConfigSources& sources);
};

} // namespace cradle
