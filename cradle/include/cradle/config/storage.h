#pragma once

#include "cradle/utils/error.h"

#include <memory>
#include <string>
#include <vector>

namespace cradle {

class HostEnvironment;

inline constexpr const char* DEFAULT_STORAGE_CONF = "/etc/containers/storage.conf";
inline constexpr const char* DEFAULT_GRAPH_ROOT = "/var/lib/containers/storage";
inline constexpr const char* DEFAULT_RUN_ROOT = "/run/containers/storage";

// ============================================================================
// Storage Defaults
// ============================================================================

/**
 * @brief Values the storage subsystem's own storage.conf contributes
 */
struct StorageDefaults {
    std::string graph_root = DEFAULT_GRAPH_ROOT;
    std::string run_root = DEFAULT_RUN_ROOT;
    std::string image_store;
    std::string driver;
    std::vector<std::string> driver_options;  ///< "<driver>.<key>=<value>"

    /**
     * @brief Read storage.conf; a missing file yields the built-in defaults
     */
    [[nodiscard]] static Result<StorageDefaults> load(const std::string& path);

    /**
     * @brief Parse storage.conf content; source names it in errors
     */
    [[nodiscard]] static Result<StorageDefaults> parse(const std::string& content, const std::string& source);

    bool operator==(const StorageDefaults&) const = default;
};

// ============================================================================
// Storage Store
// ============================================================================

struct StoreOptions {
    std::string graph_root;
    std::string run_root;
    std::string image_store;
    std::string driver;
    std::vector<std::string> driver_options;
};

/**
 * @brief Authoritative view of a live store
 */
struct StoreInfo {
    std::string graph_root;
    std::string run_root;
    std::string driver;
    std::vector<std::string> driver_options;
};

/**
 * @brief Boundary to the image/layer storage engine
 */
class StorageStore {
public:
    virtual ~StorageStore() = default;
    [[nodiscard]] virtual Result<StoreInfo> open(const StoreOptions& options) = 0;
};

/**
 * @brief Store rooted on the local filesystem
 *
 * Creates the graph and run roots. An empty driver becomes "overlay" when
 * the kernel lists it in /proc/filesystems and "vfs" otherwise.
 */
class LocalStore : public StorageStore {
public:
    explicit LocalStore(std::shared_ptr<HostEnvironment> host);

    [[nodiscard]] Result<StoreInfo> open(const StoreOptions& options) override;

private:
    std::shared_ptr<HostEnvironment> host_;

    [[nodiscard]] std::string detect_driver() const;
};

} // namespace cradle
