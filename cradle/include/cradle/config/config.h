#pragma once

#include "cradle/config/runtime_handler.h"
#include "cradle/config/storage.h"
#include "cradle/config/validation.h"
#include "cradle/config/workloads.h"
#include "cradle/subsys/image_reference.h"
#include "cradle/utils/error.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cradle {

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief What to do with image-declared volumes
 */
enum class ImageVolumes : int {
    MKDIR = 0,   ///< Create a directory for the volume
    IGNORE = 1,  ///< Skip the volume
    BIND = 2     ///< Bind mount a host directory
};

[[nodiscard]] std::string to_string(ImageVolumes volumes);
[[nodiscard]] std::optional<ImageVolumes> image_volumes_from_string(const std::string& volumes_str);

// ============================================================================
// Domain Configurations
// ============================================================================

/**
 * @brief Storage and state locations ([cradle])
 */
struct RootConfig {
    std::string root;                           ///< Graph root of the image store
    std::string runroot;                        ///< Run root of the image store
    std::string imagestore;                     ///< Optional separate image store
    std::string storage_driver;
    std::vector<std::string> storage_option;    ///< "<driver>.<key>=<value>"
    std::string log_dir = "/var/log/cradle/pods";
    std::string version_file = "/var/run/cradle/version";
    std::string version_file_persist;
    std::string clean_shutdown_file = "/var/lib/cradle/clean.shutdown";
    bool internal_wipe = true;
    bool internal_repair = false;

    /**
     * @brief In execution mode: absolute log_dir, created 0700, and the
     * store's own root/runroot/driver/options copied back
     */
    Status validate(const ValidationContext& ctx);

    [[nodiscard]] std::string clean_shutdown_supported_file_name() const;

    bool operator==(const RootConfig&) const = default;
};

/**
 * @brief Request server endpoint ([cradle.api])
 */
struct ApiConfig {
    std::string listen = "/var/run/cradle/cradle.sock";
    std::string stream_address = "127.0.0.1";
    std::string stream_port = "0";
    bool stream_enable_tls = false;
    std::string stream_tls_cert;
    std::string stream_tls_key;
    std::string stream_tls_ca;
    std::string stream_idle_timeout;
    int64_t grpc_max_send_msg_size = DEFAULT_GRPC_MAX_MSG_SIZE;
    int64_t grpc_max_recv_msg_size = DEFAULT_GRPC_MAX_MSG_SIZE;

    /**
     * @brief Clamp message sizes; in execution mode prepare the listen socket
     */
    Status validate(const ValidationContext& ctx);

    bool operator==(const ApiConfig&) const = default;
};

/**
 * @brief Container execution settings ([cradle.runtime])
 */
struct RuntimeConfig {
    // Handlers
    std::string default_runtime = std::string(DEFAULT_RUNTIME_NAME);
    Runtimes runtimes;
    Workloads workloads;

    // Legacy global monitor settings, migrated into every oci handler
    std::string conmon;
    std::string conmon_cgroup;
    std::vector<std::string> conmon_env;

    // Security
    bool selinux = false;
    std::string seccomp_profile;
    bool seccomp_use_default_when_empty = true;
    std::string apparmor_profile = std::string(DEFAULT_APPARMOR_PROFILE);
    std::string blockio_config_file;
    bool blockio_reload = false;
    std::string rdt_config_file;
    std::vector<std::string> default_capabilities;
    bool add_inheritable_capabilities = false;
    bool hostnetwork_disable_selinux = true;

    // Cgroups and resources
    std::string cgroup_manager = std::string(CGROUP_MANAGER_SYSTEMD);
    std::string separate_pull_cgroup;
    std::vector<std::string> default_ulimits;
    std::vector<std::string> default_sysctls;
    std::vector<std::string> allowed_devices = {"/dev/fuse"};
    std::vector<std::string> additional_devices;
    std::vector<std::string> cdi_spec_dirs = {"/etc/cdi", "/var/run/cdi"};
    bool device_ownership_from_security_context = false;
    int64_t pids_limit = -1;
    std::string infra_ctr_cpuset;
    std::string shared_cpuset;
    std::string irqbalance_config_file = "/etc/sysconfig/irqbalance";
    std::string irqbalance_config_restore_file = "/etc/sysconfig/orig_irq_banned_cpus";

    // Containers
    std::vector<std::string> default_env;
    std::vector<std::string> hooks_dir = {"/usr/share/containers/oci/hooks.d"};
    std::string default_mounts_file;
    std::vector<std::string> absent_mount_sources_to_reject;
    bool no_pivot = false;
    std::string decryption_keys_path = "/etc/cradle/keys/";
    std::string container_exits_dir = "/var/run/cradle/exits";
    std::string container_attach_socket_dir = "/var/run/cradle";
    std::string bind_mount_prefix;
    bool read_only = false;
    int64_t log_size_max = -1;
    bool log_to_journald = false;
    int64_t ctr_stop_timeout = DEFAULT_CTR_STOP_TIMEOUT;
    int64_t minimum_mappable_uid = -1;
    int64_t minimum_mappable_gid = -1;
    std::string timezone;

    // Pods and namespaces
    bool drop_infra_ctr = true;
    std::string namespaces_dir = "/var/run";
    std::string pinns_path;
    bool enable_criu_support = false;
    bool enable_pod_events = false;
    bool disable_hostport_mapping = false;

    // Logging
    std::string log_level = "info";
    std::string log_filter;

    /**
     * @brief Validate runtime settings and resolve runtime handlers
     *
     * Fills the parsed lists in subsystems; execution mode also builds the
     * cgroup manager, namespace manager, security profiles and monitors.
     */
    Status validate(const ValidationContext& ctx, Subsystems& subsystems);

    /**
     * @brief Ensure default_runtime names a handler, adding the built-in one when unset
     */
    Status validate_default_runtime();

    /**
     * @brief Check every handler; non-default failures drop the handler with a warning
     */
    Status validate_runtimes(const ValidationContext& ctx);

    /**
     * @brief Move the legacy global monitor settings into each oci handler
     */
    Status translate_monitor_fields(const ValidationContext& ctx, Subsystems& subsystems);
    Status translate_monitor_fields_for_handler(const std::string& name, RuntimeHandler& handler,
                                                const ValidationContext& ctx, Subsystems& subsystems);

    [[nodiscard]] const RuntimeHandler* default_handler() const;

    bool operator==(const RuntimeConfig&) const = default;

private:
    void validate_hooks_dirs(const ValidationContext& ctx);
    void probe_runtime_features(const ValidationContext& ctx);
};

/**
 * @brief Image pulling and pause image settings ([cradle.image])
 */
struct ImageConfig {
    std::string default_transport = "docker://";
    std::string global_auth_file;
    std::string pause_image = "registry.k8s.io/pause:3.9";
    std::string pause_image_auth_file;
    std::string pause_command = "/pause";
    std::vector<std::string> pinned_images;
    std::string signature_policy;
    std::string signature_policy_dir = "/etc/cradle/policies";
    std::vector<std::string> insecure_registries;
    std::string image_volumes = to_string(ImageVolumes::MKDIR);
    std::string big_files_temporary_dir;
    bool auto_reload_registries = false;
    std::string pull_progress_timeout = "0s";

    Status validate(const ValidationContext& ctx);

    [[nodiscard]] Result<ImageReference> parse_pause_image() const;

    bool operator==(const ImageConfig&) const = default;
};

/**
 * @brief Pod network plugin settings ([cradle.network])
 */
struct NetworkConfig {
    std::string cni_default_network;
    std::string network_dir = "/etc/cni/net.d/";
    std::string plugin_dir;                     ///< Deprecated; folded into plugin_dirs
    std::vector<std::string> plugin_dirs = {"/opt/cni/bin/"};

    Status validate(const ValidationContext& ctx, Subsystems& subsystems);

    bool operator==(const NetworkConfig&) const = default;
};

/**
 * @brief Metrics exporter ([cradle.metrics])
 */
struct MetricsConfig {
    bool enable_metrics = false;
    std::vector<std::string> metrics_collectors;
    std::string metrics_host = "127.0.0.1";
    int64_t metrics_port = 9090;
    std::string metrics_socket;
    std::string metrics_cert;
    std::string metrics_key;

    Status validate(const ValidationContext& ctx) const;

    [[nodiscard]] static const std::vector<std::string>& all_collectors();

    bool operator==(const MetricsConfig&) const = default;
};

/**
 * @brief Trace exporter ([cradle.tracing])
 */
struct TracingConfig {
    bool enable_tracing = false;
    std::string tracing_endpoint = "0.0.0.0:4317";
    int64_t tracing_sampling_rate_per_million = 0;

    Status validate(const ValidationContext& ctx) const;

    bool operator==(const TracingConfig&) const = default;
};

/**
 * @brief Stats collection ([cradle.stats])
 */
struct StatsConfig {
    int64_t stats_collection_period = 0;
    int64_t collection_period = 0;

    Status validate(const ValidationContext& ctx) const;

    bool operator==(const StatsConfig&) const = default;
};

/**
 * @brief Node Resource Interface plugins ([cradle.nri])
 */
struct NriConfig {
    bool enable_nri = false;
    std::string nri_listen = "/var/run/nri/nri.sock";
    std::string nri_plugin_dir = "/opt/nri/plugins";
    std::string nri_plugin_config_dir = "/etc/nri/conf.d";
    std::string nri_plugin_registration_timeout = "5s";
    std::string nri_plugin_request_timeout = "2s";
    bool nri_disable_connections = false;

    Status validate(const ValidationContext& ctx);

    bool operator==(const NriConfig&) const = default;
};

// ============================================================================
// Configuration
// ============================================================================

/**
 * @brief The whole node configuration, assembled from layered sources
 *
 * Built from defaults, then mutated by successive update_from_* calls.
 * Validation never mutates an instance in place; see resolve().
 *
 * @example
 * ```cpp
 * auto config = Configuration::defaults(*StorageDefaults::load(DEFAULT_STORAGE_CONF));
 * if (auto status = config.update_from_file("/etc/cradle/cradle.conf"); !status) { ... }
 * if (auto status = config.update_from_path("/etc/cradle/cradle.conf.d"); !status) { ... }
 * config.apply_environment_overrides();
 * ```
 */
class Configuration {
public:
    RootConfig root;
    ApiConfig api;
    RuntimeConfig runtime;
    ImageConfig image;
    NetworkConfig network;
    MetricsConfig metrics;
    TracingConfig tracing;
    StatsConfig stats;
    NriConfig nri;

    /**
     * @brief Built-in defaults, with storage locations from the storage subsystem
     */
    [[nodiscard]] static Configuration defaults(const StorageDefaults& storage = {});

    /**
     * @brief Merge the primary file and remember it for reloads
     */
    Status update_from_file(const std::string& path);

    /**
     * @brief Merge one fragment
     *
     * Keys present in the fragment overwrite; storage_option accumulates
     * with duplicates folded onto their last occurrence; an empty root,
     * runroot or storage_driver inherits the previous value. Nothing is
     * changed when the fragment fails to read or decode.
     */
    Status update_from_drop_in_file(const std::string& path);

    /**
     * @brief Merge every file below a directory, depth-first in path order
     *
     * A missing directory is not an error. Either all files merge or the
     * configuration is left untouched.
     */
    Status update_from_path(const std::string& path);

    /**
     * @brief Merge TOML content with fragment semantics; source names it in errors
     */
    Status update_from_string(const std::string& content, const std::string& source);

    /**
     * @brief Apply CRADLE_* environment overrides
     *
     * CRADLE_LOG_LEVEL, CRADLE_LISTEN, CRADLE_DEFAULT_RUNTIME,
     * CRADLE_CGROUP_MANAGER, CRADLE_ROOT, CRADLE_RUNROOT and
     * CRADLE_STORAGE_DRIVER; empty values are ignored.
     */
    void apply_environment_overrides();

    [[nodiscard]] std::string to_toml() const;
    Status to_file(const std::string& path) const;

    [[nodiscard]] const std::string& single_config_path() const { return single_config_path_; }
    [[nodiscard]] const std::string& drop_in_config_dir() const { return drop_in_config_dir_; }

    /// Compares serialized fields only.
    bool operator==(const Configuration& other) const;

private:
    std::string single_config_path_;
    std::string drop_in_config_dir_;
};

/**
 * @brief Fold duplicate entries onto their last occurrence, keeping relative order
 *
 * {"a", "b", "c", "a"} becomes {"b", "c", "a"}.
 */
[[nodiscard]] std::vector<std::string> remove_dup_storage_opts(const std::vector<std::string>& options);

} // namespace cradle
