#include "cradle/config/runtime_handler.h"

#include "cradle/config/annotations.h"
#include "cradle/config/constants.h"
#include "cradle/host/host_environment.h"
#include "cradle/utils/logger.h"
#include "cradle/utils/string_utils.h"

#include <filesystem>
#include <regex>

#include <nlohmann/json.hpp>

namespace cradle {

namespace {

Logger& handler_logger() {
    return LoggerFactory::get_logger("cradle.runtime");
}

// ============================================================================
// Feature document helpers
// ============================================================================

using json = nlohmann::json;

Status read_string(const json& object, const char* key, std::string& out) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        return make_error(ErrorCode::PARSE_ERROR, std::string(key) + " must be a string");
    }
    out = it->get<std::string>();
    return {};
}

Status read_string_list(const json& object, const char* key, std::vector<std::string>& out) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return {};
    }
    if (!it->is_array()) {
        return make_error(ErrorCode::PARSE_ERROR, std::string(key) + " must be an array");
    }
    for (const auto& item : *it) {
        if (!item.is_string()) {
            return make_error(ErrorCode::PARSE_ERROR, std::string(key) + " entries must be strings");
        }
        out.push_back(item.get<std::string>());
    }
    return {};
}

/// Reads object.<section>.enabled into out; absent sections leave out empty.
Status read_enabled(const json& object, const char* section, std::optional<bool>& out) {
    auto it = object.find(section);
    if (it == object.end() || it->is_null()) {
        return {};
    }
    if (!it->is_object()) {
        return make_error(ErrorCode::PARSE_ERROR, std::string(section) + " must be an object");
    }
    auto enabled = it->find("enabled");
    if (enabled == it->end() || enabled->is_null()) {
        return {};
    }
    if (!enabled->is_boolean()) {
        return make_error(ErrorCode::PARSE_ERROR, std::string(section) + ".enabled must be a boolean");
    }
    out = enabled->get<bool>();
    return {};
}

Status read_optional_bool(const json& object, const char* key, std::optional<bool>& out) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return {};
    }
    if (!it->is_boolean()) {
        return make_error(ErrorCode::PARSE_ERROR, std::string(key) + " must be a boolean");
    }
    out = it->get<bool>();
    return {};
}

Result<RuntimeFeatures::Linux> read_linux_features(const json& linux_section) {
    RuntimeFeatures::Linux features;
    if (!linux_section.is_object()) {
        return make_error(ErrorCode::PARSE_ERROR, "linux must be an object");
    }

    if (auto s = read_string_list(linux_section, "namespaces", features.namespaces); !s) {
        return std::unexpected(s.error());
    }
    if (auto s = read_string_list(linux_section, "capabilities", features.capabilities); !s) {
        return std::unexpected(s.error());
    }

    if (auto cgroup = linux_section.find("cgroup"); cgroup != linux_section.end() && !cgroup->is_null()) {
        if (!cgroup->is_object()) {
            return make_error(ErrorCode::PARSE_ERROR, "linux.cgroup must be an object");
        }
        if (auto s = read_optional_bool(*cgroup, "v1", features.cgroup_v1); !s) {
            return std::unexpected(s.error());
        }
        if (auto s = read_optional_bool(*cgroup, "v2", features.cgroup_v2); !s) {
            return std::unexpected(s.error());
        }
        if (auto s = read_optional_bool(*cgroup, "systemd", features.cgroup_systemd); !s) {
            return std::unexpected(s.error());
        }
    }

    struct Section {
        const char* key;
        std::optional<bool> RuntimeFeatures::Linux::*field;
    };
    static const Section sections[] = {
        {"seccomp", &RuntimeFeatures::Linux::seccomp_enabled},
        {"apparmor", &RuntimeFeatures::Linux::apparmor_enabled},
        {"selinux", &RuntimeFeatures::Linux::selinux_enabled},
        {"intelRdt", &RuntimeFeatures::Linux::intel_rdt_enabled},
    };
    for (const auto& section : sections) {
        if (auto s = read_enabled(linux_section, section.key, features.*section.field); !s) {
            return wrap_error(s.error(), "linux");
        }
    }

    if (auto mounts = linux_section.find("mountExtensions"); mounts != linux_section.end() && !mounts->is_null()) {
        if (!mounts->is_object()) {
            return make_error(ErrorCode::PARSE_ERROR, "linux.mountExtensions must be an object");
        }
        if (auto s = read_enabled(*mounts, "idmap", features.idmap_enabled); !s) {
            return wrap_error(s.error(), "linux.mountExtensions");
        }
    }

    return features;
}

} // anonymous namespace

// ============================================================================
// RuntimeType
// ============================================================================

std::string to_string(RuntimeType type) {
    switch (type) {
        case RuntimeType::OCI: return "oci";
        case RuntimeType::VM:  return "vm";
        case RuntimeType::POD: return "pod";
        default: return "unknown";
    }
}

std::optional<RuntimeType> runtime_type_from_string(const std::string& type_str) {
    if (type_str.empty() || type_str == "oci") return RuntimeType::OCI;
    if (type_str == "vm") return RuntimeType::VM;
    if (type_str == "pod") return RuntimeType::POD;
    return std::nullopt;
}

// ============================================================================
// RuntimeFeatures
// ============================================================================

Result<RuntimeFeatures> RuntimeFeatures::from_json(const std::string& document) {
    json parsed;
    try {
        parsed = json::parse(document);
    } catch (const json::exception& e) {
        return make_error(ErrorCode::PARSE_ERROR, std::string("decode runtime features: ") + e.what());
    }

    if (!parsed.is_object()) {
        return make_error(ErrorCode::PARSE_ERROR, "decode runtime features: document is not an object");
    }

    RuntimeFeatures features;
    Status status = read_string(parsed, "ociVersionMin", features.oci_version_min);
    if (status) status = read_string(parsed, "ociVersionMax", features.oci_version_max);
    if (status) status = read_string_list(parsed, "hooks", features.hooks);
    if (status) status = read_string_list(parsed, "mountOptions", features.mount_options);
    if (!status) {
        return wrap_error(status.error(), "decode runtime features");
    }

    if (auto annotations = parsed.find("annotations"); annotations != parsed.end() && !annotations->is_null()) {
        if (!annotations->is_object()) {
            return make_error(ErrorCode::PARSE_ERROR, "decode runtime features: annotations must be an object");
        }
        for (const auto& [key, value] : annotations->items()) {
            if (!value.is_string()) {
                return make_error(ErrorCode::PARSE_ERROR,
                                  "decode runtime features: annotation " + key + " must be a string");
            }
            features.annotations[key] = value.get<std::string>();
        }
    }

    if (auto linux_section = parsed.find("linux"); linux_section != parsed.end() && !linux_section->is_null()) {
        auto linux_features = read_linux_features(*linux_section);
        if (!linux_features) {
            return wrap_error(linux_features.error(), "decode runtime features");
        }
        features.linux_features = std::move(*linux_features);
    }

    return features;
}

// ============================================================================
// RuntimeHandler
// ============================================================================

RuntimeHandler RuntimeHandler::defaults() {
    RuntimeHandler handler;
    handler.runtime_type = to_string(RuntimeType::OCI);
    handler.runtime_root = std::string(DEFAULT_RUNTIME_ROOT);
    handler.allowed_annotations = {
        ANNOTATION_OCI_SECCOMP_BPF_HOOK,
        ANNOTATION_DEVICES,
    };
    handler.monitor_env = {std::string(DEFAULT_MONITOR_PATH_ENV)};
    handler.monitor_cgroup = std::string(DEFAULT_MONITOR_CGROUP);
    return handler;
}

RuntimeType RuntimeHandler::type() const {
    return runtime_type_from_string(runtime_type).value_or(RuntimeType::OCI);
}

bool RuntimeHandler::is_default_type() const {
    return runtime_type.empty() || runtime_type == to_string(RuntimeType::OCI);
}

Status RuntimeHandler::validate_static(const std::string& name) {
    if (auto status = validate_runtime_type(name); !status) {
        return status;
    }
    if (auto status = validate_runtime_config_path(name); !status) {
        return status;
    }
    if (auto status = validate_allowed_annotations(); !status) {
        return status;
    }
    return validate_monitor_exec_cgroup(name);
}

Status RuntimeHandler::validate_execution(const std::string& name, const HostEnvironment& host) {
    if (auto status = validate_runtime_path(name, host); !status) {
        return status;
    }

    if (!runtime_config_path.empty() && !host.exists(runtime_config_path)) {
        return make_error(ErrorCode::NOT_FOUND,
                          "invalid runtime_config_path for runtime '" + name + "': \"stat " +
                          runtime_config_path + ": no such file or directory\"");
    }
    return {};
}

Status RuntimeHandler::validate_runtime_type(const std::string& name) const {
    if (!runtime_type_from_string(runtime_type)) {
        return make_error(ErrorCode::INVALID_ARGUMENT,
                          "invalid `runtime_type` \"" + runtime_type + "\" for runtime \"" + name + "\"");
    }
    return {};
}

Status RuntimeHandler::validate_runtime_config_path(const std::string& name) const {
    if (runtime_config_path.empty()) {
        return {};
    }
    if (type() != RuntimeType::VM) {
        return make_error(ErrorCode::INVALID_ARGUMENT,
                          "runtime_config_path can only be used with the 'vm' runtime type (runtime '" +
                          name + "')");
    }
    return {};
}

Status RuntimeHandler::validate_allowed_annotations() {
    auto disallowed = disallowed_annotations_for(allowed_annotations);
    if (!disallowed) {
        return std::unexpected(disallowed.error());
    }
    CRADLE_DEBUG(handler_logger(), "Allowed annotations for runtime: [" + join(allowed_annotations, " ") + "]");
    disallowed_annotations = std::move(*disallowed);
    return {};
}

Status RuntimeHandler::validate_monitor_exec_cgroup(const std::string& name) const {
    if (monitor_exec_cgroup.empty() || monitor_exec_cgroup == "container") {
        return {};
    }
    return make_error(ErrorCode::INVALID_ARGUMENT,
                      "invalid monitor_exec_cgroup \"" + monitor_exec_cgroup + "\" for runtime \"" + name +
                      "\": must be empty or \"container\"");
}

Status RuntimeHandler::validate_runtime_path(const std::string& name, const HostEnvironment& host) {
    if (runtime_path.empty()) {
        auto executable = host.look_path(name);
        if (!executable) {
            return make_error(ErrorCode::NOT_FOUND,
                              "\"" + name + "\" not found in $PATH: " + executable.error().message);
        }
        runtime_path = *executable;
        CRADLE_DEBUG(handler_logger(), "Using runtime executable from $PATH \"" + runtime_path + "\"");
    } else if (!host.exists(runtime_path)) {
        return make_error(ErrorCode::NOT_FOUND,
                          "invalid runtime_path for runtime '" + name + "': \"stat " + runtime_path +
                          ": no such file or directory\"");
    }

    if (!matches_vm_binary_pattern()) {
        return make_error(ErrorCode::INVALID_ARGUMENT,
                          "invalid runtime_path for runtime '" + name +
                          "': containerd binary naming pattern is not followed");
    }

    CRADLE_DEBUG(handler_logger(), "Found valid runtime \"" + name + "\" for runtime_path \"" + runtime_path + "\"");
    return {};
}

bool RuntimeHandler::matches_vm_binary_pattern() const {
    if (type() != RuntimeType::VM) {
        return true;
    }

    static const std::regex shim_pattern{std::string(VM_SHIM_PATTERN)};
    std::string binary_name = std::filesystem::path(runtime_path).filename().string();
    return std::regex_search(binary_name, shim_pattern);
}

void RuntimeHandler::probe_features(const HostEnvironment& host, std::chrono::milliseconds timeout) {
    features.reset();

    auto output = host.run_command(runtime_path, {std::string(FEATURES_ARGUMENT)}, timeout);
    if (!output) {
        handler_logger().error("Getting OCI runtime features failed: " + output.error().message);
        return;
    }
    if (output->exit_code != 0) {
        handler_logger().error("Getting OCI runtime features failed: " + runtime_path +
                               " exited with status " + std::to_string(output->exit_code) +
                               ": " + trim(output->output));
        return;
    }

    auto decoded = RuntimeFeatures::from_json(output->output);
    if (!decoded) {
        handler_logger().error("Unmarshalling OCI features failed: " + decoded.error().message);
        return;
    }
    features = std::move(*decoded);
}

bool RuntimeHandler::supports_idmap() const {
    if (!features || !features->linux_features) {
        return false;
    }
    const auto& idmap = features->linux_features->idmap_enabled;
    return idmap.has_value() && *idmap;
}

const std::string& RuntimeHandler::runtime_path_for_platform(const std::string& platform) const {
    auto it = platform_runtime_paths.find(platform);
    if (it != platform_runtime_paths.end() && !it->second.empty()) {
        return it->second;
    }
    return runtime_path;
}

bool RuntimeHandler::operator==(const RuntimeHandler& other) const {
    return runtime_path == other.runtime_path &&
           runtime_config_path == other.runtime_config_path &&
           runtime_type == other.runtime_type &&
           runtime_root == other.runtime_root &&
           privileged_without_host_devices == other.privileged_without_host_devices &&
           allowed_annotations == other.allowed_annotations &&
           monitor_path == other.monitor_path &&
           monitor_cgroup == other.monitor_cgroup &&
           monitor_env == other.monitor_env &&
           monitor_exec_cgroup == other.monitor_exec_cgroup &&
           platform_runtime_paths == other.platform_runtime_paths &&
           runtime_pull_image == other.runtime_pull_image;
}

// ============================================================================
// Executable lookup
// ============================================================================

Result<std::string> validate_executable_path(const std::string& executable,
                                             const std::string& current_path,
                                             const HostEnvironment& host) {
    auto& logger = handler_logger();

    if (current_path.empty()) {
        auto path = host.look_path(executable);
        if (!path) {
            return std::unexpected(path.error());
        }
        CRADLE_DEBUG(logger, "Using " + executable + " from $PATH: " + *path);
        return *path;
    }

    if (!host.exists(current_path)) {
        return make_error(ErrorCode::NOT_FOUND,
                          "invalid " + executable + " path: stat " + current_path + ": no such file or directory");
    }
    logger.info("Using " + executable + " executable: " + current_path);
    return current_path;
}

} // namespace cradle
