#include "cradle/subsys/rdt.h"

#include "cradle/host/host_environment.h"
#include "cradle/utils/logger.h"

#include <algorithm>

#include <nlohmann/json.hpp>

namespace cradle {

namespace {

Status collect_classes(const nlohmann::json& classes, std::vector<std::string>& out) {
    if (!classes.is_object()) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "\"classes\" must be an object");
    }
    for (const auto& [name, definition] : classes.items()) {
        if (!definition.is_object() && !definition.is_null()) {
            return make_error(ErrorCode::INVALID_ARGUMENT, "class \"" + name + "\" must be an object");
        }
        if (std::find(out.begin(), out.end(), name) == out.end()) {
            out.push_back(name);
        }
    }
    return {};
}

} // anonymous namespace

Status RdtConfig::load(const std::string& path, const HostEnvironment& host) {
    auto& logger = LoggerFactory::get_logger("cradle.rdt");

    enabled_ = false;
    config_path_ = path;
    partitions_.clear();
    classes_.clear();

    if (path.empty()) {
        CRADLE_DEBUG(logger, "No RDT config file specified, RDT not enabled");
        return {};
    }

    if (!host.resctrl_mounted()) {
        return make_error(ErrorCode::UNAVAILABLE, "RDT not enabled: resctrl filesystem is not mounted");
    }

    auto content = host.read_file(path);
    if (!content) {
        return wrap_error(content.error(), "reading rdt config file failed");
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(*content);
    } catch (const nlohmann::json::exception& e) {
        return make_error(ErrorCode::PARSE_ERROR, "parsing rdt config " + path + " failed: " + e.what());
    }

    if (!document.is_object()) {
        return make_error(ErrorCode::PARSE_ERROR, "rdt config " + path + " must be a JSON object");
    }

    auto partitions = document.find("partitions");
    auto classes = document.find("classes");
    if (partitions == document.end() && classes == document.end()) {
        return make_error(ErrorCode::INVALID_ARGUMENT,
                          "rdt config " + path + " defines neither partitions nor classes");
    }

    std::vector<std::string> partition_names;
    std::vector<std::string> class_names;

    if (partitions != document.end()) {
        if (!partitions->is_object()) {
            return make_error(ErrorCode::INVALID_ARGUMENT, "rdt config: \"partitions\" must be an object");
        }
        for (const auto& [name, partition] : partitions->items()) {
            if (!partition.is_object()) {
                return make_error(ErrorCode::INVALID_ARGUMENT,
                                  "rdt config: partition \"" + name + "\" must be an object");
            }
            partition_names.push_back(name);
            if (auto nested = partition.find("classes"); nested != partition.end()) {
                if (auto status = collect_classes(*nested, class_names); !status) {
                    return wrap_error(status.error(), "rdt config: partition \"" + name + "\"");
                }
            }
        }
    }

    if (classes != document.end()) {
        if (auto status = collect_classes(*classes, class_names); !status) {
            return wrap_error(status.error(), "rdt config");
        }
    }

    partitions_ = std::move(partition_names);
    classes_ = std::move(class_names);
    enabled_ = true;
    logger.info("RDT enabled, config successfully loaded from " + path);
    return {};
}

} // namespace cradle
