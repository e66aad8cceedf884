#include "cradle/subsys/blockio.h"

#include "cradle/host/host_environment.h"
#include "cradle/utils/logger.h"

#include <nlohmann/json.hpp>

namespace cradle {

namespace {

/// Throttle values are written either as numbers or as strings with units ("10M").
Result<std::optional<std::string>> read_throttle(const nlohmann::json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end()) {
        return std::optional<std::string>{};
    }
    if (it->is_string()) {
        return std::optional<std::string>{it->get<std::string>()};
    }
    if (it->is_number_integer()) {
        return std::optional<std::string>{std::to_string(it->get<int64_t>())};
    }
    return make_error(ErrorCode::INVALID_ARGUMENT, std::string(key) + " must be a number or a string");
}

Result<BlockIODeviceParams> parse_device_params(const nlohmann::json& params) {
    if (!params.is_object()) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "device parameters must be an object");
    }

    BlockIODeviceParams result;

    auto devices = params.find("devices");
    if (devices == params.end() || !devices->is_array() || devices->empty()) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "device parameters need a non-empty devices list");
    }
    for (const auto& device : *devices) {
        if (!device.is_string() || device.get<std::string>().empty()) {
            return make_error(ErrorCode::INVALID_ARGUMENT, "devices entries must be non-empty strings");
        }
        result.devices.push_back(device.get<std::string>());
    }

    if (auto weight = params.find("weight"); weight != params.end()) {
        if (!weight->is_number_integer()) {
            return make_error(ErrorCode::INVALID_ARGUMENT, "weight must be an integer");
        }
        auto value = weight->get<int64_t>();
        if (value < 10 || value > 1000) {
            return make_error(ErrorCode::INVALID_ARGUMENT,
                              "weight " + std::to_string(value) + " out of range 10..1000");
        }
        result.weight = value;
    }

    struct ThrottleField {
        const char* key;
        std::optional<std::string> BlockIODeviceParams::*field;
    };
    static const ThrottleField throttles[] = {
        {"throttlereadbps", &BlockIODeviceParams::throttle_read_bps},
        {"throttlewritebps", &BlockIODeviceParams::throttle_write_bps},
        {"throttlereadiops", &BlockIODeviceParams::throttle_read_iops},
        {"throttlewriteiops", &BlockIODeviceParams::throttle_write_iops},
    };
    for (const auto& throttle : throttles) {
        auto value = read_throttle(params, throttle.key);
        if (!value) {
            return std::unexpected(value.error());
        }
        result.*throttle.field = *value;
    }

    return result;
}

} // anonymous namespace

Status BlockIOConfig::load(const std::string& path, const HostEnvironment& host) {
    auto& logger = LoggerFactory::get_logger("cradle.blockio");

    classes_.clear();
    config_path_ = path;
    enabled_ = false;

    if (path.empty()) {
        logger.info("No blockio config file specified, blockio not configured");
        return {};
    }

    auto content = host.read_file(path);
    if (!content) {
        return wrap_error(content.error(), "reading blockio config file failed");
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(*content);
    } catch (const nlohmann::json::exception& e) {
        return make_error(ErrorCode::PARSE_ERROR, "parsing blockio config " + path + " failed: " + e.what());
    }

    if (!document.is_object()) {
        return make_error(ErrorCode::PARSE_ERROR, "blockio config " + path + " must be a JSON object");
    }

    std::map<std::string, std::vector<BlockIODeviceParams>> classes;
    for (const auto& [class_name, entries] : document.items()) {
        if (!entries.is_array()) {
            return make_error(ErrorCode::INVALID_ARGUMENT,
                              "blockio class \"" + class_name + "\" must be an array");
        }
        auto& params_list = classes[class_name];
        for (const auto& entry : entries) {
            auto params = parse_device_params(entry);
            if (!params) {
                return wrap_error(params.error(), "blockio class \"" + class_name + "\"");
            }
            params_list.push_back(std::move(*params));
        }
    }

    classes_ = std::move(classes);
    enabled_ = true;
    logger.info("Blockio config successfully loaded from " + path);
    return {};
}

std::vector<std::string> BlockIOConfig::class_names() const {
    std::vector<std::string> names;
    for (const auto& [name, params] : classes_) {
        names.push_back(name);
    }
    return names;
}

const std::vector<BlockIODeviceParams>* BlockIOConfig::find_class(const std::string& name) const {
    auto it = classes_.find(name);
    return it == classes_.end() ? nullptr : &it->second;
}

} // namespace cradle
