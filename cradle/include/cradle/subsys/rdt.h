#pragma once

#include "cradle/utils/error.h"

#include <string>
#include <vector>

namespace cradle {

class HostEnvironment;

/**
 * @brief Intel RDT (resctrl) classes containers can be assigned to
 */
class RdtConfig {
public:
    RdtConfig() = default;

    /**
     * @brief Load class definitions; an empty path disables RDT
     *
     * A non-empty path requires resctrl to be mounted and the file to be a
     * JSON object holding a "partitions" or "classes" object.
     */
    Status load(const std::string& path, const HostEnvironment& host);

    [[nodiscard]] bool enabled() const { return enabled_; }
    [[nodiscard]] const std::string& config_path() const { return config_path_; }
    [[nodiscard]] const std::vector<std::string>& classes() const { return classes_; }
    [[nodiscard]] const std::vector<std::string>& partitions() const { return partitions_; }

private:
    bool enabled_ = false;
    std::string config_path_;
    std::vector<std::string> partitions_;
    std::vector<std::string> classes_;
};

} // namespace cradle
