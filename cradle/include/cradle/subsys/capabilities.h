#pragma once

#include "cradle/utils/error.h"

#include <string>
#include <vector>

namespace cradle {

/**
 * @brief Validated set of Linux capabilities granted to containers
 *
 * Names are accepted with or without the CAP_ prefix and in any case;
 * they are stored normalized as "CAP_<NAME>".
 */
class Capabilities {
public:
    Capabilities() = default;

    [[nodiscard]] static Result<Capabilities> parse(const std::vector<std::string>& names);

    /**
     * @brief Capability names used when the configuration sets none
     */
    [[nodiscard]] static const std::vector<std::string>& defaults();

    [[nodiscard]] const std::vector<std::string>& names() const { return names_; }
    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] bool empty() const { return names_.empty(); }

private:
    std::vector<std::string> names_;
};

/**
 * @brief Normalize a capability name to "CAP_<NAME>", or fail if unknown
 */
[[nodiscard]] Result<std::string> normalize_capability(const std::string& name);

} // namespace cradle
