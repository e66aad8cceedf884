#pragma once

#include "cradle/utils/error.h"

#include <set>
#include <string>

namespace cradle {

/**
 * @brief Set of CPU ids in Linux list format ("0-3,7,9-10")
 */
class CpuSet {
public:
    CpuSet() = default;

    /**
     * @brief Parse list format; an empty string yields an empty set
     */
    [[nodiscard]] static Result<CpuSet> parse(const std::string& list);

    /**
     * @brief Canonical list format with merged ranges
     */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool empty() const { return cpus_.empty(); }
    [[nodiscard]] size_t size() const { return cpus_.size(); }
    [[nodiscard]] bool contains(int cpu) const { return cpus_.contains(cpu); }
    [[nodiscard]] int max_cpu() const { return cpus_.empty() ? -1 : *cpus_.rbegin(); }
    [[nodiscard]] const std::set<int>& cpus() const { return cpus_; }

    bool operator==(const CpuSet&) const = default;

private:
    std::set<int> cpus_;
};

} // namespace cradle
