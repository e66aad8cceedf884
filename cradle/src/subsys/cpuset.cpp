#include "cradle/subsys/cpuset.h"

#include "cradle/utils/string_utils.h"

namespace cradle {

namespace {

Result<int> parse_cpu(const std::string& value, const std::string& list) {
    auto cpu = parse_int(trim(value));
    if (!cpu || *cpu < 0 || *cpu > 1 << 16) {
        return make_error(ErrorCode::INVALID_ARGUMENT, "invalid cpuset \"" + list + "\"");
    }
    return static_cast<int>(*cpu);
}

} // anonymous namespace

Result<CpuSet> CpuSet::parse(const std::string& list) {
    CpuSet result;
    std::string trimmed = trim(list);
    if (trimmed.empty()) {
        return result;
    }

    for (const auto& range : split(trimmed, ',')) {
        auto dash = range.find('-');
        if (dash == std::string::npos) {
            auto cpu = parse_cpu(range, list);
            if (!cpu) {
                return std::unexpected(cpu.error());
            }
            result.cpus_.insert(*cpu);
            continue;
        }

        auto first = parse_cpu(range.substr(0, dash), list);
        auto last = parse_cpu(range.substr(dash + 1), list);
        if (!first || !last) {
            return make_error(ErrorCode::INVALID_ARGUMENT, "invalid cpuset \"" + list + "\"");
        }
        if (*first > *last) {
            return make_error(ErrorCode::INVALID_ARGUMENT,
                              "invalid range \"" + range + "\" in cpuset \"" + list + "\"");
        }
        for (int cpu = *first; cpu <= *last; ++cpu) {
            result.cpus_.insert(cpu);
        }
    }

    return result;
}

std::string CpuSet::to_string() const {
    std::string out;
    auto it = cpus_.begin();
    while (it != cpus_.end()) {
        int start = *it;
        int end = start;
        ++it;
        while (it != cpus_.end() && *it == end + 1) {
            end = *it;
            ++it;
        }

        if (!out.empty()) {
            out += ",";
        }
        out += std::to_string(start);
        if (end != start) {
            out += "-" + std::to_string(end);
        }
    }
    return out;
}

} // namespace cradle
