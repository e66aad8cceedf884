#include "cradle/utils/string_utils.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <regex>

namespace cradle {

std::string trim(std::string_view str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";

    size_t end = str.find_last_not_of(" \t\n\r");
    return std::string(str.substr(start, end - start + 1));
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::string to_upper(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return str;
}

std::vector<std::string> split(std::string_view str, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = str.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(str.substr(start));
            break;
        }
        parts.emplace_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::optional<bool> parse_bool(const std::string& value) {
    std::string lower_value = to_lower(trim(value));

    if (lower_value == "true" || lower_value == "yes" || lower_value == "1" || lower_value == "on") {
        return true;
    } else if (lower_value == "false" || lower_value == "no" || lower_value == "0" || lower_value == "off") {
        return false;
    }

    return std::nullopt;
}

std::optional<long long> parse_int(std::string_view value) {
    if (value.empty()) {
        return std::nullopt;
    }
    long long result = 0;
    const char* first = value.data();
    const char* last = value.data() + value.size();
    if (*first == '+') {
        ++first;
    }
    auto [ptr, ec] = std::from_chars(first, last, result);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }
    return result;
}

std::optional<std::chrono::milliseconds> parse_duration(const std::string& duration_str) {
    // One or more <number>[.<fraction>]<unit> segments, e.g. "1h30m" or "1.5s".
    static const std::regex segment_regex(R"((\d+)(?:\.(\d+))?(ns|us|ms|sec|s|min|m|h))");

    if (duration_str == "0") {
        return std::chrono::milliseconds(0);
    }
    if (duration_str.empty()) {
        return std::nullopt;
    }

    const long double limit = static_cast<long double>(std::chrono::milliseconds::max().count());
    long double total = 0;
    auto it = duration_str.cbegin();
    std::smatch match;

    while (it != duration_str.cend()) {
        if (!std::regex_search(it, duration_str.cend(), match, segment_regex,
                               std::regex_constants::match_continuous)) {
            return std::nullopt;
        }

        auto whole = parse_int(match[1].str());
        if (!whole) {
            return std::nullopt;
        }
        long double value = static_cast<long double>(*whole);
        if (match[2].matched) {
            value += std::stold("0." + match[2].str());
        }

        const std::string unit = match[3].str();
        long double factor = 0;
        if (unit == "ns") {
            factor = 1e-6L;
        } else if (unit == "us") {
            factor = 1e-3L;
        } else if (unit == "ms") {
            factor = 1;
        } else if (unit == "s" || unit == "sec") {
            factor = 1000;
        } else if (unit == "m" || unit == "min") {
            factor = 60 * 1000;
        } else {
            factor = 60 * 60 * 1000;
        }

        total += value * factor;
        if (total >= limit) {
            return std::nullopt;
        }
        it = match[0].second;
    }

    // Sub-millisecond remainders are truncated; the epsilon absorbs binary rounding of decimal fractions.
    return std::chrono::milliseconds(static_cast<long long>(total + 1e-6L));
}

std::optional<std::string> get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace cradle
