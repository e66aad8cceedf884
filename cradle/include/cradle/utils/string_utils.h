#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cradle {

// ============================================================================
// String Helpers
// ============================================================================

[[nodiscard]] std::string trim(std::string_view str);
[[nodiscard]] std::string to_lower(std::string str);
[[nodiscard]] std::string to_upper(std::string str);

/**
 * @brief Split on a single character, keeping empty fields
 */
[[nodiscard]] std::vector<std::string> split(std::string_view str, char sep);
[[nodiscard]] std::string join(const std::vector<std::string>& parts, std::string_view sep);

/**
 * @brief Parse boolean from string (true/false, yes/no, 1/0, on/off)
 */
[[nodiscard]] std::optional<bool> parse_bool(const std::string& value);

/**
 * @brief Parse a base-10 signed integer, rejecting trailing garbage
 */
[[nodiscard]] std::optional<long long> parse_int(std::string_view value);

/**
 * @brief Parse duration string (e.g. "100ms", "1.5s", "1m30s", "2h45m" or a bare "0")
 *
 * Units are ns, us, ms, s/sec, m/min and h. Values past milliseconds::max() are rejected.
 */
[[nodiscard]] std::optional<std::chrono::milliseconds> parse_duration(const std::string& duration_str);

/**
 * @brief Get environment variable, treating unset and empty alike
 */
[[nodiscard]] std::optional<std::string> get_env(const std::string& name);

} // namespace cradle
