#pragma once

#include <expected>
#include <string>
#include <utility>

namespace cradle {

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Coarse classification of configuration failures
 */
enum class ErrorCode : int {
    INVALID_ARGUMENT = 1,   ///< Structurally invalid value
    NOT_FOUND = 2,          ///< File, executable or table entry missing
    IO_ERROR = 3,           ///< Filesystem or process failure
    PARSE_ERROR = 4,        ///< TOML/JSON decode failure
    PERMISSION_DENIED = 5,  ///< Access refused by the host
    ALREADY_EXISTS = 6,     ///< Resource held by someone else
    UNAVAILABLE = 7,        ///< Host lacks a required feature, or timed out
    INTERNAL = 8            ///< Should not happen
};

/**
 * @brief Error value carried through std::expected
 *
 * Context is prepended with wrap(), so a failure deep inside runtime
 * validation reads "validating runtime config: runtime validation: ...".
 */
struct Error {
    ErrorCode code = ErrorCode::INTERNAL;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] Error wrap(const std::string& context) const;
    [[nodiscard]] bool is(ErrorCode c) const noexcept { return code == c; }
    [[nodiscard]] std::string to_string() const;
};

using Status = std::expected<void, Error>;

template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Build the unexpected half of a Status or Result
 */
[[nodiscard]] inline std::unexpected<Error> make_error(ErrorCode code, std::string message) {
    return std::unexpected<Error>(Error{code, std::move(message)});
}

/**
 * @brief Re-raise an error with a context prefix
 */
[[nodiscard]] inline std::unexpected<Error> wrap_error(const Error& error, const std::string& context) {
    return std::unexpected<Error>(error.wrap(context));
}

[[nodiscard]] std::string to_string(ErrorCode code);

} // namespace cradle
