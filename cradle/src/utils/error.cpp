#include "cradle/utils/error.h"

namespace cradle {

Error Error::wrap(const std::string& context) const {
    if (context.empty()) {
        return *this;
    }
    return Error{code, context + ": " + message};
}

std::string Error::to_string() const {
    return "[" + cradle::to_string(code) + "] " + message;
}

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_ARGUMENT: return "invalid_argument";
        case ErrorCode::NOT_FOUND: return "not_found";
        case ErrorCode::IO_ERROR: return "io_error";
        case ErrorCode::PARSE_ERROR: return "parse_error";
        case ErrorCode::PERMISSION_DENIED: return "permission_denied";
        case ErrorCode::ALREADY_EXISTS: return "already_exists";
        case ErrorCode::UNAVAILABLE: return "unavailable";
        case ErrorCode::INTERNAL: return "internal";
        default: return "unknown";
    }
}

} // namespace cradle
