#include "../include/sgate_errors.hpp"

#include <cstring>

namespace sgate {

const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::VALIDATION:   return "VALIDATION";
        case ErrorCode::PARSE:        return "PARSE";
        case ErrorCode::CONFLICT:     return "CONFLICT";
        case ErrorCode::FATAL_CONFIG: return "FATAL_CONFIG";
        case ErrorCode::IO:           return "IO";
    }
    return "UNKNOWN";
}

int exit_code_for(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::VALIDATION:
        case ErrorCode::PARSE:
            return 1;
        default:
            return 2;
    }
}

IOError::IOError(const std::string& what, int err)
    : GateError(ErrorCode::IO, what + ": " + std::strerror(err))
    , errno_(err) {}

} // namespace sgate
