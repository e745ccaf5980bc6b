// tm_wrap/codes.hpp
// Error codes shared by tm_wrap::Error and the typed exception subclasses
//
// Centralizes ErrorCode -> string mapping to avoid duplication.

#pragma once

namespace tm_wrap {

enum class ErrorCode {
    Ok,
    Link,           // native library missing, unloadable, or a required symbol absent
    Validation,     // caller-correctable input problem
    NotFitted,      // operation requires a bound model
    Unsupported,    // optional engine capability absent
    Format,         // malformed, truncated or unreadable model file
    Engine,         // engine returned a null handle
    Internal,
};

/// Convert an ErrorCode to a stable string name.
///
/// This is a pure function and never throws.
[[nodiscard]] constexpr const char* code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:          return "OK";
        case ErrorCode::Link:        return "LINK";
        case ErrorCode::Validation:  return "VALIDATION";
        case ErrorCode::NotFitted:   return "NOT_FITTED";
        case ErrorCode::Unsupported: return "UNSUPPORTED";
        case ErrorCode::Format:      return "FORMAT";
        case ErrorCode::Engine:      return "ENGINE";
        case ErrorCode::Internal:    return "INTERNAL";
    }
    return "UNKNOWN_CODE";
}

} // namespace tm_wrap
