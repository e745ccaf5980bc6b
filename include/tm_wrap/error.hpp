// tm_wrap/error.hpp
// Structured exception types for TsetlinWrap
//
// Goals:
// - Preserve compatibility with code that catches std::runtime_error
// - Expose ErrorCode, context and source location
// - Let callers catch the error taxonomy by type (ValidationError, ...)

#pragma once

#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "tm_wrap/codes.hpp"

namespace tm_wrap {

enum class ErrorSource {
    Engine,
    Wrapper,
};

/// Structured error for both native engine failures and wrapper-level
/// validation errors.
class Error : public std::runtime_error {
public:
    Error(
        ErrorSource source,
        ErrorCode code,
        std::string_view context,
        std::string_view message,
        std::source_location loc = std::source_location::current())
        : std::runtime_error(build_what_(source, code, context, message, loc))
        , source_(source)
        , code_(code)
        , context_(context)
        , message_(message)
        , loc_(loc)
    {}

    [[nodiscard]] ErrorSource source() const noexcept { return source_; }
    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const char* code_name() const noexcept { return code_to_string(code_); }

    [[nodiscard]] std::string_view context() const noexcept { return context_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }
    [[nodiscard]] std::source_location location() const noexcept { return loc_; }

    // Convenience factory

    [[nodiscard]] static Error Engine(
        std::string_view context,
        std::string_view message,
        std::source_location loc = std::source_location::current())
    {
        return Error(ErrorSource::Engine, ErrorCode::Engine, context, message, loc);
    }

private:
    ErrorSource source_{ErrorSource::Wrapper};
    ErrorCode code_{ErrorCode::Internal};
    std::string context_;
    std::string message_;
    std::source_location loc_{};

    static std::string build_what_(
        ErrorSource source,
        ErrorCode code,
        std::string_view context,
        std::string_view message,
        const std::source_location& loc)
    {
        const char* prefix = (source == ErrorSource::Engine) ? "ENGINE" : "WRAP";

        if (context.empty()) {
            return fmt::format(
                "[{}_{}] at {}:{} in {}: {}",
                prefix, code_to_string(code),
                loc.file_name(), loc.line(), loc.function_name(), message);
        }

        return fmt::format(
            "[{}_{}] {} at {}:{} in {}: {}",
            prefix, code_to_string(code), context,
            loc.file_name(), loc.line(), loc.function_name(), message);
    }
};

// ============================================================================
// Typed errors
// ============================================================================

/// Native library missing or unloadable. Never retried.
class LinkError : public Error {
public:
    LinkError(std::string_view context, std::string_view message,
              std::source_location loc = std::source_location::current())
        : Error(ErrorSource::Wrapper, ErrorCode::Link, context, message, loc) {}
};

/// Bad shapes, non-binary inputs, inconsistent class sets.
class ValidationError : public Error {
public:
    ValidationError(std::string_view context, std::string_view message,
                    std::source_location loc = std::source_location::current())
        : Error(ErrorSource::Wrapper, ErrorCode::Validation, context, message, loc) {}
};

class NotFittedError : public Error {
public:
    NotFittedError(std::string_view context, std::string_view message,
                   std::source_location loc = std::source_location::current())
        : Error(ErrorSource::Wrapper, ErrorCode::NotFitted, context, message, loc) {}
};

/// An optional engine capability (e.g. the self-describing format) is absent.
class UnsupportedOperation : public Error {
public:
    UnsupportedOperation(std::string_view context, std::string_view message,
                         std::source_location loc = std::source_location::current())
        : Error(ErrorSource::Wrapper, ErrorCode::Unsupported, context, message, loc) {}
};

/// Malformed or truncated model file, or an I/O failure while reading/writing one.
class FormatError : public Error {
public:
    FormatError(std::string_view context, std::string_view message,
                std::source_location loc = std::source_location::current())
        : Error(ErrorSource::Wrapper, ErrorCode::Format, context, message, loc) {}
};

} // namespace tm_wrap
