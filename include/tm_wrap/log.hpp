// tm_wrap/log.hpp
// Library-wide spdlog logger
//
// The host application may register its own logger under the name "tm_wrap"
// before first use; otherwise a stderr logger is created lazily.

#pragma once

#include <memory>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace tm_wrap {

inline constexpr const char* kLoggerName = "tm_wrap";

[[nodiscard]] inline std::shared_ptr<spdlog::logger> logger() {
    if (auto existing = spdlog::get(kLoggerName)) {
        return existing;
    }
    try {
        return spdlog::stderr_color_mt(kLoggerName);
    } catch (const spdlog::spdlog_ex&) {
        // Lost a registration race with another thread.
        return spdlog::get(kLoggerName);
    }
}

/// The registered logger, or nullptr. Never creates one; for noexcept
/// paths such as destructors.
[[nodiscard]] inline std::shared_ptr<spdlog::logger> existing_logger() noexcept {
    return spdlog::get(kLoggerName);
}

inline void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace tm_wrap
