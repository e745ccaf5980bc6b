/**
 * @file scope_guard.hpp
 * @brief Rollback-on-exception utility for TsetlinWrap
 *
 * @details ScopeGuardOnFail runs its cleanup only when the scope is left by an
 * exception. Cleanup actions must be noexcept; a static_assert rejects
 * anything else.
 *
 * IMPORTANT - LAMBDA CONTROL FLOW WARNING:
 * TMWRAP_SCOPE_FAIL creates a lambda.
 * 'return' inside the block returns from the LAMBDA, not the enclosing function.
 *
 * Example usage with a temp file that is renamed into place:
 * @code
 * TMWRAP_SCOPE_FAIL {
 *     std::error_code ignored;
 *     std::filesystem::remove(tmp, ignored);
 * };
 * write(tmp);               // temp file removed if this throws
 * std::filesystem::rename(tmp, path);
 * @endcode
 */

#pragma once

#include <exception>    // std::uncaught_exceptions
#include <type_traits>
#include <utility>

namespace tm_wrap {

// =============================================================================
// ScopeGuardOnFail - Executes Only on Exception
// =============================================================================

/**
 * @brief Scope guard that executes only when leaving scope due to an exception.
 *
 * Uses std::uncaught_exceptions() to detect whether stack unwinding is in
 * progress, so a guard created inside a destructor that runs during
 * unwinding only fires for exceptions thrown after it was created.
 */
template <typename F>
class [[nodiscard]] ScopeGuardOnFail {
    static_assert(std::is_nothrow_invocable_v<F&>,
                  "ScopeGuardOnFail requires a noexcept cleanup action");

public:
    explicit ScopeGuardOnFail(F&& action) noexcept(std::is_nothrow_move_constructible_v<F>)
        : action_(std::forward<F>(action))
        , uncaught_count_(std::uncaught_exceptions())
    {}

    ScopeGuardOnFail(const ScopeGuardOnFail&) = delete;
    ScopeGuardOnFail& operator=(const ScopeGuardOnFail&) = delete;

    ~ScopeGuardOnFail() noexcept {
        // Only execute if more exceptions are in flight than at construction
        if (std::uncaught_exceptions() > uncaught_count_) {
            action_();
        }
    }

private:
    F action_;
    int uncaught_count_;
};

// =============================================================================
// Macro Support
// =============================================================================

namespace detail {

struct ScopeGuardOnFailMaker {};

template <typename Fn>
[[nodiscard]] ScopeGuardOnFail<std::decay_t<Fn>> operator+(ScopeGuardOnFailMaker, Fn&& fn) {
    return ScopeGuardOnFail<std::decay_t<Fn>>(std::forward<Fn>(fn));
}

} // namespace detail

#define TMWRAP_SCOPE_GUARD_CONCAT_IMPL2(a, b) a##b
#define TMWRAP_SCOPE_GUARD_CONCAT_IMPL(a, b) TMWRAP_SCOPE_GUARD_CONCAT_IMPL2(a, b)
#if defined(__COUNTER__)
#define TMWRAP_SCOPE_GUARD_UNIQUE(prefix) TMWRAP_SCOPE_GUARD_CONCAT_IMPL(prefix, __COUNTER__)
#else
#define TMWRAP_SCOPE_GUARD_UNIQUE(prefix) TMWRAP_SCOPE_GUARD_CONCAT_IMPL(prefix, __LINE__)
#endif

/// Usage: TMWRAP_SCOPE_FAIL { rollback_code; };
#define TMWRAP_SCOPE_FAIL \
    auto TMWRAP_SCOPE_GUARD_UNIQUE(tmwrap_scope_fail_) = ::tm_wrap::detail::ScopeGuardOnFailMaker{} + [&]() noexcept

} // namespace tm_wrap
