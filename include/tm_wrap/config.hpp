// tm_wrap/config.hpp
// Explicit configuration: where the native engine lives, and the
// per-classifier hyperparameters.

#pragma once

#include <cstdint>
#include <filesystem>
#include <limits>
#include <optional>
#include <source_location>
#include <string>

#include <fmt/format.h>

#include "tm_wrap/error.hpp"

namespace tm_wrap {

// ============================================================================
// EngineConfig - locating the native engine library
// ============================================================================

struct EngineConfig {
    /// Directory holding the engine library (and, optionally, its companion runtime).
    std::filesystem::path lib_dir{"."};

    /// Base name; the platform prefix/suffix is added (lib<name>.so, .dylib, .dll).
    std::string library_name{"tsetlin_machine_c"};

    /// Optional companion runtime loaded first with global symbol visibility
    /// when the file exists (FlatBuffers runtime used by the *_fbs primitives).
    std::string runtime_library_name{"flatccrt"};

    [[nodiscard]] static std::string platform_filename(const std::string& name) {
#if defined(_WIN32)
        return fmt::format("lib{}.dll", name);
#elif defined(__APPLE__)
        return fmt::format("lib{}.dylib", name);
#else
        return fmt::format("lib{}.so", name);
#endif
    }

    [[nodiscard]] std::filesystem::path library_path() const {
        return lib_dir / platform_filename(library_name);
    }

    [[nodiscard]] std::filesystem::path runtime_library_path() const {
        return lib_dir / platform_filename(runtime_library_name);
    }

    bool operator==(const EngineConfig&) const = default;
};

// ============================================================================
// Hyperparameters
// ============================================================================

struct Hyperparameters {
    std::uint32_t threshold{1000};
    std::uint32_t num_clauses{1000};
    std::int8_t max_state{127};
    std::int8_t min_state{-127};
    bool boost_true_positive_feedback{false};
    float s{3.0f};
    std::uint32_t epochs{10};

    /// Fixed seed for reproducible runs; a fresh random seed is drawn per
    /// handle creation when absent.
    std::optional<std::uint32_t> random_state{};

    // Fluent copies

    [[nodiscard]] Hyperparameters with_threshold(std::uint32_t v) const { auto h = *this; h.threshold = v; return h; }
    [[nodiscard]] Hyperparameters with_num_clauses(std::uint32_t v) const { auto h = *this; h.num_clauses = v; return h; }
    [[nodiscard]] Hyperparameters with_states(std::int8_t min_v, std::int8_t max_v) const {
        auto h = *this;
        h.min_state = min_v;
        h.max_state = max_v;
        return h;
    }
    [[nodiscard]] Hyperparameters with_boost(bool v) const { auto h = *this; h.boost_true_positive_feedback = v; return h; }
    [[nodiscard]] Hyperparameters with_s(float v) const { auto h = *this; h.s = v; return h; }
    [[nodiscard]] Hyperparameters with_epochs(std::uint32_t v) const { auto h = *this; h.epochs = v; return h; }
    [[nodiscard]] Hyperparameters with_random_state(std::uint32_t v) const { auto h = *this; h.random_state = v; return h; }

    /// Throws ValidationError on the first violated constraint.
    void validate(std::source_location loc = std::source_location::current()) const {
        constexpr const char* ctx = "Hyperparameters::validate";
        if (threshold < 1) {
            throw ValidationError(ctx, "threshold must be >= 1", loc);
        }
        if (num_clauses < 1) {
            throw ValidationError(ctx, "num_clauses must be >= 1", loc);
        }
        if (min_state > max_state) {
            throw ValidationError(ctx, fmt::format(
                "min_state ({}) must not exceed max_state ({})", min_state, max_state), loc);
        }
        // NaN fails this comparison too
        if (!(s >= 1.0f) || s == std::numeric_limits<float>::infinity()) {
            throw ValidationError(ctx, fmt::format("s must be a finite value >= 1.0, got {}", s), loc);
        }
        if (epochs < 1) {
            throw ValidationError(ctx, "epochs must be >= 1", loc);
        }
    }

    bool operator==(const Hyperparameters&) const = default;
};

} // namespace tm_wrap
