// tm_wrap/tensor_layout.hpp
// Clause-state tensor reordering between the engine and the on-disk layout
//
// Engine order:    (num_clauses, 2, num_literals)  polarity-major per clause
// Canonical order: (num_clauses, num_literals, 2)  polarity fastest-varying
//
// Per clause the transform is reshape(2, L) -> transpose -> flatten; the
// inverse is its exact mirror, so canonical_to_engine(engine_to_canonical(t)) == t.

#pragma once

#include <cstddef>
#include <cstdint>
#include <source_location>
#include <span>
#include <vector>

#include <fmt/format.h>

#include "tm_wrap/error.hpp"

namespace tm_wrap {

struct ClauseShape {
    std::uint32_t num_clauses{0};
    std::uint32_t num_literals{0};

    /// Number of automaton states, C * L * 2.
    [[nodiscard]] constexpr std::size_t state_count() const noexcept {
        return static_cast<std::size_t>(num_clauses) * num_literals * 2;
    }

    bool operator==(const ClauseShape&) const = default;
};

namespace detail {

inline void check_state_spans_(
    const char* context,
    const ClauseShape& shape,
    std::size_t src_size,
    std::size_t dst_size,
    const std::source_location& loc)
{
    const auto expected = shape.state_count();
    if (src_size != expected || dst_size != expected) {
        throw ValidationError(context, fmt::format(
            "clause tensor of shape ({}, {}, 2) needs {} states; source has {}, destination {}",
            shape.num_clauses, shape.num_literals, expected, src_size, dst_size), loc);
    }
}

} // namespace detail

/// Engine (C, 2, L) -> canonical (C, L, 2), writing into `dst`.
inline void engine_to_canonical(
    const ClauseShape& shape,
    std::span<const std::int8_t> src,
    std::span<std::int8_t> dst,
    std::source_location loc = std::source_location::current())
{
    detail::check_state_spans_("engine_to_canonical", shape, src.size(), dst.size(), loc);

    const std::size_t L = shape.num_literals;
    const std::size_t run = 2 * L;
    for (std::size_t c = 0; c < shape.num_clauses; ++c) {
        const std::int8_t* in = src.data() + c * run;
        std::int8_t* out = dst.data() + c * run;
        for (std::size_t l = 0; l < L; ++l) {
            out[2 * l + 0] = in[l];
            out[2 * l + 1] = in[L + l];
        }
    }
}

/// Canonical (C, L, 2) -> engine (C, 2, L), writing into `dst`.
inline void canonical_to_engine(
    const ClauseShape& shape,
    std::span<const std::int8_t> src,
    std::span<std::int8_t> dst,
    std::source_location loc = std::source_location::current())
{
    detail::check_state_spans_("canonical_to_engine", shape, src.size(), dst.size(), loc);

    const std::size_t L = shape.num_literals;
    const std::size_t run = 2 * L;
    for (std::size_t c = 0; c < shape.num_clauses; ++c) {
        const std::int8_t* in = src.data() + c * run;
        std::int8_t* out = dst.data() + c * run;
        for (std::size_t l = 0; l < L; ++l) {
            out[l] = in[2 * l + 0];
            out[L + l] = in[2 * l + 1];
        }
    }
}

[[nodiscard]] inline std::vector<std::int8_t> engine_to_canonical(
    const ClauseShape& shape,
    std::span<const std::int8_t> src,
    std::source_location loc = std::source_location::current())
{
    std::vector<std::int8_t> out(shape.state_count());
    engine_to_canonical(shape, src, out, loc);
    return out;
}

[[nodiscard]] inline std::vector<std::int8_t> canonical_to_engine(
    const ClauseShape& shape,
    std::span<const std::int8_t> src,
    std::source_location loc = std::source_location::current())
{
    std::vector<std::int8_t> out(shape.state_count());
    canonical_to_engine(shape, src, out, loc);
    return out;
}

} // namespace tm_wrap
