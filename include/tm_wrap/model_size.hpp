// tm_wrap/model_size.hpp
// Memory footprint of a native model, mirroring the engine's allocations.
//
// Keep in lock-step with the engine allocator; nothing checks these numbers
// against the engine at runtime.

#pragma once

#include <cstddef>
#include <cstdint>
#include <numeric>
#include <span>

#include "tm_wrap/model.hpp"

namespace tm_wrap {

struct ModelSizeBreakdown {
    std::size_t automaton_states{0};   // dense: C*L*2 int8; sparse: one linked node per held literal
    std::size_t clause_pointers{0};    // sparse: per-clause list head
    std::size_t active_literal_pointers{0};  // sparse: per-class list head
    std::size_t clause_sizes{0};       // sparse: uint32 per clause
    std::size_t weights{0};            // int16 (C, K)
    std::size_t clause_output{0};      // uint8 (C)
    std::size_t feedback{0};           // dense: int8 (C, K, 3)
    std::size_t votes{0};              // int32 (K)

    [[nodiscard]] constexpr std::size_t total() const noexcept {
        return automaton_states + clause_pointers + active_literal_pointers + clause_sizes
             + weights + clause_output + feedback + votes;
    }
};

/// Approximate size of one sparse automaton node (id, state, next + padding).
inline constexpr std::size_t kSparseNodeBytes = 16;

[[nodiscard]] inline ModelSizeBreakdown estimate_dense_size(const ModelParameters& p) noexcept {
    const std::size_t C = p.num_clauses;
    const std::size_t L = p.num_literals;
    const std::size_t K = p.num_classes;

    ModelSizeBreakdown b;
    b.automaton_states = C * L * 2 * sizeof(std::int8_t);
    b.weights = C * K * sizeof(std::int16_t);
    b.clause_output = C * sizeof(std::uint8_t);
    b.feedback = C * K * 3 * sizeof(std::int8_t);
    b.votes = K * sizeof(std::int32_t);
    return b;
}

/// `clause_sizes` is the engine's live per-clause literal count.
[[nodiscard]] inline ModelSizeBreakdown estimate_sparse_size(
    const ModelParameters& p,
    std::span<const std::uint32_t> clause_sizes) noexcept
{
    const std::size_t C = p.num_clauses;
    const std::size_t K = p.num_classes;
    const std::size_t held = std::accumulate(clause_sizes.begin(), clause_sizes.end(), std::size_t{0});

    ModelSizeBreakdown b;
    b.automaton_states = held * kSparseNodeBytes;
    b.clause_pointers = C * sizeof(void*);
    b.active_literal_pointers = K * sizeof(void*);
    b.clause_sizes = C * sizeof(std::uint32_t);
    b.weights = C * K * sizeof(std::int16_t);
    b.clause_output = C * sizeof(std::uint8_t);
    b.votes = K * sizeof(std::int32_t);
    return b;
}

} // namespace tm_wrap
