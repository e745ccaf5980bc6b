// tm_wrap/abi.hpp
// Fixed C ABI of the native Tsetlin Machine engine
//
// Function signatures and the public prefix of the engine's machine structs.
// Argument widths are part of the external contract and must match exactly.
// The struct prefixes are read (and, for model loading, written through their
// tensor pointers) by the wrapper; fields past the declared prefix are never
// touched.

#pragma once

#include <cstdint>

namespace tm_wrap::abi {

extern "C" {

// create(num_classes, threshold, num_literals, num_clauses, max_state,
//        min_state, boost_flag, y_size, y_element_size, s, seed)
using CreateFn = void* (*)(std::uint32_t, std::uint32_t, std::uint32_t, std::uint32_t,
                           std::int8_t, std::int8_t, std::uint8_t,
                           std::uint32_t, std::uint32_t, float, std::uint32_t);

// train(handle, X, y, rows, epochs)
using TrainFn = void (*)(void*, const std::uint8_t*, const void*, std::uint32_t, std::uint32_t);

// predict(handle, X, y_pred, rows)
using PredictFn = void (*)(void*, const std::uint8_t*, void*, std::uint32_t);

using FreeFn = void (*)(void*);

// save(handle, filename)
using SaveFn = void (*)(void*, const char*);

// load(filename, y_size, y_element_size) -> handle or null
using LoadFn = void* (*)(const char*, std::uint32_t, std::uint32_t);

// ----------------------------------------------------------------------------
// Dense machine (tm_*). Clause states are stored per clause as one run of
// 2 * num_literals bytes laid out (2, num_literals).
// ----------------------------------------------------------------------------
struct DenseMachine {
    std::uint32_t num_classes;
    std::uint32_t threshold;
    std::uint32_t num_literals;
    std::uint32_t num_clauses;
    std::int8_t max_state, min_state;
    std::uint8_t boost_true_positive_feedback;
    float s;

    std::uint32_t y_size, y_element_size;
    void* y_eq;
    void* output_activation;
    void* calculate_feedback;

    std::int8_t mid_state;
    float s_inv, s_min1_inv;
    std::int8_t* ta_state;         // (num_clauses, 2, num_literals)
    std::int16_t* weights;         // (num_clauses, num_classes)
    std::uint8_t* clause_output;   // (num_clauses)
    std::int32_t* votes;           // (num_classes)
};

// ----------------------------------------------------------------------------
// Sparse machine (stm_*). Automaton states live in per-clause linked lists;
// only the prefix up to the per-clause literal-count array is declared.
// ----------------------------------------------------------------------------
struct SparseMachine {
    std::uint32_t num_classes;
    std::uint32_t threshold;
    std::uint32_t num_literals;
    std::uint32_t num_clauses;
    std::int8_t max_state, min_state, sparse_init_state, sparse_min_state;
    std::uint8_t boost_true_positive_feedback;
    float s;

    std::uint32_t y_size, y_element_size;
    void* y_eq;
    void* output_activation;
    void* calculate_feedback;

    std::int8_t mid_state;
    std::int32_t clause_max_size;
    std::uint32_t* clause_sizes;   // (num_clauses) literals held per clause
};

// Linked node backing one sparse automaton state.
struct TAStateNode {
    std::uint32_t ta_id;
    std::int8_t ta_state;
    TAStateNode* next;
};

} // extern "C"

// Predictions and labels are single class indices.
inline constexpr std::uint32_t kLabelVectorSize = 1;
inline constexpr std::uint32_t kLabelElementWidth = sizeof(std::uint32_t);

} // namespace tm_wrap::abi
