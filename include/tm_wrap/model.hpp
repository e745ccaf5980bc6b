// tm_wrap/model.hpp
// Plain-data snapshot of a trained model, shared by both codecs
//
// ModelParameters - the eight scalars that size and configure a machine
// ModelTensors    - weights (C, K) and automaton states in canonical (C, L, 2) order
// SerializedModel - both together; what the codecs read and write

#pragma once

#include <cstddef>
#include <cstdint>
#include <source_location>
#include <vector>

#include <fmt/format.h>

#include "tm_wrap/error.hpp"
#include "tm_wrap/tensor_layout.hpp"

namespace tm_wrap {

enum class ModelFormat {
    RawBinary,       // fixed-offset header + two flat tensors
    SelfDescribing,  // FlatBuffers container with shapes and literal names
};

[[nodiscard]] constexpr const char* model_format_name(ModelFormat f) noexcept {
    return f == ModelFormat::RawBinary ? "raw" : "fbs";
}

struct ModelParameters {
    std::uint32_t threshold{0};
    std::uint32_t num_literals{0};
    std::uint32_t num_clauses{0};
    std::uint32_t num_classes{0};
    std::int8_t max_state{0};
    std::int8_t min_state{0};
    bool boost_true_positive_feedback{false};
    float s{0.0f};

    [[nodiscard]] ClauseShape clause_shape() const noexcept {
        return ClauseShape{num_clauses, num_literals};
    }

    [[nodiscard]] std::size_t weight_count() const noexcept {
        return static_cast<std::size_t>(num_clauses) * num_classes;
    }

    [[nodiscard]] std::size_t state_count() const noexcept {
        return clause_shape().state_count();
    }

    bool operator==(const ModelParameters&) const = default;
};

struct ModelTensors {
    std::vector<std::int16_t> weights;   // (num_clauses, num_classes)
    std::vector<std::int8_t> states;     // (num_clauses, num_literals, 2)

    bool operator==(const ModelTensors&) const = default;
};

struct SerializedModel {
    ModelParameters params;
    ModelTensors tensors;

    /// Throws ValidationError when the tensor sizes disagree with params.
    void require_consistent(
        const char* context,
        std::source_location loc = std::source_location::current()) const
    {
        if (tensors.weights.size() != params.weight_count()) {
            throw ValidationError(context, fmt::format(
                "weights hold {} values, expected num_clauses * num_classes = {}",
                tensors.weights.size(), params.weight_count()), loc);
        }
        if (tensors.states.size() != params.state_count()) {
            throw ValidationError(context, fmt::format(
                "automaton states hold {} values, expected num_clauses * num_literals * 2 = {}",
                tensors.states.size(), params.state_count()), loc);
        }
    }

    bool operator==(const SerializedModel&) const = default;
};

} // namespace tm_wrap
