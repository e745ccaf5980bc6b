// tm_wrap/fbs_codec.hpp
// Self-describing model format (FlatBuffers, schema/tsetlin_machine.fbs)
//
// Tensors travel with explicit shape vectors. The reader rebuilds tensors from
// the carried shapes, not from the parameters; check_consistent() then tells
// whether shapes and parameters agree.

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <numeric>
#include <optional>
#include <source_location>
#include <span>
#include <string>
#include <vector>

#include <flatbuffers/flatbuffers.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include "tsetlin_machine_generated.h"

#include "tm_wrap/detail/file_io.hpp"
#include "tm_wrap/error.hpp"
#include "tm_wrap/log.hpp"
#include "tm_wrap/model.hpp"

namespace tm_wrap {

/// "Literal 0", "Literal 1", ...
[[nodiscard]] inline std::vector<std::string> default_literal_names(std::uint32_t num_literals) {
    std::vector<std::string> names;
    names.reserve(num_literals);
    for (std::uint32_t i = 0; i < num_literals; ++i) {
        names.push_back(fmt::format("Literal {}", i));
    }
    return names;
}

struct SelfDescribingModel {
    ModelParameters params;
    ModelTensors tensors;
    std::vector<std::uint32_t> weights_shape;
    std::vector<std::uint32_t> states_shape;
    std::optional<std::vector<std::string>> literal_names;

    /// Throws FormatError if the carried shapes disagree with the parameters.
    void check_consistent(std::source_location loc = std::source_location::current()) const {
        constexpr const char* ctx = "SelfDescribingModel::check_consistent";
        const std::vector<std::uint32_t> want_weights{params.num_clauses, params.num_classes};
        const std::vector<std::uint32_t> want_states{params.num_clauses, params.num_literals, 2};
        if (weights_shape != want_weights) {
            throw FormatError(ctx, fmt::format(
                "clause weight shape {} does not match parameters (n_clauses={}, n_classes={})",
                weights_shape, params.num_clauses, params.num_classes), loc);
        }
        if (states_shape != want_states) {
            throw FormatError(ctx, fmt::format(
                "automaton state shape {} does not match parameters (n_clauses={}, n_literals={})",
                states_shape, params.num_clauses, params.num_literals), loc);
        }
        if (literal_names && literal_names->size() != params.num_literals) {
            throw FormatError(ctx, fmt::format(
                "{} literal names for {} literals", literal_names->size(), params.num_literals), loc);
        }
    }

    [[nodiscard]] SerializedModel to_serialized(
        std::source_location loc = std::source_location::current()) const
    {
        check_consistent(loc);
        return SerializedModel{params, tensors};
    }
};

// ============================================================================
// Encode
// ============================================================================

/// Names are written only when given with exactly one name per literal;
/// otherwise the field is left out entirely.
[[nodiscard]] inline std::vector<std::uint8_t> encode_fbs(
    const SerializedModel& model,
    const std::optional<std::vector<std::string>>& literal_names = std::nullopt,
    std::source_location loc = std::source_location::current())
{
    model.require_consistent("encode_fbs", loc);
    const auto& p = model.params;

    flatbuffers::FlatBufferBuilder fbb(
        1024 + model.tensors.weights.size() * sizeof(std::int16_t) + model.tensors.states.size());

    const auto weights_vec = fbb.CreateVector(model.tensors.weights);
    const auto weights_shape = fbb.CreateVector(std::vector<std::uint32_t>{p.num_clauses, p.num_classes});
    const auto clause_weights = TsetlinMachine::CreateClauseWeightsTensor(fbb, weights_vec, weights_shape);

    const auto states_vec = fbb.CreateVector(model.tensors.states);
    const auto states_shape = fbb.CreateVector(std::vector<std::uint32_t>{p.num_clauses, p.num_literals, 2});
    const auto automaton_states = TsetlinMachine::CreateAutomatonStatesTensor(fbb, states_vec, states_shape);

    const auto params = TsetlinMachine::CreateParameters(
        fbb, p.threshold, p.num_literals, p.num_clauses, p.num_classes,
        p.max_state, p.min_state,
        static_cast<std::uint8_t>(p.boost_true_positive_feedback ? 1 : 0), p.s);

    flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<flatbuffers::String>>> names{};
    if (literal_names) {
        if (literal_names->size() == p.num_literals) {
            names = fbb.CreateVectorOfStrings(*literal_names);
        } else {
            logger()->warn("encode_fbs: {} literal names for {} literals; omitting names",
                           literal_names->size(), p.num_literals);
        }
    }

    const auto root = TsetlinMachine::CreateModel(fbb, params, clause_weights, automaton_states, names);
    TsetlinMachine::FinishModelBuffer(fbb, root);

    const auto* data = fbb.GetBufferPointer();
    return std::vector<std::uint8_t>(data, data + fbb.GetSize());
}

// ============================================================================
// Decode
// ============================================================================

namespace detail {

template <class T>
[[nodiscard]] std::vector<T> tensor_from_fbs_(
    const flatbuffers::Vector<T>* data,
    const flatbuffers::Vector<std::uint32_t>* shape,
    std::size_t rank,
    const char* name,
    std::vector<std::uint32_t>& shape_out,
    const std::source_location& loc)
{
    constexpr const char* ctx = "decode_fbs";
    if (!data || !shape) {
        throw FormatError(ctx, fmt::format("{} tensor is missing its data or shape", name), loc);
    }
    shape_out.assign(shape->begin(), shape->end());
    if (shape_out.size() != rank) {
        throw FormatError(ctx, fmt::format(
            "{} shape {} has rank {}, expected {}", name, shape_out, shape_out.size(), rank), loc);
    }
    const auto elements = std::accumulate(shape_out.begin(), shape_out.end(), std::uint64_t{1},
                                          std::multiplies<std::uint64_t>());
    if (elements != data->size()) {
        throw FormatError(ctx, fmt::format(
            "{} shape {} implies {} values, buffer holds {}", name, shape_out, elements, data->size()), loc);
    }
    return std::vector<T>(data->begin(), data->end());
}

} // namespace detail

[[nodiscard]] inline SelfDescribingModel decode_fbs(
    std::span<const std::uint8_t> bytes,
    std::source_location loc = std::source_location::current())
{
    constexpr const char* ctx = "decode_fbs";

    flatbuffers::Verifier verifier(bytes.data(), bytes.size());
    if (!TsetlinMachine::VerifyModelBuffer(verifier)) {
        throw FormatError(ctx, fmt::format(
            "{} bytes are not a valid self-describing model", bytes.size()), loc);
    }
    const auto* model = TsetlinMachine::GetModel(bytes.data());

    const auto* params = model->params();
    if (!params) {
        throw FormatError(ctx, "model has no parameters table", loc);
    }
    const auto* weights = model->clause_weights();
    const auto* states = model->automaton_states();
    if (!weights || !states) {
        throw FormatError(ctx, "model is missing its clause weights or automaton states", loc);
    }

    SelfDescribingModel out;
    out.params.threshold = params->threshold();
    out.params.num_literals = params->n_literals();
    out.params.num_clauses = params->n_clauses();
    out.params.num_classes = params->n_classes();
    out.params.max_state = params->max_state();
    out.params.min_state = params->min_state();
    out.params.boost_true_positive_feedback = params->boost_tp() != 0;
    out.params.s = params->learn_s();

    out.tensors.weights = detail::tensor_from_fbs_(
        weights->weights(), weights->shape(), 2, "clause weights", out.weights_shape, loc);
    out.tensors.states = detail::tensor_from_fbs_(
        states->states(), states->shape(), 3, "automaton states", out.states_shape, loc);

    if (const auto* names = model->literal_names()) {
        std::vector<std::string> v;
        v.reserve(names->size());
        for (const auto* name : *names) {
            v.push_back(name ? name->str() : std::string{});
        }
        out.literal_names = std::move(v);
    }
    return out;
}

inline void write_fbs_model(
    const std::filesystem::path& path,
    const SerializedModel& model,
    const std::optional<std::vector<std::string>>& literal_names = std::nullopt,
    std::source_location loc = std::source_location::current())
{
    const auto bytes = encode_fbs(model, literal_names, loc);
    detail::write_file_atomic(path, bytes, "write_fbs_model", loc);
    logger()->info("saved self-describing model ({} bytes) to {}", bytes.size(), path.string());
}

[[nodiscard]] inline SelfDescribingModel read_fbs_model(
    const std::filesystem::path& path,
    std::source_location loc = std::source_location::current())
{
    const auto bytes = detail::read_file(path, "read_fbs_model", loc);
    auto model = decode_fbs(bytes, loc);
    logger()->info("read self-describing model from {}", path.string());
    return model;
}

} // namespace tm_wrap
