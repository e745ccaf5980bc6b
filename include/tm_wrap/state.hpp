// tm_wrap/state.hpp
// Classifier state that crosses a process boundary
//
// Carries hyperparameters, engine location and the fitted label set. The
// native model and the engine binding never cross; a classifier rebuilt from
// a state re-opens the engine on first use.
//
// Byte form: FlatBuffers, schema/classifier_state.fbs (identifier "TMCS").

#pragma once

#include <cstdint>
#include <optional>
#include <source_location>
#include <span>
#include <string>
#include <vector>

#include <flatbuffers/flatbuffers.h>
#include <fmt/format.h>

#include "classifier_state_generated.h"

#include "tm_wrap/config.hpp"
#include "tm_wrap/engine.hpp"
#include "tm_wrap/error.hpp"
#include "tm_wrap/label_mapping.hpp"

namespace tm_wrap {

template <ClassLabel Label>
struct ClassifierState {
    EngineKind kind{EngineKind::Dense};
    Hyperparameters hyperparameters{};
    EngineConfig engine{};

    // Set together once the classifier has been fitted or initialised.
    std::optional<std::vector<Label>> classes{};
    std::optional<std::uint32_t> num_literals{};
    std::optional<std::uint32_t> seed{};

    bool operator==(const ClassifierState&) const = default;
};

template <ClassLabel Label>
[[nodiscard]] std::vector<std::uint8_t> encode_state(const ClassifierState<Label>& state) {
    flatbuffers::FlatBufferBuilder fbb(256);

    const auto& hp = state.hyperparameters;
    fb::HyperparametersBuilder hb(fbb);
    hb.add_threshold(hp.threshold);
    hb.add_num_clauses(hp.num_clauses);
    hb.add_max_state(hp.max_state);
    hb.add_min_state(hp.min_state);
    hb.add_boost_tp(hp.boost_true_positive_feedback);
    hb.add_s(hp.s);
    hb.add_epochs(hp.epochs);
    if (hp.random_state) hb.add_random_state(*hp.random_state);
    const auto hyper = hb.Finish();

    const auto engine = fb::CreateEngineConfigDirect(
        fbb,
        state.engine.lib_dir.generic_string().c_str(),
        state.engine.library_name.c_str(),
        state.engine.runtime_library_name.c_str());

    flatbuffers::Offset<flatbuffers::Vector<std::int64_t>> int_classes{};
    flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<flatbuffers::String>>> str_classes{};
    if (state.classes) {
        if constexpr (std::same_as<Label, std::string>) {
            str_classes = fbb.CreateVectorOfStrings(*state.classes);
        } else {
            std::vector<std::int64_t> v(state.classes->begin(), state.classes->end());
            int_classes = fbb.CreateVector(v);
        }
    }

    fb::ClassifierStateBuilder sb(fbb);
    sb.add_engine_kind(state.kind == EngineKind::Dense ? fb::EngineKind::Dense : fb::EngineKind::Sparse);
    sb.add_hyperparameters(hyper);
    sb.add_engine(engine);
    if (!int_classes.IsNull()) sb.add_integer_classes(int_classes);
    if (!str_classes.IsNull()) sb.add_string_classes(str_classes);
    if (state.num_literals) sb.add_num_literals(*state.num_literals);
    if (state.seed) sb.add_seed(*state.seed);
    fb::FinishClassifierStateBuffer(fbb, sb.Finish());

    const auto* data = fbb.GetBufferPointer();
    return std::vector<std::uint8_t>(data, data + fbb.GetSize());
}

template <ClassLabel Label>
[[nodiscard]] ClassifierState<Label> decode_state(
    std::span<const std::uint8_t> bytes,
    std::source_location loc = std::source_location::current())
{
    constexpr const char* ctx = "decode_state";

    flatbuffers::Verifier verifier(bytes.data(), bytes.size());
    if (!fb::VerifyClassifierStateBuffer(verifier)) {
        throw FormatError(ctx, "bytes are not a serialized classifier state", loc);
    }
    const auto* s = fb::GetClassifierState(bytes.data());

    ClassifierState<Label> out;
    out.kind = s->engine_kind() == fb::EngineKind::Sparse ? EngineKind::Sparse : EngineKind::Dense;

    if (const auto* hp = s->hyperparameters()) {
        out.hyperparameters.threshold = hp->threshold();
        out.hyperparameters.num_clauses = hp->num_clauses();
        out.hyperparameters.max_state = hp->max_state();
        out.hyperparameters.min_state = hp->min_state();
        out.hyperparameters.boost_true_positive_feedback = hp->boost_tp();
        out.hyperparameters.s = hp->s();
        out.hyperparameters.epochs = hp->epochs();
        if (const auto rs = hp->random_state()) out.hyperparameters.random_state = *rs;
    } else {
        throw FormatError(ctx, "state has no hyperparameters", loc);
    }

    if (const auto* e = s->engine()) {
        if (e->lib_dir()) out.engine.lib_dir = e->lib_dir()->str();
        if (e->library_name()) out.engine.library_name = e->library_name()->str();
        if (e->runtime_library_name()) out.engine.runtime_library_name = e->runtime_library_name()->str();
    }

    if constexpr (std::same_as<Label, std::string>) {
        if (s->integer_classes()) {
            throw FormatError(ctx, "state holds integer class labels; expected strings", loc);
        }
        if (const auto* v = s->string_classes()) {
            std::vector<std::string> classes;
            classes.reserve(v->size());
            for (const auto* c : *v) classes.push_back(c ? c->str() : std::string{});
            out.classes = std::move(classes);
        }
    } else {
        if (s->string_classes()) {
            throw FormatError(ctx, "state holds string class labels; expected integers", loc);
        }
        if (const auto* v = s->integer_classes()) {
            std::vector<Label> classes;
            classes.reserve(v->size());
            for (std::int64_t c : *v) classes.push_back(static_cast<Label>(c));
            out.classes = std::move(classes);
        }
    }

    if (const auto n = s->num_literals()) out.num_literals = *n;
    if (const auto seed = s->seed()) out.seed = *seed;
    return out;
}

} // namespace tm_wrap
