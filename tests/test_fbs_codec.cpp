// test_fbs_codec.cpp
// Tests for the self-describing (FlatBuffers) model format
//
// Framework: doctest

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdint>
#include <string>
#include <vector>

#include <flatbuffers/flatbuffers.h>

#include "test_support.hpp"
#include "tm_wrap/fbs_codec.hpp"

using namespace tm_wrap;

namespace {

SerializedModel sample_model() {
    SerializedModel m;
    m.params = ModelParameters{20, 2, 3, 2, 127, -127, false, 4.0f};
    m.tensors.weights = {1, 0, 0, 1, -1, 2};
    m.tensors.states = {1, -1, 2, -2, 3, -3, 4, -4, 5, -5, 6, -6};
    return m;
}

/// Hand-built model whose shape vectors can be chosen freely.
std::vector<std::uint8_t> build_model(std::vector<std::uint32_t> weights_shape,
                                      std::vector<std::uint32_t> states_shape,
                                      const SerializedModel& m) {
    flatbuffers::FlatBufferBuilder fbb;
    auto w = TsetlinMachine::CreateClauseWeightsTensor(
        fbb, fbb.CreateVector(m.tensors.weights), fbb.CreateVector(weights_shape));
    auto s = TsetlinMachine::CreateAutomatonStatesTensor(
        fbb, fbb.CreateVector(m.tensors.states), fbb.CreateVector(states_shape));
    const auto& p = m.params;
    auto params = TsetlinMachine::CreateParameters(
        fbb, p.threshold, p.num_literals, p.num_clauses, p.num_classes, p.max_state, p.min_state, 0, p.s);
    TsetlinMachine::FinishModelBuffer(fbb, TsetlinMachine::CreateModel(fbb, params, w, s));
    return {fbb.GetBufferPointer(), fbb.GetBufferPointer() + fbb.GetSize()};
}

} // namespace

TEST_CASE("default_literal_names") {
    const auto names = default_literal_names(3);
    CHECK(names == std::vector<std::string>{"Literal 0", "Literal 1", "Literal 2"});
    CHECK(default_literal_names(0).empty());
}

TEST_CASE("encode_fbs / decode_fbs keep parameters, tensors and shapes") {
    const auto model = sample_model();
    const auto decoded = decode_fbs(encode_fbs(model));

    CHECK(decoded.params == model.params);
    CHECK(decoded.tensors == model.tensors);
    CHECK(decoded.weights_shape == std::vector<std::uint32_t>{3, 2});
    CHECK(decoded.states_shape == std::vector<std::uint32_t>{3, 2, 2});
    CHECK_NOTHROW(decoded.check_consistent());
    CHECK(decoded.to_serialized() == model);
}

TEST_CASE("Literal names are absent unless provided") {
    const auto model = sample_model();

    CHECK_FALSE(decode_fbs(encode_fbs(model)).literal_names.has_value());

    const std::vector<std::string> names{"x0", "x1"};
    const auto with_names = decode_fbs(encode_fbs(model, names));
    REQUIRE(with_names.literal_names.has_value());
    CHECK(*with_names.literal_names == names);
}

TEST_CASE("Literal names of the wrong length are left out") {
    const auto decoded = decode_fbs(encode_fbs(sample_model(), std::vector<std::string>{"only one"}));
    CHECK_FALSE(decoded.literal_names.has_value());
}

TEST_CASE("The raw parameters table uses the engine's field names") {
    const auto bytes = encode_fbs(sample_model());
    const auto* root = TsetlinMachine::GetModel(bytes.data());
    REQUIRE(root->params() != nullptr);
    CHECK(root->params()->n_literals() == 2);
    CHECK(root->params()->n_clauses() == 3);
    CHECK(root->params()->learn_s() == doctest::Approx(4.0));
    CHECK(root->literal_names() == nullptr);
}

TEST_CASE("decode_fbs - garbage and truncation are FormatErrors") {
    std::vector<std::uint8_t> garbage(64, 0xAB);
    CHECK_THROWS_AS((void)decode_fbs(garbage), FormatError);

    std::vector<std::uint8_t> empty;
    CHECK_THROWS_AS((void)decode_fbs(empty), FormatError);

    auto bytes = encode_fbs(sample_model());
    bytes.resize(bytes.size() / 2);
    CHECK_THROWS_AS((void)decode_fbs(bytes), FormatError);
}

TEST_CASE("decode_fbs - shape must account for every value") {
    const auto model = sample_model();
    CHECK_THROWS_AS((void)decode_fbs(build_model({3, 3}, {3, 2, 2}, model)), FormatError);
    CHECK_THROWS_AS((void)decode_fbs(build_model({3, 2}, {6, 2}, model)), FormatError);
}

TEST_CASE("check_consistent - shapes that disagree with the parameters") {
    const auto model = sample_model();
    // Same element counts, transposed shapes.
    const auto decoded = decode_fbs(build_model({2, 3}, {3, 2, 2}, model));
    CHECK(decoded.tensors.weights.size() == 6);
    CHECK_THROWS_AS(decoded.check_consistent(), FormatError);
    CHECK_THROWS_AS((void)decoded.to_serialized(), FormatError);
}

TEST_CASE("write_fbs_model / read_fbs_model") {
    testing::TempDir dir;
    const auto path = dir.file("model.fbs");
    const auto model = sample_model();

    write_fbs_model(path, model, default_literal_names(model.params.num_literals));
    const auto loaded = read_fbs_model(path);
    CHECK(loaded.to_serialized() == model);
    REQUIRE(loaded.literal_names.has_value());
    CHECK(loaded.literal_names->at(1) == "Literal 1");

    CHECK_THROWS_AS((void)read_fbs_model(dir.file("missing.fbs")), FormatError);
}
