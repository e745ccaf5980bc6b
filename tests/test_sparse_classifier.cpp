// test_sparse_classifier.cpp
// Tests for tm_wrap::SparseClassifier against the test engine
//
// Framework: doctest
//
// The sparse engine exports stm_save and stm_load_dense but no
// self-describing primitives, so those paths must report UnsupportedOperation.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <span>
#include <string>
#include <vector>

#include "test_support.hpp"
#include "tm_wrap/classifier.hpp"

using namespace tm_wrap;
using tm_wrap::testing::small_hyperparameters;
using tm_wrap::testing::test_engine_config;
using tm_wrap::testing::xor_labels;
using tm_wrap::testing::xor_patterns;

namespace {

SparseClassifier<> make_sparse() {
    return SparseClassifier<>(small_hyperparameters(), test_engine_config());
}

} // namespace

TEST_CASE("SparseClassifier fit / predict / score") {
    auto clf = make_sparse();
    clf.fit(xor_patterns(), xor_labels());
    CHECK(clf.is_bound());
    CHECK(clf.predict(xor_patterns()) == xor_labels());
    CHECK(clf.score(xor_patterns(), xor_labels()) == doctest::Approx(1.0));
}

TEST_CASE("SparseClassifier before fit") {
    testing::TempDir dir;
    auto clf = make_sparse();
    CHECK_THROWS_AS((void)clf.predict(xor_patterns()), NotFittedError);
    CHECK_THROWS_AS((void)clf.estimate_model_size(), NotFittedError);
    CHECK_THROWS_AS(clf.save_model(dir.file("m.bin")), NotFittedError);
}

TEST_CASE("SparseClassifier rejects non-binary input") {
    auto clf = make_sparse();
    auto X = xor_patterns();
    X.at(0, 1) = 9;
    CHECK_THROWS_AS(clf.fit(X, xor_labels()), ValidationError);
    CHECK_FALSE(clf.is_bound());
}

TEST_CASE("SparseClassifier partial_fit accumulates") {
    auto clf = make_sparse();
    const auto X = xor_patterns();
    const auto y = xor_labels();
    const auto first = BinaryMatrix(
        std::vector<std::uint8_t>(X.bytes().begin(), X.bytes().begin() + 16), 4, 4);
    const auto second = BinaryMatrix(
        std::vector<std::uint8_t>(X.bytes().begin() + 16, X.bytes().end()), 4, 4);

    clf.partial_fit(first, std::span(y).subspan(0, 4));
    clf.partial_fit(second, std::span(y).subspan(4, 4));
    CHECK(clf.score(X, y) == doctest::Approx(1.0));
}

TEST_CASE("SparseClassifier estimate_model_size follows live clause sizes") {
    auto clf = make_sparse();
    clf.fit(xor_patterns(), xor_labels());

    const auto params = clf.model_parameters();
    // Eight clauses memorised one row each: one literal polarity per feature.
    std::vector<std::uint32_t> sizes(params.num_clauses, 0);
    for (std::size_t j = 0; j < 8; ++j) sizes[j] = params.num_literals;

    const auto size = clf.estimate_model_size();
    CHECK(size.automaton_states == 8 * 4 * kSparseNodeBytes);
    CHECK(size.total() == estimate_sparse_size(params, sizes).total());
    CHECK(size.feedback == 0);
}

TEST_CASE("SparseClassifier save_model writes through the engine") {
    testing::TempDir dir;
    const auto path = dir.file("sparse.bin");
    auto clf = make_sparse();
    clf.fit(xor_patterns(), xor_labels());
    clf.save_model(path);
    CHECK(std::filesystem::exists(path));
    CHECK_FALSE(std::filesystem::exists(detail::temp_path_for(path)));
}

TEST_CASE("SparseClassifier load_model_dense reads a dense model file") {
    testing::TempDir dir;
    const auto path = dir.file("dense.bin");

    Classifier<> dense(small_hyperparameters(), test_engine_config());
    dense.fit(xor_patterns(), xor_labels());
    dense.save_model(path);

    SparseClassifier<> sparse(Hyperparameters{}, test_engine_config());
    const std::vector<std::int64_t> classes{0, 1};
    sparse.load_model_dense(path, std::span<const std::int64_t>(classes));

    CHECK(sparse.is_bound());
    CHECK(sparse.predict(xor_patterns()) == xor_labels());
    CHECK(sparse.model_parameters() == dense.model_parameters());
    CHECK(sparse.hyperparameters().num_clauses == 10);
    CHECK(sparse.hyperparameters().epochs == Hyperparameters{}.epochs);
}

TEST_CASE("SparseClassifier load_model_dense rejects s below 1.0 and keeps the current model") {
    testing::TempDir dir;
    const auto path = dir.file("low_s.bin");

    Classifier<> dense(small_hyperparameters(), test_engine_config());
    dense.fit(xor_patterns(), xor_labels());
    auto bad = dense.snapshot();
    bad.params.s = 0.5f;
    write_raw_model(path, bad);

    auto clf = make_sparse();
    clf.fit(xor_patterns(), xor_labels());
    CHECK_THROWS_AS(clf.load_model_dense(path), ValidationError);
    CHECK(clf.is_bound());
    CHECK(clf.model_parameters().s == doctest::Approx(3.0));
    CHECK(clf.predict(xor_patterns()) == xor_labels());
    CHECK_NOTHROW((void)SparseClassifier<>(clf.state()));
}

TEST_CASE("SparseClassifier load_model_dense with a missing file") {
    testing::TempDir dir;
    auto clf = make_sparse();
    CHECK_THROWS_AS(clf.load_model_dense(dir.file("absent.bin")), FormatError);
    CHECK_FALSE(clf.is_bound());
}

TEST_CASE("SparseClassifier load_model_dense with a corrupt file is an engine error") {
    testing::TempDir dir;
    const auto path = dir.file("junk.bin");
    {
        std::ofstream out(path, std::ios::binary);
        out << "not a model";
    }
    auto clf = make_sparse();
    CHECK_THROWS_AS(clf.load_model_dense(path), Error);
    CHECK_FALSE(clf.is_bound());
}

TEST_CASE("SparseClassifier self-describing persistence needs engine support") {
    testing::TempDir dir;
    auto clf = make_sparse();
    clf.fit(xor_patterns(), xor_labels());

    CHECK_THROWS_AS(clf.save_model_fbs(dir.file("m.fbs")), UnsupportedOperation);
    CHECK_FALSE(std::filesystem::exists(dir.file("m.fbs")));
    CHECK_FALSE(std::filesystem::exists(detail::temp_path_for(dir.file("m.fbs"))));

    // Reported as unsupported even though the file does not exist.
    CHECK_THROWS_AS(clf.load_model_fbs(dir.file("absent.fbs")), UnsupportedOperation);
    CHECK(clf.is_bound());
}

TEST_CASE("SparseClassifier error messages name the sparse classifier") {
    auto clf = make_sparse();
    try {
        (void)clf.predict(xor_patterns());
        FAIL("expected NotFittedError");
    } catch (const NotFittedError& e) {
        CHECK(std::string(e.what()).find("SparseClassifier::predict") != std::string::npos);
    }
}
