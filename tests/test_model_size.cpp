// test_model_size.cpp
// Tests for the native footprint estimator
//
// Framework: doctest

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdint>
#include <vector>

#include "tm_wrap/model_size.hpp"

using namespace tm_wrap;

TEST_CASE("estimate_dense_size - per-buffer byte counts") {
    ModelParameters p;
    p.num_clauses = 10;
    p.num_literals = 4;
    p.num_classes = 2;

    const auto b = estimate_dense_size(p);
    CHECK(b.automaton_states == 10 * 4 * 2);
    CHECK(b.weights == 10 * 2 * 2);
    CHECK(b.clause_output == 10);
    CHECK(b.feedback == 10 * 2 * 3);
    CHECK(b.votes == 2 * 4);
    CHECK(b.clause_pointers == 0);
    CHECK(b.total() == 80 + 40 + 10 + 60 + 8);
}

TEST_CASE("estimate_dense_size - independent re-derivation") {
    for (std::uint32_t C : {1u, 7u, 1000u}) {
        for (std::uint32_t L : {1u, 784u}) {
            for (std::uint32_t K : {2u, 10u}) {
                ModelParameters p;
                p.num_clauses = C;
                p.num_literals = L;
                p.num_classes = K;
                const std::size_t expected = std::size_t{C} * L * 2 + std::size_t{C} * K * 2 + C
                                           + std::size_t{C} * K * 3 + std::size_t{K} * 4;
                CHECK(estimate_dense_size(p).total() == expected);
            }
        }
    }
}

TEST_CASE("estimate_sparse_size - counts held literals and pointers") {
    ModelParameters p;
    p.num_clauses = 3;
    p.num_literals = 100;
    p.num_classes = 4;
    const std::vector<std::uint32_t> clause_sizes{5, 0, 7};

    const auto b = estimate_sparse_size(p, clause_sizes);
    CHECK(b.automaton_states == 12 * 16);
    CHECK(b.clause_pointers == 3 * sizeof(void*));
    CHECK(b.active_literal_pointers == 4 * sizeof(void*));
    CHECK(b.clause_sizes == 3 * 4);
    CHECK(b.weights == 3 * 4 * 2);
    CHECK(b.clause_output == 3);
    CHECK(b.feedback == 0);
    CHECK(b.votes == 16);
    CHECK(b.total() == 192 + 7 * sizeof(void*) + 12 + 24 + 3 + 16);
}

TEST_CASE("estimate_sparse_size - empty clauses cost no nodes") {
    ModelParameters p;
    p.num_clauses = 2;
    p.num_classes = 2;
    const std::vector<std::uint32_t> none{0, 0};
    CHECK(estimate_sparse_size(p, none).automaton_states == 0);
}
