// test_tensor_layout.cpp
// Tests for the engine <-> canonical clause-state reordering
//
// Framework: doctest

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdint>
#include <vector>

#include "tm_wrap/tensor_layout.hpp"

using namespace tm_wrap;

namespace {

std::vector<std::int8_t> iota_states(std::size_t n) {
    std::vector<std::int8_t> v(n);
    for (std::size_t i = 0; i < n; ++i) v[i] = static_cast<std::int8_t>(static_cast<int>(i % 251) - 125);
    return v;
}

} // namespace

TEST_CASE("engine_to_canonical - interleaves polarity per literal") {
    // One clause, three literals: engine run is [p0 p1 p2 | n0 n1 n2].
    const ClauseShape shape{1, 3};
    const std::vector<std::int8_t> engine{10, 11, 12, 20, 21, 22};

    auto canonical = engine_to_canonical(shape, engine);
    CHECK(canonical == std::vector<std::int8_t>{10, 20, 11, 21, 12, 22});
}

TEST_CASE("engine_to_canonical - clauses are transformed independently") {
    const ClauseShape shape{2, 2};
    const std::vector<std::int8_t> engine{1, 2, 3, 4, 5, 6, 7, 8};

    auto canonical = engine_to_canonical(shape, engine);
    CHECK(canonical == std::vector<std::int8_t>{1, 3, 2, 4, 5, 7, 6, 8});
}

TEST_CASE("canonical_to_engine inverts engine_to_canonical") {
    for (auto shape : {ClauseShape{1, 1}, ClauseShape{3, 5}, ClauseShape{10, 4}, ClauseShape{7, 64}}) {
        CAPTURE(shape.num_clauses);
        CAPTURE(shape.num_literals);
        const auto canonical = iota_states(shape.state_count());
        CHECK(engine_to_canonical(shape, canonical_to_engine(shape, canonical)) == canonical);
        CHECK(canonical_to_engine(shape, engine_to_canonical(shape, canonical)) == canonical);
    }
}

TEST_CASE("Span forms write into caller buffers") {
    const ClauseShape shape{2, 3};
    const auto src = iota_states(shape.state_count());
    std::vector<std::int8_t> dst(shape.state_count());

    engine_to_canonical(shape, src, dst);
    CHECK(dst == engine_to_canonical(shape, src));
}

TEST_CASE("Size mismatch is a ValidationError") {
    const ClauseShape shape{2, 3};
    std::vector<std::int8_t> short_src(11);
    std::vector<std::int8_t> dst(12);
    CHECK_THROWS_AS(engine_to_canonical(shape, short_src, dst), ValidationError);
    CHECK_THROWS_AS((void)canonical_to_engine(shape, short_src), ValidationError);
}

TEST_CASE("ClauseShape - state_count") {
    CHECK(ClauseShape{10, 4}.state_count() == 80);
    CHECK(ClauseShape{0, 4}.state_count() == 0);
}
