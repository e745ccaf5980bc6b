// test_config.cpp
// Tests for EngineConfig and Hyperparameters
//
// Framework: doctest

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <limits>
#include <string>

#include "tm_wrap/config.hpp"

using namespace tm_wrap;

// ============================================================================
// EngineConfig
// ============================================================================

TEST_CASE("EngineConfig - defaults") {
    EngineConfig cfg;
    CHECK(cfg.lib_dir == std::filesystem::path("."));
    CHECK(cfg.library_name == "tsetlin_machine_c");
    CHECK(cfg.runtime_library_name == "flatccrt");
}

TEST_CASE("EngineConfig - platform file names") {
    EngineConfig cfg;
    cfg.lib_dir = "/opt/tm/lib";
#if defined(_WIN32)
    CHECK(cfg.library_path().filename() == "libtsetlin_machine_c.dll");
    CHECK(cfg.runtime_library_path().filename() == "libflatccrt.dll");
#elif defined(__APPLE__)
    CHECK(cfg.library_path().filename() == "libtsetlin_machine_c.dylib");
    CHECK(cfg.runtime_library_path().filename() == "libflatccrt.dylib");
#else
    CHECK(cfg.library_path() == std::filesystem::path("/opt/tm/lib/libtsetlin_machine_c.so"));
    CHECK(cfg.runtime_library_path() == std::filesystem::path("/opt/tm/lib/libflatccrt.so"));
#endif
}

TEST_CASE("EngineConfig - equality") {
    EngineConfig a;
    EngineConfig b;
    CHECK(a == b);
    b.library_name = "other";
    CHECK_FALSE(a == b);
}

// ============================================================================
// Hyperparameters
// ============================================================================

TEST_CASE("Hyperparameters - defaults validate") {
    Hyperparameters hp;
    CHECK(hp.threshold == 1000);
    CHECK(hp.num_clauses == 1000);
    CHECK(hp.max_state == 127);
    CHECK(hp.min_state == -127);
    CHECK_FALSE(hp.boost_true_positive_feedback);
    CHECK(hp.s == doctest::Approx(3.0));
    CHECK(hp.epochs == 10);
    CHECK_FALSE(hp.random_state.has_value());
    CHECK_NOTHROW(hp.validate());
}

TEST_CASE("Hyperparameters - fluent copies leave the original untouched") {
    const Hyperparameters base;
    auto hp = base.with_threshold(15).with_num_clauses(10).with_states(-10, 10)
                  .with_boost(true).with_s(2.5f).with_epochs(3).with_random_state(7);

    CHECK(base == Hyperparameters{});
    CHECK(hp.threshold == 15);
    CHECK(hp.num_clauses == 10);
    CHECK(hp.min_state == -10);
    CHECK(hp.max_state == 10);
    CHECK(hp.boost_true_positive_feedback);
    CHECK(hp.s == doctest::Approx(2.5));
    CHECK(hp.epochs == 3);
    CHECK(hp.random_state == 7u);
}

TEST_CASE("Hyperparameters - validate rejects bad values") {
    const Hyperparameters ok;

    CHECK_THROWS_AS(ok.with_threshold(0).validate(), ValidationError);
    CHECK_THROWS_AS(ok.with_num_clauses(0).validate(), ValidationError);
    CHECK_THROWS_AS(ok.with_states(5, -5).validate(), ValidationError);
    CHECK_THROWS_AS(ok.with_s(0.5f).validate(), ValidationError);
    CHECK_THROWS_AS(ok.with_s(std::numeric_limits<float>::quiet_NaN()).validate(), ValidationError);
    CHECK_THROWS_AS(ok.with_s(std::numeric_limits<float>::infinity()).validate(), ValidationError);
    CHECK_THROWS_AS(ok.with_epochs(0).validate(), ValidationError);
}

TEST_CASE("Hyperparameters - boundary values are accepted") {
    const Hyperparameters ok;

    CHECK_NOTHROW(ok.with_s(1.0f).validate());
    CHECK_NOTHROW(ok.with_states(-128, 127).validate());
    CHECK_NOTHROW(ok.with_states(0, 0).validate());
    CHECK_NOTHROW(ok.with_threshold(1).with_num_clauses(1).with_epochs(1).validate());
}

TEST_CASE("Hyperparameters - error message names the field") {
    try {
        Hyperparameters{}.with_states(3, 2).validate();
        FAIL("expected ValidationError");
    } catch (const ValidationError& e) {
        CHECK(std::string(e.message()).find("min_state") != std::string::npos);
        CHECK(e.context() == "Hyperparameters::validate");
    }
}
