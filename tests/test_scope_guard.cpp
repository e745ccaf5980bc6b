// test_scope_guard.cpp
// Tests for TMWRAP_SCOPE_FAIL and the temp-file rollback built on it
//
// Framework: doctest
//
// These tests cover:
// - Rollback only on exception
// - Nested guards during unwinding
// - Reverse declaration order
// - write_file_atomic leaving no temp file behind on failure

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <vector>

#include "test_support.hpp"
#include "tm_wrap/detail/file_io.hpp"
#include "tm_wrap/scope_guard.hpp"

using namespace tm_wrap;

TEST_CASE("TMWRAP_SCOPE_FAIL skips on success") {
    int rollbacks = 0;
    {
        TMWRAP_SCOPE_FAIL { ++rollbacks; };
    }
    CHECK(rollbacks == 0);
}

TEST_CASE("TMWRAP_SCOPE_FAIL runs when an exception leaves the scope") {
    int rollbacks = 0;
    CHECK_THROWS_AS([&] {
        TMWRAP_SCOPE_FAIL { ++rollbacks; };
        throw std::logic_error("fail");
    }(), std::logic_error);
    CHECK(rollbacks == 1);
}

TEST_CASE("TMWRAP_SCOPE_FAIL inside a destructor during unwinding only counts new exceptions") {
    int rollbacks = 0;
    struct Cleanup {
        int* rollbacks;
        ~Cleanup() {
            // Unwinding is already in progress here, but nothing new is thrown.
            int* counter = rollbacks;
            TMWRAP_SCOPE_FAIL { ++*counter; };
        }
    };
    try {
        Cleanup c{&rollbacks};
        throw std::runtime_error("outer");
    } catch (const std::runtime_error&) {
        CHECK(rollbacks == 0);
    }
    CHECK(rollbacks == 0);
}

TEST_CASE("TMWRAP_SCOPE_FAIL guards run in reverse declaration order") {
    std::vector<int> order;
    try {
        TMWRAP_SCOPE_FAIL { order.push_back(1); };
        TMWRAP_SCOPE_FAIL { order.push_back(2); };
        throw std::runtime_error("x");
    } catch (const std::runtime_error&) {
        REQUIRE(order.size() == 2);
    }
    CHECK(order == std::vector<int>{2, 1});
}

TEST_CASE("write_file_atomic removes its temp file when the rename fails") {
    testing::TempDir dir;
    // A non-empty directory at the destination makes the rename fail.
    const auto target = dir.file("occupied");
    std::filesystem::create_directories(target / "child");

    const std::vector<std::uint8_t> bytes{1, 2, 3};
    CHECK_THROWS_AS(detail::write_file_atomic(target, bytes, "test", std::source_location::current()),
                    FormatError);
    CHECK_FALSE(std::filesystem::exists(detail::temp_path_for(target)));
    CHECK(std::filesystem::is_directory(target));
}

TEST_CASE("write_file_atomic replaces the destination on success") {
    testing::TempDir dir;
    const auto target = dir.file("model.bin");
    const std::vector<std::uint8_t> bytes{9, 8, 7};
    detail::write_file_atomic(target, bytes, "test", std::source_location::current());
    CHECK(detail::read_file(target, "test", std::source_location::current()) == bytes);
    CHECK_FALSE(std::filesystem::exists(detail::temp_path_for(target)));
}
