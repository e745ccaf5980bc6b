// test_support.hpp
// Shared fixtures for the TsetlinWrap test executables

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <fmt/format.h>

#include "tm_wrap/config.hpp"
#include "tm_wrap/matrix.hpp"

namespace tm_wrap::testing {

/// Points at the stand-in engine built next to the tests.
inline EngineConfig test_engine_config() {
    EngineConfig cfg;
    cfg.lib_dir = TMWRAP_TEST_ENGINE_DIR;
    cfg.library_name = TMWRAP_TEST_ENGINE_NAME;
    cfg.runtime_library_name = "tm_wrap_no_such_runtime";
    return cfg;
}

/// Scenario hyperparameters: 10 clauses, threshold 15, s 3.0, seeded.
inline Hyperparameters small_hyperparameters() {
    return Hyperparameters{}
        .with_num_clauses(10)
        .with_threshold(15)
        .with_s(3.0f)
        .with_epochs(10)
        .with_random_state(42);
}

/// Eight distinct 4-bit patterns; the label is the XOR of the first two bits.
inline BinaryMatrix xor_patterns() {
    return BinaryMatrix::FromRows({
        {0, 0, 0, 1},
        {0, 1, 0, 1},
        {1, 0, 0, 1},
        {1, 1, 0, 1},
        {0, 0, 1, 0},
        {0, 1, 1, 0},
        {1, 0, 1, 0},
        {1, 1, 1, 0},
    });
}

inline std::vector<std::int64_t> xor_labels() {
    return {0, 1, 1, 0, 0, 1, 1, 0};
}

/// Unique directory removed on scope exit.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path()
              / fmt::format("tm_wrap_test_{}_{}",
                            std::chrono::steady_clock::now().time_since_epoch().count(),
                            counter++);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] std::filesystem::path file(const std::string& name) const { return path_ / name; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace tm_wrap::testing
