// example/main.cpp
// Noisy XOR walkthrough for the Tsetlin Machine wrapper
//
// This example shows:
// 1. Generating a noisy XOR dataset
// 2. Training and scoring a dense classifier
// 3. Estimating the native model size
// 4. Saving and reloading in both model formats
// 5. Error handling
//
// Usage: tm_wrap_example [engine_lib_dir] [--verbose]

#include "tm_wrap/all.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <numeric>
#include <random>
#include <span>
#include <string_view>
#include <vector>

namespace {

struct Dataset {
    tm_wrap::BinaryMatrix X;
    std::vector<std::int64_t> y;
};

// ============================================================================
// Dataset: random bits, label = XOR of the first two, then a share of labels
// flipped.
// ============================================================================

Dataset make_noisy_xor(std::size_t samples, std::size_t features, double noise, std::uint32_t seed) {
    std::mt19937 gen(seed);
    std::bernoulli_distribution bit(0.5);

    Dataset d{tm_wrap::BinaryMatrix(samples, features), std::vector<std::int64_t>(samples)};
    for (std::size_t i = 0; i < samples; ++i) {
        for (std::size_t j = 0; j < features; ++j) {
            d.X.at(i, j) = bit(gen) ? 1 : 0;
        }
        d.y[i] = d.X.at(i, 0) ^ d.X.at(i, 1);
    }

    std::vector<std::size_t> order(samples);
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::shuffle(order.begin(), order.end(), gen);
    const auto flips = static_cast<std::size_t>(noise * static_cast<double>(samples));
    for (std::size_t k = 0; k < flips; ++k) {
        d.y[order[k]] = 1 - d.y[order[k]];
    }
    return d;
}

tm_wrap::BinaryMatrix slice_rows(const tm_wrap::BinaryMatrix& X, std::size_t first, std::size_t count) {
    const auto bytes = X.bytes().subspan(first * X.cols(), count * X.cols());
    return tm_wrap::BinaryMatrix(std::vector<std::uint8_t>(bytes.begin(), bytes.end()), count, X.cols());
}

// ============================================================================
// Example 1: Train and score
// ============================================================================

void example_train(tm_wrap::Classifier<>& clf, const Dataset& train, const Dataset& test) {
    std::cout << "=== Example 1: Train and Score ===\n";

    clf.fit(train.X, train.y);
    std::cout << "Trained on " << train.X.rows() << " rows x " << train.X.cols() << " features\n";
    std::cout << "Train accuracy: " << clf.score(train.X, train.y) << "\n";
    std::cout << "Test accuracy:  " << clf.score(test.X, test.y) << "\n\n";
}

// ============================================================================
// Example 2: Model size
// ============================================================================

void example_size(const tm_wrap::Classifier<>& clf) {
    std::cout << "=== Example 2: Estimated Model Size ===\n";

    const auto size = clf.estimate_model_size();
    std::cout << "Automaton states: " << size.automaton_states << " bytes\n";
    std::cout << "Clause weights:   " << size.weights << " bytes\n";
    std::cout << "Feedback buffer:  " << size.feedback << " bytes\n";
    std::cout << "Total:            " << size.total() << " bytes\n\n";
}

// ============================================================================
// Example 3: Save and reload
// ============================================================================

void example_persistence(const tm_wrap::Classifier<>& clf, const tm_wrap::EngineConfig& engine,
                         const Dataset& test) {
    std::cout << "=== Example 3: Save and Reload ===\n";

    const auto dir = std::filesystem::temp_directory_path();
    const std::vector<std::int64_t> classes = clf.classes();

    for (auto format : {tm_wrap::ModelFormat::RawBinary, tm_wrap::ModelFormat::SelfDescribing}) {
        const auto path = dir / (format == tm_wrap::ModelFormat::RawBinary ? "noisy_xor.bin" : "noisy_xor.fbs");
        clf.save_model(path, format);

        tm_wrap::Classifier<> reloaded(tm_wrap::Hyperparameters{}, engine);
        reloaded.load_model(path, format, std::span<const std::int64_t>(classes));

        std::cout << tm_wrap::model_format_name(format) << ": "
                  << std::filesystem::file_size(path) << " bytes, reloaded accuracy "
                  << reloaded.score(test.X, test.y) << "\n";
        std::filesystem::remove(path);
    }
    std::cout << "\n";
}

// ============================================================================
// Example 4: Error handling
// ============================================================================

void example_errors(tm_wrap::Classifier<>& clf) {
    std::cout << "=== Example 4: Error Handling ===\n";

    // Non-binary input
    try {
        auto bad = tm_wrap::BinaryMatrix::FromRows({{0, 1, 2}});
        (void)clf.predict(bad);
    } catch (const tm_wrap::ValidationError& e) {
        std::cout << "Caught expected error: " << e.what() << "\n";
    }

    // Predict before fit
    try {
        tm_wrap::Classifier<> fresh;
        (void)fresh.predict(tm_wrap::BinaryMatrix::FromRows({{0, 1}}));
    } catch (const tm_wrap::NotFittedError& e) {
        std::cout << "Caught expected error: " << e.what() << "\n";
    }
    std::cout << "\n";
}

} // namespace

// ============================================================================
// Main
// ============================================================================

int main(int argc, char** argv) {
    try {
        std::cout << "=== Tsetlin Machine Wrapper - Noisy XOR ===\n\n";

        tm_wrap::EngineConfig engine;
        bool verbose = false;
        for (int i = 1; i < argc; ++i) {
            if (std::string_view(argv[i]) == "--verbose") {
                verbose = true;
            } else {
                engine.lib_dir = argv[i];
            }
        }
        // Engine loads, probes and handle lifetimes are logged at debug.
        tm_wrap::set_log_level(verbose ? spdlog::level::debug : spdlog::level::info);

        constexpr std::size_t samples = 5000;
        constexpr std::size_t train_rows = samples * 8 / 10;
        const auto all = make_noisy_xor(samples, 12, 0.1, 42);
        const Dataset train{slice_rows(all.X, 0, train_rows),
                            {all.y.begin(), all.y.begin() + train_rows}};
        const Dataset test{slice_rows(all.X, train_rows, samples - train_rows),
                           {all.y.begin() + train_rows, all.y.end()}};

        tm_wrap::Classifier<> clf(
            tm_wrap::Hyperparameters{}.with_threshold(1000).with_num_clauses(1000).with_random_state(42),
            engine);

        example_train(clf, train, test);
        example_size(clf);
        example_persistence(clf, engine, test);
        example_errors(clf);

        std::cout << "All examples completed successfully\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
