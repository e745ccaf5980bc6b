// tm_wrap/engine.hpp
// Engine binding: the native engine's fixed function table plus probed
// optional capabilities.
//
// Required primitives (create/train/predict/free) must all resolve or Load()
// throws LinkError. Optional primitives (save/load and their self-describing
// variants) are probed by name; calling one that is absent throws
// UnsupportedOperation.

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <fmt/format.h>

#include "tm_wrap/abi.hpp"
#include "tm_wrap/config.hpp"
#include "tm_wrap/error.hpp"
#include "tm_wrap/log.hpp"
#include "tm_wrap/shared_library.hpp"

namespace tm_wrap {

enum class EngineKind {
    Dense,
    Sparse,
};

[[nodiscard]] constexpr const char* engine_kind_name(EngineKind kind) noexcept {
    return kind == EngineKind::Dense ? "dense" : "sparse";
}

[[nodiscard]] constexpr const char* symbol_prefix(EngineKind kind) noexcept {
    return kind == EngineKind::Dense ? "tm_" : "stm_";
}

enum class Capability {
    Save,               // raw binary save (engine's own format)
    Load,               // raw binary load (sparse: loads a dense-format file)
    SaveSelfDescribing,
    LoadSelfDescribing,
};

[[nodiscard]] constexpr const char* capability_name(Capability c) noexcept {
    switch (c) {
        case Capability::Save:               return "save";
        case Capability::Load:               return "load";
        case Capability::SaveSelfDescribing: return "save_fbs";
        case Capability::LoadSelfDescribing: return "load_fbs";
    }
    return "unknown";
}

/// Exported symbol name for a primitive, e.g. ("create", Dense) -> "tm_create".
/// The sparse engine's raw loader reads dense-format files and is exported
/// as stm_load_dense.
[[nodiscard]] inline std::string symbol_name(std::string_view primitive, EngineKind kind) {
    if (kind == EngineKind::Sparse && primitive == "load") {
        return "stm_load_dense";
    }
    return fmt::format("{}{}", symbol_prefix(kind), primitive);
}

// ============================================================================
// Engine
// ============================================================================

class Engine {
    struct ConstructionToken {
        explicit ConstructionToken() = default;
    };

public:
    /// Use Load(); the token keeps construction private to it.
    Engine(ConstructionToken, EngineConfig config, EngineKind kind)
        : config_(std::move(config)), kind_(kind) {}

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    /// Load the engine library described by `config`.
    [[nodiscard]] static std::shared_ptr<const Engine> Load(
        const EngineConfig& config,
        EngineKind kind,
        std::source_location loc = std::source_location::current())
    {
        const auto lib_path = config.library_path();
        std::error_code ec;
        if (!std::filesystem::exists(lib_path, ec)) {
            throw LinkError("Engine::Load", fmt::format(
                "engine library '{}' not found; check EngineConfig::lib_dir", lib_path.string()), loc);
        }

        auto engine = std::make_shared<Engine>(ConstructionToken{}, config, kind);

        const auto runtime_path = config.runtime_library_path();
        if (std::filesystem::exists(runtime_path, ec)) {
            engine->runtime_ = SharedLibrary::Open(runtime_path, true, loc);
            logger()->debug("loaded companion runtime {}", runtime_path.string());
        }
        engine->library_ = SharedLibrary::Open(lib_path, true, loc);

        engine->create_ = engine->require_<abi::CreateFn>("create", loc);
        engine->train_ = engine->require_<abi::TrainFn>("train", loc);
        engine->predict_ = engine->require_<abi::PredictFn>("predict", loc);
        engine->free_ = engine->require_<abi::FreeFn>("free", loc);

        engine->save_ = engine->probe_<abi::SaveFn>("save");
        engine->load_ = engine->probe_<abi::LoadFn>("load");
        engine->save_fbs_ = engine->probe_<abi::SaveFn>("save_fbs");
        engine->load_fbs_ = engine->probe_<abi::LoadFn>("load_fbs");

        logger()->info("loaded {} engine from {}", engine_kind_name(kind), lib_path.string());
        return engine;
    }

    [[nodiscard]] EngineKind kind() const noexcept { return kind_; }
    [[nodiscard]] const EngineConfig& config() const noexcept { return config_; }

    [[nodiscard]] bool has(Capability c) const noexcept {
        switch (c) {
            case Capability::Save:               return save_ != nullptr;
            case Capability::Load:               return load_ != nullptr;
            case Capability::SaveSelfDescribing: return save_fbs_ != nullptr;
            case Capability::LoadSelfDescribing: return load_fbs_ != nullptr;
        }
        return false;
    }

    // ─────────────────────────────────────────────────────────────────
    // Required primitives
    // ─────────────────────────────────────────────────────────────────

    /// Returns nullptr when the engine could not allocate the model.
    [[nodiscard]] void* create(
        std::uint32_t num_classes, std::uint32_t threshold,
        std::uint32_t num_literals, std::uint32_t num_clauses,
        std::int8_t max_state, std::int8_t min_state, bool boost_true_positive_feedback,
        float s, std::uint32_t seed) const noexcept
    {
        return create_(num_classes, threshold, num_literals, num_clauses,
                       max_state, min_state,
                       static_cast<std::uint8_t>(boost_true_positive_feedback ? 1 : 0),
                       abi::kLabelVectorSize, abi::kLabelElementWidth, s, seed);
    }

    void train(void* handle, const std::uint8_t* X, const std::uint32_t* y,
               std::uint32_t rows, std::uint32_t epochs) const noexcept {
        train_(handle, X, y, rows, epochs);
    }

    void predict(void* handle, const std::uint8_t* X, std::uint32_t* y_pred,
                 std::uint32_t rows) const noexcept {
        predict_(handle, X, y_pred, rows);
    }

    void free(void* handle) const noexcept {
        free_(handle);
    }

    // ─────────────────────────────────────────────────────────────────
    // Optional primitives
    // ─────────────────────────────────────────────────────────────────

    void save(void* handle, const std::filesystem::path& path,
              std::source_location loc = std::source_location::current()) const {
        require_capability_(Capability::Save, loc);
        save_(handle, path.string().c_str());
    }

    [[nodiscard]] void* load(const std::filesystem::path& path,
                             std::source_location loc = std::source_location::current()) const {
        require_capability_(Capability::Load, loc);
        return load_(path.string().c_str(), abi::kLabelVectorSize, abi::kLabelElementWidth);
    }

    void save_fbs(void* handle, const std::filesystem::path& path,
                  std::source_location loc = std::source_location::current()) const {
        require_capability_(Capability::SaveSelfDescribing, loc);
        save_fbs_(handle, path.string().c_str());
    }

    [[nodiscard]] void* load_fbs(const std::filesystem::path& path,
                                 std::source_location loc = std::source_location::current()) const {
        require_capability_(Capability::LoadSelfDescribing, loc);
        return load_fbs_(path.string().c_str(), abi::kLabelVectorSize, abi::kLabelElementWidth);
    }

private:
    template <class Fn>
    [[nodiscard]] Fn probe_(std::string_view primitive) const {
        const auto name = symbol_name(primitive, kind_);
        auto* sym = library_.symbol(name.c_str());
        logger()->debug("probe {}: {}", name, sym ? "present" : "absent");
        return reinterpret_cast<Fn>(sym);
    }

    template <class Fn>
    [[nodiscard]] Fn require_(std::string_view primitive, const std::source_location& loc) const {
        auto fn = probe_<Fn>(primitive);
        if (!fn) {
            throw LinkError("Engine::Load", fmt::format(
                "required symbol '{}' missing from '{}'",
                symbol_name(primitive, kind_), library_.path().string()), loc);
        }
        return fn;
    }

    void require_capability_(Capability c, const std::source_location& loc) const {
        if (has(c)) return;
        throw UnsupportedOperation(
            fmt::format("Engine::{}", capability_name(c)),
            fmt::format("the {} engine was built without '{}'",
                        engine_kind_name(kind_), symbol_name(capability_name(c), kind_)),
            loc);
    }

    EngineConfig config_;
    EngineKind kind_;

    // Declaration order matters: the engine library closes before its runtime.
    SharedLibrary runtime_{};
    SharedLibrary library_{};

    abi::CreateFn create_{nullptr};
    abi::TrainFn train_{nullptr};
    abi::PredictFn predict_{nullptr};
    abi::FreeFn free_{nullptr};
    abi::SaveFn save_{nullptr};
    abi::LoadFn load_{nullptr};
    abi::SaveFn save_fbs_{nullptr};
    abi::LoadFn load_fbs_{nullptr};
};

} // namespace tm_wrap
