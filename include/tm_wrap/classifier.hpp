// tm_wrap/classifier.hpp
// Tsetlin Machine classifier over the native engine
//
// States:
//   Unbound   - no native model, no label mapping
//   Bound     - native model + label mapping (trained or freshly created)
//   Detached  - label mapping without a native model; only reachable by
//               rebuilding a classifier from a ClassifierState
//
// fit() always starts from a fresh native model. partial_fit() trains the
// existing model in place, so repeated calls accumulate.
//
// Thread safety: none. Calls on one instance must be serialized by the caller.

#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <random>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "tm_wrap/abi.hpp"
#include "tm_wrap/config.hpp"
#include "tm_wrap/detail/file_io.hpp"
#include "tm_wrap/engine.hpp"
#include "tm_wrap/error.hpp"
#include "tm_wrap/fbs_codec.hpp"
#include "tm_wrap/label_mapping.hpp"
#include "tm_wrap/log.hpp"
#include "tm_wrap/matrix.hpp"
#include "tm_wrap/model.hpp"
#include "tm_wrap/model_size.hpp"
#include "tm_wrap/native_handle.hpp"
#include "tm_wrap/raw_codec.hpp"
#include "tm_wrap/scope_guard.hpp"
#include "tm_wrap/state.hpp"
#include "tm_wrap/tensor_layout.hpp"

namespace tm_wrap {

template <EngineKind Kind, ClassLabel Label>
class BasicClassifier {
public:
    using label_type = Label;
    using mapping_type = LabelMapping<Label>;
    using state_type = ClassifierState<Label>;

    static constexpr EngineKind kKind = Kind;

    explicit BasicClassifier(
        Hyperparameters hyperparameters = {},
        EngineConfig engine_config = {},
        std::source_location loc = std::source_location::current())
        : hyperparameters_(std::move(hyperparameters))
        , config_(std::move(engine_config))
    {
        hyperparameters_.validate(loc);
    }

    /// Rebuild from a state produced by state(). The result is Detached when
    /// the state carries classes, Unbound otherwise.
    explicit BasicClassifier(
        const state_type& state,
        std::source_location loc = std::source_location::current())
        : hyperparameters_(state.hyperparameters)
        , config_(state.engine)
    {
        const auto ctx = context_("restore");
        if (state.kind != Kind) {
            throw ValidationError(ctx, fmt::format(
                "state was taken from a {} classifier", engine_kind_name(state.kind)), loc);
        }
        hyperparameters_.validate(loc);
        if (state.classes.has_value() != state.num_literals.has_value()) {
            throw ValidationError(ctx, "state must carry both classes and num_literals, or neither", loc);
        }
        if (state.classes) {
            mapping_ = mapping_type::FromClasses(*state.classes, loc);
            num_literals_ = state.num_literals;
            seed_ = state.seed;
        }
    }

    BasicClassifier(const BasicClassifier&) = delete;
    BasicClassifier& operator=(const BasicClassifier&) = delete;
    /// A moved-from classifier is Unbound.
    BasicClassifier(BasicClassifier&& other) noexcept
        : hyperparameters_(std::move(other.hyperparameters_))
        , config_(std::move(other.config_))
        , engine_ptr_(std::move(other.engine_ptr_))
        , handle_(std::move(other.handle_))
        , mapping_(std::move(other.mapping_))
        , num_literals_(other.num_literals_)
        , seed_(other.seed_)
    {
        other.unbind_();
    }

    BasicClassifier& operator=(BasicClassifier&& other) noexcept {
        if (this != &other) {
            unbind_();
            hyperparameters_ = std::move(other.hyperparameters_);
            config_ = std::move(other.config_);
            engine_ptr_ = std::move(other.engine_ptr_);
            handle_ = std::move(other.handle_);
            mapping_ = std::move(other.mapping_);
            num_literals_ = other.num_literals_;
            seed_ = other.seed_;
            other.unbind_();
        }
        return *this;
    }

    ~BasicClassifier() = default;

    // ─────────────────────────────────────────────────────────────────
    // Training
    // ─────────────────────────────────────────────────────────────────

    /// Train a fresh model on (X, y). The existing model is freed once the
    /// new one has been created; if creation fails it stays in place.
    BasicClassifier& fit(
        BinaryMatrixView X,
        std::span<const Label> y,
        std::source_location loc = std::source_location::current())
    {
        const auto ctx = context_("fit");
        X.require_binary(ctx, loc);
        require_rows_match_(ctx, X, y.size(), loc);

        auto mapping = mapping_type::Fit(y, loc);
        const auto encoded = mapping.encode(y, loc);

        bind_fresh_(static_cast<std::uint32_t>(X.cols()), std::move(mapping), loc);
        train_(X, encoded, hyperparameters_.epochs);
        return *this;
    }

    /// Create an untrained model for `num_literals` features and the full
    /// class list. Predicting afterwards yields the engine's initial output.
    BasicClassifier& init_empty_state(
        std::uint32_t num_literals,
        std::span<const Label> classes,
        std::source_location loc = std::source_location::current())
    {
        if (num_literals == 0) {
            throw ValidationError(context_("init_empty_state"), "num_literals must be >= 1", loc);
        }
        auto mapping = mapping_type::FromClasses(classes, loc);
        bind_fresh_(num_literals, std::move(mapping), loc);
        return *this;
    }

    /// Train the existing model in place. The first call (or a call on a
    /// Detached classifier) creates an empty model from `classes`, or from
    /// the labels in `y` when `classes` is not given.
    BasicClassifier& partial_fit(
        BinaryMatrixView X,
        std::span<const Label> y,
        std::optional<std::span<const Label>> classes = std::nullopt,
        std::optional<std::uint32_t> epochs = std::nullopt,
        std::source_location loc = std::source_location::current())
    {
        const auto ctx = context_("partial_fit");
        X.require_binary(ctx, loc);
        require_rows_match_(ctx, X, y.size(), loc);

        const std::uint32_t n_epochs = epochs.value_or(hyperparameters_.epochs);
        if (n_epochs < 1) {
            throw ValidationError(ctx, "epochs must be >= 1", loc);
        }

        if (!mapping_) {
            auto mapping = classes ? mapping_type::FromClasses(*classes, loc)
                                   : mapping_type::Fit(y, loc);
            const auto encoded = mapping.encode(y, loc);
            bind_fresh_(static_cast<std::uint32_t>(X.cols()), std::move(mapping), loc);
            train_(X, encoded, n_epochs);
            return *this;
        }

        require_feature_count_(ctx, X, loc);
        if (classes && !std::ranges::equal(*classes, mapping_->classes())) {
            throw ValidationError(ctx,
                "provided classes do not match the classes seen during initialization", loc);
        }
        const auto encoded = mapping_->encode(y, loc);

        if (!handle_) {
            // Detached: recreate an empty model from the carried classes.
            bind_fresh_(static_cast<std::uint32_t>(X.cols()), *mapping_, loc);
        }
        train_(X, encoded, n_epochs);
        return *this;
    }

    // ─────────────────────────────────────────────────────────────────
    // Inference
    // ─────────────────────────────────────────────────────────────────

    [[nodiscard]] std::vector<Label> predict(
        BinaryMatrixView X,
        std::source_location loc = std::source_location::current()) const
    {
        const auto ctx = context_("predict");
        require_bound_(ctx, loc);
        X.require_binary(ctx, loc);
        require_feature_count_(ctx, X, loc);

        std::vector<std::uint32_t> encoded(X.rows());
        handle_.engine()->predict(handle_.get(), X.data(), encoded.data(),
                                  static_cast<std::uint32_t>(X.rows()));
        return mapping_->decode(encoded);
    }

    /// Mean accuracy of predict(X) against y.
    [[nodiscard]] double score(
        BinaryMatrixView X,
        std::span<const Label> y,
        std::source_location loc = std::source_location::current()) const
    {
        require_rows_match_(context_("score"), X, y.size(), loc);
        const auto predicted = predict(X, loc);
        std::size_t hits = 0;
        for (std::size_t i = 0; i < predicted.size(); ++i) {
            if (predicted[i] == y[i]) ++hits;
        }
        return static_cast<double>(hits) / static_cast<double>(predicted.size());
    }

    // ─────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────

    /// Free the model and forget the classes. Safe to call repeatedly.
    void reset() noexcept { unbind_(); }

    [[nodiscard]] bool is_bound() const noexcept { return handle_.valid(); }
    [[nodiscard]] bool is_detached() const noexcept { return mapping_.has_value() && !handle_.valid(); }

    [[nodiscard]] const Hyperparameters& hyperparameters() const noexcept { return hyperparameters_; }
    [[nodiscard]] const EngineConfig& engine_config() const noexcept { return config_; }
    [[nodiscard]] std::optional<std::uint32_t> seed() const noexcept { return seed_; }

    [[nodiscard]] const std::vector<Label>& classes(
        std::source_location loc = std::source_location::current()) const
    {
        require_mapping_(context_("classes"), loc);
        return mapping_->classes();
    }

    [[nodiscard]] std::uint32_t num_classes(
        std::source_location loc = std::source_location::current()) const
    {
        require_mapping_(context_("num_classes"), loc);
        return mapping_->size();
    }

    [[nodiscard]] std::uint32_t num_features(
        std::source_location loc = std::source_location::current()) const
    {
        require_mapping_(context_("num_features"), loc);
        return *num_literals_;
    }

    /// Scalars read back from the live native model.
    [[nodiscard]] ModelParameters model_parameters(
        std::source_location loc = std::source_location::current()) const
    {
        require_bound_(context_("model_parameters"), loc);
        return read_parameters_(handle_.as<machine_type>());
    }

    [[nodiscard]] ModelSizeBreakdown estimate_model_size(
        std::source_location loc = std::source_location::current()) const
    {
        require_bound_(context_("estimate_model_size"), loc);
        const auto* m = handle_.as<machine_type>();
        const auto params = read_parameters_(m);
        if constexpr (Kind == EngineKind::Dense) {
            return estimate_dense_size(params);
        } else {
            std::span<const std::uint32_t> sizes;
            if (m->clause_sizes) sizes = {m->clause_sizes, params.num_clauses};
            return estimate_sparse_size(params, sizes);
        }
    }

    [[nodiscard]] state_type state() const {
        state_type s;
        s.kind = Kind;
        s.hyperparameters = hyperparameters_;
        s.engine = config_;
        if (mapping_) {
            s.classes = mapping_->classes();
            s.num_literals = num_literals_;
            s.seed = seed_;
        }
        return s;
    }

    // ─────────────────────────────────────────────────────────────────
    // Persistence (dense): tensors are read from and written to the live
    // model directly and encoded by this library.
    // ─────────────────────────────────────────────────────────────────

    /// Copy of the model's parameters and tensors in canonical order.
    [[nodiscard]] SerializedModel snapshot(
        std::source_location loc = std::source_location::current()) const
        requires (Kind == EngineKind::Dense)
    {
        require_bound_(context_("snapshot"), loc);
        const auto* m = handle_.as<abi::DenseMachine>();

        SerializedModel model;
        model.params = read_parameters_(m);
        model.tensors.weights.assign(m->weights, m->weights + model.params.weight_count());
        model.tensors.states = engine_to_canonical(
            model.params.clause_shape(),
            std::span<const std::int8_t>(m->ta_state, model.params.state_count()), loc);
        return model;
    }

    /// Replace the current model with `model`. Class labels come from
    /// `classes` when given, else indices 0..C-1.
    BasicClassifier& restore(
        const SerializedModel& model,
        std::optional<std::span<const Label>> classes = std::nullopt,
        std::source_location loc = std::source_location::current())
        requires (Kind == EngineKind::Dense)
    {
        const auto ctx = context_("restore");
        model.require_consistent(ctx.c_str(), loc);
        const auto& p = model.params;
        require_loadable_parameters_(ctx, p, loc);

        auto mapping = mapping_for_loaded_(ctx, p.num_classes, classes, loc);

        auto hp = hyperparameters_;
        hp.threshold = p.threshold;
        hp.num_clauses = p.num_clauses;
        hp.min_state = p.min_state;
        hp.max_state = p.max_state;
        hp.boost_true_positive_feedback = p.boost_true_positive_feedback;
        hp.s = p.s;

        const auto& eng = engine_(loc);
        const auto seed = draw_seed_();
        NativeHandle handle(eng, eng->create(
            p.num_classes, p.threshold, p.num_literals, p.num_clauses,
            p.max_state, p.min_state, p.boost_true_positive_feedback, p.s, seed));
        if (!handle) {
            throw Error::Engine(ctx, fmt::format(
                "create returned no model for {} clauses x {} literals x {} classes",
                p.num_clauses, p.num_literals, p.num_classes), loc);
        }

        auto* m = handle.as<abi::DenseMachine>();
        canonical_to_engine(p.clause_shape(), model.tensors.states,
                            std::span<std::int8_t>(m->ta_state, p.state_count()), loc);
        std::copy(model.tensors.weights.begin(), model.tensors.weights.end(), m->weights);

        unbind_();
        hyperparameters_ = hp;
        commit_(std::move(handle), std::move(mapping), p.num_literals, seed);
        return *this;
    }

    void save_model(
        const std::filesystem::path& path,
        ModelFormat format = ModelFormat::RawBinary,
        std::optional<std::vector<std::string>> literal_names = std::nullopt,
        std::source_location loc = std::source_location::current()) const
        requires (Kind == EngineKind::Dense)
    {
        const auto model = snapshot(loc);
        if (format == ModelFormat::RawBinary) {
            write_raw_model(path, model, loc);
        } else {
            if (!literal_names) literal_names = default_literal_names(model.params.num_literals);
            write_fbs_model(path, model, literal_names, loc);
        }
    }

    BasicClassifier& load_model(
        const std::filesystem::path& path,
        ModelFormat format = ModelFormat::RawBinary,
        std::optional<std::span<const Label>> classes = std::nullopt,
        std::source_location loc = std::source_location::current())
        requires (Kind == EngineKind::Dense)
    {
        if (format == ModelFormat::RawBinary) {
            return restore(read_raw_model(path, loc), classes, loc);
        }
        return restore(read_fbs_model(path, loc).to_serialized(loc), classes, loc);
    }

    // ─────────────────────────────────────────────────────────────────
    // Persistence (sparse): through the engine's own save/load primitives.
    // The sparse raw format and the dense raw format are not interchangeable.
    // ─────────────────────────────────────────────────────────────────

    /// Engine's sparse raw format (stm_save).
    void save_model(
        const std::filesystem::path& path,
        std::source_location loc = std::source_location::current()) const
        requires (Kind == EngineKind::Sparse)
    {
        require_bound_(context_("save_model"), loc);
        save_through_engine_(path, Capability::Save, loc);
    }

    /// Load a dense raw-format file into the sparse engine (stm_load_dense).
    BasicClassifier& load_model_dense(
        const std::filesystem::path& path,
        std::optional<std::span<const Label>> classes = std::nullopt,
        std::source_location loc = std::source_location::current())
        requires (Kind == EngineKind::Sparse)
    {
        return load_through_engine_(path, Capability::Load, classes, loc);
    }

    void save_model_fbs(
        const std::filesystem::path& path,
        std::source_location loc = std::source_location::current()) const
        requires (Kind == EngineKind::Sparse)
    {
        require_bound_(context_("save_model_fbs"), loc);
        save_through_engine_(path, Capability::SaveSelfDescribing, loc);
    }

    BasicClassifier& load_model_fbs(
        const std::filesystem::path& path,
        std::optional<std::span<const Label>> classes = std::nullopt,
        std::source_location loc = std::source_location::current())
        requires (Kind == EngineKind::Sparse)
    {
        return load_through_engine_(path, Capability::LoadSelfDescribing, classes, loc);
    }

private:
    using machine_type = std::conditional_t<Kind == EngineKind::Dense, abi::DenseMachine, abi::SparseMachine>;

    [[nodiscard]] static std::string context_(std::string_view op) {
        return fmt::format("{}::{}", Kind == EngineKind::Dense ? "Classifier" : "SparseClassifier", op);
    }

    // ─────────────────────────────────────────────────────────────────
    // Checks
    // ─────────────────────────────────────────────────────────────────

    static void require_rows_match_(
        const std::string& ctx, const BinaryMatrixView& X, std::size_t labels,
        const std::source_location& loc)
    {
        if (labels != X.rows()) {
            throw ValidationError(ctx, fmt::format(
                "X has {} rows but y has {} labels", X.rows(), labels), loc);
        }
    }

    void require_feature_count_(
        const std::string& ctx, const BinaryMatrixView& X, const std::source_location& loc) const
    {
        if (X.cols() != *num_literals_) {
            throw ValidationError(ctx, fmt::format(
                "number of features of the input must be {}, got {}", *num_literals_, X.cols()), loc);
        }
    }

    void require_mapping_(const std::string& ctx, const std::source_location& loc) const {
        if (!mapping_) {
            throw NotFittedError(ctx, "call fit, partial_fit or init_empty_state first", loc);
        }
    }

    void require_bound_(const std::string& ctx, const std::source_location& loc) const {
        if (handle_) return;
        if (mapping_) {
            throw NotFittedError(ctx,
                "classifier was restored without its native model; call fit or partial_fit first", loc);
        }
        throw NotFittedError(ctx, "call fit, partial_fit or init_empty_state first", loc);
    }

    static void require_loadable_parameters_(
        const std::string& ctx, const ModelParameters& p, const std::source_location& loc)
    {
        if (p.num_literals == 0 || p.num_clauses == 0 || p.threshold == 0) {
            throw ValidationError(ctx, fmt::format(
                "model has threshold={}, num_literals={}, num_clauses={}; all must be >= 1",
                p.threshold, p.num_literals, p.num_clauses), loc);
        }
        if (p.min_state > p.max_state) {
            throw ValidationError(ctx, fmt::format(
                "model has min_state {} above max_state {}", p.min_state, p.max_state), loc);
        }
        if (!std::isfinite(p.s) || p.s < 1.0f) {
            throw ValidationError(ctx, fmt::format(
                "model has s = {}; must be a finite value >= 1.0", p.s), loc);
        }
    }

    [[nodiscard]] static mapping_type mapping_for_loaded_(
        const std::string& ctx,
        std::uint32_t num_classes,
        const std::optional<std::span<const Label>>& classes,
        const std::source_location& loc)
    {
        if (!classes) {
            return mapping_type::FromCount(num_classes, loc);
        }
        auto mapping = mapping_type::FromClasses(*classes, loc);
        if (mapping.size() != num_classes) {
            throw ValidationError(ctx, fmt::format(
                "{} classes given for a model with {} classes", mapping.size(), num_classes), loc);
        }
        return mapping;
    }

    // ─────────────────────────────────────────────────────────────────
    // Native model management
    // ─────────────────────────────────────────────────────────────────

    /// The engine binding, loaded on first use.
    [[nodiscard]] const std::shared_ptr<const Engine>& engine_(const std::source_location& loc) {
        if (!engine_ptr_) {
            engine_ptr_ = Engine::Load(config_, Kind, loc);
        }
        return engine_ptr_;
    }

    [[nodiscard]] std::uint32_t draw_seed_() const {
        if (hyperparameters_.random_state) {
            std::mt19937 gen(*hyperparameters_.random_state);
            return static_cast<std::uint32_t>(gen());
        }
        std::random_device rd;
        return static_cast<std::uint32_t>(rd());
    }

    /// Create a model and make it current, replacing any previous one.
    void bind_fresh_(std::uint32_t num_literals, mapping_type mapping, const std::source_location& loc) {
        const auto& eng = engine_(loc);
        const auto& hp = hyperparameters_;
        const auto seed = draw_seed_();

        NativeHandle handle(eng, eng->create(
            mapping.size(), hp.threshold, num_literals, hp.num_clauses,
            hp.max_state, hp.min_state, hp.boost_true_positive_feedback, hp.s, seed));
        if (!handle) {
            throw Error::Engine(context_("create"), fmt::format(
                "failed to create a {} model ({} classes, {} literals, {} clauses)",
                engine_kind_name(Kind), mapping.size(), num_literals, hp.num_clauses), loc);
        }
        logger()->debug("created {} model handle {} ({} classes, {} literals, {} clauses, seed {})",
                        engine_kind_name(Kind), handle.get(), mapping.size(), num_literals,
                        hp.num_clauses, seed);
        unbind_();
        commit_(std::move(handle), std::move(mapping), num_literals, seed);
    }

    void commit_(NativeHandle handle, mapping_type mapping, std::uint32_t num_literals, std::uint32_t seed) noexcept {
        handle_ = std::move(handle);
        mapping_.emplace(std::move(mapping));
        num_literals_ = num_literals;
        seed_ = seed;
    }

    void unbind_() noexcept {
        handle_.reset();
        mapping_.reset();
        num_literals_.reset();
        seed_.reset();
    }

    void train_(const BinaryMatrixView& X, const std::vector<std::uint32_t>& encoded, std::uint32_t epochs) {
        handle_.engine()->train(handle_.get(), X.data(), encoded.data(),
                                static_cast<std::uint32_t>(X.rows()), epochs);
    }

    [[nodiscard]] static ModelParameters read_parameters_(const machine_type* m) noexcept {
        ModelParameters p;
        p.threshold = m->threshold;
        p.num_literals = m->num_literals;
        p.num_clauses = m->num_clauses;
        p.num_classes = m->num_classes;
        p.max_state = m->max_state;
        p.min_state = m->min_state;
        p.boost_true_positive_feedback = m->boost_true_positive_feedback != 0;
        p.s = m->s;
        return p;
    }

    /// The engine writes the file itself; it goes to a temp path first and
    /// is renamed into place once the engine returns.
    void save_through_engine_(
        const std::filesystem::path& path, Capability capability, const std::source_location& loc) const
    {
        const auto& eng = handle_.engine();
        const auto ctx = context_(capability == Capability::Save ? "save_model" : "save_model_fbs");
        const auto tmp = detail::temp_path_for(path);

        TMWRAP_SCOPE_FAIL {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
        };

        if (capability == Capability::Save) {
            eng->save(handle_.get(), tmp, loc);
        } else {
            eng->save_fbs(handle_.get(), tmp, loc);
        }

        std::error_code ec;
        if (!std::filesystem::exists(tmp, ec)) {
            throw FormatError(ctx, fmt::format("engine did not write '{}'", tmp.string()), loc);
        }
        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            throw FormatError(ctx, fmt::format(
                "cannot move '{}' into place as '{}': {}", tmp.string(), path.string(), ec.message()), loc);
        }
        logger()->info("saved {} model to {}", engine_kind_name(Kind), path.string());
    }

    BasicClassifier& load_through_engine_(
        const std::filesystem::path& path,
        Capability capability,
        const std::optional<std::span<const Label>>& classes,
        const std::source_location& loc)
    {
        const auto ctx = context_(capability == Capability::Load ? "load_model_dense" : "load_model_fbs");
        const auto& eng = engine_(loc);

        // Capability is checked before touching the file system so that a
        // missing primitive is never reported as a missing file.
        if (!eng->has(capability)) {
            throw UnsupportedOperation(ctx, fmt::format(
                "the {} engine was built without '{}'",
                engine_kind_name(Kind), symbol_name(capability_name(capability), Kind)), loc);
        }
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            throw FormatError(ctx, fmt::format("cannot open '{}' for reading", path.string()), loc);
        }

        NativeHandle handle(eng, capability == Capability::Load ? eng->load(path, loc)
                                                                : eng->load_fbs(path, loc));
        if (!handle) {
            throw Error::Engine(ctx, fmt::format("engine could not load a model from '{}'", path.string()), loc);
        }

        const auto p = read_parameters_(handle.as<machine_type>());
        require_loadable_parameters_(ctx, p, loc);
        auto mapping = mapping_for_loaded_(ctx, p.num_classes, classes, loc);

        auto hp = hyperparameters_;
        hp.threshold = p.threshold;
        hp.num_clauses = p.num_clauses;
        hp.min_state = p.min_state;
        hp.max_state = p.max_state;
        hp.boost_true_positive_feedback = p.boost_true_positive_feedback;
        hp.s = p.s;

        unbind_();
        hyperparameters_ = hp;
        commit_(std::move(handle), std::move(mapping), p.num_literals, draw_seed_());
        logger()->info("loaded {} model from {}", engine_kind_name(Kind), path.string());
        return *this;
    }

    Hyperparameters hyperparameters_;
    EngineConfig config_;
    std::shared_ptr<const Engine> engine_ptr_{};

    // handle_ is declared after engine_ptr_ so it is destroyed first.
    NativeHandle handle_{};
    std::optional<mapping_type> mapping_{};
    std::optional<std::uint32_t> num_literals_{};
    std::optional<std::uint32_t> seed_{};
};

template <ClassLabel Label = std::int64_t>
using Classifier = BasicClassifier<EngineKind::Dense, Label>;

template <ClassLabel Label = std::int64_t>
using SparseClassifier = BasicClassifier<EngineKind::Sparse, Label>;

} // namespace tm_wrap
