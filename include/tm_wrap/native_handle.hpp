// tm_wrap/native_handle.hpp
// Move-only owner of one engine-allocated model
//
// Free-once contract: the raw pointer is cleared BEFORE the engine's free is
// called, so no path can free it twice.
// The handle shares ownership of the Engine that created it, so the library
// stays mapped until the last handle is gone regardless of destruction order.

#pragma once

#include <memory>
#include <utility>

#include "tm_wrap/engine.hpp"
#include "tm_wrap/log.hpp"

namespace tm_wrap {

class NativeHandle {
public:
    NativeHandle() = default;

    /// Adopt a raw handle returned by engine->create()/load(). A null `raw`
    /// produces an empty handle.
    NativeHandle(std::shared_ptr<const Engine> engine, void* raw) noexcept
        : engine_(std::move(engine))
        , raw_(raw)
    {}

    ~NativeHandle() { reset(); }

    NativeHandle(const NativeHandle&) = delete;
    NativeHandle& operator=(const NativeHandle&) = delete;

    NativeHandle(NativeHandle&& other) noexcept
        : engine_(std::move(other.engine_))
        , raw_(std::exchange(other.raw_, nullptr))
    {}

    NativeHandle& operator=(NativeHandle&& other) noexcept {
        if (this != &other) {
            reset();
            engine_ = std::move(other.engine_);
            raw_ = std::exchange(other.raw_, nullptr);
        }
        return *this;
    }

    /// Free the model if present. Idempotent; never throws.
    void reset() noexcept {
        void* raw = std::exchange(raw_, nullptr);
        if (!raw) return;

        if (!engine_) {
            // Unreachable through the public API; report rather than crash.
            warn_leak_(raw);
            return;
        }
        engine_->free(raw);
        if (auto log = existing_logger()) {
            log->debug("freed {} model handle {}", engine_kind_name(engine_->kind()), raw);
        }
    }

    /// Give up ownership without freeing.
    [[nodiscard]] void* release() noexcept { return std::exchange(raw_, nullptr); }

    [[nodiscard]] void* get() const noexcept { return raw_; }
    [[nodiscard]] bool valid() const noexcept { return raw_ != nullptr; }
    [[nodiscard]] explicit operator bool() const noexcept { return valid(); }
    [[nodiscard]] const std::shared_ptr<const Engine>& engine() const noexcept { return engine_; }

    /// View the engine's public struct prefix.
    template <class Machine>
    [[nodiscard]] Machine* as() const noexcept { return static_cast<Machine*>(raw_); }

private:
    static void warn_leak_(void* raw) noexcept {
        if (auto log = existing_logger()) {
            log->warn("cannot free model handle {}: engine binding unavailable; leaking it", raw);
        }
    }

    std::shared_ptr<const Engine> engine_{};
    void* raw_{nullptr};
};

} // namespace tm_wrap
