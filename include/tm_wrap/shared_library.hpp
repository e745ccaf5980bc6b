// tm_wrap/shared_library.hpp
// RAII wrapper for a dynamically loaded native library
//
// Windows: LoadLibraryA with default flags.
// POSIX:   dlopen(RTLD_NOW | RTLD_GLOBAL) when global visibility is requested,
//          so a companion runtime's symbols resolve for libraries loaded later.

#pragma once

#include <filesystem>
#include <source_location>
#include <string>
#include <utility>

#if defined(_WIN32)
    #ifndef WIN32_LEAN_AND_MEAN
        #define WIN32_LEAN_AND_MEAN
    #endif
    #include <windows.h>
#else
    #include <dlfcn.h>
#endif

#include <fmt/format.h>

#include "tm_wrap/error.hpp"

namespace tm_wrap {

class SharedLibrary {
public:
    SharedLibrary() = default;

    /// Open a library. Throws LinkError on failure.
    [[nodiscard]] static SharedLibrary Open(
        const std::filesystem::path& path,
        bool global_symbols = true,
        std::source_location loc = std::source_location::current())
    {
        SharedLibrary lib;
        lib.path_ = path;
#if defined(_WIN32)
        (void)global_symbols;
        lib.handle_ = ::LoadLibraryA(path.string().c_str());
        if (!lib.handle_) {
            throw LinkError("SharedLibrary::Open", fmt::format(
                "LoadLibrary failed for '{}' (error {})", path.string(),
                static_cast<unsigned long>(::GetLastError())), loc);
        }
#else
        const int mode = RTLD_NOW | (global_symbols ? RTLD_GLOBAL : RTLD_LOCAL);
        lib.handle_ = ::dlopen(path.c_str(), mode);
        if (!lib.handle_) {
            const char* why = ::dlerror();
            throw LinkError("SharedLibrary::Open", fmt::format(
                "dlopen failed for '{}': {}", path.string(), why ? why : "unknown error"), loc);
        }
#endif
        return lib;
    }

    ~SharedLibrary() { close(); }

    SharedLibrary(const SharedLibrary&) = delete;
    SharedLibrary& operator=(const SharedLibrary&) = delete;

    SharedLibrary(SharedLibrary&& other) noexcept
        : handle_(std::exchange(other.handle_, nullptr))
        , path_(std::move(other.path_))
    {}

    SharedLibrary& operator=(SharedLibrary&& other) noexcept {
        if (this != &other) {
            close();
            handle_ = std::exchange(other.handle_, nullptr);
            path_ = std::move(other.path_);
        }
        return *this;
    }

    /// Look up a symbol; nullptr when absent.
    [[nodiscard]] void* symbol(const char* name) const noexcept {
        if (!handle_) return nullptr;
#if defined(_WIN32)
        return reinterpret_cast<void*>(::GetProcAddress(handle_, name));
#else
        return ::dlsym(handle_, name);
#endif
    }

    void close() noexcept {
        if (!handle_) return;
#if defined(_WIN32)
        ::FreeLibrary(handle_);
#else
        ::dlclose(handle_);
#endif
        handle_ = nullptr;
    }

    [[nodiscard]] bool is_open() const noexcept { return handle_ != nullptr; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
#if defined(_WIN32)
    HMODULE handle_{nullptr};
#else
    void* handle_{nullptr};
#endif
    std::filesystem::path path_{};
};

} // namespace tm_wrap
