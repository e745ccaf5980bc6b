// tm_wrap/detail/file_io.hpp
// Whole-file read and all-or-nothing write for model files.
//
// Writes go to "<path>.tmp" and are renamed into place; the temp file is
// removed if anything fails before the rename.

#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <source_location>
#include <span>
#include <system_error>
#include <vector>

#include <fmt/format.h>

#include "tm_wrap/error.hpp"
#include "tm_wrap/scope_guard.hpp"

namespace tm_wrap::detail {

[[nodiscard]] inline std::filesystem::path temp_path_for(const std::filesystem::path& path) {
    auto tmp = path;
    tmp += ".tmp";
    return tmp;
}

inline void write_file_atomic(
    const std::filesystem::path& path,
    std::span<const std::uint8_t> bytes,
    const char* context,
    std::source_location loc)
{
    const auto tmp = temp_path_for(path);

    TMWRAP_SCOPE_FAIL {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
    };

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw FormatError(context, fmt::format("cannot open '{}' for writing", tmp.string()), loc);
        }
        out.write(reinterpret_cast<const char*>(bytes.data()),
                  static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            throw FormatError(context, fmt::format("write to '{}' failed", tmp.string()), loc);
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        throw FormatError(context, fmt::format(
            "cannot move '{}' into place as '{}': {}", tmp.string(), path.string(), ec.message()), loc);
    }
}

[[nodiscard]] inline std::vector<std::uint8_t> read_file(
    const std::filesystem::path& path,
    const char* context,
    std::source_location loc)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw FormatError(context, fmt::format("cannot open '{}' for reading", path.string()), loc);
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw FormatError(context, fmt::format("read from '{}' failed", path.string()), loc);
    }
    return bytes;
}

} // namespace tm_wrap::detail
