// tm_wrap/detail/byte_io.hpp
// Little-endian scalar append/consume helpers for the raw model format.

#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <source_location>
#include <span>
#include <type_traits>
#include <vector>

#include <fmt/format.h>

#include "tm_wrap/error.hpp"

namespace tm_wrap::detail {

class ByteWriter {
public:
    explicit ByteWriter(std::size_t reserve = 0) { bytes_.reserve(reserve); }

    template <class T>
        requires std::is_integral_v<T>
    void put(T value) {
        using U = std::make_unsigned_t<T>;
        auto u = static_cast<U>(value);
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            bytes_.push_back(static_cast<std::uint8_t>(u >> (8 * i)));
        }
    }

    void put_f64(double value) { put(std::bit_cast<std::uint64_t>(value)); }

    void pad_to(std::size_t offset) {
        if (bytes_.size() < offset) bytes_.resize(offset, 0);
    }

    template <class T>
    void put_all(std::span<const T> values) {
        for (T v : values) put(v);
    }

    [[nodiscard]] std::size_t size() const noexcept { return bytes_.size(); }
    [[nodiscard]] std::vector<std::uint8_t> take() && { return std::move(bytes_); }

private:
    std::vector<std::uint8_t> bytes_;
};

class ByteReader {
public:
    ByteReader(std::span<const std::uint8_t> bytes, const char* context,
               std::source_location loc)
        : bytes_(bytes), context_(context), loc_(loc) {}

    template <class T>
        requires std::is_integral_v<T>
    [[nodiscard]] T get(const char* field) {
        require_(sizeof(T), field);
        using U = std::make_unsigned_t<T>;
        U u = 0;
        for (std::size_t i = 0; i < sizeof(T); ++i) {
            u = static_cast<U>(u | (static_cast<U>(bytes_[pos_ + i]) << (8 * i)));
        }
        pos_ += sizeof(T);
        return static_cast<T>(u);
    }

    [[nodiscard]] double get_f64(const char* field) {
        return std::bit_cast<double>(get<std::uint64_t>(field));
    }

    void skip_to(std::size_t offset, const char* field) {
        if (offset > pos_) {
            require_(offset - pos_, field);
            pos_ = offset;
        }
    }

    /// Reads `count` elements; the count is checked against the remaining
    /// bytes before anything is allocated.
    template <class T>
    [[nodiscard]] std::vector<T> get_all(std::uint64_t count, const char* field) {
        if (count > remaining() / sizeof(T)) {
            throw FormatError(context_, fmt::format(
                "truncated model: {} needs {} elements of {} bytes at offset {}, {} bytes remain",
                field, count, sizeof(T), pos_, remaining()), loc_);
        }
        std::vector<T> out;
        out.reserve(static_cast<std::size_t>(count));
        for (std::uint64_t i = 0; i < count; ++i) {
            out.push_back(get<T>(field));
        }
        return out;
    }

    [[nodiscard]] std::size_t position() const noexcept { return pos_; }
    [[nodiscard]] std::size_t remaining() const noexcept { return bytes_.size() - pos_; }

private:
    void require_(std::size_t n, const char* field) const {
        if (n > remaining()) {
            throw FormatError(context_, fmt::format(
                "truncated model: reading {} at offset {} needs {} bytes, {} remain",
                field, pos_, n, remaining()), loc_);
        }
    }

    std::span<const std::uint8_t> bytes_;
    std::size_t pos_{0};
    const char* context_;
    std::source_location loc_;
};

} // namespace tm_wrap::detail
