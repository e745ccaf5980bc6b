// tm_wrap/matrix.hpp
// Row-major binary input matrices handed to the engine
//
// BinaryMatrixView  - non-owning (data, rows, cols); shape checked on construction
// BinaryMatrix      - owning; convenient for tests and small programs

#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <source_location>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>

#include "tm_wrap/error.hpp"

namespace tm_wrap {

class BinaryMatrixView {
public:
    BinaryMatrixView() = default;

    BinaryMatrixView(
        std::span<const std::uint8_t> data,
        std::size_t rows,
        std::size_t cols,
        std::source_location loc = std::source_location::current())
        : data_(data), rows_(rows), cols_(cols)
    {
        if (rows != 0 && cols > data.size() / rows) {
            throw ValidationError("BinaryMatrixView", fmt::format(
                "shape ({}, {}) does not fit {} bytes", rows, cols, data.size()), loc);
        }
        if (data.size() != rows * cols) {
            throw ValidationError("BinaryMatrixView", fmt::format(
                "shape ({}, {}) requires {} bytes, got {}", rows, cols, rows * cols, data.size()), loc);
        }
    }

    [[nodiscard]] std::size_t rows() const noexcept { return rows_; }
    [[nodiscard]] std::size_t cols() const noexcept { return cols_; }
    [[nodiscard]] const std::uint8_t* data() const noexcept { return data_.data(); }
    [[nodiscard]] std::span<const std::uint8_t> bytes() const noexcept { return data_; }

    [[nodiscard]] std::span<const std::uint8_t> row(std::size_t r) const noexcept {
        return data_.subspan(r * cols_, cols_);
    }

    /// Position of the first value other than 0 or 1, or size() when all are binary.
    [[nodiscard]] std::size_t first_non_binary() const noexcept {
        auto it = std::find_if(data_.begin(), data_.end(),
                               [](std::uint8_t v) { return v > 1; });
        return static_cast<std::size_t>(it - data_.begin());
    }

    [[nodiscard]] bool is_binary() const noexcept { return first_non_binary() == data_.size(); }

    /// Throws ValidationError unless the matrix is non-empty, binary-valued and
    /// addressable with the engine's 32-bit row/column counts.
    void require_binary(
        std::string_view context,
        std::source_location loc = std::source_location::current()) const
    {
        if (rows_ == 0 || cols_ == 0) {
            throw ValidationError(context, fmt::format(
                "X must be a non-empty 2-D matrix, got shape ({}, {})", rows_, cols_), loc);
        }
        constexpr auto u32_max = std::numeric_limits<std::uint32_t>::max();
        if (rows_ > u32_max || cols_ > u32_max) {
            throw ValidationError(context, "X has more rows or columns than the engine can address", loc);
        }
        const auto pos = first_non_binary();
        if (pos != data_.size()) {
            throw ValidationError(context, fmt::format(
                "input X must be binary (0 or 1); found {} at row {}, column {}",
                data_[pos], pos / cols_, pos % cols_), loc);
        }
    }

private:
    std::span<const std::uint8_t> data_{};
    std::size_t rows_{0};
    std::size_t cols_{0};
};

class BinaryMatrix {
public:
    BinaryMatrix() = default;

    BinaryMatrix(std::size_t rows, std::size_t cols, std::uint8_t fill = 0)
        : data_(rows * cols, fill), rows_(rows), cols_(cols) {}

    BinaryMatrix(
        std::vector<std::uint8_t> data,
        std::size_t rows,
        std::size_t cols,
        std::source_location loc = std::source_location::current())
        : data_(std::move(data)), rows_(rows), cols_(cols)
    {
        (void)BinaryMatrixView(data_, rows_, cols_, loc);
    }

    /// Build from nested rows; all rows must have equal length.
    [[nodiscard]] static BinaryMatrix FromRows(
        std::initializer_list<std::initializer_list<std::uint8_t>> rows,
        std::source_location loc = std::source_location::current())
    {
        BinaryMatrix m;
        m.rows_ = rows.size();
        m.cols_ = rows.size() ? rows.begin()->size() : 0;
        m.data_.reserve(m.rows_ * m.cols_);
        std::size_t r = 0;
        for (const auto& row : rows) {
            if (row.size() != m.cols_) {
                throw ValidationError("BinaryMatrix::FromRows", fmt::format(
                    "row {} has {} columns, expected {}", r, row.size(), m.cols_), loc);
            }
            m.data_.insert(m.data_.end(), row.begin(), row.end());
            ++r;
        }
        return m;
    }

    [[nodiscard]] std::size_t rows() const noexcept { return rows_; }
    [[nodiscard]] std::size_t cols() const noexcept { return cols_; }

    [[nodiscard]] std::uint8_t& at(std::size_t r, std::size_t c) { return data_.at(r * cols_ + c); }
    [[nodiscard]] std::uint8_t at(std::size_t r, std::size_t c) const { return data_.at(r * cols_ + c); }

    [[nodiscard]] std::span<const std::uint8_t> bytes() const noexcept { return data_; }

    [[nodiscard]] BinaryMatrixView view() const { return BinaryMatrixView(data_, rows_, cols_); }

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator BinaryMatrixView() const { return view(); }

private:
    std::vector<std::uint8_t> data_{};
    std::size_t rows_{0};
    std::size_t cols_{0};
};

} // namespace tm_wrap
