// tm_wrap/label_mapping.hpp
// Bijection between class labels and the engine's contiguous indices 0..C-1
//
// Ordering rule: classes are kept in ascending order (sorted deduplication).
// The engine's index space depends on this being stable across fit calls.

#pragma once

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <iterator>
#include <source_location>
#include <span>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <fmt/format.h>

#include "tm_wrap/error.hpp"

namespace tm_wrap {

/// Labels are integers or strings.
template <class T>
concept ClassLabel = (std::integral<T> && !std::same_as<T, bool>) || std::same_as<T, std::string>;

/// Label for the i-th of `num_classes` classes when a model file carries no
/// label names. String labels are zero-padded so that ascending order matches
/// index order ("07" < "10").
template <ClassLabel Label>
[[nodiscard]] Label label_from_index(std::uint32_t index, std::uint32_t num_classes) {
    if constexpr (std::same_as<Label, std::string>) {
        const auto width = fmt::formatted_size("{}", num_classes > 0 ? num_classes - 1 : 0);
        return fmt::format("{:0{}}", index, width);
    } else {
        return static_cast<Label>(index);
    }
}

template <ClassLabel Label>
class LabelMapping {
public:
    using label_type = Label;

    /// Minimum number of distinct classes; single-class problems are degenerate.
    static constexpr std::size_t kMinClasses = 2;

    /// Build from observed labels (duplicates allowed).
    [[nodiscard]] static LabelMapping Fit(
        std::span<const Label> labels,
        std::source_location loc = std::source_location::current())
    {
        LabelMapping m;
        m.classes_.assign(labels.begin(), labels.end());
        std::sort(m.classes_.begin(), m.classes_.end());
        m.classes_.erase(std::unique(m.classes_.begin(), m.classes_.end()), m.classes_.end());

        if (m.classes_.size() < kMinClasses) {
            throw ValidationError("LabelMapping::Fit", fmt::format(
                "this classifier needs at least {} classes; got {}",
                kMinClasses, m.classes_.size()), loc);
        }
        return m;
    }

    /// Build from the full class list of a model (e.g. init_empty_state).
    [[nodiscard]] static LabelMapping FromClasses(
        std::span<const Label> classes,
        std::source_location loc = std::source_location::current())
    {
        return Fit(classes, loc);
    }

    /// Default mapping for a model loaded from a file: class i <-> label_from_index(i, C).
    [[nodiscard]] static LabelMapping FromCount(
        std::uint32_t num_classes,
        std::source_location loc = std::source_location::current())
    {
        std::vector<Label> classes;
        classes.reserve(num_classes);
        for (std::uint32_t i = 0; i < num_classes; ++i) {
            classes.push_back(label_from_index<Label>(i, num_classes));
        }
        return Fit(classes, loc);
    }

    [[nodiscard]] std::vector<std::uint32_t> encode(
        std::span<const Label> labels,
        std::source_location loc = std::source_location::current()) const
    {
        std::vector<std::uint32_t> out;
        out.reserve(labels.size());
        for (std::size_t i = 0; i < labels.size(); ++i) {
            auto it = std::lower_bound(classes_.begin(), classes_.end(), labels[i]);
            if (it == classes_.end() || *it != labels[i]) {
                throw ValidationError("LabelMapping::encode", fmt::format(
                    "label at position {} was not seen when the classes were fixed", i), loc);
            }
            out.push_back(static_cast<std::uint32_t>(std::distance(classes_.begin(), it)));
        }
        return out;
    }

    /// Indices come from the engine; one outside [0, C) is a programming
    /// error and raises std::out_of_range.
    [[nodiscard]] std::vector<Label> decode(std::span<const std::uint32_t> indices) const {
        std::vector<Label> out;
        out.reserve(indices.size());
        for (std::uint32_t idx : indices) {
            if (idx >= classes_.size()) {
                throw std::out_of_range(fmt::format(
                    "LabelMapping::decode: class index {} out of range [0, {})", idx, classes_.size()));
            }
            out.push_back(classes_[idx]);
        }
        return out;
    }

    [[nodiscard]] bool contains(const Label& label) const {
        return std::binary_search(classes_.begin(), classes_.end(), label);
    }

    [[nodiscard]] const std::vector<Label>& classes() const noexcept { return classes_; }
    [[nodiscard]] std::uint32_t size() const noexcept { return static_cast<std::uint32_t>(classes_.size()); }

    bool operator==(const LabelMapping&) const = default;

private:
    LabelMapping() = default;

    std::vector<Label> classes_;
};

} // namespace tm_wrap
