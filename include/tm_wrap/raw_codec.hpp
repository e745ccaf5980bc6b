// tm_wrap/raw_codec.hpp
// Raw binary model format
//
// Little-endian, no version tag, no checksum:
//
//   offset  field                 type
//   0       threshold             uint32
//   4       num_literals          uint32
//   8       num_clauses           uint32
//   12      num_classes           uint32
//   16      max_state             int8
//   17      min_state             int8
//   18      boost_true_positive   uint8
//   19      padding (zero)        5 bytes
//   24      s                     float64
//   32      weights               int16[num_clauses * num_classes]
//   ...     clause states         int8[num_clauses * num_literals * 2], canonical order
//
// The reader consumes fields in exactly this order; a short read or trailing
// bytes raise FormatError.

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <source_location>
#include <span>
#include <vector>

#include <fmt/format.h>

#include "tm_wrap/detail/byte_io.hpp"
#include "tm_wrap/detail/file_io.hpp"
#include "tm_wrap/error.hpp"
#include "tm_wrap/log.hpp"
#include "tm_wrap/model.hpp"

namespace tm_wrap {

namespace raw_format {
inline constexpr std::size_t kSensitivityOffset = 24;
inline constexpr std::size_t kHeaderSize = 32;
} // namespace raw_format

[[nodiscard]] inline std::vector<std::uint8_t> encode_raw(
    const SerializedModel& model,
    std::source_location loc = std::source_location::current())
{
    model.require_consistent("encode_raw", loc);

    const auto& p = model.params;
    detail::ByteWriter w(raw_format::kHeaderSize
                         + model.tensors.weights.size() * sizeof(std::int16_t)
                         + model.tensors.states.size());
    w.put(p.threshold);
    w.put(p.num_literals);
    w.put(p.num_clauses);
    w.put(p.num_classes);
    w.put(p.max_state);
    w.put(p.min_state);
    w.put(static_cast<std::uint8_t>(p.boost_true_positive_feedback ? 1 : 0));
    w.pad_to(raw_format::kSensitivityOffset);
    w.put_f64(static_cast<double>(p.s));
    w.put_all<std::int16_t>(model.tensors.weights);
    w.put_all<std::int8_t>(model.tensors.states);
    return std::move(w).take();
}

[[nodiscard]] inline SerializedModel decode_raw(
    std::span<const std::uint8_t> bytes,
    std::source_location loc = std::source_location::current())
{
    constexpr const char* ctx = "decode_raw";
    detail::ByteReader r(bytes, ctx, loc);

    SerializedModel model;
    auto& p = model.params;
    p.threshold = r.get<std::uint32_t>("threshold");
    p.num_literals = r.get<std::uint32_t>("num_literals");
    p.num_clauses = r.get<std::uint32_t>("num_clauses");
    p.num_classes = r.get<std::uint32_t>("num_classes");
    p.max_state = r.get<std::int8_t>("max_state");
    p.min_state = r.get<std::int8_t>("min_state");
    p.boost_true_positive_feedback = r.get<std::uint8_t>("boost_true_positive") != 0;
    r.skip_to(raw_format::kSensitivityOffset, "header padding");
    p.s = static_cast<float>(r.get_f64("s"));

    model.tensors.weights = r.get_all<std::int16_t>(
        static_cast<std::uint64_t>(p.num_clauses) * p.num_classes, "weights");
    const auto literal_slots = static_cast<std::uint64_t>(p.num_clauses) * p.num_literals;
    if (literal_slots > r.remaining()) {
        throw FormatError(ctx, fmt::format(
            "truncated model: header declares {} clauses x {} literals but only {} bytes remain",
            p.num_clauses, p.num_literals, r.remaining()), loc);
    }
    model.tensors.states = r.get_all<std::int8_t>(literal_slots * 2, "clause states");

    if (r.remaining() != 0) {
        throw FormatError(ctx, fmt::format(
            "{} trailing bytes after the clause states; not a raw model of this shape",
            r.remaining()), loc);
    }
    return model;
}

inline void write_raw_model(
    const std::filesystem::path& path,
    const SerializedModel& model,
    std::source_location loc = std::source_location::current())
{
    const auto bytes = encode_raw(model, loc);
    detail::write_file_atomic(path, bytes, "write_raw_model", loc);
    logger()->info("saved raw model ({} clauses, {} literals, {} classes) to {}",
                   model.params.num_clauses, model.params.num_literals,
                   model.params.num_classes, path.string());
}

[[nodiscard]] inline SerializedModel read_raw_model(
    const std::filesystem::path& path,
    std::source_location loc = std::source_location::current())
{
    const auto bytes = detail::read_file(path, "read_raw_model", loc);
    auto model = decode_raw(bytes, loc);
    logger()->info("read raw model from {}", path.string());
    return model;
}

} // namespace tm_wrap
