#pragma once

// Raw DEFLATE (no zlib/gzip header) for payload bodies.
// Bodies below the threshold are stored uncompressed; the payload flags
// byte records which form was written.
//
// Internal header, not installed.

#include <algorithm>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include <zlib.h>

namespace l10n_sync::storage {

inline constexpr std::size_t deflate_threshold = 256;

// Upper bound on inflated output, guards against decompression bombs.
inline constexpr std::size_t max_inflated_size = std::size_t{256} * 1024 * 1024;

inline auto deflate_compress(std::span<const std::byte> input)
    -> std::optional<std::vector<std::byte>> {
    if (input.empty()) return std::vector<std::byte>{};

    auto stream = z_stream{};
    // windowBits = -15 selects raw deflate
    auto ret = ::deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                              -15, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) return std::nullopt;

    auto bound = ::deflateBound(&stream, static_cast<uLong>(input.size()));
    auto output = std::vector<std::byte>(bound);

    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(bound);

    ret = ::deflate(&stream, Z_FINISH);
    ::deflateEnd(&stream);
    if (ret != Z_STREAM_END) return std::nullopt;

    output.resize(stream.total_out);
    return output;
}

// The expected size is recorded by the writer, so the output buffer is
// allocated once and any size disagreement is corruption.
inline auto deflate_decompress(std::span<const std::byte> input, std::size_t expected_size)
    -> std::optional<std::vector<std::byte>> {
    if (expected_size > max_inflated_size) return std::nullopt;
    if (input.empty()) {
        if (expected_size != 0) return std::nullopt;
        return std::vector<std::byte>{};
    }

    // One spare byte detects streams that inflate past the declared size
    auto output = std::vector<std::byte>(expected_size + 1);

    auto stream = z_stream{};
    stream.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output.size());

    auto ret = ::inflateInit2(&stream, -15);
    if (ret != Z_OK) return std::nullopt;

    ret = ::inflate(&stream, Z_FINISH);
    const auto produced = stream.total_out;
    const auto consumed_all = (stream.avail_in == 0);
    ::inflateEnd(&stream);

    if (ret != Z_STREAM_END || !consumed_all || produced != expected_size) {
        return std::nullopt;
    }
    output.resize(produced);
    return output;
}

}  // namespace l10n_sync::storage
