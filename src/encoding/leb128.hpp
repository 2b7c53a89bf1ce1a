#pragma once

// LEB128 (Little Endian Base 128) variable-length integers.
// Unsigned for lengths and counts, signed for timestamps.
// Internal header, not installed.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace l10n_sync::encoding {

// -- Unsigned -----------------------------------------------------------------

inline void encode_uleb128(std::uint64_t value, std::vector<std::byte>& output) {
    do {
        auto byte = static_cast<std::byte>(value & 0x7F);
        value >>= 7;
        if (value != 0) {
            byte |= std::byte{0x80};
        }
        output.push_back(byte);
    } while (value != 0);
}

struct DecodeResult {
    std::uint64_t value;
    std::size_t bytes_read;
};

// Returns nullopt on truncated input or a value wider than 64 bits.
inline auto decode_uleb128(std::span<const std::byte> input) -> std::optional<DecodeResult> {
    auto value = std::uint64_t{0};
    auto shift = 0u;

    for (std::size_t i = 0; i < input.size(); ++i) {
        const auto bits = static_cast<std::uint64_t>(input[i] & std::byte{0x7F});
        if (shift == 63 && bits > 1) return std::nullopt;  // overflow
        if (shift > 63) return std::nullopt;
        value |= bits << shift;
        shift += 7;

        if ((input[i] & std::byte{0x80}) == std::byte{0}) {
            return DecodeResult{.value = value, .bytes_read = i + 1};
        }
    }
    return std::nullopt;
}

// -- Signed -------------------------------------------------------------------

inline void encode_sleb128(std::int64_t value, std::vector<std::byte>& output) {
    auto more = true;
    while (more) {
        auto byte = static_cast<std::byte>(value & 0x7F);
        value >>= 7;  // arithmetic shift

        const bool sign_bit = (byte & std::byte{0x40}) != std::byte{0};
        if ((value == 0 && !sign_bit) || (value == -1 && sign_bit)) {
            more = false;
        } else {
            byte |= std::byte{0x80};
        }
        output.push_back(byte);
    }
}

struct SignedDecodeResult {
    std::int64_t value;
    std::size_t bytes_read;
};

inline auto decode_sleb128(std::span<const std::byte> input) -> std::optional<SignedDecodeResult> {
    auto value = std::int64_t{0};
    auto shift = 0u;

    for (std::size_t i = 0; i < input.size(); ++i) {
        if (shift >= 64) return std::nullopt;

        auto byte = input[i];
        value |= static_cast<std::int64_t>(static_cast<std::uint64_t>(byte & std::byte{0x7F}) << shift);
        shift += 7;

        if ((byte & std::byte{0x80}) == std::byte{0}) {
            if (shift < 64 && (byte & std::byte{0x40}) != std::byte{0}) {
                value |= -(std::int64_t{1} << shift);
            }
            return SignedDecodeResult{.value = value, .bytes_read = i + 1};
        }
    }
    return std::nullopt;
}

}  // namespace l10n_sync::encoding
