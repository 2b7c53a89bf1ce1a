#pragma once

// Envelope for every content object this library writes.
//
//   magic (4 bytes: 0x4C 0x31 0x30 0x4E, "L10N")
//   checksum (4 bytes: first 4 bytes of SHA-256 of body)
//   object_type (1 byte)
//   body_length (ULEB128)
//   body (body_length bytes)
//
// The checksum catches accidental corruption before the body is decoded;
// the object's Cid (over the whole envelope) is the real identity.
//
// Internal header, not installed.

#include "../crypto/sha256.hpp"
#include "../encoding/leb128.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <vector>

namespace l10n_sync::storage {

inline constexpr std::array<std::byte, 4> envelope_magic = {
    std::byte{0x4C}, std::byte{0x31}, std::byte{0x30}, std::byte{0x4E}
};

enum class ObjectType : std::uint8_t {
    delta_payload = 0x01,
    entry_version = 0x02,
};

struct EnvelopeHeader {
    ObjectType type;
    std::array<std::byte, 4> checksum;
    std::size_t body_offset;
    std::size_t body_length;
};

inline auto compute_body_checksum(std::span<const std::byte> body)
    -> std::array<std::byte, 4> {
    auto full = crypto::sha256(body);
    auto result = std::array<std::byte, 4>{};
    std::memcpy(result.data(), full.data(), 4);
    return result;
}

// Parse the header. Returns nullopt if the magic, type or length field is bad.
inline auto parse_envelope_header(std::span<const std::byte> data)
    -> std::optional<EnvelopeHeader> {
    if (data.size() < 9) return std::nullopt;
    if (std::memcmp(data.data(), envelope_magic.data(), 4) != 0) return std::nullopt;

    auto checksum = std::array<std::byte, 4>{};
    std::memcpy(checksum.data(), &data[4], 4);

    auto raw_type = static_cast<std::uint8_t>(data[8]);
    if (raw_type != static_cast<std::uint8_t>(ObjectType::delta_payload) &&
        raw_type != static_cast<std::uint8_t>(ObjectType::entry_version)) {
        return std::nullopt;
    }

    auto len = encoding::decode_uleb128(data.subspan(9));
    if (!len) return std::nullopt;

    return EnvelopeHeader{
        .type = static_cast<ObjectType>(raw_type),
        .checksum = checksum,
        .body_offset = 9 + len->bytes_read,
        .body_length = static_cast<std::size_t>(len->value),
    };
}

// Validate the whole envelope and return its body. The body must end
// exactly at the end of data: trailing bytes are treated as corruption.
inline auto open_envelope(std::span<const std::byte> data, ObjectType expected)
    -> std::optional<std::span<const std::byte>> {
    auto header = parse_envelope_header(data);
    if (!header || header->type != expected) return std::nullopt;
    if (header->body_offset > data.size()) return std::nullopt;
    if (data.size() - header->body_offset != header->body_length) return std::nullopt;

    auto body = data.subspan(header->body_offset, header->body_length);
    auto expected_sum = compute_body_checksum(body);
    if (std::memcmp(header->checksum.data(), expected_sum.data(), 4) != 0) {
        return std::nullopt;
    }
    return body;
}

inline void write_envelope(ObjectType type, std::span<const std::byte> body,
                           std::vector<std::byte>& output) {
    output.insert(output.end(), envelope_magic.begin(), envelope_magic.end());
    auto checksum = compute_body_checksum(body);
    output.insert(output.end(), checksum.begin(), checksum.end());
    output.push_back(static_cast<std::byte>(type));
    encoding::encode_uleb128(body.size(), output);
    output.insert(output.end(), body.begin(), body.end());
}

}  // namespace l10n_sync::storage
