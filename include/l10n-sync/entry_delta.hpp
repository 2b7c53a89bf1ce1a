/// @file entry_delta.hpp
/// @brief Entry deltas and the binary delta payload that carries them.
///
/// A delta payload is the unit of upload, commit and replay detection.
/// Its layout, inside the object envelope:
///
///   format_version (1 byte) | flags (1 byte, bit 0 = raw DEFLATE)
///   [uncompressed_size ULEB128, when deflated]
///   inner block:
///     created_at (SLEB128 millis)
///     delta_count (ULEB128)
///     record offsets (delta_count x ULEB128, relative to the record area)
///     record_area_length (ULEB128)
///     records
///
/// Decoding is all-or-nothing: any defect throws MalformedPayloadError.

#pragma once

#include <l10n-sync/translation_entry.hpp>
#include <l10n-sync/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace l10n_sync {

/// What a delta does to its entry.
enum class DeltaOperation : std::uint8_t {
    create = 1,
    update = 2,
    del    = 3,  ///< Tombstone.
};

constexpr auto to_string_view(DeltaOperation op) noexcept -> std::string_view {
    switch (op) {
        case DeltaOperation::create: return "create";
        case DeltaOperation::update: return "update";
        case DeltaOperation::del:    return "delete";
    }
    return "unknown";
}

auto parse_delta_operation(std::string_view text) -> std::optional<DeltaOperation>;

/// One change to one translation entry.
///
/// The entry carries the post-operation field values (for a tombstone,
/// the last values known to the sender). base_cid, when present, is the
/// entry version the sender edited from.
struct EntryDelta {
    DeltaOperation operation{DeltaOperation::update};
    TranslationEntry entry;
    std::optional<Cid> base_cid;

    auto is_tombstone() const -> bool { return operation == DeltaOperation::del; }

    auto operator==(const EntryDelta&) const -> bool = default;
};

/// Decoded payload contents.
struct DeltaPayload {
    Timestamp created_at{};
    std::vector<EntryDelta> deltas;
};

/// Current payload format version.
inline constexpr std::uint8_t delta_payload_version = 1;

/// Capture an entry's state as a delta.
auto serialize_entry_delta(const TranslationEntry& entry, DeltaOperation operation,
                           std::optional<Cid> base_cid = std::nullopt) -> EntryDelta;

/// The entry state a delta describes.
auto deserialize_entry_delta(const EntryDelta& delta) -> TranslationEntry;

/// Encode deltas, in order, as one payload object.
auto create_delta_payload(std::span<const EntryDelta> deltas, Timestamp created_at)
    -> std::vector<std::byte>;

/// Decode a payload. Throws MalformedPayloadError on any defect.
auto decode_delta_payload(std::span<const std::byte> bytes) -> DeltaPayload;

/// Decode a payload and return only its deltas, in order.
auto parse_delta_payload(std::span<const std::byte> bytes) -> std::vector<EntryDelta>;

/// Cid of the encoded payload bytes.
auto calculate_payload_cid(std::span<const std::byte> bytes) -> Cid;

/// Cheap check of the envelope type, without decoding the body.
auto is_delta_payload(std::span<const std::byte> bytes) -> bool;

}  // namespace l10n_sync
