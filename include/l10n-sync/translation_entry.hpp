/// @file translation_entry.hpp
/// @brief TranslationEntry, its review status and QA flags, and entry
/// version objects (content-addressed snapshots used as merge bases).

#pragma once

#include <l10n-sync/types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace l10n_sync {

/// Review status of a translation.
enum class EntryStatus : std::uint8_t {
    untranslated,
    in_progress,
    translated,
    needs_review,  ///< Set when a merge conflict is waiting for a reviewer.
    approved,
    rejected,
};

constexpr auto to_string_view(EntryStatus status) noexcept -> std::string_view {
    switch (status) {
        case EntryStatus::untranslated: return "untranslated";
        case EntryStatus::in_progress:  return "in_progress";
        case EntryStatus::translated:   return "translated";
        case EntryStatus::needs_review: return "needs_review";
        case EntryStatus::approved:     return "approved";
        case EntryStatus::rejected:     return "rejected";
    }
    return "unknown";
}

/// Parse the string form produced by to_string_view.
auto parse_entry_status(std::string_view text) -> std::optional<EntryStatus>;

/// One field on which the local and remote edits disagree.
struct FieldConflict {
    std::string field;         ///< "key", "src_text", "dst_text" or "status".
    std::string local_value;   ///< The value kept live.
    std::string remote_value;  ///< The pending alternative.

    auto operator==(const FieldConflict&) const -> bool = default;
};

/// Record left on an entry by a merge that needs human review.
/// Neither side's value is lost: the live entry holds one side and the
/// record holds the other.
struct MergeConflictInfo {
    std::vector<FieldConflict> fields;
    bool remote_deleted{false};  ///< The remote side was a tombstone.
    bool local_deleted{false};   ///< The local side had been deleted.
    Timestamp detected_at{};

    auto operator==(const MergeConflictInfo&) const -> bool = default;
};

/// Quality-assurance annotations on an entry.
struct QaFlags {
    std::vector<std::string> issues;                 ///< QA issue tags.
    std::optional<MergeConflictInfo> merge_conflict;  ///< Pending merge review.
    nlohmann::json extra = nlohmann::json::object();  ///< Unrecognised fields, kept verbatim.

    auto empty() const -> bool {
        return issues.empty() && !merge_conflict && extra.empty();
    }

    friend auto operator==(const QaFlags& a, const QaFlags& b) -> bool {
        return a.issues == b.issues && a.merge_conflict == b.merge_conflict &&
               a.extra == b.extra;
    }
};

/// A single localized string: source text, its translation, and metadata.
struct TranslationEntry {
    std::string uid;                ///< Stable entry identifier.
    std::string uida_keys_b64;      ///< Display form of the entry's UIDA.
    std::string uida_hash;          ///< Hex digest of the entry's UIDA.
    std::string key;                ///< Translation key, e.g. "item.minecraft.diamond".
    std::string locale;             ///< Target locale, e.g. "zh_cn".
    std::string src_text;
    std::string dst_text;
    EntryStatus status{EntryStatus::untranslated};
    std::string language_file_uid;
    Timestamp updated_at{};
    QaFlags qa_flags;

    auto operator==(const TranslationEntry&) const -> bool = default;
};

// -- Entry version objects ----------------------------------------------------

/// Encode the content fields of an entry (everything except updated_at
/// and qa_flags) as an entry version content object.
///
/// Two entries with identical content produce identical bytes, so the
/// version's Cid doubles as a deduplicated snapshot id. A delta's
/// base_cid refers to one of these.
auto entry_version_bytes(const TranslationEntry& entry) -> std::vector<std::byte>;

/// Cid of entry_version_bytes(entry).
auto entry_version_cid(const TranslationEntry& entry) -> Cid;

/// Decode an entry version object. Returns nullopt if the bytes are not
/// a valid entry version.
auto parse_entry_version(std::span<const std::byte> bytes)
    -> std::optional<TranslationEntry>;

}  // namespace l10n_sync
