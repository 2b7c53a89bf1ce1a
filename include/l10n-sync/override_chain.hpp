/// @file override_chain.hpp
/// @brief Priority-ranked translation sources with locked fields.
///
/// Several sources can claim the same key at once (a manual fix, a
/// resource pack, a data pack, the mod itself). The chain picks the
/// highest-priority value per field; a field locked by a source cannot be
/// changed by any lower-priority one.
///
/// Priority, highest first:
///   manual_override > resource_pack > data_pack > mod > original

#pragma once

#include <l10n-sync/merge.hpp>
#include <l10n-sync/translation_entry.hpp>
#include <l10n-sync/types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace l10n_sync {

/// Lower value means higher priority.
enum class OverridePriority : std::uint8_t {
    manual_override = 1,
    resource_pack   = 2,
    data_pack       = 3,
    mod             = 4,
    original        = 5,  ///< The untouched default translation.
};

constexpr auto to_string_view(OverridePriority p) noexcept -> std::string_view {
    switch (p) {
        case OverridePriority::manual_override: return "override";
        case OverridePriority::resource_pack:   return "resource_pack";
        case OverridePriority::data_pack:       return "data_pack";
        case OverridePriority::mod:             return "mod";
        case OverridePriority::original:        return "default";
    }
    return "unknown";
}

auto parse_override_priority(std::string_view text) -> std::optional<OverridePriority>;

/// True if a outranks b.
constexpr auto outranks(OverridePriority a, OverridePriority b) noexcept -> bool {
    return static_cast<std::uint8_t>(a) < static_cast<std::uint8_t>(b);
}

struct OverrideSource {
    OverridePriority priority{OverridePriority::original};
    std::string source_id;    ///< Mod id, pack name, "manual_override_<user>".
    std::string source_name;
    std::optional<std::string> version;
    std::optional<std::string> pack_uid;
    std::optional<std::string> language_file_uid;

    /// "name vX" when a version is known, otherwise the name.
    auto display_name() const -> std::string;

    auto operator==(const OverrideSource&) const -> bool = default;
};

/// One source's claim on a key.
struct TranslationOverride {
    std::string key;
    std::string locale;
    std::string src_text;
    std::string dst_text;
    EntryStatus status{EntryStatus::untranslated};
    OverrideSource source;
    OverridePriority priority{OverridePriority::original};
    std::set<EntryField> locked_fields;
    nlohmann::json metadata = nlohmann::json::object();
    Timestamp created_at{};
    Timestamp updated_at{};

    std::optional<std::string> overrides;      ///< Uid of the entry this one replaces.
    std::optional<std::string> overridden_by;  ///< Uid of the entry replacing this one.

    /// Sources that contributed fields, as "display_name:field", filled by
    /// process_override_chain.
    std::vector<std::string> chain;

    auto is_field_locked(EntryField field) const -> bool {
        return locked_fields.contains(field);
    }

    auto can_be_overridden_by(OverridePriority other) const -> bool {
        return outranks(other, priority);
    }
};

enum class IssueSeverity : std::uint8_t { warning, error };

constexpr auto to_string_view(IssueSeverity s) noexcept -> std::string_view {
    return s == IssueSeverity::error ? "error" : "warning";
}

/// Advisory finding from validate_override_chain.
struct OverrideIssue {
    std::string type;     ///< duplicate_priority, priority_inversion, priority_mismatch,
                          ///< locked_key_conflict or missing_required_field.
    std::string key;      ///< "key:locale".
    std::string message;
    IssueSeverity severity{IssueSeverity::warning};
};

struct OverrideStatistics {
    std::size_t total_translations{0};
    std::map<OverridePriority, std::size_t> by_priority;
    std::map<EntryField, std::size_t> locked_fields_count;
    std::size_t override_chains{0};  ///< Keys with overrides/overridden_by links.
};

class OverrideChainProcessor {
public:
    OverrideChainProcessor();

    /// Locks given to a source of this priority when none are specified.
    auto default_locked_fields(OverridePriority priority) const -> std::set<EntryField>;

    /// Classify a loose source description ({"type": ..., "is_mod": ...,
    /// "is_manual_override": ...}). Unrecognised types rank as original.
    auto determine_source_priority(const nlohmann::json& source_info) const -> OverridePriority;

    auto create_override_source(std::string_view source_type, std::string source_id,
                                std::string source_name,
                                std::optional<std::string> version = std::nullopt,
                                std::optional<std::string> pack_uid = std::nullopt,
                                std::optional<std::string> language_file_uid = std::nullopt) const
        -> OverrideSource;

    /// Wrap an entry as a claim by source. Without explicit locks the
    /// source priority's defaults apply.
    auto convert_translation_entry(const TranslationEntry& entry, const OverrideSource& source,
                                   std::optional<std::set<EntryField>> locked_fields = std::nullopt) const
        -> TranslationOverride;

    /// Manual fix by a user: locks dst_text and status, status approved.
    auto create_manual_override(std::string key, std::string locale, std::string dst_text,
                                std::string user_id,
                                std::optional<std::string> reason = std::nullopt,
                                Timestamp now = system_now()) const -> TranslationOverride;

    /// Resolve every claim on (key, locale). The highest-priority claim
    /// wins; its empty, unlocked fields fall back to the next claim that
    /// has a value. Returns nullopt if nothing claims the key.
    auto process_override_chain(std::span<const TranslationOverride> translations,
                                std::string_view key, std::string_view locale) const
        -> std::optional<TranslationOverride>;

    /// process_override_chain for every key of locale.
    auto batch_process_overrides(std::span<const TranslationOverride> translations,
                                 std::string_view locale) const
        -> std::map<std::string, TranslationOverride>;

    /// Scan for inconsistencies. Never throws; an empty result means clean.
    auto validate_override_chain(std::span<const TranslationOverride> translations) const
        -> std::vector<OverrideIssue>;

    auto get_override_statistics(std::span<const TranslationOverride> translations) const
        -> OverrideStatistics;

    /// Force the locked fields of the winning claim for the merged entry's
    /// key onto a merge result. The merge runs first, so its conflict record
    /// survives. Returns the fields that were changed.
    auto apply_locked_overrides(MergeResult& result,
                                std::span<const TranslationOverride> overrides) const
        -> std::vector<EntryField>;

private:
    std::map<OverridePriority, std::set<EntryField>> default_locks_;
};

}  // namespace l10n_sync
