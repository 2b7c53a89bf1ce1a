/// @file merge.hpp
/// @brief Field-level three-way merge of translation entries.
///
/// Conflicts are results, never exceptions. Under the default policy a
/// conflicting entry keeps its local value live, is marked needs_review,
/// and carries the remote value in qa_flags.merge_conflict so a reviewer
/// can choose; no value is silently dropped.

#pragma once

#include <l10n-sync/translation_entry.hpp>
#include <l10n-sync/types.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace l10n_sync {

/// How a delta is reconciled with the local entry.
enum class MergeStrategy : std::uint8_t {
    three_way,  ///< Field-level merge against the common base.
    overwrite,  ///< Remote wins unconditionally.
    skip,       ///< Local is kept unconditionally.
};

/// What to do with a genuine conflict under three_way.
enum class ConflictPolicy : std::uint8_t {
    mark_for_review,  ///< Keep local live, attach remote, status needs_review.
    take_local,
    take_remote,
};

enum class ConflictType : std::uint8_t {
    none,
    content,      ///< Both sides changed a field to different values.
    delete_edit,  ///< Remote deleted the entry, local edited it.
    edit_delete,  ///< Local deleted the entry, remote edited it.
};

/// The entry fields the merge reconciles.
enum class EntryField : std::uint8_t {
    key,
    src_text,
    dst_text,
    status,
};

inline constexpr std::array<EntryField, 4> merge_fields = {
    EntryField::key, EntryField::src_text, EntryField::dst_text, EntryField::status,
};

/// Effect of a merge on the local store.
enum class MergeAction : std::uint8_t {
    unchanged,
    created,
    updated,
    deleted,
};

constexpr auto to_string_view(MergeStrategy s) noexcept -> std::string_view {
    switch (s) {
        case MergeStrategy::three_way: return "3way";
        case MergeStrategy::overwrite: return "overwrite";
        case MergeStrategy::skip:      return "skip";
    }
    return "unknown";
}

constexpr auto to_string_view(ConflictPolicy p) noexcept -> std::string_view {
    switch (p) {
        case ConflictPolicy::mark_for_review: return "mark_for_review";
        case ConflictPolicy::take_local:      return "take_local";
        case ConflictPolicy::take_remote:     return "take_remote";
    }
    return "unknown";
}

constexpr auto to_string_view(ConflictType t) noexcept -> std::string_view {
    switch (t) {
        case ConflictType::none:        return "none";
        case ConflictType::content:     return "content_conflict";
        case ConflictType::delete_edit: return "delete_edit";
        case ConflictType::edit_delete: return "edit_delete";
    }
    return "unknown";
}

constexpr auto to_string_view(EntryField f) noexcept -> std::string_view {
    switch (f) {
        case EntryField::key:      return "key";
        case EntryField::src_text: return "src_text";
        case EntryField::dst_text: return "dst_text";
        case EntryField::status:   return "status";
    }
    return "unknown";
}

constexpr auto to_string_view(MergeAction a) noexcept -> std::string_view {
    switch (a) {
        case MergeAction::unchanged: return "unchanged";
        case MergeAction::created:   return "created";
        case MergeAction::updated:   return "updated";
        case MergeAction::deleted:   return "deleted";
    }
    return "unknown";
}

/// Accepts "3way" and "three_way".
auto parse_merge_strategy(std::string_view text) -> std::optional<MergeStrategy>;
auto parse_conflict_policy(std::string_view text) -> std::optional<ConflictPolicy>;
auto parse_conflict_type(std::string_view text) -> std::optional<ConflictType>;
auto parse_entry_field(std::string_view text) -> std::optional<EntryField>;

/// Read a merge field as text (status uses its string form).
auto field_value(const TranslationEntry& entry, EntryField field) -> std::string;

/// Write a merge field from text. Unknown status strings leave status as is.
void set_field_value(TranslationEntry& entry, EntryField field, std::string_view value);

/// True if the merge fields of a and b are equal.
auto same_content(const TranslationEntry& a, const TranslationEntry& b) -> bool;

/// Inputs to one merge. An absent remote is a tombstone; an absent local
/// with a present base means the entry was deleted locally.
struct MergeContext {
    std::optional<TranslationEntry> base;
    std::optional<TranslationEntry> local;
    std::optional<TranslationEntry> remote;
    MergeStrategy strategy{MergeStrategy::three_way};
    ConflictPolicy policy{ConflictPolicy::mark_for_review};
};

struct MergeResult {
    bool success{true};
    std::optional<TranslationEntry> merged;  ///< nullopt: the entry is deleted.
    bool has_conflict{false};
    ConflictType conflict_type{ConflictType::none};
    std::vector<EntryField> conflicting_fields;
    MergeAction action{MergeAction::unchanged};
    std::string error_message;
};

/// Aggregate of a batch_merge run.
struct BatchMergeReport {
    std::vector<MergeResult> results;  ///< In input order.
    std::size_t processed{0};
    std::size_t clean{0};
    std::size_t conflicts{0};
    std::size_t errors{0};
    std::size_t created{0};
    std::size_t updated{0};
    std::size_t deleted{0};
};

/// Stateless apart from its clock, which stamps conflict records.
class MergeEngine {
public:
    MergeEngine();
    explicit MergeEngine(Clock clock);

    auto perform_three_way_merge(const MergeContext& context) const -> MergeResult;

    auto batch_merge(std::span<const MergeContext> contexts) const -> BatchMergeReport;

private:
    auto merge_both_present(const MergeContext& ctx) const -> MergeResult;
    auto merge_remote_deleted(const MergeContext& ctx) const -> MergeResult;
    auto merge_local_deleted(const MergeContext& ctx) const -> MergeResult;

    Clock clock_;
};

}  // namespace l10n_sync
