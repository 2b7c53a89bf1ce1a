#include <l10n-sync/merge.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace l10n_sync {

auto parse_merge_strategy(std::string_view text) -> std::optional<MergeStrategy> {
    if (text == "3way" || text == "three_way") return MergeStrategy::three_way;
    if (text == "overwrite") return MergeStrategy::overwrite;
    if (text == "skip") return MergeStrategy::skip;
    return std::nullopt;
}

auto parse_conflict_policy(std::string_view text) -> std::optional<ConflictPolicy> {
    for (auto p : {ConflictPolicy::mark_for_review, ConflictPolicy::take_local,
                   ConflictPolicy::take_remote}) {
        if (to_string_view(p) == text) return p;
    }
    return std::nullopt;
}

auto parse_conflict_type(std::string_view text) -> std::optional<ConflictType> {
    for (auto t : {ConflictType::none, ConflictType::content, ConflictType::delete_edit,
                   ConflictType::edit_delete}) {
        if (to_string_view(t) == text) return t;
    }
    return std::nullopt;
}

auto parse_entry_field(std::string_view text) -> std::optional<EntryField> {
    for (auto f : merge_fields) {
        if (to_string_view(f) == text) return f;
    }
    return std::nullopt;
}

auto field_value(const TranslationEntry& entry, EntryField field) -> std::string {
    switch (field) {
        case EntryField::key:      return entry.key;
        case EntryField::src_text: return entry.src_text;
        case EntryField::dst_text: return entry.dst_text;
        case EntryField::status:   return std::string{to_string_view(entry.status)};
    }
    return {};
}

void set_field_value(TranslationEntry& entry, EntryField field, std::string_view value) {
    switch (field) {
        case EntryField::key:      entry.key = value; return;
        case EntryField::src_text: entry.src_text = value; return;
        case EntryField::dst_text: entry.dst_text = value; return;
        case EntryField::status:
            if (auto s = parse_entry_status(value)) entry.status = *s;
            return;
    }
}

auto same_content(const TranslationEntry& a, const TranslationEntry& b) -> bool {
    return std::ranges::all_of(merge_fields, [&](EntryField f) {
        return field_value(a, f) == field_value(b, f);
    });
}

namespace {

auto action_for(const std::optional<TranslationEntry>& local,
                const std::optional<TranslationEntry>& merged) -> MergeAction {
    if (!local && merged) return MergeAction::created;
    if (local && !merged) return MergeAction::deleted;
    if (local && merged && *local != *merged) return MergeAction::updated;
    return MergeAction::unchanged;
}

auto clean(const MergeContext& ctx, std::optional<TranslationEntry> merged) -> MergeResult {
    auto r = MergeResult{};
    r.action = action_for(ctx.local, merged);
    r.merged = std::move(merged);
    return r;
}

}  // namespace

MergeEngine::MergeEngine() : clock_{system_now} {}

MergeEngine::MergeEngine(Clock clock) : clock_{std::move(clock)} {}

auto MergeEngine::perform_three_way_merge(const MergeContext& ctx) const -> MergeResult {
    if (ctx.local && ctx.remote && ctx.local->uid != ctx.remote->uid) {
        auto r = MergeResult{};
        r.success = false;
        r.merged = ctx.local;
        r.error_message = "entry identity mismatch: local " + ctx.local->uid +
                          ", remote " + ctx.remote->uid;
        return r;
    }

    switch (ctx.strategy) {
        case MergeStrategy::overwrite: return clean(ctx, ctx.remote);
        case MergeStrategy::skip:      return clean(ctx, ctx.local);
        case MergeStrategy::three_way: break;
    }

    if (!ctx.remote) return merge_remote_deleted(ctx);
    if (!ctx.local) {
        if (!ctx.base) return clean(ctx, ctx.remote);  // addition
        return merge_local_deleted(ctx);
    }
    return merge_both_present(ctx);
}

auto MergeEngine::merge_both_present(const MergeContext& ctx) const -> MergeResult {
    const auto& local = *ctx.local;
    const auto& remote = *ctx.remote;

    if (same_content(local, remote)) return clean(ctx, local);

    auto merged = local;
    auto conflicts = std::vector<FieldConflict>{};
    auto conflicting = std::vector<EntryField>{};
    auto took_remote = false;
    auto kept_local_change = false;

    for (auto f : merge_fields) {
        auto l = field_value(local, f);
        auto r = field_value(remote, f);
        if (l == r) continue;
        if (ctx.base) {
            auto b = field_value(*ctx.base, f);
            if (l == b) {
                set_field_value(merged, f, r);
                took_remote = true;
                continue;
            }
            if (r == b) {
                kept_local_change = true;
                continue;
            }
        }
        conflicting.push_back(f);
        conflicts.push_back(FieldConflict{
            .field = std::string{to_string_view(f)},
            .local_value = std::move(l),
            .remote_value = std::move(r),
        });
    }

    if (conflicts.empty()) {
        if (!kept_local_change) return clean(ctx, remote);  // clean update
        if (!took_remote) return clean(ctx, local);          // clean local keep
        merged.updated_at = std::max(local.updated_at, remote.updated_at);
        return clean(ctx, std::move(merged));
    }

    merged.updated_at = std::max(local.updated_at, remote.updated_at);

    switch (ctx.policy) {
        case ConflictPolicy::take_local:
            return clean(ctx, std::move(merged));
        case ConflictPolicy::take_remote:
            for (const auto& c : conflicts) {
                if (auto f = parse_entry_field(c.field)) set_field_value(merged, *f, c.remote_value);
            }
            return clean(ctx, std::move(merged));
        case ConflictPolicy::mark_for_review:
            break;
    }

    merged.status = EntryStatus::needs_review;
    merged.qa_flags.merge_conflict = MergeConflictInfo{
        .fields = std::move(conflicts),
        .remote_deleted = false,
        .local_deleted = false,
        .detected_at = clock_(),
    };

    SPDLOG_DEBUG("merge conflict on entry {} ({} fields)", local.uid, conflicting.size());

    auto r = MergeResult{};
    r.has_conflict = true;
    r.conflict_type = ConflictType::content;
    r.conflicting_fields = std::move(conflicting);
    r.action = action_for(ctx.local, merged);
    r.merged = std::move(merged);
    return r;
}

auto MergeEngine::merge_remote_deleted(const MergeContext& ctx) const -> MergeResult {
    if (!ctx.local) return clean(ctx, std::nullopt);
    if (ctx.base && same_content(*ctx.local, *ctx.base)) return clean(ctx, std::nullopt);

    // Local has edits the remote side never saw: never auto-delete them
    switch (ctx.policy) {
        case ConflictPolicy::take_remote: return clean(ctx, std::nullopt);
        case ConflictPolicy::take_local:  return clean(ctx, ctx.local);
        case ConflictPolicy::mark_for_review: break;
    }

    auto merged = *ctx.local;
    merged.status = EntryStatus::needs_review;
    merged.qa_flags.merge_conflict = MergeConflictInfo{
        .fields = {},
        .remote_deleted = true,
        .local_deleted = false,
        .detected_at = clock_(),
    };

    auto r = MergeResult{};
    r.has_conflict = true;
    r.conflict_type = ConflictType::delete_edit;
    r.action = action_for(ctx.local, merged);
    r.merged = std::move(merged);
    return r;
}

auto MergeEngine::merge_local_deleted(const MergeContext& ctx) const -> MergeResult {
    if (same_content(*ctx.remote, *ctx.base)) return clean(ctx, std::nullopt);

    switch (ctx.policy) {
        case ConflictPolicy::take_local:  return clean(ctx, std::nullopt);
        case ConflictPolicy::take_remote: return clean(ctx, ctx.remote);
        case ConflictPolicy::mark_for_review: break;
    }

    auto merged = *ctx.remote;
    merged.status = EntryStatus::needs_review;
    merged.qa_flags.merge_conflict = MergeConflictInfo{
        .fields = {},
        .remote_deleted = false,
        .local_deleted = true,
        .detected_at = clock_(),
    };

    auto r = MergeResult{};
    r.has_conflict = true;
    r.conflict_type = ConflictType::edit_delete;
    r.action = MergeAction::created;
    r.merged = std::move(merged);
    return r;
}

auto MergeEngine::batch_merge(std::span<const MergeContext> contexts) const -> BatchMergeReport {
    auto report = BatchMergeReport{};
    report.results.reserve(contexts.size());

    for (const auto& ctx : contexts) {
        auto result = MergeResult{};
        try {
            result = perform_three_way_merge(ctx);
        } catch (const std::exception& e) {
            result.success = false;
            result.merged = ctx.local;
            result.error_message = e.what();
        }

        ++report.processed;
        if (!result.success) {
            ++report.errors;
        } else if (result.has_conflict) {
            ++report.conflicts;
        } else {
            ++report.clean;
        }
        switch (result.action) {
            case MergeAction::created: ++report.created; break;
            case MergeAction::updated: ++report.updated; break;
            case MergeAction::deleted: ++report.deleted; break;
            case MergeAction::unchanged: break;
        }
        report.results.push_back(std::move(result));
    }
    return report;
}

}  // namespace l10n_sync
