#include <l10n-sync/delta_applier.hpp>

#include <l10n-sync/content_address.hpp>
#include <l10n-sync/error.hpp>

#include <spdlog/spdlog.h>

#include <map>
#include <utility>

namespace l10n_sync {

namespace {

// Working copy of one uid while a batch is planned.
struct Working {
    std::optional<TranslationEntry> entry;
    std::uint64_t revision{0};
    std::optional<Cid> version_cid;
    bool touched{false};
};

}  // namespace

DeltaApplier::DeltaApplier(EntryStore& entries, ObjectStore& objects, MergeEngine engine)
    : entries_{entries}, objects_{objects}, engine_{std::move(engine)} {}

void DeltaApplier::set_override_lookup(OverrideLookup lookup) {
    lookup_ = std::move(lookup);
}

auto DeltaApplier::resolve_base(const EntryDelta& delta,
                                const std::optional<StoredEntry>& stored) const
    -> std::optional<TranslationEntry> {
    if (!delta.base_cid) return std::nullopt;
    if (stored && stored->entry && stored->version_cid == delta.base_cid) return stored->entry;

    auto bytes = objects_.get(*delta.base_cid);
    if (!bytes) {
        SPDLOG_DEBUG("base {} of entry {} is not in the object store",
                     to_string(*delta.base_cid), delta.entry.uid);
        return std::nullopt;
    }
    return parse_entry_version(*bytes);
}

auto DeltaApplier::plan(std::span<const EntryDelta> deltas, const ApplyOptions& options) const
    -> Plan {
    auto result = Plan{};
    auto& report = result.report;
    auto state = std::map<std::string, Working, std::less<>>{};
    auto order = std::vector<std::string>{};

    for (const auto& delta : deltas) {
        const auto& uid = delta.entry.uid;
        auto it = state.find(uid);
        if (it == state.end()) {
            auto w = Working{};
            if (auto stored = entries_.get(uid)) {
                w.entry = stored->entry;
                w.revision = stored->revision;
                w.version_cid = stored->version_cid;
            }
            it = state.emplace(uid, std::move(w)).first;
            order.push_back(uid);
        }
        auto& w = it->second;

        auto current = std::optional<StoredEntry>{};
        if (w.entry) {
            current = StoredEntry{.uid = uid, .entry = w.entry, .revision = w.revision,
                                  .last_payload_cid = std::nullopt, .version_cid = w.version_cid};
        }

        auto ctx = MergeContext{
            .base = resolve_base(delta, current),
            .local = w.entry,
            .remote = delta.is_tombstone() ? std::nullopt
                                           : std::optional<TranslationEntry>{deserialize_entry_delta(delta)},
            .strategy = options.strategy,
            .policy = options.policy,
        };
        auto merged = engine_.perform_three_way_merge(ctx);
        ++report.processed;

        if (!merged.success) {
            SPDLOG_WARN("skipping delta for {}: {}", uid, merged.error_message);
            report.errors.push_back(uid + ": " + merged.error_message);
            continue;
        }

        if (lookup_ && merged.merged) {
            auto claims = lookup_(merged.merged->key, merged.merged->locale);
            if (!claims.empty()) {
                report.overridden_fields += overrides_.apply_locked_overrides(merged, claims).size();
            }
        }

        if (merged.has_conflict) {
            report.conflicts.push_back(ConflictReport{
                .uid = uid,
                .key = merged.merged ? merged.merged->key : delta.entry.key,
                .locale = merged.merged ? merged.merged->locale : delta.entry.locale,
                .type = merged.conflict_type,
                .fields = merged.conflicting_fields,
            });
        } else {
            ++report.clean;
        }

        switch (merged.action) {
            case MergeAction::created:   ++report.created; break;
            case MergeAction::updated:   ++report.updated; break;
            case MergeAction::deleted:   ++report.deleted; break;
            case MergeAction::unchanged: ++report.unchanged; break;
        }

        if (merged.merged != w.entry) {
            w.entry = std::move(merged.merged);
            w.version_cid = w.entry ? std::optional<Cid>{entry_version_cid(*w.entry)} : std::nullopt;
            w.touched = true;
        }
    }

    for (const auto& uid : order) {
        auto& w = state.at(uid);
        if (!w.touched) continue;
        result.writes.push_back(EntryWrite{
            .uid = uid,
            .entry = std::move(w.entry),
            .expected_revision = w.revision,
        });
    }
    return result;
}

auto DeltaApplier::apply(std::span<const EntryDelta> deltas, const ApplyOptions& options,
                         const RecordFactory& make_record) -> ApplyReport {
    for (auto attempt = std::size_t{0};; ++attempt) {
        auto p = plan(deltas, options);
        p.report.attempts = attempt + 1;

        for (const auto& w : p.writes) {
            if (w.entry) objects_.put(entry_version_bytes(*w.entry));
        }

        auto record = make_record ? std::optional<PayloadRecord>{make_record(p.report)}
                                  : std::nullopt;
        try {
            p.report.outcome = entries_.commit_batch(p.writes, std::move(record));
            return std::move(p.report);
        } catch (const ConcurrentCommitError& e) {
            if (attempt >= options.max_retries) {
                SPDLOG_ERROR("commit still stale after {} attempts: {}", attempt + 1, e.what());
                throw;
            }
            SPDLOG_WARN("stale revision on commit attempt {}, retrying: {}", attempt + 1, e.what());
        }
    }
}

}  // namespace l10n_sync
