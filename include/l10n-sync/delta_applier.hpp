/// @file delta_applier.hpp
/// @brief Merge a batch of entry deltas into an EntryStore and commit it.
///
/// This is the one write path shared by the hub (client commits) and the
/// client (downloaded payloads). Each delta is merged against the stored
/// entry and the base its sender edited from; the surviving states are
/// written with one optimistic commit_batch. A stale revision re-runs the
/// whole batch against refreshed state, up to ApplyOptions::max_retries.

#pragma once

#include <l10n-sync/entry_delta.hpp>
#include <l10n-sync/merge.hpp>
#include <l10n-sync/override_chain.hpp>
#include <l10n-sync/protocol.hpp>
#include <l10n-sync/store.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace l10n_sync {

struct ApplyOptions {
    MergeStrategy strategy{MergeStrategy::three_way};
    ConflictPolicy policy{ConflictPolicy::mark_for_review};
    std::size_t max_retries{3};
};

struct ApplyReport {
    std::size_t processed{0};
    std::size_t created{0};
    std::size_t updated{0};
    std::size_t deleted{0};
    std::size_t unchanged{0};
    std::size_t clean{0};
    std::size_t overridden_fields{0};  ///< Fields forced back by locked overrides.
    std::vector<ConflictReport> conflicts;
    std::vector<std::string> errors;   ///< Per-delta failures; those deltas were skipped.
    std::size_t attempts{0};
    CommitOutcome outcome{CommitOutcome::committed};
};

/// Overrides that apply to one key in one locale.
using OverrideLookup =
    std::function<std::vector<TranslationOverride>(std::string_view key, std::string_view locale)>;

/// Builds the idempotency record committed with the batch.
using RecordFactory = std::function<PayloadRecord(const ApplyReport&)>;

class DeltaApplier {
public:
    DeltaApplier(EntryStore& entries, ObjectStore& objects, MergeEngine engine = MergeEngine{});

    void set_override_lookup(OverrideLookup lookup);

    /// Merge and commit deltas in order. Throws ConcurrentCommitError once
    /// the retry budget is spent; nothing is written in that case.
    auto apply(std::span<const EntryDelta> deltas, const ApplyOptions& options,
               const RecordFactory& make_record = {}) -> ApplyReport;

    /// The entry version a delta was edited from, if it can be recovered
    /// from the stored entry or the object store.
    auto resolve_base(const EntryDelta& delta, const std::optional<StoredEntry>& stored) const
        -> std::optional<TranslationEntry>;

private:
    struct Plan {
        ApplyReport report;
        std::vector<EntryWrite> writes;
    };

    auto plan(std::span<const EntryDelta> deltas, const ApplyOptions& options) const -> Plan;

    EntryStore& entries_;
    ObjectStore& objects_;
    MergeEngine engine_;
    OverrideChainProcessor overrides_;
    OverrideLookup lookup_;
};

}  // namespace l10n_sync
