/// @file store.hpp
/// @brief Storage seams: content objects, entries with idempotency
/// records, and the client outbox.
///
/// The sync core talks to persistence only through these interfaces.
/// Implementations must be safe for concurrent use from several sessions.

#pragma once

#include <l10n-sync/entry_delta.hpp>
#include <l10n-sync/translation_entry.hpp>
#include <l10n-sync/types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace l10n_sync {

// -- Objects ------------------------------------------------------------------

/// Immutable bytes keyed by their Cid.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    /// Store bytes under their computed Cid. Storing identical bytes twice
    /// keeps one copy.
    virtual auto put(std::vector<std::byte> bytes) -> Cid = 0;

    /// Store bytes under an expected Cid. Throws IntegrityError if the
    /// bytes hash to something else.
    virtual void put(const Cid& cid, std::vector<std::byte> bytes) = 0;

    /// Shared, never-mutated view of the object; null if absent.
    virtual auto get(const Cid& cid) const -> std::shared_ptr<const std::vector<std::byte>> = 0;

    virtual auto contains(const Cid& cid) const -> bool = 0;

    /// Every stored Cid, sorted.
    virtual auto list() const -> std::vector<Cid> = 0;

    virtual auto size() const -> std::size_t = 0;
};

// -- Entries ------------------------------------------------------------------

/// An entry as persisted, with the bookkeeping the optimistic commit uses.
struct StoredEntry {
    std::string uid;
    std::optional<TranslationEntry> entry;  ///< nullopt: deleted (tombstone).
    std::uint64_t revision{0};              ///< Bumped on every write.
    std::optional<Cid> last_payload_cid;    ///< Payload that last wrote this entry.
    std::optional<Cid> version_cid;         ///< entry_version_cid of the live state.

    auto is_deleted() const -> bool { return !entry.has_value(); }
};

/// One entry write inside an atomic batch.
struct EntryWrite {
    std::string uid;
    std::optional<TranslationEntry> entry;  ///< nullopt deletes the entry.
    std::uint64_t expected_revision{0};     ///< 0: the uid must be unknown.
};

/// Idempotency record: what a committed payload produced.
struct PayloadRecord {
    Cid payload_cid;
    std::string session_id;
    Timestamp committed_at{};
    nlohmann::json response = nlohmann::json::object();  ///< Recorded commit response.
};

enum class CommitOutcome : std::uint8_t {
    committed,
    already_committed,  ///< The payload Cid had a record; nothing was written.
};

class EntryStore {
public:
    virtual ~EntryStore() = default;

    /// Live entry or tombstone; nullopt if the uid was never written.
    virtual auto get(std::string_view uid) const -> std::optional<StoredEntry> = 0;

    virtual auto find_by_uida_hash(std::string_view uida_hash) const
        -> std::vector<StoredEntry> = 0;

    /// Every live entry, ordered by uid.
    virtual auto live_entries() const -> std::vector<StoredEntry> = 0;

    /// Apply every write and the payload record atomically. Throws
    /// ConcurrentCommitError (naming the session of record, if any) when
    /// any expected revision is stale; nothing is written in that case.
    virtual auto commit_batch(std::span<const EntryWrite> writes,
                              std::optional<PayloadRecord> record) -> CommitOutcome = 0;

    virtual auto committed_payload(const Cid& payload_cid) const
        -> std::optional<PayloadRecord> = 0;

    /// Drop idempotency records committed before the cutoff. Returns the
    /// number dropped.
    virtual auto prune_payload_records(Timestamp before) -> std::size_t = 0;

    virtual auto payload_record_count() const -> std::size_t = 0;
};

// -- Outbox -------------------------------------------------------------------

/// A local change waiting to be pushed.
struct OutboxEntry {
    std::uint64_t sequence{0};  ///< Strictly increasing per store.
    std::string client_id;
    EntryDelta delta;
    Timestamp created_at{};

    auto operator==(const OutboxEntry&) const -> bool = default;
};

/// FIFO of pending changes, per client.
class OutboxStore {
public:
    virtual ~OutboxStore() = default;

    /// Returns the assigned sequence number.
    virtual auto append(std::string_view client_id, EntryDelta delta, Timestamp created_at)
        -> std::uint64_t = 0;

    /// Oldest first, at most limit entries.
    virtual auto pending(std::string_view client_id, std::size_t limit) const
        -> std::vector<OutboxEntry> = 0;

    /// Remove confirmed entries. Unknown sequences are ignored.
    virtual void remove(std::span<const std::uint64_t> sequences) = 0;

    virtual auto size() const -> std::size_t = 0;
    virtual auto size(std::string_view client_id) const -> std::size_t = 0;
};

}  // namespace l10n_sync
