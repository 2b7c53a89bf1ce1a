/// @file memory_store.hpp
/// @brief In-memory store implementations for tests, examples and embedding.

#pragma once

#include <l10n-sync/store.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace l10n_sync {

class InMemoryObjectStore : public ObjectStore {
public:
    auto put(std::vector<std::byte> bytes) -> Cid override;
    void put(const Cid& cid, std::vector<std::byte> bytes) override;
    auto get(const Cid& cid) const -> std::shared_ptr<const std::vector<std::byte>> override;
    auto contains(const Cid& cid) const -> bool override;
    auto list() const -> std::vector<Cid> override;
    auto size() const -> std::size_t override;

    /// Total bytes held.
    auto size_bytes() const -> std::uint64_t;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<Cid, std::shared_ptr<const std::vector<std::byte>>> objects_;
};

class InMemoryEntryStore : public EntryStore {
public:
    auto get(std::string_view uid) const -> std::optional<StoredEntry> override;
    auto find_by_uida_hash(std::string_view uida_hash) const -> std::vector<StoredEntry> override;
    auto live_entries() const -> std::vector<StoredEntry> override;
    auto commit_batch(std::span<const EntryWrite> writes,
                      std::optional<PayloadRecord> record) -> CommitOutcome override;
    auto committed_payload(const Cid& payload_cid) const -> std::optional<PayloadRecord> override;
    auto prune_payload_records(Timestamp before) -> std::size_t override;
    auto payload_record_count() const -> std::size_t override;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, StoredEntry, std::less<>> entries_;
    std::unordered_map<Cid, PayloadRecord> payloads_;
};

class InMemoryOutboxStore : public OutboxStore {
public:
    auto append(std::string_view client_id, EntryDelta delta, Timestamp created_at)
        -> std::uint64_t override;
    auto pending(std::string_view client_id, std::size_t limit) const
        -> std::vector<OutboxEntry> override;
    void remove(std::span<const std::uint64_t> sequences) override;
    auto size() const -> std::size_t override;
    auto size(std::string_view client_id) const -> std::size_t override;

private:
    mutable std::shared_mutex mutex_;
    std::uint64_t next_sequence_{1};
    std::deque<OutboxEntry> entries_;
};

}  // namespace l10n_sync
