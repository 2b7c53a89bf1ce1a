#include <l10n-sync/memory_store.hpp>

#include <l10n-sync/content_address.hpp>
#include <l10n-sync/error.hpp>

#include <algorithm>
#include <mutex>
#include <unordered_set>
#include <utility>

namespace l10n_sync {

// -- InMemoryObjectStore ------------------------------------------------------

auto InMemoryObjectStore::put(std::vector<std::byte> bytes) -> Cid {
    auto cid = compute_cid(bytes);
    auto lock = std::unique_lock{mutex_};
    if (!objects_.contains(cid)) {
        objects_.emplace(cid, std::make_shared<const std::vector<std::byte>>(std::move(bytes)));
    }
    return cid;
}

void InMemoryObjectStore::put(const Cid& cid, std::vector<std::byte> bytes) {
    if (!verify_cid(bytes, cid)) {
        throw IntegrityError{"object bytes do not match their cid",
                             ErrorContext{.cid = to_string(cid)}};
    }
    auto lock = std::unique_lock{mutex_};
    if (!objects_.contains(cid)) {
        objects_.emplace(cid, std::make_shared<const std::vector<std::byte>>(std::move(bytes)));
    }
}

auto InMemoryObjectStore::get(const Cid& cid) const
    -> std::shared_ptr<const std::vector<std::byte>> {
    auto lock = std::shared_lock{mutex_};
    auto it = objects_.find(cid);
    return it == objects_.end() ? nullptr : it->second;
}

auto InMemoryObjectStore::contains(const Cid& cid) const -> bool {
    auto lock = std::shared_lock{mutex_};
    return objects_.contains(cid);
}

auto InMemoryObjectStore::list() const -> std::vector<Cid> {
    auto result = std::vector<Cid>{};
    {
        auto lock = std::shared_lock{mutex_};
        result.reserve(objects_.size());
        for (const auto& [cid, _] : objects_) result.push_back(cid);
    }
    std::ranges::sort(result);
    return result;
}

auto InMemoryObjectStore::size() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return objects_.size();
}

auto InMemoryObjectStore::size_bytes() const -> std::uint64_t {
    auto lock = std::shared_lock{mutex_};
    auto total = std::uint64_t{0};
    for (const auto& [_, bytes] : objects_) total += bytes->size();
    return total;
}

// -- InMemoryEntryStore -------------------------------------------------------

auto InMemoryEntryStore::get(std::string_view uid) const -> std::optional<StoredEntry> {
    auto lock = std::shared_lock{mutex_};
    auto it = entries_.find(uid);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

auto InMemoryEntryStore::find_by_uida_hash(std::string_view uida_hash) const
    -> std::vector<StoredEntry> {
    auto lock = std::shared_lock{mutex_};
    auto result = std::vector<StoredEntry>{};
    for (const auto& [_, stored] : entries_) {
        if (stored.entry && stored.entry->uida_hash == uida_hash) result.push_back(stored);
    }
    return result;
}

auto InMemoryEntryStore::live_entries() const -> std::vector<StoredEntry> {
    auto lock = std::shared_lock{mutex_};
    auto result = std::vector<StoredEntry>{};
    for (const auto& [_, stored] : entries_) {
        if (stored.entry) result.push_back(stored);
    }
    return result;
}

auto InMemoryEntryStore::commit_batch(std::span<const EntryWrite> writes,
                                      std::optional<PayloadRecord> record) -> CommitOutcome {
    auto lock = std::unique_lock{mutex_};

    if (record && payloads_.contains(record->payload_cid)) {
        return CommitOutcome::already_committed;
    }

    const auto session = record ? record->session_id : std::string{};
    auto seen = std::unordered_set<std::string_view>{};
    for (const auto& w : writes) {
        if (!seen.insert(w.uid).second) {
            throw ConcurrentCommitError{session, "entry " + w.uid + " written twice in one batch"};
        }
        auto it = entries_.find(w.uid);
        auto current = it == entries_.end() ? std::uint64_t{0} : it->second.revision;
        if (current != w.expected_revision) {
            throw ConcurrentCommitError{
                session, "entry " + w.uid + " is at revision " + std::to_string(current) +
                         ", expected " + std::to_string(w.expected_revision)};
        }
    }

    for (const auto& w : writes) {
        auto& stored = entries_[w.uid];
        stored.uid = w.uid;
        stored.entry = w.entry;
        stored.revision += 1;
        stored.version_cid = w.entry ? std::optional<Cid>{entry_version_cid(*w.entry)}
                                     : std::nullopt;
        if (record) stored.last_payload_cid = record->payload_cid;
    }
    if (record) payloads_.insert_or_assign(record->payload_cid, std::move(*record));
    return CommitOutcome::committed;
}

auto InMemoryEntryStore::committed_payload(const Cid& payload_cid) const
    -> std::optional<PayloadRecord> {
    auto lock = std::shared_lock{mutex_};
    auto it = payloads_.find(payload_cid);
    if (it == payloads_.end()) return std::nullopt;
    return it->second;
}

auto InMemoryEntryStore::prune_payload_records(Timestamp before) -> std::size_t {
    auto lock = std::unique_lock{mutex_};
    return std::erase_if(payloads_, [&](const auto& kv) {
        return kv.second.committed_at < before;
    });
}

auto InMemoryEntryStore::payload_record_count() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return payloads_.size();
}

// -- InMemoryOutboxStore ------------------------------------------------------

auto InMemoryOutboxStore::append(std::string_view client_id, EntryDelta delta,
                                 Timestamp created_at) -> std::uint64_t {
    auto lock = std::unique_lock{mutex_};
    auto seq = next_sequence_++;
    entries_.push_back(OutboxEntry{
        .sequence = seq,
        .client_id = std::string{client_id},
        .delta = std::move(delta),
        .created_at = created_at,
    });
    return seq;
}

auto InMemoryOutboxStore::pending(std::string_view client_id, std::size_t limit) const
    -> std::vector<OutboxEntry> {
    auto lock = std::shared_lock{mutex_};
    auto result = std::vector<OutboxEntry>{};
    for (const auto& e : entries_) {
        if (result.size() >= limit) break;
        if (e.client_id == client_id) result.push_back(e);
    }
    return result;
}

void InMemoryOutboxStore::remove(std::span<const std::uint64_t> sequences) {
    auto lock = std::unique_lock{mutex_};
    auto doomed = std::unordered_set<std::uint64_t>(sequences.begin(), sequences.end());
    std::erase_if(entries_, [&](const OutboxEntry& e) { return doomed.contains(e.sequence); });
}

auto InMemoryOutboxStore::size() const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return entries_.size();
}

auto InMemoryOutboxStore::size(std::string_view client_id) const -> std::size_t {
    auto lock = std::shared_lock{mutex_};
    return static_cast<std::size_t>(std::ranges::count_if(
        entries_, [&](const OutboxEntry& e) { return e.client_id == client_id; }));
}

}  // namespace l10n_sync
