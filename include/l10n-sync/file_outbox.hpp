/// @file file_outbox.hpp
/// @brief Durable outbox backed by a JSON-lines file.
///
/// Every mutation rewrites the file through a temporary sibling and a
/// rename, so a crash leaves either the old or the new queue on disk,
/// never a torn one.

#pragma once

#include <l10n-sync/store.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace l10n_sync {

class FileOutboxStore : public OutboxStore {
public:
    /// Open (or create) the outbox at path. Throws StorageError if an
    /// existing file cannot be read or holds a malformed line.
    explicit FileOutboxStore(std::filesystem::path path);

    auto append(std::string_view client_id, EntryDelta delta, Timestamp created_at)
        -> std::uint64_t override;
    auto pending(std::string_view client_id, std::size_t limit) const
        -> std::vector<OutboxEntry> override;
    void remove(std::span<const std::uint64_t> sequences) override;
    auto size() const -> std::size_t override;
    auto size(std::string_view client_id) const -> std::size_t override;

    auto path() const -> const std::filesystem::path& { return path_; }

private:
    void load();
    void persist(const std::deque<OutboxEntry>& entries) const;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
    std::uint64_t next_sequence_{1};
    std::deque<OutboxEntry> entries_;
};

}  // namespace l10n_sync
