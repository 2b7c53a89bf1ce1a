/// @file sync_client.hpp
/// @brief Client side of the sync protocol and the offline outbox.
///
/// Local edits land in the local entry store immediately and queue in the
/// outbox. sync() later runs one session: handshake, download of what the
/// hub has and the client lacks, local merge of downloaded payloads, then
/// the outbox pushed in order. Outbox entries leave the queue only after
/// the hub confirms their commit.

#pragma once

#include <l10n-sync/chunk_transfer.hpp>
#include <l10n-sync/config.hpp>
#include <l10n-sync/entry_delta.hpp>
#include <l10n-sync/error.hpp>
#include <l10n-sync/merge.hpp>
#include <l10n-sync/protocol.hpp>
#include <l10n-sync/store.hpp>
#include <l10n-sync/translation_entry.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace l10n_sync {

class SyncHub;

/// Boundary between a client and the hub. Implementations may block;
/// SyncClient holds no lock while calling them.
class SyncTransport {
public:
    virtual ~SyncTransport() = default;

    virtual auto handshake(const HandshakeRequest& request) -> HandshakeResponse = 0;
    virtual auto upload_chunk(const ChunkMessage& chunk) -> ChunkAck = 0;
    virtual auto download_chunk(const ChunkRequest& request) -> ChunkMessage = 0;
    virtual auto commit(const CommitRequest& request) -> CommitResponse = 0;
    virtual auto complete_session(std::string_view session_id) -> SessionStatusResponse = 0;
    virtual auto cancel_session(std::string_view session_id) -> SessionStatusResponse = 0;
};

/// In-process transport straight into a SyncHub.
class LocalTransport : public SyncTransport {
public:
    explicit LocalTransport(SyncHub& hub) : hub_{hub} {}

    auto handshake(const HandshakeRequest& request) -> HandshakeResponse override;
    auto upload_chunk(const ChunkMessage& chunk) -> ChunkAck override;
    auto download_chunk(const ChunkRequest& request) -> ChunkMessage override;
    auto commit(const CommitRequest& request) -> CommitResponse override;
    auto complete_session(std::string_view session_id) -> SessionStatusResponse override;
    auto cancel_session(std::string_view session_id) -> SessionStatusResponse override;

private:
    SyncHub& hub_;
};

struct ClientServices {
    std::shared_ptr<ObjectStore> objects;
    std::shared_ptr<EntryStore> entries;
    std::shared_ptr<OutboxStore> outbox;
    std::shared_ptr<SyncTransport> transport;
    Clock clock = system_now;
};

/// Outcome of one sync() run.
struct SyncReport {
    std::string session_id;
    bool completed{false};
    bool cancelled{false};
    bool full_resync_recommended{false};

    std::size_t objects_downloaded{0};
    std::size_t payloads_applied{0};     ///< Downloaded payloads merged locally.
    std::size_t payloads_rejected{0};    ///< Downloaded payloads that failed to decode.
    std::size_t local_conflicts{0};      ///< Conflicts from merging downloaded payloads.

    std::size_t payloads_pushed{0};
    std::size_t deltas_pushed{0};
    std::size_t outbox_remaining{0};
    std::vector<CommitResponse> commits;

    std::optional<Error> error;          ///< Set when the run stopped early.
};

class SyncClient {
public:
    /// Throws ConfigError for an invalid config and std::invalid_argument
    /// for a missing store or transport.
    SyncClient(std::string client_id, SyncConfig config, ClientServices services);

    SyncClient(const SyncClient&) = delete;
    auto operator=(const SyncClient&) -> SyncClient& = delete;

    /// Apply an edit to the local store and queue it for the hub. A delete
    /// leaves a tombstone. Returns the outbox sequence number.
    auto record_local_edit(const TranslationEntry& entry, DeltaOperation operation)
        -> std::uint64_t;

    /// Run one session. Failures are reported in SyncReport::error and
    /// leave the unpushed part of the outbox intact. A stop request cancels
    /// the session at the next chunk or payload boundary.
    auto sync(std::stop_token stop = {}) -> SyncReport;

    auto pending_changes() const -> std::size_t;
    auto client_id() const -> const std::string& { return client_id_; }
    auto config() const -> const SyncConfig& { return config_; }

private:
    auto build_filter() const -> std::vector<std::byte>;
    auto download_object(const std::string& session_id, const Cid& cid, std::stop_token stop)
        -> bool;
    void apply_downloaded(const std::string& session_id, const std::vector<Cid>& cids,
                          SyncReport& report);
    void push_outbox(const std::string& session_id, std::size_t chunk_size,
                     std::stop_token stop, SyncReport& report);
    auto next_session_id() -> std::string;

    std::string client_id_;
    SyncConfig config_;
    ClientServices services_;
    MergeEngine engine_;
    std::uint64_t session_counter_{0};
};

}  // namespace l10n_sync
