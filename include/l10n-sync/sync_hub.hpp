/// @file sync_hub.hpp
/// @brief Server side of the sync protocol.
///
/// A SyncHub owns the session table and drives handshake, chunk transfer
/// and commit against injected stores. Every operation on one session is
/// serialized by that session's mutex; different sessions proceed in
/// parallel. Nothing here is a process-wide singleton: executor, pool,
/// stores, locks, metrics sink and clock are all supplied by the caller.
///
/// @code
/// auto hub = l10n_sync::SyncHub{config, l10n_sync::HubServices{
///     .objects = std::make_shared<l10n_sync::InMemoryObjectStore>(),
///     .entries = std::make_shared<l10n_sync::InMemoryEntryStore>(),
/// }};
/// auto reply = hub.handshake(request);
/// @endcode

#pragma once

#include <l10n-sync/bloom_filter.hpp>
#include <l10n-sync/chunk_transfer.hpp>
#include <l10n-sync/config.hpp>
#include <l10n-sync/merge.hpp>
#include <l10n-sync/metrics.hpp>
#include <l10n-sync/override_chain.hpp>
#include <l10n-sync/protocol.hpp>
#include <l10n-sync/resource_lock.hpp>
#include <l10n-sync/store.hpp>
#include <l10n-sync/sync_session.hpp>
#include <l10n-sync/thread_pool.hpp>
#include <l10n-sync/types.hpp>

#include <taskflow/taskflow.hpp>

#include <cstddef>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace l10n_sync {

/// Collaborators of a SyncHub. objects and entries are required; the
/// rest may be null (no executor scans inline, no pool runs async calls
/// on the caller's thread, no lock manager means a private one).
struct HubServices {
    std::shared_ptr<ObjectStore> objects;
    std::shared_ptr<EntryStore> entries;
    std::shared_ptr<tf::Executor> executor;
    std::shared_ptr<thread_pool> pool;
    std::shared_ptr<MetricsSink> metrics;
    std::shared_ptr<ResourceLockManager> locks;
    Clock clock = system_now;
};

struct HubStatistics {
    std::size_t live_sessions{0};
    std::size_t archived_sessions{0};
    std::size_t objects{0};
    std::size_t payload_records{0};
    std::size_t overrides{0};
};

class SyncHub {
public:
    /// Throws ConfigError if config is invalid and std::invalid_argument
    /// if a required store is missing.
    SyncHub(SyncConfig config, HubServices services);
    ~SyncHub();

    SyncHub(const SyncHub&) = delete;
    auto operator=(const SyncHub&) -> SyncHub& = delete;

    // -- Protocol ----------------------------------------------------------

    /// Decode the client's filter, find the hub objects it lacks, and open
    /// an active session. Throws MalformedPayloadError for an undecodable
    /// filter and InvalidSessionStateError for an unsupported protocol
    /// version or a reused session id.
    auto handshake(const HandshakeRequest& request) -> HandshakeResponse;

    /// Verify and buffer one chunk. Integrity failures come back as a
    /// rejected ChunkAck and leave the session active; an expired session
    /// throws SessionExpiredError.
    auto upload_chunk(const ChunkMessage& chunk) -> ChunkAck;

    /// Serve one chunk of a stored object. Throws ObjectNotFoundError for
    /// an unknown Cid and std::out_of_range for a bad index.
    auto download_chunk(const ChunkRequest& request) -> ChunkMessage;

    /// Apply a delta payload.
    ///
    /// The payload comes inline or from chunks uploaded in this session,
    /// and must hash to payload_cid. A payload committed before returns its
    /// recorded response and applies nothing. A malformed payload throws
    /// MalformedPayloadError and leaves the session active. When the
    /// optimistic commit stays stale after max_commit_retries the session
    /// fails and ConcurrentCommitError is thrown.
    auto commit(const CommitRequest& request) -> CommitResponse;

    auto complete_session(std::string_view session_id) -> SessionStatusResponse;

    /// Allowed until the session completes. Objects already verified stay
    /// in the object store; buffered chunks are dropped.
    auto cancel_session(std::string_view session_id) -> SessionStatusResponse;

    /// Throws SessionNotFoundError for unknown or evicted sessions.
    auto session_status(std::string_view session_id) const -> SessionStatusResponse;

    auto sweep_expired_sessions() -> std::vector<std::string>;

    // -- Async -------------------------------------------------------------

    auto async_upload_chunk(ChunkMessage chunk) -> std::future<ChunkAck>;
    auto async_commit(CommitRequest request) -> std::future<CommitResponse>;

    // -- Maintenance -------------------------------------------------------

    /// Drop idempotency records older than the configured retention, under
    /// the "idempotency-log" maintenance lock. Throws ResourceBusyError if
    /// another owner is compacting.
    auto compact_idempotency_log(std::string_view owner = "sync-hub") -> std::size_t;

    /// Register a claim consulted for locked fields on every commit.
    void register_override(TranslationOverride claim);
    void clear_overrides();
    auto validate_overrides() const -> std::vector<OverrideIssue>;

    auto statistics() const -> HubStatistics;
    auto config() const -> const SyncConfig& { return config_; }
    auto lock_manager() const -> ResourceLockManager& { return *services_.locks; }

private:
    struct SessionState;

    auto state_for(std::string_view session_id) const -> std::shared_ptr<SessionState>;
    auto find_state(std::string_view session_id) const -> std::shared_ptr<SessionState>;
    auto scan_missing(const BloomFilter& filter) const -> std::vector<Cid>;
    auto load_payload(const CommitRequest& request, SessionState& state) const
        -> std::vector<std::byte>;
    auto replay(const PayloadRecord& record, std::string_view session_id) -> CommitResponse;
    auto overrides_for(std::string_view key, std::string_view locale) const
        -> std::vector<TranslationOverride>;
    void on_session_finished(const SyncSession& session);
    void report_error(ErrorKind kind, std::string_view session_id);

    SyncConfig config_;
    HubServices services_;
    SessionManager sessions_;
    MergeEngine engine_;
    OverrideChainProcessor override_processor_;

    mutable std::mutex states_mutex_;
    std::map<std::string, std::shared_ptr<SessionState>, std::less<>> states_;

    mutable std::mutex overrides_mutex_;
    std::vector<TranslationOverride> overrides_;
};

auto to_status_response(const SyncSession& session) -> SessionStatusResponse;

}  // namespace l10n_sync
