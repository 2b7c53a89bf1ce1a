/// @file sync_session.hpp
/// @brief Sync session state machine with TTL expiry and statistics.
///
/// A session moves pending -> active -> {completed | failed | expired},
/// or to cancelled from pending or active. Terminal sessions leave the
/// live table and are kept in a bounded archive so their final status
/// can still be queried.

#pragma once

#include <l10n-sync/types.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace l10n_sync {

enum class SessionStatus : std::uint8_t {
    pending,
    active,
    completed,
    failed,
    expired,
    cancelled,
};

constexpr auto to_string_view(SessionStatus s) noexcept -> std::string_view {
    switch (s) {
        case SessionStatus::pending:   return "pending";
        case SessionStatus::active:    return "active";
        case SessionStatus::completed: return "completed";
        case SessionStatus::failed:    return "failed";
        case SessionStatus::expired:   return "expired";
        case SessionStatus::cancelled: return "cancelled";
    }
    return "unknown";
}

auto parse_session_status(std::string_view s) -> std::optional<SessionStatus>;

constexpr auto is_terminal(SessionStatus s) noexcept -> bool {
    return s != SessionStatus::pending && s != SessionStatus::active;
}

/// Per-session counters. Durations are milliseconds.
struct SessionStats {
    std::int64_t handshake_latency_ms{0};
    std::uint64_t missing_cids{0};        ///< Objects the handshake reported missing.

    std::uint64_t chunks_received{0};
    std::uint64_t chunks_rejected{0};
    std::uint64_t chunks_sent{0};
    std::uint64_t largest_chunk_bytes{0};
    std::int64_t chunk_time_ms{0};        ///< Sum over received chunks.
    std::uint64_t objects_received{0};

    std::uint64_t bytes_received{0};
    std::uint64_t bytes_sent{0};

    std::uint64_t payloads_committed{0};
    std::uint64_t payloads_replayed{0};
    std::uint64_t entries_processed{0};
    std::uint64_t clean_merges{0};
    std::uint64_t conflicted_merges{0};
    std::uint64_t errors{0};

    auto operator==(const SessionStats&) const -> bool = default;
};

struct SyncSession {
    std::string session_id;
    std::string client_id;
    SessionStatus status{SessionStatus::pending};
    Timestamp created_at{};
    Timestamp expires_at{};
    std::optional<Timestamp> finished_at;
    std::size_t chunk_size{0};
    std::string failure_reason;
    SessionStats stats;

    auto is_terminal() const -> bool { return l10n_sync::is_terminal(status); }
    auto is_expired_at(Timestamp now) const -> bool { return now >= expires_at; }

    auto operator==(const SyncSession&) const -> bool = default;
};

/// Owns every session and decides its state transitions.
///
/// All methods are thread-safe. The terminal listener runs after the
/// manager's own lock is released, so it may call back into the manager.
class SessionManager {
public:
    using TerminalListener = std::function<void(const SyncSession&)>;

    explicit SessionManager(std::chrono::milliseconds ttl,
                            std::size_t archive_limit = 1000,
                            Clock clock = system_now);

    SessionManager(const SessionManager&) = delete;
    auto operator=(const SessionManager&) -> SessionManager& = delete;

    /// Called once for every session that reaches a terminal state.
    void set_terminal_listener(TerminalListener listener);

    /// Register a pending session. Throws InvalidSessionStateError if the
    /// id is already in use (live or archived).
    auto create(std::string session_id, std::string client_id, std::size_t chunk_size)
        -> SyncSession;

    /// pending -> active.
    void activate(std::string_view session_id);

    /// Return the session if it is active and within its TTL.
    ///
    /// Throws SessionNotFoundError for unknown ids, SessionExpiredError if
    /// the TTL has passed (the session is marked expired first), and
    /// InvalidSessionStateError for any other state.
    auto require_active(std::string_view session_id) -> SyncSession;

    void complete(std::string_view session_id);
    void fail(std::string_view session_id, std::string reason);

    /// Allowed from pending or active.
    void cancel(std::string_view session_id);

    /// Expire every live session past its TTL. Returns their ids.
    auto sweep_expired() -> std::vector<std::string>;

    /// Expire one live session if its TTL has passed. False if the
    /// session is unknown, already terminal, or still within its TTL.
    auto expire_if_due(std::string_view session_id) -> bool;

    /// Live or archived session; nullopt if unknown or evicted from the archive.
    auto status(std::string_view session_id) const -> std::optional<SyncSession>;

    /// Mutate a live session's statistics. No-op if the session is not live.
    void update_stats(std::string_view session_id, const std::function<void(SessionStats&)>& fn);

    auto live_count() const -> std::size_t;
    auto archived_count() const -> std::size_t;
    auto ttl() const -> std::chrono::milliseconds { return ttl_; }
    auto now() const -> Timestamp { return clock_(); }

private:
    auto finish_locked(std::map<std::string, SyncSession, std::less<>>::iterator it,
                       SessionStatus status, std::string reason) -> SyncSession;
    void notify(const std::vector<SyncSession>& finished) const;

    std::chrono::milliseconds ttl_;
    std::size_t archive_limit_;
    Clock clock_;
    TerminalListener listener_;

    mutable std::mutex mutex_;
    std::map<std::string, SyncSession, std::less<>> live_;
    std::map<std::string, SyncSession, std::less<>> archive_;
    std::deque<std::string> archive_order_;
};

}  // namespace l10n_sync
