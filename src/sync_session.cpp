#include <l10n-sync/sync_session.hpp>

#include <l10n-sync/error.hpp>

#include <spdlog/spdlog.h>

#include <array>
#include <iterator>
#include <utility>

namespace l10n_sync {

auto parse_session_status(std::string_view s) -> std::optional<SessionStatus> {
    static constexpr auto all = std::array{
        SessionStatus::pending,   SessionStatus::active,  SessionStatus::completed,
        SessionStatus::failed,    SessionStatus::expired, SessionStatus::cancelled,
    };
    for (auto status : all) {
        if (to_string_view(status) == s) return status;
    }
    return std::nullopt;
}

SessionManager::SessionManager(std::chrono::milliseconds ttl, std::size_t archive_limit,
                               Clock clock)
    : ttl_{ttl}, archive_limit_{archive_limit}, clock_{std::move(clock)} {}

void SessionManager::set_terminal_listener(TerminalListener listener) {
    auto lock = std::scoped_lock{mutex_};
    listener_ = std::move(listener);
}

auto SessionManager::create(std::string session_id, std::string client_id,
                            std::size_t chunk_size) -> SyncSession {
    auto now = clock_();
    auto lock = std::scoped_lock{mutex_};
    if (live_.contains(session_id) || archive_.contains(session_id)) {
        throw InvalidSessionStateError{session_id, "session id " + session_id + " already used"};
    }
    auto session = SyncSession{
        .session_id = session_id,
        .client_id = std::move(client_id),
        .status = SessionStatus::pending,
        .created_at = now,
        .expires_at = now + ttl_,
        .finished_at = std::nullopt,
        .chunk_size = chunk_size,
        .failure_reason = {},
        .stats = {},
    };
    live_.emplace(std::move(session_id), session);
    SPDLOG_DEBUG("session {} created for client {}", session.session_id, session.client_id);
    return session;
}

void SessionManager::activate(std::string_view session_id) {
    auto lock = std::scoped_lock{mutex_};
    auto it = live_.find(session_id);
    if (it == live_.end()) throw SessionNotFoundError{std::string{session_id}};
    if (it->second.status != SessionStatus::pending) {
        throw InvalidSessionStateError{
            std::string{session_id},
            "cannot activate session in state " + std::string{to_string_view(it->second.status)}};
    }
    it->second.status = SessionStatus::active;
}

auto SessionManager::require_active(std::string_view session_id) -> SyncSession {
    auto now = clock_();
    auto finished = std::vector<SyncSession>{};
    {
        auto lock = std::scoped_lock{mutex_};
        auto it = live_.find(session_id);
        if (it == live_.end()) {
            auto archived = archive_.find(session_id);
            if (archived == archive_.end()) throw SessionNotFoundError{std::string{session_id}};
            if (archived->second.status == SessionStatus::expired) {
                throw SessionExpiredError{std::string{session_id}};
            }
            throw InvalidSessionStateError{
                std::string{session_id},
                "session is " + std::string{to_string_view(archived->second.status)}};
        }
        if (it->second.is_expired_at(now)) {
            finished.push_back(finish_locked(it, SessionStatus::expired, "session ttl elapsed"));
        } else if (it->second.status != SessionStatus::active) {
            throw InvalidSessionStateError{
                std::string{session_id},
                "session is " + std::string{to_string_view(it->second.status)}};
        } else {
            return it->second;
        }
    }
    notify(finished);
    throw SessionExpiredError{std::string{session_id}};
}

void SessionManager::complete(std::string_view session_id) {
    auto finished = std::vector<SyncSession>{};
    {
        auto lock = std::scoped_lock{mutex_};
        auto it = live_.find(session_id);
        if (it == live_.end()) throw SessionNotFoundError{std::string{session_id}};
        if (it->second.status != SessionStatus::active) {
            throw InvalidSessionStateError{
                std::string{session_id},
                "cannot complete session in state " +
                    std::string{to_string_view(it->second.status)}};
        }
        finished.push_back(finish_locked(it, SessionStatus::completed, {}));
    }
    notify(finished);
}

void SessionManager::fail(std::string_view session_id, std::string reason) {
    auto finished = std::vector<SyncSession>{};
    {
        auto lock = std::scoped_lock{mutex_};
        auto it = live_.find(session_id);
        if (it == live_.end()) throw SessionNotFoundError{std::string{session_id}};
        SPDLOG_WARN("session {} failed: {}", session_id, reason);
        finished.push_back(finish_locked(it, SessionStatus::failed, std::move(reason)));
    }
    notify(finished);
}

void SessionManager::cancel(std::string_view session_id) {
    auto finished = std::vector<SyncSession>{};
    {
        auto lock = std::scoped_lock{mutex_};
        auto it = live_.find(session_id);
        if (it == live_.end()) throw SessionNotFoundError{std::string{session_id}};
        finished.push_back(finish_locked(it, SessionStatus::cancelled, "cancelled by client"));
    }
    notify(finished);
}

auto SessionManager::sweep_expired() -> std::vector<std::string> {
    auto now = clock_();
    auto finished = std::vector<SyncSession>{};
    {
        auto lock = std::scoped_lock{mutex_};
        for (auto it = live_.begin(); it != live_.end();) {
            auto next = std::next(it);
            if (it->second.is_expired_at(now)) {
                finished.push_back(finish_locked(it, SessionStatus::expired, "session ttl elapsed"));
            }
            it = next;
        }
    }
    notify(finished);

    auto ids = std::vector<std::string>{};
    ids.reserve(finished.size());
    for (const auto& s : finished) ids.push_back(s.session_id);
    if (!ids.empty()) SPDLOG_INFO("expired {} idle sessions", ids.size());
    return ids;
}

auto SessionManager::expire_if_due(std::string_view session_id) -> bool {
    auto now = clock_();
    auto finished = std::vector<SyncSession>{};
    {
        auto lock = std::scoped_lock{mutex_};
        auto it = live_.find(session_id);
        if (it == live_.end() || !it->second.is_expired_at(now)) return false;
        finished.push_back(finish_locked(it, SessionStatus::expired, "session ttl elapsed"));
    }
    notify(finished);
    return true;
}

auto SessionManager::status(std::string_view session_id) const -> std::optional<SyncSession> {
    auto lock = std::scoped_lock{mutex_};
    if (auto it = live_.find(session_id); it != live_.end()) return it->second;
    if (auto it = archive_.find(session_id); it != archive_.end()) return it->second;
    return std::nullopt;
}

void SessionManager::update_stats(std::string_view session_id,
                                  const std::function<void(SessionStats&)>& fn) {
    auto lock = std::scoped_lock{mutex_};
    auto it = live_.find(session_id);
    if (it != live_.end()) fn(it->second.stats);
}

auto SessionManager::live_count() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return live_.size();
}

auto SessionManager::archived_count() const -> std::size_t {
    auto lock = std::scoped_lock{mutex_};
    return archive_.size();
}

auto SessionManager::finish_locked(std::map<std::string, SyncSession, std::less<>>::iterator it,
                                   SessionStatus status, std::string reason) -> SyncSession {
    auto node = live_.extract(it);
    auto& session = node.mapped();
    session.status = status;
    session.finished_at = clock_();
    session.failure_reason = std::move(reason);
    auto result = session;

    archive_order_.push_back(session.session_id);
    archive_.insert(std::move(node));
    while (archive_.size() > archive_limit_ && !archive_order_.empty()) {
        archive_.erase(archive_order_.front());
        archive_order_.pop_front();
    }
    SPDLOG_INFO("session {} is {}", result.session_id, to_string_view(status));
    return result;
}

void SessionManager::notify(const std::vector<SyncSession>& finished) const {
    if (finished.empty()) return;
    auto listener = TerminalListener{};
    {
        auto lock = std::scoped_lock{mutex_};
        listener = listener_;
    }
    if (!listener) return;
    for (const auto& s : finished) listener(s);
}

}  // namespace l10n_sync
