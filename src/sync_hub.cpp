#include <l10n-sync/sync_hub.hpp>

#include <l10n-sync/content_address.hpp>
#include <l10n-sync/delta_applier.hpp>
#include <l10n-sync/entry_delta.hpp>
#include <l10n-sync/error.hpp>
#include <l10n-sync/json.hpp>

#include <taskflow/algorithm/for_each.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>
#include <utility>

namespace l10n_sync {

namespace {

constexpr auto scan_block_size = std::size_t{4096};
constexpr auto idempotency_lock_name = "idempotency-log";

auto elapsed(Timestamp from, Timestamp to) -> std::chrono::milliseconds {
    return std::chrono::milliseconds{to.millis_since_epoch - from.millis_since_epoch};
}

// Run fn on the pool, or inline when there is none, and hand back a future.
template <typename R, typename Fn>
auto run_on(const std::shared_ptr<thread_pool>& pool, Fn fn) -> std::future<R> {
    if (pool) return pool->submit(std::move(fn));
    auto promise = std::promise<R>{};
    try {
        promise.set_value(fn());
    } catch (...) {
        promise.set_exception(std::current_exception());
    }
    return promise.get_future();
}

}  // namespace

/// Per-session scratch state: partially received objects.
struct SyncHub::SessionState {
    explicit SessionState(std::string id) : assembler{std::move(id)} {}

    std::mutex mutex;
    ChunkAssembler assembler;
};

auto to_status_response(const SyncSession& session) -> SessionStatusResponse {
    return SessionStatusResponse{
        .session_id = session.session_id,
        .client_id = session.client_id,
        .status = session.status,
        .expires_at = session.expires_at,
        .failure_reason = session.failure_reason,
        .stats = session.stats,
    };
}

SyncHub::SyncHub(SyncConfig config, HubServices services)
    : config_{std::move(config)},
      services_{std::move(services)},
      sessions_{config_.session_ttl, config_.session_archive_limit, services_.clock},
      engine_{services_.clock} {
    config_.validate();
    if (!services_.objects) throw std::invalid_argument{"SyncHub needs an object store"};
    if (!services_.entries) throw std::invalid_argument{"SyncHub needs an entry store"};
    if (!services_.locks) services_.locks = std::make_shared<ResourceLockManager>(services_.clock);

    sessions_.set_terminal_listener([this](const SyncSession& s) { on_session_finished(s); });
}

SyncHub::~SyncHub() {
    if (services_.pool) services_.pool->wait_for_tasks();
}

// -- Handshake ----------------------------------------------------------------

auto SyncHub::scan_missing(const BloomFilter& filter) const -> std::vector<Cid> {
    auto inventory = services_.objects->list();
    auto blocks = (inventory.size() + scan_block_size - 1) / scan_block_size;
    auto found = std::vector<std::vector<Cid>>(blocks);

    auto scan_block = [&](std::size_t b) {
        auto first = b * scan_block_size;
        auto last = std::min(first + scan_block_size, inventory.size());
        for (auto i = first; i < last; ++i) {
            if (!filter.might_contain(inventory[i])) found[b].push_back(inventory[i]);
        }
    };

    if (services_.executor && blocks > 1) {
        auto taskflow = tf::Taskflow{};
        taskflow.for_each_index(std::size_t{0}, blocks, std::size_t{1}, scan_block);
        services_.executor->run(taskflow).wait();
    } else {
        for (auto b = std::size_t{0}; b < blocks; ++b) scan_block(b);
    }

    auto missing = std::vector<Cid>{};
    for (auto& block : found) missing.insert(missing.end(), block.begin(), block.end());
    return missing;
}

auto SyncHub::handshake(const HandshakeRequest& request) -> HandshakeResponse {
    auto started = services_.clock();

    if (request.protocol_version != config_.protocol_version) {
        report_error(ErrorKind::invalid_session_state, request.session_id);
        throw InvalidSessionStateError{request.session_id,
                                       "unsupported protocol version " + request.protocol_version};
    }
    auto filter = BloomFilter::from_bytes(request.bloom_filter);
    if (!filter) {
        report_error(ErrorKind::malformed_payload, request.session_id);
        throw MalformedPayloadError{"bloom filter could not be decoded",
                                    ErrorContext{.session_id = request.session_id}};
    }

    auto session = sessions_.create(request.session_id, request.client_id, config_.chunk_size);
    {
        auto lock = std::scoped_lock{states_mutex_};
        states_.insert_or_assign(session.session_id,
                                 std::make_shared<SessionState>(session.session_id));
    }

    auto scanned = services_.objects->size();
    auto missing = scan_missing(*filter);
    auto fp_rate = filter->estimated_false_positive_rate();
    auto resync = fp_rate > config_.max_false_positive_rate;
    if (resync) {
        SPDLOG_WARN("session {}: client filter fp rate {:.4f} exceeds {:.4f}, full resync recommended",
                    session.session_id, fp_rate, config_.max_false_positive_rate);
    }

    sessions_.activate(session.session_id);
    auto latency = elapsed(started, services_.clock());
    sessions_.update_stats(session.session_id, [&](SessionStats& st) {
        st.handshake_latency_ms = latency.count();
        st.missing_cids = missing.size();
    });
    if (services_.metrics) {
        services_.metrics->on_handshake(HandshakeSample{
            .session_id = session.session_id,
            .latency = latency,
            .filter_bits = filter->bits(),
            .filter_inserted = filter->inserted_count(),
            .estimated_fp_rate = fp_rate,
            .objects_scanned = scanned,
            .missing_cids = missing.size(),
        });
    }
    SPDLOG_INFO("session {} opened for client {}: {} objects missing on the client",
                session.session_id, session.client_id, missing.size());

    return HandshakeResponse{
        .session_id = session.session_id,
        .protocol_version = config_.protocol_version,
        .missing_cids = std::move(missing),
        .session_expires_at = session.expires_at,
        .chunk_size = config_.chunk_size,
        .max_concurrent_chunks = config_.max_concurrent_chunks,
        .full_resync_recommended = resync,
        .capabilities = ServerCapabilities{
            .supported_versions = {config_.protocol_version},
            .max_chunk_size = config_.max_chunk_size,
            .max_concurrent_chunks = config_.max_concurrent_chunks,
            .compression = {"deflate"},
            .supports_resume = true,
        },
    };
}

// -- Chunks -------------------------------------------------------------------

auto SyncHub::find_state(std::string_view session_id) const -> std::shared_ptr<SessionState> {
    auto lock = std::scoped_lock{states_mutex_};
    auto it = states_.find(session_id);
    return it == states_.end() ? nullptr : it->second;
}

auto SyncHub::state_for(std::string_view session_id) const -> std::shared_ptr<SessionState> {
    auto state = find_state(session_id);
    if (!state) {
        throw InvalidSessionStateError{std::string{session_id}, "session is no longer active"};
    }
    return state;
}

auto SyncHub::upload_chunk(const ChunkMessage& chunk) -> ChunkAck {
    auto started = services_.clock();
    auto session = sessions_.require_active(chunk.session_id);
    auto state = state_for(chunk.session_id);
    auto lock = std::scoped_lock{state->mutex};

    auto ack = ChunkAck{
        .accepted = true,
        .session_id = chunk.session_id,
        .cid = chunk.cid,
        .chunk_index = chunk.chunk_index,
    };

    // Already verified and stored, possibly by another session
    if (services_.objects->contains(chunk.cid)) {
        ack.object_complete = true;
        ack.bytes_received = chunk.object_size;
        ack.object_size = chunk.object_size;
        return ack;
    }

    auto reject = [&](const SyncError& e) {
        SPDLOG_WARN("session {}: rejected chunk {} of {}: {}", chunk.session_id,
                    chunk.chunk_index, to_string(chunk.cid), e.what());
        sessions_.update_stats(chunk.session_id, [](SessionStats& st) {
            ++st.chunks_rejected;
            ++st.errors;
        });
        if (services_.metrics) {
            services_.metrics->on_chunk(ChunkSample{.session_id = chunk.session_id,
                                                    .bytes = chunk.data.size(),
                                                    .duration = {},
                                                    .accepted = false});
        }
        report_error(e.kind(), chunk.session_id);
        ack.accepted = false;
        ack.error = e.what();
        auto missing = state->assembler.missing_chunks(chunk.cid);
        if (!missing.empty()) ack.next_chunk_index = missing.front();
        return ack;
    };

    auto context = ErrorContext{.session_id = chunk.session_id,
                                .cid = to_string(chunk.cid),
                                .chunk_index = chunk.chunk_index};
    if (chunk.data.size() > session.chunk_size) {
        return reject(IntegrityError{"chunk exceeds the session chunk size", context});
    }
    if (chunk.object_size > config_.max_object_size) {
        return reject(IntegrityError{"object exceeds max_object_size", context});
    }
    if (state->assembler.bytes_buffered() + chunk.data.size() > config_.max_session_buffer_bytes) {
        return reject(IntegrityError{"session upload buffer is full", context});
    }

    auto progress = ChunkProgress{};
    try {
        progress = state->assembler.receive(chunk);
    } catch (const IntegrityError& e) {
        return reject(e);
    }

    ack.bytes_received = progress.bytes_received;
    ack.object_size = progress.object_size;
    ack.next_chunk_index = progress.next_chunk_index;

    if (progress.object_complete) {
        try {
            auto bytes = state->assembler.take_object(chunk.cid);
            services_.objects->put(chunk.cid, std::move(bytes));
        } catch (const IntegrityError& e) {
            return reject(e);
        }
        ack.object_complete = true;
        ack.next_chunk_index.reset();
        SPDLOG_DEBUG("session {}: object {} complete", chunk.session_id, to_string(chunk.cid));
    }

    auto duration = elapsed(started, services_.clock());
    sessions_.update_stats(chunk.session_id, [&](SessionStats& st) {
        if (progress.duplicate) return;
        ++st.chunks_received;
        st.bytes_received += chunk.data.size();
        st.largest_chunk_bytes = std::max<std::uint64_t>(st.largest_chunk_bytes, chunk.data.size());
        st.chunk_time_ms += duration.count();
        if (ack.object_complete) ++st.objects_received;
    });
    if (services_.metrics && !progress.duplicate) {
        services_.metrics->on_chunk(ChunkSample{.session_id = chunk.session_id,
                                                .bytes = chunk.data.size(),
                                                .duration = duration,
                                                .accepted = true});
    }
    return ack;
}

auto SyncHub::download_chunk(const ChunkRequest& request) -> ChunkMessage {
    auto session = sessions_.require_active(request.session_id);
    auto state = state_for(request.session_id);
    auto lock = std::scoped_lock{state->mutex};

    auto bytes = services_.objects->get(request.cid);
    if (!bytes) {
        report_error(ErrorKind::object_not_found, request.session_id);
        throw ObjectNotFoundError{"no object " + to_string(request.cid),
                                  ErrorContext{.session_id = request.session_id,
                                               .cid = to_string(request.cid),
                                               .chunk_index = request.chunk_index}};
    }
    auto chunk = make_chunk(request.session_id, request.cid, *bytes, request.chunk_index,
                            session.chunk_size);
    sessions_.update_stats(request.session_id, [&](SessionStats& st) {
        ++st.chunks_sent;
        st.bytes_sent += chunk.data.size();
    });
    return chunk;
}

// -- Commit -------------------------------------------------------------------

auto SyncHub::load_payload(const CommitRequest& request, SessionState& state) const
    -> std::vector<std::byte> {
    auto context = ErrorContext{.session_id = request.session_id,
                                .cid = to_string(request.payload_cid)};
    if (request.payload) {
        if (!verify_cid(*request.payload, request.payload_cid)) {
            throw IntegrityError{"payload bytes do not match payload_cid", context};
        }
        return *request.payload;
    }
    if (auto stored = services_.objects->get(request.payload_cid)) return *stored;
    if (state.assembler.has_object(request.payload_cid)) {
        throw IntegrityError{"payload upload is incomplete", context};
    }
    throw ObjectNotFoundError{"payload was neither sent inline nor uploaded", context};
}

auto SyncHub::replay(const PayloadRecord& record, std::string_view session_id) -> CommitResponse {
    auto response = record.response.get<CommitResponse>();
    response.session_id = std::string{session_id};
    response.applied = false;
    response.replayed = true;
    sessions_.update_stats(session_id, [](SessionStats& st) { ++st.payloads_replayed; });
    if (services_.metrics) {
        services_.metrics->on_commit(MergeSample{.session_id = std::string{session_id},
                                                 .replayed = true});
    }
    SPDLOG_INFO("session {}: payload {} already committed by {}, replaying recorded response",
                session_id, to_string(record.payload_cid), record.session_id);
    return response;
}

auto SyncHub::commit(const CommitRequest& request) -> CommitResponse {
    sessions_.require_active(request.session_id);
    auto state = state_for(request.session_id);
    auto lock = std::scoped_lock{state->mutex};

    auto bytes = std::vector<std::byte>{};
    try {
        bytes = load_payload(request, *state);
    } catch (const SyncError& e) {
        report_error(e.kind(), request.session_id);
        throw;
    }

    if (auto record = services_.entries->committed_payload(request.payload_cid)) {
        return replay(*record, request.session_id);
    }

    auto deltas = std::vector<EntryDelta>{};
    try {
        deltas = parse_delta_payload(bytes);
    } catch (const MalformedPayloadError& e) {
        sessions_.update_stats(request.session_id, [](SessionStats& st) { ++st.errors; });
        report_error(ErrorKind::malformed_payload, request.session_id);
        throw MalformedPayloadError{e.what(),
                                    ErrorContext{.session_id = request.session_id,
                                                 .cid = to_string(request.payload_cid)}};
    }

    auto applier = DeltaApplier{*services_.entries, *services_.objects, engine_};
    applier.set_override_lookup([this](std::string_view key, std::string_view locale) {
        return overrides_for(key, locale);
    });

    auto committed_at = services_.clock();
    auto make_response = [&](const ApplyReport& report) {
        return CommitResponse{
            .session_id = request.session_id,
            .payload_cid = request.payload_cid,
            .applied = true,
            .replayed = false,
            .processed = report.processed,
            .created = report.created,
            .updated = report.updated,
            .deleted = report.deleted,
            .unchanged = report.unchanged,
            .conflict_count = report.conflicts.size(),
            .error_count = report.errors.size(),
            .conflicts = report.conflicts,
            .errors = report.errors,
            .committed_at = committed_at,
        };
    };

    auto options = ApplyOptions{.strategy = request.merge_strategy,
                                .policy = request.conflict_policy,
                                .max_retries = config_.max_commit_retries};
    auto report = ApplyReport{};
    try {
        report = applier.apply(deltas, options, [&](const ApplyReport& r) {
            // Last point before the batch is written; a session cancelled
            // or expired since the start of the commit writes nothing.
            sessions_.require_active(request.session_id);
            return PayloadRecord{.payload_cid = request.payload_cid,
                                 .session_id = request.session_id,
                                 .committed_at = committed_at,
                                 .response = nlohmann::json(make_response(r))};
        });
    } catch (const ConcurrentCommitError& e) {
        report_error(ErrorKind::concurrent_commit, request.session_id);
        sessions_.fail(request.session_id, e.what());
        throw ConcurrentCommitError{request.session_id, e.what()};
    } catch (const InvalidSessionStateError& e) {
        report_error(e.kind(), request.session_id);
        throw;
    }

    if (report.outcome == CommitOutcome::already_committed) {
        if (auto record = services_.entries->committed_payload(request.payload_cid)) {
            return replay(*record, request.session_id);
        }
    }

    services_.objects->put(request.payload_cid, std::move(bytes));

    sessions_.update_stats(request.session_id, [&](SessionStats& st) {
        ++st.payloads_committed;
        st.entries_processed += report.processed;
        st.clean_merges += report.clean;
        st.conflicted_merges += report.conflicts.size();
        st.errors += report.errors.size();
    });
    if (services_.metrics) {
        services_.metrics->on_commit(MergeSample{
            .session_id = request.session_id,
            .processed = report.processed,
            .clean = report.clean,
            .conflicts = report.conflicts.size(),
            .errors = report.errors.size(),
            .replayed = false,
        });
    }
    SPDLOG_INFO("session {}: committed payload {} ({} deltas, {} conflicts, {} attempts)",
                request.session_id, to_string(request.payload_cid), report.processed,
                report.conflicts.size(), report.attempts);
    return make_response(report);
}

// -- Lifecycle ----------------------------------------------------------------

auto SyncHub::complete_session(std::string_view session_id) -> SessionStatusResponse {
    sessions_.require_active(session_id);
    {
        auto state = state_for(session_id);
        auto lock = std::scoped_lock{state->mutex};
        auto pending = state->assembler.pending_objects();
        if (!pending.empty()) {
            SPDLOG_WARN("session {} completed with {} partially uploaded objects",
                        session_id, pending.size());
        }
        sessions_.complete(session_id);
    }
    return session_status(session_id);
}

auto SyncHub::cancel_session(std::string_view session_id) -> SessionStatusResponse {
    // Wait out any in-flight upload or commit on this session
    if (auto state = find_state(session_id)) {
        auto lock = std::scoped_lock{state->mutex};
        sessions_.cancel(session_id);
    } else {
        sessions_.cancel(session_id);
    }
    return session_status(session_id);
}

auto SyncHub::session_status(std::string_view session_id) const -> SessionStatusResponse {
    auto session = sessions_.status(session_id);
    if (!session) throw SessionNotFoundError{std::string{session_id}};
    return to_status_response(*session);
}

auto SyncHub::sweep_expired_sessions() -> std::vector<std::string> {
    auto snapshot = std::vector<std::pair<std::string, std::shared_ptr<SessionState>>>{};
    {
        auto lock = std::scoped_lock{states_mutex_};
        snapshot.assign(states_.begin(), states_.end());
    }

    auto expired = std::vector<std::string>{};
    for (auto& [id, state] : snapshot) {
        auto lock = std::scoped_lock{state->mutex};
        if (sessions_.expire_if_due(id)) expired.push_back(id);
    }
    // Sessions that never got scratch state
    auto rest = sessions_.sweep_expired();
    expired.insert(expired.end(), rest.begin(), rest.end());
    return expired;
}

void SyncHub::on_session_finished(const SyncSession& session) {
    auto dropped = std::shared_ptr<SessionState>{};
    {
        auto lock = std::scoped_lock{states_mutex_};
        auto it = states_.find(session.session_id);
        if (it != states_.end()) {
            dropped = std::move(it->second);
            states_.erase(it);
        }
    }
    if (services_.metrics) services_.metrics->on_session_finished(session);
    if (session.status == SessionStatus::expired) report_error(ErrorKind::session_expired,
                                                               session.session_id);
}

void SyncHub::report_error(ErrorKind kind, std::string_view session_id) {
    if (services_.metrics) services_.metrics->on_error(kind, session_id);
}

// -- Async --------------------------------------------------------------------

auto SyncHub::async_upload_chunk(ChunkMessage chunk) -> std::future<ChunkAck> {
    return run_on<ChunkAck>(services_.pool, [this, chunk = std::move(chunk)] {
        return upload_chunk(chunk);
    });
}

auto SyncHub::async_commit(CommitRequest request) -> std::future<CommitResponse> {
    return run_on<CommitResponse>(services_.pool, [this, request = std::move(request)] {
        return commit(request);
    });
}

// -- Maintenance --------------------------------------------------------------

auto SyncHub::compact_idempotency_log(std::string_view owner) -> std::size_t {
    auto guard = ScopedResourceLock{*services_.locks, idempotency_lock_name, std::string{owner},
                                    config_.maintenance_lock_ttl};
    auto cutoff = services_.clock() - config_.idempotency_retention;
    auto dropped = services_.entries->prune_payload_records(cutoff);
    SPDLOG_INFO("compacted idempotency log: {} records dropped, {} kept",
                dropped, services_.entries->payload_record_count());
    return dropped;
}

void SyncHub::register_override(TranslationOverride claim) {
    auto lock = std::scoped_lock{overrides_mutex_};
    overrides_.push_back(std::move(claim));
}

void SyncHub::clear_overrides() {
    auto lock = std::scoped_lock{overrides_mutex_};
    overrides_.clear();
}

auto SyncHub::validate_overrides() const -> std::vector<OverrideIssue> {
    auto lock = std::scoped_lock{overrides_mutex_};
    return override_processor_.validate_override_chain(overrides_);
}

auto SyncHub::overrides_for(std::string_view key, std::string_view locale) const
    -> std::vector<TranslationOverride> {
    auto lock = std::scoped_lock{overrides_mutex_};
    auto result = std::vector<TranslationOverride>{};
    for (const auto& o : overrides_) {
        if (o.key == key && o.locale == locale) result.push_back(o);
    }
    return result;
}

auto SyncHub::statistics() const -> HubStatistics {
    auto overrides = std::size_t{0};
    {
        auto lock = std::scoped_lock{overrides_mutex_};
        overrides = overrides_.size();
    }
    return HubStatistics{
        .live_sessions = sessions_.live_count(),
        .archived_sessions = sessions_.archived_count(),
        .objects = services_.objects->size(),
        .payload_records = services_.entries->payload_record_count(),
        .overrides = overrides,
    };
}

}  // namespace l10n_sync
