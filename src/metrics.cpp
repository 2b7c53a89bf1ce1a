#include <l10n-sync/metrics.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace l10n_sync {

// -- LoggingMetricsSink -------------------------------------------------------

void LoggingMetricsSink::on_handshake(const HandshakeSample& s) {
    SPDLOG_INFO("handshake {}: {} ms, filter {} bits / {} items (fp {:.4f}), {} of {} objects missing",
                s.session_id, s.latency.count(), s.filter_bits, s.filter_inserted,
                s.estimated_fp_rate, s.missing_cids, s.objects_scanned);
}

void LoggingMetricsSink::on_chunk(const ChunkSample& s) {
    if (s.accepted) {
        SPDLOG_DEBUG("chunk {}: {} bytes in {} ms", s.session_id, s.bytes, s.duration.count());
    } else {
        SPDLOG_WARN("chunk {}: rejected {} bytes", s.session_id, s.bytes);
    }
}

void LoggingMetricsSink::on_commit(const MergeSample& s) {
    if (s.replayed) {
        SPDLOG_INFO("commit {}: replayed, nothing applied", s.session_id);
        return;
    }
    SPDLOG_INFO("commit {}: {} processed, {} clean, {} conflicts, {} errors",
                s.session_id, s.processed, s.clean, s.conflicts, s.errors);
}

void LoggingMetricsSink::on_session_finished(const SyncSession& session) {
    SPDLOG_INFO("session {} ({}) finished as {}: {} chunks, {} payloads, {} conflicts",
                session.session_id, session.client_id, to_string_view(session.status),
                session.stats.chunks_received, session.stats.payloads_committed,
                session.stats.conflicted_merges);
}

void LoggingMetricsSink::on_error(ErrorKind kind, std::string_view session_id) {
    SPDLOG_WARN("sync error {} in session {}", to_string_view(kind), session_id);
}

// -- MetricsCollector ---------------------------------------------------------

void MetricsCollector::on_handshake(const HandshakeSample& s) {
    auto lock = std::scoped_lock{mutex_};
    ++totals_.handshakes;
    handshake_ms_sum_ += s.latency.count();
    fp_rate_sum_ += s.estimated_fp_rate;
    totals_.objects_scanned += s.objects_scanned;
    totals_.missing_cids += s.missing_cids;
    totals_.average_handshake_ms =
        static_cast<double>(handshake_ms_sum_) / static_cast<double>(totals_.handshakes);
    totals_.average_filter_fp_rate = fp_rate_sum_ / static_cast<double>(totals_.handshakes);
}

void MetricsCollector::on_chunk(const ChunkSample& s) {
    auto lock = std::scoped_lock{mutex_};
    if (!s.accepted) {
        ++totals_.chunks_rejected;
        return;
    }
    ++totals_.chunks_accepted;
    totals_.chunk_bytes += s.bytes;
    chunk_ms_sum_ += s.duration.count();
    totals_.average_chunk_ms =
        static_cast<double>(chunk_ms_sum_) / static_cast<double>(totals_.chunks_accepted);
}

void MetricsCollector::on_commit(const MergeSample& s) {
    auto lock = std::scoped_lock{mutex_};
    if (s.replayed) {
        ++totals_.replays;
        return;
    }
    ++totals_.commits;
    totals_.entries_processed += s.processed;
    totals_.clean_merges += s.clean;
    totals_.conflicts += s.conflicts;
    totals_.merge_errors += s.errors;
}

void MetricsCollector::on_session_finished(const SyncSession& session) {
    auto lock = std::scoped_lock{mutex_};
    ++totals_.sessions_by_outcome[session.status];
}

void MetricsCollector::on_error(ErrorKind kind, std::string_view) {
    auto lock = std::scoped_lock{mutex_};
    ++totals_.errors_by_kind[kind];
}

auto MetricsCollector::snapshot() const -> MetricsSnapshot {
    auto lock = std::scoped_lock{mutex_};
    return totals_;
}

void MetricsCollector::reset() {
    auto lock = std::scoped_lock{mutex_};
    totals_ = MetricsSnapshot{};
    handshake_ms_sum_ = 0;
    fp_rate_sum_ = 0.0;
    chunk_ms_sum_ = 0;
}

// -- FanoutMetricsSink --------------------------------------------------------

void FanoutMetricsSink::add(std::shared_ptr<MetricsSink> sink) {
    if (sink) sinks_.push_back(std::move(sink));
}

void FanoutMetricsSink::on_handshake(const HandshakeSample& s) {
    for (const auto& sink : sinks_) sink->on_handshake(s);
}

void FanoutMetricsSink::on_chunk(const ChunkSample& s) {
    for (const auto& sink : sinks_) sink->on_chunk(s);
}

void FanoutMetricsSink::on_commit(const MergeSample& s) {
    for (const auto& sink : sinks_) sink->on_commit(s);
}

void FanoutMetricsSink::on_session_finished(const SyncSession& session) {
    for (const auto& sink : sinks_) sink->on_session_finished(session);
}

void FanoutMetricsSink::on_error(ErrorKind kind, std::string_view session_id) {
    for (const auto& sink : sinks_) sink->on_error(kind, session_id);
}

// -- JSON ---------------------------------------------------------------------

auto snapshot_to_json(const MetricsSnapshot& s) -> nlohmann::json {
    auto outcomes = nlohmann::json::object();
    for (const auto& [status, n] : s.sessions_by_outcome) {
        outcomes[std::string{to_string_view(status)}] = n;
    }
    auto errors = nlohmann::json::object();
    for (const auto& [kind, n] : s.errors_by_kind) {
        errors[std::string{to_string_view(kind)}] = n;
    }
    return nlohmann::json{
        {"bloom_filter", {
            {"handshakes", s.handshakes},
            {"average_handshake_ms", s.average_handshake_ms},
            {"average_fp_rate", s.average_filter_fp_rate},
            {"objects_scanned", s.objects_scanned},
            {"missing_cids", s.missing_cids},
        }},
        {"chunks", {
            {"accepted", s.chunks_accepted},
            {"rejected", s.chunks_rejected},
            {"bytes", s.chunk_bytes},
            {"average_ms", s.average_chunk_ms},
        }},
        {"merges", {
            {"commits", s.commits},
            {"replays", s.replays},
            {"processed", s.entries_processed},
            {"clean", s.clean_merges},
            {"conflicts", s.conflicts},
            {"errors", s.merge_errors},
        }},
        {"sessions", outcomes},
        {"errors", errors},
    };
}

}  // namespace l10n_sync
