/// @file metrics.hpp
/// @brief Telemetry seam for sync sessions.
///
/// The hub reports events to a MetricsSink. Nothing in the protocol's
/// correctness depends on a sink; a null sink is valid.

#pragma once

#include <l10n-sync/error.hpp>
#include <l10n-sync/sync_session.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace l10n_sync {

/// What a handshake learned about the client's filter.
struct HandshakeSample {
    std::string session_id;
    std::chrono::milliseconds latency{0};
    std::uint64_t filter_bits{0};
    std::uint64_t filter_inserted{0};
    double estimated_fp_rate{0.0};
    std::size_t objects_scanned{0};
    std::size_t missing_cids{0};
};

struct ChunkSample {
    std::string session_id;
    std::uint64_t bytes{0};
    std::chrono::milliseconds duration{0};
    bool accepted{true};
};

struct MergeSample {
    std::string session_id;
    std::size_t processed{0};
    std::size_t clean{0};
    std::size_t conflicts{0};
    std::size_t errors{0};
    bool replayed{false};
};

class MetricsSink {
public:
    virtual ~MetricsSink() = default;

    virtual void on_handshake(const HandshakeSample& sample) = 0;
    virtual void on_chunk(const ChunkSample& sample) = 0;
    virtual void on_commit(const MergeSample& sample) = 0;
    virtual void on_session_finished(const SyncSession& session) = 0;
    virtual void on_error(ErrorKind kind, std::string_view session_id) = 0;
};

/// Writes every event to the default spdlog logger.
class LoggingMetricsSink : public MetricsSink {
public:
    void on_handshake(const HandshakeSample& sample) override;
    void on_chunk(const ChunkSample& sample) override;
    void on_commit(const MergeSample& sample) override;
    void on_session_finished(const SyncSession& session) override;
    void on_error(ErrorKind kind, std::string_view session_id) override;
};

/// Point-in-time aggregate of everything a MetricsCollector has seen.
struct MetricsSnapshot {
    std::uint64_t handshakes{0};
    double average_handshake_ms{0.0};
    double average_filter_fp_rate{0.0};
    std::uint64_t objects_scanned{0};
    std::uint64_t missing_cids{0};

    std::uint64_t chunks_accepted{0};
    std::uint64_t chunks_rejected{0};
    std::uint64_t chunk_bytes{0};
    double average_chunk_ms{0.0};

    std::uint64_t commits{0};
    std::uint64_t replays{0};
    std::uint64_t entries_processed{0};
    std::uint64_t clean_merges{0};
    std::uint64_t conflicts{0};
    std::uint64_t merge_errors{0};

    std::map<SessionStatus, std::uint64_t> sessions_by_outcome;
    std::map<ErrorKind, std::uint64_t> errors_by_kind;
};

/// Thread-safe in-memory aggregate.
class MetricsCollector : public MetricsSink {
public:
    void on_handshake(const HandshakeSample& sample) override;
    void on_chunk(const ChunkSample& sample) override;
    void on_commit(const MergeSample& sample) override;
    void on_session_finished(const SyncSession& session) override;
    void on_error(ErrorKind kind, std::string_view session_id) override;

    auto snapshot() const -> MetricsSnapshot;
    void reset();

private:
    mutable std::mutex mutex_;
    MetricsSnapshot totals_;
    std::int64_t handshake_ms_sum_{0};
    double fp_rate_sum_{0.0};
    std::int64_t chunk_ms_sum_{0};
};

/// Forwards every event to each registered sink, in registration order.
class FanoutMetricsSink : public MetricsSink {
public:
    void add(std::shared_ptr<MetricsSink> sink);

    void on_handshake(const HandshakeSample& sample) override;
    void on_chunk(const ChunkSample& sample) override;
    void on_commit(const MergeSample& sample) override;
    void on_session_finished(const SyncSession& session) override;
    void on_error(ErrorKind kind, std::string_view session_id) override;

private:
    std::vector<std::shared_ptr<MetricsSink>> sinks_;
};

auto snapshot_to_json(const MetricsSnapshot& snapshot) -> nlohmann::json;

}  // namespace l10n_sync
