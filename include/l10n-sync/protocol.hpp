/// @file protocol.hpp
/// @brief Boundary messages exchanged between a client and the hub.
///
/// These are plain value types. JSON encoding lives in json.hpp; the HTTP
/// framing around them is the host application's concern.

#pragma once

#include <l10n-sync/merge.hpp>
#include <l10n-sync/sync_session.hpp>
#include <l10n-sync/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace l10n_sync {

/// The only wire protocol revision this library speaks.
inline constexpr std::string_view protocol_version_v1 = "v1";

/// What the hub advertises in a handshake response.
struct ServerCapabilities {
    std::vector<std::string> supported_versions{std::string{protocol_version_v1}};
    std::size_t max_chunk_size{0};
    std::size_t max_concurrent_chunks{0};
    std::vector<std::string> compression{"deflate"};
    bool supports_resume{true};

    auto operator==(const ServerCapabilities&) const -> bool = default;
};

// -- Handshake ----------------------------------------------------------------

struct HandshakeRequest {
    std::string client_id;
    std::string session_id;
    std::string protocol_version{protocol_version_v1};
    std::vector<std::byte> bloom_filter;  ///< BloomFilter::to_bytes() of the client's CIDs.

    auto operator==(const HandshakeRequest&) const -> bool = default;
};

struct HandshakeResponse {
    std::string session_id;
    std::string protocol_version{protocol_version_v1};
    std::vector<Cid> missing_cids;         ///< Hub objects the filter says the client lacks.
    Timestamp session_expires_at{};
    std::size_t chunk_size{0};
    std::size_t max_concurrent_chunks{0};
    bool full_resync_recommended{false};   ///< Filter too saturated to trust.
    ServerCapabilities capabilities;

    auto operator==(const HandshakeResponse&) const -> bool = default;
};

// -- Chunks -------------------------------------------------------------------

/// Reply to a chunk upload. A rejected chunk carries the reason; the
/// sender re-sends that index only.
struct ChunkAck {
    bool accepted{false};
    std::string session_id;
    Cid cid;
    std::uint32_t chunk_index{0};
    bool object_complete{false};
    std::uint64_t bytes_received{0};
    std::uint64_t object_size{0};
    std::optional<std::uint32_t> next_chunk_index;
    std::optional<std::string> error;

    auto operator==(const ChunkAck&) const -> bool = default;
};

struct ChunkRequest {
    std::string session_id;
    Cid cid;
    std::uint32_t chunk_index{0};

    auto operator==(const ChunkRequest&) const -> bool = default;
};

// -- Commit -------------------------------------------------------------------

struct CommitRequest {
    std::string session_id;
    Cid payload_cid;
    /// Payload bytes inline. When absent the payload must already have
    /// been uploaded by chunks in this session.
    std::optional<std::vector<std::byte>> payload;
    MergeStrategy merge_strategy{MergeStrategy::three_way};
    ConflictPolicy conflict_policy{ConflictPolicy::mark_for_review};

    auto operator==(const CommitRequest&) const -> bool = default;
};

/// One entry the commit left for review.
struct ConflictReport {
    std::string uid;
    std::string key;
    std::string locale;
    ConflictType type{ConflictType::none};
    std::vector<EntryField> fields;

    auto operator==(const ConflictReport&) const -> bool = default;
};

struct CommitResponse {
    std::string session_id;
    Cid payload_cid;
    bool applied{false};
    bool replayed{false};   ///< Payload was committed before; nothing was re-applied.
    std::size_t processed{0};
    std::size_t created{0};
    std::size_t updated{0};
    std::size_t deleted{0};
    std::size_t unchanged{0};
    std::size_t conflict_count{0};
    std::size_t error_count{0};
    std::vector<ConflictReport> conflicts;
    std::vector<std::string> errors;
    Timestamp committed_at{};

    auto operator==(const CommitResponse&) const -> bool = default;
};

// -- Status -------------------------------------------------------------------

struct SessionStatusResponse {
    std::string session_id;
    std::string client_id;
    SessionStatus status{SessionStatus::pending};
    Timestamp expires_at{};
    std::string failure_reason;
    SessionStats stats;

    auto operator==(const SessionStatusResponse&) const -> bool = default;
};

}  // namespace l10n_sync
