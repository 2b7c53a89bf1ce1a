/// @file json.hpp
/// @brief nlohmann/json interoperability for l10n-sync.
///
/// ADL serialization (to_json/from_json) for the value types that cross
/// the wire or land in the outbox file. Bytes are base64, Cids use the
/// "alg:hex" form, timestamps are epoch milliseconds and enums use their
/// to_string_view names.
///
/// from_json throws nlohmann::json::exception for missing keys or wrong
/// JSON types, and std::invalid_argument for values of the right type
/// that do not parse (unknown enum names, bad Cids, bad base64).

#pragma once

#include <l10n-sync/chunk_transfer.hpp>
#include <l10n-sync/entry_delta.hpp>
#include <l10n-sync/error.hpp>
#include <l10n-sync/merge.hpp>
#include <l10n-sync/protocol.hpp>
#include <l10n-sync/sync_session.hpp>
#include <l10n-sync/translation_entry.hpp>
#include <l10n-sync/types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace l10n_sync {

// -- Scalars ------------------------------------------------------------------

void to_json(nlohmann::json& j, const Cid& cid);
void from_json(const nlohmann::json& j, Cid& cid);

void to_json(nlohmann::json& j, const Timestamp& ts);
void from_json(const nlohmann::json& j, Timestamp& ts);

void to_json(nlohmann::json& j, EntryStatus status);
void from_json(const nlohmann::json& j, EntryStatus& status);

void to_json(nlohmann::json& j, DeltaOperation op);
void from_json(const nlohmann::json& j, DeltaOperation& op);

void to_json(nlohmann::json& j, MergeStrategy strategy);
void from_json(const nlohmann::json& j, MergeStrategy& strategy);

void to_json(nlohmann::json& j, ConflictPolicy policy);
void from_json(const nlohmann::json& j, ConflictPolicy& policy);

void to_json(nlohmann::json& j, ConflictType type);
void from_json(const nlohmann::json& j, ConflictType& type);

void to_json(nlohmann::json& j, EntryField field);
void from_json(const nlohmann::json& j, EntryField& field);

void to_json(nlohmann::json& j, SessionStatus status);
void from_json(const nlohmann::json& j, SessionStatus& status);

// -- Entry types --------------------------------------------------------------

void to_json(nlohmann::json& j, const FieldConflict& c);
void from_json(const nlohmann::json& j, FieldConflict& c);

void to_json(nlohmann::json& j, const MergeConflictInfo& info);
void from_json(const nlohmann::json& j, MergeConflictInfo& info);

/// Known keys map to QaFlags members; anything else goes to QaFlags::extra
/// and is written back out unchanged.
void to_json(nlohmann::json& j, const QaFlags& flags);
void from_json(const nlohmann::json& j, QaFlags& flags);

void to_json(nlohmann::json& j, const TranslationEntry& e);
void from_json(const nlohmann::json& j, TranslationEntry& e);

void to_json(nlohmann::json& j, const EntryDelta& d);
void from_json(const nlohmann::json& j, EntryDelta& d);

// -- Protocol messages --------------------------------------------------------

void to_json(nlohmann::json& j, const ServerCapabilities& c);
void from_json(const nlohmann::json& j, ServerCapabilities& c);

void to_json(nlohmann::json& j, const HandshakeRequest& r);
void from_json(const nlohmann::json& j, HandshakeRequest& r);

void to_json(nlohmann::json& j, const HandshakeResponse& r);
void from_json(const nlohmann::json& j, HandshakeResponse& r);

void to_json(nlohmann::json& j, const ChunkMessage& m);
void from_json(const nlohmann::json& j, ChunkMessage& m);

void to_json(nlohmann::json& j, const ChunkAck& a);
void from_json(const nlohmann::json& j, ChunkAck& a);

void to_json(nlohmann::json& j, const ChunkRequest& r);
void from_json(const nlohmann::json& j, ChunkRequest& r);

void to_json(nlohmann::json& j, const CommitRequest& r);
void from_json(const nlohmann::json& j, CommitRequest& r);

void to_json(nlohmann::json& j, const ConflictReport& r);
void from_json(const nlohmann::json& j, ConflictReport& r);

void to_json(nlohmann::json& j, const CommitResponse& r);
void from_json(const nlohmann::json& j, CommitResponse& r);

void to_json(nlohmann::json& j, const SessionStats& s);
void from_json(const nlohmann::json& j, SessionStats& s);

void to_json(nlohmann::json& j, const SessionStatusResponse& r);
void from_json(const nlohmann::json& j, SessionStatusResponse& r);

/// Error body for a failed request: {"kind", "message", "context"}.
void to_json(nlohmann::json& j, const Error& e);

// -- Bytes --------------------------------------------------------------------

/// Bytes as a base64 JSON string.
auto bytes_to_json(const std::vector<std::byte>& bytes) -> nlohmann::json;

/// Decode a base64 JSON string.
auto bytes_from_json(const nlohmann::json& j) -> std::vector<std::byte>;

}  // namespace l10n_sync
