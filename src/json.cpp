#include <l10n-sync/json.hpp>

#include <l10n-sync/content_address.hpp>

#include "encoding/text.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace l10n_sync {

// =============================================================================
// Helpers
// =============================================================================

namespace {

template <typename E, typename Parse>
void enum_from_json(const nlohmann::json& j, E& out, Parse parse, const char* what) {
    auto text = j.get<std::string>();
    auto value = parse(text);
    if (!value) throw std::invalid_argument{std::string{"unknown "} + what + " '" + text + "'"};
    out = *value;
}

template <typename T>
auto optional_to_json(const std::optional<T>& value) -> nlohmann::json {
    if (!value) return nullptr;
    return nlohmann::json(*value);
}

template <typename T>
void optional_from_json(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
        return;
    }
    out = it->get<T>();
}

// Read key if present, leaving the default otherwise.
template <typename T>
void read_if(const nlohmann::json& j, const char* key, T& out) {
    if (auto it = j.find(key); it != j.end() && !it->is_null()) it->get_to(out);
}

}  // namespace

// =============================================================================
// Scalars
// =============================================================================

void to_json(nlohmann::json& j, const Cid& cid) { j = to_string(cid); }

void from_json(const nlohmann::json& j, Cid& cid) {
    auto text = j.get<std::string>();
    auto parsed = parse_cid(text);
    if (!parsed) throw std::invalid_argument{"invalid cid '" + text + "'"};
    cid = *parsed;
}

void to_json(nlohmann::json& j, const Timestamp& ts) { j = ts.millis_since_epoch; }

void from_json(const nlohmann::json& j, Timestamp& ts) {
    ts.millis_since_epoch = j.get<std::int64_t>();
}

void to_json(nlohmann::json& j, EntryStatus status) { j = to_string_view(status); }

void from_json(const nlohmann::json& j, EntryStatus& status) {
    enum_from_json(j, status, parse_entry_status, "entry status");
}

void to_json(nlohmann::json& j, DeltaOperation op) { j = to_string_view(op); }

void from_json(const nlohmann::json& j, DeltaOperation& op) {
    enum_from_json(j, op, parse_delta_operation, "delta operation");
}

void to_json(nlohmann::json& j, MergeStrategy strategy) { j = to_string_view(strategy); }

void from_json(const nlohmann::json& j, MergeStrategy& strategy) {
    enum_from_json(j, strategy, parse_merge_strategy, "merge strategy");
}

void to_json(nlohmann::json& j, ConflictPolicy policy) { j = to_string_view(policy); }

void from_json(const nlohmann::json& j, ConflictPolicy& policy) {
    enum_from_json(j, policy, parse_conflict_policy, "conflict policy");
}

void to_json(nlohmann::json& j, ConflictType type) { j = to_string_view(type); }

void from_json(const nlohmann::json& j, ConflictType& type) {
    enum_from_json(j, type, parse_conflict_type, "conflict type");
}

void to_json(nlohmann::json& j, EntryField field) { j = to_string_view(field); }

void from_json(const nlohmann::json& j, EntryField& field) {
    enum_from_json(j, field, parse_entry_field, "entry field");
}

void to_json(nlohmann::json& j, SessionStatus status) { j = to_string_view(status); }

void from_json(const nlohmann::json& j, SessionStatus& status) {
    enum_from_json(j, status, parse_session_status, "session status");
}

// =============================================================================
// Entry types
// =============================================================================

void to_json(nlohmann::json& j, const FieldConflict& c) {
    j = nlohmann::json{
        {"field", c.field},
        {"local_value", c.local_value},
        {"remote_value", c.remote_value},
    };
}

void from_json(const nlohmann::json& j, FieldConflict& c) {
    j.at("field").get_to(c.field);
    j.at("local_value").get_to(c.local_value);
    j.at("remote_value").get_to(c.remote_value);
}

void to_json(nlohmann::json& j, const MergeConflictInfo& info) {
    j = nlohmann::json{
        {"fields", info.fields},
        {"remote_deleted", info.remote_deleted},
        {"local_deleted", info.local_deleted},
        {"detected_at", info.detected_at},
    };
}

void from_json(const nlohmann::json& j, MergeConflictInfo& info) {
    info = MergeConflictInfo{};
    read_if(j, "fields", info.fields);
    read_if(j, "remote_deleted", info.remote_deleted);
    read_if(j, "local_deleted", info.local_deleted);
    read_if(j, "detected_at", info.detected_at);
}

void to_json(nlohmann::json& j, const QaFlags& flags) {
    j = flags.extra.is_object() ? flags.extra : nlohmann::json::object();
    if (!flags.issues.empty()) j["issues"] = flags.issues;
    if (flags.merge_conflict) j["merge_conflict"] = *flags.merge_conflict;
}

void from_json(const nlohmann::json& j, QaFlags& flags) {
    if (!j.is_object()) throw std::invalid_argument{"qa_flags must be a JSON object"};
    flags = QaFlags{};
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() == "issues") {
            it.value().get_to(flags.issues);
        } else if (it.key() == "merge_conflict") {
            if (!it.value().is_null()) flags.merge_conflict = it.value().get<MergeConflictInfo>();
        } else {
            flags.extra[it.key()] = it.value();
        }
    }
}

void to_json(nlohmann::json& j, const TranslationEntry& e) {
    j = nlohmann::json{
        {"uid", e.uid},
        {"uida_keys_b64", e.uida_keys_b64},
        {"uida_hash", e.uida_hash},
        {"key", e.key},
        {"locale", e.locale},
        {"src_text", e.src_text},
        {"dst_text", e.dst_text},
        {"status", e.status},
        {"language_file_uid", e.language_file_uid},
        {"updated_at", e.updated_at},
        {"qa_flags", e.qa_flags},
    };
}

void from_json(const nlohmann::json& j, TranslationEntry& e) {
    e = TranslationEntry{};
    j.at("uid").get_to(e.uid);
    read_if(j, "uida_keys_b64", e.uida_keys_b64);
    read_if(j, "uida_hash", e.uida_hash);
    j.at("key").get_to(e.key);
    j.at("locale").get_to(e.locale);
    read_if(j, "src_text", e.src_text);
    read_if(j, "dst_text", e.dst_text);
    read_if(j, "status", e.status);
    read_if(j, "language_file_uid", e.language_file_uid);
    read_if(j, "updated_at", e.updated_at);
    read_if(j, "qa_flags", e.qa_flags);
}

void to_json(nlohmann::json& j, const EntryDelta& d) {
    j = nlohmann::json{
        {"operation", d.operation},
        {"entry", d.entry},
        {"base_cid", optional_to_json(d.base_cid)},
    };
}

void from_json(const nlohmann::json& j, EntryDelta& d) {
    j.at("operation").get_to(d.operation);
    j.at("entry").get_to(d.entry);
    optional_from_json(j, "base_cid", d.base_cid);
}

// =============================================================================
// Protocol messages
// =============================================================================

void to_json(nlohmann::json& j, const ServerCapabilities& c) {
    j = nlohmann::json{
        {"supported_versions", c.supported_versions},
        {"max_chunk_size", c.max_chunk_size},
        {"max_concurrent_chunks", c.max_concurrent_chunks},
        {"compression", c.compression},
        {"supports_resume", c.supports_resume},
    };
}

void from_json(const nlohmann::json& j, ServerCapabilities& c) {
    c = ServerCapabilities{};
    read_if(j, "supported_versions", c.supported_versions);
    read_if(j, "max_chunk_size", c.max_chunk_size);
    read_if(j, "max_concurrent_chunks", c.max_concurrent_chunks);
    read_if(j, "compression", c.compression);
    read_if(j, "supports_resume", c.supports_resume);
}

void to_json(nlohmann::json& j, const HandshakeRequest& r) {
    j = nlohmann::json{
        {"client_id", r.client_id},
        {"session_id", r.session_id},
        {"protocol_version", r.protocol_version},
        {"bloom_filter", bytes_to_json(r.bloom_filter)},
    };
}

void from_json(const nlohmann::json& j, HandshakeRequest& r) {
    j.at("client_id").get_to(r.client_id);
    j.at("session_id").get_to(r.session_id);
    r.protocol_version = j.value("protocol_version", std::string{protocol_version_v1});
    r.bloom_filter = bytes_from_json(j.at("bloom_filter"));
}

void to_json(nlohmann::json& j, const HandshakeResponse& r) {
    j = nlohmann::json{
        {"session_id", r.session_id},
        {"protocol_version", r.protocol_version},
        {"missing_cids", r.missing_cids},
        {"session_expires_at", r.session_expires_at},
        {"chunk_size", r.chunk_size},
        {"max_concurrent_chunks", r.max_concurrent_chunks},
        {"full_resync_recommended", r.full_resync_recommended},
        {"capabilities", r.capabilities},
    };
}

void from_json(const nlohmann::json& j, HandshakeResponse& r) {
    r = HandshakeResponse{};
    j.at("session_id").get_to(r.session_id);
    read_if(j, "protocol_version", r.protocol_version);
    j.at("missing_cids").get_to(r.missing_cids);
    j.at("session_expires_at").get_to(r.session_expires_at);
    j.at("chunk_size").get_to(r.chunk_size);
    read_if(j, "max_concurrent_chunks", r.max_concurrent_chunks);
    read_if(j, "full_resync_recommended", r.full_resync_recommended);
    read_if(j, "capabilities", r.capabilities);
}

void to_json(nlohmann::json& j, const ChunkMessage& m) {
    j = nlohmann::json{
        {"session_id", m.session_id},
        {"cid", m.cid},
        {"chunk_index", m.chunk_index},
        {"total_chunks", m.total_chunks},
        {"data", bytes_to_json(m.data)},
        {"chunk_hash", m.chunk_hash},
        {"data_size", m.data_size},
        {"object_size", m.object_size},
    };
}

void from_json(const nlohmann::json& j, ChunkMessage& m) {
    j.at("session_id").get_to(m.session_id);
    j.at("cid").get_to(m.cid);
    j.at("chunk_index").get_to(m.chunk_index);
    j.at("total_chunks").get_to(m.total_chunks);
    m.data = bytes_from_json(j.at("data"));
    j.at("chunk_hash").get_to(m.chunk_hash);
    j.at("data_size").get_to(m.data_size);
    j.at("object_size").get_to(m.object_size);
}

void to_json(nlohmann::json& j, const ChunkAck& a) {
    j = nlohmann::json{
        {"accepted", a.accepted},
        {"session_id", a.session_id},
        {"cid", a.cid},
        {"chunk_index", a.chunk_index},
        {"object_complete", a.object_complete},
        {"bytes_received", a.bytes_received},
        {"object_size", a.object_size},
        {"next_chunk_index", optional_to_json(a.next_chunk_index)},
        {"error", optional_to_json(a.error)},
    };
}

void from_json(const nlohmann::json& j, ChunkAck& a) {
    a = ChunkAck{};
    j.at("accepted").get_to(a.accepted);
    read_if(j, "session_id", a.session_id);
    j.at("cid").get_to(a.cid);
    j.at("chunk_index").get_to(a.chunk_index);
    read_if(j, "object_complete", a.object_complete);
    read_if(j, "bytes_received", a.bytes_received);
    read_if(j, "object_size", a.object_size);
    optional_from_json(j, "next_chunk_index", a.next_chunk_index);
    optional_from_json(j, "error", a.error);
}

void to_json(nlohmann::json& j, const ChunkRequest& r) {
    j = nlohmann::json{
        {"session_id", r.session_id},
        {"cid", r.cid},
        {"chunk_index", r.chunk_index},
    };
}

void from_json(const nlohmann::json& j, ChunkRequest& r) {
    j.at("session_id").get_to(r.session_id);
    j.at("cid").get_to(r.cid);
    j.at("chunk_index").get_to(r.chunk_index);
}

void to_json(nlohmann::json& j, const CommitRequest& r) {
    j = nlohmann::json{
        {"session_id", r.session_id},
        {"payload_cid", r.payload_cid},
        {"payload", r.payload ? bytes_to_json(*r.payload) : nlohmann::json(nullptr)},
        {"merge_strategy", r.merge_strategy},
        {"conflict_policy", r.conflict_policy},
    };
}

void from_json(const nlohmann::json& j, CommitRequest& r) {
    r = CommitRequest{};
    j.at("session_id").get_to(r.session_id);
    j.at("payload_cid").get_to(r.payload_cid);
    if (auto it = j.find("payload"); it != j.end() && !it->is_null()) {
        r.payload = bytes_from_json(*it);
    }
    read_if(j, "merge_strategy", r.merge_strategy);
    read_if(j, "conflict_policy", r.conflict_policy);
}

void to_json(nlohmann::json& j, const ConflictReport& r) {
    j = nlohmann::json{
        {"uid", r.uid},
        {"key", r.key},
        {"locale", r.locale},
        {"type", r.type},
        {"fields", r.fields},
    };
}

void from_json(const nlohmann::json& j, ConflictReport& r) {
    r = ConflictReport{};
    j.at("uid").get_to(r.uid);
    read_if(j, "key", r.key);
    read_if(j, "locale", r.locale);
    j.at("type").get_to(r.type);
    read_if(j, "fields", r.fields);
}

void to_json(nlohmann::json& j, const CommitResponse& r) {
    j = nlohmann::json{
        {"session_id", r.session_id},
        {"payload_cid", r.payload_cid},
        {"applied", r.applied},
        {"replayed", r.replayed},
        {"processed", r.processed},
        {"created", r.created},
        {"updated", r.updated},
        {"deleted", r.deleted},
        {"unchanged", r.unchanged},
        {"conflict_count", r.conflict_count},
        {"error_count", r.error_count},
        {"conflicts", r.conflicts},
        {"errors", r.errors},
        {"committed_at", r.committed_at},
    };
}

void from_json(const nlohmann::json& j, CommitResponse& r) {
    r = CommitResponse{};
    read_if(j, "session_id", r.session_id);
    j.at("payload_cid").get_to(r.payload_cid);
    read_if(j, "applied", r.applied);
    read_if(j, "replayed", r.replayed);
    read_if(j, "processed", r.processed);
    read_if(j, "created", r.created);
    read_if(j, "updated", r.updated);
    read_if(j, "deleted", r.deleted);
    read_if(j, "unchanged", r.unchanged);
    read_if(j, "conflict_count", r.conflict_count);
    read_if(j, "error_count", r.error_count);
    read_if(j, "conflicts", r.conflicts);
    read_if(j, "errors", r.errors);
    read_if(j, "committed_at", r.committed_at);
}

void to_json(nlohmann::json& j, const SessionStats& s) {
    j = nlohmann::json{
        {"handshake_latency_ms", s.handshake_latency_ms},
        {"missing_cids", s.missing_cids},
        {"chunks_received", s.chunks_received},
        {"chunks_rejected", s.chunks_rejected},
        {"chunks_sent", s.chunks_sent},
        {"largest_chunk_bytes", s.largest_chunk_bytes},
        {"chunk_time_ms", s.chunk_time_ms},
        {"objects_received", s.objects_received},
        {"bytes_received", s.bytes_received},
        {"bytes_sent", s.bytes_sent},
        {"payloads_committed", s.payloads_committed},
        {"payloads_replayed", s.payloads_replayed},
        {"entries_processed", s.entries_processed},
        {"clean_merges", s.clean_merges},
        {"conflicted_merges", s.conflicted_merges},
        {"errors", s.errors},
    };
}

void from_json(const nlohmann::json& j, SessionStats& s) {
    s = SessionStats{};
    read_if(j, "handshake_latency_ms", s.handshake_latency_ms);
    read_if(j, "missing_cids", s.missing_cids);
    read_if(j, "chunks_received", s.chunks_received);
    read_if(j, "chunks_rejected", s.chunks_rejected);
    read_if(j, "chunks_sent", s.chunks_sent);
    read_if(j, "largest_chunk_bytes", s.largest_chunk_bytes);
    read_if(j, "chunk_time_ms", s.chunk_time_ms);
    read_if(j, "objects_received", s.objects_received);
    read_if(j, "bytes_received", s.bytes_received);
    read_if(j, "bytes_sent", s.bytes_sent);
    read_if(j, "payloads_committed", s.payloads_committed);
    read_if(j, "payloads_replayed", s.payloads_replayed);
    read_if(j, "entries_processed", s.entries_processed);
    read_if(j, "clean_merges", s.clean_merges);
    read_if(j, "conflicted_merges", s.conflicted_merges);
    read_if(j, "errors", s.errors);
}

void to_json(nlohmann::json& j, const SessionStatusResponse& r) {
    j = nlohmann::json{
        {"session_id", r.session_id},
        {"client_id", r.client_id},
        {"status", r.status},
        {"expires_at", r.expires_at},
        {"failure_reason", r.failure_reason},
        {"stats", r.stats},
    };
}

void from_json(const nlohmann::json& j, SessionStatusResponse& r) {
    r = SessionStatusResponse{};
    j.at("session_id").get_to(r.session_id);
    read_if(j, "client_id", r.client_id);
    j.at("status").get_to(r.status);
    read_if(j, "expires_at", r.expires_at);
    read_if(j, "failure_reason", r.failure_reason);
    read_if(j, "stats", r.stats);
}

void to_json(nlohmann::json& j, const Error& e) {
    auto context = nlohmann::json::object();
    if (!e.context.session_id.empty()) context["session_id"] = e.context.session_id;
    if (!e.context.cid.empty()) context["cid"] = e.context.cid;
    if (e.context.chunk_index) context["chunk_index"] = *e.context.chunk_index;
    j = nlohmann::json{
        {"kind", to_string_view(e.kind)},
        {"message", e.message},
        {"context", std::move(context)},
    };
}

// =============================================================================
// Bytes
// =============================================================================

auto bytes_to_json(const std::vector<std::byte>& bytes) -> nlohmann::json {
    return encoding::base64_encode(bytes);
}

auto bytes_from_json(const nlohmann::json& j) -> std::vector<std::byte> {
    auto decoded = encoding::base64_decode(j.get<std::string>());
    if (!decoded) throw std::invalid_argument{"invalid base64"};
    return std::move(*decoded);
}

}  // namespace l10n_sync
