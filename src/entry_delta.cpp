#include <l10n-sync/entry_delta.hpp>

#include <l10n-sync/content_address.hpp>
#include <l10n-sync/error.hpp>
#include <l10n-sync/json.hpp>

#include "storage/compression.hpp"
#include "storage/deserializer.hpp"
#include "storage/envelope.hpp"
#include "storage/serializer.hpp"

#include <exception>
#include <string>
#include <utility>

namespace l10n_sync {

namespace {

constexpr std::uint8_t flag_deflate = 0x01;

// Upper bound on deltas in one payload; anything larger is a corrupt count.
constexpr std::uint64_t max_payload_deltas = 1'000'000;

[[noreturn]] void malformed(const std::string& what) {
    throw MalformedPayloadError{"malformed delta payload: " + what};
}

void write_record(storage::Serializer& ser, const EntryDelta& d) {
    const auto& e = d.entry;
    ser.write_u8(static_cast<std::uint8_t>(d.operation));
    ser.write_string(e.uid);
    ser.write_string(e.uida_keys_b64);
    ser.write_string(e.uida_hash);
    ser.write_string(e.key);
    ser.write_string(e.locale);
    ser.write_string(e.src_text);
    ser.write_string(e.dst_text);
    ser.write_u8(static_cast<std::uint8_t>(e.status));
    ser.write_string(e.language_file_uid);
    ser.write_timestamp(e.updated_at);
    if (e.qa_flags.empty()) {
        ser.write_string("");
    } else {
        auto j = nlohmann::json{};
        to_json(j, e.qa_flags);
        ser.write_string(j.dump());
    }
    ser.write_optional_cid(d.base_cid);
}

auto read_string(storage::Deserializer& des, const char* field) -> std::string {
    auto s = des.read_string();
    if (!s) malformed(std::string{"truncated "} + field);
    return std::move(*s);
}

auto read_record(std::span<const std::byte> bytes) -> EntryDelta {
    auto des = storage::Deserializer{bytes};
    auto d = EntryDelta{};

    auto op = des.read_u8();
    if (!op) malformed("truncated operation");
    if (*op < static_cast<std::uint8_t>(DeltaOperation::create) ||
        *op > static_cast<std::uint8_t>(DeltaOperation::del)) {
        malformed("unknown operation " + std::to_string(*op));
    }
    d.operation = static_cast<DeltaOperation>(*op);

    auto& e = d.entry;
    e.uid = read_string(des, "uid");
    e.uida_keys_b64 = read_string(des, "uida_keys_b64");
    e.uida_hash = read_string(des, "uida_hash");
    e.key = read_string(des, "key");
    e.locale = read_string(des, "locale");
    e.src_text = read_string(des, "src_text");
    e.dst_text = read_string(des, "dst_text");

    auto status = des.read_u8();
    if (!status) malformed("truncated status");
    if (*status > static_cast<std::uint8_t>(EntryStatus::rejected)) {
        malformed("unknown status " + std::to_string(*status));
    }
    e.status = static_cast<EntryStatus>(*status);

    e.language_file_uid = read_string(des, "language_file_uid");

    auto updated = des.read_timestamp();
    if (!updated) malformed("truncated updated_at");
    e.updated_at = *updated;

    auto qa = read_string(des, "qa_flags");
    if (!qa.empty()) {
        try {
            from_json(nlohmann::json::parse(qa), e.qa_flags);
        } catch (const std::exception& ex) {
            malformed(std::string{"bad qa_flags: "} + ex.what());
        }
    }

    auto base = des.read_optional_cid();
    if (!base) malformed("truncated base_cid");
    d.base_cid = *base;

    if (!des.at_end()) malformed("trailing bytes in record");
    return d;
}

auto encode_inner(std::span<const EntryDelta> deltas, Timestamp created_at)
    -> std::vector<std::byte> {
    auto records = storage::Serializer{};
    auto offsets = std::vector<std::uint64_t>{};
    offsets.reserve(deltas.size());
    for (const auto& d : deltas) {
        offsets.push_back(records.size());
        write_record(records, d);
    }

    auto inner = storage::Serializer{};
    inner.write_timestamp(created_at);
    inner.write_uleb128(deltas.size());
    for (auto off : offsets) inner.write_uleb128(off);
    inner.write_uleb128(records.size());
    inner.write_bytes(records.data());
    return inner.take();
}

auto decode_inner(std::span<const std::byte> inner) -> DeltaPayload {
    auto des = storage::Deserializer{inner};
    auto payload = DeltaPayload{};

    auto created = des.read_timestamp();
    if (!created) malformed("truncated created_at");
    payload.created_at = *created;

    auto count = des.read_uleb128();
    if (!count) malformed("truncated delta count");
    // Each offset takes at least one byte
    if (*count > max_payload_deltas || *count > des.remaining()) {
        malformed("implausible delta count " + std::to_string(*count));
    }

    auto offsets = std::vector<std::uint64_t>{};
    offsets.reserve(static_cast<std::size_t>(*count));
    for (std::uint64_t i = 0; i < *count; ++i) {
        auto off = des.read_uleb128();
        if (!off) malformed("truncated manifest");
        offsets.push_back(*off);
    }

    auto area_len = des.read_uleb128();
    if (!area_len) malformed("truncated record area length");
    if (*area_len != des.remaining()) malformed("record area length mismatch");
    auto area = *des.read_bytes(static_cast<std::size_t>(*area_len));

    if (offsets.empty()) {
        if (!area.empty()) malformed("records present with empty manifest");
        return payload;
    }
    if (offsets.front() != 0) malformed("first record offset is not zero");

    payload.deltas.reserve(offsets.size());
    for (std::size_t i = 0; i < offsets.size(); ++i) {
        auto begin = offsets[i];
        auto end = (i + 1 < offsets.size()) ? offsets[i + 1] : area.size();
        if (end <= begin || end > area.size()) {
            malformed("record offsets out of order at index " + std::to_string(i));
        }
        payload.deltas.push_back(read_record(
            area.subspan(static_cast<std::size_t>(begin), static_cast<std::size_t>(end - begin))));
    }
    return payload;
}

}  // namespace

auto parse_delta_operation(std::string_view text) -> std::optional<DeltaOperation> {
    for (auto op : {DeltaOperation::create, DeltaOperation::update, DeltaOperation::del}) {
        if (to_string_view(op) == text) return op;
    }
    return std::nullopt;
}

auto serialize_entry_delta(const TranslationEntry& entry, DeltaOperation operation,
                           std::optional<Cid> base_cid) -> EntryDelta {
    return EntryDelta{
        .operation = operation,
        .entry = entry,
        .base_cid = base_cid,
    };
}

auto deserialize_entry_delta(const EntryDelta& delta) -> TranslationEntry {
    return delta.entry;
}

auto create_delta_payload(std::span<const EntryDelta> deltas, Timestamp created_at)
    -> std::vector<std::byte> {
    auto inner = encode_inner(deltas, created_at);

    auto body = storage::Serializer{};
    body.write_u8(delta_payload_version);
    if (inner.size() > storage::deflate_threshold) {
        auto compressed = storage::deflate_compress(inner);
        if (compressed && compressed->size() < inner.size()) {
            body.write_u8(flag_deflate);
            body.write_uleb128(inner.size());
            body.write_bytes(*compressed);
        } else {
            body.write_u8(0);
            body.write_bytes(inner);
        }
    } else {
        body.write_u8(0);
        body.write_bytes(inner);
    }

    auto out = std::vector<std::byte>{};
    storage::write_envelope(storage::ObjectType::delta_payload, body.data(), out);
    return out;
}

auto decode_delta_payload(std::span<const std::byte> bytes) -> DeltaPayload {
    auto body = storage::open_envelope(bytes, storage::ObjectType::delta_payload);
    if (!body) malformed("bad envelope (magic, type, length or checksum)");

    auto des = storage::Deserializer{*body};
    auto version = des.read_u8();
    if (!version) malformed("missing format version");
    if (*version != delta_payload_version) {
        malformed("unsupported format version " + std::to_string(*version));
    }
    auto flags = des.read_u8();
    if (!flags) malformed("missing flags");
    if ((*flags & ~flag_deflate) != 0) malformed("unknown flags");

    if ((*flags & flag_deflate) == 0) {
        return decode_inner(body->subspan(des.pos()));
    }

    auto size = des.read_uleb128();
    if (!size) malformed("truncated uncompressed size");
    auto inflated = storage::deflate_decompress(body->subspan(des.pos()),
                                                static_cast<std::size_t>(*size));
    if (!inflated) malformed("deflate stream is corrupt");
    return decode_inner(*inflated);
}

auto parse_delta_payload(std::span<const std::byte> bytes) -> std::vector<EntryDelta> {
    return decode_delta_payload(bytes).deltas;
}

auto calculate_payload_cid(std::span<const std::byte> bytes) -> Cid {
    return compute_cid(bytes);
}

auto is_delta_payload(std::span<const std::byte> bytes) -> bool {
    auto header = storage::parse_envelope_header(bytes);
    return header && header->type == storage::ObjectType::delta_payload;
}

}  // namespace l10n_sync
