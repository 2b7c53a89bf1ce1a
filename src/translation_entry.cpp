#include <l10n-sync/translation_entry.hpp>

#include <l10n-sync/content_address.hpp>

#include "storage/envelope.hpp"

#include <string>
#include <utility>

namespace l10n_sync {

auto parse_entry_status(std::string_view text) -> std::optional<EntryStatus> {
    for (auto s : {EntryStatus::untranslated, EntryStatus::in_progress,
                   EntryStatus::translated, EntryStatus::needs_review,
                   EntryStatus::approved, EntryStatus::rejected}) {
        if (to_string_view(s) == text) return s;
    }
    return std::nullopt;
}

namespace {

auto content_json(const TranslationEntry& e) -> nlohmann::json {
    return nlohmann::json{
        {"uid", e.uid},
        {"uida_keys_b64", e.uida_keys_b64},
        {"uida_hash", e.uida_hash},
        {"key", e.key},
        {"locale", e.locale},
        {"src_text", e.src_text},
        {"dst_text", e.dst_text},
        {"status", std::string{to_string_view(e.status)}},
        {"language_file_uid", e.language_file_uid},
    };
}

}  // namespace

auto entry_version_bytes(const TranslationEntry& entry) -> std::vector<std::byte> {
    auto text = content_json(entry).dump();
    auto body = std::as_bytes(std::span<const char>{text.data(), text.size()});
    auto out = std::vector<std::byte>{};
    storage::write_envelope(storage::ObjectType::entry_version, body, out);
    return out;
}

auto entry_version_cid(const TranslationEntry& entry) -> Cid {
    return compute_cid(entry_version_bytes(entry));
}

auto parse_entry_version(std::span<const std::byte> bytes)
    -> std::optional<TranslationEntry> {
    auto body = storage::open_envelope(bytes, storage::ObjectType::entry_version);
    if (!body) return std::nullopt;

    auto j = nlohmann::json::parse(
        reinterpret_cast<const char*>(body->data()),
        reinterpret_cast<const char*>(body->data()) + body->size(),
        nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;

    auto field = [&](const char* name) -> std::optional<std::string> {
        auto it = j.find(name);
        if (it == j.end() || !it->is_string()) return std::nullopt;
        return it->get<std::string>();
    };

    auto uid = field("uid");
    auto keys_b64 = field("uida_keys_b64");
    auto uida_hash = field("uida_hash");
    auto key = field("key");
    auto locale = field("locale");
    auto src = field("src_text");
    auto dst = field("dst_text");
    auto status_text = field("status");
    auto file_uid = field("language_file_uid");
    if (!uid || !keys_b64 || !uida_hash || !key || !locale || !src || !dst ||
        !status_text || !file_uid) {
        return std::nullopt;
    }
    auto status = parse_entry_status(*status_text);
    if (!status) return std::nullopt;

    auto e = TranslationEntry{};
    e.uid = std::move(*uid);
    e.uida_keys_b64 = std::move(*keys_b64);
    e.uida_hash = std::move(*uida_hash);
    e.key = std::move(*key);
    e.locale = std::move(*locale);
    e.src_text = std::move(*src);
    e.dst_text = std::move(*dst);
    e.status = *status;
    e.language_file_uid = std::move(*file_uid);
    return e;
}

}  // namespace l10n_sync
