#include <l10n-sync/uida.hpp>

#include <l10n-sync/content_address.hpp>
#include <l10n-sync/error.hpp>

#include "encoding/text.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <string>
#include <utility>

namespace l10n_sync {

namespace {

constexpr auto reserved_namespace_key = std::string_view{"namespace"};

auto join(const std::vector<std::string>& parts) -> std::string {
    auto out = std::string{};
    for (const auto& p : parts) {
        if (!out.empty()) out += ", ";
        out += p;
    }
    return out;
}

void check_string(const std::string& s, std::string_view what) {
    if (!encoding::is_valid_utf8(s)) {
        throw CanonicalizationError{std::string{what} + " is not valid UTF-8"};
    }
}

// Integral floats serialize as integers, so 1.0 and 1 name the same key.
void normalize_numbers(nlohmann::json& v) {
    if (v.is_number_float()) {
        auto d = v.get<double>();
        if (std::trunc(d) == d && std::fabs(d) <= static_cast<double>(max_uida_integer)) {
            v = static_cast<std::int64_t>(d);
        }
        return;
    }
    if (v.is_structured()) {
        for (auto& e : v) normalize_numbers(e);
    }
}

void check_value(const nlohmann::json& v, std::size_t depth) {
    if (depth > max_uida_depth) {
        throw CanonicalizationError{"key map nested deeper than " +
                                    std::to_string(max_uida_depth) + " levels"};
    }

    switch (v.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::boolean:
            return;
        case nlohmann::json::value_t::number_integer: {
            auto i = v.get<std::int64_t>();
            if (i > max_uida_integer || i < -max_uida_integer) {
                throw CanonicalizationError{"integer " + std::to_string(i) +
                                            " is outside the I-JSON safe range"};
            }
            return;
        }
        case nlohmann::json::value_t::number_unsigned: {
            auto u = v.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(max_uida_integer)) {
                throw CanonicalizationError{"integer " + std::to_string(u) +
                                            " is outside the I-JSON safe range"};
            }
            return;
        }
        case nlohmann::json::value_t::number_float:
            if (!std::isfinite(v.get<double>())) {
                throw CanonicalizationError{"non-finite number in key map"};
            }
            return;
        case nlohmann::json::value_t::string:
            check_string(v.get_ref<const std::string&>(), "string value");
            return;
        case nlohmann::json::value_t::array:
            for (const auto& e : v) check_value(e, depth + 1);
            return;
        case nlohmann::json::value_t::object:
            for (auto it = v.begin(); it != v.end(); ++it) {
                check_string(it.key(), "object key");
                check_value(it.value(), depth + 1);
            }
            return;
        case nlohmann::json::value_t::binary:
            throw CanonicalizationError{"binary values are not allowed in a key map"};
        case nlohmann::json::value_t::discarded:
            break;
    }
    throw CanonicalizationError{"unsupported value in key map"};
}

}  // namespace

// -- NamespaceRegistry --------------------------------------------------------

auto NamespaceRegistry::minecraft_defaults() -> NamespaceRegistry {
    auto r = NamespaceRegistry{};
    r.register_namespace("mc.mod.item", {"mod_id", "item_id", "locale"});
    r.register_namespace("mc.mod.block", {"mod_id", "block_id", "locale"});
    r.register_namespace("mc.mod.entity", {"mod_id", "entity_id", "locale"});
    r.register_namespace("mc.mod.gui", {"mod_id", "gui_id", "locale"});
    r.register_namespace("mc.mod.recipe", {"mod_id", "recipe_id", "type"});
    r.register_namespace("mc.mod.advancement", {"mod_id", "advancement_id"});

    r.register_namespace("mc.resourcepack.lang", {"carrier_uid", "locale"});
    r.register_namespace("mc.resourcepack.texture", {"pack_id", "texture_path"});
    r.register_namespace("mc.resourcepack.model", {"pack_id", "model_path"});

    r.register_namespace("mc.datapack.lang", {"carrier_uid", "locale"});
    r.register_namespace("mc.datapack.recipe", {"pack_id", "recipe_id"});
    r.register_namespace("mc.datapack.advancement", {"pack_id", "advancement_id"});
    r.register_namespace("mc.datapack.loot_table", {"pack_id", "loot_table_id"});

    r.register_namespace("mc.vanilla.lang", {"key", "locale"});
    r.register_namespace("mc.vanilla.item", {"item_id"});
    r.register_namespace("mc.vanilla.block", {"block_id"});
    return r;
}

void NamespaceRegistry::register_namespace(std::string name, std::set<std::string> required_keys) {
    patterns_.insert_or_assign(std::move(name), std::move(required_keys));
}

auto NamespaceRegistry::contains(std::string_view name) const -> bool {
    return patterns_.find(name) != patterns_.end();
}

auto NamespaceRegistry::required_keys(std::string_view name) const
    -> std::optional<std::set<std::string>> {
    auto it = patterns_.find(name);
    if (it == patterns_.end()) return std::nullopt;
    return it->second;
}

auto NamespaceRegistry::namespaces() const -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    result.reserve(patterns_.size());
    for (const auto& [name, _] : patterns_) result.push_back(name);
    return result;
}

auto NamespaceRegistry::missing_keys(std::string_view name, const nlohmann::json& keys) const
    -> std::vector<std::string> {
    auto result = std::vector<std::string>{};
    auto it = patterns_.find(name);
    if (it == patterns_.end()) return result;
    for (const auto& k : it->second) {
        if (!keys.is_object() || !keys.contains(k)) result.push_back(k);
    }
    return result;
}

// -- Canonicalization ---------------------------------------------------------

auto canonicalize_uida(std::string_view ns, const nlohmann::json& keys)
    -> std::vector<std::byte> {
    if (ns.empty()) throw CanonicalizationError{"namespace must not be empty"};
    if (!encoding::is_valid_utf8(ns)) throw CanonicalizationError{"namespace is not valid UTF-8"};
    if (!keys.is_object()) throw CanonicalizationError{"key map must be a JSON object"};
    if (keys.contains(std::string{reserved_namespace_key})) {
        throw CanonicalizationError{"\"namespace\" is a reserved key"};
    }

    check_value(keys, 1);

    // nlohmann's object_t is a std::map, so every level serializes in
    // byte order of its keys.
    auto doc = keys;
    normalize_numbers(doc);
    doc[std::string{reserved_namespace_key}] = std::string{ns};
    auto text = doc.dump();

    auto bytes = encoding::as_bytes(text);
    return std::vector<std::byte>(bytes.begin(), bytes.end());
}

// -- UidaEncoder --------------------------------------------------------------

UidaEncoder::UidaEncoder() : registry_{NamespaceRegistry::minecraft_defaults()} {}

UidaEncoder::UidaEncoder(NamespaceRegistry registry) : registry_{std::move(registry)} {}

auto UidaEncoder::generate(std::string_view ns, const nlohmann::json& keys) const
    -> UidaComponents {
    auto canonical = canonicalize_uida(ns, keys);

    if (!registry_.contains(ns)) {
        SPDLOG_WARN("unknown UIDA namespace '{}'", ns);
    } else {
        auto missing = registry_.missing_keys(ns, keys);
        if (!missing.empty()) {
            SPDLOG_WARN("UIDA namespace '{}' is missing required keys: {}", ns, join(missing));
        }
    }

    auto digest = compute_cid(canonical);
    return UidaComponents{
        .canonical_bytes = canonical,
        .digest = digest,
        .keys_b64 = encoding::base64_encode(canonical),
        .hash_hex = encoding::to_hex(digest.digest),
    };
}

auto UidaEncoder::generate_translation_entry_uida(std::string_view mod_id,
                                                  std::string_view translation_key,
                                                  std::string_view locale,
                                                  std::string_view carrier_type,
                                                  std::optional<std::string> variant) const
    -> UidaComponents {
    auto keys = nlohmann::json::object();
    auto ns = std::string{"mc.mod.item"};

    auto first_dot = translation_key.find('.');
    auto second_dot = first_dot == std::string_view::npos
        ? std::string_view::npos
        : translation_key.find('.', first_dot + 1);

    if (carrier_type == "mod" && second_dot != std::string_view::npos) {
        auto type = translation_key.substr(0, first_dot);
        auto detected_mod = translation_key.substr(first_dot + 1, second_dot - first_dot - 1);
        auto item_id = translation_key.substr(second_dot + 1);

        if (type == "item") {
            ns = "mc.mod.item";
        } else if (type == "block") {
            ns = "mc.mod.block";
        } else if (type == "entity" || type == "entitytype") {
            ns = "mc.mod.entity";
        } else if (type == "gui" || type == "screen" || type == "container") {
            ns = "mc.mod.gui";
        }

        keys["mod_id"] = std::string{detected_mod.empty() ? mod_id : detected_mod};
        keys[std::string{type} + "_id"] = std::string{item_id};
        keys["locale"] = std::string{locale};
    } else {
        keys["mod_id"] = std::string{mod_id};
        keys["item_id"] = std::string{translation_key};
        keys["locale"] = std::string{locale};
    }

    if (variant) keys["variant"] = *variant;
    return generate(ns, keys);
}

auto UidaEncoder::generate_language_file_uida(std::string_view carrier_type,
                                              std::string_view carrier_uid,
                                              std::string_view locale,
                                              std::optional<std::string> file_path) const
    -> UidaComponents {
    auto ns = carrier_type == "data_pack" ? "mc.datapack.lang" : "mc.resourcepack.lang";

    auto keys = nlohmann::json::object();
    keys["carrier_type"] = std::string{carrier_type};
    keys["carrier_uid"] = std::string{carrier_uid};
    keys["locale"] = std::string{locale};
    if (file_path) keys["file_path"] = *file_path;
    return generate(ns, keys);
}

}  // namespace l10n_sync
