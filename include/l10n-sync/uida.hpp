/// @file uida.hpp
/// @brief UIDA: canonical namespace-scoped key encoding and identifiers.
///
/// A UIDA names a logical record (a translation entry, a language file)
/// by its structured key set rather than by an allocated id. The key map
/// and namespace are canonicalized to bytes and hashed; the digest is the
/// identifier.
///
/// Canonical form: the namespace is inserted under the reserved key
/// "namespace", keys are sorted by UTF-8 bytes at every level, and the
/// result is compact JSON text (no insignificant whitespace). Only the
/// I-JSON value subset is accepted.
///
/// @code
/// auto encoder = UidaEncoder{};
/// auto uida = encoder.generate("mc.mod.item",
///     {{"mod_id", "create"}, {"item_id", "brass_ingot"}, {"locale", "zh_cn"}});
/// auto id = uida.hash_hex;
/// @endcode

#pragma once

#include <l10n-sync/types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace l10n_sync {

/// Result of encoding one key set.
struct UidaComponents {
    std::vector<std::byte> canonical_bytes;  ///< Canonical JSON text as bytes.
    Cid digest;                              ///< Cid of canonical_bytes.
    std::string keys_b64;                    ///< Base64 of canonical_bytes, for display.
    std::string hash_hex;                    ///< Hex of the digest.

    auto operator==(const UidaComponents&) const -> bool = default;
};

/// Maximum nesting depth accepted in a key map.
inline constexpr std::size_t max_uida_depth = 32;

/// Largest integer magnitude accepted (I-JSON safe range, 2^53 - 1).
inline constexpr std::int64_t max_uida_integer = 9007199254740991;

/// Namespace to required-key-set catalog.
///
/// Registries are plain values owned by whoever builds the encoder; there
/// is no process-wide catalog.
class NamespaceRegistry {
public:
    NamespaceRegistry() = default;

    /// The Minecraft namespaces (mc.mod.*, mc.resourcepack.*, mc.datapack.*,
    /// mc.vanilla.*).
    static auto minecraft_defaults() -> NamespaceRegistry;

    /// Add or replace a namespace.
    void register_namespace(std::string name, std::set<std::string> required_keys);

    auto contains(std::string_view name) const -> bool;
    auto required_keys(std::string_view name) const -> std::optional<std::set<std::string>>;
    auto namespaces() const -> std::vector<std::string>;

    /// Required keys of name that keys does not provide.
    auto missing_keys(std::string_view name, const nlohmann::json& keys) const
        -> std::vector<std::string>;

private:
    std::map<std::string, std::set<std::string>, std::less<>> patterns_;
};

/// Canonicalize a namespace and key map to bytes.
///
/// Throws CanonicalizationError for an empty namespace, a non-object key
/// map, a caller-supplied "namespace" key, non-finite numbers, integers
/// outside the I-JSON range, binary values, invalid UTF-8, or nesting
/// deeper than max_uida_depth.
auto canonicalize_uida(std::string_view ns, const nlohmann::json& keys)
    -> std::vector<std::byte>;

/// Encodes key sets against a namespace registry.
class UidaEncoder {
public:
    /// Use the Minecraft default registry.
    UidaEncoder();

    explicit UidaEncoder(NamespaceRegistry registry);

    /// Canonicalize and hash. Unknown namespaces and missing required
    /// keys are logged as warnings; they never fail generation.
    auto generate(std::string_view ns, const nlohmann::json& keys) const -> UidaComponents;

    /// UIDA for a translation entry. Keys of the form "type.mod.id" select
    /// the mc.mod.* namespace from their type prefix; anything else falls
    /// back to mc.mod.item with the whole key as item_id.
    auto generate_translation_entry_uida(std::string_view mod_id,
                                         std::string_view translation_key,
                                         std::string_view locale,
                                         std::string_view carrier_type = "mod",
                                         std::optional<std::string> variant = std::nullopt) const
        -> UidaComponents;

    /// UIDA for a language file inside a carrier (mod, resource pack, data pack).
    auto generate_language_file_uida(std::string_view carrier_type,
                                     std::string_view carrier_uid,
                                     std::string_view locale,
                                     std::optional<std::string> file_path = std::nullopt) const
        -> UidaComponents;

    auto registry() const -> const NamespaceRegistry& { return registry_; }

private:
    NamespaceRegistry registry_;
};

}  // namespace l10n_sync
