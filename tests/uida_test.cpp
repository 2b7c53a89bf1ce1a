#include <l10n-sync/error.hpp>
#include <l10n-sync/uida.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>

using namespace l10n_sync;
using json = nlohmann::json;

namespace {

auto text_of(const std::vector<std::byte>& bytes) -> std::string {
    return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

auto brass_ingot_keys() -> json {
    return json{{"mod_id", "create"}, {"item_id", "brass_ingot"}, {"locale", "zh_cn"}};
}

}  // namespace

// -- Canonical form -----------------------------------------------------------

TEST(Uida, canonical_form_sorts_keys_and_inserts_namespace) {
    auto bytes = canonicalize_uida("mc.mod.item", brass_ingot_keys());
    EXPECT_EQ(text_of(bytes),
              R"({"item_id":"brass_ingot","locale":"zh_cn","mod_id":"create","namespace":"mc.mod.item"})");
}

TEST(Uida, digest_and_display_forms_are_stable) {
    auto encoder = UidaEncoder{};
    auto uida = encoder.generate("mc.mod.item", brass_ingot_keys());

    EXPECT_EQ(uida.hash_hex, "5e318f3107f0064e976f276ee1ee8bc169875c3d44dd1f38bd4ef083ebf80a20");
    EXPECT_EQ(uida.keys_b64,
              "eyJpdGVtX2lkIjoiYnJhc3NfaW5nb3QiLCJsb2NhbGUiOiJ6aF9jbiIsIm1vZF9pZCI6ImNyZWF0ZSIs"
              "Im5hbWVzcGFjZSI6Im1jLm1vZC5pdGVtIn0=");
    EXPECT_EQ(uida.digest.algorithm, HashAlgorithm::sha256);
}

TEST(Uida, key_order_does_not_change_the_digest) {
    auto a = json::parse(R"({"mod_id":"create","item_id":"brass_ingot","locale":"zh_cn"})");
    auto b = json::parse(R"({"locale":"zh_cn","item_id":"brass_ingot","mod_id":"create"})");

    auto encoder = UidaEncoder{};
    EXPECT_EQ(encoder.generate("mc.mod.item", a).digest, encoder.generate("mc.mod.item", b).digest);
}

TEST(Uida, nested_objects_are_sorted_at_every_level) {
    auto keys = json::parse(R"({"z":{"b":1,"a":[{"d":true,"c":null}]},"a":"x"})");
    EXPECT_EQ(text_of(canonicalize_uida("test.ns", keys)),
              R"({"a":"x","namespace":"test.ns","z":{"a":[{"c":null,"d":true}],"b":1}})");
}

TEST(Uida, integral_floats_canonicalize_as_integers) {
    auto encoder = UidaEncoder{};
    EXPECT_EQ(encoder.generate("t", json{{"n", 1}}).digest,
              encoder.generate("t", json{{"n", 1.0}}).digest);
    EXPECT_EQ(text_of(canonicalize_uida("t", json{{"n", json::array({-2.0, 0.5, 3u})}})),
              R"({"n":[-2,0.5,3],"namespace":"t"})");
    EXPECT_NE(encoder.generate("t", json{{"n", 1}}).digest,
              encoder.generate("t", json{{"n", 1.5}}).digest);
}

TEST(Uida, any_key_change_changes_the_digest) {
    auto encoder = UidaEncoder{};
    auto base = encoder.generate("mc.mod.item", brass_ingot_keys());

    auto other_mod = brass_ingot_keys();
    other_mod["mod_id"] = "thermal";
    EXPECT_NE(encoder.generate("mc.mod.item", other_mod).digest, base.digest);

    EXPECT_NE(encoder.generate("mc.mod.block", brass_ingot_keys()).digest, base.digest);
}

TEST(Uida, unicode_values_are_kept_as_utf8) {
    auto keys = json{{"key", "item.minecraft.diamond"}, {"locale", "zh_cn"}, {"text", "钻石"}};
    auto text = text_of(canonicalize_uida("mc.vanilla.lang", keys));
    EXPECT_NE(text.find("钻石"), std::string::npos);
}

// -- Rejected input -----------------------------------------------------------

TEST(Uida, empty_namespace_is_rejected) {
    EXPECT_THROW(canonicalize_uida("", brass_ingot_keys()), CanonicalizationError);
}

TEST(Uida, non_object_key_map_is_rejected) {
    EXPECT_THROW(canonicalize_uida("mc.mod.item", json::array({1, 2})), CanonicalizationError);
    EXPECT_THROW(canonicalize_uida("mc.mod.item", json("brass")), CanonicalizationError);
}

TEST(Uida, reserved_namespace_key_is_rejected) {
    auto keys = brass_ingot_keys();
    keys["namespace"] = "sneaky";
    EXPECT_THROW(canonicalize_uida("mc.mod.item", keys), CanonicalizationError);
}

TEST(Uida, integers_outside_safe_range_are_rejected) {
    EXPECT_NO_THROW(canonicalize_uida("t", json{{"n", max_uida_integer}}));
    EXPECT_THROW(canonicalize_uida("t", json{{"n", max_uida_integer + 1}}), CanonicalizationError);
    EXPECT_THROW(canonicalize_uida("t", json{{"n", -max_uida_integer - 1}}), CanonicalizationError);
    EXPECT_THROW(canonicalize_uida("t", json{{"n", std::numeric_limits<std::uint64_t>::max()}}),
                 CanonicalizationError);
}

TEST(Uida, non_finite_numbers_are_rejected) {
    EXPECT_THROW(canonicalize_uida("t", json{{"x", std::nan("")}}), CanonicalizationError);
    EXPECT_THROW(canonicalize_uida("t", json{{"x", std::numeric_limits<double>::infinity()}}),
                 CanonicalizationError);
}

TEST(Uida, binary_values_are_rejected) {
    auto keys = json::object();
    keys["blob"] = json::binary({1, 2, 3});
    EXPECT_THROW(canonicalize_uida("t", keys), CanonicalizationError);
}

TEST(Uida, invalid_utf8_is_rejected) {
    auto keys = json{{"item_id", std::string{"\xC3\x28"}}};
    EXPECT_THROW(canonicalize_uida("t", keys), CanonicalizationError);
}

TEST(Uida, nesting_deeper_than_limit_is_rejected) {
    auto deep = json("leaf");
    for (std::size_t i = 0; i < max_uida_depth + 1; ++i) deep = json{{"k", deep}};
    EXPECT_THROW(canonicalize_uida("t", deep), CanonicalizationError);
}

// -- Registry and encoder helpers ---------------------------------------------

TEST(NamespaceRegistry, minecraft_defaults_know_required_keys) {
    auto registry = NamespaceRegistry::minecraft_defaults();
    EXPECT_TRUE(registry.contains("mc.mod.item"));
    EXPECT_TRUE(registry.contains("mc.datapack.loot_table"));
    EXPECT_FALSE(registry.contains("mc.mod.unknown"));

    auto required = registry.required_keys("mc.mod.block");
    ASSERT_TRUE(required.has_value());
    EXPECT_EQ(*required, (std::set<std::string>{"mod_id", "block_id", "locale"}));
}

TEST(NamespaceRegistry, missing_keys_lists_what_is_absent) {
    auto registry = NamespaceRegistry::minecraft_defaults();
    auto missing = registry.missing_keys("mc.mod.item", json{{"mod_id", "create"}});
    EXPECT_EQ(missing, (std::vector<std::string>{"item_id", "locale"}));
}

TEST(UidaEncoder, unknown_namespace_still_generates) {
    auto encoder = UidaEncoder{NamespaceRegistry{}};
    auto uida = encoder.generate("custom.thing", json{{"id", 1}});
    EXPECT_EQ(uida.hash_hex.size(), 64u);
}

TEST(UidaEncoder, translation_entry_uida_splits_typed_keys) {
    auto encoder = UidaEncoder{};
    auto from_key = encoder.generate_translation_entry_uida("ignored", "block.create.brass_casing",
                                                            "zh_cn");
    auto explicit_keys = encoder.generate(
        "mc.mod.block",
        json{{"mod_id", "create"}, {"block_id", "brass_casing"}, {"locale", "zh_cn"}});
    EXPECT_EQ(from_key.digest, explicit_keys.digest);
}

TEST(UidaEncoder, translation_entry_uida_falls_back_to_whole_key) {
    auto encoder = UidaEncoder{};
    auto uida = encoder.generate_translation_entry_uida("create", "tooltip", "en_us");
    auto expected = encoder.generate(
        "mc.mod.item", json{{"mod_id", "create"}, {"item_id", "tooltip"}, {"locale", "en_us"}});
    EXPECT_EQ(uida.digest, expected.digest);
}

TEST(UidaEncoder, language_file_uida_depends_on_carrier_type) {
    auto encoder = UidaEncoder{};
    auto pack = encoder.generate_language_file_uida("resource_pack", "pack-1", "zh_cn");
    auto data = encoder.generate_language_file_uida("data_pack", "pack-1", "zh_cn");
    EXPECT_NE(pack.digest, data.digest);
    EXPECT_NE(text_of(data.canonical_bytes).find("mc.datapack.lang"), std::string::npos);
}
