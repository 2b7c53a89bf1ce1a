// basic_usage: identity, content addressing and merging of translation entries
//
// Demonstrates: UidaEncoder, entry_version_cid, MergeEngine,
//               OverrideChainProcessor

#include <l10n-sync/l10n_sync.hpp>

#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace ls = l10n_sync;

static auto make_entry(std::string dst, ls::EntryStatus status) -> ls::TranslationEntry {
    auto e = ls::TranslationEntry{};
    e.uid = "create:block.create.andesite_casing:zh_cn";
    e.key = "block.create.andesite_casing";
    e.locale = "zh_cn";
    e.src_text = "Andesite Casing";
    e.dst_text = std::move(dst);
    e.status = status;
    return e;
}

int main() {
    // --- UIDA: the same key always yields the same identity ---
    auto encoder = ls::UidaEncoder{};
    auto uida = encoder.generate_translation_entry_uida(
        "create", "block.create.andesite_casing", "zh_cn");
    std::printf("uida keys:  %s\n", uida.keys_b64.c_str());
    std::printf("uida hash:  %s\n", uida.hash_hex.c_str());

    // --- Entry versions are content addressed ---
    auto base = make_entry("安山岩机壳", ls::EntryStatus::translated);
    base.uida_keys_b64 = uida.keys_b64;
    base.uida_hash = uida.hash_hex;
    std::printf("version:    %s\n", ls::to_string(ls::entry_version_cid(base)).c_str());

    // --- Three-way merge: disjoint edits merge cleanly ---
    auto engine = ls::MergeEngine{};
    auto local = base;
    local.dst_text = "安山岩外壳";
    auto remote = base;
    remote.status = ls::EntryStatus::approved;

    auto clean = engine.perform_three_way_merge(
        ls::MergeContext{.base = base, .local = local, .remote = remote});
    std::printf("\nclean merge: action=%s dst=\"%s\" status=%s\n",
                std::string{ls::to_string_view(clean.action)}.c_str(),
                clean.merged->dst_text.c_str(),
                std::string{ls::to_string_view(clean.merged->status)}.c_str());

    // --- Both sides edit the same field: kept for review ---
    remote = base;
    remote.dst_text = "安山岩框架";
    auto conflict = engine.perform_three_way_merge(
        ls::MergeContext{.base = base, .local = local, .remote = remote});
    std::printf("conflict:    type=%s status=%s pending=\"%s\"\n",
                std::string{ls::to_string_view(conflict.conflict_type)}.c_str(),
                std::string{ls::to_string_view(conflict.merged->status)}.c_str(),
                conflict.merged->qa_flags.merge_conflict->fields[0].remote_value.c_str());

    // --- Override chain: a manual fix outranks the mod's own text ---
    auto overrides = ls::OverrideChainProcessor{};
    auto mod = overrides.create_override_source("mod", "create", "Create", "0.5.1");
    auto claims = std::vector<ls::TranslationOverride>{
        overrides.convert_translation_entry(base, mod),
        overrides.create_manual_override(base.key, base.locale, "安山岩机壳(校对)", "reviewer"),
    };
    auto winner = overrides.process_override_chain(claims, base.key, base.locale);
    std::printf("\noverride winner: %s -> \"%s\"\n",
                winner->source.display_name().c_str(), winner->dst_text.c_str());
    for (const auto& issue : overrides.validate_override_chain(claims)) {
        std::printf("  issue: %s %s\n", issue.type.c_str(), issue.message.c_str());
    }

    return 0;
}
