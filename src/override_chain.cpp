#include <l10n-sync/override_chain.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace l10n_sync {

namespace {

auto group_key(const TranslationOverride& t) -> std::string {
    return t.key + ":" + t.locale;
}

auto lowercase(std::string_view s) -> std::string {
    auto out = std::string{s};
    std::ranges::transform(out, out.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Empty means "no opinion"; an untranslated status carries no value either.
auto has_value(const TranslationOverride& t, EntryField f) -> bool {
    switch (f) {
        case EntryField::key:      return !t.key.empty();
        case EntryField::src_text: return !t.src_text.empty();
        case EntryField::dst_text: return !t.dst_text.empty();
        case EntryField::status:   return t.status != EntryStatus::untranslated;
    }
    return false;
}

auto value_of(const TranslationOverride& t, EntryField f) -> std::string {
    switch (f) {
        case EntryField::key:      return t.key;
        case EntryField::src_text: return t.src_text;
        case EntryField::dst_text: return t.dst_text;
        case EntryField::status:   return std::string{to_string_view(t.status)};
    }
    return {};
}

void assign(TranslationOverride& target, const TranslationOverride& from, EntryField f) {
    switch (f) {
        case EntryField::key:      target.key = from.key; return;
        case EntryField::src_text: target.src_text = from.src_text; return;
        case EntryField::dst_text: target.dst_text = from.dst_text; return;
        case EntryField::status:   target.status = from.status; return;
    }
}

}  // namespace

auto parse_override_priority(std::string_view text) -> std::optional<OverridePriority> {
    for (auto p : {OverridePriority::manual_override, OverridePriority::resource_pack,
                   OverridePriority::data_pack, OverridePriority::mod,
                   OverridePriority::original}) {
        if (to_string_view(p) == text) return p;
    }
    return std::nullopt;
}

auto OverrideSource::display_name() const -> std::string {
    if (version) return source_name + " v" + *version;
    return source_name;
}

OverrideChainProcessor::OverrideChainProcessor()
    : default_locks_{
          {OverridePriority::manual_override, {EntryField::dst_text, EntryField::status}},
          {OverridePriority::resource_pack, {EntryField::key, EntryField::src_text, EntryField::dst_text}},
          {OverridePriority::data_pack, {EntryField::key}},
          {OverridePriority::mod, {EntryField::key, EntryField::src_text}},
          {OverridePriority::original, {}},
      } {}

auto OverrideChainProcessor::default_locked_fields(OverridePriority priority) const
    -> std::set<EntryField> {
    auto it = default_locks_.find(priority);
    return it == default_locks_.end() ? std::set<EntryField>{} : it->second;
}

auto OverrideChainProcessor::determine_source_priority(const nlohmann::json& source_info) const
    -> OverridePriority {
    auto type = std::string{"default"};
    if (source_info.is_object()) {
        auto it = source_info.find("type");
        if (it != source_info.end() && it->is_string()) type = lowercase(it->get<std::string>());
    }
    auto flag = [&](const char* name) {
        if (!source_info.is_object()) return false;
        auto it = source_info.find(name);
        return it != source_info.end() && it->is_boolean() && it->get<bool>();
    };

    if (type == "override" || type == "manual_override" || flag("is_manual_override")) {
        return OverridePriority::manual_override;
    }
    if (type.find("resource") != std::string::npos) return OverridePriority::resource_pack;
    if (type.find("data") != std::string::npos) return OverridePriority::data_pack;
    if (type == "mod" || flag("is_mod")) return OverridePriority::mod;
    return OverridePriority::original;
}

auto OverrideChainProcessor::create_override_source(std::string_view source_type,
                                                    std::string source_id,
                                                    std::string source_name,
                                                    std::optional<std::string> version,
                                                    std::optional<std::string> pack_uid,
                                                    std::optional<std::string> language_file_uid) const
    -> OverrideSource {
    auto priority = parse_override_priority(lowercase(source_type))
                        .value_or(OverridePriority::original);
    return OverrideSource{
        .priority = priority,
        .source_id = std::move(source_id),
        .source_name = std::move(source_name),
        .version = std::move(version),
        .pack_uid = std::move(pack_uid),
        .language_file_uid = std::move(language_file_uid),
    };
}

auto OverrideChainProcessor::convert_translation_entry(
    const TranslationEntry& entry, const OverrideSource& source,
    std::optional<std::set<EntryField>> locked_fields) const -> TranslationOverride {
    auto t = TranslationOverride{};
    t.key = entry.key;
    t.locale = entry.locale;
    t.src_text = entry.src_text;
    t.dst_text = entry.dst_text;
    t.status = entry.status;
    t.source = source;
    t.priority = source.priority;
    t.locked_fields = locked_fields ? std::move(*locked_fields)
                                    : default_locked_fields(source.priority);
    t.created_at = entry.updated_at;
    t.updated_at = entry.updated_at;
    return t;
}

auto OverrideChainProcessor::create_manual_override(std::string key, std::string locale,
                                                    std::string dst_text, std::string user_id,
                                                    std::optional<std::string> reason,
                                                    Timestamp now) const
    -> TranslationOverride {
    auto t = TranslationOverride{};
    t.key = std::move(key);
    t.locale = std::move(locale);
    t.dst_text = std::move(dst_text);
    t.status = EntryStatus::approved;
    t.source = OverrideSource{
        .priority = OverridePriority::manual_override,
        .source_id = "manual_override_" + user_id,
        .source_name = "manual override",
    };
    t.priority = OverridePriority::manual_override;
    t.locked_fields = {EntryField::dst_text, EntryField::status};
    t.metadata = nlohmann::json{
        {"user_id", user_id},
        {"reason", reason.value_or("manual override")},
        {"override_type", "manual"},
    };
    t.created_at = now;
    t.updated_at = now;

    SPDLOG_INFO("manual override for {}:{} by {}", t.key, t.locale, user_id);
    return t;
}

auto OverrideChainProcessor::process_override_chain(
    std::span<const TranslationOverride> translations, std::string_view key,
    std::string_view locale) const -> std::optional<TranslationOverride> {
    auto matching = std::vector<const TranslationOverride*>{};
    for (const auto& t : translations) {
        if (t.key == key && t.locale == locale) matching.push_back(&t);
    }
    if (matching.empty()) return std::nullopt;

    std::ranges::stable_sort(matching, [](const auto* a, const auto* b) {
        return outranks(a->priority, b->priority);
    });

    auto result = *matching.front();
    result.chain.clear();
    result.chain.push_back(result.source.display_name());
    if (matching.size() == 1) return result;

    for (auto f : {EntryField::src_text, EntryField::dst_text, EntryField::status}) {
        if (has_value(result, f) || result.is_field_locked(f)) continue;
        for (std::size_t i = 1; i < matching.size(); ++i) {
            if (has_value(*matching[i], f)) {
                assign(result, *matching[i], f);
                result.chain.push_back(matching[i]->source.display_name() + ":" +
                                       std::string{to_string_view(f)});
                break;
            }
        }
    }

    result.metadata["override_chain"] = result.chain;
    result.metadata["final_priority"] = std::string{to_string_view(result.priority)};

    SPDLOG_DEBUG("override chain for {}:{} resolved to {} ({} sources)", key, locale,
                 to_string_view(result.priority), matching.size());
    return result;
}

auto OverrideChainProcessor::batch_process_overrides(
    std::span<const TranslationOverride> translations, std::string_view locale) const
    -> std::map<std::string, TranslationOverride> {
    auto keys = std::set<std::string>{};
    for (const auto& t : translations) {
        if (t.locale == locale) keys.insert(t.key);
    }

    auto results = std::map<std::string, TranslationOverride>{};
    for (const auto& k : keys) {
        if (auto processed = process_override_chain(translations, k, locale)) {
            results.emplace(k, std::move(*processed));
        }
    }
    SPDLOG_INFO("processed override chains for {} keys in locale {}", results.size(), locale);
    return results;
}

auto OverrideChainProcessor::validate_override_chain(
    std::span<const TranslationOverride> translations) const -> std::vector<OverrideIssue> {
    auto issues = std::vector<OverrideIssue>{};

    auto groups = std::map<std::string, std::vector<const TranslationOverride*>>{};
    for (const auto& t : translations) groups[group_key(t)].push_back(&t);

    for (const auto& [gk, members] : groups) {
        auto seen = std::map<OverridePriority, std::size_t>{};
        for (const auto* t : members) ++seen[t->priority];
        for (const auto& [p, count] : seen) {
            if (count > 1) {
                issues.push_back(OverrideIssue{
                    .type = "duplicate_priority",
                    .key = gk,
                    .message = std::to_string(count) + " sources share priority " +
                               std::string{to_string_view(p)},
                    .severity = IssueSeverity::warning,
                });
            }
        }

        for (const auto* t : members) {
            if (t->priority != t->source.priority) {
                issues.push_back(OverrideIssue{
                    .type = "priority_mismatch",
                    .key = gk,
                    .message = "source " + t->source.display_name() + " ranks as " +
                               std::string{to_string_view(t->source.priority)} +
                               " but claims " + std::string{to_string_view(t->priority)},
                    .severity = IssueSeverity::warning,
                });
            }

            if (t->key.empty() || t->locale.empty()) {
                issues.push_back(OverrideIssue{
                    .type = "missing_required_field",
                    .key = gk,
                    .message = "source " + t->source.display_name() + " has no " +
                               (t->key.empty() ? "key" : "locale"),
                    .severity = IssueSeverity::error,
                });
            }
            if (t->dst_text.empty() && (t->status == EntryStatus::translated ||
                                        t->status == EntryStatus::approved)) {
                issues.push_back(OverrideIssue{
                    .type = "missing_required_field",
                    .key = gk,
                    .message = "source " + t->source.display_name() + " is " +
                               std::string{to_string_view(t->status)} + " without dst_text",
                    .severity = IssueSeverity::error,
                });
            }

            // A lock held by a lower-ranked source that a higher-ranked one
            // sets differently can never take effect.
            for (auto f : t->locked_fields) {
                for (const auto* other : members) {
                    if (other == t || !outranks(other->priority, t->priority)) continue;
                    if (other->is_field_locked(f) || !has_value(*other, f)) continue;
                    if (value_of(*other, f) == value_of(*t, f)) continue;
                    issues.push_back(OverrideIssue{
                        .type = "priority_inversion",
                        .key = gk,
                        .message = std::string{to_string_view(f)} + " locked by " +
                                   t->source.display_name() + " is overridden by " +
                                   other->source.display_name(),
                        .severity = IssueSeverity::warning,
                    });
                }
            }

            if (t->is_field_locked(EntryField::key)) {
                auto differs = std::ranges::any_of(members, [&](const auto* other) {
                    return other != t && other->key != t->key;
                });
                if (differs) {
                    issues.push_back(OverrideIssue{
                        .type = "locked_key_conflict",
                        .key = gk,
                        .message = "key is locked but other sources use a different key",
                        .severity = IssueSeverity::error,
                    });
                }
            }
        }
    }
    return issues;
}

auto OverrideChainProcessor::get_override_statistics(
    std::span<const TranslationOverride> translations) const -> OverrideStatistics {
    auto stats = OverrideStatistics{};
    stats.total_translations = translations.size();
    for (auto p : {OverridePriority::manual_override, OverridePriority::resource_pack,
                   OverridePriority::data_pack, OverridePriority::mod,
                   OverridePriority::original}) {
        stats.by_priority[p] = 0;
    }

    auto chained = std::set<std::string>{};
    for (const auto& t : translations) {
        ++stats.by_priority[t.priority];
        for (auto f : t.locked_fields) ++stats.locked_fields_count[f];
        if (t.overrides || t.overridden_by) chained.insert(group_key(t));
    }
    stats.override_chains = chained.size();
    return stats;
}

auto OverrideChainProcessor::apply_locked_overrides(
    MergeResult& result, std::span<const TranslationOverride> overrides) const
    -> std::vector<EntryField> {
    auto changed = std::vector<EntryField>{};
    if (!result.merged) return changed;

    auto& entry = *result.merged;
    auto winner = process_override_chain(overrides, entry.key, entry.locale);
    if (!winner) return changed;

    for (auto f : merge_fields) {
        if (!winner->is_field_locked(f) || !has_value(*winner, f)) continue;
        auto forced = value_of(*winner, f);
        if (field_value(entry, f) == forced) continue;
        set_field_value(entry, f, forced);
        changed.push_back(f);
    }

    if (!changed.empty()) {
        if (result.action == MergeAction::unchanged) result.action = MergeAction::updated;
        SPDLOG_DEBUG("locked overrides from {} changed {} fields of {}",
                     winner->source.display_name(), changed.size(), entry.uid);
    }
    return changed;
}

}  // namespace l10n_sync
