#include <l10n-sync/config.hpp>

#include <l10n-sync/error.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <string_view>

namespace l10n_sync {

namespace {

constexpr auto known_levels = std::array<std::string_view, 8>{
    "trace", "debug", "info", "warn", "warning", "error", "critical", "off",
};

auto is_known_level(std::string_view level) -> bool {
    return std::ranges::find(known_levels, level) != known_levels.end();
}

template <typename T>
void read(const nlohmann::json& j, const char* name, T& out) {
    auto it = j.find(name);
    if (it == j.end()) return;
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError{std::string{"config field "} + name + ": " + e.what()};
    }
}

void read_millis(const nlohmann::json& j, const char* name, std::chrono::milliseconds& out) {
    auto ms = out.count();
    read(j, name, ms);
    out = std::chrono::milliseconds{ms};
}

}  // namespace

void SyncConfig::validate() const {
    if (chunk_size == 0) throw ConfigError{"chunk_size must be positive"};
    if (chunk_size > max_chunk_size) throw ConfigError{"chunk_size exceeds max_chunk_size"};
    if (max_concurrent_chunks == 0) throw ConfigError{"max_concurrent_chunks must be positive"};
    if (max_object_size == 0) throw ConfigError{"max_object_size must be positive"};
    if (max_session_buffer_bytes < chunk_size) {
        throw ConfigError{"max_session_buffer_bytes is smaller than chunk_size"};
    }
    if (session_ttl.count() <= 0) throw ConfigError{"session_ttl_ms must be positive"};
    if (bloom_bits == 0) throw ConfigError{"bloom_bits must be positive"};
    if (bloom_hashes == 0 || bloom_hashes > 64) throw ConfigError{"bloom_hashes must be in 1..64"};
    if (!(max_false_positive_rate > 0.0 && max_false_positive_rate < 1.0)) {
        throw ConfigError{"max_false_positive_rate must be in (0, 1)"};
    }
    if (outbox_batch_size == 0) throw ConfigError{"outbox_batch_size must be positive"};
    if (idempotency_retention.count() < 0) throw ConfigError{"idempotency_retention_ms is negative"};
    if (maintenance_lock_ttl.count() <= 0) throw ConfigError{"maintenance_lock_ttl_ms must be positive"};
    if (protocol_version != "v1") {
        throw ConfigError{"unsupported protocol_version " + protocol_version};
    }
    if (!is_known_level(log_level)) throw ConfigError{"unknown log_level " + log_level};
}

auto config_from_json(const nlohmann::json& j) -> SyncConfig {
    if (!j.is_object()) throw ConfigError{"config must be a JSON object"};

    auto c = SyncConfig{};
    read(j, "chunk_size", c.chunk_size);
    read(j, "max_chunk_size", c.max_chunk_size);
    read(j, "max_concurrent_chunks", c.max_concurrent_chunks);
    read(j, "max_object_size", c.max_object_size);
    read(j, "max_session_buffer_bytes", c.max_session_buffer_bytes);
    read_millis(j, "session_ttl_ms", c.session_ttl);
    read(j, "session_archive_limit", c.session_archive_limit);
    read(j, "bloom_bits", c.bloom_bits);
    read(j, "bloom_hashes", c.bloom_hashes);
    read(j, "max_false_positive_rate", c.max_false_positive_rate);
    read(j, "max_commit_retries", c.max_commit_retries);
    read(j, "outbox_batch_size", c.outbox_batch_size);
    read_millis(j, "idempotency_retention_ms", c.idempotency_retention);
    read_millis(j, "maintenance_lock_ttl_ms", c.maintenance_lock_ttl);
    read(j, "protocol_version", c.protocol_version);
    read(j, "log_level", c.log_level);
    c.validate();
    return c;
}

auto config_to_json(const SyncConfig& c) -> nlohmann::json {
    return nlohmann::json{
        {"chunk_size", c.chunk_size},
        {"max_chunk_size", c.max_chunk_size},
        {"max_concurrent_chunks", c.max_concurrent_chunks},
        {"max_object_size", c.max_object_size},
        {"max_session_buffer_bytes", c.max_session_buffer_bytes},
        {"session_ttl_ms", c.session_ttl.count()},
        {"session_archive_limit", c.session_archive_limit},
        {"bloom_bits", c.bloom_bits},
        {"bloom_hashes", c.bloom_hashes},
        {"max_false_positive_rate", c.max_false_positive_rate},
        {"max_commit_retries", c.max_commit_retries},
        {"outbox_batch_size", c.outbox_batch_size},
        {"idempotency_retention_ms", c.idempotency_retention.count()},
        {"maintenance_lock_ttl_ms", c.maintenance_lock_ttl.count()},
        {"protocol_version", c.protocol_version},
        {"log_level", c.log_level},
    };
}

auto load_config(const std::filesystem::path& path) -> SyncConfig {
    auto in = std::ifstream{path};
    if (!in) throw ConfigError{"cannot open config file " + path.string()};
    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) throw ConfigError{"config file " + path.string() + " is not valid JSON"};
    auto config = config_from_json(j);
    SPDLOG_INFO("loaded config from {}", path.string());
    return config;
}

void configure_logging(const SyncConfig& config) {
    spdlog::set_level(spdlog::level::from_str(config.log_level));
}

}  // namespace l10n_sync
