/// @file config.hpp
/// @brief Tunables for the hub and client, loadable from JSON.

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace l10n_sync {

struct SyncConfig {
    // Transfer
    std::size_t chunk_size{2 * 1024 * 1024};
    std::size_t max_chunk_size{8 * 1024 * 1024};
    std::size_t max_concurrent_chunks{4};
    std::uint64_t max_object_size{256 * 1024 * 1024};
    std::uint64_t max_session_buffer_bytes{512 * 1024 * 1024};  ///< Partial uploads held per session.

    // Sessions
    std::chrono::milliseconds session_ttl{std::chrono::hours{1}};
    std::size_t session_archive_limit{1000};

    // Bloom filter
    std::uint64_t bloom_bits{8'388'608};
    std::uint32_t bloom_hashes{7};
    double max_false_positive_rate{0.01};

    // Commit
    std::size_t max_commit_retries{3};
    std::size_t outbox_batch_size{500};
    std::chrono::milliseconds idempotency_retention{std::chrono::hours{24}};
    std::chrono::milliseconds maintenance_lock_ttl{std::chrono::minutes{5}};

    std::string protocol_version{"v1"};
    std::string log_level{"info"};

    /// Throws ConfigError naming the first invalid field.
    void validate() const;
};

/// Overlay the keys present in j onto the defaults, then validate. Unknown
/// keys are ignored. Throws ConfigError on a wrong type or bad value.
auto config_from_json(const nlohmann::json& j) -> SyncConfig;

auto config_to_json(const SyncConfig& config) -> nlohmann::json;

/// Read a JSON config file. Throws ConfigError if it cannot be read or parsed.
auto load_config(const std::filesystem::path& path) -> SyncConfig;

/// Set the default spdlog logger's level from config.log_level.
void configure_logging(const SyncConfig& config);

}  // namespace l10n_sync
