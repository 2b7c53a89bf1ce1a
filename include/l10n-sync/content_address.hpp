/// @file content_address.hpp
/// @brief Content identifiers: compute, verify, format and parse CIDs.

#pragma once

#include <l10n-sync/types.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace l10n_sync {

/// Compute the content identifier of a byte payload.
///
/// Pure and deterministic: the same bytes always yield the same Cid.
/// The digest is computed incrementally, so inputs of any size are
/// hashed in full.
auto compute_cid(std::span<const std::byte> bytes,
                 HashAlgorithm algorithm = HashAlgorithm::sha256) -> Cid;

/// Convenience overload for text payloads.
auto compute_cid(std::string_view text,
                 HashAlgorithm algorithm = HashAlgorithm::sha256) -> Cid;

/// Check that bytes hash to the expected Cid (using the Cid's algorithm).
auto verify_cid(std::span<const std::byte> bytes, const Cid& expected) -> bool;

/// Format as "sha256:<64 lowercase hex digits>".
auto to_string(const Cid& cid) -> std::string;

/// Parse the "alg:hex" form. Returns nullopt for unknown algorithms or bad hex.
auto parse_cid(std::string_view text) -> std::optional<Cid>;

/// Incremental CID computation for data that arrives in pieces.
class CidBuilder {
public:
    explicit CidBuilder(HashAlgorithm algorithm = HashAlgorithm::sha256);
    ~CidBuilder();

    CidBuilder(const CidBuilder&) = delete;
    auto operator=(const CidBuilder&) -> CidBuilder& = delete;
    CidBuilder(CidBuilder&&) noexcept;
    auto operator=(CidBuilder&&) noexcept -> CidBuilder&;

    /// Feed more bytes.
    auto update(std::span<const std::byte> bytes) -> CidBuilder&;

    /// Produce the Cid of everything fed so far. Resets the builder.
    auto finish() -> Cid;

private:
    struct Impl;
    HashAlgorithm algorithm_;
    std::unique_ptr<Impl> impl_;
};

}  // namespace l10n_sync
