/// @file bloom_filter.hpp
/// @brief Bloom filter over Cids, used by the sync handshake.
///
/// The client summarizes the objects it holds in a filter; the hub sends
/// back every object the filter does not claim. A false positive only
/// means an object is not sent this round, never that data is corrupted.

#pragma once

#include <l10n-sync/types.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace l10n_sync {

/// Filter dimensions.
struct BloomParameters {
    std::uint64_t bits{0};
    std::uint32_t hash_count{0};

    auto operator==(const BloomParameters&) const -> bool = default;
};

/// Standard sizing formula: m = -n ln p / (ln 2)^2, k = (m / n) ln 2.
/// Clamped to at least 8 bits and 1 hash. Throws std::invalid_argument
/// unless 0 < fp_rate < 1.
auto optimal_bloom_parameters(std::uint64_t expected_elements, double fp_rate)
    -> BloomParameters;

/// Fixed-size Bloom filter keyed by Cid.
///
/// Bit positions use Kirsch-Mitzenmacher double hashing: position i is
/// (h1 + i * h2) mod bits, with h1 and h2 the first two little-endian
/// 64-bit words of the digest. No false negatives.
class BloomFilter {
public:
    static constexpr std::uint8_t format_marker = 0xB1;

    /// Construct an empty filter. Throws std::invalid_argument if bits or
    /// hash_count is zero.
    BloomFilter(std::uint64_t bits, std::uint32_t hash_count);

    explicit BloomFilter(BloomParameters params)
        : BloomFilter{params.bits, params.hash_count} {}

    void add(const Cid& cid);

    /// False means definitely absent; true means possibly present.
    auto might_contain(const Cid& cid) const -> bool;

    auto bits() const -> std::uint64_t { return bits_; }
    auto hash_count() const -> std::uint32_t { return hash_count_; }
    auto inserted_count() const -> std::uint64_t { return inserted_; }

    /// Fraction of bits set.
    auto fill_ratio() const -> double;

    /// (1 - e^(-k n / m))^k for the current insert count.
    auto estimated_false_positive_rate() const -> double;

    /// marker | ULEB bits | ULEB hash_count | ULEB inserted | ceil(bits/8) bytes
    auto to_bytes() const -> std::vector<std::byte>;

    /// Returns nullopt on a bad marker, zero dimensions, or a bit array
    /// whose size does not match the declared bit count.
    static auto from_bytes(std::span<const std::byte> data) -> std::optional<BloomFilter>;

    auto operator==(const BloomFilter&) const -> bool = default;

private:
    std::uint64_t bits_;
    std::uint32_t hash_count_;
    std::uint64_t inserted_{0};
    std::vector<std::uint8_t> array_;

    template <typename F>
    void for_each_bit(const Cid& cid, F&& f) const;
};

}  // namespace l10n_sync
