#include <l10n-sync/bloom_filter.hpp>
#include <l10n-sync/content_address.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace l10n_sync;

namespace {

auto cids(std::size_t n, std::string_view prefix) -> std::vector<Cid> {
    auto result = std::vector<Cid>{};
    result.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        result.push_back(compute_cid(std::string{prefix} + std::to_string(i)));
    }
    return result;
}

}  // namespace

// -- Sizing -------------------------------------------------------------------

TEST(BloomParameters, standard_formula) {
    // n = 1000, p = 0.01 gives m = 9586 bits and k = 7
    auto params = optimal_bloom_parameters(1000, 0.01);
    EXPECT_EQ(params.bits, 9586u);
    EXPECT_EQ(params.hash_count, 7u);
}

TEST(BloomParameters, tiny_inputs_are_clamped) {
    auto params = optimal_bloom_parameters(0, 0.5);
    EXPECT_GE(params.bits, 8u);
    EXPECT_GE(params.hash_count, 1u);
}

TEST(BloomParameters, out_of_range_rate_throws) {
    EXPECT_THROW(optimal_bloom_parameters(10, 0.0), std::invalid_argument);
    EXPECT_THROW(optimal_bloom_parameters(10, 1.0), std::invalid_argument);
    EXPECT_THROW(optimal_bloom_parameters(10, -0.1), std::invalid_argument);
}

// -- Membership ---------------------------------------------------------------

TEST(BloomFilter, zero_dimensions_throw) {
    EXPECT_THROW(BloomFilter(0, 3), std::invalid_argument);
    EXPECT_THROW(BloomFilter(64, 0), std::invalid_argument);
}

TEST(BloomFilter, empty_filter_contains_nothing) {
    auto filter = BloomFilter{1024, 5};
    for (const auto& cid : cids(50, "absent-")) EXPECT_FALSE(filter.might_contain(cid));
    EXPECT_EQ(filter.fill_ratio(), 0.0);
    EXPECT_EQ(filter.estimated_false_positive_rate(), 0.0);
}

TEST(BloomFilter, no_false_negatives) {
    auto present = cids(2000, "present-");
    auto filter = BloomFilter{optimal_bloom_parameters(present.size(), 0.01)};
    for (const auto& cid : present) filter.add(cid);

    EXPECT_EQ(filter.inserted_count(), present.size());
    for (const auto& cid : present) EXPECT_TRUE(filter.might_contain(cid));
}

TEST(BloomFilter, false_positive_rate_near_target) {
    auto present = cids(2000, "present-");
    auto filter = BloomFilter{optimal_bloom_parameters(present.size(), 0.01)};
    for (const auto& cid : present) filter.add(cid);

    auto hits = 0;
    auto absent = cids(10000, "absent-");
    for (const auto& cid : absent) hits += filter.might_contain(cid) ? 1 : 0;

    // Generous bound: 3x the configured rate
    EXPECT_LT(static_cast<double>(hits) / static_cast<double>(absent.size()), 0.03);
    EXPECT_NEAR(filter.estimated_false_positive_rate(), 0.01, 0.005);
}

TEST(BloomFilter, overfull_filter_reports_high_error_rate) {
    auto filter = BloomFilter{64, 3};
    for (const auto& cid : cids(500, "x")) filter.add(cid);
    EXPECT_GT(filter.estimated_false_positive_rate(), 0.9);
    EXPECT_GT(filter.fill_ratio(), 0.9);
}

// -- Wire form ----------------------------------------------------------------

TEST(BloomFilter, to_bytes_from_bytes_preserves_everything) {
    auto filter = BloomFilter{1000, 4};
    for (const auto& cid : cids(30, "obj-")) filter.add(cid);

    auto bytes = filter.to_bytes();
    EXPECT_EQ(bytes.front(), std::byte{BloomFilter::format_marker});

    auto decoded = BloomFilter::from_bytes(bytes);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, filter);
    EXPECT_EQ(decoded->inserted_count(), 30u);
}

TEST(BloomFilter, from_bytes_rejects_bad_marker) {
    auto bytes = BloomFilter{64, 2}.to_bytes();
    bytes[0] = std::byte{0x00};
    EXPECT_FALSE(BloomFilter::from_bytes(bytes).has_value());
}

TEST(BloomFilter, from_bytes_rejects_size_mismatch) {
    auto bytes = BloomFilter{64, 2}.to_bytes();
    auto longer = bytes;
    longer.push_back(std::byte{0});
    EXPECT_FALSE(BloomFilter::from_bytes(longer).has_value());

    bytes.pop_back();
    EXPECT_FALSE(BloomFilter::from_bytes(bytes).has_value());
}

TEST(BloomFilter, from_bytes_rejects_zero_and_absurd_dimensions) {
    // marker, bits = 0, hashes = 1, inserted = 0
    auto zero_bits = std::vector<std::byte>{std::byte{0xB1}, std::byte{0}, std::byte{1}, std::byte{0}};
    EXPECT_FALSE(BloomFilter::from_bytes(zero_bits).has_value());

    // marker, bits = 8, hashes = 100, inserted = 0, one byte of bits
    auto many_hashes = std::vector<std::byte>{std::byte{0xB1}, std::byte{8}, std::byte{100},
                                              std::byte{0}, std::byte{0}};
    EXPECT_FALSE(BloomFilter::from_bytes(many_hashes).has_value());
}

TEST(BloomFilter, from_bytes_rejects_empty_input) {
    EXPECT_FALSE(BloomFilter::from_bytes({}).has_value());
}
