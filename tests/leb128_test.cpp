#include "../src/encoding/leb128.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <initializer_list>
#include <limits>
#include <span>
#include <vector>

using namespace l10n_sync::encoding;

namespace {

auto uleb(std::uint64_t v) -> std::vector<std::byte> {
    auto out = std::vector<std::byte>{};
    encode_uleb128(v, out);
    return out;
}

auto sleb(std::int64_t v) -> std::vector<std::byte> {
    auto out = std::vector<std::byte>{};
    encode_sleb128(v, out);
    return out;
}

auto bytes(std::initializer_list<unsigned> values) -> std::vector<std::byte> {
    auto out = std::vector<std::byte>{};
    for (auto v : values) out.push_back(static_cast<std::byte>(v));
    return out;
}

}  // namespace

// -- Unsigned -----------------------------------------------------------------

TEST(Leb128, unsigned_boundaries_of_one_byte) {
    EXPECT_EQ(uleb(0), bytes({0x00}));
    EXPECT_EQ(uleb(127), bytes({0x7F}));
    EXPECT_EQ(uleb(128), bytes({0x80, 0x01}));
}

TEST(Leb128, sizes_used_on_the_wire) {
    // Default chunk size (2 MiB) and default filter width (2^23 bits)
    EXPECT_EQ(uleb(2u * 1024 * 1024), bytes({0x80, 0x80, 0x80, 0x01}));
    EXPECT_EQ(uleb(8'388'608), bytes({0x80, 0x80, 0x80, 0x04}));
}

TEST(Leb128, appends_to_existing_output) {
    auto out = bytes({0xB1});
    encode_uleb128(300, out);
    EXPECT_EQ(out, bytes({0xB1, 0xAC, 0x02}));
}

TEST(Leb128, decode_stops_at_last_byte) {
    auto input = bytes({0xAC, 0x02, 0xFF, 0xFF});
    auto r = decode_uleb128(input);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->value, 300u);
    EXPECT_EQ(r->bytes_read, 2u);
}

TEST(Leb128, max_uint64_takes_ten_bytes) {
    auto encoded = uleb(std::numeric_limits<std::uint64_t>::max());
    ASSERT_EQ(encoded.size(), 10u);
    EXPECT_EQ(encoded.back(), std::byte{0x01});

    auto r = decode_uleb128(encoded);
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->value, std::numeric_limits<std::uint64_t>::max());
}

TEST(Leb128, truncated_or_empty_is_nullopt) {
    EXPECT_FALSE(decode_uleb128(bytes({0x80})).has_value());
    EXPECT_FALSE(decode_uleb128(bytes({0xFF, 0xFF})).has_value());
    EXPECT_FALSE(decode_uleb128(std::span<const std::byte>{}).has_value());
}

TEST(Leb128, wider_than_64_bits_is_nullopt) {
    // Tenth byte may only carry the top bit
    auto too_big = bytes({0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x02});
    EXPECT_FALSE(decode_uleb128(too_big).has_value());

    auto too_long = bytes({0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x00});
    EXPECT_FALSE(decode_uleb128(too_long).has_value());
}

// -- Signed -------------------------------------------------------------------

TEST(Leb128, signed_sign_bit_forces_extra_byte) {
    EXPECT_EQ(sleb(0), bytes({0x00}));
    EXPECT_EQ(sleb(63), bytes({0x3F}));
    EXPECT_EQ(sleb(64), bytes({0xC0, 0x00}));
    EXPECT_EQ(sleb(-1), bytes({0x7F}));
    EXPECT_EQ(sleb(-64), bytes({0x40}));
    EXPECT_EQ(sleb(-65), bytes({0xBF, 0x7F}));
}

TEST(Leb128, signed_decode_extends_sign) {
    auto r = decode_sleb128(bytes({0xBF, 0x7F}));
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r->value, -65);
    EXPECT_EQ(r->bytes_read, 2u);
}

TEST(Leb128, timestamps_survive) {
    for (auto ms : {std::int64_t{1700000000123}, std::int64_t{-86'400'000},
                    std::numeric_limits<std::int64_t>::min(),
                    std::numeric_limits<std::int64_t>::max()}) {
        auto encoded = sleb(ms);
        auto r = decode_sleb128(encoded);
        ASSERT_TRUE(r.has_value()) << ms;
        EXPECT_EQ(r->value, ms);
        EXPECT_EQ(r->bytes_read, encoded.size());
    }
}

TEST(Leb128, signed_truncated_or_overlong_is_nullopt) {
    EXPECT_FALSE(decode_sleb128(bytes({0xC0})).has_value());
    EXPECT_FALSE(decode_sleb128(std::span<const std::byte>{}).has_value());
    auto overlong = std::vector<std::byte>(11, std::byte{0x80});
    overlong.push_back(std::byte{0x00});
    EXPECT_FALSE(decode_sleb128(overlong).has_value());
}
