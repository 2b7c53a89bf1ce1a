#include "../src/storage/compression.hpp"
#include "../src/storage/deserializer.hpp"
#include "../src/storage/envelope.hpp"
#include "../src/storage/serializer.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace l10n_sync;
using namespace l10n_sync::storage;

namespace {

auto sample_body() -> std::vector<std::byte> {
    auto ser = Serializer{};
    ser.write_string("item.create.brass_ingot");
    ser.write_string("黄铜锭");
    ser.write_uleb128(300);
    return ser.take();
}

auto wrap(ObjectType type, const std::vector<std::byte>& body) -> std::vector<std::byte> {
    auto out = std::vector<std::byte>{};
    write_envelope(type, body, out);
    return out;
}

}  // namespace

// -- Envelope -----------------------------------------------------------------

TEST(Envelope, header_layout) {
    auto body = sample_body();
    auto bytes = wrap(ObjectType::delta_payload, body);

    ASSERT_GE(bytes.size(), 10u);
    EXPECT_EQ(bytes[0], std::byte{0x4C});
    EXPECT_EQ(bytes[1], std::byte{0x31});
    EXPECT_EQ(bytes[2], std::byte{0x30});
    EXPECT_EQ(bytes[3], std::byte{0x4E});
    EXPECT_EQ(bytes[8], std::byte{0x01});

    auto header = parse_envelope_header(bytes);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->type, ObjectType::delta_payload);
    EXPECT_EQ(header->body_length, body.size());
    EXPECT_EQ(header->body_offset + header->body_length, bytes.size());
}

TEST(Envelope, open_returns_the_body) {
    auto body = sample_body();
    auto bytes = wrap(ObjectType::entry_version, body);

    auto opened = open_envelope(bytes, ObjectType::entry_version);
    ASSERT_TRUE(opened.has_value());
    EXPECT_TRUE(std::equal(opened->begin(), opened->end(), body.begin(), body.end()));
}

TEST(Envelope, wrong_type_is_rejected) {
    auto bytes = wrap(ObjectType::entry_version, sample_body());
    EXPECT_FALSE(open_envelope(bytes, ObjectType::delta_payload).has_value());
}

TEST(Envelope, corrupted_body_fails_checksum) {
    auto bytes = wrap(ObjectType::delta_payload, sample_body());
    bytes.back() ^= std::byte{0x40};
    EXPECT_FALSE(open_envelope(bytes, ObjectType::delta_payload).has_value());
}

TEST(Envelope, trailing_bytes_are_rejected) {
    auto bytes = wrap(ObjectType::delta_payload, sample_body());
    bytes.push_back(std::byte{0});
    EXPECT_FALSE(open_envelope(bytes, ObjectType::delta_payload).has_value());
}

TEST(Envelope, truncation_is_rejected) {
    auto bytes = wrap(ObjectType::delta_payload, sample_body());
    bytes.resize(bytes.size() - 1);
    EXPECT_FALSE(open_envelope(bytes, ObjectType::delta_payload).has_value());
    EXPECT_FALSE(parse_envelope_header(std::span{bytes}.first(5)).has_value());
}

TEST(Envelope, bad_magic_and_unknown_type_are_rejected) {
    auto bytes = wrap(ObjectType::delta_payload, sample_body());
    auto bad_magic = bytes;
    bad_magic[0] = std::byte{'X'};
    EXPECT_FALSE(parse_envelope_header(bad_magic).has_value());

    auto bad_type = bytes;
    bad_type[8] = std::byte{0x7F};
    EXPECT_FALSE(parse_envelope_header(bad_type).has_value());
}

// -- Serializer / Deserializer ------------------------------------------------

TEST(Serializer, fields_read_back_in_order) {
    auto cid = Cid{};
    cid.digest[0] = std::byte{0xAA};

    auto ser = Serializer{};
    ser.write_u8(7);
    ser.write_string("zh_cn");
    ser.write_timestamp(Timestamp{-5});
    ser.write_optional_cid(cid);
    ser.write_optional_cid(std::nullopt);

    auto bytes = ser.take();
    auto des = Deserializer{bytes};
    EXPECT_EQ(des.read_u8(), 7);
    EXPECT_EQ(des.read_string(), "zh_cn");
    EXPECT_EQ(des.read_timestamp(), Timestamp{-5});
    auto present = des.read_optional_cid();
    ASSERT_TRUE(present.has_value());
    EXPECT_EQ(*present, cid);
    auto absent = des.read_optional_cid();
    ASSERT_TRUE(absent.has_value());
    EXPECT_FALSE(absent->has_value());
    EXPECT_TRUE(des.at_end());
}

TEST(Deserializer, string_longer_than_input_is_nullopt) {
    auto ser = Serializer{};
    ser.write_uleb128(100);
    ser.write_u8('a');
    auto bytes = ser.take();

    auto des = Deserializer{bytes};
    EXPECT_FALSE(des.read_string().has_value());
}

// -- Compression --------------------------------------------------------------

TEST(Compression, raw_deflate_round_trip) {
    auto text = std::string{};
    for (int i = 0; i < 200; ++i) text += "item.create.brass_ingot=黄铜锭\n";
    auto input = std::vector<std::byte>(reinterpret_cast<const std::byte*>(text.data()),
                                        reinterpret_cast<const std::byte*>(text.data()) + text.size());

    auto packed = deflate_compress(input);
    ASSERT_TRUE(packed.has_value());
    EXPECT_LT(packed->size(), input.size());

    auto unpacked = deflate_decompress(*packed, input.size());
    ASSERT_TRUE(unpacked.has_value());
    EXPECT_EQ(*unpacked, input);
}

TEST(Compression, size_disagreement_is_rejected) {
    auto input = std::vector<std::byte>(1000, std::byte{'z'});
    auto packed = deflate_compress(input);
    ASSERT_TRUE(packed.has_value());

    EXPECT_FALSE(deflate_decompress(*packed, input.size() - 1).has_value());
    EXPECT_FALSE(deflate_decompress(*packed, input.size() + 1).has_value());
}

TEST(Compression, garbage_does_not_inflate) {
    auto garbage = std::vector<std::byte>(64, std::byte{0xFF});
    EXPECT_FALSE(deflate_decompress(garbage, 128).has_value());
}

TEST(Compression, declared_size_above_cap_is_rejected) {
    auto input = std::vector<std::byte>(16, std::byte{'a'});
    auto packed = deflate_compress(input);
    ASSERT_TRUE(packed.has_value());
    EXPECT_FALSE(deflate_decompress(*packed, max_inflated_size + 1).has_value());
}
