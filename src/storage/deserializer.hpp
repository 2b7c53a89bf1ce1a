#pragma once

// Byte stream deserializer for payload records and filters.
// Every read returns nullopt on truncation; callers decide whether that
// is a malformed payload or just "not this format".
// Internal header, not installed.

#include <l10n-sync/types.hpp>
#include "../encoding/leb128.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace l10n_sync::storage {

class Deserializer {
public:
    explicit Deserializer(std::span<const std::byte> data)
        : data_{data}, pos_{0} {}

    auto remaining() const -> std::size_t { return data_.size() - pos_; }
    auto pos() const -> std::size_t { return pos_; }
    auto at_end() const -> bool { return pos_ >= data_.size(); }

    auto read_u8() -> std::optional<std::uint8_t> {
        if (pos_ >= data_.size()) return std::nullopt;
        return static_cast<std::uint8_t>(data_[pos_++]);
    }

    auto read_bytes(std::size_t n) -> std::optional<std::span<const std::byte>> {
        if (n > remaining()) return std::nullopt;
        auto result = data_.subspan(pos_, n);
        pos_ += n;
        return result;
    }

    auto read_uleb128() -> std::optional<std::uint64_t> {
        auto result = encoding::decode_uleb128(data_.subspan(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result->value;
    }

    auto read_sleb128() -> std::optional<std::int64_t> {
        auto result = encoding::decode_sleb128(data_.subspan(pos_));
        if (!result) return std::nullopt;
        pos_ += result->bytes_read;
        return result->value;
    }

    auto read_string() -> std::optional<std::string> {
        auto len = read_uleb128();
        if (!len || *len > remaining()) return std::nullopt;
        auto bytes = read_bytes(static_cast<std::size_t>(*len));
        if (!bytes) return std::nullopt;
        return std::string{reinterpret_cast<const char*>(bytes->data()), bytes->size()};
    }

    auto read_timestamp() -> std::optional<Timestamp> {
        auto v = read_sleb128();
        if (!v) return std::nullopt;
        return Timestamp{*v};
    }

    auto read_cid() -> std::optional<Cid> {
        auto alg = read_u8();
        if (!alg || *alg != static_cast<std::uint8_t>(HashAlgorithm::sha256)) {
            return std::nullopt;
        }
        auto bytes = read_bytes(Cid::digest_size);
        if (!bytes) return std::nullopt;
        auto cid = Cid{};
        cid.algorithm = static_cast<HashAlgorithm>(*alg);
        std::memcpy(cid.digest.data(), bytes->data(), Cid::digest_size);
        return cid;
    }

    // Outer optional: read succeeded. Inner optional: Cid present.
    auto read_optional_cid() -> std::optional<std::optional<Cid>> {
        auto present = read_u8();
        if (!present || *present > 1) return std::nullopt;
        if (*present == 0) return std::optional<Cid>{};
        auto cid = read_cid();
        if (!cid) return std::nullopt;
        return std::optional<Cid>{*cid};
    }

private:
    std::span<const std::byte> data_;
    std::size_t pos_;
};

}  // namespace l10n_sync::storage
