#pragma once

// Byte stream serializer for payload records and filters.
// Internal header, not installed.

#include <l10n-sync/types.hpp>
#include "../encoding/leb128.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace l10n_sync::storage {

class Serializer {
public:
    void write_u8(std::uint8_t v) {
        data_.push_back(static_cast<std::byte>(v));
    }

    void write_bytes(std::span<const std::byte> bytes) {
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    void write_uleb128(std::uint64_t value) {
        encoding::encode_uleb128(value, data_);
    }

    void write_sleb128(std::int64_t value) {
        encoding::encode_sleb128(value, data_);
    }

    // Length-prefixed UTF-8 bytes.
    void write_string(std::string_view s) {
        write_uleb128(s.size());
        auto bytes = std::as_bytes(std::span<const char>{s.data(), s.size()});
        data_.insert(data_.end(), bytes.begin(), bytes.end());
    }

    void write_timestamp(Timestamp ts) {
        write_sleb128(ts.millis_since_epoch);
    }

    void write_cid(const Cid& cid) {
        write_u8(static_cast<std::uint8_t>(cid.algorithm));
        write_bytes(cid.digest);
    }

    // Presence byte (0/1) followed by the Cid.
    void write_optional_cid(const std::optional<Cid>& cid) {
        write_u8(cid ? 1 : 0);
        if (cid) write_cid(*cid);
    }

    auto size() const -> std::size_t { return data_.size(); }
    auto data() const -> const std::vector<std::byte>& { return data_; }
    auto take() -> std::vector<std::byte> { return std::move(data_); }

private:
    std::vector<std::byte> data_;
};

}  // namespace l10n_sync::storage
