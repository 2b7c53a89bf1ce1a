#pragma once

// Hex and base64 text encodings for digests and byte blobs.
// Internal header, not installed.

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace l10n_sync::encoding {

inline auto to_hex(std::span<const std::byte> data) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(data.size() * 2);
    for (auto b : data) {
        auto v = static_cast<unsigned char>(b);
        result.push_back(hex_chars[v >> 4]);
        result.push_back(hex_chars[v & 0x0F]);
    }
    return result;
}

inline auto hex_nibble(char c) -> std::optional<unsigned char> {
    if (c >= '0' && c <= '9') return static_cast<unsigned char>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<unsigned char>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<unsigned char>(c - 'A' + 10);
    return std::nullopt;
}

// Decode exactly out.size() bytes of hex. Returns false on bad length or digit.
inline auto from_hex(std::string_view hex, std::span<std::byte> out) -> bool {
    if (hex.size() != out.size() * 2) return false;
    for (std::size_t i = 0; i < out.size(); ++i) {
        auto hi = hex_nibble(hex[i * 2]);
        auto lo = hex_nibble(hex[i * 2 + 1]);
        if (!hi || !lo) return false;
        out[i] = static_cast<std::byte>((*hi << 4) | *lo);
    }
    return true;
}

inline constexpr std::string_view base64_alphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

inline auto base64_encode(std::span<const std::byte> data) -> std::string {
    auto result = std::string{};
    const auto n = data.size();
    result.reserve(((n + 2) / 3) * 4);
    for (std::size_t i = 0; i < n; i += 3) {
        auto b0 = static_cast<unsigned char>(data[i]);
        auto b1 = (i + 1 < n) ? static_cast<unsigned char>(data[i + 1]) : 0u;
        auto b2 = (i + 2 < n) ? static_cast<unsigned char>(data[i + 2]) : 0u;
        result.push_back(base64_alphabet[b0 >> 2]);
        result.push_back(base64_alphabet[((b0 & 0x03) << 4) | (b1 >> 4)]);
        result.push_back((i + 1 < n) ? base64_alphabet[((b1 & 0x0F) << 2) | (b2 >> 6)] : '=');
        result.push_back((i + 2 < n) ? base64_alphabet[b2 & 0x3F] : '=');
    }
    return result;
}

// Strict decoder: rejects characters outside the alphabet and bad padding.
inline auto base64_decode(std::string_view encoded) -> std::optional<std::vector<std::byte>> {
    static const auto table = []() {
        auto t = std::array<int, 256>{};
        t.fill(-1);
        for (std::size_t i = 0; i < base64_alphabet.size(); ++i) {
            t[static_cast<unsigned char>(base64_alphabet[i])] = static_cast<int>(i);
        }
        return t;
    }();

    if (encoded.size() % 4 != 0) return std::nullopt;

    auto result = std::vector<std::byte>{};
    result.reserve((encoded.size() / 4) * 3);
    for (std::size_t i = 0; i < encoded.size(); i += 4) {
        const bool last = (i + 4 == encoded.size());
        auto pad = 0;
        auto v = std::array<int, 4>{};
        for (std::size_t j = 0; j < 4; ++j) {
            auto c = encoded[i + j];
            if (c == '=' && last && j >= 2) {
                ++pad;
                v[j] = 0;
                continue;
            }
            if (pad > 0) return std::nullopt;  // data after padding
            v[j] = table[static_cast<unsigned char>(c)];
            if (v[j] < 0) return std::nullopt;
        }
        result.push_back(static_cast<std::byte>((v[0] << 2) | (v[1] >> 4)));
        if (pad < 2) result.push_back(static_cast<std::byte>(((v[1] & 0x0F) << 4) | (v[2] >> 2)));
        if (pad < 1) result.push_back(static_cast<std::byte>(((v[2] & 0x03) << 6) | v[3]));
    }
    return result;
}

inline auto as_bytes(std::string_view text) -> std::span<const std::byte> {
    return std::as_bytes(std::span<const char>{text.data(), text.size()});
}

// Well-formed UTF-8 per RFC 3629: no overlongs, no surrogates, max U+10FFFF.
inline auto is_valid_utf8(std::string_view text) -> bool {
    const auto* p = reinterpret_cast<const unsigned char*>(text.data());
    const auto n = text.size();
    auto i = std::size_t{0};
    while (i < n) {
        const auto c = p[i];
        if (c < 0x80) { ++i; continue; }

        auto len = std::size_t{0};
        auto lo = static_cast<unsigned char>(0x80);
        auto hi = static_cast<unsigned char>(0xBF);
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c >= 0xE0 && c <= 0xEF) {
            len = 3;
            if (c == 0xE0) lo = 0xA0;
            if (c == 0xED) hi = 0x9F;
        } else if (c >= 0xF0 && c <= 0xF4) {
            len = 4;
            if (c == 0xF0) lo = 0x90;
            if (c == 0xF4) hi = 0x8F;
        } else {
            return false;
        }
        if (i + len > n) return false;
        if (p[i + 1] < lo || p[i + 1] > hi) return false;
        for (auto k = std::size_t{2}; k < len; ++k) {
            if (p[i + k] < 0x80 || p[i + k] > 0xBF) return false;
        }
        i += len;
    }
    return true;
}

}  // namespace l10n_sync::encoding
