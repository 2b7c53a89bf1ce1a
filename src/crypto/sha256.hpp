#pragma once

// Incremental SHA-256 (FIPS 180-4).
// Large objects are hashed in pieces as chunks arrive, so the context
// keeps a 64-byte block buffer and a 64-bit running length.
// Internal header, not installed.

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string_view>
#include <vector>

namespace l10n_sync::crypto {

namespace detail {

inline constexpr std::uint32_t k[64] = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5,
    0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3,
    0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc,
    0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7,
    0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13,
    0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3,
    0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5,
    0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208,
    0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
};

inline constexpr auto rotr(std::uint32_t x, unsigned n) -> std::uint32_t {
    return (x >> n) | (x << (32 - n));
}

inline auto load_be32(const std::byte* p) -> std::uint32_t {
    return (static_cast<std::uint32_t>(p[0]) << 24) |
           (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) |
           (static_cast<std::uint32_t>(p[3]));
}

inline void store_be32(std::byte* p, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        p[i] = static_cast<std::byte>(v >> (24 - 8 * i));
    }
}

}  // namespace detail

class Sha256 {
public:
    static constexpr std::size_t digest_size = 32;
    static constexpr std::size_t block_size = 64;

    using Digest = std::array<std::byte, digest_size>;

    Sha256() { reset(); }

    void reset() {
        state_ = {
            0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
            0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19,
        };
        buffered_ = 0;
        total_len_ = 0;
    }

    auto update(std::span<const std::byte> input) -> Sha256& {
        total_len_ += input.size();
        auto pos = std::size_t{0};

        // Top up a partially filled block first
        if (buffered_ > 0) {
            auto take = std::min(block_size - buffered_, input.size());
            std::memcpy(buffer_.data() + buffered_, input.data(), take);
            buffered_ += take;
            pos += take;
            if (buffered_ < block_size) return *this;
            compress(buffer_.data());
            buffered_ = 0;
        }

        for (; pos + block_size <= input.size(); pos += block_size) {
            compress(input.data() + pos);
        }

        if (pos < input.size()) {
            buffered_ = input.size() - pos;
            std::memcpy(buffer_.data(), input.data() + pos, buffered_);
        }
        return *this;
    }

    auto update(std::string_view text) -> Sha256& {
        return update(std::as_bytes(std::span<const char>{text.data(), text.size()}));
    }

    // Finish the hash. The context is reset afterwards and may be reused.
    auto finish() -> Digest {
        const auto bit_len = total_len_ * 8;

        auto tail = std::array<std::byte, block_size * 2>{};
        std::memcpy(tail.data(), buffer_.data(), buffered_);
        tail[buffered_] = std::byte{0x80};
        const auto tail_len = (buffered_ + 1 + 8 <= block_size) ? block_size : block_size * 2;
        for (int i = 0; i < 8; ++i) {
            tail[tail_len - 1 - static_cast<std::size_t>(i)] =
                static_cast<std::byte>(bit_len >> (8 * i));
        }
        for (std::size_t off = 0; off < tail_len; off += block_size) {
            compress(tail.data() + off);
        }

        auto out = Digest{};
        for (std::size_t i = 0; i < 8; ++i) {
            detail::store_be32(out.data() + i * 4, state_[i]);
        }
        reset();
        return out;
    }

private:
    void compress(const std::byte* block) {
        using detail::rotr;
        auto w = std::array<std::uint32_t, 64>{};
        for (std::size_t i = 0; i < 16; ++i) {
            w[i] = detail::load_be32(block + i * 4);
        }
        for (std::size_t i = 16; i < 64; ++i) {
            auto s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
            auto s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
            w[i] = w[i - 16] + s0 + w[i - 7] + s1;
        }

        auto v = state_;
        for (std::size_t i = 0; i < 64; ++i) {
            auto s1 = rotr(v[4], 6) ^ rotr(v[4], 11) ^ rotr(v[4], 25);
            auto ch = (v[4] & v[5]) ^ (~v[4] & v[6]);
            auto t1 = v[7] + s1 + ch + detail::k[i] + w[i];
            auto s0 = rotr(v[0], 2) ^ rotr(v[0], 13) ^ rotr(v[0], 22);
            auto maj = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
            auto t2 = s0 + maj;
            v[7] = v[6];
            v[6] = v[5];
            v[5] = v[4];
            v[4] = v[3] + t1;
            v[3] = v[2];
            v[2] = v[1];
            v[1] = v[0];
            v[0] = t1 + t2;
        }
        for (std::size_t i = 0; i < 8; ++i) {
            state_[i] += v[i];
        }
    }

    std::array<std::uint32_t, 8> state_{};
    std::array<std::byte, block_size> buffer_{};
    std::size_t buffered_{0};
    std::uint64_t total_len_{0};
};

// One-shot digest of a byte span.
inline auto sha256(std::span<const std::byte> input) -> Sha256::Digest {
    auto ctx = Sha256{};
    ctx.update(input);
    return ctx.finish();
}

inline auto sha256(const std::vector<std::byte>& input) -> Sha256::Digest {
    return sha256(std::span<const std::byte>{input});
}

}  // namespace l10n_sync::crypto
