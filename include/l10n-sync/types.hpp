/// @file types.hpp
/// @brief Core value types: HashAlgorithm, Cid, Timestamp, Clock.

#pragma once

#include <algorithm>
#include <array>
#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace l10n_sync {

/// Digest algorithm family tag carried by every CID.
enum class HashAlgorithm : std::uint8_t {
    sha256 = 0x12,  ///< SHA-256, 32-byte digest (multihash code).
};

/// Textual prefix of an algorithm, as used in "alg:hex" CID strings.
constexpr auto to_string_view(HashAlgorithm alg) noexcept -> std::string_view {
    switch (alg) {
        case HashAlgorithm::sha256: return "sha256";
    }
    return "unknown";
}

/// A content identifier: algorithm tag plus a 32-byte digest.
///
/// Objects are content-addressed: identical bytes always produce the
/// same Cid, which is the basis for deduplication and integrity checks.
/// Ordering compares the algorithm first, then the raw digest bytes.
struct Cid {
    static constexpr std::size_t digest_size = 32;  ///< Fixed digest size in bytes.

    HashAlgorithm algorithm{HashAlgorithm::sha256};  ///< Digest family.
    std::array<std::byte, digest_size> digest{};     ///< Raw digest bytes.

    constexpr Cid() = default;

    /// Construct from an algorithm and a digest.
    constexpr Cid(HashAlgorithm alg, std::array<std::byte, digest_size> d)
        : algorithm{alg}, digest{d} {}

    auto operator<=>(const Cid&) const = default;
    auto operator==(const Cid&) const -> bool = default;

    /// Check if the digest is all zeros (default-constructed).
    auto is_zero() const -> bool {
        return std::ranges::all_of(digest, [](std::byte b) {
            return b == std::byte{0};
        });
    }
};

/// Milliseconds since the Unix epoch.
struct Timestamp {
    std::int64_t millis_since_epoch{0};

    auto operator<=>(const Timestamp&) const = default;
    auto operator==(const Timestamp&) const -> bool = default;

    /// Shift by a duration.
    auto operator+(std::chrono::milliseconds d) const -> Timestamp {
        return Timestamp{millis_since_epoch + d.count()};
    }
    auto operator-(std::chrono::milliseconds d) const -> Timestamp {
        return Timestamp{millis_since_epoch - d.count()};
    }
};

/// Source of wall-clock time. Injected so expiry is testable.
using Clock = std::function<Timestamp()>;

/// The system wall clock.
inline auto system_now() -> Timestamp {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return Timestamp{std::chrono::duration_cast<std::chrono::milliseconds>(now).count()};
}

/// Helper for std::visit with multiple lambdas.
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace l10n_sync

/// @cond HASH_SPECIALIZATIONS

template <>
struct std::hash<l10n_sync::Cid> {
    auto operator()(const l10n_sync::Cid& cid) const noexcept -> std::size_t {
        // Digest bytes are already uniformly distributed
        auto result = static_cast<std::size_t>(cid.algorithm);
        const auto* p = reinterpret_cast<const unsigned char*>(cid.digest.data());
        for (std::size_t i = 0; i < sizeof(std::size_t); ++i) {
            result = (result << 8) | p[i];
        }
        return result;
    }
};

/// @endcond
