#include <l10n-sync/bloom_filter.hpp>

#include "storage/deserializer.hpp"
#include "storage/serializer.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstring>
#include <stdexcept>

namespace l10n_sync {

namespace {

// Upper bound on a decoded filter (1 GiB of bits), so a hostile header
// cannot make us allocate unbounded memory.
constexpr auto max_filter_bits = std::uint64_t{8} * 1024 * 1024 * 1024;
constexpr auto max_hash_count = std::uint64_t{64};

auto load_le64(const std::byte* p) -> std::uint64_t {
    auto v = std::uint64_t{0};
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | static_cast<std::uint64_t>(p[i]);
    }
    return v;
}

}  // namespace

auto optimal_bloom_parameters(std::uint64_t expected_elements, double fp_rate)
    -> BloomParameters {
    if (!(fp_rate > 0.0 && fp_rate < 1.0)) {
        throw std::invalid_argument{"false positive rate must be in (0, 1)"};
    }
    const auto n = static_cast<double>(std::max<std::uint64_t>(expected_elements, 1));
    const auto ln2 = std::log(2.0);
    auto m = std::ceil(-n * std::log(fp_rate) / (ln2 * ln2));
    auto k = std::round((m / n) * ln2);
    return BloomParameters{
        .bits = std::max<std::uint64_t>(static_cast<std::uint64_t>(m), 8),
        .hash_count = std::max<std::uint32_t>(static_cast<std::uint32_t>(k), 1),
    };
}

BloomFilter::BloomFilter(std::uint64_t bits, std::uint32_t hash_count)
    : bits_{bits}, hash_count_{hash_count} {
    if (bits == 0) throw std::invalid_argument{"bloom filter needs at least one bit"};
    if (hash_count == 0) throw std::invalid_argument{"bloom filter needs at least one hash"};
    array_.assign(static_cast<std::size_t>((bits + 7) / 8), 0);
}

template <typename F>
void BloomFilter::for_each_bit(const Cid& cid, F&& f) const {
    const auto h1 = load_le64(cid.digest.data());
    // Force h2 odd so consecutive bit positions never collapse onto one bit
    const auto h2 = load_le64(cid.digest.data() + 8) | 1;
    for (std::uint32_t i = 0; i < hash_count_; ++i) {
        f((h1 + static_cast<std::uint64_t>(i) * h2) % bits_);
    }
}

void BloomFilter::add(const Cid& cid) {
    for_each_bit(cid, [this](std::uint64_t pos) {
        array_[pos >> 3] |= static_cast<std::uint8_t>(1u << (pos & 7));
    });
    ++inserted_;
}

auto BloomFilter::might_contain(const Cid& cid) const -> bool {
    auto present = true;
    for_each_bit(cid, [&](std::uint64_t pos) {
        if ((array_[pos >> 3] & (1u << (pos & 7))) == 0) present = false;
    });
    return present;
}

auto BloomFilter::fill_ratio() const -> double {
    auto set = std::uint64_t{0};
    for (auto b : array_) set += static_cast<std::uint64_t>(std::popcount(b));
    return static_cast<double>(set) / static_cast<double>(bits_);
}

auto BloomFilter::estimated_false_positive_rate() const -> double {
    const auto k = static_cast<double>(hash_count_);
    const auto n = static_cast<double>(inserted_);
    const auto m = static_cast<double>(bits_);
    return std::pow(1.0 - std::exp(-k * n / m), k);
}

auto BloomFilter::to_bytes() const -> std::vector<std::byte> {
    auto ser = storage::Serializer{};
    ser.write_u8(format_marker);
    ser.write_uleb128(bits_);
    ser.write_uleb128(hash_count_);
    ser.write_uleb128(inserted_);
    ser.write_bytes(std::as_bytes(std::span{array_}));
    return ser.take();
}

auto BloomFilter::from_bytes(std::span<const std::byte> data) -> std::optional<BloomFilter> {
    auto des = storage::Deserializer{data};

    auto marker = des.read_u8();
    if (!marker || *marker != format_marker) return std::nullopt;

    auto bits = des.read_uleb128();
    auto hashes = des.read_uleb128();
    auto inserted = des.read_uleb128();
    if (!bits || !hashes || !inserted) return std::nullopt;
    if (*bits == 0 || *bits > max_filter_bits) return std::nullopt;
    if (*hashes == 0 || *hashes > max_hash_count) return std::nullopt;

    const auto byte_len = static_cast<std::size_t>((*bits + 7) / 8);
    if (des.remaining() != byte_len) return std::nullopt;
    auto raw = des.read_bytes(byte_len);
    if (!raw) return std::nullopt;

    auto bf = BloomFilter{*bits, static_cast<std::uint32_t>(*hashes)};
    bf.inserted_ = *inserted;
    std::memcpy(bf.array_.data(), raw->data(), byte_len);
    return bf;
}

}  // namespace l10n_sync
