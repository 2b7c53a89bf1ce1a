// Fuzz target for BloomFilter::from_bytes: handshake filters arrive from
// untrusted clients.

#include <l10n-sync/bloom_filter.hpp>
#include <l10n-sync/content_address.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto filter = l10n_sync::BloomFilter::from_bytes(span);
    if (filter) {
        auto needle = l10n_sync::compute_cid(span);
        (void)filter->might_contain(needle);
        (void)filter->estimated_false_positive_rate();
    }

    return 0;
}
