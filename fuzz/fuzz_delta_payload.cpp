// Fuzz target for the delta payload decoder: any input must either decode
// or raise MalformedPayloadError, never crash or read out of bounds.

#include <l10n-sync/entry_delta.hpp>
#include <l10n-sync/error.hpp>
#include <l10n-sync/translation_entry.hpp>

#include <cstddef>
#include <cstdint>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    try {
        auto payload = l10n_sync::decode_delta_payload(span);
        // Re-encoding what decoded must decode again
        auto bytes = l10n_sync::create_delta_payload(payload.deltas, payload.created_at);
        (void)l10n_sync::decode_delta_payload(bytes);
    } catch (const l10n_sync::MalformedPayloadError&) {
    }

    // Entry version objects share the envelope format
    auto version = l10n_sync::parse_entry_version(span);
    (void)version;

    return 0;
}
