// Fuzz target for LEB128 framing: walks arbitrary input the way the payload
// and filter decoders do, mixing fixed reads with uleb and sleb fields.

#include "src/storage/deserializer.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto u = l10n_sync::encoding::decode_uleb128(span);
    auto s = l10n_sync::encoding::decode_sleb128(span);
    if (u && u->bytes_read > size) __builtin_trap();
    if (s && s->bytes_read > size) __builtin_trap();

    auto des = l10n_sync::storage::Deserializer{span};
    while (!des.at_end()) {
        auto tag = des.read_u8();
        if (!tag) break;
        const auto before = des.pos();
        auto ok = false;
        switch (*tag % 4) {
            case 0: ok = des.read_uleb128().has_value(); break;
            case 1: ok = des.read_timestamp().has_value(); break;
            case 2: ok = des.read_string().has_value(); break;
            default: ok = des.read_optional_cid().has_value(); break;
        }
        if (!ok) break;
        if (des.pos() < before || des.remaining() > size) __builtin_trap();
    }

    return 0;
}
