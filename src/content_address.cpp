#include <l10n-sync/content_address.hpp>

#include "crypto/sha256.hpp"
#include "encoding/text.hpp"

#include <memory>

namespace l10n_sync {

struct CidBuilder::Impl {
    crypto::Sha256 sha;
};

CidBuilder::CidBuilder(HashAlgorithm algorithm)
    : algorithm_{algorithm}, impl_{std::make_unique<Impl>()} {}

CidBuilder::~CidBuilder() = default;
CidBuilder::CidBuilder(CidBuilder&&) noexcept = default;
auto CidBuilder::operator=(CidBuilder&&) noexcept -> CidBuilder& = default;

auto CidBuilder::update(std::span<const std::byte> bytes) -> CidBuilder& {
    impl_->sha.update(bytes);
    return *this;
}

auto CidBuilder::finish() -> Cid {
    return Cid{algorithm_, impl_->sha.finish()};
}

auto compute_cid(std::span<const std::byte> bytes, HashAlgorithm algorithm) -> Cid {
    switch (algorithm) {
        case HashAlgorithm::sha256:
            return Cid{algorithm, crypto::sha256(bytes)};
    }
    return Cid{algorithm, crypto::sha256(bytes)};
}

auto compute_cid(std::string_view text, HashAlgorithm algorithm) -> Cid {
    return compute_cid(encoding::as_bytes(text), algorithm);
}

auto verify_cid(std::span<const std::byte> bytes, const Cid& expected) -> bool {
    return compute_cid(bytes, expected.algorithm) == expected;
}

auto to_string(const Cid& cid) -> std::string {
    auto result = std::string{to_string_view(cid.algorithm)};
    result.push_back(':');
    result += encoding::to_hex(cid.digest);
    return result;
}

auto parse_cid(std::string_view text) -> std::optional<Cid> {
    auto colon = text.find(':');
    if (colon == std::string_view::npos) return std::nullopt;

    auto prefix = text.substr(0, colon);
    auto cid = Cid{};
    if (prefix == to_string_view(HashAlgorithm::sha256)) {
        cid.algorithm = HashAlgorithm::sha256;
    } else {
        return std::nullopt;
    }

    if (!encoding::from_hex(text.substr(colon + 1), cid.digest)) return std::nullopt;
    return cid;
}

}  // namespace l10n_sync
