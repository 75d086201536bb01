// =============================================================================
// railmr - Work-unit Fingerprints Implementation
// =============================================================================

#include "railmr/cache/fingerprint.h"

#include <array>
#include <charconv>
#include <new>

#include <fmt/format.h>
#include <xxhash.h>

#include "railmr/format/record_codec.h"

namespace railmr::cache {

std::string Fingerprint::toHex() const {
    return fmt::format("{:016x}{:016x}", high, low);
}

std::optional<Fingerprint> Fingerprint::fromHex(std::string_view hex) {
    if (hex.size() != 32) {
        return std::nullopt;
    }
    Fingerprint fp;
    auto parse = [](std::string_view text, std::uint64_t& out) {
        auto result = std::from_chars(text.data(), text.data() + text.size(), out, 16);
        return result.ec == std::errc{} && result.ptr == text.data() + text.size();
    };
    if (!parse(hex.substr(0, 16), fp.high) || !parse(hex.substr(16), fp.low)) {
        return std::nullopt;
    }
    return fp;
}

FingerprintBuilder::FingerprintBuilder() : state_(XXH3_createState()) {
    if (state_ == nullptr) {
        throw std::bad_alloc();
    }
    XXH3_128bits_reset(static_cast<XXH3_state_t*>(state_));
}

FingerprintBuilder::~FingerprintBuilder() {
    XXH3_freeState(static_cast<XXH3_state_t*>(state_));
}

FingerprintBuilder& FingerprintBuilder::add(std::string_view field) {
    auto* state = static_cast<XXH3_state_t*>(state_);
    // Length prefix is 8 bytes, little-endian on every host
    const std::uint64_t length = field.size();
    std::array<std::uint8_t, 8> prefix{};
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        prefix[i] = static_cast<std::uint8_t>((length >> (i * 8)) & 0xFF);
    }
    XXH3_128bits_update(state, prefix.data(), prefix.size());
    XXH3_128bits_update(state, field.data(), field.size());
    return *this;
}

Fingerprint FingerprintBuilder::finish() const {
    XXH128_hash_t digest = XXH3_128bits_digest(static_cast<XXH3_state_t*>(state_));
    return Fingerprint{digest.high64, digest.low64};
}

std::string canonicalParams(const std::map<std::string, std::string>& params) {
    std::string out;
    for (const auto& [key, value] : params) {
        format::appendRecord(out, Record{key, value});
    }
    return out;
}

Fingerprint fingerprintWorkUnit(std::string_view bodyName, std::string_view canonicalParameters,
                                std::string_view semanticInput) {
    FingerprintBuilder builder;
    builder.add(bodyName).add(canonicalParameters).add(semanticInput);
    return builder.finish();
}

}  // namespace railmr::cache
