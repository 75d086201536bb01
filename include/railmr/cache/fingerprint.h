// =============================================================================
// railmr - Work-unit Fingerprints
// =============================================================================
// 128-bit XXH3 digest of the semantically relevant input of a work unit:
// the stage body name, its canonical parameters and the unit's semantic input
// (for example a read sequence). Sample labels, read names, stage names and
// task indices never contribute, so identical work recurring in different
// samples maps onto the same cache entry.
// =============================================================================

#ifndef RAILMR_CACHE_FINGERPRINT_H
#define RAILMR_CACHE_FINGERPRINT_H

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace railmr::cache {

struct Fingerprint {
    std::uint64_t high = 0;
    std::uint64_t low = 0;

    /// @brief 32 lowercase hex digits.
    [[nodiscard]] std::string toHex() const;

    [[nodiscard]] static std::optional<Fingerprint> fromHex(std::string_view hex);

    bool operator==(const Fingerprint&) const = default;
};

/// @brief Incremental fingerprint over length-prefixed fields.
class FingerprintBuilder {
public:
    FingerprintBuilder();
    ~FingerprintBuilder();

    FingerprintBuilder(const FingerprintBuilder&) = delete;
    FingerprintBuilder& operator=(const FingerprintBuilder&) = delete;

    /// @brief Append one field as its length (8 bytes, little-endian) followed by its bytes.
    ///
    /// Field boundaries are part of the digest, and digests agree across hosts.
    FingerprintBuilder& add(std::string_view field);

    [[nodiscard]] Fingerprint finish() const;

private:
    void* state_;
};

/// @brief Unambiguous rendering of body parameters, one encoded record per key.
[[nodiscard]] std::string canonicalParams(const std::map<std::string, std::string>& params);

/// @brief Fingerprint of one work unit.
[[nodiscard]] Fingerprint fingerprintWorkUnit(std::string_view bodyName,
                                              std::string_view canonicalParameters,
                                              std::string_view semanticInput);

}  // namespace railmr::cache

#endif  // RAILMR_CACHE_FINGERPRINT_H
