// =============================================================================
// railmr - Built-in Stage Bodies
// =============================================================================
// identity            map/reduce  re-emit every record unchanged
// sequence_signature  map         minimizer signature of a read (cacheable)
// count_by_key        reduce      number of records per key
// collapse_samples    reduce      per-sample multiplicity of a read sequence
// streaming           any         external command speaking the record codec
// =============================================================================

#ifndef RAILMR_STAGE_BUILTIN_BODIES_H
#define RAILMR_STAGE_BUILTIN_BODIES_H

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "railmr/stage/stage_body.h"

namespace railmr::stage {

inline constexpr std::int64_t kDefaultSignatureK = 12;
inline constexpr std::int64_t kDefaultSignatureW = 8;

/// @brief A minimizer and the offset of its first occurrence.
struct Minimizer {
    std::string kmer;
    std::uint32_t position = 0;

    bool operator==(const Minimizer&) const = default;
};

/// @brief Distinct (w, k) minimizers of @p sequence in order of first occurrence.
/// @note Ties inside a window go to the leftmost k-mer. Empty if shorter than k.
[[nodiscard]] std::vector<Minimizer> computeMinimizers(std::string_view sequence, std::size_t k,
                                                       std::size_t w);

/// @brief First TAB-separated field of a first-stage record value (the sample label).
[[nodiscard]] std::string_view sampleLabel(std::string_view value) noexcept;

void registerBuiltinBodies(StageRegistry& registry);

}  // namespace railmr::stage

#endif  // RAILMR_STAGE_BUILTIN_BODIES_H
