// =============================================================================
// railmr - Partitioners
// =============================================================================
// Key -> partition index functions. A stage names its partitioner with a short
// textual spec carried in task descriptors:
//
//   hash              XXH64 of the whole key modulo N (default)
//   key-fields=S[,E]  hash of TAB-separated key fields S..E (1-based), so
//                     records that share a key prefix meet in one partition
//   range=k1,k2,...   total order: partition = number of split points <= key
//
// Records with equal partition keys always land in the same partition.
// =============================================================================

#ifndef RAILMR_SORT_PARTITIONER_H
#define RAILMR_SORT_PARTITIONER_H

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "railmr/common/error.h"
#include "railmr/common/types.h"

namespace railmr::sort {

/// @brief Maps a record key onto one of N partitions.
class Partitioner {
public:
    virtual ~Partitioner() = default;

    /// @pre partitions > 0
    [[nodiscard]] virtual PartitionIndex partition(std::string_view key,
                                                   PartitionIndex partitions) const = 0;
};

/// @brief XXH64 of the full key.
class HashPartitioner final : public Partitioner {
public:
    [[nodiscard]] PartitionIndex partition(std::string_view key,
                                           PartitionIndex partitions) const override;
};

/// @brief Hash of a contiguous range of TAB-separated key fields.
class KeyFieldPartitioner final : public Partitioner {
public:
    /// @param firstField 1-based first field.
    /// @param lastField 1-based last field, 0 meaning "to the end of the key".
    KeyFieldPartitioner(std::uint32_t firstField, std::uint32_t lastField);

    [[nodiscard]] PartitionIndex partition(std::string_view key,
                                           PartitionIndex partitions) const override;

    /// @brief The bytes of the key that participate in partitioning.
    [[nodiscard]] std::string_view partitionKey(std::string_view key) const noexcept;

private:
    std::uint32_t firstField_;
    std::uint32_t lastField_;
};

/// @brief Total-order partitioner over sorted split points.
class RangePartitioner final : public Partitioner {
public:
    explicit RangePartitioner(std::vector<std::string> splitPoints);

    [[nodiscard]] PartitionIndex partition(std::string_view key,
                                           PartitionIndex partitions) const override;

private:
    std::vector<std::string> splitPoints_;
};

// =============================================================================
// Partitioner Spec
// =============================================================================

struct PartitionerSpec {
    enum class Kind : std::uint8_t { kHash, kKeyFields, kRange };

    Kind kind = Kind::kHash;
    std::uint32_t firstField = 1;
    std::uint32_t lastField = 0;
    std::vector<std::string> splitPoints;

    /// @brief Parse "hash", "key-fields=S[,E]" ("kS[,E]" accepted) or "range=a,b,...".
    [[nodiscard]] static Result<PartitionerSpec> parse(std::string_view text);

    /// @brief Canonical text accepted by parse().
    [[nodiscard]] std::string toString() const;

    /// @brief Check the spec against the declared partition count.
    [[nodiscard]] VoidResult validate(PartitionIndex partitions) const;

    [[nodiscard]] std::unique_ptr<Partitioner> create() const;

    bool operator==(const PartitionerSpec&) const = default;
};

}  // namespace railmr::sort

#endif  // RAILMR_SORT_PARTITIONER_H
