// =============================================================================
// railmr - Partition Sorter
// =============================================================================
// Splits a task's output stream into N partitions and sorts each by key,
// keeping arrival order among equal keys.
//
// Records are buffered per partition. When the buffered bytes exceed the
// memory limit every non-empty buffer is sorted and spilled as a run file;
// finish() merges each partition's runs with its in-memory tail. Runs are
// merged in spill order, which preserves stability across spills.
// =============================================================================

#ifndef RAILMR_SORT_PARTITION_SORTER_H
#define RAILMR_SORT_PARTITION_SORTER_H

#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

#include "railmr/common/types.h"
#include "railmr/format/partition_file.h"
#include "railmr/sort/merge_reader.h"
#include "railmr/sort/partitioner.h"

namespace railmr::sort {

struct PartitionSorterOptions {
    PartitionIndex partitions = 1;

    /// @brief Buffered bytes that trigger a spill.
    std::size_t memoryLimitBytes = kDefaultSortBufferMB * 1024 * 1024;

    /// @brief Directory for spill runs. Empty keeps everything in memory.
    std::filesystem::path spillDirectory;

    Compression spillCompression = Compression::kNone;
};

class PartitionSorter {
public:
    /// @brief Receives each partition, in index order, as a sorted stream.
    using PartitionSink = std::function<void(PartitionIndex, RecordSource&)>;

    /// @param partitioner Must outlive the sorter.
    PartitionSorter(const Partitioner& partitioner, PartitionSorterOptions options);

    /// @brief Removes any spill runs still on disk.
    ~PartitionSorter();

    PartitionSorter(const PartitionSorter&) = delete;
    PartitionSorter& operator=(const PartitionSorter&) = delete;

    void add(Record record);

    /// @brief Deliver every partition (including empty ones) to @p sink.
    /// @note May be called once.
    void finish(const PartitionSink& sink);

    [[nodiscard]] std::uint64_t recordsAdded() const noexcept { return sequence_; }

    [[nodiscard]] std::size_t spillCount() const noexcept { return spillCount_; }

private:
    struct Entry {
        Record record;
        std::uint64_t sequence;
    };

    void spill();

    [[nodiscard]] std::vector<Record> takeSorted(PartitionIndex partition);

    void removeRuns() noexcept;

    const Partitioner* partitioner_;
    PartitionSorterOptions options_;
    std::vector<std::vector<Entry>> buffers_;
    std::vector<std::vector<std::filesystem::path>> runs_;
    std::size_t bufferedBytes_ = 0;
    std::uint64_t sequence_ = 0;
    std::size_t spillCount_ = 0;
    bool finished_ = false;
};

/// @brief Partition and sort an in-memory stream.
[[nodiscard]] std::vector<std::vector<Record>> partitionAndSort(std::vector<Record> records,
                                                                PartitionIndex partitions,
                                                                const Partitioner& partitioner);

}  // namespace railmr::sort

#endif  // RAILMR_SORT_PARTITION_SORTER_H
