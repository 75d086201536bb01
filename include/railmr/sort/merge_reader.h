// =============================================================================
// railmr - External Merge
// =============================================================================
// K-way merge of individually sorted record streams into one sorted stream,
// and grouping of that stream by key for reduce tasks.
//
// Memory is bounded by one buffered record per source. Ties between equal keys
// are broken by source index, then by position within the source, so merging
// the outputs of upstream tasks 0..T-1 in order preserves the stable order of
// the records each task produced.
// =============================================================================

#ifndef RAILMR_SORT_MERGE_READER_H
#define RAILMR_SORT_MERGE_READER_H

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <queue>
#include <vector>

#include "railmr/common/types.h"
#include "railmr/format/partition_file.h"

namespace railmr::sort {

/// @brief Pull-based record stream.
class RecordSource {
public:
    virtual ~RecordSource() = default;

    /// @return The next record, or nullopt when exhausted.
    [[nodiscard]] virtual std::optional<Record> next() = 0;
};

/// @brief Records held in memory, consumed front to back.
class VectorSource final : public RecordSource {
public:
    explicit VectorSource(std::vector<Record> records) : records_(std::move(records)) {}

    [[nodiscard]] std::optional<Record> next() override;

private:
    std::vector<Record> records_;
    std::size_t position_ = 0;
};

/// @brief Records read from a published partition file.
class FileSource final : public RecordSource {
public:
    explicit FileSource(const std::filesystem::path& path) : reader_(path) {}

    [[nodiscard]] std::optional<Record> next() override { return reader_.next(); }

private:
    format::PartitionReader reader_;
};

/// @brief Open one FileSource per path, in order.
/// @throws IOError(kMissingInput) naming the first missing file.
[[nodiscard]] std::vector<std::unique_ptr<RecordSource>> openFileSources(
    const std::vector<std::filesystem::path>& paths);

/// @brief Stable k-way merge of sorted sources.
class MergeReader final : public RecordSource {
public:
    explicit MergeReader(std::vector<std::unique_ptr<RecordSource>> sources);

    MergeReader(const MergeReader&) = delete;
    MergeReader& operator=(const MergeReader&) = delete;

    /// @throws FormatError(kCorruptedData) if a source is not sorted by key.
    [[nodiscard]] std::optional<Record> next() override;

    [[nodiscard]] std::uint64_t recordsRead() const noexcept { return recordsRead_; }

private:
    struct Head {
        Record record;
        std::size_t source;

        /// @brief Inverted so std::priority_queue yields the smallest (key, source).
        bool operator<(const Head& other) const {
            if (record.key != other.record.key) {
                return record.key > other.record.key;
            }
            return source > other.source;
        }
    };

    void advance(std::size_t source, const std::string* previousKey);

    std::vector<std::unique_ptr<RecordSource>> sources_;
    std::priority_queue<Head> heap_;
    std::uint64_t recordsRead_ = 0;
};

/// @brief Groups a key-sorted stream into WorkUnits.
class GroupReader {
public:
    explicit GroupReader(RecordSource& source) : source_(&source) {}

    /// @return The next key with all its values, or nullopt at end of stream.
    [[nodiscard]] std::optional<WorkUnit> nextGroup();

private:
    RecordSource* source_;
    std::optional<Record> pending_;
    bool started_ = false;
};

}  // namespace railmr::sort

#endif  // RAILMR_SORT_MERGE_READER_H
