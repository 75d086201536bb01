// =============================================================================
// railmr - Partition Sorter Implementation
// =============================================================================

#include "railmr/sort/partition_sorter.h"

#include <algorithm>

#include <fmt/format.h>
#include <tbb/parallel_sort.h>

#include "railmr/common/logger.h"

namespace railmr::sort {

namespace {

/// @brief Below this size std::sort beats spinning up TBB workers.
constexpr std::size_t kParallelSortThreshold = 1 << 16;

}  // namespace

PartitionSorter::PartitionSorter(const Partitioner& partitioner, PartitionSorterOptions options)
    : partitioner_(&partitioner),
      options_(std::move(options)),
      buffers_(options_.partitions),
      runs_(options_.partitions) {
    if (options_.partitions == 0) {
        throw ConfigurationError("partition count must be positive");
    }
}

PartitionSorter::~PartitionSorter() {
    removeRuns();
}

void PartitionSorter::add(Record record) {
    if (finished_) {
        throw TaskExecutionError("record added after partitions were finished");
    }
    const PartitionIndex partition = partitioner_->partition(record.key, options_.partitions);
    bufferedBytes_ += record.footprint();
    buffers_[partition].push_back(Entry{std::move(record), sequence_++});

    if (bufferedBytes_ > options_.memoryLimitBytes && !options_.spillDirectory.empty()) {
        spill();
    }
}

std::vector<Record> PartitionSorter::takeSorted(PartitionIndex partition) {
    auto& entries = buffers_[partition];
    auto byKeyThenArrival = [](const Entry& lhs, const Entry& rhs) {
        if (lhs.record.key != rhs.record.key) {
            return lhs.record.key < rhs.record.key;
        }
        return lhs.sequence < rhs.sequence;
    };
    if (entries.size() >= kParallelSortThreshold) {
        tbb::parallel_sort(entries.begin(), entries.end(), byKeyThenArrival);
    } else {
        std::sort(entries.begin(), entries.end(), byKeyThenArrival);
    }

    std::vector<Record> records;
    records.reserve(entries.size());
    for (auto& entry : entries) {
        records.push_back(std::move(entry.record));
    }
    entries.clear();
    entries.shrink_to_fit();
    return records;
}

void PartitionSorter::spill() {
    std::error_code ec;
    std::filesystem::create_directories(options_.spillDirectory, ec);
    if (ec) {
        throw IOError("Cannot create spill directory", ec,
                      ErrorContext{options_.spillDirectory.string()});
    }

    format::PartitionWriterOptions writerOptions;
    writerOptions.compression = options_.spillCompression;
    writerOptions.durable = false;

    for (PartitionIndex p = 0; p < options_.partitions; ++p) {
        if (buffers_[p].empty()) {
            continue;
        }
        auto path = options_.spillDirectory /
                    fmt::format("spill-{:04}.part-{:05}.rec", spillCount_, p);
        format::writeRecordFile(path, takeSorted(p), writerOptions);
        runs_[p].push_back(std::move(path));
    }
    RAILMR_LOG_DEBUG("Spilled sort run {} ({} bytes buffered)", spillCount_, bufferedBytes_);
    ++spillCount_;
    bufferedBytes_ = 0;
}

void PartitionSorter::finish(const PartitionSink& sink) {
    if (finished_) {
        throw TaskExecutionError("partitions already finished");
    }
    finished_ = true;

    for (PartitionIndex p = 0; p < options_.partitions; ++p) {
        VectorSource tail(takeSorted(p));
        if (runs_[p].empty()) {
            sink(p, tail);
            continue;
        }
        auto sources = openFileSources(runs_[p]);
        sources.push_back(std::make_unique<VectorSource>(std::move(tail)));
        MergeReader merged(std::move(sources));
        sink(p, merged);
    }
    bufferedBytes_ = 0;
    removeRuns();
}

void PartitionSorter::removeRuns() noexcept {
    for (auto& partitionRuns : runs_) {
        for (const auto& path : partitionRuns) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
        partitionRuns.clear();
    }
}

std::vector<std::vector<Record>> partitionAndSort(std::vector<Record> records,
                                                  PartitionIndex partitions,
                                                  const Partitioner& partitioner) {
    PartitionSorterOptions options;
    options.partitions = partitions;
    PartitionSorter sorter(partitioner, options);
    for (auto& record : records) {
        sorter.add(std::move(record));
    }

    std::vector<std::vector<Record>> result(partitions);
    sorter.finish([&](PartitionIndex p, RecordSource& source) {
        while (auto record = source.next()) {
            result[p].push_back(std::move(*record));
        }
    });
    return result;
}

}  // namespace railmr::sort
