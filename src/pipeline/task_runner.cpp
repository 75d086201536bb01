// =============================================================================
// railmr - Task Runner Implementation
// =============================================================================

#include "railmr/pipeline/task_runner.h"

#include <chrono>
#include <memory>
#include <optional>

#include <fmt/format.h>

#include "railmr/cache/dedup_cache.h"
#include "railmr/cache/fingerprint.h"
#include "railmr/common/logger.h"
#include "railmr/format/partition_file.h"
#include "railmr/io/fastq_parser.h"
#include "railmr/sort/merge_reader.h"
#include "railmr/sort/partition_sorter.h"

namespace railmr::pipeline {

namespace {

/// @brief Feeds body output into the sorter.
class SortingEmitter final : public stage::Emitter {
public:
    using Emitter::emit;

    explicit SortingEmitter(sort::PartitionSorter& sorter) : sorter_(&sorter) {}

    void emit(Record record) override { sorter_->add(std::move(record)); }

private:
    sort::PartitionSorter* sorter_;
};

std::string mateName(const std::string& id, int mate) {
    std::string_view name = id;
    if (name.size() > 2 && name[name.size() - 2] == '/' &&
        (name.back() == '1' || name.back() == '2')) {
        name.remove_suffix(2);
    }
    return fmt::format("{}/{}", name, mate);
}

Record makeReadRecord(const io::FastqRecord& read, std::string_view label,
                      std::string_view name) {
    auto canonical = io::canonicalize(read.sequence, read.quality);
    return Record{std::move(canonical.sequence),
                  makeReadValue(label, name, canonical.reversed, canonical.quality)};
}

}  // namespace

std::string makeReadValue(std::string_view label, std::string_view readName, bool reversed,
                          std::string_view quality) {
    return fmt::format("{}\t{}\t{}\t{}", label, readName, reversed ? 1 : 0, quality);
}

std::uint64_t ingestManifestEntry(const format::ManifestEntry& entry,
                                  const std::function<void(Record)>& sink) {
    auto sources = entry.sourcePaths();
    std::uint64_t reads = 0;

    if (!entry.paired()) {
        io::FastqParser parser(sources[0]);
        parser.open();
        while (auto read = parser.readRecord()) {
            sink(makeReadRecord(*read, entry.label, read->id));
            ++reads;
        }
        return reads;
    }

    io::FastqParser first(sources[0]);
    io::FastqParser second(sources[1]);
    first.open();
    second.open();
    for (;;) {
        auto mate1 = first.readRecord();
        auto mate2 = second.readRecord();
        if (!mate1 && !mate2) {
            break;
        }
        if (!mate1 || !mate2) {
            throw FormatError(
                fmt::format("Paired inputs of {} have different read counts ({} ended first)",
                            entry.label, mate1 ? sources[1].string() : sources[0].string()),
                ErrorContext{mate1 ? sources[1].string() : sources[0].string()});
        }
        sink(makeReadRecord(*mate1, entry.label, mateName(mate1->id, 1)));
        sink(makeReadRecord(*mate2, entry.label, mateName(mate2->id, 2)));
        reads += 2;
    }
    return reads;
}

// =============================================================================
// TaskRunner
// =============================================================================

format::TaskOutcome TaskRunner::execute(const format::TaskSpec& spec,
                                        const CancellationToken& cancel) const {
    const auto started = std::chrono::steady_clock::now();
    RAILMR_LOG_DEBUG("Task {} starting ({} inputs, {} output partitions)", spec.describe(),
                     spec.manifestEntry ? 1 : spec.inputFiles.size(), spec.outputPartitions);

    format::TaskOutcome outcome;
    try {
        outcome = format::TaskOutcome::success(run(spec, cancel));
    } catch (const CancelledError& ex) {
        outcome = format::TaskOutcome::failure(ErrorCode::kCancelled, ex.message());
    } catch (const RailmrException& ex) {
        outcome = format::TaskOutcome::failure(ex.code(), ex.what());
    } catch (const std::exception& ex) {
        outcome = format::TaskOutcome::failure(ErrorCode::kTaskExecutionError, ex.what());
    }

    std::error_code ec;
    std::filesystem::remove_all(spec.scratchDir, ec);

    outcome.counters.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (outcome.succeeded()) {
        RAILMR_LOG_DEBUG("Task {} succeeded: {} units, {} records in, {} out", spec.describe(),
                         outcome.counters.unitsProcessed, outcome.counters.recordsRead,
                         outcome.counters.recordsWritten);
    } else {
        RAILMR_LOG_WARNING("Task {} {}: {}", spec.describe(), taskStateToString(outcome.state),
                           outcome.reason);
    }
    return outcome;
}

format::TaskCounters TaskRunner::run(const format::TaskSpec& spec,
                                     const CancellationToken& cancel) const {
    format::TaskCounters counters;
    auto body = registry_->create(spec.stage);
    auto partitioner = spec.stage.partitioner.create();

    std::error_code ec;
    std::filesystem::create_directories(spec.scratchDir, ec);
    if (ec) {
        throw IOError("Cannot create scratch directory", ec,
                      ErrorContext{spec.scratchDir.string()});
    }

    sort::PartitionSorterOptions sorterOptions;
    sorterOptions.partitions = spec.outputPartitions;
    sorterOptions.memoryLimitBytes = spec.sortBufferBytes;
    sorterOptions.spillDirectory = spec.scratchDir;
    sort::PartitionSorter sorter(*partitioner, sorterOptions);
    SortingEmitter emitter(sorter);

    stage::StageContext context{&spec.stage, spec.stageIndex, spec.taskIndex, spec.attempt,
                                &cancel};
    body->begin(context);

    std::optional<cache::DedupCache> cache;
    std::string params;
    if (spec.dedupEnabled && spec.stage.dedup && body->cacheable()) {
        cache::DedupCacheOptions cacheOptions;
        cacheOptions.claimTimeout = spec.claimTimeout;
        cache.emplace(spec.cacheDir, cacheOptions);
        params = cache::canonicalParams(spec.stage.params);
    }

    const auto what = fmt::format("Task {}", spec.describe());
    auto processUnit = [&](const WorkUnit& unit) {
        cancel.throwIfCancelled(what);
        if (cache) {
            auto fingerprint =
                cache::fingerprintWorkUnit(spec.stage.body, params, body->semanticInput(unit));
            auto result =
                cache->getOrCompute(fingerprint, [&] { return body->compute(unit); }, &cancel);
            body->emitComputed(unit, result, emitter);
        } else {
            body->process(unit, emitter);
        }
        ++counters.unitsProcessed;
    };

    if (spec.manifestEntry) {
        counters.recordsRead = ingestManifestEntry(*spec.manifestEntry, [&](Record record) {
            WorkUnit unit{std::move(record.key), {std::move(record.value)}};
            processUnit(unit);
        });
    } else {
        sort::MergeReader merged(sort::openFileSources(spec.inputFiles));
        if (spec.stage.role == StageRole::kReduce) {
            sort::GroupReader groups(merged);
            while (auto unit = groups.nextGroup()) {
                processUnit(*unit);
            }
        } else {
            while (auto record = merged.next()) {
                WorkUnit unit{std::move(record->key), {std::move(record->value)}};
                processUnit(unit);
            }
        }
        counters.recordsRead = merged.recordsRead();
    }
    body->end(emitter);

    if (cache) {
        counters.cache = cache->stats();
    }

    // Stage every partition before publishing any of them
    const auto outputs = spec.outputFiles();
    format::PartitionWriterOptions writerOptions;
    writerOptions.compression = spec.compression;
    writerOptions.compressionLevel = spec.compressionLevel;
    std::vector<std::unique_ptr<format::PartitionWriter>> writers;
    writers.reserve(outputs.size());
    sorter.finish([&](PartitionIndex partition, sort::RecordSource& source) {
        auto writer = std::make_unique<format::PartitionWriter>(outputs[partition], writerOptions);
        while (auto record = source.next()) {
            writer->write(*record);
        }
        writers.push_back(std::move(writer));
    });

    cancel.throwIfCancelled(what);
    for (auto& writer : writers) {
        writer->commit();
        counters.recordsWritten += writer->recordCount();
        counters.bytesWritten += writer->bytesWritten();
        counters.fileBytes += writer->fileSize();
    }
    return counters;
}

}  // namespace railmr::pipeline
