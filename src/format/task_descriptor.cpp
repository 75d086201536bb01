// =============================================================================
// railmr - Task Descriptors and Status Files Implementation
// =============================================================================

#include "railmr/format/task_descriptor.h"

#include <charconv>
#include <functional>
#include <map>

#include <fmt/format.h>

#include "railmr/format/partition_file.h"
#include "railmr/format/storage_layout.h"

namespace railmr::format {

namespace {

template <typename T>
T parseNumber(const std::string& text, std::string_view field) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        throw FormatError(fmt::format("Invalid value '{}' for field '{}'", text, field));
    }
    return value;
}

std::string manifestLine(const ManifestEntry& entry) {
    if (entry.paired()) {
        return fmt::format("{}\t{}\t{}\t{}\t{}", entry.url1, entry.md5_1, entry.url2,
                           entry.md5_2, entry.label);
    }
    return fmt::format("{}\t{}\t{}", entry.url1, entry.md5_1, entry.label);
}

/// @brief Dispatch each record to the handler registered for its key.
void dispatch(const std::vector<Record>& records,
              const std::map<std::string_view, std::function<void(const std::string&)>>& handlers,
              std::string_view what) {
    for (const auto& record : records) {
        auto it = handlers.find(record.key);
        if (it == handlers.end()) {
            throw FormatError(fmt::format("Unknown {} field '{}'", what, record.key));
        }
        it->second(record.value);
    }
}

}  // namespace

// =============================================================================
// TaskSpec
// =============================================================================

std::vector<std::filesystem::path> TaskSpec::outputFiles() const {
    std::vector<std::filesystem::path> files;
    files.reserve(outputPartitions);
    for (PartitionIndex p = 0; p < outputPartitions; ++p) {
        files.push_back(StorageLayout::partitionFile(outputDir, p, taskIndex));
    }
    return files;
}

std::string TaskSpec::describe() const {
    return fmt::format("{}/{}/a{}", stage.name, taskIndex, attempt);
}

std::vector<Record> TaskSpec::toRecords() const {
    std::vector<Record> records{
        {"run-id", runId},
        {"stage-index", std::to_string(stageIndex)},
        {"stage", stage.toString()},
        {"output-partitions", std::to_string(outputPartitions)},
        {"task-index", std::to_string(taskIndex)},
        {"attempt", std::to_string(attempt)},
    };
    for (const auto& input : inputFiles) {
        records.push_back({"input", input.string()});
    }
    if (manifestEntry) {
        records.push_back({"manifest", manifestLine(*manifestEntry)});
        records.push_back({"manifest-line", std::to_string(manifestEntry->lineNumber)});
    }
    records.push_back({"output-dir", outputDir.string()});
    records.push_back({"cache-dir", cacheDir.string()});
    records.push_back({"scratch-dir", scratchDir.string()});
    records.push_back({"status-path", statusPath.string()});
    records.push_back({"compression", std::string(compressionToString(compression))});
    records.push_back({"compression-level", std::to_string(compressionLevel)});
    records.push_back({"sort-buffer-bytes", std::to_string(sortBufferBytes)});
    records.push_back({"claim-timeout-ms", std::to_string(claimTimeout.count())});
    records.push_back({"dedup", dedupEnabled ? "yes" : "no"});
    return records;
}

TaskSpec TaskSpec::fromRecords(const std::vector<Record>& records) {
    TaskSpec spec;
    bool haveStage = false;
    std::uint64_t manifestLineNumber = 0;

    std::map<std::string_view, std::function<void(const std::string&)>> handlers{
        {"run-id", [&](const std::string& v) { spec.runId = v; }},
        {"stage-index",
         [&](const std::string& v) {
             spec.stageIndex = parseNumber<StageIndex>(v, "stage-index");
         }},
        {"stage",
         [&](const std::string& v) {
             auto parsed = stage::parseStageLine(v);
             if (!parsed) {
                 throw FormatError(fmt::format("Invalid stage definition: {}",
                                               parsed.error().message()));
             }
             spec.stage = std::move(*parsed);
             haveStage = true;
         }},
        {"output-partitions",
         [&](const std::string& v) {
             spec.outputPartitions = parseNumber<PartitionIndex>(v, "output-partitions");
         }},
        {"task-index",
         [&](const std::string& v) {
             spec.taskIndex = parseNumber<TaskIndex>(v, "task-index");
         }},
        {"attempt",
         [&](const std::string& v) {
             spec.attempt = parseNumber<AttemptNumber>(v, "attempt");
         }},
        {"input", [&](const std::string& v) { spec.inputFiles.emplace_back(v); }},
        {"manifest",
         [&](const std::string& v) {
             auto entry = parseManifestLine(v);
             if (!entry) {
                 throw FormatError(
                     fmt::format("Invalid manifest entry: {}", entry.error().message()));
             }
             spec.manifestEntry = std::move(*entry);
         }},
        {"manifest-line",
         [&](const std::string& v) {
             manifestLineNumber = parseNumber<std::uint64_t>(v, "manifest-line");
         }},
        {"output-dir", [&](const std::string& v) { spec.outputDir = v; }},
        {"cache-dir", [&](const std::string& v) { spec.cacheDir = v; }},
        {"scratch-dir", [&](const std::string& v) { spec.scratchDir = v; }},
        {"status-path", [&](const std::string& v) { spec.statusPath = v; }},
        {"compression",
         [&](const std::string& v) {
             auto compression = compressionFromString(v);
             if (!compression) {
                 throw FormatError(fmt::format("Unknown compression '{}'", v));
             }
             spec.compression = *compression;
         }},
        {"compression-level",
         [&](const std::string& v) {
             spec.compressionLevel = parseNumber<int>(v, "compression-level");
         }},
        {"sort-buffer-bytes",
         [&](const std::string& v) {
             spec.sortBufferBytes = parseNumber<std::size_t>(v, "sort-buffer-bytes");
         }},
        {"claim-timeout-ms",
         [&](const std::string& v) {
             spec.claimTimeout =
                 std::chrono::milliseconds(parseNumber<std::int64_t>(v, "claim-timeout-ms"));
         }},
        {"dedup",
         [&](const std::string& v) {
             auto flag = stage::parseBool(v);
             if (!flag) {
                 throw FormatError(fmt::format("Invalid dedup flag '{}'", v));
             }
             spec.dedupEnabled = *flag;
         }},
    };
    dispatch(records, handlers, "task descriptor");

    if (!haveStage || spec.runId.empty() || spec.outputDir.empty()) {
        throw FormatError("Task descriptor lacks stage, run-id or output-dir");
    }
    if (spec.manifestEntry) {
        spec.manifestEntry->lineNumber = manifestLineNumber;
    }
    if (spec.outputPartitions == 0) {
        throw FormatError("Task descriptor declares zero output partitions");
    }
    return spec;
}

void TaskSpec::save(const std::filesystem::path& path) const {
    auto records = toRecords();
    writeRecordFile(path, records);
}

TaskSpec TaskSpec::load(const std::filesystem::path& path) {
    try {
        return fromRecords(readRecordFile(path));
    } catch (const FormatError& ex) {
        throw FormatError(ex.code(), ex.message(), ErrorContext{path.string()});
    }
}

// =============================================================================
// TaskOutcome
// =============================================================================

TaskOutcome TaskOutcome::success(TaskCounters counters) {
    TaskOutcome outcome;
    outcome.state = TaskState::kSucceeded;
    outcome.code = ErrorCode::kSuccess;
    outcome.counters = counters;
    return outcome;
}

TaskOutcome TaskOutcome::failure(ErrorCode code, std::string reason, TaskCounters counters) {
    TaskOutcome outcome;
    outcome.state = code == ErrorCode::kCancelled ? TaskState::kCancelled : TaskState::kFailed;
    outcome.code = code;
    outcome.reason = std::move(reason);
    outcome.counters = counters;
    return outcome;
}

void TaskOutcome::save(const std::filesystem::path& path) const {
    const auto& c = counters;
    std::vector<Record> records{
        {"state", std::string(taskStateToString(state))},
        {"code", std::string(errorCodeToString(code))},
        {"reason", reason},
        {"units", std::to_string(c.unitsProcessed)},
        {"records-read", std::to_string(c.recordsRead)},
        {"records-written", std::to_string(c.recordsWritten)},
        {"bytes-written", std::to_string(c.bytesWritten)},
        {"file-bytes", std::to_string(c.fileBytes)},
        {"cache-hits", std::to_string(c.cache.hits)},
        {"cache-misses", std::to_string(c.cache.misses)},
        {"cache-accepted", std::to_string(c.cache.accepted)},
        {"cache-race-losses", std::to_string(c.cache.raceLosses)},
        {"cache-claim-waits", std::to_string(c.cache.claimWaits)},
        {"elapsed-ms", std::to_string(c.elapsed.count())},
    };
    writeRecordFile(path, records);
}

TaskOutcome TaskOutcome::load(const std::filesystem::path& path) {
    TaskOutcome outcome;
    auto& c = outcome.counters;
    bool haveState = false;

    auto counter = [](std::uint64_t& target, std::string_view field) {
        return [&target, field](const std::string& v) {
            target = parseNumber<std::uint64_t>(v, field);
        };
    };

    std::map<std::string_view, std::function<void(const std::string&)>> handlers{
        {"state",
         [&](const std::string& v) {
             auto state = taskStateFromString(v);
             if (!state) {
                 throw FormatError(fmt::format("Unknown task state '{}'", v));
             }
             outcome.state = *state;
             haveState = true;
         }},
        {"code",
         [&](const std::string& v) {
             auto code = errorCodeFromString(v);
             if (!code) {
                 throw FormatError(fmt::format("Unknown error code '{}'", v));
             }
             outcome.code = *code;
         }},
        {"reason", [&](const std::string& v) { outcome.reason = v; }},
        {"units", counter(c.unitsProcessed, "units")},
        {"records-read", counter(c.recordsRead, "records-read")},
        {"records-written", counter(c.recordsWritten, "records-written")},
        {"bytes-written", counter(c.bytesWritten, "bytes-written")},
        {"file-bytes", counter(c.fileBytes, "file-bytes")},
        {"cache-hits", counter(c.cache.hits, "cache-hits")},
        {"cache-misses", counter(c.cache.misses, "cache-misses")},
        {"cache-accepted", counter(c.cache.accepted, "cache-accepted")},
        {"cache-race-losses", counter(c.cache.raceLosses, "cache-race-losses")},
        {"cache-claim-waits", counter(c.cache.claimWaits, "cache-claim-waits")},
        {"elapsed-ms",
         [&](const std::string& v) {
             c.elapsed = std::chrono::milliseconds(parseNumber<std::int64_t>(v, "elapsed-ms"));
         }},
    };

    try {
        dispatch(readRecordFile(path), handlers, "status");
    } catch (const FormatError& ex) {
        throw FormatError(ex.code(), ex.message(), ErrorContext{path.string()});
    }
    if (!haveState) {
        throw FormatError("Status file lacks a state", ErrorContext{path.string()});
    }
    return outcome;
}

}  // namespace railmr::format
