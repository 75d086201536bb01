// =============================================================================
// railmr - Task Descriptors and Status Files
// =============================================================================
// A TaskSpec is everything a worker needs to run one task attempt, on any
// backend, without talking to the orchestrator. It is stored as a record file
// (key = field name, value = field value; "input" repeats) so it shares the
// codec's escaping and trailer checks.
//
// The worker reports back through a TaskOutcome status file written the same
// way. Both files are published with an atomic rename.
// =============================================================================

#ifndef RAILMR_FORMAT_TASK_DESCRIPTOR_H
#define RAILMR_FORMAT_TASK_DESCRIPTOR_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "railmr/cache/dedup_cache.h"
#include "railmr/common/error.h"
#include "railmr/common/types.h"
#include "railmr/format/manifest.h"
#include "railmr/stage/stage.h"

namespace railmr::format {

struct TaskSpec {
    std::string runId;
    StageIndex stageIndex = 0;
    stage::StageDef stage;

    /// @brief Resolved output partition count of the stage.
    PartitionIndex outputPartitions = 1;

    TaskIndex taskIndex = 0;
    AttemptNumber attempt = 1;

    /// @brief Upstream partition files, in task-index order (stages after the first).
    std::vector<std::filesystem::path> inputFiles;

    /// @brief Input unit of a first-stage task.
    std::optional<ManifestEntry> manifestEntry;

    /// @brief Directory of this stage (holds part-PPPPP/ subdirectories).
    std::filesystem::path outputDir;
    std::filesystem::path cacheDir;
    std::filesystem::path scratchDir;
    std::filesystem::path statusPath;

    Compression compression = Compression::kNone;
    int compressionLevel = kDefaultCompressionLevel;
    std::size_t sortBufferBytes = kDefaultSortBufferMB * 1024 * 1024;
    std::chrono::milliseconds claimTimeout = kDefaultClaimTimeout;
    bool dedupEnabled = true;

    /// @brief Partition files this task publishes, one per output partition.
    [[nodiscard]] std::vector<std::filesystem::path> outputFiles() const;

    /// @brief "stage/task/attempt" for diagnostics.
    [[nodiscard]] std::string describe() const;

    [[nodiscard]] std::vector<Record> toRecords() const;

    /// @throws FormatError on unknown or malformed fields.
    [[nodiscard]] static TaskSpec fromRecords(const std::vector<Record>& records);

    /// @brief Write the descriptor atomically.
    void save(const std::filesystem::path& path) const;

    /// @throws IOError or FormatError.
    [[nodiscard]] static TaskSpec load(const std::filesystem::path& path);

    bool operator==(const TaskSpec&) const = default;
};

struct TaskCounters {
    std::uint64_t unitsProcessed = 0;
    std::uint64_t recordsRead = 0;
    std::uint64_t recordsWritten = 0;
    std::uint64_t bytesWritten = 0;

    /// @brief Stored size of the published partitions (after compression).
    std::uint64_t fileBytes = 0;
    cache::CacheStats cache;
    std::chrono::milliseconds elapsed{0};

    TaskCounters& operator+=(const TaskCounters& other) noexcept {
        unitsProcessed += other.unitsProcessed;
        recordsRead += other.recordsRead;
        recordsWritten += other.recordsWritten;
        bytesWritten += other.bytesWritten;
        fileBytes += other.fileBytes;
        cache += other.cache;
        elapsed += other.elapsed;
        return *this;
    }
};

/// @brief Result of one task attempt.
struct TaskOutcome {
    /// @brief kSucceeded, kFailed or kCancelled.
    TaskState state = TaskState::kFailed;
    ErrorCode code = ErrorCode::kSuccess;
    std::string reason;
    TaskCounters counters;

    [[nodiscard]] bool succeeded() const noexcept { return state == TaskState::kSucceeded; }

    [[nodiscard]] static TaskOutcome success(TaskCounters counters);

    [[nodiscard]] static TaskOutcome failure(ErrorCode code, std::string reason,
                                             TaskCounters counters = {});

    void save(const std::filesystem::path& path) const;

    /// @throws IOError(kMissingInput) if absent, FormatError if malformed.
    [[nodiscard]] static TaskOutcome load(const std::filesystem::path& path);
};

}  // namespace railmr::format

#endif  // RAILMR_FORMAT_TASK_DESCRIPTOR_H
