// =============================================================================
// railmr - Pipeline Orchestrator
// =============================================================================
// Drives one Job through its stages on a single Backend:
//
//   for each stage, in order:
//     create the task set (manifest entries, or upstream partitions)
//     submit runnable tasks while the backend reports free capacity
//     poll running attempts; verify outputs of successful ones
//     retry failed attempts with exponential backoff, up to maxAttempts
//     re-run upstream tasks whose published files went missing
//   merge the final partitions into the output directory
//
// A stage starts only after every task of the previous stage succeeded.
// The Job object owns all run state; the orchestrator keeps none between runs.
// =============================================================================

#ifndef RAILMR_PIPELINE_ORCHESTRATOR_H
#define RAILMR_PIPELINE_ORCHESTRATOR_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "railmr/backend/backend.h"
#include "railmr/common/cancellation.h"
#include "railmr/common/error.h"
#include "railmr/common/types.h"
#include "railmr/format/manifest.h"
#include "railmr/format/storage_layout.h"
#include "railmr/format/task_descriptor.h"
#include "railmr/pipeline/task.h"
#include "railmr/stage/stage.h"
#include "railmr/stage/stage_body.h"

namespace railmr::pipeline {

// =============================================================================
// Progress Callback
// =============================================================================

/// @brief Progress information for callbacks
struct ProgressInfo {
    StageIndex stage = 0;
    std::string stageName;

    /// @brief Tasks of the stage that have succeeded so far (monotonic).
    std::uint32_t completedTasks = 0;

    std::uint32_t totalTasks = 0;

    /// @brief Failed attempts in the stage so far.
    std::uint32_t failedAttempts = 0;

    std::uint64_t elapsedMs = 0;

    [[nodiscard]] double ratio() const noexcept {
        return totalTasks == 0 ? 0.0
                               : static_cast<double>(completedTasks) /
                                     static_cast<double>(totalTasks);
    }
};

/// @brief Progress callback type
/// @return true to continue, false to cancel the job
using ProgressCallback = std::function<bool(const ProgressInfo& info)>;

// =============================================================================
// Job Configuration
// =============================================================================

struct JobConfig {
    /// @brief Shared working storage; runs live in <workRoot>/<runId>.
    std::filesystem::path workRoot = "railmr-work";

    /// @brief Empty picks YYYYMMDD-HHMMSS-<pid>.
    std::string runId;

    /// @brief Where final partitions are merged to (empty = leave them in the run).
    std::filesystem::path outputDir;

    /// @brief K of xK partition counts.
    std::uint32_t taskCount = kDefaultTaskCount;

    AttemptNumber maxAttempts = kDefaultMaxAttempts;
    std::uint32_t maxUpstreamReruns = kDefaultMaxUpstreamReruns;

    std::chrono::milliseconds pollInterval = kDefaultPollInterval;
    std::chrono::milliseconds retryBackoff = kDefaultRetryBackoff;
    std::chrono::milliseconds maxRetryBackoff = kMaxRetryBackoff;

    Compression compression = Compression::kNone;
    int compressionLevel = kDefaultCompressionLevel;
    std::size_t sortBufferMB = kDefaultSortBufferMB;
    std::chrono::milliseconds claimTimeout = kDefaultClaimTimeout;

    /// @brief Redundancy elimination for stages that allow it.
    bool dedup = true;

    bool keepIntermediates = false;

    /// @brief Replace an existing run directory with the same id.
    bool force = false;

    ProgressCallback progressCallback;

    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Reports
// =============================================================================

/// @brief Shape of one stage, known before anything runs.
struct StagePlan {
    StageIndex index = 0;
    std::string name;
    StageRole role = StageRole::kMap;
    std::string body;
    std::uint32_t tasks = 0;
    PartitionIndex partitions = 0;
    bool dedup = false;
};

/// @brief Stage shapes of @p pipeline over @p manifest.
[[nodiscard]] std::vector<StagePlan> planStages(const stage::PipelineDef& pipeline,
                                                const format::Manifest& manifest,
                                                std::uint32_t taskCount);

struct StageReport {
    StagePlan plan;
    std::uint32_t submitted = 0;
    std::uint32_t succeeded = 0;
    std::uint32_t failed = 0;
    std::uint32_t retried = 0;
    std::uint32_t upstreamReruns = 0;
    format::TaskCounters counters;
    bool completed = false;
};

struct JobResult {
    JobState state = JobState::kCreated;
    ErrorCode code = ErrorCode::kSuccess;

    /// @brief Diagnostic of the first unrecoverable task.
    std::string reason;

    std::string runId;
    std::filesystem::path runRoot;
    std::vector<StageReport> stages;
    format::TaskCounters totals;

    /// @brief Merged output files, one per final partition.
    std::vector<std::filesystem::path> outputs;

    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] bool succeeded() const noexcept { return state == JobState::kSucceeded; }

    /// @brief 0, 5 (stage failure), 7 (cancelled) or the category of @ref code.
    [[nodiscard]] int exitCode() const noexcept;
};

// =============================================================================
// Job
// =============================================================================

/// @brief One end-to-end run of a pipeline over a manifest.
class Job {
public:
    Job(format::Manifest manifest, stage::PipelineDef pipeline, JobConfig config);

    Job(const Job&) = delete;
    Job& operator=(const Job&) = delete;

    [[nodiscard]] const format::Manifest& manifest() const noexcept { return manifest_; }
    [[nodiscard]] const stage::PipelineDef& pipeline() const noexcept { return pipeline_; }
    [[nodiscard]] const JobConfig& config() const noexcept { return config_; }

    [[nodiscard]] JobState state() const noexcept { return result_.state; }
    [[nodiscard]] const JobResult& result() const noexcept { return result_; }

    /// @brief Run layout; valid once the job has started.
    [[nodiscard]] const std::optional<format::StorageLayout>& layout() const noexcept {
        return layout_;
    }

private:
    friend class Orchestrator;

    struct StageRun {
        stage::StageDef def;
        std::filesystem::path dir;
        std::vector<Task> tasks;
        StageReport report;
    };

    format::Manifest manifest_;
    stage::PipelineDef pipeline_;
    JobConfig config_;

    std::optional<format::StorageLayout> layout_;
    std::vector<StageRun> stages_;
    JobResult result_;
};

// =============================================================================
// Orchestrator
// =============================================================================

class Orchestrator {
public:
    /// @param backend Selected once per job; must outlive the orchestrator.
    /// @param registry Stage bodies the pipeline is validated against.
    Orchestrator(backend::Backend& backend, const stage::StageRegistry& registry);

    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// @brief Run @p job to a terminal state.
    /// @throws ConfigurationError before any task is submitted if the job is invalid.
    /// @throws IOError if the run directory cannot be prepared.
    JobResult run(Job& job);

    /// @brief Stop submitting and abort in-flight tasks. Thread-safe.
    void cancel() noexcept;

    [[nodiscard]] bool isCancelled() const noexcept { return cancel_.isCancelled(); }

private:
    using Clock = Task::Clock;

    void prepare(Job& job);

    /// @return false if the stage did not complete.
    bool runStage(Job& job, StageIndex index);

    [[nodiscard]] format::TaskSpec buildSpec(const Job& job, StageIndex stage, TaskIndex task,
                                             AttemptNumber attempt) const;

    void submitTask(Job& job, StageIndex stage, Task& task);

    /// @brief Apply a finished attempt's status to its task.
    void handleFinished(Job& job, StageIndex stage, Task& task, backend::TaskStatus status);

    void handleFailure(Job& job, StageIndex stage, Task& task, ErrorCode code,
                       std::string reason);

    /// @brief Confirm a succeeded attempt's partitions are all on storage.
    ///
    /// Compares their stored size with the size the worker reported publishing.
    /// A status without counters falls back to reading every partition.
    [[nodiscard]] static VoidResult checkOutputs(const Job::StageRun& run, const Task& task,
                                                 const backend::TaskStatus& status);

    /// @brief Re-queue upstream tasks whose files this task could not read.
    /// @return true if at least one upstream task was re-queued.
    bool requestUpstreamReruns(Job& job, StageIndex stage, const Task& task);

    /// @brief Poll every running task of @p stages once.
    void pollRunning(Job& job, const std::vector<StageIndex>& stages);

    /// @brief Cancel every in-flight attempt and wait for them to finish.
    void drain(Job& job, const std::vector<StageIndex>& stages);

    void reportProgress(Job& job, StageIndex stage);

    void mergeOutputs(Job& job);

    void removeIntermediates(const Job& job) const;

    void writeSummary(const Job& job) const;

    void failJob(Job& job, ErrorCode code, std::string reason);

    backend::Backend& backend_;
    const stage::StageRegistry& registry_;
    CancellationToken cancel_;
    WakeupSignal wakeup_;
    Clock::time_point started_{};
};

/// @brief Human-readable job summary (also written to job.summary).
[[nodiscard]] std::string formatSummary(const JobResult& result);

}  // namespace railmr::pipeline

#endif  // RAILMR_PIPELINE_ORCHESTRATOR_H
