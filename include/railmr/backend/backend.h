// =============================================================================
// railmr - Backend Contract
// =============================================================================
// One interface for every execution substrate. The orchestrator only ever
// calls submit(), poll(), cancel() and capacity(); each adapter maps those
// onto its own submission API:
//
//   local   worker threads in a TBB arena
//   slurm   sbatch / squeue / sacct / scancel
//   ssh     one remote login per task on a shared filesystem
//   emr     Elastic MapReduce streaming steps
//
// Guarantees every adapter gives:
// - a task reported kSucceeded has all of its output partitions published
// - a cancelled task leaves no partial file at its output paths (partition
//   files are only ever published by rename)
// - launch and channel failures are retried inside the adapter; only
//   exhausted retries surface, as kTaskExecutionError
// =============================================================================

#ifndef RAILMR_BACKEND_BACKEND_H
#define RAILMR_BACKEND_BACKEND_H

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "railmr/common/error.h"
#include "railmr/common/types.h"
#include "railmr/format/task_descriptor.h"
#include "railmr/io/process.h"

namespace railmr::backend {

/// @brief Identifies one submitted task attempt.
struct TaskHandle {
    /// @brief Unique within the job: NN-TTTTT-aA.
    std::string id;

    /// @brief Substrate identifier (scheduler job id, step id, pid, ...).
    std::string externalId;

    StageIndex stage = 0;
    TaskIndex task = 0;
    AttemptNumber attempt = 0;
};

struct TaskStatus {
    /// @brief kRunning, kSucceeded, kFailed or kCancelled.
    TaskState state = TaskState::kRunning;
    ErrorCode code = ErrorCode::kSuccess;
    std::string reason;
    std::optional<format::TaskCounters> counters;

    [[nodiscard]] bool finished() const noexcept { return state != TaskState::kRunning; }

    [[nodiscard]] static TaskStatus running() { return TaskStatus{}; }

    [[nodiscard]] static TaskStatus fromOutcome(const format::TaskOutcome& outcome);

    [[nodiscard]] static TaskStatus failed(ErrorCode code, std::string reason);
};

/// @brief Files of one task attempt, prepared by the orchestrator before submit().
struct TaskFiles {
    /// @brief Serialized TaskSpec, already written.
    std::filesystem::path descriptor;

    /// @brief Worker stdout/stderr.
    std::filesystem::path log;

    /// @brief Substrate-specific submission artifact (batch script, input split).
    std::filesystem::path script;
};

class Backend {
public:
    using CompletionListener = std::function<void()>;

    virtual ~Backend() = default;

    [[nodiscard]] virtual BackendKind kind() const noexcept = 0;

    [[nodiscard]] virtual std::string name() const {
        return std::string(backendKindToString(kind()));
    }

    /// @brief Start one task attempt.
    /// @return Error(kTaskExecutionError) once submission retries are exhausted.
    [[nodiscard]] virtual Result<TaskHandle> submit(const format::TaskSpec& spec,
                                                    const TaskFiles& files) = 0;

    /// @brief Current state of a submitted attempt.
    [[nodiscard]] virtual Result<TaskStatus> poll(const TaskHandle& handle) = 0;

    /// @brief Ask the substrate to abort an attempt. Completion is observed by poll().
    [[nodiscard]] virtual VoidResult cancel(const TaskHandle& handle) = 0;

    /// @brief Task slots currently free.
    [[nodiscard]] virtual std::size_t capacity() const = 0;

    /// @brief Called (from any thread) whenever an attempt finishes.
    void setCompletionListener(CompletionListener listener) {
        std::lock_guard lock(listenerMutex_);
        listener_ = std::move(listener);
    }

    /// @brief Release substrate resources; in-flight attempts are cancelled.
    virtual void shutdown() {}

protected:
    void notifyCompletion() {
        CompletionListener listener;
        {
            std::lock_guard lock(listenerMutex_);
            listener = listener_;
        }
        if (listener) {
            listener();
        }
    }

private:
    std::mutex listenerMutex_;
    CompletionListener listener_;
};

/// @brief NN-TTTTT-aA, the handle id of one attempt.
[[nodiscard]] std::string attemptId(StageIndex stage, TaskIndex task, AttemptNumber attempt);

/// @brief Status of a finished remote attempt, read from its worker status file.
/// @param exitCode Worker exit code reported by the substrate.
[[nodiscard]] TaskStatus statusFromFile(const std::filesystem::path& statusPath, int exitCode);

/// @brief Run a substrate client tool (sbatch, aws, ...) and return its stdout.
/// @return Error(kBackendUnavailable) if the tool cannot be started, times out
///         or exits non-zero; the message carries the tool's stderr.
[[nodiscard]] Result<std::string> runClientCommand(io::ProcessLauncher& launcher,
                                                   const std::vector<std::string>& argv,
                                                   std::chrono::milliseconds timeout);

/// @brief Write a submission artifact (batch script, input split).
[[nodiscard]] VoidResult writeSubmissionFile(const std::filesystem::path& path,
                                             std::string_view content);

/// @brief Leading and trailing whitespace removed.
[[nodiscard]] std::string_view trimOutput(std::string_view text) noexcept;

}  // namespace railmr::backend

#endif  // RAILMR_BACKEND_BACKEND_H
