// =============================================================================
// railmr - Cluster Scheduler (SLURM) Backend
// =============================================================================
// One batch job per task attempt. The job script runs
// `<worker> exec-task --descriptor <path>` on a node sharing the work root.
//
//   submit  sbatch --parsable <script>
//   poll    squeue -h -j <id> -o %T, then sacct once the job left the queue
//   cancel  scancel <id>
//
// The worker's status file is authoritative; scheduler states only decide
// between "still running" and "ended without a status file".
// =============================================================================

#ifndef RAILMR_BACKEND_CLUSTER_SCHEDULER_BACKEND_H
#define RAILMR_BACKEND_CLUSTER_SCHEDULER_BACKEND_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

#include "railmr/backend/backend.h"
#include "railmr/backend/backend_config.h"
#include "railmr/io/process.h"

namespace railmr::backend {

/// @brief Contents of the batch script of one attempt.
[[nodiscard]] std::string makeBatchScript(const ClusterSchedulerOptions& options,
                                          const std::filesystem::path& worker,
                                          const format::TaskSpec& spec, const TaskFiles& files);

/// @brief Whether a squeue/sacct state means the job has not ended yet.
[[nodiscard]] bool isActiveSchedulerState(std::string_view state) noexcept;

class ClusterSchedulerBackend final : public Backend {
public:
    /// @param launcher Must outlive the backend.
    ClusterSchedulerBackend(ClusterSchedulerOptions options, BackendEnvironment environment,
                            RetryPolicy retry, std::chrono::milliseconds commandTimeout,
                            io::ProcessLauncher& launcher);

    ClusterSchedulerBackend(const ClusterSchedulerBackend&) = delete;
    ClusterSchedulerBackend& operator=(const ClusterSchedulerBackend&) = delete;

    [[nodiscard]] BackendKind kind() const noexcept override {
        return BackendKind::kClusterScheduler;
    }

    [[nodiscard]] Result<TaskHandle> submit(const format::TaskSpec& spec,
                                            const TaskFiles& files) override;

    [[nodiscard]] Result<TaskStatus> poll(const TaskHandle& handle) override;

    [[nodiscard]] VoidResult cancel(const TaskHandle& handle) override;

    [[nodiscard]] std::size_t capacity() const override;

    void shutdown() override;

private:
    struct Job {
        std::filesystem::path statusPath;
        bool cancelRequested = false;
        std::uint32_t unaccountedPolls = 0;
    };

    /// @brief squeue state, or empty once the job has left the queue.
    [[nodiscard]] Result<std::string> queueState(const std::string& jobId);

    /// @brief sacct "State|ExitCode" line, or empty while accounting lags.
    [[nodiscard]] Result<std::string> accountingRecord(const std::string& jobId);

    [[nodiscard]] TaskStatus endedStatus(const std::string& jobId, const Job& job,
                                         std::string_view accounting) const;

    ClusterSchedulerOptions options_;
    BackendEnvironment environment_;
    RetryPolicy retry_;
    std::chrono::milliseconds commandTimeout_;
    io::ProcessLauncher& launcher_;

    mutable std::mutex mutex_;
    std::map<std::string, Job> jobs_;
};

}  // namespace railmr::backend

#endif  // RAILMR_BACKEND_CLUSTER_SCHEDULER_BACKEND_H
