// =============================================================================
// railmr - Cluster Scheduler (SLURM) Backend Implementation
// =============================================================================

#include "railmr/backend/cluster_scheduler_backend.h"

#include <array>
#include <charconv>

#include <fmt/format.h>

#include "railmr/common/logger.h"

namespace railmr::backend {

namespace {

/// Polls a finished job may go unaccounted before it is declared lost.
constexpr std::uint32_t kMaxUnaccountedPolls = 3;

std::string_view firstLine(std::string_view text) {
    text = trimOutput(text);
    return text.substr(0, text.find('\n'));
}

}  // namespace

std::string makeBatchScript(const ClusterSchedulerOptions& options,
                            const std::filesystem::path& worker, const format::TaskSpec& spec,
                            const TaskFiles& files) {
    std::string script = "#!/bin/sh\n";
    script += fmt::format("#SBATCH --job-name=railmr-{}-{}\n", spec.stage.name,
                          attemptId(spec.stageIndex, spec.taskIndex, spec.attempt));
    script += fmt::format("#SBATCH --output={}\n", files.log.string());
    script += "#SBATCH --open-mode=append\n";
    script += "#SBATCH --ntasks=1\n";
    script += fmt::format("#SBATCH --cpus-per-task={}\n", options.cpusPerTask);
    script += fmt::format("#SBATCH --time={}\n", options.timeLimit);
    if (!options.partition.empty()) {
        script += fmt::format("#SBATCH --partition={}\n", options.partition);
    }
    if (!options.account.empty()) {
        script += fmt::format("#SBATCH --account={}\n", options.account);
    }
    if (options.memoryMb > 0) {
        script += fmt::format("#SBATCH --mem={}M\n", options.memoryMb);
    }
    script += fmt::format("exec {} exec-task --descriptor {}\n", io::shellQuote(worker.string()),
                          io::shellQuote(files.descriptor.string()));
    return script;
}

bool isActiveSchedulerState(std::string_view state) noexcept {
    static constexpr std::array<std::string_view, 12> kActive = {
        "PENDING",      "RUNNING",     "CONFIGURING", "COMPLETING", "SUSPENDED", "REQUEUED",
        "REQUEUE_HOLD", "REQUEUE_FED", "RESIZING",    "SIGNALING",  "STAGE_OUT", "STOPPED"};
    for (auto active : kActive) {
        if (state == active) {
            return true;
        }
    }
    return false;
}

ClusterSchedulerBackend::ClusterSchedulerBackend(ClusterSchedulerOptions options,
                                                 BackendEnvironment environment, RetryPolicy retry,
                                                 std::chrono::milliseconds commandTimeout,
                                                 io::ProcessLauncher& launcher)
    : options_(std::move(options)),
      environment_(std::move(environment)),
      retry_(retry),
      commandTimeout_(commandTimeout),
      launcher_(launcher) {}

Result<TaskHandle> ClusterSchedulerBackend::submit(const format::TaskSpec& spec,
                                                   const TaskFiles& files) {
    auto script = makeBatchScript(options_, environment_.worker, spec, files);
    if (auto written = writeSubmissionFile(files.script, script); !written) {
        return std::unexpected(written.error());
    }

    std::vector<std::string> argv = {environment_.sbatch, "--parsable"};
    argv.insert(argv.end(), options_.extraArgs.begin(), options_.extraArgs.end());
    argv.push_back(files.script.string());

    auto output = retryWithBackoff<std::string>(
        retry_, "sbatch", [&] { return runClientCommand(launcher_, argv, commandTimeout_); });
    if (!output) {
        return std::unexpected(output.error());
    }

    // --parsable prints "jobid" or "jobid;cluster".
    auto line = firstLine(*output);
    std::string jobId(line.substr(0, line.find(';')));
    if (jobId.empty() || jobId.front() < '0' || jobId.front() > '9') {
        return makeError<TaskHandle>(
            ErrorCode::kTaskExecutionError,
            fmt::format("sbatch returned no job id for {} (output: '{}')", spec.describe(), line));
    }

    TaskHandle handle;
    handle.id = attemptId(spec.stageIndex, spec.taskIndex, spec.attempt);
    handle.externalId = jobId;
    handle.stage = spec.stageIndex;
    handle.task = spec.taskIndex;
    handle.attempt = spec.attempt;
    {
        std::lock_guard lock(mutex_);
        jobs_[jobId] = Job{spec.statusPath, false, 0};
    }
    RAILMR_LOG_DEBUG("Submitted {} as slurm job {}", spec.describe(), jobId);
    return handle;
}

Result<std::string> ClusterSchedulerBackend::queueState(const std::string& jobId) {
    std::vector<std::string> argv = {environment_.squeue, "-h", "-j", jobId, "-o", "%T"};
    return retryWithBackoff<std::string>(retry_, "squeue", [&]() -> Result<std::string> {
        auto result = launcher_.run(argv, commandTimeout_);
        if (!result) {
            return std::unexpected(result.error());
        }
        if (result->timedOut) {
            return makeError<std::string>(ErrorCode::kBackendUnavailable, "squeue timed out");
        }
        if (result->exitCode != 0) {
            // Jobs purged from the controller are reported as invalid.
            if (result->errorOutput.find("Invalid job id") != std::string::npos) {
                return std::string();
            }
            return makeError<std::string>(
                ErrorCode::kBackendUnavailable,
                fmt::format("squeue exited with code {}: {}", result->exitCode,
                            trimOutput(result->errorOutput)));
        }
        return std::string(firstLine(result->output));
    });
}

Result<std::string> ClusterSchedulerBackend::accountingRecord(const std::string& jobId) {
    std::vector<std::string> argv = {environment_.sacct, "-n", "-X", "-P", "-o",
                                     "State,ExitCode", "-j", jobId};
    auto output = retryWithBackoff<std::string>(
        retry_, "sacct", [&] { return runClientCommand(launcher_, argv, commandTimeout_); });
    if (!output) {
        return std::unexpected(output.error());
    }
    return std::string(firstLine(*output));
}

TaskStatus ClusterSchedulerBackend::endedStatus(const std::string& jobId, const Job& job,
                                                std::string_view accounting) const {
    auto bar = accounting.find('|');
    auto state = accounting.substr(0, bar);
    int exitCode = 0;
    if (bar != std::string_view::npos) {
        // ExitCode is "code:signal".
        auto code = accounting.substr(bar + 1);
        auto parsed = std::from_chars(code.data(), code.data() + code.size(), exitCode);
        if (parsed.ec != std::errc{}) {
            exitCode = -1;
        }
    }

    std::error_code ec;
    if (std::filesystem::exists(job.statusPath, ec)) {
        return statusFromFile(job.statusPath, exitCode);
    }
    if (job.cancelRequested || state.starts_with("CANCELLED")) {
        TaskStatus status;
        status.state = TaskState::kCancelled;
        status.code = ErrorCode::kCancelled;
        status.reason = fmt::format("slurm job {} cancelled", jobId);
        return status;
    }
    return TaskStatus::failed(
        ErrorCode::kTaskExecutionError,
        fmt::format("slurm job {} ended {} (exit {}) without writing {}", jobId,
                    state.empty() ? std::string_view("without accounting record") : state,
                    exitCode, job.statusPath.string()));
}

Result<TaskStatus> ClusterSchedulerBackend::poll(const TaskHandle& handle) {
    const auto& jobId = handle.externalId;
    Job job;
    {
        std::lock_guard lock(mutex_);
        auto it = jobs_.find(jobId);
        if (it == jobs_.end()) {
            return makeError<TaskStatus>(ErrorCode::kInternalError,
                                         fmt::format("unknown slurm job {}", jobId));
        }
        job = it->second;
    }

    auto state = queueState(jobId);
    if (!state) {
        return std::unexpected(state.error());
    }
    if (isActiveSchedulerState(*state)) {
        return TaskStatus::running();
    }

    auto accounting = accountingRecord(jobId);
    if (!accounting) {
        return std::unexpected(accounting.error());
    }
    auto accountedState = std::string_view(*accounting).substr(0, accounting->find('|'));
    if (isActiveSchedulerState(accountedState)) {
        return TaskStatus::running();
    }

    std::lock_guard lock(mutex_);
    auto it = jobs_.find(jobId);
    if (it == jobs_.end()) {
        return makeError<TaskStatus>(ErrorCode::kInternalError,
                                     fmt::format("unknown slurm job {}", jobId));
    }
    std::error_code ec;
    if (accounting->empty() && !std::filesystem::exists(job.statusPath, ec) &&
        ++it->second.unaccountedPolls < kMaxUnaccountedPolls) {
        return TaskStatus::running();
    }
    auto status = endedStatus(jobId, it->second, *accounting);
    jobs_.erase(it);
    return status;
}

VoidResult ClusterSchedulerBackend::cancel(const TaskHandle& handle) {
    {
        std::lock_guard lock(mutex_);
        auto it = jobs_.find(handle.externalId);
        if (it == jobs_.end()) {
            return makeVoidSuccess();
        }
        it->second.cancelRequested = true;
    }
    std::vector<std::string> argv = {environment_.scancel, handle.externalId};
    auto output = retryWithBackoff<std::string>(
        retry_, "scancel", [&] { return runClientCommand(launcher_, argv, commandTimeout_); });
    if (!output) {
        return std::unexpected(output.error());
    }
    return makeVoidSuccess();
}

std::size_t ClusterSchedulerBackend::capacity() const {
    std::lock_guard lock(mutex_);
    return jobs_.size() >= options_.maxQueued ? 0 : options_.maxQueued - jobs_.size();
}

void ClusterSchedulerBackend::shutdown() {
    std::map<std::string, Job> jobs;
    {
        std::lock_guard lock(mutex_);
        jobs.swap(jobs_);
    }
    for (const auto& [jobId, job] : jobs) {
        auto result = runClientCommand(launcher_, {environment_.scancel, jobId}, commandTimeout_);
        if (!result) {
            RAILMR_LOG_WARNING("Could not cancel slurm job {}: {}", jobId,
                               result.error().message());
        }
    }
}

}  // namespace railmr::backend
