// =============================================================================
// railmr - Pipeline Orchestrator Implementation
// =============================================================================

#include "railmr/pipeline/orchestrator.h"

#include <algorithm>
#include <fstream>

#include <fmt/format.h>

#include "railmr/backend/retry.h"
#include "railmr/common/logger.h"
#include "railmr/format/partition_file.h"
#include "railmr/sort/merge_reader.h"

namespace railmr::pipeline {

namespace {

/// Upper bound on waiting for cancelled attempts to report back.
constexpr std::chrono::seconds kMinDrainTimeout{30};

/// Lines of a failed attempt's log quoted in the job diagnostic.
constexpr std::size_t kLogTailLines = 20;

std::string logTail(const std::filesystem::path& log) {
    std::ifstream in(log);
    if (!in) {
        return {};
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(std::move(line));
        if (lines.size() > kLogTailLines) {
            lines.erase(lines.begin());
        }
    }
    std::string tail;
    for (const auto& kept : lines) {
        tail += "\n  | ";
        tail += kept;
    }
    return tail;
}

bool allSucceeded(const std::vector<Task>& tasks) {
    return std::all_of(tasks.begin(), tasks.end(),
                       [](const Task& task) { return task.state() == TaskState::kSucceeded; });
}

}  // namespace

// =============================================================================
// Configuration and reports
// =============================================================================

VoidResult JobConfig::validate() const {
    if (workRoot.empty()) {
        return makeVoidError(ErrorCode::kConfigurationError, "--work-root must not be empty");
    }
    if (runId.find('/') != std::string::npos || runId == "." || runId == "..") {
        return makeVoidError(ErrorCode::kConfigurationError,
                             fmt::format("invalid run id '{}'", runId));
    }
    if (taskCount == 0) {
        return makeVoidError(ErrorCode::kConfigurationError, "--tasks must be positive");
    }
    if (maxAttempts == 0) {
        return makeVoidError(ErrorCode::kConfigurationError, "--max-attempts must be positive");
    }
    if (pollInterval.count() <= 0) {
        return makeVoidError(ErrorCode::kConfigurationError, "--poll-interval must be positive");
    }
    if (retryBackoff.count() < 0 || maxRetryBackoff < retryBackoff) {
        return makeVoidError(ErrorCode::kConfigurationError,
                             "retry backoff must satisfy 0 <= initial <= max");
    }
    if (compression != Compression::kNone && (compressionLevel < 1 || compressionLevel > 19)) {
        return makeVoidError(ErrorCode::kConfigurationError,
                             fmt::format("compression level {} out of range 1-19",
                                         compressionLevel));
    }
    if (sortBufferMB == 0) {
        return makeVoidError(ErrorCode::kConfigurationError, "--sort-buffer must be positive");
    }
    if (claimTimeout.count() <= 0) {
        return makeVoidError(ErrorCode::kConfigurationError, "claim timeout must be positive");
    }
    return makeVoidSuccess();
}

std::vector<StagePlan> planStages(const stage::PipelineDef& pipeline,
                                  const format::Manifest& manifest, std::uint32_t taskCount) {
    std::vector<StagePlan> plans;
    auto tasks = static_cast<std::uint32_t>(manifest.size());
    for (StageIndex i = 0; i < pipeline.size(); ++i) {
        const auto& def = pipeline.stage(i);
        StagePlan plan;
        plan.index = i;
        plan.name = def.name;
        plan.role = def.role;
        plan.body = def.body;
        plan.tasks = tasks;
        plan.partitions = def.outputPartitions(taskCount);
        plan.dedup = def.dedup;
        tasks = plan.partitions;
        plans.push_back(std::move(plan));
    }
    return plans;
}

int JobResult::exitCode() const noexcept {
    switch (state) {
        case JobState::kSucceeded:
            return 0;
        case JobState::kCancelled:
            return toExitCode(ErrorCode::kCancelled);
        default:
            break;
    }
    if (code == ErrorCode::kSuccess || exitCategory(code) == ErrorCode::kTaskExecutionError) {
        return toExitCode(ErrorCode::kStageFailure);
    }
    return toExitCode(code);
}

std::string formatSummary(const JobResult& result) {
    std::string out;
    out += fmt::format("run-id: {}\n", result.runId);
    out += fmt::format("state: {}\n", jobStateToString(result.state));
    if (result.state != JobState::kSucceeded) {
        out += fmt::format("code: {}\n", errorCodeToString(result.code));
        out += fmt::format("reason: {}\n", result.reason);
    }
    out += fmt::format("elapsed-ms: {}\n", result.elapsed.count());
    for (const auto& stage : result.stages) {
        const auto& plan = stage.plan;
        const auto& c = stage.counters;
        out += fmt::format(
            "stage {:02} {} ({} {}): tasks {}, partitions {}, submitted {}, succeeded {}, "
            "failed {}, retried {}, upstream-reruns {}{}\n",
            plan.index, plan.name, stageRoleToString(plan.role), plan.body, plan.tasks,
            plan.partitions, stage.submitted, stage.succeeded, stage.failed, stage.retried,
            stage.upstreamReruns, stage.completed ? "" : " [incomplete]");
        out += fmt::format(
            "  units {}, records-read {}, records-written {}, bytes-written {}, "
            "cache hits {} misses {} accepted {} race-losses {}\n",
            c.unitsProcessed, c.recordsRead, c.recordsWritten, c.bytesWritten, c.cache.hits,
            c.cache.misses, c.cache.accepted, c.cache.raceLosses);
    }
    const auto& t = result.totals;
    out += fmt::format("totals: units {}, records-written {}, cache hits {} misses {}\n",
                       t.unitsProcessed, t.recordsWritten, t.cache.hits, t.cache.misses);
    for (const auto& output : result.outputs) {
        out += fmt::format("output: {}\n", output.string());
    }
    return out;
}

Job::Job(format::Manifest manifest, stage::PipelineDef pipeline, JobConfig config)
    : manifest_(std::move(manifest)),
      pipeline_(std::move(pipeline)),
      config_(std::move(config)) {}

// =============================================================================
// Orchestrator
// =============================================================================

Orchestrator::Orchestrator(backend::Backend& backend, const stage::StageRegistry& registry)
    : backend_(backend), registry_(registry) {}

Orchestrator::~Orchestrator() {
    backend_.setCompletionListener(nullptr);
}

void Orchestrator::cancel() noexcept {
    cancel_.cancel();
    wakeup_.notify();
}

JobResult Orchestrator::run(Job& job) {
    if (auto valid = job.config_.validate(); !valid) {
        throw ConfigurationError(valid.error().message());
    }
    if (auto valid = job.pipeline_.validate(registry_); !valid) {
        throw ConfigurationError(valid.error().message());
    }
    if (job.manifest_.empty()) {
        throw ConfigurationError("manifest has no entries");
    }

    started_ = Clock::now();
    prepare(job);
    auto& result = job.result_;
    backend_.setCompletionListener([this] { wakeup_.notify(); });

    result.state = JobState::kRunning;
    RAILMR_LOG_INFO("Job {} started: {} stages over {} input units on the {} backend",
                    result.runId, job.stages_.size(), job.manifest_.size(), backend_.name());

    bool completed = true;
    for (StageIndex s = 0; s < job.stages_.size(); ++s) {
        if (!runStage(job, s)) {
            completed = false;
            break;
        }
    }
    if (completed) {
        try {
            mergeOutputs(job);
            if (!job.config_.keepIntermediates) {
                removeIntermediates(job);
            }
            result.state = JobState::kSucceeded;
            result.code = ErrorCode::kSuccess;
        } catch (const RailmrException& ex) {
            failJob(job, ex.code(), fmt::format("cannot publish job output: {}", ex.what()));
        }
    }
    backend_.setCompletionListener(nullptr);

    result.stages.clear();
    result.totals = {};
    for (const auto& run : job.stages_) {
        result.stages.push_back(run.report);
        result.totals += run.report.counters;
    }
    result.elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_);
    writeSummary(job);

    if (result.succeeded()) {
        RAILMR_LOG_INFO("Job {} succeeded in {} ms", result.runId, result.elapsed.count());
    } else {
        RAILMR_LOG_ERROR("Job {} {}: {}", result.runId, jobStateToString(result.state),
                         result.reason);
    }
    return result;
}

void Orchestrator::prepare(Job& job) {
    const auto& config = job.config_;
    auto runId = config.runId.empty() ? format::StorageLayout::makeRunId() : config.runId;
    job.layout_.emplace(std::filesystem::absolute(config.workRoot), runId);
    const auto& layout = *job.layout_;

    std::error_code ec;
    if (std::filesystem::exists(layout.runRoot(), ec)) {
        if (!config.force) {
            throw ConfigurationError(
                fmt::format("run directory {} already exists (use --force to replace it)",
                            layout.runRoot().string()));
        }
        RAILMR_LOG_WARNING("Removing existing run directory {}", layout.runRoot().string());
        std::filesystem::remove_all(layout.runRoot(), ec);
        if (ec) {
            throw IOError("cannot remove existing run directory", ec,
                          ErrorContext(layout.runRoot().string()));
        }
    }
    layout.create();

    auto& result = job.result_;
    result = JobResult{};
    result.runId = layout.runId();
    result.runRoot = layout.runRoot();

    job.stages_.clear();
    for (auto& plan : planStages(job.pipeline_, job.manifest_, config.taskCount)) {
        Job::StageRun run;
        run.def = job.pipeline_.stage(plan.index);
        run.dir = layout.stageDir(plan.index, plan.name);
        for (TaskIndex t = 0; t < plan.tasks; ++t) {
            run.tasks.emplace_back(plan.index, t);
        }
        run.report.plan = std::move(plan);
        job.stages_.push_back(std::move(run));
    }
}

bool Orchestrator::runStage(Job& job, StageIndex index) {
    auto& run = job.stages_[index];
    auto& result = job.result_;
    const auto& plan = run.report.plan;

    std::error_code ec;
    std::filesystem::create_directories(run.dir, ec);
    if (ec) {
        failJob(job, ErrorCode::kIOError,
                fmt::format("cannot create {}: {}", run.dir.string(), ec.message()));
        return false;
    }
    RAILMR_LOG_INFO("Stage {} '{}' ({} {}): {} tasks -> {} partitions", index, plan.name,
                    stageRoleToString(plan.role), plan.body, plan.tasks, plan.partitions);

    // Upstream tasks come back into play when a downstream task finds their files missing.
    std::vector<StageIndex> active;
    if (index > 0) {
        active.push_back(index - 1);
    }
    active.push_back(index);

    while (true) {
        if (cancel_.isCancelled()) {
            drain(job, active);
            result.state = JobState::kCancelled;
            result.code = ErrorCode::kCancelled;
            result.reason = fmt::format("cancelled during stage '{}'", plan.name);
            return false;
        }
        if (result.state == JobState::kFailed) {
            drain(job, active);
            return false;
        }

        if (index > 0 && allSucceeded(job.stages_[index - 1].tasks)) {
            for (auto& task : run.tasks) {
                if (task.blockedOnUpstream) {
                    task.blockedOnUpstream = false;
                    task.retry(Clock::now());
                }
            }
        }

        // Nothing of this stage starts while an upstream re-run is outstanding.
        const bool upstreamSettled = index == 0 || allSucceeded(job.stages_[index - 1].tasks);
        auto now = Clock::now();
        for (auto stage : active) {
            if (stage == index && !upstreamSettled) {
                continue;
            }
            for (auto& task : job.stages_[stage].tasks) {
                if (result.state == JobState::kFailed || backend_.capacity() == 0) {
                    break;
                }
                if (task.isRunnable(now)) {
                    submitTask(job, stage, task);
                }
            }
        }

        pollRunning(job, active);

        if (result.state != JobState::kFailed && !cancel_.isCancelled() &&
            std::all_of(active.begin(), active.end(), [&](StageIndex stage) {
                return allSucceeded(job.stages_[stage].tasks);
            })) {
            run.report.completed = true;
            RAILMR_LOG_INFO("Stage {} '{}' complete: {} succeeded, {} failed attempts, {} retried",
                            index, plan.name, run.report.succeeded, run.report.failed,
                            run.report.retried);
            return true;
        }
        wakeup_.waitFor(job.config_.pollInterval);
    }
}

format::TaskSpec Orchestrator::buildSpec(const Job& job, StageIndex stage, TaskIndex task,
                                         AttemptNumber attempt) const {
    const auto& layout = *job.layout_;
    const auto& config = job.config_;
    const auto& run = job.stages_[stage];

    format::TaskSpec spec;
    spec.runId = layout.runId();
    spec.stageIndex = stage;
    spec.stage = run.def;
    spec.outputPartitions = run.report.plan.partitions;
    spec.taskIndex = task;
    spec.attempt = attempt;
    if (stage == 0) {
        spec.manifestEntry = job.manifest_.entry(task).resolved(std::filesystem::current_path());
    } else {
        const auto& upstream = job.stages_[stage - 1];
        spec.inputFiles = format::StorageLayout::partitionInputs(upstream.dir, task,
                                                                 upstream.report.plan.tasks);
    }
    spec.outputDir = run.dir;
    spec.cacheDir = layout.cacheDir();
    spec.scratchDir = layout.taskScratchDir(stage, task, attempt);
    spec.statusPath = layout.taskFile(stage, task, attempt, "status");
    spec.compression = config.compression;
    spec.compressionLevel = config.compressionLevel;
    spec.sortBufferBytes = config.sortBufferMB * 1024 * 1024;
    spec.claimTimeout = config.claimTimeout;
    spec.dedupEnabled = config.dedup;
    return spec;
}

void Orchestrator::submitTask(Job& job, StageIndex stage, Task& task) {
    const auto& layout = *job.layout_;
    auto attempt = task.attempt() + 1;
    auto spec = buildSpec(job, stage, task.index(), attempt);
    backend::TaskFiles files{layout.taskFile(stage, task.index(), attempt, "task"),
                             layout.taskFile(stage, task.index(), attempt, "log"),
                             layout.taskFile(stage, task.index(), attempt, "submit")};
    ++job.stages_[stage].report.submitted;

    backend::TaskHandle placeholder;
    placeholder.id = backend::attemptId(stage, task.index(), attempt);
    placeholder.stage = stage;
    placeholder.task = task.index();
    placeholder.attempt = attempt;

    std::error_code ec;
    std::filesystem::remove(spec.statusPath, ec);
    try {
        spec.save(files.descriptor);
    } catch (const RailmrException& ex) {
        task.start(placeholder);
        handleFailure(job, stage, task, ex.code(),
                      fmt::format("cannot write task descriptor: {}", ex.what()));
        return;
    }

    auto handle = backend_.submit(spec, files);
    if (!handle) {
        task.start(placeholder);
        handleFailure(job, stage, task, handle.error().code(),
                      fmt::format("submission failed: {}", handle.error().message()));
        return;
    }
    task.start(*handle);
    RAILMR_LOG_DEBUG("Submitted {} ({})", spec.describe(), handle->externalId);
}

void Orchestrator::pollRunning(Job& job, const std::vector<StageIndex>& stages) {
    for (auto stage : stages) {
        for (auto& task : job.stages_[stage].tasks) {
            if (task.state() != TaskState::kRunning) {
                continue;
            }
            const auto& handle = *task.handle();
            auto status = backend_.poll(handle);
            if (!status) {
                if (auto cancelled = backend_.cancel(handle); !cancelled) {
                    RAILMR_LOG_WARNING("Could not cancel {}: {}", handle.id,
                                       cancelled.error().message());
                }
                handleFinished(job, stage, task,
                               backend::TaskStatus::failed(
                                   ErrorCode::kTaskExecutionError,
                                   fmt::format("status query failed: {}",
                                               status.error().message())));
                continue;
            }
            if (status->finished()) {
                handleFinished(job, stage, task, std::move(*status));
            }
        }
    }
}

VoidResult Orchestrator::checkOutputs(const Job::StageRun& run, const Task& task,
                                      const backend::TaskStatus& status) {
    std::vector<std::filesystem::path> paths;
    paths.reserve(run.report.plan.partitions);
    for (PartitionIndex p = 0; p < run.report.plan.partitions; ++p) {
        paths.push_back(format::StorageLayout::partitionFile(run.dir, p, task.index()));
    }

    // Without the worker's counters every file is read back in full.
    if (!status.counters) {
        for (const auto& path : paths) {
            if (auto verified = format::verifyRecordFile(path); !verified) {
                return std::unexpected(verified.error());
            }
        }
        return makeVoidSuccess();
    }

    auto stored = format::publishedBytes(paths);
    if (!stored) {
        return std::unexpected(stored.error());
    }
    if (*stored != status.counters->fileBytes) {
        return makeVoidError(ErrorCode::kCorruptedData,
                             fmt::format("{} output bytes on storage, worker published {}",
                                         *stored, status.counters->fileBytes));
    }
    return makeVoidSuccess();
}

void Orchestrator::handleFinished(Job& job, StageIndex stage, Task& task,
                                  backend::TaskStatus status) {
    auto& run = job.stages_[stage];
    switch (status.state) {
        case TaskState::kSucceeded: {
            if (auto checked = checkOutputs(run, task, status); !checked) {
                handleFailure(job, stage, task, checked.error().code(),
                              fmt::format("output verification failed: {}",
                                          checked.error().message()));
                return;
            }
            task.succeed();
            ++run.report.succeeded;
            if (status.counters) {
                run.report.counters += *status.counters;
            }
            RAILMR_LOG_DEBUG("Task {}/{} attempt {} succeeded", run.def.name, task.index(),
                             task.attempt());
            reportProgress(job, stage);
            return;
        }
        case TaskState::kCancelled:
            if (cancel_.isCancelled()) {
                task.cancel();
                return;
            }
            handleFailure(job, stage, task, ErrorCode::kTaskExecutionError,
                          status.reason.empty() ? std::string("attempt cancelled by the backend")
                                                : status.reason);
            return;
        default:
            handleFailure(job, stage, task,
                          status.code == ErrorCode::kSuccess ? ErrorCode::kTaskExecutionError
                                                             : status.code,
                          std::move(status.reason));
            return;
    }
}

void Orchestrator::handleFailure(Job& job, StageIndex stage, Task& task, ErrorCode code,
                                 std::string reason) {
    auto& run = job.stages_[stage];
    const auto& config = job.config_;
    auto attempt = task.attempt();
    const bool settling = cancel_.isCancelled() || job.result_.state == JobState::kFailed;
    // A failure caused by missing upstream output is not held against this task.
    const bool upstreamRerun =
        !settling && stage > 0 &&
        (code == ErrorCode::kMissingInput || code == ErrorCode::kCorruptedData) &&
        requestUpstreamReruns(job, stage, task);
    task.fail(code, reason, !upstreamRerun);
    ++run.report.failed;
    RAILMR_LOG_WARNING("Task {}/{} attempt {} failed ({}): {}", run.def.name, task.index(),
                       attempt, errorCodeToString(code), reason);

    if (settling) {
        return;
    }
    if (upstreamRerun) {
        task.blockedOnUpstream = true;
        return;
    }
    if (task.failures() < config.maxAttempts) {
        auto delay = backend::backoffDelay(config.retryBackoff, task.failures(),
                                           config.maxRetryBackoff);
        task.retry(Clock::now() + delay);
        ++run.report.retried;
        return;
    }

    auto log = job.layout_->taskFile(stage, task.index(), attempt, "log");
    failJob(job, ErrorCode::kStageFailure,
            fmt::format("stage '{}' task {} failed {} times; last error: {}{}", run.def.name,
                        task.index(), task.failures(), reason, logTail(log)));
}

bool Orchestrator::requestUpstreamReruns(Job& job, StageIndex stage, const Task& task) {
    auto& upstream = job.stages_[stage - 1];
    std::vector<TaskIndex> missing;
    for (TaskIndex t = 0; t < upstream.tasks.size(); ++t) {
        auto path = format::StorageLayout::partitionFile(upstream.dir, task.index(), t);
        if (format::verifyRecordFile(path)) {
            continue;
        }
        const auto& producer = upstream.tasks[t];
        if (producer.state() == TaskState::kSucceeded &&
            producer.reruns() >= job.config_.maxUpstreamReruns) {
            RAILMR_LOG_WARNING("Task {}/{} already re-run {} times; not re-running again",
                               upstream.def.name, t, producer.reruns());
            return false;
        }
        missing.push_back(t);
    }
    if (missing.empty()) {
        return false;
    }
    for (auto t : missing) {
        auto& producer = upstream.tasks[t];
        if (producer.state() != TaskState::kSucceeded) {
            continue;
        }
        RAILMR_LOG_WARNING("Re-running task {}/{}: its partition {} is missing or unreadable",
                           upstream.def.name, t, task.index());
        producer.requestRerun();
        ++upstream.report.upstreamReruns;
    }
    return true;
}

void Orchestrator::drain(Job& job, const std::vector<StageIndex>& stages) {
    for (auto stage : stages) {
        for (auto& task : job.stages_[stage].tasks) {
            if (task.state() == TaskState::kRunning) {
                if (auto cancelled = backend_.cancel(*task.handle()); !cancelled) {
                    RAILMR_LOG_WARNING("Could not cancel {}: {}", task.handle()->id,
                                       cancelled.error().message());
                }
            } else if (task.state() == TaskState::kPending ||
                       task.state() == TaskState::kRetrying) {
                task.blockedOnUpstream = false;
                task.cancel();
            }
        }
    }

    auto running = [&] {
        return std::any_of(stages.begin(), stages.end(), [&](StageIndex stage) {
            const auto& tasks = job.stages_[stage].tasks;
            return std::any_of(tasks.begin(), tasks.end(), [](const Task& task) {
                return task.state() == TaskState::kRunning;
            });
        });
    };
    auto deadline = Clock::now() + std::max<std::chrono::milliseconds>(
                                       kMinDrainTimeout, job.config_.pollInterval * 10);
    while (running() && Clock::now() < deadline) {
        pollRunning(job, stages);
        if (running()) {
            wakeup_.waitFor(job.config_.pollInterval);
        }
    }
    for (auto stage : stages) {
        for (auto& task : job.stages_[stage].tasks) {
            if (task.state() == TaskState::kRunning) {
                RAILMR_LOG_WARNING("Task {}/{} did not report back after cancellation",
                                   job.stages_[stage].def.name, task.index());
                task.cancel();
            }
        }
    }
}

void Orchestrator::reportProgress(Job& job, StageIndex stage) {
    const auto& callback = job.config_.progressCallback;
    if (!callback) {
        return;
    }
    const auto& report = job.stages_[stage].report;
    ProgressInfo info;
    info.stage = stage;
    info.stageName = report.plan.name;
    info.totalTasks = report.plan.tasks;
    info.completedTasks = std::min(report.succeeded, report.plan.tasks);
    info.failedAttempts = report.failed;
    info.elapsedMs = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_).count());
    if (!callback(info)) {
        RAILMR_LOG_WARNING("Job cancelled by progress callback");
        cancel();
    }
}

void Orchestrator::mergeOutputs(Job& job) {
    const auto& config = job.config_;
    if (config.outputDir.empty()) {
        return;
    }
    const auto& last = job.stages_.back();
    const auto& plan = last.report.plan;

    std::error_code ec;
    std::filesystem::create_directories(config.outputDir, ec);
    if (ec) {
        throw IOError("cannot create output directory", ec,
                      ErrorContext(config.outputDir.string()));
    }

    format::PartitionWriterOptions options;
    options.compression = config.compression;
    options.compressionLevel = config.compressionLevel;
    for (PartitionIndex p = 0; p < plan.partitions; ++p) {
        auto inputs = format::StorageLayout::partitionInputs(last.dir, p, plan.tasks);
        sort::MergeReader merged(sort::openFileSources(inputs));
        auto target = config.outputDir / fmt::format("part-{:05}{}", p, kPartitionFileExtension);
        format::PartitionWriter writer(target, options);
        while (auto record = merged.next()) {
            writer.write(*record);
        }
        writer.commit();
        job.result_.outputs.push_back(target);
    }
    RAILMR_LOG_INFO("Merged {} partitions of stage '{}' into {}", plan.partitions, plan.name,
                    config.outputDir.string());
}

void Orchestrator::removeIntermediates(const Job& job) const {
    const auto& layout = *job.layout_;
    std::vector<std::filesystem::path> doomed = {layout.tasksDir(), layout.cacheDir(),
                                                 layout.scratchDir()};
    for (std::size_t s = 0; s + 1 < job.stages_.size(); ++s) {
        doomed.push_back(job.stages_[s].dir);
    }
    for (const auto& path : doomed) {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        if (ec) {
            RAILMR_LOG_WARNING("Could not remove {}: {}", path.string(), ec.message());
        }
    }
}

void Orchestrator::writeSummary(const Job& job) const {
    const auto& path = job.layout_->summaryPath();
    std::ofstream out(path, std::ios::trunc);
    out << formatSummary(job.result_);
    out.close();
    if (!out) {
        RAILMR_LOG_WARNING("Could not write job summary {}", path.string());
    }
}

void Orchestrator::failJob(Job& job, ErrorCode code, std::string reason) {
    auto& result = job.result_;
    if (result.state == JobState::kFailed) {
        return;
    }
    result.state = JobState::kFailed;
    result.code = code;
    result.reason = std::move(reason);
    RAILMR_LOG_ERROR("{}", result.reason);
}

}  // namespace railmr::pipeline
