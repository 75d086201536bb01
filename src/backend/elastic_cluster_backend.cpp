// =============================================================================
// railmr - Elastic Cluster (EMR) Backend Implementation
// =============================================================================

#include "railmr/backend/elastic_cluster_backend.h"

#include <fmt/format.h>

#include "railmr/common/logger.h"

namespace railmr::backend {

namespace {

constexpr std::string_view kNLineInputFormat = "org.apache.hadoop.mapred.lib.NLineInputFormat";

std::string fileUrl(const std::filesystem::path& path) {
    return "file://" + std::filesystem::absolute(path).string();
}

}  // namespace

nlohmann::json makeStreamingStep(const ElasticOptions& options,
                                 const std::filesystem::path& worker,
                                 const format::TaskSpec& spec, const TaskFiles& files) {
    auto id = attemptId(spec.stageIndex, spec.taskIndex, spec.attempt);
    auto outputDir = files.script;
    outputDir.replace_extension("out");

    nlohmann::json args = nlohmann::json::array({
        "hadoop-streaming",
        "-D",
        "mapreduce.job.reduces=0",
        "-D",
        fmt::format("mapreduce.job.name=railmr {} {}", spec.runId, id),
        "-inputformat",
        std::string(kNLineInputFormat),
        "-input",
        fileUrl(files.script),
        "-output",
        fileUrl(outputDir),
        "-mapper",
        fmt::format("{} exec-task --descriptor-stdin", worker.string()),
    });

    nlohmann::json step;
    step["Type"] = "CUSTOM_JAR";
    step["Name"] = fmt::format("railmr {} {} {}", spec.runId, spec.stage.name, id);
    step["ActionOnFailure"] = options.actionOnFailure;
    step["Jar"] = "command-runner.jar";
    step["Args"] = std::move(args);
    return nlohmann::json::array({std::move(step)});
}

Result<std::string> parseAddStepsResponse(std::string_view output) {
    auto response = nlohmann::json::parse(output, nullptr, false);
    if (response.is_discarded() || !response.is_object()) {
        return makeError<std::string>(ErrorCode::kTaskExecutionError,
                                      fmt::format("unreadable add-steps response '{}'", output));
    }
    auto ids = response.find("StepIds");
    if (ids == response.end() || !ids->is_array() || ids->empty() ||
        !ids->front().is_string()) {
        return makeError<std::string>(ErrorCode::kTaskExecutionError,
                                      "add-steps response carries no step id");
    }
    return ids->front().get<std::string>();
}

Result<StepState> parseDescribeStepResponse(std::string_view output) {
    auto response = nlohmann::json::parse(output, nullptr, false);
    const auto statusPointer = nlohmann::json::json_pointer("/Step/Status");
    if (response.is_discarded() || !response.contains(statusPointer)) {
        return makeError<StepState>(
            ErrorCode::kBackendUnavailable,
            fmt::format("unreadable describe-step response '{}'", output));
    }
    const auto& status = response.at(statusPointer);
    auto stateField = status.is_object() ? status.find("State") : status.end();
    if (stateField == status.end() || !stateField->is_string()) {
        return makeError<StepState>(ErrorCode::kBackendUnavailable,
                                    "describe-step response carries no step state");
    }
    StepState state;
    state.state = stateField->get<std::string>();
    auto details = status.find("FailureDetails");
    if (details != status.end() && details->is_object()) {
        for (const auto* key : {"Reason", "Message"}) {
            auto field = details->find(key);
            if (field == details->end() || !field->is_string()) {
                continue;
            }
            if (!state.failureReason.empty()) {
                state.failureReason += ": ";
            }
            state.failureReason += field->get<std::string>();
        }
    }
    return state;
}

bool StepState::active() const noexcept {
    return state == "PENDING" || state == "RUNNING" || state == "CANCEL_PENDING";
}

ElasticClusterBackend::ElasticClusterBackend(ElasticOptions options,
                                             BackendEnvironment environment, RetryPolicy retry,
                                             std::chrono::milliseconds commandTimeout,
                                             io::ProcessLauncher& launcher)
    : options_(std::move(options)),
      environment_(std::move(environment)),
      retry_(retry),
      commandTimeout_(commandTimeout),
      launcher_(launcher) {
    if (options_.region.empty()) {
        options_.region = environment_.awsRegion;
    }
    if (options_.profile.empty()) {
        options_.profile = environment_.awsProfile;
    }
}

std::vector<std::string> ElasticClusterBackend::emrCommand(std::string_view command) const {
    std::vector<std::string> argv = {environment_.aws, "emr", std::string(command),
                                     "--cluster-id", options_.clusterId};
    if (!options_.region.empty()) {
        argv.insert(argv.end(), {"--region", options_.region});
    }
    if (!options_.profile.empty()) {
        argv.insert(argv.end(), {"--profile", options_.profile});
    }
    return argv;
}

Result<std::string> ElasticClusterBackend::runAws(const std::vector<std::string>& argv,
                                                  std::string_view what) {
    auto output = retryWithBackoff<std::string>(
        retry_, what, [&] { return runClientCommand(launcher_, argv, commandTimeout_); });
    if (!output) {
        return std::unexpected(output.error());
    }
    return std::string(trimOutput(*output));
}

Result<TaskHandle> ElasticClusterBackend::submit(const format::TaskSpec& spec,
                                                 const TaskFiles& files) {
    // NLineInputFormat hands the mapper "offset TAB line".
    auto split = std::filesystem::absolute(files.descriptor).string() + "\n";
    if (auto written = writeSubmissionFile(files.script, split); !written) {
        return std::unexpected(written.error());
    }

    auto argv = emrCommand("add-steps");
    argv.insert(argv.end(),
                {"--steps", makeStreamingStep(options_, environment_.worker, spec, files).dump(),
                 "--output", "json"});
    auto output = runAws(argv, "aws emr add-steps");
    if (!output) {
        return std::unexpected(output.error());
    }
    auto stepId = parseAddStepsResponse(*output);
    if (!stepId) {
        return makeError<TaskHandle>(stepId.error().code(),
                                     fmt::format("aws emr add-steps for {}: {}", spec.describe(),
                                                 stepId.error().message()));
    }

    TaskHandle handle;
    handle.id = attemptId(spec.stageIndex, spec.taskIndex, spec.attempt);
    handle.externalId = *stepId;
    handle.stage = spec.stageIndex;
    handle.task = spec.taskIndex;
    handle.attempt = spec.attempt;
    {
        std::lock_guard lock(mutex_);
        steps_[*stepId] = Step{spec.statusPath, false};
    }
    RAILMR_LOG_DEBUG("Submitted {} as EMR step {}", spec.describe(), *stepId);
    return handle;
}

Result<TaskStatus> ElasticClusterBackend::poll(const TaskHandle& handle) {
    const auto& stepId = handle.externalId;
    Step step;
    {
        std::lock_guard lock(mutex_);
        auto it = steps_.find(stepId);
        if (it == steps_.end()) {
            return makeError<TaskStatus>(ErrorCode::kInternalError,
                                         fmt::format("unknown EMR step {}", stepId));
        }
        step = it->second;
    }

    auto argv = emrCommand("describe-step");
    argv.insert(argv.end(), {"--step-id", stepId, "--output", "json"});
    auto output = runAws(argv, "aws emr describe-step");
    if (!output) {
        return std::unexpected(output.error());
    }
    auto state = parseDescribeStepResponse(*output);
    if (!state) {
        return std::unexpected(state.error());
    }
    if (state->active()) {
        return TaskStatus::running();
    }

    TaskStatus status;
    std::error_code ec;
    if (std::filesystem::exists(step.statusPath, ec)) {
        status = statusFromFile(step.statusPath, state->state == "COMPLETED" ? 0 : 1);
    } else if (state->state == "CANCELLED" || step.cancelRequested) {
        status.state = TaskState::kCancelled;
        status.code = ErrorCode::kCancelled;
        status.reason = fmt::format("EMR step {} cancelled", stepId);
    } else {
        status = TaskStatus::failed(
            ErrorCode::kTaskExecutionError,
            fmt::format("EMR step {} ended {} without writing {}{}", stepId, state->state,
                        step.statusPath.string(),
                        state->failureReason.empty() ? "" : " (" + state->failureReason + ")"));
    }
    std::lock_guard lock(mutex_);
    steps_.erase(stepId);
    return status;
}

VoidResult ElasticClusterBackend::cancel(const TaskHandle& handle) {
    {
        std::lock_guard lock(mutex_);
        auto it = steps_.find(handle.externalId);
        if (it == steps_.end()) {
            return makeVoidSuccess();
        }
        it->second.cancelRequested = true;
    }
    auto argv = emrCommand("cancel-steps");
    argv.insert(argv.end(), {"--step-ids", handle.externalId});
    auto output = runAws(argv, "aws emr cancel-steps");
    if (!output) {
        return std::unexpected(output.error());
    }
    return makeVoidSuccess();
}

std::size_t ElasticClusterBackend::capacity() const {
    std::lock_guard lock(mutex_);
    return steps_.size() >= options_.maxConcurrentSteps
               ? 0
               : options_.maxConcurrentSteps - steps_.size();
}

void ElasticClusterBackend::shutdown() {
    std::map<std::string, Step> steps;
    {
        std::lock_guard lock(mutex_);
        steps.swap(steps_);
    }
    for (const auto& [stepId, step] : steps) {
        auto argv = emrCommand("cancel-steps");
        argv.insert(argv.end(), {"--step-ids", stepId});
        auto result = runClientCommand(launcher_, argv, commandTimeout_);
        if (!result) {
            RAILMR_LOG_WARNING("Could not cancel EMR step {}: {}", stepId,
                               result.error().message());
        }
    }
}

}  // namespace railmr::backend
