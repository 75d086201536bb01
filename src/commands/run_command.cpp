// =============================================================================
// railmr - Run Command Implementation
// =============================================================================

#include "run_command.h"

#include <iostream>
#include <system_error>

#include <fmt/format.h>

#include "railmr/backend/backend_factory.h"
#include "railmr/common/logger.h"
#include "railmr/format/manifest.h"
#include "railmr/io/process.h"
#include "railmr/stage/stage_body.h"
#include "signal_guard.h"

namespace railmr::commands {

// =============================================================================
// Shared Helpers
// =============================================================================

stage::PipelineDef loadPipeline(std::string_view nameOrPath) {
    if (stage::PipelineDef::isPreset(nameOrPath)) {
        return stage::PipelineDef::preset(nameOrPath);
    }
    std::filesystem::path path{std::string(nameOrPath)};
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        std::string known;
        for (const auto& name : stage::PipelineDef::presetNames()) {
            known += known.empty() ? name : ", " + name;
        }
        throw ConfigurationError(fmt::format(
            "'{}' is neither a pipeline preset ({}) nor a readable file", nameOrPath, known));
    }
    return stage::PipelineDef::load(path);
}

std::map<std::string, std::string> parseParams(const std::vector<std::string>& assignments) {
    std::map<std::string, std::string> params;
    for (const auto& assignment : assignments) {
        auto eq = assignment.find('=');
        if (eq == std::string::npos || eq == 0) {
            throw ConfigurationError(
                fmt::format("Malformed parameter '{}', expected key=value", assignment));
        }
        auto key = assignment.substr(0, eq);
        if (!params.emplace(key, assignment.substr(eq + 1)).second) {
            throw ConfigurationError(fmt::format("Parameter '{}' given more than once", key));
        }
    }
    return params;
}

// =============================================================================
// RunCommand Implementation
// =============================================================================

RunCommand::RunCommand(RunOptions options) : options_(std::move(options)) {}

RunCommand::~RunCommand() = default;

RunCommand::RunCommand(RunCommand&&) noexcept = default;
RunCommand& RunCommand::operator=(RunCommand&&) noexcept = default;

int RunCommand::execute() {
    try {
        auto registry = stage::StageRegistry::withBuiltins();

        auto manifest = format::Manifest::load(options_.manifestPath);
        if (manifest.empty()) {
            throw ConfigurationError(
                fmt::format("Manifest {} has no entries", options_.manifestPath.string()));
        }
        if (options_.checkInputs) {
            if (auto inputs = manifest.checkInputs(); !inputs) {
                throw ConfigurationError(inputs.error().message());
            }
        }

        auto pipelineDef = loadPipeline(options_.pipeline);
        pipelineDef.applyDefaults(options_.params);
        if (auto valid = pipelineDef.validate(registry); !valid) {
            throw ConfigurationError(valid.error().message());
        }

        auto jobConfig = options_.job;
        if (auto valid = jobConfig.validate(); !valid) {
            throw ConfigurationError(valid.error().message());
        }
        if (auto valid = options_.backend.validate(); !valid) {
            throw ConfigurationError(valid.error().message());
        }

        if (options_.dryRun) {
            printPlan(pipeline::planStages(pipelineDef, manifest, jobConfig.taskCount), manifest);
            return 0;
        }

        if (options_.showProgress) {
            jobConfig.progressCallback = [](const pipeline::ProgressInfo& info) {
                RAILMR_LOG_INFO("Stage {} {}: {}/{} tasks ({:.0f}%), {} failed attempts",
                                info.stage, info.stageName, info.completedTasks, info.totalTasks,
                                info.ratio() * 100.0, info.failedAttempts);
                return true;
            };
        }

        io::PosixProcessLauncher launcher;
        auto backend = backend::makeBackend(options_.backend, registry, launcher);

        pipeline::JobResult result;
        {
            pipeline::Orchestrator orchestrator(*backend, registry);
            SignalGuard signals([&orchestrator] { orchestrator.cancel(); });

            pipeline::Job job(std::move(manifest), std::move(pipelineDef), std::move(jobConfig));
            result = orchestrator.run(job);
        }
        backend->shutdown();

        if (!options_.quiet) {
            std::cout << pipeline::formatSummary(result);
        }
        return result.exitCode();

    } catch (const RailmrException& e) {
        RAILMR_LOG_ERROR("Run failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        RAILMR_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternalError);
    }
}

void RunCommand::printPlan(const std::vector<pipeline::StagePlan>& plan,
                           const format::Manifest& manifest) const {
    std::cout << fmt::format("manifest: {} ({} entries)\n", options_.manifestPath.string(),
                             manifest.size());
    std::cout << fmt::format("backend: {}\n", backendKindToString(options_.backend.kind));
    std::cout << fmt::format("task-count: {}\n", options_.job.taskCount);
    for (const auto& stage : plan) {
        std::cout << fmt::format(
            "stage {:02} {:<12} {:<6} {:<20} tasks {:>5} -> partitions {:>5}{}\n", stage.index,
            stage.name, stageRoleToString(stage.role), stage.body, stage.tasks, stage.partitions,
            stage.dedup && options_.job.dedup ? " dedup" : "");
    }
}

// =============================================================================
// Factory Function
// =============================================================================

std::unique_ptr<RunCommand> createRunCommand(RunOptions options) {
    return std::make_unique<RunCommand>(std::move(options));
}

}  // namespace railmr::commands
