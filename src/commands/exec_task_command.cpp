// =============================================================================
// railmr - Exec-Task Command Implementation
// =============================================================================

#include "exec_task_command.h"

#include <iostream>
#include <vector>

#include "railmr/common/cancellation.h"
#include "railmr/common/error.h"
#include "railmr/common/logger.h"
#include "railmr/pipeline/worker.h"
#include "railmr/stage/stage_body.h"
#include "signal_guard.h"

namespace railmr::commands {

ExecTaskCommand::ExecTaskCommand(ExecTaskOptions options) : options_(std::move(options)) {}

ExecTaskCommand::~ExecTaskCommand() = default;

ExecTaskCommand::ExecTaskCommand(ExecTaskCommand&&) noexcept = default;
ExecTaskCommand& ExecTaskCommand::operator=(ExecTaskCommand&&) noexcept = default;

int ExecTaskCommand::execute() {
    return execute(std::cin);
}

int ExecTaskCommand::execute(std::istream& in) {
    try {
        std::vector<std::filesystem::path> descriptors;
        if (options_.fromStdin) {
            descriptors = pipeline::readDescriptorSplit(in);
        } else {
            descriptors.push_back(options_.descriptorPath);
        }
        if (descriptors.empty() || descriptors.front().empty()) {
            throw ConfigurationError("No task descriptor given");
        }

        auto registry = stage::StageRegistry::withBuiltins();
        CancellationToken cancel;
        SignalGuard signals([&cancel] { cancel.cancel(); });

        int exitCode = pipeline::kWorkerSucceeded;
        for (const auto& descriptor : descriptors) {
            if (cancel.isCancelled()) {
                return toExitCode(ErrorCode::kCancelled);
            }
            RAILMR_LOG_DEBUG("Executing task descriptor {}", descriptor.string());
            int code = pipeline::runTaskDescriptor(descriptor, registry, cancel);
            if (code == toExitCode(ErrorCode::kCancelled)) {
                return code;
            }
            if (code != pipeline::kWorkerSucceeded) {
                exitCode = code;
            }
        }
        return exitCode;

    } catch (const RailmrException& e) {
        RAILMR_LOG_ERROR("Task execution failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        RAILMR_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kInternalError);
    }
}

std::unique_ptr<ExecTaskCommand> createExecTaskCommand(ExecTaskOptions options) {
    return std::make_unique<ExecTaskCommand>(std::move(options));
}

}  // namespace railmr::commands
