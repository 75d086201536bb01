// =============================================================================
// railmr - Run Command
// =============================================================================
// Command handler for running a pipeline over a manifest on one backend.
//
// This module provides:
// - RunOptions: everything `railmr run` accepts
// - RunCommand: load, validate, plan and execute a Job
// - Helpers shared with `railmr validate` (pipeline lookup, --param parsing)
// =============================================================================

#ifndef RAILMR_COMMANDS_RUN_COMMAND_H
#define RAILMR_COMMANDS_RUN_COMMAND_H

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "railmr/backend/backend_config.h"
#include "railmr/common/error.h"
#include "railmr/pipeline/orchestrator.h"
#include "railmr/stage/stage.h"

namespace railmr::commands {

// =============================================================================
// Run Options
// =============================================================================

struct RunOptions {
    std::filesystem::path manifestPath;

    /// @brief Preset name or pipeline definition file.
    std::string pipeline = "dedup-count";

    /// @brief Job-level stage parameters (--param k=v).
    std::map<std::string, std::string> params;

    pipeline::JobConfig job;
    backend::BackendConfig backend;

    /// @brief Verify local input files exist before submitting anything.
    bool checkInputs = false;

    /// @brief Print the stage plan and exit.
    bool dryRun = false;

    /// @brief Log a line per completed task.
    bool showProgress = true;

    /// @brief Suppress the summary on stdout.
    bool quiet = false;
};

// =============================================================================
// RunCommand Class
// =============================================================================

class RunCommand {
public:
    explicit RunCommand(RunOptions options);

    ~RunCommand();

    // Non-copyable, movable
    RunCommand(const RunCommand&) = delete;
    RunCommand& operator=(const RunCommand&) = delete;
    RunCommand(RunCommand&&) noexcept;
    RunCommand& operator=(RunCommand&&) noexcept;

    /// @brief Execute the run command.
    /// @return 0 on success, 1 configuration error, 5 stage failure, 7 cancelled.
    [[nodiscard]] int execute();

    [[nodiscard]] const RunOptions& options() const noexcept { return options_; }

private:
    void printPlan(const std::vector<pipeline::StagePlan>& plan,
                   const format::Manifest& manifest) const;

    RunOptions options_;
};

// =============================================================================
// Shared Helpers
// =============================================================================

/// @brief Resolve a preset name or load a definition file.
/// @throws ConfigurationError if it is neither.
[[nodiscard]] stage::PipelineDef loadPipeline(std::string_view nameOrPath);

/// @brief Parse "key=value" arguments.
/// @throws ConfigurationError on a malformed or repeated key.
[[nodiscard]] std::map<std::string, std::string> parseParams(
    const std::vector<std::string>& assignments);

// =============================================================================
// Factory Function
// =============================================================================

[[nodiscard]] std::unique_ptr<RunCommand> createRunCommand(RunOptions options);

}  // namespace railmr::commands

#endif  // RAILMR_COMMANDS_RUN_COMMAND_H
