// =============================================================================
// railmr - Exec-Task Command
// =============================================================================
// Worker entry point launched by every backend: runs one task descriptor (or
// every descriptor named in an N-line input split on stdin) and publishes the
// status file the orchestrator reads back.
// =============================================================================

#ifndef RAILMR_COMMANDS_EXEC_TASK_COMMAND_H
#define RAILMR_COMMANDS_EXEC_TASK_COMMAND_H

#include <filesystem>
#include <iosfwd>
#include <memory>

namespace railmr::commands {

struct ExecTaskOptions {
    /// @brief Descriptor file; ignored when fromStdin is set.
    std::filesystem::path descriptorPath;

    /// @brief Read "offset TAB path" split lines from stdin.
    bool fromStdin = false;
};

class ExecTaskCommand {
public:
    explicit ExecTaskCommand(ExecTaskOptions options);

    ~ExecTaskCommand();

    ExecTaskCommand(const ExecTaskCommand&) = delete;
    ExecTaskCommand& operator=(const ExecTaskCommand&) = delete;
    ExecTaskCommand(ExecTaskCommand&&) noexcept;
    ExecTaskCommand& operator=(ExecTaskCommand&&) noexcept;

    /// @return 0 if every task succeeded, 4 on task failure, 7 if cancelled.
    [[nodiscard]] int execute();

    /// @brief Same as execute() with descriptor split lines taken from @p in.
    [[nodiscard]] int execute(std::istream& in);

    [[nodiscard]] const ExecTaskOptions& options() const noexcept { return options_; }

private:
    ExecTaskOptions options_;
};

[[nodiscard]] std::unique_ptr<ExecTaskCommand> createExecTaskCommand(ExecTaskOptions options);

}  // namespace railmr::commands

#endif  // RAILMR_COMMANDS_EXEC_TASK_COMMAND_H
