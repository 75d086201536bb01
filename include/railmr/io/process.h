// =============================================================================
// railmr - Child Process Management
// =============================================================================
// Launching of external client tools (sbatch, ssh, aws) and of streaming stage
// bodies.
//
// ProcessLauncher is the seam the remote backends depend on: production code
// uses PosixProcessLauncher, tests inject a launcher that emulates the
// substrate's tools. Children are started with posix_spawnp() in their own
// process group so terminate() reaches everything they started.
//
// A child killed by signal N reports exit code 128 + N, as a shell would.
// =============================================================================

#ifndef RAILMR_IO_PROCESS_H
#define RAILMR_IO_PROCESS_H

#include <chrono>
#include <exception>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "railmr/common/error.h"

namespace railmr::io {

/// @brief Captured result of a command run to completion.
struct ProcessResult {
    int exitCode = -1;
    std::string output;
    std::string errorOutput;
    bool timedOut = false;

    [[nodiscard]] bool success() const noexcept { return exitCode == 0 && !timedOut; }
};

/// @brief A running child whose output goes to a log file.
class ChildProcess {
public:
    virtual ~ChildProcess() = default;

    /// @return The exit code if the child has finished.
    [[nodiscard]] virtual std::optional<int> tryWait() = 0;

    /// @brief Block until the child exits.
    virtual int wait() = 0;

    /// @brief Send SIGTERM to the child's process group.
    virtual void terminate() noexcept = 0;

    [[nodiscard]] virtual int pid() const noexcept = 0;
};

class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    /// @brief Run a command to completion, capturing stdout and stderr.
    /// @return Error(kBackendUnavailable) if the command cannot be started.
    [[nodiscard]] virtual Result<ProcessResult> run(const std::vector<std::string>& argv,
                                                    std::chrono::milliseconds timeout) = 0;

    /// @brief Start a command in the background, appending its output to @p logFile.
    [[nodiscard]] virtual Result<std::unique_ptr<ChildProcess>> spawn(
        const std::vector<std::string>& argv, const std::filesystem::path& logFile) = 0;
};

class PosixProcessLauncher final : public ProcessLauncher {
public:
    [[nodiscard]] Result<ProcessResult> run(const std::vector<std::string>& argv,
                                            std::chrono::milliseconds timeout) override;

    [[nodiscard]] Result<std::unique_ptr<ChildProcess>> spawn(
        const std::vector<std::string>& argv, const std::filesystem::path& logFile) override;
};

/// @brief Quote an argument for /bin/sh.
[[nodiscard]] std::string shellQuote(std::string_view argument);

/// @brief Quote and join an argument vector into one shell command line.
[[nodiscard]] std::string joinCommand(const std::vector<std::string>& argv);

// =============================================================================
// PipedProcess
// =============================================================================

/// @brief Shell command with a writable stdin and a streamed stdout.
///
/// stdout is consumed by a reader thread as it arrives, so the child never
/// blocks on a full pipe while input is still being written. stderr is
/// inherited.
class PipedProcess {
public:
    /// @brief Consumes the child's stdout on the reader thread.
    ///
    /// Whatever it leaves unread is discarded. An exception it throws is
    /// rethrown by finish().
    using OutputReader = std::function<void(std::istream& output)>;

    /// @throws TaskExecutionError if the shell cannot be started.
    PipedProcess(const std::string& shellCommand, OutputReader reader);

    /// @brief Kills the child if it is still running.
    ~PipedProcess();

    PipedProcess(const PipedProcess&) = delete;
    PipedProcess& operator=(const PipedProcess&) = delete;

    /// @throws TaskExecutionError if the child closed its input.
    void write(std::string_view data);

    void closeInput() noexcept;

    /// @brief Close stdin, wait for the child and return its exit code.
    /// @throws Whatever the output reader threw.
    int finish();

    [[nodiscard]] const std::string& command() const noexcept { return command_; }

private:
    void readOutput();

    std::string command_;
    int pid_ = -1;
    int stdinFd_ = -1;
    int stdoutFd_ = -1;
    OutputReader outputReader_;
    std::thread reader_;
    std::exception_ptr readError_;
    std::optional<int> exitCode_;
};

}  // namespace railmr::io

#endif  // RAILMR_IO_PROCESS_H
