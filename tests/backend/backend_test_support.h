// =============================================================================
// railmr - Backend Test Utilities
// =============================================================================
// A scripted ProcessLauncher that stands in for sbatch, squeue, sacct, ssh and
// aws, plus helpers for building one submitted attempt.
// =============================================================================

#ifndef RAILMR_TESTS_BACKEND_BACKEND_TEST_SUPPORT_H
#define RAILMR_TESTS_BACKEND_BACKEND_TEST_SUPPORT_H

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "railmr/backend/backend.h"
#include "railmr/backend/retry.h"
#include "railmr/format/task_descriptor.h"
#include "railmr/io/process.h"

namespace railmr::backend::test {

// =============================================================================
// FakeChild
// =============================================================================

/// @brief Exit state of a fake child, shared with the test.
struct ChildState {
    std::mutex mutex;
    std::optional<int> exitCode;
    bool terminated = false;

    void exit(int code) {
        std::lock_guard lock(mutex);
        exitCode = code;
    }
};

class FakeChild final : public io::ChildProcess {
public:
    FakeChild(std::shared_ptr<ChildState> state, int pid) : state_(std::move(state)), pid_(pid) {}

    [[nodiscard]] std::optional<int> tryWait() override {
        std::lock_guard lock(state_->mutex);
        return state_->exitCode;
    }

    int wait() override {
        std::lock_guard lock(state_->mutex);
        if (!state_->exitCode) {
            state_->exitCode = 128 + 15;
        }
        return *state_->exitCode;
    }

    void terminate() noexcept override {
        std::lock_guard lock(state_->mutex);
        state_->terminated = true;
        if (!state_->exitCode) {
            state_->exitCode = 128 + 15;
        }
    }

    [[nodiscard]] int pid() const noexcept override { return pid_; }

private:
    std::shared_ptr<ChildState> state_;
    int pid_;
};

// =============================================================================
// FakeLauncher
// =============================================================================

/// @brief Records every command and answers it from test-provided handlers.
class FakeLauncher final : public io::ProcessLauncher {
public:
    using RunHandler = std::function<Result<io::ProcessResult>(const std::vector<std::string>&)>;
    using SpawnHandler = std::function<Result<std::unique_ptr<io::ChildProcess>>(
        const std::vector<std::string>&, const std::filesystem::path&)>;

    [[nodiscard]] Result<io::ProcessResult> run(const std::vector<std::string>& argv,
                                                std::chrono::milliseconds /*timeout*/) override {
        record(argv);
        if (!onRun) {
            return makeError<io::ProcessResult>(ErrorCode::kBackendUnavailable, "no handler");
        }
        return onRun(argv);
    }

    [[nodiscard]] Result<std::unique_ptr<io::ChildProcess>> spawn(
        const std::vector<std::string>& argv, const std::filesystem::path& logFile) override {
        record(argv);
        if (!onSpawn) {
            return makeError<std::unique_ptr<io::ChildProcess>>(ErrorCode::kBackendUnavailable,
                                                                "no handler");
        }
        return onSpawn(argv, logFile);
    }

    /// @brief Commands naming @p program (or an aws subcommand) in their first three words.
    [[nodiscard]] std::vector<std::vector<std::string>> callsTo(const std::string& program) {
        std::lock_guard lock(mutex_);
        std::vector<std::vector<std::string>> matching;
        for (const auto& call : calls_) {
            auto words = call.begin() + static_cast<std::ptrdiff_t>(std::min<std::size_t>(
                                            call.size(), 3));
            if (std::find(call.begin(), words, program) != words) {
                matching.push_back(call);
            }
        }
        return matching;
    }

    [[nodiscard]] std::size_t callCount() {
        std::lock_guard lock(mutex_);
        return calls_.size();
    }

    RunHandler onRun;
    SpawnHandler onSpawn;

private:
    void record(const std::vector<std::string>& argv) {
        std::lock_guard lock(mutex_);
        calls_.push_back(argv);
    }

    std::mutex mutex_;
    std::vector<std::vector<std::string>> calls_;
};

[[nodiscard]] inline io::ProcessResult commandOutput(std::string output) {
    io::ProcessResult result;
    result.exitCode = 0;
    result.output = std::move(output);
    return result;
}

[[nodiscard]] inline io::ProcessResult commandFailure(int exitCode, std::string errorOutput) {
    io::ProcessResult result;
    result.exitCode = exitCode;
    result.errorOutput = std::move(errorOutput);
    return result;
}

/// @brief Retry policy without waiting.
[[nodiscard]] inline RetryPolicy quickRetry(std::uint32_t attempts = 3) {
    RetryPolicy policy;
    policy.maxAttempts = attempts;
    policy.initialDelay = std::chrono::milliseconds{0};
    policy.maxDelay = std::chrono::milliseconds{0};
    return policy;
}

// =============================================================================
// Attempts
// =============================================================================

struct Attempt {
    format::TaskSpec spec;
    TaskFiles files;
};

/// @brief Spec and file set of one attempt rooted at @p dir.
[[nodiscard]] inline Attempt makeAttempt(const std::filesystem::path& dir, TaskIndex task = 0,
                                         AttemptNumber attempt = 1) {
    Attempt result;
    result.spec.runId = "run-1";
    result.spec.stageIndex = 1;
    result.spec.stage.name = "count";
    result.spec.taskIndex = task;
    result.spec.attempt = attempt;
    auto id = attemptId(1, task, attempt);
    result.spec.statusPath = dir / (id + ".status");
    result.files.descriptor = dir / (id + ".task");
    result.files.log = dir / (id + ".log");
    result.files.script = dir / (id + ".submit");
    return result;
}

/// @brief What a worker leaves behind when it finishes.
inline void writeStatus(const Attempt& attempt, const format::TaskOutcome& outcome) {
    outcome.save(attempt.spec.statusPath);
}

[[nodiscard]] inline format::TaskOutcome successOutcome(std::uint64_t written = 5) {
    format::TaskCounters counters;
    counters.recordsWritten = written;
    return format::TaskOutcome::success(counters);
}

}  // namespace railmr::backend::test

#endif  // RAILMR_TESTS_BACKEND_BACKEND_TEST_SUPPORT_H
