// =============================================================================
// railmr - Task State Machine
// =============================================================================
// Orchestrator-side view of one task. Transitions are validated:
//
//   Pending  -> Running | Cancelled
//   Running  -> Succeeded | Failed | Cancelled
//   Failed   -> Retrying
//   Retrying -> Running | Cancelled
//   Succeeded -> Pending        only through requestRerun()
//
// Any other transition is an internal error.
// =============================================================================

#ifndef RAILMR_PIPELINE_TASK_H
#define RAILMR_PIPELINE_TASK_H

#include <chrono>
#include <optional>
#include <string>

#include "railmr/backend/backend.h"
#include "railmr/common/error.h"
#include "railmr/common/types.h"

namespace railmr::pipeline {

class Task {
public:
    using Clock = std::chrono::steady_clock;

    Task(StageIndex stage, TaskIndex index) : stage_(stage), index_(index) {}

    [[nodiscard]] static bool isValidTransition(TaskState from, TaskState to) noexcept;

    [[nodiscard]] StageIndex stage() const noexcept { return stage_; }
    [[nodiscard]] TaskIndex index() const noexcept { return index_; }
    [[nodiscard]] TaskState state() const noexcept { return state_; }

    /// @brief Number of the most recently started attempt (0 before the first).
    [[nodiscard]] AttemptNumber attempt() const noexcept { return attempt_; }

    /// @brief Failed attempts since the task was last (re)queued.
    [[nodiscard]] std::uint32_t failures() const noexcept { return failures_; }

    [[nodiscard]] std::uint32_t reruns() const noexcept { return reruns_; }

    [[nodiscard]] bool isTerminal() const noexcept {
        return state_ == TaskState::kSucceeded || state_ == TaskState::kCancelled;
    }

    /// @brief Ready to be submitted now.
    [[nodiscard]] bool isRunnable(Clock::time_point now) const noexcept {
        return state_ == TaskState::kPending ||
               (state_ == TaskState::kRetrying && now >= notBefore_);
    }

    /// @brief Pending or Retrying -> Running. Starts a new attempt.
    AttemptNumber start(backend::TaskHandle handle);

    void succeed();

    /// @brief Running -> Failed. @p countsAgainstBudget false leaves failures() unchanged.
    void fail(ErrorCode code, std::string reason, bool countsAgainstBudget = true);

    /// @brief Failed -> Retrying, eligible again at @p notBefore.
    void retry(Clock::time_point notBefore);

    void cancel();

    /// @brief Succeeded -> Pending after a downstream task found its output missing.
    void requestRerun();

    [[nodiscard]] const std::optional<backend::TaskHandle>& handle() const noexcept {
        return handle_;
    }

    [[nodiscard]] ErrorCode lastCode() const noexcept { return lastCode_; }
    [[nodiscard]] const std::string& lastReason() const noexcept { return lastReason_; }

    /// @brief Set when the task waits for upstream re-runs before retrying.
    bool blockedOnUpstream = false;

private:
    void transition(TaskState to);

    StageIndex stage_;
    TaskIndex index_;
    TaskState state_ = TaskState::kPending;
    AttemptNumber attempt_ = 0;
    std::uint32_t failures_ = 0;
    std::uint32_t reruns_ = 0;
    Clock::time_point notBefore_{};
    std::optional<backend::TaskHandle> handle_;
    ErrorCode lastCode_ = ErrorCode::kSuccess;
    std::string lastReason_;
};

}  // namespace railmr::pipeline

#endif  // RAILMR_PIPELINE_TASK_H
