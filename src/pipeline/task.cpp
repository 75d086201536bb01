// =============================================================================
// railmr - Task State Machine Implementation
// =============================================================================

#include "railmr/pipeline/task.h"

#include <fmt/format.h>

namespace railmr::pipeline {

bool Task::isValidTransition(TaskState from, TaskState to) noexcept {
    switch (from) {
        case TaskState::kPending:
            return to == TaskState::kRunning || to == TaskState::kCancelled;
        case TaskState::kRunning:
            return to == TaskState::kSucceeded || to == TaskState::kFailed ||
                   to == TaskState::kCancelled;
        case TaskState::kFailed:
            return to == TaskState::kRetrying;
        case TaskState::kRetrying:
            return to == TaskState::kRunning || to == TaskState::kCancelled;
        case TaskState::kSucceeded:
        case TaskState::kCancelled:
            return false;
    }
    return false;
}

void Task::transition(TaskState to) {
    if (!isValidTransition(state_, to)) {
        throw RailmrException(ErrorCode::kInternalError,
                              fmt::format("Illegal transition {} -> {} for task {}/{}",
                                          taskStateToString(state_), taskStateToString(to),
                                          stage_, index_));
    }
    state_ = to;
}

AttemptNumber Task::start(backend::TaskHandle handle) {
    transition(TaskState::kRunning);
    ++attempt_;
    handle.attempt = attempt_;
    handle_ = std::move(handle);
    blockedOnUpstream = false;
    return attempt_;
}

void Task::succeed() {
    transition(TaskState::kSucceeded);
    handle_.reset();
    lastCode_ = ErrorCode::kSuccess;
    lastReason_.clear();
}

void Task::fail(ErrorCode code, std::string reason, bool countsAgainstBudget) {
    transition(TaskState::kFailed);
    handle_.reset();
    if (countsAgainstBudget) {
        ++failures_;
    }
    lastCode_ = code;
    lastReason_ = std::move(reason);
}

void Task::retry(Clock::time_point notBefore) {
    transition(TaskState::kRetrying);
    notBefore_ = notBefore;
}

void Task::cancel() {
    transition(TaskState::kCancelled);
    handle_.reset();
}

void Task::requestRerun() {
    if (state_ != TaskState::kSucceeded) {
        throw RailmrException(ErrorCode::kInternalError,
                              fmt::format("Re-run requested for task {}/{} in state {}", stage_,
                                          index_, taskStateToString(state_)));
    }
    state_ = TaskState::kPending;
    failures_ = 0;
    ++reruns_;
}

}  // namespace railmr::pipeline
