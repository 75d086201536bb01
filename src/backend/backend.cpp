// =============================================================================
// railmr - Backend Contract Implementation
// =============================================================================

#include "railmr/backend/backend.h"

#include <fstream>

#include <fmt/format.h>

#include "railmr/common/logger.h"

namespace railmr::backend {

TaskStatus TaskStatus::fromOutcome(const format::TaskOutcome& outcome) {
    TaskStatus status;
    status.state = outcome.state;
    status.code = outcome.code;
    status.reason = outcome.reason;
    status.counters = outcome.counters;
    return status;
}

TaskStatus TaskStatus::failed(ErrorCode code, std::string reason) {
    TaskStatus status;
    status.state = TaskState::kFailed;
    status.code = code;
    status.reason = std::move(reason);
    return status;
}

std::string attemptId(StageIndex stage, TaskIndex task, AttemptNumber attempt) {
    return fmt::format("{:02}-{:05}-a{}", stage, task, attempt);
}

TaskStatus statusFromFile(const std::filesystem::path& statusPath, int exitCode) {
    std::error_code ec;
    if (!std::filesystem::exists(statusPath, ec)) {
        return TaskStatus::failed(
            ErrorCode::kTaskExecutionError,
            fmt::format("worker exited with code {} without writing {}", exitCode,
                        statusPath.string()));
    }
    try {
        auto status = TaskStatus::fromOutcome(format::TaskOutcome::load(statusPath));
        if (status.state == TaskState::kSucceeded && exitCode != 0) {
            RAILMR_LOG_WARNING("Worker reported success in {} but exited with code {}",
                               statusPath.string(), exitCode);
        }
        return status;
    } catch (const RailmrException& ex) {
        return TaskStatus::failed(ErrorCode::kTaskExecutionError,
                                  fmt::format("unreadable status file: {}", ex.what()));
    }
}

Result<std::string> runClientCommand(io::ProcessLauncher& launcher,
                                     const std::vector<std::string>& argv,
                                     std::chrono::milliseconds timeout) {
    auto result = launcher.run(argv, timeout);
    if (!result) {
        return std::unexpected(result.error());
    }
    const auto& program = argv.empty() ? std::string() : argv.front();
    if (result->timedOut) {
        return makeError<std::string>(
            ErrorCode::kBackendUnavailable,
            fmt::format("{} timed out after {} ms", program, timeout.count()));
    }
    if (result->exitCode != 0) {
        return makeError<std::string>(
            ErrorCode::kBackendUnavailable,
            fmt::format("{} exited with code {}: {}", program, result->exitCode,
                        trimOutput(result->errorOutput)));
    }
    return std::move(result->output);
}

VoidResult writeSubmissionFile(const std::filesystem::path& path, std::string_view content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return makeVoidError(ErrorCode::kIOError,
                             fmt::format("cannot create {}", path.string()));
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        return makeVoidError(ErrorCode::kIOError, fmt::format("cannot write {}", path.string()));
    }
    return makeVoidSuccess();
}

std::string_view trimOutput(std::string_view text) noexcept {
    constexpr std::string_view kSpace = " \t\r\n";
    auto begin = text.find_first_not_of(kSpace);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(kSpace);
    return text.substr(begin, end - begin + 1);
}

}  // namespace railmr::backend
