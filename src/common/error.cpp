// =============================================================================
// railmr - Error Handling Framework Implementation
// =============================================================================

#include "railmr/common/error.h"

#include <array>
#include <sstream>

#include <fmt/format.h>

namespace railmr {

std::optional<ErrorCode> errorCodeFromString(std::string_view name) noexcept {
    static constexpr std::array kAll = {
        ErrorCode::kSuccess,           ErrorCode::kConfigurationError,
        ErrorCode::kIOError,           ErrorCode::kFormatError,
        ErrorCode::kTaskExecutionError, ErrorCode::kStageFailure,
        ErrorCode::kBackendUnavailable, ErrorCode::kCancelled,
        ErrorCode::kInvalidArgument,   ErrorCode::kFileNotFound,
        ErrorCode::kFileExists,        ErrorCode::kInvalidState,
        ErrorCode::kMissingInput,      ErrorCode::kCorruptedData,
        ErrorCode::kUnsupportedFormat, ErrorCode::kDecompressionFailed,
        ErrorCode::kInternalError};
    for (auto code : kAll) {
        if (errorCodeToString(code) == name) {
            return code;
        }
    }
    return std::nullopt;
}

// =============================================================================
// ErrorContext Implementation
// =============================================================================

std::string ErrorContext::format() const {
    std::ostringstream oss;
    bool hasContent = false;

    auto separate = [&]() {
        if (hasContent) {
            oss << ", ";
        }
        hasContent = true;
    };

    if (!stage.empty()) {
        separate();
        oss << "stage: " << stage;
    }
    if (taskIndex.has_value()) {
        separate();
        oss << "task: " << *taskIndex;
    }
    if (attempt.has_value()) {
        separate();
        oss << "attempt: " << *attempt;
    }
    if (!filePath.empty()) {
        separate();
        oss << "file: " << filePath;
    }

#ifndef NDEBUG
    if (hasContent) {
        oss << " (at " << location.file_name() << ":" << location.line() << ")";
    }
#endif

    return oss.str();
}

// =============================================================================
// RailmrException Implementation
// =============================================================================

void RailmrException::formatWhat() {
    std::ostringstream oss;
    oss << "[" << errorCodeToString(code_) << "] " << message_;

    if (context_.has_value()) {
        std::string contextStr = context_->format();
        if (!contextStr.empty()) {
            oss << " (" << contextStr << ")";
        }
    }

    what_ = oss.str();
}

std::string IOError::formatWithSystemError(const std::string& message, std::error_code ec) {
    return fmt::format("{}: {} (error code: {})", message, ec.message(), ec.value());
}

// =============================================================================
// Error Implementation
// =============================================================================

Error::Error(const RailmrException& ex) : code_(ex.code()), message_(ex.message()) {
    if (ex.hasContext()) {
        std::string contextStr = ex.context()->format();
        if (!contextStr.empty()) {
            message_ = fmt::format("{} ({})", message_, contextStr);
        }
    }
}

[[noreturn]] void Error::throwException() const {
    switch (exitCategory(code_)) {
        case ErrorCode::kConfigurationError:
            throw ConfigurationError(message_);
        case ErrorCode::kIOError:
            throw IOError(code_, message_, ErrorContext{});
        case ErrorCode::kFormatError:
            throw FormatError(code_, message_, ErrorContext{});
        case ErrorCode::kStageFailure:
            throw StageFailure(message_);
        case ErrorCode::kBackendUnavailable:
            throw BackendUnavailableError(message_);
        case ErrorCode::kCancelled:
            throw CancelledError(message_);
        case ErrorCode::kTaskExecutionError:
            throw TaskExecutionError(message_);
        default:
            throw RailmrException(code_, message_);
    }
}

}  // namespace railmr
