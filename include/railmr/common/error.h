// =============================================================================
// railmr - Error Handling Framework
// =============================================================================
// Error taxonomy shared by every layer of the execution engine.
//
// This module provides:
// - ErrorCode enum whose categories are the CLI exit codes
// - RailmrException hierarchy for structured error handling
// - Result<T> type for functional error handling (using std::expected)
// - ErrorContext for stage/task/file diagnostics
//
// Exit Code Convention:
// - 0: Success
// - 1: Configuration error (bad manifest, bad pipeline, bad backend parameters)
// - 2: I/O error
// - 3: Format error (malformed stream, corrupted partition)
// - 4: Task execution error
// - 5: Stage failure (retry budget exhausted, job halted)
// - 6: Backend unavailable
// - 7: Cancelled
// =============================================================================

#ifndef RAILMR_COMMON_ERROR_H
#define RAILMR_COMMON_ERROR_H

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace railmr {

// =============================================================================
// Error Code Enumeration
// =============================================================================

/// @brief Error codes. Values 0-7 are exit-code categories, the rest refine them.
enum class ErrorCode : std::uint8_t {
    kSuccess = 0,

    /// @brief Invalid manifest, pipeline definition or backend parameters.
    kConfigurationError = 1,

    /// @brief File read/write failure.
    kIOError = 2,

    /// @brief Malformed record stream or descriptor.
    kFormatError = 3,

    /// @brief Stage body failure, non-zero worker exit, output write failure.
    kTaskExecutionError = 4,

    /// @brief A task exhausted its retry budget; the job halts.
    kStageFailure = 5,

    /// @brief Submission channel lost or scheduler unreachable.
    kBackendUnavailable = 6,

    /// @brief Operation was cancelled.
    kCancelled = 7,

    kInvalidArgument = 8,
    kFileNotFound = 9,
    kFileExists = 10,
    kInvalidState = 11,

    /// @brief An upstream partition file a task depends on is absent or unreadable.
    kMissingInput = 12,

    /// @brief Truncated partition or checksum mismatch.
    kCorruptedData = 13,

    kUnsupportedFormat = 14,
    kDecompressionFailed = 15,
    kInternalError = 16
};

/// @brief Map a refined error code onto its exit-code category.
[[nodiscard]] constexpr ErrorCode exitCategory(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kInvalidArgument:
            return ErrorCode::kConfigurationError;
        case ErrorCode::kFileNotFound:
        case ErrorCode::kFileExists:
        case ErrorCode::kMissingInput:
            return ErrorCode::kIOError;
        case ErrorCode::kCorruptedData:
        case ErrorCode::kUnsupportedFormat:
        case ErrorCode::kDecompressionFailed:
            return ErrorCode::kFormatError;
        case ErrorCode::kInvalidState:
        case ErrorCode::kInternalError:
            return ErrorCode::kTaskExecutionError;
        default:
            return code;
    }
}

/// @brief Convert ErrorCode to its integer exit code value.
[[nodiscard]] constexpr int toExitCode(ErrorCode code) noexcept {
    return static_cast<int>(exitCategory(code));
}

/// @brief Convert ErrorCode to string representation.
[[nodiscard]] constexpr std::string_view errorCodeToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:
            return "success";
        case ErrorCode::kConfigurationError:
            return "configuration error";
        case ErrorCode::kIOError:
            return "I/O error";
        case ErrorCode::kFormatError:
            return "format error";
        case ErrorCode::kTaskExecutionError:
            return "task execution error";
        case ErrorCode::kStageFailure:
            return "stage failure";
        case ErrorCode::kBackendUnavailable:
            return "backend unavailable";
        case ErrorCode::kCancelled:
            return "cancelled";
        case ErrorCode::kInvalidArgument:
            return "invalid argument";
        case ErrorCode::kFileNotFound:
            return "file not found";
        case ErrorCode::kFileExists:
            return "file exists";
        case ErrorCode::kInvalidState:
            return "invalid state";
        case ErrorCode::kMissingInput:
            return "missing input";
        case ErrorCode::kCorruptedData:
            return "corrupted data";
        case ErrorCode::kUnsupportedFormat:
            return "unsupported format";
        case ErrorCode::kDecompressionFailed:
            return "decompression failed";
        case ErrorCode::kInternalError:
            return "internal error";
    }
    return "unknown error";
}

/// @brief Parse the name produced by errorCodeToString().
[[nodiscard]] std::optional<ErrorCode> errorCodeFromString(std::string_view name) noexcept;

[[nodiscard]] constexpr bool isSuccess(ErrorCode code) noexcept {
    return code == ErrorCode::kSuccess;
}

[[nodiscard]] constexpr bool isError(ErrorCode code) noexcept {
    return code != ErrorCode::kSuccess;
}

// =============================================================================
// Error Context Structure
// =============================================================================

/// @brief Where an error occurred: file, stage, task and attempt.
struct ErrorContext {
    std::string filePath;
    std::string stage;
    std::optional<std::uint32_t> taskIndex;
    std::optional<std::uint32_t> attempt;

    /// @brief Source location where the error was created.
    std::source_location location;

    ErrorContext(std::source_location loc = std::source_location::current()) : location(loc) {}

    explicit ErrorContext(std::string path,
                          std::source_location loc = std::source_location::current())
        : filePath(std::move(path)), location(loc) {}

    ErrorContext& withFile(std::string path) {
        filePath = std::move(path);
        return *this;
    }

    ErrorContext& withStage(std::string name) {
        stage = std::move(name);
        return *this;
    }

    ErrorContext& withTask(std::uint32_t index) {
        taskIndex = index;
        return *this;
    }

    ErrorContext& withAttempt(std::uint32_t number) {
        attempt = number;
        return *this;
    }

    /// @brief Format context as a string for error messages.
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// Base Exception Class
// =============================================================================

/// @brief Base exception class for all railmr errors.
class RailmrException : public std::exception {
public:
    RailmrException(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {
        formatWhat();
    }

    RailmrException(ErrorCode code, std::string message, ErrorContext context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {
        formatWhat();
    }

    ~RailmrException() override = default;

    RailmrException(const RailmrException&) = default;
    RailmrException(RailmrException&&) noexcept = default;
    RailmrException& operator=(const RailmrException&) = default;
    RailmrException& operator=(RailmrException&&) noexcept = default;

    [[nodiscard]] const char* what() const noexcept override { return what_.c_str(); }

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    /// @brief Get the exit code for this error.
    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Get the error message (without context).
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] const std::optional<ErrorContext>& context() const noexcept { return context_; }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

protected:
    void formatWhat();

    ErrorCode code_;
    std::string message_;
    std::optional<ErrorContext> context_;
    std::string what_;
};

// =============================================================================
// Specific Exception Classes
// =============================================================================

/// @brief Bad manifest, pipeline definition or backend parameters (exit code 1).
/// @note Always raised before any task is submitted.
class ConfigurationError : public RailmrException {
public:
    explicit ConfigurationError(std::string message)
        : RailmrException(ErrorCode::kConfigurationError, std::move(message)) {}

    ConfigurationError(std::string message, ErrorContext context)
        : RailmrException(ErrorCode::kConfigurationError, std::move(message),
                          std::move(context)) {}
};

/// @brief File system failures (exit code 2).
class IOError : public RailmrException {
public:
    explicit IOError(std::string message)
        : RailmrException(ErrorCode::kIOError, std::move(message)) {}

    IOError(std::string message, ErrorContext context)
        : RailmrException(ErrorCode::kIOError, std::move(message), std::move(context)) {}

    /// @brief Construct with a refined code (kFileNotFound, kMissingInput, ...).
    IOError(ErrorCode code, std::string message, ErrorContext context)
        : RailmrException(code, std::move(message), std::move(context)) {}

    IOError(std::string message, std::error_code ec)
        : RailmrException(ErrorCode::kIOError, formatWithSystemError(message, ec)),
          systemError_(ec) {}

    IOError(std::string message, std::error_code ec, ErrorContext context)
        : RailmrException(ErrorCode::kIOError, formatWithSystemError(message, ec),
                          std::move(context)),
          systemError_(ec) {}

    [[nodiscard]] const std::optional<std::error_code>& systemError() const noexcept {
        return systemError_;
    }

private:
    static std::string formatWithSystemError(const std::string& message, std::error_code ec);

    std::optional<std::error_code> systemError_;
};

/// @brief Malformed stream data (exit code 3).
class FormatError : public RailmrException {
public:
    explicit FormatError(std::string message)
        : RailmrException(ErrorCode::kFormatError, std::move(message)) {}

    FormatError(std::string message, ErrorContext context)
        : RailmrException(ErrorCode::kFormatError, std::move(message), std::move(context)) {}

    /// @brief Construct with a refined code (kCorruptedData, kUnsupportedFormat, ...).
    FormatError(ErrorCode code, std::string message, ErrorContext context)
        : RailmrException(code, std::move(message), std::move(context)) {}
};

/// @brief Failure of a single task attempt (exit code 4).
/// @note Recoverable by the orchestrator up to the retry budget.
class TaskExecutionError : public RailmrException {
public:
    explicit TaskExecutionError(std::string message)
        : RailmrException(ErrorCode::kTaskExecutionError, std::move(message)) {}

    TaskExecutionError(std::string message, ErrorContext context)
        : RailmrException(ErrorCode::kTaskExecutionError, std::move(message),
                          std::move(context)) {}
};

/// @brief A stage exhausted the retry budget of one of its tasks (exit code 5).
class StageFailure : public RailmrException {
public:
    explicit StageFailure(std::string message)
        : RailmrException(ErrorCode::kStageFailure, std::move(message)) {}

    StageFailure(std::string message, ErrorContext context)
        : RailmrException(ErrorCode::kStageFailure, std::move(message), std::move(context)) {}
};

/// @brief Scheduler or remote channel unreachable (exit code 6).
/// @note Retried with backoff inside the backend adapter before escalation.
class BackendUnavailableError : public RailmrException {
public:
    explicit BackendUnavailableError(std::string message)
        : RailmrException(ErrorCode::kBackendUnavailable, std::move(message)) {}

    BackendUnavailableError(std::string message, ErrorContext context)
        : RailmrException(ErrorCode::kBackendUnavailable, std::move(message),
                          std::move(context)) {}
};

/// @brief Cooperative cancellation observed (exit code 7).
class CancelledError : public RailmrException {
public:
    explicit CancelledError(std::string message)
        : RailmrException(ErrorCode::kCancelled, std::move(message)) {}
};

// =============================================================================
// Result Type (using std::expected)
// =============================================================================

/// @brief Error type for Result, wrapping ErrorCode and message.
class Error {
public:
    Error(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

    /// @brief Capture an exception's code, message and formatted context.
    explicit Error(const RailmrException& ex);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] const std::string& message() const noexcept { return message_; }

    [[nodiscard]] int exitCode() const noexcept { return toExitCode(code_); }

    /// @brief Throw the exception type matching the error code's category.
    [[noreturn]] void throwException() const;

private:
    ErrorCode code_;
    std::string message_;
};

/// @brief Result type for operations that can fail.
template <typename T, typename E = Error>
using Result = std::expected<T, E>;

template <typename T>
[[nodiscard]] Result<T> makeError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

template <typename T>
[[nodiscard]] Result<T> makeError(Error error) {
    return std::unexpected(std::move(error));
}

// =============================================================================
// Void Result Type
// =============================================================================

/// @brief Result type for operations that return nothing on success.
using VoidResult = Result<std::monostate>;

[[nodiscard]] inline VoidResult makeVoidSuccess() {
    return VoidResult{std::monostate{}};
}

[[nodiscard]] inline VoidResult makeVoidError(ErrorCode code, std::string message) {
    return std::unexpected(Error{code, std::move(message)});
}

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Return the value or throw the exception matching the error.
template <typename T>
[[nodiscard]] T unwrapOrThrow(Result<T> result) {
    if (result.has_value()) {
        return std::move(result.value());
    }
    result.error().throwException();
}

inline void unwrapOrThrow(VoidResult result) {
    if (!result.has_value()) {
        result.error().throwException();
    }
}

/// @brief Execute a function and convert exceptions to Result.
template <typename F>
[[nodiscard]] auto tryExecute(F&& func)
    -> Result<std::conditional_t<std::is_void_v<decltype(func())>, std::monostate,
                                 decltype(func())>> {
    using ReturnType = decltype(func());
    try {
        if constexpr (std::is_void_v<ReturnType>) {
            func();
            return std::monostate{};
        } else {
            return func();
        }
    } catch (const RailmrException& ex) {
        return std::unexpected(Error{ex});
    } catch (const std::exception& ex) {
        return std::unexpected(Error{ErrorCode::kInternalError, ex.what()});
    }
}

}  // namespace railmr

#endif  // RAILMR_COMMON_ERROR_H
