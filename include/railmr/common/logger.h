// =============================================================================
// railmr - Logger Module
// =============================================================================
// Low-latency asynchronous logging using Quill library.
//
// Usage:
//   railmr::log::init({.logFile = "run.log", .level = railmr::log::Level::kInfo});
//   RAILMR_LOG_INFO("stage {} submitted {} tasks", name, count);
//
// The driver and every worker process log through the same macros. The logger
// name carries the process role ("driver" or "worker"), so interleaved task logs
// on shared storage stay attributable. When no explicit init() happened (library
// use, tests) the first log statement sets up a console logger.
// =============================================================================

#ifndef RAILMR_COMMON_LOGGER_H
#define RAILMR_COMMON_LOGGER_H

#include <optional>
#include <string>
#include <string_view>

#include <quill/Backend.h>
#include <quill/Frontend.h>
#include <quill/LogMacros.h>
#include <quill/Logger.h>
#include <quill/sinks/ConsoleSink.h>
#include <quill/sinks/FileSink.h>

namespace railmr::log {

enum class Level {
    kTrace = 0,
    kDebug,
    kInfo,
    kWarning,
    kError,
    kCritical
};

/// @brief Which side of a job the current process plays.
enum class Role {
    kDriver,
    kWorker
};

struct Config {
    /// @brief Log file path. Empty string disables file logging.
    std::string logFile;

    Level level = Level::kInfo;

    Role role = Role::kDriver;

    /// @brief Enable console output.
    bool enableConsole = true;

    /// @brief Append to an existing log file instead of truncating it.
    bool appendToFile = false;
};

/// @brief Initialize the global logger. Later calls are ignored until shutdown().
void init(const Config& config);

/// @brief Get the global logger instance, creating a console logger on first use.
[[nodiscard]] quill::Logger* logger();

[[nodiscard]] bool isInitialized() noexcept;

/// @brief Change the level of an initialized logger.
void setLevel(Level level);

void flush();

/// @brief Flush and stop the backend thread.
void shutdown();

[[nodiscard]] quill::LogLevel toQuillLevel(Level level) noexcept;

/// @brief Parse a level name (case-insensitive); "warn" and "fatal" are accepted aliases.
[[nodiscard]] std::optional<Level> parseLevel(std::string_view name) noexcept;

/// @brief Like parseLevel() but falls back to kInfo.
[[nodiscard]] Level levelFromString(std::string_view name) noexcept;

[[nodiscard]] std::string_view levelToString(Level level) noexcept;

/// @brief Level selected by the global -v/-q flags. Quiet wins over verbosity.
[[nodiscard]] Level levelFromVerbosity(int verbosity, bool quiet) noexcept;

[[nodiscard]] std::string_view roleName(Role role) noexcept;

}  // namespace railmr::log

// =============================================================================
// Convenience Macros
// =============================================================================

#define RAILMR_LOG_TRACE(fmt, ...) \
    LOG_TRACE_L1(railmr::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define RAILMR_LOG_DEBUG(fmt, ...) \
    LOG_DEBUG(railmr::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define RAILMR_LOG_INFO(fmt, ...) \
    LOG_INFO(railmr::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define RAILMR_LOG_WARNING(fmt, ...) \
    LOG_WARNING(railmr::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define RAILMR_LOG_ERROR(fmt, ...) \
    LOG_ERROR(railmr::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#define RAILMR_LOG_CRITICAL(fmt, ...) \
    LOG_CRITICAL(railmr::log::logger(), fmt __VA_OPT__(, ) __VA_ARGS__)

#endif  // RAILMR_COMMON_LOGGER_H
