// =============================================================================
// railmr - Common Type Definitions
// =============================================================================
// Core type definitions shared by the codec, sorter, backends and orchestrator.
//
// This module defines:
// - Record: the (key, value) pair flowing between stages
// - WorkUnit: one key with its grouped values
// - StageRole, TaskState, JobState, BackendKind, Compression enums
// - StageIndex, TaskIndex, PartitionIndex, AttemptNumber aliases
// - Engine-wide default constants
// =============================================================================

#ifndef RAILMR_COMMON_TYPES_H
#define RAILMR_COMMON_TYPES_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace railmr {

// =============================================================================
// Type Aliases
// =============================================================================

using StageIndex = std::uint32_t;
using TaskIndex = std::uint32_t;
using PartitionIndex = std::uint32_t;

/// @brief Attempt numbers start at 1.
using AttemptNumber = std::uint32_t;

/// @brief xxHash64 checksum of encoded record bytes.
using Checksum = std::uint64_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Default number of tasks per stage when the pipeline uses xK partition counts.
inline constexpr std::uint32_t kDefaultTaskCount = 4;

/// @brief Attempts per task before the stage fails (Hadoop's default).
inline constexpr AttemptNumber kDefaultMaxAttempts = 4;

/// @brief Upper bound on explicit upstream re-runs triggered by one downstream task.
inline constexpr std::uint32_t kDefaultMaxUpstreamReruns = 2;

inline constexpr std::chrono::milliseconds kDefaultPollInterval{500};

inline constexpr std::chrono::milliseconds kDefaultRetryBackoff{250};

inline constexpr std::chrono::milliseconds kMaxRetryBackoff{30'000};

/// @brief How long a task waits for another task's claimed cache entry.
inline constexpr std::chrono::seconds kDefaultClaimTimeout{600};

/// @brief In-memory sort buffer per task before spilling sorted runs (MB).
inline constexpr std::size_t kDefaultSortBufferMB = 256;

inline constexpr int kDefaultCompressionLevel = 3;

/// @brief Maximum worker threads for the local backend.
inline constexpr std::size_t kMaxLocalWorkers = 256;

inline constexpr std::string_view kPartitionFileExtension = ".rec";

// =============================================================================
// Record
// =============================================================================

/// @brief One (key, value) pair. Both fields are arbitrary bytes.
struct Record {
    std::string key;
    std::string value;

    /// @brief Bytes held by the record, used for sort-buffer accounting.
    [[nodiscard]] std::size_t footprint() const noexcept {
        return key.size() + value.size() + sizeof(Record);
    }

    bool operator==(const Record&) const = default;
};

/// @brief The records a stage body sees in one call: a key and its values in
///        stable arrival order. Map units carry exactly one value.
struct WorkUnit {
    std::string key;
    std::vector<std::string> values;
};

// =============================================================================
// Stage Role
// =============================================================================

enum class StageRole : std::uint8_t {
    /// @brief One input partition set in, N output partitions out.
    kMap = 0,

    /// @brief All records sharing a key arrive together at one task.
    kReduce = 1
};

[[nodiscard]] constexpr std::string_view stageRoleToString(StageRole role) noexcept {
    switch (role) {
        case StageRole::kMap:
            return "map";
        case StageRole::kReduce:
            return "reduce";
    }
    return "unknown";
}

[[nodiscard]] std::optional<StageRole> stageRoleFromString(std::string_view name) noexcept;

// =============================================================================
// Task State
// =============================================================================

/// @brief Lifecycle of one task.
/// @note Pending -> Running -> {Succeeded, Failed} -> (Retrying -> Running)*
enum class TaskState : std::uint8_t {
    kPending = 0,
    kRunning,
    kSucceeded,
    kFailed,
    kRetrying,
    kCancelled
};

[[nodiscard]] constexpr std::string_view taskStateToString(TaskState state) noexcept {
    switch (state) {
        case TaskState::kPending:
            return "pending";
        case TaskState::kRunning:
            return "running";
        case TaskState::kSucceeded:
            return "succeeded";
        case TaskState::kFailed:
            return "failed";
        case TaskState::kRetrying:
            return "retrying";
        case TaskState::kCancelled:
            return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] std::optional<TaskState> taskStateFromString(std::string_view name) noexcept;

// =============================================================================
// Job State
// =============================================================================

enum class JobState : std::uint8_t {
    kCreated = 0,
    kRunning,
    kSucceeded,
    kFailed,
    kCancelled
};

[[nodiscard]] constexpr std::string_view jobStateToString(JobState state) noexcept {
    switch (state) {
        case JobState::kCreated:
            return "created";
        case JobState::kRunning:
            return "running";
        case JobState::kSucceeded:
            return "succeeded";
        case JobState::kFailed:
            return "failed";
        case JobState::kCancelled:
            return "cancelled";
    }
    return "unknown";
}

// =============================================================================
// Backend Kind
// =============================================================================

/// @brief Execution substrate. Exactly one is selected per job.
enum class BackendKind : std::uint8_t {
    /// @brief Worker threads on this machine.
    kLocal = 0,

    /// @brief Batch scheduler (SLURM) over a shared filesystem.
    kClusterScheduler,

    /// @brief Hosts reachable by ssh sharing a filesystem.
    kRemoteShell,

    /// @brief Managed elastic cluster (Elastic MapReduce steps).
    kElasticCluster
};

[[nodiscard]] constexpr std::string_view backendKindToString(BackendKind kind) noexcept {
    switch (kind) {
        case BackendKind::kLocal:
            return "local";
        case BackendKind::kClusterScheduler:
            return "slurm";
        case BackendKind::kRemoteShell:
            return "ssh";
        case BackendKind::kElasticCluster:
            return "emr";
    }
    return "unknown";
}

/// @brief Accepts the canonical names and the long aliases
///        ("cluster-scheduler", "remote-shell", "elastic").
[[nodiscard]] std::optional<BackendKind> backendKindFromString(std::string_view name) noexcept;

// =============================================================================
// Intermediate Compression
// =============================================================================

enum class Compression : std::uint8_t {
    kNone = 0,
    kGzip,
    kZstd
};

[[nodiscard]] constexpr std::string_view compressionToString(Compression compression) noexcept {
    switch (compression) {
        case Compression::kNone:
            return "none";
        case Compression::kGzip:
            return "gzip";
        case Compression::kZstd:
            return "zstd";
    }
    return "unknown";
}

[[nodiscard]] std::optional<Compression> compressionFromString(std::string_view name) noexcept;

}  // namespace railmr

#endif  // RAILMR_COMMON_TYPES_H
