// =============================================================================
// railmr - Common Type Definitions Implementation
// =============================================================================

#include "railmr/common/types.h"

namespace railmr {

std::optional<StageRole> stageRoleFromString(std::string_view name) noexcept {
    if (name == "map") {
        return StageRole::kMap;
    }
    if (name == "reduce") {
        return StageRole::kReduce;
    }
    return std::nullopt;
}

std::optional<TaskState> taskStateFromString(std::string_view name) noexcept {
    for (auto state : {TaskState::kPending, TaskState::kRunning, TaskState::kSucceeded,
                       TaskState::kFailed, TaskState::kRetrying, TaskState::kCancelled}) {
        if (taskStateToString(state) == name) {
            return state;
        }
    }
    return std::nullopt;
}

std::optional<BackendKind> backendKindFromString(std::string_view name) noexcept {
    if (name == "local") {
        return BackendKind::kLocal;
    }
    if (name == "slurm" || name == "cluster-scheduler") {
        return BackendKind::kClusterScheduler;
    }
    if (name == "ssh" || name == "remote-shell") {
        return BackendKind::kRemoteShell;
    }
    if (name == "emr" || name == "elastic") {
        return BackendKind::kElasticCluster;
    }
    return std::nullopt;
}

std::optional<Compression> compressionFromString(std::string_view name) noexcept {
    if (name == "none") {
        return Compression::kNone;
    }
    if (name == "gzip" || name == "gz") {
        return Compression::kGzip;
    }
    if (name == "zstd" || name == "zst") {
        return Compression::kZstd;
    }
    return std::nullopt;
}

}  // namespace railmr
