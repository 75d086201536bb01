// =============================================================================
// railmr - Backend Factory Implementation
// =============================================================================

#include "railmr/backend/backend_factory.h"

#include "railmr/backend/cluster_scheduler_backend.h"
#include "railmr/backend/elastic_cluster_backend.h"
#include "railmr/backend/local_backend.h"
#include "railmr/backend/remote_shell_backend.h"
#include "railmr/common/logger.h"

namespace railmr::backend {

std::unique_ptr<Backend> makeBackend(const BackendConfig& config,
                                     const stage::StageRegistry& registry,
                                     io::ProcessLauncher& launcher) {
    if (auto valid = config.validate(); !valid) {
        throw ConfigurationError(valid.error().message());
    }

    std::unique_ptr<Backend> backend;
    switch (config.kind) {
        case BackendKind::kLocal:
            backend = std::make_unique<LocalBackend>(
                registry, config.local.resolvedWorkers(config.environment));
            break;
        case BackendKind::kClusterScheduler:
            backend = std::make_unique<ClusterSchedulerBackend>(
                config.scheduler, config.environment, config.submitRetry, config.commandTimeout,
                launcher);
            break;
        case BackendKind::kRemoteShell:
            backend = std::make_unique<RemoteShellBackend>(config.remoteShell, config.environment,
                                                           config.submitRetry, launcher);
            break;
        case BackendKind::kElasticCluster:
            backend = std::make_unique<ElasticClusterBackend>(
                config.elastic, config.environment, config.submitRetry, config.commandTimeout,
                launcher);
            break;
    }
    if (!backend) {
        throw ConfigurationError("unknown backend kind");
    }
    RAILMR_LOG_INFO("Using {} backend with {} task slots", backend->name(), backend->capacity());
    return backend;
}

}  // namespace railmr::backend
