// =============================================================================
// railmr - Backend Factory
// =============================================================================

#ifndef RAILMR_BACKEND_BACKEND_FACTORY_H
#define RAILMR_BACKEND_BACKEND_FACTORY_H

#include <memory>

#include "railmr/backend/backend.h"
#include "railmr/backend/backend_config.h"
#include "railmr/io/process.h"
#include "railmr/stage/stage_body.h"

namespace railmr::backend {

/// @brief Create the adapter selected by @p config.
/// @param registry Stage bodies for in-process execution; must outlive the backend.
/// @param launcher Client-tool launcher for remote substrates; must outlive the backend.
/// @throws ConfigurationError if @p config is invalid.
[[nodiscard]] std::unique_ptr<Backend> makeBackend(const BackendConfig& config,
                                                   const stage::StageRegistry& registry,
                                                   io::ProcessLauncher& launcher);

}  // namespace railmr::backend

#endif  // RAILMR_BACKEND_BACKEND_FACTORY_H
