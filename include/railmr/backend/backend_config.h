// =============================================================================
// railmr - Backend Configuration
// =============================================================================
// Per-substrate connection parameters plus the environment the adapters read.
// BackendEnvironment::capture() reads the process environment exactly once;
// adapters only ever see the captured copy.
//
// Environment variables:
//   RAILMR_WORKER       worker executable (default: this executable)
//   RAILMR_SBATCH, RAILMR_SQUEUE, RAILMR_SACCT, RAILMR_SCANCEL
//   RAILMR_SSH, RAILMR_AWS
//   AWS_PROFILE, AWS_DEFAULT_REGION
//   NTASKS              default local worker count
// =============================================================================

#ifndef RAILMR_BACKEND_BACKEND_CONFIG_H
#define RAILMR_BACKEND_BACKEND_CONFIG_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "railmr/backend/retry.h"
#include "railmr/common/error.h"
#include "railmr/common/types.h"

namespace railmr::backend {

struct BackendEnvironment {
    std::filesystem::path worker;
    std::string sbatch = "sbatch";
    std::string squeue = "squeue";
    std::string sacct = "sacct";
    std::string scancel = "scancel";
    std::string ssh = "ssh";
    std::string aws = "aws";
    std::string awsProfile;
    std::string awsRegion;
    std::optional<std::size_t> ntasks;

    /// @brief Snapshot of the current process environment.
    [[nodiscard]] static BackendEnvironment capture();
};

struct LocalOptions {
    /// @brief Worker threads; 0 picks NTASKS or hardware threads minus one.
    std::size_t workers = 0;

    [[nodiscard]] std::size_t resolvedWorkers(const BackendEnvironment& env) const noexcept;

    [[nodiscard]] VoidResult validate() const;
};

struct ClusterSchedulerOptions {
    std::string partition;
    std::string account;
    std::string timeLimit = "24:00:00";
    std::uint32_t memoryMb = 0;
    std::uint32_t cpusPerTask = 1;

    /// @brief Jobs kept queued or running at once.
    std::size_t maxQueued = 64;

    std::vector<std::string> extraArgs;

    [[nodiscard]] VoidResult validate() const;
};

struct HostSlots {
    std::string host;
    std::size_t slots = 1;

    bool operator==(const HostSlots&) const = default;
};

struct RemoteShellOptions {
    std::vector<HostSlots> hosts;
    std::vector<std::string> sshOptions;

    /// @brief Parse "host[:slots],host[:slots],...".
    [[nodiscard]] static Result<std::vector<HostSlots>> parseHosts(std::string_view text);

    [[nodiscard]] std::size_t totalSlots() const noexcept;

    [[nodiscard]] VoidResult validate() const;
};

struct ElasticOptions {
    std::string clusterId;
    std::string region;
    std::string profile;
    std::size_t maxConcurrentSteps = 8;

    /// @brief TERMINATE_CLUSTER, CANCEL_AND_WAIT or CONTINUE.
    std::string actionOnFailure = "CONTINUE";

    [[nodiscard]] VoidResult validate() const;
};

struct BackendConfig {
    BackendKind kind = BackendKind::kLocal;

    LocalOptions local;
    ClusterSchedulerOptions scheduler;
    RemoteShellOptions remoteShell;
    ElasticOptions elastic;

    /// @brief Retries of launch and status commands.
    RetryPolicy submitRetry;

    /// @brief Timeout of one client-tool invocation.
    std::chrono::milliseconds commandTimeout{60'000};

    BackendEnvironment environment;

    /// @brief Validate the options of the selected backend only.
    [[nodiscard]] VoidResult validate() const;
};

}  // namespace railmr::backend

#endif  // RAILMR_BACKEND_BACKEND_CONFIG_H
