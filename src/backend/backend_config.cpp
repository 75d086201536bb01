// =============================================================================
// railmr - Backend Configuration Implementation
// =============================================================================

#include "railmr/backend/backend_config.h"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <thread>

#include <fmt/format.h>

namespace railmr::backend {

namespace {

std::string envOr(const char* name, std::string fallback) {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? std::string(value) : std::move(fallback);
}

}  // namespace

BackendEnvironment BackendEnvironment::capture() {
    BackendEnvironment env;
    auto worker = envOr("RAILMR_WORKER", {});
    if (worker.empty()) {
        std::error_code ec;
        auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
        env.worker = ec ? std::filesystem::path("railmr") : self;
    } else {
        env.worker = worker;
    }
    env.sbatch = envOr("RAILMR_SBATCH", env.sbatch);
    env.squeue = envOr("RAILMR_SQUEUE", env.squeue);
    env.sacct = envOr("RAILMR_SACCT", env.sacct);
    env.scancel = envOr("RAILMR_SCANCEL", env.scancel);
    env.ssh = envOr("RAILMR_SSH", env.ssh);
    env.aws = envOr("RAILMR_AWS", env.aws);
    env.awsProfile = envOr("AWS_PROFILE", {});
    env.awsRegion = envOr("AWS_DEFAULT_REGION", {});

    auto ntasks = envOr("NTASKS", {});
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(ntasks.data(), ntasks.data() + ntasks.size(), value);
    if (!ntasks.empty() && ec == std::errc{} && ptr == ntasks.data() + ntasks.size() &&
        value > 0) {
        env.ntasks = value;
    }
    return env;
}

// =============================================================================
// Per-backend options
// =============================================================================

std::size_t LocalOptions::resolvedWorkers(const BackendEnvironment& env) const noexcept {
    if (workers > 0) {
        return std::min(workers, kMaxLocalWorkers);
    }
    if (env.ntasks) {
        return std::min(*env.ntasks, kMaxLocalWorkers);
    }
    auto hardware = static_cast<std::size_t>(std::thread::hardware_concurrency());
    return hardware > 1 ? std::min(hardware - 1, kMaxLocalWorkers) : 1;
}

VoidResult LocalOptions::validate() const {
    if (workers > kMaxLocalWorkers) {
        return makeVoidError(ErrorCode::kConfigurationError,
                             fmt::format("--workers must be at most {}", kMaxLocalWorkers));
    }
    return makeVoidSuccess();
}

VoidResult ClusterSchedulerOptions::validate() const {
    if (maxQueued == 0) {
        return makeVoidError(ErrorCode::kConfigurationError, "--max-queued must be positive");
    }
    if (cpusPerTask == 0) {
        return makeVoidError(ErrorCode::kConfigurationError, "--cpus-per-task must be positive");
    }
    if (timeLimit.empty()) {
        return makeVoidError(ErrorCode::kConfigurationError, "--time-limit must not be empty");
    }
    return makeVoidSuccess();
}

Result<std::vector<HostSlots>> RemoteShellOptions::parseHosts(std::string_view text) {
    std::vector<HostSlots> hosts;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto comma = text.find(',', start);
        if (comma == std::string_view::npos) {
            comma = text.size();
        }
        auto item = text.substr(start, comma - start);
        start = comma + 1;
        if (item.empty()) {
            continue;
        }
        HostSlots host;
        auto colon = item.rfind(':');
        host.host = std::string(item.substr(0, colon));
        if (colon != std::string_view::npos) {
            auto slots = item.substr(colon + 1);
            auto [ptr, ec] = std::from_chars(slots.data(), slots.data() + slots.size(), host.slots);
            if (slots.empty() || ec != std::errc{} || ptr != slots.data() + slots.size() ||
                host.slots == 0) {
                return makeError<std::vector<HostSlots>>(
                    ErrorCode::kConfigurationError,
                    fmt::format("invalid slot count in host '{}'", item));
            }
        }
        if (host.host.empty()) {
            return makeError<std::vector<HostSlots>>(ErrorCode::kConfigurationError,
                                                     fmt::format("empty host name in '{}'", item));
        }
        hosts.push_back(std::move(host));
    }
    return hosts;
}

std::size_t RemoteShellOptions::totalSlots() const noexcept {
    std::size_t total = 0;
    for (const auto& host : hosts) {
        total += host.slots;
    }
    return total;
}

VoidResult RemoteShellOptions::validate() const {
    if (hosts.empty()) {
        return makeVoidError(ErrorCode::kConfigurationError,
                             "ssh backend needs at least one host (--hosts)");
    }
    return makeVoidSuccess();
}

VoidResult ElasticOptions::validate() const {
    if (clusterId.empty()) {
        return makeVoidError(ErrorCode::kConfigurationError,
                             "emr backend needs a cluster id (--cluster-id)");
    }
    if (maxConcurrentSteps == 0) {
        return makeVoidError(ErrorCode::kConfigurationError,
                             "--max-concurrent-steps must be positive");
    }
    if (actionOnFailure != "TERMINATE_CLUSTER" && actionOnFailure != "CANCEL_AND_WAIT" &&
        actionOnFailure != "CONTINUE") {
        return makeVoidError(
            ErrorCode::kConfigurationError,
            fmt::format("invalid action on failure '{}' (TERMINATE_CLUSTER, CANCEL_AND_WAIT or "
                        "CONTINUE)",
                        actionOnFailure));
    }
    return makeVoidSuccess();
}

VoidResult BackendConfig::validate() const {
    if (auto retry = submitRetry.validate(); !retry) {
        return retry;
    }
    if (commandTimeout.count() <= 0) {
        return makeVoidError(ErrorCode::kConfigurationError, "command timeout must be positive");
    }
    switch (kind) {
        case BackendKind::kLocal:
            return local.validate();
        case BackendKind::kClusterScheduler:
            return scheduler.validate();
        case BackendKind::kRemoteShell:
            return remoteShell.validate();
        case BackendKind::kElasticCluster:
            return elastic.validate();
    }
    return makeVoidSuccess();
}

}  // namespace railmr::backend
