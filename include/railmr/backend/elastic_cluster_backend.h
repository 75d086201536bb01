// =============================================================================
// railmr - Elastic Cluster (EMR) Backend
// =============================================================================
// Each task attempt is one Hadoop streaming step on a running EMR cluster.
// The step's input is a one-line split naming the attempt's descriptor; with
// NLineInputFormat a single mapper receives it and runs
// `<worker> exec-task --descriptor-stdin`. Reducers are disabled: shuffling
// is done by railmr itself through the shared work root.
//
//   submit  aws emr add-steps --cluster-id <id> --steps <json>
//   poll    aws emr describe-step ... --step-id <step>
//   cancel  aws emr cancel-steps ... --step-ids <step>
// =============================================================================

#ifndef RAILMR_BACKEND_ELASTIC_CLUSTER_BACKEND_H
#define RAILMR_BACKEND_ELASTIC_CLUSTER_BACKEND_H

#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "railmr/backend/backend.h"
#include "railmr/backend/backend_config.h"
#include "railmr/io/process.h"

namespace railmr::backend {

/// @brief --steps argument of aws emr add-steps for one attempt: a one-element step list.
[[nodiscard]] nlohmann::json makeStreamingStep(const ElasticOptions& options,
                                               const std::filesystem::path& worker,
                                               const format::TaskSpec& spec,
                                               const TaskFiles& files);

/// @brief State of a step as reported by describe-step.
struct StepState {
    std::string state;
    std::string failureReason;

    /// @brief PENDING, RUNNING or CANCEL_PENDING.
    [[nodiscard]] bool active() const noexcept;
};

/// @brief First id of an `add-steps --output json` response (`{"StepIds": [...]}`).
[[nodiscard]] Result<std::string> parseAddStepsResponse(std::string_view output);

/// @brief `Step.Status` of a `describe-step --output json` response.
[[nodiscard]] Result<StepState> parseDescribeStepResponse(std::string_view output);

class ElasticClusterBackend final : public Backend {
public:
    /// @param launcher Must outlive the backend.
    ElasticClusterBackend(ElasticOptions options, BackendEnvironment environment,
                          RetryPolicy retry, std::chrono::milliseconds commandTimeout,
                          io::ProcessLauncher& launcher);

    ElasticClusterBackend(const ElasticClusterBackend&) = delete;
    ElasticClusterBackend& operator=(const ElasticClusterBackend&) = delete;

    [[nodiscard]] BackendKind kind() const noexcept override {
        return BackendKind::kElasticCluster;
    }

    [[nodiscard]] Result<TaskHandle> submit(const format::TaskSpec& spec,
                                            const TaskFiles& files) override;

    [[nodiscard]] Result<TaskStatus> poll(const TaskHandle& handle) override;

    [[nodiscard]] VoidResult cancel(const TaskHandle& handle) override;

    [[nodiscard]] std::size_t capacity() const override;

    void shutdown() override;

private:
    struct Step {
        std::filesystem::path statusPath;
        bool cancelRequested = false;
    };

    /// @brief `aws emr <command> --cluster-id <id>` plus region and profile.
    [[nodiscard]] std::vector<std::string> emrCommand(std::string_view command) const;

    [[nodiscard]] Result<std::string> runAws(const std::vector<std::string>& argv,
                                             std::string_view what);

    ElasticOptions options_;
    BackendEnvironment environment_;
    RetryPolicy retry_;
    std::chrono::milliseconds commandTimeout_;
    io::ProcessLauncher& launcher_;

    mutable std::mutex mutex_;
    std::map<std::string, Step> steps_;
};

}  // namespace railmr::backend

#endif  // RAILMR_BACKEND_ELASTIC_CLUSTER_BACKEND_H
