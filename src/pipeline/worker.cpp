// =============================================================================
// railmr - Worker Entry Point Implementation
// =============================================================================

#include "railmr/pipeline/worker.h"

#include <istream>
#include <string>

#include "railmr/common/logger.h"
#include "railmr/pipeline/task_runner.h"

namespace railmr::pipeline {

format::TaskOutcome runAndReport(const format::TaskSpec& spec, const stage::StageRegistry& registry,
                                 const CancellationToken& cancel) {
    TaskRunner runner(registry);
    auto outcome = runner.execute(spec, cancel);
    if (!spec.statusPath.empty()) {
        outcome.save(spec.statusPath);
    }
    return outcome;
}

int runTaskDescriptor(const std::filesystem::path& descriptor,
                      const stage::StageRegistry& registry, const CancellationToken& cancel) {
    auto spec = format::TaskSpec::load(descriptor);
    RAILMR_LOG_INFO("Worker running task {} of run {}", spec.describe(), spec.runId);

    auto outcome = runAndReport(spec, registry, cancel);
    if (outcome.succeeded()) {
        return kWorkerSucceeded;
    }
    return outcome.state == TaskState::kCancelled ? toExitCode(ErrorCode::kCancelled)
                                                  : kWorkerTaskFailed;
}

std::vector<std::filesystem::path> readDescriptorSplit(std::istream& in) {
    std::vector<std::filesystem::path> paths;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        auto tab = line.find('\t');
        std::string path = tab == std::string::npos ? line : line.substr(tab + 1);
        if (!path.empty()) {
            paths.emplace_back(std::move(path));
        }
    }
    return paths;
}

}  // namespace railmr::pipeline
