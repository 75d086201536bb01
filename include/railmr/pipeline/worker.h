// =============================================================================
// railmr - Worker Entry Point
// =============================================================================
// What `railmr exec-task` does on every backend: load a task descriptor, run
// the task, publish the status file the orchestrator reads back.
// =============================================================================

#ifndef RAILMR_PIPELINE_WORKER_H
#define RAILMR_PIPELINE_WORKER_H

#include <filesystem>
#include <iosfwd>
#include <vector>

#include "railmr/common/cancellation.h"
#include "railmr/format/task_descriptor.h"
#include "railmr/stage/stage_body.h"

namespace railmr::pipeline {

/// @brief Worker process exit codes.
inline constexpr int kWorkerSucceeded = 0;
inline constexpr int kWorkerTaskFailed = 4;

/// @brief Run the task described by @p descriptor and write its status file.
/// @return kWorkerSucceeded, kWorkerTaskFailed, or 7 if cancelled.
/// @throws IOError/FormatError if the descriptor cannot be loaded or the status
///         file cannot be written.
int runTaskDescriptor(const std::filesystem::path& descriptor,
                      const stage::StageRegistry& registry, const CancellationToken& cancel);

/// @brief Run a task and publish its outcome to spec.statusPath.
format::TaskOutcome runAndReport(const format::TaskSpec& spec, const stage::StageRegistry& registry,
                                 const CancellationToken& cancel);

/// @brief Descriptor paths from an N-line input split ("offset TAB path" lines).
/// @note Lines without a TAB are taken as bare paths.
[[nodiscard]] std::vector<std::filesystem::path> readDescriptorSplit(std::istream& in);

}  // namespace railmr::pipeline

#endif  // RAILMR_PIPELINE_WORKER_H
