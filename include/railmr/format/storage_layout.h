// =============================================================================
// railmr - Working Storage Layout
// =============================================================================
// Deterministic names for everything a job keeps on shared storage:
//
//   <work-root>/<run-id>/
//     stages/NN-<stage>/part-PPPPP/from-TTTTT.rec   output of task T, partition P
//     tasks/                                        descriptors, status, scripts, logs
//     cache/xx/<fingerprint>.rec                    redundancy-elimination entries
//     scratch/                                      sort spills, per attempt
//     job.summary
//
// Every backend locates partitions through these functions only.
// =============================================================================

#ifndef RAILMR_FORMAT_STORAGE_LAYOUT_H
#define RAILMR_FORMAT_STORAGE_LAYOUT_H

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "railmr/common/types.h"

namespace railmr::format {

class StorageLayout {
public:
    StorageLayout(std::filesystem::path workRoot, std::string runId);

    [[nodiscard]] const std::filesystem::path& workRoot() const noexcept { return workRoot_; }
    [[nodiscard]] const std::string& runId() const noexcept { return runId_; }

    [[nodiscard]] const std::filesystem::path& runRoot() const noexcept { return runRoot_; }

    [[nodiscard]] std::filesystem::path stagesDir() const { return runRoot_ / "stages"; }

    /// @brief stages/NN-<name>
    [[nodiscard]] std::filesystem::path stageDir(StageIndex stage, std::string_view name) const;

    [[nodiscard]] std::filesystem::path tasksDir() const { return runRoot_ / "tasks"; }
    [[nodiscard]] std::filesystem::path cacheDir() const { return runRoot_ / "cache"; }
    [[nodiscard]] std::filesystem::path scratchDir() const { return runRoot_ / "scratch"; }
    [[nodiscard]] std::filesystem::path summaryPath() const { return runRoot_ / "job.summary"; }

    /// @brief tasks/NN-TTTTT-aA.<suffix>, one per attempt.
    [[nodiscard]] std::filesystem::path taskFile(StageIndex stage, TaskIndex task,
                                                 AttemptNumber attempt,
                                                 std::string_view suffix) const;

    /// @brief scratch/NN-TTTTT-aA
    [[nodiscard]] std::filesystem::path taskScratchDir(StageIndex stage, TaskIndex task,
                                                       AttemptNumber attempt) const;

    /// @brief Create the run directory skeleton.
    /// @throws IOError on failure.
    void create() const;

    /// @brief <stageDir>/part-PPPPP
    [[nodiscard]] static std::filesystem::path partitionDir(const std::filesystem::path& stageDir,
                                                            PartitionIndex partition);

    /// @brief <stageDir>/part-PPPPP/from-TTTTT.rec
    [[nodiscard]] static std::filesystem::path partitionFile(
        const std::filesystem::path& stageDir, PartitionIndex partition, TaskIndex task);

    /// @brief from-00000 .. from-(taskCount-1) of one partition, in task order.
    [[nodiscard]] static std::vector<std::filesystem::path> partitionInputs(
        const std::filesystem::path& stageDir, PartitionIndex partition, TaskIndex taskCount);

    /// @brief YYYYMMDD-HHMMSS-<pid> in local time.
    [[nodiscard]] static std::string makeRunId();

private:
    std::filesystem::path workRoot_;
    std::string runId_;
    std::filesystem::path runRoot_;
};

}  // namespace railmr::format

#endif  // RAILMR_FORMAT_STORAGE_LAYOUT_H
