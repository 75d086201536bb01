// =============================================================================
// railmr - Working Storage Layout Implementation
// =============================================================================

#include "railmr/format/storage_layout.h"

#include <unistd.h>

#include <chrono>
#include <ctime>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "railmr/common/error.h"

namespace railmr::format {

StorageLayout::StorageLayout(std::filesystem::path workRoot, std::string runId)
    : workRoot_(std::move(workRoot)), runId_(std::move(runId)), runRoot_(workRoot_ / runId_) {}

std::filesystem::path StorageLayout::stageDir(StageIndex stage, std::string_view name) const {
    return stagesDir() / fmt::format("{:02}-{}", stage, name);
}

std::filesystem::path StorageLayout::taskFile(StageIndex stage, TaskIndex task,
                                              AttemptNumber attempt,
                                              std::string_view suffix) const {
    return tasksDir() / fmt::format("{:02}-{:05}-a{}.{}", stage, task, attempt, suffix);
}

std::filesystem::path StorageLayout::taskScratchDir(StageIndex stage, TaskIndex task,
                                                    AttemptNumber attempt) const {
    return scratchDir() / fmt::format("{:02}-{:05}-a{}", stage, task, attempt);
}

void StorageLayout::create() const {
    for (const auto& dir : {stagesDir(), tasksDir(), cacheDir(), scratchDir()}) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw IOError("Cannot create directory", ec, ErrorContext{dir.string()});
        }
    }
}

std::filesystem::path StorageLayout::partitionDir(const std::filesystem::path& stageDir,
                                                  PartitionIndex partition) {
    return stageDir / fmt::format("part-{:05}", partition);
}

std::filesystem::path StorageLayout::partitionFile(const std::filesystem::path& stageDir,
                                                   PartitionIndex partition, TaskIndex task) {
    return partitionDir(stageDir, partition) /
           fmt::format("from-{:05}{}", task, kPartitionFileExtension);
}

std::vector<std::filesystem::path> StorageLayout::partitionInputs(
    const std::filesystem::path& stageDir, PartitionIndex partition, TaskIndex taskCount) {
    std::vector<std::filesystem::path> inputs;
    inputs.reserve(taskCount);
    for (TaskIndex task = 0; task < taskCount; ++task) {
        inputs.push_back(partitionFile(stageDir, partition, task));
    }
    return inputs;
}

std::string StorageLayout::makeRunId() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    return fmt::format("{:%Y%m%d-%H%M%S}-{}", fmt::localtime(now), ::getpid());
}

}  // namespace railmr::format
