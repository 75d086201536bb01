// =============================================================================
// railmr - Stage and Pipeline Definitions
// =============================================================================
// A pipeline is an ordered chain of stages. Each stage names its role, the
// stage body that does the work, its output partition count, its partitioner,
// whether it takes part in redundancy elimination, and the parameters handed
// to its body.
//
// Pipeline file syntax (one stage per line, '#' starts a comment):
//
//   name role body [key=value ...]
//
//   signature  map     sequence_signature  partitions=x1 dedup=yes k=12
//   count      reduce  count_by_key        partitions=4 key-fields=1,1
//
// Recognised keys are partitions (N or xK), key-fields, range and dedup; every
// other key is a body parameter.
// =============================================================================

#ifndef RAILMR_STAGE_STAGE_H
#define RAILMR_STAGE_STAGE_H

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "railmr/common/error.h"
#include "railmr/common/types.h"
#include "railmr/sort/partitioner.h"

namespace railmr::stage {

class StageRegistry;

/// @brief Declared output partition count: a fixed N, or K times the job task count.
struct PartitionCount {
    std::uint32_t value = 1;
    bool perTask = false;

    /// @brief Parse "N" or "xK".
    [[nodiscard]] static Result<PartitionCount> parse(std::string_view text);

    [[nodiscard]] std::string toString() const;

    [[nodiscard]] PartitionIndex resolve(std::uint32_t taskCount) const noexcept {
        return perTask ? value * taskCount : value;
    }

    bool operator==(const PartitionCount&) const = default;
};

struct StageDef {
    std::string name;
    StageRole role = StageRole::kMap;
    std::string body;
    PartitionCount partitions;
    sort::PartitionerSpec partitioner;
    bool dedup = false;
    std::map<std::string, std::string> params;

    /// @brief Number of output partitions for a job with @p taskCount tasks.
    [[nodiscard]] PartitionIndex outputPartitions(std::uint32_t taskCount) const noexcept {
        return partitions.resolve(taskCount);
    }

    [[nodiscard]] std::string param(std::string_view key, std::string_view fallback = {}) const;

    /// @throws ConfigurationError if the parameter is not an integer in [minValue, maxValue].
    [[nodiscard]] std::int64_t intParam(std::string_view key, std::int64_t fallback,
                                        std::int64_t minValue, std::int64_t maxValue) const;

    /// @throws ConfigurationError if the parameter is not a boolean word.
    [[nodiscard]] bool boolParam(std::string_view key, bool fallback) const;

    /// @brief One pipeline-file line describing this stage.
    [[nodiscard]] std::string toString() const;

    bool operator==(const StageDef&) const = default;
};

/// @brief Parse yes/no, true/false, on/off, 1/0.
[[nodiscard]] std::optional<bool> parseBool(std::string_view text) noexcept;

class PipelineDef {
public:
    PipelineDef() = default;
    explicit PipelineDef(std::vector<StageDef> stages) : stages_(std::move(stages)) {}

    /// @brief Parse a pipeline file.
    /// @throws ConfigurationError listing every malformed line.
    [[nodiscard]] static PipelineDef parse(std::istream& in, std::string_view sourceName);

    /// @throws ConfigurationError if the file cannot be read or is malformed.
    [[nodiscard]] static PipelineDef load(const std::filesystem::path& path);

    /// @throws ConfigurationError if @p name is not a built-in preset.
    [[nodiscard]] static PipelineDef preset(std::string_view name);

    [[nodiscard]] static std::vector<std::string> presetNames();

    [[nodiscard]] static bool isPreset(std::string_view name);

    /// @brief Check structure, partitioners, bodies and their parameters.
    /// @return ConfigurationError describing every problem found.
    [[nodiscard]] VoidResult validate(const StageRegistry& registry) const;

    /// @brief Fill parameters a stage does not set itself from job-level defaults.
    void applyDefaults(const std::map<std::string, std::string>& globalParams);

    void addStage(StageDef stage) { stages_.push_back(std::move(stage)); }

    [[nodiscard]] const std::vector<StageDef>& stages() const noexcept { return stages_; }

    [[nodiscard]] const StageDef& stage(StageIndex index) const { return stages_.at(index); }

    [[nodiscard]] std::size_t size() const noexcept { return stages_.size(); }

    [[nodiscard]] bool empty() const noexcept { return stages_.empty(); }

private:
    std::vector<StageDef> stages_;
};

/// @brief Parse one "name role body key=value..." line.
[[nodiscard]] Result<StageDef> parseStageLine(std::string_view line);

}  // namespace railmr::stage

#endif  // RAILMR_STAGE_STAGE_H
