// =============================================================================
// railmr - Task Runner
// =============================================================================
// Executes one task attempt described by a TaskSpec:
//
//   1. read input: FASTQ of a manifest entry (first stage) or the k-way merge
//      of the upstream partition files for this task's partition
//   2. feed work units to the stage body, through the redundancy-elimination
//      cache where the stage allows it
//   3. partition and sort the emitted records
//   4. publish one file per output partition, all or none
//
// The runner never retries and never throws: every failure is reported in the
// returned TaskOutcome. Running the same spec twice yields identical files.
// =============================================================================

#ifndef RAILMR_PIPELINE_TASK_RUNNER_H
#define RAILMR_PIPELINE_TASK_RUNNER_H

#include <functional>

#include "railmr/common/cancellation.h"
#include "railmr/format/manifest.h"
#include "railmr/format/task_descriptor.h"
#include "railmr/stage/stage_body.h"

namespace railmr::pipeline {

/// @brief Value of a first-stage record: label TAB read-name TAB reversed TAB quality.
[[nodiscard]] std::string makeReadValue(std::string_view label, std::string_view readName,
                                        bool reversed, std::string_view quality);

/// @brief Read the FASTQ sources of a manifest entry as first-stage records.
/// @note Mates of a paired entry are read in lockstep and named /1 and /2.
/// @throws IOError, FormatError.
std::uint64_t ingestManifestEntry(const format::ManifestEntry& entry,
                                  const std::function<void(Record)>& sink);

class TaskRunner {
public:
    /// @param registry Must outlive the runner.
    explicit TaskRunner(const stage::StageRegistry& registry) : registry_(&registry) {}

    [[nodiscard]] format::TaskOutcome execute(const format::TaskSpec& spec,
                                              const CancellationToken& cancel) const;

private:
    [[nodiscard]] format::TaskCounters run(const format::TaskSpec& spec,
                                           const CancellationToken& cancel) const;

    const stage::StageRegistry* registry_;
};

}  // namespace railmr::pipeline

#endif  // RAILMR_PIPELINE_TASK_RUNNER_H
