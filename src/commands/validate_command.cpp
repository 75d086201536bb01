// =============================================================================
// railmr - Validate Command Implementation
// =============================================================================

#include "validate_command.h"

#include <iostream>
#include <optional>

#include <fmt/format.h>

#include "railmr/common/error.h"
#include "railmr/common/logger.h"
#include "railmr/format/manifest.h"
#include "railmr/pipeline/orchestrator.h"
#include "railmr/stage/stage.h"
#include "railmr/stage/stage_body.h"
#include "run_command.h"

namespace railmr::commands {

ValidateCommand::ValidateCommand(ValidateOptions options) : options_(std::move(options)) {}

ValidateCommand::~ValidateCommand() = default;

ValidateCommand::ValidateCommand(ValidateCommand&&) noexcept = default;
ValidateCommand& ValidateCommand::operator=(ValidateCommand&&) noexcept = default;

int ValidateCommand::execute() {
    problems_.clear();
    auto registry = stage::StageRegistry::withBuiltins();

    std::optional<format::Manifest> manifest;
    if (!options_.manifestPath.empty()) {
        try {
            manifest = format::Manifest::load(options_.manifestPath);
            if (manifest->empty()) {
                problems_.push_back(
                    fmt::format("manifest {}: no entries", options_.manifestPath.string()));
            } else if (options_.checkInputs) {
                if (auto inputs = manifest->checkInputs(); !inputs) {
                    problems_.push_back(inputs.error().message());
                }
            }
        } catch (const RailmrException& e) {
            problems_.emplace_back(e.what());
        }
    }

    std::optional<stage::PipelineDef> pipelineDef;
    try {
        pipelineDef = loadPipeline(options_.pipeline);
        pipelineDef->applyDefaults(parseParams(options_.params));
        if (auto valid = pipelineDef->validate(registry); !valid) {
            problems_.push_back(valid.error().message());
        }
    } catch (const RailmrException& e) {
        problems_.emplace_back(e.what());
    }

    if (options_.taskCount == 0) {
        problems_.emplace_back("task count must be positive");
    }

    if (!problems_.empty()) {
        for (const auto& problem : problems_) {
            std::cerr << problem << '\n';
        }
        RAILMR_LOG_ERROR("Validation found {} problem(s)", problems_.size());
        return toExitCode(ErrorCode::kConfigurationError);
    }

    std::cout << fmt::format("pipeline: {} ({} stages) OK\n", options_.pipeline,
                             pipelineDef->size());
    if (manifest) {
        std::cout << fmt::format("manifest: {} ({} entries) OK\n",
                                 options_.manifestPath.string(), manifest->size());
        for (const auto& plan : pipeline::planStages(*pipelineDef, *manifest, options_.taskCount)) {
            std::cout << fmt::format("stage {:02} {}: {} tasks -> {} partitions\n", plan.index,
                                     plan.name, plan.tasks, plan.partitions);
        }
    }
    return 0;
}

std::unique_ptr<ValidateCommand> createValidateCommand(ValidateOptions options) {
    return std::make_unique<ValidateCommand>(std::move(options));
}

}  // namespace railmr::commands
