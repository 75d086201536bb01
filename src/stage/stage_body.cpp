// =============================================================================
// railmr - Stage Body Contract Implementation
// =============================================================================

#include "railmr/stage/stage_body.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace railmr::stage {

std::vector<Record> StageBody::compute(const WorkUnit& unit) {
    CollectingEmitter collector;
    process(unit, collector);
    return std::move(collector.records());
}

void StageBody::emitComputed(const WorkUnit& /*unit*/, const std::vector<Record>& result,
                             Emitter& out) {
    for (const auto& record : result) {
        out.emit(record);
    }
}

// =============================================================================
// StageRegistry
// =============================================================================

void StageRegistry::add(std::string name, StageBodyFactory factory) {
    factories_.insert_or_assign(std::move(name), std::move(factory));
}

bool StageRegistry::contains(std::string_view name) const {
    return factories_.find(name) != factories_.end();
}

std::vector<std::string> StageRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (const auto& [name, factory] : factories_) {
        result.push_back(name);
    }
    return result;
}

std::unique_ptr<StageBody> StageRegistry::create(const StageDef& stage) const {
    auto it = factories_.find(stage.body);
    if (it == factories_.end()) {
        throw ConfigurationError(fmt::format("stage '{}': unknown body '{}' (available: {})",
                                             stage.name, stage.body, fmt::join(names(), ", ")));
    }
    auto body = it->second();
    body->configure(stage);
    return body;
}

}  // namespace railmr::stage
