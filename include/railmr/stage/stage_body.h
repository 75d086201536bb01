// =============================================================================
// railmr - Stage Body Contract
// =============================================================================
// A stage body is the opaque computation a stage performs. The task runner
// feeds it work units (one record for a map stage, one key group for a reduce
// stage) and collects what it emits.
//
// Bodies that can take part in redundancy elimination split their work in two:
// compute() depends only on semanticInput() and its result is what the cache
// stores, while emitComputed() adds the sample-specific decoration afterwards.
// =============================================================================

#ifndef RAILMR_STAGE_STAGE_BODY_H
#define RAILMR_STAGE_STAGE_BODY_H

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "railmr/common/cancellation.h"
#include "railmr/common/types.h"
#include "railmr/stage/stage.h"

namespace railmr::stage {

/// @brief Output channel of a stage body.
class Emitter {
public:
    virtual ~Emitter() = default;

    virtual void emit(Record record) = 0;

    void emit(std::string key, std::string value) {
        emit(Record{std::move(key), std::move(value)});
    }
};

/// @brief Emitter that keeps everything in memory.
class CollectingEmitter final : public Emitter {
public:
    using Emitter::emit;

    void emit(Record record) override { records_.push_back(std::move(record)); }

    [[nodiscard]] std::vector<Record>& records() noexcept { return records_; }

private:
    std::vector<Record> records_;
};

/// @brief Per-task information handed to begin().
struct StageContext {
    const StageDef* stage = nullptr;
    StageIndex stageIndex = 0;
    TaskIndex taskIndex = 0;
    AttemptNumber attempt = 1;
    const CancellationToken* cancel = nullptr;
};

class StageBody {
public:
    virtual ~StageBody() = default;

    /// @brief Read and check parameters. Called once, before any task runs.
    /// @throws ConfigurationError on bad parameters.
    virtual void configure(const StageDef& /*stage*/) {}

    virtual void begin(const StageContext& /*context*/) {}

    virtual void process(const WorkUnit& unit, Emitter& out) = 0;

    /// @brief Flush anything buffered. Called once after the last unit.
    virtual void end(Emitter& /*out*/) {}

    /// @brief Whether compute() is a pure function of semanticInput().
    [[nodiscard]] virtual bool cacheable() const { return false; }

    [[nodiscard]] virtual std::string semanticInput(const WorkUnit& unit) const { return unit.key; }

    /// @brief The cacheable part of process().
    [[nodiscard]] virtual std::vector<Record> compute(const WorkUnit& unit);

    /// @brief Turn a (possibly cached) compute() result into output records.
    virtual void emitComputed(const WorkUnit& unit, const std::vector<Record>& result,
                              Emitter& out);
};

using StageBodyFactory = std::function<std::unique_ptr<StageBody>()>;

/// @brief Named stage bodies available to a job.
class StageRegistry {
public:
    void add(std::string name, StageBodyFactory factory);

    [[nodiscard]] bool contains(std::string_view name) const;

    [[nodiscard]] std::vector<std::string> names() const;

    /// @brief Create and configure the body of @p stage.
    /// @throws ConfigurationError if the body is unknown or rejects its parameters.
    [[nodiscard]] std::unique_ptr<StageBody> create(const StageDef& stage) const;

    /// @brief Registry holding every built-in body.
    [[nodiscard]] static StageRegistry withBuiltins();

private:
    std::map<std::string, StageBodyFactory, std::less<>> factories_;
};

}  // namespace railmr::stage

#endif  // RAILMR_STAGE_STAGE_BODY_H
