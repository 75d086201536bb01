// =============================================================================
// railmr - Built-in Stage Bodies Implementation
// =============================================================================

#include "railmr/stage/builtin_bodies.h"

#include <algorithm>
#include <map>
#include <memory>
#include <mutex>
#include <set>

#include <fmt/format.h>

#include "railmr/common/logger.h"
#include "railmr/format/record_codec.h"
#include "railmr/io/process.h"

namespace railmr::stage {

std::vector<Minimizer> computeMinimizers(std::string_view sequence, std::size_t k,
                                         std::size_t w) {
    std::vector<Minimizer> result;
    if (k == 0 || w == 0 || sequence.size() < k) {
        return result;
    }
    const std::size_t kmers = sequence.size() - k + 1;
    const std::size_t window = std::min(w, kmers);

    std::set<std::size_t> chosen;
    for (std::size_t start = 0; start + window <= kmers; ++start) {
        std::size_t best = start;
        for (std::size_t i = start + 1; i < start + window; ++i) {
            if (sequence.substr(i, k) < sequence.substr(best, k)) {
                best = i;
            }
        }
        chosen.insert(best);
    }

    result.reserve(chosen.size());
    for (auto position : chosen) {
        result.push_back(Minimizer{std::string(sequence.substr(position, k)),
                                   static_cast<std::uint32_t>(position)});
    }
    return result;
}

std::string_view sampleLabel(std::string_view value) noexcept {
    return value.substr(0, value.find(format::kFieldSeparator));
}

namespace {

/// @brief Decode a command's stdout as it arrives, handing each record to @p sink.
template <typename Sink>
io::PipedProcess::OutputReader decodeCommandOutput(const std::string& command, Sink sink) {
    return [command, sink = std::move(sink)](std::istream& output) mutable {
        format::RecordReader reader(
            output,
            format::RecordReaderOptions{.requireTrailer = false,
                                        .sourceName = fmt::format("output of '{}'", command)});
        while (auto record = reader.next()) {
            sink(std::move(*record));
        }
    };
}

// =============================================================================
// identity
// =============================================================================

class IdentityBody final : public StageBody {
public:
    void process(const WorkUnit& unit, Emitter& out) override {
        for (const auto& value : unit.values) {
            out.emit(unit.key, value);
        }
    }
};

// =============================================================================
// sequence_signature
// =============================================================================

/// Key: canonical read sequence. Value: label TAB read-name TAB reversed TAB quality.
/// Emits one record per minimizer: key = k-mer, value = label TAB offset.
class SequenceSignatureBody final : public StageBody {
public:
    void configure(const StageDef& stage) override {
        k_ = static_cast<std::size_t>(stage.intParam("k", kDefaultSignatureK, 1, 64));
        w_ = static_cast<std::size_t>(stage.intParam("w", kDefaultSignatureW, 1, 1024));
    }

    void process(const WorkUnit& unit, Emitter& out) override {
        emitComputed(unit, compute(unit), out);
    }

    bool cacheable() const override { return true; }

    std::vector<Record> compute(const WorkUnit& unit) override {
        std::vector<Record> result;
        for (auto& minimizer : computeMinimizers(unit.key, k_, w_)) {
            result.push_back(Record{std::move(minimizer.kmer), std::to_string(minimizer.position)});
        }
        return result;
    }

    void emitComputed(const WorkUnit& unit, const std::vector<Record>& result,
                      Emitter& out) override {
        for (const auto& value : unit.values) {
            auto label = sampleLabel(value);
            for (const auto& record : result) {
                out.emit(record.key, fmt::format("{}\t{}", label, record.value));
            }
        }
    }

private:
    std::size_t k_ = kDefaultSignatureK;
    std::size_t w_ = kDefaultSignatureW;
};

// =============================================================================
// count_by_key
// =============================================================================

class CountByKeyBody final : public StageBody {
public:
    void process(const WorkUnit& unit, Emitter& out) override {
        out.emit(unit.key, std::to_string(unit.values.size()));
    }
};

// =============================================================================
// collapse_samples
// =============================================================================

/// Emits key = sequence, value = "label:count,..." with labels in sorted order.
class CollapseSamplesBody final : public StageBody {
public:
    void process(const WorkUnit& unit, Emitter& out) override {
        std::map<std::string_view, std::uint64_t> counts;
        for (const auto& value : unit.values) {
            ++counts[sampleLabel(value)];
        }
        std::string summary;
        for (const auto& [label, count] : counts) {
            if (!summary.empty()) {
                summary += ',';
            }
            summary += fmt::format("{}:{}", label, count);
        }
        out.emit(unit.key, std::move(summary));
    }
};

// =============================================================================
// streaming
// =============================================================================

/// External command reading and writing the record codec (trailer optional).
///
/// Without cacheable=yes one process serves the whole task: every input record
/// is written to it, and its output is decoded while it runs and emitted after
/// each unit and at end(). With cacheable=yes one process runs per work unit
/// and sees only the unit's key, so its output can be shared between samples.
class StreamingBody final : public StageBody {
public:
    void configure(const StageDef& stage) override {
        command_ = stage.param("command");
        if (command_.empty()) {
            throw ConfigurationError(
                fmt::format("stage '{}': streaming body needs command=...", stage.name));
        }
        cacheable_ = stage.boolParam("cacheable", false);
    }

    void begin(const StageContext& context) override {
        if (!cacheable_) {
            RAILMR_LOG_DEBUG("Stage {} task {}: starting '{}'", context.stage->name,
                             context.taskIndex, command_);
            process_ = std::make_unique<io::PipedProcess>(
                command_, decodeCommandOutput(command_, [this](Record record) {
                    std::lock_guard<std::mutex> lock(pendingMutex_);
                    pending_.push_back(std::move(record));
                }));
        }
    }

    void process(const WorkUnit& unit, Emitter& out) override {
        if (cacheable_) {
            emitComputed(unit, compute(unit), out);
            return;
        }
        std::string buffer;
        for (const auto& value : unit.values) {
            format::appendRecord(buffer, Record{unit.key, value});
        }
        process_->write(buffer);
        emitPending(out);
    }

    void end(Emitter& out) override {
        if (!process_) {
            return;
        }
        int code = process_->finish();
        if (code != 0) {
            throw TaskExecutionError(fmt::format("'{}' exited with code {}", command_, code));
        }
        emitPending(out);
        process_.reset();
    }

    bool cacheable() const override { return cacheable_; }

    std::vector<Record> compute(const WorkUnit& unit) override {
        std::vector<Record> records;
        io::PipedProcess child(command_, decodeCommandOutput(command_, [&records](Record record) {
                                   records.push_back(std::move(record));
                               }));
        child.write(format::encodeRecord(Record{unit.key, {}}));
        int code = child.finish();
        if (code != 0) {
            throw TaskExecutionError(fmt::format("'{}' exited with code {}", command_, code));
        }
        return records;
    }

private:
    /// @brief Emit what the command has produced so far, on the task thread.
    void emitPending(Emitter& out) {
        std::vector<Record> ready;
        {
            std::lock_guard<std::mutex> lock(pendingMutex_);
            ready.swap(pending_);
        }
        for (auto& record : ready) {
            out.emit(std::move(record));
        }
    }

    std::string command_;
    bool cacheable_ = false;
    std::mutex pendingMutex_;
    std::vector<Record> pending_;
    std::unique_ptr<io::PipedProcess> process_;
};

template <typename Body>
StageBodyFactory factoryFor() {
    return [] { return std::make_unique<Body>(); };
}

}  // namespace

void registerBuiltinBodies(StageRegistry& registry) {
    registry.add("identity", factoryFor<IdentityBody>());
    registry.add("sequence_signature", factoryFor<SequenceSignatureBody>());
    registry.add("count_by_key", factoryFor<CountByKeyBody>());
    registry.add("collapse_samples", factoryFor<CollapseSamplesBody>());
    registry.add("streaming", factoryFor<StreamingBody>());
}

StageRegistry StageRegistry::withBuiltins() {
    StageRegistry registry;
    registerBuiltinBodies(registry);
    return registry;
}

}  // namespace railmr::stage
