// =============================================================================
// railmr - External Merge Implementation
// =============================================================================

#include "railmr/sort/merge_reader.h"

#include <fmt/format.h>

namespace railmr::sort {

std::optional<Record> VectorSource::next() {
    if (position_ >= records_.size()) {
        return std::nullopt;
    }
    return std::move(records_[position_++]);
}

std::vector<std::unique_ptr<RecordSource>> openFileSources(
    const std::vector<std::filesystem::path>& paths) {
    std::vector<std::unique_ptr<RecordSource>> sources;
    sources.reserve(paths.size());
    for (const auto& path : paths) {
        sources.push_back(std::make_unique<FileSource>(path));
    }
    return sources;
}

MergeReader::MergeReader(std::vector<std::unique_ptr<RecordSource>> sources)
    : sources_(std::move(sources)) {
    for (std::size_t i = 0; i < sources_.size(); ++i) {
        advance(i, nullptr);
    }
}

void MergeReader::advance(std::size_t source, const std::string* previousKey) {
    if (auto record = sources_[source]->next()) {
        if (previousKey != nullptr && record->key < *previousKey) {
            throw FormatError(ErrorCode::kCorruptedData,
                              fmt::format("merge source {} is not sorted by key", source),
                              ErrorContext{});
        }
        heap_.push(Head{std::move(*record), source});
    }
}

std::optional<Record> MergeReader::next() {
    if (heap_.empty()) {
        return std::nullopt;
    }
    Head head = heap_.top();
    heap_.pop();
    advance(head.source, &head.record.key);
    ++recordsRead_;
    return std::move(head.record);
}

std::optional<WorkUnit> GroupReader::nextGroup() {
    if (!started_) {
        pending_ = source_->next();
        started_ = true;
    }
    if (!pending_) {
        return std::nullopt;
    }

    WorkUnit unit;
    unit.key = std::move(pending_->key);
    unit.values.push_back(std::move(pending_->value));
    for (;;) {
        pending_ = source_->next();
        if (!pending_ || pending_->key != unit.key) {
            break;
        }
        unit.values.push_back(std::move(pending_->value));
    }
    return unit;
}

}  // namespace railmr::sort
