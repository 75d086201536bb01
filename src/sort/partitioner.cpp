// =============================================================================
// railmr - Partitioners Implementation
// =============================================================================

#include "railmr/sort/partitioner.h"

#include <algorithm>
#include <cctype>
#include <charconv>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <xxhash.h>

namespace railmr::sort {

namespace {

PartitionIndex hashToPartition(std::string_view bytes, PartitionIndex partitions) {
    const std::uint64_t hash = XXH64(bytes.data(), bytes.size(), 0);
    return static_cast<PartitionIndex>(hash % partitions);
}

bool parseField(std::string_view text, std::uint32_t& out) {
    auto result = std::from_chars(text.data(), text.data() + text.size(), out);
    return result.ec == std::errc{} && result.ptr == text.data() + text.size();
}

std::vector<std::string> splitList(std::string_view text) {
    std::vector<std::string> items;
    std::size_t start = 0;
    while (start <= text.size()) {
        auto comma = text.find(',', start);
        if (comma == std::string_view::npos) {
            comma = text.size();
        }
        items.emplace_back(text.substr(start, comma - start));
        start = comma + 1;
    }
    return items;
}

}  // namespace

PartitionIndex HashPartitioner::partition(std::string_view key, PartitionIndex partitions) const {
    return hashToPartition(key, partitions);
}

KeyFieldPartitioner::KeyFieldPartitioner(std::uint32_t firstField, std::uint32_t lastField)
    : firstField_(firstField), lastField_(lastField) {}

std::string_view KeyFieldPartitioner::partitionKey(std::string_view key) const noexcept {
    std::size_t begin = 0;
    for (std::uint32_t field = 1; field < firstField_; ++field) {
        auto tab = key.find('\t', begin);
        if (tab == std::string_view::npos) {
            return {};
        }
        begin = tab + 1;
    }
    if (lastField_ == 0) {
        return key.substr(begin);
    }
    std::size_t end = begin;
    for (std::uint32_t field = firstField_; field <= lastField_; ++field) {
        auto tab = key.find('\t', end);
        if (tab == std::string_view::npos) {
            return key.substr(begin);
        }
        end = field == lastField_ ? tab : tab + 1;
    }
    return key.substr(begin, end - begin);
}

PartitionIndex KeyFieldPartitioner::partition(std::string_view key,
                                              PartitionIndex partitions) const {
    return hashToPartition(partitionKey(key), partitions);
}

RangePartitioner::RangePartitioner(std::vector<std::string> splitPoints)
    : splitPoints_(std::move(splitPoints)) {
    std::sort(splitPoints_.begin(), splitPoints_.end());
}

PartitionIndex RangePartitioner::partition(std::string_view key, PartitionIndex partitions) const {
    auto it = std::upper_bound(splitPoints_.begin(), splitPoints_.end(), key,
                               [](std::string_view lhs, const std::string& rhs) {
                                   return lhs < std::string_view(rhs);
                               });
    auto index = static_cast<PartitionIndex>(it - splitPoints_.begin());
    return std::min<PartitionIndex>(index, partitions - 1);
}

// =============================================================================
// PartitionerSpec
// =============================================================================

Result<PartitionerSpec> PartitionerSpec::parse(std::string_view text) {
    PartitionerSpec spec;
    if (text.empty() || text == "hash") {
        return spec;
    }

    std::string_view fields;
    if (text.starts_with("key-fields=")) {
        fields = text.substr(11);
    } else if (text.starts_with("k") && text.size() > 1 &&
               std::isdigit(static_cast<unsigned char>(text[1]))) {
        fields = text.substr(1);
    }

    if (!fields.empty()) {
        spec.kind = Kind::kKeyFields;
        auto parts = splitList(fields);
        if (parts.size() > 2 || !parseField(parts[0], spec.firstField) ||
            (parts.size() == 2 && !parseField(parts[1], spec.lastField))) {
            return makeError<PartitionerSpec>(
                ErrorCode::kConfigurationError,
                fmt::format("invalid key field range '{}'", fields));
        }
        if (parts.size() == 1) {
            spec.lastField = spec.firstField;
        }
        if (spec.firstField == 0 || (spec.lastField != 0 && spec.lastField < spec.firstField)) {
            return makeError<PartitionerSpec>(
                ErrorCode::kConfigurationError,
                fmt::format("invalid key field range '{}'", fields));
        }
        return spec;
    }

    if (text.starts_with("range=")) {
        spec.kind = Kind::kRange;
        spec.splitPoints = splitList(text.substr(6));
        std::sort(spec.splitPoints.begin(), spec.splitPoints.end());
        if (std::adjacent_find(spec.splitPoints.begin(), spec.splitPoints.end()) !=
            spec.splitPoints.end()) {
            return makeError<PartitionerSpec>(ErrorCode::kConfigurationError,
                                              "range split points must be distinct");
        }
        return spec;
    }

    return makeError<PartitionerSpec>(ErrorCode::kConfigurationError,
                                      fmt::format("unknown partitioner '{}'", text));
}

std::string PartitionerSpec::toString() const {
    switch (kind) {
        case Kind::kHash:
            return "hash";
        case Kind::kKeyFields:
            return fmt::format("key-fields={},{}", firstField, lastField);
        case Kind::kRange:
            return fmt::format("range={}", fmt::join(splitPoints, ","));
    }
    return "hash";
}

VoidResult PartitionerSpec::validate(PartitionIndex partitions) const {
    if (partitions == 0) {
        return makeVoidError(ErrorCode::kConfigurationError,
                             "partition count must be positive");
    }
    if (kind == Kind::kRange && splitPoints.size() + 1 != partitions) {
        return makeVoidError(ErrorCode::kConfigurationError,
                             fmt::format("range partitioner with {} split points needs {} "
                                         "partitions, stage declares {}",
                                         splitPoints.size(), splitPoints.size() + 1, partitions));
    }
    return makeVoidSuccess();
}

std::unique_ptr<Partitioner> PartitionerSpec::create() const {
    switch (kind) {
        case Kind::kKeyFields:
            return std::make_unique<KeyFieldPartitioner>(firstField, lastField);
        case Kind::kRange:
            return std::make_unique<RangePartitioner>(splitPoints);
        case Kind::kHash:
            break;
    }
    return std::make_unique<HashPartitioner>();
}

}  // namespace railmr::sort
