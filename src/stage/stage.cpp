// =============================================================================
// railmr - Stage and Pipeline Definitions Implementation
// =============================================================================

#include "railmr/stage/stage.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <set>
#include <sstream>

#include <fmt/format.h>

#include "railmr/stage/stage_body.h"

namespace railmr::stage {

namespace {

struct Preset {
    std::string_view name;
    std::string_view text;
};

constexpr Preset kPresets[] = {
    {"dedup-count",
     "signature  map     sequence_signature  partitions=x1 dedup=yes\n"
     "count      reduce  count_by_key        partitions=x1\n"},
    {"collapse",
     "ingest     map     identity            partitions=x1\n"
     "collapse   reduce  collapse_samples    partitions=x1\n"},
};

bool isSpace(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

/// @brief Split on whitespace; double quotes group, backslash escapes inside quotes.
Result<std::vector<std::string>> tokenize(std::string_view line) {
    std::vector<std::string> tokens;
    std::string current;
    bool inToken = false;
    bool inQuotes = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (inQuotes) {
            if (c == '"') {
                inQuotes = false;
            } else if (c == '\\' && i + 1 < line.size() &&
                       (line[i + 1] == '"' || line[i + 1] == '\\')) {
                current += line[++i];
            } else {
                current += c;
            }
        } else if (c == '"') {
            inQuotes = true;
            inToken = true;
        } else if (isSpace(c)) {
            if (inToken) {
                tokens.push_back(std::move(current));
                current.clear();
                inToken = false;
            }
        } else {
            current += c;
            inToken = true;
        }
    }
    if (inQuotes) {
        return makeError<std::vector<std::string>>(ErrorCode::kConfigurationError,
                                                   "unterminated quote");
    }
    if (inToken) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

std::string quoteIfNeeded(std::string_view value) {
    bool plain = !value.empty() && std::none_of(value.begin(), value.end(), [](char c) {
        return isSpace(c) || c == '"' || c == '\\' || c == '#';
    });
    if (plain) {
        return std::string(value);
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\') {
            quoted += '\\';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

std::string_view stripComment(std::string_view line) {
    bool inQuotes = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            inQuotes = !inQuotes;
        } else if (line[i] == '\\' && inQuotes) {
            ++i;
        } else if (line[i] == '#' && !inQuotes) {
            return line.substr(0, i);
        }
    }
    return line;
}

bool isValidName(std::string_view name) {
    return !name.empty() && std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-';
    });
}

}  // namespace

// =============================================================================
// PartitionCount
// =============================================================================

Result<PartitionCount> PartitionCount::parse(std::string_view text) {
    PartitionCount count;
    std::string_view digits = text;
    if (!digits.empty() && (digits.front() == 'x' || digits.front() == 'X')) {
        count.perTask = true;
        digits.remove_prefix(1);
    }
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), count.value);
    if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size() ||
        count.value == 0) {
        return makeError<PartitionCount>(
            ErrorCode::kConfigurationError,
            fmt::format("invalid partition count '{}' (expected N or xK, N and K > 0)", text));
    }
    return count;
}

std::string PartitionCount::toString() const {
    return perTask ? fmt::format("x{}", value) : fmt::format("{}", value);
}

// =============================================================================
// StageDef
// =============================================================================

std::optional<bool> parseBool(std::string_view text) noexcept {
    std::string lower;
    for (char c : text) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "yes" || lower == "true" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "no" || lower == "false" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

std::string StageDef::param(std::string_view key, std::string_view fallback) const {
    auto it = params.find(std::string(key));
    return it == params.end() ? std::string(fallback) : it->second;
}

std::int64_t StageDef::intParam(std::string_view key, std::int64_t fallback,
                                std::int64_t minValue, std::int64_t maxValue) const {
    auto it = params.find(std::string(key));
    if (it == params.end()) {
        return fallback;
    }
    const auto& text = it->second;
    std::int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() ||
        value < minValue || value > maxValue) {
        throw ConfigurationError(
            fmt::format("stage '{}': parameter {}={} must be an integer in [{}, {}]", name, key,
                        text, minValue, maxValue));
    }
    return value;
}

bool StageDef::boolParam(std::string_view key, bool fallback) const {
    auto it = params.find(std::string(key));
    if (it == params.end()) {
        return fallback;
    }
    auto value = parseBool(it->second);
    if (!value) {
        throw ConfigurationError(fmt::format("stage '{}': parameter {}={} must be yes or no", name,
                                             key, it->second));
    }
    return *value;
}

std::string StageDef::toString() const {
    std::string line = fmt::format("{} {} {} partitions={}", name, stageRoleToString(role), body,
                                   partitions.toString());
    if (partitioner.kind != sort::PartitionerSpec::Kind::kHash) {
        line += " " + quoteIfNeeded(partitioner.toString());
    }
    if (dedup) {
        line += " dedup=yes";
    }
    for (const auto& [key, value] : params) {
        line += fmt::format(" {}={}", key, quoteIfNeeded(value));
    }
    return line;
}

Result<StageDef> parseStageLine(std::string_view line) {
    auto tokens = tokenize(line);
    if (!tokens) {
        return std::unexpected(tokens.error());
    }
    if (tokens->size() < 3) {
        return makeError<StageDef>(ErrorCode::kConfigurationError,
                                   "expected 'name role body [key=value ...]'");
    }

    StageDef stage;
    stage.name = (*tokens)[0];
    if (!isValidName(stage.name)) {
        return makeError<StageDef>(ErrorCode::kConfigurationError,
                                   fmt::format("invalid stage name '{}'", stage.name));
    }
    auto role = stageRoleFromString((*tokens)[1]);
    if (!role) {
        return makeError<StageDef>(
            ErrorCode::kConfigurationError,
            fmt::format("invalid role '{}' (expected map or reduce)", (*tokens)[1]));
    }
    stage.role = *role;
    stage.body = (*tokens)[2];

    for (std::size_t i = 3; i < tokens->size(); ++i) {
        const auto& token = (*tokens)[i];
        auto eq = token.find('=');
        if (eq == std::string::npos || eq == 0) {
            return makeError<StageDef>(ErrorCode::kConfigurationError,
                                       fmt::format("expected key=value, got '{}'", token));
        }
        auto key = token.substr(0, eq);
        auto value = token.substr(eq + 1);

        if (key == "partitions") {
            auto count = PartitionCount::parse(value);
            if (!count) {
                return std::unexpected(count.error());
            }
            stage.partitions = *count;
        } else if (key == "key-fields" || key == "range") {
            auto spec = sort::PartitionerSpec::parse(key + "=" + value);
            if (!spec) {
                return std::unexpected(spec.error());
            }
            stage.partitioner = std::move(*spec);
        } else if (key == "dedup") {
            auto flag = parseBool(value);
            if (!flag) {
                return makeError<StageDef>(ErrorCode::kConfigurationError,
                                           fmt::format("invalid dedup value '{}'", value));
            }
            stage.dedup = *flag;
        } else if (!stage.params.emplace(key, value).second) {
            return makeError<StageDef>(ErrorCode::kConfigurationError,
                                       fmt::format("parameter '{}' given twice", key));
        }
    }
    return stage;
}

// =============================================================================
// PipelineDef
// =============================================================================

PipelineDef PipelineDef::parse(std::istream& in, std::string_view sourceName) {
    PipelineDef pipeline;
    std::vector<std::string> errors;
    std::string raw;
    std::uint64_t lineNumber = 0;

    while (std::getline(in, raw)) {
        ++lineNumber;
        auto line = stripComment(raw);
        if (std::all_of(line.begin(), line.end(), isSpace)) {
            continue;
        }
        auto stage = parseStageLine(line);
        if (!stage) {
            errors.push_back(
                fmt::format("{}:{}: {}", sourceName, lineNumber, stage.error().message()));
            continue;
        }
        pipeline.stages_.push_back(std::move(*stage));
    }

    if (errors.empty() && pipeline.stages_.empty()) {
        errors.push_back(fmt::format("{}: no stages defined", sourceName));
    }
    if (!errors.empty()) {
        std::string message = fmt::format("Invalid pipeline definition ({} error{}):",
                                          errors.size(), errors.size() == 1 ? "" : "s");
        for (const auto& error : errors) {
            message += "\n  " + error;
        }
        throw ConfigurationError(message);
    }
    return pipeline;
}

PipelineDef PipelineDef::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError(fmt::format("Cannot read pipeline file {}", path.string()),
                                 ErrorContext{path.string()});
    }
    return parse(in, path.string());
}

PipelineDef PipelineDef::preset(std::string_view name) {
    for (const auto& preset : kPresets) {
        if (preset.name == name) {
            std::istringstream in{std::string(preset.text)};
            return parse(in, fmt::format("preset:{}", name));
        }
    }
    throw ConfigurationError(fmt::format("Unknown pipeline preset '{}'", name));
}

std::vector<std::string> PipelineDef::presetNames() {
    std::vector<std::string> names;
    for (const auto& preset : kPresets) {
        names.emplace_back(preset.name);
    }
    return names;
}

bool PipelineDef::isPreset(std::string_view name) {
    return std::any_of(std::begin(kPresets), std::end(kPresets),
                       [name](const Preset& preset) { return preset.name == name; });
}

VoidResult PipelineDef::validate(const StageRegistry& registry) const {
    std::vector<std::string> errors;

    if (stages_.empty()) {
        errors.emplace_back("pipeline has no stages");
    } else if (stages_.front().role != StageRole::kMap) {
        errors.push_back(
            fmt::format("first stage '{}' must be a map stage", stages_.front().name));
    }

    std::set<std::string, std::less<>> seen;
    for (const auto& stage : stages_) {
        if (!seen.insert(stage.name).second) {
            errors.push_back(fmt::format("duplicate stage name '{}'", stage.name));
        }

        if (stage.partitioner.kind == sort::PartitionerSpec::Kind::kRange) {
            if (stage.partitions.perTask) {
                errors.push_back(fmt::format(
                    "stage '{}': range partitioner needs a fixed partition count", stage.name));
            } else if (auto valid = stage.partitioner.validate(stage.partitions.value); !valid) {
                errors.push_back(
                    fmt::format("stage '{}': {}", stage.name, valid.error().message()));
            }
        }

        if (!registry.contains(stage.body)) {
            errors.push_back(fmt::format("stage '{}': unknown body '{}'", stage.name, stage.body));
            continue;
        }
        try {
            auto body = registry.create(stage);
            if (stage.dedup && !body->cacheable()) {
                errors.push_back(fmt::format(
                    "stage '{}': body '{}' does not support redundancy elimination", stage.name,
                    stage.body));
            }
        } catch (const ConfigurationError& ex) {
            errors.push_back(ex.message());
        }
    }

    if (errors.empty()) {
        return makeVoidSuccess();
    }
    std::string message = "Invalid pipeline:";
    for (const auto& error : errors) {
        message += "\n  " + error;
    }
    return makeVoidError(ErrorCode::kConfigurationError, message);
}

void PipelineDef::applyDefaults(const std::map<std::string, std::string>& globalParams) {
    for (auto& stage : stages_) {
        for (const auto& [key, value] : globalParams) {
            stage.params.emplace(key, value);
        }
    }
}

}  // namespace railmr::stage
