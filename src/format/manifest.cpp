// =============================================================================
// railmr - Input Manifest Implementation
// =============================================================================

#include "railmr/format/manifest.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <set>

#include <fmt/format.h>

#include "railmr/common/logger.h"

namespace railmr::format {

namespace {

constexpr std::string_view kFileScheme = "file://";

std::vector<std::string_view> splitTabs(std::string_view line) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    for (;;) {
        auto tab = line.find('\t', start);
        if (tab == std::string_view::npos) {
            fields.push_back(line.substr(start));
            return fields;
        }
        fields.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
}

bool isValidMd5(std::string_view md5) {
    if (md5.empty() || md5 == "0") {
        return true;
    }
    return md5.size() == 32 && std::all_of(md5.begin(), md5.end(), [](char c) {
               return std::isxdigit(static_cast<unsigned char>(c)) != 0;
           });
}

/// @return Error text, or empty if the URL is acceptable.
std::string checkUrl(std::string_view url) {
    if (url.empty()) {
        return "empty URL";
    }
    auto scheme = url.find("://");
    if (scheme != std::string_view::npos && !url.starts_with(kFileScheme)) {
        return fmt::format("unsupported URL scheme '{}' in '{}' (only local paths and file:// "
                           "are supported)",
                           url.substr(0, scheme), url);
    }
    return {};
}

std::string_view trimLineEnd(std::string_view line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.remove_suffix(1);
    }
    return line;
}

}  // namespace

std::filesystem::path localPath(std::string_view url) {
    if (url.starts_with(kFileScheme)) {
        url.remove_prefix(kFileScheme.size());
    }
    return std::filesystem::path(std::string(url));
}

std::vector<std::filesystem::path> ManifestEntry::sourcePaths() const {
    std::vector<std::filesystem::path> paths{localPath(url1)};
    if (paired()) {
        paths.push_back(localPath(url2));
    }
    return paths;
}

ManifestEntry ManifestEntry::resolved(const std::filesystem::path& base) const {
    auto resolve = [&base](const std::string& url) {
        auto path = localPath(url);
        return (path.is_absolute() ? path : base / path).lexically_normal().string();
    };
    ManifestEntry copy = *this;
    copy.url1 = resolve(url1);
    if (paired()) {
        copy.url2 = resolve(url2);
    }
    return copy;
}

Result<ManifestEntry> parseManifestLine(std::string_view line) {
    auto fields = splitTabs(trimLineEnd(line));
    ManifestEntry entry;
    if (fields.size() == 3) {
        entry.url1 = fields[0];
        entry.md5_1 = fields[1];
        entry.label = fields[2];
    } else if (fields.size() == 5) {
        entry.url1 = fields[0];
        entry.md5_1 = fields[1];
        entry.url2 = fields[2];
        entry.md5_2 = fields[3];
        entry.label = fields[4];
    } else {
        return makeError<ManifestEntry>(
            ErrorCode::kConfigurationError,
            fmt::format("expected 3 or 5 tab-separated fields, found {}", fields.size()));
    }

    std::vector<std::string_view> urls{entry.url1};
    if (fields.size() == 5) {
        urls.push_back(entry.url2);
    }
    for (auto url : urls) {
        if (auto problem = checkUrl(url); !problem.empty()) {
            return makeError<ManifestEntry>(ErrorCode::kConfigurationError, problem);
        }
    }
    for (const auto& md5 : {entry.md5_1, entry.md5_2}) {
        if (!isValidMd5(md5)) {
            return makeError<ManifestEntry>(
                ErrorCode::kConfigurationError,
                fmt::format("invalid MD5 '{}' (expected 32 hex digits or 0)", md5));
        }
    }

    auto first = entry.label.find('-');
    auto second =
        first == std::string::npos ? std::string::npos : entry.label.find('-', first + 1);
    if (second == std::string::npos || entry.label.find('-', second + 1) != std::string::npos) {
        return makeError<ManifestEntry>(
            ErrorCode::kConfigurationError,
            fmt::format("label '{}' is not of the form group-biorep-techrep", entry.label));
    }
    entry.group = entry.label.substr(0, first);
    entry.biorep = entry.label.substr(first + 1, second - first - 1);
    entry.techrep = entry.label.substr(second + 1);
    if (entry.group.empty() || entry.biorep.empty() || entry.techrep.empty()) {
        return makeError<ManifestEntry>(
            ErrorCode::kConfigurationError,
            fmt::format("label '{}' has an empty group, biorep or techrep", entry.label));
    }
    return entry;
}

// =============================================================================
// Manifest
// =============================================================================

Manifest Manifest::parse(std::istream& in, std::string_view sourceName) {
    Manifest manifest;
    std::vector<std::string> errors;
    std::set<std::string, std::less<>> labels;
    std::string line;
    std::uint64_t lineNumber = 0;

    while (std::getline(in, line)) {
        ++lineNumber;
        std::string_view view = trimLineEnd(line);
        if (view.empty() || view.front() == '#') {
            continue;
        }
        auto entry = parseManifestLine(view);
        if (!entry) {
            errors.push_back(
                fmt::format("{}:{}: {}", sourceName, lineNumber, entry.error().message()));
            continue;
        }
        if (!labels.insert(entry->label).second) {
            errors.push_back(fmt::format("{}:{}: duplicate label '{}'", sourceName, lineNumber,
                                         entry->label));
            continue;
        }
        entry->lineNumber = lineNumber;
        manifest.entries_.push_back(std::move(*entry));
    }

    if (errors.empty() && manifest.entries_.empty()) {
        errors.push_back(fmt::format("{}: manifest has no valid lines", sourceName));
    }
    if (!errors.empty()) {
        std::string message = fmt::format("Invalid manifest ({} error{}):", errors.size(),
                                          errors.size() == 1 ? "" : "s");
        for (const auto& error : errors) {
            message += "\n  " + error;
        }
        throw ConfigurationError(message, ErrorContext{std::string(sourceName)});
    }
    RAILMR_LOG_DEBUG("Manifest {}: {} entries", sourceName, manifest.entries_.size());
    return manifest;
}

Manifest Manifest::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError(fmt::format("Cannot read manifest file {}", path.string()),
                                 ErrorContext{path.string()});
    }
    return parse(in, path.string());
}

VoidResult Manifest::checkInputs() const {
    std::vector<std::string> missing;
    for (const auto& entry : entries_) {
        for (const auto& path : entry.sourcePaths()) {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec)) {
                missing.push_back(fmt::format("line {}: {} does not exist", entry.lineNumber,
                                              path.string()));
            }
        }
    }
    if (missing.empty()) {
        return makeVoidSuccess();
    }
    std::string message = "Manifest inputs missing:";
    for (const auto& item : missing) {
        message += "\n  " + item;
    }
    return makeVoidError(ErrorCode::kConfigurationError, message);
}

}  // namespace railmr::format
