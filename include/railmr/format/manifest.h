// =============================================================================
// railmr - Input Manifest
// =============================================================================
// Tab-separated list of input units, one per line:
//
//   URL <TAB> MD5 <TAB> label                              (unpaired)
//   URL1 <TAB> MD5_1 <TAB> URL2 <TAB> MD5_2 <TAB> label     (paired)
//
// MD5 is empty, "0" or 32 hex digits. The label has the form
// group-biorep-techrep and is unique within the manifest. Blank lines and lines
// starting with '#' are ignored. URLs are local paths or file:// URLs.
//
// Every malformed line is reported, together, in a single ConfigurationError.
// =============================================================================

#ifndef RAILMR_FORMAT_MANIFEST_H
#define RAILMR_FORMAT_MANIFEST_H

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

#include "railmr/common/error.h"

namespace railmr::format {

struct ManifestEntry {
    std::string url1;
    std::string md5_1;
    std::string url2;
    std::string md5_2;
    std::string label;

    std::string group;
    std::string biorep;
    std::string techrep;

    /// @brief 1-based line in the manifest file (0 when not read from a file).
    std::uint64_t lineNumber = 0;

    [[nodiscard]] bool paired() const noexcept { return !url2.empty(); }

    /// @brief Local file paths of the entry's sources.
    [[nodiscard]] std::vector<std::filesystem::path> sourcePaths() const;

    /// @brief Copy with file:// stripped and relative paths made absolute.
    [[nodiscard]] ManifestEntry resolved(const std::filesystem::path& base) const;

    bool operator==(const ManifestEntry&) const = default;
};

/// @brief Parse one manifest line (without the line terminator).
[[nodiscard]] Result<ManifestEntry> parseManifestLine(std::string_view line);

/// @brief Local path of a manifest URL; file:// is stripped.
[[nodiscard]] std::filesystem::path localPath(std::string_view url);

class Manifest {
public:
    Manifest() = default;
    explicit Manifest(std::vector<ManifestEntry> entries) : entries_(std::move(entries)) {}

    /// @throws ConfigurationError listing every malformed line.
    [[nodiscard]] static Manifest parse(std::istream& in, std::string_view sourceName);

    /// @throws ConfigurationError if the file is missing or malformed.
    [[nodiscard]] static Manifest load(const std::filesystem::path& path);

    /// @brief Check that every local source file exists.
    [[nodiscard]] VoidResult checkInputs() const;

    [[nodiscard]] const std::vector<ManifestEntry>& entries() const noexcept { return entries_; }

    [[nodiscard]] const ManifestEntry& entry(std::size_t index) const { return entries_.at(index); }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

private:
    std::vector<ManifestEntry> entries_;
};

}  // namespace railmr::format

#endif  // RAILMR_FORMAT_MANIFEST_H
