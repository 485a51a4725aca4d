#pragma once

#include "metadata/package_descriptor.hpp"
#include "metadata/parse_error.hpp"

#include <expected>
#include <optional>
#include <string>

namespace reposync {

// Highest metadata spec version this client understands.
inline constexpr const char* kSupportedSpecVersion = "v1.34";

class MetadataParser {
  public:
    // Blank input yields an empty optional rather than an error.
    std::expected<std::optional<PackageDescriptor>, ParseError> Parse(const std::string& json_input) const;

    // Same rules for a record that is already decoded.
    std::expected<PackageDescriptor, ParseError> ParseValue(nlohmann::json j) const;
};

// Statistics record: a JSON object mapping identifiers to integer counts.
// Counts that do not fit an int are rejected.
std::expected<DownloadCountTable, std::string> ParseDownloadCounts(const std::string& json_input);
std::expected<DownloadCountTable, std::string> DownloadCountsFromJson(const nlohmann::json& j);

} // namespace reposync
