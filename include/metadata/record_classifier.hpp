#pragma once

#include <string_view>

namespace reposync {

enum class RecordKind {
    Statistics,
    Metadata,
    Noise,
};

inline constexpr std::string_view kStatisticsSuffix = "download_counts.json";
inline constexpr std::string_view kMetadataSuffix = ".ckan";

// Classification is by name suffix only.
RecordKind ClassifyRecord(std::string_view entry_name);

} // namespace reposync
