#include "metadata/record_classifier.hpp"

#include "util/path_utils.hpp"

namespace reposync {

RecordKind ClassifyRecord(std::string_view entry_name) {
    if (EndsWith(entry_name, kStatisticsSuffix))
        return RecordKind::Statistics;
    if (EndsWith(entry_name, kMetadataSuffix))
        return RecordKind::Metadata;
    return RecordKind::Noise;
}

} // namespace reposync
