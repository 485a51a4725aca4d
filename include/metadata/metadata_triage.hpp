#pragma once

#include "metadata/metadata_parser.hpp"
#include "util/result.hpp"

#include <optional>
#include <string>

namespace reposync {

// Parses one metadata record and decides what a failure means for the sync.
// Ok + descriptor: record loaded.
// Ok + empty:      blank record, or a failure caused by newer-format metadata (logged at info).
// Fail:            any other failure; logged at error with the innermost message.
class MetadataTriage {
  public:
    Result Process(const std::string& raw, const std::string& record_name,
                   std::optional<PackageDescriptor>& out) const;

  private:
    MetadataParser parser_;
};

} // namespace reposync
