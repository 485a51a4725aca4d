#pragma once

#include "archive/entry_reader.hpp"
#include "metadata/metadata_triage.hpp"
#include "sync/progress.hpp"
#include "sync/registry.hpp"

#include <optional>
#include <string>
#include <vector>

namespace reposync {

// What one repository archive contributed to the batch.
struct RepoExtraction {
    std::vector<PackageDescriptor> descriptors;
    // Last statistics record found in this archive, if any.
    std::optional<DownloadCountTable> download_counts;
};

class RepoExtractor {
  public:
    explicit RepoExtractor(IReporter& reporter, const EntryReaderOptions& opt = {})
        : reporter_(reporter), opt_(opt) {}

    // Fails on a missing file, an unsupported container, a corrupt container,
    // an unreadable statistics record or a fatal metadata record.
    Result Extract(const RepositorySource& repo, const std::string& path, RepoExtraction& out) const;

  private:
    IReporter& reporter_;
    EntryReaderOptions opt_;
    MetadataTriage triage_;
};

} // namespace reposync
