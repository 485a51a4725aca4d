#include "sync/repo_extractor.hpp"

#include "metadata/metadata_parser.hpp"
#include "metadata/record_classifier.hpp"
#include "util/logger.hpp"

#include <memory>

namespace reposync {

Result RepoExtractor::Extract(const RepositorySource& repo,
                              const std::string& path,
                              RepoExtraction& out) const {
    out = RepoExtraction{};

    ContainerKind kind = ContainerKind::Unsupported;
    if (auto r = FormatDetector::Detect(path, kind); !r.is_ok())
        return r;

    std::unique_ptr<IEntryReader> reader;
    if (auto r = OpenEntryReader(kind, path, opt_, reader); !r.is_ok())
        return r;

    const std::string label = "Loading modules from " + repo.name + " repository...";
    reporter_.OnMessage(label);

    PercentTracker tracker;
    ContainerEntry entry;
    bool eof = false;
    while (true) {
        if (auto r = reader->Next(entry, eof); !r.is_ok())
            return Result::Fail(r.err, r.msg + " (" + path + ")");
        if (eof)
            break;

        switch (ClassifyRecord(entry.name)) {
            case RecordKind::Statistics: {
                std::string text;
                if (auto r = reader->ReadCurrentToString(text); !r.is_ok())
                    return r;
                auto counts = ParseDownloadCounts(text);
                if (!counts) {
                    LogError("Error processing %s : %s", entry.name.c_str(), counts.error().c_str());
                    return Result::Fail(kErrMetadata, "Error processing " + entry.name + ": " + counts.error());
                }
                out.download_counts = std::move(*counts);
                reporter_.OnMessage("Loaded download counts from " + repo.name + " repository");
                break;
            }
            case RecordKind::Metadata: {
                LogDebug("Reading CKAN data from %s", entry.name.c_str());
                if (tracker.Advance(reader->PercentConsumed()))
                    reporter_.OnProgress({label, tracker.Last()});

                std::string text;
                if (auto r = reader->ReadCurrentToString(text); !r.is_ok())
                    return r;

                std::optional<PackageDescriptor> descriptor;
                if (auto r = triage_.Process(text, entry.name, descriptor); !r.is_ok())
                    return r;
                if (descriptor)
                    out.descriptors.push_back(std::move(*descriptor));
                break;
            }
            case RecordKind::Noise:
                LogDebug("Skipping archive entry %s", entry.name.c_str());
                if (auto r = reader->SkipCurrent(); !r.is_ok())
                    return r;
                break;
        }
    }

    LogInfo("%s: %zu modules loaded from %s%s",
            repo.name.c_str(), out.descriptors.size(), ToString(kind),
            out.download_counts ? " (with download counts)" : "");
    return Result::Ok();
}

} // namespace reposync
