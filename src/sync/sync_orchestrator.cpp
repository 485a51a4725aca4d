#include "sync/sync_orchestrator.hpp"

#include "sync/completion_collector.hpp"
#include "sync/freshness_gate.hpp"
#include "sync/repo_extractor.hpp"
#include "sync/temp_file.hpp"
#include "util/logger.hpp"

#include <iterator>
#include <vector>

namespace reposync {

const char* ToString(SyncOutcome outcome) {
    switch (outcome) {
        case SyncOutcome::Updated:   return "Updated";
        case SyncOutcome::NoChanges: return "NoChanges";
        case SyncOutcome::Failed:    return "Failed";
    }
    return "Unknown";
}

const char* ToString(SyncOrchestrator::State state) {
    using S = SyncOrchestrator::State;
    switch (state) {
        case S::Idle:              return "Idle";
        case S::CheckingFreshness: return "CheckingFreshness";
        case S::Fetching:          return "Fetching";
        case S::Extracting:        return "Extracting";
        case S::Committing:        return "Committing";
        case S::NoChanges:         return "NoChanges";
        case S::Updated:           return "Updated";
        case S::Failed:            return "Failed";
    }
    return "Unknown";
}

SyncOrchestrator::SyncOrchestrator(IRegistry& registry,
                                   ITransferEngine& transfer,
                                   IETagProbe& probe,
                                   IReporter& reporter)
    : SyncOrchestrator(registry, transfer, probe, reporter, Options{}) {}

SyncOrchestrator::SyncOrchestrator(IRegistry& registry,
                                   ITransferEngine& transfer,
                                   IETagProbe& probe,
                                   IReporter& reporter,
                                   const Options& opt)
    : registry_(registry), transfer_(transfer), probe_(probe), reporter_(reporter), opt_(opt) {}

SyncOutcome SyncOrchestrator::Fail(Result why) {
    LogError("Repository update failed: %s", why.msg.c_str());
    reporter_.OnMessage("Repository update failed: " + why.msg);
    last_failure_ = std::move(why);
    state_ = State::Failed;
    return SyncOutcome::Failed;
}

SyncOutcome SyncOrchestrator::Run() {
    last_failure_ = Result::Ok();

    state_ = State::CheckingFreshness;
    const std::vector<RepositorySource> repos = DistinctByUri(registry_.Repositories());

    reporter_.OnProgress({"Checking for updates", 0});
    if (FreshnessGate(probe_).AllUnchanged(repos)) {
        reporter_.OnProgress({"Already up to date", 100});
        reporter_.OnMessage("No changes since last update");
        state_ = State::NoChanges;
        return SyncOutcome::NoChanges;
    }

    // Every artifact path is owned here and unlinked when Run returns.
    std::vector<TempFile> artifacts;
    artifacts.reserve(repos.size());

    state_ = State::Fetching;
    std::vector<DownloadTarget> targets;
    targets.reserve(repos.size());
    for (const auto& repo : repos) {
        TempFile tmp;
        if (auto r = TempFile::Create(opt_.download_dir, "reposync-", tmp); !r.is_ok())
            return Fail(r);
        targets.push_back({repo.uri, tmp.Path()});
        artifacts.push_back(std::move(tmp));
    }

    CompletionCollector collector;
    const Result fetched = transfer_.FetchAll(targets, collector.Callback());
    const auto completions = collector.ByUri();
    for (std::size_t i = 0; i < targets.size(); ++i) {
        auto it = completions.find(targets[i].uri);
        if (it != completions.end() && !it->second.path.empty() && it->second.path != targets[i].path)
            artifacts.push_back(TempFile::Adopt(it->second.path));
    }
    if (!fetched.is_ok())
        return Fail(Result::Fail(kErrTransfer, fetched.msg));

    state_ = State::Extracting;
    RepoExtractor extractor(reporter_, opt_.entry);
    RegistryUpdate update;
    for (std::size_t i = 0; i < repos.size(); ++i) {
        const auto& repo = repos[i];
        auto it = completions.find(repo.uri);
        if (it == completions.end())
            return Fail(Result::Fail(kErrTransfer, "no download completion reported for " + repo.uri));
        if (!it->second.error.empty())
            return Fail(Result::Fail(kErrTransfer, repo.uri + ": " + it->second.error));

        const std::string& path = it->second.path.empty() ? targets[i].path : it->second.path;
        RepoExtraction extraction;
        if (auto r = extractor.Extract(repo, path, extraction); !r.is_ok())
            return Fail(r);

        update.available.insert(update.available.end(),
                                std::make_move_iterator(extraction.descriptors.begin()),
                                std::make_move_iterator(extraction.descriptors.end()));
        // Each statistics record replaces the batch table; the last repository wins.
        if (extraction.download_counts) {
            if (!update.download_counts.empty())
                LogDebug("Download counts from %s replace earlier ones", repo.name.c_str());
            update.download_counts = std::move(*extraction.download_counts);
        }
        update.etags[repo.uri] = it->second.etag;
    }

    if (update.available.empty()) {
        LogWarn("No modules found in any repository, registry left unchanged");
        state_ = State::NoChanges;
        return SyncOutcome::NoChanges;
    }

    state_ = State::Committing;
    for (const auto& repo : repos) {
        LogDebug("Setting etag for %s: %s", repo.name.c_str(), update.etags[repo.uri].c_str());
    }
    if (auto r = registry_.Commit(update); !r.is_ok())
        return Fail(Result::Fail(kErrCommit, "registry commit failed: " + r.msg));

    ShowInconsistencies();

    LogInfo("Updated %zu repositories, %zu modules available", repos.size(), update.available.size());
    state_ = State::Updated;
    return SyncOutcome::Updated;
}

void SyncOrchestrator::ShowInconsistencies() {
    const auto problems = registry_.GetInconsistencies();
    if (problems.empty())
        return;

    std::string text = "The following inconsistencies were found:\n";
    for (const auto& p : problems) {
        text += "- " + p + "\n";
    }
    reporter_.OnMessage(text);
}

} // namespace reposync
