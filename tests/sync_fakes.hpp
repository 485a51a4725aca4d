#pragma once

#include "net/transfer.hpp"
#include "sync/progress.hpp"
#include "sync/registry.hpp"
#include "testing.hpp"

#include <expected>
#include <map>
#include <string>
#include <thread>
#include <vector>

namespace testutil {

class RecordingReporter final : public reposync::IReporter {
  public:
    struct Progress {
        std::string label;
        int percent = 0;
    };

    void OnProgress(const reposync::ProgressEvent& e) override {
        progress.push_back({std::string(e.label), e.percent});
    }
    void OnMessage(std::string_view text) override { messages.emplace_back(text); }

    bool SawMessageContaining(const std::string& needle) const {
        for (const auto& m : messages)
            if (m.find(needle) != std::string::npos)
                return true;
        return false;
    }

    std::vector<Progress> progress;
    std::vector<std::string> messages;
};

// Answers from a fixed uri -> token table; unknown uris fail.
class MapProbe final : public reposync::IETagProbe {
  public:
    std::expected<std::string, std::string> CurrentETag(const std::string& uri) override {
        probed.push_back(uri);
        auto it = tokens.find(uri);
        if (it == tokens.end())
            return std::unexpected("unreachable");
        return it->second;
    }

    std::map<std::string, std::string> tokens;
    std::vector<std::string> probed;
};

// Copies prepared archives into the requested paths. Completions are delivered
// from a worker thread in reverse target order.
class FakeTransferEngine final : public reposync::ITransferEngine {
  public:
    struct Source {
        std::vector<std::uint8_t> body;
        std::string etag;
        std::string error;
    };

    reposync::Result FetchAll(const std::vector<reposync::DownloadTarget>& targets,
                              const reposync::CompletionCallback& on_complete) override {
        ++calls;
        requested = targets;
        bool failed = false;
        std::thread worker([&] {
            for (auto it = targets.rbegin(); it != targets.rend(); ++it) {
                reposync::DownloadCompletion c{it->uri, it->path, "", ""};
                auto src = sources.find(it->uri);
                if (src == sources.end()) {
                    c.error = "404 Not Found";
                } else if (!src->second.error.empty()) {
                    c.error = src->second.error;
                } else {
                    c.etag = src->second.etag;
                    if (!WriteBytesFile(it->path, src->second.body))
                        c.error = "write failed";
                }
                if (!c.error.empty())
                    failed = true;
                on_complete(c);
            }
        });
        worker.join();
        if (failed)
            return reposync::Result::Fail(reposync::kErrTransfer, "Download failed");
        return reposync::Result::Ok();
    }

    std::map<std::string, Source> sources;
    std::vector<reposync::DownloadTarget> requested;
    int calls = 0;
};

class FakeRegistry final : public reposync::IRegistry {
  public:
    std::vector<reposync::RepositorySource> Repositories() const override { return repositories; }

    reposync::Result Commit(const reposync::RegistryUpdate& update) override {
        ++commits;
        if (fail_commit)
            return reposync::Result::Fail(reposync::kErrCommit, "disk full");
        last_update = update;
        for (auto& repo : repositories) {
            if (auto it = update.etags.find(repo.uri); it != update.etags.end())
                repo.etag = it->second;
        }
        return reposync::Result::Ok();
    }

    std::vector<std::string> GetInconsistencies() const override { return inconsistencies; }

    std::vector<reposync::RepositorySource> repositories;
    std::vector<std::string> inconsistencies;
    reposync::RegistryUpdate last_update;
    int commits = 0;
    bool fail_commit = false;
};

} // namespace testutil
