#pragma once

#include "sync/registry.hpp"

#include <string>
#include <vector>

namespace reposync {

// Registry persisted as one JSON document:
// {"repositories":[{"name","uri","etag"}], "available":[...], "download_counts":{...}}
class JsonFileRegistry final : public IRegistry {
  public:
    // A missing file yields an empty registry bound to `path`.
    static Result Load(const std::string& path, JsonFileRegistry& out);

    // Adds or renames a repository and saves immediately.
    Result AddRepository(const std::string& name, const std::string& uri);

    std::vector<RepositorySource> Repositories() const override;
    Result Commit(const RegistryUpdate& update) override;
    std::vector<std::string> GetInconsistencies() const override;

    const std::vector<PackageDescriptor>& Available() const { return state_.available; }
    const DownloadCountTable& DownloadCounts() const { return state_.download_counts; }
    const std::string& Path() const { return path_; }

  private:
    struct State {
        std::vector<RepositorySource> repositories;
        std::vector<PackageDescriptor> available;
        DownloadCountTable download_counts;
    };

    Result Save(const State& state) const;

    std::string path_;
    State state_;
};

} // namespace reposync
