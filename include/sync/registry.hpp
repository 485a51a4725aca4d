#pragma once

#include "metadata/package_descriptor.hpp"
#include "util/result.hpp"

#include <map>
#include <string>
#include <vector>

namespace reposync {

struct RepositorySource {
    std::string name;
    std::string uri;
    std::string etag; // empty when never fetched
};

// Everything one successful batch writes to the registry.
struct RegistryUpdate {
    std::vector<PackageDescriptor> available;
    DownloadCountTable download_counts;
    std::map<std::string, std::string> etags; // repository uri -> change-token
};

class IRegistry {
  public:
    virtual ~IRegistry() = default;

    virtual std::vector<RepositorySource> Repositories() const = 0;

    // Replaces the available set and download counts, stores the change-tokens
    // and saves. Either all of it lands or the registry is left untouched.
    virtual Result Commit(const RegistryUpdate& update) = 0;

    // Human-readable consistency problems of the current state.
    virtual std::vector<std::string> GetInconsistencies() const = 0;
};

} // namespace reposync
