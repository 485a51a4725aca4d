#include "sync/freshness_gate.hpp"

#include "util/logger.hpp"

#include <unordered_set>

namespace reposync {

std::vector<RepositorySource> DistinctByUri(const std::vector<RepositorySource>& repos) {
    std::vector<RepositorySource> out;
    std::unordered_set<std::string> seen;
    for (const auto& repo : repos) {
        if (seen.insert(repo.uri).second)
            out.push_back(repo);
    }
    return out;
}

bool FreshnessGate::AllUnchanged(const std::vector<RepositorySource>& repos) const {
    for (const auto& repo : repos) {
        if (repo.etag.empty()) {
            LogDebug("%s has no cached etag", repo.name.c_str());
            return false;
        }
        auto current = probe_.CurrentETag(repo.uri);
        if (!current) {
            LogDebug("etag probe for %s failed (%s), treating as changed",
                     repo.name.c_str(), current.error().c_str());
            return false;
        }
        if (*current != repo.etag) {
            LogDebug("%s changed: etag %s -> %s", repo.name.c_str(), repo.etag.c_str(), current->c_str());
            return false;
        }
    }
    return true;
}

} // namespace reposync
