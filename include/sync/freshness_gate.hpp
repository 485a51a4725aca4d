#pragma once

#include "net/transfer.hpp"
#include "sync/registry.hpp"

#include <vector>

namespace reposync {

// Keeps the first repository for each uri, in input order.
std::vector<RepositorySource> DistinctByUri(const std::vector<RepositorySource>& repos);

class FreshnessGate {
  public:
    explicit FreshnessGate(IETagProbe& probe) : probe_(probe) {}

    // True iff every repository has a cached change-token equal to the one the
    // server reports now. A failed probe counts as changed. Stops probing at
    // the first repository that needs a refetch.
    bool AllUnchanged(const std::vector<RepositorySource>& repos) const;

  private:
    IETagProbe& probe_;
};

} // namespace reposync
