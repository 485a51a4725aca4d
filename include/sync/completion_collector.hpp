#pragma once

#include "net/transfer.hpp"

#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace reposync {

// Thread-safe sink for transfer completions. Completions are only appended
// while the batch runs; the keyed view is built once the batch is over.
class CompletionCollector {
  public:
    void Add(const DownloadCompletion& c) {
        std::lock_guard<std::mutex> lk(mu_);
        received_.push_back(c);
    }

    CompletionCallback Callback() {
        return [this](const DownloadCompletion& c) { Add(c); };
    }

    // uri -> completion; a later completion for the same uri replaces an earlier one.
    std::map<std::string, DownloadCompletion> ByUri() const {
        std::lock_guard<std::mutex> lk(mu_);
        std::map<std::string, DownloadCompletion> out;
        for (const auto& c : received_)
            out[c.uri] = c;
        return out;
    }

    std::size_t Count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return received_.size();
    }

  private:
    mutable std::mutex mu_;
    std::vector<DownloadCompletion> received_;
};

} // namespace reposync
