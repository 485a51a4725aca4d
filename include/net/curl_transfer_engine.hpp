#pragma once

#include "net/transfer.hpp"

#include <cstddef>
#include <string>

namespace reposync {

// Fetches all targets concurrently through one curl multi handle.
class CurlTransferEngine final : public ITransferEngine {
  public:
    struct Options {
        std::size_t max_concurrent = 4;
        long connect_timeout_sec = 15;
        long transfer_timeout_sec = 300;
        std::string user_agent = "reposync/1.0 (+libcurl)";
    };

    CurlTransferEngine();
    explicit CurlTransferEngine(const Options& opt);

    Result FetchAll(const std::vector<DownloadTarget>& targets,
                    const CompletionCallback& on_complete) override;

  private:
    Options opt_{};
};

} // namespace reposync
