#pragma once

#include "net/transfer.hpp"

#include <string>

namespace reposync {

// HEAD request; the ETag response header is the change-token.
class CurlETagProbe final : public IETagProbe {
  public:
    struct Options {
        long connect_timeout_sec = 15;
        long timeout_sec = 30;
        std::string user_agent = "reposync/1.0 (+libcurl)";
    };

    CurlETagProbe();
    explicit CurlETagProbe(const Options& opt);

    std::expected<std::string, std::string> CurrentETag(const std::string& uri) override;

  private:
    Options opt_{};
};

} // namespace reposync
