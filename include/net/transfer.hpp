#pragma once

#include "util/result.hpp"

#include <expected>
#include <functional>
#include <string>
#include <vector>

namespace reposync {

struct DownloadTarget {
    std::string uri;
    std::string path; // local file the body is written to
};

struct DownloadCompletion {
    std::string uri;
    std::string path;
    std::string error; // empty on success
    std::string etag;  // empty when the server sent none
};

// May be invoked from any thread, once per target, in any order.
using CompletionCallback = std::function<void(const DownloadCompletion&)>;

class ITransferEngine {
  public:
    virtual ~ITransferEngine() = default;

    // Blocks until every target completed. Fails if any target failed.
    virtual Result FetchAll(const std::vector<DownloadTarget>& targets,
                            const CompletionCallback& on_complete) = 0;
};

class IETagProbe {
  public:
    virtual ~IETagProbe() = default;

    // Current change-token of `uri`, or an error describing why the probe failed.
    virtual std::expected<std::string, std::string> CurrentETag(const std::string& uri) = 0;
};

} // namespace reposync
