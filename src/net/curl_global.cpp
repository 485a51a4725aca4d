#include "net/curl_global.hpp"

#include "net/http_headers.hpp"

#include <curl/curl.h>
#include <mutex>
#include <string>
#include <string_view>

namespace reposync {

void EnsureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::size_t CaptureETagHeader(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    const std::size_t bytes = size * nitems;
    auto* etag = static_cast<std::string*>(userdata);
    // Status line of a new response (after a redirect) invalidates earlier headers.
    const std::string_view line(buffer, bytes);
    if (line.rfind("HTTP/", 0) == 0) {
        etag->clear();
    } else if (auto value = ParseETagHeader(line)) {
        *etag = std::move(*value);
    }
    return bytes;
}

} // namespace reposync
