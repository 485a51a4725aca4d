#include "net/curl_etag_probe.hpp"

#include "net/curl_global.hpp"
#include "util/logger.hpp"

#include <curl/curl.h>

namespace reposync {

CurlETagProbe::CurlETagProbe() : CurlETagProbe(Options{}) {}

CurlETagProbe::CurlETagProbe(const Options& opt) : opt_(opt) {
    EnsureCurlGlobalInit();
}

std::expected<std::string, std::string> CurlETagProbe::CurrentETag(const std::string& uri) {
    CURL* h = curl_easy_init();
    if (!h)
        return std::unexpected("curl_easy_init failed");

    std::string etag;
    char errbuf[CURL_ERROR_SIZE]{};
    curl_easy_setopt(h, CURLOPT_URL, uri.c_str());
    curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, CaptureETagHeader);
    curl_easy_setopt(h, CURLOPT_HEADERDATA, &etag);
    curl_easy_setopt(h, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, opt_.connect_timeout_sec);
    curl_easy_setopt(h, CURLOPT_TIMEOUT, opt_.timeout_sec);
    curl_easy_setopt(h, CURLOPT_USERAGENT, opt_.user_agent.c_str());

    const CURLcode rc = curl_easy_perform(h);
    curl_easy_cleanup(h);

    if (rc != CURLE_OK) {
        std::string msg = errbuf[0] != '\0' ? errbuf : curl_easy_strerror(rc);
        LogDebug("ETag probe failed for %s: %s", uri.c_str(), msg.c_str());
        return std::unexpected(std::move(msg));
    }
    if (etag.empty())
        return std::unexpected("no ETag header in response");
    return etag;
}

} // namespace reposync
