#pragma once

#include <cstddef>

namespace reposync {

// curl_global_init exactly once per process.
void EnsureCurlGlobalInit();

// CURLOPT_HEADERFUNCTION callback; userdata is a std::string* receiving the ETag.
std::size_t CaptureETagHeader(char* buffer, std::size_t size, std::size_t nitems, void* userdata);

} // namespace reposync
