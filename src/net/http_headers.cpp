#include "net/http_headers.hpp"

#include <algorithm>
#include <cctype>

namespace reposync {

namespace {

std::string_view Trim(std::string_view s) {
    auto issp = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && issp(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && issp(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

} // namespace

std::optional<std::string> ParseETagHeader(std::string_view line) {
    const auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return std::nullopt;

    const std::string_view key = Trim(line.substr(0, colon));
    constexpr std::string_view kName = "etag";
    if (key.size() != kName.size() ||
        !std::equal(key.begin(), key.end(), kName.begin(), [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == b;
        })) {
        return std::nullopt;
    }
    return std::string(Trim(line.substr(colon + 1)));
}

} // namespace reposync
