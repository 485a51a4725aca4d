#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace reposync {

// Value of an "ETag:" response header line (name matched case-insensitively,
// surrounding whitespace and CRLF trimmed), or nullopt for any other line.
std::optional<std::string> ParseETagHeader(std::string_view line);

} // namespace reposync
