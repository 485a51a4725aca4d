#pragma once

#include <string>

namespace reposync {

class VersionComparator {
public:
    // Dotted numeric comparison; an optional leading 'v' is ignored ("v1.4" == "1.4.0").
    // Returns -1, 0 or 1.
    static int Compare(const std::string& lhs, const std::string& rhs);
};

} // namespace reposync
