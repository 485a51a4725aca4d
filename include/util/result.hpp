#pragma once
#include <string>
#include <utility>

namespace reposync {

// Error codes carried in Result::err. Positive values are errno.
inline constexpr int kErrGeneric = -1;
inline constexpr int kErrNotFound = -2;
inline constexpr int kErrUnsupportedContainer = -3;
inline constexpr int kErrMetadata = -4;
inline constexpr int kErrTransfer = -5;
inline constexpr int kErrCommit = -6;

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }
};

} // namespace reposync
