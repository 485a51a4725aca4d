#pragma once

#include "util/result.hpp"

#include <string>

namespace reposync {

// Owns a path on disk and unlinks it on destruction.
class TempFile {
public:
    // mkstemp in `dir`; the descriptor is closed immediately, the path is kept.
    static Result Create(const std::string& dir, const std::string& prefix, TempFile& out);

    // Takes ownership of an existing path.
    static TempFile Adopt(std::string path);

    TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile();

    const std::string& Path() const;

private:
    void Cleanup();

    std::string path_;
};

} // namespace reposync
