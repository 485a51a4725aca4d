#include "sync/temp_file.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <unistd.h>
#include <vector>

namespace reposync {

Result TempFile::Create(const std::string& dir, const std::string& prefix, TempFile& out) {
    std::string tmpl = (dir.empty() ? std::string("/tmp") : dir) + "/" + prefix + "XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int fd = ::mkstemp(buf.data());
    if (fd < 0) {
        const int e = errno;
        return Result::Fail(e, "mkstemp failed in " + dir + " (" + std::strerror(e) + ")");
    }
    out = TempFile();
    out.path_ = buf.data();
    // Only the path is kept; the transfer engine reopens it for writing.
    if (::close(fd) != 0) {
        const int e = errno;
        out.Cleanup();
        return Result::Fail(e, "cannot close temp file (" + std::string(std::strerror(e)) + ")");
    }
    return Result::Ok();
}

TempFile TempFile::Adopt(std::string path) {
    TempFile t;
    t.path_ = std::move(path);
    return t;
}

TempFile::TempFile() = default;
TempFile::TempFile(TempFile&& other) noexcept { *this = std::move(other); }
TempFile& TempFile::operator=(TempFile&& other) noexcept {
    if (this != &other) {
        Cleanup();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}
TempFile::~TempFile() { Cleanup(); }

const std::string& TempFile::Path() const { return path_; }

void TempFile::Cleanup() {
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

} // namespace reposync
