#include "io/file_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

namespace reposync {

FileReader::~FileReader() { Close(); }

FileReader::FileReader(FileReader&& other) noexcept
    : path_(std::move(other.path_)), fd_(std::exchange(other.fd_, -1)), size_(std::exchange(other.size_, std::nullopt)) {}

FileReader& FileReader::operator=(FileReader&& other) noexcept {
    if (this != &other) {
        Close();
        path_ = std::move(other.path_);
        fd_ = std::exchange(other.fd_, -1);
        size_ = std::exchange(other.size_, std::nullopt);
    }
    return *this;
}

void FileReader::Close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Result FileReader::Open(std::string path, FileReader& out) {
    out.Close();
    out.size_ = std::nullopt;
    out.path_ = std::move(path);

    const int fd = ::open(out.path_.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int e = errno;
        if (e == ENOENT) {
            return Result::Fail(kErrNotFound, "File not found: " + out.path_);
        }
        return Result::Fail(
            e, "Failed to open input: " + out.path_ + " (" + std::strerror(e) + ")");
    }
    out.fd_ = fd;

    struct stat st{};
    if (::fstat(fd, &st) == 0 && st.st_size > 0) {
        out.size_ = static_cast<std::uint64_t>(st.st_size);
    }

    return Result::Ok();
}

std::optional<std::uint64_t> FileReader::TotalSize() const { return size_; }

ssize_t FileReader::Read(std::span<std::uint8_t> out) {
    if (fd_ < 0)
        return -1;
    while (true) {
        ssize_t n = ::read(fd_, out.data(), out.size());
        if (n >= 0) {
            return n;
        }
        if (errno == EINTR) {
            continue;
        }
        return -1;
    }
}

} // namespace reposync
