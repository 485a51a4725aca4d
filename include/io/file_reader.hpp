#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace reposync {

// Read-only file source. Owns its descriptor; moving transfers it.
class FileReader final : public IReader {
public:
    FileReader() = default;
    ~FileReader() override;

    FileReader(const FileReader&) = delete;
    FileReader& operator=(const FileReader&) = delete;
    FileReader(FileReader&& other) noexcept;
    FileReader& operator=(FileReader&& other) noexcept;

    // Fails with kErrNotFound when the path does not exist. Any descriptor
    // `out` already held is closed first.
    static Result Open(std::string path, FileReader &out);

    std::optional<std::uint64_t> TotalSize() const override;
    ssize_t Read(std::span<std::uint8_t> out) override;

    bool IsOpen() const { return fd_ >= 0; }
    const std::string& Path() const { return path_; }

private:
    void Close();

    std::string path_;
    int fd_ = -1;
    std::optional<std::uint64_t> size_;
};

} // namespace reposync
