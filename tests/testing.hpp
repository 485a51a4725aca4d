#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/reposync_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }

    std::size_t FileCount() const {
        std::size_t n = 0;
        for (const auto& e : std::filesystem::directory_iterator(path_)) {
            (void)e;
            ++n;
        }
        return n;
    }

  private:
    std::string path_;
};

class MemoryReader final : public reposync::IReader {
  public:
    explicit MemoryReader(std::string data) : data_(data.begin(), data.end()) {}

    explicit MemoryReader(std::vector<std::uint8_t> data) : data_(std::move(data)) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        if (pos_ >= data_.size())
            return 0;
        const size_t n = std::min(out.size(), data_.size() - pos_);
        std::copy(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
                  data_.begin() + static_cast<std::ptrdiff_t>(pos_ + n),
                  out.begin());
        pos_ += n;
        return static_cast<ssize_t>(n);
    }

    std::optional<std::uint64_t> TotalSize() const override {
        return static_cast<std::uint64_t>(data_.size());
    }

  private:
    std::vector<std::uint8_t> data_;
    size_t pos_ = 0;
};

struct ArchiveEntry {
    std::string path;
    std::string contents;
    mode_t file_type = AE_IFREG;
};

enum class Container { TarGz, Zip, Tar };

inline std::vector<std::uint8_t> BuildArchive(const std::vector<ArchiveEntry>& entries,
                                              Container container) {
    std::size_t capacity = 64 * 1024;
    for (const auto& e : entries)
        capacity += e.contents.size() + e.path.size() + 2048;
    std::vector<std::uint8_t> out(capacity);
    size_t used = 0;

    archive* a = archive_write_new();
    if (!a)
        throw std::runtime_error("archive_write_new failed");

    int rc = ARCHIVE_OK;
    if (container == Container::Zip) {
        rc = archive_write_set_format_zip(a);
    } else {
        rc = archive_write_set_format_pax_restricted(a);
        if (rc == ARCHIVE_OK && container == Container::TarGz)
            rc = archive_write_add_filter_gzip(a);
    }
    if (rc != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive format setup failed");
    }
    if (archive_write_open_memory(a, out.data(), out.size(), &used) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_open_memory failed");
    }

    for (const auto& entry : entries) {
        archive_entry* hdr = archive_entry_new();
        if (!hdr) {
            (void)archive_write_free(a);
            throw std::runtime_error("archive_entry_new failed");
        }
        archive_entry_set_pathname(hdr, entry.path.c_str());
        archive_entry_set_filetype(hdr, entry.file_type);
        archive_entry_set_perm(hdr, entry.file_type == AE_IFDIR ? 0755 : 0644);
        archive_entry_set_size(hdr, static_cast<la_int64_t>(entry.contents.size()));
        if (archive_write_header(a, hdr) != ARCHIVE_OK) {
            archive_entry_free(hdr);
            (void)archive_write_free(a);
            throw std::runtime_error("archive_write_header failed");
        }
        if (!entry.contents.empty()) {
            if (archive_write_data(a, entry.contents.data(), entry.contents.size()) < 0) {
                archive_entry_free(hdr);
                (void)archive_write_free(a);
                throw std::runtime_error("archive_write_data failed");
            }
        }
        archive_entry_free(hdr);
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_close failed");
    }
    if (archive_write_free(a) != ARCHIVE_OK) {
        throw std::runtime_error("archive_write_free failed");
    }
    out.resize(used);
    return out;
}

inline bool WriteBytesFile(const std::string& path, const std::vector<std::uint8_t>& content) {
    std::ofstream os(path, std::ios::binary);
    if (!os.good()) {
        return false;
    }
    os.write(reinterpret_cast<const char*>(content.data()),
             static_cast<std::streamsize>(content.size()));
    return os.good();
}

inline bool WriteTextFile(const std::string& path, const std::string& content) {
    std::ofstream os(path);
    if (!os.good()) {
        return false;
    }
    os << content;
    return os.good();
}

inline std::string ReadTextFile(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
}

// Writes the archive to `path` and returns the path.
inline std::string WriteArchive(const std::string& path,
                                const std::vector<ArchiveEntry>& entries,
                                Container container) {
    if (!WriteBytesFile(path, BuildArchive(entries, container)))
        throw std::runtime_error("cannot write " + path);
    return path;
}

inline std::string ReadAll(reposync::IReader& reader) {
    std::string out;
    std::array<std::uint8_t, 1024> buf{};
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0)
            break;
        if (n < 0)
            return {};
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return out;
}

// Minimal valid metadata record.
inline std::string Ckan(const std::string& identifier,
                        const std::string& version,
                        const std::string& extra = "") {
    return std::string("{\"spec_version\":\"v1.4\",\"identifier\":\"") + identifier +
           "\",\"name\":\"" + identifier + "\",\"abstract\":\"test\",\"version\":\"" + version +
           "\",\"download\":\"https://example.com/" + identifier + ".zip\"" +
           (extra.empty() ? "" : "," + extra) + "}";
}

} // namespace testutil
