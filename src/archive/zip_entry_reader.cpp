#include "archive/zip_entry_reader.hpp"

#include "io/file_reader.hpp"
#include "util/logger.hpp"

namespace reposync {

namespace {
constexpr std::size_t kBlockSize = 64 * 1024;
} // namespace

Result ZipEntryReader::CountEntries(const std::string& path, std::uint64_t& out) {
    out = 0;
    archive* a = archive_read_new();
    if (!a) return Result::Fail(kErrGeneric, "archive_read_new failed");
    archive_read_support_format_zip(a);

    if (archive_read_open_filename(a, path.c_str(), kBlockSize) != ARCHIVE_OK) {
        std::string em = archive_error_string(a) ? archive_error_string(a) : "unknown";
        archive_read_free(a);
        return Result::Fail(kErrGeneric, "cannot open zip " + path + ": " + em);
    }

    archive_entry* entry = nullptr;
    int r;
    while ((r = archive_read_next_header(a, &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        if (archive_entry_filetype(entry) == AE_IFREG)
            ++out;
        archive_read_data_skip(a);
    }

    std::string em = (r != ARCHIVE_EOF && archive_error_string(a)) ? archive_error_string(a) : "";
    archive_read_free(a);
    if (r != ARCHIVE_EOF)
        return Result::Fail(kErrGeneric, "zip pre-scan failed for " + path + ": " + em);
    return Result::Ok();
}

Result ZipEntryReader::Open(const std::string& path) {
    if (opened_) return Result::Fail(kErrGeneric, "Container already opened");

    LogDebug("Starting registry update from zip file: \"%s\"", path.c_str());

    {
        FileReader probe;
        if (auto r = FileReader::Open(path, probe); !r.is_ok())
            return r;
        byte_count_ = probe.TotalSize().value_or(0);
    }

    if (auto r = CountEntries(path, entry_count_); !r.is_ok())
        return r;

    ar_ = archive_read_new();
    if (!ar_) return Result::Fail(kErrGeneric, "archive_read_new failed");
    archive_read_support_format_zip(ar_);

    if (archive_read_open_filename(ar_, path.c_str(), kBlockSize) != ARCHIVE_OK) {
        Result fail = FailFromArchive("cannot open zip " + path);
        archive_read_free(ar_);
        ar_ = nullptr;
        return fail;
    }

    LogDebug("zip %s: %llu entries, %llu bytes",
             path.c_str(), (unsigned long long)entry_count_, (unsigned long long)byte_count_);
    opened_ = true;
    return Result::Ok();
}

void ZipEntryReader::OnEntryReturned() {
    current_index_ = returned_++;
}

int ZipEntryReader::PercentConsumed() const {
    if (entry_count_ == 0) return 0;
    const std::uint64_t pct = (current_index_ * 100ULL) / entry_count_;
    return static_cast<int>(pct > 100 ? 100 : pct);
}

} // namespace reposync
