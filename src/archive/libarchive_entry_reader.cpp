#include "archive/libarchive_entry_reader.hpp"

#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <vector>

namespace reposync {

LibarchiveEntryReader::~LibarchiveEntryReader() {
    if (ar_) {
        archive_read_free(ar_);
        ar_ = nullptr;
    }
}

Result LibarchiveEntryReader::FailFromArchive(const std::string& what) const {
    const char* es = ar_ ? archive_error_string(ar_) : nullptr;
    return Result::Fail(kErrGeneric, what + ": " + (es ? es : "unknown"));
}

Result LibarchiveEntryReader::Next(ContainerEntry& out, bool& eof) {
    eof = false;
    if (!opened_ || !ar_) return Result::Fail(kErrGeneric, "Container not opened");

    if (in_entry_) {
        return Result::Fail(kErrGeneric, "Previous entry not finished (read to EOF or call SkipCurrent)");
    }

    while (true) {
        int r = archive_read_next_header(ar_, &cur_entry_);
        if (r == ARCHIVE_EOF) {
            eof = true;
            return Result::Ok();
        }
        if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
            return FailFromArchive("archive_read_next_header");
        }

        if (archive_entry_filetype(cur_entry_) != AE_IFREG) {
            if (archive_read_data_skip(ar_) != ARCHIVE_OK)
                return FailFromArchive("archive_read_data_skip");
            continue;
        }

        const char* name = archive_entry_pathname(cur_entry_);
        out.name = name ? NormalizeEntryPath(name) : std::string();

        const la_int64_t declared = archive_entry_size_is_set(cur_entry_) ? archive_entry_size(cur_entry_) : 0;
        if (declared < 0 || static_cast<std::uint64_t>(declared) > opt_.max_entry_bytes) {
            LogError("Error processing %s: Metadata size too large (%lld bytes)",
                     out.name.c_str(), (long long)declared);
            ++oversized_skipped_;
            if (archive_read_data_skip(ar_) != ARCHIVE_OK)
                return FailFromArchive("archive_read_data_skip");
            continue;
        }
        out.size = static_cast<std::uint64_t>(declared);

        in_entry_ = true;
        OnEntryReturned();
        return Result::Ok();
    }
}

Result LibarchiveEntryReader::SkipCurrent() {
    if (!in_entry_) return Result::Ok();
    if (archive_read_data_skip(ar_) != ARCHIVE_OK) {
        return FailFromArchive("archive_read_data_skip");
    }
    in_entry_ = false;
    return Result::Ok();
}

Result LibarchiveEntryReader::ReadCurrentToString(std::string& out) {
    if (!in_entry_) return Result::Fail(kErrGeneric, "No current entry");
    out.clear();
    if (archive_entry_size_is_set(cur_entry_) && archive_entry_size(cur_entry_) > 0)
        out.reserve(static_cast<std::size_t>(archive_entry_size(cur_entry_)));

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const la_ssize_t n = archive_read_data(ar_, buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) {
            in_entry_ = false;
            return FailFromArchive("archive_read_data");
        }
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }

    in_entry_ = false;
    return Result::Ok();
}

} // namespace reposync
