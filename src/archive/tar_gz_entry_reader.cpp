#include "archive/tar_gz_entry_reader.hpp"

#include "io/file_reader.hpp"
#include "io/gzip_reader.hpp"
#include "util/logger.hpp"

#include <exception>
#include <memory>
#include <vector>

namespace reposync {

namespace {

// Publishes how many compressed bytes have been pulled from the file.
class CompressedByteCounter final : public IReader {
  public:
    CompressedByteCounter(std::unique_ptr<IReader> file, std::uint64_t& consumed)
        : file_(std::move(file)), consumed_(consumed) {}

    ssize_t Read(std::span<std::uint8_t> out) override {
        const ssize_t n = file_->Read(out);
        if (n > 0)
            consumed_ += static_cast<std::uint64_t>(n);
        return n;
    }

  private:
    std::unique_ptr<IReader> file_;
    std::uint64_t& consumed_;
};

struct StreamCtx {
    std::unique_ptr<IReader> r;
    std::vector<std::uint8_t> buf;
    explicit StreamCtx(std::unique_ptr<IReader> rr) : r(std::move(rr)), buf(64 * 1024) {}
};

la_ssize_t ReadCb(archive* a, void* cd, const void** buff) {
    auto* c = static_cast<StreamCtx*>(cd);
    const ssize_t n = c->r->Read(std::span<std::uint8_t>(c->buf.data(), c->buf.size()));
    if (n < 0) {
        archive_set_error(a, -1 /* ARCHIVE_ERRNO_MISC, not exported by archive.h */, "gzip stream is corrupt or truncated");
        return -1;
    }
    *buff = c->buf.data();
    return static_cast<la_ssize_t>(n); // 0 => EOF
}

int CloseCb(archive*, void* cd) {
    delete static_cast<StreamCtx*>(cd);
    return ARCHIVE_OK;
}

} // namespace

Result TarGzEntryReader::Open(const std::string& path) {
    if (opened_) return Result::Fail(kErrGeneric, "Container already opened");

    LogDebug("Starting registry update from tar.gz file: \"%s\"", path.c_str());

    auto file = std::make_unique<FileReader>();
    if (auto r = FileReader::Open(path, *file); !r.is_ok())
        return r;
    compressed_total_ = file->TotalSize().value_or(0);
    compressed_read_ = 0;

    std::unique_ptr<IReader> chain;
    try {
        chain = std::make_unique<GzipReader>(
            std::make_unique<CompressedByteCounter>(std::move(file), compressed_read_));
    } catch (const std::exception& e) {
        return Result::Fail(kErrGeneric, std::string("gzip init failed: ") + e.what());
    }

    ar_ = archive_read_new();
    if (!ar_) return Result::Fail(kErrGeneric, "archive_read_new failed");

    archive_read_support_format_tar(ar_);

    auto* ctx = new StreamCtx(std::move(chain));
    // libarchive invokes the close callback (which frees ctx) even when open fails.
    if (archive_read_open2(ar_, ctx, /*open*/nullptr, ReadCb, /*skip*/nullptr, CloseCb) != ARCHIVE_OK) {
        Result fail = FailFromArchive("archive_read_open2 failed for " + path);
        archive_read_free(ar_);
        ar_ = nullptr;
        return fail;
    }

    opened_ = true;
    return Result::Ok();
}

int TarGzEntryReader::PercentConsumed() const {
    if (compressed_total_ == 0) return 0;
    const std::uint64_t pct = (compressed_read_ * 100ULL) / compressed_total_;
    return static_cast<int>(pct > 100 ? 100 : pct);
}

} // namespace reposync
