#pragma once

#include "archive/entry_reader.hpp"

#include <archive.h>
#include <archive_entry.h>

namespace reposync {

// Shared libarchive cursor; subclasses open `ar_` with the right format and
// report progress their own way.
class LibarchiveEntryReader : public IEntryReader {
  public:
    ~LibarchiveEntryReader() override;

    LibarchiveEntryReader(const LibarchiveEntryReader&) = delete;
    LibarchiveEntryReader& operator=(const LibarchiveEntryReader&) = delete;

    Result Next(ContainerEntry& out, bool& eof) override;
    Result ReadCurrentToString(std::string& out) override;
    Result SkipCurrent() override;
    std::uint64_t OversizedSkipped() const override { return oversized_skipped_; }

  protected:
    explicit LibarchiveEntryReader(const EntryReaderOptions& opt) : opt_(opt) {}

    // Called for every entry handed out by Next().
    virtual void OnEntryReturned() {}

    Result FailFromArchive(const std::string& what) const;

    struct archive* ar_ = nullptr;
    bool opened_ = false;

  private:
    EntryReaderOptions opt_;
    struct archive_entry* cur_entry_ = nullptr;
    bool in_entry_ = false;
    std::uint64_t oversized_skipped_ = 0;
};

} // namespace reposync
