#pragma once

#include "archive/libarchive_entry_reader.hpp"

#include <cstdint>
#include <string>

namespace reposync {

// Entry count and file size are taken up front; progress is the index of the
// current entry over the entry count.
class ZipEntryReader final : public LibarchiveEntryReader {
  public:
    explicit ZipEntryReader(const EntryReaderOptions& opt = {}) : LibarchiveEntryReader(opt) {}

    Result Open(const std::string& path);

    int PercentConsumed() const override;

    std::uint64_t EntryCount() const { return entry_count_; }
    std::uint64_t ByteCount() const { return byte_count_; }

  protected:
    void OnEntryReturned() override;

  private:
    static Result CountEntries(const std::string& path, std::uint64_t& out);

    std::uint64_t entry_count_ = 0;
    std::uint64_t byte_count_ = 0;
    std::uint64_t returned_ = 0;
    std::uint64_t current_index_ = 0;
};

} // namespace reposync
