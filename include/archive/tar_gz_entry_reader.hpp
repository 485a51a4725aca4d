#pragma once

#include "archive/libarchive_entry_reader.hpp"

#include <cstdint>
#include <string>

namespace reposync {

// gzip is inflated with zlib and the resulting tar stream is parsed by
// libarchive. Progress is the share of compressed file bytes consumed.
class TarGzEntryReader final : public LibarchiveEntryReader {
  public:
    explicit TarGzEntryReader(const EntryReaderOptions& opt = {}) : LibarchiveEntryReader(opt) {}

    Result Open(const std::string& path);

    int PercentConsumed() const override;

  private:
    std::uint64_t compressed_read_ = 0;
    std::uint64_t compressed_total_ = 0;
};

} // namespace reposync
