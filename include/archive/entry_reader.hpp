#pragma once

#include "archive/container_kind.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <limits>
#include <memory>
#include <string>

namespace reposync {

struct ContainerEntry {
    std::string name;
    std::uint64_t size = 0;
};

struct EntryReaderOptions {
    // Entries declaring more bytes than this are skipped with an error log.
    std::uint64_t max_entry_bytes = static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max());
};

// Forward-only cursor over the regular-file entries of one container, in
// container order. The content of the current entry is consumed with
// ReadCurrentToString() or SkipCurrent() before Next() may be called again.
class IEntryReader {
  public:
    virtual ~IEntryReader() = default;

    // Returns Ok + eof=true at the end of the container.
    virtual Result Next(ContainerEntry& out, bool& eof) = 0;
    virtual Result ReadCurrentToString(std::string& out) = 0;
    virtual Result SkipCurrent() = 0;

    // 0..100, how far traversal has progressed through the container.
    virtual int PercentConsumed() const = 0;

    // Number of entries dropped because their declared size exceeded the limit.
    virtual std::uint64_t OversizedSkipped() const = 0;
};

Result OpenEntryReader(ContainerKind kind,
                       const std::string& path,
                       const EntryReaderOptions& opt,
                       std::unique_ptr<IEntryReader>& out);

} // namespace reposync
