#pragma once

#include "util/result.hpp"

#include <cstdint>
#include <span>
#include <string>

namespace reposync {

enum class ContainerKind {
    TarGz,
    Zip,
    Unsupported,
};

const char* ToString(ContainerKind kind);

// Picks the container kind from the leading magic bytes, never from the file name.
class FormatDetector {
  public:
    static ContainerKind DetectBytes(std::span<const std::uint8_t> head);

    // Fails with kErrNotFound for a missing file and kErrUnsupportedContainer
    // (out = Unsupported) when no signature matches.
    static Result Detect(const std::string& path, ContainerKind& out);
};

} // namespace reposync
