#include "archive/container_kind.hpp"

#include "io/file_reader.hpp"

#include <algorithm>
#include <array>

namespace reposync {

namespace {
constexpr std::array<std::uint8_t, 2> kGzipMagic{0x1f, 0x8b};
constexpr std::array<std::uint8_t, 4> kZipLocalHeader{0x50, 0x4b, 0x03, 0x04};
// An archive without entries starts with the end-of-central-directory record.
constexpr std::array<std::uint8_t, 4> kZipEmpty{0x50, 0x4b, 0x05, 0x06};

template <std::size_t N>
bool HasPrefix(std::span<const std::uint8_t> head, const std::array<std::uint8_t, N>& magic) {
    return head.size() >= N && std::equal(magic.begin(), magic.end(), head.begin());
}
} // namespace

const char* ToString(ContainerKind kind) {
    switch (kind) {
        case ContainerKind::TarGz: return "tar.gz";
        case ContainerKind::Zip:   return "zip";
        default:                   return "unsupported";
    }
}

ContainerKind FormatDetector::DetectBytes(std::span<const std::uint8_t> head) {
    if (HasPrefix(head, kGzipMagic))
        return ContainerKind::TarGz;
    if (HasPrefix(head, kZipLocalHeader) || HasPrefix(head, kZipEmpty))
        return ContainerKind::Zip;
    return ContainerKind::Unsupported;
}

Result FormatDetector::Detect(const std::string& path, ContainerKind& out) {
    out = ContainerKind::Unsupported;

    FileReader reader;
    if (auto r = FileReader::Open(path, reader); !r.is_ok())
        return r;

    std::array<std::uint8_t, 4> head{};
    std::size_t used = 0;
    while (used < head.size()) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(head.data() + used, head.size() - used));
        if (n < 0)
            return Result::Fail(kErrGeneric, "Failed to read header of " + path);
        if (n == 0)
            break;
        used += static_cast<std::size_t>(n);
    }

    out = DetectBytes(std::span<const std::uint8_t>(head.data(), used));
    if (out == ContainerKind::Unsupported) {
        return Result::Fail(kErrUnsupportedContainer,
                            "Not a .tar.gz or .zip, cannot process: " + path);
    }
    return Result::Ok();
}

} // namespace reposync
