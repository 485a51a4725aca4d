#include "archive/entry_reader.hpp"

#include "archive/tar_gz_entry_reader.hpp"
#include "archive/zip_entry_reader.hpp"

namespace reposync {

Result OpenEntryReader(ContainerKind kind,
                       const std::string& path,
                       const EntryReaderOptions& opt,
                       std::unique_ptr<IEntryReader>& out) {
    out.reset();
    switch (kind) {
        case ContainerKind::TarGz: {
            auto reader = std::make_unique<TarGzEntryReader>(opt);
            if (auto r = reader->Open(path); !r.is_ok())
                return r;
            out = std::move(reader);
            return Result::Ok();
        }
        case ContainerKind::Zip: {
            auto reader = std::make_unique<ZipEntryReader>(opt);
            if (auto r = reader->Open(path); !r.is_ok())
                return r;
            out = std::move(reader);
            return Result::Ok();
        }
        default:
            return Result::Fail(kErrUnsupportedContainer,
                                "Not a .tar.gz or .zip, cannot process: " + path);
    }
}

} // namespace reposync
