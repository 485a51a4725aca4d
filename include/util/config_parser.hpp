#pragma once
#include "util/logger.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace reposync::config {

class SyncConfigFromFile {
public:
    std::string registry_path;
    std::string download_dir;
    std::string user_agent;
    std::string log_level;
    std::string progress_file;

    std::optional<std::uint64_t> max_entry_bytes;
    std::optional<std::uint64_t> max_concurrent_downloads;
    std::optional<std::uint64_t> connect_timeout_sec;
    std::optional<std::uint64_t> transfer_timeout_sec;
    std::optional<bool> progress;

    bool LoadFile(const std::string &path);

    void Reset();
};

// Level from `LogLevel`, forced to Debug when `verbose`. Returns false (and
// yields Info) when the configured name is not recognised.
bool ResolveLogLevel(const SyncConfigFromFile& cfg, bool verbose, LogLevel& out);

} // namespace reposync::config
