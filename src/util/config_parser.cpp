#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

#include <cstdio>

namespace reposync::config {

void SyncConfigFromFile::Reset() {
    registry_path.clear();
    download_dir.clear();
    user_agent.clear();
    log_level.clear();
    progress_file.clear();
    max_entry_bytes.reset();
    max_concurrent_downloads.reset();
    connect_timeout_sec.reset();
    transfer_timeout_sec.reset();
    progress.reset();
}

bool SyncConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        std::fprintf(stderr, "Config: %s\n", err.c_str());
        return false;
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        std::fprintf(stderr, "Config: %s in %s\n", err.c_str(), path.c_str());
        return false;
    }

    return true;
}

bool ResolveLogLevel(const SyncConfigFromFile& cfg, bool verbose, LogLevel& out) {
    bool known = true;
    out = LogLevel::Info;
    if (!cfg.log_level.empty() && !ParseLogLevel(cfg.log_level, out)) {
        out = LogLevel::Info;
        known = false;
    }
    if (verbose)
        out = LogLevel::Debug;
    return known;
}

} // namespace reposync::config
