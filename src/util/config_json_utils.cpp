#include "util/config_json_utils.hpp"

#include "util/logger.hpp"

#include <fstream>

namespace reposync::config::detail {

namespace {

// Absent keys leave the output untouched; present keys of the wrong type are errors.
bool GetString(const nlohmann::json& j, const char* key, std::string& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64(const nlohmann::json& j,
            const char* key,
            std::optional<std::uint64_t>& out,
            std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer()) || it->get<long long>() < 0) {
        err = std::string("'") + key + "' must be a non-negative integer";
        return false;
    }
    out = it->get<std::uint64_t>();
    return true;
}

bool GetBool(const nlohmann::json& j, const char* key, std::optional<bool>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string("'") + key + "' must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, SyncConfigFromFile& cfg, std::string& err) {
    if (!GetString(j, "RegistryPath", cfg.registry_path, err) ||
        !GetString(j, "DownloadDir", cfg.download_dir, err) ||
        !GetString(j, "UserAgent", cfg.user_agent, err) ||
        !GetString(j, "LogLevel", cfg.log_level, err) ||
        !GetString(j, "ProgressFile", cfg.progress_file, err)) {
        return false;
    }

    if (!GetU64(j, "MaxEntryBytes", cfg.max_entry_bytes, err) ||
        !GetU64(j, "MaxConcurrentDownloads", cfg.max_concurrent_downloads, err) ||
        !GetU64(j, "ConnectTimeoutSec", cfg.connect_timeout_sec, err) ||
        !GetU64(j, "TransferTimeoutSec", cfg.transfer_timeout_sec, err)) {
        return false;
    }

    if (!GetBool(j, "Progress", cfg.progress, err))
        return false;

    if (cfg.max_concurrent_downloads && *cfg.max_concurrent_downloads == 0) {
        err = "'MaxConcurrentDownloads' must be at least 1";
        return false;
    }
    if (!cfg.log_level.empty()) {
        LogLevel lvl{};
        if (!ParseLogLevel(cfg.log_level, lvl)) {
            err = "unknown LogLevel '" + cfg.log_level + "'";
            return false;
        }
    }

    return true;
}

} // namespace reposync::config::detail
