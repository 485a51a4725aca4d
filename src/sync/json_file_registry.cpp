#include "sync/json_file_registry.hpp"

#include "metadata/metadata_parser.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <set>
#include <unordered_set>

namespace reposync {

using json = nlohmann::json;

namespace {

Result ParseState(const json& j,
                  std::vector<RepositorySource>& repos,
                  std::vector<PackageDescriptor>& available,
                  DownloadCountTable& counts) {
    if (!j.is_object())
        return Result::Fail(kErrGeneric, "registry root must be a JSON object");

    if (auto it = j.find("repositories"); it != j.end()) {
        if (!it->is_array())
            return Result::Fail(kErrGeneric, "'repositories' must be an array");
        for (const auto& item : *it) {
            if (!item.is_object() || !item.contains("uri") || !item["uri"].is_string())
                return Result::Fail(kErrGeneric, "repository entries need a string 'uri'");
            RepositorySource repo;
            repo.uri = item["uri"].get<std::string>();
            repo.name = repo.uri;
            if (auto name = item.find("name"); name != item.end() && !name->is_null()) {
                if (!name->is_string())
                    return Result::Fail(kErrGeneric, "repository 'name' must be a string for " + repo.uri);
                repo.name = name->get<std::string>();
            }
            if (auto etag = item.find("etag"); etag != item.end() && !etag->is_null()) {
                if (!etag->is_string())
                    return Result::Fail(kErrGeneric, "repository 'etag' must be a string for " + repo.uri);
                repo.etag = etag->get<std::string>();
            }
            repos.push_back(std::move(repo));
        }
    }

    if (auto it = j.find("available"); it != j.end()) {
        if (!it->is_array())
            return Result::Fail(kErrGeneric, "'available' must be an array");
        MetadataParser parser;
        for (const auto& item : *it) {
            auto d = parser.ParseValue(item);
            if (!d) {
                return Result::Fail(kErrGeneric,
                                    "stored descriptor is invalid: " + InnermostCause(d.error()).message);
            }
            available.push_back(std::move(*d));
        }
    }

    if (auto it = j.find("download_counts"); it != j.end()) {
        auto table = DownloadCountsFromJson(*it);
        if (!table)
            return Result::Fail(kErrGeneric, table.error());
        counts = std::move(*table);
    }

    return Result::Ok();
}

} // namespace

Result JsonFileRegistry::Load(const std::string& path, JsonFileRegistry& out) {
    out.path_ = path;
    out.state_ = State{};

    std::error_code ec;
    if (!std::filesystem::exists(path, ec) && !ec) {
        LogInfo("Registry %s does not exist yet, starting empty", path.c_str());
        return Result::Ok();
    }

    std::ifstream is(path);
    if (!is.good()) {
        return Result::Fail(kErrGeneric, "cannot open registry " + path);
    }

    json j;
    try {
        is >> j;
    } catch (const std::exception& e) {
        return Result::Fail(kErrGeneric, "invalid JSON in " + path + ": " + e.what());
    }

    State loaded;
    if (auto r = ParseState(j, loaded.repositories, loaded.available, loaded.download_counts); !r.is_ok())
        return Result::Fail(r.err, r.msg + " in " + path);

    out.state_ = std::move(loaded);
    LogDebug("Loaded registry %s: %zu repositories, %zu available",
             path.c_str(), out.state_.repositories.size(), out.state_.available.size());
    return Result::Ok();
}

Result JsonFileRegistry::AddRepository(const std::string& name, const std::string& uri) {
    State next = state_;
    bool found = false;
    for (auto& repo : next.repositories) {
        if (repo.uri == uri) {
            repo.name = name;
            found = true;
        }
    }
    if (!found)
        next.repositories.push_back(RepositorySource{name, uri, ""});

    if (auto r = Save(next); !r.is_ok())
        return r;
    state_ = std::move(next);
    return Result::Ok();
}

std::vector<RepositorySource> JsonFileRegistry::Repositories() const {
    return state_.repositories;
}

Result JsonFileRegistry::Commit(const RegistryUpdate& update) {
    State next = state_;
    next.available = update.available;
    next.download_counts = update.download_counts;
    for (auto& repo : next.repositories) {
        if (auto it = update.etags.find(repo.uri); it != update.etags.end())
            repo.etag = it->second;
    }

    if (auto r = Save(next); !r.is_ok())
        return r;
    state_ = std::move(next);
    return Result::Ok();
}

std::vector<std::string> JsonFileRegistry::GetInconsistencies() const {
    std::unordered_set<std::string> provided;
    for (const auto& d : state_.available) {
        provided.insert(d.identifier);
        provided.insert(d.provides.begin(), d.provides.end());
    }

    std::set<std::string> problems;
    for (const auto& d : state_.available) {
        for (const auto& dep : d.depends) {
            if (!provided.contains(dep))
                problems.insert(d.ToString() + " has an unsatisfied dependency: " + dep);
        }
    }
    return {problems.begin(), problems.end()};
}

Result JsonFileRegistry::Save(const State& state) const {
    json repos = json::array();
    for (const auto& repo : state.repositories) {
        repos.push_back({{"name", repo.name}, {"uri", repo.uri}, {"etag", repo.etag}});
    }
    json available = json::array();
    for (const auto& d : state.available) {
        available.push_back(d.raw);
    }
    const json doc = {
        {"repositories", std::move(repos)},
        {"available", std::move(available)},
        {"download_counts", state.download_counts},
    };

    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream os(tmp_path, std::ios::trunc);
        if (!os.good())
            return Result::Fail(kErrCommit, "cannot write " + tmp_path);
        os << doc.dump(1, '\t');
        os.close();
        if (!os.good()) {
            std::remove(tmp_path.c_str());
            return Result::Fail(kErrCommit, "cannot write " + tmp_path);
        }
    }

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        const int e = errno;
        std::remove(tmp_path.c_str());
        return Result::Fail(kErrCommit, "cannot replace " + path_ + " (" + std::strerror(e) + ")");
    }
    return Result::Ok();
}

} // namespace reposync
