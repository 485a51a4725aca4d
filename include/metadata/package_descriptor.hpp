#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace reposync {

struct PackageDescriptor {
    std::string identifier;
    std::string name;
    std::string abstract;
    std::string license; // several licenses are joined with ", "
    std::string version;
    std::string spec_version;
    std::string kind = "package";
    std::string download;

    // Plain relation names; any_of groups are kept only in `raw`.
    std::vector<std::string> depends;
    std::vector<std::string> provides;

    // The record as published, persisted verbatim by the registry.
    nlohmann::json raw;

    std::string ToString() const { return identifier + " " + version; }
};

// Package identifier -> popularity count, ordered by key.
using DownloadCountTable = std::map<std::string, int>;

} // namespace reposync
