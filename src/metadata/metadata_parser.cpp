#include "metadata/metadata_parser.hpp"

#include "util/version_comparator.hpp"

#include <cstdint>
#include <limits>
#include <regex>

namespace reposync {

using json = nlohmann::json;

namespace {

const char* TypeName(const json& j) {
    return j.type_name();
}

ParseError FieldError(const std::string& field, ParseError inner) {
    return ParseError::Wrap(ParseErrorKind::Conversion,
                            "Error converting value for field '" + field + "'",
                            std::move(inner));
}

std::expected<std::string, ParseError> RequiredString(const json& j, const std::string& field) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) {
        return std::unexpected(FieldError(
            field, ParseError::Make(ParseErrorKind::BadMetadata, "missing required field '" + field + "'")));
    }
    if (!it->is_string()) {
        return std::unexpected(FieldError(
            field,
            ParseError::Make(ParseErrorKind::FieldType,
                             "'" + field + "' must be a string, got " + TypeName(*it))));
    }
    return it->get<std::string>();
}

std::expected<std::string, ParseError> OptionalString(const json& j, const std::string& field) {
    auto it = j.find(field);
    if (it == j.end() || it->is_null())
        return std::string();
    if (!it->is_string()) {
        return std::unexpected(FieldError(
            field,
            ParseError::Make(ParseErrorKind::FieldType,
                             "'" + field + "' must be a string, got " + TypeName(*it))));
    }
    return it->get<std::string>();
}

// spec_version is either the integer 1 or a string of the form "vX.Y".
std::expected<std::string, ParseError> ParseSpecVersion(const json& j) {
    auto it = j.find("spec_version");
    if (it == j.end()) {
        return std::unexpected(ParseError::Make(ParseErrorKind::BadMetadata, "missing spec_version"));
    }
    if (it->is_number_integer()) {
        if (it->get<long long>() != 1) {
            return std::unexpected(ParseError::Make(ParseErrorKind::BadMetadata,
                                                    "invalid spec_version " + it->dump()));
        }
        return std::string("v1.0");
    }
    static const std::regex kSpecRe(R"(^v\d+(\.\d+)*$)");
    if (!it->is_string() || !std::regex_match(it->get<std::string>(), kSpecRe)) {
        return std::unexpected(ParseError::Make(ParseErrorKind::BadMetadata,
                                                "invalid spec_version " + it->dump()));
    }
    return it->get<std::string>();
}

// `download` may be a single URL or a list of mirrors.
std::expected<std::string, ParseError> ParseDownload(const json& j) {
    auto it = j.find("download");
    if (it != j.end() && it->is_array()) {
        for (const auto& url : *it) {
            if (!url.is_string()) {
                return std::unexpected(FieldError(
                    "download",
                    ParseError::Make(ParseErrorKind::FieldType,
                                     std::string("'download' entries must be strings, got ") + TypeName(url))));
            }
        }
        if (it->empty()) {
            return std::unexpected(FieldError(
                "download", ParseError::Make(ParseErrorKind::BadMetadata, "'download' list is empty")));
        }
        return it->front().get<std::string>();
    }
    return RequiredString(j, "download");
}

// `license` may be one name or a list of names.
std::expected<std::string, ParseError> ParseLicense(const json& j) {
    auto it = j.find("license");
    if (it == j.end() || !it->is_array())
        return OptionalString(j, "license");
    std::string out;
    for (const auto& name : *it) {
        if (!name.is_string()) {
            return std::unexpected(FieldError(
                "license",
                ParseError::Make(ParseErrorKind::FieldType,
                                 std::string("'license' entries must be strings, got ") + TypeName(name))));
        }
        if (!out.empty())
            out += ", ";
        out += name.get<std::string>();
    }
    return out;
}

std::vector<std::string> RelationNames(const json& j, const char* field) {
    std::vector<std::string> out;
    auto it = j.find(field);
    if (it == j.end() || !it->is_array())
        return out;
    for (const auto& rel : *it) {
        if (rel.is_object()) {
            auto name = rel.find("name");
            if (name != rel.end() && name->is_string())
                out.push_back(name->get<std::string>());
        } else if (rel.is_string()) {
            out.push_back(rel.get<std::string>());
        }
    }
    return out;
}

} // namespace

std::expected<std::optional<PackageDescriptor>, ParseError>
MetadataParser::Parse(const std::string& json_input) const {
    if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
        return std::optional<PackageDescriptor>{};
    }

    json j;
    try {
        j = json::parse(json_input);
    } catch (const json::parse_error& e) {
        return std::unexpected(ParseError::Make(ParseErrorKind::Syntax, std::string("Syntax Error: ") + e.what()));
    }

    auto d = ParseValue(std::move(j));
    if (!d)
        return std::unexpected(d.error());
    return std::optional<PackageDescriptor>(std::move(*d));
}

std::expected<PackageDescriptor, ParseError> MetadataParser::ParseValue(json j) const {
    if (!j.is_object()) {
        return std::unexpected(ParseError::Make(ParseErrorKind::BadMetadata, "JSON root must be an object"));
    }

    PackageDescriptor d;

    auto spec = ParseSpecVersion(j);
    if (!spec)
        return std::unexpected(spec.error());
    d.spec_version = *spec;
    if (VersionComparator::Compare(d.spec_version, kSupportedSpecVersion) > 0) {
        return std::unexpected(ParseError::Make(
            ParseErrorKind::UnsupportedFormat,
            "requires spec " + d.spec_version + ", this client supports " + kSupportedSpecVersion));
    }

    auto identifier = RequiredString(j, "identifier");
    if (!identifier)
        return std::unexpected(identifier.error());
    static const std::regex kIdentifierRe(R"(^[A-Za-z0-9][A-Za-z0-9-]+$)");
    if (!std::regex_match(*identifier, kIdentifierRe)) {
        return std::unexpected(FieldError(
            "identifier",
            ParseError::Make(ParseErrorKind::BadMetadata, "invalid identifier '" + *identifier + "'")));
    }
    d.identifier = std::move(*identifier);

    auto version = RequiredString(j, "version");
    if (!version)
        return std::unexpected(version.error());
    if (version->empty()) {
        return std::unexpected(FieldError(
            "version", ParseError::Make(ParseErrorKind::BadMetadata, "empty version")));
    }
    d.version = std::move(*version);

    auto kind = OptionalString(j, "kind");
    if (!kind)
        return std::unexpected(kind.error());
    if (!kind->empty())
        d.kind = std::move(*kind);
    if (d.kind != "package" && d.kind != "metapackage" && d.kind != "dlc") {
        return std::unexpected(
            ParseError::Make(ParseErrorKind::UnsupportedFormat, "unknown kind '" + d.kind + "'"));
    }

    auto name = RequiredString(j, "name");
    if (!name)
        return std::unexpected(name.error());
    d.name = std::move(*name);

    auto abstract = OptionalString(j, "abstract");
    if (!abstract)
        return std::unexpected(abstract.error());
    d.abstract = std::move(*abstract);

    auto license = ParseLicense(j);
    if (!license)
        return std::unexpected(license.error());
    d.license = std::move(*license);

    if (d.kind == "package") {
        auto download = ParseDownload(j);
        if (!download)
            return std::unexpected(download.error());
        d.download = std::move(*download);
    }

    d.depends = RelationNames(j, "depends");
    d.provides = RelationNames(j, "provides");
    d.raw = std::move(j);
    return d;
}

std::expected<DownloadCountTable, std::string> ParseDownloadCounts(const std::string& json_input) {
    json j;
    try {
        j = json::parse(json_input);
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    }
    return DownloadCountsFromJson(j);
}

std::expected<DownloadCountTable, std::string> DownloadCountsFromJson(const json& j) {
    if (!j.is_object()) {
        return std::unexpected("download counts root must be an object");
    }

    DownloadCountTable table;
    for (const auto& [key, val] : j.items()) {
        if (!val.is_number_integer()) {
            return std::unexpected("download count for '" + key + "' must be an integer");
        }
        const bool fits = val.is_number_unsigned()
                              ? val.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
                              : val.get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                                    val.get<std::int64_t>() <= std::numeric_limits<int>::max();
        if (!fits) {
            return std::unexpected("download count for '" + key + "' is out of range");
        }
        table.emplace(key, val.get<int>());
    }
    return table;
}

} // namespace reposync
