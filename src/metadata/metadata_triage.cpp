#include "metadata/metadata_triage.hpp"

#include "util/logger.hpp"

namespace reposync {

Result MetadataTriage::Process(const std::string& raw,
                               const std::string& record_name,
                               std::optional<PackageDescriptor>& out) const {
    out.reset();

    auto parsed = parser_.Parse(raw);
    if (parsed) {
        out = std::move(*parsed);
        if (out) {
            LogDebug("Module parsed: %s", out->ToString().c_str());
        }
        return Result::Ok();
    }

    const ParseError& err = parsed.error();
    if (const ParseError* benign = FindCause(err, [](const ParseError& e) { return IsBenignKind(e.kind); })) {
        LogInfo("Skipping %s : %s", record_name.c_str(), benign->message.c_str());
        return Result::Ok();
    }

    const ParseError& leaf = InnermostCause(err);
    LogError("Error processing %s : %s", record_name.c_str(), leaf.message.c_str());
    return Result::Fail(kErrMetadata, "Error processing " + record_name + ": " + leaf.message);
}

} // namespace reposync
