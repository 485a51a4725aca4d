#pragma once

#include <functional>
#include <memory>
#include <string>

namespace reposync {

enum class ParseErrorKind {
    Syntax,            // not valid JSON at all
    Conversion,        // a field could not be turned into its descriptor value
    FieldType,         // JSON value has the wrong type
    UnsupportedFormat, // written for a newer client (spec_version, kind)
    BadMetadata,       // structurally invalid but forward-compatible metadata
};

const char* ToString(ParseErrorKind kind);

// One link of a failure chain; `cause` points at the error this one wraps.
struct ParseError {
    ParseErrorKind kind = ParseErrorKind::Syntax;
    std::string message;
    std::shared_ptr<const ParseError> cause;

    static ParseError Make(ParseErrorKind kind, std::string message) {
        return ParseError{kind, std::move(message), nullptr};
    }

    static ParseError Wrap(ParseErrorKind kind, std::string message, ParseError inner) {
        return ParseError{kind, std::move(message), std::make_shared<const ParseError>(std::move(inner))};
    }
};

// First error in the chain (starting with `err` itself) matching `pred`, or nullptr.
const ParseError* FindCause(const ParseError& err, const std::function<bool(const ParseError&)>& pred);

const ParseError& InnermostCause(const ParseError& err);

// UnsupportedFormat and BadMetadata come from records meant for newer clients.
bool IsBenignKind(ParseErrorKind kind);

inline bool IsBenign(const ParseError& err) {
    return FindCause(err, [](const ParseError& e) { return IsBenignKind(e.kind); }) != nullptr;
}

} // namespace reposync
