#include "metadata/parse_error.hpp"

namespace reposync {

const char* ToString(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::Syntax:            return "syntax";
        case ParseErrorKind::Conversion:        return "conversion";
        case ParseErrorKind::FieldType:         return "field-type";
        case ParseErrorKind::UnsupportedFormat: return "unsupported-format";
        case ParseErrorKind::BadMetadata:       return "bad-metadata";
    }
    return "unknown";
}

const ParseError* FindCause(const ParseError& err, const std::function<bool(const ParseError&)>& pred) {
    for (const ParseError* cur = &err; cur != nullptr; cur = cur->cause.get()) {
        if (pred(*cur))
            return cur;
    }
    return nullptr;
}

const ParseError& InnermostCause(const ParseError& err) {
    const ParseError* cur = &err;
    while (cur->cause)
        cur = cur->cause.get();
    return *cur;
}

bool IsBenignKind(ParseErrorKind kind) {
    return kind == ParseErrorKind::UnsupportedFormat || kind == ParseErrorKind::BadMetadata;
}

} // namespace reposync
