/*
 * Permitter Parse Errors Implementation
 * Copyright (c) 2025 Permitter contributors
 * Description: See header for overview.
 */
#include <permitter/core/errors.hpp>

namespace permitter {

const char* to_string(ParseErrorKind kind) {
    switch (kind) {
        case ParseErrorKind::UnterminatedQuote: return "UnterminatedQuote";
        case ParseErrorKind::UnsupportedSubstitution: return "UnsupportedSubstitution";
        case ParseErrorKind::MalformedWrapper: return "MalformedWrapper";
        case ParseErrorKind::AmbiguousSegment: return "AmbiguousSegment";
        case ParseErrorKind::UnsupportedConstruct: return "UnsupportedConstruct";
    }
    return "Unknown";
}

std::string describe(const ParseError& err) {
    std::string out = to_string(err.kind);
    if (!err.detail.empty()) out += ": " + err.detail;
    out += " at " + std::to_string(err.pos);
    return out;
}

} // namespace permitter
