/*
 * Permitter Decision Trace Implementation
 * Copyright (c) 2025 Permitter contributors
 * Description: Tagged line output for StreamTrace. See header for details.
 */
#include <permitter/trace/trace.hpp>

namespace permitter {

const char* to_string(NormalizeStep step) {
    switch (step) {
        case NormalizeStep::StripAssignments: return "strip-assignments";
        case NormalizeStep::StripExport: return "strip-export";
        case NormalizeStep::SkipStatement: return "skip-statement";
        case NormalizeStep::StripWrapper: return "strip-wrapper";
        case NormalizeStep::StripBackground: return "strip-background";
        case NormalizeStep::StripRedirections: return "strip-redirections";
        case NormalizeStep::UnwrapSubshell: return "unwrap-subshell";
        case NormalizeStep::KeepSubshell: return "keep-subshell";
        case NormalizeStep::Emit: return "emit";
    }
    return "unknown";
}

std::ostream& StreamTrace::line() { return m_out << m_tag << ' '; }

void StreamTrace::note(const std::string& message) { line() << message << '\n'; }

void StreamTrace::on_input(const std::string& raw, int depth) {
    line() << "input (depth " << depth << "): " << raw << '\n';
}

void StreamTrace::on_tokens(const TokenStream& ts, int depth) {
    auto& os = line(); os << "tokens (depth " << depth << "):";
    for (const auto& t : ts) {
        if (t.kind == TokenKind::Eof) continue;
        os << ' ' << to_string(t.kind) << '(' << (t.kind == TokenKind::Newline ? "\\n" : t.lexeme) << ')';
    }
    os << '\n';
}

void StreamTrace::on_segments(const std::vector<Segment>& segments, int depth) {
    for (std::size_t i = 0; i < segments.size(); ++i)
        line() << "segment " << i << " (depth " << depth << ") [" << to_string(segments[i].next) << "]: " << join_tokens(segments[i].tokens) << '\n';
}

void StreamTrace::on_step(std::size_t segment, NormalizeStep step, const std::string& remaining, int depth) {
    line() << "  segment " << segment << " (depth " << depth << ") " << to_string(step) << " -> " << (remaining.empty() ? "<nothing>" : remaining) << '\n';
}

void StreamTrace::on_error(const ParseError& err) { line() << "parse error: " << describe(err) << '\n'; }

void StreamTrace::on_commands(const std::vector<std::string>& commands) {
    auto& os = line(); os << "commands:";
    if (commands.empty()) os << " <none>";
    for (const auto& c : commands) os << " [" << c << ']';
    os << '\n';
}

void StreamTrace::on_verdict(const Verdict& v, const PermissionRule* rule) {
    auto& os = line(); os << "verdict: " << describe(v);
    if (rule) os << " (rule " << rule->source << ')';
    os << '\n';
}

} // namespace permitter
