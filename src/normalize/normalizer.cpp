/*
 * Permitter Normalizer Implementation
 * Copyright (c) 2025 Permitter contributors
 * Description: Strips assignments, statements, wrappers, background markers
 *              and redirections from each segment and opens one level of
 *              bash -c. See header for details.
 */
#include <permitter/normalize/normalizer.hpp>
#include <permitter/normalize/keywords.hpp>
#include <permitter/lex/lexer.hpp>
#include <permitter/parse/segmenter.hpp>
#include <cctype>
#include <optional>

namespace permitter {

namespace {

bool starts_with(const std::string& s, const char* prefix) { return s.rfind(prefix, 0) == 0; }

bool is_integer(const std::string& s, bool allow_sign) {
    std::size_t i = 0;
    if (allow_sign && !s.empty() && (s[0] == '-' || s[0] == '+')) i = 1;
    if (i >= s.size()) return false;
    for (; i < s.size(); ++i) if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    return true;
}

ParseError malformed(Wrapper w, const std::string& why, std::size_t pos) {
    return ParseError{ParseErrorKind::MalformedWrapper, std::string(to_string(w)) + ": " + why, pos};
}

class SegmentNormalizer {
public:
    SegmentNormalizer(const Segment& seg, int depth, TraceObserver* trace, std::size_t index)
        : m_toks(seg.tokens), m_end(seg.tokens.size()), m_depth(depth), m_trace(trace), m_index(index) {}

    Result<CommandList> run() {
        if (auto err = strip_tail()) return *err;
        auto front = strip_front();
        if (is_error(front)) return get_error(front);
        if (get_value(front) || m_begin == m_end) {
            if (m_redirected)
                return ParseError{ParseErrorKind::AmbiguousSegment, "redirection with no command", pos_at(0)};
            return CommandList{};
        }

        for (std::size_t k = m_begin; k < m_end; ++k) {
            const Token& t = m_toks[k];
            if (!is_word(t.kind))
                return ParseError{ParseErrorKind::AmbiguousSegment, "`" + t.lexeme + "` inside a command", t.pos};
        }
        const Token& head = m_toks[m_begin];
        if (is_compound_keyword(head))
            return ParseError{ParseErrorKind::UnsupportedConstruct, "compound command `" + head.lexeme + "`", head.pos};

        if (is_inline_script()) {
            if (m_depth > 0) {
                step(NormalizeStep::UnwrapSubshell);
                auto inner = normalize_command(m_toks[m_begin + 2].value, m_depth - 1, m_trace);
                if (is_error(inner)) {
                    ParseError e = get_error(inner);
                    e.detail = "inside " + head.value + " -c: " + e.detail;
                    return e;
                }
                return inner;
            }
            step(NormalizeStep::KeepSubshell);
        }

        CommandList out{join_range()};
        step(NormalizeStep::Emit);
        return out;
    }

private:
    std::string join_range() const {
        return join_tokens(std::vector<Token>(m_toks.begin() + m_begin, m_toks.begin() + m_end));
    }

    void step(NormalizeStep s) {
        if (m_trace) m_trace->on_step(m_index, s, join_range(), m_depth);
    }

    std::size_t pos_at(std::size_t i) const {
        if (i < m_toks.size()) return m_toks[i].pos;
        return m_toks.empty() ? 0 : m_toks.back().pos + m_toks.back().lexeme.size();
    }

    const Token* word_at(std::size_t i) const {
        return (i < m_end && is_word(m_toks[i].kind)) ? &m_toks[i] : nullptr;
    }

    // bash -c "<script>" / sh -c '<script>' and nothing else
    bool is_inline_script() const {
        if (m_end - m_begin != 3) return false;
        const Token& flag = m_toks[m_begin + 1];
        const Token& script = m_toks[m_begin + 2];
        return is_subshell_interpreter(m_toks[m_begin]) && flag.kind == TokenKind::Word && flag.value == "-c"
            && is_word(script.kind) && script.quoted;
    }

    std::optional<ParseError> strip_tail() {
        bool background = false;
        while (m_end > m_begin && m_toks[m_end - 1].kind == TokenKind::Background) { --m_end; background = true; }
        if (background) step(NormalizeStep::StripBackground);

        while (m_end > m_begin) {
            const Token& last = m_toks[m_end - 1];
            if (last.kind == TokenKind::RedirDup) { --m_end; m_redirected = true; continue; }
            if (redirection_takes_target(last.kind))
                return ParseError{ParseErrorKind::AmbiguousSegment, "redirection `" + last.lexeme + "` without a target", last.pos};
            if (m_end - m_begin >= 2 && is_word(last.kind) && redirection_takes_target(m_toks[m_end - 2].kind)) {
                m_end -= 2; m_redirected = true; continue;
            }
            break;
        }
        if (m_redirected) step(NormalizeStep::StripRedirections);
        return std::nullopt;
    }

    // true when the segment is a statement that runs nothing
    Result<bool> strip_front() {
        bool wrapped = false;
        while (true) {
            std::size_t before = m_begin;
            while (m_begin < m_end && m_toks[m_begin].kind == TokenKind::Assign) ++m_begin;
            if (m_begin != before) step(NormalizeStep::StripAssignments);
            if (m_begin == m_end) return true;

            const Token& head = m_toks[m_begin];
            // after a wrapper the name is run as a program
            std::optional<StatementBuiltin> st;
            if (!wrapped) st = statement_for(head);
            if (st) {
                if (*st != StatementBuiltin::Export) {
                    m_begin = m_end; step(NormalizeStep::SkipStatement); return true;
                }
                std::size_t j = m_begin + 1;
                while (j < m_end && m_toks[j].kind == TokenKind::Assign) ++j;
                if (j == m_end) { m_begin = m_end; step(NormalizeStep::SkipStatement); return true; }
                m_begin = j; step(NormalizeStep::StripExport);
                continue;
            }
            if (auto w = wrapper_for(head)) {
                auto next = skip_wrapper(*w, m_begin + 1);
                if (is_error(next)) return get_error(next);
                m_begin = get_value(next); step(NormalizeStep::StripWrapper);
                wrapped = true;
                continue;
            }
            return false;
        }
    }

    // Index of the wrapped command word, i points just past the wrapper name.
    Result<std::size_t> skip_wrapper(Wrapper w, std::size_t i) const {
        switch (w) {
            case Wrapper::Timeout: {
                while (const Token* t = word_at(i)) {
                    const std::string& v = t->value;
                    if (v == "--") { ++i; break; }
                    if (v.size() < 2 || v[0] != '-') break;
                    if (v == "--preserve-status" || v == "--foreground" || v == "-v" || v == "--verbose") { ++i; continue; }
                    if (v == "-s" || v == "-k" || v == "--signal" || v == "--kill-after") {
                        if (!word_at(i + 1)) return malformed(w, "option " + v + " needs an argument", t->pos);
                        i += 2; continue;
                    }
                    if (starts_with(v, "--signal=") || starts_with(v, "--kill-after=") ||
                        (v.size() > 2 && (v[1] == 's' || v[1] == 'k'))) { ++i; continue; }
                    return malformed(w, "unknown option " + v, t->pos);
                }
                const Token* d = word_at(i);
                if (!d || !is_duration(d->value)) return malformed(w, "missing duration", pos_at(i));
                ++i;
                break;
            }
            case Wrapper::Time: {
                while (const Token* t = word_at(i)) {
                    if (t->value == "-p") { ++i; continue; }
                    if (t->value == "--") { ++i; break; }
                    if (t->value.size() > 1 && t->value[0] == '-') return malformed(w, "unknown option " + t->value, t->pos);
                    break;
                }
                break;
            }
            case Wrapper::Nice: {
                while (const Token* t = word_at(i)) {
                    const std::string& v = t->value;
                    if (v == "--") { ++i; break; }
                    if (v.size() < 2 || v[0] != '-') break;
                    if (v == "-n" || v == "--adjustment") {
                        const Token* a = word_at(i + 1);
                        if (!a || !is_integer(a->value, true)) return malformed(w, "option " + v + " needs a number", t->pos);
                        i += 2; continue;
                    }
                    if (starts_with(v, "--adjustment=") && is_integer(v.substr(13), true)) { ++i; continue; }
                    if (starts_with(v, "-n") && is_integer(v.substr(2), true)) { ++i; continue; }
                    if (is_integer(v.substr(1), true)) { ++i; continue; } // nice -10
                    return malformed(w, "unknown option " + v, t->pos);
                }
                break;
            }
            case Wrapper::Nohup: {
                if (const Token* t = word_at(i)) {
                    if (t->value == "--") ++i;
                    else if (t->value.size() > 1 && t->value[0] == '-') return malformed(w, "unknown option " + t->value, t->pos);
                }
                break;
            }
            case Wrapper::Env: {
                bool options_done = false;
                while (const Token* t = word_at(i)) {
                    const std::string& v = t->value;
                    if (t->kind == TokenKind::Assign) { options_done = true; ++i; continue; }
                    if (options_done || v.size() < 1 || v[0] != '-') break;
                    if (v == "--") { options_done = true; ++i; continue; }
                    if (v == "-" || v == "-i" || v == "--ignore-environment") { ++i; continue; }
                    if (v == "-u" || v == "--unset") {
                        if (!word_at(i + 1)) return malformed(w, "option " + v + " needs a name", t->pos);
                        i += 2; continue;
                    }
                    if (starts_with(v, "--unset=") || (v.size() > 2 && starts_with(v, "-u"))) { ++i; continue; }
                    return malformed(w, "unknown option " + v, t->pos);
                }
                break;
            }
        }
        if (!word_at(i)) return malformed(w, "no command to run", pos_at(i));
        return i;
    }

    const std::vector<Token>& m_toks;
    std::size_t m_begin = 0;
    std::size_t m_end;
    int m_depth;
    TraceObserver* m_trace;
    std::size_t m_index;
    bool m_redirected = false;
};

} // namespace

bool is_duration(const std::string& word) {
    std::size_t i = 0, digits = 0;
    while (i < word.size() && std::isdigit(static_cast<unsigned char>(word[i]))) { ++i; ++digits; }
    if (i < word.size() && word[i] == '.') {
        ++i;
        while (i < word.size() && std::isdigit(static_cast<unsigned char>(word[i]))) { ++i; ++digits; }
    }
    if (digits == 0) return false;
    if (i < word.size() && (word[i] == 's' || word[i] == 'm' || word[i] == 'h' || word[i] == 'd')) ++i;
    return i == word.size();
}

Result<CommandList> normalize_segment(const Segment& seg, int depth, TraceObserver* trace, std::size_t index) {
    SegmentNormalizer n(seg, depth, trace, index);
    return n.run();
}

Result<CommandList> normalize_command(const std::string& raw, int depth, TraceObserver* trace) {
    if (trace) trace->on_input(raw, depth);
    auto tokens = tokenize(raw);
    if (is_error(tokens)) return get_error(tokens);
    if (trace) trace->on_tokens(get_value(tokens), depth);

    auto segments = segment_tokens(get_value(tokens));
    if (trace) trace->on_segments(segments, depth);

    CommandList out;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        auto cmds = normalize_segment(segments[i], depth, trace, i);
        if (is_error(cmds)) return get_error(cmds);
        for (auto& c : get_value(cmds)) out.push_back(std::move(c));
    }
    return out;
}

} // namespace permitter
