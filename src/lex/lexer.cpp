/*
 * Permitter Lexer Implementation
 * Copyright (c) 2025 Permitter contributors
 * Description: Converts a raw command into a TokenStream (operators, words,
 *              assignments, redirections) or the first ParseError found.
 *              See header for details.
 */
#include <cctype>
#include <utility>
#include <permitter/lex/lexer.hpp>

namespace permitter {

static bool is_blank(char c) { return c == ' ' || c == '\t'; }
static bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }
static bool is_operator_char(char c) {
    return c == '|' || c == '&' || c == ';' || c == '<' || c == '>' || c == '(' || c == ')';
}

Lexer::Lexer(std::string input, LexerOptions opts) : m_input(std::move(input)), m_opts(opts) {}

char Lexer::peek(std::size_t ahead) const {
    return m_pos + ahead < m_input.size() ? m_input[m_pos + ahead] : '\0';
}
char Lexer::get() { return eof() ? '\0' : m_input[m_pos++]; }
bool Lexer::eof() const { return m_pos >= m_input.size(); }

void Lexer::skip_blanks() {
    while (!eof()) {
        if (is_blank(peek())) { get(); continue; }
        if (peek() == '\\' && peek(1) == '\n') { m_pos += 2; continue; } // line continuation
        break;
    }
}

bool Lexer::is_name_start(char c) const { return std::isalpha(static_cast<unsigned char>(c)) || c == '_'; }
bool Lexer::is_name_char(char c) const { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

Token Lexer::fail(ParseErrorKind kind, std::string detail, std::size_t pos) {
    if (!m_error) m_error = ParseError{kind, std::move(detail), pos};
    return {TokenKind::Eof, "", pos};
}

// Substitutions are refused wherever they appear, quoted or not: their output
// becomes part of the command and cannot be checked.
std::optional<ParseError> Lexer::scan_substitutions() const {
    for (std::size_t i = 0; i < m_input.size(); ++i) {
        char c = m_input[i];
        if (c == '`') return ParseError{ParseErrorKind::UnsupportedSubstitution, "backtick substitution", i};
        if (c == '$' && i + 1 < m_input.size() && m_input[i + 1] == '(')
            return ParseError{ParseErrorKind::UnsupportedSubstitution, "`$(` substitution", i};
    }
    return std::nullopt;
}

Token Lexer::lex_redirection(std::size_t start) {
    while (is_digit(peek())) get();
    bool has_fd = m_pos > start;
    char op = get();
    TokenKind kind;
    if (op == '<') {
        if (peek() == '<') return fail(ParseErrorKind::UnsupportedConstruct, peek(1) == '<' ? "here-string `<<<`" : "here-document `<<`", start);
        if (peek() == '(') return fail(ParseErrorKind::UnsupportedConstruct, "process substitution `<(`", start);
        if (peek() == '>') { get(); kind = TokenKind::RedirInOut; }
        else if (peek() == '&') {
            get();
            if (peek() == '-') get();
            else if (is_digit(peek())) { while (is_digit(peek())) get(); }
            else return fail(ParseErrorKind::AmbiguousSegment, "`<&` without a descriptor", start);
            kind = TokenKind::RedirDup;
        } else kind = TokenKind::RedirIn;
    } else {
        if (peek() == '(') return fail(ParseErrorKind::UnsupportedConstruct, "process substitution `>(`", start);
        if (peek() == '>') { get(); kind = TokenKind::RedirOutAppend; }
        else if (peek() == '|') { get(); kind = TokenKind::RedirClobber; }
        else if (peek() == '&') {
            get();
            if (peek() == '-') { get(); kind = TokenKind::RedirDup; }
            else if (is_digit(peek())) { while (is_digit(peek())) get(); kind = TokenKind::RedirDup; }
            else if (has_fd) return fail(ParseErrorKind::AmbiguousSegment, "`N>&` without a descriptor", start);
            else kind = TokenKind::RedirAll; // >&word is &>word
        } else kind = TokenKind::RedirOut;
    }
    // 2>&1x is an ambiguous redirect in bash, not a dup followed by a word
    if (kind == TokenKind::RedirDup && !eof() && !is_blank(peek()) && peek() != '\n' && !is_operator_char(peek()))
        return fail(ParseErrorKind::AmbiguousSegment, "descriptor duplication followed by text", start);
    return {kind, m_input.substr(start, m_pos - start), start};
}

Token Lexer::lex_operator() {
    std::size_t start = m_pos;
    char c = get();
    switch (c) {
        case '|':
            if (peek() == '|') { get(); return {TokenKind::OrIf, "||", start}; }
            if (peek() == '&') { get(); return {TokenKind::Pipe, "|&", start}; }
            return {TokenKind::Pipe, "|", start};
        case '&':
            if (peek() == '&') { get(); return {TokenKind::AndIf, "&&", start}; }
            if (peek() == '>') {
                get();
                if (peek() == '>') { get(); return {TokenKind::RedirAllAppend, "&>>", start}; }
                return {TokenKind::RedirAll, "&>", start};
            }
            return {TokenKind::Background, "&", start};
        case ';':
            if (peek() == ';') return fail(ParseErrorKind::UnsupportedConstruct, "case terminator `;;`", start);
            return {TokenKind::Semi, ";", start};
        case '(':
        case ')':
            return fail(ParseErrorKind::UnsupportedConstruct, std::string("subshell group `") + c + "`", start);
        case '<':
        case '>':
            m_pos = start; return lex_redirection(start);
        default:
            m_pos = start; return lex_word();
    }
}

Token Lexer::lex_word() {
    std::size_t start = m_pos; std::string out; bool quoted = false;
    while (!eof()) {
        char c = peek();
        if (is_blank(c) || c == '\n' || is_operator_char(c)) break;
        if (c == '\'') {
            std::size_t qstart = m_pos; quoted = true; get();
            while (true) {
                if (eof()) return fail(ParseErrorKind::UnterminatedQuote, "unterminated single quote", qstart);
                char d = get();
                if (d == '\'') break;
                out.push_back(d);
            }
            continue;
        }
        if (c == '"') {
            std::size_t qstart = m_pos; quoted = true; get();
            while (true) {
                if (eof()) return fail(ParseErrorKind::UnterminatedQuote, "unterminated double quote", qstart);
                char d = get();
                if (d == '"') break;
                if (d == '\\' && !eof()) {
                    char n = peek();
                    if (n == '\n') { get(); continue; }
                    if (n == '"' || n == '\\' || n == '$' || n == '`') { out.push_back(n); get(); continue; }
                }
                out.push_back(d);
            }
            continue;
        }
        if (c == '\\') {
            std::size_t bstart = m_pos; quoted = true; get();
            if (eof()) return fail(ParseErrorKind::UnterminatedQuote, "trailing backslash", bstart);
            char n = get();
            if (n != '\n') out.push_back(n);
            continue;
        }
        out.push_back(get());
    }
    Token t{TokenKind::Word, m_input.substr(start, m_pos - start), start, out, quoted};
    if (m_opts.enable_assign_detection) t = try_assign(t);
    return t;
}

Token Lexer::try_assign(const Token& word) const {
    const auto& lex = word.lexeme; auto eq = lex.find('=');
    if (eq == std::string::npos || eq == 0) return word;
    std::size_t name_end = (lex[eq - 1] == '+') ? eq - 1 : eq;
    if (name_end == 0) return word;
    for (std::size_t i = 0; i < name_end; ++i)
        if (!is_name_char(lex[i]) || (i == 0 && !is_name_start(lex[i]))) return word;
    Token assign = word; assign.kind = TokenKind::Assign; return assign;
}

Token Lexer::next() {
    skip_blanks(); if (eof()) return {TokenKind::Eof, "", m_pos};
    char c = peek();
    if (c == '\n') { std::size_t start = m_pos; get(); return {TokenKind::Newline, "\n", start}; }
    if (is_operator_char(c)) return lex_operator();
    if (is_digit(c)) {
        std::size_t j = m_pos;
        while (j < m_input.size() && is_digit(m_input[j])) ++j;
        if (j < m_input.size() && (m_input[j] == '<' || m_input[j] == '>')) return lex_redirection(m_pos);
    }
    return lex_word();
}

Result<TokenStream> Lexer::run() {
    if (auto err = scan_substitutions()) return *err;
    TokenStream ts;
    while (true) {
        Token t = next();
        if (m_error) return *m_error;
        ts.push_back(t);
        if (t.kind == TokenKind::Eof) break;
    }
    return ts;
}

Result<TokenStream> tokenize(const std::string& raw) {
    Lexer lx(raw);
    return lx.run();
}

} // namespace permitter
