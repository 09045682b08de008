/*
 * Permitter Lexer Module
 *
 * Copyright (c) 2025 Permitter contributors
 *
 * Description:
 *   Lexical analysis for the permission engine. Converts a raw command string
 *   into a stream of Token objects handling quoting, escaping, chain operators
 *   (|, &&, ||, ;, &), redirections (>, >>, <, 2>, 2>&1, &>) and assignment
 *   detection (NAME=VALUE). Anything the engine refuses to look inside (command
 *   substitution, here-documents, process substitution, subshell groups) stops
 *   the lexer with a ParseError instead of producing tokens.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include <optional>
#include "permitter/core/errors.hpp"
#include "permitter/lex/tokens.hpp"

namespace permitter {

struct LexerOptions {
    bool enable_assign_detection = true; // treat NAME=VALUE as an Assign token
};

class Lexer {
public:
    Lexer(std::string input, LexerOptions opts = {});
    // Token stream terminated by Eof, or the first error found.
    Result<TokenStream> run();
private:
    std::optional<ParseError> scan_substitutions() const;
    Token next();
    char peek(std::size_t ahead = 0) const;
    char get();
    bool eof() const;
    void skip_blanks();
    Token lex_word();
    Token lex_operator();
    Token lex_redirection(std::size_t start);
    bool is_name_start(char c) const;
    bool is_name_char(char c) const;
    Token try_assign(const Token& word) const;
    Token fail(ParseErrorKind kind, std::string detail, std::size_t pos);

    std::string m_input;
    LexerOptions m_opts;
    std::size_t m_pos = 0; // current index
    std::optional<ParseError> m_error;
};

// Convenience wrapper: Lexer(raw).run().
Result<TokenStream> tokenize(const std::string& raw);

} // namespace permitter
