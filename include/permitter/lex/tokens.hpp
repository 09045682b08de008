/*
 * Permitter Token Definitions
 *
 * Copyright (c) 2025 Permitter contributors
 *
 * Description:
 *   Defines token kinds and the Token structure produced by the lexer. The kind
 *   enumeration is closed: every chain operator and every redirection form the
 *   engine understands has its own kind, so the strippable-construct policy is
 *   decided by exhaustive switches instead of string comparisons.
 *
 * License (MIT): (see full text in lexer.hpp header or duplicate below)
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
#include <cstddef>
#include <vector>

namespace permitter {

enum class TokenKind {
    Word,
    Assign,          // NAME=VALUE or NAME+=VALUE with an unquoted name
    AndIf,           // &&
    OrIf,            // ||
    Pipe,            // | and |&
    Semi,            // ;
    Newline,         // unquoted line break, sequences like ';'
    Background,      // &
    RedirOut,        // [N]>
    RedirOutAppend,  // [N]>>
    RedirClobber,    // [N]>|
    RedirIn,         // [N]<
    RedirInOut,      // [N]<>
    RedirAll,        // &> and >&word
    RedirAllAppend,  // &>>
    RedirDup,        // [N]>&M, [N]<&M, [N]>&-  (self-contained, no target)
    Eof
};

struct Token {
    TokenKind kind;
    std::string lexeme;      // raw source text, quotes and escapes included
    std::size_t pos;
    std::string value;       // lexeme with quoting removed (words only)
    bool quoted = false;     // any quote or escape appeared in the word
};

using TokenStream = std::vector<Token>;

bool is_word(TokenKind kind);
bool is_chain_operator(TokenKind kind);
bool is_redirection(TokenKind kind);
// Every redirection except a descriptor duplication consumes the next word.
bool redirection_takes_target(TokenKind kind);

const char* to_string(TokenKind kind);

} // namespace permitter
