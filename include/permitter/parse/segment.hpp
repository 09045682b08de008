/*
 * Permitter Segment Definitions
 *
 * Copyright (c) 2025 Permitter contributors
 *
 * Description:
 *   A Segment is the token run of one simple command, bounded by top-level
 *   chain or pipe operators. Segments keep source order and remember the
 *   operator that followed them; the decision itself treats them as a set of
 *   obligations that must all be satisfied.
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
#include "permitter/lex/tokens.hpp"

namespace permitter {

enum class ChainOp {
    None,       // last segment
    And,        // &&
    Or,         // ||
    Seq,        // ; or newline
    Pipe,       // | or |&
    Background  // & between two commands
};

struct Segment {
    std::vector<Token> tokens;
    ChainOp next = ChainOp::None;
};

const char* to_string(ChainOp op);

// Raw source text of the tokens joined by single spaces.
std::string join_tokens(const std::vector<Token>& tokens);

} // namespace permitter
