/*
 * Permitter Parse Errors
 *
 * Copyright (c) 2025 Permitter contributors
 *
 * Description:
 *   Defines the ParseError taxonomy shared by the tokenizer, segmenter and
 *   normalizer, plus the Result<T> alias used to return either a value or the
 *   error that stopped the pipeline. Every ParseError is fatal for the current
 *   decision and always maps to a deferred verdict.
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
#include <cstddef>
#include <string>
#include <variant>

namespace permitter {

enum class ParseErrorKind {
    UnterminatedQuote,
    UnsupportedSubstitution,
    MalformedWrapper,
    AmbiguousSegment,
    UnsupportedConstruct
};

struct ParseError {
    ParseErrorKind kind;
    std::string detail;
    std::size_t pos = 0; // byte offset in the string being parsed
};

const char* to_string(ParseErrorKind kind);

// "UnsupportedSubstitution: `$(` at 5"
std::string describe(const ParseError& err);

// Either a value or the ParseError that stopped the pipeline.
template <typename T>
using Result = std::variant<T, ParseError>;

template <typename T>
bool is_error(const Result<T>& r) { return std::holds_alternative<ParseError>(r); }

template <typename T>
const ParseError& get_error(const Result<T>& r) { return std::get<ParseError>(r); }

template <typename T>
const T& get_value(const Result<T>& r) { return std::get<T>(r); }

template <typename T>
T& get_value(Result<T>& r) { return std::get<T>(r); }

} // namespace permitter
