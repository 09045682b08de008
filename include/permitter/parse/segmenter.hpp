/*
 * Permitter Segmenter Interface
 *
 * Copyright (c) 2025 Permitter contributors
 *
 * Description:
 *   Declares the segment_tokens entry point which splits a TokenStream at
 *   top-level &&, ||, ;, newline, | and mid-stream & into ordered Segments.
 *   A & that ends the stream is kept inside the last segment as a background
 *   marker. Implementation resides in segmenter.cpp.
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
#include <vector>
#include "permitter/lex/tokens.hpp"
#include "permitter/parse/segment.hpp"

namespace permitter {

// Empty segments (leading, trailing or doubled operators) are dropped.
std::vector<Segment> segment_tokens(const TokenStream& ts);

} // namespace permitter
