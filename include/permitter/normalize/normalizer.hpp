/*
 * Permitter Normalizer
 *
 * Copyright (c) 2025 Permitter contributors
 *
 * Description:
 *   Reduces each segment to the command that actually runs: leading
 *   assignments, export statements, benign wrappers (timeout, time, nice,
 *   nohup, env), a trailing background marker and trailing redirections are
 *   removed, and one level of bash -c / sh -c is opened and parsed again.
 *   The remaining tokens are re-joined with their original quoting.
 *
 *   A segment yields zero commands (pure assignment or statement), one
 *   command, or the commands of an unwrapped subshell. Anything that cannot be
 *   reduced that way is a ParseError.
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
#include <vector>
#include "permitter/core/errors.hpp"
#include "permitter/parse/segment.hpp"
#include "permitter/trace/trace.hpp"

namespace permitter {

using NormalizedCommand = std::string;
using CommandList = std::vector<NormalizedCommand>;

// bash -c is opened at most this many times per decision.
constexpr int kMaxSubshellDepth = 1;

// depth is the number of bash -c levels that may still be opened.
Result<CommandList> normalize_segment(const Segment& seg, int depth = kMaxSubshellDepth,
                                      TraceObserver* trace = nullptr, std::size_t index = 0);

// tokenize -> segment -> normalize over a whole command string.
Result<CommandList> normalize_command(const std::string& raw, int depth = kMaxSubshellDepth,
                                      TraceObserver* trace = nullptr);

// True when the word is a timeout duration: digits, optional fraction, optional s/m/h/d.
bool is_duration(const std::string& word);

} // namespace permitter
