/*
 * Permitter Verdict
 *
 * Copyright (c) 2025 Permitter contributors
 *
 * Description:
 *   The single output of one decision: Allow, or Defer with the reason that
 *   stopped the allow path. Reasons exist for diagnostics only; every Defer
 *   leads to the same outcome (the normal approval flow).
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
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include "permitter/core/errors.hpp"

namespace permitter {

struct NoMatch {
    std::string command;
};

struct Denied {
    std::string command;
    std::string rule; // rule literal, e.g. Bash(rm -rf:*)
};

struct ParseFailure {
    ParseError error;
};

using DeferReason = std::variant<NoMatch, Denied, ParseFailure>;

struct Verdict {
    std::optional<DeferReason> defer; // empty means Allow

    bool allowed() const { return !defer.has_value(); }

    static Verdict allow() { return Verdict{}; }
    static Verdict no_match(std::string command) { return Verdict{DeferReason{NoMatch{std::move(command)}}}; }
    static Verdict denied(std::string command, std::string rule) {
        return Verdict{DeferReason{Denied{std::move(command), std::move(rule)}}};
    }
    static Verdict parse_error(ParseError err) { return Verdict{DeferReason{ParseFailure{std::move(err)}}}; }
};

// "Allow", "Defer(NoMatch: git commit -m 'msg')", ...
std::string describe(const Verdict& v);

} // namespace permitter
