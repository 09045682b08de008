/*
 * Permitter Decision Trace
 *
 * Copyright (c) 2025 Permitter contributors
 *
 * Description:
 *   Optional observer for debugging a decision. The pipeline reports the
 *   tokens, the segments, every normalization step applied per segment, the
 *   final command list and the verdict. Observers only watch: nothing they do
 *   can change the verdict. StreamTrace prints the tagged [PERMITTER] lines used
 *   by the hook's debug mode.
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
#include <ostream>
#include <string>
#include <utility>
#include <vector>
#include "permitter/core/errors.hpp"
#include "permitter/decide/verdict.hpp"
#include "permitter/lex/tokens.hpp"
#include "permitter/match/rule.hpp"
#include "permitter/parse/segment.hpp"

namespace permitter {

enum class NormalizeStep {
    StripAssignments,
    StripExport,
    SkipStatement,     // export/set/unset/... with nothing to run
    StripWrapper,
    StripBackground,
    StripRedirections,
    UnwrapSubshell,
    KeepSubshell,      // bash -c left literal at the depth cap
    Emit
};

const char* to_string(NormalizeStep step);

class TraceObserver {
public:
    virtual ~TraceObserver() = default;
    // depth is the remaining subshell depth of the (sub-)invocation being parsed
    virtual void on_input(const std::string& raw, int depth) = 0;
    virtual void on_tokens(const TokenStream& ts, int depth) = 0;
    virtual void on_segments(const std::vector<Segment>& segments, int depth) = 0;
    virtual void on_step(std::size_t segment, NormalizeStep step, const std::string& remaining, int depth) = 0;
    virtual void on_error(const ParseError& err) = 0;
    virtual void on_commands(const std::vector<std::string>& commands) = 0;
    // rule is the rule that settled the verdict: the deny rule for Denied, the
    // allow rule of the last command for Allow, nullptr otherwise
    virtual void on_verdict(const Verdict& v, const PermissionRule* rule) = 0;
};

// Writes one "[PERMITTER] ..." line per event.
class StreamTrace : public TraceObserver {
public:
    explicit StreamTrace(std::ostream& out, std::string tag = "[PERMITTER]") : m_out(out), m_tag(std::move(tag)) {}
    void on_input(const std::string& raw, int depth) override;
    void on_tokens(const TokenStream& ts, int depth) override;
    void on_segments(const std::vector<Segment>& segments, int depth) override;
    void on_step(std::size_t segment, NormalizeStep step, const std::string& remaining, int depth) override;
    void on_error(const ParseError& err) override;
    void on_commands(const std::vector<std::string>& commands) override;
    void on_verdict(const Verdict& v, const PermissionRule* rule) override;
    // Free-form message with the same tag.
    void note(const std::string& message);
private:
    std::ostream& line();
    std::ostream& m_out;
    std::string m_tag;
};

} // namespace permitter
