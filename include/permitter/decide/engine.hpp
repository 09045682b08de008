/*
 * Permitter Decision Engine
 *
 * Copyright (c) 2025 Permitter contributors
 *
 * Description:
 *   Turns one raw command string and a PermissionSet into a Verdict.
 *   The string is tokenized, segmented and normalized; any ParseError defers.
 *   Deny rules are then checked over every normalized command before any
 *   allow rule is consulted, and Allow requires every command to match an
 *   allow rule. Deny never produces a hard block, only a Defer.
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
#include <utility>
#include "permitter/decide/verdict.hpp"
#include "permitter/match/rule.hpp"
#include "permitter/normalize/normalizer.hpp"
#include "permitter/trace/trace.hpp"

namespace permitter {

class Engine {
public:
    explicit Engine(PermissionSet permissions, TraceObserver* trace = nullptr)
        : m_perms(std::move(permissions)), m_trace(trace) {}

    Verdict decide(const std::string& raw) const;

    // Normalized commands of raw, at the full subshell depth.
    Result<CommandList> commands(const std::string& raw) const;

    const PermissionSet& permissions() const { return m_perms; }

private:
    Verdict judge(const CommandList& cmds, const PermissionRule** rule) const;
    PermissionSet m_perms;
    TraceObserver* m_trace;
};

// One-shot form of Engine::decide.
Verdict decide(const std::string& raw, const PermissionSet& permissions, TraceObserver* trace = nullptr);

} // namespace permitter
