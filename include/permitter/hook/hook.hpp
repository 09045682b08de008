/*
 * Permitter PermissionRequest Hook
 *
 * Copyright (c) 2025 Permitter contributors
 *
 * Description:
 *   Glue between the host's PermissionRequest event and the decision engine.
 *   Reads the event JSON, loads the permission rules, asks the engine and
 *   renders exactly one decision line. The hook only ever answers "allow" or
 *   "ask"; anything unexpected (disabled, bad input, other tools) is "ask".
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
#include <ostream>
#include <string>
#include "permitter/decide/verdict.hpp"
#include "permitter/hook/config.hpp"

namespace permitter::hook {

enum class Behavior { Allow, Ask };

const char* to_string(Behavior b);

// {"hookSpecificOutput":{"hookEventName":"PermissionRequest","decision":{"behavior":"..."}}}
std::string decision_json(Behavior b);

struct HookRequest {
    std::string tool_name;
    std::string command;
};

// nullopt when the input is not a JSON object. tool is accepted for tool_name.
std::optional<HookRequest> parse_request(const std::string& input);

struct HookEnv {
    std::string cwd;
    std::string home;
};

struct HookOutcome {
    Behavior behavior = Behavior::Ask;
    std::optional<Verdict> verdict; // set only when the engine ran
    int exit_code = 0;
    std::string output;             // decision line, newline included
};

// One full hook invocation. log receives the debug trace when cfg.debug is set.
HookOutcome run_hook(const std::string& input, const HookConfig& cfg, const HookEnv& env, std::ostream& log);

} // namespace permitter::hook
