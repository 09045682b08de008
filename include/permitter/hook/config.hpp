/*
 * Permitter Hook Configuration
 * Copyright (c) 2025 Permitter contributors
 * MIT License.
 *
 * key=value lines from ~/.permitterrc, then PERMITTER_* environment
 * variables on top. The feature is off unless explicitly enabled.
 */
#pragma once
#include <functional>
#include <istream>
#include <optional>
#include <string>

namespace permitter::hook {

struct HookConfig {
    bool enabled = false;
    bool debug = false;  // trace to stderr
    bool strict = true;  // exit 1 on a parse-error Defer
};

// Environment lookup; std::getenv in production, a map in tests.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup process_env();

// Applies every recognised key of an rc stream to cfg. Unknown keys and
// lines without '=' are ignored.
void read_rc(std::istream& in, HookConfig& cfg);

// Defaults, then <home>/.permitterrc, then the environment.
HookConfig load_config(const std::string& home, const EnvLookup& env);

} // namespace permitter::hook
