/*
 * Permitter Permission Rules
 *
 * Copyright (c) 2025 Permitter contributors
 *
 * Description:
 *   PermissionRule is one parsed allow or deny entry of the form
 *   Bash(<pattern>:*) (prefix match) or Bash(<pattern>) (exact match).
 *   PermissionSet is the read-only allow/deny snapshot handed to one decision.
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
#include <vector>

namespace permitter {

struct PermissionRule {
    std::string tool_prefix = "Bash";
    std::string pattern;
    bool wildcard = false;   // written as Bash(pattern:*)
    std::string source;      // literal as configured, for diagnostics
};

struct PermissionSet {
    std::vector<PermissionRule> allow;
    std::vector<PermissionRule> deny;
};

// nullopt for anything that is not Bash(<non-empty pattern>) or Bash(<non-empty pattern>:*).
std::optional<PermissionRule> parse_rule(const std::string& literal);

// Parses every literal, silently skipping the ones parse_rule rejects.
std::vector<PermissionRule> parse_rules(const std::vector<std::string>& literals);

PermissionSet make_permission_set(const std::vector<std::string>& allow, const std::vector<std::string>& deny);

} // namespace permitter
