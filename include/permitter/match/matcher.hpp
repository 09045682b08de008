/*
 * Permitter Matcher
 * Copyright (c) 2025 Permitter contributors
 * MIT License.
 *
 * Prefix and exact matching of normalized commands against PermissionRules.
 * Matching is case-sensitive and byte-wise; a wildcard rule only matches on a
 * space boundary so Bash(npm test:*) never covers "npm testing".
 */
#pragma once
#include <string>
#include <vector>
#include "permitter/match/rule.hpp"

namespace permitter {

bool matches(const std::string& command, const PermissionRule& rule);

bool matches_any(const std::string& command, const std::vector<PermissionRule>& rules);

// First rule (in list order) that matches, for diagnostics.
const PermissionRule* first_match(const std::string& command, const std::vector<PermissionRule>& rules);

} // namespace permitter
