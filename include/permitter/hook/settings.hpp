/*
 * Permitter Settings Loader
 * Copyright (c) 2025 Permitter contributors
 * MIT License.
 *
 * Collects permissions.allow / permissions.deny from the project-local,
 * project and user settings files. Lists are merged as a union in file
 * order with duplicates kept; unreadable or malformed files are skipped.
 */
#pragma once
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "permitter/match/rule.hpp"

namespace permitter::hook {

struct RuleLiterals {
    std::vector<std::string> allow;
    std::vector<std::string> deny;
};

// <cwd>/.claude/settings.local.json, <cwd>/.claude/settings.json, <home>/.claude/settings.json
std::vector<std::string> settings_files(const std::string& cwd, const std::string& home);

// nullopt if the file is missing, empty or not a JSON object.
std::optional<RuleLiterals> load_settings_file(const std::string& path);

RuleLiterals load_rule_literals(const std::vector<std::string>& files, std::ostream* log = nullptr);

// Merged literals parsed into rules; non-Bash and malformed literals are dropped.
PermissionSet load_permission_set(const std::string& cwd, const std::string& home, std::ostream* log = nullptr);

} // namespace permitter::hook
