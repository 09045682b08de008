/*
 * Permitter Matcher Implementation
 * Copyright (c) 2025 Permitter contributors
 * MIT License.
 */
#include <permitter/match/matcher.hpp>
#include <permitter/match/rule.hpp>

namespace permitter {

static const std::string kRulePrefix = "Bash(";
static const std::string kWildcardSuffix = ":*";

std::optional<PermissionRule> parse_rule(const std::string& literal) {
    if (literal.size() <= kRulePrefix.size() + 1) return std::nullopt;
    if (literal.compare(0, kRulePrefix.size(), kRulePrefix) != 0 || literal.back() != ')') return std::nullopt;
    std::string inner = literal.substr(kRulePrefix.size(), literal.size() - kRulePrefix.size() - 1);
    PermissionRule rule;
    rule.source = literal;
    if (inner.size() >= kWildcardSuffix.size() &&
        inner.compare(inner.size() - kWildcardSuffix.size(), kWildcardSuffix.size(), kWildcardSuffix) == 0) {
        rule.wildcard = true;
        inner.resize(inner.size() - kWildcardSuffix.size());
    }
    if (inner.empty()) return std::nullopt;
    rule.pattern = std::move(inner);
    return rule;
}

std::vector<PermissionRule> parse_rules(const std::vector<std::string>& literals) {
    std::vector<PermissionRule> out;
    for (const auto& l : literals) {
        if (auto r = parse_rule(l)) out.push_back(std::move(*r));
    }
    return out;
}

PermissionSet make_permission_set(const std::vector<std::string>& allow, const std::vector<std::string>& deny) {
    return PermissionSet{parse_rules(allow), parse_rules(deny)};
}

bool matches(const std::string& command, const PermissionRule& rule) {
    const std::string& p = rule.pattern;
    if (command == p) return true;
    if (!rule.wildcard || command.size() <= p.size()) return false;
    if (command.compare(0, p.size(), p) != 0) return false;
    return command[p.size()] == ' ';
}

bool matches_any(const std::string& command, const std::vector<PermissionRule>& rules) {
    return first_match(command, rules) != nullptr;
}

const PermissionRule* first_match(const std::string& command, const std::vector<PermissionRule>& rules) {
    for (const auto& r : rules) {
        if (matches(command, r)) return &r;
    }
    return nullptr;
}

} // namespace permitter
