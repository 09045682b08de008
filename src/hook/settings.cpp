/*
 * Permitter Settings Loader Implementation
 * Copyright (c) 2025 Permitter contributors
 * MIT License.
 */
#include <permitter/hook/settings.hpp>
#include <permitter/hook/json.hpp>
#include <fstream>
#include <sstream>

namespace permitter::hook {

static void append_strings(const JsonValue* list, std::vector<std::string>& out) {
    if (!list || !list->is_array()) return;
    for (const auto& item : list->array) {
        if (item.is_string()) out.push_back(item.string);
    }
}

std::vector<std::string> settings_files(const std::string& cwd, const std::string& home) {
    return {
        cwd + "/.claude/settings.local.json",
        cwd + "/.claude/settings.json",
        home + "/.claude/settings.json",
    };
}

std::optional<RuleLiterals> load_settings_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::stringstream buf; buf << in.rdbuf();
    auto doc = parse_json(buf.str());
    if (!doc || !doc->is_object()) return std::nullopt;

    RuleLiterals out;
    const JsonValue* perms = doc->get("permissions");
    if (perms && perms->is_object()) {
        append_strings(perms->get("allow"), out.allow);
        append_strings(perms->get("deny"), out.deny);
    }
    return out;
}

RuleLiterals load_rule_literals(const std::vector<std::string>& files, std::ostream* log) {
    RuleLiterals merged;
    for (const auto& f : files) {
        auto one = load_settings_file(f);
        if (!one) {
            if (log) *log << "[PERMITTER] settings skipped: " << f << '\n';
            continue;
        }
        if (log) *log << "[PERMITTER] settings " << f << ": " << one->allow.size() << " allow, " << one->deny.size() << " deny\n";
        merged.allow.insert(merged.allow.end(), one->allow.begin(), one->allow.end());
        merged.deny.insert(merged.deny.end(), one->deny.begin(), one->deny.end());
    }
    return merged;
}

PermissionSet load_permission_set(const std::string& cwd, const std::string& home, std::ostream* log) {
    RuleLiterals lits = load_rule_literals(settings_files(cwd, home), log);
    return make_permission_set(lits.allow, lits.deny);
}

} // namespace permitter::hook
