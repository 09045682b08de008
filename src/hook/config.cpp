/*
 * Permitter Hook Configuration Implementation
 * Copyright (c) 2025 Permitter contributors
 * MIT License.
 */
#include <permitter/hook/config.hpp>
#include <cstdlib>
#include <fstream>

namespace permitter::hook {

static std::string trim(const std::string& s) {
    size_t a = 0; while (a < s.size() && (s[a] == ' ' || s[a] == '\t' || s[a] == '\r')) ++a;
    size_t b = s.size(); while (b > a && (s[b-1] == ' ' || s[b-1] == '\t' || s[b-1] == '\r')) --b;
    return s.substr(a, b - a);
}

static bool truthy(const std::string& v) { return v == "1" || v == "true" || v == "on"; }

EnvLookup process_env() {
    return [](const std::string& key) -> std::optional<std::string> {
        const char* v = std::getenv(key.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

void read_rc(std::istream& in, HookConfig& cfg) {
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('='); if (eq == std::string::npos) continue;
        auto key = trim(line.substr(0, eq)); auto val = trim(line.substr(eq + 1));
        if (key == "enabled") cfg.enabled = truthy(val);
        else if (key == "debug") cfg.debug = truthy(val);
        else if (key == "strict") cfg.strict = truthy(val);
    }
}

HookConfig load_config(const std::string& home, const EnvLookup& env) {
    HookConfig cfg;
    if (!home.empty()) {
        std::ifstream in(home + "/.permitterrc");
        if (in) read_rc(in, cfg);
    }
    // environment: "1" is true, anything else false
    if (auto v = env("PERMITTER_ENABLED")) cfg.enabled = (*v == "1");
    if (auto v = env("PERMITTER_DEBUG")) cfg.debug = (*v == "1");
    if (auto v = env("PERMITTER_STRICT")) cfg.strict = (*v == "1");
    return cfg;
}

} // namespace permitter::hook
