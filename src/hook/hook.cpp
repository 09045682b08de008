/*
 * Permitter PermissionRequest Hook Implementation
 * Copyright (c) 2025 Permitter contributors
 * Description: See header for overview.
 */
#include <permitter/hook/hook.hpp>
#include <permitter/hook/json.hpp>
#include <permitter/hook/settings.hpp>
#include <permitter/decide/engine.hpp>
#include <permitter/trace/trace.hpp>
#include <memory>
#include <utility>

namespace permitter::hook {

const char* to_string(Behavior b) { return b == Behavior::Allow ? "allow" : "ask"; }

std::string decision_json(Behavior b) {
    return std::string("{\"hookSpecificOutput\":{\"hookEventName\":\"PermissionRequest\",\"decision\":{\"behavior\":")
        + json_quote(to_string(b)) + "}}}";
}

std::optional<HookRequest> parse_request(const std::string& input) {
    auto doc = parse_json(input);
    if (!doc || !doc->is_object()) return std::nullopt;
    HookRequest req;
    const JsonValue* tool = doc->get("tool_name");
    if (!tool || !tool->is_string() || tool->string.empty()) tool = doc->get("tool");
    if (tool && tool->is_string()) req.tool_name = tool->string;
    const JsonValue* ti = doc->get("tool_input");
    if (ti && ti->is_object()) {
        const JsonValue* cmd = ti->get("command");
        if (cmd && cmd->is_string()) req.command = cmd->string;
    }
    return req;
}

static HookOutcome finish(Behavior b, int exit_code = 0) {
    HookOutcome out;
    out.behavior = b; out.exit_code = exit_code;
    out.output = decision_json(b) + "\n";
    return out;
}

HookOutcome run_hook(const std::string& input, const HookConfig& cfg, const HookEnv& env, std::ostream& log) {
    std::unique_ptr<StreamTrace> trace;
    if (cfg.debug) trace = std::make_unique<StreamTrace>(log);
    auto debug = [&](const std::string& msg) { if (trace) trace->note(msg); };

    if (!cfg.enabled) { debug("hook disabled, showing normal dialog"); return finish(Behavior::Ask); }

    auto req = parse_request(input);
    if (!req) { debug("unreadable hook input, showing normal dialog"); return finish(Behavior::Ask); }
    if (req->tool_name != "Bash") {
        debug("non-Bash tool (" + (req->tool_name.empty() ? std::string("<none>") : req->tool_name) + "), showing normal dialog");
        return finish(Behavior::Ask);
    }
    if (req->command.empty()) { debug("empty command, showing normal dialog"); return finish(Behavior::Ask); }

    PermissionSet perms = load_permission_set(env.cwd, env.home, cfg.debug ? &log : nullptr);
    debug("rules: " + std::to_string(perms.allow.size()) + " allow, " + std::to_string(perms.deny.size()) + " deny");

    Engine engine(std::move(perms), trace.get());
    Verdict v = engine.decide(req->command);

    bool parse_failed = v.defer && std::holds_alternative<ParseFailure>(*v.defer);
    HookOutcome out = finish(v.allowed() ? Behavior::Allow : Behavior::Ask, (parse_failed && cfg.strict) ? 1 : 0);
    out.verdict = v;
    return out;
}

} // namespace permitter::hook
