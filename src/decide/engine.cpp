/*
 * Permitter Decision Engine Implementation
 * Copyright (c) 2025 Permitter contributors
 * Description: Parse, then deny pass, then allow pass. See header for details.
 */
#include <permitter/decide/engine.hpp>
#include <permitter/match/matcher.hpp>

namespace permitter {

Result<CommandList> Engine::commands(const std::string& raw) const {
    return normalize_command(raw, kMaxSubshellDepth, m_trace);
}

Verdict Engine::judge(const CommandList& cmds, const PermissionRule** rule) const {
    *rule = nullptr;
    for (const auto& c : cmds) {
        if (const PermissionRule* d = first_match(c, m_perms.deny)) {
            *rule = d;
            return Verdict::denied(c, d->source);
        }
    }
    for (const auto& c : cmds) {
        const PermissionRule* a = first_match(c, m_perms.allow);
        if (!a) { *rule = nullptr; return Verdict::no_match(c); }
        *rule = a;
    }
    return Verdict::allow();
}

Verdict Engine::decide(const std::string& raw) const {
    auto parsed = commands(raw);
    if (is_error(parsed)) {
        Verdict v = Verdict::parse_error(get_error(parsed));
        if (m_trace) { m_trace->on_error(get_error(parsed)); m_trace->on_verdict(v, nullptr); }
        return v;
    }
    const CommandList& cmds = get_value(parsed);
    if (m_trace) m_trace->on_commands(cmds);

    const PermissionRule* rule = nullptr;
    Verdict v = judge(cmds, &rule);
    if (m_trace) m_trace->on_verdict(v, rule);
    return v;
}

Verdict decide(const std::string& raw, const PermissionSet& permissions, TraceObserver* trace) {
    Engine e(permissions, trace);
    return e.decide(raw);
}

} // namespace permitter
