/*
 * Permitter Verdict Implementation
 * Copyright (c) 2025 Permitter contributors
 * Description: See header for overview.
 */
#include <permitter/decide/verdict.hpp>
#include <type_traits>

namespace permitter {

std::string describe(const Verdict& v) {
    if (v.allowed()) return "Allow";
    return std::visit([](const auto& reason) -> std::string {
        using T = std::decay_t<decltype(reason)>;
        if constexpr (std::is_same_v<T, NoMatch>) return "Defer(NoMatch: " + reason.command + ")";
        else if constexpr (std::is_same_v<T, Denied>) return "Defer(Denied: " + reason.command + " by " + reason.rule + ")";
        else return "Defer(ParseError: " + describe(reason.error) + ")";
    }, *v.defer);
}

} // namespace permitter
