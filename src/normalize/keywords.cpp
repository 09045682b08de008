/*
 * Permitter Keyword Tables Implementation
 * Copyright (c) 2025 Permitter contributors
 * MIT License.
 */
#include <permitter/normalize/keywords.hpp>
#include <array>
#include <utility>

namespace permitter {

namespace {

const std::array<std::pair<const char*, Wrapper>, 5> kWrappers{{
    {"timeout", Wrapper::Timeout},
    {"time", Wrapper::Time},
    {"nice", Wrapper::Nice},
    {"nohup", Wrapper::Nohup},
    {"env", Wrapper::Env},
}};

const std::array<std::pair<const char*, StatementBuiltin>, 7> kStatements{{
    {"export", StatementBuiltin::Export},
    {"set", StatementBuiltin::Set},
    {"unset", StatementBuiltin::Unset},
    {"local", StatementBuiltin::Local},
    {"declare", StatementBuiltin::Declare},
    {"typeset", StatementBuiltin::Typeset},
    {"readonly", StatementBuiltin::Readonly},
}};

const std::array<const char*, 17> kCompoundKeywords{{
    "if", "then", "else", "elif", "fi", "for", "while", "until", "do", "done",
    "case", "esac", "select", "function", "{", "}", "!",
}};

} // namespace

std::optional<Wrapper> wrapper_for(const Token& word) {
    if (word.kind != TokenKind::Word) return std::nullopt;
    for (const auto& [name, w] : kWrappers) if (word.value == name) return w;
    return std::nullopt;
}

std::optional<StatementBuiltin> statement_for(const Token& word) {
    if (word.kind != TokenKind::Word) return std::nullopt;
    for (const auto& [name, s] : kStatements) if (word.value == name) return s;
    return std::nullopt;
}

bool is_compound_keyword(const Token& word) {
    if (word.kind != TokenKind::Word) return false;
    for (const char* k : kCompoundKeywords) if (word.value == k) return true;
    return false;
}

bool is_subshell_interpreter(const Token& word) {
    return word.kind == TokenKind::Word && (word.value == "bash" || word.value == "sh");
}

const char* to_string(Wrapper w) {
    switch (w) {
        case Wrapper::Timeout: return "timeout";
        case Wrapper::Time: return "time";
        case Wrapper::Nice: return "nice";
        case Wrapper::Nohup: return "nohup";
        case Wrapper::Env: return "env";
    }
    return "?";
}

const char* to_string(StatementBuiltin s) {
    switch (s) {
        case StatementBuiltin::Export: return "export";
        case StatementBuiltin::Set: return "set";
        case StatementBuiltin::Unset: return "unset";
        case StatementBuiltin::Local: return "local";
        case StatementBuiltin::Declare: return "declare";
        case StatementBuiltin::Typeset: return "typeset";
        case StatementBuiltin::Readonly: return "readonly";
    }
    return "?";
}

} // namespace permitter
