/*
 * Permitter Keyword Tables
 * Copyright (c) 2025 Permitter contributors
 * MIT License.
 *
 * Closed sets of the words the normalizer treats specially: wrappers that run
 * the command after their own options, statement builtins that run nothing,
 * and the reserved words of compound commands the engine refuses to read.
 */
#pragma once
#include <optional>
#include <string>
#include "permitter/lex/tokens.hpp"

namespace permitter {

enum class Wrapper { Timeout, Time, Nice, Nohup, Env };

enum class StatementBuiltin { Export, Set, Unset, Local, Declare, Typeset, Readonly };

std::optional<Wrapper> wrapper_for(const Token& word);
std::optional<StatementBuiltin> statement_for(const Token& word);
// if, for, while, case, function, {, !, ...
bool is_compound_keyword(const Token& word);
// bash or sh
bool is_subshell_interpreter(const Token& word);

const char* to_string(Wrapper w);
const char* to_string(StatementBuiltin s);

} // namespace permitter
