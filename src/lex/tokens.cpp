/*
 * Permitter Token Helpers
 * Copyright (c) 2025 Permitter contributors
 * Description: Classification helpers for TokenKind. See tokens.hpp.
 */
#include <permitter/lex/tokens.hpp>

namespace permitter {

bool is_word(TokenKind kind) {
    return kind == TokenKind::Word || kind == TokenKind::Assign;
}

bool is_chain_operator(TokenKind kind) {
    switch (kind) {
        case TokenKind::AndIf:
        case TokenKind::OrIf:
        case TokenKind::Pipe:
        case TokenKind::Semi:
        case TokenKind::Newline:
        case TokenKind::Background:
            return true;
        default:
            return false;
    }
}

bool is_redirection(TokenKind kind) {
    switch (kind) {
        case TokenKind::RedirOut:
        case TokenKind::RedirOutAppend:
        case TokenKind::RedirClobber:
        case TokenKind::RedirIn:
        case TokenKind::RedirInOut:
        case TokenKind::RedirAll:
        case TokenKind::RedirAllAppend:
        case TokenKind::RedirDup:
            return true;
        default:
            return false;
    }
}

bool redirection_takes_target(TokenKind kind) {
    return is_redirection(kind) && kind != TokenKind::RedirDup;
}

const char* to_string(TokenKind kind) {
    switch (kind) {
        case TokenKind::Word: return "Word";
        case TokenKind::Assign: return "Assign";
        case TokenKind::AndIf: return "AndIf";
        case TokenKind::OrIf: return "OrIf";
        case TokenKind::Pipe: return "Pipe";
        case TokenKind::Semi: return "Semi";
        case TokenKind::Newline: return "Newline";
        case TokenKind::Background: return "Background";
        case TokenKind::RedirOut: return "RedirOut";
        case TokenKind::RedirOutAppend: return "RedirOutAppend";
        case TokenKind::RedirClobber: return "RedirClobber";
        case TokenKind::RedirIn: return "RedirIn";
        case TokenKind::RedirInOut: return "RedirInOut";
        case TokenKind::RedirAll: return "RedirAll";
        case TokenKind::RedirAllAppend: return "RedirAllAppend";
        case TokenKind::RedirDup: return "RedirDup";
        case TokenKind::Eof: return "Eof";
    }
    return "Unknown";
}

} // namespace permitter
