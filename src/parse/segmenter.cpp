/*
 * Permitter Segmenter Implementation
 * Copyright (c) 2025 Permitter contributors
 * Description: See header for details.
 */
#include <permitter/parse/segmenter.hpp>
#include <permitter/parse/segment.hpp>

namespace permitter {

const char* to_string(ChainOp op) {
    switch (op) {
        case ChainOp::None: return "NONE";
        case ChainOp::And: return "AND";
        case ChainOp::Or: return "OR";
        case ChainOp::Seq: return "SEQ";
        case ChainOp::Pipe: return "PIPE";
        case ChainOp::Background: return "BACKGROUND";
    }
    return "NONE";
}

std::string join_tokens(const std::vector<Token>& tokens) {
    std::string out;
    for (const auto& t : tokens) {
        if (t.kind == TokenKind::Eof) continue;
        if (!out.empty()) out.push_back(' ');
        out += t.lexeme;
    }
    return out;
}

class Segmenter {
public:
    Segmenter(const TokenStream& ts) : m_ts(ts) {}
    std::vector<Segment> run() {
        while (!eof()) {
            const Token& t = get();
            if (t.kind == TokenKind::Background && trailing_background()) {
                m_current.tokens.push_back(t);
                continue;
            }
            if (is_chain_operator(t.kind)) { close(op_for(t.kind)); continue; }
            m_current.tokens.push_back(t);
        }
        close(ChainOp::None);
        if (!m_out.empty()) m_out.back().next = ChainOp::None;
        return std::move(m_out);
    }
private:
    bool eof() const { return m_index >= m_ts.size() || m_ts[m_index].kind == TokenKind::Eof; }
    const Token& get() { return m_ts[m_index++]; }

    // True when only line breaks follow the '&' just consumed.
    bool trailing_background() const {
        for (std::size_t i = m_index; i < m_ts.size(); ++i) {
            if (m_ts[i].kind == TokenKind::Eof) break;
            if (m_ts[i].kind != TokenKind::Newline) return false;
        }
        return true;
    }

    static ChainOp op_for(TokenKind kind) {
        switch (kind) {
            case TokenKind::AndIf: return ChainOp::And;
            case TokenKind::OrIf: return ChainOp::Or;
            case TokenKind::Pipe: return ChainOp::Pipe;
            case TokenKind::Background: return ChainOp::Background;
            case TokenKind::Semi:
            case TokenKind::Newline:
            default: return ChainOp::Seq;
        }
    }

    void close(ChainOp op) {
        if (m_current.tokens.empty()) return; // operator with nothing before it
        m_current.next = op;
        m_out.push_back(std::move(m_current));
        m_current = Segment{};
    }

    const TokenStream& m_ts;
    std::size_t m_index = 0;
    Segment m_current;
    std::vector<Segment> m_out;
};

std::vector<Segment> segment_tokens(const TokenStream& ts) {
    Segmenter s(ts);
    return s.run();
}

} // namespace permitter
