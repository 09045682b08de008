/*
 * Permitter JSON Reader Implementation
 * Copyright (c) 2025 Permitter contributors
 * MIT License.
 */
#include <permitter/hook/json.hpp>
#include <cstdio>
#include <cstdlib>

namespace permitter::hook {

namespace {

constexpr int kMaxNesting = 256;

class Reader {
public:
    explicit Reader(const std::string& text) : m_text(text) {}

    std::optional<JsonValue> document() {
        JsonValue v;
        skip_ws();
        if (!value(v, 0)) return std::nullopt;
        skip_ws();
        if (m_pos != m_text.size()) return std::nullopt;
        return v;
    }

private:
    bool eof() const { return m_pos >= m_text.size(); }
    char peek() const { return eof() ? '\0' : m_text[m_pos]; }
    void skip_ws() { while (!eof() && (peek() == ' ' || peek() == '\t' || peek() == '\n' || peek() == '\r')) ++m_pos; }
    bool literal(const char* word) {
        std::size_t n = std::char_traits<char>::length(word);
        if (m_text.compare(m_pos, n, word) != 0) return false;
        m_pos += n; return true;
    }

    bool value(JsonValue& out, int depth) {
        if (depth > kMaxNesting) return false;
        switch (peek()) {
            case '{': return object(out, depth);
            case '[': return array(out, depth);
            case '"': out.type = JsonValue::Type::String; return string(out.string);
            case 't': out.type = JsonValue::Type::Bool; out.boolean = true; return literal("true");
            case 'f': out.type = JsonValue::Type::Bool; out.boolean = false; return literal("false");
            case 'n': out.type = JsonValue::Type::Null; return literal("null");
            default: return number(out);
        }
    }

    bool object(JsonValue& out, int depth) {
        out.type = JsonValue::Type::Object;
        ++m_pos; skip_ws();
        if (peek() == '}') { ++m_pos; return true; }
        while (true) {
            std::string key;
            if (peek() != '"' || !string(key)) return false;
            skip_ws();
            if (peek() != ':') return false;
            ++m_pos; skip_ws();
            JsonValue member;
            if (!value(member, depth + 1)) return false;
            out.object.emplace_back(std::move(key), std::move(member));
            skip_ws();
            if (peek() == ',') { ++m_pos; skip_ws(); continue; }
            if (peek() == '}') { ++m_pos; return true; }
            return false;
        }
    }

    bool array(JsonValue& out, int depth) {
        out.type = JsonValue::Type::Array;
        ++m_pos; skip_ws();
        if (peek() == ']') { ++m_pos; return true; }
        while (true) {
            JsonValue item;
            if (!value(item, depth + 1)) return false;
            out.array.push_back(std::move(item));
            skip_ws();
            if (peek() == ',') { ++m_pos; skip_ws(); continue; }
            if (peek() == ']') { ++m_pos; return true; }
            return false;
        }
    }

    bool number(JsonValue& out) {
        std::size_t start = m_pos;
        auto digits = [&]() { std::size_t n = 0; while (!eof() && peek() >= '0' && peek() <= '9') { ++m_pos; ++n; } return n; };
        if (peek() == '-') ++m_pos;
        if (peek() == '0') ++m_pos;
        else if (digits() == 0) return false;
        if (peek() == '.') { ++m_pos; if (digits() == 0) return false; }
        if (peek() == 'e' || peek() == 'E') {
            ++m_pos;
            if (peek() == '+' || peek() == '-') ++m_pos;
            if (digits() == 0) return false;
        }
        out.type = JsonValue::Type::Number;
        out.number = std::strtod(m_text.substr(start, m_pos - start).c_str(), nullptr);
        return true;
    }

    bool hex4(unsigned& cp) {
        if (m_pos + 4 > m_text.size()) return false;
        cp = 0;
        for (int i = 0; i < 4; ++i) {
            char c = m_text[m_pos++];
            cp <<= 4;
            if (c >= '0' && c <= '9') cp |= unsigned(c - '0');
            else if (c >= 'a' && c <= 'f') cp |= unsigned(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') cp |= unsigned(c - 'A' + 10);
            else return false;
        }
        return true;
    }

    static void append_utf8(std::string& out, unsigned cp) {
        if (cp < 0x80) out += char(cp);
        else if (cp < 0x800) { out += char(0xC0 | (cp >> 6)); out += char(0x80 | (cp & 0x3F)); }
        else if (cp < 0x10000) { out += char(0xE0 | (cp >> 12)); out += char(0x80 | ((cp >> 6) & 0x3F)); out += char(0x80 | (cp & 0x3F)); }
        else { out += char(0xF0 | (cp >> 18)); out += char(0x80 | ((cp >> 12) & 0x3F)); out += char(0x80 | ((cp >> 6) & 0x3F)); out += char(0x80 | (cp & 0x3F)); }
    }

    bool string(std::string& out) {
        ++m_pos; // opening quote
        while (!eof()) {
            char c = m_text[m_pos++];
            if (c == '"') return true;
            if (static_cast<unsigned char>(c) < 0x20) return false;
            if (c != '\\') { out += c; continue; }
            if (eof()) return false;
            char e = m_text[m_pos++];
            switch (e) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    unsigned cp;
                    if (!hex4(cp)) return false;
                    if (cp >= 0xD800 && cp <= 0xDBFF && m_text.compare(m_pos, 2, "\\u") == 0) {
                        std::size_t save = m_pos;
                        m_pos += 2;
                        unsigned lo;
                        if (!hex4(lo)) return false;
                        if (lo >= 0xDC00 && lo <= 0xDFFF) cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                        else { m_pos = save; cp = 0xFFFD; }
                    } else if (cp >= 0xD800 && cp <= 0xDFFF) {
                        cp = 0xFFFD; // lone surrogate
                    }
                    append_utf8(out, cp);
                    break;
                }
                default: return false;
            }
        }
        return false;
    }

    const std::string& m_text;
    std::size_t m_pos = 0;
};

} // namespace

const JsonValue* JsonValue::get(const std::string& key) const {
    if (type != Type::Object) return nullptr;
    for (auto it = object.rbegin(); it != object.rend(); ++it) {
        if (it->first == key) return &it->second;
    }
    return nullptr;
}

std::optional<JsonValue> parse_json(const std::string& text) {
    Reader r(text);
    return r.document();
}

std::string json_quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

} // namespace permitter::hook
