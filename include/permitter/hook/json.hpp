/*
 * Permitter JSON Reader
 * Copyright (c) 2025 Permitter contributors
 * MIT License.
 *
 * Hand-written, minimal, no external lib. Reads the hook input and the
 * settings files, writes the one-line decision.
 */
#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace permitter::hook {

struct JsonValue {
    enum class Type { Null, Bool, Number, String, Array, Object };
    Type type = Type::Null;
    bool boolean = false;
    double number = 0;
    std::string string;
    std::vector<JsonValue> array;
    std::vector<std::pair<std::string, JsonValue>> object; // in document order

    bool is_null() const { return type == Type::Null; }
    bool is_string() const { return type == Type::String; }
    bool is_array() const { return type == Type::Array; }
    bool is_object() const { return type == Type::Object; }

    // Member lookup; the last duplicate key wins. nullptr if absent or not an object.
    const JsonValue* get(const std::string& key) const;
};

// nullopt on any syntax error or trailing garbage.
std::optional<JsonValue> parse_json(const std::string& text);

// Quoted JSON string literal for s.
std::string json_quote(const std::string& s);

} // namespace permitter::hook
