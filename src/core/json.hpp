#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace termdeck::json
{

// Minimal JSON document model for the files this library reads and writes.
// Numbers are kept as double; duplicate object keys keep the last value.
struct Value
{
    enum class Type
    {
        Null,
        Bool,
        Number,
        String,
        Array,
        Object
    };

    Type                         type    = Type::Null;
    bool                         boolean = false;
    double                       number  = 0.0;
    std::string                  string;
    std::vector<Value>           array;
    std::map<std::string, Value> object;

    bool is_null() const { return type == Type::Null; }
    bool is_object() const { return type == Type::Object; }
    bool is_array() const { return type == Type::Array; }
    bool is_string() const { return type == Type::String; }
    bool is_number() const { return type == Type::Number; }
    bool is_bool() const { return type == Type::Bool; }

    // nullptr when this is not an object or the key is absent.
    const Value* find(const std::string& key) const;

    std::string string_or(const std::string& key, const std::string& def) const;
    double      number_or(const std::string& key, double def) const;
    bool        bool_or(const std::string& key, bool def) const;

    // Unset when the key is absent, null or not a string.
    std::optional<std::string> optional_string(const std::string& key) const;
};

// Parses a complete document. `error` receives a short description with the
// byte offset of the first problem.
std::optional<Value> parse(std::string_view text, std::string* error = nullptr);

std::string escape(std::string_view s);

// Quoted and escaped.
std::string quote(std::string_view s);

}   // namespace termdeck::json
