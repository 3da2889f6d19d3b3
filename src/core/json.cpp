#include "json.hpp"

#include <cstdio>
#include <cstdlib>

namespace termdeck::json
{

const Value* Value::find(const std::string& key) const
{
    if (type != Type::Object)
        return nullptr;
    auto it = object.find(key);
    return it != object.end() ? &it->second : nullptr;
}

std::string Value::string_or(const std::string& key, const std::string& def) const
{
    const Value* v = find(key);
    return (v && v->is_string()) ? v->string : def;
}

double Value::number_or(const std::string& key, double def) const
{
    const Value* v = find(key);
    return (v && v->is_number()) ? v->number : def;
}

bool Value::bool_or(const std::string& key, bool def) const
{
    const Value* v = find(key);
    return (v && v->is_bool()) ? v->boolean : def;
}

std::optional<std::string> Value::optional_string(const std::string& key) const
{
    const Value* v = find(key);
    if (v && v->is_string())
        return v->string;
    return std::nullopt;
}

// ─── Writer helpers ──────────────────────────────────────────────────────────

std::string escape(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                }
                else
                {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string quote(std::string_view s)
{
    return "\"" + escape(s) + "\"";
}

// ─── Parser ──────────────────────────────────────────────────────────────────

namespace
{

constexpr int MAX_DEPTH = 256;

class Parser
{
   public:
    explicit Parser(std::string_view text) : text_(text) {}

    bool parse_document(Value& out)
    {
        skip_ws();
        if (!parse_value(out, 0))
            return false;
        skip_ws();
        if (pos_ != text_.size())
            return fail("trailing characters");
        return true;
    }

    const std::string& error() const { return error_; }

   private:
    bool fail(const char* what)
    {
        if (error_.empty())
            error_ = std::string(what) + " at offset " + std::to_string(pos_);
        return false;
    }

    void skip_ws()
    {
        while (pos_ < text_.size()
               && (text_[pos_] == ' ' || text_[pos_] == '\t' || text_[pos_] == '\n' || text_[pos_] == '\r'))
            ++pos_;
    }

    bool consume(char c)
    {
        if (pos_ < text_.size() && text_[pos_] == c)
        {
            ++pos_;
            return true;
        }
        return false;
    }

    bool match_literal(std::string_view lit)
    {
        if (text_.substr(pos_, lit.size()) != lit)
            return false;
        pos_ += lit.size();
        return true;
    }

    bool parse_value(Value& out, int depth)
    {
        if (depth > MAX_DEPTH)
            return fail("nesting too deep");
        if (pos_ >= text_.size())
            return fail("unexpected end of input");

        char c = text_[pos_];
        if (c == '{')
            return parse_object(out, depth);
        if (c == '[')
            return parse_array(out, depth);
        if (c == '"')
        {
            out.type = Value::Type::String;
            return parse_string(out.string);
        }
        if (c == 't' || c == 'f')
        {
            out.type = Value::Type::Bool;
            if (match_literal("true"))
            {
                out.boolean = true;
                return true;
            }
            if (match_literal("false"))
            {
                out.boolean = false;
                return true;
            }
            return fail("bad literal");
        }
        if (c == 'n')
        {
            out.type = Value::Type::Null;
            return match_literal("null") ? true : fail("bad literal");
        }
        return parse_number(out);
    }

    bool parse_object(Value& out, int depth)
    {
        out.type = Value::Type::Object;
        ++pos_;   // '{'
        skip_ws();
        if (consume('}'))
            return true;
        while (true)
        {
            skip_ws();
            std::string key;
            if (pos_ >= text_.size() || text_[pos_] != '"')
                return fail("expected key");
            if (!parse_string(key))
                return false;
            skip_ws();
            if (!consume(':'))
                return fail("expected ':'");
            skip_ws();
            Value v;
            if (!parse_value(v, depth + 1))
                return false;
            out.object[std::move(key)] = std::move(v);
            skip_ws();
            if (consume(','))
                continue;
            if (consume('}'))
                return true;
            return fail("expected ',' or '}'");
        }
    }

    bool parse_array(Value& out, int depth)
    {
        out.type = Value::Type::Array;
        ++pos_;   // '['
        skip_ws();
        if (consume(']'))
            return true;
        while (true)
        {
            skip_ws();
            Value v;
            if (!parse_value(v, depth + 1))
                return false;
            out.array.push_back(std::move(v));
            skip_ws();
            if (consume(','))
                continue;
            if (consume(']'))
                return true;
            return fail("expected ',' or ']'");
        }
    }

    static void append_utf8(std::string& out, unsigned cp)
    {
        if (cp < 0x80)
        {
            out += static_cast<char>(cp);
        }
        else if (cp < 0x800)
        {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else if (cp < 0x10000)
        {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else
        {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    bool parse_hex4(unsigned& out)
    {
        if (pos_ + 4 > text_.size())
            return fail("short \\u escape");
        out = 0;
        for (int i = 0; i < 4; ++i)
        {
            char     c = text_[pos_++];
            unsigned d;
            if (c >= '0' && c <= '9')
                d = static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f')
                d = static_cast<unsigned>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F')
                d = static_cast<unsigned>(c - 'A' + 10);
            else
                return fail("bad \\u escape");
            out = (out << 4) | d;
        }
        return true;
    }

    bool parse_string(std::string& out)
    {
        ++pos_;   // opening quote
        while (pos_ < text_.size())
        {
            char c = text_[pos_++];
            if (c == '"')
                return true;
            if (c != '\\')
            {
                out += c;
                continue;
            }
            if (pos_ >= text_.size())
                break;
            char esc = text_[pos_++];
            switch (esc)
            {
                case '"':
                    out += '"';
                    break;
                case '\\':
                    out += '\\';
                    break;
                case '/':
                    out += '/';
                    break;
                case 'b':
                    out += '\b';
                    break;
                case 'f':
                    out += '\f';
                    break;
                case 'n':
                    out += '\n';
                    break;
                case 'r':
                    out += '\r';
                    break;
                case 't':
                    out += '\t';
                    break;
                case 'u':
                {
                    unsigned cp = 0;
                    if (!parse_hex4(cp))
                        return false;
                    if (cp >= 0xD800 && cp <= 0xDBFF && text_.substr(pos_, 2) == "\\u")
                    {
                        pos_ += 2;
                        unsigned low = 0;
                        if (!parse_hex4(low))
                            return false;
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    }
                    append_utf8(out, cp);
                    break;
                }
                default:
                    return fail("bad escape");
            }
        }
        return fail("unterminated string");
    }

    bool parse_number(Value& out)
    {
        size_t start = pos_;
        if (pos_ < text_.size() && (text_[pos_] == '-' || text_[pos_] == '+'))
            ++pos_;
        while (pos_ < text_.size()
               && ((text_[pos_] >= '0' && text_[pos_] <= '9') || text_[pos_] == '.' || text_[pos_] == 'e'
                   || text_[pos_] == 'E' || text_[pos_] == '-' || text_[pos_] == '+'))
            ++pos_;
        if (pos_ == start)
            return fail("unexpected character");

        std::string token(text_.substr(start, pos_ - start));
        char*       end = nullptr;
        double      v   = std::strtod(token.c_str(), &end);
        if (!end || *end != '\0')
        {
            pos_ = start;
            return fail("bad number");
        }
        out.type   = Value::Type::Number;
        out.number = v;
        return true;
    }

    std::string_view text_;
    size_t           pos_ = 0;
    std::string      error_;
};

}   // namespace

std::optional<Value> parse(std::string_view text, std::string* error)
{
    Parser p(text);
    Value  v;
    if (!p.parse_document(v))
    {
        if (error)
            *error = p.error();
        return std::nullopt;
    }
    return v;
}

}   // namespace termdeck::json
