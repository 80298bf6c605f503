#include "layercast/json/json.h"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace layercast::json {

namespace {

constexpr int kMaxNestingDepth = 512;

const std::string& empty_string() {
    static const std::string empty;
    return empty;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void append_utf8(std::uint32_t cp, std::string& out) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

class Parser {
public:
    explicit Parser(const std::string& text) : text_(text) {}

    ParseResult run() {
        ParseResult result;
        skip_whitespace();
        if (!parse_value(result.value)) {
            result.error = error_;
            result.error_offset = pos_;
            return result;
        }
        skip_whitespace();
        if (pos_ != text_.size()) {
            result.value = Value();
            result.error = "Unexpected trailing characters";
            result.error_offset = pos_;
            return result;
        }
        result.ok = true;
        return result;
    }

private:
    const std::string& text_;
    std::size_t pos_ = 0;
    int depth_ = 0;
    std::string error_;

    bool fail(const std::string& message) {
        if (error_.empty()) error_ = message;
        return false;
    }

    void skip_whitespace() {
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++pos_;
        }
    }

    bool consume_literal(const char* literal) {
        std::size_t i = 0;
        while (literal[i] != '\0') {
            if (pos_ + i >= text_.size() || text_[pos_ + i] != literal[i]) {
                return fail(std::string("Invalid literal, expected '") + literal + "'");
            }
            ++i;
        }
        pos_ += i;
        return true;
    }

    bool parse_value(Value& out) {
        if (pos_ >= text_.size()) return fail("Unexpected end of input");

        const char c = text_[pos_];
        switch (c) {
            case '{': return parse_object(out);
            case '[': return parse_array(out);
            case '"': {
                std::string s;
                if (!parse_string(s)) return false;
                out = Value(std::move(s));
                return true;
            }
            case 't':
                if (!consume_literal("true")) return false;
                out = Value(true);
                return true;
            case 'f':
                if (!consume_literal("false")) return false;
                out = Value(false);
                return true;
            case 'n':
                if (!consume_literal("null")) return false;
                out = Value();
                return true;
            default:
                if (c == '-' || (c >= '0' && c <= '9')) return parse_number(out);
                return fail(std::string("Unexpected character '") + c + "'");
        }
    }

    bool parse_number(Value& out) {
        const std::size_t start = pos_;
        if (text_[pos_] == '-') ++pos_;
        if (pos_ >= text_.size() || !(text_[pos_] >= '0' && text_[pos_] <= '9')) {
            return fail("Invalid number");
        }
        while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') ++pos_;
        if (pos_ < text_.size() && text_[pos_] == '.') {
            ++pos_;
            if (pos_ >= text_.size() || !(text_[pos_] >= '0' && text_[pos_] <= '9')) {
                return fail("Invalid number: expected digit after '.'");
            }
            while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') ++pos_;
        }
        if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            ++pos_;
            if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
            if (pos_ >= text_.size() || !(text_[pos_] >= '0' && text_[pos_] <= '9')) {
                return fail("Invalid number: malformed exponent");
            }
            while (pos_ < text_.size() && text_[pos_] >= '0' && text_[pos_] <= '9') ++pos_;
        }

        const std::string literal = text_.substr(start, pos_ - start);
        out = Value(std::strtod(literal.c_str(), nullptr));
        return true;
    }

    bool parse_hex4(std::uint32_t& cp) {
        if (pos_ + 4 > text_.size()) return fail("Truncated \\u escape");
        cp = 0;
        for (int i = 0; i < 4; ++i) {
            const int h = hex_value(text_[pos_ + static_cast<std::size_t>(i)]);
            if (h < 0) return fail("Invalid \\u escape");
            cp = (cp << 4) | static_cast<std::uint32_t>(h);
        }
        pos_ += 4;
        return true;
    }

    bool parse_string(std::string& out) {
        ++pos_;  // opening quote
        while (pos_ < text_.size()) {
            const char c = text_[pos_++];
            if (c == '"') return true;
            if (static_cast<unsigned char>(c) < 0x20) {
                return fail("Unescaped control character in string");
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) break;
            const char esc = text_[pos_++];
            switch (esc) {
                case '"':  out += '"'; break;
                case '\\': out += '\\'; break;
                case '/':  out += '/'; break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u': {
                    std::uint32_t cp = 0;
                    if (!parse_hex4(cp)) return false;
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        // High surrogate: a low surrogate must follow.
                        if (pos_ + 2 <= text_.size() && text_[pos_] == '\\' && text_[pos_ + 1] == 'u') {
                            pos_ += 2;
                            std::uint32_t low = 0;
                            if (!parse_hex4(low)) return false;
                            if (low < 0xDC00 || low > 0xDFFF) return fail("Invalid surrogate pair");
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            cp = 0xFFFD;
                        }
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        cp = 0xFFFD;
                    }
                    append_utf8(cp, out);
                    break;
                }
                default:
                    return fail(std::string("Invalid escape '\\") + esc + "'");
            }
        }
        return fail("Unterminated string");
    }

    bool parse_array(Value& out) {
        if (++depth_ > kMaxNestingDepth) return fail("Nesting too deep");
        ++pos_;  // [
        out = Value::array();
        skip_whitespace();
        if (pos_ < text_.size() && text_[pos_] == ']') {
            ++pos_;
            --depth_;
            return true;
        }
        while (true) {
            skip_whitespace();
            Value item;
            if (!parse_value(item)) return false;
            out.push_back(std::move(item));
            skip_whitespace();
            if (pos_ >= text_.size()) return fail("Unterminated array");
            if (text_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (text_[pos_] == ']') {
                ++pos_;
                break;
            }
            return fail("Expected ',' or ']' in array");
        }
        --depth_;
        return true;
    }

    bool parse_object(Value& out) {
        if (++depth_ > kMaxNestingDepth) return fail("Nesting too deep");
        ++pos_;  // {
        out = Value::object();
        skip_whitespace();
        if (pos_ < text_.size() && text_[pos_] == '}') {
            ++pos_;
            --depth_;
            return true;
        }
        while (true) {
            skip_whitespace();
            if (pos_ >= text_.size() || text_[pos_] != '"') return fail("Expected object key");
            std::string key;
            if (!parse_string(key)) return false;
            skip_whitespace();
            if (pos_ >= text_.size() || text_[pos_] != ':') return fail("Expected ':' after object key");
            ++pos_;
            skip_whitespace();
            Value member;
            if (!parse_value(member)) return false;
            out.set(key, std::move(member));
            skip_whitespace();
            if (pos_ >= text_.size()) return fail("Unterminated object");
            if (text_[pos_] == ',') {
                ++pos_;
                continue;
            }
            if (text_[pos_] == '}') {
                ++pos_;
                break;
            }
            return fail("Expected ',' or '}' in object");
        }
        --depth_;
        return true;
    }
};

std::string format_number(double n) {
    if (!std::isfinite(n)) return "null";
    if (n == std::floor(n) && std::fabs(n) < 1e15) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(n));
        return buf;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.10g", n);
    return buf;
}

void write_indent(std::string& out, int indent, int level) {
    out += '\n';
    out.append(static_cast<std::size_t>(indent * level), ' ');
}

void write_value(const Value& value, int indent, int level, std::string& out) {
    switch (value.type()) {
        case Type::Null:
            out += "null";
            return;
        case Type::Bool:
            out += value.as_bool() ? "true" : "false";
            return;
        case Type::Number:
            out += format_number(value.as_number());
            return;
        case Type::String:
            out += quote(value.as_string());
            return;
        case Type::Array: {
            const auto& items = value.items();
            if (items.empty()) {
                out += "[]";
                return;
            }
            out += '[';
            for (std::size_t i = 0; i < items.size(); ++i) {
                if (i > 0) out += ',';
                if (indent >= 0) write_indent(out, indent, level + 1);
                write_value(items[i], indent, level + 1, out);
            }
            if (indent >= 0) write_indent(out, indent, level);
            out += ']';
            return;
        }
        case Type::Object: {
            const auto& members = value.members();
            if (members.empty()) {
                out += "{}";
                return;
            }
            out += '{';
            for (std::size_t i = 0; i < members.size(); ++i) {
                if (i > 0) out += ',';
                if (indent >= 0) write_indent(out, indent, level + 1);
                out += quote(members[i].first);
                out += indent >= 0 ? ": " : ":";
                write_value(members[i].second, indent, level + 1, out);
            }
            if (indent >= 0) write_indent(out, indent, level);
            out += '}';
            return;
        }
    }
}

}  // namespace

const char* type_name(Type type) {
    switch (type) {
        case Type::Null:   return "null";
        case Type::Bool:   return "bool";
        case Type::Number: return "number";
        case Type::String: return "string";
        case Type::Array:  return "array";
        case Type::Object: return "object";
    }
    return "unknown";
}

Value Value::array() {
    Value v;
    v.type_ = Type::Array;
    return v;
}

Value Value::object() {
    Value v;
    v.type_ = Type::Object;
    return v;
}

bool Value::as_bool(bool fallback) const {
    return type_ == Type::Bool ? bool_ : fallback;
}

double Value::as_number(double fallback) const {
    return type_ == Type::Number ? number_ : fallback;
}

const std::string& Value::as_string() const {
    return type_ == Type::String ? string_ : empty_string();
}

const Value* Value::find(const std::string& key) const {
    if (type_ != Type::Object) return nullptr;
    for (const auto& member : object_) {
        if (member.first == key) return &member.second;
    }
    return nullptr;
}

Value& Value::set(const std::string& key, Value value) {
    if (type_ == Type::Null) type_ = Type::Object;
    for (auto& member : object_) {
        if (member.first == key) {
            member.second = std::move(value);
            return member.second;
        }
    }
    object_.emplace_back(key, std::move(value));
    return object_.back().second;
}

void Value::push_back(Value value) {
    if (type_ == Type::Null) type_ = Type::Array;
    array_.push_back(std::move(value));
}

std::size_t Value::size() const {
    if (type_ == Type::Array) return array_.size();
    if (type_ == Type::Object) return object_.size();
    return 0;
}

ParseResult parse(const std::string& text) {
    return Parser(text).run();
}

std::string serialize(const Value& value, int indent) {
    std::string out;
    write_value(value, indent, 0, out);
    return out;
}

std::string quote(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 2);
    out += '"';
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    out += '"';
    return out;
}

}  // namespace layercast::json
