#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace layercast::json {

enum class Type { Null, Bool, Number, String, Array, Object };

const char* type_name(Type type);

// A JSON value. Objects keep their members in insertion order so that
// serialized documents are stable across runs.
class Value {
public:
    using Array = std::vector<Value>;
    using Member = std::pair<std::string, Value>;
    using Object = std::vector<Member>;

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : type_(Type::Bool), bool_(b) {}
    Value(int n) : type_(Type::Number), number_(n) {}
    Value(std::size_t n) : type_(Type::Number), number_(static_cast<double>(n)) {}
    Value(double n) : type_(Type::Number), number_(n) {}
    Value(const char* s) : type_(Type::String), string_(s) {}
    Value(std::string s) : type_(Type::String), string_(std::move(s)) {}

    static Value array();
    static Value object();

    Type type() const { return type_; }
    bool is_null() const { return type_ == Type::Null; }
    bool is_bool() const { return type_ == Type::Bool; }
    bool is_number() const { return type_ == Type::Number; }
    bool is_string() const { return type_ == Type::String; }
    bool is_array() const { return type_ == Type::Array; }
    bool is_object() const { return type_ == Type::Object; }

    bool as_bool(bool fallback = false) const;
    double as_number(double fallback = 0) const;
    // Empty string for non-string values.
    const std::string& as_string() const;

    const Array& items() const { return array_; }
    const Object& members() const { return object_; }

    // Object lookup; nullptr when absent or when this is not an object.
    const Value* find(const std::string& key) const;
    bool contains(const std::string& key) const { return find(key) != nullptr; }

    // Replaces an existing member or appends a new one. Converts a null
    // value into an object first.
    Value& set(const std::string& key, Value value);
    // Appends to an array. Converts a null value into an array first.
    void push_back(Value value);

    std::size_t size() const;

private:
    Type type_ = Type::Null;
    bool bool_ = false;
    double number_ = 0;
    std::string string_;
    Array array_;
    Object object_;
};

struct ParseResult {
    bool ok = false;
    Value value;
    std::string error;
    std::size_t error_offset = 0;
};

ParseResult parse(const std::string& text);

// Negative indent produces compact output.
std::string serialize(const Value& value, int indent = -1);

std::string quote(const std::string& text);

}  // namespace layercast::json
