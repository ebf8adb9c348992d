#pragma once

#include <string>
#include <variant>

namespace lox {

enum class ValueKind {
    Nil,
    Number,
    String,
    Boolean
};

// Runtime value: a closed sum of nil, 32-bit number, string and boolean.
class Value {
    std::variant<std::monostate, float, std::string, bool> data_;

public:
    Value() = default;

    static Value nil() { return Value(); }
    static Value number(float n) {
        Value v;
        v.data_.emplace<float>(n);
        return v;
    }
    static Value string(std::string s) {
        Value v;
        v.data_.emplace<std::string>(std::move(s));
        return v;
    }
    static Value boolean(bool b) {
        Value v;
        v.data_.emplace<bool>(b);
        return v;
    }

    ValueKind kind() const { return static_cast<ValueKind>(data_.index()); }

    bool is_nil() const { return std::holds_alternative<std::monostate>(data_); }
    bool is_number() const { return std::holds_alternative<float>(data_); }
    bool is_string() const { return std::holds_alternative<std::string>(data_); }
    bool is_boolean() const { return std::holds_alternative<bool>(data_); }

    float as_number() const { return std::get<float>(data_); }
    const std::string& as_string() const { return std::get<std::string>(data_); }
    bool as_boolean() const { return std::get<bool>(data_); }

    // Text written by `print`: strings unquoted, numbers in shortest form
    std::string to_string() const;

    // Cross-kind values are never equal
    friend bool operator==(const Value& a, const Value& b) { return a.data_ == b.data_; }
    friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }
};

const char* value_kind_name(ValueKind k);

// Shortest text that reads back as the same float: 2, 2.5, -0, inf, NaN
std::string format_number(float n);

} // namespace lox
