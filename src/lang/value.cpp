#include <lox/lang/value.hpp>
#include <charconv>
#include <cmath>

namespace lox {

std::string format_number(float n) {
    if (std::isnan(n)) return "NaN";
    if (std::isinf(n)) return n < 0 ? "-inf" : "inf";

    // Fixed notation never needs more than 39 integer digits for a float
    char buf[64];
    auto res = std::to_chars(buf, buf + sizeof(buf), n, std::chars_format::fixed);
    return std::string(buf, res.ptr);
}

std::string Value::to_string() const {
    switch (kind()) {
    case ValueKind::Nil:     return "nil";
    case ValueKind::Number:  return format_number(as_number());
    case ValueKind::String:  return as_string();
    case ValueKind::Boolean: return as_boolean() ? "true" : "false";
    }
    return "";
}

const char* value_kind_name(ValueKind k) {
    switch (k) {
    case ValueKind::Nil:     return "nil";
    case ValueKind::Number:  return "number";
    case ValueKind::String:  return "string";
    case ValueKind::Boolean: return "boolean";
    }
    return "unknown";
}

} // namespace lox
