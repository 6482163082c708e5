//! # JSON Serializer
//!
//! Compact and pretty-printed output for `JsonValue`. Object members come out
//! in key order, so equal values always serialize to identical text.
//!
//! | Character           | Escape Sequence |
//! |---------------------|-----------------|
//! | `"`                 | `\"`            |
//! | `\`                 | `\\`            |
//! | Line feed           | `\n`            |
//! | Carriage return     | `\r`            |
//! | Tab                 | `\t`            |
//! | Control (0x00-0x1F) | `\uXXXX`        |

#include "strata/json/json_value.hpp"

#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace strata::json {

namespace {

auto escape_string(const std::string& s) -> std::string {
    std::string result;
    result.reserve(s.size() + 2);

    for (char c : s) {
        switch (c) {
        case '"':
            result += "\\\"";
            break;
        case '\\':
            result += "\\\\";
            break;
        case '\b':
            result += "\\b";
            break;
        case '\f':
            result += "\\f";
            break;
        case '\n':
            result += "\\n";
            break;
        case '\r':
            result += "\\r";
            break;
        case '\t':
            result += "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                std::ostringstream oss;
                oss << "\\u" << std::hex << std::setfill('0') << std::setw(4)
                    << static_cast<int>(static_cast<unsigned char>(c));
                result += oss.str();
            } else {
                result += c;
            }
            break;
        }
    }

    return result;
}

/// Integers without a decimal point; non-finite doubles become `null`.
auto format_number(const JsonNumber& num) -> std::string {
    if (num.kind == JsonNumber::Kind::Int64) {
        return std::to_string(num.i64);
    }
    if (std::isnan(num.f64) || std::isinf(num.f64)) {
        return "null";
    }
    std::ostringstream oss;
    oss << std::setprecision(17) << num.f64;
    return oss.str();
}

void serialize_compact(const JsonValue& value, std::string& out) {
    if (value.is_null()) {
        out += "null";
    } else if (value.is_bool()) {
        out += value.as_bool() ? "true" : "false";
    } else if (value.is_number()) {
        out += format_number(value.as_number());
    } else if (value.is_string()) {
        out += '"';
        out += escape_string(value.as_string());
        out += '"';
    } else if (value.is_array()) {
        out += '[';
        bool first = true;
        for (const auto& elem : value.as_array()) {
            if (!first) {
                out += ',';
            }
            first = false;
            serialize_compact(elem, out);
        }
        out += ']';
    } else if (value.is_object()) {
        out += '{';
        bool first = true;
        for (const auto& [key, val] : value.as_object()) {
            if (!first) {
                out += ',';
            }
            first = false;
            out += '"';
            out += escape_string(key);
            out += "\":";
            serialize_compact(val, out);
        }
        out += '}';
    }
}

void serialize_pretty(const JsonValue& value, std::string& out, int indent, int depth) {
    std::string pad(static_cast<size_t>(indent * depth), ' ');
    std::string inner(static_cast<size_t>(indent * (depth + 1)), ' ');

    if (value.is_array()) {
        const auto& arr = value.as_array();
        if (arr.empty()) {
            out += "[]";
            return;
        }
        out += "[\n";
        for (size_t i = 0; i < arr.size(); ++i) {
            out += inner;
            serialize_pretty(arr[i], out, indent, depth + 1);
            if (i + 1 < arr.size()) {
                out += ',';
            }
            out += '\n';
        }
        out += pad;
        out += ']';
    } else if (value.is_object()) {
        const auto& obj = value.as_object();
        if (obj.empty()) {
            out += "{}";
            return;
        }
        out += "{\n";
        size_t i = 0;
        for (const auto& [key, val] : obj) {
            out += inner;
            out += '"';
            out += escape_string(key);
            out += "\": ";
            serialize_pretty(val, out, indent, depth + 1);
            if (++i < obj.size()) {
                out += ',';
            }
            out += '\n';
        }
        out += pad;
        out += '}';
    } else {
        serialize_compact(value, out);
    }
}

} // namespace

auto JsonValue::to_string() const -> std::string {
    std::string out;
    serialize_compact(*this, out);
    return out;
}

auto JsonValue::to_string_pretty(int indent) const -> std::string {
    std::string out;
    serialize_pretty(*this, out, indent, 0);
    return out;
}

auto JsonValue::write_to(std::ostream& os) const -> std::ostream& {
    return os << to_string();
}

} // namespace strata::json
