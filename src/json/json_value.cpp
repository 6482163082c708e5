//! # JSON Value Implementation
//!
//! Deep copy, structural equality and type names for `JsonValue`.

#include "strata/json/json_value.hpp"

namespace strata::json {

auto JsonValue::type_name() const -> const char* {
    if (is_null()) {
        return "null";
    }
    if (is_bool()) {
        return "bool";
    }
    if (is_number()) {
        return "number";
    }
    if (is_string()) {
        return "string";
    }
    if (is_array()) {
        return "array";
    }
    return "object";
}

auto JsonValue::clone() const -> JsonValue {
    if (is_array()) {
        JsonArray copy;
        copy.reserve(as_array().size());
        for (const auto& elem : as_array()) {
            copy.push_back(elem.clone());
        }
        return JsonValue(std::move(copy));
    }
    if (is_object()) {
        JsonObject copy;
        for (const auto& [key, val] : as_object()) {
            copy.emplace(key, val.clone());
        }
        return JsonValue(std::move(copy));
    }
    if (is_bool()) {
        return JsonValue(as_bool());
    }
    if (is_number()) {
        return JsonValue(as_number());
    }
    if (is_string()) {
        return JsonValue(as_string());
    }
    return JsonValue();
}

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (data.index() != other.data.index()) {
        return false;
    }
    if (is_null()) {
        return true;
    }
    if (is_bool()) {
        return as_bool() == other.as_bool();
    }
    if (is_number()) {
        return as_number() == other.as_number();
    }
    if (is_string()) {
        return as_string() == other.as_string();
    }
    if (is_array()) {
        const auto& a = as_array();
        const auto& b = other.as_array();
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (a[i] != b[i]) {
                return false;
            }
        }
        return true;
    }
    const auto& a = as_object();
    const auto& b = other.as_object();
    if (a.size() != b.size()) {
        return false;
    }
    auto it_a = a.begin();
    auto it_b = b.begin();
    for (; it_a != a.end(); ++it_a, ++it_b) {
        if (it_a->first != it_b->first || it_a->second != it_b->second) {
            return false;
        }
    }
    return true;
}

} // namespace strata::json
