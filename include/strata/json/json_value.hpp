//! # JSON Value Types
//!
//! `JsonValue` is the variant tree used for configuration files and for the
//! machine-readable report.
//!
//! ## Number Handling
//!
//! | JSON Input | Storage Type | Reason              |
//! |------------|--------------|---------------------|
//! | `42`       | `Int64`      | No decimal point    |
//! | `3.14`     | `Double`     | Has decimal point   |
//! | `1e10`     | `Double`     | Has exponent        |
//!
//! Integers that overflow `int64_t` are stored as `Double`.
//!
//! ## Example
//!
//! ```cpp
//! JsonValue obj(JsonObject{});
//! obj.set("status", JsonValue("clean"));
//! obj.set("count", JsonValue(int64_t{3}));
//! if (auto* status = obj.get("status"); status && status->is_string()) {
//!     std::cout << status->as_string() << "\n";
//! }
//! ```

#pragma once

#include "strata/common.hpp"

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace strata::json {

struct JsonValue;

/// Ordered values.
using JsonArray = std::vector<JsonValue>;

/// Key-value pairs, ordered by key (serialization is deterministic).
using JsonObject = std::map<std::string, JsonValue>;

// ============================================================================
// JsonNumber
// ============================================================================

/// A JSON number that keeps integers exact.
struct JsonNumber {
    enum class Kind : uint8_t { Int64, Double };

    Kind kind;

    union {
        int64_t i64;
        double f64;
    };

    explicit JsonNumber(int64_t value) : kind(Kind::Int64), i64(value) {}
    explicit JsonNumber(double value) : kind(Kind::Double), f64(value) {}
    JsonNumber() : kind(Kind::Int64), i64(0) {}

    [[nodiscard]] auto is_integer() const -> bool {
        return kind == Kind::Int64;
    }

    /// The integer value, or nullopt for non-integral doubles.
    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t> {
        if (kind == Kind::Int64) {
            return i64;
        }
        auto truncated = static_cast<int64_t>(f64);
        if (static_cast<double>(truncated) == f64) {
            return truncated;
        }
        return std::nullopt;
    }

    [[nodiscard]] auto as_f64() const -> double {
        return kind == Kind::Int64 ? static_cast<double>(i64) : f64;
    }

    [[nodiscard]] auto operator==(const JsonNumber& other) const -> bool {
        if (kind == Kind::Int64 && other.kind == Kind::Int64) {
            return i64 == other.i64;
        }
        return as_f64() == other.as_f64();
    }
};

// ============================================================================
// JsonValue
// ============================================================================

/// A JSON value: null, boolean, number, string, array or object.
///
/// Arrays and objects are boxed, so values are move-only; use `clone()` for
/// deep copies.
struct JsonValue {
    using Null = std::monostate;
    using ValueVariant =
        std::variant<Null, bool, JsonNumber, std::string, Box<JsonArray>, Box<JsonObject>>;

    ValueVariant data;

    JsonValue() : data(Null{}) {}
    explicit JsonValue(std::nullptr_t) : data(Null{}) {}
    explicit JsonValue(bool value) : data(value) {}
    explicit JsonValue(int value) : data(JsonNumber(static_cast<int64_t>(value))) {}
    explicit JsonValue(int64_t value) : data(JsonNumber(value)) {}
    explicit JsonValue(uint64_t value) : data(JsonNumber(static_cast<int64_t>(value))) {}
    explicit JsonValue(double value) : data(JsonNumber(value)) {}
    explicit JsonValue(const char* value) : data(std::string(value)) {}
    explicit JsonValue(std::string value) : data(std::move(value)) {}
    explicit JsonValue(std::string_view value) : data(std::string(value)) {}
    explicit JsonValue(JsonArray value) : data(make_box<JsonArray>(std::move(value))) {}
    explicit JsonValue(JsonObject value) : data(make_box<JsonObject>(std::move(value))) {}
    explicit JsonValue(JsonNumber value) : data(value) {}

    // ========================================================================
    // Type Queries
    // ========================================================================

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<Null>(data);
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }
    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<JsonNumber>(data);
    }
    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }
    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Box<JsonObject>>(data);
    }
    [[nodiscard]] auto is_integer() const -> bool {
        if (auto* num = std::get_if<JsonNumber>(&data)) {
            return num->try_as_i64().has_value();
        }
        return false;
    }

    /// Name of the held type ("null", "bool", "number", ...), for error messages.
    [[nodiscard]] auto type_name() const -> const char*;

    // ========================================================================
    // Accessors (throw std::bad_variant_access on type mismatch)
    // ========================================================================

    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }
    [[nodiscard]] auto as_number() const -> const JsonNumber& {
        return std::get<JsonNumber>(data);
    }
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }
    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }
    [[nodiscard]] auto as_array_mut() -> JsonArray& {
        return *std::get<Box<JsonArray>>(data);
    }
    [[nodiscard]] auto as_object_mut() -> JsonObject& {
        return *std::get<Box<JsonObject>>(data);
    }

    [[nodiscard]] auto try_as_i64() const -> std::optional<int64_t> {
        if (auto* num = std::get_if<JsonNumber>(&data)) {
            return num->try_as_i64();
        }
        return std::nullopt;
    }

    // ========================================================================
    // Object / Array Access
    // ========================================================================

    /// The member `key` of an object, or nullptr (also for non-objects).
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue* {
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            auto it = (*obj)->find(key);
            if (it != (*obj)->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    [[nodiscard]] auto contains(const std::string& key) const -> bool {
        return get(key) != nullptr;
    }

    [[nodiscard]] auto operator[](size_t index) const -> const JsonValue& {
        return as_array().at(index);
    }

    /// Element or member count; 0 for scalars.
    [[nodiscard]] auto size() const -> size_t {
        if (auto* arr = std::get_if<Box<JsonArray>>(&data)) {
            return (*arr)->size();
        }
        if (auto* obj = std::get_if<Box<JsonObject>>(&data)) {
            return (*obj)->size();
        }
        return 0;
    }

    void push(JsonValue value) {
        as_array_mut().push_back(std::move(value));
    }

    void set(const std::string& key, JsonValue value) {
        as_object_mut()[key] = std::move(value);
    }

    // ========================================================================
    // Serialization
    // ========================================================================

    /// Compact output, no whitespace.
    [[nodiscard]] auto to_string() const -> std::string;

    /// Indented output with newlines.
    [[nodiscard]] auto to_string_pretty(int indent = 2) const -> std::string;

    auto write_to(std::ostream& os) const -> std::ostream&;

    [[nodiscard]] auto clone() const -> JsonValue;

    [[nodiscard]] auto operator==(const JsonValue& other) const -> bool;
    [[nodiscard]] auto operator!=(const JsonValue& other) const -> bool {
        return !(*this == other);
    }
};

// ============================================================================
// Factory Functions
// ============================================================================

inline auto json_null() -> JsonValue {
    return JsonValue();
}

inline auto json_bool(bool value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_int(int64_t value) -> JsonValue {
    return JsonValue(value);
}

inline auto json_string(std::string value) -> JsonValue {
    return JsonValue(std::move(value));
}

inline auto json_array() -> JsonValue {
    return JsonValue(JsonArray{});
}

inline auto json_object() -> JsonValue {
    return JsonValue(JsonObject{});
}

} // namespace strata::json
