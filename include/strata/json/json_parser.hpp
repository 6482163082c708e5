//! # JSON Parser
//!
//! Lexer and recursive descent parser producing `JsonValue` trees. Errors
//! carry line and column so configuration mistakes can be pinpointed.
//!
//! ```cpp
//! auto result = parse_json(R"({"layers": []})");
//! if (is_ok(result)) {
//!     auto& json = unwrap(result);
//! } else {
//!     std::cerr << unwrap_err(result).to_string() << std::endl;
//! }
//! ```

#pragma once

#include "strata/common.hpp"
#include "strata/json/json_error.hpp"
#include "strata/json/json_value.hpp"

#include <string_view>
#include <vector>

namespace strata::json {

// ============================================================================
// Token Types
// ============================================================================

enum class JsonTokenKind : uint8_t {
    LBrace,
    RBrace,
    LBracket,
    RBracket,
    Colon,
    Comma,
    String,
    IntNumber,
    FloatNumber,
    True,
    False,
    Null,
    Eof,
    Error
};

struct JsonToken {
    JsonTokenKind kind = JsonTokenKind::Eof;
    std::string_view lexeme;
    size_t line = 0;
    size_t column = 0;
    size_t offset = 0;
    std::string string_value; ///< Unescaped content for `String`
    JsonNumber number_value;  ///< Parsed value for numbers
};

// ============================================================================
// Lexer
// ============================================================================

/// Zero-copy JSON lexer over a string view.
class JsonLexer {
public:
    explicit JsonLexer(std::string_view input);

    /// Next token; `Eof` at end of input, `Error` on malformed input.
    auto next_token() -> JsonToken;

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors_.empty();
    }
    [[nodiscard]] auto errors() const -> const std::vector<JsonError>& {
        return errors_;
    }

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    std::vector<JsonError> errors_;

    [[nodiscard]] auto peek() const -> char;
    auto advance() -> char;
    void skip_whitespace();
    auto make_token(JsonTokenKind kind, size_t start_pos, size_t start_line, size_t start_col)
        -> JsonToken;
    auto scan_string() -> JsonToken;
    auto scan_number() -> JsonToken;
    auto scan_keyword() -> JsonToken;
    void add_error(const std::string& msg, size_t line, size_t col);
};

// ============================================================================
// Parser
// ============================================================================

/// Recursive descent parser with a nesting limit.
class JsonParser {
public:
    explicit JsonParser(std::string_view input);

    /// Parses exactly one value followed by end of input.
    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

private:
    JsonLexer lexer_;
    JsonToken current_;
    static constexpr size_t MAX_DEPTH = 256;
    size_t depth_ = 0;

    void advance();
    [[nodiscard]] auto check(JsonTokenKind kind) const -> bool;
    auto match(JsonTokenKind kind) -> bool;
    [[nodiscard]] auto make_error(const std::string& msg) const -> JsonError;
    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
};

/// Parses a JSON document.
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

} // namespace strata::json
