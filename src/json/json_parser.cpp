//! # JSON Parser Implementation
//!
//! Two stages: `JsonLexer` turns the input into tokens, `JsonParser` builds
//! the `JsonValue` tree. The parser stops at the first error and reports the
//! position of the token it could not accept.

#include "strata/json/json_parser.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>

namespace strata::json {

// ============================================================================
// JsonLexer
// ============================================================================

JsonLexer::JsonLexer(std::string_view input) : input_(input) {}

auto JsonLexer::peek() const -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    return input_[pos_];
}

auto JsonLexer::advance() -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void JsonLexer::skip_whitespace() {
    while (pos_ < input_.size()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            advance();
        } else {
            break;
        }
    }
}

auto JsonLexer::make_token(JsonTokenKind kind, size_t start_pos, size_t start_line,
                           size_t start_col) -> JsonToken {
    JsonToken tok;
    tok.kind = kind;
    tok.lexeme = input_.substr(start_pos, pos_ - start_pos);
    tok.line = start_line;
    tok.column = start_col;
    tok.offset = start_pos;
    return tok;
}

void JsonLexer::add_error(const std::string& msg, size_t line, size_t col) {
    errors_.push_back(JsonError::make(msg, line, col));
}

/// Scans a string literal, resolving escapes (`\uXXXX` is encoded as UTF-8).
auto JsonLexer::scan_string() -> JsonToken {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    advance(); // opening quote

    std::string value;
    while (pos_ < input_.size()) {
        char c = peek();

        if (c == '"') {
            advance();
            JsonToken tok = make_token(JsonTokenKind::String, start_pos, start_line, start_col);
            tok.string_value = std::move(value);
            return tok;
        }

        if (c == '\\') {
            advance();
            char escaped = advance();
            switch (escaped) {
            case '"':
                value += '"';
                break;
            case '\\':
                value += '\\';
                break;
            case '/':
                value += '/';
                break;
            case 'b':
                value += '\b';
                break;
            case 'f':
                value += '\f';
                break;
            case 'n':
                value += '\n';
                break;
            case 'r':
                value += '\r';
                break;
            case 't':
                value += '\t';
                break;
            case 'u': {
                if (pos_ + 4 > input_.size()) {
                    add_error("Incomplete unicode escape sequence", line_, column_);
                    return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
                }
                std::string_view hex = input_.substr(pos_, 4);
                unsigned int codepoint = 0;
                auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + 4, codepoint, 16);
                if (ec != std::errc{} || ptr != hex.data() + 4) {
                    add_error("Invalid unicode escape sequence", line_, column_);
                    return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
                }
                pos_ += 4;
                column_ += 4;
                if (codepoint < 0x80) {
                    value += static_cast<char>(codepoint);
                } else if (codepoint < 0x800) {
                    value += static_cast<char>(0xC0 | (codepoint >> 6));
                    value += static_cast<char>(0x80 | (codepoint & 0x3F));
                } else {
                    value += static_cast<char>(0xE0 | (codepoint >> 12));
                    value += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
                    value += static_cast<char>(0x80 | (codepoint & 0x3F));
                }
                break;
            }
            default:
                add_error("Invalid escape sequence: \\" + std::string(1, escaped), line_, column_);
                return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
            }
        } else if (static_cast<unsigned char>(c) < 0x20) {
            add_error("Control character in string", line_, column_);
            return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
        } else {
            value += c;
            advance();
        }
    }

    add_error("Unterminated string", start_line, start_col);
    return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
}

auto JsonLexer::scan_number() -> JsonToken {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    bool is_float = false;

    if (peek() == '-') {
        advance();
    }

    if (peek() == '0') {
        advance();
    } else if (std::isdigit(static_cast<unsigned char>(peek()))) {
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    } else {
        add_error("Invalid number", start_line, start_col);
        return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
    }

    if (peek() == '.') {
        is_float = true;
        advance();
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            add_error("Expected digit after decimal point", line_, column_);
            return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }

    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            add_error("Expected digit in exponent", line_, column_);
            return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            advance();
        }
    }

    std::string_view num_str = input_.substr(start_pos, pos_ - start_pos);
    JsonToken tok = make_token(is_float ? JsonTokenKind::FloatNumber : JsonTokenKind::IntNumber,
                               start_pos, start_line, start_col);

    if (!is_float) {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(num_str.data(), num_str.data() + num_str.size(), value);
        if (ec == std::errc{}) {
            tok.number_value = JsonNumber(value);
            return tok;
        }
        tok.kind = JsonTokenKind::FloatNumber; // overflow
    }

    tok.number_value = JsonNumber(std::strtod(std::string(num_str).c_str(), nullptr));
    return tok;
}

auto JsonLexer::scan_keyword() -> JsonToken {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    while (std::isalpha(static_cast<unsigned char>(peek()))) {
        advance();
    }

    std::string_view word = input_.substr(start_pos, pos_ - start_pos);

    if (word == "true") {
        return make_token(JsonTokenKind::True, start_pos, start_line, start_col);
    }
    if (word == "false") {
        return make_token(JsonTokenKind::False, start_pos, start_line, start_col);
    }
    if (word == "null") {
        return make_token(JsonTokenKind::Null, start_pos, start_line, start_col);
    }

    add_error("Unknown keyword: " + std::string(word), start_line, start_col);
    return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
}

auto JsonLexer::next_token() -> JsonToken {
    skip_whitespace();

    if (pos_ >= input_.size()) {
        JsonToken tok;
        tok.kind = JsonTokenKind::Eof;
        tok.line = line_;
        tok.column = column_;
        tok.offset = pos_;
        return tok;
    }

    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;
    char c = peek();

    switch (c) {
    case '{':
        advance();
        return make_token(JsonTokenKind::LBrace, start_pos, start_line, start_col);
    case '}':
        advance();
        return make_token(JsonTokenKind::RBrace, start_pos, start_line, start_col);
    case '[':
        advance();
        return make_token(JsonTokenKind::LBracket, start_pos, start_line, start_col);
    case ']':
        advance();
        return make_token(JsonTokenKind::RBracket, start_pos, start_line, start_col);
    case ':':
        advance();
        return make_token(JsonTokenKind::Colon, start_pos, start_line, start_col);
    case ',':
        advance();
        return make_token(JsonTokenKind::Comma, start_pos, start_line, start_col);
    case '"':
        return scan_string();
    case 't':
    case 'f':
    case 'n':
        return scan_keyword();
    default:
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            return scan_number();
        }
        advance();
        add_error("Unexpected character: " + std::string(1, c), start_line, start_col);
        return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
    }
}

// ============================================================================
// JsonParser
// ============================================================================

JsonParser::JsonParser(std::string_view input) : lexer_(input) {
    advance();
}

void JsonParser::advance() {
    current_ = lexer_.next_token();
}

auto JsonParser::check(JsonTokenKind kind) const -> bool {
    return current_.kind == kind;
}

auto JsonParser::match(JsonTokenKind kind) -> bool {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

auto JsonParser::make_error(const std::string& msg) const -> JsonError {
    return JsonError::make(msg, current_.line, current_.column, current_.offset);
}

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    auto result = parse_value();
    if (is_err(result)) {
        return result;
    }

    if (!check(JsonTokenKind::Eof)) {
        return make_error("Unexpected content after JSON value");
    }

    return result;
}

auto JsonParser::parse_value() -> Result<JsonValue, JsonError> {
    if (depth_ >= MAX_DEPTH) {
        return make_error("Maximum nesting depth exceeded");
    }

    switch (current_.kind) {
    case JsonTokenKind::Null:
        advance();
        return JsonValue();

    case JsonTokenKind::True:
        advance();
        return JsonValue(true);

    case JsonTokenKind::False:
        advance();
        return JsonValue(false);

    case JsonTokenKind::IntNumber:
    case JsonTokenKind::FloatNumber: {
        JsonNumber num = current_.number_value;
        advance();
        return JsonValue(num);
    }

    case JsonTokenKind::String: {
        std::string str = std::move(current_.string_value);
        advance();
        return JsonValue(std::move(str));
    }

    case JsonTokenKind::LBrace:
        return parse_object();

    case JsonTokenKind::LBracket:
        return parse_array();

    case JsonTokenKind::Error:
        if (lexer_.has_errors()) {
            return lexer_.errors().back();
        }
        return make_error("Invalid token");

    case JsonTokenKind::Eof:
        return make_error("Unexpected end of input");

    default:
        return make_error("Unexpected token '" + std::string(current_.lexeme) + "'");
    }
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    ++depth_;
    advance(); // '{'

    JsonObject obj;

    if (match(JsonTokenKind::RBrace)) {
        --depth_;
        return JsonValue(std::move(obj));
    }

    while (true) {
        if (!check(JsonTokenKind::String)) {
            --depth_;
            return make_error("Expected string key in object");
        }
        std::string key = std::move(current_.string_value);
        advance();

        if (!match(JsonTokenKind::Colon)) {
            --depth_;
            return make_error("Expected ':' after object key");
        }

        auto value_result = parse_value();
        if (is_err(value_result)) {
            --depth_;
            return value_result;
        }

        obj[std::move(key)] = std::move(unwrap(value_result));

        if (match(JsonTokenKind::Comma)) {
            if (check(JsonTokenKind::RBrace)) {
                --depth_;
                return make_error("Trailing comma in object");
            }
        } else if (match(JsonTokenKind::RBrace)) {
            --depth_;
            return JsonValue(std::move(obj));
        } else {
            --depth_;
            return make_error("Expected ',' or '}' in object");
        }
    }
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    ++depth_;
    advance(); // '['

    JsonArray arr;

    if (match(JsonTokenKind::RBracket)) {
        --depth_;
        return JsonValue(std::move(arr));
    }

    while (true) {
        auto value_result = parse_value();
        if (is_err(value_result)) {
            --depth_;
            return value_result;
        }

        arr.push_back(std::move(unwrap(value_result)));

        if (match(JsonTokenKind::Comma)) {
            if (check(JsonTokenKind::RBracket)) {
                --depth_;
                return make_error("Trailing comma in array");
            }
        } else if (match(JsonTokenKind::RBracket)) {
            --depth_;
            return JsonValue(std::move(arr));
        } else {
            --depth_;
            return make_error("Expected ',' or ']' in array");
        }
    }
}

auto parse_json(std::string_view input) -> Result<JsonValue, JsonError> {
    JsonParser parser(input);
    return parser.parse();
}

} // namespace strata::json
