//! # Source Scanner Implementation
//!
//! A single forward pass over the input. Comments are replaced by spaces,
//! literal bodies are replaced by spaces and recorded, and every bracket
//! outside comments and literals is pushed to or popped from a stack.
//!
//! ## Ambiguous Quotes
//!
//! | Case                   | Resolution                                         |
//! |------------------------|----------------------------------------------------|
//! | C++ `1'000'000`        | `'` after a number run is a digit separator        |
//! | Rust `'a` lifetimes    | `'` is a char literal only for `'x'` or `'\...'`   |
//! | JS `/re/` vs division  | regex when the previous significant token cannot end an expression |

#include "strata/ingest/source_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

namespace strata::ingest {

namespace {

auto is_ident_char(char c) -> bool {
    auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || c == '$' || u >= 0x80;
}

auto is_ident_start(char c) -> bool {
    auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || c == '$' || u >= 0x80;
}

auto uses_c_comments(Language lang) -> bool {
    return lang != Language::Python;
}

auto is_js_like(Language lang) -> bool {
    return lang == Language::JavaScript || lang == Language::TypeScript;
}

/// Keywords after which a `/` starts a regex literal rather than a division.
auto is_regex_keyword(std::string_view word) -> bool {
    static constexpr std::string_view KEYWORDS[] = {
        "return", "typeof", "case", "do",    "else",   "in",  "of",
        "void",   "yield",  "await", "delete", "throw", "new", "instanceof"};
    return std::find(std::begin(KEYWORDS), std::end(KEYWORDS), word) != std::end(KEYWORDS);
}

/// Scanning state for one file.
class Scanner {
public:
    Scanner(std::string_view in, Language lang, ScanResult& out)
        : in_(in), n_(in.size()), lang_(lang), out_(out) {}

    void run();

private:
    std::string_view in_;
    size_t n_;
    Language lang_;
    ScanResult& out_;
    std::vector<std::pair<char, size_t>> brackets_;

    void fail(const std::string& msg, size_t offset) {
        if (out_.ok) {
            out_.ok = false;
            out_.error = "line " + std::to_string(out_.line_of(offset)) + ": " + msg;
        }
    }

    void blank(size_t from, size_t to) {
        to = std::min(to, n_);
        for (size_t k = from; k < to; ++k) {
            if (out_.text[k] != '\n') {
                out_.text[k] = ' ';
            }
        }
    }

    /// Records a literal spanning `open..close_end` and blanks its body.
    void record(size_t open, size_t close_end, size_t body_from, size_t body_to) {
        body_to = std::min(body_to, n_);
        body_from = std::min(body_from, body_to);
        StringLiteral lit;
        lit.offset = open;
        lit.end = std::min(close_end, n_);
        lit.line = out_.line_of(open);
        lit.value = std::string(in_.substr(body_from, body_to - body_from));
        blank(body_from, body_to);
        out_.strings.push_back(std::move(lit));
    }

    auto skip_line_comment(size_t i) -> size_t {
        size_t j = i;
        while (j < n_ && in_[j] != '\n') {
            ++j;
        }
        blank(i, j);
        return j;
    }

    auto skip_block_comment(size_t i) -> size_t {
        size_t j = i + 2;
        while (j + 1 < n_ && !(in_[j] == '*' && in_[j + 1] == '/')) {
            ++j;
        }
        if (j + 1 >= n_) {
            fail("unterminated block comment", i);
            blank(i, n_);
            return n_;
        }
        blank(i, j + 2);
        return j + 2;
    }

    auto scan_quoted(size_t i, bool multiline) -> size_t;
    auto scan_triple(size_t i) -> size_t;
    auto scan_cpp_raw(size_t i) -> size_t;
    auto try_rust_raw(size_t i) -> size_t;
    auto scan_rust_quote(size_t i) -> size_t;
    auto scan_template(size_t i) -> size_t;
    auto scan_go_raw(size_t i) -> size_t;
    auto try_regex(size_t i) -> size_t;
    void on_bracket(char c, size_t i);
    void finish_brackets();

    [[nodiscard]] auto number_run_before(size_t i) const -> bool {
        size_t j = i;
        while (j > 0 && (std::isalnum(static_cast<unsigned char>(in_[j - 1])) || in_[j - 1] == '\'')) {
            --j;
        }
        return j < i && std::isdigit(static_cast<unsigned char>(in_[j]));
    }

    [[nodiscard]] auto cpp_raw_prefix(size_t i) const -> bool {
        // in_[i] == 'R' and in_[i + 1] == '"'
        size_t j = i;
        while (j > 0 && is_ident_char(in_[j - 1])) {
            --j;
        }
        auto prefix = in_.substr(j, i - j);
        return prefix.empty() || prefix == "u8" || prefix == "L" || prefix == "u" || prefix == "U";
    }
};

auto Scanner::scan_quoted(size_t i, bool multiline) -> size_t {
    char q = in_[i];
    size_t j = i + 1;
    while (j < n_) {
        char c = in_[j];
        if (c == '\\') {
            j += 2;
            continue;
        }
        if (c == q) {
            record(i, j + 1, i + 1, j);
            return j + 1;
        }
        if (c == '\n' && !multiline) {
            fail("unterminated string literal", i);
            record(i, j, i + 1, j);
            return j;
        }
        ++j;
    }
    fail("unterminated string literal", i);
    record(i, n_, i + 1, n_);
    return n_;
}

auto Scanner::scan_triple(size_t i) -> size_t {
    char q = in_[i];
    size_t j = i + 3;
    while (j < n_) {
        if (in_[j] == '\\') {
            j += 2;
            continue;
        }
        if (j + 2 < n_ && in_[j] == q && in_[j + 1] == q && in_[j + 2] == q) {
            record(i, j + 3, i + 3, j);
            return j + 3;
        }
        ++j;
    }
    fail("unterminated triple-quoted string", i);
    record(i, n_, i + 3, n_);
    return n_;
}

auto Scanner::scan_cpp_raw(size_t i) -> size_t {
    size_t quote = i + 1;
    size_t paren = in_.find('(', quote + 1);
    if (paren == std::string_view::npos || paren - quote - 1 > 16) {
        return scan_quoted(quote, false);
    }
    std::string terminator = ")" + std::string(in_.substr(quote + 1, paren - quote - 1)) + "\"";
    size_t close = in_.find(terminator, paren + 1);
    if (close == std::string_view::npos) {
        fail("unterminated raw string literal", quote);
        record(quote, n_, paren + 1, n_);
        return n_;
    }
    size_t end = close + terminator.size();
    record(quote, end, paren + 1, close);
    return end;
}

/// Returns the end of a Rust raw string starting at `i`, or `i` if there is none.
auto Scanner::try_rust_raw(size_t i) -> size_t {
    size_t j = i + (in_[i] == 'b' ? 2 : 1);
    size_t hashes = 0;
    while (j < n_ && in_[j] == '#') {
        ++hashes;
        ++j;
    }
    if (j >= n_ || in_[j] != '"') {
        return i;
    }
    size_t quote = j;
    std::string terminator = "\"" + std::string(hashes, '#');
    size_t close = in_.find(terminator, quote + 1);
    if (close == std::string_view::npos) {
        fail("unterminated raw string literal", quote);
        blank(i + 1, quote);
        record(quote, n_, quote + 1, n_);
        return n_;
    }
    blank(i + 1, quote);
    record(quote, close + 1, quote + 1, close);
    blank(close + 1, close + terminator.size());
    return close + terminator.size();
}

/// Char literal or lifetime.
auto Scanner::scan_rust_quote(size_t i) -> size_t {
    if (i + 1 < n_ && in_[i + 1] == '\\') {
        return scan_quoted(i, false);
    }
    if (i + 2 < n_ && in_[i + 2] == '\'') {
        record(i, i + 3, i + 1, i + 2);
        return i + 3;
    }
    if (i + 1 < n_ && static_cast<unsigned char>(in_[i + 1]) >= 0x80) {
        size_t close = in_.find('\'', i + 1);
        if (close != std::string_view::npos && close - i <= 5) {
            record(i, close + 1, i + 1, close);
            return close + 1;
        }
    }
    return i + 1; // lifetime
}

auto Scanner::scan_template(size_t i) -> size_t {
    size_t j = i + 1;
    while (j < n_) {
        char c = in_[j];
        if (c == '\\') {
            j += 2;
            continue;
        }
        if (c == '`') {
            record(i, j + 1, i + 1, j);
            return j + 1;
        }
        if (c == '$' && j + 1 < n_ && in_[j + 1] == '{') {
            int depth = 0;
            while (j < n_) {
                if (in_[j] == '{') {
                    ++depth;
                } else if (in_[j] == '}') {
                    if (--depth == 0) {
                        break;
                    }
                }
                ++j;
            }
        }
        ++j;
    }
    fail("unterminated template literal", i);
    record(i, n_, i + 1, n_);
    return n_;
}

auto Scanner::scan_go_raw(size_t i) -> size_t {
    size_t close = in_.find('`', i + 1);
    if (close == std::string_view::npos) {
        fail("unterminated raw string literal", i);
        record(i, n_, i + 1, n_);
        return n_;
    }
    record(i, close + 1, i + 1, close);
    return close + 1;
}

/// Returns the end of a regex literal starting at `i`, or `i` if the slash is
/// a division operator.
auto Scanner::try_regex(size_t i) -> size_t {
    size_t p = i;
    while (p > 0 && std::isspace(static_cast<unsigned char>(out_.text[p - 1]))) {
        --p;
    }
    if (p > 0) {
        char prev = out_.text[p - 1];
        if (is_ident_char(prev)) {
            size_t w = p;
            while (w > 0 && is_ident_char(out_.text[w - 1])) {
                --w;
            }
            if (!is_regex_keyword(std::string_view(out_.text).substr(w, p - w))) {
                return i;
            }
        } else if (prev == ')' || prev == ']' || prev == '}' || prev == '"' || prev == '\'' ||
                   prev == '`') {
            return i;
        }
    }

    bool in_class = false;
    size_t j = i + 1;
    while (j < n_ && in_[j] != '\n') {
        char c = in_[j];
        if (c == '\\') {
            j += 2;
            continue;
        }
        if (c == '[') {
            in_class = true;
        } else if (c == ']') {
            in_class = false;
        } else if (c == '/' && !in_class) {
            blank(i + 1, j);
            return j + 1;
        }
        ++j;
    }
    return i;
}

void Scanner::on_bracket(char c, size_t i) {
    if (c == '(' || c == '[' || c == '{') {
        brackets_.emplace_back(c, i);
        return;
    }
    char open = c == ')' ? '(' : (c == ']' ? '[' : '{');
    if (brackets_.empty()) {
        fail(std::string("unbalanced '") + c + "'", i);
        return;
    }
    if (brackets_.back().first == open) {
        brackets_.pop_back();
        return;
    }
    fail(std::string("mismatched '") + c + "'", i);
    auto it = std::find_if(brackets_.rbegin(), brackets_.rend(),
                           [open](const auto& b) { return b.first == open; });
    if (it != brackets_.rend()) {
        brackets_.erase(std::prev(it.base()), brackets_.end());
    }
}

void Scanner::finish_brackets() {
    if (!brackets_.empty()) {
        const auto& [c, offset] = brackets_.back();
        fail(std::string("unclosed '") + c + "'", offset);
    }
}

void Scanner::run() {
    size_t i = 0;
    while (i < n_) {
        char c = in_[i];
        char next = i + 1 < n_ ? in_[i + 1] : '\0';

        if (lang_ == Language::Python && c == '#') {
            i = skip_line_comment(i);
            continue;
        }
        if (uses_c_comments(lang_) && c == '/' && next == '/') {
            i = skip_line_comment(i);
            continue;
        }
        if (uses_c_comments(lang_) && c == '/' && next == '*') {
            i = skip_block_comment(i);
            continue;
        }

        if (lang_ == Language::Cpp && c == 'R' && next == '"' && cpp_raw_prefix(i)) {
            i = scan_cpp_raw(i);
            continue;
        }
        if (lang_ == Language::Rust && (c == 'r' || (c == 'b' && next == 'r')) &&
            (i == 0 || !is_ident_char(in_[i - 1]))) {
            size_t end = try_rust_raw(i);
            if (end != i) {
                i = end;
                continue;
            }
        }

        switch (c) {
        case '"':
            if ((lang_ == Language::Python || lang_ == Language::Java) && next == '"' &&
                i + 2 < n_ && in_[i + 2] == '"') {
                i = scan_triple(i);
            } else {
                i = scan_quoted(i, lang_ == Language::Rust);
            }
            continue;
        case '\'':
            if (lang_ == Language::Python && next == '\'' && i + 2 < n_ && in_[i + 2] == '\'') {
                i = scan_triple(i);
            } else if (lang_ == Language::Rust) {
                i = scan_rust_quote(i);
            } else if (lang_ == Language::Cpp && number_run_before(i)) {
                ++i;
            } else {
                i = scan_quoted(i, false);
            }
            continue;
        case '`':
            if (is_js_like(lang_)) {
                i = scan_template(i);
                continue;
            }
            if (lang_ == Language::Go) {
                i = scan_go_raw(i);
                continue;
            }
            break;
        case '/':
            if (is_js_like(lang_)) {
                size_t end = try_regex(i);
                if (end != i) {
                    i = end;
                    continue;
                }
            }
            break;
        case '(':
        case ')':
        case '[':
        case ']':
        case '{':
        case '}':
            on_bracket(c, i);
            break;
        default:
            break;
        }
        ++i;
    }
    finish_brackets();
}

auto is_punct3(std::string_view s) -> bool {
    return s == "...";
}

auto is_punct2(std::string_view s) -> bool {
    static constexpr std::string_view OPS[] = {"::", "=>", "->", "!=", "==", "?.",
                                               "<=", ">=", "&&", "||", ":="};
    return std::find(std::begin(OPS), std::end(OPS), s) != std::end(OPS);
}

} // namespace

// ============================================================================
// ScanResult
// ============================================================================

auto ScanResult::line_of(size_t offset) const -> uint32_t {
    auto it = std::upper_bound(line_starts.begin(), line_starts.end(), offset);
    return static_cast<uint32_t>(std::distance(line_starts.begin(), it));
}

auto ScanResult::column_of(size_t offset) const -> uint32_t {
    auto line = line_of(offset);
    if (line == 0) {
        return static_cast<uint32_t>(offset + 1);
    }
    return static_cast<uint32_t>(offset - line_starts[line - 1] + 1);
}

auto ScanResult::string_at(size_t offset) const -> const StringLiteral* {
    auto it = std::lower_bound(strings.begin(), strings.end(), offset,
                               [](const StringLiteral& lit, size_t off) { return lit.offset < off; });
    if (it != strings.end() && it->offset == offset) {
        return &*it;
    }
    return nullptr;
}

// ============================================================================
// SourceScanner
// ============================================================================

auto SourceScanner::scan(std::string_view content) const -> ScanResult {
    ScanResult result;
    result.text = std::string(content);
    result.line_starts.push_back(0);
    for (size_t i = 0; i < content.size(); ++i) {
        if (content[i] == '\n') {
            result.line_starts.push_back(i + 1);
        }
    }

    Scanner scanner(content, lang_, result);
    scanner.run();
    return result;
}

auto SourceScanner::tokenize(const ScanResult& scan) -> std::vector<Token> {
    std::vector<Token> tokens;
    std::string_view text = scan.text;
    size_t n = text.size();
    size_t next_literal = 0;
    uint32_t depth = 0;
    uint32_t last_line = 0;

    auto push = [&](TokenKind kind, size_t from, size_t to, const StringLiteral* lit) {
        Token tok;
        tok.kind = kind;
        tok.text = text.substr(from, to - from);
        tok.offset = from;
        tok.line = scan.line_of(from);
        tok.column = scan.column_of(from);
        tok.line_start = tok.line != last_line;
        tok.literal = lit;
        last_line = tok.line;
        if (kind == TokenKind::Punct && tok.text == "}" && depth > 0) {
            --depth;
        }
        tok.depth = depth;
        if (kind == TokenKind::Punct && tok.text == "{") {
            ++depth;
        }
        tokens.push_back(tok);
    };

    size_t i = 0;
    while (i < n) {
        while (next_literal < scan.strings.size() && scan.strings[next_literal].offset < i) {
            ++next_literal;
        }
        if (next_literal < scan.strings.size() && scan.strings[next_literal].offset == i) {
            const auto& lit = scan.strings[next_literal];
            push(TokenKind::String, i, lit.end, &lit);
            i = std::max(lit.end, i + 1);
            continue;
        }

        char c = text[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }
        if (is_ident_start(c)) {
            size_t j = i + 1;
            while (j < n && is_ident_char(text[j])) {
                ++j;
            }
            push(TokenKind::Ident, i, j, nullptr);
            i = j;
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c))) {
            size_t j = i + 1;
            while (j < n && (is_ident_char(text[j]) || text[j] == '\'' ||
                             (text[j] == '.' && j + 1 < n &&
                              std::isdigit(static_cast<unsigned char>(text[j + 1]))))) {
                ++j;
            }
            push(TokenKind::Number, i, j, nullptr);
            i = j;
            continue;
        }
        if (i + 3 <= n && is_punct3(text.substr(i, 3))) {
            push(TokenKind::Punct, i, i + 3, nullptr);
            i += 3;
            continue;
        }
        if (i + 2 <= n && is_punct2(text.substr(i, 2))) {
            push(TokenKind::Punct, i, i + 2, nullptr);
            i += 2;
            continue;
        }
        push(TokenKind::Punct, i, i + 1, nullptr);
        ++i;
    }
    return tokens;
}

} // namespace strata::ingest
