//! # Empty Error-Handler Extraction
//!
//! Records error-handling constructs whose body performs no action. Comments
//! are already blanked, so a handler holding only a comment is empty too.
//!
//! | Language         | Construct                                       |
//! |------------------|-------------------------------------------------|
//! | C++, Java, JS/TS | `catch (...) { }`                               |
//! | JS/TS            | `.catch(() => {})`, `.catch(function () {})`    |
//! | Python           | `except ...:` whose body is only `pass` or `...`|
//! | Go               | `if err != nil { }`                             |
//! | Rust             | `Err(_) => {}`, `Err(_) => ()`                  |

#include "ingest/extract_internal.hpp"

#include <cctype>

namespace strata::ingest::detail {

namespace {

void add_site(FileFacts& facts, const char* construct, const Token& start, const Token& end) {
    CallSite site;
    site.callee = construct;
    site.matched_pattern = construct;
    site.line = start.line;
    site.column = start.column;
    site.end_line = end.line;
    facts.empty_handler_sites.insert(std::move(site));
}

/// True when the braces at `open` enclose nothing but `;`.
auto empty_block(const Extraction& ex, size_t open, size_t& close) -> bool {
    if (!ex.at(open).is_punct("{")) {
        return false;
    }
    close = find_matching(ex, open);
    if (close == NPOS) {
        return false;
    }
    for (size_t k = open + 1; k < close; ++k) {
        if (!ex.at(k).is_punct(";")) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// catch blocks
// ============================================================================

void catch_blocks(const Extraction& ex, FileFacts& facts) {
    bool js = ex.lang == Language::JavaScript || ex.lang == Language::TypeScript;
    for (size_t i = 0; i < ex.size(); ++i) {
        const auto& tok = ex.at(i);
        if (!tok.is_ident("catch")) {
            continue;
        }
        bool member = i > 0 && (ex.at(i - 1).is_punct(".") || ex.at(i - 1).is_punct("?."));

        if (!member) {
            size_t k = i + 1;
            if (ex.at(k).is_punct("(")) {
                size_t close = find_matching(ex, k);
                if (close == NPOS) {
                    continue;
                }
                k = close + 1;
            }
            size_t end = NPOS;
            if (empty_block(ex, k, end)) {
                add_site(facts, "catch", tok, ex.at(end));
            }
            continue;
        }

        if (!js || !ex.at(i + 1).is_punct("(")) {
            continue;
        }
        // `.catch(<handler>)`
        size_t call_close = find_matching(ex, i + 1);
        if (call_close == NPOS) {
            continue;
        }
        size_t k = i + 2;
        if (ex.at(k).is_ident("async")) {
            ++k;
        }
        if (ex.at(k).is_ident("function")) {
            ++k;
            if (ex.at(k).is_ident()) {
                ++k;
            }
        }
        if (ex.at(k).is_punct("(")) {
            size_t params = find_matching(ex, k);
            if (params == NPOS) {
                continue;
            }
            k = params + 1;
        } else if (ex.at(k).is_ident()) {
            ++k;
        }
        if (ex.at(k).is_punct("=>")) {
            ++k;
        }
        size_t end = NPOS;
        bool empty = empty_block(ex, k, end) && end + 1 == call_close;
        if (!empty && ex.at(k).is_punct("(") && ex.at(k + 1).is_punct(")") &&
            k + 2 == call_close) {
            empty = true; // `() => ()`
        }
        if (!empty && (ex.at(k).is_ident("undefined") || ex.at(k).is_ident("null")) &&
            k + 1 == call_close) {
            empty = true;
        }
        if (empty) {
            add_site(facts, ".catch()", tok, ex.at(call_close));
        }
    }
}

// ============================================================================
// Python except
// ============================================================================

void python_excepts(const Extraction& ex, FileFacts& facts) {
    for (size_t i = 0; i < ex.size(); ++i) {
        const auto& tok = ex.at(i);
        if (!tok.is_ident("except") || !tok.line_start) {
            continue;
        }
        size_t k = i + 1;
        while (k < ex.size() && !ex.at(k).is_punct(":")) {
            ++k;
        }
        if (k >= ex.size()) {
            continue;
        }
        size_t body = k + 1;
        size_t last = NPOS;
        bool empty = true;

        if (body < ex.size() && ex.at(body).line == ex.at(k).line) {
            // Inline body: `except E: pass`
            for (size_t j = body; j < ex.size() && ex.at(j).line == ex.at(k).line; ++j) {
                const auto& t = ex.at(j);
                if (!t.is_ident("pass") && !t.is_punct("...") && !t.is_punct(";")) {
                    empty = false;
                }
                last = j;
            }
        } else {
            for (size_t j = body; j < ex.size(); ++j) {
                const auto& t = ex.at(j);
                if (t.line_start && t.column <= tok.column) {
                    break;
                }
                if (!t.is_ident("pass") && !t.is_punct("...") && !t.is_punct(";")) {
                    empty = false;
                }
                last = j;
            }
        }
        if (empty && last != NPOS) {
            add_site(facts, "except", tok, ex.at(last));
        }
    }
}

// ============================================================================
// Go
// ============================================================================

auto mentions_err(std::string_view name) -> bool {
    for (size_t i = 0; i + 3 <= name.size(); ++i) {
        auto a = static_cast<char>(std::tolower(static_cast<unsigned char>(name[i])));
        auto b = static_cast<char>(std::tolower(static_cast<unsigned char>(name[i + 1])));
        auto c = static_cast<char>(std::tolower(static_cast<unsigned char>(name[i + 2])));
        if (a == 'e' && b == 'r' && c == 'r') {
            return true;
        }
    }
    return false;
}

void go_err_checks(const Extraction& ex, FileFacts& facts) {
    for (size_t i = 0; i + 4 < ex.size(); ++i) {
        const auto& name = ex.at(i);
        if (!name.is_ident() || !mentions_err(name.text) || !ex.at(i + 1).is_punct("!=") ||
            !ex.at(i + 2).is_ident("nil")) {
            continue;
        }
        size_t end = NPOS;
        if (!empty_block(ex, i + 3, end)) {
            continue;
        }
        // Locate the `if` that owns the condition
        size_t start = i;
        while (start > 0 && !ex.at(start).is_ident("if") && ex.at(start).line == name.line) {
            --start;
        }
        const auto& anchor = ex.at(start).is_ident("if") ? ex.at(start) : name;
        add_site(facts, "if err != nil", anchor, ex.at(end));
    }
}

// ============================================================================
// Rust
// ============================================================================

void rust_err_arms(const Extraction& ex, FileFacts& facts) {
    for (size_t i = 0; i < ex.size(); ++i) {
        const auto& tok = ex.at(i);
        if (!tok.is_ident("Err") || !ex.at(i + 1).is_punct("(")) {
            continue;
        }
        size_t close = find_matching(ex, i + 1);
        if (close == NPOS || !ex.at(close + 1).is_punct("=>")) {
            continue;
        }
        size_t k = close + 2;
        size_t end = NPOS;
        if (empty_block(ex, k, end)) {
            add_site(facts, "Err(_) =>", tok, ex.at(end));
        } else if (ex.at(k).is_punct("(") && ex.at(k + 1).is_punct(")")) {
            add_site(facts, "Err(_) =>", tok, ex.at(k + 1));
        }
    }
}

} // namespace

void extract_empty_handlers(const Extraction& ex, FileFacts& facts) {
    switch (ex.lang) {
    case Language::Cpp:
    case Language::Java:
    case Language::JavaScript:
    case Language::TypeScript:
        catch_blocks(ex, facts);
        break;
    case Language::Python:
        python_excepts(ex, facts);
        break;
    case Language::Go:
        go_err_checks(ex, facts);
        break;
    case Language::Rust:
        rust_err_arms(ex, facts);
        break;
    }
}

} // namespace strata::ingest::detail
