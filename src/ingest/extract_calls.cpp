//! # Call-Site Extraction
//!
//! Finds call expressions `callee(`, counts them, and records those whose
//! dotted callee chain matches the language's I/O deny list.
//!
//! ## Callee Chains
//!
//! | Source                      | Callee            |
//! |-----------------------------|-------------------|
//! | `fs.promises.readFile(p)`   | `fs.promises.readFile` |
//! | `std::fs::read(p)`          | `std.fs.read`     |
//! | `new Date()`                | `new Date`        |
//! | `client().query(sql)`       | `.query`          |
//! | `println!("x")`             | `println!`        |
//!
//! ## Declarations Are Not Calls
//!
//! An identifier followed by `(` is a declaration rather than a call when:
//! it follows a declaring keyword (`function`, `def`, `fn`, `func`); it is
//! preceded by a type or modifier identifier (`int main(`, `async save(`); it
//! sits directly inside an `interface`/`trait` body; or, for brace languages
//! without bare conditions, its parameter list is followed by `{` (or by a
//! `:` return annotation in JS/TS).

#include "ingest/extract_internal.hpp"
#include "strata/policy/glob.hpp"

#include <algorithm>
#include <iterator>

namespace strata::ingest::detail {

namespace {

/// Identifiers that take a parenthesised operand without being calls.
auto is_non_call_keyword(std::string_view word) -> bool {
    static constexpr std::string_view KEYWORDS[] = {
        "if",       "for",      "while",    "switch",   "catch",    "return",  "sizeof",
        "alignof",  "decltype", "typeof",   "function", "fn",       "func",    "def",
        "class",    "struct",   "elif",     "except",   "with",     "match",   "foreach",
        "using",    "lambda",   "and",      "or",       "not",      "in",      "is",
        "await",    "yield",    "throw",    "new",      "delete",   "import",  "export",
        "extends",  "implements", "loop",   "unsafe",   "do",       "else",    "case",
        "go",       "defer",    "noexcept", "static_assert", "synchronized", "assert",
        "interface", "trait",   "enum",     "union",    "operator", "template"};
    return std::find(std::begin(KEYWORDS), std::end(KEYWORDS), word) != std::end(KEYWORDS);
}

/// Identifiers that may directly precede a call expression.
auto may_precede_call(std::string_view word) -> bool {
    static constexpr std::string_view WORDS[] = {
        "return", "await", "new",  "throw", "raise", "yield", "else",   "case",
        "in",     "of",    "not",  "and",   "or",    "is",    "go",     "defer",
        "typeof", "delete", "if",  "elif",  "while", "assert", "with",  "match",
        "do",     "then",  "print", "co_await", "co_return", "co_yield", "instanceof"};
    return std::find(std::begin(WORDS), std::end(WORDS), word) != std::end(WORDS);
}

auto is_chain_link(const Token& tok) -> bool {
    return tok.is_punct(".") || tok.is_punct("::") || tok.is_punct("?.") || tok.is_punct("->");
}

auto body_rule_applies(Language lang) -> bool {
    return lang == Language::Cpp || lang == Language::Java || lang == Language::JavaScript ||
           lang == Language::TypeScript;
}

struct Call {
    std::string callee;
    size_t first = 0; ///< Index of the first token of the chain
};

/// Builds the callee chain ending at identifier `k`.
auto callee_chain(const Extraction& ex, size_t k) -> Call {
    Call call;
    size_t j = k;
    while (j >= 2 && is_chain_link(ex.at(j - 1)) && ex.at(j - 2).is_ident()) {
        j -= 2;
    }
    call.first = j;
    for (size_t t = j; t <= k; t += 2) {
        if (!call.callee.empty()) {
            call.callee += '.';
        }
        call.callee += ex.at(t).text;
    }
    if (j >= 1 && is_chain_link(ex.at(j - 1))) {
        call.callee = "." + call.callee; // member of a computed receiver
        call.first = j - 1;
    } else if (j >= 1 && ex.at(j - 1).is_ident("new")) {
        call.callee = "new " + call.callee;
    }
    return call;
}

} // namespace

void extract_calls(const Extraction& ex, const std::vector<std::string>& deny, FileFacts& facts) {
    bool pending_decl = false;
    std::vector<uint32_t> contract_bodies; // depths of interface/trait bodies
    bool contract_next_brace = false;

    for (size_t i = 0; i < ex.size(); ++i) {
        const auto& tok = ex.at(i);

        if (tok.is_punct("{")) {
            pending_decl = false;
            if (contract_next_brace) {
                contract_bodies.push_back(tok.depth + 1);
                contract_next_brace = false;
            }
            continue;
        }
        if (tok.is_punct("}")) {
            while (!contract_bodies.empty() && contract_bodies.back() > tok.depth) {
                contract_bodies.pop_back();
            }
            continue;
        }
        if (tok.is_punct(";") || tok.is_punct("=>")) {
            pending_decl = false;
            contract_next_brace = false;
            continue;
        }
        if (!tok.is_ident()) {
            continue;
        }
        if (tok.is("function") || tok.is("def") || tok.is("fn") || tok.is("func")) {
            pending_decl = true;
            continue;
        }
        if ((tok.is("interface") || tok.is("trait")) &&
            !(i > 0 && is_chain_link(ex.at(i - 1)))) {
            contract_next_brace = true;
            continue;
        }

        size_t paren = i + 1;
        if (ex.lang == Language::Rust && ex.at(paren).is_punct("!")) {
            ++paren; // macro invocation
        }
        if (!ex.at(paren).is_punct("(") || is_non_call_keyword(tok.text)) {
            continue;
        }

        if (pending_decl) {
            pending_decl = false;
            continue;
        }
        if (!contract_bodies.empty() && contract_bodies.back() == tok.depth) {
            continue;
        }

        Call call = callee_chain(ex, i);
        if (paren != i + 1) {
            call.callee += "!";
        }

        if (call.first > 0 && !ex.at(call.first).line_start) {
            const auto& before = ex.at(call.first - 1);
            if (before.is_ident() && !before.is("new") && !may_precede_call(before.text)) {
                continue; // typed declaration
            }
            if (ex.lang == Language::Java && before.is_punct("@")) {
                continue; // annotation
            }
        }

        size_t close = find_matching(ex, paren);
        if (close != NPOS && body_rule_applies(ex.lang)) {
            const auto& after = ex.at(close + 1);
            if (after.is_punct("{")) {
                continue;
            }
            bool js = ex.lang == Language::JavaScript || ex.lang == Language::TypeScript;
            if (js && after.is_punct(":") && ex.at(close + 2).is_ident()) {
                continue;
            }
        }

        ++facts.call_site_count;

        for (const auto& pattern : deny) {
            if (policy::wildcard_match(pattern, call.callee)) {
                CallSite site;
                site.callee = call.callee;
                site.matched_pattern = pattern;
                site.line = tok.line;
                site.column = ex.at(call.first).column;
                site.end_line = tok.line;
                facts.io_call_sites.insert(std::move(site));
                break;
            }
        }
    }
}

} // namespace strata::ingest::detail
