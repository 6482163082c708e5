//! # Export Extraction
//!
//! Collects the public symbols of a file and their kinds. The kind decides
//! whether a module counts as a pure contract (see `is_contract_kind`).
//!
//! | Language   | Exported when                                                    |
//! |------------|------------------------------------------------------------------|
//! | JS/TS      | `export` declarations, export lists, `exports.x =`               |
//! | Python     | top-level `def`/`class`/assignment not starting with `_`         |
//! | Go         | top-level declaration with a capitalised name                    |
//! | Rust       | top-level `pub` item                                             |
//! | Java       | top-level `public` type                                          |
//! | C++        | type, alias, constant or free function at namespace scope        |

#include "ingest/extract_internal.hpp"

#include <algorithm>
#include <cctype>

namespace strata::ingest::detail {

namespace {

void add(FileFacts& facts, std::string_view name, SymbolKind kind) {
    if (!name.empty()) {
        facts.exports.insert(Symbol{std::string(name), kind});
    }
}

auto is_all_caps(std::string_view name) -> bool {
    bool letter = false;
    for (char c : name) {
        auto u = static_cast<unsigned char>(c);
        if (std::islower(u)) {
            return false;
        }
        letter = letter || std::isupper(u);
    }
    return letter;
}

// ============================================================================
// JavaScript / TypeScript
// ============================================================================

/// True when the initializer starting at `k` is a function expression.
auto js_function_initializer(const Extraction& ex, size_t k) -> bool {
    const auto& tok = ex.at(k);
    if (tok.is_ident("async") || tok.is_ident("function")) {
        return true;
    }
    if (tok.is_ident() && ex.at(k + 1).is_punct("=>")) {
        return true;
    }
    if (tok.is_punct("(")) {
        size_t close = find_matching(ex, k);
        if (close == NPOS) {
            return false;
        }
        if (ex.at(close + 1).is_punct("=>")) {
            return true;
        }
        if (ex.at(close + 1).is_punct(":")) {
            // `(a): T => ...`
            for (size_t j = close + 2; j < ex.size() && j < close + 32; ++j) {
                if (ex.at(j).is_punct("=>")) {
                    return true;
                }
                if (ex.at(j).is_punct(";") || ex.at(j).is_punct("{")) {
                    return false;
                }
            }
        }
    }
    return false;
}

void js_export_declaration(const Extraction& ex, size_t i, FileFacts& facts) {
    size_t k = i + 1;
    if (ex.at(k).is_ident("declare")) {
        ++k;
    }
    const auto& kw = ex.at(k);

    if (kw.is_ident("default")) {
        const auto& next = ex.at(k + 1);
        if (next.is_ident("class") || (next.is_ident("abstract") && ex.at(k + 2).is_ident("class"))) {
            add(facts, "default", SymbolKind::Class);
        } else if (next.is_ident("function") || next.is_ident("async")) {
            add(facts, "default", SymbolKind::Function);
        } else if (next.is_ident("interface")) {
            add(facts, "default", SymbolKind::Interface);
        } else {
            add(facts, "default", SymbolKind::Variable);
        }
        return;
    }
    if (kw.is_ident("async") && ex.at(k + 1).is_ident("function")) {
        ++k;
    }
    const auto& decl = ex.at(k);
    size_t name_at = k + 1;
    if (ex.at(name_at).is_punct("*")) {
        ++name_at; // generator
    }
    const auto& name = ex.at(name_at);

    if (decl.is_ident("function") && name.is_ident()) {
        add(facts, name.text, SymbolKind::Function);
    } else if (decl.is_ident("class") && name.is_ident()) {
        add(facts, name.text, SymbolKind::Class);
    } else if (decl.is_ident("abstract") && ex.at(k + 1).is_ident("class")) {
        add(facts, ex.at(k + 2).text, SymbolKind::Class);
    } else if (decl.is_ident("interface") && name.is_ident()) {
        add(facts, name.text, SymbolKind::Interface);
    } else if (decl.is_ident("type") && name.is_ident()) {
        add(facts, name.text, SymbolKind::Type);
    } else if (decl.is_ident("enum") && name.is_ident()) {
        add(facts, name.text, SymbolKind::Enum);
    } else if (decl.is_ident("const") && name.is_ident("enum")) {
        add(facts, ex.at(k + 2).text, SymbolKind::Enum);
    } else if ((decl.is_ident("const") || decl.is_ident("let") || decl.is_ident("var")) &&
               name.is_ident()) {
        size_t j = k + 2;
        if (ex.at(j).is_punct(":")) {
            while (j < ex.size() && !ex.at(j).is_punct("=") && !ex.at(j).is_punct(";") &&
                   ex.at(j).line == name.line) {
                ++j;
            }
        }
        if (ex.at(j).is_punct("=") && js_function_initializer(ex, j + 1)) {
            add(facts, name.text, SymbolKind::Function);
        } else {
            add(facts, name.text,
                decl.is("const") ? SymbolKind::Constant : SymbolKind::Variable);
        }
    } else if (decl.is_punct("{") || (decl.is_ident("type") && name.is_punct("{"))) {
        size_t open = decl.is_punct("{") ? k : name_at;
        size_t close = find_matching(ex, open);
        if (close == NPOS) {
            return;
        }
        bool types_only = decl.is_ident("type");
        for (size_t j = open + 1; j < close; ++j) {
            const auto& tok = ex.at(j);
            if (!tok.is_ident() || tok.is("as")) {
                continue;
            }
            if (ex.at(j + 1).is_ident("as")) {
                continue; // exported under the alias
            }
            if (tok.is("type") && ex.at(j + 1).is_ident()) {
                continue;
            }
            add(facts, tok.text, types_only ? SymbolKind::Type : SymbolKind::Variable);
        }
    }
}

void js_exports(const Extraction& ex, FileFacts& facts) {
    for (size_t i = 0; i < ex.size(); ++i) {
        const auto& tok = ex.at(i);
        if (!tok.is_ident()) {
            continue;
        }
        bool member = i > 0 && ex.at(i - 1).is_punct(".");
        if (tok.is("export") && !member && tok.depth == 0) {
            js_export_declaration(ex, i, facts);
            continue;
        }
        // CommonJS: `exports.x = ...` and `module.exports.x = ...`
        if (tok.is("exports") && ex.at(i + 1).is_punct(".") && ex.at(i + 2).is_ident() &&
            ex.at(i + 3).is_punct("=")) {
            bool plain = !member;
            bool via_module = member && i >= 2 && ex.at(i - 2).is_ident("module");
            if (plain || via_module) {
                bool fn = js_function_initializer(ex, i + 4);
                add(facts, ex.at(i + 2).text, fn ? SymbolKind::Function : SymbolKind::Variable);
            }
        }
    }
}

// ============================================================================
// Python
// ============================================================================

auto python_class_kind(const Extraction& ex, size_t name_at) -> SymbolKind {
    // Decorator lines directly above the `class` keyword
    size_t j = name_at - 1;
    while (j > 0) {
        size_t start = j - 1;
        while (start > 0 && !ex.at(start).line_start) {
            --start;
        }
        if (!ex.at(start).is_punct("@")) {
            break;
        }
        for (size_t t = start; t < j; ++t) {
            if (ex.at(t).is_ident("dataclass")) {
                return SymbolKind::Struct;
            }
        }
        j = start;
    }
    if (!ex.at(name_at + 1).is_punct("(")) {
        return SymbolKind::Class;
    }
    size_t close = find_matching(ex, name_at + 1);
    if (close == NPOS) {
        return SymbolKind::Class;
    }
    for (size_t j = name_at + 2; j < close; ++j) {
        const auto& base = ex.at(j);
        if (base.is("Protocol") || base.is("ABC") || base.is("ABCMeta")) {
            return SymbolKind::Interface;
        }
        if (base.is("Enum") || base.is("IntEnum") || base.is("StrEnum") || base.is("Flag") ||
            base.is("IntFlag")) {
            return SymbolKind::Enum;
        }
        if (base.is("NamedTuple") || base.is("TypedDict")) {
            return SymbolKind::Type;
        }
    }
    return SymbolKind::Class;
}

void python_exports(const Extraction& ex, FileFacts& facts) {
    for (size_t i = 0; i < ex.size(); ++i) {
        const auto& tok = ex.at(i);
        if (!tok.line_start || tok.column != 1 || !tok.is_ident()) {
            continue;
        }
        size_t k = i;
        if (tok.is("async") && ex.at(i + 1).is_ident("def")) {
            ++k;
        }
        const auto& kw = ex.at(k);
        const auto& name = ex.at(k + 1);

        if (kw.is("def") && name.is_ident()) {
            if (!name.text.starts_with("_")) {
                add(facts, name.text, SymbolKind::Function);
            }
        } else if (kw.is("class") && name.is_ident()) {
            if (!name.text.starts_with("_")) {
                add(facts, name.text, python_class_kind(ex, k + 1));
            }
        } else if (kw.is("type") && name.is_ident() && ex.at(k + 2).is_punct("=")) {
            add(facts, name.text, SymbolKind::Type);
        } else if (!tok.text.starts_with("_")) {
            const auto& next = ex.at(i + 1);
            bool assign = next.is_punct("=") && !ex.at(i + 2).is_punct("=");
            bool annotated = next.is_punct(":") && ex.at(i + 2).line == tok.line;
            if (assign || annotated) {
                add(facts, tok.text,
                    is_all_caps(tok.text) ? SymbolKind::Constant : SymbolKind::Variable);
            }
        }
    }
}

// ============================================================================
// Go
// ============================================================================

void go_type_spec(const Extraction& ex, size_t name_at, FileFacts& facts) {
    const auto& name = ex.at(name_at);
    if (!name.is_ident() || !starts_upper(name.text)) {
        return;
    }
    size_t k = name_at + 1;
    if (ex.at(k).is_punct("[")) {
        size_t close = find_matching(ex, k);
        k = close == NPOS ? k + 1 : close + 1; // type parameters
    }
    if (ex.at(k).is_punct("=")) {
        ++k;
    }
    const auto& def = ex.at(k);
    if (def.is_ident("struct")) {
        add(facts, name.text, SymbolKind::Struct);
    } else if (def.is_ident("interface")) {
        add(facts, name.text, SymbolKind::Interface);
    } else {
        add(facts, name.text, SymbolKind::Type);
    }
}

void go_exports(const Extraction& ex, FileFacts& facts) {
    for (size_t i = 0; i < ex.size(); ++i) {
        const auto& tok = ex.at(i);
        if (tok.depth != 0 || !tok.line_start || !tok.is_ident()) {
            continue;
        }
        if (tok.is("func")) {
            const auto& name = ex.at(i + 1);
            if (name.is_ident() && starts_upper(name.text)) {
                add(facts, name.text, SymbolKind::Function);
            }
            continue;
        }
        bool is_type = tok.is("type");
        bool is_const = tok.is("const");
        bool is_var = tok.is("var");
        if (!is_type && !is_const && !is_var) {
            continue;
        }
        auto value_kind = is_const ? SymbolKind::Constant : SymbolKind::Variable;

        if (!ex.at(i + 1).is_punct("(")) {
            if (is_type) {
                go_type_spec(ex, i + 1, facts);
            } else if (ex.at(i + 1).is_ident() && starts_upper(ex.at(i + 1).text)) {
                add(facts, ex.at(i + 1).text, value_kind);
            }
            continue;
        }

        size_t close = find_matching(ex, i + 1);
        if (close == NPOS) {
            continue;
        }
        for (size_t j = i + 2; j < close; ++j) {
            const auto& entry = ex.at(j);
            if (!entry.line_start || !entry.is_ident() || entry.depth != 0) {
                continue;
            }
            if (is_type) {
                go_type_spec(ex, j, facts);
            } else if (starts_upper(entry.text)) {
                add(facts, entry.text, value_kind);
            }
        }
        i = close;
    }
}

// ============================================================================
// Rust
// ============================================================================

void rust_exports(const Extraction& ex, FileFacts& facts) {
    for (size_t i = 0; i < ex.size(); ++i) {
        const auto& tok = ex.at(i);
        if (!tok.is_ident("pub") || tok.depth != 0) {
            continue;
        }
        size_t k = i + 1;
        if (ex.at(k).is_punct("(")) {
            size_t close = find_matching(ex, k);
            if (close == NPOS) {
                continue;
            }
            k = close + 1;
        }
        bool is_const_fn = false;
        while (ex.at(k).is_ident("async") || ex.at(k).is_ident("unsafe") ||
               ex.at(k).is_ident("extern") || ex.at(k).kind == TokenKind::String ||
               (ex.at(k).is_ident("const") && ex.at(k + 1).is_ident("fn"))) {
            is_const_fn = is_const_fn || ex.at(k).is("const");
            ++k;
        }
        const auto& kw = ex.at(k);
        size_t name_at = k + 1;
        if (kw.is_ident("static") && ex.at(name_at).is_ident("mut")) {
            ++name_at;
        }
        const auto& name = ex.at(name_at);
        if (!name.is_ident()) {
            continue;
        }

        if (kw.is("fn")) {
            add(facts, name.text, SymbolKind::Function);
        } else if (kw.is("struct") || kw.is("union")) {
            add(facts, name.text, SymbolKind::Struct);
        } else if (kw.is("enum")) {
            add(facts, name.text, SymbolKind::Enum);
        } else if (kw.is("trait")) {
            add(facts, name.text, SymbolKind::Trait);
        } else if (kw.is("type")) {
            add(facts, name.text, SymbolKind::Type);
        } else if (kw.is("const") && !is_const_fn) {
            add(facts, name.text, SymbolKind::Constant);
        } else if (kw.is("static")) {
            add(facts, name.text, SymbolKind::Variable);
        }
    }
}

// ============================================================================
// Java
// ============================================================================

auto is_java_modifier(const Token& tok) -> bool {
    static constexpr std::string_view MODIFIERS[] = {"public", "abstract", "final",   "static",
                                                     "sealed", "strictfp", "private", "protected"};
    return tok.is_ident() &&
           std::find(std::begin(MODIFIERS), std::end(MODIFIERS), tok.text) != std::end(MODIFIERS);
}

void java_exports(const Extraction& ex, FileFacts& facts) {
    for (size_t i = 0; i < ex.size(); ++i) {
        const auto& tok = ex.at(i);
        if (tok.depth != 0 || !tok.is_ident()) {
            continue;
        }
        SymbolKind kind;
        if (tok.is("class")) {
            kind = SymbolKind::Class;
        } else if (tok.is("interface")) {
            kind = SymbolKind::Interface;
        } else if (tok.is("enum")) {
            kind = SymbolKind::Enum;
        } else if (tok.is("record")) {
            kind = SymbolKind::Struct;
        } else {
            continue;
        }
        const auto& name = ex.at(i + 1);
        if (!name.is_ident()) {
            continue;
        }

        bool is_public = false;
        size_t j = i;
        if (j > 0 && ex.at(j - 1).is_punct("@")) {
            --j; // @interface
        }
        while (j > 0 && is_java_modifier(ex.at(j - 1))) {
            --j;
            is_public = is_public || ex.at(j).is("public");
        }
        if (is_public) {
            add(facts, name.text, kind);
        }
    }
}

// ============================================================================
// C / C++
// ============================================================================

/// Scope depth per token, not counting `namespace` and `extern "C"` braces.
auto cpp_scope_depths(const Extraction& ex) -> std::vector<uint32_t> {
    std::vector<uint32_t> scope(ex.size(), 0);
    std::vector<bool> stack;
    uint32_t depth = 0;
    for (size_t i = 0; i < ex.size(); ++i) {
        const auto& tok = ex.at(i);
        if (tok.is_punct("}")) {
            if (!stack.empty()) {
                if (!stack.back()) {
                    --depth;
                }
                stack.pop_back();
            }
            scope[i] = depth;
            continue;
        }
        scope[i] = depth;
        if (!tok.is_punct("{")) {
            continue;
        }
        bool is_namespace = false;
        size_t j = i;
        while (j > 0 && (ex.at(j - 1).is_ident() || ex.at(j - 1).is_punct("::"))) {
            --j;
            if (ex.at(j).is_ident("namespace")) {
                is_namespace = true;
                break;
            }
        }
        if (i >= 2 && ex.at(i - 1).kind == TokenKind::String && ex.at(i - 2).is_ident("extern")) {
            is_namespace = true;
        }
        stack.push_back(is_namespace);
        if (!is_namespace) {
            ++depth;
        }
    }
    return scope;
}

auto is_cpp_keyword(std::string_view word) -> bool {
    static constexpr std::string_view KEYWORDS[] = {
        "if",     "for",    "while",  "switch",    "return",   "sizeof",   "alignof",
        "decltype", "catch", "throw", "new",       "delete",   "case",     "else",
        "do",     "static_assert", "noexcept", "typeid", "co_return", "co_await", "operator",
        "template", "using", "typedef"};
    return std::find(std::begin(KEYWORDS), std::end(KEYWORDS), word) != std::end(KEYWORDS);
}

void cpp_exports(const Extraction& ex, FileFacts& facts) {
    auto scope = cpp_scope_depths(ex);
    int parens = 0;
    for (size_t i = 0; i < ex.size(); ++i) {
        const auto& tok = ex.at(i);
        if (tok.is_punct("(")) {
            ++parens;
        } else if (tok.is_punct(")")) {
            parens = std::max(0, parens - 1);
        }
        if (scope[i] != 0 || parens != 0 || !tok.is_ident()) {
            continue;
        }

        if (tok.is("class") || tok.is("struct") || tok.is("union")) {
            if (i > 0 && (ex.at(i - 1).is_ident("enum") || ex.at(i - 1).is_ident("friend"))) {
                continue;
            }
            const auto& name = ex.at(i + 1);
            size_t k = i + 2;
            if (ex.at(k).is_ident("final")) {
                ++k;
            }
            if (name.is_ident() && (ex.at(k).is_punct("{") || ex.at(k).is_punct(":"))) {
                add(facts, name.text, tok.is("class") ? SymbolKind::Class : SymbolKind::Struct);
            }
        } else if (tok.is("enum")) {
            size_t k = i + 1;
            if (ex.at(k).is_ident("class") || ex.at(k).is_ident("struct")) {
                ++k;
            }
            const auto& name = ex.at(k);
            if (name.is_ident() && (ex.at(k + 1).is_punct("{") || ex.at(k + 1).is_punct(":"))) {
                add(facts, name.text, SymbolKind::Enum);
            }
        } else if (tok.is("using") && ex.at(i + 1).is_ident() && ex.at(i + 2).is_punct("=")) {
            add(facts, ex.at(i + 1).text, SymbolKind::Type);
        } else if (tok.is("typedef")) {
            size_t k = i + 1;
            while (k < ex.size() && !ex.at(k).is_punct(";")) {
                ++k;
            }
            if (k > i + 1 && ex.at(k - 1).is_ident()) {
                add(facts, ex.at(k - 1).text, SymbolKind::Type);
            }
        } else if ((tok.is("constexpr") || tok.is("const")) && tok.line_start) {
            size_t k = i + 1;
            while (k < ex.size() && ex.at(k).line == tok.line && !ex.at(k).is_punct("=") &&
                   !ex.at(k).is_punct("{") && !ex.at(k).is_punct(";") &&
                   !ex.at(k).is_punct("(")) {
                ++k;
            }
            if ((ex.at(k).is_punct("=") || ex.at(k).is_punct("{")) && ex.at(k - 1).is_ident()) {
                add(facts, ex.at(k - 1).text, SymbolKind::Constant);
            }
        } else if (ex.at(i + 1).is_punct("(") && i > 0 && !is_cpp_keyword(tok.text)) {
            const auto& prev = ex.at(i - 1);
            bool typed = (prev.is_ident() && !is_cpp_keyword(prev.text)) || prev.is_punct("*") ||
                         prev.is_punct("&") || prev.is_punct(">");
            bool is_static = false;
            bool initializer = false;
            for (size_t j = i; j-- > 0 && ex.at(j).line == tok.line;) {
                is_static = is_static || ex.at(j).is_ident("static");
                initializer = initializer || ex.at(j).is_punct("=");
            }
            if (typed && !is_static && !initializer) {
                add(facts, tok.text, SymbolKind::Function);
            }
        }
    }
}

} // namespace

void extract_exports(const Extraction& ex, FileFacts& facts) {
    switch (ex.lang) {
    case Language::Cpp:
        cpp_exports(ex, facts);
        break;
    case Language::JavaScript:
    case Language::TypeScript:
        js_exports(ex, facts);
        break;
    case Language::Python:
        python_exports(ex, facts);
        break;
    case Language::Go:
        go_exports(ex, facts);
        break;
    case Language::Rust:
        rust_exports(ex, facts);
        break;
    case Language::Java:
        java_exports(ex, facts);
        break;
    }
}

} // namespace strata::ingest::detail
