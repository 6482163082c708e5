//! # Import Extraction
//!
//! Recognises import statements per language and records them as `ImportRef`
//! values in source order. Module paths are normalised to slash form.
//!
//! | Language   | Forms                                                           |
//! |------------|-----------------------------------------------------------------|
//! | C++        | `#include "x"`, `#include <x>`                                  |
//! | JS/TS      | `import … from "x"`, `import "x"`, `import("x")`, `export … from "x"`, `require("x")` |
//! | Python     | `import a.b`, `from .a import b`                                |
//! | Go         | `import "x"`, `import ( … )`                                    |
//! | Rust       | `use a::{b, c};`, `mod x;`, `extern crate x;`                   |
//! | Java       | `import a.b.C;`, `import a.b.*;`, `import static a.b.C.m;`      |

#include "ingest/extract_internal.hpp"

#include <filesystem>
#include <map>

namespace strata::ingest::detail {

namespace {

auto is_relative_specifier(std::string_view spec) -> bool {
    return spec == "." || spec == ".." || spec.starts_with("./") || spec.starts_with("../");
}

auto make_import(std::string spec, uint32_t line, bool local) -> ImportRef {
    ImportRef ref;
    ref.raw_specifier = std::move(spec);
    ref.line = line;
    ref.local_form = local;
    return ref;
}

// ============================================================================
// C / C++
// ============================================================================

void cpp_imports(const Extraction& ex, FileFacts& facts) {
    for (size_t i = 0; i + 2 < ex.size(); ++i) {
        const auto& hash = ex.at(i);
        if (!hash.is_punct("#") || !hash.line_start) {
            continue;
        }
        const auto& directive = ex.at(i + 1);
        if (!directive.is_ident("include") || directive.line != hash.line) {
            continue;
        }
        const auto& target = ex.at(i + 2);
        if (target.line != hash.line) {
            continue;
        }
        if (target.kind == TokenKind::String && target.literal) {
            facts.imports.push_back(make_import(target.literal->value, hash.line, true));
        } else if (target.is_punct("<")) {
            std::string_view text = ex.scan.text;
            size_t close = text.find('>', target.offset);
            size_t eol = text.find('\n', target.offset);
            if (close == std::string_view::npos || close > eol) {
                continue;
            }
            std::string spec(text.substr(target.offset + 1, close - target.offset - 1));
            facts.imports.push_back(make_import(std::move(spec), hash.line, false));
        }
    }
}

// ============================================================================
// JavaScript / TypeScript
// ============================================================================

/// Parses `{ a, b as c, type d }` starting at the `{`; returns the imported names.
auto js_named_bindings(const Extraction& ex, size_t open, size_t close) -> std::set<std::string> {
    std::set<std::string> names;
    bool expect_name = true;
    for (size_t k = open + 1; k < close; ++k) {
        const auto& tok = ex.at(k);
        if (tok.is_punct(",")) {
            expect_name = true;
            continue;
        }
        if (!expect_name || !tok.is_ident()) {
            continue;
        }
        if ((tok.is("type") || tok.is("typeof")) && ex.at(k + 1).is_ident() &&
            !ex.at(k + 1).is("as")) {
            continue;
        }
        names.insert(std::string(tok.text));
        expect_name = false;
    }
    return names;
}

/// `import <bindings> from "x"` with `i` at `import`. Returns the index after
/// the statement.
auto js_import_statement(const Extraction& ex, size_t i, FileFacts& facts) -> size_t {
    const auto& kw = ex.at(i);
    size_t k = i + 1;
    std::set<std::string> symbols;

    if (ex.at(k).is_ident("type") || ex.at(k).is_ident("typeof")) {
        if (!ex.at(k + 1).is_ident("from") || ex.at(k + 2).kind != TokenKind::String) {
            ++k;
        }
    }

    for (size_t limit = 0; k < ex.size() && limit < 512; ++limit) {
        const auto& tok = ex.at(k);
        if (tok.is_punct(";")) {
            return k;
        }
        if (tok.is_ident("from") && ex.at(k + 1).kind == TokenKind::String) {
            const auto* lit = ex.at(k + 1).literal;
            auto ref = make_import(lit->value, kw.line, is_relative_specifier(lit->value));
            ref.symbols = std::move(symbols);
            facts.imports.push_back(std::move(ref));
            return k + 2;
        }
        if (tok.is_punct("=") && ex.at(k + 1).is_ident("require")) {
            return k; // TS `import x = require("y")`; the require is picked up on its own
        }
        if (tok.is_punct("{")) {
            size_t close = find_matching(ex, k);
            if (close == NPOS) {
                return k + 1;
            }
            auto named = js_named_bindings(ex, k, close);
            symbols.insert(named.begin(), named.end());
            k = close + 1;
            continue;
        }
        if (tok.is_punct("*")) {
            symbols.insert("*");
            k += ex.at(k + 1).is_ident("as") ? 3 : 1;
            continue;
        }
        if (tok.is_ident() && !tok.is("as")) {
            symbols.insert("default");
        }
        ++k;
    }
    return k;
}

/// `export … from "x"` with `i` at `export`.
void js_reexport(const Extraction& ex, size_t i, FileFacts& facts) {
    size_t k = i + 1;
    if (ex.at(k).is_ident("type")) {
        ++k;
    }
    std::set<std::string> symbols;
    if (ex.at(k).is_punct("*")) {
        symbols.insert("*");
        k += ex.at(k + 1).is_ident("as") ? 3 : 1;
    } else if (ex.at(k).is_punct("{")) {
        size_t close = find_matching(ex, k);
        if (close == NPOS) {
            return;
        }
        symbols = js_named_bindings(ex, k, close);
        k = close + 1;
    } else {
        return;
    }
    if (ex.at(k).is_ident("from") && ex.at(k + 1).kind == TokenKind::String) {
        const auto* lit = ex.at(k + 1).literal;
        auto ref = make_import(lit->value, ex.at(i).line, is_relative_specifier(lit->value));
        ref.symbols = std::move(symbols);
        facts.imports.push_back(std::move(ref));
    }
}

void js_imports(const Extraction& ex, FileFacts& facts) {
    for (size_t i = 0; i < ex.size(); ++i) {
        const auto& tok = ex.at(i);
        if (!tok.is_ident()) {
            continue;
        }
        bool member = i > 0 && (ex.at(i - 1).is_punct(".") || ex.at(i - 1).is_punct("?."));
        if (member) {
            continue;
        }

        if (tok.is("import")) {
            const auto& next = ex.at(i + 1);
            if (next.kind == TokenKind::String) {
                facts.imports.push_back(make_import(next.literal->value, tok.line,
                                                    is_relative_specifier(next.literal->value)));
                ++i;
            } else if (next.is_punct("(")) {
                const auto& arg = ex.at(i + 2);
                if (arg.kind == TokenKind::String && ex.at(i + 3).is_punct(")")) {
                    facts.imports.push_back(make_import(arg.literal->value, tok.line,
                                                        is_relative_specifier(arg.literal->value)));
                }
            } else if (!next.is_punct(".")) {
                i = js_import_statement(ex, i, facts) - 1;
            }
        } else if (tok.is("export")) {
            js_reexport(ex, i, facts);
        } else if (tok.is("require") && ex.at(i + 1).is_punct("(") &&
                   ex.at(i + 2).kind == TokenKind::String && ex.at(i + 3).is_punct(")")) {
            const auto* lit = ex.at(i + 2).literal;
            facts.imports.push_back(
                make_import(lit->value, tok.line, is_relative_specifier(lit->value)));
        }
    }
}

// ============================================================================
// Python
// ============================================================================

/// Reads a dotted name starting at `k`; returns the name and the next index.
auto python_dotted(const Extraction& ex, size_t k, uint32_t line, std::string& out) -> size_t {
    while (k < ex.size() && ex.at(k).line == line) {
        const auto& tok = ex.at(k);
        if (tok.is_ident("import")) {
            break;
        }
        if (tok.is_ident() && (out.empty() || out.back() == '.')) {
            out += tok.text;
        } else if (tok.is_punct(".") && !out.empty() && out.back() != '.') {
            out += '.';
        } else {
            break;
        }
        ++k;
    }
    return k;
}

auto python_statement_start(const Extraction& ex, size_t i) -> bool {
    if (ex.at(i).line_start) {
        return true;
    }
    return i > 0 && (ex.at(i - 1).is_punct(";") || ex.at(i - 1).is_punct(":"));
}

void python_imports(const Extraction& ex, FileFacts& facts) {
    for (size_t i = 0; i < ex.size(); ++i) {
        const auto& tok = ex.at(i);
        if (!tok.is_ident() || !python_statement_start(ex, i)) {
            continue;
        }

        if (tok.is("import")) {
            size_t k = i + 1;
            while (k < ex.size() && ex.at(k).line == tok.line) {
                std::string name;
                k = python_dotted(ex, k, tok.line, name);
                if (name.empty()) {
                    break;
                }
                facts.imports.push_back(make_import(dotted_to_slash(name), tok.line, false));
                if (ex.at(k).is_ident("as")) {
                    k += 2;
                }
                if (!ex.at(k).is_punct(",") || ex.at(k).line != tok.line) {
                    break;
                }
                ++k;
            }
            i = k > i ? k - 1 : i;
            continue;
        }

        if (!tok.is("from")) {
            continue;
        }

        size_t k = i + 1;
        size_t dots = 0;
        while (ex.at(k).line == tok.line &&
               (ex.at(k).is_punct(".") || ex.at(k).is_punct("..."))) {
            dots += ex.at(k).text.size();
            ++k;
        }
        std::string module;
        k = python_dotted(ex, k, tok.line, module);
        if (!ex.at(k).is_ident("import")) {
            continue;
        }
        ++k;

        std::set<std::string> symbols;
        bool paren = ex.at(k).is_punct("(");
        size_t end = paren ? find_matching(ex, k) : NPOS;
        if (paren) {
            end = end == NPOS ? ex.size() : end;
            ++k;
        }
        for (; k < ex.size(); ++k) {
            const auto& name = ex.at(k);
            if (paren ? k >= end : name.line != tok.line) {
                break;
            }
            if (name.is_punct("*")) {
                symbols.insert("*");
            } else if (name.is_ident() && !name.is("as") && !ex.at(k - 1).is_ident("as")) {
                symbols.insert(std::string(name.text));
            }
        }

        std::string spec;
        if (dots == 0) {
            spec = dotted_to_slash(module);
        } else {
            spec = dots == 1 ? "." : "..";
            for (size_t d = 2; d < dots; ++d) {
                spec += "/..";
            }
            if (!module.empty()) {
                spec += "/" + dotted_to_slash(module);
            }
        }
        if (spec.empty()) {
            continue;
        }
        auto ref = make_import(std::move(spec), tok.line, dots > 0);
        ref.symbols = std::move(symbols);
        facts.imports.push_back(std::move(ref));
        i = k > i ? k - 1 : i;
    }
}

// ============================================================================
// Go
// ============================================================================

void go_import_spec(const Extraction& ex, size_t k, FileFacts& facts) {
    const auto& tok = ex.at(k);
    if (tok.kind != TokenKind::String || !tok.literal) {
        return;
    }
    auto ref = make_import(tok.literal->value, tok.line, is_relative_specifier(tok.literal->value));
    ref.package_import = true;
    facts.imports.push_back(std::move(ref));
}

void go_imports(const Extraction& ex, FileFacts& facts) {
    for (size_t i = 0; i < ex.size(); ++i) {
        const auto& tok = ex.at(i);
        if (!tok.is_ident("import") || tok.depth != 0) {
            continue;
        }
        size_t k = i + 1;
        if (ex.at(k).is_punct("(")) {
            size_t close = find_matching(ex, k);
            if (close == NPOS) {
                close = ex.size();
            }
            for (size_t j = k + 1; j < close; ++j) {
                go_import_spec(ex, j, facts);
            }
            i = close;
            continue;
        }
        if (ex.at(k).is_ident() || ex.at(k).is_punct(".") || ex.at(k).is_punct("_")) {
            ++k;
        }
        go_import_spec(ex, k, facts);
    }
}

// ============================================================================
// Rust
// ============================================================================

struct UseLeaf {
    std::vector<std::string> segments;
    std::string leaf;
};

/// Parses one use tree starting at `k`, appending leaves. Returns the index
/// after the tree.
auto rust_use_tree(const Extraction& ex, size_t k, std::vector<std::string> prefix,
                   std::vector<UseLeaf>& leaves) -> size_t {
    if (ex.at(k).is_punct("::")) {
        ++k; // leading `::`
    }
    while (k < ex.size()) {
        const auto& tok = ex.at(k);
        if (tok.is_punct("{")) {
            size_t close = find_matching(ex, k);
            if (close == NPOS) {
                return ex.size();
            }
            size_t j = k + 1;
            while (j < close) {
                j = rust_use_tree(ex, j, prefix, leaves);
                while (j < close && !ex.at(j).is_punct(",")) {
                    ++j;
                }
                ++j;
            }
            return close + 1;
        }
        if (tok.is_punct("*")) {
            leaves.push_back({prefix, "*"});
            return k + 1;
        }
        if (!tok.is_ident()) {
            return k;
        }
        if (ex.at(k + 1).is_punct("::")) {
            prefix.emplace_back(tok.text);
            k += 2;
            continue;
        }
        leaves.push_back({prefix, std::string(tok.text)});
        k += 1;
        if (ex.at(k).is_ident("as")) {
            k += 2;
        }
        return k;
    }
    return k;
}

auto normalize_relative(const std::string& path) -> std::string {
    auto normal = std::filesystem::path(path).lexically_normal().generic_string();
    while (!normal.empty() && normal.back() == '/') {
        normal.pop_back();
    }
    if (normal.empty() || normal == ".") {
        return ".";
    }
    if (normal.starts_with("..")) {
        return normal;
    }
    return "./" + normal;
}

/// Directory of the module `self` refers to, relative to the file's directory.
auto rust_self_dir(const std::string& path) -> std::string {
    auto name = std::filesystem::path(path).filename().string();
    if (name == "mod.rs" || name == "lib.rs" || name == "main.rs") {
        return ".";
    }
    return "./" + std::filesystem::path(path).stem().string();
}

void rust_imports(const Extraction& ex, FileFacts& facts) {
    for (size_t i = 0; i < ex.size(); ++i) {
        const auto& tok = ex.at(i);

        if (tok.is_ident("mod") && ex.at(i + 1).is_ident() && ex.at(i + 2).is_punct(";")) {
            std::string spec =
                normalize_relative(rust_self_dir(facts.path) + "/" + std::string(ex.at(i + 1).text));
            facts.imports.push_back(make_import(std::move(spec), tok.line, true));
            continue;
        }
        if (tok.is_ident("extern") && ex.at(i + 1).is_ident("crate") && ex.at(i + 2).is_ident()) {
            facts.imports.push_back(make_import(std::string(ex.at(i + 2).text), tok.line, false));
            continue;
        }
        if (!tok.is_ident("use")) {
            continue;
        }

        std::vector<UseLeaf> leaves;
        size_t end = rust_use_tree(ex, i + 1, {}, leaves);

        std::map<std::string, size_t> by_spec;
        for (auto& leaf : leaves) {
            auto segments = leaf.segments;
            std::string symbol;
            if (leaf.leaf == "*") {
                symbol = "*";
            } else if (leaf.leaf == "self") {
                // module itself
            } else if (starts_upper(leaf.leaf)) {
                symbol = leaf.leaf;
            } else {
                segments.push_back(leaf.leaf);
            }
            if (segments.empty()) {
                continue;
            }

            bool local = segments.front() == "self" || segments.front() == "super";
            std::string spec;
            if (local) {
                std::string rel = rust_self_dir(facts.path);
                size_t s = 0;
                if (segments[0] == "self") {
                    s = 1;
                }
                for (; s < segments.size() && segments[s] == "super"; ++s) {
                    rel += "/..";
                }
                for (; s < segments.size(); ++s) {
                    rel += "/" + segments[s];
                }
                spec = normalize_relative(rel);
            } else {
                for (const auto& seg : segments) {
                    spec += spec.empty() ? seg : "/" + seg;
                }
            }

            auto it = by_spec.find(spec);
            if (it == by_spec.end()) {
                by_spec.emplace(spec, facts.imports.size());
                auto ref = make_import(spec, tok.line, local);
                if (!symbol.empty()) {
                    ref.symbols.insert(symbol);
                }
                facts.imports.push_back(std::move(ref));
            } else if (!symbol.empty()) {
                facts.imports[it->second].symbols.insert(symbol);
            }
        }
        i = end > i ? end - 1 : i;
    }
}

// ============================================================================
// Java
// ============================================================================

void java_imports(const Extraction& ex, FileFacts& facts) {
    for (size_t i = 0; i < ex.size(); ++i) {
        const auto& tok = ex.at(i);
        if (!tok.is_ident("import") || tok.depth != 0) {
            continue;
        }
        size_t k = i + 1;
        bool is_static = ex.at(k).is_ident("static");
        if (is_static) {
            ++k;
        }
        std::vector<std::string> parts;
        bool wildcard = false;
        while (k < ex.size() && !ex.at(k).is_punct(";")) {
            const auto& part = ex.at(k);
            if (part.is_ident()) {
                parts.emplace_back(part.text);
            } else if (part.is_punct("*")) {
                wildcard = true;
            } else if (!part.is_punct(".")) {
                break;
            }
            ++k;
        }
        if (parts.empty()) {
            continue;
        }

        std::string symbol;
        bool package = false;
        if (is_static) {
            if (!wildcard && parts.size() > 1) {
                symbol = parts.back();
                parts.pop_back();
            }
        } else if (wildcard) {
            package = true;
        } else {
            symbol = parts.back();
        }

        std::string spec;
        for (const auto& p : parts) {
            spec += spec.empty() ? p : "/" + p;
        }
        auto ref = make_import(std::move(spec), tok.line, false);
        ref.package_import = package;
        if (!symbol.empty()) {
            ref.symbols.insert(symbol);
        }
        facts.imports.push_back(std::move(ref));
        i = k;
    }
}

} // namespace

void extract_imports(const Extraction& ex, FileFacts& facts) {
    switch (ex.lang) {
    case Language::Cpp:
        cpp_imports(ex, facts);
        break;
    case Language::JavaScript:
    case Language::TypeScript:
        js_imports(ex, facts);
        break;
    case Language::Python:
        python_imports(ex, facts);
        break;
    case Language::Go:
        go_imports(ex, facts);
        break;
    case Language::Rust:
        rust_imports(ex, facts);
        break;
    case Language::Java:
        java_imports(ex, facts);
        break;
    }
}

} // namespace strata::ingest::detail
