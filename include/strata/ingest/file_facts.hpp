//! # File Facts
//!
//! The immutable per-file record produced by ingestion: what a source file
//! imports, what it exports, and which call sites of interest it contains.
//!
//! ## Languages
//!
//! | Language     | Extensions                                        |
//! |--------------|---------------------------------------------------|
//! | `Cpp`        | `.c .cc .cpp .cxx .h .hh .hpp .hxx`               |
//! | `JavaScript` | `.js .jsx .mjs .cjs`                              |
//! | `TypeScript` | `.ts .tsx .mts .cts`                              |
//! | `Python`     | `.py .pyi`                                        |
//! | `Go`         | `.go`                                             |
//! | `Rust`       | `.rs`                                             |
//! | `Java`       | `.java`                                           |
//!
//! ## Ownership
//!
//! A `FileFacts` value is created once by `SourceIngestor`, moved out of the
//! ingestion worker that produced it, and finally moved into the module graph.
//! The graph builder is the only writer after ingestion: it fills in
//! `ImportRef::resolved_path`.

#ifndef STRATA_INGEST_FILE_FACTS_HPP
#define STRATA_INGEST_FILE_FACTS_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace strata::ingest {

// ============================================================================
// Language
// ============================================================================

enum class Language : uint8_t { Cpp, JavaScript, TypeScript, Python, Go, Rust, Java };

/// Detects the language from a file extension; nullopt for unknown files.
[[nodiscard]] auto language_from_path(std::string_view path) -> std::optional<Language>;

/// Lower-case language name as used in configuration keys ("cpp", "typescript", ...).
[[nodiscard]] auto language_name(Language lang) -> const char*;

/// Parses a configuration language key.
[[nodiscard]] auto parse_language(std::string_view name) -> std::optional<Language>;

/// All supported languages, in declaration order.
[[nodiscard]] auto all_languages() -> const std::vector<Language>&;

// ============================================================================
// Symbols
// ============================================================================

enum class SymbolKind : uint8_t {
    Function,
    Class,
    Interface,
    Type,
    Struct,
    Enum,
    Trait,
    Constant,
    Variable
};

[[nodiscard]] auto symbol_kind_name(SymbolKind kind) -> const char*;

/// True for pure data/contract declarations (interfaces, type aliases,
/// plain structs, enums, traits and constants).
[[nodiscard]] auto is_contract_kind(SymbolKind kind) -> bool;

struct Symbol {
    std::string name;
    SymbolKind kind = SymbolKind::Variable;

    auto operator<=>(const Symbol&) const = default;
};

// ============================================================================
// Call Sites
// ============================================================================

/// A located call expression (or empty handler) of interest.
///
/// For I/O call sites `matched_pattern` is the deny-list entry that matched.
/// For empty error handlers it names the construct, and `line..end_line`
/// spans the handler.
struct CallSite {
    std::string callee;
    std::string matched_pattern;
    uint32_t line = 0;
    uint32_t column = 0;
    uint32_t end_line = 0;

    auto operator<=>(const CallSite&) const = default;
};

// ============================================================================
// Imports
// ============================================================================

struct ImportRef {
    /// Specifier as written, normalised to slash form (`a.b` -> `a/b`).
    std::string raw_specifier;

    /// Path of the in-root module this import resolved to. Empty until the
    /// graph builder runs, and stays empty for external dependencies.
    std::optional<std::string> resolved_path;

    /// Names the import binds (`default` and `*` for default and namespace
    /// imports). Plain names: the kind of a bound symbol is only known from
    /// the target's `exports`.
    std::set<std::string> symbols;

    uint32_t line = 0;

    /// Written as a file-local lookup (`./x`, `#include "x"`, `from . import`,
    /// `self::`/`super::`, `mod x;`).
    bool local_form = false;

    /// Names a package directory rather than a file (Go imports, Java `.*`).
    bool package_import = false;
};

// ============================================================================
// FileFacts
// ============================================================================

struct FileFacts {
    /// Root-relative path with forward slashes.
    std::string path;
    Language language = Language::Cpp;

    std::vector<ImportRef> imports;
    std::set<Symbol> exports;
    std::set<CallSite> io_call_sites;
    std::set<CallSite> empty_handler_sites;

    /// Number of call expressions in the file (declarations excluded).
    uint32_t call_site_count = 0;

    bool parse_ok = true;
    std::string parse_error;
};

} // namespace strata::ingest

#endif // STRATA_INGEST_FILE_FACTS_HPP
