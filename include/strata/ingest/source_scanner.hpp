//! # Source Scanner
//!
//! Language-aware pre-pass over raw file bytes. The scanner blanks comments
//! and string-literal bodies with spaces (newlines are kept, so offsets and
//! line numbers stay valid), records every string literal, and checks that
//! `()`, `[]` and `{}` are balanced. The tokenizer then splits the blanked
//! text into a flat token stream that the per-language extractors walk.
//!
//! ## Literal Forms
//!
//! | Language         | Comments            | Strings                                  |
//! |------------------|---------------------|------------------------------------------|
//! | C++              | `//`, `/* */`       | `"..."`, `'c'`, `R"d(...)d"`             |
//! | JavaScript/TS    | `//`, `/* */`       | `"..."`, `'...'`, `` `...` ``, `/re/`    |
//! | Python           | `#`                 | `"..."`, `'...'`, `"""..."""`, `'''...'''`|
//! | Go               | `//`, `/* */`       | `"..."`, `'c'`, `` `raw` ``              |
//! | Rust             | `//`, `/* */`       | `"..."`, `'c'`, `r#"..."#`               |
//! | Java             | `//`, `/* */`       | `"..."`, `'c'`, `"""..."""`              |
//!
//! ## Failure Model
//!
//! Scanning never stops early. An unterminated comment or literal, or an
//! unbalanced bracket, clears `ok` and records the first problem in `error`;
//! the blanked text is still produced so extraction can run best-effort.

#ifndef STRATA_INGEST_SOURCE_SCANNER_HPP
#define STRATA_INGEST_SOURCE_SCANNER_HPP

#include "strata/ingest/file_facts.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace strata::ingest {

/// A string literal found in the source.
struct StringLiteral {
    size_t offset = 0; ///< Offset of the opening quote (or raw-string prefix)
    size_t end = 0;    ///< One past the closing quote
    uint32_t line = 0;
    std::string value; ///< Raw body between the quotes
};

/// Result of scanning one file.
struct ScanResult {
    std::string text; ///< Same length as the input; comments and literal bodies blanked
    std::vector<StringLiteral> strings;
    std::vector<size_t> line_starts;
    bool ok = true;
    std::string error;

    /// 1-based line of a byte offset.
    [[nodiscard]] auto line_of(size_t offset) const -> uint32_t;

    /// 1-based column of a byte offset.
    [[nodiscard]] auto column_of(size_t offset) const -> uint32_t;

    /// The literal whose opening starts at `offset`, or nullptr.
    [[nodiscard]] auto string_at(size_t offset) const -> const StringLiteral*;
};

// ============================================================================
// Tokens
// ============================================================================

enum class TokenKind : uint8_t { Ident, Number, String, Punct };

struct Token {
    TokenKind kind = TokenKind::Punct;
    std::string_view text;
    size_t offset = 0;
    uint32_t line = 0;
    uint32_t column = 0;
    uint32_t depth = 0;         ///< `{}` nesting depth before this token
    bool line_start = false;    ///< First token on its line
    const StringLiteral* literal = nullptr;

    [[nodiscard]] auto is(std::string_view s) const -> bool {
        return text == s;
    }
    [[nodiscard]] auto is_ident() const -> bool {
        return kind == TokenKind::Ident;
    }
    [[nodiscard]] auto is_ident(std::string_view s) const -> bool {
        return kind == TokenKind::Ident && text == s;
    }
    [[nodiscard]] auto is_punct(std::string_view s) const -> bool {
        return kind == TokenKind::Punct && text == s;
    }
};

class SourceScanner {
public:
    explicit SourceScanner(Language lang) : lang_(lang) {}

    /// Blanks comments and literal bodies, collects literals, checks brackets.
    [[nodiscard]] auto scan(std::string_view content) const -> ScanResult;

    /// Splits a scan result into tokens. String tokens point into `scan.strings`,
    /// so the scan result must outlive the tokens.
    [[nodiscard]] static auto tokenize(const ScanResult& scan) -> std::vector<Token>;

private:
    Language lang_;
};

} // namespace strata::ingest

#endif // STRATA_INGEST_SOURCE_SCANNER_HPP
