//! # Extraction Internal Interface
//!
//! Shared declarations for the per-language fact extractors. Each extractor
//! walks the token stream of one scanned file and appends to a `FileFacts`.
//!
//! | Extractor                | Fills                          |
//! |--------------------------|--------------------------------|
//! | `extract_imports`        | `imports`                      |
//! | `extract_exports`        | `exports`                      |
//! | `extract_calls`          | `io_call_sites`, `call_site_count` |
//! | `extract_empty_handlers` | `empty_handler_sites`          |

#pragma once

#include "strata/ingest/file_facts.hpp"
#include "strata/ingest/source_scanner.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace strata::ingest::detail {

/// Read-only view of one scanned file.
struct Extraction {
    const std::string& path;
    Language lang;
    const ScanResult& scan;
    const std::vector<Token>& tokens;

    [[nodiscard]] auto size() const -> size_t {
        return tokens.size();
    }

    /// Token at `i`, or a static end-of-input punct token.
    [[nodiscard]] auto at(size_t i) const -> const Token&;
};

void extract_imports(const Extraction& ex, FileFacts& facts);
void extract_exports(const Extraction& ex, FileFacts& facts);
void extract_calls(const Extraction& ex, const std::vector<std::string>& deny, FileFacts& facts);
void extract_empty_handlers(const Extraction& ex, FileFacts& facts);

// ============================================================================
// Helpers
// ============================================================================

constexpr size_t NPOS = static_cast<size_t>(-1);

/// Index of the bracket closing the one at `open`, or NPOS.
[[nodiscard]] auto find_matching(const Extraction& ex, size_t open) -> size_t;

/// `a.b.c` -> `a/b/c`.
[[nodiscard]] auto dotted_to_slash(std::string_view dotted) -> std::string;

/// True when the identifier starts with an upper-case ASCII letter.
[[nodiscard]] auto starts_upper(std::string_view name) -> bool;

} // namespace strata::ingest::detail
