//! # Glob Patterns
//!
//! Path globs used by layer patterns, ignore lists and public-API patterns,
//! plus the flat wildcard match used for call-site deny lists.
//!
//! ## Path Glob Syntax
//!
//! | Syntax   | Matches                                              |
//! |----------|------------------------------------------------------|
//! | `*`      | Any run of characters within one path segment        |
//! | `?`      | One character other than `/`                         |
//! | `**`     | Zero or more whole segments (must be its own segment)|
//! | `[abc]`  | One character from the set; `[!a]`/`[^a]` negate, `a-z` ranges |
//! | `{a,b}`  | Either alternative; may nest                         |
//!
//! Paths are root-relative with forward slashes. A pattern always matches the
//! whole path.
//!
//! ## Example
//!
//! ```cpp
//! auto glob = Glob::compile("src/{business,domain}/**/*.ts");
//! if (is_ok(glob)) {
//!     bool hit = unwrap(glob).matches("src/domain/order/order.ts"); // true
//! }
//! ```

#ifndef STRATA_POLICY_GLOB_HPP
#define STRATA_POLICY_GLOB_HPP

#include "strata/common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace strata::policy {

/// A validated path glob with braces expanded.
class Glob {
public:
    /// Validates and compiles a pattern. The error is a human-readable reason.
    [[nodiscard]] static auto compile(std::string_view pattern) -> Result<Glob, std::string>;

    /// True when the whole path matches one of the alternatives.
    [[nodiscard]] auto matches(std::string_view path) const -> bool;

    [[nodiscard]] auto pattern() const -> const std::string& {
        return pattern_;
    }

private:
    std::string pattern_;
    std::vector<std::vector<std::string>> alternatives_; ///< Segments per alternative
};

/// One-shot match; malformed patterns never match.
[[nodiscard]] auto glob_match(std::string_view pattern, std::string_view path) -> bool;

/// Flat wildcard match for dotted callee names: `*` matches any run of
/// characters (dots included), `?` exactly one.
[[nodiscard]] auto wildcard_match(std::string_view pattern, std::string_view text) -> bool;

} // namespace strata::policy

#endif // STRATA_POLICY_GLOB_HPP
