//! # Common Definitions
//!
//! Types and helpers shared by every Strata component.
//!
//! ## Overview
//!
//! - **Version Information**: Analyzer version constants
//! - **Result Type**: Error handling for recoverable failures (configuration,
//!   file loading) without exceptions
//! - **Error Types**: `ConfigError` for rejected configuration and
//!   `InternalError` for broken invariants
//! - **Smart Pointers**: Aliases for unique ownership
//!
//! ## Error Classes
//!
//! | Class               | Channel                 | Effect on the run        |
//! |---------------------|-------------------------|--------------------------|
//! | Parse failure       | `FileFacts::parse_ok`   | Local, reported          |
//! | Configuration error | `Result<T, ConfigError>`| Stops before ingestion   |
//! | Internal invariant  | `throw InternalError`   | Aborts, `internal-error` |

#ifndef STRATA_COMMON_HPP
#define STRATA_COMMON_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace strata {

// ============================================================================
// Version Information
// ============================================================================

/// The analyzer version string.
constexpr const char* VERSION = "0.3.0";

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// ```cpp
/// auto policy = LayerPolicy::create(rules, allowed);
/// if (is_err(policy)) {
///     std::cerr << unwrap_err(policy).to_string() << "\n";
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value. Throws `std::bad_variant_access` on error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value. Throws `std::bad_variant_access` on success.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Error Types
// ============================================================================

/// A rejected configuration value.
///
/// `key` is the dotted path of the offending entry, e.g.
/// `allowed_targets.business[1]` or `layers[3].pattern`.
struct ConfigError {
    std::string key;
    std::string message;

    static auto make(std::string key, std::string message) -> ConfigError {
        return ConfigError{std::move(key), std::move(message)};
    }

    [[nodiscard]] auto to_string() const -> std::string {
        if (key.empty()) {
            return message;
        }
        return key + ": " + message;
    }
};

/// A broken internal invariant (a programming error, never bad input).
///
/// Thrown by the graph builder and the rule engine; caught only at the
/// analyzer boundary where it becomes the `internal-error` run status.
class InternalError : public std::logic_error {
public:
    explicit InternalError(const std::string& what) : std::logic_error(what) {}
};

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace strata

#endif // STRATA_COMMON_HPP
