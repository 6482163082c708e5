//! # Violations
//!
//! The unit every rule produces and the reporter sorts. A violation carries
//! a closed, tagged detail: one alternative per rule category, so consumers
//! match exhaustively with `std::visit` instead of downcasting.
//!
//! | Category         | Detail                   | Produced by            |
//! |------------------|--------------------------|------------------------|
//! | `Direction`      | `DirectionDetail`        | `dependency-direction` |
//! | `IoIsolation`    | `IoIsolationDetail`      | `io-isolation`         |
//! | `Boundary`       | `BoundaryDetail`         | `module-boundary`      |
//! | `ErrorShape`     | `ErrorShapeDetail`       | `error-shape`          |
//! | `Cycle`          | `CycleDetail`            | `circular-dependency`  |
//! | `ParseFailure`   | `ParseFailureDetail`     | `parse-failure`        |
//! | `ConfigGap`      | `ConfigGapDetail`        | `config-gap`           |
//! | `AmbiguousImport`| `AmbiguousImportDetail`  | `ambiguous-import`     |

#ifndef STRATA_REPORT_VIOLATION_HPP
#define STRATA_REPORT_VIOLATION_HPP

#include "strata/policy/layer.hpp"

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace strata::report {

// ============================================================================
// Severity and Category
// ============================================================================

/// Ordered from least to most severe.
enum class Severity : uint8_t { Info = 0, Warning = 1, Error = 2 };

[[nodiscard]] auto severity_name(Severity severity) -> const char*;
[[nodiscard]] auto parse_severity(std::string_view name) -> std::optional<Severity>;

/// True for the three defined enumerators.
[[nodiscard]] auto is_valid_severity(Severity severity) -> bool;

/// One step less severe; `Info` stays `Info`.
[[nodiscard]] auto downgrade(Severity severity) -> Severity;

enum class Category : uint8_t {
    Direction,
    IoIsolation,
    Boundary,
    ErrorShape,
    Cycle,
    ParseFailure,
    ConfigGap,
    AmbiguousImport
};

[[nodiscard]] auto category_name(Category category) -> const char*;

// ============================================================================
// Details
// ============================================================================

struct DirectionDetail {
    std::string target;
    policy::Layer from_layer = policy::Layer::Unclassified;
    policy::Layer to_layer = policy::Layer::Unclassified;
    bool type_only = false;
};

struct IoIsolationDetail {
    std::string primitive; ///< Deny-list pattern that matched
    std::string subject;   ///< Callee or imported specifier
    bool via_import = false;
};

struct BoundaryDetail {
    std::string target;
    std::string from_feature;
    std::string to_feature;
    std::string public_api_pattern;
};

struct ErrorShapeDetail {
    std::string construct;
};

struct CycleDetail {
    std::vector<std::string> members;
    std::string next; ///< Module the reported import leads to
};

struct ParseFailureDetail {
    std::string reason;
};

struct ConfigGapDetail {};

struct AmbiguousImportDetail {
    std::string specifier;
    std::vector<std::string> candidates;
};

using ViolationDetail =
    std::variant<DirectionDetail, IoIsolationDetail, BoundaryDetail, ErrorShapeDetail,
                 CycleDetail, ParseFailureDetail, ConfigGapDetail, AmbiguousImportDetail>;

/// The category a detail alternative belongs to.
[[nodiscard]] auto detail_category(const ViolationDetail& detail) -> Category;

// ============================================================================
// Violation
// ============================================================================

/// Inclusive 1-based line span.
struct LineRange {
    uint32_t begin = 0;
    uint32_t end = 0;

    auto operator<=>(const LineRange&) const = default;

    [[nodiscard]] static auto at(uint32_t line) -> LineRange {
        return LineRange{line, line};
    }
};

struct Violation {
    std::string rule_id;
    Category category = Category::Direction;
    Severity severity = Severity::Error;
    std::string path;
    std::optional<LineRange> line_range;
    /// 1-based column of the offending construct on `line_range->begin`; 0 when unknown.
    uint32_t column = 0;
    std::string message;
    ViolationDetail detail;
};

/// "path:begin" or "path:begin-end", or the bare path.
[[nodiscard]] auto format_location(const Violation& violation) -> std::string;

} // namespace strata::report

#endif // STRATA_REPORT_VIOLATION_HPP
