//! # Violation Reporter
//!
//! Turns the union of rule outputs into the deterministic report.
//!
//! ## Ordering
//!
//! 1. Severity, most severe first
//! 2. Path, ascending
//! 3. Line range, ascending; violations without a range come first
//! 4. Rule id, then message
//!
//! Exact duplicates (same rule id, path and line range) are dropped, keeping
//! the first in that order.

#ifndef STRATA_REPORT_VIOLATION_REPORTER_HPP
#define STRATA_REPORT_VIOLATION_REPORTER_HPP

#include "strata/json/json_value.hpp"
#include "strata/report/violation.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace strata::report {

struct Report {
    std::vector<Violation> violations;
    std::map<std::string, size_t> by_rule;
    std::map<Severity, size_t> by_severity;
    std::map<Category, size_t> by_category;

    [[nodiscard]] auto total() const -> size_t {
        return violations.size();
    }

    [[nodiscard]] auto count(Severity severity) const -> size_t {
        auto it = by_severity.find(severity);
        return it == by_severity.end() ? 0 : it->second;
    }

    [[nodiscard]] auto count(const std::string& rule_id) const -> size_t {
        auto it = by_rule.find(rule_id);
        return it == by_rule.end() ? 0 : it->second;
    }
};

class ViolationReporter {
public:
    [[nodiscard]] auto build(std::vector<Violation> violations) const -> Report;
};

/// Strict weak ordering used by the reporter.
[[nodiscard]] auto violation_less(const Violation& a, const Violation& b) -> bool;

/// JSON rendering of a report:
///
/// ```json
/// {
///   "violations": [{"rule": "...", "category": "...", "severity": "...", "path": "...",
///                   "line_range": {"begin": 3, "end": 3} | null, "message": "...",
///                   "detail": {...}}],
///   "counts": {"total": 1, "by_rule": {...}, "by_severity": {...}, "by_category": {...}}
/// }
/// ```
[[nodiscard]] auto report_to_json(const Report& report) -> json::JsonValue;

[[nodiscard]] auto violation_to_json(const Violation& violation) -> json::JsonValue;

} // namespace strata::report

#endif // STRATA_REPORT_VIOLATION_REPORTER_HPP
