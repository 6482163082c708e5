#include "strata/report/violation_reporter.hpp"

#include "strata/log/log.hpp"

#include <algorithm>
#include <set>
#include <tuple>
#include <type_traits>
#include <variant>

namespace strata::report {

auto violation_less(const Violation& a, const Violation& b) -> bool {
    if (a.severity != b.severity) {
        return a.severity > b.severity;
    }
    if (a.path != b.path) {
        return a.path < b.path;
    }
    if (a.line_range != b.line_range) {
        // nullopt orders before any value
        return a.line_range < b.line_range;
    }
    if (a.column != b.column) {
        return a.column < b.column;
    }
    return std::tie(a.rule_id, a.message) < std::tie(b.rule_id, b.message);
}

auto ViolationReporter::build(std::vector<Violation> violations) const -> Report {
    std::stable_sort(violations.begin(), violations.end(), violation_less);

    Report report;
    // Column separates distinct call sites sharing a line.
    std::set<std::tuple<std::string, std::string, std::optional<LineRange>, uint32_t>> seen;
    size_t duplicates = 0;
    for (auto& v : violations) {
        if (!seen.emplace(v.rule_id, v.path, v.line_range, v.column).second) {
            ++duplicates;
            continue;
        }
        report.by_rule[v.rule_id]++;
        report.by_severity[v.severity]++;
        report.by_category[v.category]++;
        report.violations.push_back(std::move(v));
    }

    STRATA_LOG_DEBUG("report", "Report: " << report.total() << " violations ("
                                          << report.count(Severity::Error) << " errors, "
                                          << report.count(Severity::Warning) << " warnings, "
                                          << report.count(Severity::Info) << " infos), "
                                          << duplicates << " duplicates dropped");
    return report;
}

// ============================================================================
// JSON
// ============================================================================

namespace {

using json::JsonArray;
using json::JsonObject;
using json::JsonValue;

auto strings(const std::vector<std::string>& items) -> JsonValue {
    JsonArray arr;
    for (const auto& s : items) {
        arr.emplace_back(s);
    }
    return JsonValue(std::move(arr));
}

auto detail_to_json(const ViolationDetail& detail) -> JsonValue {
    JsonObject obj;
    std::visit(
        [&obj](const auto& d) {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, DirectionDetail>) {
                obj.emplace("target", JsonValue(d.target));
                obj.emplace("from_layer", JsonValue(policy::layer_name(d.from_layer)));
                obj.emplace("to_layer", JsonValue(policy::layer_name(d.to_layer)));
                obj.emplace("type_only", JsonValue(d.type_only));
            } else if constexpr (std::is_same_v<T, IoIsolationDetail>) {
                obj.emplace("primitive", JsonValue(d.primitive));
                obj.emplace("subject", JsonValue(d.subject));
                obj.emplace("via_import", JsonValue(d.via_import));
            } else if constexpr (std::is_same_v<T, BoundaryDetail>) {
                obj.emplace("target", JsonValue(d.target));
                obj.emplace("from_feature", JsonValue(d.from_feature));
                obj.emplace("to_feature", JsonValue(d.to_feature));
                obj.emplace("public_api_pattern", JsonValue(d.public_api_pattern));
            } else if constexpr (std::is_same_v<T, ErrorShapeDetail>) {
                obj.emplace("construct", JsonValue(d.construct));
            } else if constexpr (std::is_same_v<T, CycleDetail>) {
                obj.emplace("members", strings(d.members));
                obj.emplace("next", JsonValue(d.next));
            } else if constexpr (std::is_same_v<T, ParseFailureDetail>) {
                obj.emplace("reason", JsonValue(d.reason));
            } else if constexpr (std::is_same_v<T, ConfigGapDetail>) {
                // no fields
            } else if constexpr (std::is_same_v<T, AmbiguousImportDetail>) {
                obj.emplace("specifier", JsonValue(d.specifier));
                obj.emplace("candidates", strings(d.candidates));
            }
        },
        detail);
    return JsonValue(std::move(obj));
}

template <typename K, typename F>
auto counts(const std::map<K, size_t>& source, F name) -> JsonValue {
    JsonObject obj;
    for (const auto& [key, count] : source) {
        obj.emplace(name(key), JsonValue(static_cast<int64_t>(count)));
    }
    return JsonValue(std::move(obj));
}

} // namespace

auto violation_to_json(const Violation& v) -> JsonValue {
    JsonObject obj;
    obj.emplace("rule", JsonValue(v.rule_id));
    obj.emplace("category", JsonValue(category_name(v.category)));
    obj.emplace("severity", JsonValue(severity_name(v.severity)));
    obj.emplace("path", JsonValue(v.path));
    if (v.line_range) {
        JsonObject range;
        range.emplace("begin", JsonValue(static_cast<int64_t>(v.line_range->begin)));
        range.emplace("end", JsonValue(static_cast<int64_t>(v.line_range->end)));
        obj.emplace("line_range", JsonValue(std::move(range)));
        if (v.column > 0) {
            obj.emplace("column", JsonValue(static_cast<int64_t>(v.column)));
        }
    } else {
        obj.emplace("line_range", JsonValue(nullptr));
    }
    obj.emplace("message", JsonValue(v.message));
    obj.emplace("detail", detail_to_json(v.detail));
    return JsonValue(std::move(obj));
}

auto report_to_json(const Report& report) -> JsonValue {
    JsonArray violations;
    violations.reserve(report.violations.size());
    for (const auto& v : report.violations) {
        violations.push_back(violation_to_json(v));
    }

    JsonObject totals;
    totals.emplace("total", JsonValue(static_cast<int64_t>(report.total())));
    totals.emplace("by_rule", counts(report.by_rule, [](const std::string& k) { return k; }));
    totals.emplace("by_severity", counts(report.by_severity, [](Severity s) {
                       return std::string(severity_name(s));
                   }));
    totals.emplace("by_category", counts(report.by_category, [](Category c) {
                       return std::string(category_name(c));
                   }));

    JsonObject root;
    root.emplace("violations", JsonValue(std::move(violations)));
    root.emplace("counts", JsonValue(std::move(totals)));
    return JsonValue(std::move(root));
}

} // namespace strata::report
