//! # Reporter Tests
//!
//! Deterministic ordering, duplicate removal, counts and the JSON layout.

#include "strata/report/violation_reporter.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace strata;
using namespace strata::report;

namespace {

Violation make(const std::string& rule, Severity severity, const std::string& path,
               std::optional<LineRange> range, const std::string& message = "m") {
    Violation v;
    v.rule_id = rule;
    v.severity = severity;
    v.path = path;
    v.line_range = range;
    v.message = message;
    if (rule == "config-gap") {
        v.category = Category::ConfigGap;
        v.detail = ConfigGapDetail{};
    } else if (rule == "parse-failure") {
        v.category = Category::ParseFailure;
        v.detail = ParseFailureDetail{"line 1: unclosed '{'"};
    } else {
        v.category = Category::Direction;
        v.detail = DirectionDetail{"src/infra/db.ts", policy::Layer::Business,
                                   policy::Layer::Infrastructure, false};
    }
    return v;
}

std::vector<std::string> locations(const Report& report) {
    std::vector<std::string> out;
    for (const auto& v : report.violations) {
        out.push_back(std::string(severity_name(v.severity)) + " " + format_location(v));
    }
    return out;
}

} // namespace

// ============================================================================
// Severity Helpers
// ============================================================================

TEST(SeverityTest, NamesAndDowngrade) {
    EXPECT_EQ(parse_severity("warning"), Severity::Warning);
    EXPECT_FALSE(parse_severity("fatal").has_value());
    EXPECT_EQ(downgrade(Severity::Error), Severity::Warning);
    EXPECT_EQ(downgrade(Severity::Warning), Severity::Info);
    EXPECT_EQ(downgrade(Severity::Info), Severity::Info);
    EXPECT_FALSE(is_valid_severity(static_cast<Severity>(7)));
}

TEST(ViolationTest, FormatLocation) {
    EXPECT_EQ(format_location(make("r", Severity::Error, "a.ts", std::nullopt)), "a.ts");
    EXPECT_EQ(format_location(make("r", Severity::Error, "a.ts", LineRange::at(4))), "a.ts:4");
    EXPECT_EQ(format_location(make("r", Severity::Error, "a.ts", LineRange{4, 9})), "a.ts:4-9");
}

TEST(ViolationTest, DetailCategory) {
    EXPECT_EQ(detail_category(CycleDetail{}), Category::Cycle);
    EXPECT_EQ(detail_category(AmbiguousImportDetail{}), Category::AmbiguousImport);
    EXPECT_STREQ(category_name(Category::IoIsolation), "io-isolation");
}

// ============================================================================
// Ordering
// ============================================================================

TEST(ReporterTest, SortsBySeverityPathAndLine) {
    std::vector<Violation> input;
    input.push_back(make("config-gap", Severity::Warning, "src/b.ts", std::nullopt));
    input.push_back(make("dependency-direction", Severity::Error, "src/b.ts", LineRange::at(7)));
    input.push_back(make("dependency-direction", Severity::Error, "src/a.ts", LineRange::at(9)));
    input.push_back(make("dependency-direction", Severity::Error, "src/a.ts", LineRange::at(2)));
    input.push_back(make("parse-failure", Severity::Warning, "src/b.ts", LineRange::at(1)));
    input.push_back(make("config-gap", Severity::Info, "src/a.ts", std::nullopt));

    auto report = ViolationReporter().build(input);
    EXPECT_EQ(locations(report), (std::vector<std::string>{
                                     "error src/a.ts:2",
                                     "error src/a.ts:9",
                                     "error src/b.ts:7",
                                     "warning src/b.ts",
                                     "warning src/b.ts:1",
                                     "info src/a.ts",
                                 }));
}

TEST(ReporterTest, InputOrderDoesNotMatter) {
    std::vector<Violation> input;
    for (int i = 0; i < 20; ++i) {
        input.push_back(make("dependency-direction", i % 3 == 0 ? Severity::Warning : Severity::Error,
                             "src/m" + std::to_string(i % 5) + ".ts",
                             LineRange::at(static_cast<uint32_t>(i + 1))));
    }
    auto reversed = input;
    std::reverse(reversed.begin(), reversed.end());

    ViolationReporter reporter;
    EXPECT_EQ(locations(reporter.build(input)), locations(reporter.build(reversed)));
}

TEST(ReporterTest, RuleIdBreaksTies) {
    std::vector<Violation> input;
    input.push_back(make("parse-failure", Severity::Warning, "a.ts", LineRange::at(1)));
    input.push_back(make("config-gap", Severity::Warning, "a.ts", LineRange::at(1)));
    auto report = ViolationReporter().build(input);
    ASSERT_EQ(report.total(), 2u);
    EXPECT_EQ(report.violations[0].rule_id, "config-gap");
}

// ============================================================================
// Deduplication and Counts
// ============================================================================

TEST(ReporterTest, DropsDuplicates) {
    std::vector<Violation> input;
    input.push_back(make("dependency-direction", Severity::Error, "a.ts", LineRange::at(3), "x"));
    input.push_back(make("dependency-direction", Severity::Error, "a.ts", LineRange::at(3), "y"));
    input.push_back(make("dependency-direction", Severity::Error, "a.ts", LineRange::at(4), "x"));

    auto report = ViolationReporter().build(input);
    ASSERT_EQ(report.total(), 2u);
    // the first in sort order survives
    EXPECT_EQ(report.violations[0].message, "x");
    EXPECT_EQ(report.count("dependency-direction"), 2u);
}

TEST(ReporterTest, KeepsDistinctColumnsOnOneLine) {
    auto first = make("io-isolation", Severity::Error, "a.ts", LineRange::at(2), "b");
    first.column = 30;
    auto second = make("io-isolation", Severity::Error, "a.ts", LineRange::at(2), "a");
    second.column = 10;
    auto repeat = second;

    auto report = ViolationReporter().build({first, second, repeat});
    ASSERT_EQ(report.total(), 2u);
    EXPECT_EQ(report.violations[0].column, 10u);
    EXPECT_EQ(report.violations[1].column, 30u);
    EXPECT_EQ(report.count("io-isolation"), 2u);
}

TEST(ReporterTest, CountsPerSeverityRuleAndCategory) {
    std::vector<Violation> input;
    input.push_back(make("dependency-direction", Severity::Error, "a.ts", LineRange::at(1)));
    input.push_back(make("dependency-direction", Severity::Warning, "b.ts", LineRange::at(1)));
    input.push_back(make("config-gap", Severity::Warning, "c.ts", std::nullopt));

    auto report = ViolationReporter().build(input);
    EXPECT_EQ(report.total(), 3u);
    EXPECT_EQ(report.count(Severity::Error), 1u);
    EXPECT_EQ(report.count(Severity::Warning), 2u);
    EXPECT_EQ(report.count(Severity::Info), 0u);
    EXPECT_EQ(report.count("config-gap"), 1u);
    EXPECT_EQ(report.count("error-shape"), 0u);
    EXPECT_EQ(report.by_category.at(Category::Direction), 2u);
}

TEST(ReporterTest, EmptyInput) {
    auto report = ViolationReporter().build({});
    EXPECT_EQ(report.total(), 0u);
    EXPECT_TRUE(report.by_rule.empty());
}

// ============================================================================
// JSON
// ============================================================================

TEST(ReporterJsonTest, ViolationLayout) {
    auto json = violation_to_json(
        make("dependency-direction", Severity::Error, "src/domain/a.ts", LineRange{3, 5}));

    EXPECT_EQ(json.get("rule")->as_string(), "dependency-direction");
    EXPECT_EQ(json.get("category")->as_string(), "direction");
    EXPECT_EQ(json.get("severity")->as_string(), "error");
    EXPECT_EQ(json.get("path")->as_string(), "src/domain/a.ts");
    ASSERT_TRUE(json.get("line_range")->is_object());
    EXPECT_EQ(json.get("line_range")->get("begin")->try_as_i64(), 3);
    EXPECT_EQ(json.get("line_range")->get("end")->try_as_i64(), 5);

    const auto* detail = json.get("detail");
    ASSERT_NE(detail, nullptr);
    EXPECT_EQ(detail->get("from_layer")->as_string(), "business");
    EXPECT_EQ(detail->get("to_layer")->as_string(), "infrastructure");
    EXPECT_FALSE(detail->get("type_only")->as_bool());
}

TEST(ReporterJsonTest, ColumnOnlyWhenKnown) {
    auto v = make("dependency-direction", Severity::Error, "a.ts", LineRange::at(2));
    EXPECT_EQ(violation_to_json(v).get("column"), nullptr);
    v.column = 12;
    EXPECT_EQ(violation_to_json(v).get("column")->try_as_i64(), 12);
}

TEST(ReporterJsonTest, MissingRangeIsNull) {
    auto json = violation_to_json(make("config-gap", Severity::Warning, "a.ts", std::nullopt));
    EXPECT_TRUE(json.get("line_range")->is_null());
    EXPECT_TRUE(json.get("detail")->is_object());
    EXPECT_EQ(json.get("detail")->size(), 0u);
}

TEST(ReporterJsonTest, ReportCounts) {
    std::vector<Violation> input;
    input.push_back(make("dependency-direction", Severity::Error, "a.ts", LineRange::at(1)));
    input.push_back(make("config-gap", Severity::Warning, "b.ts", std::nullopt));
    auto json = report_to_json(ViolationReporter().build(input));

    ASSERT_TRUE(json.get("violations")->is_array());
    EXPECT_EQ(json.get("violations")->size(), 2u);
    const auto* counts = json.get("counts");
    ASSERT_NE(counts, nullptr);
    EXPECT_EQ(counts->get("total")->try_as_i64(), 2);
    EXPECT_EQ(counts->get("by_severity")->get("error")->try_as_i64(), 1);
    EXPECT_EQ(counts->get("by_rule")->get("config-gap")->try_as_i64(), 1);
    EXPECT_EQ(counts->get("by_category")->get("direction")->try_as_i64(), 1);
}
