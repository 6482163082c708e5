//! # Analyzer Tests
//!
//! End-to-end runs over temporary source trees: status mapping, stats,
//! deadlines, determinism across thread counts and the JSON result.

#include "strata/analysis/analyzer.hpp"
#include "strata/config/config_loader.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace strata;
using namespace strata::analysis;
using strata::testing::TempTree;

namespace {

class AnalyzerTest : public ::testing::Test {
protected:
    TempTree tree{"analyzer"};

    AnalysisConfig config() const {
        return config::default_config(tree.root());
    }

    AnalysisResult analyze() const {
        return Analyzer(config()).run();
    }

    static size_t count_rule(const AnalysisResult& result, const std::string& rule) {
        return result.report.count(rule);
    }
};

/// Reports a module that is not in the graph.
class UnknownPathRule : public rules::Rule {
public:
    auto id() const -> std::string_view override {
        return "unknown-path";
    }
    auto category() const -> report::Category override {
        return report::Category::ConfigGap;
    }
    auto default_severity() const -> report::Severity override {
        return report::Severity::Warning;
    }
    auto description() const -> std::string_view override {
        return "reports a file outside the graph";
    }
    auto evaluate(const rules::RuleContext&, report::Severity severity) const
        -> std::vector<report::Violation> override {
        report::Violation v;
        v.rule_id = "unknown-path";
        v.category = report::Category::ConfigGap;
        v.severity = severity;
        v.path = "src/missing.ts";
        v.detail = report::ConfigGapDetail{};
        return {v};
    }
};

} // namespace

// ============================================================================
// Status Mapping
// ============================================================================

TEST_F(AnalyzerTest, CleanProject) {
    tree.write("src/domain/order.ts",
               "import { Repo } from '../ports/repo';\n"
               "export function place(r: Repo) {\n  return r;\n}\n");
    tree.write("src/ports/repo.ts", "export interface Repo { save(): void }\n");

    auto result = analyze();
    EXPECT_EQ(result.status, RunStatus::Clean);
    EXPECT_EQ(result.report.total(), 0u);
    EXPECT_EQ(result.stats.files_discovered, 2u);
    EXPECT_EQ(result.stats.modules, 2u);
    EXPECT_EQ(result.stats.edges, 1u);
    EXPECT_EQ(result.stats.parse_failures, 0u);
    EXPECT_FALSE(result.config_error.has_value());
}

TEST_F(AnalyzerTest, EmptyRootIsClean) {
    auto result = analyze();
    EXPECT_EQ(result.status, RunStatus::Clean);
    EXPECT_EQ(result.stats.files_discovered, 0u);
    EXPECT_EQ(result.stats.threads, 0);
}

TEST_F(AnalyzerTest, LayerViolationFound) {
    tree.write("src/domain/order.ts",
               "import { Db } from '../infra/db';\nexport function place() {}\n");
    tree.write("src/infra/db.ts", "export class Db {}\n");

    auto result = analyze();
    EXPECT_EQ(result.status, RunStatus::ViolationsFound);
    ASSERT_EQ(result.report.total(), 1u);
    const auto& v = result.report.violations[0];
    EXPECT_EQ(v.rule_id, "dependency-direction");
    EXPECT_EQ(v.path, "src/domain/order.ts");
    EXPECT_EQ(v.line_range, report::LineRange::at(1));
}

TEST_F(AnalyzerTest, CycleReportedOncePerMember) {
    tree.write("src/a.ts", "import { b } from './b';\nexport const a = 1;\n");
    tree.write("src/b.ts", "import { c } from './c';\nexport const b = 1;\n");
    tree.write("src/c.ts", "import { a } from './a';\nexport const c = 1;\n");

    auto result = analyze();
    EXPECT_EQ(result.status, RunStatus::ViolationsFound);
    EXPECT_EQ(count_rule(result, "circular-dependency"), 3u);
    EXPECT_EQ(count_rule(result, "config-gap"), 3u);
    EXPECT_EQ(result.stats.cycles, 1u);
}

TEST_F(AnalyzerTest, ParseFailureDoesNotStopTheRun) {
    tree.write("src/domain/bad.ts", "export function f() {\n");
    tree.write("src/domain/order.ts",
               "import { Db } from '../infra/db';\nexport function place() {}\n");
    tree.write("src/infra/db.ts", "export class Db {}\n");

    auto result = analyze();
    EXPECT_EQ(result.status, RunStatus::ViolationsFound);
    EXPECT_EQ(result.stats.parse_failures, 1u);
    EXPECT_EQ(count_rule(result, "parse-failure"), 1u);
    EXPECT_EQ(count_rule(result, "dependency-direction"), 1u);
    // errors sort ahead of the parse-failure warning
    EXPECT_EQ(result.report.violations[0].rule_id, "dependency-direction");
}

TEST_F(AnalyzerTest, IgnoredDirectoriesAreSkipped) {
    tree.write("src/domain/order.ts", "export const x = 1;\n");
    tree.write("node_modules/pkg/index.js", "module.exports = {\n");

    auto result = analyze();
    EXPECT_EQ(result.status, RunStatus::Clean);
    EXPECT_EQ(result.stats.files_discovered, 1u);
}

TEST_F(AnalyzerTest, DisabledRuleProducesNothing) {
    tree.write("src/main.ts", "export const x = 1;\n");

    auto cfg = config();
    cfg.rule_toggles["config-gap"] = rules::RuleToggle{false, std::nullopt};
    auto result = Analyzer(cfg).run();
    EXPECT_EQ(result.status, RunStatus::Clean);
}

TEST_F(AnalyzerTest, TwoIoCallsOnOneLine) {
    tree.write("src/domain/order.ts",
               "export function load() {\n"
               "  return fs.readFileSync('a') + fs.readFileSync('b');\n"
               "}\n");

    auto result = analyze();
    EXPECT_EQ(result.status, RunStatus::ViolationsFound);
    ASSERT_EQ(count_rule(result, "io-isolation"), 2u);
    const auto& first = result.report.violations[0];
    const auto& second = result.report.violations[1];
    EXPECT_EQ(first.line_range, report::LineRange::at(2));
    EXPECT_EQ(second.line_range, report::LineRange::at(2));
    EXPECT_LT(first.column, second.column);
}

// ============================================================================
// Layers and Features at the Root
// ============================================================================

TEST_F(AnalyzerTest, RootLayerDirectoriesAreNotFeatures) {
    tree.write("business/order.ts",
               "import { Db } from '../infra/db';\n"
               "import { OrderStore } from '../contracts/order_store';\n"
               "export function place(s: OrderStore) {\n  return s;\n}\n");
    tree.write("infra/db.ts", "export class Db {}\n");
    tree.write("contracts/order_store.ts", "export interface OrderStore { save(): void }\n");

    auto result = analyze();
    EXPECT_EQ(result.status, RunStatus::ViolationsFound);
    EXPECT_EQ(count_rule(result, "dependency-direction"), 1u);
    EXPECT_EQ(count_rule(result, "module-boundary"), 0u);
    ASSERT_EQ(result.report.total(), 1u);
    EXPECT_EQ(result.report.violations[0].line_range, report::LineRange::at(1));
}

TEST_F(AnalyzerTest, RootFeatureInternalsAreGuarded) {
    tree.write("feature_a/x.ts", "import { y } from '../feature_b/internal';\nexport const x = y;\n");
    tree.write("feature_b/internal.ts", "export const y = 1;\n");
    tree.write("feature_b/index.ts", "export { y } from './internal';\n");

    auto result = analyze();
    EXPECT_EQ(result.status, RunStatus::ViolationsFound);
    ASSERT_EQ(count_rule(result, "module-boundary"), 1u);
    auto it = std::find_if(result.report.violations.begin(), result.report.violations.end(),
                           [](const report::Violation& v) { return v.rule_id == "module-boundary"; });
    ASSERT_NE(it, result.report.violations.end());
    EXPECT_EQ(it->path, "feature_a/x.ts");
    EXPECT_EQ(it->line_range, report::LineRange::at(1));
}

TEST_F(AnalyzerTest, RootFeatureWithLayerSubdirectories) {
    tree.write("feature_a/domain/x.ts",
               "import { y } from '../../feature_b/domain/internal';\nexport const x = y;\n");
    tree.write("feature_b/domain/internal.ts", "export const y = 1;\n");

    auto result = analyze();
    EXPECT_EQ(count_rule(result, "module-boundary"), 1u);
    EXPECT_EQ(count_rule(result, "dependency-direction"), 0u);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(AnalyzerTest, MissingRootIsConfigError) {
    auto cfg = config::default_config(tree.root() / "does-not-exist");
    auto result = Analyzer(cfg).run();
    EXPECT_EQ(result.status, RunStatus::ConfigError);
    ASSERT_TRUE(result.config_error.has_value());
    EXPECT_EQ(result.config_error->key, "root");
    EXPECT_EQ(result.report.total(), 0u);
}

TEST_F(AnalyzerTest, InvalidIgnoreGlobIsConfigError) {
    auto cfg = config();
    cfg.ignore = {"**/ok/**", "src/{a,b"};
    auto result = Analyzer(cfg).run();
    EXPECT_EQ(result.status, RunStatus::ConfigError);
    EXPECT_EQ(result.config_error->key, "ignore[1]");
}

TEST_F(AnalyzerTest, NegativeThreadCountIsConfigError) {
    auto cfg = config();
    cfg.threads = -2;
    EXPECT_EQ(Analyzer(cfg).run().status, RunStatus::ConfigError);
}

TEST_F(AnalyzerTest, ExpiredDeadlineTimesOut) {
    tree.write("src/domain/order.ts",
               "import { Db } from '../infra/db';\nexport function place() {}\n");
    tree.write("src/infra/db.ts", "export class Db {}\n");

    auto result = Analyzer(config()).run(Deadline::after(std::chrono::milliseconds(0)));
    EXPECT_EQ(result.status, RunStatus::Timeout);
    EXPECT_EQ(result.message, "discovery");
    EXPECT_EQ(result.report.total(), 0u);
}

TEST_F(AnalyzerTest, DeadlineDuringIngestionTimesOut) {
    for (int i = 0; i < 3000; ++i) {
        tree.write("src/domain/m" + std::to_string(i) + ".ts",
                   "import { Db } from '../infra/db';\nexport const V" + std::to_string(i) +
                       " = 1;\n");
    }
    tree.write("src/infra/db.ts", "export class Db {}\n");

    auto cfg = config();
    cfg.threads = 2;
    auto result = Analyzer(cfg).run(Deadline::after(std::chrono::milliseconds(1)));
    EXPECT_EQ(result.status, RunStatus::Timeout);
    EXPECT_FALSE(result.message.empty());
    EXPECT_EQ(result.report.total(), 0u);
}

TEST_F(AnalyzerTest, InvalidRuleOutputIsInternalError) {
    tree.write("src/domain/order.ts", "export function place() {}\n");

    auto cfg = config();
    cfg.rule_set = [] {
        std::vector<Box<rules::Rule>> set;
        set.push_back(make_box<UnknownPathRule>());
        return set;
    };
    auto result = Analyzer(cfg).run();
    EXPECT_EQ(result.status, RunStatus::InternalError);
    EXPECT_EQ(result.report.total(), 0u);
    EXPECT_NE(result.message.find("rule 'unknown-path'"), std::string::npos);
    EXPECT_NE(result.message.find("unknown module path"), std::string::npos);
    EXPECT_STREQ(run_status_name(result.status), "internal-error");
}

TEST_F(AnalyzerTest, RuleSetReplacesBuiltins) {
    tree.write("src/domain/order.ts",
               "import { Db } from '../infra/db';\nexport function place() {}\n");
    tree.write("src/infra/db.ts", "export class Db {}\n");

    auto cfg = config();
    cfg.rule_set = [] { return std::vector<Box<rules::Rule>>{}; };
    auto result = Analyzer(cfg).run();
    EXPECT_EQ(result.status, RunStatus::Clean);
    EXPECT_EQ(result.stats.edges, 1u);
}

// ============================================================================
// Determinism
// ============================================================================

TEST_F(AnalyzerTest, ThreadCountDoesNotChangeReport) {
    for (int i = 0; i < 30; ++i) {
        auto dir = i % 3 == 0 ? "domain" : (i % 3 == 1 ? "infra" : "ui");
        auto next = (i + 1) % 30;
        auto next_dir = next % 3 == 0 ? "domain" : (next % 3 == 1 ? "infra" : "ui");
        tree.write("src/" + std::string(dir) + "/m" + std::to_string(i) + ".ts",
                   "import { V" + std::to_string(next) + " } from '../" + next_dir + "/m" +
                       std::to_string(next) + "';\nexport const V" + std::to_string(i) +
                       " = 1;\n");
    }

    auto single = config();
    single.threads = 1;
    auto many = config();
    many.threads = 8;

    auto a = Analyzer(single).run();
    auto b = Analyzer(many).run();
    EXPECT_EQ(a.status, RunStatus::ViolationsFound);
    EXPECT_EQ(a.status, b.status);
    EXPECT_EQ(report::report_to_json(a.report), report::report_to_json(b.report));

    auto again = Analyzer(many).run();
    EXPECT_EQ(report::report_to_json(b.report), report::report_to_json(again.report));
}

// ============================================================================
// Go Modules
// ============================================================================

TEST_F(AnalyzerTest, GoModuleMapping) {
    tree.write("go.mod", "module example.com/shop\n\ngo 1.21\n");
    auto mapping = go_module_mapping(tree.root());
    ASSERT_TRUE(mapping.has_value());
    EXPECT_EQ(mapping->prefix, "example.com/shop/");
    EXPECT_EQ(mapping->target, "");

    EXPECT_FALSE(go_module_mapping(tree.root() / "missing").has_value());
}

TEST_F(AnalyzerTest, GoImportsResolveThroughModulePath) {
    tree.write("go.mod", "module example.com/shop\n");
    tree.write("internal/domain/order.go",
               "package domain\n\nimport \"example.com/shop/internal/infra\"\n");
    tree.write("internal/infra/db.go", "package infra\n");

    auto result = analyze();
    EXPECT_EQ(result.stats.edges, 1u);
    EXPECT_EQ(count_rule(result, "dependency-direction"), 1u);
}

// ============================================================================
// JSON
// ============================================================================

TEST_F(AnalyzerTest, ResultJson) {
    tree.write("src/main.ts", "export const x = 1;\n");

    auto json = result_to_json(analyze());
    EXPECT_EQ(json.get("status")->as_string(), "violations-found");
    EXPECT_EQ(json.get("stats")->get("modules")->try_as_i64(), 1);
    EXPECT_EQ(json.get("counts")->get("total")->try_as_i64(), 1);
    EXPECT_FALSE(json.contains("error"));
}

TEST_F(AnalyzerTest, ConfigErrorJson) {
    auto result = Analyzer(config::default_config(tree.root() / "nope")).run();
    auto json = result_to_json(result);
    EXPECT_EQ(json.get("status")->as_string(), "config-error");
    EXPECT_EQ(json.get("error")->get("key")->as_string(), "root");
    EXPECT_EQ(json.get("violations")->size(), 0u);
}

TEST_F(AnalyzerTest, TimeoutJsonNamesStage) {
    auto result = Analyzer(config()).run(Deadline::after(std::chrono::milliseconds(0)));
    auto json = result_to_json(result);
    EXPECT_EQ(json.get("status")->as_string(), "timeout");
    EXPECT_EQ(json.get("error")->get("stage")->as_string(), "discovery");
}
