// CLI Tests
// Tests for check argument parsing, exit codes and text output

#include "cli/cli_internal.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace strata;
using namespace strata::cli;
using analysis::AnalysisResult;
using analysis::RunStatus;
using strata::testing::TempTree;

namespace {

CheckOptions parse_ok(const std::vector<std::string>& args) {
    auto result = parse_check_args(args);
    EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result) : "");
    return is_ok(result) ? unwrap(result) : CheckOptions{};
}

std::string parse_error(const std::vector<std::string>& args) {
    auto result = parse_check_args(args);
    EXPECT_TRUE(is_err(result));
    return is_err(result) ? unwrap_err(result) : "";
}

report::Violation violation(const std::string& rule, report::Severity severity,
                            const std::string& path, std::optional<report::LineRange> range,
                            const std::string& message) {
    report::Violation v;
    v.rule_id = rule;
    v.severity = severity;
    v.path = path;
    v.line_range = range;
    v.message = message;
    return v;
}

} // namespace

// ============================================================================
// Argument Parsing
// ============================================================================

TEST(CheckArgsTest, Defaults) {
    auto options = parse_ok({});
    EXPECT_EQ(options.root, std::filesystem::path("."));
    EXPECT_FALSE(options.config_path.has_value());
    EXPECT_EQ(options.format, OutputFormat::Text);
    EXPECT_FALSE(options.threads.has_value());
    EXPECT_FALSE(options.deadline_ms.has_value());
    EXPECT_TRUE(options.color);
}

TEST(CheckArgsTest, AllOptions) {
    auto options = parse_ok({"--format=json", "--threads=4", "--deadline-ms=1500", "--no-color",
                             "--config=ci/strata.json", "services/api"});
    EXPECT_EQ(options.root, std::filesystem::path("services/api"));
    EXPECT_EQ(options.config_path, std::filesystem::path("ci/strata.json"));
    EXPECT_EQ(options.format, OutputFormat::Json);
    EXPECT_EQ(options.threads, 4);
    EXPECT_EQ(options.deadline_ms, 1500);
    EXPECT_FALSE(options.color);
}

TEST(CheckArgsTest, Rejections) {
    EXPECT_NE(parse_error({"--format=xml"}).find("unknown format 'xml'"), std::string::npos);
    EXPECT_NE(parse_error({"--threads=-1"}).find("invalid thread count"), std::string::npos);
    EXPECT_NE(parse_error({"--threads=many"}).find("invalid thread count"), std::string::npos);
    EXPECT_NE(parse_error({"--threads=5000"}).find("invalid thread count"), std::string::npos);
    EXPECT_NE(parse_error({"--deadline-ms=-3"}).find("invalid deadline"), std::string::npos);
    EXPECT_NE(parse_error({"--config="}).find("--config requires"), std::string::npos);
    EXPECT_NE(parse_error({"--verbose-ish"}).find("unknown option"), std::string::npos);
    EXPECT_NE(parse_error({"a", "b"}).find("more than one root"), std::string::npos);
}

// ============================================================================
// Exit Codes
// ============================================================================

TEST(ExitCodeTest, OnePerStatus) {
    EXPECT_EQ(exit_code(RunStatus::Clean), 0);
    EXPECT_EQ(exit_code(RunStatus::ViolationsFound), 1);
    EXPECT_EQ(exit_code(RunStatus::ConfigError), 2);
    EXPECT_EQ(exit_code(RunStatus::Timeout), 3);
    EXPECT_EQ(exit_code(RunStatus::InternalError), 4);
}

// ============================================================================
// Text Output
// ============================================================================

TEST(FormatTextTest, GroupsViolationsByFile) {
    AnalysisResult result;
    result.status = RunStatus::ViolationsFound;
    result.report.violations.push_back(violation("dependency-direction", report::Severity::Error,
                                                 "src/b.ts", report::LineRange::at(3),
                                                 "bad import"));
    result.report.violations.push_back(violation("error-shape", report::Severity::Warning,
                                                 "src/a.ts", report::LineRange{4, 6},
                                                 "empty catch block"));
    result.report.violations.push_back(
        violation("config-gap", report::Severity::Warning, "src/b.ts", std::nullopt, "no layer"));
    result.report.by_severity[report::Severity::Error] = 1;
    result.report.by_severity[report::Severity::Warning] = 2;
    result.stats.files_ingested = 2;
    result.stats.modules = 2;
    result.stats.edges = 1;
    result.stats.elapsed_ms = 5;

    auto text = format_text(result, Palette::plain());
    EXPECT_EQ(text, "src/a.ts\n"
                    "  4-6  warning  [error-shape] empty catch block\n"
                    "\n"
                    "src/b.ts\n"
                    "  3  error  [dependency-direction] bad import\n"
                    "  -  warning  [config-gap] no layer\n"
                    "\n"
                    "3 violations: 1 error, 2 warnings, 0 infos "
                    "(2 files, 2 modules, 1 edge, 5ms)\n");
}

TEST(FormatTextTest, CleanSummary) {
    AnalysisResult result;
    result.stats.files_ingested = 1;
    result.stats.modules = 1;
    auto text = format_text(result, Palette::plain());
    EXPECT_EQ(text, "No violations (1 file, 1 module, 0 edges, 0ms)\n");
}

TEST(FormatTextTest, FailureStatuses) {
    AnalysisResult config_error;
    config_error.status = RunStatus::ConfigError;
    config_error.config_error = ConfigError::make("threads", "must not be negative");
    EXPECT_EQ(format_text(config_error, Palette::plain()),
              "configuration error: threads: must not be negative\n");

    AnalysisResult timeout;
    timeout.status = RunStatus::Timeout;
    timeout.message = "rule io-isolation";
    timeout.stats.elapsed_ms = 12;
    EXPECT_EQ(format_text(timeout, Palette::plain()),
              "timeout: deadline exceeded during rule io-isolation after 12ms\n");

    AnalysisResult internal;
    internal.status = RunStatus::InternalError;
    internal.message = "edge to unknown module";
    EXPECT_EQ(format_text(internal, Palette::plain()),
              "internal error: edge to unknown module\n");
}

TEST(FormatTextTest, AnsiPaletteColorsSeverity) {
    AnalysisResult result;
    result.status = RunStatus::ViolationsFound;
    result.report.violations.push_back(violation("dependency-direction", report::Severity::Error,
                                                 "a.ts", report::LineRange::at(1), "x"));
    auto palette = Palette::ansi();
    auto text = format_text(result, palette);
    EXPECT_NE(text.find(std::string(palette.red) + "error"), std::string::npos);
    EXPECT_NE(text.find(palette.reset), std::string::npos);
}

// ============================================================================
// Check
// ============================================================================

TEST(CheckTest, RunsAgainstRoot) {
    TempTree tree("cli");
    tree.write("src/domain/order.ts",
               "import { Db } from '../infra/db';\nexport function place() {}\n");
    tree.write("src/infra/db.ts", "export class Db {}\n");

    CheckOptions options;
    options.root = tree.root();
    options.threads = 2;
    auto result = check(options);
    EXPECT_EQ(result.status, RunStatus::ViolationsFound);
    EXPECT_EQ(exit_code(result.status), EXIT_VIOLATIONS);
    EXPECT_EQ(result.report.count("dependency-direction"), 1u);
}

TEST(CheckTest, BadConfigFileIsConfigError) {
    TempTree tree("cli");
    tree.write("strata.json", R"({"threads": -1})");

    CheckOptions options;
    options.root = tree.root();
    auto result = check(options);
    EXPECT_EQ(result.status, RunStatus::ConfigError);
    ASSERT_TRUE(result.config_error.has_value());
    EXPECT_EQ(result.config_error->key, "threads");
}

TEST(CheckTest, MissingExplicitConfig) {
    TempTree tree("cli");
    CheckOptions options;
    options.root = tree.root();
    options.config_path = tree.root() / "absent.json";
    EXPECT_EQ(check(options).status, RunStatus::ConfigError);
}

TEST(CheckTest, ZeroDeadlineOverrideDisablesConfiguredDeadline) {
    TempTree tree("cli");
    tree.write("strata.json", R"({"deadline_ms": 1})");
    tree.write("src/domain/order.ts", "export const x = 1;\n");

    CheckOptions options;
    options.root = tree.root();
    options.deadline_ms = 0;
    EXPECT_EQ(check(options).status, RunStatus::Clean);
}

// ============================================================================
// Rules Listing
// ============================================================================

TEST(RulesListingTest, OneLinePerRule) {
    auto text = format_rules_text(Palette::plain());
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 8);
    for (const auto& rule : rules::builtin_rules()) {
        EXPECT_NE(text.find(std::string(rule->id())), std::string::npos) << rule->id();
        EXPECT_NE(text.find(std::string(rule->description())), std::string::npos);
    }
}

// ============================================================================
// Version
// ============================================================================

TEST(VersionTest, PrintsVersionString) {
    ::testing::internal::CaptureStdout();
    print_version();
    auto out = ::testing::internal::GetCapturedStdout();
    EXPECT_EQ(out, std::string("strata ") + VERSION + "\n");
    EXPECT_EQ(std::count(out.begin(), out.end(), '.'), 2);
}
