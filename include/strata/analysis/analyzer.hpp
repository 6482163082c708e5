//! # Analyzer
//!
//! Runs the whole pipeline for one configuration and maps every outcome to a
//! run status.
//!
//! ## Pipeline
//!
//! ```text
//! validate config → discover → ingest (parallel) ═ barrier ═ build graph
//!     → classify → evaluate rules → report
//! ```
//!
//! ## Status Mapping
//!
//! | Outcome                                | Status             |
//! |----------------------------------------|--------------------|
//! | Report empty                           | `Clean`            |
//! | Report non-empty                       | `ViolationsFound`  |
//! | Deadline passed at any stage           | `Timeout`          |
//! | Configuration rejected before ingestion| `ConfigError`      |
//! | `InternalError` or unexpected exception| `InternalError`    |
//!
//! A run that does not finish cleanly returns an empty report: violations
//! from a partial graph are not trustworthy.

#ifndef STRATA_ANALYSIS_ANALYZER_HPP
#define STRATA_ANALYSIS_ANALYZER_HPP

#include "strata/common.hpp"
#include "strata/deadline.hpp"
#include "strata/graph/module_graph.hpp"
#include "strata/ingest/source_ingestor.hpp"
#include "strata/json/json_value.hpp"
#include "strata/policy/layer_policy.hpp"
#include "strata/report/violation_reporter.hpp"
#include "strata/rules/rule_engine.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace strata::analysis {

enum class RunStatus : uint8_t { Clean, ViolationsFound, Timeout, ConfigError, InternalError };

[[nodiscard]] auto run_status_name(RunStatus status) -> const char*;

/// Glob patterns skipped unless configuration replaces them.
[[nodiscard]] auto default_ignore_globs() -> std::vector<std::string>;

/// Everything one run needs. Plain value, no global state.
struct AnalysisConfig {
    std::filesystem::path root = ".";
    policy::LayerPolicy policy = policy::LayerPolicy::canonical();
    ingest::IngestOptions ingest;
    graph::GraphOptions graph;
    rules::RuleSettings rules;
    std::map<std::string, rules::RuleToggle> rule_toggles;
    /// Builds the rules to evaluate; empty selects `rules::builtin_rules()`.
    std::function<std::vector<Box<rules::Rule>>()> rule_set;
    std::vector<std::string> ignore = default_ignore_globs();
    /// Worker count; 0 selects the hardware concurrency.
    int threads = 0;
    std::optional<std::chrono::milliseconds> deadline;
};

struct RunStats {
    size_t files_discovered = 0;
    size_t files_ingested = 0;
    size_t parse_failures = 0;
    size_t modules = 0;
    size_t edges = 0;
    size_t external_deps = 0;
    size_t cycles = 0;
    int threads = 0;
    int64_t elapsed_ms = 0;
};

struct AnalysisResult {
    RunStatus status = RunStatus::Clean;
    report::Report report;
    std::optional<ConfigError> config_error;
    /// Diagnostic for `InternalError` and the stage for `Timeout`.
    std::string message;
    RunStats stats;
};

class Analyzer {
public:
    explicit Analyzer(AnalysisConfig config) : config_(std::move(config)) {}

    /// Runs with the configured deadline, if any.
    [[nodiscard]] auto run() const -> AnalysisResult;

    /// Runs against an explicit deadline.
    [[nodiscard]] auto run(const Deadline& deadline) const -> AnalysisResult;

    [[nodiscard]] auto config() const -> const AnalysisConfig& {
        return config_;
    }

private:
    auto run_pipeline(const Deadline& deadline, RunStats& stats) const -> report::Report;

    AnalysisConfig config_;
};

/// Checks the parts of a configuration the policy constructor does not:
/// root directory, ignore globs, thread count.
[[nodiscard]] auto validate_config(const AnalysisConfig& config) -> std::optional<ConfigError>;

/// Root mapping for a Go module: `module x/y` in `go.mod` maps `x/y/` to the
/// root. nullopt without a readable `go.mod`.
[[nodiscard]] auto go_module_mapping(const std::filesystem::path& root)
    -> std::optional<graph::RootMapping>;

/// JSON rendering: status, report, stats and any error.
[[nodiscard]] auto result_to_json(const AnalysisResult& result) -> json::JsonValue;

} // namespace strata::analysis

#endif // STRATA_ANALYSIS_ANALYZER_HPP
