//! # Analyzer Implementation
//!
//! Orchestrates one run. The deadline is checked before each stage and,
//! inside ingestion and rule evaluation, before each file and each rule.
//! Exceptions stop at this boundary: nothing escapes `run()`.

#include "strata/analysis/analyzer.hpp"

#include "strata/ingest/ingest_pool.hpp"
#include "strata/log/log.hpp"
#include "strata/policy/glob.hpp"
#include "strata/policy/layer_classifier.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace strata::analysis {

auto run_status_name(RunStatus status) -> const char* {
    switch (status) {
    case RunStatus::Clean:
        return "clean";
    case RunStatus::ViolationsFound:
        return "violations-found";
    case RunStatus::Timeout:
        return "timeout";
    case RunStatus::ConfigError:
        return "config-error";
    case RunStatus::InternalError:
        return "internal-error";
    }
    return "unknown";
}

auto default_ignore_globs() -> std::vector<std::string> {
    return {"**/node_modules/**", "**/vendor/**", "**/.git/**",        "**/dist/**",
            "**/build/**",        "**/target/**", "**/__pycache__/**"};
}

auto validate_config(const AnalysisConfig& config) -> std::optional<ConfigError> {
    std::error_code ec;
    if (!std::filesystem::is_directory(config.root, ec)) {
        return ConfigError::make("root", "not a directory: " + config.root.string());
    }
    for (size_t i = 0; i < config.ignore.size(); ++i) {
        auto glob = policy::Glob::compile(config.ignore[i]);
        if (is_err(glob)) {
            return ConfigError::make("ignore[" + std::to_string(i) + "]",
                                     "invalid glob '" + config.ignore[i] + "': " +
                                         unwrap_err(glob));
        }
    }
    if (config.threads < 0) {
        return ConfigError::make("threads", "must not be negative");
    }
    if (config.deadline && config.deadline->count() < 0) {
        return ConfigError::make("deadline_ms", "must not be negative");
    }
    return std::nullopt;
}

auto go_module_mapping(const std::filesystem::path& root) -> std::optional<graph::RootMapping> {
    std::ifstream file(root / "go.mod");
    if (!file) {
        return std::nullopt;
    }
    std::string line;
    while (std::getline(file, line)) {
        std::istringstream words(line);
        std::string keyword;
        std::string module;
        if (words >> keyword >> module && keyword == "module") {
            if (module.size() >= 2 && module.front() == '"' && module.back() == '"') {
                module = module.substr(1, module.size() - 2);
            }
            return graph::RootMapping{module + "/", ""};
        }
    }
    return std::nullopt;
}

// ============================================================================
// Run
// ============================================================================

auto Analyzer::run() const -> AnalysisResult {
    return run(config_.deadline ? Deadline::after(*config_.deadline) : Deadline::none());
}

auto Analyzer::run(const Deadline& deadline) const -> AnalysisResult {
    auto start = std::chrono::steady_clock::now();
    AnalysisResult result;

    auto finish = [&](RunStatus status) {
        result.status = status;
        result.stats.elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                      std::chrono::steady_clock::now() - start)
                                      .count();
        STRATA_LOG_INFO("analysis", "Run finished: " << run_status_name(status) << " in "
                                                      << result.stats.elapsed_ms << "ms");
        return std::move(result);
    };

    if (auto error = validate_config(config_)) {
        STRATA_LOG_ERROR("config", error->to_string());
        result.config_error = std::move(error);
        return finish(RunStatus::ConfigError);
    }

    try {
        result.report = run_pipeline(deadline, result.stats);
    } catch (const DeadlineExceeded& e) {
        STRATA_LOG_WARN("analysis", e.what());
        result.report = report::Report{};
        result.message = e.stage();
        return finish(RunStatus::Timeout);
    } catch (const InternalError& e) {
        STRATA_LOG_ERROR("analysis", "Internal error: " << e.what());
        result.report = report::Report{};
        result.message = e.what();
        return finish(RunStatus::InternalError);
    } catch (const std::exception& e) {
        STRATA_LOG_ERROR("analysis", "Unexpected failure: " << e.what());
        result.report = report::Report{};
        result.message = e.what();
        return finish(RunStatus::InternalError);
    }

    return finish(result.report.total() == 0 ? RunStatus::Clean : RunStatus::ViolationsFound);
}

auto Analyzer::run_pipeline(const Deadline& deadline, RunStats& stats) const -> report::Report {
    const auto root = std::filesystem::absolute(config_.root).lexically_normal();
    STRATA_LOG_INFO("analysis", "Analyzing " << root.string());

    deadline.check("discovery");
    auto files = ingest::discover_sources(root, config_.ignore);
    stats.files_discovered = files.size();

    ingest::SourceIngestor ingestor(config_.ingest);
    ingest::IngestPool pool(ingestor, config_.threads);
    stats.threads = files.empty() ? 0 : std::min(pool.thread_count(), static_cast<int>(files.size()));
    auto facts = pool.run(root, files, deadline);
    stats.files_ingested = facts.size();
    for (const auto& f : facts) {
        if (!f.parse_ok) {
            stats.parse_failures++;
        }
    }

    deadline.check("graph");
    auto graph_options = config_.graph;
    if (auto go = go_module_mapping(root)) {
        STRATA_LOG_DEBUG("graph", "Go module prefix " << go->prefix << " maps to the root");
        graph_options.root_mappings.insert(graph_options.root_mappings.begin(), *go);
    }
    graph::ModuleGraphBuilder builder(std::move(graph_options));
    auto graph = builder.build(std::move(facts));
    stats.modules = graph.modules().size();
    stats.edges = graph.edges().size();
    stats.external_deps = graph.external_dep_count();
    stats.cycles = graph.cycles().size();

    deadline.check("classification");
    policy::LayerClassifier classifier(config_.policy);
    classifier.apply(graph);

    deadline.check("rules");
    rules::RuleEngine engine(config_.rule_set ? config_.rule_set() : rules::builtin_rules(),
                             config_.rule_toggles);
    rules::RuleContext ctx{graph, config_.policy, config_.rules};
    auto violations = engine.evaluate(ctx, deadline);

    deadline.check("report");
    return report::ViolationReporter().build(std::move(violations));
}

// ============================================================================
// JSON
// ============================================================================

auto result_to_json(const AnalysisResult& result) -> json::JsonValue {
    using json::JsonObject;
    using json::JsonValue;

    auto root = report::report_to_json(result.report);
    root.set("status", JsonValue(run_status_name(result.status)));

    JsonObject stats;
    auto num = [](auto v) { return JsonValue(static_cast<int64_t>(v)); };
    stats.emplace("files_discovered", num(result.stats.files_discovered));
    stats.emplace("files_ingested", num(result.stats.files_ingested));
    stats.emplace("parse_failures", num(result.stats.parse_failures));
    stats.emplace("modules", num(result.stats.modules));
    stats.emplace("edges", num(result.stats.edges));
    stats.emplace("external_deps", num(result.stats.external_deps));
    stats.emplace("cycles", num(result.stats.cycles));
    stats.emplace("threads", num(result.stats.threads));
    stats.emplace("elapsed_ms", num(result.stats.elapsed_ms));
    root.set("stats", JsonValue(std::move(stats)));

    if (result.config_error) {
        JsonObject error;
        error.emplace("key", JsonValue(result.config_error->key));
        error.emplace("message", JsonValue(result.config_error->message));
        root.set("error", JsonValue(std::move(error)));
    } else if (result.status == RunStatus::InternalError) {
        JsonObject error;
        error.emplace("message", JsonValue(result.message));
        root.set("error", JsonValue(std::move(error)));
    } else if (result.status == RunStatus::Timeout) {
        JsonObject error;
        error.emplace("stage", JsonValue(result.message));
        root.set("error", JsonValue(std::move(error)));
    }
    return root;
}

} // namespace strata::analysis
