//! # Check Command
//!
//! Implements `strata check`.
//!
//! ## Flow
//!
//! ```text
//! run_check()
//!   ├─ parse_check_args()   - root, --config, --format, overrides
//!   ├─ check()
//!   │     ├─ load_config()  - strata.json or --config file
//!   │     ├─ apply --threads / --deadline-ms
//!   │     └─ Analyzer::run()
//!   ├─ format_text() or result_to_json()
//!   └─ exit_code(status)
//! ```
//!
//! Report output goes to stdout; log records go to stderr.

#include "cli_internal.hpp"

#include "strata/config/config_loader.hpp"
#include "strata/log/log.hpp"

#include <charconv>
#include <iostream>
#include <map>
#include <sstream>

namespace strata::cli {

using analysis::AnalysisResult;
using analysis::RunStatus;
using report::Severity;
using report::Violation;

// ============================================================================
// Argument Parsing
// ============================================================================

namespace {

bool parse_int(std::string_view text, int64_t& out) {
    if (text.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc() && ptr == text.data() + text.size();
}

} // namespace

Result<CheckOptions, std::string> parse_check_args(const std::vector<std::string>& args) {
    CheckOptions options;
    bool has_root = false;

    for (const auto& arg : args) {
        if (arg.starts_with("--config=")) {
            auto value = arg.substr(9);
            if (value.empty()) {
                return std::string("--config requires a file path");
            }
            options.config_path = value;
        } else if (arg.starts_with("--format=")) {
            auto value = arg.substr(9);
            if (value == "text") {
                options.format = OutputFormat::Text;
            } else if (value == "json") {
                options.format = OutputFormat::Json;
            } else {
                return "unknown format '" + value + "' (expected text or json)";
            }
        } else if (arg.starts_with("--threads=")) {
            int64_t n = 0;
            if (!parse_int(arg.substr(10), n) || n < 0 || n > 1024) {
                return "invalid thread count '" + arg.substr(10) + "'";
            }
            options.threads = static_cast<int>(n);
        } else if (arg.starts_with("--deadline-ms=")) {
            int64_t n = 0;
            if (!parse_int(arg.substr(14), n) || n < 0) {
                return "invalid deadline '" + arg.substr(14) + "'";
            }
            options.deadline_ms = n;
        } else if (arg == "--no-color") {
            options.color = false;
        } else if (!arg.empty() && arg[0] == '-') {
            return "unknown option '" + arg + "'";
        } else {
            if (has_root) {
                return "more than one root given ('" + options.root.string() + "', '" + arg + "')";
            }
            options.root = arg;
            has_root = true;
        }
    }
    return options;
}

// ============================================================================
// Running
// ============================================================================

AnalysisResult check(const CheckOptions& options) {
    auto loaded = config::load_config(options.root, options.config_path);
    if (is_err(loaded)) {
        const auto& error = unwrap_err(loaded);
        STRATA_LOG_ERROR("config", error.to_string());
        AnalysisResult result;
        result.status = RunStatus::ConfigError;
        result.config_error = error;
        return result;
    }

    auto config = std::move(unwrap(loaded));
    if (options.threads) {
        config.threads = *options.threads;
    }
    if (options.deadline_ms) {
        if (*options.deadline_ms == 0) {
            config.deadline.reset();
        } else {
            config.deadline = std::chrono::milliseconds(*options.deadline_ms);
        }
    }

    STRATA_LOG_DEBUG("cli", "Threads: " << config.threads << ", deadline: "
                                        << (config.deadline
                                                ? std::to_string(config.deadline->count()) + "ms"
                                                : std::string("none")));

    analysis::Analyzer analyzer(std::move(config));
    return analyzer.run();
}

// ============================================================================
// Text Output
// ============================================================================

namespace {

const char* severity_color(Severity severity, const Palette& p) {
    switch (severity) {
    case Severity::Error:
        return p.red;
    case Severity::Warning:
        return p.yellow;
    case Severity::Info:
        return p.cyan;
    }
    return p.reset;
}

std::string plural(size_t n, const char* noun) {
    return std::to_string(n) + " " + noun + (n == 1 ? "" : "s");
}

void write_violations(std::ostringstream& out, const report::Report& report, const Palette& p) {
    // Report order is severity first; regroup per file keeping that order
    std::map<std::string, std::vector<const Violation*>> by_file;
    for (const auto& v : report.violations) {
        by_file[v.path].push_back(&v);
    }

    for (const auto& [path, violations] : by_file) {
        out << p.bold << path << p.reset << "\n";
        for (const auto* v : violations) {
            std::string location = "-";
            if (v->line_range) {
                location = std::to_string(v->line_range->begin);
                if (v->line_range->end != v->line_range->begin) {
                    location += "-" + std::to_string(v->line_range->end);
                }
            }
            out << "  " << p.dim << location << p.reset << "  "
                << severity_color(v->severity, p) << report::severity_name(v->severity)
                << p.reset << "  " << p.dim << "[" << v->rule_id << "]" << p.reset << " "
                << v->message << "\n";
        }
        out << "\n";
    }
}

} // namespace

std::string format_text(const AnalysisResult& result, const Palette& p) {
    std::ostringstream out;

    switch (result.status) {
    case RunStatus::ConfigError:
        out << p.red << "configuration error" << p.reset << ": "
            << (result.config_error ? result.config_error->to_string() : result.message) << "\n";
        return out.str();
    case RunStatus::Timeout:
        out << p.red << "timeout" << p.reset << ": deadline exceeded during " << result.message
            << " after " << result.stats.elapsed_ms << "ms\n";
        return out.str();
    case RunStatus::InternalError:
        out << p.red << "internal error" << p.reset << ": " << result.message << "\n";
        return out.str();
    case RunStatus::Clean:
    case RunStatus::ViolationsFound:
        break;
    }

    write_violations(out, result.report, p);

    const auto& stats = result.stats;
    if (result.status == RunStatus::Clean) {
        out << p.green << "No violations" << p.reset;
    } else {
        const auto& report = result.report;
        out << plural(report.total(), "violation") << ": ";
        out << p.red << plural(report.count(Severity::Error), "error") << p.reset << ", ";
        out << p.yellow << plural(report.count(Severity::Warning), "warning") << p.reset << ", ";
        out << p.cyan << plural(report.count(Severity::Info), "info") << p.reset;
    }
    out << " " << p.dim << "(" << plural(stats.files_ingested, "file") << ", "
        << plural(stats.modules, "module") << ", " << plural(stats.edges, "edge") << ", "
        << stats.elapsed_ms << "ms)" << p.reset << "\n";
    return out.str();
}

// ============================================================================
// Entry Point
// ============================================================================

int run_check(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_check_help();
            return EXIT_CLEAN;
        }
        if (log::is_log_option(arg)) {
            continue;
        }
        args.push_back(std::move(arg));
    }

    auto parsed = parse_check_args(args);
    if (is_err(parsed)) {
        std::cerr << "strata check: " << unwrap_err(parsed) << "\n";
        std::cerr << "Run 'strata check --help' for usage.\n";
        return EXIT_CONFIG_ERROR;
    }
    const auto& options = unwrap(parsed);

    auto result = check(options);

    if (options.format == OutputFormat::Json) {
        std::cout << analysis::result_to_json(result).to_string_pretty() << "\n";
    } else {
        auto palette =
            options.color && stdout_supports_color() ? Palette::ansi() : Palette::plain();
        std::cout << format_text(result, palette);
    }
    std::cout.flush();

    return exit_code(result.status);
}

} // namespace strata::cli
