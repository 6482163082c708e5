//! # CLI Internal Interface
//!
//! Declarations shared by the command handlers.
//!
//! ## Commands
//!
//! | Command        | Handler       | Description                          |
//! |----------------|---------------|--------------------------------------|
//! | `strata check` | `run_check()` | Analyze a source tree                |
//! | `strata rules` | `run_rules()` | List the built-in rules              |
//!
//! ## Exit Codes
//!
//! | Code | Run status         |
//! |------|--------------------|
//! | 0    | `clean`            |
//! | 1    | `violations-found` |
//! | 2    | `config-error`     |
//! | 3    | `timeout`          |
//! | 4    | `internal-error`   |

#pragma once

#include "strata/analysis/analyzer.hpp"
#include "strata/common.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace strata::cli {

constexpr int EXIT_CLEAN = 0;
constexpr int EXIT_VIOLATIONS = 1;
constexpr int EXIT_CONFIG_ERROR = 2;
constexpr int EXIT_TIMEOUT = 3;
constexpr int EXIT_INTERNAL_ERROR = 4;

enum class OutputFormat { Text, Json };

// ============================================================================
// Terminal Colors
// ============================================================================

/// ANSI escape sequences, or empty strings when colors are off.
struct Palette {
    const char* reset = "";
    const char* bold = "";
    const char* dim = "";
    const char* red = "";
    const char* yellow = "";
    const char* green = "";
    const char* cyan = "";

    static auto plain() -> Palette;
    static auto ansi() -> Palette;
};

/// True when stdout is a terminal and `NO_COLOR` is unset.
bool stdout_supports_color();

// ============================================================================
// Check Command
// ============================================================================

struct CheckOptions {
    std::filesystem::path root = ".";
    std::optional<std::filesystem::path> config_path;
    OutputFormat format = OutputFormat::Text;
    std::optional<int> threads;
    /// Milliseconds; 0 disables the configured deadline.
    std::optional<int64_t> deadline_ms;
    bool color = true;
};

/// Parses the arguments that follow `check`. Log options must already be
/// removed. The error is a one-line usage message.
Result<CheckOptions, std::string> parse_check_args(const std::vector<std::string>& args);

/// Loads configuration, applies command-line overrides and runs the analyzer.
/// Configuration failures come back as a `ConfigError` result.
analysis::AnalysisResult check(const CheckOptions& options);

/// Human-readable rendering, grouped by file.
std::string format_text(const analysis::AnalysisResult& result, const Palette& palette);

int exit_code(analysis::RunStatus status);

int run_check(int argc, char* argv[]);

// ============================================================================
// Rules Command
// ============================================================================

/// One line per built-in rule: id, default severity, description.
std::string format_rules_text(const Palette& palette);

int run_rules(int argc, char* argv[]);

// ============================================================================
// Help Text
// ============================================================================

void print_usage();
void print_version();
void print_check_help();

/// Main entry point: dispatches on argv[1].
int strata_main(int argc, char* argv[]);

} // namespace strata::cli
