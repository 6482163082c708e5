//! # Configuration Loading
//!
//! Reads `strata.json` into an `AnalysisConfig`. Every key is optional;
//! missing keys keep the defaults. Any malformed value is rejected with a
//! `ConfigError` naming its key path.
//!
//! ## Example
//!
//! ```json
//! {
//!   "layers": [
//!     {"pattern": "src/domain/**", "layer": "business"},
//!     {"pattern": "src/adapters/**", "layer": "infrastructure"}
//!   ],
//!   "allowed_targets": {"business": ["contracts"], "infrastructure": ["business", "contracts"]},
//!   "io_deny_calls": {"typescript": ["fs.*", "fetch"]},
//!   "io_deny_imports": {"typescript": ["pg", "fs"]},
//!   "io_isolated_layers": ["business"],
//!   "public_api_pattern": "index.*",
//!   "public_api_overrides": {"billing": "api.*"},
//!   "features_root": "src/features",
//!   "ignore": ["**/generated/**"],
//!   "root_mappings": [{"prefix": "@app/", "target": "src/"}],
//!   "index_names": ["index", "__init__", "mod"],
//!   "cycle_allow": [["src/a.ts", "src/b.ts"]],
//!   "type_only": {"enabled": true, "max_call_sites": 0},
//!   "rules": {"config-gap": "off", "error-shape": "error"},
//!   "threads": 8,
//!   "deadline_ms": 30000
//! }
//! ```
//!
//! ## Replacement Rules
//!
//! | Key                            | Effect on defaults                     |
//! |--------------------------------|----------------------------------------|
//! | `layers`, `allowed_targets`    | Each replaces its canonical half       |
//! | `io_deny_calls/imports.<lang>` | Replaces that language's list only     |
//! | `ignore`, `root_mappings`      | Replace the whole default list         |
//! | `deadline_ms: 0`               | No deadline                            |

#ifndef STRATA_CONFIG_CONFIG_LOADER_HPP
#define STRATA_CONFIG_CONFIG_LOADER_HPP

#include "strata/analysis/analyzer.hpp"
#include "strata/common.hpp"
#include "strata/ingest/file_facts.hpp"
#include "strata/json/json_value.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::config {

constexpr const char* CONFIG_FILE_NAME = "strata.json";

using DenyLists = std::map<ingest::Language, std::vector<std::string>>;

/// Call-site patterns for filesystem, network, database, clock and
/// randomness primitives, per language.
[[nodiscard]] auto default_io_deny_calls() -> DenyLists;

/// Import specifier patterns for I/O modules and drivers, per language.
[[nodiscard]] auto default_io_deny_imports() -> DenyLists;

/// The configuration used when no file is present.
[[nodiscard]] auto default_config(const std::filesystem::path& root) -> analysis::AnalysisConfig;

/// Applies a parsed document on top of the defaults.
[[nodiscard]] auto parse_config(const json::JsonValue& doc, const std::filesystem::path& root)
    -> Result<analysis::AnalysisConfig, ConfigError>;

/// Parses JSON text; syntax errors carry line and column.
[[nodiscard]] auto parse_config_text(std::string_view text, const std::filesystem::path& root)
    -> Result<analysis::AnalysisConfig, ConfigError>;

/// Loads `config_path`, or `root/strata.json` when none is given. A missing
/// default file yields the defaults; a missing explicit file is an error.
[[nodiscard]] auto load_config(const std::filesystem::path& root,
                               const std::optional<std::filesystem::path>& config_path)
    -> Result<analysis::AnalysisConfig, ConfigError>;

} // namespace strata::config

#endif // STRATA_CONFIG_CONFIG_LOADER_HPP
