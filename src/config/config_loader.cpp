//! # Configuration Loading Implementation
//!
//! Each section has a reader that fills its part of the configuration and
//! returns the first `ConfigError` it finds. Key paths are built as readers
//! descend: `layers[2].pattern`, `io_deny_calls.python[0]`.

#include "strata/config/config_loader.hpp"

#include "strata/json/json_parser.hpp"
#include "strata/log/log.hpp"
#include "strata/policy/glob.hpp"
#include "strata/rules/rule.hpp"

#include <fstream>
#include <set>
#include <sstream>

namespace strata::config {

using ingest::Language;
using json::JsonValue;

// ============================================================================
// Defaults
// ============================================================================

auto default_io_deny_calls() -> DenyLists {
    return {
        {Language::Cpp,
         {"fopen", "std.fopen", "freopen", "open", "socket", "connect", "send", "recv", "system",
          "popen", "getenv", "std.getenv", "time", "std.time", "rand", "std.rand", "srand",
          "std.chrono.*.now", "std.filesystem.*", "fs.*", "curl_easy_*", "sqlite3_*"}},
        {Language::JavaScript,
         {"fs.*", "fsPromises.*", "fetch", "axios", "axios.*", "http.request", "http.get",
          "https.request", "https.get", "new Date", "Date.now", "Math.random",
          "crypto.randomUUID", "crypto.getRandomValues", "localStorage.*", "sessionStorage.*",
          "new WebSocket", "new XMLHttpRequest"}},
        {Language::TypeScript,
         {"fs.*", "fsPromises.*", "fetch", "axios", "axios.*", "http.request", "http.get",
          "https.request", "https.get", "new Date", "Date.now", "Math.random",
          "crypto.randomUUID", "crypto.getRandomValues", "localStorage.*", "sessionStorage.*",
          "new WebSocket", "new XMLHttpRequest"}},
        {Language::Python,
         {"open", "os.*", "shutil.*", "subprocess.*", "requests.*", "urllib.request.*",
          "socket.*", "sqlite3.connect", "psycopg2.connect", "time.time", "time.sleep",
          "datetime.now", "datetime.datetime.now", "random.*", "uuid.uuid4"}},
        {Language::Go,
         {"os.*", "ioutil.*", "io.ReadAll", "http.*", "net.*", "sql.Open", "time.Now",
          "time.Sleep", "rand.*", "exec.Command"}},
        {Language::Rust,
         {"std.fs.*", "fs.*", "File.open", "File.create", "std.net.*", "TcpStream.connect",
          "reqwest.*", "Instant.now", "SystemTime.now", "rand.*", "thread_rng"}},
        {Language::Java,
         {"new FileInputStream", "new FileOutputStream", "new FileReader", "new FileWriter",
          "Files.*", "DriverManager.getConnection", "HttpClient.*", "new Socket", "new URL",
          "System.currentTimeMillis", "System.nanoTime", "LocalDateTime.now", "Instant.now",
          "Math.random", "new Random"}},
    };
}

auto default_io_deny_imports() -> DenyLists {
    std::vector<std::string> js = {"fs",     "fs/*",    "node:fs*", "node:http*", "node:net",
                                   "http",   "https",   "net",      "pg",         "mysql*",
                                   "mongodb", "mongoose", "redis",  "ioredis",    "axios",
                                   "sqlite3", "better-sqlite3", "@prisma/client", "typeorm",
                                   "sequelize", "knex"};
    return {
        {Language::Cpp,
         {"fstream", "cstdio", "stdio.h", "filesystem", "random", "sys/socket.h", "netinet/*",
          "arpa/*", "curl/*", "sqlite3.h", "libpq-fe.h", "mysql.h"}},
        {Language::JavaScript, js},
        {Language::TypeScript, js},
        {Language::Python,
         {"os", "shutil", "subprocess", "socket", "requests", "urllib", "urllib/*", "http/client",
          "sqlite3", "psycopg2", "pymysql", "sqlalchemy", "sqlalchemy/*", "redis", "boto3",
          "httpx", "aiohttp"}},
        {Language::Go,
         {"os", "io/ioutil", "net", "net/*", "database/sql", "github.com/lib/pq",
          "github.com/jackc/pgx*", "go.mongodb.org/*", "github.com/go-redis/*",
          "github.com/redis/*"}},
        {Language::Rust,
         {"std/fs", "std/fs/*", "std/net", "std/net/*", "tokio/fs*", "tokio/net*", "reqwest*",
          "sqlx*", "diesel*", "redis*"}},
        {Language::Java,
         {"java/io/File*", "java/nio/file/*", "java/net/*", "java/sql/*", "javax/sql/*",
          "okhttp3/*"}},
    };
}

auto default_config(const std::filesystem::path& root) -> analysis::AnalysisConfig {
    analysis::AnalysisConfig config;
    config.root = root;
    config.ingest.io_deny_calls = default_io_deny_calls();
    config.rules.io_deny_imports = default_io_deny_imports();
    return config;
}

// ============================================================================
// Readers
// ============================================================================

namespace {

using Error = std::optional<ConfigError>;

auto mismatch(const std::string& key, const char* expected, const JsonValue& v) -> ConfigError {
    return ConfigError::make(key, std::string("expected ") + expected + ", found " + v.type_name());
}

auto read_string(const JsonValue& v, const std::string& key, std::string& out) -> Error {
    if (!v.is_string()) {
        return mismatch(key, "a string", v);
    }
    out = v.as_string();
    return std::nullopt;
}

auto read_glob(const JsonValue& v, const std::string& key, std::string& out) -> Error {
    if (auto err = read_string(v, key, out)) {
        return err;
    }
    auto glob = policy::Glob::compile(out);
    if (is_err(glob)) {
        return ConfigError::make(key, "invalid glob '" + out + "': " + unwrap_err(glob));
    }
    return std::nullopt;
}

auto read_strings(const JsonValue& v, const std::string& key, std::vector<std::string>& out)
    -> Error {
    if (!v.is_array()) {
        return mismatch(key, "an array of strings", v);
    }
    out.clear();
    for (size_t i = 0; i < v.size(); ++i) {
        std::string s;
        if (auto err = read_string(v[i], key + "[" + std::to_string(i) + "]", s)) {
            return err;
        }
        out.push_back(std::move(s));
    }
    return std::nullopt;
}

auto read_count(const JsonValue& v, const std::string& key, int64_t& out) -> Error {
    auto n = v.try_as_i64();
    if (!v.is_number() || !n) {
        return mismatch(key, "an integer", v);
    }
    if (*n < 0) {
        return ConfigError::make(key, "must not be negative");
    }
    out = *n;
    return std::nullopt;
}

auto read_object(const JsonValue& v, const std::string& key) -> Error {
    if (!v.is_object()) {
        return mismatch(key, "an object", v);
    }
    return std::nullopt;
}

/// `{pattern, layer}` array.
auto read_layers(const JsonValue& v, std::vector<policy::LayerPatternSpec>& out) -> Error {
    if (!v.is_array()) {
        return mismatch("layers", "an array", v);
    }
    for (size_t i = 0; i < v.size(); ++i) {
        auto key = "layers[" + std::to_string(i) + "]";
        const auto& entry = v[i];
        if (auto err = read_object(entry, key)) {
            return err;
        }
        policy::LayerPatternSpec spec;
        for (const char* field : {"pattern", "layer"}) {
            const auto* member = entry.get(field);
            if (!member) {
                return ConfigError::make(key + "." + field, "missing");
            }
            auto& target = std::string_view(field) == "pattern" ? spec.pattern : spec.layer;
            if (auto err = read_string(*member, key + "." + field, target)) {
                return err;
            }
        }
        out.push_back(std::move(spec));
    }
    return std::nullopt;
}

auto read_allowed(const JsonValue& v, policy::AllowedTargetSpec& out) -> Error {
    if (auto err = read_object(v, "allowed_targets")) {
        return err;
    }
    for (const auto& [name, targets] : v.as_object()) {
        std::vector<std::string> list;
        if (auto err = read_strings(targets, "allowed_targets." + name, list)) {
            return err;
        }
        out.emplace_back(name, std::move(list));
    }
    return std::nullopt;
}

auto read_deny(const JsonValue& v, const std::string& key, DenyLists& out) -> Error {
    if (auto err = read_object(v, key)) {
        return err;
    }
    for (const auto& [name, patterns] : v.as_object()) {
        auto lang = ingest::parse_language(name);
        if (!lang) {
            return ConfigError::make(key + "." + name, "unknown language '" + name + "'");
        }
        std::vector<std::string> list;
        if (auto err = read_strings(patterns, key + "." + name, list)) {
            return err;
        }
        for (size_t i = 0; i < list.size(); ++i) {
            if (list[i].empty()) {
                return ConfigError::make(key + "." + name + "[" + std::to_string(i) + "]",
                                         "empty pattern");
            }
        }
        out[*lang] = std::move(list);
    }
    return std::nullopt;
}

auto read_root_mappings(const JsonValue& v, std::vector<graph::RootMapping>& out) -> Error {
    if (!v.is_array()) {
        return mismatch("root_mappings", "an array", v);
    }
    out.clear();
    for (size_t i = 0; i < v.size(); ++i) {
        auto key = "root_mappings[" + std::to_string(i) + "]";
        if (auto err = read_object(v[i], key)) {
            return err;
        }
        graph::RootMapping mapping;
        const auto* prefix = v[i].get("prefix");
        const auto* target = v[i].get("target");
        if (!prefix) {
            return ConfigError::make(key + ".prefix", "missing");
        }
        if (!target) {
            return ConfigError::make(key + ".target", "missing");
        }
        if (auto err = read_string(*prefix, key + ".prefix", mapping.prefix)) {
            return err;
        }
        if (auto err = read_string(*target, key + ".target", mapping.target)) {
            return err;
        }
        out.push_back(std::move(mapping));
    }
    return std::nullopt;
}

auto read_cycle_allow(const JsonValue& v, std::vector<std::pair<std::string, std::string>>& out)
    -> Error {
    if (!v.is_array()) {
        return mismatch("cycle_allow", "an array of path pairs", v);
    }
    for (size_t i = 0; i < v.size(); ++i) {
        auto key = "cycle_allow[" + std::to_string(i) + "]";
        std::vector<std::string> pair;
        if (auto err = read_strings(v[i], key, pair)) {
            return err;
        }
        if (pair.size() != 2) {
            return ConfigError::make(key, "expected exactly two paths");
        }
        out.emplace_back(pair[0], pair[1]);
    }
    return std::nullopt;
}

auto read_type_only(const JsonValue& v, rules::TypeOnlyPolicy& out) -> Error {
    if (auto err = read_object(v, "type_only")) {
        return err;
    }
    for (const auto& [name, value] : v.as_object()) {
        auto key = "type_only." + name;
        if (name == "enabled") {
            if (!value.is_bool()) {
                return mismatch(key, "a boolean", value);
            }
            out.enabled = value.as_bool();
        } else if (name == "max_call_sites") {
            int64_t n = 0;
            if (auto err = read_count(value, key, n)) {
                return err;
            }
            out.max_call_sites = static_cast<uint32_t>(n);
        } else {
            return ConfigError::make(key, "unknown key");
        }
    }
    return std::nullopt;
}

auto read_rules(const JsonValue& v, std::map<std::string, rules::RuleToggle>& out) -> Error {
    if (auto err = read_object(v, "rules")) {
        return err;
    }
    for (const auto& [id, value] : v.as_object()) {
        auto key = "rules." + id;
        if (!rules::is_builtin_rule(id)) {
            return ConfigError::make(key, "unknown rule");
        }
        std::string setting;
        if (auto err = read_string(value, key, setting)) {
            return err;
        }
        rules::RuleToggle toggle;
        if (setting == "off") {
            toggle.enabled = false;
        } else if (auto severity = report::parse_severity(setting)) {
            toggle.severity = severity;
        } else {
            return ConfigError::make(key, "expected \"off\", \"info\", \"warning\" or \"error\", "
                                          "found \"" + setting + "\"");
        }
        out[id] = toggle;
    }
    return std::nullopt;
}

const std::set<std::string> KNOWN_KEYS = {
    "layers",         "allowed_targets",    "io_deny_calls", "io_deny_imports",
    "io_isolated_layers", "public_api_pattern", "public_api_overrides", "features_root",
    "ignore",         "root_mappings",      "index_names",   "cycle_allow",
    "type_only",      "rules",              "threads",       "deadline_ms"};

} // namespace

// ============================================================================
// Parse
// ============================================================================

auto parse_config(const JsonValue& doc, const std::filesystem::path& root)
    -> Result<analysis::AnalysisConfig, ConfigError> {
    auto config = default_config(root);

    if (!doc.is_object()) {
        return mismatch("", "a JSON object at the top level", doc);
    }
    for (const auto& [key, value] : doc.as_object()) {
        if (KNOWN_KEYS.count(key) == 0) {
            return ConfigError::make(key, "unknown key");
        }
    }

    auto patterns = policy::LayerPolicy::canonical_patterns();
    auto allowed = policy::LayerPolicy::canonical_allowed();
    if (const auto* v = doc.get("layers")) {
        patterns.clear();
        if (auto err = read_layers(*v, patterns)) {
            return *err;
        }
    }
    if (const auto* v = doc.get("allowed_targets")) {
        allowed.clear();
        if (auto err = read_allowed(*v, allowed)) {
            return *err;
        }
    }
    auto layer_policy = policy::LayerPolicy::create(patterns, allowed);
    if (is_err(layer_policy)) {
        return unwrap_err(layer_policy);
    }
    config.policy = std::move(unwrap(layer_policy));

    if (const auto* v = doc.get("io_deny_calls")) {
        if (auto err = read_deny(*v, "io_deny_calls", config.ingest.io_deny_calls)) {
            return *err;
        }
    }
    if (const auto* v = doc.get("io_deny_imports")) {
        if (auto err = read_deny(*v, "io_deny_imports", config.rules.io_deny_imports)) {
            return *err;
        }
    }
    if (const auto* v = doc.get("io_isolated_layers")) {
        std::vector<std::string> names;
        if (auto err = read_strings(*v, "io_isolated_layers", names)) {
            return *err;
        }
        config.rules.io_isolated_layers.clear();
        for (size_t i = 0; i < names.size(); ++i) {
            auto layer = policy::parse_layer(names[i]);
            if (!layer) {
                return ConfigError::make("io_isolated_layers[" + std::to_string(i) + "]",
                                         "unknown layer '" + names[i] + "'");
            }
            config.rules.io_isolated_layers.insert(*layer);
        }
    }
    if (const auto* v = doc.get("public_api_pattern")) {
        if (auto err = read_glob(*v, "public_api_pattern", config.rules.public_api_pattern)) {
            return *err;
        }
    }
    if (const auto* v = doc.get("public_api_overrides")) {
        if (auto err = read_object(*v, "public_api_overrides")) {
            return *err;
        }
        for (const auto& [feature, pattern] : v->as_object()) {
            std::string glob;
            if (auto err = read_glob(pattern, "public_api_overrides." + feature, glob)) {
                return *err;
            }
            config.rules.public_api_overrides[feature] = glob;
        }
    }
    if (const auto* v = doc.get("features_root")) {
        if (auto err = read_string(*v, "features_root", config.graph.features_root)) {
            return *err;
        }
    }
    if (const auto* v = doc.get("ignore")) {
        if (auto err = read_strings(*v, "ignore", config.ignore)) {
            return *err;
        }
        for (size_t i = 0; i < config.ignore.size(); ++i) {
            std::string pattern;
            if (auto err = read_glob(JsonValue(config.ignore[i]),
                                     "ignore[" + std::to_string(i) + "]", pattern)) {
                return *err;
            }
        }
    }
    if (const auto* v = doc.get("root_mappings")) {
        if (auto err = read_root_mappings(*v, config.graph.root_mappings)) {
            return *err;
        }
    }
    if (const auto* v = doc.get("index_names")) {
        if (auto err = read_strings(*v, "index_names", config.graph.index_names)) {
            return *err;
        }
    }
    if (const auto* v = doc.get("cycle_allow")) {
        if (auto err = read_cycle_allow(*v, config.graph.cycle_allow)) {
            return *err;
        }
    }
    if (const auto* v = doc.get("type_only")) {
        if (auto err = read_type_only(*v, config.rules.type_only)) {
            return *err;
        }
    }
    if (const auto* v = doc.get("rules")) {
        if (auto err = read_rules(*v, config.rule_toggles)) {
            return *err;
        }
    }
    if (const auto* v = doc.get("threads")) {
        int64_t n = 0;
        if (auto err = read_count(*v, "threads", n)) {
            return *err;
        }
        config.threads = static_cast<int>(n);
    }
    if (const auto* v = doc.get("deadline_ms")) {
        int64_t n = 0;
        if (auto err = read_count(*v, "deadline_ms", n)) {
            return *err;
        }
        if (n > 0) {
            config.deadline = std::chrono::milliseconds(n);
        }
    }

    return config;
}

auto parse_config_text(std::string_view text, const std::filesystem::path& root)
    -> Result<analysis::AnalysisConfig, ConfigError> {
    auto doc = json::parse_json(text);
    if (is_err(doc)) {
        return ConfigError::make("", "invalid JSON: " + unwrap_err(doc).to_string());
    }
    return parse_config(unwrap(doc), root);
}

auto load_config(const std::filesystem::path& root,
                 const std::optional<std::filesystem::path>& config_path)
    -> Result<analysis::AnalysisConfig, ConfigError> {
    auto path = config_path ? *config_path : root / CONFIG_FILE_NAME;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (config_path) {
            return ConfigError::make("config", "file not found: " + path.string());
        }
        STRATA_LOG_DEBUG("config", "No " << CONFIG_FILE_NAME << " in " << root.string()
                                         << ", using defaults");
        return default_config(root);
    }

    std::ifstream file(path);
    if (!file) {
        return ConfigError::make("config", "cannot read " + path.string());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();

    auto result = parse_config_text(buffer.str(), root);
    if (is_err(result)) {
        auto& error = unwrap_err(result);
        error.message = path.filename().string() + ": " + error.message;
        STRATA_LOG_ERROR("config", error.to_string());
    } else {
        STRATA_LOG_DEBUG("config", "Loaded " << path.string());
    }
    return result;
}

} // namespace strata::config
