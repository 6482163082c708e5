//! # Strata Logging
//!
//! Structured, module-tagged logging for the analyzer:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Per-component filtering (`ingest=debug,*=warn`)
//! - Console, file and null sinks, text or JSON lines
//! - Thread-safe dispatch (ingestion workers log concurrently)
//! - Compile-time level elision via STRATA_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! STRATA_LOG_INFO("analysis", "Analyzing " << root << " with " << threads << " workers");
//! STRATA_LOG_DEBUG("ingest", "Parsed " << path << ": " << facts.imports.size() << " imports");
//! STRATA_LOG_WARN("graph", "Ambiguous import '" << spec << "' in " << path);
//! ```
//!
//! ## Module Tags
//!
//! | Tag        | Component                     |
//! |------------|-------------------------------|
//! | `ingest`   | Discovery, scanner, ingestor  |
//! | `graph`    | Module graph builder, SCC     |
//! | `classify` | Layer policy and classifier   |
//! | `rules`    | Rule engine and rules         |
//! | `report`   | Violation reporter            |
//! | `analysis` | Pipeline orchestration        |
//! | `config`   | Configuration loading         |
//! | `cli`      | Command-line front end        |

#ifndef STRATA_LOG_HPP
#define STRATA_LOG_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace strata::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Per-import, per-edge tracing
    Debug = 1, ///< Per-file and per-stage details
    Info = 2,  ///< Run progress
    Warn = 3,  ///< Degraded input (unreadable files, parse failures)
    Error = 4, ///< Run-stopping problems
    Fatal = 5, ///< Broken invariants
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name for a log level (e.g., "DEBUG").
inline const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

/// Parses a log level name (lower or upper case).
/// Returns LogLevel::Info if the string is not recognized.
inline LogLevel parse_level(std::string_view s) {
    if (s == "trace" || s == "TRACE")
        return LogLevel::Trace;
    if (s == "debug" || s == "DEBUG")
        return LogLevel::Debug;
    if (s == "info" || s == "INFO")
        return LogLevel::Info;
    if (s == "warn" || s == "WARN" || s == "warning")
        return LogLevel::Warn;
    if (s == "error" || s == "ERROR")
        return LogLevel::Error;
    if (s == "fatal" || s == "FATAL")
        return LogLevel::Fatal;
    if (s == "off" || s == "OFF")
        return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Component tag (e.g., "ingest", "rules")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< One JSON object per line
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, colored when stderr is a capable terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_color_enabled(bool enabled) {
        colors_enabled_ = enabled;
    }
    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;

    const char* level_color(LogLevel level) const;
};

/// Appends to a log file. Flushes on Error and Fatal.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Discards everything (tests, benchmarks).
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Renders a record as a single text line (no trailing newline).
std::string format_text(const LogRecord& record);

/// Renders a record as a single JSON object (no trailing newline).
std::string format_json(const LogRecord& record);

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter.
///
/// Parses specs like "ingest=trace,rules=debug,*=warn". A bare module name
/// enables Trace for that module.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// The lowest level configured for any module (or the default).
    LogLevel min_level() const {
        LogLevel min = default_level_;
        for (const auto& [_, level] : module_levels_) {
            if (level < min)
                min = level;
        }
        return min;
    }

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = none)
    bool console = true;                ///< Enable stderr output
    bool colors = true;                 ///< Enable ANSI colors on console
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Process-wide logger.
///
/// Auto-initializes with a Warn-level console sink on first use.
class Logger {
public:
    /// Replaces sinks, level and filter with the given configuration.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before building the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes all sinks. Used by tests that install a capture sink.
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Timestamp Helpers
// ============================================================================

/// Current local time as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now_c);
#else
    localtime_r(&now_c, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Extracts --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv
/// and -q from argv, falling back to the STRATA_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

/// True if `arg` is one of the options consumed by parse_log_options().
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef STRATA_MIN_LOG_LEVEL
#define STRATA_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific ones below.
#define STRATA_LOG_IMPL(level, module_str, msg)                                                    \
    do {                                                                                           \
        if (static_cast<int>(level) >= STRATA_MIN_LOG_LEVEL) {                                     \
            auto& logger_ = ::strata::log::Logger::instance();                                     \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Usage: STRATA_LOG_TRACE("graph", "edge " << from << " -> " << to);
#define STRATA_LOG_TRACE(module, msg) STRATA_LOG_IMPL(::strata::log::LogLevel::Trace, module, msg)
#define STRATA_LOG_DEBUG(module, msg) STRATA_LOG_IMPL(::strata::log::LogLevel::Debug, module, msg)
#define STRATA_LOG_INFO(module, msg) STRATA_LOG_IMPL(::strata::log::LogLevel::Info, module, msg)
#define STRATA_LOG_WARN(module, msg) STRATA_LOG_IMPL(::strata::log::LogLevel::Warn, module, msg)
#define STRATA_LOG_ERROR(module, msg) STRATA_LOG_IMPL(::strata::log::LogLevel::Error, module, msg)
#define STRATA_LOG_FATAL(module, msg) STRATA_LOG_IMPL(::strata::log::LogLevel::Fatal, module, msg)

} // namespace strata::log

#endif // STRATA_LOG_HPP
