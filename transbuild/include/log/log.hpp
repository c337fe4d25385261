//! # transbuild Logging
//!
//! Component-tagged logging for the conversion pipeline.
//!
//! Every record carries the component that emitted it and, when it is
//! emitted while a phase step runs, the graph module being processed.
//! The scheduler opens a `ModuleScope` around each step, so code deep in
//! reference expansion or a module type's conversion never has to pass
//! the module name to the logger.
//!
//! ## Usage
//!
//! ```cpp
//! TRANSBUILD_LOG_INFO("sched", "Phase " << name << " finished in " << ms << "ms");
//! TRANSBUILD_LOG_DEBUG("paths", "Package boundary at " << prefix);
//! ```
//!
//! With a scope open the text form reads:
//!
//! ```text
//! 14:02:11.084 DEBUG [expand] libfoo: missing dependency "bar"
//! ```
//!
//! ## Components
//!
//! | Tag         | Component                        |
//! |-------------|----------------------------------|
//! | `config`    | configuration loading            |
//! | `paths`     | package-boundary resolution      |
//! | `expand`    | reference expansion              |
//! | `allowlist` | conversion decisions             |
//! | `convert`   | conversion phase                 |
//! | `sched`     | phase scheduler                  |
//! | `mixed`     | mixed-execution bridge           |
//! | `codegen`   | build-file rendering             |
//!
//! ## Filters
//!
//! `"paths=trace,sched=debug,*=warn"` sets per-component levels; `*` sets
//! the default. A bare component name enables everything from it.

#ifndef TRANSBUILD_LOG_HPP
#define TRANSBUILD_LOG_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace transbuild::log {

// ============================================================================
// Levels
// ============================================================================

enum class LogLevel : int {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5, ///< Followed by abort
    Off = 6
};

/// Upper-case name of `level` ("TRACE", "WARN", ...).
const char* level_name(LogLevel level);

/// Parses a level name in any case. Unknown names yield nullopt.
auto parse_level(std::string_view name) -> std::optional<LogLevel>;

// ============================================================================
// Records
// ============================================================================

struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string_view component; ///< Emitting component ("paths", "sched", ...)
    std::string_view subject;   ///< Module in scope, empty outside phase steps
    std::string message;
    int64_t timestamp_ms = 0; ///< Milliseconds since epoch
};

enum class LogFormat {
    Text, ///< One human-readable line per record
    JSON  ///< One JSON object per line
};

/// `HH:MM:SS.mmm LEVEL [component] subject: message`, local time, no newline.
std::string format_text(const LogRecord& record);

/// `{"ts":..,"level":..,"component":..,"subject":..,"msg":..}`, no newline.
/// `subject` is omitted when empty.
std::string format_json(const LogRecord& record);

// ============================================================================
// Module Scope
// ============================================================================

/// Attaches a graph module name to every record the current thread emits
/// while the scope is alive. Scopes nest; the innermost one wins.
///
/// The name must outlive the scope.
class ModuleScope {
public:
    explicit ModuleScope(std::string_view module);
    ~ModuleScope();

    ModuleScope(const ModuleScope&) = delete;
    ModuleScope& operator=(const ModuleScope&) = delete;

private:
    std::string_view previous_;
};

/// Module name of the innermost scope on this thread, or empty.
auto current_module() -> std::string_view;

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr; colors the level when stderr is a color terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// Appends to a file, flushing after Error and Fatal records.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);

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

class NullSink : public LogSink {
public:
    void write(const LogRecord&) override {}
    void flush() override {}
};

class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void add(std::unique_ptr<LogSink> sink);

    size_t size() const {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

// ============================================================================
// Filter
// ============================================================================

class LogFilter {
public:
    /// Replaces the per-component levels with those in `spec`.
    /// Entries naming an unknown level are skipped; returns false if any was.
    bool parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view component) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level any component or the default lets through.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> component_levels_;
};

// ============================================================================
// Configuration
// ============================================================================

/// Filled from the `[log]` section of the configuration file.
struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec;
    std::string log_file; ///< Empty: no file output
    bool console = true;
    bool colors = true;
};

/// Applies TRANSBUILD_LOG when the configuration set neither a level nor a
/// filter. A value containing '=' or ',' is a filter, anything else a level;
/// an unknown level leaves `config` unchanged.
void apply_env_overrides(LogConfig& config, bool has_explicit_level);

// ============================================================================
// Logger
// ============================================================================

/// Process-wide logger. Starts with a console sink at Warn until `init()`.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Checked by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view component) const;

    void log(const LogRecord& record);

    /// Stamps the time and the current module scope onto a new record.
    void log(LogLevel level, std::string_view component, const std::string& message);

    void add_sink(std::unique_ptr<LogSink> sink);
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
// Macros
// ============================================================================

// 0=Trace .. 6=Off; records below this level compile to nothing.
#ifndef TRANSBUILD_MIN_LOG_LEVEL
#define TRANSBUILD_MIN_LOG_LEVEL 0
#endif

#define TRANSBUILD_LOG_IMPL(level, component, msg)                                                 \
    do {                                                                                           \
        if (static_cast<int>(level) >= TRANSBUILD_MIN_LOG_LEVEL) {                                 \
            auto& logger_ = ::transbuild::log::Logger::instance();                                 \
            if (logger_.should_log(level, component)) {                                            \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, component, oss_.str());                                         \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define TRANSBUILD_LOG_TRACE(component, msg)                                                       \
    TRANSBUILD_LOG_IMPL(::transbuild::log::LogLevel::Trace, component, msg)
#define TRANSBUILD_LOG_DEBUG(component, msg)                                                       \
    TRANSBUILD_LOG_IMPL(::transbuild::log::LogLevel::Debug, component, msg)
#define TRANSBUILD_LOG_INFO(component, msg)                                                        \
    TRANSBUILD_LOG_IMPL(::transbuild::log::LogLevel::Info, component, msg)
#define TRANSBUILD_LOG_WARN(component, msg)                                                        \
    TRANSBUILD_LOG_IMPL(::transbuild::log::LogLevel::Warn, component, msg)
#define TRANSBUILD_LOG_ERROR(component, msg)                                                       \
    TRANSBUILD_LOG_IMPL(::transbuild::log::LogLevel::Error, component, msg)
#define TRANSBUILD_LOG_FATAL(component, msg)                                                       \
    TRANSBUILD_LOG_IMPL(::transbuild::log::LogLevel::Fatal, component, msg)

} // namespace transbuild::log

#endif // TRANSBUILD_LOG_HPP
