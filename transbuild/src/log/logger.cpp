//! # Logger Implementation
//!
//! Record formatting, module scopes, sinks, filters, the Logger singleton
//! and `transbuild::fatal`.

#include "common.hpp"
#include "log/log.hpp"

#include <array>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <unistd.h>

namespace transbuild::log {

namespace {

constexpr std::array<LogLevel, 7> ALL_LEVELS = {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                                                LogLevel::Warn,  LogLevel::Error, LogLevel::Fatal,
                                                LogLevel::Off};

thread_local std::string_view current_subject;

bool stderr_has_colors() {
    if (!isatty(fileno(stderr))) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term && std::string_view(term) != "dumb";
}

const char* level_color(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m";
    case LogLevel::Debug:
        return "\033[36m";
    case LogLevel::Info:
        return "\033[32m";
    case LogLevel::Warn:
        return "\033[33m";
    case LogLevel::Error:
        return "\033[31m";
    case LogLevel::Fatal:
        return "\033[1;31m";
    case LogLevel::Off:
        break;
    }
    return "";
}

/// Local wall-clock "HH:MM:SS.mmm" of `timestamp_ms`.
void write_clock(std::ostream& out, int64_t timestamp_ms) {
    std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm local{};
    localtime_r(&seconds, &local);
    out << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << timestamp_ms % 1000 << std::setfill(' ');
}

void write_text(std::ostream& out, const LogRecord& record, bool colors) {
    write_clock(out, record.timestamp_ms);
    out << ' ';
    if (colors) {
        out << level_color(record.level);
    }
    out << std::left << std::setw(5) << level_name(record.level);
    if (colors) {
        out << "\033[0m";
    }
    out << " [" << record.component << "] ";
    if (!record.subject.empty()) {
        out << record.subject << ": ";
    }
    out << record.message;
}

void write_json_string(std::ostream& out, std::string_view text) {
    out << '"';
    for (char c : text) {
        switch (c) {
        case '"':
            out << "\\\"";
            break;
        case '\\':
            out << "\\\\";
            break;
        case '\n':
            out << "\\n";
            break;
        case '\r':
            out << "\\r";
            break;
        case '\t':
            out << "\\t";
            break;
        default:
            out << c;
        }
    }
    out << '"';
}

auto now_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace

// ============================================================================
// Levels
// ============================================================================

const char* level_name(LogLevel level) {
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

auto parse_level(std::string_view name) -> std::optional<LogLevel> {
    std::string upper(name);
    for (char& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    for (LogLevel level : ALL_LEVELS) {
        if (upper == level_name(level)) {
            return level;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Formatting
// ============================================================================

std::string format_text(const LogRecord& record) {
    std::ostringstream oss;
    write_text(oss, record, false);
    return oss.str();
}

std::string format_json(const LogRecord& record) {
    std::ostringstream oss;
    oss << "{\"ts\":" << record.timestamp_ms << ",\"level\":\"" << level_name(record.level)
        << "\",\"component\":";
    write_json_string(oss, record.component);
    if (!record.subject.empty()) {
        oss << ",\"subject\":";
        write_json_string(oss, record.subject);
    }
    oss << ",\"msg\":";
    write_json_string(oss, record.message);
    oss << '}';
    return oss.str();
}

// ============================================================================
// ModuleScope
// ============================================================================

ModuleScope::ModuleScope(std::string_view module) : previous_(current_subject) {
    current_subject = module;
}

ModuleScope::~ModuleScope() {
    current_subject = previous_;
}

auto current_module() -> std::string_view {
    return current_subject;
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors) : colors_enabled_(use_colors && stderr_has_colors()) {}

void ConsoleSink::write(const LogRecord& record) {
    // One insertion per record so lines from worker threads never interleave
    std::ostringstream line;
    if (format_ == LogFormat::JSON) {
        line << format_json(record);
    } else {
        write_text(line, record, colors_enabled_);
    }
    line << '\n';
    std::cerr << line.str();
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    file_ << (format_ == LogFormat::JSON ? format_json(record) : format_text(record)) << '\n';
    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

void MultiSink::write(const LogRecord& record) {
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void MultiSink::flush() {
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

void MultiSink::add(std::unique_ptr<LogSink> sink) {
    sinks_.push_back(std::move(sink));
}

// ============================================================================
// LogFilter
// ============================================================================

bool LogFilter::parse(std::string_view spec) {
    component_levels_.clear();
    bool all_known = true;

    size_t pos = 0;
    while (pos <= spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }
        auto token = spec.substr(pos, comma - pos);
        pos = comma + 1;

        if (token.empty()) {
            continue;
        }
        size_t eq = token.find('=');
        if (eq == std::string_view::npos) {
            component_levels_[std::string(token)] = LogLevel::Trace;
            continue;
        }

        auto level = parse_level(token.substr(eq + 1));
        if (!level) {
            all_known = false;
            continue;
        }
        auto component = token.substr(0, eq);
        if (component == "*") {
            default_level_ = *level;
        } else {
            component_levels_[std::string(component)] = *level;
        }
    }
    return all_known;
}

bool LogFilter::should_log(LogLevel level, std::string_view component) const {
    auto it = component_levels_.find(std::string(component));
    return level >= (it != component_levels_.end() ? it->second : default_level_);
}

LogLevel LogFilter::min_level() const {
    LogLevel min = default_level_;
    for (const auto& [_, level] : component_levels_) {
        if (level < min) {
            min = level;
        }
    }
    return min;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    filter_.set_default_level(level_);
    sinks_.push_back(std::make_unique<ConsoleSink>());
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.level_ = config.level;
    logger.filter_.set_default_level(config.level);

    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
        // Without "*=level" the configured level stays the default
        if (config.level < logger.filter_.default_level()) {
            logger.filter_.set_default_level(config.level);
        }
        logger.level_ = logger.filter_.min_level();
    }

    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        logger.sinks_.push_back(std::move(console));
    }

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        file->set_format(config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }
}

bool Logger::should_log(LogLevel level, std::string_view component) const {
    return level >= level_ && filter_.should_log(level, component);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view component, const std::string& message) {
    LogRecord record;
    record.level = level;
    record.component = component;
    record.subject = current_subject;
    record.message = message;
    record.timestamp_ms = now_ms();
    log(record);
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    filter_.set_default_level(level);
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    level_ = filter_.min_level();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace transbuild::log

namespace transbuild {

void fatal(std::string_view component, const std::string& message) {
    TRANSBUILD_LOG_FATAL(component, message);
    log::Logger::instance().flush();
    std::abort();
}

} // namespace transbuild
