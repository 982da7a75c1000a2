//! # ordo Logging
//!
//! A structured logger shared by the sorting gates, the dispatcher and the
//! run driver:
//! - 5 log levels (Trace, Debug, Info, Warn, Error)
//! - Module-tagged messages for per-component filtering
//! - Thread names in every record (worker threads are named by the dispatcher)
//! - Console (stderr) and file sinks, text or JSON
//! - Compile-time level elision via ORDO_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! ORDO_LOG_DEBUG("sort", "flushed slot " << suite_id);
//! ORDO_LOG_WARN("sort", "forcing slot after " << timeout.count() << "ms");
//! ```

#ifndef ORDO_LOG_HPP
#define ORDO_LOG_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
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

namespace ordo::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Per-event traffic through the gates
    Debug = 1, ///< Slot lifecycle, task scheduling
    Info = 2,  ///< Run-level progress
    Warn = 3,  ///< Forced flushes, late events
    Error = 4, ///< Protocol violations, pool failures, unit failures at the worker boundary
    Off = 5    ///< Disables all logging
};

/// Returns the short string name for a log level (e.g., "TRACE", "DEBUG").
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
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

/// Parses a log level from a string.
/// Returns LogLevel::Info if the string is not recognized.
inline LogLevel parse_level(std::string_view s) {
    if (s == "trace" || s == "TRACE")
        return LogLevel::Trace;
    if (s == "debug" || s == "DEBUG")
        return LogLevel::Debug;
    if (s == "info" || s == "INFO")
        return LogLevel::Info;
    if (s == "warn" || s == "WARN")
        return LogLevel::Warn;
    if (s == "error" || s == "ERROR")
        return LogLevel::Error;
    if (s == "off" || s == "OFF")
        return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Thread Names
// ============================================================================

/// Names the calling thread for log records and event headers.
void set_thread_name(std::string name);

/// Returns the calling thread's name ("main" unless renamed).
const std::string& thread_name();

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "sort", "dispatch")
    std::string message;     ///< Formatted message text
    std::string thread;      ///< Name of the emitting thread
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text
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

/// Writes to stderr.
class ConsoleSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    LogFormat format_ = LogFormat::Text;
};

/// File sink. Flushes on Error messages.
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

/// Renders a record as one text line (no trailing newline).
std::string format_text(const LogRecord& record);

/// Renders a record as one JSON object (no trailing newline).
std::string format_json(const LogRecord& record);

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses filter strings like "sort=trace,dispatch=debug,*=warn".
class LogFilter {
public:
    LogFilter() = default;

    /// Parse a filter specification string.
    /// Module names without "=level" are set to Trace.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level configured for any module or the default.
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
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable console (stderr) output
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Auto-initializes with a Warn-level console sink on first use.
class Logger {
public:
    /// Replace sinks, level and filter with the given configuration.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before building the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message);

    /// Adds a sink next to the configured ones (tests install capture sinks).
    void add_sink(std::unique_ptr<LogSink> sink);

    void flush();

private:
    Logger();

    std::atomic<LogLevel> level_{LogLevel::Warn};
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Timestamp Helpers
// ============================================================================

/// Returns current local time formatted as "HH:MM:SS.mmm".
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

/// Returns milliseconds since epoch.
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Extracts --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv
/// and -q from argv. Falls back to the ORDO_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Off
#ifndef ORDO_MIN_LOG_LEVEL
#define ORDO_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific ones below.
#define ORDO_LOG_IMPL(level, module_str, msg)                                                      \
    do {                                                                                           \
        if (static_cast<int>(level) >= ORDO_MIN_LOG_LEVEL) {                                       \
            auto& logger_ = ::ordo::log::Logger::instance();                                       \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str());                                        \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Usage: ORDO_LOG_TRACE("sort", "recorded " << kind_name(event));
#define ORDO_LOG_TRACE(module, msg) ORDO_LOG_IMPL(::ordo::log::LogLevel::Trace, module, msg)
#define ORDO_LOG_DEBUG(module, msg) ORDO_LOG_IMPL(::ordo::log::LogLevel::Debug, module, msg)
#define ORDO_LOG_INFO(module, msg) ORDO_LOG_IMPL(::ordo::log::LogLevel::Info, module, msg)
#define ORDO_LOG_WARN(module, msg) ORDO_LOG_IMPL(::ordo::log::LogLevel::Warn, module, msg)
#define ORDO_LOG_ERROR(module, msg) ORDO_LOG_IMPL(::ordo::log::LogLevel::Error, module, msg)

} // namespace ordo::log

#endif // ORDO_LOG_HPP
