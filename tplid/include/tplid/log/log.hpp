//! # tplid Logging
//!
//! Structured logging for the tplid tools:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//! - Console (stderr) and file sinks, text or JSON lines
//! - Thread-safe output with mutex protection
//! - Compile-time level elision via TPLID_MIN_LOG_LEVEL
//!
//! The fingerprint model and the matcher never log. Logging happens in the
//! loader, serializer, corpus and CLI layers around them.
//!
//! ## Usage
//!
//! ```cpp
//! TPLID_LOG_INFO("profile", "Process library: " << name << " " << version);
//! TPLID_LOG_WARN("corpus", "Skipping unreadable profile " << path);
//! ```

#ifndef TPLID_LOG_HPP
#define TPLID_LOG_HPP

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

namespace tplid::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Data-quality conditions and skipped inputs
    Error = 4, ///< Failed artifacts
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Upper-case level names, indexed by `LogLevel`.
inline constexpr const char* LEVEL_NAMES[] = {"TRACE", "DEBUG", "INFO", "WARN",
                                              "ERROR", "FATAL", "OFF"};

inline const char* level_name(LogLevel level) {
    auto index = static_cast<int>(level);
    return (index >= 0 && index <= static_cast<int>(LogLevel::Off)) ? LEVEL_NAMES[index] : "???";
}

/// Parses a level name in any letter case. "warning" is accepted for Warn;
/// anything unrecognized maps to Info.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "profile", "corpus")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log lines.
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

/// Writes to stderr with optional ANSI colors.
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

/// Appends to a log file. Error and Fatal records are flushed immediately.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

    bool is_open() const {
        return file_.is_open();
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Renders a record as a single line (without trailing newline).
std::string format_record(const LogRecord& record, LogFormat format);

/// Writes `text` as the body of a JSON string literal (no surrounding quotes).
/// Also used by the JSON match report.
void write_json_escaped(std::ostream& out, std::string_view text);

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter.
///
/// Parses specs like "match=trace,loader=debug,*=warn". A bare module name
/// enables everything from that module.
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

    /// Lowest level enabled for any module.
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
// Logger
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Module filter string
    std::string log_file;    ///< Path to log file (empty = no file)
    bool console = true;
    bool colors = true;
};

/// Thread-safe global logger.
class Logger {
public:
    /// Replaces sinks, level and filter with the given configuration.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before formatting the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink (used by tests to capture output).
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

/// Formats a record timestamp as local "HH:MM:SS.mmm".
inline std::string format_timestamp(int64_t timestamp_ms) {
    auto seconds = static_cast<std::time_t>(timestamp_ms / 1000);

    std::tm tm_buf;
    localtime_r(&seconds, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << timestamp_ms % 1000;
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
/// and -q from argv, falling back to the TPLID_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef TPLID_MIN_LOG_LEVEL
#define TPLID_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific macros below.
#define TPLID_LOG_IMPL(level, module_str, msg)                                                     \
    do {                                                                                           \
        if (static_cast<int>(level) >= TPLID_MIN_LOG_LEVEL) {                                      \
            auto& logger_ = ::tplid::log::Logger::instance();                                      \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define TPLID_LOG_TRACE(module, msg) TPLID_LOG_IMPL(::tplid::log::LogLevel::Trace, module, msg)
#define TPLID_LOG_DEBUG(module, msg) TPLID_LOG_IMPL(::tplid::log::LogLevel::Debug, module, msg)
#define TPLID_LOG_INFO(module, msg) TPLID_LOG_IMPL(::tplid::log::LogLevel::Info, module, msg)
#define TPLID_LOG_WARN(module, msg) TPLID_LOG_IMPL(::tplid::log::LogLevel::Warn, module, msg)
#define TPLID_LOG_ERROR(module, msg) TPLID_LOG_IMPL(::tplid::log::LogLevel::Error, module, msg)
#define TPLID_LOG_FATAL(module, msg) TPLID_LOG_IMPL(::tplid::log::LogLevel::Fatal, module, msg)

} // namespace tplid::log

#endif // TPLID_LOG_HPP
