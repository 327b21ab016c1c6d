//! # sidl Logging
//!
//! A small structured logging library shared by the lexer, parsers and CLI:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering (`lexer`, `parser`, `cli`)
//! - Output sinks: Console (stderr), File and Memory
//! - Thread-safe output with mutex protection
//! - Compile-time level elision via SIDL_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! SIDL_LOG_INFO("cli", "Loading " << path);
//! SIDL_LOG_DEBUG("parser", "Parsed trait " << name);
//! SIDL_LOG_WARN("parser", "Documentation comment discarded at " << loc.to_string());
//! ```

#ifndef SIDL_LOG_LOG_HPP
#define SIDL_LOG_LOG_HPP

#include <array>
#include <cctype>
#include <chrono>
#include <cstddef>
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

namespace sidl::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Token-level tracing
    Debug = 1, ///< Parser decisions
    Info = 2,  ///< Progress of a load
    Warn = 3,  ///< Suspicious but accepted input
    Error = 4, ///< Failed loads
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Upper-case level names, indexed by `LogLevel`.
inline constexpr std::array<const char*, 7> LEVEL_NAMES = {"TRACE", "DEBUG", "INFO", "WARN",
                                                           "ERROR", "FATAL", "OFF"};

inline auto level_name(LogLevel level) -> const char* {
    auto index = static_cast<size_t>(level);
    return index < LEVEL_NAMES.size() ? LEVEL_NAMES[index] : "???";
}

/// Parses a level name, ignoring case; unknown names give Info.
inline auto parse_level(std::string_view s) -> LogLevel {
    for (size_t i = 0; i < LEVEL_NAMES.size(); ++i) {
        std::string_view name = LEVEL_NAMES[i];
        if (name.size() != s.size()) {
            continue;
        }
        bool same = true;
        for (size_t j = 0; j < name.size() && same; ++j) {
            same = std::toupper(static_cast<unsigned char>(s[j])) == name[j];
        }
        if (same) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::Info;
}

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g. "parser")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
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

/// Writes to stderr, with ANSI colors when stderr is a color terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool colors_enabled_;
};

/// Appends log lines to a file. Flushes on Error and Fatal.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

private:
    std::ofstream file_;
};

/// Keeps every record in memory; used by tests and embedders that surface
/// diagnostics themselves.
class MemorySink : public LogSink {
public:
    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    void write(const LogRecord& record) override;
    void flush() override {}

    /// Returns a copy of the captured entries.
    [[nodiscard]] auto entries() const -> std::vector<Entry>;

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter.
///
/// Parses specs like "parser=debug,lexer=off,*=warn". A bare module name
/// enables Trace for that module.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// Lowest level any module (or the default) accepts.
    [[nodiscard]] auto min_level() const -> LogLevel {
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
    LogLevel level = LogLevel::Warn; ///< Global minimum log level
    std::string filter_spec;         ///< Module filter string
    std::string log_file;            ///< Path to log file (empty = no file)
    bool console = true;             ///< Enable console (stderr) output
    bool colors = true;              ///< Enable ANSI colors on console
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Until `init()` is called the logger has no sinks, so library code logs
/// nothing unless the embedding program configures it.
class Logger {
public:
    /// Replaces the sinks, level and filter with the given configuration.
    static void init(const LogConfig& config);

    static auto instance() -> Logger&;

    /// Fast-path check used by the macros before formatting the message.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink.
    void clear_sinks();

    void set_level(LogLevel level);

    [[nodiscard]] auto level() const -> LogLevel {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Info;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Timestamp Helpers
// ============================================================================

/// Formats milliseconds since the epoch as local "HH:MM:SS.mmm".
inline auto format_timestamp(int64_t ms) -> std::string {
    auto seconds = static_cast<std::time_t>(ms / 1000);

    std::tm tm_buf{};
    localtime_r(&seconds, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << ms % 1000;
    return oss.str();
}

inline auto epoch_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Extracts logging options from argv: --log-level=, --log-filter=,
/// --log-file=, -q, -v/-vv/-vvv. Falls back to the SIDL_LOG environment
/// variable when neither a level nor a filter was given.
auto parse_log_options(int argc, char* argv[]) -> LogConfig;

/// Returns true if `arg` is one of the options `parse_log_options` consumes.
[[nodiscard]] auto is_log_option(std::string_view arg) -> bool;

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef SIDL_MIN_LOG_LEVEL
#define SIDL_MIN_LOG_LEVEL 0
#endif

/// Internal macro; use the level-specific macros below.
#define SIDL_LOG_IMPL(level, module_str, msg)                                                      \
    do {                                                                                           \
        if (static_cast<int>(level) >= SIDL_MIN_LOG_LEVEL) {                                       \
            auto& logger_ = ::sidl::log::Logger::instance();                                       \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Usage: SIDL_LOG_TRACE("module", "message " << value);
#define SIDL_LOG_TRACE(module, msg) SIDL_LOG_IMPL(::sidl::log::LogLevel::Trace, module, msg)
#define SIDL_LOG_DEBUG(module, msg) SIDL_LOG_IMPL(::sidl::log::LogLevel::Debug, module, msg)
#define SIDL_LOG_INFO(module, msg) SIDL_LOG_IMPL(::sidl::log::LogLevel::Info, module, msg)
#define SIDL_LOG_WARN(module, msg) SIDL_LOG_IMPL(::sidl::log::LogLevel::Warn, module, msg)
#define SIDL_LOG_ERROR(module, msg) SIDL_LOG_IMPL(::sidl::log::LogLevel::Error, module, msg)
#define SIDL_LOG_FATAL(module, msg) SIDL_LOG_IMPL(::sidl::log::LogLevel::Fatal, module, msg)

} // namespace sidl::log

#endif // SIDL_LOG_LOG_HPP
