//! # Logger Implementation
//!
//! Sinks, the module filter and the `Logger` singleton.
//!
//! ## Line Format
//!
//! ```text
//! 14:02:11.384 WARN  parser  model.sidl:3:1: documentation comment is not attached ...
//! 14:02:11.385 DEBUG lexer   Numbers cannot have leading zeros at model.sidl:7:12  (lexer_core.cpp:63)
//! ```
//!
//! Debug and Trace lines written to a file also name the emitting source
//! file and line.

#include "log/log.hpp"

#include <array>
#include <cstdio>
#include <cstdlib>

#include <unistd.h>

namespace sidl::log {

namespace {

/// ANSI color per level, indexed by `LogLevel`.
constexpr std::array<const char*, 7> LEVEL_COLORS = {
    "\033[90m",   // Trace: dark gray
    "\033[36m",   // Debug: cyan
    "\033[32m",   // Info: green
    "\033[33m",   // Warn: yellow
    "\033[31m",   // Error: red
    "\033[1;31m", // Fatal: bold red
    "",           // Off
};

constexpr const char* COLOR_RESET = "\033[0m";

auto stderr_supports_color() -> bool {
    if (isatty(fileno(stderr)) == 0) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
}

/// Strips the directories from `__FILE__`.
auto base_name(const char* path) -> std::string_view {
    if (path == nullptr) {
        return {};
    }
    std::string_view view(path);
    auto slash = view.find_last_of("/\\");
    return slash == std::string_view::npos ? view : view.substr(slash + 1);
}

/// Renders one record as a log line, without the trailing newline.
auto format_record(const LogRecord& record, bool colors, bool with_origin) -> std::string {
    std::ostringstream out;
    out << format_timestamp(record.timestamp_ms) << ' ';

    if (colors) {
        out << LEVEL_COLORS[static_cast<size_t>(record.level)];
    }
    out << std::left << std::setw(5) << level_name(record.level);
    if (colors) {
        out << COLOR_RESET;
    }

    out << ' ' << std::left << std::setw(7) << record.module << ' ' << record.message;

    if (with_origin && record.level <= LogLevel::Debug && record.file != nullptr) {
        out << "  (" << base_name(record.file) << ':' << record.line << ')';
    }
    return out.str();
}

/// Trims spaces around one entry of a filter spec.
auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && text.front() == ' ') {
        text.remove_prefix(1);
    }
    while (!text.empty() && text.back() == ' ') {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors)
    : colors_enabled_(use_colors && stderr_supports_color()) {}

void ConsoleSink::write(const LogRecord& record) {
    std::cerr << format_record(record, colors_enabled_, false) << '\n';
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : (std::ios::out | std::ios::trunc)) {}

FileSink::~FileSink() {
    flush();
}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    file_ << format_record(record, false, true) << '\n';
    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// MemorySink
// ============================================================================

void MemorySink::write(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(Entry{.level = record.level,
                             .module = std::string(record.module),
                             .message = record.message});
}

auto MemorySink::entries() const -> std::vector<Entry> {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

void MemorySink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    while (!spec.empty()) {
        auto comma = spec.find(',');
        auto entry = trim(spec.substr(0, comma));
        spec = comma == std::string_view::npos ? std::string_view{} : spec.substr(comma + 1);

        if (entry.empty()) {
            continue;
        }

        auto eq = entry.find('=');
        if (eq == std::string_view::npos) {
            module_levels_[std::string(entry)] = LogLevel::Trace;
            continue;
        }

        auto module = trim(entry.substr(0, eq));
        auto level = parse_level(trim(entry.substr(eq + 1)));
        if (module == "*") {
            default_level_ = level;
        } else if (!module.empty()) {
            module_levels_[std::string(module)] = level;
        }
    }
}

auto LogFilter::should_log(LogLevel level, std::string_view module) const -> bool {
    auto it = module_levels_.find(std::string(module));
    auto threshold = it == module_levels_.end() ? default_level_ : it->second;
    return level >= threshold;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() = default;

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    std::vector<std::unique_ptr<LogSink>> sinks;
    if (config.console) {
        sinks.push_back(std::make_unique<ConsoleSink>(config.colors));
    }
    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        if (file->is_open()) {
            sinks.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }

    LogFilter filter;
    filter.set_default_level(config.level);
    if (!config.filter_spec.empty()) {
        // A spec without "*=level" keeps the configured level as its default
        filter.parse(config.filter_spec);
        if (config.level < filter.default_level()) {
            filter.set_default_level(config.level);
        }
    }

    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);
    logger.sinks_ = std::move(sinks);
    logger.filter_ = std::move(filter);
    logger.level_ = logger.filter_.min_level();
}

auto Logger::should_log(LogLevel level, std::string_view module) const -> bool {
    return level >= level_ && filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    log(LogRecord{.level = level,
                  .module = module,
                  .message = message,
                  .file = file,
                  .line = line,
                  .timestamp_ms = epoch_ms()});
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

} // namespace sidl::log
