#pragma once

#include "types.hpp"
#include "string.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio {

// ============================================================================
// Log levels
// ============================================================================

enum class LogLevel : u8 {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

[[nodiscard]] constexpr std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

// Case-insensitive inverse of log_level_name
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

// ============================================================================
// Source location (GCC 9 compatible)
// ============================================================================

struct SourceLocation {
    const char* file;
    int line;
    const char* function;

    static SourceLocation current(const char* file = __builtin_FILE(),
                                  int line = __builtin_LINE(),
                                  const char* func = __builtin_FUNCTION()) {
        return {file, line, func};
    }

    [[nodiscard]] const char* file_name() const { return file; }
    [[nodiscard]] int line_number() const { return line; }
    [[nodiscard]] const char* function_name() const { return function; }
};

// ============================================================================
// Log record
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view message;
    std::string_view logger_name;
    SourceLocation location;
    std::chrono::system_clock::time_point timestamp;
};

// ============================================================================
// Log sink interface
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

// Writes to stderr so that document text on stdout stays clean
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);
    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool m_use_colors;
};

class FileSink : public LogSink {
public:
    explicit FileSink(const char* filename);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    [[nodiscard]] bool is_open() const { return m_file != nullptr; }

    void write(const LogRecord& record) override;
    void flush() override;

private:
    void* m_file{nullptr};
};

// Keeps records in memory, mostly for tests
class MemorySink : public LogSink {
public:
    struct Entry {
        LogLevel level;
        std::string logger_name;
        std::string message;
    };

    void write(const LogRecord& record) override;
    void flush() override {}

    [[nodiscard]] std::vector<Entry> entries() const;
    void clear();

private:
    mutable std::mutex m_mutex;
    std::vector<Entry> m_entries;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    explicit Logger(std::string_view name);

    void trace(std::string_view msg, SourceLocation loc = SourceLocation::current());
    void debug(std::string_view msg, SourceLocation loc = SourceLocation::current());
    void info(std::string_view msg, SourceLocation loc = SourceLocation::current());
    void warn(std::string_view msg, SourceLocation loc = SourceLocation::current());
    void error(std::string_view msg, SourceLocation loc = SourceLocation::current());
    void fatal(std::string_view msg, SourceLocation loc = SourceLocation::current());

    // Format-style logging, "{}" placeholders (see StringBuilder::append_format)
    template<typename... Args>
    void trace_fmt(std::string_view fmt, const Args&... args) {
        log_fmt(LogLevel::Trace, fmt, args...);
    }

    template<typename... Args>
    void debug_fmt(std::string_view fmt, const Args&... args) {
        log_fmt(LogLevel::Debug, fmt, args...);
    }

    template<typename... Args>
    void info_fmt(std::string_view fmt, const Args&... args) {
        log_fmt(LogLevel::Info, fmt, args...);
    }

    template<typename... Args>
    void warn_fmt(std::string_view fmt, const Args&... args) {
        log_fmt(LogLevel::Warn, fmt, args...);
    }

    template<typename... Args>
    void error_fmt(std::string_view fmt, const Args&... args) {
        log_fmt(LogLevel::Error, fmt, args...);
    }

    template<typename... Args>
    void fatal_fmt(std::string_view fmt, const Args&... args) {
        log_fmt(LogLevel::Fatal, fmt, args...);
    }

    void set_level(LogLevel level) { m_level.store(level, std::memory_order_relaxed); }
    [[nodiscard]] LogLevel level() const { return m_level.load(std::memory_order_relaxed); }
    [[nodiscard]] std::string_view name() const { return m_name; }

    // Honors both the logger level and the global level
    [[nodiscard]] bool is_enabled(LogLevel level) const;

private:
    template<typename... Args>
    void log_fmt(LogLevel level, std::string_view fmt, const Args&... args) {
        if (!is_enabled(level)) {
            return;
        }
        StringBuilder builder;
        builder.append_format(fmt, args...);
        log_impl(level, builder.view(), SourceLocation{"", 0, ""});
    }

    void log_impl(LogLevel level, std::string_view message, SourceLocation loc);

    std::string m_name;
    std::atomic<LogLevel> m_level{LogLevel::Trace};
};

// ============================================================================
// Global logging configuration
// ============================================================================

namespace logging {

// Initialize logging system with default console sink
void init();

// Initialize with custom sinks
void init(std::vector<std::unique_ptr<LogSink>> sinks);

void shutdown();

void add_sink(std::unique_ptr<LogSink> sink);

// Global minimum level, Warn until changed
void set_level(LogLevel level);
[[nodiscard]] LogLevel level();

// Get or create a named logger
[[nodiscard]] Logger& get(std::string_view name);

[[nodiscard]] Logger& default_logger();

void flush();

} // namespace logging

// ============================================================================
// Convenience macros
// ============================================================================

#define FOLIO_LOG_TRACE(msg) ::folio::logging::default_logger().trace(msg)
#define FOLIO_LOG_DEBUG(msg) ::folio::logging::default_logger().debug(msg)
#define FOLIO_LOG_INFO(msg)  ::folio::logging::default_logger().info(msg)
#define FOLIO_LOG_WARN(msg)  ::folio::logging::default_logger().warn(msg)
#define FOLIO_LOG_ERROR(msg) ::folio::logging::default_logger().error(msg)
#define FOLIO_LOG_FATAL(msg) ::folio::logging::default_logger().fatal(msg)

#define FOLIO_LOG_DEBUG_FMT(fmt, ...) ::folio::logging::default_logger().debug_fmt(fmt, ##__VA_ARGS__)
#define FOLIO_LOG_INFO_FMT(fmt, ...)  ::folio::logging::default_logger().info_fmt(fmt, ##__VA_ARGS__)
#define FOLIO_LOG_WARN_FMT(fmt, ...)  ::folio::logging::default_logger().warn_fmt(fmt, ##__VA_ARGS__)
#define FOLIO_LOG_ERROR_FMT(fmt, ...) ::folio::logging::default_logger().error_fmt(fmt, ##__VA_ARGS__)

} // namespace folio
