#pragma once

#include "types.hpp"
#include "string.hpp"
#include <string_view>
#include <chrono>
#include <fstream>
#include <optional>
#include <vector>
#include <memory>
#include <format>

namespace weft {

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

// Accepts "trace", "debug", ... (case-insensitive)
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

// Writes to stderr; Info and above optionally colored
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);
    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool m_use_colors;
};

// Appends to a file; every record carries its source location
class FileSink : public LogSink {
public:
    explicit FileSink(const String& path);

    [[nodiscard]] bool is_open() const { return m_stream.is_open(); }

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::ofstream m_stream;
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

    // Formatting is skipped entirely when the level is disabled.
    template<typename... Args>
    void trace_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(LogLevel::Trace)) {
            trace(std::vformat(fmt.get(), std::make_format_args(args...)));
        }
    }

    template<typename... Args>
    void debug_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(LogLevel::Debug)) {
            debug(std::vformat(fmt.get(), std::make_format_args(args...)));
        }
    }

    template<typename... Args>
    void info_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(LogLevel::Info)) {
            info(std::vformat(fmt.get(), std::make_format_args(args...)));
        }
    }

    template<typename... Args>
    void warn_fmt(std::format_string<Args...> fmt, Args&&... args) {
        if (is_enabled(LogLevel::Warn)) {
            warn(std::vformat(fmt.get(), std::make_format_args(args...)));
        }
    }

    void set_level(LogLevel level) { m_level = level; }
    [[nodiscard]] LogLevel level() const { return m_level; }
    [[nodiscard]] std::string_view name() const { return m_name; }

    [[nodiscard]] bool is_enabled(LogLevel level) const;

private:
    void log_impl(LogLevel level, std::string_view message, SourceLocation loc);

    std::string m_name;
    LogLevel m_level{LogLevel::Trace};
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

// Global minimum level, applied on top of each logger's own level
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

#define WEFT_LOG_TRACE(msg) ::weft::logging::default_logger().trace(msg)
#define WEFT_LOG_DEBUG(msg) ::weft::logging::default_logger().debug(msg)
#define WEFT_LOG_INFO(msg)  ::weft::logging::default_logger().info(msg)
#define WEFT_LOG_WARN(msg)  ::weft::logging::default_logger().warn(msg)
#define WEFT_LOG_ERROR(msg) ::weft::logging::default_logger().error(msg)

#define WEFT_LOG_DEBUG_FMT(fmt, ...) ::weft::logging::default_logger().debug_fmt(fmt, ##__VA_ARGS__)
#define WEFT_LOG_INFO_FMT(fmt, ...)  ::weft::logging::default_logger().info_fmt(fmt, ##__VA_ARGS__)
#define WEFT_LOG_WARN_FMT(fmt, ...)  ::weft::logging::default_logger().warn_fmt(fmt, ##__VA_ARGS__)

} // namespace weft
