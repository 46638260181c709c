#include "weft/core/logger.hpp"
#include <atomic>
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <ctime>

namespace weft {

// ============================================================================
// Global state
// ============================================================================

namespace {

struct LoggingState {
    std::mutex mutex;
    std::vector<std::unique_ptr<LogSink>> sinks;
    std::unordered_map<std::string, std::unique_ptr<Logger>> loggers;
    std::unique_ptr<Logger> default_logger;
    std::atomic<LogLevel> global_level{LogLevel::Warn};
    bool initialized{false};
};

LoggingState& state() {
    static LoggingState s;
    return s;
}

// "12:34:56.789", local time
std::string clock_text(std::chrono::system_clock::time_point tp) {
    auto seconds = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif
    return std::format("{:02}:{:02}:{:02}.{:03}", local.tm_hour, local.tm_min, local.tm_sec, millis);
}

std::string_view file_basename(std::string_view path) {
    auto slash = path.find_last_of("/\\");
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

// "[time] [LEVEL] [logger] message (file:line)", the level text supplied by
// the sink so it can be decorated
std::string format_line(const LogRecord& record, std::string_view level_text, bool with_location) {
    std::string line = std::format("[{}] {} ", clock_text(record.timestamp), level_text);
    if (!record.logger_name.empty()) {
        line += std::format("[{}] ", record.logger_name);
    }
    line += record.message;
    if (with_location) {
        line += std::format(" ({}:{})", file_basename(record.location.file_name()),
                            record.location.line_number());
    }
    return line;
}

std::string_view level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35m";
        case LogLevel::Off:   break;
    }
    return "";
}

// Caller holds the state mutex
void install_locked(LoggingState& s, std::vector<std::unique_ptr<LogSink>> sinks) {
    if (s.initialized) {
        return;
    }
    s.sinks = std::move(sinks);
    s.default_logger = std::make_unique<Logger>("weft");
    s.initialized = true;
}

// Caller holds the state mutex
void flush_locked(LoggingState& s) {
    for (auto& sink : s.sinks) {
        sink->flush();
    }
}

} // anonymous namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    static const std::pair<std::string_view, LogLevel> names[] = {
        {"trace", LogLevel::Trace}, {"debug", LogLevel::Debug}, {"info", LogLevel::Info},
        {"warn", LogLevel::Warn},   {"warning", LogLevel::Warn}, {"error", LogLevel::Error},
        {"fatal", LogLevel::Fatal}, {"off", LogLevel::Off},     {"none", LogLevel::Off},
    };

    String lowered = String(name).to_lowercase();
    for (const auto& [text, level] : names) {
        if (lowered.view() == text) {
            return level;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors) : m_use_colors(use_colors) {}

void ConsoleSink::write(const LogRecord& record) {
    std::string level_text = std::format("[{}]", log_level_name(record.level));
    if (m_use_colors) {
        level_text = std::format("{}{}\033[0m", level_color(record.level), level_text);
    }

    // stdout belongs to tool output
    std::cerr << format_line(record, level_text, record.level <= LogLevel::Debug) << '\n';
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const String& path) : m_stream(path.c_str(), std::ios::out | std::ios::app) {}

void FileSink::write(const LogRecord& record) {
    if (!m_stream.is_open()) {
        return;
    }
    m_stream << format_line(record, std::format("[{}]", log_level_name(record.level)), true) << '\n';
}

void FileSink::flush() {
    if (m_stream.is_open()) {
        m_stream.flush();
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(std::string_view name) : m_name(name) {}

void Logger::trace(std::string_view msg, SourceLocation loc) { log_impl(LogLevel::Trace, msg, loc); }
void Logger::debug(std::string_view msg, SourceLocation loc) { log_impl(LogLevel::Debug, msg, loc); }
void Logger::info(std::string_view msg, SourceLocation loc) { log_impl(LogLevel::Info, msg, loc); }
void Logger::warn(std::string_view msg, SourceLocation loc) { log_impl(LogLevel::Warn, msg, loc); }
void Logger::error(std::string_view msg, SourceLocation loc) { log_impl(LogLevel::Error, msg, loc); }

bool Logger::is_enabled(LogLevel level) const {
    if (level == LogLevel::Off) {
        return false;
    }
    return level >= m_level && level >= logging::level();
}

void Logger::log_impl(LogLevel level, std::string_view message, SourceLocation loc) {
    if (!is_enabled(level)) {
        return;
    }

    LogRecord record{level, message, m_name, loc, std::chrono::system_clock::now()};

    auto& s = state();
    std::lock_guard lock(s.mutex);
    for (auto& sink : s.sinks) {
        sink->write(record);
    }
}

// ============================================================================
// Global configuration
// ============================================================================

namespace logging {

void init() {
    std::vector<std::unique_ptr<LogSink>> sinks;
    sinks.push_back(std::make_unique<ConsoleSink>());
    init(std::move(sinks));
}

void init(std::vector<std::unique_ptr<LogSink>> sinks) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    install_locked(s, std::move(sinks));
}

void shutdown() {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    flush_locked(s);
    s.sinks.clear();
    s.default_logger.reset();
    s.initialized = false;
    // Named loggers outlive shutdown: callers cache references to them
}

void add_sink(std::unique_ptr<LogSink> sink) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.sinks.push_back(std::move(sink));
}

void set_level(LogLevel level) {
    state().global_level.store(level, std::memory_order_relaxed);
}

LogLevel level() {
    return state().global_level.load(std::memory_order_relaxed);
}

Logger& get(std::string_view name) {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    auto [it, inserted] = s.loggers.try_emplace(std::string(name));
    if (inserted) {
        it->second = std::make_unique<Logger>(name);
    }
    return *it->second;
}

Logger& default_logger() {
    auto& s = state();
    if (!s.initialized) {
        init();
    }
    return *s.default_logger;
}

void flush() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    flush_locked(s);
}

} // namespace logging

} // namespace weft
