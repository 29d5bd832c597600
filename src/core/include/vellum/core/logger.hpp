#pragma once

/**
 * Logging
 *
 * Named loggers write LogRecords to process-wide sinks. Every component
 * logs through its own logger ("cache", "loader", "texture_pool",
 * "resource_manager", "batch") so output can be filtered per subsystem.
 */

#include "types.hpp"
#include <chrono>
#include <cstdio>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace vellum {

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

[[nodiscard]] std::string_view to_string(LogLevel level);

// Case-insensitive level name ("debug", "WARN", ...)
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

// ============================================================================
// Source location
// ============================================================================

struct SourceLocation {
    const char* file;
    int line;

    static SourceLocation current(const char* file = __builtin_FILE(),
                                  int line = __builtin_LINE()) {
        return {file, line};
    }
};

// ============================================================================
// Message formatting
// ============================================================================

namespace detail {

inline void format_into(std::ostringstream& out, std::string_view fmt) {
    out << fmt;
}

template<typename Arg, typename... Rest>
void format_into(std::ostringstream& out, std::string_view fmt, Arg&& arg, Rest&&... rest) {
    auto pos = fmt.find("{}");
    if (pos == std::string_view::npos) {
        out << fmt;
        return;
    }
    out << fmt.substr(0, pos) << std::forward<Arg>(arg);
    format_into(out, fmt.substr(pos + 2), std::forward<Rest>(rest)...);
}

} // namespace detail

// Substitutes each "{}" in fmt with the next argument, streamed with operator<<
template<typename... Args>
[[nodiscard]] std::string format_message(std::string_view fmt, Args&&... args) {
    std::ostringstream out;
    detail::format_into(out, fmt, std::forward<Args>(args)...);
    return out.str();
}

// ============================================================================
// Sinks
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view message;
    std::string_view logger_name;
    SourceLocation location;
    std::chrono::system_clock::time_point timestamp;
};

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

// Writes to stderr so stdout stays free for tool output
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);
    void write(const LogRecord& record) override;
    void flush() override;

private:
    bool m_use_colors;
};

// Appends to a file; a sink whose file failed to open drops records
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path);

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] bool is_open() const { return m_file != nullptr; }

private:
    struct Closer {
        void operator()(std::FILE* file) const { std::fclose(file); }
    };

    std::unique_ptr<std::FILE, Closer> m_file;
};

// Keeps "[LEVEL] [logger] message" lines, for tests
class MemorySink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override {}

    [[nodiscard]] std::vector<std::string> lines() const { return m_lines; }
    [[nodiscard]] bool contains(std::string_view fragment) const;
    void clear() { m_lines.clear(); }

private:
    std::vector<std::string> m_lines;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    explicit Logger(std::string_view name) : m_name(name) {}

    void log(LogLevel level, std::string_view message,
             SourceLocation loc = SourceLocation::current());

    void trace(std::string_view msg, SourceLocation loc = SourceLocation::current()) { log(LogLevel::Trace, msg, loc); }
    void debug(std::string_view msg, SourceLocation loc = SourceLocation::current()) { log(LogLevel::Debug, msg, loc); }
    void info(std::string_view msg, SourceLocation loc = SourceLocation::current()) { log(LogLevel::Info, msg, loc); }
    void warn(std::string_view msg, SourceLocation loc = SourceLocation::current()) { log(LogLevel::Warn, msg, loc); }
    void error(std::string_view msg, SourceLocation loc = SourceLocation::current()) { log(LogLevel::Error, msg, loc); }
    void fatal(std::string_view msg, SourceLocation loc = SourceLocation::current()) { log(LogLevel::Fatal, msg, loc); }

    // "{}" placeholders; arguments are only formatted when the level is enabled
    template<typename... Args>
    void trace_fmt(std::string_view fmt, Args&&... args) { log_fmt(LogLevel::Trace, fmt, std::forward<Args>(args)...); }
    template<typename... Args>
    void debug_fmt(std::string_view fmt, Args&&... args) { log_fmt(LogLevel::Debug, fmt, std::forward<Args>(args)...); }
    template<typename... Args>
    void info_fmt(std::string_view fmt, Args&&... args) { log_fmt(LogLevel::Info, fmt, std::forward<Args>(args)...); }
    template<typename... Args>
    void warn_fmt(std::string_view fmt, Args&&... args) { log_fmt(LogLevel::Warn, fmt, std::forward<Args>(args)...); }
    template<typename... Args>
    void error_fmt(std::string_view fmt, Args&&... args) { log_fmt(LogLevel::Error, fmt, std::forward<Args>(args)...); }
    template<typename... Args>
    void fatal_fmt(std::string_view fmt, Args&&... args) { log_fmt(LogLevel::Fatal, fmt, std::forward<Args>(args)...); }

    void set_level(LogLevel level) { m_level = level; }
    [[nodiscard]] LogLevel level() const { return m_level; }
    [[nodiscard]] std::string_view name() const { return m_name; }
    [[nodiscard]] bool is_enabled(LogLevel level) const { return level >= m_level; }

private:
    template<typename... Args>
    void log_fmt(LogLevel level, std::string_view fmt, Args&&... args) {
        if (is_enabled(level)) {
            log(level, format_message(fmt, std::forward<Args>(args)...));
        }
    }

    std::string m_name;
    LogLevel m_level{LogLevel::Trace};
};

// ============================================================================
// Global logging configuration
// ============================================================================

namespace logging {

// Console sink; the global level is taken from VELLUM_LOG_LEVEL when set
void init();

void init(std::vector<std::unique_ptr<LogSink>> sinks);

// Flushes and drops every sink and logger
void shutdown();

void add_sink(std::unique_ptr<LogSink> sink);

void set_level(LogLevel level);
[[nodiscard]] LogLevel level();

// Loggers live until shutdown(); references stay valid until then
[[nodiscard]] Logger& get(std::string_view name);
[[nodiscard]] Logger& default_logger();

void flush();

} // namespace logging

// ============================================================================
// Convenience macros
// ============================================================================

#define VELLUM_LOG_TRACE(msg) ::vellum::logging::default_logger().trace(msg)
#define VELLUM_LOG_DEBUG(msg) ::vellum::logging::default_logger().debug(msg)
#define VELLUM_LOG_INFO(msg)  ::vellum::logging::default_logger().info(msg)
#define VELLUM_LOG_WARN(msg)  ::vellum::logging::default_logger().warn(msg)
#define VELLUM_LOG_ERROR(msg) ::vellum::logging::default_logger().error(msg)
#define VELLUM_LOG_FATAL(msg) ::vellum::logging::default_logger().fatal(msg)

#define VELLUM_LOG_TRACE_FMT(fmt, ...) ::vellum::logging::default_logger().trace_fmt(fmt, ##__VA_ARGS__)
#define VELLUM_LOG_DEBUG_FMT(fmt, ...) ::vellum::logging::default_logger().debug_fmt(fmt, ##__VA_ARGS__)
#define VELLUM_LOG_INFO_FMT(fmt, ...)  ::vellum::logging::default_logger().info_fmt(fmt, ##__VA_ARGS__)
#define VELLUM_LOG_WARN_FMT(fmt, ...)  ::vellum::logging::default_logger().warn_fmt(fmt, ##__VA_ARGS__)
#define VELLUM_LOG_ERROR_FMT(fmt, ...) ::vellum::logging::default_logger().error_fmt(fmt, ##__VA_ARGS__)
#define VELLUM_LOG_FATAL_FMT(fmt, ...) ::vellum::logging::default_logger().fatal_fmt(fmt, ##__VA_ARGS__)

} // namespace vellum
