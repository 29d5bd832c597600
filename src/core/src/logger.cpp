#include "vellum/core/logger.hpp"
#include <array>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <mutex>
#include <unordered_map>

namespace vellum {

namespace {

struct LoggingState {
    std::mutex mutex;
    std::vector<std::unique_ptr<LogSink>> sinks;
    std::unordered_map<std::string, std::unique_ptr<Logger>> loggers;
    std::unique_ptr<Logger> default_logger;
    LogLevel global_level{LogLevel::Info};
    bool initialized{false};
};

LoggingState& state() {
    static LoggingState s;
    return s;
}

constexpr std::array<std::string_view, 7> LEVEL_NAMES{
    "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL", "OFF"};

// "2024-05-01 12:00:00.123", local time
std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto seconds = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    char buffer[40];
    usize length = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    std::snprintf(buffer + length, sizeof(buffer) - length, ".%03d", static_cast<int>(millis));
    return buffer;
}

const char* level_color(LogLevel level) {
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

// "[LEVEL] [logger] message", shared by the file and memory sinks
std::string format_body(const LogRecord& record) {
    std::string line = "[";
    line += to_string(record.level);
    line += "] ";
    if (!record.logger_name.empty()) {
        line += "[";
        line += record.logger_name;
        line += "] ";
    }
    line += record.message;
    return line;
}

void install_locked(LoggingState& s, std::vector<std::unique_ptr<LogSink>> sinks) {
    s.sinks = std::move(sinks);
    s.default_logger = std::make_unique<Logger>("vellum");
    s.initialized = true;
}

} // anonymous namespace

std::string_view to_string(LogLevel level) {
    auto index = static_cast<usize>(level);
    return index < LEVEL_NAMES.size() ? LEVEL_NAMES[index] : "UNKNOWN";
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string upper;
    upper.reserve(name.size());
    for (char c : name) {
        upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    for (usize i = 0; i < LEVEL_NAMES.size(); ++i) {
        if (LEVEL_NAMES[i] == upper) {
            return static_cast<LogLevel>(i);
        }
    }
    if (upper == "WARNING") {
        return LogLevel::Warn;
    }
    return std::nullopt;
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors) : m_use_colors(use_colors) {}

void ConsoleSink::write(const LogRecord& record) {
    std::cerr << "[" << format_timestamp(record.timestamp) << "] ";
    if (m_use_colors) {
        std::cerr << level_color(record.level) << "[" << to_string(record.level) << "]\033[0m ";
    } else {
        std::cerr << "[" << to_string(record.level) << "] ";
    }
    if (!record.logger_name.empty()) {
        std::cerr << "[" << record.logger_name << "] ";
    }
    std::cerr << record.message;

    // Source positions only on the chatty levels
    if (record.level <= LogLevel::Debug) {
        std::cerr << " (" << record.location.file << ":" << record.location.line << ")";
    }
    std::cerr << "\n";
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const std::string& path) : m_file(std::fopen(path.c_str(), "a")) {}

void FileSink::write(const LogRecord& record) {
    if (!m_file) {
        return;
    }
    std::string line = "[" + format_timestamp(record.timestamp) + "] " + format_body(record);
    std::fprintf(m_file.get(), "%s (%s:%d)\n", line.c_str(),
                 record.location.file, record.location.line);
}

void FileSink::flush() {
    if (m_file) {
        std::fflush(m_file.get());
    }
}

void MemorySink::write(const LogRecord& record) {
    m_lines.push_back(format_body(record));
}

bool MemorySink::contains(std::string_view fragment) const {
    for (const auto& line : m_lines) {
        if (line.find(fragment) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Logger
// ============================================================================

void Logger::log(LogLevel level, std::string_view message, SourceLocation loc) {
    if (!is_enabled(level)) {
        return;
    }

    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (level < s.global_level) {
        return;
    }

    LogRecord record{level, message, m_name, loc, std::chrono::system_clock::now()};
    for (auto& sink : s.sinks) {
        sink->write(record);
    }
}

// ============================================================================
// Global configuration
// ============================================================================

namespace logging {

void init() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (s.initialized) {
        return;
    }

    std::vector<std::unique_ptr<LogSink>> sinks;
    sinks.push_back(std::make_unique<ConsoleSink>());
    install_locked(s, std::move(sinks));

    if (const char* env = std::getenv("VELLUM_LOG_LEVEL")) {
        if (auto parsed = parse_log_level(env)) {
            s.global_level = *parsed;
        }
    }
}

void init(std::vector<std::unique_ptr<LogSink>> sinks) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (!s.initialized) {
        install_locked(s, std::move(sinks));
    }
}

void shutdown() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    for (auto& sink : s.sinks) {
        sink->flush();
    }
    s.sinks.clear();
    s.loggers.clear();
    s.default_logger.reset();
    s.initialized = false;
}

void add_sink(std::unique_ptr<LogSink> sink) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.sinks.push_back(std::move(sink));
}

void set_level(LogLevel level) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.global_level = level;
}

LogLevel level() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    return s.global_level;
}

Logger& get(std::string_view name) {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    std::string key(name);
    auto it = s.loggers.find(key);
    if (it == s.loggers.end()) {
        it = s.loggers.emplace(std::move(key), std::make_unique<Logger>(name)).first;
    }
    return *it->second;
}

Logger& default_logger() {
    if (!state().initialized) {
        init();
    }
    return *state().default_logger;
}

void flush() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    for (auto& sink : s.sinks) {
        sink->flush();
    }
}

} // namespace logging

} // namespace vellum
