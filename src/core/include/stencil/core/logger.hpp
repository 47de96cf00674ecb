#pragma once

#include "types.hpp"
#include <chrono>
#include <format>
#include <fstream>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stencil {

// ============================================================================
// Levels
// ============================================================================

enum class LogLevel : u8 {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal,
    Off,
};

[[nodiscard]] constexpr std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off: return "OFF";
    }
    return "?";
}

// Case-insensitive; "warning" is accepted for Warn
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

// ============================================================================
// Records and sinks
// ============================================================================

struct LogRecord {
    LogLevel level;
    std::string_view logger_name;
    std::string_view message;
    std::chrono::system_clock::time_point time;
};

// "HH:MM:SS.mmm LEVEL [logger] message", no trailing newline
[[nodiscard]] std::string format_log_line(const LogRecord& record);

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() {}
};

// Diagnostics only; never stdout, which carries generated code
class ConsoleSink : public LogSink {
public:
    ConsoleSink();
    explicit ConsoleSink(std::ostream& out) : m_out(out) {}

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::ostream& m_out;
};

// Appends to a file; check is_open() before adding it
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path);

    [[nodiscard]] bool is_open() const { return m_file.is_open(); }

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::ofstream m_file;
};

// Keeps every record; used by tests
class MemorySink : public LogSink {
public:
    struct Entry {
        LogLevel level;
        std::string logger_name;
        std::string message;
    };

    void write(const LogRecord& record) override;

    [[nodiscard]] const std::vector<Entry>& entries() const { return m_entries; }
    void clear() { m_entries.clear(); }

private:
    std::vector<Entry> m_entries;
};

// ============================================================================
// Logger - named channel ("stencil.compiler", "stencil.markup")
// ============================================================================

class Logger {
public:
    explicit Logger(std::string_view name) : m_name(name) {}

    void log(LogLevel level, std::string_view message);

    // Formatting is skipped entirely when the level is filtered out
    template<typename... Args>
    void logf(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(level)) {
            log(level, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    void trace(std::string_view message) { log(LogLevel::Trace, message); }
    void debug(std::string_view message) { log(LogLevel::Debug, message); }
    void info(std::string_view message) { log(LogLevel::Info, message); }
    void warn(std::string_view message) { log(LogLevel::Warn, message); }
    void error(std::string_view message) { log(LogLevel::Error, message); }
    void fatal(std::string_view message) { log(LogLevel::Fatal, message); }

    template<typename... Args>
    void trace_fmt(std::format_string<Args...> fmt, Args&&... args) { logf(LogLevel::Trace, fmt, std::forward<Args>(args)...); }
    template<typename... Args>
    void debug_fmt(std::format_string<Args...> fmt, Args&&... args) { logf(LogLevel::Debug, fmt, std::forward<Args>(args)...); }
    template<typename... Args>
    void warn_fmt(std::format_string<Args...> fmt, Args&&... args) { logf(LogLevel::Warn, fmt, std::forward<Args>(args)...); }

    void set_level(LogLevel level) { m_level = level; }
    [[nodiscard]] LogLevel level() const { return m_level; }
    [[nodiscard]] std::string_view name() const { return m_name; }

    // Both this logger's level and the global level must admit the record
    [[nodiscard]] bool should_log(LogLevel level) const;

private:
    std::string m_name;
    LogLevel m_level{LogLevel::Trace};
};

// ============================================================================
// Process-wide configuration
// ============================================================================

namespace logging {

// Installs a ConsoleSink on stderr. No-op when already initialized.
void init();
void init(std::vector<std::unique_ptr<LogSink>> sinks);

// Flushes and drops the sinks. Loggers handed out by get() stay valid.
void shutdown();

void add_sink(std::unique_ptr<LogSink> sink);

void set_level(LogLevel level);
[[nodiscard]] LogLevel level();

[[nodiscard]] Logger& get(std::string_view name);

void flush();

} // namespace logging

} // namespace stencil
