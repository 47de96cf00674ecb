#include "stencil/core/logger.hpp"
#include "stencil/core/string.hpp"
#include <atomic>
#include <ctime>
#include <iostream>
#include <map>
#include <mutex>

namespace stencil {

namespace {

struct Registry {
    std::mutex mutex;
    std::vector<std::unique_ptr<LogSink>> sinks;
    // std::map: references to loggers must survive later insertions
    std::map<std::string, Logger, std::less<>> loggers;
    std::atomic<LogLevel> level{LogLevel::Info};
    bool initialized{false};
};

Registry& registry() {
    static Registry instance;
    return instance;
}

constexpr LogLevel ALL_LEVELS[] = {
    LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
    LogLevel::Error, LogLevel::Fatal, LogLevel::Off,
};

} // namespace

std::optional<LogLevel> parse_log_level(std::string_view name) {
    String candidate(name);
    for (auto level : ALL_LEVELS) {
        if (candidate.equals_ignoring_ascii_case(log_level_name(level))) {
            return level;
        }
    }
    if (candidate.equals_ignoring_ascii_case("warning")) {
        return LogLevel::Warn;
    }
    return std::nullopt;
}

std::string format_log_line(const LogRecord& record) {
    using namespace std::chrono;

    auto since_epoch = record.time.time_since_epoch();
    auto millis = duration_cast<milliseconds>(since_epoch).count() % 1000;
    auto seconds = system_clock::to_time_t(record.time);

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    return std::format("{:02}:{:02}:{:02}.{:03} {} [{}] {}",
        local.tm_hour, local.tm_min, local.tm_sec, millis,
        log_level_name(record.level), record.logger_name, record.message);
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink()
    : m_out(std::cerr)
{
}

void ConsoleSink::write(const LogRecord& record) {
    m_out << format_log_line(record) << '\n';
}

void ConsoleSink::flush() {
    m_out.flush();
}

FileSink::FileSink(const std::string& path)
    : m_file(path, std::ios::out | std::ios::app)
{
}

void FileSink::write(const LogRecord& record) {
    if (m_file.is_open()) {
        m_file << format_log_line(record) << '\n';
    }
}

void FileSink::flush() {
    if (m_file.is_open()) {
        m_file.flush();
    }
}

void MemorySink::write(const LogRecord& record) {
    m_entries.push_back({record.level, std::string(record.logger_name), std::string(record.message)});
}

// ============================================================================
// Logger
// ============================================================================

bool Logger::should_log(LogLevel level) const {
    return level != LogLevel::Off && level >= m_level && level >= logging::level();
}

void Logger::log(LogLevel level, std::string_view message) {
    if (!should_log(level)) {
        return;
    }

    LogRecord record{level, m_name, message, std::chrono::system_clock::now()};

    auto& reg = registry();
    std::lock_guard lock(reg.mutex);
    for (auto& sink : reg.sinks) {
        sink->write(record);
    }
}

// ============================================================================
// logging::
// ============================================================================

namespace logging {

void init() {
    std::vector<std::unique_ptr<LogSink>> sinks;
    sinks.push_back(std::make_unique<ConsoleSink>());
    init(std::move(sinks));
}

void init(std::vector<std::unique_ptr<LogSink>> sinks) {
    auto& reg = registry();
    std::lock_guard lock(reg.mutex);
    if (reg.initialized) {
        return;
    }
    reg.sinks = std::move(sinks);
    reg.initialized = true;
}

void shutdown() {
    auto& reg = registry();
    std::lock_guard lock(reg.mutex);
    for (auto& sink : reg.sinks) {
        sink->flush();
    }
    reg.sinks.clear();
    reg.initialized = false;
}

void add_sink(std::unique_ptr<LogSink> sink) {
    auto& reg = registry();
    std::lock_guard lock(reg.mutex);
    reg.sinks.push_back(std::move(sink));
}

void set_level(LogLevel level) {
    registry().level = level;
}

LogLevel level() {
    return registry().level;
}

Logger& get(std::string_view name) {
    auto& reg = registry();
    std::lock_guard lock(reg.mutex);

    auto found = reg.loggers.find(name);
    if (found == reg.loggers.end()) {
        found = reg.loggers.emplace(std::string(name), Logger(name)).first;
    }
    return found->second;
}

void flush() {
    auto& reg = registry();
    std::lock_guard lock(reg.mutex);
    for (auto& sink : reg.sinks) {
        sink->flush();
    }
}

} // namespace logging

} // namespace stencil
