#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace wsgate {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Frame-level detail (every message sent/received)
    Debug = 1,  // State transitions, dropped frames
    Info  = 2,  // Connections, sessions, retries
    Warn  = 3,  // Recoverable failures (disconnects, keepalive expiry)
    Error = 4,  // Terminal failures
    Fatal = 5,  // Unrecoverable
    Off   = 6   // Disable all logging
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
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

// ─────────────────────────────────────────────────────────────────────────────
// Log Record - Immutable snapshot of a log event
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface - Swappable logging backend
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    // Check if a level would be logged (for avoiding expensive formatting)
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, msg, loc);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, msg, loc);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, msg, loc);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, msg, loc);
    }

private:
    void write(LogLevel level, std::string_view msg, std::source_location loc) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - Discards all logs (default)
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger - Outputs to stderr with colors
// ─────────────────────────────────────────────────────────────────────────────

class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    void set_level(LogLevel level) noexcept {
        min_level_ = level;
    }

    [[nodiscard]] LogLevel level() const noexcept {
        return min_level_;
    }

    void set_colors_enabled(bool enabled) noexcept {
        colors_enabled_ = enabled;
    }

private:
    LogLevel min_level_;
    bool colors_enabled_ = true;
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

// Get the global logger instance (defaults to NullLogger)
[[nodiscard]] ILogger& get_logger() noexcept;

// Set a new global logger (nullptr restores the NullLogger)
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// Logging macros taking std::format arguments. The format arguments are only
// evaluated when the level is enabled.
//
//   WSGATE_LOG_INFO("Connection #{} connected", attempt_id);

#define WSGATE_LOG_AT(level, ...)                                                   \
    do {                                                                            \
        ::wsgate::ILogger& wsgate_logger_ref_ = ::wsgate::get_logger();             \
        if (wsgate_logger_ref_.should_log(level)) {                                 \
            wsgate_logger_ref_.log(::wsgate::LogRecord(                             \
                level, std::format(__VA_ARGS__), std::source_location::current())); \
        }                                                                           \
    } while (false)

#define WSGATE_LOG_TRACE(...) WSGATE_LOG_AT(::wsgate::LogLevel::Trace, __VA_ARGS__)
#define WSGATE_LOG_DEBUG(...) WSGATE_LOG_AT(::wsgate::LogLevel::Debug, __VA_ARGS__)
#define WSGATE_LOG_INFO(...)  WSGATE_LOG_AT(::wsgate::LogLevel::Info, __VA_ARGS__)
#define WSGATE_LOG_WARN(...)  WSGATE_LOG_AT(::wsgate::LogLevel::Warn, __VA_ARGS__)
#define WSGATE_LOG_ERROR(...) WSGATE_LOG_AT(::wsgate::LogLevel::Error, __VA_ARGS__)

}  // namespace wsgate
