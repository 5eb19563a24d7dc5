#include "wsgate/log/logger.hpp"

#include <ctime>
#include <iostream>
#include <mutex>

namespace wsgate {

namespace {

constexpr std::string_view kReset = "\033[0m";
constexpr std::string_view kGray  = "\033[90m";
constexpr std::string_view kBold  = "\033[1m";

[[nodiscard]] std::string_view level_color(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35m";
        case LogLevel::Off:   return kReset;
    }
    return kReset;
}

// HH:MM:SS.mmm in local time
[[nodiscard]] std::string format_clock(const std::chrono::system_clock::time_point& tp) {
    const auto seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    return std::format("{:02}:{:02}:{:02}.{:03}", local.tm_hour, local.tm_min, local.tm_sec, millis);
}

[[nodiscard]] std::string_view basename_of(const char* path) noexcept {
    const std::string_view full(path);
    const auto slash = full.find_last_of("/\\");
    if (slash == std::string_view::npos) {
        return full;
    }
    return full.substr(slash + 1);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────

void ConsoleLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }

    std::string line;
    if (colors_enabled_) {
        line = std::format(
            "{}{}{} {}{}{:<5}{} {}{}:{}{} {}\n",
            kGray, format_clock(record.timestamp), kReset,
            kBold, level_color(record.level), to_string(record.level), kReset,
            kGray, basename_of(record.location.file_name()), record.location.line(), kReset,
            record.message
        );
    } else {
        line = std::format(
            "{} {:<5} {}:{} {}\n",
            format_clock(record.timestamp),
            to_string(record.level),
            basename_of(record.location.file_name()),
            record.location.line(),
            record.message
        );
    }

    static std::mutex output_mutex;
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << line;
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::unique_ptr<ILogger>& logger_slot() {
    static std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
    return instance;
}

std::mutex& logger_slot_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_slot_mutex());
    return *logger_slot();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(logger_slot_mutex());
    if (logger == nullptr) {
        logger_slot() = std::make_unique<NullLogger>();
        return;
    }
    logger_slot() = std::move(logger);
}

}  // namespace wsgate
