// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "wsgate/log/logger.hpp"
#include "wsgate/log/spdlog_logger.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>

using namespace wsgate;

namespace {

std::string read_file(const std::string& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Basic Functionality Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger respects minimum log level", "[log][spdlog]") {
    auto logger = make_spdlog_console_logger(LogLevel::Warn);

    REQUIRE_FALSE(logger->should_log(LogLevel::Trace));
    REQUIRE_FALSE(logger->should_log(LogLevel::Debug));
    REQUIRE_FALSE(logger->should_log(LogLevel::Info));
    REQUIRE(logger->should_log(LogLevel::Warn));
    REQUIRE(logger->should_log(LogLevel::Error));
    REQUIRE(logger->should_log(LogLevel::Fatal));

    SECTION("level changes reach the spdlog logger") {
        logger->set_level(LogLevel::Debug);
        REQUIRE(logger->level() == LogLevel::Debug);
        REQUIRE(logger->should_log(LogLevel::Debug));
        REQUIRE(logger->get_spdlog_logger()->level() == spdlog::level::debug);
    }
}

TEST_CASE("SpdlogLogger level mapping", "[log][spdlog]") {
    REQUIRE(SpdlogLogger::to_spdlog_level(LogLevel::Error) == spdlog::level::err);
    REQUIRE(SpdlogLogger::to_spdlog_level(LogLevel::Fatal) == spdlog::level::critical);
    REQUIRE(SpdlogLogger::to_spdlog_level(LogLevel::Off) == spdlog::level::off);
    REQUIRE(SpdlogLogger::from_spdlog_level(spdlog::level::warn) == LogLevel::Warn);
    REQUIRE(SpdlogLogger::from_spdlog_level(spdlog::level::trace) == LogLevel::Trace);
}

TEST_CASE("SpdlogLogger wraps an existing spdlog logger", "[log][spdlog]") {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    auto inner = std::make_shared<spdlog::logger>("wsgate_wrap_test", sink);
    inner->set_level(spdlog::level::warn);
    inner->set_pattern("%l|%v");

    SpdlogLogger logger(inner);
    REQUIRE(logger.level() == LogLevel::Warn);

    logger.info("hidden");
    logger.warn("shown");
    logger.flush();

    const std::string content = out.str();
    REQUIRE(content.find("hidden") == std::string::npos);
    REQUIRE(content.find("warning|shown") != std::string::npos);
}

TEST_CASE("SpdlogLogger rejects a null spdlog logger", "[log][spdlog]") {
    REQUIRE_THROWS_AS(SpdlogLogger(std::shared_ptr<spdlog::logger>{}), std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════════════════════
// File Logging Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger file logger respects log level", "[log][spdlog][file]") {
    const std::string test_file = "wsgate_spdlog_level.log";
    std::filesystem::remove(test_file);

    {
        auto logger = make_spdlog_file_logger(test_file, LogLevel::Warn);
        logger->debug("This should not appear");
        logger->info("This should not appear");
        logger->warn("This should appear");
        logger->error("This should appear");
        logger->flush();
    }

    const std::string content = read_file(test_file);
    REQUIRE(content.find("This should not appear") == std::string::npos);
    REQUIRE(content.find("This should appear") != std::string::npos);

    std::filesystem::remove(test_file);
}

TEST_CASE("SpdlogLogger can set custom pattern", "[log][spdlog][pattern]") {
    const std::string test_file = "wsgate_spdlog_pattern.log";
    std::filesystem::remove(test_file);

    {
        auto logger = make_spdlog_file_logger(test_file, LogLevel::Info);
        logger->set_pattern("%v");
        logger->info("Simple message");
        logger->flush();
    }

    REQUIRE(read_file(test_file) == "Simple message\n");

    std::filesystem::remove(test_file);
}

// ═══════════════════════════════════════════════════════════════════════════
// Async Logging Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger async console logger works", "[log][spdlog][async]") {
    auto logger = make_spdlog_async_console_logger(LogLevel::Info, 128);
    REQUIRE(logger != nullptr);
    REQUIRE(logger->should_log(LogLevel::Info));
    REQUIRE_FALSE(logger->should_log(LogLevel::Debug));

    for (int i = 0; i < 10; ++i) {
        logger->info("Async message");
    }
    logger->flush();
}

// ═══════════════════════════════════════════════════════════════════════════
// Integration with Global Logger
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger receives library log macros", "[log][spdlog][integration]") {
    const std::string test_file = "wsgate_spdlog_global.log";
    std::filesystem::remove(test_file);

    {
        auto logger = make_spdlog_file_logger(test_file, LogLevel::Info);
        auto* spdlog_ptr = logger.get();
        set_logger(std::move(logger));

        WSGATE_LOG_INFO("Connection #{} connected", 7);
        WSGATE_LOG_DEBUG("filtered {}", 1);

        spdlog_ptr->flush();
        set_logger(nullptr);
    }

    const std::string content = read_file(test_file);
    REQUIRE(content.find("Connection #7 connected") != std::string::npos);
    REQUIRE(content.find("filtered") == std::string::npos);
    // Call site of the macro, not the logger implementation
    REQUIRE(content.find("spdlog_logger_test.cpp") != std::string::npos);

    std::filesystem::remove(test_file);
}
