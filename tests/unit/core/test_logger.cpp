#include <gtest/gtest.h>
#include "stencil/core/logger.hpp"
#include "support/log_capture.hpp"
#include <sstream>

using namespace stencil;

// ============================================================================
// Level names
// ============================================================================

TEST(LogLevelTest, Names) {
    EXPECT_EQ(log_level_name(LogLevel::Trace), "TRACE");
    EXPECT_EQ(log_level_name(LogLevel::Warn), "WARN");
    EXPECT_EQ(log_level_name(LogLevel::Off), "OFF");
}

TEST(LogLevelTest, ParseIgnoresCase) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("ERROR"), LogLevel::Error);
    EXPECT_EQ(parse_log_level("Warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
}

TEST(LogLevelTest, ParseRejectsUnknownNames) {
    EXPECT_EQ(parse_log_level("verbose"), std::nullopt);
    EXPECT_EQ(parse_log_level(""), std::nullopt);
}

// ============================================================================
// Loggers and sinks
// ============================================================================

class LoggerTest : public stencil::testing::LogCaptureTest {};

TEST_F(LoggerTest, NamedLoggerRecordsItsName) {
    logging::get("stencil.test").info("hello");

    ASSERT_EQ(records().size(), 1u);
    EXPECT_EQ(records()[0].level, LogLevel::Info);
    EXPECT_EQ(records()[0].logger_name, "stencil.test");
    EXPECT_EQ(records()[0].message, "hello");
}

TEST_F(LoggerTest, SameNameReturnsSameLogger) {
    auto& a = logging::get("stencil.same");
    auto& b = logging::get("stencil.same");
    EXPECT_EQ(&a, &b);
}

TEST_F(LoggerTest, FormatsArguments) {
    logging::get("stencil.test").debug_fmt("{} of {}", 3, "four");

    ASSERT_EQ(records().size(), 1u);
    EXPECT_EQ(records()[0].message, "3 of four");
}

TEST_F(LoggerTest, GlobalLevelFilters) {
    logging::set_level(LogLevel::Warn);

    auto& logger = logging::get("stencil.test");
    logger.debug("dropped");
    logger.info("dropped");
    logger.warn("kept");
    logger.error("kept");

    EXPECT_EQ(records().size(), 2u);
    EXPECT_FALSE(logged("dropped"));
}

TEST_F(LoggerTest, LoggerLevelFilters) {
    auto& logger = logging::get("stencil.quiet");
    logger.set_level(LogLevel::Error);
    logger.warn("dropped");
    logger.error("kept");
    logger.set_level(LogLevel::Trace);

    ASSERT_EQ(records().size(), 1u);
    EXPECT_EQ(records()[0].message, "kept");
}

TEST_F(LoggerTest, OffSilencesEverything) {
    logging::set_level(LogLevel::Off);
    logging::get("stencil.test").fatal("dropped");

    EXPECT_TRUE(records().empty());
}

// ============================================================================
// Line format
// ============================================================================

TEST(LogLineTest, ConsoleSinkWritesLevelLoggerAndMessage) {
    std::ostringstream out;
    ConsoleSink sink(out);

    sink.write(LogRecord{LogLevel::Warn, "stencil.compiler", "replacing tag library", std::chrono::system_clock::now()});

    auto line = out.str();
    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');
    EXPECT_NE(line.find(" WARN [stencil.compiler] replacing tag library"), std::string::npos);
    // HH:MM:SS.mmm prefix
    EXPECT_EQ(line[2], ':');
    EXPECT_EQ(line[8], '.');
}

TEST(LogLineTest, FileSinkReportsUnopenablePath) {
    FileSink sink("/nonexistent-directory/stencil.log");
    EXPECT_FALSE(sink.is_open());
    sink.write(LogRecord{LogLevel::Info, "x", "ignored", std::chrono::system_clock::now()});
}
