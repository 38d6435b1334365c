/// @file test_logger.cpp
/// Unit tests for logger.hpp: logfmt rendering and level filtering.

#include "config.hpp"
#include "logger.hpp"

#include <gtest/gtest.h>
#include <sstream>
#include <string>

using namespace supercast;

// ============================================================================
// formatLogLine
// ============================================================================

TEST(FormatLogLine, PlainFields) {
    const std::string line = formatLogLine(LogLevel::Info, "hello",
                                           {{"method", "get"}, {"path", "/episodes"}});
    EXPECT_EQ(line, "level=info message=hello method=get path=/episodes");
}

TEST(FormatLogLine, QuotesValuesWithSpacesOrEquals) {
    const std::string line = formatLogLine(LogLevel::Error, "Supercast API error",
                                           {{"error_message", "a=b"}});
    EXPECT_EQ(line, "level=error message=\"Supercast API error\" error_message=\"a=b\"");
}

TEST(FormatLogLine, EscapesQuotesAndNewlines) {
    const std::string line = formatLogLine(LogLevel::Debug, "m",
                                           {{"body", "say \"hi\"\nbye"}});
    EXPECT_EQ(line, "level=debug message=m body=\"say \\\"hi\\\"\\nbye\"");
}

TEST(FormatLogLine, EmptyValuesAreOmitted) {
    const std::string line = formatLogLine(LogLevel::Info, "m",
                                           {{"account", ""}, {"status", "200"}});
    EXPECT_EQ(line, "level=info message=m status=200");
}

// ============================================================================
// log() filtering
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        mSaved = config();
        config().logSink = &mOut;
    }

    void TearDown() override { config() = mSaved; }

    std::ostringstream mOut;

private:
    Config mSaved;
};

TEST_F(LoggerTest, NoneSuppressesEverything) {
    config().logLevel = LogLevel::None;
    logError("boom");
    logInfo("hello");
    EXPECT_TRUE(mOut.str().empty());
}

TEST_F(LoggerTest, InfoLevelSkipsDebug) {
    config().logLevel = LogLevel::Info;
    logDebug("details");
    logInfo("Request to Supercast API", {{"method", "get"}});
    logError("oops");

    EXPECT_EQ(mOut.str(),
              "[Supercast] level=info message=\"Request to Supercast API\" method=get\n"
              "[Supercast] level=error message=oops\n");
}

TEST_F(LoggerTest, DebugLevelWritesAll) {
    config().logLevel = LogLevel::Debug;
    logDebug("a");
    logInfo("b");
    logError("c");

    EXPECT_EQ(mOut.str(),
              "[Supercast] level=debug message=a\n"
              "[Supercast] level=info message=b\n"
              "[Supercast] level=error message=c\n");
}

TEST_F(LoggerTest, ErrorLevelOnlyErrors) {
    config().logLevel = LogLevel::Error;
    logInfo("b");
    logError("c");
    EXPECT_EQ(mOut.str(), "[Supercast] level=error message=c\n");
}

TEST_F(LoggerTest, NoneRecordIsNeverWritten) {
    config().logLevel = LogLevel::Debug;
    log(LogLevel::None, "never");
    EXPECT_TRUE(mOut.str().empty());
}
