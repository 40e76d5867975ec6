#include <gtest/gtest.h>
#include "test_support.hpp"
#include "utils/logging.hpp"

namespace {

using runbox::testing::LogCapture;
using runbox::utils::FormatLogMessage;
using runbox::utils::LogLevel;
using runbox::utils::LogMessage;
using runbox::utils::ParseLogLevel;

TEST(LoggingTest, FormatsTagLevelAndSortedFields) {
    const LogMessage warn{LogLevel::kWarn, "docker", "failed to remove container",
                          {{"id", "c1"}, {"error", "timeout"}}};
    EXPECT_EQ(FormatLogMessage(warn), "[docker] WARNING: failed to remove container error=timeout id=c1");

    const LogMessage info{LogLevel::kInfo, "sandbox", "runner selected", {}};
    EXPECT_EQ(FormatLogMessage(info), "[sandbox] runner selected");

    const LogMessage error{LogLevel::kError, "host", "boom", {}};
    EXPECT_EQ(FormatLogMessage(error), "[host] ERROR: boom");
}

TEST(LoggingTest, ParsesLevelNames) {
    EXPECT_EQ(ParseLogLevel("DEBUG", LogLevel::kInfo), LogLevel::kDebug);
    EXPECT_EQ(ParseLogLevel("warning", LogLevel::kInfo), LogLevel::kWarn);
    EXPECT_EQ(ParseLogLevel("error", LogLevel::kInfo), LogLevel::kError);
    EXPECT_EQ(ParseLogLevel("verbose", LogLevel::kInfo), LogLevel::kInfo);
}

TEST(LoggingTest, DropsMessagesBelowMinimumLevel) {
    LogCapture logs;
    runbox::utils::SetLogConfig(runbox::utils::LogConfig{LogLevel::kWarn});
    runbox::utils::Log(LogLevel::kInfo, "test", "quiet");
    runbox::utils::LogWarn("test", "loud");
    EXPECT_EQ(logs.Count(LogLevel::kInfo), 0u);
    EXPECT_TRUE(logs.Contains(LogLevel::kWarn, "loud"));
}

}  // namespace
