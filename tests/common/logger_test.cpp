// =============================================================================
// swiss-uid - Logger Level Tests
// =============================================================================
// Level selection only; these tests never start the Quill backend.
// =============================================================================

#include "suid/common/logger.h"

#include <gtest/gtest.h>

namespace suid::log {
namespace {

TEST(LoggerLevelTest, ParsesNamesIgnoringCase) {
    EXPECT_EQ(levelFromString("debug"), Level::kDebug);
    EXPECT_EQ(levelFromString("WARNING"), Level::kWarning);
    EXPECT_EQ(levelFromString("warn"), Level::kWarning);
    EXPECT_EQ(levelFromString("Fatal"), Level::kCritical);
    EXPECT_FALSE(levelFromString("loud").has_value());
    EXPECT_FALSE(levelFromString("").has_value());
}

TEST(LoggerLevelTest, CanonicalNames) {
    for (auto level : {Level::kTrace, Level::kDebug, Level::kInfo, Level::kWarning, Level::kError,
                       Level::kCritical}) {
        EXPECT_EQ(levelFromString(levelToString(level)), level);
    }
    EXPECT_EQ(levelToString(Level::kWarning), "warning");
    EXPECT_EQ(levelToString(Level::kCritical), "critical");
}

TEST(LoggerLevelTest, VerbosityFlags) {
    EXPECT_EQ(levelForVerbosity(0, false), Level::kWarning);
    EXPECT_EQ(levelForVerbosity(1, false), Level::kDebug);
    EXPECT_EQ(levelForVerbosity(3, false), Level::kTrace);
    EXPECT_EQ(levelForVerbosity(2, true), Level::kError);
}

TEST(LoggerLevelTest, QuillMapping) {
    EXPECT_EQ(toQuillLevel(Level::kTrace), quill::LogLevel::TraceL1);
    EXPECT_EQ(toQuillLevel(Level::kError), quill::LogLevel::Error);
}

TEST(LoggerConfigTest, ConsoleDefaultsToStderr) {
    const Config config;
    EXPECT_EQ(config.consoleStream, "stderr");
    EXPECT_EQ(config.level, Level::kWarning);
    EXPECT_TRUE(config.logFile.empty());
}

TEST(LoggerLevelTest, NotInitializedByDefault) {
    EXPECT_FALSE(isInitialized());
    EXPECT_EQ(logger(), nullptr);
    EXPECT_NO_THROW(flush());
    EXPECT_NO_THROW(shutdown());
}

}  // namespace
}  // namespace suid::log
