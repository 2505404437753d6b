// =============================================================================
// byteseq - Logger Tests
// =============================================================================

#include "byteseq/common/logger.h"

#include <gtest/gtest.h>

#include <filesystem>

namespace byteseq::log {
namespace {

TEST(LoggerTest, LevelRoundTripsThroughString) {
    for (const Level level : {Level::kTrace, Level::kDebug, Level::kInfo, Level::kWarning,
                              Level::kError, Level::kCritical}) {
        EXPECT_EQ(levelFromString(levelToString(level)), level);
    }
}

TEST(LoggerTest, LevelFromStringIsCaseInsensitiveWithAliases) {
    EXPECT_EQ(levelFromString("DEBUG"), Level::kDebug);
    EXPECT_EQ(levelFromString("warn"), Level::kWarning);
    EXPECT_EQ(levelFromString("fatal"), Level::kCritical);
    EXPECT_EQ(levelFromString("nonsense"), Level::kInfo);
}

TEST(LoggerTest, QuillLevelMapping) {
    EXPECT_EQ(toQuillLevel(Level::kTrace), quill::LogLevel::TraceL1);
    EXPECT_EQ(toQuillLevel(Level::kWarning), quill::LogLevel::Warning);
    EXPECT_EQ(toQuillLevel(Level::kCritical), quill::LogLevel::Critical);
}

TEST(LoggerTest, MacrosAreNoOpsBeforeInit) {
    ASSERT_FALSE(isInitialized());
    EXPECT_EQ(logger(), nullptr);
    BSEQ_LOG_INFO("dropped {}", 1);
    BSEQ_LOG_ERROR("dropped");
    flush();
}

TEST(LoggerTest, InitWritesToFileAndShutsDown) {
    const auto path = std::filesystem::temp_directory_path() / "byteseq_logger_test.log";
    std::filesystem::remove(path);

    Config config;
    config.logFile = path.string();
    config.level = Level::kDebug;
    config.enableConsole = false;
    init(config);

    ASSERT_TRUE(isInitialized());
    ASSERT_NE(logger(), nullptr);
    BSEQ_LOG_DEBUG("logger test {}", 42);
    flush();
    EXPECT_TRUE(std::filesystem::exists(path));

    shutdown();
    EXPECT_FALSE(isInitialized());
    EXPECT_EQ(logger(), nullptr);
    std::filesystem::remove(path);
}

}  // namespace
}  // namespace byteseq::log
