#include "common/logging.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
namespace filewarden {
namespace common {
namespace tests {

using ::filewarden::tests::read_text_file;

class LoggingTest : public ::testing::Test {
  protected:
    void SetUp() override
    {
        log_dir = fs::temp_directory_path() /
                  (std::string("filewarden_logging_") +
                   ::testing::UnitTest::GetInstance()
                       ->current_test_info()
                       ->name());
        std::error_code ec;
        fs::remove_all(log_dir, ec);
        fs::create_directory(log_dir);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(log_dir, ec);
    }

    LoggingConfig file_only_config(LogLevel level)
    {
        LoggingConfig config;
        config.console_logging = false;
        config.file_logging = true;
        config.level = level;
        config.log_file_path = (log_dir / "test.log").string();
        return config;
    }

    std::string log_contents()
    {
        return read_text_file(log_dir / "test.log");
    }

    fs::path log_dir;
};

TEST_F(LoggingTest, ComponentLoggersShareFileSink)
{
    ASSERT_TRUE(initialize_logging(file_only_config(LogLevel::DEBUG)));

    auto logger = get_logger("FileSystemManager");
    logger->info("Copied a to b");
    logger->debug("details");
    logger->flush();

    const std::string content = log_contents();
    EXPECT_NE(content.find(" - FileSystemManager - info - Copied a to b"),
              std::string::npos);
    EXPECT_NE(content.find(" - FileSystemManager - debug - details"),
              std::string::npos);
}

TEST_F(LoggingTest, FileLevelFiltersMessages)
{
    ASSERT_TRUE(initialize_logging(file_only_config(LogLevel::WARN)));

    auto logger = get_logger("Shell");
    logger->info("quiet");
    logger->warn("loud");
    logger->flush();

    const std::string content = log_contents();
    EXPECT_EQ(content.find("quiet"), std::string::npos);
    EXPECT_NE(content.find(" - Shell - warning - loud"), std::string::npos);
}

TEST_F(LoggingTest, GetLoggerReturnsSameInstance)
{
    ASSERT_TRUE(initialize_logging(file_only_config(LogLevel::INFO)));

    auto first = get_logger("ResultFormatter");
    auto second = get_logger("ResultFormatter");
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->name(), "ResultFormatter");
    EXPECT_EQ(get_logger(), spdlog::default_logger());
}

TEST(LogLevelTest, StringConversion)
{
    EXPECT_EQ(log_level_to_string(LogLevel::DEBUG), "debug");
    EXPECT_EQ(log_level_to_string(LogLevel::CRITICAL), "critical");

    EXPECT_EQ(log_level_from_string("info"), LogLevel::INFO);
    EXPECT_EQ(log_level_from_string("WARN"), LogLevel::WARN);
    EXPECT_EQ(log_level_from_string("off"), LogLevel::OFF);
    EXPECT_FALSE(log_level_from_string("verbose").has_value());
}

} // namespace tests
} // namespace common
} // namespace filewarden
