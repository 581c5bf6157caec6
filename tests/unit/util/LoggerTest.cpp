/**
 * @file LoggerTest.cpp
 * @brief Unit tests for util::Logger
 */

#include <gtest/gtest.h>

#include "fixtures/TestFixtures.hpp"
#include "util/Logger.hpp"

class LoggerTest : public TempDirFixture {
protected:
    void TearDown() override {
        util::Logger::instance().shutdown();
        util::Logger::instance().set_min_level(util::LogLevel::INFO);
        TempDirFixture::TearDown();
    }
};

TEST(LogLevelTest, ParseLogLevel_KnownNames) {
    EXPECT_EQ(util::parse_log_level("debug"), util::LogLevel::DEBUG);
    EXPECT_EQ(util::parse_log_level("INFO"), util::LogLevel::INFO);
    EXPECT_EQ(util::parse_log_level("Warn"), util::LogLevel::WARNING);
    EXPECT_EQ(util::parse_log_level("warning"), util::LogLevel::WARNING);
    EXPECT_EQ(util::parse_log_level("error"), util::LogLevel::ERROR);
    EXPECT_FALSE(util::parse_log_level("verbose").has_value());
}

TEST_F(LoggerTest, Initialize_WritesComponentLines) {
    auto& logger = util::Logger::instance();
    ASSERT_TRUE(logger.initialize(temp_dir / "logs", "test-app"));
    EXPECT_TRUE(logger.is_initialized());
    EXPECT_EQ(logger.get_log_file_path(), temp_dir / "logs" / "test-app.log");

    LOG_INFO("CopyEngine", "Selected Sequential");
    LOG_DEBUG("CopyEngine", "not written at info level");
    logger.flush();

    const auto content = ReadFile(temp_dir / "logs" / "test-app.log");
    EXPECT_NE(content.find("[INFO ] [CopyEngine] Selected Sequential"), std::string::npos);
    EXPECT_EQ(content.find("not written"), std::string::npos);
}

TEST_F(LoggerTest, SetMinLevel_FiltersLowerLevels) {
    auto& logger = util::Logger::instance();
    ASSERT_TRUE(logger.initialize(temp_dir, "levels", util::LogLevel::DEBUG));

    LOG_DEBUG("Test", "debug line");
    logger.set_min_level(util::LogLevel::ERROR);
    LOG_WARNING("Test", "warning line");
    LOG_ERROR("Test", "error line");
    logger.flush();

    const auto content = ReadFile(temp_dir / "levels.log");
    EXPECT_NE(content.find("debug line"), std::string::npos);
    EXPECT_EQ(content.find("warning line"), std::string::npos);
    EXPECT_NE(content.find("[ERROR] [Test] error line"), std::string::npos);
}

TEST_F(LoggerTest, Log_ExceedsSizeLimit_RotatesFiles) {
    auto& logger = util::Logger::instance();
    ASSERT_TRUE(logger.initialize(temp_dir, "rotating", util::LogLevel::INFO,
                                  util::LogRotationPolicy{.max_file_size_bytes = 512,
                                                          .max_files = 2}));

    const std::string payload(200, 'x');
    for (int i = 0; i < 20; ++i) {
        LOG_INFO("Test", payload);
    }
    logger.flush();

    EXPECT_TRUE(std::filesystem::exists(temp_dir / "rotating.log"));
    EXPECT_TRUE(std::filesystem::exists(temp_dir / "rotating.1.log"));
    EXPECT_TRUE(std::filesystem::exists(temp_dir / "rotating.2.log"));
    EXPECT_FALSE(std::filesystem::exists(temp_dir / "rotating.3.log"));
    EXPECT_LT(std::filesystem::file_size(temp_dir / "rotating.log"), 1024U);
}

TEST_F(LoggerTest, Log_BeforeInitialize_WritesNothing) {
    auto& logger = util::Logger::instance();
    logger.shutdown();
    EXPECT_FALSE(logger.is_initialized());
    EXPECT_TRUE(logger.get_log_file_path().empty());

    LOG_ERROR("Test", "goes nowhere");

    EXPECT_TRUE(std::filesystem::is_empty(temp_dir));
}
