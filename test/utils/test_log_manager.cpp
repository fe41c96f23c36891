#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include "common/utils/log_manager.hpp"

using namespace chatlive::utils;

namespace {
const std::string TEST_LOG_PATH = "test_chatlive.log";

std::string ReadFile(const std::string& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}
}  // namespace

class LogManagerTest : public ::testing::Test {
protected:
    void TearDown() override {
        spdlog::drop("test_file_logger");
        std::remove(TEST_LOG_PATH.c_str());
    }
};

TEST_F(LogManagerTest, GetLoggerReturnsSameInstance) {
    auto first = LogManager::GetLogger("test_shared");
    auto second = LogManager::GetLogger("test_shared");
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, second);
    EXPECT_EQ(first->name(), "test_shared");
}

TEST_F(LogManagerTest, LogToFile) {
    LogManager::SetLogToFile("test_file_logger", TEST_LOG_PATH);
    auto logger = LogManager::GetLogger("test_file_logger");
    logger->info("room {} swept", 42);
    logger->flush();

    auto content = ReadFile(TEST_LOG_PATH);
    EXPECT_NE(content.find("room 42 swept"), std::string::npos);
    EXPECT_NE(content.find("[test_file_logger]"), std::string::npos);
}

TEST_F(LogManagerTest, LoggingCanBeDisabled) {
    LogManager::SetLogToFile("test_file_logger", TEST_LOG_PATH);
    EXPECT_TRUE(LogManager::IsLoggingEnabled("test_file_logger"));

    LogManager::SetLoggingEnabled("test_file_logger", false);
    EXPECT_FALSE(LogManager::IsLoggingEnabled("test_file_logger"));
    auto logger = LogManager::GetLogger("test_file_logger");
    logger->info("hidden");
    logger->flush();
    EXPECT_EQ(ReadFile(TEST_LOG_PATH).find("hidden"), std::string::npos);

    LogManager::SetLoggingEnabled("test_file_logger", true);
    logger->info("visible");
    logger->flush();
    EXPECT_NE(ReadFile(TEST_LOG_PATH).find("visible"), std::string::npos);
}

TEST_F(LogManagerTest, SetLevelByName) {
    LogManager::SetLogLevel("warn", "test_level");
    EXPECT_EQ(LogManager::GetLogger("test_level")->level(), spdlog::level::warn);

    LogManager::SetLogLevel("debug", std::vector<std::string>{"test_level", "test_level_2"});
    EXPECT_EQ(LogManager::GetLogger("test_level")->level(), spdlog::level::debug);
    EXPECT_EQ(LogManager::GetLogger("test_level_2")->level(), spdlog::level::debug);
}

TEST_F(LogManagerTest, SwitchBackToConsole) {
    LogManager::SetLogToFile("test_file_logger", TEST_LOG_PATH);
    LogManager::SetLogToConsole("test_file_logger");
    auto logger = LogManager::GetLogger("test_file_logger");
    logger->info("to console");
    logger->flush();
    EXPECT_EQ(ReadFile(TEST_LOG_PATH).find("to console"), std::string::npos);
}
