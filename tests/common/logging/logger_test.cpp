// File: tests/common/logging/logger_test.cpp

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "common/logging/logger.hpp"

using common::logging::Logger;
using common::logging::LoggerSettings;

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path root;

    void SetUp() override {
        root = std::filesystem::temp_directory_path() /
               ("rangefinder_logger_test_" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()));
        std::filesystem::remove_all(root);
    }

    void TearDown() override {
        LoggerSettings quiet;
        quiet.file_sink = false;
        Logger::configure(quiet);
        std::filesystem::remove_all(root);
    }

    [[nodiscard]] LoggerSettings settingsIn(const std::string &directory, const bool file_sink) const {
        LoggerSettings settings;
        settings.directory = (root / directory).string();
        settings.filename = "ranging.log";
        settings.file_sink = file_sink;
        return settings;
    }
};

TEST_F(LoggerTest, FileSinkFollowsLateConfiguration) {
    // Something has already logged with whatever sinks were active.
    LOG_INFO("Logger already in use before configuration");

    const LoggerSettings settings = settingsIn("with_file", true);
    Logger::configure(settings);
    LOG_INFO("written to the configured file");
    Logger::getLogger()->flush();

    const auto file = std::filesystem::path(settings.directory) / settings.filename;
    ASSERT_TRUE(std::filesystem::exists(file));
    std::ifstream stream(file);
    std::stringstream contents;
    contents << stream.rdbuf();
    EXPECT_NE(contents.str().find("written to the configured file"), std::string::npos);
}

TEST_F(LoggerTest, DisabledFileSinkCreatesNoFile) {
    LOG_INFO("Logger already in use before configuration");

    const LoggerSettings settings = settingsIn("without_file", false);
    Logger::configure(settings);
    LOG_INFO("console only");
    Logger::getLogger()->flush();

    EXPECT_FALSE(std::filesystem::exists(settings.directory));
}

TEST_F(LoggerTest, LevelChangesKeepTheSinks) {
    const LoggerSettings settings = settingsIn("levels", true);
    Logger::configure(settings);
    const auto logger = Logger::getLogger();

    LoggerSettings quieter = settings;
    quieter.level = "error";
    Logger::configure(quieter);

    EXPECT_EQ(Logger::getLogger(), logger);
    EXPECT_EQ(Logger::getLogger()->level(), spdlog::level::err);
}

TEST(LoggerLevelTest, UnknownLevelFallsBackToInfo) {
    EXPECT_EQ(Logger::getLogLevel("debug"), spdlog::level::debug);
    EXPECT_EQ(Logger::getLogLevel("verbose"), spdlog::level::info);
}
