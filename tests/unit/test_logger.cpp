#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

#include "Logger.h"
#include "LoggerMacros.h"

namespace fs = std::filesystem;
using namespace BlockSync;

TEST(LoggerTest, Singleton) {
    Logger& logger1 = Logger::instance();
    Logger& logger2 = Logger::instance();
    EXPECT_EQ(&logger1, &logger2);
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_TRUE(parseLogLevel("debug") == LogLevel::DEBUG);
    EXPECT_TRUE(parseLogLevel("INFO") == LogLevel::INFO);
    EXPECT_TRUE(parseLogLevel("warning") == LogLevel::WARN);
    EXPECT_TRUE(parseLogLevel("Error") == LogLevel::ERROR);
    EXPECT_TRUE(parseLogLevel("critical") == LogLevel::CRITICAL);
    EXPECT_FALSE(parseLogLevel("verbose").has_value());
}

TEST(LoggerTest, FileLoggingHonorsLevel) {
    fs::path logFile = fs::temp_directory_path() / ("blocksync_log_" + std::to_string(::getpid()) + ".txt");
    fs::remove(logFile);

    Logger& logger = Logger::instance();
    logger.setConsoleOutput(false);
    logger.setLogFile(logFile.string());
    logger.setLevel(LogLevel::INFO);
    EXPECT_FALSE(logger.isDebugEnabled());
    EXPECT_TRUE(logger.isEnabled(LogLevel::WARN));

    logger.debug("Hidden debug message");
    logger.info("Test info message", "LoggerTest");
    logger.error("Test error message");
    LOG_DEBUG_COMP_IF("Hidden macro message", "LoggerTest");
    LOG_INFO_COMP_IF("Macro info message", "LoggerTest");

    std::ifstream file(logFile);
    ASSERT_TRUE(file.is_open());

    std::string line;
    bool foundInfo = false;
    bool foundError = false;
    bool foundDebug = false;
    bool foundMacro = false;
    while (std::getline(file, line)) {
        if (line.find("Test info message") != std::string::npos) {
            foundInfo = true;
            EXPECT_NE(line.find("[INFO] [LoggerTest]"), std::string::npos);
        }
        if (line.find("Test error message") != std::string::npos) foundError = true;
        if (line.find("Hidden") != std::string::npos) foundDebug = true;
        if (line.find("Macro info message") != std::string::npos) foundMacro = true;
    }
    EXPECT_TRUE(foundInfo);
    EXPECT_TRUE(foundError);
    EXPECT_FALSE(foundDebug);
    EXPECT_TRUE(foundMacro);

    logger.setLogFile("/dev/null");
    logger.setConsoleOutput(true);
    fs::remove(logFile);
}
