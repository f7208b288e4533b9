/**
 * @file test_logger.cpp
 * @brief Thread-safety and file output validation for the logging system
 *
 * Tests:
 * 1. Timestamped log file creation in a fresh directory
 * 2. Level filtering and problem counting
 * 3. Component-tagged stream logging
 * 4. Concurrent logging from multiple threads (GUI + gesture worker pattern)
 * 5. Appending to an explicit log file
 */

#include <gtest/gtest.h>
#include <airchord/core/Logger.hpp>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace airchord::core;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / "airchord_test_logs";
        std::error_code ec;
        fs::remove_all(dir_, ec);

        auto& logger = Logger::getInstance();
        ASSERT_TRUE(logger.initializeWithTimestamp(dir_.string(), LogLevel::DEBUG));
        logger.setConsoleOutput(false);
    }

    void TearDown() override {
        auto& logger = Logger::getInstance();
        logger.closeLogFile();
        logger.setConsoleOutput(true);
        logger.setLevel(LogLevel::INFO);
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    static std::string readLog() {
        Logger::getInstance().flush();
        std::ifstream file(Logger::getInstance().getCurrentLogFile());
        std::stringstream content;
        content << file.rdbuf();
        return content.str();
    }

    fs::path dir_;
};

TEST_F(LoggerTest, CreatesTimestampedFile) {
    std::string logFile = Logger::getInstance().getCurrentLogFile();
    ASSERT_FALSE(logFile.empty());
    EXPECT_TRUE(fs::exists(logFile));
    EXPECT_EQ(fs::path(logFile).parent_path(), dir_);

    std::string name = fs::path(logFile).filename().string();
    EXPECT_EQ(name.rfind("airchord_", 0), 0u);
    EXPECT_EQ(fs::path(logFile).extension(), ".log");
}

TEST_F(LoggerTest, WritesMessagesWithLevelAndSource) {
    LOG_INFO("chord table loaded");
    LOG_ERROR("camera lost");

    std::string content = readLog();
    EXPECT_NE(content.find("[INFO] chord table loaded"), std::string::npos);
    EXPECT_NE(content.find("[ERROR] camera lost"), std::string::npos);
    EXPECT_NE(content.find("test_logger.cpp:"), std::string::npos);
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
    auto& logger = Logger::getInstance();
    logger.setLevel(LogLevel::WARNING);
    EXPECT_EQ(logger.getLevel(), LogLevel::WARNING);

    logger.debug("hidden debug line");
    logger.info("hidden info line");
    logger.warning("visible warning line");

    std::string content = readLog();
    EXPECT_EQ(content.find("hidden debug line"), std::string::npos);
    EXPECT_EQ(content.find("hidden info line"), std::string::npos);
    EXPECT_NE(content.find("visible warning line"), std::string::npos);
}

TEST_F(LoggerTest, CountsProblems) {
    auto& logger = Logger::getInstance();
    size_t before = logger.getProblemCount();

    logger.info("fine");
    logger.warning("first problem");
    logger.critical("second problem");

    EXPECT_EQ(logger.getProblemCount(), before + 2);
}

TEST_F(LoggerTest, StreamLoggingTagsComponent) {
    AIRCHORD_LOG_INFO("Dispatcher") << "Start chord " << 3;

    std::string content = readLog();
    EXPECT_NE(content.find("[Dispatcher] Start chord 3"), std::string::npos);
}

TEST_F(LoggerTest, LevelNames) {
    EXPECT_EQ(Logger::levelFromString("debug"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::levelFromString("WARN"), LogLevel::WARNING);
    EXPECT_EQ(Logger::levelFromString("Critical"), LogLevel::CRITICAL);
    EXPECT_EQ(Logger::levelFromString("nonsense"), LogLevel::INFO);
    EXPECT_EQ(Logger::levelToString(LogLevel::ERROR), "ERROR");
}

TEST_F(LoggerTest, ConcurrentLoggingKeepsEveryLine) {
    const int numThreads = 4;
    const int messagesPerThread = 200;
    std::atomic<int> totalMessages{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([t, messagesPerThread, &totalMessages]() {
            for (int i = 0; i < messagesPerThread; ++i) {
                AIRCHORD_LOG_DEBUG("Thread" + std::to_string(t)) << "message " << i;
                ++totalMessages;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(totalMessages.load(), numThreads * messagesPerThread);

    std::istringstream content(readLog());
    std::string line;
    int logged = 0;
    while (std::getline(content, line)) {
        if (line.find("[DEBUG] [Thread") != std::string::npos) {
            ++logged;
        }
    }
    EXPECT_EQ(logged, numThreads * messagesPerThread);
}

TEST_F(LoggerTest, CloseStopsFileOutput) {
    auto& logger = Logger::getInstance();
    std::string logFile = logger.getCurrentLogFile();
    logger.closeLogFile();
    EXPECT_TRUE(logger.getCurrentLogFile().empty());

    logger.info("after close");
    std::ifstream file(logFile);
    std::stringstream content;
    content << file.rdbuf();
    EXPECT_EQ(content.str().find("after close"), std::string::npos);
}

TEST_F(LoggerTest, ExplicitLogFileAppends) {
    auto& logger = Logger::getInstance();
    fs::path path = dir_ / "headless.log";
    {
        std::ofstream existing(path);
        existing << "earlier run" << std::endl;
    }

    ASSERT_TRUE(logger.setLogFile(path.string()));
    EXPECT_EQ(logger.getCurrentLogFile(), path.string());
    logger.info("second run");

    std::string content = readLog();
    EXPECT_NE(content.find("earlier run"), std::string::npos);
    EXPECT_NE(content.find("[INFO] second run"), std::string::npos);
}

TEST_F(LoggerTest, ExplicitLogFileInMissingDirectoryFails) {
    auto& logger = Logger::getInstance();
    EXPECT_FALSE(logger.setLogFile((dir_ / "missing" / "x.log").string()));
    EXPECT_TRUE(logger.getCurrentLogFile().empty());
}
