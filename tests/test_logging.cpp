#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../src/core/Logging.h"
#include <sstream>
#include <thread>
#include <vector>
#include <iostream>

namespace secret_hunter {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Info);
        old_buf_ = std::cerr.rdbuf(captured_.rdbuf());
    }

    void TearDown() override {
        std::cerr.rdbuf(old_buf_);
        Logger::instance().set_level(LogLevel::Info);
    }

    std::string captured() const { return captured_.str(); }

    std::ostringstream captured_;
    std::streambuf* old_buf_ = nullptr;
};

TEST_F(LoggingTest, SingletonInstance) {
    Logger& logger1 = Logger::instance();
    Logger& logger2 = Logger::instance();
    EXPECT_EQ(&logger1, &logger2);
}

TEST_F(LoggingTest, DefaultLogLevel) {
    EXPECT_EQ(Logger::instance().level(), LogLevel::Info);
}

TEST_F(LoggingTest, SetLogLevel) {
    Logger& logger = Logger::instance();

    logger.set_level(LogLevel::Debug);
    EXPECT_EQ(logger.level(), LogLevel::Debug);

    logger.set_level(LogLevel::Error);
    EXPECT_EQ(logger.level(), LogLevel::Error);

    logger.set_level(LogLevel::Trace);
    EXPECT_EQ(logger.level(), LogLevel::Trace);
}

TEST_F(LoggingTest, MessagesCarryLevelPrefix) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Trace);
    logger.error("e");
    logger.warn("w");
    logger.info("i");
    logger.debug("d");
    logger.trace("t");
    EXPECT_EQ(captured(), "[ERROR] e\n[WARN] w\n[INFO] i\n[DEBUG] d\n[TRACE] t\n");
}

TEST_F(LoggingTest, MessagesAboveLevelAreDropped) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Warn);
    logger.info("not shown");
    logger.debug("not shown either");
    logger.warn("shown");
    EXPECT_EQ(captured(), "[WARN] shown\n");
}

TEST_F(LoggingTest, EnabledFollowsLevel) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Info);
    EXPECT_TRUE(logger.enabled(LogLevel::Error));
    EXPECT_TRUE(logger.enabled(LogLevel::Info));
    EXPECT_FALSE(logger.enabled(LogLevel::Debug));

    logger.set_level(LogLevel::Error);
    EXPECT_FALSE(logger.enabled(LogLevel::Warn));
}

TEST_F(LoggingTest, ParseLogLevel) {
    LogLevel lvl = LogLevel::Info;
    EXPECT_TRUE(parse_log_level("DEBUG", lvl));
    EXPECT_EQ(lvl, LogLevel::Debug);
    EXPECT_TRUE(parse_log_level("warning", lvl));
    EXPECT_EQ(lvl, LogLevel::Warn);
    EXPECT_TRUE(parse_log_level("trace", lvl));
    EXPECT_EQ(lvl, LogLevel::Trace);

    lvl = LogLevel::Error;
    EXPECT_FALSE(parse_log_level("loud", lvl));
    EXPECT_EQ(lvl, LogLevel::Error);
}

TEST_F(LoggingTest, ThreadSafety) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::Info);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < 50; ++i) logger.info("thread " + std::to_string(t));
        });
    }
    for (auto& th : threads) th.join();

    std::istringstream lines(captured());
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        EXPECT_THAT(line, ::testing::StartsWith("[INFO] thread "));
        ++count;
    }
    EXPECT_EQ(count, 200);
}

}
