// test/unit/test_util.cpp
// -----------------------------------------------------------
// ThreadPool and logger behavior the engine relies on.

#include <gtest/gtest.h>

#include <atomic>
#include <cstdio>
#include <fstream>
#include <future>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "util/logger.hpp"
#include "util/thread_pool.hpp"

namespace logger = piiguard::util::logger;
using piiguard::util::ThreadPool;

TEST(ThreadPoolTest, RunsEveryTaskAndKeepsResults) {
    std::atomic<int> ran{0};
    std::vector<std::future<int>> results;
    {
        ThreadPool pool(3);
        EXPECT_EQ(pool.size(), (size_t)3);
        for (int i = 0; i < 50; ++i) {
            results.push_back(pool.enqueue([&ran](int x) { ++ran; return x * x; }, i));
        }
    }
    EXPECT_EQ(ran.load(), 50);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, ExceptionsReachTheFuture) {
    ThreadPool pool(1);
    auto failing = pool.enqueue([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(failing.get(), std::runtime_error);

    // The worker survives a throwing task
    EXPECT_EQ(pool.enqueue([] { return 7; }).get(), 7);
}

TEST(ThreadPoolTest, ZeroMeansHardwareConcurrency) {
    ThreadPool pool(0);
    EXPECT_GE(pool.size(), (size_t)1);
}

TEST(LoggerTest, ParsesLevelNames) {
    EXPECT_EQ(logger::parseLogLevel("DEBUG"), logger::LogLevel::DEBUG);
    EXPECT_EQ(logger::parseLogLevel("warning"), logger::LogLevel::WARN);
    EXPECT_EQ(logger::parseLogLevel("Critical"), logger::LogLevel::CRITICAL);
    EXPECT_THROW(logger::parseLogLevel("loud"), std::invalid_argument);
    EXPECT_STREQ(logger::levelName(logger::LogLevel::ERROR), "ERROR");
}

TEST(LoggerTest, FileSinkHonorsLevel) {
    const std::string path = ::testing::TempDir() + "piiguard_logger_test.log";
    std::remove(path.c_str());

    logger::setLogLevel(logger::LogLevel::WARN);
    EXPECT_FALSE(logger::isEnabled(logger::LogLevel::INFO));
    EXPECT_TRUE(logger::isEnabled(logger::LogLevel::ERROR));
    logger::enableFileOutput(path);
    logger::info("Scanner: below threshold");
    logger::warn("Scanner: kept warning");
    logger::disableFileOutput();
    logger::setLogLevel(logger::LogLevel::INFO);

    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    EXPECT_EQ(contents.str().find("below threshold"), std::string::npos);
    EXPECT_NE(contents.str().find("[WARN] Scanner: kept warning"), std::string::npos);
    std::remove(path.c_str());
}
