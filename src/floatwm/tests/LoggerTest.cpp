#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <floatwm/floatwm.hpp>

using namespace floatwm;

class LoggerTest : public ::testing::Test {
protected:
    struct Received {
        Logger::LogLevel level;
        std::string message;
    };

    std::mutex mutex;
    std::condition_variable delivered;
    std::vector<Received> received;

    void SetUp() override {
        // let the processing thread drain what earlier suites queued
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    int32_t record(Logger& logger) {
        return logger.addCallback([this](Logger::LogLevel level, size_t, const char* s) {
            std::lock_guard lock{mutex};
            received.push_back({level, s});
            delivered.notify_all();
        });
    }

    bool waitFor(size_t count) {
        std::unique_lock lock{mutex};
        return delivered.wait_for(lock, std::chrono::seconds(5), [&] { return received.size() >= count; });
    }
};

TEST_F(LoggerTest, CallbacksReceiveFormattedMessagesInOrder) {
    Logger logger{};
    record(logger);
    logger.logInfo("window %s at %d", "w1", 10);
    logger.logWarning("theme '%s' is unknown", "solar");
    logger.logError("failed");
    logger.logDiagnostic("drag ended");

    ASSERT_TRUE(waitFor(4));
    std::lock_guard lock{mutex};
    ASSERT_EQ(received.size(), 4);
    EXPECT_EQ(received[0].level, Logger::INFO);
    EXPECT_EQ(received[0].message, "window w1 at 10");
    EXPECT_EQ(received[1].level, Logger::WARNING);
    EXPECT_EQ(received[1].message, "theme 'solar' is unknown");
    EXPECT_EQ(received[2].level, Logger::ERROR);
    // diagnostics reach callbacks even when stderr does not echo them
    EXPECT_EQ(received[3].level, Logger::DIAGNOSTIC);
    EXPECT_EQ(received[3].message, "drag ended");
}

TEST_F(LoggerTest, EveryCallbackReceivesEachMessage) {
    std::atomic<int> first{0};
    Logger logger{};
    logger.addCallback([&first](Logger::LogLevel, size_t, const char*) { first++; });
    record(logger);

    logger.logInfo("one");
    logger.logInfo("two");
    ASSERT_TRUE(waitFor(2));
    EXPECT_EQ(first.load(), 2);
}

TEST_F(LoggerTest, RemovedCallbackIsNotCalled) {
    std::atomic<int> removed{0};
    Logger logger{};
    auto token = logger.addCallback([&removed](Logger::LogLevel, size_t, const char*) { removed++; });
    logger.removeCallback(token);
    record(logger);

    logger.logWarning("after removal");
    ASSERT_TRUE(waitFor(1));
    EXPECT_EQ(removed.load(), 0);
}

TEST_F(LoggerTest, StderrEchoHonorsLevel) {
    Logger logger{Logger::WARNING};
    EXPECT_EQ(logger.stderrLevel(), Logger::WARNING);
    record(logger);

    testing::internal::CaptureStderr();
    logger.logInfo("quiet line");
    logger.logWarning("loud line");
    ASSERT_TRUE(waitFor(2));
    auto output = testing::internal::GetCapturedStderr();
    EXPECT_NE(output.find("(W)]: loud line"), std::string::npos);
    EXPECT_EQ(output.find("quiet line"), std::string::npos);
}

TEST_F(LoggerTest, EchoLevels) {
    Logger logger{};
    EXPECT_EQ(logger.stderrLevel(), Logger::SILENT);
    logger.stderrLevel(Logger::DIAGNOSTIC);
    EXPECT_EQ(logger.stderrLevel(), Logger::DIAGNOSTIC);
    EXPECT_EQ(Logger::global()->stderrLevel(), Logger::INFO);
}

TEST_F(LoggerTest, MessagesQueuedForDestroyedLoggerAreDropped) {
    std::atomic<int> calls{0};
    auto shortLived = std::make_unique<Logger>();
    shortLived->addCallback([&calls](Logger::LogLevel, size_t, const char*) { calls++; });
    for (int i = 0; i < 10; i++)
        shortLived->logInfo("message %d", i);
    shortLived.reset();

    Logger logger{};
    record(logger);
    logger.logInfo("still delivering");
    ASSERT_TRUE(waitFor(1));
    std::lock_guard lock{mutex};
    EXPECT_EQ(received[0].message, "still delivering");
    EXPECT_LE(calls.load(), 10);
}
