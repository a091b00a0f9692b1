#include <gtest/gtest.h>

#include <thread>

#include "tokenkeeper/logging/logger.h"

#include "capture_sink.h"

namespace tokenkeeper {
namespace logging {
namespace {

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override { sink_ = std::make_shared<CaptureSink>(); }

  std::shared_ptr<CaptureSink> sink_;
};

TEST_F(LoggerTest, BasicLogging) {
  Logger logger("test");
  logger.setSink(sink_);

  logger.info("Test message");

  auto messages = sink_->messages();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].level, LogLevel::Info);
  EXPECT_EQ(messages[0].message, "Test message");
  EXPECT_EQ(messages[0].logger_name, "test");
}

TEST_F(LoggerTest, FormatsArguments) {
  Logger logger("test");
  logger.setSink(sink_);

  logger.warning("slot '{}' retry in {}ms", "catalog", 250);

  auto messages = sink_->messages();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0].message, "slot 'catalog' retry in 250ms");
}

TEST_F(LoggerTest, LevelFiltering) {
  Logger logger("test");
  logger.setSink(sink_);
  logger.setLevel(LogLevel::Warning);

  logger.debug("Debug message");
  logger.info("Info message");
  logger.warning("Warning message");
  logger.error("Error message");
  logger.critical("Critical message");

  auto messages = sink_->messages();
  ASSERT_EQ(messages.size(), 3u);
  EXPECT_EQ(messages[0].level, LogLevel::Warning);
  EXPECT_EQ(messages[1].level, LogLevel::Error);
  EXPECT_EQ(messages[2].level, LogLevel::Critical);
}

TEST_F(LoggerTest, OffSuppressesEverything) {
  Logger logger("test");
  logger.setSink(sink_);
  logger.setLevel(LogLevel::Off);

  logger.critical("Critical message");
  EXPECT_FALSE(logger.shouldLog(LogLevel::Off));
  EXPECT_TRUE(sink_->messages().empty());
}

TEST_F(LoggerTest, LogWithLocation) {
  Logger logger("test");
  logger.setSink(sink_);

  logger.log(LogLevel::Error, "file.cc", 42, "fn", "code {}", 7);

  auto messages = sink_->messages();
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_STREQ(messages[0].file, "file.cc");
  EXPECT_EQ(messages[0].line, 42);
  EXPECT_STREQ(messages[0].function, "fn");
  EXPECT_EQ(messages[0].message, "code 7");
}

TEST_F(LoggerTest, NoSinkIsHarmless) {
  Logger logger("test");
  logger.info("dropped");
  logger.flush();
  EXPECT_EQ(logger.getSink(), nullptr);
}

TEST_F(LoggerTest, Flush) {
  Logger logger("test");
  logger.setSink(sink_);
  logger.flush();
  EXPECT_TRUE(sink_->flushed());
}

TEST_F(LoggerTest, ConcurrentLogging) {
  Logger logger("test");
  logger.setSink(sink_);

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&logger, t]() {
      for (int i = 0; i < 100; ++i) {
        logger.info("thread {} message {}", t, i);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(sink_->messages().size(), 400u);
}

}  // namespace
}  // namespace logging
}  // namespace tokenkeeper
