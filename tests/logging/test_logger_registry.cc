#include <mutex>
#include <vector>

#include <gtest/gtest.h>

#include "conduit/logging/logger_registry.h"

#define CONDUIT_LOG_COMPONENT "test.registry"
#include "conduit/logging/log_macros.h"

using namespace conduit::logging;

// Test sink for capturing
class TestCaptureSink : public LogSink {
 public:
  void log(const LogMessage& msg) override {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.push_back(msg);
  }

  void flush() override {}

  std::vector<LogMessage> getMessages() {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
  }

 private:
  std::mutex mutex_;
  std::vector<LogMessage> messages_;
};

class LoggerRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registry_ = &LoggerRegistry::instance();
    registry_->clearPatterns();
    registry_->setGlobalLevel(LogLevel::Info);
    test_sink_ = std::make_shared<TestCaptureSink>();
    registry_->setDefaultSink(test_sink_);
  }

  void TearDown() override {
    registry_->clearPatterns();
    registry_->setGlobalLevel(LogLevel::Info);
    registry_->setDefaultSink(std::make_shared<NullSink>());
  }

  LoggerRegistry* registry_;
  std::shared_ptr<TestCaptureSink> test_sink_;
};

TEST_F(LoggerRegistryTest, SingletonInstance) {
  EXPECT_EQ(&LoggerRegistry::instance(), &LoggerRegistry::instance());
}

TEST_F(LoggerRegistryTest, DefaultLogger) {
  auto logger = registry_->getDefaultLogger();

  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(logger->getName(), "default");
  EXPECT_EQ(logger->getLevel(), LogLevel::Info);
}

TEST_F(LoggerRegistryTest, GetOrCreateLogger) {
  auto logger1 = registry_->getOrCreateLogger("http.client");
  auto logger2 = registry_->getOrCreateLogger("http.client");

  EXPECT_EQ(logger1, logger2);
  EXPECT_EQ(logger1->getName(), "http.client");
}

TEST_F(LoggerRegistryTest, GlobalLevelAppliesToExistingLoggers) {
  auto logger = registry_->getOrCreateLogger("network.connector");
  registry_->setGlobalLevel(LogLevel::Debug);
  EXPECT_EQ(LogLevel::Debug, logger->getLevel());
  EXPECT_TRUE(registry_->shouldLog("network.connector", LogLevel::Debug));

  registry_->setGlobalLevel(LogLevel::Error);
  EXPECT_FALSE(logger->shouldLog(LogLevel::Warning));
  EXPECT_TRUE(logger->shouldLog(LogLevel::Error));
}

TEST_F(LoggerRegistryTest, PatternOverridesGlobalLevel) {
  registry_->setGlobalLevel(LogLevel::Warning);
  registry_->setPattern("http.*", LogLevel::Debug);

  EXPECT_EQ(LogLevel::Debug, registry_->getEffectiveLevel("http.client"));
  EXPECT_EQ(LogLevel::Debug, registry_->getEffectiveLevel("http.websocket"));
  EXPECT_EQ(LogLevel::Warning, registry_->getEffectiveLevel("network.channel"));

  // Latest matching pattern wins
  registry_->setPattern("http.codec", LogLevel::Error);
  EXPECT_EQ(LogLevel::Error, registry_->getEffectiveLevel("http.codec"));
  EXPECT_EQ(LogLevel::Debug, registry_->getEffectiveLevel("http.client"));
}

TEST_F(LoggerRegistryTest, OffSilencesEverything) {
  registry_->setGlobalLevel(LogLevel::Off);
  EXPECT_FALSE(registry_->shouldLog("anything", LogLevel::Emergency));
}

TEST_F(LoggerRegistryTest, MacroWritesRecordWithComponentAndLocation) {
  registry_->setGlobalLevel(LogLevel::Debug);

  CONDUIT_LOG_DEBUG("channel {} sending {}", 7, "GET");

  auto messages = test_sink_->getMessages();
  ASSERT_EQ(1u, messages.size());
  EXPECT_EQ("channel 7 sending GET", messages[0].message);
  EXPECT_EQ("test.registry", messages[0].logger_name);
  EXPECT_EQ(LogLevel::Debug, messages[0].level);
  EXPECT_NE(nullptr, messages[0].file);
  EXPECT_GT(messages[0].line, 0);
}

TEST_F(LoggerRegistryTest, MacroBelowThresholdIsDropped) {
  registry_->setGlobalLevel(LogLevel::Info);

  CONDUIT_LOG_DEBUG("hidden {}", 1);
  CONDUIT_LOG_INFO("shown {}", 2);

  auto messages = test_sink_->getMessages();
  ASSERT_EQ(1u, messages.size());
  EXPECT_EQ("shown 2", messages[0].message);
}
