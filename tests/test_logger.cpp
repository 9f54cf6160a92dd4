// Repository: Probekit-core
// Component: Logger unit tests

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "probekit/config/EnvConfig.hpp"
#include "probekit/util/Logger.hpp"

namespace probekit::util {
namespace {

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    debug_was_enabled_ = Logger::DebugEnabled();
    Logger::SetSink([this](LogLevel level, const std::string& line) {
      lines_.emplace_back(level, line);
    });
  }

  void TearDown() override {
    Logger::SetSink(nullptr);
    Logger::SetDebugEnabled(debug_was_enabled_);
  }

  std::vector<std::pair<LogLevel, std::string>> lines_;
  bool debug_was_enabled_ = false;
};

TEST_F(LoggerTest, SinkSeesEveryLevelWithItsTag) {
  Logger::Info("[Test] info");
  Logger::Warn("[Test] warn");
  Logger::Error("[Test] error");

  ASSERT_EQ(lines_.size(), 3u);
  EXPECT_EQ(lines_[0].first, LogLevel::kInfo);
  EXPECT_EQ(lines_[1].first, LogLevel::kWarn);
  EXPECT_EQ(lines_[2].first, LogLevel::kError);
  EXPECT_EQ(lines_[2].second, "[Test] error");
}

TEST_F(LoggerTest, DebugIsDroppedUnlessEnabled) {
  Logger::SetDebugEnabled(false);
  Logger::Debug("[Test] hidden");
  EXPECT_TRUE(lines_.empty());

  Logger::SetDebugEnabled(true);
  Logger::Debug("[Test] shown");
  ASSERT_EQ(lines_.size(), 1u);
  EXPECT_EQ(lines_[0].first, LogLevel::kDebug);
}

TEST_F(LoggerTest, RemovedSinkStopsReceiving) {
  Logger::SetSink(nullptr);
  Logger::Warn("[Test] unseen");
  EXPECT_TRUE(lines_.empty());
}

TEST_F(LoggerTest, RejectedEnvironmentValueIsReportedAsWarning) {
  pool::ResourcePoolConfig config;
  const int applied = config::ApplyEnvOverrides(config, [](const char* name) {
    return std::string(name) == config::kEnvPoolMaxSize ? std::optional<std::string>("lots")
                                                        : std::nullopt;
  });
  EXPECT_EQ(applied, 0);

  bool warned = false;
  for (const auto& [level, line] : lines_) {
    if (level == LogLevel::kWarn && line.find("[EnvConfig]") != std::string::npos &&
        line.find("PROBEKIT_POOL_MAX_SIZE") != std::string::npos) {
      warned = true;
    }
  }
  EXPECT_TRUE(warned);
}

TEST(LogLevelTest, Names) {
  EXPECT_STREQ(LogLevelName(LogLevel::kDebug), "debug");
  EXPECT_STREQ(LogLevelName(LogLevel::kError), "error");
}

}  // namespace
}  // namespace probekit::util
