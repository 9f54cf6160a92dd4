// Repository: Probekit-core
// Component: Environment configuration unit tests

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <map>
#include <optional>
#include <string>

#include "probekit/config/EnvConfig.hpp"

namespace probekit::config {
namespace {

EnvLookup FromMap(std::map<std::string, std::string> env) {
  return [env](const char* name) -> std::optional<std::string> {
    auto it = env.find(name);
    if (it == env.end()) return std::nullopt;
    return it->second;
  };
}

TEST(EnvConfigTest, ParseUnsignedIsStrict) {
  EXPECT_EQ(ParseUnsigned("0"), 0u);
  EXPECT_EQ(ParseUnsigned("4096"), 4096u);
  EXPECT_FALSE(ParseUnsigned("").has_value());
  EXPECT_FALSE(ParseUnsigned("-1").has_value());
  EXPECT_FALSE(ParseUnsigned("12ms").has_value());
  EXPECT_FALSE(ParseUnsigned(" 12").has_value());
  EXPECT_FALSE(ParseUnsigned("99999999999999999999999").has_value());
}

TEST(EnvConfigTest, NoVariablesLeavesDefaults) {
  pool::ResourcePoolConfig config;
  EXPECT_EQ(ApplyEnvOverrides(config, FromMap({})), 0);
  EXPECT_EQ(config.pool.max_size, 10u);
  EXPECT_EQ(config.pool.acquisition_timeout, std::chrono::milliseconds(30000));
  EXPECT_EQ(config.memory.max_heap_used, 512ull * 1024 * 1024);
  EXPECT_EQ(config.buffer.max_total_buffers, 50u);
}

TEST(EnvConfigTest, AppliesEveryRecognisedVariable) {
  pool::ResourcePoolConfig config;
  int applied = ApplyEnvOverrides(config, FromMap({
                                              {kEnvPoolMaxSize, "4"},
                                              {kEnvPoolIdleTimeoutMs, "1500"},
                                              {kEnvPoolMaxAgeMs, "60000"},
                                              {kEnvPoolAcquireTimeoutMs, "250"},
                                              {kEnvMemoryMaxHeapMb, "64"},
                                              {kEnvMemoryMaxRssMb, "128"},
                                              {kEnvMemoryGcThreshold, "80"},
                                              {kEnvBufferMaxTotal, "12"},
                                              {kEnvBufferCompressionThreshold, "2048"},
                                          }));
  EXPECT_EQ(applied, 9);
  EXPECT_EQ(config.pool.max_size, 4u);
  EXPECT_EQ(config.pool.idle_timeout, std::chrono::milliseconds(1500));
  EXPECT_EQ(config.pool.max_age, std::chrono::milliseconds(60000));
  EXPECT_EQ(config.pool.acquisition_timeout, std::chrono::milliseconds(250));
  EXPECT_EQ(config.memory.max_heap_used, 64ull * 1024 * 1024);
  EXPECT_EQ(config.memory.max_rss, 128ull * 1024 * 1024);
  EXPECT_DOUBLE_EQ(config.memory.gc_threshold_percent, 80.0);
  EXPECT_EQ(config.buffer.max_total_buffers, 12u);
  EXPECT_EQ(config.buffer.compression_threshold, 2048u);
}

TEST(EnvConfigTest, MalformedAndOutOfRangeValuesAreIgnored) {
  pool::ResourcePoolConfig config;
  int applied = ApplyEnvOverrides(config, FromMap({
                                              {kEnvPoolMaxSize, "0"},
                                              {kEnvMemoryGcThreshold, "150"},
                                              {kEnvPoolAcquireTimeoutMs, "soon"},
                                              {kEnvBufferMaxTotal, "8"},
                                          }));
  EXPECT_EQ(applied, 1);
  EXPECT_EQ(config.pool.max_size, 10u);
  EXPECT_DOUBLE_EQ(config.memory.gc_threshold_percent, 70.0);
  EXPECT_EQ(config.pool.acquisition_timeout, std::chrono::milliseconds(30000));
  EXPECT_EQ(config.buffer.max_total_buffers, 8u);
}

TEST(EnvConfigTest, ParseBoundedRejectsValuesOutsideTheRange) {
  EXPECT_EQ(ParseBounded("1", 1, kMaxDurationMs), 1u);
  EXPECT_EQ(ParseBounded("604800000", 1, kMaxDurationMs), kMaxDurationMs);
  EXPECT_FALSE(ParseBounded("604800001", 1, kMaxDurationMs).has_value());
  EXPECT_FALSE(ParseBounded("0", 1, kMaxDurationMs).has_value());
  // Would wrap to a negative duration if it reached std::chrono.
  EXPECT_FALSE(ParseBounded("18446744073709551615", 1, kMaxDurationMs).has_value());
  EXPECT_FALSE(ParseBounded("9223372036854775807", 1, kMaxDurationMs).has_value());
}

TEST(EnvConfigTest, EveryEnvironmentKnobHasACommandLineFlag) {
  const char* const flags[] = {
      "--pool-size",   "--idle-timeout-ms", "--max-age-ms",
      "--acquire-timeout-ms", "--max-heap-mb", "--max-rss-mb",
      "--gc-threshold", "--max-buffers", "--compression-threshold",
  };
  ASSERT_EQ(PoolSettings().size(), 9u);
  for (const char* flag : flags) {
    const PoolSetting* setting = FindPoolSettingByFlag(flag);
    ASSERT_NE(setting, nullptr) << flag;
    EXPECT_EQ(std::string(setting->flag), flag);
  }
  EXPECT_EQ(FindPoolSettingByFlag("--timeout-ms"), nullptr);
  EXPECT_EQ(FindPoolSettingByFlag("--no-such-flag"), nullptr);
}

TEST(EnvConfigTest, FlagsShareTheEnvironmentBounds) {
  for (const PoolSetting& setting : PoolSettings()) {
    const std::string over_max = std::to_string(setting.max + 1);
    EXPECT_FALSE(ParseBounded(over_max, setting.min, setting.max).has_value()) << setting.flag;

    pool::ResourcePoolConfig config;
    EXPECT_EQ(ApplyEnvOverrides(config, FromMap({{setting.env_name, over_max}})), 0)
        << setting.env_name;
  }
  const PoolSetting* acquire = FindPoolSettingByFlag("--acquire-timeout-ms");
  ASSERT_NE(acquire, nullptr);
  EXPECT_EQ(std::string(acquire->env_name), kEnvPoolAcquireTimeoutMs);
  EXPECT_EQ(acquire->min, 1u);
  EXPECT_EQ(acquire->max, kMaxDurationMs);
}

TEST(EnvConfigTest, FlagValuesAppliedAfterEnvironmentWin) {
  pool::ResourcePoolConfig config;
  ApplyEnvOverrides(config, FromMap({{kEnvPoolMaxAgeMs, "60000"}, {kEnvMemoryMaxRssMb, "128"}}));

  const PoolSetting* max_age = FindPoolSettingByFlag("--max-age-ms");
  ASSERT_NE(max_age, nullptr);
  auto value = ParseBounded("5000", max_age->min, max_age->max);
  ASSERT_TRUE(value.has_value());
  max_age->apply(config, *value);

  EXPECT_EQ(config.pool.max_age, std::chrono::milliseconds(5000));
  EXPECT_EQ(config.memory.max_rss, 128ull * 1024 * 1024);
}

TEST(EnvConfigTest, ProcessEnvironmentReadsGetenv) {
  ::setenv("PROBEKIT_TEST_ENV_VALUE", "abc", 1);
  auto lookup = ProcessEnvironment();
  EXPECT_EQ(lookup("PROBEKIT_TEST_ENV_VALUE"), std::string("abc"));
  ::unsetenv("PROBEKIT_TEST_ENV_VALUE");
  EXPECT_FALSE(lookup("PROBEKIT_TEST_ENV_VALUE").has_value());
}

}  // namespace
}  // namespace probekit::config
