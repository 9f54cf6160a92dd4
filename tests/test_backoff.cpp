// Repository: Probekit-core
// Component: Backoff strategy unit tests

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "probekit/wait/Backoff.hpp"

namespace probekit::wait {
namespace {

TEST(BackoffTest, FibonacciSequence) {
  const uint64_t expected[] = {1, 1, 2, 3, 5, 8, 13, 21};
  for (int n = 1; n <= 8; ++n) {
    EXPECT_EQ(Fibonacci(n), expected[n - 1]) << "n=" << n;
  }
  EXPECT_EQ(Fibonacci(0), 1u);
}

TEST(BackoffTest, FibonacciSaturatesInsteadOfOverflowing) {
  EXPECT_EQ(Fibonacci(500), std::numeric_limits<uint64_t>::max());
}

TEST(BackoffTest, MultiplicativeCompoundsFromFirstAttempt) {
  EXPECT_DOUBLE_EQ(StrategyDelayMs(BackoffStrategy::kMultiplicative, 1, 10.0, 1.5), 15.0);
  EXPECT_DOUBLE_EQ(StrategyDelayMs(BackoffStrategy::kMultiplicative, 2, 10.0, 1.5), 22.5);
}

TEST(BackoffTest, NamedStrategiesUseBaseDelay) {
  EXPECT_DOUBLE_EQ(StrategyDelayMs(BackoffStrategy::kLinear, 3, 100.0, 9.0), 300.0);
  EXPECT_DOUBLE_EQ(StrategyDelayMs(BackoffStrategy::kExponential, 1, 100.0, 9.0), 100.0);
  EXPECT_DOUBLE_EQ(StrategyDelayMs(BackoffStrategy::kExponential, 4, 100.0, 9.0), 800.0);
  EXPECT_DOUBLE_EQ(StrategyDelayMs(BackoffStrategy::kFibonacci, 6, 10.0, 9.0), 80.0);
  EXPECT_DOUBLE_EQ(StrategyDelayMs(BackoffStrategy::kQuadratic, 3, 10.0, 9.0), 90.0);
}

TEST(BackoffTest, AttemptBelowOneTreatedAsOne) {
  EXPECT_DOUBLE_EQ(StrategyDelayMs(BackoffStrategy::kLinear, 0, 50.0, 1.5), 50.0);
}

TEST(BackoffTest, CapAppliesBeforeJitter) {
  EXPECT_DOUBLE_EQ(CapAndJitterMs(5000.0, 2000.0, 0.0, 0.9), 2000.0);
  // u=1.0 is the upper edge: +jitter/2 of the capped value.
  EXPECT_DOUBLE_EQ(CapAndJitterMs(5000.0, 2000.0, 0.1, 1.0), 2100.0);
  EXPECT_DOUBLE_EQ(CapAndJitterMs(5000.0, 2000.0, 0.1, 0.0), 1900.0);
}

TEST(BackoffTest, NeutralRandomAddsNoJitter) {
  EXPECT_DOUBLE_EQ(CapAndJitterMs(400.0, 1000.0, 0.5, 0.5), 400.0);
}

TEST(BackoffTest, FloorsAtOneMillisecond) {
  EXPECT_DOUBLE_EQ(CapAndJitterMs(0.2, 100.0, 0.0, 0.5), 1.0);
  EXPECT_DOUBLE_EQ(CapAndJitterMs(1.0, 100.0, 1.0, 0.0), 1.0);
}

TEST(BackoffTest, OverflowedDelayFallsBackToMax) {
  const double huge = StrategyDelayMs(BackoffStrategy::kExponential, 5000, 100.0, 1.5);
  EXPECT_TRUE(std::isinf(huge));
  EXPECT_DOUBLE_EQ(CapAndJitterMs(huge, 2000.0, 0.0, 0.5), 2000.0);
}

TEST(BackoffTest, StrategyNames) {
  EXPECT_STREQ(BackoffStrategyName(BackoffStrategy::kMultiplicative), "multiplicative");
  EXPECT_STREQ(BackoffStrategyName(BackoffStrategy::kFibonacci), "fibonacci");
}

}  // namespace
}  // namespace probekit::wait
