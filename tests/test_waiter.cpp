// Repository: Probekit-core
// Component: Waiter unit tests
//
// Every test drives virtual time through FakeClock: no test really sleeps.

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "probekit/wait/Waiter.hpp"
#include "support/FakeClock.hpp"

namespace probekit::wait {
namespace {

using std::chrono::milliseconds;
using tests::FakeClock;

WaitOptions NoJitter(int initial_ms, int max_ms, int timeout_ms, double multiplier = 2.0) {
  WaitOptions o;
  o.initial_delay = milliseconds(initial_ms);
  o.max_delay = milliseconds(max_ms);
  o.timeout = milliseconds(timeout_ms);
  o.backoff_multiplier = multiplier;
  o.jitter = 0.0;
  return o;
}

class WaiterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    clock_ = std::make_shared<FakeClock>();
    waiter_ = std::make_unique<Waiter>(clock_, 1234u);
  }

  std::shared_ptr<FakeClock> clock_;
  std::unique_ptr<Waiter> waiter_;
};

// -----------------------------------------------------------------------------
// Success paths
// -----------------------------------------------------------------------------
TEST_F(WaiterTest, ImmediateSuccessNeverSleeps) {
  auto r = waiter_->WaitUntil([] { return true; }, NoJitter(10, 100, 1000));
  EXPECT_TRUE(r.success);
  EXPECT_EQ(r.attempts, 1);
  EXPECT_EQ(r.total_wait_time, milliseconds(0));
  EXPECT_TRUE(clock_->Sleeps().empty());
}

TEST_F(WaiterTest, BacksOffMultiplicativelyUntilReady) {
  int calls = 0;
  std::function<std::optional<int>()> condition = [&]() -> std::optional<int> {
    if (++calls < 3) return std::nullopt;
    return 42;
  };
  auto r = waiter_->WaitFor<int>(condition, NoJitter(10, 1000, 5000));

  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.result, 42);
  EXPECT_EQ(r.attempts, 3);
  EXPECT_THAT(clock_->Sleeps(), ::testing::ElementsAre(milliseconds(20), milliseconds(40)));
  EXPECT_EQ(r.total_wait_time, milliseconds(60));
}

TEST_F(WaiterTest, ExceptionsAreRetriedAndRemembered) {
  int calls = 0;
  std::function<std::optional<std::string>()> condition = [&]() -> std::optional<std::string> {
    if (++calls <= 2) throw std::runtime_error("not yet");
    return std::string("done");
  };
  auto r = waiter_->WaitFor<std::string>(condition, NoJitter(10, 100, 1000));
  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.result, "done");
  EXPECT_EQ(r.attempts, 3);
  EXPECT_EQ(r.last_error, "not yet");
}

TEST_F(WaiterTest, NonStandardExceptionsAreRetriedAsUnknown) {
  int calls = 0;
  std::function<std::optional<int>()> condition = [&]() -> std::optional<int> {
    if (++calls == 1) throw 7;
    return 1;
  };
  auto r = waiter_->WaitFor<int>(condition, NoJitter(10, 100, 1000));
  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.attempts, 2);
  EXPECT_EQ(r.last_error, "unknown exception");
}

// -----------------------------------------------------------------------------
// Timeout and early termination
// -----------------------------------------------------------------------------
TEST_F(WaiterTest, TimesOutAndClampsFinalSleepToRemainingTime) {
  auto r = waiter_->WaitUntil([] { return false; }, NoJitter(10, 1000, 100));
  EXPECT_FALSE(r.success);
  EXPECT_FALSE(r.result.has_value());
  EXPECT_EQ(r.attempts, 3);
  EXPECT_THAT(clock_->Sleeps(),
              ::testing::ElementsAre(milliseconds(20), milliseconds(40), milliseconds(40)));
  EXPECT_EQ(r.total_wait_time, milliseconds(100));
}

TEST_F(WaiterTest, TimeoutReportsLastError) {
  std::function<std::optional<int>()> condition = []() -> std::optional<int> {
    throw std::runtime_error("connection refused");
  };
  auto r = waiter_->WaitFor<int>(condition, NoJitter(10, 50, 200));
  EXPECT_FALSE(r.success);
  EXPECT_FALSE(r.failed_fast);
  EXPECT_EQ(r.last_error, "connection refused");
  EXPECT_TRUE(static_cast<bool>(r.last_exception));
  EXPECT_GE(r.total_wait_time, milliseconds(200));
}

TEST_F(WaiterTest, IdenticalErrorStreakFailsFast) {
  std::function<std::optional<int>()> condition = []() -> std::optional<int> {
    throw std::runtime_error("permission denied");
  };
  WaitOptions o = NoJitter(10, 50, 60000);
  o.max_identical_errors = 3;
  auto r = waiter_->WaitFor<int>(condition, o);
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.failed_fast);
  EXPECT_EQ(r.attempts, 3);
  EXPECT_LT(r.total_wait_time, milliseconds(60000));
}

TEST_F(WaiterTest, ChangingErrorsDoNotFailFast) {
  int calls = 0;
  std::function<std::optional<int>()> condition = [&]() -> std::optional<int> {
    throw std::runtime_error(++calls % 2 ? "odd" : "even");
  };
  WaitOptions o = NoJitter(10, 10, 200);
  o.max_identical_errors = 2;
  auto r = waiter_->WaitFor<int>(condition, o);
  EXPECT_FALSE(r.failed_fast);
  EXPECT_GT(r.attempts, 2);
}

TEST_F(WaiterTest, CancelFlagStopsBeforeFirstAttempt) {
  std::atomic<bool> cancel{true};
  WaitOptions o = NoJitter(10, 100, 1000);
  o.cancel_flag = &cancel;
  int calls = 0;
  auto r = waiter_->WaitUntil([&] { ++calls; return true; }, o);
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.cancelled);
  EXPECT_EQ(r.attempts, 0);
  EXPECT_EQ(calls, 0);
}

// -----------------------------------------------------------------------------
// Delay computation
// -----------------------------------------------------------------------------
TEST_F(WaiterTest, CustomIntervalIsCappedButNotJittered) {
  WaitOptions o = NoJitter(10, 50, 1000);
  o.jitter = 0.5;
  o.interval_function = [](int attempt, double) { return attempt * 7.0; };
  EXPECT_EQ(waiter_->NextDelay(1, o), milliseconds(7));
  EXPECT_EQ(waiter_->NextDelay(2, o), milliseconds(14));
  EXPECT_EQ(waiter_->NextDelay(100, o), milliseconds(50));
}

TEST_F(WaiterTest, JitterStaysWithinHalfBand) {
  WaitOptions o;
  o.initial_delay = milliseconds(100);
  o.max_delay = milliseconds(10000);
  o.strategy = BackoffStrategy::kLinear;
  o.jitter = 0.1;
  for (int i = 0; i < 200; ++i) {
    const auto d = waiter_->NextDelay(5, o);
    EXPECT_GE(d, milliseconds(475));
    EXPECT_LE(d, milliseconds(525));
  }
}

TEST_F(WaiterTest, FibonacciStrategySleeps) {
  int calls = 0;
  WaitOptions o = NoJitter(10, 1000, 10000);
  auto r = waiter_->WaitWithStrategy([&] { return ++calls == 5; }, BackoffStrategy::kFibonacci, o);
  ASSERT_TRUE(r.success);
  EXPECT_THAT(clock_->Sleeps(), ::testing::ElementsAre(milliseconds(10), milliseconds(10),
                                                       milliseconds(20), milliseconds(30)));
}

TEST_F(WaiterTest, DelayUsesInjectedClock) {
  waiter_->Delay(milliseconds(100));
  EXPECT_THAT(clock_->Sleeps(), ::testing::ElementsAre(milliseconds(100)));
}

// -----------------------------------------------------------------------------
// Conveniences
// -----------------------------------------------------------------------------
TEST_F(WaiterTest, WaitForOutputSubstringAndRegex) {
  std::string buffer = "starting\n";
  int polls = 0;
  auto output = [&] {
    if (++polls == 3) buffer += "server listening on 8080\n";
    return buffer;
  };
  auto r = waiter_->WaitForOutput(output, "listening", NoJitter(10, 100, 1000));
  ASSERT_TRUE(r.success);
  EXPECT_THAT(*r.result, ::testing::HasSubstr("8080"));

  auto rx = waiter_->WaitForOutput([&] { return buffer; }, std::regex("port? \\d+|on (\\d+)"),
                                   NoJitter(10, 100, 1000));
  EXPECT_TRUE(rx.success);
  EXPECT_EQ(rx.attempts, 1);
}

TEST_F(WaiterTest, TerminalReadyMatchesTrimmedLastLine) {
  auto ready = waiter_->WaitForTerminalReady([] { return std::string("motd\nuser@host:~$   "); });
  EXPECT_TRUE(ready.success);

  auto busy = waiter_->WaitForTerminalReady([] { return std::string("$ make\ncompiling...\n"); },
                                            Waiter::DefaultPromptPattern(),
                                            NoJitter(10, 100, 300));
  EXPECT_FALSE(busy.success);
}

TEST_F(WaiterTest, ProcessStartWaitsForPositivePid) {
  int polls = 0;
  auto r = waiter_->WaitForProcessStart([&]() -> pid_t { return ++polls < 3 ? 0 : 4321; });
  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.result, 4321);
  EXPECT_EQ(r.attempts, 3);
}

TEST_F(WaiterTest, ProcessExitWaitsForNotRunning) {
  int polls = 0;
  auto r = waiter_->WaitForProcessExit([&] { return ++polls < 4; });
  EXPECT_TRUE(r.success);
  EXPECT_EQ(r.attempts, 4);
}

TEST_F(WaiterTest, WaitForFileByPath) {
  EXPECT_TRUE(waiter_->WaitForFile(std::string("/")).success);
  auto missing = waiter_->WaitForFile(std::string("/nonexistent/probekit/file"),
                                      NoJitter(100, 100, 500));
  EXPECT_FALSE(missing.success);
}

TEST_F(WaiterTest, WaitForAllNeedsEveryPredicateInOneAttempt) {
  int a = 0;
  int b = 0;
  std::vector<std::function<bool()>> predicates = {
      [&] { return ++a >= 2; },
      [&] { return ++b >= 3; },
  };
  auto r = waiter_->WaitForAll(predicates, NoJitter(10, 100, 1000));
  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.attempts, 3);
}

TEST_F(WaiterTest, WaitForAnyReturnsFirstTrueIndex) {
  std::vector<std::function<bool()>> predicates = {
      [] { return false; },
      []() -> bool { throw std::runtime_error("broken check"); },
      [] { return true; },
      [] { return true; },
  };
  auto r = waiter_->WaitForAny(predicates, NoJitter(10, 100, 1000));
  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.result, 2u);
}

TEST_F(WaiterTest, RetryOperationReturnsFirstValue) {
  int calls = 0;
  auto r = waiter_->RetryOperation(
      [&]() -> int {
        if (++calls < 3) throw std::runtime_error("flaky");
        return 7;
      },
      NoJitter(10, 100, 1000));
  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.result, 7);
  EXPECT_EQ(r.attempts, 3);
}

TEST(WaitOptionsTest, PresetDefaults) {
  EXPECT_EQ(WaitOptions::TerminalReadyDefaults().initial_delay, milliseconds(50));
  EXPECT_EQ(WaitOptions::TerminalReadyDefaults().timeout, milliseconds(10000));
  EXPECT_EQ(WaitOptions::ProcessStartDefaults().max_delay, milliseconds(500));
  EXPECT_EQ(WaitOptions::ProcessExitDefaults().timeout, milliseconds(30000));
  EXPECT_EQ(WaitOptions::FileDefaults().initial_delay, milliseconds(100));

  WaitOptions d;
  EXPECT_EQ(d.strategy, BackoffStrategy::kMultiplicative);
  EXPECT_DOUBLE_EQ(d.backoff_multiplier, 1.5);
  EXPECT_DOUBLE_EQ(d.jitter, 0.1);
}

}  // namespace
}  // namespace probekit::wait
