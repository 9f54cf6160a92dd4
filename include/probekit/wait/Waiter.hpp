// Repository: Probekit-core
// Component: Waiter
// Purpose: Condition polling with pluggable backoff and jitter. Replaces fixed
//          sleeps everywhere a caller must synchronize with something external
//          (process start/exit, shell prompts, output text, files).
// Copyright (c) 2025 Probekit

#ifndef PROBEKIT_WAIT_WAITER_HPP_
#define PROBEKIT_WAIT_WAITER_HPP_

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <regex>
#include <string>
#include <type_traits>
#include <vector>

#include <sys/types.h>

#include "probekit/time/IClock.hpp"
#include "probekit/util/Errors.hpp"
#include "probekit/wait/Backoff.hpp"

namespace probekit::wait {

struct WaitOptions {
  std::chrono::milliseconds initial_delay{10};
  std::chrono::milliseconds max_delay{2000};
  std::chrono::milliseconds timeout{30000};
  double backoff_multiplier = 1.5;
  double jitter = 0.1;  // 0..1, fraction of the delay
  BackoffStrategy strategy = BackoffStrategy::kMultiplicative;

  // Overrides `strategy` when set: (attempt, initial_delay_ms) -> delay ms.
  // Capped at max_delay and floored at 1ms; no jitter is added.
  std::function<double(int, double)> interval_function;

  // Stop early once this many consecutive attempts threw the same message.
  // 0 keeps retrying until timeout.
  int max_identical_errors = 0;

  // Checked before every attempt; the wait ends (cancelled) once it reads true.
  const std::atomic<bool>* cancel_flag = nullptr;

  static WaitOptions TerminalReadyDefaults();
  static WaitOptions ProcessStartDefaults();
  static WaitOptions ProcessExitDefaults();
  static WaitOptions FileDefaults();
};

// Produced fresh per wait; never mutated afterwards.
template <typename T>
struct WaitResult {
  bool success = false;
  int attempts = 0;
  std::chrono::milliseconds total_wait_time{0};
  std::optional<std::string> last_error;
  std::exception_ptr last_exception;
  std::optional<T> result;
  bool failed_fast = false;
  bool cancelled = false;
};

// Waiter polls a condition until it yields a value or the timeout elapses.
//
// A condition returns std::nullopt for "not ready yet". A thrown exception
// also means "not ready yet": it is remembered as last_error and polling
// continues. Only timeout (or the optional fail-fast / cancel policies) ends
// a wait unsuccessfully.
//
// Thread-safe: one Waiter may serve concurrent waits.
class Waiter {
 public:
  explicit Waiter(std::shared_ptr<time::IClock> clock = time::DefaultClock());
  Waiter(std::shared_ptr<time::IClock> clock, uint32_t seed);

  template <typename T>
  WaitResult<T> WaitFor(const std::function<std::optional<T>()>& condition,
                        const WaitOptions& options = WaitOptions()) const;

  // Predicate form of WaitFor: ready when the predicate returns true.
  WaitResult<bool> WaitUntil(const std::function<bool()>& predicate,
                             const WaitOptions& options = WaitOptions()) const;

  WaitResult<bool> WaitWithStrategy(const std::function<bool()>& predicate,
                                    BackoffStrategy strategy,
                                    WaitOptions options = WaitOptions()) const;

  // Substring match against the provider's current text; result is that text.
  WaitResult<std::string> WaitForOutput(const std::function<std::string()>& output,
                                        const std::string& expected,
                                        const WaitOptions& options = WaitOptions()) const;
  WaitResult<std::string> WaitForOutput(const std::function<std::string()>& output,
                                        const std::regex& pattern,
                                        const WaitOptions& options = WaitOptions()) const;

  // Ready when the trimmed last line of the output matches `prompt`.
  WaitResult<std::string> WaitForTerminalReady(
      const std::function<std::string()>& output,
      const std::regex& prompt = DefaultPromptPattern(),
      const WaitOptions& options = WaitOptions::TerminalReadyDefaults()) const;

  // Ready once the provider reports a pid > 0.
  WaitResult<pid_t> WaitForProcessStart(
      const std::function<pid_t()>& pid_provider,
      const WaitOptions& options = WaitOptions::ProcessStartDefaults()) const;

  // Ready once `is_running` reports false.
  WaitResult<bool> WaitForProcessExit(
      const std::function<bool()>& is_running,
      const WaitOptions& options = WaitOptions::ProcessExitDefaults()) const;

  WaitResult<bool> WaitForFile(const std::function<bool()>& file_check,
                               const WaitOptions& options = WaitOptions::FileDefaults()) const;
  WaitResult<bool> WaitForFile(const std::string& path,
                               const WaitOptions& options = WaitOptions::FileDefaults()) const;

  // All predicates true in the same attempt. A throwing predicate counts as false.
  WaitResult<bool> WaitForAll(const std::vector<std::function<bool()>>& predicates,
                              const WaitOptions& options = WaitOptions()) const;

  // Index of the first predicate (in order) that is true. Throwing counts as false.
  WaitResult<size_t> WaitForAny(const std::vector<std::function<bool()>>& predicates,
                                const WaitOptions& options = WaitOptions()) const;

  // Runs `operation` until it returns without throwing.
  template <typename Operation>
  auto RetryOperation(Operation&& operation, const WaitOptions& options = WaitOptions()) const
      -> WaitResult<std::invoke_result_t<Operation&>>;

  // Sleeps max(1, ms ± ms*jitter/2).
  void Delay(std::chrono::milliseconds duration, double jitter = 0.0) const;

  // Delay that follows `attempt` (1-based) under `options`.
  std::chrono::milliseconds NextDelay(int attempt, const WaitOptions& options) const;

  static const std::regex& DefaultPromptPattern();

  const std::shared_ptr<time::IClock>& clock() const { return clock_; }

 private:
  double UnitRandom() const;

  std::shared_ptr<time::IClock> clock_;
  mutable std::mutex rng_mutex_;
  mutable std::mt19937 rng_;
};

template <typename T>
WaitResult<T> Waiter::WaitFor(const std::function<std::optional<T>()>& condition,
                              const WaitOptions& options) const {
  WaitResult<T> out;
  const auto start = clock_->Now();
  std::string streak_message;
  int streak = 0;

  auto note_error = [&](const std::string& message) {
    out.last_exception = std::current_exception();
    out.last_error = message;
    if (options.max_identical_errors <= 0) return false;
    if (streak > 0 && message == streak_message) {
      ++streak;
    } else {
      streak_message = message;
      streak = 1;
    }
    return streak >= options.max_identical_errors;
  };

  while (time::ElapsedMs(start, clock_->Now()) < options.timeout) {
    if (options.cancel_flag != nullptr &&
        options.cancel_flag->load(std::memory_order_acquire)) {
      out.cancelled = true;
      break;
    }

    ++out.attempts;
    bool stop = false;
    try {
      std::optional<T> value = condition();
      if (value.has_value()) {
        out.success = true;
        out.result = std::move(value);
        out.total_wait_time = time::ElapsedMs(start, clock_->Now());
        return out;
      }
      streak = 0;
    } catch (...) {
      stop = note_error(util::DescribeCurrentException());
    }
    if (stop) {
      out.failed_fast = true;
      break;
    }

    const auto remaining = options.timeout - time::ElapsedMs(start, clock_->Now());
    if (remaining.count() <= 0) break;
    clock_->SleepFor(std::min(NextDelay(out.attempts, options), remaining));
  }

  out.total_wait_time = time::ElapsedMs(start, clock_->Now());
  return out;
}

template <typename Operation>
auto Waiter::RetryOperation(Operation&& operation, const WaitOptions& options) const
    -> WaitResult<std::invoke_result_t<Operation&>> {
  using Result = std::invoke_result_t<Operation&>;
  static_assert(!std::is_void_v<Result>, "RetryOperation needs an operation with a result");
  std::function<std::optional<Result>()> condition = [&operation]() {
    return std::optional<Result>(operation());
  };
  return WaitFor<Result>(condition, options);
}

}  // namespace probekit::wait

#endif  // PROBEKIT_WAIT_WAITER_HPP_
