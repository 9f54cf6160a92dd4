// Repository: Probekit-core
// Component: Waiter
// Purpose: Condition polling with pluggable backoff and jitter.
// Copyright (c) 2025 Probekit

#include "probekit/wait/Waiter.hpp"

#include <cmath>

#include <unistd.h>

namespace probekit::wait {

namespace {

std::string TrimmedLastLine(const std::string& text) {
  const size_t nl = text.find_last_of('\n');
  std::string last = nl == std::string::npos ? text : text.substr(nl + 1);
  const size_t begin = last.find_first_not_of(" \t\r");
  if (begin == std::string::npos) return std::string();
  const size_t end = last.find_last_not_of(" \t\r");
  return last.substr(begin, end - begin + 1);
}

WaitOptions WithDelays(int initial_ms, int max_ms, int timeout_ms) {
  WaitOptions o;
  o.initial_delay = std::chrono::milliseconds(initial_ms);
  o.max_delay = std::chrono::milliseconds(max_ms);
  o.timeout = std::chrono::milliseconds(timeout_ms);
  return o;
}

}  // namespace

WaitOptions WaitOptions::TerminalReadyDefaults() { return WithDelays(50, 1000, 10000); }
WaitOptions WaitOptions::ProcessStartDefaults() { return WithDelays(10, 500, 5000); }
WaitOptions WaitOptions::ProcessExitDefaults() { return WithDelays(100, 2000, 30000); }
WaitOptions WaitOptions::FileDefaults() { return WithDelays(100, 1000, 10000); }

Waiter::Waiter(std::shared_ptr<time::IClock> clock)
    : Waiter(std::move(clock), std::random_device{}()) {}

Waiter::Waiter(std::shared_ptr<time::IClock> clock, uint32_t seed)
    : clock_(clock ? std::move(clock) : time::DefaultClock()), rng_(seed) {}

const std::regex& Waiter::DefaultPromptPattern() {
  static const std::regex pattern(R"(\$\s*$)");
  return pattern;
}

double Waiter::UnitRandom() const {
  std::lock_guard<std::mutex> lock(rng_mutex_);
  return std::uniform_real_distribution<double>(0.0, 1.0)(rng_);
}

std::chrono::milliseconds Waiter::NextDelay(int attempt, const WaitOptions& options) const {
  const double base_ms = static_cast<double>(options.initial_delay.count());
  const double max_ms = static_cast<double>(options.max_delay.count());
  double delay_ms = 0.0;
  if (options.interval_function) {
    delay_ms = std::max(1.0, std::min(options.interval_function(attempt, base_ms), max_ms));
  } else {
    delay_ms = CapAndJitterMs(
        StrategyDelayMs(options.strategy, attempt, base_ms, options.backoff_multiplier),
        max_ms, options.jitter, UnitRandom());
  }
  return std::chrono::milliseconds(static_cast<int64_t>(std::llround(delay_ms)));
}

WaitResult<bool> Waiter::WaitUntil(const std::function<bool()>& predicate,
                                   const WaitOptions& options) const {
  std::function<std::optional<bool>()> condition = [&predicate]() -> std::optional<bool> {
    if (predicate()) return true;
    return std::nullopt;
  };
  return WaitFor<bool>(condition, options);
}

WaitResult<bool> Waiter::WaitWithStrategy(const std::function<bool()>& predicate,
                                          BackoffStrategy strategy,
                                          WaitOptions options) const {
  options.strategy = strategy;
  options.interval_function = nullptr;
  return WaitUntil(predicate, options);
}

WaitResult<std::string> Waiter::WaitForOutput(const std::function<std::string()>& output,
                                              const std::string& expected,
                                              const WaitOptions& options) const {
  std::function<std::optional<std::string>()> condition =
      [&output, &expected]() -> std::optional<std::string> {
    std::string text = output();
    if (text.find(expected) != std::string::npos) return text;
    return std::nullopt;
  };
  return WaitFor<std::string>(condition, options);
}

WaitResult<std::string> Waiter::WaitForOutput(const std::function<std::string()>& output,
                                              const std::regex& pattern,
                                              const WaitOptions& options) const {
  std::function<std::optional<std::string>()> condition =
      [&output, &pattern]() -> std::optional<std::string> {
    std::string text = output();
    if (std::regex_search(text, pattern)) return text;
    return std::nullopt;
  };
  return WaitFor<std::string>(condition, options);
}

WaitResult<std::string> Waiter::WaitForTerminalReady(const std::function<std::string()>& output,
                                                     const std::regex& prompt,
                                                     const WaitOptions& options) const {
  std::function<std::optional<std::string>()> condition =
      [&output, &prompt]() -> std::optional<std::string> {
    std::string text = output();
    if (std::regex_search(TrimmedLastLine(text), prompt)) return text;
    return std::nullopt;
  };
  return WaitFor<std::string>(condition, options);
}

WaitResult<pid_t> Waiter::WaitForProcessStart(const std::function<pid_t()>& pid_provider,
                                              const WaitOptions& options) const {
  std::function<std::optional<pid_t>()> condition = [&pid_provider]() -> std::optional<pid_t> {
    const pid_t pid = pid_provider();
    if (pid > 0) return pid;
    return std::nullopt;
  };
  return WaitFor<pid_t>(condition, options);
}

WaitResult<bool> Waiter::WaitForProcessExit(const std::function<bool()>& is_running,
                                            const WaitOptions& options) const {
  return WaitUntil([&is_running]() { return !is_running(); }, options);
}

WaitResult<bool> Waiter::WaitForFile(const std::function<bool()>& file_check,
                                     const WaitOptions& options) const {
  return WaitUntil(file_check, options);
}

WaitResult<bool> Waiter::WaitForFile(const std::string& path, const WaitOptions& options) const {
  return WaitUntil([&path]() { return ::access(path.c_str(), F_OK) == 0; }, options);
}

WaitResult<bool> Waiter::WaitForAll(const std::vector<std::function<bool()>>& predicates,
                                    const WaitOptions& options) const {
  return WaitUntil(
      [&predicates]() {
        bool all = true;
        for (const auto& predicate : predicates) {
          bool ok = false;
          try {
            ok = predicate();
          } catch (const std::exception&) {
            ok = false;
          }
          // Evaluate every predicate each attempt, like a parallel check would.
          all = all && ok;
        }
        return all;
      },
      options);
}

WaitResult<size_t> Waiter::WaitForAny(const std::vector<std::function<bool()>>& predicates,
                                      const WaitOptions& options) const {
  std::function<std::optional<size_t>()> condition = [&predicates]() -> std::optional<size_t> {
    for (size_t i = 0; i < predicates.size(); ++i) {
      try {
        if (predicates[i]()) return i;
      } catch (const std::exception&) {
        // next predicate
      }
    }
    return std::nullopt;
  };
  return WaitFor<size_t>(condition, options);
}

void Waiter::Delay(std::chrono::milliseconds duration, double jitter) const {
  const double ms = static_cast<double>(duration.count());
  const double perturbation = jitter > 0.0 ? ms * jitter * (UnitRandom() - 0.5) : 0.0;
  const double actual = std::max(1.0, ms + perturbation);
  clock_->SleepFor(std::chrono::milliseconds(static_cast<int64_t>(std::llround(actual))));
}

}  // namespace probekit::wait
