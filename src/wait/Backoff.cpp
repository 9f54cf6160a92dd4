// Repository: Probekit-core
// Component: Backoff Strategies
// Purpose: Pure delay math for condition polling (strategy curve, cap, jitter).
// Copyright (c) 2025 Probekit

#include "probekit/wait/Backoff.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace probekit::wait {

const char* BackoffStrategyName(BackoffStrategy strategy) {
  switch (strategy) {
    case BackoffStrategy::kMultiplicative: return "multiplicative";
    case BackoffStrategy::kLinear: return "linear";
    case BackoffStrategy::kExponential: return "exponential";
    case BackoffStrategy::kFibonacci: return "fibonacci";
    case BackoffStrategy::kQuadratic: return "quadratic";
  }
  return "unknown";
}

uint64_t Fibonacci(int n) {
  if (n <= 2) return 1;
  uint64_t a = 1;
  uint64_t b = 1;
  for (int i = 3; i <= n; ++i) {
    if (b > std::numeric_limits<uint64_t>::max() - a) {
      return std::numeric_limits<uint64_t>::max();
    }
    const uint64_t next = a + b;
    a = b;
    b = next;
  }
  return b;
}

double StrategyDelayMs(BackoffStrategy strategy, int attempt, double base_ms,
                       double multiplier) {
  const int n = std::max(attempt, 1);
  switch (strategy) {
    case BackoffStrategy::kLinear:
      return base_ms * n;
    case BackoffStrategy::kExponential:
      return base_ms * std::pow(2.0, n - 1);
    case BackoffStrategy::kFibonacci:
      return base_ms * static_cast<double>(Fibonacci(n));
    case BackoffStrategy::kQuadratic:
      return base_ms * static_cast<double>(n) * static_cast<double>(n);
    case BackoffStrategy::kMultiplicative:
      break;
  }
  return base_ms * std::pow(multiplier, n);
}

double CapAndJitterMs(double delay_ms, double max_ms, double jitter, double unit_random) {
  double capped = std::min(delay_ms, max_ms);
  if (!std::isfinite(capped)) capped = max_ms;
  const double perturbation = jitter > 0.0 ? jitter * capped * (unit_random - 0.5) : 0.0;
  return std::max(1.0, capped + perturbation);
}

}  // namespace probekit::wait
