// Repository: Probekit-core
// Component: Backoff Strategies
// Purpose: Pure delay math for condition polling (strategy curve, cap, jitter).
// Copyright (c) 2025 Probekit

#ifndef PROBEKIT_WAIT_BACKOFF_HPP_
#define PROBEKIT_WAIT_BACKOFF_HPP_

#include <cstdint>

namespace probekit::wait {

enum class BackoffStrategy {
  kMultiplicative = 0,  // base * multiplier^attempt
  kLinear = 1,          // base * attempt
  kExponential = 2,     // base * 2^(attempt-1)
  kFibonacci = 3,       // base * fib(attempt)
  kQuadratic = 4,       // base * attempt^2
};

const char* BackoffStrategyName(BackoffStrategy strategy);

// fib(1) = fib(2) = 1. Saturates instead of overflowing for large n.
uint64_t Fibonacci(int n);

// Uncapped delay for `attempt` (1-based) before jitter is applied.
double StrategyDelayMs(BackoffStrategy strategy, int attempt, double base_ms,
                       double multiplier);

// Caps at max_ms, perturbs by ±(jitter * delay) / 2 and floors at 1ms.
// `unit_random` must be in [0, 1); 0.5 means no perturbation.
double CapAndJitterMs(double delay_ms, double max_ms, double jitter, double unit_random);

}  // namespace probekit::wait

#endif  // PROBEKIT_WAIT_BACKOFF_HPP_
