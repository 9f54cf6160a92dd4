// Repository: Probekit-core
// Component: Latency Window
// Purpose: Rolling window of recent acquisition latencies (avg / p95 / p99).
// Copyright (c) 2025 Probekit

#ifndef PROBEKIT_POOL_LATENCY_WINDOW_HPP_
#define PROBEKIT_POOL_LATENCY_WINDOW_HPP_

#include <cstddef>
#include <deque>
#include <mutex>

#include "probekit/pool/PoolTypes.hpp"

namespace probekit::pool {

class LatencyWindow {
 public:
  static constexpr size_t kDefaultCapacity = 100;

  explicit LatencyWindow(size_t capacity = kDefaultCapacity);

  void Record(double latency_ms);
  LatencyStats Stats() const;
  size_t size() const;
  void Clear();

 private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::deque<double> samples_;
};

}  // namespace probekit::pool

#endif  // PROBEKIT_POOL_LATENCY_WINDOW_HPP_
