// Repository: Probekit-core
// Component: Latency Window
// Purpose: Rolling window of recent acquisition latencies (avg / p95 / p99).
// Copyright (c) 2025 Probekit

#include "probekit/pool/LatencyWindow.hpp"

#include <algorithm>
#include <numeric>
#include <vector>

namespace probekit::pool {

namespace {

// Nearest-rank on the sorted samples: index floor(n * p), clamped.
double Percentile(const std::vector<double>& sorted, double fraction) {
  if (sorted.empty()) return 0.0;
  size_t index = static_cast<size_t>(static_cast<double>(sorted.size()) * fraction);
  index = std::min(index, sorted.size() - 1);
  return sorted[index];
}

}  // namespace

LatencyWindow::LatencyWindow(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

void LatencyWindow::Record(double latency_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  samples_.push_back(latency_ms);
  while (samples_.size() > capacity_) samples_.pop_front();
}

LatencyStats LatencyWindow::Stats() const {
  std::vector<double> sorted;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sorted.assign(samples_.begin(), samples_.end());
  }
  LatencyStats stats;
  stats.samples = sorted.size();
  if (sorted.empty()) return stats;

  std::sort(sorted.begin(), sorted.end());
  stats.avg_ms = std::accumulate(sorted.begin(), sorted.end(), 0.0) /
                 static_cast<double>(sorted.size());
  stats.p95_ms = Percentile(sorted, 0.95);
  stats.p99_ms = Percentile(sorted, 0.99);
  return stats;
}

size_t LatencyWindow::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return samples_.size();
}

void LatencyWindow::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  samples_.clear();
}

}  // namespace probekit::pool
