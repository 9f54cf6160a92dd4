// Repository: Probekit-core
// Component: Memory Monitor
// Purpose: Samples process memory and classifies it against the pool's
//          three escalating thresholds (soft / heap / RSS).
// Copyright (c) 2025 Probekit

#ifndef PROBEKIT_POOL_MEMORY_MONITOR_HPP_
#define PROBEKIT_POOL_MEMORY_MONITOR_HPP_

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "probekit/pool/PoolTypes.hpp"

namespace probekit::pool {

class IMemorySampler {
 public:
  virtual ~IMemorySampler() = default;
  virtual MemoryUsage Sample() = 0;
};

// RSS from /proc/self/statm, heap from glibc mallinfo2().
class ProcMemorySampler : public IMemorySampler {
 public:
  MemoryUsage Sample() override;
};

// Result of comparing one sample with MemoryLimits.
struct MemoryAssessment {
  MemoryUsage usage;
  bool above_soft_threshold = false;  // heap_used > gc_threshold% of max_heap_used
  bool heap_exceeded = false;         // heap_used > max_heap_used
  bool rss_exceeded = false;          // rss > max_rss
};

class MemoryMonitor {
 public:
  MemoryMonitor(const MemoryLimits& limits, std::shared_ptr<IMemorySampler> sampler);

  MemoryAssessment Assess();
  MemoryAssessment Assess(const MemoryUsage& usage) const;

  // Asks the allocator to return free pages to the OS. Returns false (and does
  // nothing) when enable_gc_hint is off.
  bool TriggerGcHint(const std::string& reason);

  MemoryMetrics Metrics();
  const MemoryLimits& limits() const { return limits_; }

 private:
  const MemoryLimits limits_;
  std::shared_ptr<IMemorySampler> sampler_;

  std::mutex mutex_;
  uint64_t gc_runs_ = 0;
  std::optional<std::chrono::system_clock::time_point> last_gc_time_;
};

}  // namespace probekit::pool

#endif  // PROBEKIT_POOL_MEMORY_MONITOR_HPP_
