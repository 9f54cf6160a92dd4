// Repository: Probekit-core
// Component: Memory Monitor
// Purpose: Samples process memory and classifies it against the pool's
//          three escalating thresholds (soft / heap / RSS).
// Copyright (c) 2025 Probekit

#include "probekit/pool/MemoryMonitor.hpp"

#include <cstdio>

#include <malloc.h>
#include <unistd.h>

#include "probekit/util/Logger.hpp"

namespace probekit::pool {

MemoryUsage ProcMemorySampler::Sample() {
  MemoryUsage usage;

  struct mallinfo2 mi = mallinfo2();
  usage.heap_used = static_cast<uint64_t>(mi.uordblks) + static_cast<uint64_t>(mi.hblkhd);
  usage.heap_total = static_cast<uint64_t>(mi.arena) + static_cast<uint64_t>(mi.hblkhd);

  FILE* file = std::fopen("/proc/self/statm", "r");
  if (file) {
    unsigned long size = 0;
    unsigned long resident = 0;
    if (std::fscanf(file, "%lu %lu", &size, &resident) == 2) {
      usage.rss = static_cast<uint64_t>(resident) * static_cast<uint64_t>(sysconf(_SC_PAGESIZE));
    }
    std::fclose(file);
  } else {
    util::Logger::Debug("[MemoryMonitor] /proc/self/statm unavailable, rss=0");
  }
  return usage;
}

MemoryMonitor::MemoryMonitor(const MemoryLimits& limits, std::shared_ptr<IMemorySampler> sampler)
    : limits_(limits), sampler_(std::move(sampler)) {
  if (!sampler_) sampler_ = std::make_shared<ProcMemorySampler>();
}

MemoryAssessment MemoryMonitor::Assess() {
  return Assess(sampler_->Sample());
}

MemoryAssessment MemoryMonitor::Assess(const MemoryUsage& usage) const {
  MemoryAssessment a;
  a.usage = usage;
  const double soft_limit =
      static_cast<double>(limits_.max_heap_used) * (limits_.gc_threshold_percent / 100.0);
  a.above_soft_threshold = static_cast<double>(usage.heap_used) > soft_limit;
  a.heap_exceeded = usage.heap_used > limits_.max_heap_used;
  a.rss_exceeded = usage.rss > limits_.max_rss;
  return a;
}

bool MemoryMonitor::TriggerGcHint(const std::string& reason) {
  if (!limits_.enable_gc_hint) return false;
  malloc_trim(0);
  std::lock_guard<std::mutex> lock(mutex_);
  gc_runs_++;
  last_gc_time_ = std::chrono::system_clock::now();
  util::Logger::Debug("[MemoryMonitor] gc hint (" + reason + "), runs=" +
                      std::to_string(gc_runs_));
  return true;
}

MemoryMetrics MemoryMonitor::Metrics() {
  MemoryMetrics m;
  m.usage = sampler_->Sample();
  std::lock_guard<std::mutex> lock(mutex_);
  m.gc_runs = gc_runs_;
  m.last_gc_time = last_gc_time_;
  return m;
}

}  // namespace probekit::pool
