// Repository: Probekit-core
// Component: Memory monitor unit tests

#include <gtest/gtest.h>

#include <memory>

#include "fixtures/RecordingObservers.h"
#include "probekit/pool/MemoryMonitor.hpp"

namespace probekit::pool {
namespace {

using tests::fixtures::FakeMemorySampler;

constexpr uint64_t kMiB = 1024ull * 1024;

MemoryLimits Limits() {
  MemoryLimits l;
  l.max_heap_used = 100 * kMiB;
  l.max_rss = 200 * kMiB;
  l.gc_threshold_percent = 70.0;
  return l;
}

TEST(MemoryMonitorTest, BelowSoftThresholdIsQuiet) {
  auto sampler = std::make_shared<FakeMemorySampler>();
  sampler->Set(50 * kMiB, 100 * kMiB);
  MemoryMonitor monitor(Limits(), sampler);
  MemoryAssessment a = monitor.Assess();
  EXPECT_FALSE(a.above_soft_threshold);
  EXPECT_FALSE(a.heap_exceeded);
  EXPECT_FALSE(a.rss_exceeded);
  EXPECT_EQ(sampler->samples(), 1);
}

TEST(MemoryMonitorTest, SoftThresholdOnly) {
  MemoryMonitor monitor(Limits(), std::make_shared<FakeMemorySampler>());
  MemoryUsage usage;
  usage.heap_used = 75 * kMiB;
  usage.rss = 100 * kMiB;
  MemoryAssessment a = monitor.Assess(usage);
  EXPECT_TRUE(a.above_soft_threshold);
  EXPECT_FALSE(a.heap_exceeded);
  EXPECT_FALSE(a.rss_exceeded);
}

TEST(MemoryMonitorTest, ThresholdsAreStrictlyGreaterThan) {
  MemoryMonitor monitor(Limits(), std::make_shared<FakeMemorySampler>());
  MemoryUsage usage;
  usage.heap_used = 100 * kMiB;
  usage.rss = 200 * kMiB;
  MemoryAssessment a = monitor.Assess(usage);
  EXPECT_TRUE(a.above_soft_threshold);
  EXPECT_FALSE(a.heap_exceeded);
  EXPECT_FALSE(a.rss_exceeded);

  usage.heap_used += 1;
  usage.rss += 1;
  a = monitor.Assess(usage);
  EXPECT_TRUE(a.heap_exceeded);
  EXPECT_TRUE(a.rss_exceeded);
}

TEST(MemoryMonitorTest, GcHintCountsRuns) {
  MemoryMonitor monitor(Limits(), std::make_shared<FakeMemorySampler>());
  EXPECT_EQ(monitor.Metrics().gc_runs, 0u);
  EXPECT_FALSE(monitor.Metrics().last_gc_time.has_value());
  EXPECT_TRUE(monitor.TriggerGcHint("manual"));
  EXPECT_TRUE(monitor.TriggerGcHint("manual"));
  MemoryMetrics m = monitor.Metrics();
  EXPECT_EQ(m.gc_runs, 2u);
  EXPECT_TRUE(m.last_gc_time.has_value());
}

TEST(MemoryMonitorTest, GcHintDisabled) {
  MemoryLimits limits = Limits();
  limits.enable_gc_hint = false;
  MemoryMonitor monitor(limits, std::make_shared<FakeMemorySampler>());
  EXPECT_FALSE(monitor.TriggerGcHint("manual"));
  EXPECT_EQ(monitor.Metrics().gc_runs, 0u);
}

TEST(ProcMemorySamplerTest, ReportsNonZeroRss) {
  ProcMemorySampler sampler;
  MemoryUsage usage = sampler.Sample();
  EXPECT_GT(usage.rss, 0u);
  EXPECT_GT(usage.heap_total, 0u);
}

}  // namespace
}  // namespace probekit::pool
