// Repository: Probekit-core
// Component: Latency window unit tests

#include <gtest/gtest.h>

#include "probekit/pool/LatencyWindow.hpp"

namespace probekit::pool {
namespace {

TEST(LatencyWindowTest, EmptyWindowReportsZeros) {
  LatencyWindow window;
  LatencyStats s = window.Stats();
  EXPECT_EQ(s.samples, 0u);
  EXPECT_DOUBLE_EQ(s.avg_ms, 0.0);
  EXPECT_DOUBLE_EQ(s.p95_ms, 0.0);
  EXPECT_DOUBLE_EQ(s.p99_ms, 0.0);
}

TEST(LatencyWindowTest, PercentilesUseNearestRank) {
  LatencyWindow window;
  // Inserted out of order; 1..100 ms.
  for (int i = 100; i >= 1; --i) window.Record(static_cast<double>(i));
  LatencyStats s = window.Stats();
  EXPECT_EQ(s.samples, 100u);
  EXPECT_DOUBLE_EQ(s.avg_ms, 50.5);
  EXPECT_DOUBLE_EQ(s.p95_ms, 96.0);  // sorted[95]
  EXPECT_DOUBLE_EQ(s.p99_ms, 100.0);  // sorted[99]
}

TEST(LatencyWindowTest, KeepsOnlyMostRecentSamples) {
  LatencyWindow window(100);
  for (int i = 0; i < 150; ++i) window.Record(i < 50 ? 1000.0 : 10.0);
  EXPECT_EQ(window.size(), 100u);
  EXPECT_DOUBLE_EQ(window.Stats().avg_ms, 10.0);
}

TEST(LatencyWindowTest, SingleSample) {
  LatencyWindow window;
  window.Record(7.0);
  LatencyStats s = window.Stats();
  EXPECT_DOUBLE_EQ(s.avg_ms, 7.0);
  EXPECT_DOUBLE_EQ(s.p95_ms, 7.0);
  EXPECT_DOUBLE_EQ(s.p99_ms, 7.0);
}

}  // namespace
}  // namespace probekit::pool
