// Repository: Probekit-core
// Component: Resource Pool Types
// Purpose: Configuration and metrics structures shared by the pool, the
//          buffer cache and the memory monitor.
// Copyright (c) 2025 Probekit

#ifndef PROBEKIT_POOL_POOL_TYPES_HPP_
#define PROBEKIT_POOL_POOL_TYPES_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace probekit::pool {

// Plain aggregates, defaults match the harness's historical tuning.
struct PoolLimits {
  size_t max_size = 10;
  std::chrono::milliseconds idle_timeout{300'000};
  std::chrono::milliseconds max_age{1'800'000};
  std::chrono::milliseconds acquisition_timeout{30'000};
  std::chrono::milliseconds idle_check_interval{60'000};  // 0 disables the timer
};

struct MemoryLimits {
  uint64_t max_heap_used = 512ull * 1024 * 1024;
  uint64_t max_rss = 1024ull * 1024 * 1024;
  double gc_threshold_percent = 70.0;  // of max_heap_used
  std::chrono::milliseconds monitor_interval{10'000};  // 0 disables sampling
  bool enable_gc_hint = true;
};

struct BufferLimits {
  size_t max_buffer_size = 1024 * 1024;
  size_t max_total_buffers = 50;
  size_t compression_threshold = 64 * 1024;
  std::chrono::milliseconds rotation_interval{60'000};  // 0 disables periodic rotation
};

struct ResourcePoolConfig {
  PoolLimits pool;
  MemoryLimits memory;
  BufferLimits buffer;
  bool enable_metrics = true;
};

enum class DestroyReason {
  kResetFailed = 0,
  kIdleEviction = 1,      // idle_timeout or max_age exceeded
  kPressureEviction = 2,  // RSS over limit, every idle resource goes
  kShutdown = 3,
};

const char* DestroyReasonToString(DestroyReason reason);

struct MemoryUsage {
  uint64_t heap_used = 0;
  uint64_t heap_total = 0;
  uint64_t rss = 0;
};

struct LatencyStats {
  double avg_ms = 0.0;
  double p95_ms = 0.0;
  double p99_ms = 0.0;
  size_t samples = 0;
};

struct PoolMetrics {
  size_t total_resources = 0;
  size_t active_resources = 0;
  size_t idle_resources = 0;
  size_t pending_acquisitions = 0;
  size_t creating = 0;
  uint64_t total_created = 0;
  uint64_t total_destroyed = 0;
  uint64_t destroyed_reset_failed = 0;
  uint64_t destroyed_idle = 0;
  uint64_t destroyed_pressure = 0;
  uint64_t destroyed_shutdown = 0;
  uint64_t acquisition_timeouts = 0;
  LatencyStats acquisition_time;
};

struct MemoryMetrics {
  MemoryUsage usage;
  uint64_t gc_runs = 0;
  std::optional<std::chrono::system_clock::time_point> last_gc_time;
};

struct BufferMetrics {
  size_t total_buffers = 0;
  size_t total_size = 0;     // stored bytes (compressed where compressed)
  size_t logical_size = 0;   // bytes as handed to CreateBuffer
  size_t compressed_buffers = 0;
  double compression_ratio = 0.0;  // compressed_buffers / total_buffers
  uint64_t rotations = 0;
  uint64_t rotated_out = 0;
};

struct ResourceMetrics {
  PoolMetrics pool;
  MemoryMetrics memory;
  BufferMetrics buffers;
};

// Observer for pool events. Callbacks never run under pool locks; they may
// run on the caller's thread or on the pool maintenance thread.
class IPoolObserver {
 public:
  virtual ~IPoolObserver() = default;
  virtual void OnMemoryWarning(const MemoryUsage& /*usage*/) {}
  virtual void OnMemoryAlert(const MemoryUsage& /*usage*/) {}
  virtual void OnResourceCreated(const std::string& /*type*/, const std::string& /*id*/) {}
  virtual void OnResourceDestroyed(const std::string& /*type*/, const std::string& /*id*/,
                                   DestroyReason /*reason*/) {}
  virtual void OnBufferRotated(size_t /*removed_count*/) {}
  virtual void OnGcTriggered(const std::string& /*reason*/) {}
  virtual void OnMetricsUpdated(const ResourceMetrics& /*metrics*/) {}
  virtual void OnDestroyed() {}
  virtual void OnError(const std::string& /*message*/) {}
};

}  // namespace probekit::pool

#endif  // PROBEKIT_POOL_POOL_TYPES_HPP_
