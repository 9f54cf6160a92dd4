// Repository: Probekit-core
// Component: Resource Pool
// Purpose: Bounded pool of reusable resources with FIFO overflow queueing,
//          idle/age eviction, a buffer cache and memory-pressure handling.
// Copyright (c) 2025 Probekit

#ifndef PROBEKIT_POOL_RESOURCE_POOL_HPP_
#define PROBEKIT_POOL_RESOURCE_POOL_HPP_

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <exception>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "probekit/pool/BufferCache.hpp"
#include "probekit/pool/IResourceFactory.hpp"
#include "probekit/pool/LatencyWindow.hpp"
#include "probekit/pool/MemoryMonitor.hpp"
#include "probekit/pool/PoolTypes.hpp"
#include "probekit/time/IClock.hpp"
#include "probekit/util/Errors.hpp"
#include "probekit/util/Logger.hpp"
#include "probekit/wait/Waiter.hpp"

namespace probekit::pool {

// ResourcePool owns every resource it hands out.
//
// Acquire() returns an idle resource with the same ConfigKey, creates a new
// one while total + in-flight creations < max_size, or queues the caller
// until a matching release, a freed slot, the acquisition timeout, or
// Destroy(). Callers must Release() what they acquire and must not keep the
// pointer afterwards.
//
// A maintenance thread (started when any interval is non-zero) runs the
// memory check, periodic buffer rotation and idle cleanup.
//
// Thread-safe. Observer callbacks never run under pool locks.
template <typename Resource, typename Config>
class ResourcePool {
 public:
  using Factory = IResourceFactory<Resource, Config>;
  using ResourcePtr = std::shared_ptr<Resource>;

  static constexpr const char* kComponentName = "Resource pool";
  static constexpr std::chrono::milliseconds kCreateDrainTimeout{2000};

  ResourcePool(std::shared_ptr<Factory> factory,
               const ResourcePoolConfig& config = ResourcePoolConfig(),
               std::shared_ptr<IMemorySampler> sampler = nullptr,
               std::shared_ptr<time::IClock> clock = time::DefaultClock());
  ~ResourcePool();

  ResourcePool(const ResourcePool&) = delete;
  ResourcePool& operator=(const ResourcePool&) = delete;

  // Throws util::ShuttingDownError after Destroy(), util::AcquisitionTimeoutError
  // when queued past acquisition_timeout, or whatever the factory's Create threw.
  ResourcePtr Acquire(const Config& config);

  // Resets and returns the resource to the idle set (or destroys it when the
  // reset fails). Unknown resources and releases after Destroy() are ignored.
  void Release(const ResourcePtr& resource);

  // Destroys idle resources past idle_timeout or max_age. Returns count.
  size_t CleanupIdle();

  // Samples memory once and applies the escalating responses.
  MemoryAssessment RunMemoryCheck();

  size_t RotateBuffers(bool force);
  void TriggerGarbageCollection(const std::string& reason = "manual");

  std::string CreateBuffer(const std::vector<uint8_t>& bytes, bool compress = false);
  std::string CreateBuffer(const std::string& text, bool compress = false);
  std::optional<std::vector<uint8_t>> GetBuffer(const std::string& id);
  bool DestroyBuffer(const std::string& id);

  ResourceMetrics GetMetrics();

  // Rejects pending acquisitions, destroys every resource, clears buffers and
  // emits OnDestroyed. Idempotent.
  void Destroy();

  bool IsDestroyed() const;
  size_t Size() const;
  size_t PendingCount() const;
  const ResourcePoolConfig& config() const { return config_; }

  void AddObserver(IPoolObserver* observer);
  void RemoveObserver(IPoolObserver* observer);

 private:
  struct Pooled {
    std::string id;
    std::string config_key;
    ResourcePtr resource;
    time::IClock::TimePoint created_at;
    time::IClock::TimePoint last_used;
    uint64_t use_count = 0;
    bool in_use = false;
  };

  enum class PendingState { kWaiting, kGranted, kSlotGranted, kRejected };

  // Lives in pending_ only while kWaiting; whoever changes the state removes it.
  struct Pending {
    std::string config_key;
    PendingState state = PendingState::kWaiting;
    ResourcePtr granted;
    std::condition_variable cv;
  };

  struct Doomed {
    std::string id;
    ResourcePtr resource;
    DestroyReason reason;
  };

  using PooledList = std::list<Pooled>;

  ResourcePtr CreateForCaller(const Config& config, const std::string& key,
                              time::IClock::TimePoint started);
  size_t EvictIdle(bool everything, DestroyReason reason);
  void DestroyOutsideLock(const Doomed& doomed);
  void FinishAcquire(time::IClock::TimePoint started);
  void OnBuffersRotated(size_t removed);

  Pooled* FindIdleLocked(const std::string& key);
  typename PooledList::iterator FindLocked(const Resource* resource);
  typename PooledList::iterator FindLocked(const std::string& id);
  ResourcePtr MarkActiveLocked(Pooled& pooled);
  bool HasCapacityLocked() const;
  bool GrantIdleLocked();
  bool GrantSlotLocked();
  void CountDestroyLocked(DestroyReason reason);

  bool MaintenanceEnabled() const;
  void MaintenanceLoop();
  void StopMaintenance();
  bool MaintenanceStopRequested();

  template <typename Fn>
  void ForEachObserver(Fn&& fn);
  void NotifyMetrics();
  void NotifyError(const std::string& message);

  std::shared_ptr<Factory> factory_;
  const ResourcePoolConfig config_;
  const std::string type_name_;
  std::shared_ptr<time::IClock> clock_;
  wait::Waiter waiter_;
  MemoryMonitor monitor_;
  BufferCache buffers_;
  LatencyWindow latency_;

  mutable std::mutex mutex_;
  PooledList resources_;
  std::list<std::shared_ptr<Pending>> pending_;  // FIFO
  size_t creating_ = 0;
  uint64_t id_counter_ = 0;
  uint64_t total_created_ = 0;
  uint64_t total_destroyed_ = 0;
  uint64_t destroyed_reset_failed_ = 0;
  uint64_t destroyed_idle_ = 0;
  uint64_t destroyed_pressure_ = 0;
  uint64_t destroyed_shutdown_ = 0;
  uint64_t acquisition_timeouts_ = 0;
  bool destroyed_ = false;

  std::mutex observers_mutex_;
  std::vector<IPoolObserver*> observers_;

  std::mutex maintenance_mutex_;
  std::condition_variable maintenance_cv_;
  bool maintenance_stop_ = false;
  std::thread maintenance_thread_;
};

// ---------------------------------------------------------------------------
// Implementation
// ---------------------------------------------------------------------------

template <typename Resource, typename Config>
ResourcePool<Resource, Config>::ResourcePool(std::shared_ptr<Factory> factory,
                                             const ResourcePoolConfig& config,
                                             std::shared_ptr<IMemorySampler> sampler,
                                             std::shared_ptr<time::IClock> clock)
    : factory_(std::move(factory)),
      config_(config),
      type_name_(factory_ ? factory_->TypeName() : std::string()),
      clock_(std::move(clock)),
      waiter_(clock_),
      monitor_(config.memory, std::move(sampler)),
      buffers_(config.buffer, clock_) {
  if (!factory_) {
    throw std::invalid_argument("ResourcePool requires a resource factory");
  }
  buffers_.SetRotationListener([this](size_t removed) { OnBuffersRotated(removed); });
  if (MaintenanceEnabled()) {
    maintenance_thread_ = std::thread([this] { MaintenanceLoop(); });
  }
  util::Logger::Debug("[ResourcePool] created for " + type_name_ + " max_size=" +
                      std::to_string(config_.pool.max_size));
}

template <typename Resource, typename Config>
ResourcePool<Resource, Config>::~ResourcePool() {
  Destroy();
  StopMaintenance();
}

template <typename Resource, typename Config>
typename ResourcePool<Resource, Config>::ResourcePtr ResourcePool<Resource, Config>::Acquire(
    const Config& config) {
  const auto started = clock_->Now();
  const std::string key = factory_->ConfigKey(config);

  std::unique_lock<std::mutex> lock(mutex_);
  if (destroyed_) throw util::ShuttingDownError(kComponentName);

  if (Pooled* idle = FindIdleLocked(key)) {
    ResourcePtr resource = MarkActiveLocked(*idle);
    lock.unlock();
    FinishAcquire(started);
    return resource;
  }

  if (HasCapacityLocked()) {
    ++creating_;
    lock.unlock();
    return CreateForCaller(config, key, started);
  }

  auto pending = std::make_shared<Pending>();
  pending->config_key = key;
  pending_.push_back(pending);
  util::Logger::Debug("[ResourcePool] queued acquisition for key " + key + " (pending=" +
                      std::to_string(pending_.size()) + ")");

  const auto deadline = std::chrono::steady_clock::now() + config_.pool.acquisition_timeout;
  const bool settled = pending->cv.wait_until(
      lock, deadline, [&pending] { return pending->state != PendingState::kWaiting; });

  if (!settled) {
    pending_.remove(pending);
    ++acquisition_timeouts_;
    lock.unlock();
    util::Logger::Warn("[ResourcePool] acquisition timed out after " +
                       std::to_string(config_.pool.acquisition_timeout.count()) + "ms");
    throw util::AcquisitionTimeoutError(config_.pool.acquisition_timeout);
  }

  switch (pending->state) {
    case PendingState::kGranted: {
      ResourcePtr resource = std::move(pending->granted);
      lock.unlock();
      FinishAcquire(started);
      return resource;
    }
    case PendingState::kSlotGranted:
      lock.unlock();
      return CreateForCaller(config, key, started);
    case PendingState::kRejected:
    case PendingState::kWaiting:
      break;
  }
  throw util::ShuttingDownError(kComponentName);
}

// Caller holds one unit of creating_.
template <typename Resource, typename Config>
typename ResourcePool<Resource, Config>::ResourcePtr
ResourcePool<Resource, Config>::CreateForCaller(const Config& config, const std::string& key,
                                                time::IClock::TimePoint started) {
  auto give_back_slot = [this] {
    std::lock_guard<std::mutex> lock(mutex_);
    --creating_;
    if (!destroyed_) GrantSlotLocked();
  };

  ResourcePtr resource;
  try {
    resource = factory_->Create(config);
    if (!resource) {
      throw util::ProbekitError(type_name_ + " factory returned no resource");
    }
  } catch (...) {
    util::Logger::Warn("[ResourcePool] create " + type_name_ +
                       " failed: " + util::DescribeCurrentException());
    give_back_slot();
    throw;
  }

  std::string id;
  bool rejected = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    --creating_;
    if (destroyed_) {
      rejected = true;
    } else {
      const auto now = clock_->Now();
      Pooled pooled;
      pooled.id = type_name_ + "_" + std::to_string(++id_counter_);
      pooled.config_key = key;
      pooled.resource = resource;
      pooled.created_at = now;
      pooled.last_used = now;
      pooled.use_count = 1;
      pooled.in_use = true;
      id = pooled.id;
      resources_.push_back(std::move(pooled));
      ++total_created_;
    }
  }

  if (rejected) {
    try {
      factory_->Destroy(*resource);
    } catch (...) {
      util::Logger::Warn("[ResourcePool] destroy of late " + type_name_ +
                         " failed: " + util::DescribeCurrentException());
    }
    throw util::ShuttingDownError(kComponentName);
  }

  util::Logger::Debug("[ResourcePool] created " + id + " key=" + key);
  ForEachObserver([&](IPoolObserver* o) { o->OnResourceCreated(type_name_, id); });
  FinishAcquire(started);
  return resource;
}

template <typename Resource, typename Config>
void ResourcePool<Resource, Config>::Release(const ResourcePtr& resource) {
  if (!resource) return;

  std::string id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) {
      util::Logger::Debug("[ResourcePool] release after destroy ignored");
      return;
    }
    auto it = FindLocked(resource.get());
    if (it == resources_.end() || !it->in_use) {
      util::Logger::Warn("[ResourcePool] release of unknown or idle " + type_name_ + " ignored");
      return;
    }
    id = it->id;
  }

  bool clean = false;
  try {
    clean = factory_->Reset(*resource);
  } catch (...) {
    util::Logger::Warn("[ResourcePool] reset of " + id +
                       " threw: " + util::DescribeCurrentException());
    clean = false;
  }

  std::optional<Doomed> doomed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = FindLocked(id);
    if (it == resources_.end()) return;  // destroyed concurrently
    if (clean) {
      it->in_use = false;
      it->last_used = clock_->Now();
      GrantIdleLocked();
    } else {
      doomed = Doomed{it->id, it->resource, DestroyReason::kResetFailed};
      CountDestroyLocked(DestroyReason::kResetFailed);
      resources_.erase(it);
      GrantSlotLocked();
    }
  }

  if (doomed) {
    util::Logger::Warn("[ResourcePool] reset failed, destroying " + doomed->id);
    DestroyOutsideLock(*doomed);
  }
  NotifyMetrics();
}

template <typename Resource, typename Config>
size_t ResourcePool<Resource, Config>::CleanupIdle() {
  return EvictIdle(false, DestroyReason::kIdleEviction);
}

template <typename Resource, typename Config>
size_t ResourcePool<Resource, Config>::EvictIdle(bool everything, DestroyReason reason) {
  std::vector<Doomed> doomed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) return 0;
    const auto now = clock_->Now();
    for (auto it = resources_.begin(); it != resources_.end();) {
      const bool expired = everything || now - it->last_used >= config_.pool.idle_timeout ||
                           now - it->created_at >= config_.pool.max_age;
      if (!it->in_use && expired) {
        doomed.push_back(Doomed{it->id, it->resource, reason});
        CountDestroyLocked(reason);
        it = resources_.erase(it);
      } else {
        ++it;
      }
    }
    for (size_t i = 0; i < doomed.size(); ++i) {
      if (!GrantSlotLocked()) break;
    }
  }

  for (const auto& d : doomed) DestroyOutsideLock(d);
  if (!doomed.empty()) {
    util::Logger::Info("[ResourcePool] evicted " + std::to_string(doomed.size()) + " idle " +
                       type_name_ + " (" + DestroyReasonToString(reason) + ")");
    NotifyMetrics();
  }
  return doomed.size();
}

template <typename Resource, typename Config>
MemoryAssessment ResourcePool<Resource, Config>::RunMemoryCheck() {
  const MemoryAssessment assessment = monitor_.Assess();
  const MemoryUsage& usage = assessment.usage;

  if (assessment.above_soft_threshold) {
    util::Logger::Warn("[ResourcePool] heap " + std::to_string(usage.heap_used) +
                       " bytes above soft threshold");
    ForEachObserver([&](IPoolObserver* o) { o->OnMemoryWarning(usage); });
    // An observer may have destroyed the pool.
    if (IsDestroyed()) return assessment;
    TriggerGarbageCollection("high_memory");
  }

  if (assessment.heap_exceeded) {
    util::Logger::Warn("[ResourcePool] heap limit exceeded, evicting idle and rotating buffers");
    ForEachObserver([&](IPoolObserver* o) { o->OnMemoryAlert(usage); });
    if (IsDestroyed()) return assessment;
    CleanupIdle();
    buffers_.Rotate(true);
  }

  if (assessment.rss_exceeded) {
    util::Logger::Warn("[ResourcePool] rss " + std::to_string(usage.rss) +
                       " bytes over limit, aggressive cleanup");
    ForEachObserver([&](IPoolObserver* o) { o->OnMemoryAlert(usage); });
    if (IsDestroyed()) return assessment;
    EvictIdle(true, DestroyReason::kPressureEviction);
    if (buffers_.AggressiveClear() > 0) NotifyMetrics();
    TriggerGarbageCollection("memory_pressure");
  }
  return assessment;
}

template <typename Resource, typename Config>
size_t ResourcePool<Resource, Config>::RotateBuffers(bool force) {
  return buffers_.Rotate(force);
}

template <typename Resource, typename Config>
void ResourcePool<Resource, Config>::TriggerGarbageCollection(const std::string& reason) {
  if (monitor_.TriggerGcHint(reason)) {
    ForEachObserver([&](IPoolObserver* o) { o->OnGcTriggered(reason); });
  }
}

template <typename Resource, typename Config>
std::string ResourcePool<Resource, Config>::CreateBuffer(const std::vector<uint8_t>& bytes,
                                                         bool compress) {
  if (IsDestroyed()) throw util::ShuttingDownError(kComponentName);
  std::string id = buffers_.CreateBuffer(bytes, compress);
  NotifyMetrics();
  return id;
}

template <typename Resource, typename Config>
std::string ResourcePool<Resource, Config>::CreateBuffer(const std::string& text, bool compress) {
  return CreateBuffer(std::vector<uint8_t>(text.begin(), text.end()), compress);
}

template <typename Resource, typename Config>
std::optional<std::vector<uint8_t>> ResourcePool<Resource, Config>::GetBuffer(
    const std::string& id) {
  return buffers_.GetBuffer(id);
}

template <typename Resource, typename Config>
bool ResourcePool<Resource, Config>::DestroyBuffer(const std::string& id) {
  const bool removed = buffers_.DestroyBuffer(id);
  if (removed) NotifyMetrics();
  return removed;
}

template <typename Resource, typename Config>
ResourceMetrics ResourcePool<Resource, Config>::GetMetrics() {
  ResourceMetrics m;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    m.pool.total_resources = resources_.size();
    for (const auto& p : resources_) {
      if (p.in_use) m.pool.active_resources++;
    }
    m.pool.idle_resources = m.pool.total_resources - m.pool.active_resources;
    m.pool.pending_acquisitions = pending_.size();
    m.pool.creating = creating_;
    m.pool.total_created = total_created_;
    m.pool.total_destroyed = total_destroyed_;
    m.pool.destroyed_reset_failed = destroyed_reset_failed_;
    m.pool.destroyed_idle = destroyed_idle_;
    m.pool.destroyed_pressure = destroyed_pressure_;
    m.pool.destroyed_shutdown = destroyed_shutdown_;
    m.pool.acquisition_timeouts = acquisition_timeouts_;
  }
  m.pool.acquisition_time = latency_.Stats();
  m.memory = monitor_.Metrics();
  m.buffers = buffers_.Metrics();
  return m;
}

template <typename Resource, typename Config>
void ResourcePool<Resource, Config>::Destroy() {
  std::vector<Doomed> doomed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) return;
    destroyed_ = true;
    for (auto& pending : pending_) {
      pending->state = PendingState::kRejected;
      pending->cv.notify_all();
    }
    pending_.clear();
    for (auto& p : resources_) {
      doomed.push_back(Doomed{p.id, p.resource, DestroyReason::kShutdown});
      CountDestroyLocked(DestroyReason::kShutdown);
    }
    resources_.clear();
  }

  StopMaintenance();

  // In-flight creations see destroyed_ and dispose of their resource.
  wait::WaitOptions drain;
  drain.initial_delay = std::chrono::milliseconds(5);
  drain.max_delay = std::chrono::milliseconds(50);
  drain.timeout = kCreateDrainTimeout;
  drain.jitter = 0.0;
  auto drained = waiter_.WaitUntil(
      [this] {
        std::lock_guard<std::mutex> lock(mutex_);
        return creating_ == 0;
      },
      drain);
  if (!drained.success) {
    util::Logger::Warn("[ResourcePool] creations still in flight after " +
                       std::to_string(kCreateDrainTimeout.count()) + "ms");
  }

  for (const auto& d : doomed) DestroyOutsideLock(d);
  buffers_.Clear();
  TriggerGarbageCollection("shutdown");

  util::Logger::Info("[ResourcePool] destroyed (" + std::to_string(doomed.size()) + " " +
                     type_name_ + " released)");
  NotifyMetrics();
  ForEachObserver([](IPoolObserver* o) { o->OnDestroyed(); });
}

template <typename Resource, typename Config>
bool ResourcePool<Resource, Config>::IsDestroyed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return destroyed_;
}

template <typename Resource, typename Config>
size_t ResourcePool<Resource, Config>::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return resources_.size();
}

template <typename Resource, typename Config>
size_t ResourcePool<Resource, Config>::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

template <typename Resource, typename Config>
void ResourcePool<Resource, Config>::AddObserver(IPoolObserver* observer) {
  if (!observer) return;
  std::lock_guard<std::mutex> lock(observers_mutex_);
  if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end()) {
    observers_.push_back(observer);
  }
}

template <typename Resource, typename Config>
void ResourcePool<Resource, Config>::RemoveObserver(IPoolObserver* observer) {
  std::lock_guard<std::mutex> lock(observers_mutex_);
  observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

template <typename Resource, typename Config>
void ResourcePool<Resource, Config>::DestroyOutsideLock(const Doomed& doomed) {
  try {
    factory_->Destroy(*doomed.resource);
  } catch (...) {
    const std::string message =
        "destroy of " + doomed.id + " failed: " + util::DescribeCurrentException();
    util::Logger::Warn("[ResourcePool] " + message);
    NotifyError(message);
  }
  util::Logger::Debug("[ResourcePool] destroyed " + doomed.id + " (" +
                      DestroyReasonToString(doomed.reason) + ")");
  ForEachObserver([&](IPoolObserver* o) {
    o->OnResourceDestroyed(type_name_, doomed.id, doomed.reason);
  });
}

template <typename Resource, typename Config>
void ResourcePool<Resource, Config>::FinishAcquire(time::IClock::TimePoint started) {
  const auto elapsed =
      std::chrono::duration<double, std::milli>(clock_->Now() - started).count();
  latency_.Record(elapsed);
  NotifyMetrics();
}

template <typename Resource, typename Config>
void ResourcePool<Resource, Config>::OnBuffersRotated(size_t removed) {
  util::Logger::Debug("[ResourcePool] buffer rotation removed " + std::to_string(removed));
  ForEachObserver([&](IPoolObserver* o) { o->OnBufferRotated(removed); });
  NotifyMetrics();
}

template <typename Resource, typename Config>
typename ResourcePool<Resource, Config>::Pooled* ResourcePool<Resource, Config>::FindIdleLocked(
    const std::string& key) {
  for (auto& p : resources_) {
    if (!p.in_use && p.config_key == key) return &p;
  }
  return nullptr;
}

template <typename Resource, typename Config>
typename ResourcePool<Resource, Config>::PooledList::iterator
ResourcePool<Resource, Config>::FindLocked(const Resource* resource) {
  return std::find_if(resources_.begin(), resources_.end(),
                      [resource](const Pooled& p) { return p.resource.get() == resource; });
}

template <typename Resource, typename Config>
typename ResourcePool<Resource, Config>::PooledList::iterator
ResourcePool<Resource, Config>::FindLocked(const std::string& id) {
  return std::find_if(resources_.begin(), resources_.end(),
                      [&id](const Pooled& p) { return p.id == id; });
}

template <typename Resource, typename Config>
typename ResourcePool<Resource, Config>::ResourcePtr
ResourcePool<Resource, Config>::MarkActiveLocked(Pooled& pooled) {
  pooled.in_use = true;
  pooled.last_used = clock_->Now();
  pooled.use_count++;
  return pooled.resource;
}

// max_size 0 is treated as 1.
template <typename Resource, typename Config>
bool ResourcePool<Resource, Config>::HasCapacityLocked() const {
  return resources_.size() + creating_ < std::max<size_t>(config_.pool.max_size, 1);
}

// FIFO scan: the first waiter whose key has an idle match gets it. One waiter at most.
template <typename Resource, typename Config>
bool ResourcePool<Resource, Config>::GrantIdleLocked() {
  for (auto it = pending_.begin(); it != pending_.end(); ++it) {
    Pooled* idle = FindIdleLocked((*it)->config_key);
    if (!idle) continue;
    std::shared_ptr<Pending> waiter = *it;
    pending_.erase(it);
    waiter->granted = MarkActiveLocked(*idle);
    waiter->state = PendingState::kGranted;
    waiter->cv.notify_all();
    return true;
  }
  return false;
}

// Hands a free creation slot to the FIFO-earliest waiter.
template <typename Resource, typename Config>
bool ResourcePool<Resource, Config>::GrantSlotLocked() {
  if (pending_.empty() || !HasCapacityLocked()) return false;
  std::shared_ptr<Pending> waiter = pending_.front();
  pending_.pop_front();
  ++creating_;
  waiter->state = PendingState::kSlotGranted;
  waiter->cv.notify_all();
  return true;
}

template <typename Resource, typename Config>
void ResourcePool<Resource, Config>::CountDestroyLocked(DestroyReason reason) {
  ++total_destroyed_;
  switch (reason) {
    case DestroyReason::kResetFailed: ++destroyed_reset_failed_; break;
    case DestroyReason::kIdleEviction: ++destroyed_idle_; break;
    case DestroyReason::kPressureEviction: ++destroyed_pressure_; break;
    case DestroyReason::kShutdown: ++destroyed_shutdown_; break;
  }
}

template <typename Resource, typename Config>
bool ResourcePool<Resource, Config>::MaintenanceEnabled() const {
  return config_.memory.monitor_interval.count() > 0 ||
         config_.buffer.rotation_interval.count() > 0 ||
         config_.pool.idle_check_interval.count() > 0;
}

template <typename Resource, typename Config>
void ResourcePool<Resource, Config>::MaintenanceLoop() {
  using SteadyClock = std::chrono::steady_clock;
  struct Task {
    std::chrono::milliseconds interval;
    SteadyClock::time_point due;
    const char* name;
  };

  const auto now = SteadyClock::now();
  std::vector<Task> tasks;
  if (config_.memory.monitor_interval.count() > 0) {
    tasks.push_back({config_.memory.monitor_interval, now + config_.memory.monitor_interval,
                     "memory_check"});
  }
  if (config_.buffer.rotation_interval.count() > 0) {
    tasks.push_back({config_.buffer.rotation_interval, now + config_.buffer.rotation_interval,
                     "buffer_rotation"});
  }
  if (config_.pool.idle_check_interval.count() > 0) {
    tasks.push_back({config_.pool.idle_check_interval, now + config_.pool.idle_check_interval,
                     "idle_cleanup"});
  }

  std::unique_lock<std::mutex> lock(maintenance_mutex_);
  while (!maintenance_stop_ && !tasks.empty()) {
    auto wake = tasks.front().due;
    for (const auto& t : tasks) wake = std::min(wake, t.due);
    maintenance_cv_.wait_until(lock, wake, [this] { return maintenance_stop_; });
    if (maintenance_stop_) break;
    lock.unlock();

    const auto tick = SteadyClock::now();
    bool stop = false;
    for (auto& task : tasks) {
      if (tick < task.due) continue;
      task.due = tick + task.interval;
      const std::string name = task.name;
      try {
        if (name == "memory_check") {
          RunMemoryCheck();
        } else if (name == "buffer_rotation") {
          buffers_.Rotate(false);
        } else {
          CleanupIdle();
        }
      } catch (...) {
        const std::string what = util::DescribeCurrentException();
        util::Logger::Error("[ResourcePool] " + name + " failed: " + what);
        NotifyError(name + " failed: " + what);
      }
      if (MaintenanceStopRequested()) {
        stop = true;
        break;
      }
    }
    if (stop) break;
    lock.lock();
  }
}

template <typename Resource, typename Config>
void ResourcePool<Resource, Config>::StopMaintenance() {
  {
    std::lock_guard<std::mutex> lock(maintenance_mutex_);
    maintenance_stop_ = true;
  }
  maintenance_cv_.notify_all();
  if (!maintenance_thread_.joinable()) return;
  // Destroy() reached from a maintenance-task observer only raises the stop
  // flag; the loop exits after that task and the destructor joins it.
  if (maintenance_thread_.get_id() == std::this_thread::get_id()) return;
  maintenance_thread_.join();
}

template <typename Resource, typename Config>
bool ResourcePool<Resource, Config>::MaintenanceStopRequested() {
  std::lock_guard<std::mutex> lock(maintenance_mutex_);
  return maintenance_stop_;
}

template <typename Resource, typename Config>
template <typename Fn>
void ResourcePool<Resource, Config>::ForEachObserver(Fn&& fn) {
  std::vector<IPoolObserver*> observers;
  {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers = observers_;
  }
  for (IPoolObserver* o : observers) fn(o);
}

template <typename Resource, typename Config>
void ResourcePool<Resource, Config>::NotifyMetrics() {
  if (!config_.enable_metrics) return;
  {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    if (observers_.empty()) return;
  }
  const ResourceMetrics metrics = GetMetrics();
  ForEachObserver([&](IPoolObserver* o) { o->OnMetricsUpdated(metrics); });
}

template <typename Resource, typename Config>
void ResourcePool<Resource, Config>::NotifyError(const std::string& message) {
  ForEachObserver([&](IPoolObserver* o) { o->OnError(message); });
}

}  // namespace probekit::pool

#endif  // PROBEKIT_POOL_RESOURCE_POOL_HPP_
