// Repository: Probekit-core
// Component: Harness Runtime
// Purpose: Composition root: signal hub, process supervisor, shell session
//          factory and pool, torn down in dependency order.
// Copyright (c) 2025 Probekit

#ifndef PROBEKIT_RUNTIME_HARNESS_RUNTIME_HPP_
#define PROBEKIT_RUNTIME_HARNESS_RUNTIME_HPP_

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>

#include "probekit/pool/MemoryMonitor.hpp"
#include "probekit/pool/PoolTypes.hpp"
#include "probekit/process/ProcessSupervisor.hpp"
#include "probekit/process/SignalHub.hpp"
#include "probekit/session/ShellSessionFactory.hpp"

namespace probekit::runtime {

struct RuntimeOptions {
  pool::ResourcePoolConfig pool;
  std::chrono::milliseconds shutdown_timeout{process::ProcessSupervisor::kDefaultShutdownTimeout};
  // Take over SIGINT/SIGTERM for the process (one runtime per program).
  bool install_signal_handlers = false;
};

class HarnessRuntime {
 public:
  explicit HarnessRuntime(RuntimeOptions options = RuntimeOptions(),
                          std::shared_ptr<pool::IMemorySampler> sampler = nullptr);
  ~HarnessRuntime();

  HarnessRuntime(const HarnessRuntime&) = delete;
  HarnessRuntime& operator=(const HarnessRuntime&) = delete;

  process::SignalHub& signal_hub() { return hub_; }
  process::ProcessSupervisor& supervisor() { return supervisor_; }
  session::ShellSessionPool& pool() { return *pool_; }
  const RuntimeOptions& options() const { return options_; }

  // Runs on the signal dispatcher thread after the supervisor has stopped
  // every child. The pool itself is torn down by Shutdown().
  void SetTerminationCallback(process::SignalHub::TerminationCallback callback);

  // Pool first (sessions end through the supervisor), then the supervisor.
  // Idempotent.
  void Shutdown();
  bool IsShutDown() const { return shut_down_.load(std::memory_order_acquire); }

 private:
  RuntimeOptions options_;
  process::SignalHub hub_;
  process::ProcessSupervisor supervisor_;
  std::shared_ptr<session::ShellSessionFactory> factory_;
  std::unique_ptr<session::ShellSessionPool> pool_;

  std::mutex shutdown_mutex_;
  std::atomic<bool> shut_down_{false};
};

}  // namespace probekit::runtime

#endif  // PROBEKIT_RUNTIME_HARNESS_RUNTIME_HPP_
