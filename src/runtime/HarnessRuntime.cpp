// Repository: Probekit-core
// Component: Harness Runtime
// Purpose: Composition root: signal hub, process supervisor, shell session
//          factory and pool, torn down in dependency order.
// Copyright (c) 2025 Probekit

#include "probekit/runtime/HarnessRuntime.hpp"

#include "probekit/util/Logger.hpp"

namespace probekit::runtime {

HarnessRuntime::HarnessRuntime(RuntimeOptions options,
                               std::shared_ptr<pool::IMemorySampler> sampler)
    : options_(std::move(options)),
      supervisor_(&hub_),
      factory_(std::make_shared<session::ShellSessionFactory>(supervisor_)) {
  hub_.SetGracePeriod(options_.shutdown_timeout);
  if (options_.install_signal_handlers && !hub_.Install()) {
    util::Logger::Warn("[Runtime] signal handlers already owned elsewhere; "
                       "SIGINT/SIGTERM will not reach this runtime");
  }
  pool_ = std::make_unique<session::ShellSessionPool>(factory_, options_.pool, std::move(sampler));
  util::Logger::Info("[Runtime] started (pool max_size=" +
                     std::to_string(options_.pool.pool.max_size) + ")");
}

HarnessRuntime::~HarnessRuntime() {
  Shutdown();
}

void HarnessRuntime::SetTerminationCallback(process::SignalHub::TerminationCallback callback) {
  hub_.SetTerminationCallback(std::move(callback));
}

void HarnessRuntime::Shutdown() {
  std::lock_guard<std::mutex> lock(shutdown_mutex_);
  if (shut_down_.load(std::memory_order_acquire)) return;

  util::Logger::Info("[Runtime] shutting down");
  pool_->Destroy();
  supervisor_.Shutdown(options_.shutdown_timeout);
  supervisor_.Destroy();
  hub_.Uninstall();
  shut_down_.store(true, std::memory_order_release);
  util::Logger::Info("[Runtime] shutdown complete");
}

}  // namespace probekit::runtime
