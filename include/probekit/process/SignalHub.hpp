// Repository: Probekit-core
// Component: Signal Hub
// Purpose: Single owner of SIGINT/SIGTERM for the whole program. Created once at
//          the composition root and injected into every ProcessSupervisor, so
//          supervisors never race each other to handle the same OS signal.
// Copyright (c) 2025 Probekit

#ifndef PROBEKIT_PROCESS_SIGNAL_HUB_HPP_
#define PROBEKIT_PROCESS_SIGNAL_HUB_HPP_

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace probekit::process {

class ProcessSupervisor;

// SignalHub fans a termination signal out to every attached supervisor.
//
// Install() takes over SIGINT/SIGTERM via sigaction. The async handler only
// writes the signal number to a self-pipe; a dispatcher thread reads it and
// runs Dispatch(), which shuts down attached supervisors (graceful, then
// forced) and finally calls the termination callback.
//
// Only one hub may own the OS handlers at a time; a second Install() returns
// false. Hubs that never call Install() are fully usable through Dispatch(),
// which is how tests drive them.
//
// Destroying the hub SIGKILLs whatever attached supervisors still track
// when the program exits without a clean shutdown.
class SignalHub {
 public:
  using TerminationCallback = std::function<void(int signo)>;

  static constexpr std::chrono::milliseconds kDefaultGracePeriod{5000};

  SignalHub();
  ~SignalHub();

  SignalHub(const SignalHub&) = delete;
  SignalHub& operator=(const SignalHub&) = delete;

  bool Install();
  void Uninstall();
  bool IsInstalled() const { return installed_.load(std::memory_order_acquire); }

  void Attach(ProcessSupervisor* supervisor);
  void Detach(ProcessSupervisor* supervisor);
  size_t AttachedCount() const;

  // Runs after attached supervisors are shut down (on the dispatcher thread
  // when the signal came from the OS).
  void SetTerminationCallback(TerminationCallback callback);
  void SetGracePeriod(std::chrono::milliseconds grace);

  // Shuts down every attached supervisor, then invokes the callback.
  void Dispatch(int signo);

  // Most recent signal dispatched, 0 if none.
  int LastSignal() const { return last_signal_.load(std::memory_order_acquire); }

 private:
  void DispatcherLoop();
  void JoinDispatcher();

  mutable std::mutex mutex_;
  std::vector<ProcessSupervisor*> supervisors_;
  TerminationCallback on_termination_;
  std::chrono::milliseconds grace_{kDefaultGracePeriod};

  std::atomic<bool> installed_{false};
  std::atomic<int> last_signal_{0};
  int pipe_fds_[2] = {-1, -1};
  std::thread dispatcher_thread_;
};

}  // namespace probekit::process

#endif  // PROBEKIT_PROCESS_SIGNAL_HUB_HPP_
