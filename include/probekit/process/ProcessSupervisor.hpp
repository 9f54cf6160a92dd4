// Repository: Probekit-core
// Component: Process Supervisor
// Purpose: Owns every child process the harness spawns and guarantees none is
//          orphaned or left as a zombie: process-group signalling, a reaper
//          thread, and a graceful-then-forced shutdown.
// Copyright (c) 2025 Probekit

#ifndef PROBEKIT_PROCESS_PROCESS_SUPERVISOR_HPP_
#define PROBEKIT_PROCESS_PROCESS_SUPERVISOR_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "probekit/process/ManagedProcess.hpp"
#include "probekit/time/IClock.hpp"
#include "probekit/wait/Waiter.hpp"

namespace probekit::process {

class SignalHub;

// Observer for supervisor lifecycle events. Callbacks run on the thread that
// observed the event (caller or reaper) and never under supervisor locks.
class IProcessObserver {
 public:
  virtual ~IProcessObserver() = default;
  virtual void OnProcessStarted(const ManagedProcess& /*process*/) {}
  // exit_code / term_signal are filled in on the record.
  virtual void OnProcessExited(const ManagedProcess& /*process*/) {}
  virtual void OnProcessKilled(const ManagedProcess& /*process*/, int /*signo*/) {}
  virtual void OnCleanupComplete(size_t /*reaped_count*/) {}
  // `process` is null when the failure is not tied to a tracked child.
  virtual void OnError(const std::string& /*message*/, const ManagedProcess* /*process*/) {}
};

// ProcessSupervisor tracks spawned children by pid.
//
// Children are spawned detached into their own process group by default so a
// kill reaches grandchildren too. A reaper thread polls waitpid(WNOHANG);
// reaped records leave the live table for a short history so a late
// WaitForExit() still sees the final record.
//
// Thread-safe: all public methods may be called from any thread.
class ProcessSupervisor {
 public:
  static constexpr std::chrono::milliseconds kDefaultShutdownTimeout{5000};
  static constexpr std::chrono::milliseconds kReapInterval{20};
  static constexpr size_t kFinishedHistory = 64;

  // `hub` (optional) is the program's signal owner; the supervisor attaches
  // itself on construction and detaches in Destroy().
  explicit ProcessSupervisor(SignalHub* hub = nullptr,
                             std::shared_ptr<time::IClock> clock = time::DefaultClock());
  ~ProcessSupervisor();

  ProcessSupervisor(const ProcessSupervisor&) = delete;
  ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

  // Spawns and tracks a child. Throws SpawnError on failure (after OnError),
  // ShuttingDownError once Shutdown()/Destroy() has begun.
  ManagedProcess Start(const std::string& command,
                       const std::vector<std::string>& args = {},
                       const SpawnOptions& options = SpawnOptions());

  // Signals the child's process group, falling back to the pid alone.
  // Returns false (never throws) for unknown or already-terminal pids and when
  // no signal could be delivered.
  bool Kill(pid_t pid, int signo = SIGTERM);

  // Signals every process below a tracked, live child but not the child
  // itself. Returns how many were signalled; 0 for unknown or terminal pids.
  size_t SignalDescendants(pid_t pid, int signo);

  // Kill() on every tracked child. Returns how many were signalled.
  size_t KillAll(int signo = SIGTERM);

  // Final record once the child is reaped; nullopt on timeout or unknown pid.
  std::optional<ManagedProcess> WaitForExit(pid_t pid, std::chrono::milliseconds timeout);

  // SIGTERM everything, wait up to timeout/2, SIGKILL what is left, wait up
  // to timeout/2, then report OnCleanupComplete. Runs once; later calls return.
  void Shutdown(std::chrono::milliseconds timeout = kDefaultShutdownTimeout);

  // Detaches from the hub, drops this instance's observers, stops the reaper
  // and SIGKILLs/reaps whatever is still alive. Idempotent.
  void Destroy();

  // Reaps exited children now. Returns how many were reaped.
  size_t ReapFinished();

  std::vector<ManagedProcess> GetProcesses() const;
  std::vector<ManagedProcess> GetRunningProcesses() const;
  // Live or recently finished record.
  std::optional<ManagedProcess> Find(pid_t pid) const;
  // Tracked and not yet reaped (a signalled child still counts).
  bool IsRunning(pid_t pid) const;
  size_t LiveCount() const;
  bool IsShuttingDown() const;

  void AddObserver(IProcessObserver* observer);
  void RemoveObserver(IProcessObserver* observer);

 private:
  friend class SignalHub;

  struct Event {
    enum class Kind { kStarted, kExited, kKilled, kError } kind;
    ManagedProcess process;
    bool has_process = true;
    int signo = 0;
    std::string message;
  };

  void ReaperLoop();
  void Emit(const std::vector<Event>& events);
  void EmitCleanupComplete(size_t reaped);
  void KillAndReapRemaining();
  std::optional<ManagedProcess> FindFinishedLocked(pid_t pid) const;
  void RetireLocked(std::unordered_map<pid_t, ManagedProcess>::iterator it);
  // Called by a hub that is being destroyed while still holding this supervisor.
  void ForgetHub() { hub_.store(nullptr, std::memory_order_release); }

  std::atomic<SignalHub*> hub_;
  std::shared_ptr<time::IClock> clock_;
  wait::Waiter waiter_;

  mutable std::mutex mutex_;
  std::condition_variable exit_cv_;
  std::unordered_map<pid_t, ManagedProcess> processes_;
  std::deque<ManagedProcess> finished_;
  bool shutting_down_ = false;
  bool shutdown_started_ = false;
  bool destroyed_ = false;

  std::mutex observers_mutex_;
  std::vector<IProcessObserver*> observers_;

  std::mutex reaper_mutex_;
  std::condition_variable reaper_cv_;
  bool reaper_stop_ = false;
  std::thread reaper_thread_;
};

}  // namespace probekit::process

#endif  // PROBEKIT_PROCESS_PROCESS_SUPERVISOR_HPP_
