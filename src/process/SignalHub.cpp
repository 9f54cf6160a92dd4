// Repository: Probekit-core
// Component: Signal Hub
// Purpose: Single owner of SIGINT/SIGTERM for the whole program.
// Copyright (c) 2025 Probekit

#include "probekit/process/SignalHub.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

#include "probekit/process/ProcessSupervisor.hpp"
#include "probekit/util/Logger.hpp"

namespace probekit::process {

namespace {

using util::Logger;

// The async handler can only touch lock-free globals. g_owner_claimed keeps
// a second hub from stealing the handlers; g_wake_fd is the owner's pipe.
std::atomic<bool> g_owner_claimed{false};
std::atomic<int> g_wake_fd{-1};

struct sigaction g_previous_int;
struct sigaction g_previous_term;

void OnTerminationSignal(int signo) {
  const int saved_errno = errno;
  const int fd = g_wake_fd.load(std::memory_order_acquire);
  if (fd >= 0) {
    const unsigned char byte = static_cast<unsigned char>(signo);
    [[maybe_unused]] ssize_t n = ::write(fd, &byte, 1);
  }
  errno = saved_errno;
}

}  // namespace

SignalHub::SignalHub() = default;

SignalHub::~SignalHub() {
  Uninstall();
  JoinDispatcher();

  std::vector<ProcessSupervisor*> supervisors;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    supervisors.swap(supervisors_);
  }
  for (ProcessSupervisor* supervisor : supervisors) {
    supervisor->ForgetHub();
    const size_t killed = supervisor->KillAll(SIGKILL);
    if (killed > 0) {
      Logger::Warn("[SignalHub] Killed " + std::to_string(killed) +
                   " leftover process(es) at exit");
    }
  }
}

bool SignalHub::Install() {
  if (IsInstalled()) return true;
  if (dispatcher_thread_.joinable() &&
      dispatcher_thread_.get_id() == std::this_thread::get_id()) {
    Logger::Warn("[SignalHub] Install() from the dispatcher thread is not supported");
    return false;
  }
  JoinDispatcher();

  bool expected = false;
  if (!g_owner_claimed.compare_exchange_strong(expected, true)) {
    Logger::Warn("[SignalHub] Termination signals already owned by another hub");
    return false;
  }

  if (::pipe2(pipe_fds_, O_CLOEXEC | O_NONBLOCK) != 0) {
    Logger::Error(std::string("[SignalHub] pipe2 failed: ") + std::strerror(errno));
    g_owner_claimed.store(false);
    return false;
  }
  // Reader blocks; only the writer end must never block inside the handler.
  ::fcntl(pipe_fds_[0], F_SETFL, ::fcntl(pipe_fds_[0], F_GETFL) & ~O_NONBLOCK);
  g_wake_fd.store(pipe_fds_[1], std::memory_order_release);

  struct sigaction action;
  std::memset(&action, 0, sizeof(action));
  action.sa_handler = OnTerminationSignal;
  sigemptyset(&action.sa_mask);
  action.sa_flags = SA_RESTART;
  if (::sigaction(SIGINT, &action, &g_previous_int) != 0 ||
      ::sigaction(SIGTERM, &action, &g_previous_term) != 0) {
    Logger::Error(std::string("[SignalHub] sigaction failed: ") + std::strerror(errno));
    ::sigaction(SIGINT, &g_previous_int, nullptr);
    g_wake_fd.store(-1);
    ::close(pipe_fds_[0]);
    ::close(pipe_fds_[1]);
    pipe_fds_[0] = pipe_fds_[1] = -1;
    g_owner_claimed.store(false);
    return false;
  }

  installed_.store(true, std::memory_order_release);
  dispatcher_thread_ = std::thread(&SignalHub::DispatcherLoop, this);
  Logger::Debug("[SignalHub] Installed SIGINT/SIGTERM handlers");
  return true;
}

void SignalHub::Uninstall() {
  if (!installed_.exchange(false)) return;

  ::sigaction(SIGINT, &g_previous_int, nullptr);
  ::sigaction(SIGTERM, &g_previous_term, nullptr);
  g_wake_fd.store(-1, std::memory_order_release);

  // Closing the write end wakes the dispatcher with EOF.
  ::close(pipe_fds_[1]);
  pipe_fds_[1] = -1;
  g_owner_claimed.store(false, std::memory_order_release);
  JoinDispatcher();
}

// On the dispatcher thread itself (a termination callback that tears the
// runtime down) the join and the read end are left to the destructor.
void SignalHub::JoinDispatcher() {
  if (dispatcher_thread_.joinable()) {
    if (dispatcher_thread_.get_id() == std::this_thread::get_id()) return;
    dispatcher_thread_.join();
  }
  if (pipe_fds_[0] >= 0) {
    ::close(pipe_fds_[0]);
    pipe_fds_[0] = -1;
  }
}

void SignalHub::Attach(ProcessSupervisor* supervisor) {
  if (supervisor == nullptr) return;
  std::lock_guard<std::mutex> lock(mutex_);
  if (std::find(supervisors_.begin(), supervisors_.end(), supervisor) == supervisors_.end()) {
    supervisors_.push_back(supervisor);
  }
}

void SignalHub::Detach(ProcessSupervisor* supervisor) {
  std::lock_guard<std::mutex> lock(mutex_);
  supervisors_.erase(std::remove(supervisors_.begin(), supervisors_.end(), supervisor),
                     supervisors_.end());
}

size_t SignalHub::AttachedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return supervisors_.size();
}

void SignalHub::SetTerminationCallback(TerminationCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  on_termination_ = std::move(callback);
}

void SignalHub::SetGracePeriod(std::chrono::milliseconds grace) {
  std::lock_guard<std::mutex> lock(mutex_);
  grace_ = grace;
}

void SignalHub::Dispatch(int signo) {
  last_signal_.store(signo, std::memory_order_release);
  Logger::Info("[SignalHub] Received signal " + std::to_string(signo) +
               ", shutting down supervised processes");

  TerminationCallback callback;
  {
    // Held across the shutdowns so a concurrent Detach() (supervisor teardown)
    // waits until this pass no longer touches the supervisor.
    std::lock_guard<std::mutex> lock(mutex_);
    for (ProcessSupervisor* supervisor : supervisors_) {
      supervisor->Shutdown(grace_);
    }
    callback = on_termination_;
  }
  if (callback) {
    callback(signo);
  }
}

void SignalHub::DispatcherLoop() {
  while (true) {
    unsigned char byte = 0;
    const ssize_t n = ::read(pipe_fds_[0], &byte, 1);
    if (n == 1) {
      Dispatch(static_cast<int>(byte));
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    break;  // EOF: Uninstall() closed the write end
  }
}

}  // namespace probekit::process
