// Repository: Probekit-core
// Component: Process Supervisor
// Purpose: Spawn, signal, reap and shut down child processes.
// Copyright (c) 2025 Probekit

#include "probekit/process/ProcessSupervisor.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <unordered_map>

#include <dirent.h>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include "probekit/process/SignalHub.hpp"
#include "probekit/util/Errors.hpp"
#include "probekit/util/Logger.hpp"

extern char** environ;

namespace probekit::process {

namespace {

using util::Logger;

void ClosePair(int fds[2]) {
  for (int i = 0; i < 2; ++i) {
    if (fds[i] >= 0) {
      ::close(fds[i]);
      fds[i] = -1;
    }
  }
}

// Walks /proc once and returns every process below `root`, parents first.
std::vector<pid_t> DescendantsOf(pid_t root) {
  std::unordered_map<pid_t, std::vector<pid_t>> children;
  DIR* proc = ::opendir("/proc");
  if (proc == nullptr) return {};
  while (struct dirent* entry = ::readdir(proc)) {
    char* end = nullptr;
    const long pid = std::strtol(entry->d_name, &end, 10);
    if (pid <= 0 || *end != '\0') continue;
    std::ifstream stat(std::string("/proc/") + entry->d_name + "/stat");
    std::string line;
    if (!std::getline(stat, line)) continue;
    // comm may contain spaces and parentheses; fields resume after the last ')'.
    const auto paren = line.rfind(')');
    if (paren == std::string::npos) continue;
    std::istringstream fields(line.substr(paren + 1));
    char state = 0;
    long ppid = 0;
    if (!(fields >> state >> ppid)) continue;
    children[static_cast<pid_t>(ppid)].push_back(static_cast<pid_t>(pid));
  }
  ::closedir(proc);

  std::vector<pid_t> out;
  std::vector<pid_t> frontier{root};
  while (!frontier.empty()) {
    const pid_t parent = frontier.back();
    frontier.pop_back();
    auto it = children.find(parent);
    if (it == children.end()) continue;
    for (pid_t child : it->second) {
      out.push_back(child);
      frontier.push_back(child);
    }
  }
  return out;
}

std::string ErrnoText(int err) {
  return std::string(std::strerror(err)) + " (errno=" + std::to_string(err) + ")";
}

// RAII holder for posix_spawn attribute/action objects.
class SpawnAttributes {
 public:
  SpawnAttributes() {
    posix_spawn_file_actions_init(&actions_);
    posix_spawnattr_init(&attr_);
  }
  ~SpawnAttributes() {
    posix_spawn_file_actions_destroy(&actions_);
    posix_spawnattr_destroy(&attr_);
  }
  SpawnAttributes(const SpawnAttributes&) = delete;
  SpawnAttributes& operator=(const SpawnAttributes&) = delete;

  posix_spawn_file_actions_t* actions() { return &actions_; }
  posix_spawnattr_t* attr() { return &attr_; }

 private:
  posix_spawn_file_actions_t actions_;
  posix_spawnattr_t attr_;
};

}  // namespace

ProcessSupervisor::ProcessSupervisor(SignalHub* hub, std::shared_ptr<time::IClock> clock)
    : hub_(hub),
      clock_(clock ? std::move(clock) : time::DefaultClock()),
      waiter_(clock_) {
  reaper_thread_ = std::thread(&ProcessSupervisor::ReaperLoop, this);
  if (hub != nullptr) {
    hub->Attach(this);
  }
}

ProcessSupervisor::~ProcessSupervisor() {
  Destroy();
}

ManagedProcess ProcessSupervisor::Start(const std::string& command,
                                        const std::vector<std::string>& args,
                                        const SpawnOptions& options) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_) {
      throw util::ShuttingDownError("ProcessSupervisor");
    }
  }

  const std::string description = DescribeCommand(command, args);
  int stdin_pipe[2] = {-1, -1};
  int stdout_pipe[2] = {-1, -1};

  auto fail = [&](const std::string& reason) -> util::SpawnError {
    ClosePair(stdin_pipe);
    ClosePair(stdout_pipe);
    const std::string message = "Failed to spawn process: " + description + " - " + reason;
    Logger::Error("[ProcessSupervisor] " + message);
    Emit({Event{Event::Kind::kError, ManagedProcess{}, false, 0, message}});
    return util::SpawnError(message);
  };

  if (command.empty()) {
    throw fail("empty command");
  }

  SpawnAttributes spawn;
  short flags = POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF;
  sigset_t empty_mask;
  sigemptyset(&empty_mask);
  posix_spawnattr_setsigmask(spawn.attr(), &empty_mask);
  sigset_t default_signals;
  sigemptyset(&default_signals);
  sigaddset(&default_signals, SIGINT);
  sigaddset(&default_signals, SIGTERM);
  sigaddset(&default_signals, SIGPIPE);
  posix_spawnattr_setsigdefault(spawn.attr(), &default_signals);
  if (options.detached) {
    flags |= POSIX_SPAWN_SETPGROUP;
    posix_spawnattr_setpgroup(spawn.attr(), 0);
  }
  posix_spawnattr_setflags(spawn.attr(), flags);

  if (!options.cwd.empty()) {
    const int rc = posix_spawn_file_actions_addchdir_np(spawn.actions(), options.cwd.c_str());
    if (rc != 0) throw fail("cannot set cwd: " + ErrnoText(rc));
  }

  if (options.pipe_stdio) {
    if (::pipe2(stdin_pipe, O_CLOEXEC) != 0 || ::pipe2(stdout_pipe, O_CLOEXEC) != 0) {
      throw fail("pipe2 failed: " + ErrnoText(errno));
    }
    posix_spawn_file_actions_adddup2(spawn.actions(), stdin_pipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(spawn.actions(), stdout_pipe[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(spawn.actions(), stdout_pipe[1], STDERR_FILENO);
  }

  std::vector<char*> argv;
  argv.reserve(args.size() + 2);
  argv.push_back(const_cast<char*>(command.c_str()));
  for (const auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));
  argv.push_back(nullptr);

  std::vector<std::string> env_storage;
  std::vector<char*> envp;
  char** env_ptr = environ;
  if (options.env.has_value()) {
    env_storage.reserve(options.env->size());
    for (const auto& [key, value] : *options.env) env_storage.push_back(key + "=" + value);
    for (auto& entry : env_storage) envp.push_back(entry.data());
    envp.push_back(nullptr);
    env_ptr = envp.data();
  }

  pid_t pid = 0;
  const int rc = posix_spawnp(&pid, command.c_str(), spawn.actions(), spawn.attr(),
                              argv.data(), env_ptr);
  if (rc != 0 || pid <= 0) {
    throw fail(ErrnoText(rc));
  }

  ManagedProcess record;
  record.pid = pid;
  record.command = command;
  record.args = args;
  record.start_time = std::chrono::system_clock::now();
  if (options.detached) record.process_group_id = pid;
  record.status = ProcessStatus::kRunning;

  if (options.pipe_stdio) {
    ::close(stdin_pipe[0]);
    ::close(stdout_pipe[1]);
    record.stdio.stdin_fd = stdin_pipe[1];
    record.stdio.stdout_fd = stdout_pipe[0];
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    ManagedProcess tracked = record;
    tracked.stdio = StdioPipes{};
    processes_[pid] = std::move(tracked);
  }

  Logger::Info("[ProcessSupervisor] Spawned pid=" + std::to_string(pid) + " cmd=" + description);
  Emit({Event{Event::Kind::kStarted, record, true, 0, std::string()}});
  return record;
}

bool ProcessSupervisor::Kill(pid_t pid, int signo) {
  std::vector<Event> events;
  bool sent = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(pid);
    if (it == processes_.end() || IsTerminal(it->second.status)) {
      return false;
    }
    ManagedProcess& record = it->second;

    int group_errno = 0;
    if (record.process_group_id.has_value()) {
      if (::kill(-*record.process_group_id, signo) == 0) {
        sent = true;
      } else {
        group_errno = errno;
      }
    }
    if (!sent && ::kill(pid, signo) == 0) {
      sent = true;
    }

    if (sent) {
      record.status = ProcessStatus::kKilled;
      events.push_back(Event{Event::Kind::kKilled, record, true, signo, std::string()});
    } else {
      const int err = errno;
      std::ostringstream msg;
      msg << "Failed to signal pid=" << pid << " signal=" << signo << ": " << ErrnoText(err);
      if (group_errno != 0) msg << " (group: " << ErrnoText(group_errno) << ")";
      events.push_back(Event{Event::Kind::kError, record, true, signo, msg.str()});
    }
  }

  if (sent) {
    Logger::Debug("[ProcessSupervisor] Sent signal " + std::to_string(signo) +
                  " to pid=" + std::to_string(pid));
  } else {
    Logger::Error("[ProcessSupervisor] " + events.back().message);
  }
  Emit(events);
  return sent;
}

size_t ProcessSupervisor::SignalDescendants(pid_t pid, int signo) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = processes_.find(pid);
    if (it == processes_.end() || IsTerminal(it->second.status)) return 0;
  }

  size_t sent = 0;
  for (pid_t child : DescendantsOf(pid)) {
    if (::kill(child, signo) == 0) {
      ++sent;
      continue;
    }
    const int err = errno;
    if (err != ESRCH) {
      Logger::Warn("[ProcessSupervisor] Failed to signal descendant pid=" +
                   std::to_string(child) + " of pid=" + std::to_string(pid) + ": " +
                   ErrnoText(err));
    }
  }
  Logger::Debug("[ProcessSupervisor] Sent signal " + std::to_string(signo) + " to " +
                std::to_string(sent) + " descendant(s) of pid=" + std::to_string(pid));
  return sent;
}

size_t ProcessSupervisor::KillAll(int signo) {
  std::vector<pid_t> pids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pids.reserve(processes_.size());
    for (const auto& [pid, _] : processes_) pids.push_back(pid);
  }
  size_t signalled = 0;
  for (pid_t pid : pids) {
    if (Kill(pid, signo)) ++signalled;
  }
  return signalled;
}

std::optional<ManagedProcess> ProcessSupervisor::WaitForExit(pid_t pid,
                                                             std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (processes_.find(pid) == processes_.end()) {
    return FindFinishedLocked(pid);
  }
  exit_cv_.wait_for(lock, timeout, [&]() {
    auto it = processes_.find(pid);
    return it == processes_.end() || IsTerminal(it->second.status);
  });
  auto it = processes_.find(pid);
  if (it != processes_.end()) {
    if (IsTerminal(it->second.status)) return it->second;
    return std::nullopt;
  }
  return FindFinishedLocked(pid);
}

void ProcessSupervisor::Shutdown(std::chrono::milliseconds timeout) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_started_) return;
    shutdown_started_ = true;
    shutting_down_ = true;
  }

  ReapFinished();
  const size_t initial = LiveCount();
  if (initial == 0) {
    EmitCleanupComplete(0);
    return;
  }

  Logger::Info("[ProcessSupervisor] Shutting down " + std::to_string(initial) + " process(es)");
  KillAll(SIGTERM);

  wait::WaitOptions options;
  options.initial_delay = std::chrono::milliseconds(10);
  options.max_delay = std::chrono::milliseconds(100);
  options.jitter = 0.0;
  options.timeout = timeout / 2;
  auto all_reaped = [this]() {
    ReapFinished();
    return LiveCount() == 0;
  };

  const auto graceful = waiter_.WaitUntil(all_reaped, options);
  if (!graceful.success) {
    Logger::Warn("[ProcessSupervisor] " + std::to_string(LiveCount()) +
                 " process(es) ignored SIGTERM, sending SIGKILL");
    KillAll(SIGKILL);
    waiter_.WaitUntil(all_reaped, options);
  }

  const size_t remaining = LiveCount();
  if (remaining > 0) {
    Logger::Error("[ProcessSupervisor] " + std::to_string(remaining) +
                  " process(es) still alive after shutdown");
  }
  EmitCleanupComplete(initial - remaining);
}

void ProcessSupervisor::Destroy() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) return;
    destroyed_ = true;
    shutting_down_ = true;
  }

  if (SignalHub* hub = hub_.exchange(nullptr, std::memory_order_acq_rel)) {
    hub->Detach(this);
  }
  {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.clear();
  }
  {
    std::lock_guard<std::mutex> lock(reaper_mutex_);
    reaper_stop_ = true;
  }
  reaper_cv_.notify_all();
  if (reaper_thread_.joinable()) {
    reaper_thread_.join();
  }

  KillAndReapRemaining();

  std::lock_guard<std::mutex> lock(mutex_);
  processes_.clear();
  finished_.clear();
  exit_cv_.notify_all();
}

size_t ProcessSupervisor::ReapFinished() {
  std::vector<Event> events;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = processes_.begin(); it != processes_.end();) {
      int status = 0;
      const pid_t result = ::waitpid(it->first, &status, WNOHANG);
      if (result == 0) {
        ++it;
        continue;
      }

      ManagedProcess& record = it->second;
      if (result == it->first) {
        record.status = ProcessStatus::kExited;
        if (WIFEXITED(status)) {
          record.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
          record.term_signal = WTERMSIG(status);
        }
        events.push_back(Event{Event::Kind::kExited, record, true, 0, std::string()});
      } else if (errno == ECHILD) {
        // Reaped elsewhere (SIGCHLD ignored or a foreign waitpid); exit status is lost.
        record.status = ProcessStatus::kExited;
        events.push_back(Event{Event::Kind::kExited, record, true, 0, std::string()});
      } else if (errno == EINTR) {
        ++it;
        continue;
      } else {
        record.status = ProcessStatus::kTerminated;
        events.push_back(Event{Event::Kind::kError, record, true, 0,
                               "waitpid failed for pid=" + std::to_string(it->first) + ": " +
                                   ErrnoText(errno)});
      }
      auto retired = it++;
      RetireLocked(retired);
    }
  }

  size_t reaped = 0;
  for (const auto& event : events) {
    if (event.kind == Event::Kind::kExited) {
      ++reaped;
      std::ostringstream line;
      line << "[ProcessSupervisor] Reaped pid=" << event.process.pid;
      if (event.process.exit_code) line << " exit_code=" << *event.process.exit_code;
      if (event.process.term_signal) line << " signal=" << *event.process.term_signal;
      Logger::Debug(line.str());
    } else {
      Logger::Error("[ProcessSupervisor] " + event.message);
    }
  }
  if (!events.empty()) {
    exit_cv_.notify_all();
    Emit(events);
  }
  return reaped;
}

std::vector<ManagedProcess> ProcessSupervisor::GetProcesses() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ManagedProcess> result;
  result.reserve(processes_.size());
  for (const auto& [_, record] : processes_) result.push_back(record);
  return result;
}

std::vector<ManagedProcess> ProcessSupervisor::GetRunningProcesses() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ManagedProcess> result;
  for (const auto& [_, record] : processes_) {
    if (record.status == ProcessStatus::kRunning) result.push_back(record);
  }
  return result;
}

std::optional<ManagedProcess> ProcessSupervisor::Find(pid_t pid) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = processes_.find(pid);
  if (it != processes_.end()) return it->second;
  return FindFinishedLocked(pid);
}

bool ProcessSupervisor::IsRunning(pid_t pid) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = processes_.find(pid);
  return it != processes_.end() && !IsTerminal(it->second.status);
}

size_t ProcessSupervisor::LiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return processes_.size();
}

bool ProcessSupervisor::IsShuttingDown() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return shutting_down_;
}

void ProcessSupervisor::AddObserver(IProcessObserver* observer) {
  if (observer == nullptr) return;
  std::lock_guard<std::mutex> lock(observers_mutex_);
  if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end()) {
    observers_.push_back(observer);
  }
}

void ProcessSupervisor::RemoveObserver(IProcessObserver* observer) {
  std::lock_guard<std::mutex> lock(observers_mutex_);
  observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

void ProcessSupervisor::ReaperLoop() {
  std::unique_lock<std::mutex> lock(reaper_mutex_);
  while (!reaper_stop_) {
    lock.unlock();
    ReapFinished();
    lock.lock();
    reaper_cv_.wait_for(lock, kReapInterval, [this]() { return reaper_stop_; });
  }
}

void ProcessSupervisor::Emit(const std::vector<Event>& events) {
  std::vector<IProcessObserver*> observers;
  {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers = observers_;
  }
  for (const auto& event : events) {
    for (IProcessObserver* observer : observers) {
      try {
        switch (event.kind) {
          case Event::Kind::kStarted: observer->OnProcessStarted(event.process); break;
          case Event::Kind::kExited: observer->OnProcessExited(event.process); break;
          case Event::Kind::kKilled: observer->OnProcessKilled(event.process, event.signo); break;
          case Event::Kind::kError:
            observer->OnError(event.message, event.has_process ? &event.process : nullptr);
            break;
        }
      } catch (...) {
        Logger::Error("[ProcessSupervisor] Observer threw: " + util::DescribeCurrentException());
      }
    }
  }
}

void ProcessSupervisor::EmitCleanupComplete(size_t reaped) {
  Logger::Info("[ProcessSupervisor] Cleanup complete, reaped=" + std::to_string(reaped));
  std::vector<IProcessObserver*> observers;
  {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers = observers_;
  }
  for (IProcessObserver* observer : observers) {
    try {
      observer->OnCleanupComplete(reaped);
    } catch (...) {
      Logger::Error("[ProcessSupervisor] Observer threw: " + util::DescribeCurrentException());
    }
  }
}

void ProcessSupervisor::KillAndReapRemaining() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& [pid, record] : processes_) {
    if (record.process_group_id.has_value() && ::kill(-*record.process_group_id, SIGKILL) == 0) {
      continue;
    }
    if (::kill(pid, SIGKILL) != 0 && errno != ESRCH) {
      Logger::Error("[ProcessSupervisor] Cannot SIGKILL pid=" + std::to_string(pid) + ": " +
                    ErrnoText(errno));
    }
  }
  // SIGKILL cannot be caught, so each child goes away promptly; bound the
  // wait anyway so an uninterruptible child cannot hang teardown.
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  for (auto& [pid, record] : processes_) {
    while (true) {
      const pid_t result = ::waitpid(pid, nullptr, WNOHANG);
      if (result != 0) break;
      if (std::chrono::steady_clock::now() >= deadline) {
        Logger::Error("[ProcessSupervisor] pid=" + std::to_string(pid) +
                      " not reaped after SIGKILL");
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    record.status = ProcessStatus::kExited;
  }
}

std::optional<ManagedProcess> ProcessSupervisor::FindFinishedLocked(pid_t pid) const {
  for (auto it = finished_.rbegin(); it != finished_.rend(); ++it) {
    if (it->pid == pid) return *it;
  }
  return std::nullopt;
}

void ProcessSupervisor::RetireLocked(std::unordered_map<pid_t, ManagedProcess>::iterator it) {
  finished_.push_back(std::move(it->second));
  while (finished_.size() > kFinishedHistory) finished_.pop_front();
  processes_.erase(it);
}

}  // namespace probekit::process
