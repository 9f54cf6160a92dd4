// Repository: Probekit-core
// Component: Shell Session
// Purpose: Shell child with piped stdio, reader thread and two-phase teardown.
// Copyright (c) 2025 Probekit

#include "probekit/session/ShellSession.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <stdexcept>

#include <poll.h>
#include <pthread.h>
#include <unistd.h>

#include "probekit/util/Errors.hpp"
#include "probekit/util/Logger.hpp"

namespace probekit::session {

namespace {

using util::Logger;

constexpr size_t kReadChunk = 4096;

// Writes all of `data`. SIGPIPE is blocked for the duration so a dead shell
// surfaces as EPIPE instead of terminating the harness.
bool WriteAllNoSigpipe(int fd, const std::string& data, int* err) {
  sigset_t pipe_set;
  sigset_t old_set;
  sigemptyset(&pipe_set);
  sigaddset(&pipe_set, SIGPIPE);
  pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set);

  bool ok = true;
  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n > 0) {
      written += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    *err = errno;
    ok = false;
    break;
  }

  if (!ok && *err == EPIPE) {
    struct timespec zero = {0, 0};
    sigtimedwait(&pipe_set, nullptr, &zero);
  }
  pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
  return ok;
}

}  // namespace

ShellSession::ShellSession(process::ProcessSupervisor& supervisor, ShellConfig config)
    : supervisor_(supervisor), config_(std::move(config)) {}

ShellSession::~ShellSession() {
  Destroy();
}

void ShellSession::Start() {
  if (destroyed_.load(std::memory_order_acquire)) {
    throw util::ProbekitError("Cannot start a destroyed shell session");
  }
  if (started_.exchange(true)) {
    throw util::ProbekitError("Shell session is already started");
  }

  process::SpawnOptions options;
  options.cwd = config_.cwd;
  options.env = config_.env;
  options.detached = true;
  options.pipe_stdio = true;

  process::ManagedProcess proc;
  try {
    proc = supervisor_.Start(config_.shell, config_.args, options);
  } catch (...) {
    started_.store(false, std::memory_order_release);
    throw;
  }

  pid_ = proc.pid;
  stdin_fd_ = proc.stdio.stdin_fd;
  stdout_fd_ = proc.stdio.stdout_fd;
  reader_thread_ = std::thread([this] { ReaderLoop(); });
  Logger::Debug("[ShellSession] started " + config_.shell + " pid=" + std::to_string(pid_));
}

void ShellSession::Write(const std::string& data) {
  if (!IsRunning()) {
    throw util::ProbekitError("Shell session is not started or is destroyed");
  }
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (stdin_fd_ < 0) {
    throw util::ProbekitError("Shell session stdin is closed");
  }
  int err = 0;
  if (!WriteAllNoSigpipe(stdin_fd_, data, &err)) {
    throw util::ProbekitError("Write to shell pid=" + std::to_string(pid_) +
                              " failed: " + std::strerror(err));
  }
  std::lock_guard<std::mutex> out_lock(output_mutex_);
  input_history_.push_back(data);
}

void ShellSession::WriteLine(const std::string& line) {
  Write(line + "\n");
}

size_t ShellSession::SendControl(char key) {
  const bool letter = std::isalpha(static_cast<unsigned char>(key)) != 0;
  if (!letter && key != '\\') {
    throw std::invalid_argument(std::string("SendControl requires a letter A-Z or '\\', got '") +
                                key + "'");
  }
  const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(key)));

  // Pipes have no line discipline: deliver what a terminal would generate to
  // the shell's running commands, leaving the shell itself alive.
  int signo = 0;
  if (upper == 'C') signo = SIGINT;
  if (upper == '\\') signo = SIGQUIT;
  if (signo != 0) {
    if (IsDestroyed()) throw util::ProbekitError("ShellSession is destroyed");
    return supervisor_.SignalDescendants(pid_, signo);
  }

  Write(std::string(1, static_cast<char>(upper - 64)));
  return 0;
}

std::string ShellSession::ExecuteCommand(const std::string& command,
                                         const std::optional<std::string>& expected,
                                         std::optional<std::chrono::milliseconds> timeout) {
  const auto limit = timeout.value_or(config_.command_timeout);

  std::string marker;
  size_t start_offset = 0;
  {
    std::lock_guard<std::mutex> lock(output_mutex_);
    start_offset = output_.size();
    marker = "__probekit_done_" + std::to_string(++command_counter_) + "__";
  }

  WriteLine(command);
  const std::string needle = expected.value_or(marker);
  if (!expected) WriteLine("echo " + marker);

  wait::WaitOptions options;
  options.initial_delay = std::chrono::milliseconds(50);
  options.max_delay = std::chrono::milliseconds(500);
  options.timeout = limit;

  // A dead shell throws the same error every attempt, which ends the wait early.
  options.max_identical_errors = 3;
  auto since_write = [this, start_offset, &needle]() {
    std::string text;
    {
      std::lock_guard<std::mutex> lock(output_mutex_);
      text = start_offset <= output_.size() ? output_.substr(start_offset) : output_;
    }
    if (text.find(needle) == std::string::npos && !IsRunning()) {
      throw util::ProbekitError("shell pid=" + std::to_string(pid_) + " is no longer running");
    }
    return text;
  };
  auto result = waiter_.WaitForOutput(since_write, needle, options);
  if (!result.success) {
    if (result.failed_fast && result.last_error) {
      throw util::ProbekitError(*result.last_error + ": " + command);
    }
    throw util::ProbekitError("Command execution timeout after " + std::to_string(limit.count()) +
                              "ms: " + command);
  }

  std::string output = result.result.value_or(std::string());
  if (!expected) {
    const size_t pos = output.find(marker);
    if (pos != std::string::npos) output.erase(pos);
  }
  return output;
}

std::string ShellSession::Output() const {
  std::lock_guard<std::mutex> lock(output_mutex_);
  return output_;
}

void ShellSession::ClearOutput() {
  std::lock_guard<std::mutex> lock(output_mutex_);
  output_.clear();
}

std::vector<std::string> ShellSession::InputHistory() const {
  std::lock_guard<std::mutex> lock(output_mutex_);
  return input_history_;
}

void ShellSession::ClearInputHistory() {
  std::lock_guard<std::mutex> lock(output_mutex_);
  input_history_.clear();
}

wait::WaitResult<std::string> ShellSession::WaitForOutput(
    const std::string& expected, const wait::WaitOptions& options) const {
  return waiter_.WaitForOutput([this] { return Output(); }, expected, options);
}

wait::WaitResult<std::string> ShellSession::WaitForPrompt(
    const std::regex& prompt, const wait::WaitOptions& options) const {
  return waiter_.WaitForTerminalReady([this] { return Output(); }, prompt, options);
}

bool ShellSession::IsRunning() const {
  return started_.load(std::memory_order_acquire) && !destroyed_.load(std::memory_order_acquire) &&
         supervisor_.IsRunning(pid_);
}

void ShellSession::Destroy() {
  if (destroyed_.exchange(true, std::memory_order_acq_rel)) return;
  if (!started_.load(std::memory_order_acquire)) return;

  if (supervisor_.IsRunning(pid_)) {
    auto still_running = [this] { return supervisor_.IsRunning(pid_); };

    supervisor_.Kill(pid_, SIGTERM);
    wait::WaitOptions grace;
    grace.initial_delay = std::chrono::milliseconds(100);
    grace.max_delay = std::chrono::milliseconds(500);
    grace.timeout = kGracePeriod;
    grace.jitter = 0.1;
    auto exited = waiter_.WaitForProcessExit(still_running, grace);

    if (!exited.success) {
      Logger::Warn("[ShellSession] pid=" + std::to_string(pid_) +
                   " ignored SIGTERM for " + std::to_string(kGracePeriod.count()) +
                   "ms, sending SIGKILL");
      supervisor_.Kill(pid_, SIGKILL);
      grace.timeout = std::chrono::milliseconds(1000);
      if (!waiter_.WaitForProcessExit(still_running, grace).success) {
        Logger::Error("[ShellSession] pid=" + std::to_string(pid_) + " still not reaped after SIGKILL");
      }
    }
  }

  CloseStdin();
  reader_stop_.store(true, std::memory_order_release);
  if (reader_thread_.joinable()) reader_thread_.join();
  if (stdout_fd_ >= 0) {
    ::close(stdout_fd_);
    stdout_fd_ = -1;
  }
  Logger::Debug("[ShellSession] destroyed pid=" + std::to_string(pid_));
}

void ShellSession::ReaderLoop() {
  char buf[kReadChunk];
  struct pollfd pfd;
  pfd.fd = stdout_fd_;
  pfd.events = POLLIN;

  while (!reader_stop_.load(std::memory_order_acquire)) {
    pfd.revents = 0;
    int rc = ::poll(&pfd, 1, static_cast<int>(kReadPollInterval.count()));
    if (rc < 0) {
      if (errno == EINTR) continue;
      Logger::Error("[ShellSession] poll failed: " + std::string(std::strerror(errno)));
      return;
    }
    if (rc == 0) continue;
    if (pfd.revents & (POLLIN | POLLHUP)) {
      ssize_t n = ::read(stdout_fd_, buf, sizeof(buf));
      if (n > 0) {
        AppendOutput(buf, static_cast<size_t>(n));
      } else if (n == 0) {
        return;  // EOF: shell closed its end
      } else if (errno != EINTR && errno != EAGAIN) {
        Logger::Warn("[ShellSession] read failed: " + std::string(std::strerror(errno)));
        return;
      }
    } else if (pfd.revents & (POLLERR | POLLNVAL)) {
      return;
    }
  }
}

void ShellSession::AppendOutput(const char* data, size_t len) {
  std::lock_guard<std::mutex> lock(output_mutex_);
  output_.append(data, len);
  if (config_.max_output_bytes > 0 && output_.size() > config_.max_output_bytes) {
    output_.erase(0, output_.size() - config_.max_output_bytes);
  }
}

void ShellSession::CloseStdin() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (stdin_fd_ >= 0) {
    ::close(stdin_fd_);
    stdin_fd_ = -1;
  }
}

}  // namespace probekit::session
