// Repository: Probekit-core
// Component: Shell Session
// Purpose: Long-lived shell child with piped stdio, driven by tests the way a
//          user drives a terminal: write input, wait for output.
// Copyright (c) 2025 Probekit

#ifndef PROBEKIT_SESSION_SHELL_SESSION_HPP_
#define PROBEKIT_SESSION_SHELL_SESSION_HPP_

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

#include "probekit/process/ProcessSupervisor.hpp"
#include "probekit/wait/Waiter.hpp"

namespace probekit::session {

struct ShellConfig {
  std::string shell = "/bin/sh";
  std::vector<std::string> args;
  std::string cwd;  // empty: inherit
  // Replaces the environment when set; inherits otherwise.
  std::optional<std::map<std::string, std::string>> env;
  std::chrono::milliseconds command_timeout{30000};
  size_t max_output_bytes = 1024 * 1024;  // oldest output is dropped beyond this
};

// ShellSession runs one shell under a ProcessSupervisor. stdout and stderr are
// merged and accumulated by a reader thread.
//
// Destroy() is two-phase: SIGTERM to the session's process group, a polled
// grace period, then SIGKILL.
class ShellSession {
 public:
  static constexpr std::chrono::milliseconds kGracePeriod{2000};
  static constexpr std::chrono::milliseconds kReadPollInterval{50};

  ShellSession(process::ProcessSupervisor& supervisor, ShellConfig config);
  ~ShellSession();

  ShellSession(const ShellSession&) = delete;
  ShellSession& operator=(const ShellSession&) = delete;

  // Throws util::SpawnError, or util::ProbekitError when already started or destroyed.
  void Start();

  // Throws util::ProbekitError when the session is not running or the pipe broke.
  void Write(const std::string& data);
  void WriteLine(const std::string& line);
  // Ctrl+<key>; key must be A-Z (either case) or a backslash. Ctrl+C sends
  // SIGINT and Ctrl+backslash SIGQUIT to the commands the shell is running,
  // returning how many processes were signalled. Other keys write the byte.
  size_t SendControl(char key);

  // Writes `command`, then waits for `expected` (when given) or for the
  // command to finish. Returns the output produced after the write.
  // Throws util::ProbekitError on timeout.
  std::string ExecuteCommand(const std::string& command,
                             const std::optional<std::string>& expected = std::nullopt,
                             std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  std::string Output() const;
  void ClearOutput();
  std::vector<std::string> InputHistory() const;
  void ClearInputHistory();

  wait::WaitResult<std::string> WaitForOutput(
      const std::string& expected, const wait::WaitOptions& options = wait::WaitOptions()) const;
  wait::WaitResult<std::string> WaitForPrompt(
      const std::regex& prompt = wait::Waiter::DefaultPromptPattern(),
      const wait::WaitOptions& options = wait::WaitOptions::TerminalReadyDefaults()) const;

  bool IsRunning() const;
  bool IsDestroyed() const { return destroyed_.load(std::memory_order_acquire); }
  pid_t pid() const { return pid_; }
  const ShellConfig& config() const { return config_; }

  // Idempotent.
  void Destroy();

 private:
  void ReaderLoop();
  void AppendOutput(const char* data, size_t len);
  void CloseStdin();

  process::ProcessSupervisor& supervisor_;
  const ShellConfig config_;
  wait::Waiter waiter_;

  pid_t pid_ = 0;
  int stdin_fd_ = -1;
  int stdout_fd_ = -1;
  std::atomic<bool> started_{false};
  std::atomic<bool> destroyed_{false};

  mutable std::mutex output_mutex_;
  std::string output_;
  std::vector<std::string> input_history_;
  uint64_t command_counter_ = 0;

  std::mutex write_mutex_;
  std::atomic<bool> reader_stop_{false};
  std::thread reader_thread_;
};

}  // namespace probekit::session

#endif  // PROBEKIT_SESSION_SHELL_SESSION_HPP_
