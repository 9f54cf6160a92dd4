// Repository: Probekit-core
// Component: Managed Process Record
// Purpose: Per-child bookkeeping owned by ProcessSupervisor.
// Copyright (c) 2025 Probekit

#ifndef PROBEKIT_PROCESS_MANAGED_PROCESS_HPP_
#define PROBEKIT_PROCESS_MANAGED_PROCESS_HPP_

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace probekit::process {

enum class ProcessStatus {
  kRunning = 0,
  kKilled = 1,      // signal delivered, not reaped yet
  kExited = 2,      // reaped (normal exit or terminated by a signal)
  kTerminated = 3,  // spawn or observation failure
};

const char* ProcessStatusToString(ProcessStatus status);

inline bool IsTerminal(ProcessStatus status) {
  return status == ProcessStatus::kExited || status == ProcessStatus::kTerminated;
}

// Parent ends of the child's stdio pipes (-1 when not piped). stderr is
// merged into stdout. Whoever receives a ManagedProcess from Start() owns them.
struct StdioPipes {
  int stdin_fd = -1;
  int stdout_fd = -1;
};

struct ManagedProcess {
  pid_t pid = 0;
  std::string command;
  std::vector<std::string> args;
  std::chrono::system_clock::time_point start_time;
  std::optional<pid_t> process_group_id;
  ProcessStatus status = ProcessStatus::kRunning;
  std::optional<int> exit_code;
  std::optional<int> term_signal;
  StdioPipes stdio;
};

struct SpawnOptions {
  std::string cwd;  // empty: inherit
  // Replaces the child's environment when set; inherits otherwise.
  std::optional<std::map<std::string, std::string>> env;
  // Own process group (pgid == pid) so the whole tree can be signalled.
  bool detached = true;
  bool pipe_stdio = false;
};

std::string DescribeCommand(const std::string& command, const std::vector<std::string>& args);

}  // namespace probekit::process

#endif  // PROBEKIT_PROCESS_MANAGED_PROCESS_HPP_
