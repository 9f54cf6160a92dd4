// Repository: Probekit-core
// Component: Managed Process Record
// Purpose: Per-child bookkeeping owned by ProcessSupervisor.
// Copyright (c) 2025 Probekit

#include "probekit/process/ManagedProcess.hpp"

namespace probekit::process {

const char* ProcessStatusToString(ProcessStatus status) {
  switch (status) {
    case ProcessStatus::kRunning: return "running";
    case ProcessStatus::kKilled: return "killed";
    case ProcessStatus::kExited: return "exited";
    case ProcessStatus::kTerminated: return "terminated";
  }
  return "unknown";
}

std::string DescribeCommand(const std::string& command, const std::vector<std::string>& args) {
  std::string out = command;
  for (const auto& arg : args) {
    out += ' ';
    out += arg;
  }
  return out;
}

}  // namespace probekit::process
