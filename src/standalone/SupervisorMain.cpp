// Repository: Probekit-core
// Component: Standalone Supervisor Harness
// Purpose: Runs shell commands inside pooled, supervised shell sessions.
// Copyright (c) 2025 Probekit
//
// This binary is for smoke testing and diagnostics. It exercises the whole
// lifecycle stack: signal hub, supervisor, session pool, waiter.
//
// EXIT CODES:
//   0  every command completed (and matched its --expect text)
//   1  usage error
//   2  a command timed out or its --expect text never appeared
//   3  a session could not be acquired or spawned

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "probekit/config/EnvConfig.hpp"
#include "probekit/runtime/HarnessRuntime.hpp"
#include "probekit/session/ShellSession.hpp"
#include "probekit/util/Errors.hpp"
#include "probekit/util/Logger.hpp"

namespace {

using probekit::util::Logger;

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitExpectation = 2;
constexpr int kExitAcquire = 3;

std::atomic<bool> g_termination_requested{false};

// =============================================================================
// CLI Arguments
// =============================================================================
struct Step {
  std::string command;
  std::optional<std::string> expect;
};

struct CliArgs {
  std::vector<Step> steps;
  std::string shell = "/bin/sh";
  std::string cwd;
  std::optional<uint64_t> timeout_ms;
  // Pool setting flags in command-line order, applied over the environment.
  std::vector<std::pair<const probekit::config::PoolSetting*, uint64_t>> pool_overrides;
  bool metrics = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS] --exec CMD [--expect TEXT] ...\n"
            << "\n"
            << "Runs each command in a pooled shell session and waits for it to finish.\n"
            << "\n"
            << "COMMANDS:\n"
            << "  --exec CMD              Command to run (repeatable, runs in order)\n"
            << "  --expect TEXT           Wait for TEXT in the preceding command's output\n"
            << "\n"
            << "SESSION OPTIONS:\n"
            << "  --shell PATH            Shell binary (default: /bin/sh)\n"
            << "  --cwd DIR               Working directory for sessions\n"
            << "  --timeout-ms N          Per-command timeout (default: 30000)\n"
            << "\n"
            << "POOL OPTIONS (override PROBEKIT_* environment values):\n"
            << "  --pool-size N           Maximum pooled sessions\n"
            << "  --idle-timeout-ms N     Evict sessions idle this long\n"
            << "  --max-age-ms N          Evict idle sessions older than this\n"
            << "  --acquire-timeout-ms N  Wait limit when the pool is full\n"
            << "  --max-heap-mb N         Heap limit for the memory monitor\n"
            << "  --max-rss-mb N          RSS limit for the memory monitor\n"
            << "  --gc-threshold N        Soft threshold, percent of the heap limit\n"
            << "  --max-buffers N         Buffer cache capacity\n"
            << "  --compression-threshold N  Compress buffers at or above N bytes\n"
            << "  --metrics               Print pool metrics before exiting\n"
            << "  --help                  Show this help message\n"
            << "\n"
            << "EXAMPLE:\n"
            << "  " << program_name << " --exec 'echo hello' --expect hello --metrics\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--exec" && i + 1 < argc) {
      args.steps.push_back(Step{argv[++i], std::nullopt});
    } else if (arg == "--expect" && i + 1 < argc) {
      if (args.steps.empty()) {
        args.error = "--expect must follow an --exec";
        return args;
      }
      args.steps.back().expect = argv[++i];
    } else if (arg == "--shell" && i + 1 < argc) {
      args.shell = argv[++i];
    } else if (arg == "--cwd" && i + 1 < argc) {
      args.cwd = argv[++i];
    } else if (arg == "--timeout-ms" && i + 1 < argc) {
      std::string value = argv[++i];
      args.timeout_ms = probekit::config::ParseBounded(value, 1, probekit::config::kMaxDurationMs);
      if (!args.timeout_ms) {
        args.error = arg + " needs an integer in [1, " +
                     std::to_string(probekit::config::kMaxDurationMs) + "], got '" + value + "'";
        return args;
      }
    } else if (const auto* setting = probekit::config::FindPoolSettingByFlag(arg);
               setting != nullptr && i + 1 < argc) {
      std::string value = argv[++i];
      auto parsed = probekit::config::ParseBounded(value, setting->min, setting->max);
      if (!parsed) {
        args.error = arg + " needs an integer in [" + std::to_string(setting->min) + ", " +
                     std::to_string(setting->max) + "], got '" + value + "'";
        return args;
      }
      args.pool_overrides.emplace_back(setting, *parsed);
    } else if (arg == "--metrics") {
      args.metrics = true;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.steps.empty()) {
    args.error = "At least one --exec is required";
    return args;
  }

  args.valid = true;
  return args;
}

void PrintMetrics(const probekit::pool::ResourceMetrics& m) {
  std::cout << std::fixed << std::setprecision(1)
            << "[HARNESS] pool: total=" << m.pool.total_resources
            << " active=" << m.pool.active_resources
            << " idle=" << m.pool.idle_resources
            << " created=" << m.pool.total_created
            << " destroyed=" << m.pool.total_destroyed
            << " timeouts=" << m.pool.acquisition_timeouts << "\n"
            << "[HARNESS] acquire: avg=" << m.pool.acquisition_time.avg_ms
            << "ms p95=" << m.pool.acquisition_time.p95_ms
            << "ms p99=" << m.pool.acquisition_time.p99_ms
            << "ms samples=" << m.pool.acquisition_time.samples << "\n"
            << "[HARNESS] memory: heap_used=" << m.memory.usage.heap_used
            << " rss=" << m.memory.usage.rss
            << " gc_runs=" << m.memory.gc_runs << "\n"
            << "[HARNESS] buffers: count=" << m.buffers.total_buffers
            << " bytes=" << m.buffers.total_size << "\n";
}

int RunSteps(const CliArgs& args, probekit::runtime::HarnessRuntime& runtime) {
  probekit::session::ShellConfig shell;
  shell.shell = args.shell;
  shell.cwd = args.cwd;
  if (args.timeout_ms) shell.command_timeout = std::chrono::milliseconds(static_cast<int64_t>(*args.timeout_ms));

  int rc = kExitOk;
  for (size_t i = 0; i < args.steps.size(); ++i) {
    if (g_termination_requested.load(std::memory_order_acquire)) {
      std::cerr << "[HARNESS] termination requested, skipping remaining commands\n";
      break;
    }
    const Step& step = args.steps[i];

    std::shared_ptr<probekit::session::ShellSession> session;
    try {
      session = runtime.pool().Acquire(shell);
    } catch (const probekit::util::ProbekitError& e) {
      Logger::Error("[HARNESS] could not acquire a shell session: " + std::string(e.what()));
      return kExitAcquire;
    }

    try {
      std::string output = session->ExecuteCommand(step.command, step.expect);
      std::cout << "[HARNESS] step " << (i + 1) << ": " << step.command << "\n" << output;
      if (!output.empty() && output.back() != '\n') std::cout << "\n";
    } catch (const probekit::util::ProbekitError& e) {
      Logger::Error("[HARNESS] step " + std::to_string(i + 1) + " failed: " + e.what());
      rc = kExitExpectation;
    }
    runtime.pool().Release(session);
    if (rc != kExitOk) break;
  }
  return rc;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return kExitOk;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return kExitUsage;
  }

  probekit::runtime::RuntimeOptions options;
  probekit::config::ApplyEnvOverrides(options.pool);
  for (const auto& [setting, value] : args.pool_overrides) {
    setting->apply(options.pool, value);
  }
  options.install_signal_handlers = true;

  int rc = kExitOk;
  {
    probekit::runtime::HarnessRuntime runtime(options);
    runtime.SetTerminationCallback([](int signo) {
      std::cerr << "\n[HARNESS] Received signal " << signo << ", requesting termination...\n";
      g_termination_requested.store(true, std::memory_order_release);
    });

    rc = RunSteps(args, runtime);
    if (args.metrics) PrintMetrics(runtime.pool().GetMetrics());
    runtime.Shutdown();
  }

  if (g_termination_requested.load(std::memory_order_acquire) && rc == kExitOk) {
    rc = kExitExpectation;
  }
  return rc;
}
