// Repository: Probekit-core
// Component: Signal hub unit tests

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

#include "probekit/process/ProcessSupervisor.hpp"
#include "probekit/process/SignalHub.hpp"

namespace probekit::process {
namespace {

using namespace std::chrono_literals;

bool WaitForFlag(const std::atomic<bool>& flag, std::chrono::milliseconds limit) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (!flag.load()) {
    if (std::chrono::steady_clock::now() >= deadline) return false;
    std::this_thread::sleep_for(5ms);
  }
  return true;
}

// ---------------------------------------------------------------------------
// Attach / Detach
// ---------------------------------------------------------------------------

TEST(SignalHubTest, SupervisorAttachesOnConstructionAndDetachesOnDestroy) {
  SignalHub hub;
  {
    ProcessSupervisor supervisor(&hub);
    EXPECT_EQ(hub.AttachedCount(), 1u);
    supervisor.Destroy();
    EXPECT_EQ(hub.AttachedCount(), 0u);
  }
  EXPECT_EQ(hub.AttachedCount(), 0u);
}

TEST(SignalHubTest, AttachIgnoresDuplicatesAndNull) {
  SignalHub hub;
  ProcessSupervisor supervisor(&hub);
  hub.Attach(&supervisor);
  hub.Attach(nullptr);
  EXPECT_EQ(hub.AttachedCount(), 1u);
  hub.Detach(&supervisor);
  EXPECT_EQ(hub.AttachedCount(), 0u);
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

TEST(SignalHubTest, DispatchShutsDownEverySupervisorThenRunsCallback) {
  SignalHub hub;
  hub.SetGracePeriod(1000ms);
  ProcessSupervisor first(&hub);
  ProcessSupervisor second(&hub);

  first.Start("sleep", {"30"});
  second.Start("sleep", {"30"});
  ASSERT_EQ(first.LiveCount(), 1u);
  ASSERT_EQ(second.LiveCount(), 1u);

  int seen_signal = 0;
  size_t live_at_callback = 99;
  hub.SetTerminationCallback([&](int signo) {
    seen_signal = signo;
    live_at_callback = first.LiveCount() + second.LiveCount();
  });

  hub.Dispatch(SIGTERM);

  EXPECT_EQ(seen_signal, SIGTERM);
  EXPECT_EQ(live_at_callback, 0u);
  EXPECT_EQ(hub.LastSignal(), SIGTERM);
  EXPECT_TRUE(first.IsShuttingDown());
  EXPECT_TRUE(second.IsShuttingDown());
}

TEST(SignalHubTest, LastSignalIsZeroUntilDispatched) {
  SignalHub hub;
  EXPECT_EQ(hub.LastSignal(), 0);
  hub.Dispatch(SIGINT);
  EXPECT_EQ(hub.LastSignal(), SIGINT);
}

// ---------------------------------------------------------------------------
// OS handler ownership
// ---------------------------------------------------------------------------

TEST(SignalHubTest, OnlyOneHubOwnsTheHandlers) {
  SignalHub owner;
  SignalHub other;
  ASSERT_TRUE(owner.Install());
  EXPECT_TRUE(owner.Install());  // already installed
  EXPECT_FALSE(other.Install());
  EXPECT_FALSE(other.IsInstalled());

  owner.Uninstall();
  EXPECT_FALSE(owner.IsInstalled());
  EXPECT_TRUE(other.Install());
  other.Uninstall();
}

TEST(SignalHubTest, RaisedSignalReachesTheCallbackThroughTheDispatcher) {
  SignalHub hub;
  std::atomic<bool> fired{false};
  std::atomic<int> seen{0};
  hub.SetTerminationCallback([&](int signo) {
    seen.store(signo);
    fired.store(true);
  });
  ASSERT_TRUE(hub.Install());

  ASSERT_EQ(::raise(SIGTERM), 0);
  ASSERT_TRUE(WaitForFlag(fired, 2000ms));
  EXPECT_EQ(seen.load(), SIGTERM);
  EXPECT_EQ(hub.LastSignal(), SIGTERM);

  hub.Uninstall();
}

TEST(SignalHubTest, UninstallFromTheCallbackThenDestroyJoinsTheDispatcher) {
  std::atomic<bool> fired{false};
  auto hub = std::make_unique<SignalHub>();
  SignalHub* raw = hub.get();
  hub->SetTerminationCallback([&fired, raw](int) {
    raw->Uninstall();
    fired.store(true);
  });
  ASSERT_TRUE(hub->Install());

  ASSERT_EQ(::raise(SIGTERM), 0);
  ASSERT_TRUE(WaitForFlag(fired, 2000ms));
  EXPECT_FALSE(hub->IsInstalled());

  hub.reset();

  // The handlers were released, so a fresh hub can take them.
  SignalHub next;
  EXPECT_TRUE(next.Install());
  next.Uninstall();
}

TEST(SignalHubTest, DestroyingTheHubKillsLeftoverChildren) {
  auto hub = std::make_unique<SignalHub>();
  ProcessSupervisor supervisor(hub.get());
  const ManagedProcess child = supervisor.Start("sleep", {"30"});

  hub.reset();

  auto exited = supervisor.WaitForExit(child.pid, 2000ms);
  ASSERT_TRUE(exited.has_value());
  ASSERT_TRUE(exited->term_signal.has_value());
  EXPECT_EQ(*exited->term_signal, SIGKILL);
}

}  // namespace
}  // namespace probekit::process
