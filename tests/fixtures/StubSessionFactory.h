// Stub resource and factory for ResourcePool tests.
// In-memory only; no processes, no threads. Failures are switchable.

#ifndef PROBEKIT_TESTS_FIXTURES_STUB_SESSION_FACTORY_H_
#define PROBEKIT_TESTS_FIXTURES_STUB_SESSION_FACTORY_H_

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "probekit/pool/IResourceFactory.hpp"

namespace probekit::tests::fixtures {

struct StubConfig {
  std::string shell = "/bin/sh";
  std::string cwd;
  int timeout_ms = 0;  // not part of the key
};

class StubSession {
 public:
  explicit StubSession(int serial, StubConfig config)
      : serial_(serial), config_(std::move(config)) {}

  int serial() const { return serial_; }
  const StubConfig& config() const { return config_; }

  void AppendOutput(const std::string& text) { output_ += text; }
  const std::string& output() const { return output_; }
  void ClearOutput() { output_.clear(); }

  bool destroyed() const { return destroyed_.load(); }
  void MarkDestroyed() { destroyed_.store(true); }

 private:
  int serial_;
  StubConfig config_;
  std::string output_;
  std::atomic<bool> destroyed_{false};
};

class StubSessionFactory : public pool::IResourceFactory<StubSession, StubConfig> {
 public:
  std::shared_ptr<StubSession> Create(const StubConfig& config) override {
    if (create_delay_ms.load() > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(create_delay_ms.load()));
    }
    if (fail_create.load()) throw std::runtime_error("stub create failed");
    if (throw_int_on_create.load()) throw 42;
    const int serial = ++created_;
    return std::make_shared<StubSession>(serial, config);
  }

  bool Reset(StubSession& session) override {
    reset_calls_.fetch_add(1);
    if (throw_on_reset.load()) throw std::runtime_error("stub reset threw");
    if (fail_reset.load()) return false;
    session.ClearOutput();
    return true;
  }

  void Destroy(StubSession& session) override {
    destroy_calls_.fetch_add(1);
    session.MarkDestroyed();
    if (throw_on_destroy.load()) throw std::runtime_error("stub destroy failed");
  }

  std::string ConfigKey(const StubConfig& config) const override {
    return config.shell + "|" + config.cwd;
  }

  std::string TypeName() const override { return "stub"; }

  int created() const { return created_.load(); }
  int reset_calls() const { return reset_calls_.load(); }
  int destroy_calls() const { return destroy_calls_.load(); }

  std::atomic<bool> fail_create{false};
  std::atomic<bool> throw_int_on_create{false};
  std::atomic<bool> fail_reset{false};
  std::atomic<bool> throw_on_reset{false};
  std::atomic<bool> throw_on_destroy{false};
  std::atomic<int> create_delay_ms{0};

 private:
  std::atomic<int> created_{0};
  std::atomic<int> reset_calls_{0};
  std::atomic<int> destroy_calls_{0};
};

}  // namespace probekit::tests::fixtures

#endif  // PROBEKIT_TESTS_FIXTURES_STUB_SESSION_FACTORY_H_
