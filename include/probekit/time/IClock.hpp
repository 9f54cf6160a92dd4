// Repository: Probekit-core
// Component: Clock Interface
// Purpose: Decouple sleeping and "now" from polling and eviction math.
//          Production: SystemClock reads steady_clock and really sleeps.
//          Tests: FakeClock (advances virtual time, no sleep).
// Copyright (c) 2025 Probekit

#ifndef PROBEKIT_TIME_ICLOCK_HPP_
#define PROBEKIT_TIME_ICLOCK_HPP_

#include <chrono>
#include <memory>
#include <thread>

namespace probekit::time {

class IClock {
 public:
  using TimePoint = std::chrono::steady_clock::time_point;

  virtual ~IClock() = default;
  virtual TimePoint Now() const = 0;
  virtual void SleepFor(std::chrono::milliseconds duration) = 0;
};

class SystemClock : public IClock {
 public:
  TimePoint Now() const override { return std::chrono::steady_clock::now(); }

  void SleepFor(std::chrono::milliseconds duration) override {
    std::this_thread::sleep_for(duration);
  }
};

// Shared process-wide real clock; components default to it when no clock is injected.
inline std::shared_ptr<IClock> DefaultClock() {
  static std::shared_ptr<IClock> clock = std::make_shared<SystemClock>();
  return clock;
}

inline std::chrono::milliseconds ElapsedMs(IClock::TimePoint from, IClock::TimePoint to) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(to - from);
}

}  // namespace probekit::time

#endif  // PROBEKIT_TIME_ICLOCK_HPP_
