// Repository: Probekit-core
// Component: Logger
// Purpose: Line logger shared by every component and helper thread.
// Copyright (c) 2025 Probekit

#include "probekit/util/Logger.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>

namespace probekit::util {

namespace {

std::atomic<bool>& DebugFlag() {
  static std::atomic<bool> flag{std::getenv("PROBEKIT_DEBUG") != nullptr};
  return flag;
}

}  // namespace

std::mutex Logger::mutex_;
Logger::Sink Logger::sink_;

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug: return "debug";
    case LogLevel::kInfo: return "info";
    case LogLevel::kWarn: return "warn";
    case LogLevel::kError: return "error";
  }
  return "unknown";
}

void Logger::Emit(LogLevel level, const std::string& line) {
  if (level == LogLevel::kDebug && !DebugEnabled()) return;

  std::lock_guard<std::mutex> lock(mutex_);
  if (sink_) {
    sink_(level, line);
  }
  std::ostream& out = level >= LogLevel::kWarn ? std::cerr : std::cout;
  out << line << '\n';
  out.flush();
}

void Logger::SetSink(Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sink_ = std::move(sink);
}

void Logger::SetDebugEnabled(bool enabled) {
  DebugFlag().store(enabled, std::memory_order_relaxed);
}

bool Logger::DebugEnabled() {
  return DebugFlag().load(std::memory_order_relaxed);
}

}  // namespace probekit::util
