// Repository: Probekit-core
// Component: Logger
// Purpose: Line logger shared by every component and helper thread.
// Copyright (c) 2025 Probekit

#ifndef PROBEKIT_UTIL_LOGGER_HPP_
#define PROBEKIT_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace probekit::util {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

const char* LogLevelName(LogLevel level);

// Logger writes whole lines under one static mutex so output from the reaper,
// pool maintenance, signal dispatcher and session readers never interleaves.
//
// Debug and Info go to stdout, Warn and Error to stderr. Debug is off unless
// PROBEKIT_DEBUG is set in the environment (read once) or SetDebugEnabled(true)
// is called.
//
// A sink, when installed, receives every emitted line with its level before
// it is written to the stream. Tests use it to assert on warnings; pass
// nullptr to remove it.
class Logger {
 public:
  using Sink = std::function<void(LogLevel level, const std::string& line)>;

  static void Debug(const std::string& line) { Emit(LogLevel::kDebug, line); }
  static void Info(const std::string& line) { Emit(LogLevel::kInfo, line); }
  static void Warn(const std::string& line) { Emit(LogLevel::kWarn, line); }
  static void Error(const std::string& line) { Emit(LogLevel::kError, line); }

  static void Emit(LogLevel level, const std::string& line);

  static void SetSink(Sink sink);
  static void SetDebugEnabled(bool enabled);
  static bool DebugEnabled();

 private:
  static std::mutex mutex_;
  static Sink sink_;
};

}  // namespace probekit::util

#endif  // PROBEKIT_UTIL_LOGGER_HPP_
