// Repository: Probekit-core
// Component: Error Types
// Purpose: Caller-visible failures of the supervisor and the resource pool.
// Copyright (c) 2025 Probekit

#ifndef PROBEKIT_UTIL_ERRORS_HPP_
#define PROBEKIT_UTIL_ERRORS_HPP_

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace probekit::util {

class ProbekitError : public std::runtime_error {
 public:
  explicit ProbekitError(const std::string& what) : std::runtime_error(what) {}
};

// A child process could not be spawned.
class SpawnError : public ProbekitError {
 public:
  explicit SpawnError(const std::string& what) : ProbekitError(what) {}
};

// Operation attempted while (or after) the owning component shuts down.
class ShuttingDownError : public ProbekitError {
 public:
  explicit ShuttingDownError(const std::string& component)
      : ProbekitError(component + " is shutting down") {}
};

class AcquisitionTimeoutError : public ProbekitError {
 public:
  explicit AcquisitionTimeoutError(std::chrono::milliseconds timeout)
      : ProbekitError("Resource acquisition timeout after " +
                      std::to_string(timeout.count()) + "ms"),
        timeout_(timeout) {}

  std::chrono::milliseconds timeout() const { return timeout_; }

 private:
  std::chrono::milliseconds timeout_;
};

class BufferTooLargeError : public ProbekitError {
 public:
  BufferTooLargeError(size_t size, size_t limit)
      : ProbekitError("Buffer of " + std::to_string(size) +
                      " bytes exceeds limit of " + std::to_string(limit) + " bytes") {}
};

// what() of the exception being handled; call only inside a catch block.
inline std::string DescribeCurrentException() {
  try {
    throw;
  } catch (const std::exception& e) {
    return e.what();
  } catch (...) {
    return "unknown exception";
  }
}

}  // namespace probekit::util

#endif  // PROBEKIT_UTIL_ERRORS_HPP_
