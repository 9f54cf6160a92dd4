// Repository: Probekit-core
// Component: Environment Configuration
// Purpose: PROBEKIT_* environment and command-line overrides for the
//          resource pool limits.
// Copyright (c) 2025 Probekit

#ifndef PROBEKIT_CONFIG_ENV_CONFIG_HPP_
#define PROBEKIT_CONFIG_ENV_CONFIG_HPP_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "probekit/pool/PoolTypes.hpp"

namespace probekit::config {

inline constexpr const char* kEnvPoolMaxSize = "PROBEKIT_POOL_MAX_SIZE";
inline constexpr const char* kEnvPoolIdleTimeoutMs = "PROBEKIT_POOL_IDLE_TIMEOUT_MS";
inline constexpr const char* kEnvPoolMaxAgeMs = "PROBEKIT_POOL_MAX_AGE_MS";
inline constexpr const char* kEnvPoolAcquireTimeoutMs = "PROBEKIT_POOL_ACQUIRE_TIMEOUT_MS";
inline constexpr const char* kEnvMemoryMaxHeapMb = "PROBEKIT_MEMORY_MAX_HEAP_MB";
inline constexpr const char* kEnvMemoryMaxRssMb = "PROBEKIT_MEMORY_MAX_RSS_MB";
inline constexpr const char* kEnvMemoryGcThreshold = "PROBEKIT_MEMORY_GC_THRESHOLD";
inline constexpr const char* kEnvBufferMaxTotal = "PROBEKIT_BUFFER_MAX_TOTAL";
inline constexpr const char* kEnvBufferCompressionThreshold =
    "PROBEKIT_BUFFER_COMPRESSION_THRESHOLD";

// Upper bound for every millisecond knob (one week).
inline constexpr uint64_t kMaxDurationMs = 7ull * 24 * 3600 * 1000;

// One tunable pool limit, reachable from the environment and from the
// command line with the same bounds.
struct PoolSetting {
  const char* env_name;
  const char* flag;
  uint64_t min;
  uint64_t max;
  void (*apply)(pool::ResourcePoolConfig& config, uint64_t value);
};

const std::vector<PoolSetting>& PoolSettings();

// nullptr when `flag` (e.g. "--max-age-ms") names no pool setting.
const PoolSetting* FindPoolSettingByFlag(const std::string& flag);

// Returns the variable's value, nullopt when unset. Injectable for tests.
using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

EnvLookup ProcessEnvironment();

// Whole-string unsigned decimal parse; nullopt on anything else.
std::optional<uint64_t> ParseUnsigned(const std::string& text);

// ParseUnsigned() plus an inclusive range check.
std::optional<uint64_t> ParseBounded(const std::string& text, uint64_t min, uint64_t max);

// Applies every recognised variable; malformed or out-of-range values are
// logged at Warn and leave the field untouched. Returns how many applied.
int ApplyEnvOverrides(pool::ResourcePoolConfig& config,
                      const EnvLookup& lookup = ProcessEnvironment());

}  // namespace probekit::config

#endif  // PROBEKIT_CONFIG_ENV_CONFIG_HPP_
