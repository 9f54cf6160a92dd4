// Repository: Probekit-core
// Component: Environment Configuration
// Purpose: PROBEKIT_* environment and command-line overrides for the
//          resource pool limits.
// Copyright (c) 2025 Probekit

#include "probekit/config/EnvConfig.hpp"

#include <cerrno>
#include <chrono>
#include <cstdlib>

#include "probekit/util/Logger.hpp"

namespace probekit::config {

namespace {

constexpr uint64_t kMiB = 1024ull * 1024;

using std::chrono::milliseconds;

const std::vector<PoolSetting> kPoolSettings = {
    {kEnvPoolMaxSize, "--pool-size", 1, 10'000,
     [](pool::ResourcePoolConfig& c, uint64_t v) { c.pool.max_size = static_cast<size_t>(v); }},
    {kEnvPoolIdleTimeoutMs, "--idle-timeout-ms", 0, kMaxDurationMs,
     [](pool::ResourcePoolConfig& c, uint64_t v) { c.pool.idle_timeout = milliseconds(v); }},
    {kEnvPoolMaxAgeMs, "--max-age-ms", 0, kMaxDurationMs,
     [](pool::ResourcePoolConfig& c, uint64_t v) { c.pool.max_age = milliseconds(v); }},
    {kEnvPoolAcquireTimeoutMs, "--acquire-timeout-ms", 1, kMaxDurationMs,
     [](pool::ResourcePoolConfig& c, uint64_t v) {
       c.pool.acquisition_timeout = milliseconds(v);
     }},
    {kEnvMemoryMaxHeapMb, "--max-heap-mb", 1, 1024ull * 1024,
     [](pool::ResourcePoolConfig& c, uint64_t v) { c.memory.max_heap_used = v * kMiB; }},
    {kEnvMemoryMaxRssMb, "--max-rss-mb", 1, 1024ull * 1024,
     [](pool::ResourcePoolConfig& c, uint64_t v) { c.memory.max_rss = v * kMiB; }},
    {kEnvMemoryGcThreshold, "--gc-threshold", 1, 100,
     [](pool::ResourcePoolConfig& c, uint64_t v) {
       c.memory.gc_threshold_percent = static_cast<double>(v);
     }},
    {kEnvBufferMaxTotal, "--max-buffers", 1, 1'000'000,
     [](pool::ResourcePoolConfig& c, uint64_t v) {
       c.buffer.max_total_buffers = static_cast<size_t>(v);
     }},
    {kEnvBufferCompressionThreshold, "--compression-threshold", 0, 1ull << 32,
     [](pool::ResourcePoolConfig& c, uint64_t v) {
       c.buffer.compression_threshold = static_cast<size_t>(v);
     }},
};

// Looks up the setting's variable and checks it. Logs and returns nullopt on rejection.
std::optional<uint64_t> ReadBounded(const EnvLookup& lookup, const PoolSetting& setting) {
  std::optional<std::string> raw = lookup(setting.env_name);
  if (!raw) return std::nullopt;
  if (!ParseUnsigned(*raw)) {
    util::Logger::Warn(std::string("[EnvConfig] ignoring ") + setting.env_name + "='" + *raw +
                       "': not an unsigned integer");
    return std::nullopt;
  }
  std::optional<uint64_t> value = ParseBounded(*raw, setting.min, setting.max);
  if (!value) {
    util::Logger::Warn(std::string("[EnvConfig] ignoring ") + setting.env_name + "=" + *raw +
                       ": outside [" + std::to_string(setting.min) + ", " +
                       std::to_string(setting.max) + "]");
  }
  return value;
}

}  // namespace

const std::vector<PoolSetting>& PoolSettings() { return kPoolSettings; }

const PoolSetting* FindPoolSettingByFlag(const std::string& flag) {
  for (const PoolSetting& setting : kPoolSettings) {
    if (flag == setting.flag) return &setting;
  }
  return nullptr;
}

EnvLookup ProcessEnvironment() {
  return [](const char* name) -> std::optional<std::string> {
    const char* v = std::getenv(name);
    if (v == nullptr) return std::nullopt;
    return std::string(v);
  };
}

std::optional<uint64_t> ParseUnsigned(const std::string& text) {
  if (text.empty()) return std::nullopt;
  for (char c : text) {
    if (c < '0' || c > '9') return std::nullopt;
  }
  errno = 0;
  char* end = nullptr;
  unsigned long long v = std::strtoull(text.c_str(), &end, 10);
  if (errno == ERANGE || end == nullptr || *end != '\0') return std::nullopt;
  return static_cast<uint64_t>(v);
}

std::optional<uint64_t> ParseBounded(const std::string& text, uint64_t min, uint64_t max) {
  std::optional<uint64_t> value = ParseUnsigned(text);
  if (!value || *value < min || *value > max) return std::nullopt;
  return value;
}

int ApplyEnvOverrides(pool::ResourcePoolConfig& config, const EnvLookup& lookup) {
  int applied = 0;
  for (const PoolSetting& setting : kPoolSettings) {
    if (auto v = ReadBounded(lookup, setting)) {
      setting.apply(config, *v);
      ++applied;
    }
  }

  if (applied > 0) {
    util::Logger::Info("[EnvConfig] applied " + std::to_string(applied) + " environment override(s)");
  }
  return applied;
}

}  // namespace probekit::config
