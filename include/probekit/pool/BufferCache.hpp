// Repository: Probekit-core
// Component: Buffer Cache
// Purpose: Capacity-bounded byte-buffer store with optional gzip compression
//          and least-recently-accessed rotation.
// Copyright (c) 2025 Probekit

#ifndef PROBEKIT_POOL_BUFFER_CACHE_HPP_
#define PROBEKIT_POOL_BUFFER_CACHE_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "probekit/pool/PoolTypes.hpp"
#include "probekit/time/IClock.hpp"

namespace probekit::pool {

// gzip (RFC 1952) helpers over zlib. Compress returns nullopt on zlib failure;
// Decompress returns nullopt for malformed input.
std::optional<std::vector<uint8_t>> GzipCompress(const std::vector<uint8_t>& raw);
std::optional<std::vector<uint8_t>> GzipDecompress(const std::vector<uint8_t>& gz);

struct BufferEntry {
  std::string id;
  std::vector<uint8_t> bytes;  // stored form
  size_t logical_size = 0;
  bool compressed = false;
  time::IClock::TimePoint created_at;
  time::IClock::TimePoint last_accessed;
  uint64_t access_seq = 0;  // tiebreak for equal last_accessed
  uint64_t access_count = 0;
};

// BufferCache is thread-safe. Entries are removed oldest-first by
// (last_accessed, access_seq), never in map order.
class BufferCache {
 public:
  using RotationListener = std::function<void(size_t removed)>;

  static constexpr size_t kAggressiveKeep = 5;

  explicit BufferCache(const BufferLimits& limits,
                       std::shared_ptr<time::IClock> clock = time::DefaultClock());

  BufferCache(const BufferCache&) = delete;
  BufferCache& operator=(const BufferCache&) = delete;

  // Stores a copy of bytes and returns its id. Rotates first when the cache
  // is full. Payloads at or above compression_threshold are compressed even
  // when compress is false. Throws util::BufferTooLargeError above
  // max_buffer_size.
  std::string CreateBuffer(const std::vector<uint8_t>& bytes, bool compress = false);
  std::string CreateBuffer(const std::string& text, bool compress = false);

  // Returns the original bytes (decompressed) and marks the entry accessed.
  std::optional<std::vector<uint8_t>> GetBuffer(const std::string& id);

  bool DestroyBuffer(const std::string& id);

  // force=false: only entries idle longer than rotation_interval are
  // candidates. Removes half of the candidates (at least one), oldest first.
  // Returns the number removed.
  size_t Rotate(bool force);

  // Keeps the `keep` most recently accessed entries; returns number removed.
  size_t AggressiveClear(size_t keep = kAggressiveKeep);

  void Clear();

  bool Contains(const std::string& id) const;
  size_t size() const;
  BufferMetrics Metrics() const;
  const BufferLimits& limits() const { return limits_; }

  // Invoked outside the cache lock whenever a rotation removed entries.
  void SetRotationListener(RotationListener listener);

 private:
  size_t RotateLocked(bool force);
  void RemoveLocked(std::unordered_map<std::string, BufferEntry>::iterator it);
  std::vector<std::unordered_map<std::string, BufferEntry>::iterator> OldestFirstLocked();
  void NotifyRotated(size_t removed);

  const BufferLimits limits_;
  std::shared_ptr<time::IClock> clock_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, BufferEntry> entries_;
  size_t stored_bytes_ = 0;
  size_t logical_bytes_ = 0;
  uint64_t id_counter_ = 0;
  uint64_t access_counter_ = 0;
  uint64_t rotations_ = 0;
  uint64_t rotated_out_ = 0;

  std::mutex listener_mutex_;
  RotationListener rotation_listener_;
};

}  // namespace probekit::pool

#endif  // PROBEKIT_POOL_BUFFER_CACHE_HPP_
