// Repository: Probekit-core
// Component: Buffer Cache
// Purpose: Capacity-bounded byte-buffer store with optional gzip compression
//          and least-recently-accessed rotation.
// Copyright (c) 2025 Probekit

#include "probekit/pool/BufferCache.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <sstream>

#include <zlib.h>

#include "probekit/util/Errors.hpp"
#include "probekit/util/Logger.hpp"

namespace probekit::pool {

namespace {

// windowBits 15 plus 16 selects the gzip wrapper instead of zlib's.
constexpr int kGzipWindowBits = 15 + 16;
constexpr int kGzipMemLevel = 8;
constexpr size_t kInflateChunk = 16 * 1024;

uint64_t WallClockMs() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now().time_since_epoch()).count());
}

bool OlderThan(const BufferEntry& a, const BufferEntry& b) {
  if (a.last_accessed != b.last_accessed) return a.last_accessed < b.last_accessed;
  return a.access_seq < b.access_seq;
}

}  // namespace

std::optional<std::vector<uint8_t>> GzipCompress(const std::vector<uint8_t>& raw) {
  z_stream zs;
  std::memset(&zs, 0, sizeof(zs));
  if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits,
                   kGzipMemLevel, Z_DEFAULT_STRATEGY) != Z_OK) {
    return std::nullopt;
  }

  std::vector<uint8_t> out(deflateBound(&zs, static_cast<uLong>(raw.size())));
  zs.next_in = const_cast<Bytef*>(raw.data());
  zs.avail_in = static_cast<uInt>(raw.size());
  zs.next_out = out.data();
  zs.avail_out = static_cast<uInt>(out.size());

  int rc = deflate(&zs, Z_FINISH);
  const size_t produced = zs.total_out;
  deflateEnd(&zs);
  if (rc != Z_STREAM_END) return std::nullopt;

  out.resize(produced);
  return out;
}

std::optional<std::vector<uint8_t>> GzipDecompress(const std::vector<uint8_t>& gz) {
  z_stream zs;
  std::memset(&zs, 0, sizeof(zs));
  if (inflateInit2(&zs, kGzipWindowBits) != Z_OK) return std::nullopt;

  zs.next_in = const_cast<Bytef*>(gz.data());
  zs.avail_in = static_cast<uInt>(gz.size());

  std::vector<uint8_t> out;
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    const size_t offset = out.size();
    out.resize(offset + kInflateChunk);
    zs.next_out = out.data() + offset;
    zs.avail_out = static_cast<uInt>(kInflateChunk);
    rc = inflate(&zs, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      inflateEnd(&zs);
      return std::nullopt;
    }
    out.resize(offset + (kInflateChunk - zs.avail_out));
    if (rc == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
      // Input exhausted before the gzip trailer.
      inflateEnd(&zs);
      return std::nullopt;
    }
  }
  inflateEnd(&zs);
  return out;
}

BufferCache::BufferCache(const BufferLimits& limits, std::shared_ptr<time::IClock> clock)
    : limits_(limits), clock_(std::move(clock)) {}

std::string BufferCache::CreateBuffer(const std::string& text, bool compress) {
  return CreateBuffer(std::vector<uint8_t>(text.begin(), text.end()), compress);
}

std::string BufferCache::CreateBuffer(const std::vector<uint8_t>& bytes, bool compress) {
  if (bytes.size() > limits_.max_buffer_size) {
    throw util::BufferTooLargeError(bytes.size(), limits_.max_buffer_size);
  }

  const bool should_compress = compress || bytes.size() >= limits_.compression_threshold;
  std::optional<std::vector<uint8_t>> packed;
  if (should_compress) {
    packed = GzipCompress(bytes);
    if (!packed) {
      util::Logger::Warn("[BufferCache] gzip failed for " + std::to_string(bytes.size()) +
                         " bytes, storing raw");
    }
  }

  size_t rotated = 0;
  std::string id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t cap = std::max<size_t>(limits_.max_total_buffers, 1);
    while (entries_.size() >= cap) {
      size_t removed = RotateLocked(true);
      if (removed == 0) break;
      rotated += removed;
    }

    const auto now = clock_->Now();
    std::ostringstream oss;
    oss << "buffer_" << ++id_counter_ << "_" << WallClockMs();
    id = oss.str();

    BufferEntry entry;
    entry.id = id;
    entry.compressed = packed.has_value();
    entry.bytes = packed ? std::move(*packed) : bytes;
    entry.logical_size = bytes.size();
    entry.created_at = now;
    entry.last_accessed = now;
    entry.access_seq = ++access_counter_;

    stored_bytes_ += entry.bytes.size();
    logical_bytes_ += entry.logical_size;
    entries_.emplace(id, std::move(entry));
  }

  if (rotated > 0) NotifyRotated(rotated);
  return id;
}

std::optional<std::vector<uint8_t>> BufferCache::GetBuffer(const std::string& id) {
  std::vector<uint8_t> stored;
  bool compressed = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    it->second.last_accessed = clock_->Now();
    it->second.access_seq = ++access_counter_;
    it->second.access_count++;
    stored = it->second.bytes;
    compressed = it->second.compressed;
  }

  if (!compressed) return stored;
  auto raw = GzipDecompress(stored);
  if (!raw) {
    util::Logger::Error("[BufferCache] corrupt gzip payload in " + id);
  }
  return raw;
}

bool BufferCache::DestroyBuffer(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = entries_.find(id);
  if (it == entries_.end()) return false;
  RemoveLocked(it);
  return true;
}

size_t BufferCache::Rotate(bool force) {
  size_t removed = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    removed = RotateLocked(force);
  }
  if (removed > 0) NotifyRotated(removed);
  return removed;
}

size_t BufferCache::RotateLocked(bool force) {
  const auto now = clock_->Now();
  auto ordered = OldestFirstLocked();
  if (!force) {
    ordered.erase(std::remove_if(ordered.begin(), ordered.end(),
                                 [&](const auto& it) {
                                   return now - it->second.last_accessed <=
                                          limits_.rotation_interval;
                                 }),
                  ordered.end());
  }
  if (ordered.empty()) return 0;

  const size_t victims = std::max<size_t>(1, ordered.size() / 2);
  for (size_t i = 0; i < victims; ++i) RemoveLocked(ordered[i]);

  rotations_++;
  rotated_out_ += victims;
  util::Logger::Debug("[BufferCache] rotated out " + std::to_string(victims) + " of " +
                      std::to_string(ordered.size()) + " candidates" +
                      (force ? " (forced)" : ""));
  return victims;
}

size_t BufferCache::AggressiveClear(size_t keep) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto ordered = OldestFirstLocked();
  if (ordered.size() <= keep) return 0;
  const size_t victims = ordered.size() - keep;
  for (size_t i = 0; i < victims; ++i) RemoveLocked(ordered[i]);
  return victims;
}

void BufferCache::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
  stored_bytes_ = 0;
  logical_bytes_ = 0;
}

bool BufferCache::Contains(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.count(id) != 0;
}

size_t BufferCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

BufferMetrics BufferCache::Metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  BufferMetrics m;
  m.total_buffers = entries_.size();
  m.total_size = stored_bytes_;
  m.logical_size = logical_bytes_;
  for (const auto& [id, entry] : entries_) {
    if (entry.compressed) m.compressed_buffers++;
  }
  m.compression_ratio = static_cast<double>(m.compressed_buffers) /
                        static_cast<double>(std::max<size_t>(1, m.total_buffers));
  m.rotations = rotations_;
  m.rotated_out = rotated_out_;
  return m;
}

void BufferCache::SetRotationListener(RotationListener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  rotation_listener_ = std::move(listener);
}

void BufferCache::RemoveLocked(std::unordered_map<std::string, BufferEntry>::iterator it) {
  stored_bytes_ -= it->second.bytes.size();
  logical_bytes_ -= it->second.logical_size;
  entries_.erase(it);
}

std::vector<std::unordered_map<std::string, BufferEntry>::iterator>
BufferCache::OldestFirstLocked() {
  std::vector<std::unordered_map<std::string, BufferEntry>::iterator> ordered;
  ordered.reserve(entries_.size());
  for (auto it = entries_.begin(); it != entries_.end(); ++it) ordered.push_back(it);
  std::sort(ordered.begin(), ordered.end(),
            [](const auto& a, const auto& b) { return OlderThan(a->second, b->second); });
  return ordered;
}

void BufferCache::NotifyRotated(size_t removed) {
  RotationListener listener;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener = rotation_listener_;
  }
  if (listener) listener(removed);
}

}  // namespace probekit::pool
