// Repository: ReelForge
// Component: Audio Decode Cache
// Purpose: Decoded-audio cache shared read-only across jobs.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_AUDIO_AUDIO_DECODE_CACHE_HPP_
#define REELFORGE_AUDIO_AUDIO_DECODE_CACHE_HPP_

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "reelforge/audio/AudioDecoder.hpp"

namespace reelforge::audio {

// AudioDecodeCache maps (sourceRef, source window) to decoded PCM.
//
// A lookup hits any completed entry for the same sourceRef whose decoded
// span covers the requested window, so a clip reusing part of an earlier
// decode costs nothing. Single writer per span: while a decode covering the
// window is in flight, later callers wait for it instead of starting their
// own. Entries are immutable and handed out as shared_ptr<const>, so any
// number of jobs read them concurrently; eviction only drops the cache's
// reference. Failed decodes are not cached; the next caller retries.
//
// Retention is bounded by `byte_budget`: after each insert the least
// recently used completed entries are evicted until the total fits. A
// decode larger than the whole budget is returned but never cached.
class AudioDecodeCache {
 public:
  using DecodeFn = std::function<bool(DecodedAudio* out, std::string* error)>;

  static constexpr size_t kDefaultByteBudget = 512u * 1024u * 1024u;

  explicit AudioDecodeCache(size_t byte_budget = kDefaultByteBudget);

  AudioDecodeCache(const AudioDecodeCache&) = delete;
  AudioDecodeCache& operator=(const AudioDecodeCache&) = delete;

  // Returns a covering entry, or runs `decode` when no entry covers
  // `window`. `decode` must fill at least `window`. Returns nullptr (with
  // `error`) on decode failure or when `abort` is raised while waiting on
  // another writer.
  std::shared_ptr<const DecodedAudio> GetOrDecode(const std::string& key,
                                                  const DecodeWindow& window,
                                                  const std::atomic<bool>& abort,
                                                  const DecodeFn& decode,
                                                  std::string* error);

  // Any completed entry for `key`.
  bool Contains(const std::string& key) const;
  // A completed entry for `key` covering `window`.
  bool Contains(const std::string& key, const DecodeWindow& window) const;
  // Completed entries.
  size_t size() const;
  size_t bytes() const;
  size_t byte_budget() const { return byte_budget_; }
  void Clear();

  // Number of decodes actually executed (cache misses).
  uint64_t decode_count() const { return decode_count_.load(std::memory_order_relaxed); }
  uint64_t eviction_count() const { return eviction_count_.load(std::memory_order_relaxed); }

 private:
  struct Entry {
    DecodeWindow window;
    bool in_flight = true;
    std::shared_ptr<const DecodedAudio> audio;
    size_t bytes = 0;
    uint64_t last_used = 0;
  };
  using EntryList = std::vector<std::shared_ptr<Entry>>;

  static bool EntryCovers(const Entry& entry, const DecodeWindow& window);
  void RemoveLocked(const std::string& key, const Entry* entry);
  void EvictLocked(const Entry* keep);

  const size_t byte_budget_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::map<std::string, EntryList> entries_;
  size_t bytes_ = 0;
  uint64_t tick_ = 0;
  std::atomic<uint64_t> decode_count_{0};
  std::atomic<uint64_t> eviction_count_{0};
};

}  // namespace reelforge::audio

#endif  // REELFORGE_AUDIO_AUDIO_DECODE_CACHE_HPP_
