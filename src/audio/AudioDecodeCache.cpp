// Repository: ReelForge
// Component: Audio Decode Cache
// Purpose: Decoded-audio cache shared read-only across jobs.
// Copyright (c) 2025 ReelForge

#include "reelforge/audio/AudioDecodeCache.hpp"

#include <algorithm>
#include <chrono>
#include <limits>

#include "reelforge/util/Logger.hpp"

namespace reelforge::audio {

namespace {
constexpr auto kWaitSlice = std::chrono::milliseconds(20);
// Half a mix frame; window edges closer than this are equal.
constexpr double kEdgeEpsilon = 0.5 / pipeline::kMixSampleRate;
}  // namespace

double DecodeWindow::EndSeconds() const {
  return ToEnd() ? std::numeric_limits<double>::infinity()
                 : start_seconds + duration_seconds;
}

bool DecodeWindow::Covers(const DecodeWindow& other) const {
  if (other.start_seconds + kEdgeEpsilon < start_seconds) return false;
  if (ToEnd()) return true;
  return !other.ToEnd() && other.EndSeconds() <= EndSeconds() + kEdgeEpsilon;
}

bool DecodedAudio::Covers(const DecodeWindow& request) const {
  if (request.start_seconds + kEdgeEpsilon < window.start_seconds) return false;
  return reached_end || window.Covers(request);
}

AudioDecodeCache::AudioDecodeCache(size_t byte_budget) : byte_budget_(byte_budget) {}

bool AudioDecodeCache::EntryCovers(const Entry& entry, const DecodeWindow& window) {
  return entry.in_flight ? entry.window.Covers(window) : entry.audio->Covers(window);
}

std::shared_ptr<const DecodedAudio> AudioDecodeCache::GetOrDecode(
    const std::string& key, const DecodeWindow& window, const std::atomic<bool>& abort,
    const DecodeFn& decode, std::string* error) {
  std::shared_ptr<Entry> mine;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
      EntryList& list = entries_[key];
      bool pending = false;
      for (const auto& entry : list) {
        if (!EntryCovers(*entry, window)) continue;
        if (!entry->in_flight) {
          entry->last_used = ++tick_;
          return entry->audio;
        }
        pending = true;
      }
      if (!pending) {
        mine = std::make_shared<Entry>();
        mine->window = window;
        list.push_back(mine);
        break;  // this caller is the writer
      }
      if (abort.load(std::memory_order_acquire)) {
        if (error) *error = "aborted while waiting for concurrent decode of " + key;
        return nullptr;
      }
      cv_.wait_for(lock, kWaitSlice);
    }
  }

  decode_count_.fetch_add(1, std::memory_order_relaxed);
  auto decoded = std::make_shared<DecodedAudio>();
  std::string decode_error;
  const bool ok = decode(decoded.get(), &decode_error);

  std::shared_ptr<const DecodedAudio> result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ok) {
      RemoveLocked(key, mine.get());
    } else {
      result = decoded;
      const size_t size = decoded->ByteSize();
      if (size > byte_budget_) {
        RemoveLocked(key, mine.get());
        util::Logger::Debug("[AudioDecodeCache] not caching " + key + ": " +
                            std::to_string(size) + " bytes exceeds the budget");
      } else {
        // Completed entries the new span supersedes.
        EntryList& list = entries_[key];
        for (auto it = list.begin(); it != list.end();) {
          const Entry& other = **it;
          if (&other != mine.get() && !other.in_flight && decoded->Covers(other.audio->window)) {
            bytes_ -= other.bytes;
            it = list.erase(it);
          } else {
            ++it;
          }
        }
        mine->in_flight = false;
        mine->audio = decoded;
        mine->bytes = size;
        mine->last_used = ++tick_;
        bytes_ += size;
        EvictLocked(mine.get());
      }
    }
  }
  cv_.notify_all();

  if (!ok && error) *error = decode_error;
  return result;
}

void AudioDecodeCache::RemoveLocked(const std::string& key, const Entry* entry) {
  auto found = entries_.find(key);
  if (found == entries_.end()) return;
  EntryList& list = found->second;
  for (auto it = list.begin(); it != list.end(); ++it) {
    if (it->get() == entry) {
      if (!entry->in_flight) bytes_ -= entry->bytes;
      list.erase(it);
      break;
    }
  }
  if (list.empty()) entries_.erase(found);
}

void AudioDecodeCache::EvictLocked(const Entry* keep) {
  while (bytes_ > byte_budget_) {
    const std::string* victim_key = nullptr;
    const Entry* victim = nullptr;
    for (const auto& [key, list] : entries_) {
      for (const auto& entry : list) {
        if (entry->in_flight || entry.get() == keep) continue;
        if (!victim || entry->last_used < victim->last_used) {
          victim = entry.get();
          victim_key = &key;
        }
      }
    }
    if (!victim) return;
    const std::string key = *victim_key;
    RemoveLocked(key, victim);
    eviction_count_.fetch_add(1, std::memory_order_relaxed);
    util::Logger::Debug("[AudioDecodeCache] evicted " + key);
  }
}

bool AudioDecodeCache::Contains(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto found = entries_.find(key);
  if (found == entries_.end()) return false;
  return std::any_of(found->second.begin(), found->second.end(),
                     [](const std::shared_ptr<Entry>& e) { return !e->in_flight; });
}

bool AudioDecodeCache::Contains(const std::string& key, const DecodeWindow& window) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto found = entries_.find(key);
  if (found == entries_.end()) return false;
  return std::any_of(found->second.begin(), found->second.end(),
                     [&window](const std::shared_ptr<Entry>& e) {
                       return !e->in_flight && e->audio->Covers(window);
                     });
}

size_t AudioDecodeCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t n = 0;
  for (const auto& [key, list] : entries_) {
    for (const auto& entry : list) {
      if (!entry->in_flight) ++n;
    }
  }
  return n;
}

size_t AudioDecodeCache::bytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bytes_;
}

void AudioDecodeCache::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto it = entries_.begin(); it != entries_.end();) {
    EntryList& list = it->second;
    list.erase(std::remove_if(list.begin(), list.end(),
                              [](const std::shared_ptr<Entry>& e) { return !e->in_flight; }),
               list.end());
    if (list.empty()) {
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
  bytes_ = 0;
}

}  // namespace reelforge::audio
