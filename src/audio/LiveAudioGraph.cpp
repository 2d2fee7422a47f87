// Repository: ReelForge
// Component: Live Audio Graph
// Purpose: Pull-driven audio output for the streaming recorder path.
// Copyright (c) 2025 ReelForge

#include "reelforge/audio/LiveAudioGraph.hpp"

#include <algorithm>
#include <cmath>

namespace reelforge::audio {

LiveAudioGraph::~LiveAudioGraph() {
  Release();
}

void LiveAudioGraph::Connect(RenderFn render, int64_t total_frames) {
  std::lock_guard<std::mutex> lock(mutex_);
  render_ = std::move(render);
  total_frames_ = std::max<int64_t>(0, total_frames);
  cursor_ = 0;
}

pipeline::PcmBuffer LiveAudioGraph::Pull(double until_seconds) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!render_) return pipeline::PcmBuffer{};
  int64_t until = static_cast<int64_t>(
      std::llround(until_seconds * pipeline::kMixSampleRate));
  until = std::clamp<int64_t>(until, cursor_, total_frames_);
  if (until == cursor_) return pipeline::PcmBuffer{};
  pipeline::PcmBuffer out = render_(cursor_, until);
  cursor_ = until;
  return out;
}

void LiveAudioGraph::Release() {
  std::lock_guard<std::mutex> lock(mutex_);
  render_ = nullptr;
}

bool LiveAudioGraph::IsConnected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<bool>(render_);
}

int64_t LiveAudioGraph::cursor_frames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cursor_;
}

int64_t LiveAudioGraph::total_frames() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_frames_;
}

}  // namespace reelforge::audio
