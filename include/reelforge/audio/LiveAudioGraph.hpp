// Repository: ReelForge
// Component: Live Audio Graph
// Purpose: Pull-driven audio output for the streaming recorder path.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_AUDIO_LIVE_AUDIO_GRAPH_HPP_
#define REELFORGE_AUDIO_LIVE_AUDIO_GRAPH_HPP_

#include <cstdint>
#include <functional>
#include <mutex>

#include "reelforge/pipeline/ExportTypes.hpp"

namespace reelforge::audio {

// LiveAudioGraph is the destination a mixer attaches to when audio is
// consumed in real time. The capture clock pulls it once per video tick;
// each pull renders the span from the graph cursor up to the requested
// time and advances the cursor, so consecutive pulls are gapless.
//
// Release() disconnects the render function. After release every pull
// returns an empty buffer and the mixer may be destroyed.
class LiveAudioGraph {
 public:
  // Renders frames [start_frame, end_frame) at the mix rate.
  using RenderFn = std::function<pipeline::PcmBuffer(int64_t start_frame, int64_t end_frame)>;

  LiveAudioGraph() = default;
  ~LiveAudioGraph();

  LiveAudioGraph(const LiveAudioGraph&) = delete;
  LiveAudioGraph& operator=(const LiveAudioGraph&) = delete;

  void Connect(RenderFn render, int64_t total_frames);

  pipeline::PcmBuffer Pull(double until_seconds);

  void Release();

  bool IsConnected() const;
  int64_t cursor_frames() const;
  int64_t total_frames() const;

 private:
  mutable std::mutex mutex_;
  RenderFn render_;
  int64_t total_frames_ = 0;
  int64_t cursor_ = 0;
};

}  // namespace reelforge::audio

#endif  // REELFORGE_AUDIO_LIVE_AUDIO_GRAPH_HPP_
