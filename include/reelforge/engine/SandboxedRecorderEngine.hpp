// Repository: ReelForge
// Component: Sandboxed Recorder Engine
// Purpose: Live-stream export through a streaming encoder whose container
//          bytes are collected as chunks and joined into one blob.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_ENGINE_SANDBOXED_RECORDER_ENGINE_HPP_
#define REELFORGE_ENGINE_SANDBOXED_RECORDER_ENGINE_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "reelforge/audio/AudioMixer.hpp"
#include "reelforge/audio/LiveAudioGraph.hpp"
#include "reelforge/capture/CaptureStreamBuilder.hpp"
#include "reelforge/encode/MediaEncoder.hpp"
#include "reelforge/engine/BackendEngine.hpp"

namespace reelforge::engine {

// SandboxedRecorderEngine
//
// Frames are pushed in real time by a LiveCaptureStream, audio is pulled
// from a LiveAudioGraph the mixer is attached to, and both go to a
// bitrate-driven streaming encoder. Progress is wall-clock elapsed over the
// job duration.
//
// Cancel stops frame pushes, aborts the encoder, discards buffered chunks
// and releases the audio graph before Encode() returns.
class SandboxedRecorderEngine : public IBackendEngine {
 public:
  SandboxedRecorderEngine(EngineTier tier, encode::MediaEncoderFactory encoder_factory);
  ~SandboxedRecorderEngine() override;

  SandboxedRecorderEngine(const SandboxedRecorderEngine&) = delete;
  SandboxedRecorderEngine& operator=(const SandboxedRecorderEngine&) = delete;

  EngineKind kind() const override { return EngineKind::kSandboxedRecorder; }
  EngineTier tier() const override { return tier_; }
  std::string name() const override;
  bool MuxesInternally() const override { return true; }

  pipeline::EngineStatus Initialize(const pipeline::ExportSettings& settings) override;
  pipeline::EngineStatus Encode(EngineContext& ctx) override;
  pipeline::EngineStatus Mux(EngineContext& ctx) override;
  void Cancel() override;
  void Release() override;

  // Video bitrate used for `preset` at `tier`.
  static int64_t VideoBitrateFor(EngineTier tier, pipeline::QualityPreset preset);

  // True while any encoder, stream, graph or chunk buffer is held.
  bool HoldsResources() const;
  size_t buffered_bytes() const;

 private:
  void OnChunk(const uint8_t* data, size_t size);
  pipeline::EngineStatus Teardown(pipeline::EngineStatus status);
  void ReleaseGraph();

  EngineTier tier_;
  encode::MediaEncoderFactory encoder_factory_;

  std::unique_ptr<encode::IMediaEncoder> encoder_;
  std::unique_ptr<audio::LiveAudioGraph> graph_;
  audio::AudioMixer* attached_mixer_ = nullptr;
  std::unique_ptr<capture::LiveCaptureStream> stream_;
  std::atomic<bool> cancel_requested_{false};

  mutable std::mutex chunks_mutex_;
  std::vector<std::vector<uint8_t>> chunks_;
  size_t buffered_bytes_ = 0;
};

}  // namespace reelforge::engine

#endif  // REELFORGE_ENGINE_SANDBOXED_RECORDER_ENGINE_HPP_
