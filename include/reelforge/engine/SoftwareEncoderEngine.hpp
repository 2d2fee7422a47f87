// Repository: ReelForge
// Component: Software Encoder Engine
// Purpose: Frame-by-frame export through an in-process encoder fed by a
//          bounded producer/consumer queue.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_ENGINE_SOFTWARE_ENCODER_ENGINE_HPP_
#define REELFORGE_ENGINE_SOFTWARE_ENCODER_ENGINE_HPP_

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "reelforge/encode/MediaEncoder.hpp"
#include "reelforge/engine/BackendEngine.hpp"
#include "reelforge/util/ScopedTempDir.hpp"

namespace reelforge::engine {

struct SoftwareEncoderOptions {
  size_t queue_depth = 8;
  size_t frame_memory_ceiling_bytes = 256u * 1024u * 1024u;
  std::string temp_root;
};

// SoftwareEncoderEngine
//
// The coordinator thread renders frames and mixes the matching audio
// window (FrameSequence), copies each frame into a pooled buffer and
// queues it. One worker owns the encoder and drains the queue, so encoder
// calls are never concurrent. The pool holds `effective_queue_depth()`
// buffers; the producer blocks while all of them are in flight, which caps
// raw frame memory at depth * width * height * 4.
//
// The container is written into a job temp directory and moved to the
// destination in Mux().
class SoftwareEncoderEngine : public IBackendEngine {
 public:
  SoftwareEncoderEngine(encode::MediaEncoderFactory encoder_factory,
                        SoftwareEncoderOptions options);
  ~SoftwareEncoderEngine() override;

  SoftwareEncoderEngine(const SoftwareEncoderEngine&) = delete;
  SoftwareEncoderEngine& operator=(const SoftwareEncoderEngine&) = delete;

  EngineKind kind() const override { return EngineKind::kSoftwareEncoder; }
  EngineTier tier() const override { return EngineTier::kMid; }
  std::string name() const override { return "SoftwareEncoder"; }
  bool MuxesInternally() const override { return true; }

  pipeline::EngineStatus Initialize(const pipeline::ExportSettings& settings) override;
  pipeline::EngineStatus Encode(EngineContext& ctx) override;
  pipeline::EngineStatus Mux(EngineContext& ctx) override;
  void Cancel() override;
  void Release() override;

  // Depth after applying the memory ceiling; valid after Initialize().
  size_t effective_queue_depth() const { return effective_depth_; }
  int64_t frames_encoded() const { return frames_encoded_.load(std::memory_order_acquire); }

  // max(1, ceiling / frame_bytes) when depth * frame_bytes exceeds the
  // ceiling, `depth` otherwise.
  static size_t ComputeQueueDepth(size_t depth, size_t frame_bytes, size_t ceiling);

 private:
  struct QueuedFrame {
    int64_t index = 0;
    double timestamp_seconds = 0.0;
    std::unique_ptr<pipeline::PixelBuffer> pixels;
    pipeline::PcmBuffer audio;
  };

  void WorkerLoop();
  std::unique_ptr<pipeline::PixelBuffer> AcquireBuffer(const EngineContext& ctx);
  void ReturnBuffer(std::unique_ptr<pipeline::PixelBuffer> buffer);
  void StopWorker();
  pipeline::EngineStatus Teardown(pipeline::EngineStatus status);

  encode::MediaEncoderFactory encoder_factory_;
  SoftwareEncoderOptions options_;
  size_t effective_depth_ = 0;

  std::unique_ptr<encode::IMediaEncoder> encoder_;
  util::ScopedTempDir temp_dir_;
  std::string temp_output_path_;
  bool encoded_ = false;

  std::atomic<bool> cancel_requested_{false};
  std::atomic<int64_t> frames_encoded_{0};

  std::thread worker_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<QueuedFrame> queue_;
  std::vector<std::unique_ptr<pipeline::PixelBuffer>> pool_;
  bool input_closed_ = false;
  bool worker_stop_ = false;
  bool worker_done_ = false;
  pipeline::EngineStatus worker_status_;
};

}  // namespace reelforge::engine

#endif  // REELFORGE_ENGINE_SOFTWARE_ENCODER_ENGINE_HPP_
