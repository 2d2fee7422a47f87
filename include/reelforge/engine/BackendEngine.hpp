// Repository: ReelForge
// Component: Backend Engine Contract
// Purpose: Interface shared by the three interchangeable encode strategies.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_ENGINE_BACKEND_ENGINE_HPP_
#define REELFORGE_ENGINE_BACKEND_ENGINE_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "reelforge/pipeline/ExportTypes.hpp"

namespace reelforge::audio {
class AudioMixer;
}
namespace reelforge::frame {
class FrameSource;
}

namespace reelforge::engine {

enum class EngineKind {
  kSandboxedRecorder = 0,
  kSoftwareEncoder,
  kExternalProcess,
};

// Capability tier a candidate is evaluated at. Only the recorder has more
// than one tier (high and the always-supported baseline).
enum class EngineTier {
  kBaseline = 0,
  kMid,
  kHigh,
};

const char* EngineKindToString(EngineKind kind);
const char* EngineTierToString(EngineTier tier);

struct EngineCandidate {
  EngineKind kind = EngineKind::kSandboxedRecorder;
  EngineTier tier = EngineTier::kBaseline;

  bool operator==(const EngineCandidate& other) const {
    return kind == other.kind && tier == other.tier;
  }
  bool operator!=(const EngineCandidate& other) const { return !(*this == other); }

  // "ExternalProcess", "SandboxedRecorder(high)", ...
  std::string Describe() const;
};

// Everything an engine needs from the job while it runs. The Frame Source
// and mixer are owned by the coordinator and outlive the engine's Encode()
// and Mux() calls.
struct EngineContext {
  uint64_t job_id = 0;
  pipeline::ExportSettings settings;
  frame::FrameSource* frames = nullptr;
  audio::AudioMixer* mixer = nullptr;

  // Raised by the coordinator on Cancel(). Checked between frames and IPC
  // messages.
  const std::atomic<bool>* cancel = nullptr;

  // Wall-clock budget for Encoding + Muxing.
  std::chrono::steady_clock::time_point deadline =
      std::chrono::steady_clock::time_point::max();

  // Source files to join with stream copy, in timeline order. Empty means
  // the frames are rendered. Only the external engine acts on it.
  std::vector<std::string> stream_copy_segments;

  // (phase, completion of that phase in [0, 1])
  std::function<void(pipeline::JobState, double)> progress;

  bool CancelRequested() const {
    return cancel != nullptr && cancel->load(std::memory_order_acquire);
  }
  bool DeadlineExceeded() const {
    return std::chrono::steady_clock::now() >= deadline;
  }
  void ReportProgress(pipeline::JobState phase, double fraction) const {
    if (progress) progress(phase, fraction);
  }
};

// IBackendEngine
//
// Lifecycle: Initialize() once, then Encode() and Mux() from the
// coordinator worker, then Release(). Cancel() may be called from any
// thread at any time; the running call notices it at its next checkpoint,
// tears down and returns kCancelled.
//
// Release() frees every resource the engine holds (encoder, subprocess,
// temp files, audio graph). It is idempotent and also run by destructors.
class IBackendEngine {
 public:
  virtual ~IBackendEngine() = default;

  virtual EngineKind kind() const = 0;
  virtual EngineTier tier() const = 0;
  virtual std::string name() const = 0;

  // True when Encode() already produces the final container and Mux() only
  // delivers it.
  virtual bool MuxesInternally() const = 0;

  // Failure here is an initialization failure; the selector moves on to
  // the next candidate.
  virtual pipeline::EngineStatus Initialize(const pipeline::ExportSettings& settings) = 0;

  virtual pipeline::EngineStatus Encode(EngineContext& ctx) = 0;
  virtual pipeline::EngineStatus Mux(EngineContext& ctx) = 0;

  virtual void Cancel() = 0;
  virtual void Release() = 0;
};

using EngineFactory =
    std::function<std::unique_ptr<IBackendEngine>(const EngineCandidate& candidate)>;

// Checkpoint shared by every engine loop: kCancelled or kTimeout failure,
// or success when the job may go on.
pipeline::EngineStatus CheckInterrupted(const EngineContext& ctx,
                                        const std::atomic<bool>& engine_cancel);

// Moves a finished file to its destination (rename, falling back to copy
// across filesystems).
pipeline::EngineStatus DeliverOutputFile(const std::string& from, const std::string& to);

// Writes an in-memory container to `path`.
pipeline::EngineStatus DeliverOutputBlob(const std::vector<uint8_t>& blob,
                                         const std::string& path);

}  // namespace reelforge::engine

#endif  // REELFORGE_ENGINE_BACKEND_ENGINE_HPP_
