// Repository: ReelForge
// Component: External Process Engine
// Purpose: Renders frames to disk and drives the native encoder through
//          the reelforge_export_host subprocess.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_ENGINE_EXTERNAL_PROCESS_ENGINE_HPP_
#define REELFORGE_ENGINE_EXTERNAL_PROCESS_ENGINE_HPP_

#include <atomic>
#include <functional>
#include <memory>
#include <string>

#include "reelforge/encode/FrameImageWriter.hpp"
#include "reelforge/engine/BackendEngine.hpp"
#include "reelforge/util/ChildProcess.hpp"
#include "reelforge/util/ScopedTempDir.hpp"

namespace reelforge::engine {

struct ExternalProcessOptions {
  std::string host_binary_path = "reelforge_export_host";
  std::string encoder_binary_path = "ffmpeg";
  std::string temp_root;
};

using FrameImageWriterFactory = std::function<std::unique_ptr<encode::IFrameImageWriter>()>;

// ExternalProcessEngine
//
// Encode: every frame is written as <job dir>/frames/frame-%04d.png and the
// full mix as one WAV (DiskCapture). With stream copy segments in the
// context no frame is rendered; the host joins the source files instead.
// Mux: the host is spawned as a process-group leader, receives one
// EncodeRequest, runs the encoder over the frame directory and streams
// progress and a result back. The finished file is then moved to the
// destination.
//
// Teardown: on cancel, timeout or failure the host's process group is
// SIGKILLed and reaped, and the job directory is removed. Release() does
// the same on every other path.
class ExternalProcessEngine : public IBackendEngine {
 public:
  ExternalProcessEngine(ExternalProcessOptions options, FrameImageWriterFactory writer_factory);
  ~ExternalProcessEngine() override;

  ExternalProcessEngine(const ExternalProcessEngine&) = delete;
  ExternalProcessEngine& operator=(const ExternalProcessEngine&) = delete;

  EngineKind kind() const override { return EngineKind::kExternalProcess; }
  EngineTier tier() const override { return EngineTier::kHigh; }
  std::string name() const override { return "ExternalProcess"; }
  bool MuxesInternally() const override { return false; }

  pipeline::EngineStatus Initialize(const pipeline::ExportSettings& settings) override;
  pipeline::EngineStatus Encode(EngineContext& ctx) override;
  pipeline::EngineStatus Mux(EngineContext& ctx) override;
  void Cancel() override;
  void Release() override;

  const std::string& job_directory() const { return temp_dir_.path(); }
  const std::string& frame_directory() const { return frame_dir_; }
  const std::string& audio_path() const { return audio_path_; }

 private:
  pipeline::EngineStatus RunHost(EngineContext& ctx);
  pipeline::EngineStatus Teardown(pipeline::EngineStatus status);

  ExternalProcessOptions options_;
  FrameImageWriterFactory writer_factory_;
  std::unique_ptr<encode::IFrameImageWriter> writer_;

  util::ScopedTempDir temp_dir_;
  std::string frame_dir_;
  std::string audio_path_;
  std::string temp_output_path_;
  int64_t frames_written_ = 0;

  std::unique_ptr<util::ChildProcess> host_;
  std::atomic<bool> cancel_requested_{false};
};

}  // namespace reelforge::engine

#endif  // REELFORGE_ENGINE_EXTERNAL_PROCESS_ENGINE_HPP_
