// Repository: ReelForge
// Component: Sandboxed Recorder Engine
// Purpose: Live-stream export through a streaming encoder whose container
//          bytes are collected as chunks and joined into one blob.
// Copyright (c) 2025 ReelForge

#include "reelforge/engine/SandboxedRecorderEngine.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

#include "reelforge/util/Logger.hpp"

namespace reelforge::engine {

using pipeline::EngineStatus;
using pipeline::ExportError;
using pipeline::JobState;

namespace {

constexpr auto kStreamPollInterval = std::chrono::milliseconds(50);

}  // namespace

SandboxedRecorderEngine::SandboxedRecorderEngine(EngineTier tier,
                                                 encode::MediaEncoderFactory encoder_factory)
    : tier_(tier), encoder_factory_(std::move(encoder_factory)) {}

SandboxedRecorderEngine::~SandboxedRecorderEngine() {
  Release();
}

std::string SandboxedRecorderEngine::name() const {
  return EngineCandidate{kind(), tier_}.Describe();
}

int64_t SandboxedRecorderEngine::VideoBitrateFor(EngineTier tier,
                                                 pipeline::QualityPreset preset) {
  const int64_t wanted = pipeline::QualityParamsFor(preset).video_bitrate;
  if (tier == EngineTier::kHigh) return wanted;
  return std::min(wanted,
                  pipeline::QualityParamsFor(pipeline::QualityPreset::kLow).video_bitrate);
}

EngineStatus SandboxedRecorderEngine::Initialize(const pipeline::ExportSettings& settings) {
  if (!encoder_factory_) {
    return EngineStatus::Failure(ExportError::kEngineInitialization,
                                 "no streaming encoder available");
  }
  encoder_ = encoder_factory_();
  if (!encoder_) {
    return EngineStatus::Failure(ExportError::kEngineInitialization,
                                 "streaming encoder could not be created");
  }

  encode::EncoderOpenParams params;
  params.width = settings.width;
  params.height = settings.height;
  params.fps = settings.fps;
  params.format = settings.format;
  params.quality = settings.quality;
  params.video_bitrate = VideoBitrateFor(tier_, settings.quality);
  params.chunk_sink = [this](const uint8_t* data, size_t size) { OnChunk(data, size); };

  EngineStatus status = encoder_->Open(params);
  if (!status.ok) {
    encoder_->Abort();
    encoder_.reset();
    return EngineStatus::Failure(ExportError::kEngineInitialization,
                                 "streaming encoder failed to open: " + status.message,
                                 status.diagnostic);
  }
  cancel_requested_.store(false, std::memory_order_release);

  std::ostringstream oss;
  oss << "[SandboxedRecorderEngine] initialized tier=" << EngineTierToString(tier_)
      << " " << settings.width << "x" << settings.height << "@" << settings.fps
      << " bitrate=" << params.video_bitrate;
  util::Logger::Info(oss.str());
  return EngineStatus::Success();
}

void SandboxedRecorderEngine::OnChunk(const uint8_t* data, size_t size) {
  std::lock_guard<std::mutex> lock(chunks_mutex_);
  chunks_.emplace_back(data, data + size);
  buffered_bytes_ += size;
}

EngineStatus SandboxedRecorderEngine::Encode(EngineContext& ctx) {
  if (!encoder_) {
    return EngineStatus::Failure(ExportError::kEngineInitialization,
                                 "recorder used before Initialize()");
  }

  graph_ = std::make_unique<audio::LiveAudioGraph>();
  capture::CaptureStreamBuilder builder(ctx.settings, ctx.frames, ctx.mixer);
  stream_ = builder.BuildLiveStream(graph_.get());
  attached_mixer_ = ctx.mixer;
  if (!stream_) {
    return Teardown(EngineStatus::Failure(ExportError::kEngineInitialization,
                                          "audio graph could not be attached"));
  }

  // Written only by the stream thread until the stream is joined.
  EngineStatus sink_status = EngineStatus::Success();
  const bool started = stream_->Start(
      [this, &sink_status](const pipeline::EncodedFrame& frame,
                           const pipeline::PcmBuffer& pcm) {
        // Audio for the tick goes in before the frame it belongs to.
        EngineStatus s = encoder_->EncodeAudio(pcm);
        if (s.ok) s = encoder_->EncodeFrame(frame);
        if (!s.ok) {
          sink_status = s;
          return false;
        }
        return true;
      });
  if (!started) {
    return Teardown(EngineStatus::Failure(ExportError::kEngineInitialization,
                                          "live capture stream did not start"));
  }

  const double duration = std::max(ctx.settings.duration_seconds, 1e-6);
  while (!stream_->WaitFinished(kStreamPollInterval)) {
    EngineStatus interrupted = CheckInterrupted(ctx, cancel_requested_);
    if (!interrupted.ok) {
      util::JobLog("SandboxedRecorderEngine", ctx.job_id)
          .Info("stopping: " + interrupted.message);
      return Teardown(interrupted);
    }
    ctx.ReportProgress(JobState::kEncoding,
                       std::min(1.0, stream_->ElapsedSeconds() / duration));
  }
  stream_->Stop();

  if (!sink_status.ok) {
    return Teardown(sink_status);
  }
  EngineStatus interrupted = CheckInterrupted(ctx, cancel_requested_);
  if (!interrupted.ok) {
    return Teardown(interrupted);
  }
  if (stream_->frames_pushed() != stream_->total_frames()) {
    return Teardown(EngineStatus::Failure(
        ExportError::kIo, "live stream ended after " +
                              std::to_string(stream_->frames_pushed()) + " of " +
                              std::to_string(stream_->total_frames()) + " frames"));
  }

  EngineStatus finished = encoder_->Finish();
  if (!finished.ok) {
    return Teardown(finished);
  }
  stream_.reset();
  ReleaseGraph();

  ctx.ReportProgress(JobState::kEncoding, 1.0);
  return EngineStatus::Success();
}

EngineStatus SandboxedRecorderEngine::Mux(EngineContext& ctx) {
  std::vector<uint8_t> blob;
  {
    std::lock_guard<std::mutex> lock(chunks_mutex_);
    if (chunks_.empty()) {
      return EngineStatus::Failure(ExportError::kIo, "recorder produced no data");
    }
    blob.reserve(buffered_bytes_);
    for (const auto& chunk : chunks_) {
      blob.insert(blob.end(), chunk.begin(), chunk.end());
    }
    chunks_.clear();
    buffered_bytes_ = 0;
  }
  ctx.ReportProgress(JobState::kMuxing, 0.5);

  EngineStatus status = DeliverOutputBlob(blob, ctx.settings.output_path);
  if (!status.ok) return status;

  std::ostringstream oss;
  oss << "wrote " << blob.size() << " bytes to " << ctx.settings.output_path;
  util::JobLog("SandboxedRecorderEngine", ctx.job_id).Info(oss.str());
  ctx.ReportProgress(JobState::kMuxing, 1.0);
  return EngineStatus::Success();
}

void SandboxedRecorderEngine::Cancel() {
  cancel_requested_.store(true, std::memory_order_release);
}

EngineStatus SandboxedRecorderEngine::Teardown(EngineStatus status) {
  Release();
  return status;
}

void SandboxedRecorderEngine::Release() {
  // Stream first: it is the only other caller into the encoder and graph.
  if (stream_) {
    stream_->Stop();
    stream_.reset();
  }
  if (encoder_) {
    encoder_->Abort();
    encoder_.reset();
  }
  ReleaseGraph();
  std::lock_guard<std::mutex> lock(chunks_mutex_);
  chunks_.clear();
  chunks_.shrink_to_fit();
  buffered_bytes_ = 0;
}

void SandboxedRecorderEngine::ReleaseGraph() {
  if (attached_mixer_) {
    attached_mixer_->DetachLiveGraph();
    attached_mixer_ = nullptr;
  }
  if (graph_) {
    graph_->Release();
    graph_.reset();
  }
}

bool SandboxedRecorderEngine::HoldsResources() const {
  std::lock_guard<std::mutex> lock(chunks_mutex_);
  return encoder_ != nullptr || graph_ != nullptr || stream_ != nullptr || !chunks_.empty();
}

size_t SandboxedRecorderEngine::buffered_bytes() const {
  std::lock_guard<std::mutex> lock(chunks_mutex_);
  return buffered_bytes_;
}

}  // namespace reelforge::engine
