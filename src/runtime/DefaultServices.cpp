// Repository: ReelForge
// Component: Default Export Services
// Purpose: Wires the production decoders, encoders and engines.
// Copyright (c) 2025 ReelForge

#include <atomic>
#include <memory>
#include <string>

#include "reelforge/audio/AudioDecoder.hpp"
#include "reelforge/decode/FFmpegInput.hpp"
#include "reelforge/encode/FrameImageWriter.hpp"
#include "reelforge/encode/MediaEncoder.hpp"
#include "reelforge/engine/ExternalProcessEngine.hpp"
#include "reelforge/engine/SandboxedRecorderEngine.hpp"
#include "reelforge/engine/SoftwareEncoderEngine.hpp"
#include "reelforge/frame/VisualSourceProvider.hpp"
#include "reelforge/runtime/ExportCoordinator.hpp"
#include "reelforge/util/Logger.hpp"

namespace reelforge::runtime {

namespace {

#ifdef REELFORGE_FFMPEG_AVAILABLE

std::shared_ptr<audio::IAudioDecoder> MakeAudioDecoder() {
  return std::make_shared<audio::FFmpegAudioDecoder>();
}

std::shared_ptr<frame::IVisualSourceProvider> MakeVisualSource(
    pipeline::SourceResolver resolver) {
  return std::make_shared<frame::FFmpegVisualSource>(std::move(resolver));
}

std::unique_ptr<encode::IMediaEncoder> MakeMediaEncoder() {
  return std::make_unique<encode::FFmpegMediaEncoder>();
}

#else
// Stub implementations when FFmpeg is not available. Decodes fail (sources
// degrade to silence or blank) and the in-process encoders cannot be created.
// The external engine still runs when a frame writer is available.

constexpr const char* kNoFFmpeg = "built without FFmpeg";

class UnavailableAudioDecoder : public audio::IAudioDecoder {
 public:
  bool Decode(const pipeline::ResolvedSource&, const audio::DecodeWindow&,
              const std::atomic<bool>&, audio::DecodedAudio*, std::string* error) override {
    *error = kNoFFmpeg;
    return false;
  }
};

class UnavailableVisualSource : public frame::IVisualSourceProvider {
 public:
  bool SampleFrame(const pipeline::TimelineElement&, double, pipeline::PixelBuffer*,
                   std::string* error) override {
    *error = kNoFFmpeg;
    return false;
  }
};

std::shared_ptr<audio::IAudioDecoder> MakeAudioDecoder() {
  util::Logger::Error("[DefaultServices] FFmpeg not available. Rebuild with FFmpeg to enable export.");
  return std::make_shared<UnavailableAudioDecoder>();
}

std::shared_ptr<frame::IVisualSourceProvider> MakeVisualSource(pipeline::SourceResolver) {
  return std::make_shared<UnavailableVisualSource>();
}

std::unique_ptr<encode::IMediaEncoder> MakeMediaEncoder() {
  return nullptr;
}

#endif  // REELFORGE_FFMPEG_AVAILABLE

std::unique_ptr<encode::IFrameImageWriter> MakeFrameWriter() {
#if defined(REELFORGE_FFMPEG_AVAILABLE)
  return std::make_unique<encode::FFmpegPngWriter>();
#elif defined(REELFORGE_LIBPNG_AVAILABLE)
  return std::make_unique<encode::LibPngWriter>();
#else
  return nullptr;
#endif
}

}  // namespace

ExportServices DefaultServices(const pipeline::ExportPipelineConfig& config) {
  ExportServices services;
  services.audio_decoder = MakeAudioDecoder();
  services.decode_cache = std::make_shared<audio::AudioDecodeCache>(config.audio_cache_budget_bytes);
  services.visual_source_factory = &MakeVisualSource;
#ifdef REELFORGE_FFMPEG_AVAILABLE
  services.video_inspector = &decode::DescribeVideoStream;
#endif

  engine::ExternalProcessOptions external;
  external.host_binary_path = config.host_binary_path;
  external.encoder_binary_path = config.encoder_binary_path;
  external.temp_root = config.temp_root;

  engine::SoftwareEncoderOptions software;
  software.queue_depth = config.software_queue_depth;
  software.frame_memory_ceiling_bytes = config.frame_memory_ceiling_bytes;
  software.temp_root = config.temp_root;

  services.engine_factory =
      [external, software](
          const engine::EngineCandidate& candidate) -> std::unique_ptr<engine::IBackendEngine> {
    switch (candidate.kind) {
      case engine::EngineKind::kExternalProcess:
        return std::make_unique<engine::ExternalProcessEngine>(external, &MakeFrameWriter);
      case engine::EngineKind::kSoftwareEncoder:
        return std::make_unique<engine::SoftwareEncoderEngine>(&MakeMediaEncoder, software);
      case engine::EngineKind::kSandboxedRecorder:
        return std::make_unique<engine::SandboxedRecorderEngine>(candidate.tier,
                                                                 &MakeMediaEncoder);
    }
    return nullptr;
  };
  return services;
}

}  // namespace reelforge::runtime
