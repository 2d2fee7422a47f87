// Repository: ReelForge
// Component: Media Encoder
// Purpose: Video + audio encoder/muxer used by the in-process engines.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_ENCODE_MEDIA_ENCODER_HPP_
#define REELFORGE_ENCODE_MEDIA_ENCODER_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "reelforge/pipeline/ExportTypes.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVCodecContext;
struct AVStream;
struct AVFrame;
struct AVPacket;
struct AVIOContext;
struct SwsContext;
struct SwrContext;

namespace reelforge::encode {

// Receives muxed container bytes in output order.
using ChunkSink = std::function<void(const uint8_t* data, size_t size)>;

struct EncoderOpenParams {
  int width = 0;
  int height = 0;
  int fps = 30;
  pipeline::ContainerFormat format = pipeline::ContainerFormat::kMp4;
  pipeline::QualityPreset quality = pipeline::QualityPreset::kMedium;

  // Exactly one of output_path / chunk_sink is used. With a chunk sink the
  // container is written in streaming form (fragmented mp4, live webm).
  std::string output_path;
  ChunkSink chunk_sink;

  // 0 = quality-driven (CRF); > 0 = constant bitrate target in bits/s.
  int64_t video_bitrate = 0;
};

// IMediaEncoder encodes one job's frames and PCM into one container with
// exactly one video and one audio stream.
//
// Single writer: all calls for one encoder come from one thread at a time.
// Frames must arrive in strictly increasing index order; PCM is appended
// contiguously from time zero.
class IMediaEncoder {
 public:
  virtual ~IMediaEncoder() = default;

  virtual pipeline::EngineStatus Open(const EncoderOpenParams& params) = 0;
  virtual pipeline::EngineStatus EncodeAudio(const pipeline::PcmBuffer& pcm) = 0;
  virtual pipeline::EngineStatus EncodeFrame(const pipeline::EncodedFrame& frame) = 0;

  // Flushes both encoders and finalizes the container.
  virtual pipeline::EngineStatus Finish() = 0;

  // Drops all state without finalizing. Safe at any point, repeatedly.
  virtual void Abort() = 0;
};

using MediaEncoderFactory = std::function<std::unique_ptr<IMediaEncoder>()>;

// FFmpeg implementation: libx264 + AAC in mp4, or libvpx-vp9 + Opus in webm.
class FFmpegMediaEncoder : public IMediaEncoder {
 public:
  FFmpegMediaEncoder() = default;
  ~FFmpegMediaEncoder() override;

  FFmpegMediaEncoder(const FFmpegMediaEncoder&) = delete;
  FFmpegMediaEncoder& operator=(const FFmpegMediaEncoder&) = delete;
  FFmpegMediaEncoder(FFmpegMediaEncoder&&) = delete;
  FFmpegMediaEncoder& operator=(FFmpegMediaEncoder&&) = delete;

  pipeline::EngineStatus Open(const EncoderOpenParams& params) override;
  pipeline::EngineStatus EncodeAudio(const pipeline::PcmBuffer& pcm) override;
  pipeline::EngineStatus EncodeFrame(const pipeline::EncodedFrame& frame) override;
  pipeline::EngineStatus Finish() override;
  void Abort() override;

 private:
  pipeline::EngineStatus OpenVideo();
  pipeline::EngineStatus OpenAudio();
  pipeline::EngineStatus SendAudioFrame(size_t frames);
  pipeline::EngineStatus Drain(AVCodecContext* ctx, AVStream* stream);
  void FreeAll();

  static int AVIOWriteThunk(void* opaque, uint8_t* buf, int buf_size);

  EncoderOpenParams params_;
  bool opened_ = false;
  bool header_written_ = false;

  AVFormatContext* format_ctx_ = nullptr;
  AVIOContext* custom_avio_ctx_ = nullptr;
  AVCodecContext* video_ctx_ = nullptr;
  AVCodecContext* audio_ctx_ = nullptr;
  AVStream* video_stream_ = nullptr;
  AVStream* audio_stream_ = nullptr;
  AVFrame* video_frame_ = nullptr;
  AVFrame* audio_frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;
  SwrContext* swr_ctx_ = nullptr;

  int audio_frame_size_ = 1024;
  int64_t audio_samples_sent_ = 0;
  std::vector<float> audio_pending_;  // interleaved stereo awaiting a full frame
};

}  // namespace reelforge::encode

#endif  // REELFORGE_ENCODE_MEDIA_ENCODER_HPP_
