// Repository: ReelForge
// Component: Media Encoder
// Purpose: Owns FFmpeg encoder/muxer handles for one export.
// Copyright (c) 2025 ReelForge

#include "reelforge/encode/MediaEncoder.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/dict.h>
#include <libavutil/imgutils.h>
#include <libavutil/log.h>
#include <libavutil/mathematics.h>
#include <libavutil/opt.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

#include "reelforge/decode/FFmpegInput.hpp"
#include "reelforge/util/Logger.hpp"

namespace reelforge::encode {

using decode::AvErrorToString;
using pipeline::ContainerFormat;
using pipeline::EngineStatus;
using pipeline::ExportError;
using pipeline::kMixChannels;
using pipeline::kMixSampleRate;

namespace {

constexpr size_t kAvioBufferSize = 64 * 1024;
constexpr int64_t kAudioBitrate = 128000;

EngineStatus FfmpegFailure(ExportError err, const std::string& what, int ret) {
  util::Logger::Error("[MediaEncoder] " + what + ": " + AvErrorToString(ret));
  return EngineStatus::Failure(err, what, AvErrorToString(ret));
}

}  // namespace

FFmpegMediaEncoder::~FFmpegMediaEncoder() {
  FreeAll();
}

int FFmpegMediaEncoder::AVIOWriteThunk(void* opaque, uint8_t* buf, int buf_size) {
  if (opaque == nullptr) return -1;
  auto* self = static_cast<FFmpegMediaEncoder*>(opaque);
  if (!self->params_.chunk_sink) return -1;
  self->params_.chunk_sink(buf, static_cast<size_t>(buf_size));
  return buf_size;
}

EngineStatus FFmpegMediaEncoder::Open(const EncoderOpenParams& params) {
  if (opened_) {
    return EngineStatus::Failure(ExportError::kEngineInitialization,
                                 "encoder already open");
  }
  params_ = params;
  av_log_set_level(AV_LOG_ERROR);

  const bool streaming = static_cast<bool>(params_.chunk_sink);
  const bool webm = params_.format == ContainerFormat::kWebm;
  const char* muxer = webm ? "webm" : "mp4";
  const char* url = streaming ? nullptr : params_.output_path.c_str();

  int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, muxer, url);
  if (ret < 0 || !format_ctx_) {
    FreeAll();
    return FfmpegFailure(ExportError::kEngineInitialization,
                         std::string("failed to allocate ") + muxer + " muxer", ret);
  }

  if (streaming) {
    auto* buffer = static_cast<uint8_t*>(av_malloc(kAvioBufferSize));
    if (!buffer) {
      FreeAll();
      return EngineStatus::Failure(ExportError::kEngineInitialization,
                                   "failed to allocate AVIO buffer");
    }
    custom_avio_ctx_ = avio_alloc_context(buffer, static_cast<int>(kAvioBufferSize), 1,
                                          this, nullptr,
                                          &FFmpegMediaEncoder::AVIOWriteThunk, nullptr);
    if (!custom_avio_ctx_) {
      av_free(buffer);
      FreeAll();
      return EngineStatus::Failure(ExportError::kEngineInitialization,
                                   "failed to allocate AVIO context");
    }
    custom_avio_ctx_->seekable = 0;
    format_ctx_->pb = custom_avio_ctx_;
    format_ctx_->flags |= AVFMT_FLAG_CUSTOM_IO;
  }

  EngineStatus status = OpenVideo();
  if (status.ok) status = OpenAudio();
  if (!status.ok) {
    FreeAll();
    return status;
  }

  if (!streaming && !(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
    ret = avio_open(&format_ctx_->pb, params_.output_path.c_str(), AVIO_FLAG_WRITE);
    if (ret < 0) {
      FreeAll();
      return FfmpegFailure(ExportError::kIo, "cannot open " + params_.output_path, ret);
    }
  }

  AVDictionary* muxer_opts = nullptr;
  if (!webm) {
    av_dict_set(&muxer_opts, "movflags",
                streaming ? "frag_keyframe+empty_moov+default_base_moof" : "+faststart",
                0);
  }
  ret = avformat_write_header(format_ctx_, &muxer_opts);
  av_dict_free(&muxer_opts);
  if (ret < 0) {
    FreeAll();
    return FfmpegFailure(ExportError::kEngineInitialization, "avformat_write_header failed",
                         ret);
  }
  header_written_ = true;
  opened_ = true;

  std::ostringstream oss;
  oss << "[MediaEncoder] opened " << muxer << " " << params_.width << "x"
      << params_.height << "@" << params_.fps
      << (streaming ? " (streaming)" : " -> " + params_.output_path);
  util::Logger::Info(oss.str());
  return EngineStatus::Success();
}

EngineStatus FFmpegMediaEncoder::OpenVideo() {
  const bool webm = params_.format == ContainerFormat::kWebm;
  const char* codec_name = webm ? "libvpx-vp9" : "libx264";
  const AVCodec* codec = avcodec_find_encoder_by_name(codec_name);
  if (!codec) {
    util::Logger::Error(std::string("[MediaEncoder] ") + codec_name + " not found");
    return EngineStatus::Failure(ExportError::kEngineInitialization,
                                 std::string(codec_name) + " encoder not available");
  }

  video_stream_ = avformat_new_stream(format_ctx_, codec);
  video_ctx_ = avcodec_alloc_context3(codec);
  if (!video_stream_ || !video_ctx_) {
    return EngineStatus::Failure(ExportError::kEngineInitialization,
                                 "failed to allocate video stream");
  }
  video_stream_->id = static_cast<int>(format_ctx_->nb_streams) - 1;

  video_ctx_->width = params_.width;
  video_ctx_->height = params_.height;
  video_ctx_->time_base = AVRational{1, params_.fps};
  video_ctx_->framerate = AVRational{params_.fps, 1};
  video_ctx_->pix_fmt = AV_PIX_FMT_YUV420P;
  video_ctx_->gop_size = params_.fps * 2;
  if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
    video_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
  }

  const auto quality = pipeline::QualityParamsFor(params_.quality);
  AVDictionary* opts = nullptr;
  if (params_.video_bitrate > 0) {
    video_ctx_->bit_rate = params_.video_bitrate;
    if (!webm) av_dict_set(&opts, "preset", "veryfast", 0);
  } else if (webm) {
    video_ctx_->bit_rate = 0;
    av_dict_set_int(&opts, "crf", quality.vp9_crf, 0);
  } else {
    av_dict_set(&opts, "preset", quality.x264_preset, 0);
    av_dict_set_int(&opts, "crf", quality.h264_crf, 0);
  }
  if (webm) {
    av_dict_set(&opts, "deadline", "good", 0);
    av_dict_set(&opts, "cpu-used", "4", 0);
    av_dict_set(&opts, "row-mt", "1", 0);
  }

  int ret = avcodec_open2(video_ctx_, codec, &opts);
  av_dict_free(&opts);
  if (ret < 0) {
    return FfmpegFailure(ExportError::kEngineInitialization,
                         std::string("avcodec_open2 failed for ") + codec_name, ret);
  }
  ret = avcodec_parameters_from_context(video_stream_->codecpar, video_ctx_);
  if (ret < 0) {
    return FfmpegFailure(ExportError::kEngineInitialization,
                         "video parameters copy failed", ret);
  }
  video_stream_->time_base = video_ctx_->time_base;

  video_frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!video_frame_ || !packet_) {
    return EngineStatus::Failure(ExportError::kEngineInitialization,
                                 "frame/packet allocation failed");
  }
  video_frame_->format = video_ctx_->pix_fmt;
  video_frame_->width = params_.width;
  video_frame_->height = params_.height;
  ret = av_frame_get_buffer(video_frame_, 32);
  if (ret < 0) {
    return FfmpegFailure(ExportError::kEngineInitialization,
                         "video frame buffer allocation failed", ret);
  }
  return EngineStatus::Success();
}

EngineStatus FFmpegMediaEncoder::OpenAudio() {
  const bool webm = params_.format == ContainerFormat::kWebm;
  const AVCodec* codec = avcodec_find_encoder_by_name(webm ? "libopus" : "aac");
  if (!codec && webm) codec = avcodec_find_encoder_by_name("opus");
  if (!codec) {
    return EngineStatus::Failure(ExportError::kEngineInitialization,
                                 webm ? "opus encoder not available"
                                      : "aac encoder not available");
  }

  audio_stream_ = avformat_new_stream(format_ctx_, codec);
  audio_ctx_ = avcodec_alloc_context3(codec);
  if (!audio_stream_ || !audio_ctx_) {
    return EngineStatus::Failure(ExportError::kEngineInitialization,
                                 "failed to allocate audio stream");
  }
  audio_stream_->id = static_cast<int>(format_ctx_->nb_streams) - 1;

  audio_ctx_->sample_rate = kMixSampleRate;
  av_channel_layout_default(&audio_ctx_->ch_layout, kMixChannels);
  audio_ctx_->sample_fmt = (codec->sample_fmts != nullptr) ? codec->sample_fmts[0]
                                                           : AV_SAMPLE_FMT_FLTP;
  audio_ctx_->bit_rate = kAudioBitrate;
  audio_ctx_->time_base = AVRational{1, kMixSampleRate};
  if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
    audio_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
  }

  int ret = avcodec_open2(audio_ctx_, codec, nullptr);
  if (ret < 0) {
    return FfmpegFailure(ExportError::kEngineInitialization, "audio avcodec_open2 failed",
                         ret);
  }
  ret = avcodec_parameters_from_context(audio_stream_->codecpar, audio_ctx_);
  if (ret < 0) {
    return FfmpegFailure(ExportError::kEngineInitialization,
                         "audio parameters copy failed", ret);
  }
  audio_stream_->time_base = audio_ctx_->time_base;
  audio_frame_size_ = audio_ctx_->frame_size > 0 ? audio_ctx_->frame_size : 1024;

  AVChannelLayout in_layout;
  std::memset(&in_layout, 0, sizeof(in_layout));
  av_channel_layout_default(&in_layout, kMixChannels);
  ret = swr_alloc_set_opts2(&swr_ctx_,
                            &audio_ctx_->ch_layout, audio_ctx_->sample_fmt, kMixSampleRate,
                            &in_layout, AV_SAMPLE_FMT_FLT, kMixSampleRate, 0, nullptr);
  av_channel_layout_uninit(&in_layout);
  if (ret < 0 || !swr_ctx_ || (ret = swr_init(swr_ctx_)) < 0) {
    return FfmpegFailure(ExportError::kEngineInitialization, "audio resampler setup failed",
                         ret);
  }

  audio_frame_ = av_frame_alloc();
  if (!audio_frame_) {
    return EngineStatus::Failure(ExportError::kEngineInitialization,
                                 "audio frame allocation failed");
  }
  return EngineStatus::Success();
}

EngineStatus FFmpegMediaEncoder::Drain(AVCodecContext* ctx, AVStream* stream) {
  while (true) {
    int ret = avcodec_receive_packet(ctx, packet_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return EngineStatus::Success();
    if (ret < 0) {
      return FfmpegFailure(ExportError::kIo, "avcodec_receive_packet failed", ret);
    }
    av_packet_rescale_ts(packet_, ctx->time_base, stream->time_base);
    packet_->stream_index = stream->index;
    // av_interleaved_write_frame takes ownership and unrefs the packet.
    ret = av_interleaved_write_frame(format_ctx_, packet_);
    if (ret < 0) {
      return FfmpegFailure(ExportError::kIo, "av_interleaved_write_frame failed", ret);
    }
  }
}

EngineStatus FFmpegMediaEncoder::EncodeFrame(const pipeline::EncodedFrame& frame) {
  if (!opened_ || frame.pixels == nullptr) {
    return EngineStatus::Failure(ExportError::kIo, "encoder not open");
  }
  const auto& px = *frame.pixels;

  sws_ctx_ = sws_getCachedContext(sws_ctx_, px.width, px.height, AV_PIX_FMT_RGBA,
                                  params_.width, params_.height, AV_PIX_FMT_YUV420P,
                                  SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    return EngineStatus::Failure(ExportError::kIo, "sws_getCachedContext failed");
  }
  int ret = av_frame_make_writable(video_frame_);
  if (ret < 0) {
    return FfmpegFailure(ExportError::kIo, "av_frame_make_writable failed", ret);
  }
  const uint8_t* src[4] = {px.rgba.data(), nullptr, nullptr, nullptr};
  int src_stride[4] = {px.width * 4, 0, 0, 0};
  sws_scale(sws_ctx_, src, src_stride, 0, px.height, video_frame_->data,
            video_frame_->linesize);
  video_frame_->pts = frame.index;

  ret = avcodec_send_frame(video_ctx_, video_frame_);
  if (ret < 0) {
    return FfmpegFailure(ExportError::kIo, "avcodec_send_frame (video) failed", ret);
  }
  return Drain(video_ctx_, video_stream_);
}

EngineStatus FFmpegMediaEncoder::SendAudioFrame(size_t frames) {
  av_frame_unref(audio_frame_);
  audio_frame_->format = audio_ctx_->sample_fmt;
  audio_frame_->sample_rate = audio_ctx_->sample_rate;
  audio_frame_->nb_samples = static_cast<int>(frames);
  int ret = av_channel_layout_copy(&audio_frame_->ch_layout, &audio_ctx_->ch_layout);
  if (ret < 0 || (ret = av_frame_get_buffer(audio_frame_, 0)) < 0) {
    return FfmpegFailure(ExportError::kIo, "audio frame buffer allocation failed", ret);
  }

  const uint8_t* in[1] = {reinterpret_cast<const uint8_t*>(audio_pending_.data())};
  ret = swr_convert(swr_ctx_, audio_frame_->data, static_cast<int>(frames), in,
                    static_cast<int>(frames));
  if (ret < 0) {
    return FfmpegFailure(ExportError::kIo, "swr_convert failed", ret);
  }
  audio_pending_.erase(audio_pending_.begin(),
                       audio_pending_.begin() + static_cast<std::ptrdiff_t>(frames * kMixChannels));

  audio_frame_->pts = audio_samples_sent_;
  audio_samples_sent_ += static_cast<int64_t>(frames);
  ret = avcodec_send_frame(audio_ctx_, audio_frame_);
  if (ret < 0) {
    return FfmpegFailure(ExportError::kIo, "avcodec_send_frame (audio) failed", ret);
  }
  return Drain(audio_ctx_, audio_stream_);
}

EngineStatus FFmpegMediaEncoder::EncodeAudio(const pipeline::PcmBuffer& pcm) {
  if (!opened_) return EngineStatus::Failure(ExportError::kIo, "encoder not open");
  audio_pending_.insert(audio_pending_.end(), pcm.samples.begin(), pcm.samples.end());
  const size_t frame_size = static_cast<size_t>(audio_frame_size_);
  while (audio_pending_.size() / kMixChannels >= frame_size) {
    EngineStatus s = SendAudioFrame(frame_size);
    if (!s.ok) return s;
  }
  return EngineStatus::Success();
}

EngineStatus FFmpegMediaEncoder::Finish() {
  if (!opened_) return EngineStatus::Failure(ExportError::kIo, "encoder not open");

  // Short final audio frame carries the remainder.
  const size_t remainder = audio_pending_.size() / kMixChannels;
  if (remainder > 0) {
    EngineStatus s = SendAudioFrame(remainder);
    if (!s.ok) {
      FreeAll();
      return s;
    }
  }

  avcodec_send_frame(video_ctx_, nullptr);
  EngineStatus s = Drain(video_ctx_, video_stream_);
  if (s.ok) {
    avcodec_send_frame(audio_ctx_, nullptr);
    s = Drain(audio_ctx_, audio_stream_);
  }
  if (s.ok) {
    int ret = av_write_trailer(format_ctx_);
    if (ret < 0) s = FfmpegFailure(ExportError::kIo, "av_write_trailer failed", ret);
  }
  if (custom_avio_ctx_) avio_flush(custom_avio_ctx_);
  FreeAll();
  if (s.ok) util::Logger::Info("[MediaEncoder] finished");
  return s;
}

void FFmpegMediaEncoder::Abort() {
  if (opened_) util::Logger::Info("[MediaEncoder] aborted");
  FreeAll();
}

void FFmpegMediaEncoder::FreeAll() {
  if (format_ctx_) {
    if (!custom_avio_ctx_ && format_ctx_->pb &&
        !(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
      avio_closep(&format_ctx_->pb);
    }
    avformat_free_context(format_ctx_);
    format_ctx_ = nullptr;
  }
  if (custom_avio_ctx_) {
    av_freep(&custom_avio_ctx_->buffer);
    avio_context_free(&custom_avio_ctx_);
    custom_avio_ctx_ = nullptr;
  }
  if (video_frame_) av_frame_free(&video_frame_);
  if (audio_frame_) av_frame_free(&audio_frame_);
  if (packet_) av_packet_free(&packet_);
  if (video_ctx_) avcodec_free_context(&video_ctx_);
  if (audio_ctx_) avcodec_free_context(&audio_ctx_);
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (swr_ctx_) swr_free(&swr_ctx_);
  video_stream_ = nullptr;
  audio_stream_ = nullptr;
  audio_pending_.clear();
  audio_samples_sent_ = 0;
  opened_ = false;
  header_written_ = false;
}

}  // namespace reelforge::encode
