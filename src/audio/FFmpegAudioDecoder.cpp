// Repository: ReelForge
// Component: Audio Decoder
// Purpose: Decodes an audio-bearing source to 48 kHz float stereo PCM.
// Copyright (c) 2025 ReelForge

#include "reelforge/audio/AudioDecoder.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstring>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/frame.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

#include "reelforge/decode/FFmpegInput.hpp"
#include "reelforge/util/Logger.hpp"

namespace reelforge::audio {

using decode::AvErrorToString;
using pipeline::kMixChannels;
using pipeline::kMixSampleRate;

namespace {

// Upper bound on decoded length; sources beyond this are truncated.
constexpr double kMaxDecodedSeconds = pipeline::kMaxExportDurationSeconds + 60.0;

// Owns the per-decode FFmpeg objects so every return path frees them.
struct DecodeSession {
  AVCodecContext* codec_ctx = nullptr;
  SwrContext* swr_ctx = nullptr;
  AVFrame* frame = nullptr;
  AVPacket* packet = nullptr;

  ~DecodeSession() {
    if (packet) av_packet_free(&packet);
    if (frame) av_frame_free(&frame);
    if (swr_ctx) swr_free(&swr_ctx);
    if (codec_ctx) avcodec_free_context(&codec_ctx);
  }
};

bool ConfigureResampler(DecodeSession* s, std::string* error) {
  AVChannelLayout src_layout;
  std::memset(&src_layout, 0, sizeof(src_layout));
  if (s->codec_ctx->ch_layout.nb_channels > 0 &&
      s->codec_ctx->ch_layout.order != AV_CHANNEL_ORDER_UNSPEC) {
    av_channel_layout_copy(&src_layout, &s->codec_ctx->ch_layout);
  } else {
    int channels = s->codec_ctx->ch_layout.nb_channels > 0
                       ? s->codec_ctx->ch_layout.nb_channels
                       : 2;
    av_channel_layout_default(&src_layout, channels);
  }

  AVChannelLayout dst_layout;
  std::memset(&dst_layout, 0, sizeof(dst_layout));
  av_channel_layout_default(&dst_layout, kMixChannels);

  int ret = swr_alloc_set_opts2(&s->swr_ctx,
                                &dst_layout, AV_SAMPLE_FMT_FLT, kMixSampleRate,
                                &src_layout, s->codec_ctx->sample_fmt,
                                s->codec_ctx->sample_rate, 0, nullptr);
  av_channel_layout_uninit(&src_layout);
  av_channel_layout_uninit(&dst_layout);
  if (ret < 0 || !s->swr_ctx) {
    if (error) *error = "swr_alloc_set_opts2 failed: " + AvErrorToString(ret);
    return false;
  }
  ret = swr_init(s->swr_ctx);
  if (ret < 0) {
    if (error) *error = "swr_init failed: " + AvErrorToString(ret);
    return false;
  }
  return true;
}

// Converts `frame` (or flushes when null) into `chunk`, replacing its
// contents.
bool ConvertFrame(DecodeSession* s, const AVFrame* frame, std::vector<float>* chunk,
                  std::string* error) {
  chunk->clear();
  const int in_samples = frame ? frame->nb_samples : 0;
  const int out_capacity = swr_get_out_samples(s->swr_ctx, in_samples);
  if (out_capacity <= 0) return true;

  chunk->resize(static_cast<size_t>(out_capacity) * kMixChannels);
  uint8_t* out_planes[1] = {reinterpret_cast<uint8_t*>(chunk->data())};
  int converted = swr_convert(s->swr_ctx, out_planes, out_capacity,
                              frame ? const_cast<const uint8_t**>(frame->extended_data)
                                    : nullptr,
                              in_samples);
  if (converted < 0) {
    chunk->clear();
    if (error) *error = "swr_convert failed: " + AvErrorToString(converted);
    return false;
  }
  chunk->resize(static_cast<size_t>(converted) * kMixChannels);
  return true;
}

// Frame positions are absolute source frames at the mix rate. Keeps the
// part of `chunk` (starting at `*cursor`) inside [first, last) and advances
// the cursor. A gap before the kept part is filled with silence.
void AppendWindowed(const std::vector<float>& chunk, int64_t first, int64_t last,
                    int64_t* cursor, pipeline::PcmBuffer* pcm) {
  const int64_t frames = static_cast<int64_t>(chunk.size() / kMixChannels);
  const int64_t have = first + static_cast<int64_t>(pcm->FrameCount());
  const int64_t lo = std::max({*cursor, first, have});
  const int64_t hi = std::min(*cursor + frames, last);
  if (lo < hi) {
    if (lo > have) {
      pcm->samples.resize(pcm->samples.size() + static_cast<size_t>(lo - have) * kMixChannels,
                          0.0f);
    }
    auto begin = chunk.begin() + static_cast<std::ptrdiff_t>((lo - *cursor) * kMixChannels);
    auto end = chunk.begin() + static_cast<std::ptrdiff_t>((hi - *cursor) * kMixChannels);
    pcm->samples.insert(pcm->samples.end(), begin, end);
  }
  *cursor += frames;
}

}  // namespace

bool FFmpegAudioDecoder::Decode(const pipeline::ResolvedSource& source,
                                const DecodeWindow& window,
                                const std::atomic<bool>& abort,
                                DecodedAudio* out,
                                std::string* error) {
  decode::FFmpegInput input;
  if (!input.Open(source, &abort, error)) {
    return false;
  }
  AVFormatContext* fmt = input.format();

  const AVCodec* codec = nullptr;
  int stream_index = av_find_best_stream(fmt, AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
  if (stream_index < 0 || codec == nullptr) {
    if (error) *error = "no audio stream in " + input.label();
    return false;
  }
  AVStream* stream = fmt->streams[stream_index];

  DecodeSession s;
  s.codec_ctx = avcodec_alloc_context3(codec);
  if (!s.codec_ctx) {
    if (error) *error = "avcodec_alloc_context3 failed";
    return false;
  }
  int ret = avcodec_parameters_to_context(s.codec_ctx, stream->codecpar);
  if (ret < 0) {
    if (error) *error = "avcodec_parameters_to_context failed: " + AvErrorToString(ret);
    return false;
  }
  ret = avcodec_open2(s.codec_ctx, codec, nullptr);
  if (ret < 0) {
    if (error) *error = "avcodec_open2 failed: " + AvErrorToString(ret);
    return false;
  }
  if (!ConfigureResampler(&s, error)) {
    return false;
  }

  s.frame = av_frame_alloc();
  s.packet = av_packet_alloc();
  if (!s.frame || !s.packet) {
    if (error) *error = "frame/packet allocation failed";
    return false;
  }

  const double start_seconds = std::max(0.0, window.start_seconds);
  const int64_t max_frames = static_cast<int64_t>(kMaxDecodedSeconds * kMixSampleRate);
  const int64_t first = std::llround(start_seconds * kMixSampleRate);
  const int64_t last =
      window.ToEnd()
          ? first + max_frames
          : std::min(first + max_frames,
                     static_cast<int64_t>(std::llround(window.EndSeconds() * kMixSampleRate)));
  const int64_t stream_origin = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;

  bool seeked = false;
  if (first > 0) {
    const int64_t target =
        stream_origin + static_cast<int64_t>(start_seconds / av_q2d(stream->time_base));
    ret = av_seek_frame(fmt, stream_index, target, AVSEEK_FLAG_BACKWARD);
    if (ret >= 0) {
      avcodec_flush_buffers(s.codec_ctx);
      seeked = true;
    } else {
      // Unseekable input: decode from the head and drop the lead-in.
      util::Logger::Debug("[FFmpegAudioDecoder] seek failed on " + input.label() + ": " +
                          AvErrorToString(ret));
    }
  }

  pipeline::PcmBuffer pcm;
  pcm.sample_rate = kMixSampleRate;
  pcm.channels = kMixChannels;
  std::vector<float> chunk;
  int64_t cursor = 0;
  bool cursor_known = false;

  auto receive_all = [&]() -> bool {
    while (true) {
      int r = avcodec_receive_frame(s.codec_ctx, s.frame);
      if (r == AVERROR(EAGAIN) || r == AVERROR_EOF) return true;
      if (r < 0) {
        if (error) *error = "avcodec_receive_frame failed: " + AvErrorToString(r);
        return false;
      }
      if (!cursor_known) {
        // The first frame after open or seek anchors the position.
        const int64_t pts = s.frame->best_effort_timestamp;
        if (pts != AV_NOPTS_VALUE) {
          cursor = std::llround((pts - stream_origin) * av_q2d(stream->time_base) *
                                kMixSampleRate);
        } else {
          cursor = seeked ? first : 0;
        }
        cursor_known = true;
      }
      bool ok = ConvertFrame(&s, s.frame, &chunk, error);
      av_frame_unref(s.frame);
      if (!ok) return false;
      AppendWindowed(chunk, first, last, &cursor, &pcm);
    }
  };

  bool reached_eof = false;
  while (!reached_eof) {
    if (abort.load(std::memory_order_acquire)) {
      if (error) *error = "decode aborted";
      return false;
    }
    if (cursor_known && cursor >= last) break;

    ret = av_read_frame(fmt, s.packet);
    if (ret == AVERROR_EOF) {
      reached_eof = true;
      avcodec_send_packet(s.codec_ctx, nullptr);
    } else if (ret < 0) {
      if (abort.load(std::memory_order_acquire)) {
        if (error) *error = "decode aborted";
      } else if (error) {
        *error = "av_read_frame failed: " + AvErrorToString(ret);
      }
      return false;
    } else {
      if (s.packet->stream_index != stream_index) {
        av_packet_unref(s.packet);
        continue;
      }
      ret = avcodec_send_packet(s.codec_ctx, s.packet);
      av_packet_unref(s.packet);
      if (ret < 0 && ret != AVERROR(EAGAIN)) {
        // A corrupt packet is skipped, not fatal.
        util::Logger::Debug("[FFmpegAudioDecoder] send_packet: " + AvErrorToString(ret));
        continue;
      }
    }
    if (!receive_all()) return false;
  }

  if (reached_eof) {
    // Drain samples still buffered in the resampler.
    if (!ConvertFrame(&s, nullptr, &chunk, error)) return false;
    AppendWindowed(chunk, first, last, &cursor, &pcm);
  }

  out->start_seconds = static_cast<double>(first) / kMixSampleRate;
  out->window = window;
  out->reached_end = reached_eof;
  out->pcm = std::move(pcm);
  util::Logger::Debug("[FFmpegAudioDecoder] decoded " + input.label() + " from " +
                      std::to_string(out->start_seconds) + "s frames=" +
                      std::to_string(out->pcm.FrameCount()));
  return true;
}

}  // namespace reelforge::audio
