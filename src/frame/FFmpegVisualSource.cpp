// Repository: ReelForge
// Component: Visual Source Provider
// Purpose: FFmpeg-backed sampling of still and video sources.
// Copyright (c) 2025 ReelForge

#include "reelforge/frame/VisualSourceProvider.hpp"

#include <cmath>
#include <cstring>
#include <limits>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/frame.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}

#include "reelforge/decode/FFmpegInput.hpp"
#include "reelforge/util/Logger.hpp"

namespace reelforge::frame {

using decode::AvErrorToString;
using pipeline::PixelBuffer;

namespace {
// Forward decoding is preferred over seeking within this window.
constexpr double kSeekThresholdSeconds = 2.0;
}  // namespace

struct FFmpegVisualSource::OpenSource {
  decode::FFmpegInput input;
  AVCodecContext* codec_ctx = nullptr;
  SwsContext* sws_ctx = nullptr;
  AVFrame* frame = nullptr;
  AVPacket* packet = nullptr;
  int stream_index = -1;
  double time_base = 0.0;
  double start_offset = 0.0;
  bool is_still = false;
  bool started = false;
  bool eof = false;

  PixelBuffer last;
  double last_time = -std::numeric_limits<double>::infinity();
  bool have_last = false;
  PixelBuffer pending;
  double pending_time = 0.0;
  bool have_pending = false;

  ~OpenSource() {
    if (sws_ctx) sws_freeContext(sws_ctx);
    if (packet) av_packet_free(&packet);
    if (frame) av_frame_free(&frame);
    if (codec_ctx) avcodec_free_context(&codec_ctx);
  }

  bool Convert(PixelBuffer* out) {
    const int w = frame->width;
    const int h = frame->height;
    sws_ctx = sws_getCachedContext(sws_ctx, w, h, static_cast<AVPixelFormat>(frame->format),
                                   w, h, AV_PIX_FMT_RGBA, SWS_POINT,
                                   nullptr, nullptr, nullptr);
    if (!sws_ctx) return false;
    out->Resize(w, h);
    uint8_t* dst[4] = {out->rgba.data(), nullptr, nullptr, nullptr};
    int dst_stride[4] = {w * 4, 0, 0, 0};
    sws_scale(sws_ctx, frame->data, frame->linesize, 0, h, dst, dst_stride);
    return true;
  }

  // Decodes the next frame into `frame`. Returns false at end of stream.
  bool DecodeNext(double* frame_time, std::string* error) {
    while (true) {
      int ret = avcodec_receive_frame(codec_ctx, frame);
      if (ret == 0) {
        int64_t ts = frame->best_effort_timestamp;
        if (ts == AV_NOPTS_VALUE) ts = frame->pts;
        *frame_time = (ts == AV_NOPTS_VALUE) ? 0.0 : ts * time_base - start_offset;
        return true;
      }
      if (ret == AVERROR_EOF) return false;
      if (ret != AVERROR(EAGAIN)) {
        if (error) *error = "receive_frame: " + AvErrorToString(ret);
        return false;
      }
      ret = av_read_frame(input.format(), packet);
      if (ret < 0) {
        avcodec_send_packet(codec_ctx, nullptr);
        continue;
      }
      if (packet->stream_index == stream_index) {
        avcodec_send_packet(codec_ctx, packet);
      }
      av_packet_unref(packet);
    }
  }

  void SeekTo(double t) {
    int64_t ts = static_cast<int64_t>((t + start_offset) / time_base);
    av_seek_frame(input.format(), stream_index, ts, AVSEEK_FLAG_BACKWARD);
    avcodec_flush_buffers(codec_ctx);
    have_last = false;
    have_pending = false;
    last_time = -std::numeric_limits<double>::infinity();
    eof = false;
    started = true;
  }
};

FFmpegVisualSource::FFmpegVisualSource(pipeline::SourceResolver resolver)
    : resolver_(std::move(resolver)) {}

FFmpegVisualSource::~FFmpegVisualSource() = default;

FFmpegVisualSource::OpenSource* FFmpegVisualSource::GetOrOpen(const std::string& source_ref,
                                                              std::string* error) {
  auto it = sources_.find(source_ref);
  if (it != sources_.end()) return it->second.get();

  auto resolved = resolver_ ? resolver_(source_ref) : std::nullopt;
  if (!resolved) {
    if (error) *error = "source '" + source_ref + "' could not be resolved";
    return nullptr;
  }

  auto os = std::make_unique<OpenSource>();
  if (!os->input.Open(*resolved, nullptr, error)) return nullptr;
  AVFormatContext* fmt = os->input.format();

  const AVCodec* codec = nullptr;
  os->stream_index = av_find_best_stream(fmt, AVMEDIA_TYPE_VIDEO, -1, -1, &codec, 0);
  if (os->stream_index < 0 || !codec) {
    if (error) *error = "no video stream in " + os->input.label();
    return nullptr;
  }
  AVStream* stream = fmt->streams[os->stream_index];
  os->codec_ctx = avcodec_alloc_context3(codec);
  if (!os->codec_ctx ||
      avcodec_parameters_to_context(os->codec_ctx, stream->codecpar) < 0) {
    if (error) *error = "codec context setup failed for " + os->input.label();
    return nullptr;
  }
  int ret = avcodec_open2(os->codec_ctx, codec, nullptr);
  if (ret < 0) {
    if (error) *error = "avcodec_open2: " + AvErrorToString(ret);
    return nullptr;
  }
  os->frame = av_frame_alloc();
  os->packet = av_packet_alloc();
  if (!os->frame || !os->packet) {
    if (error) *error = "frame/packet allocation failed";
    return nullptr;
  }
  os->time_base = av_q2d(stream->time_base);
  os->start_offset =
      stream->start_time == AV_NOPTS_VALUE ? 0.0 : stream->start_time * os->time_base;

  const char* demuxer = fmt->iformat ? fmt->iformat->name : "";
  os->is_still = (stream->disposition & AV_DISPOSITION_ATTACHED_PIC) != 0 ||
                 std::strstr(demuxer, "image2") != nullptr ||
                 std::strstr(demuxer, "_pipe") != nullptr ||
                 stream->nb_frames == 1;

  util::Logger::Debug("[FFmpegVisualSource] opened " + os->input.label() +
                      (os->is_still ? " (still)" : " (video)"));
  OpenSource* raw = os.get();
  sources_.emplace(source_ref, std::move(os));
  return raw;
}

bool FFmpegVisualSource::SampleFrame(const pipeline::TimelineElement& element,
                                     double source_time_seconds, PixelBuffer* out,
                                     std::string* error) {
  OpenSource* os = GetOrOpen(element.source_ref, error);
  if (!os) return false;

  if (os->is_still) {
    if (!os->have_last) {
      double t = 0.0;
      if (!os->DecodeNext(&t, error) || !os->Convert(&os->last)) {
        if (error && error->empty()) *error = "still image produced no frame";
        return false;
      }
      os->have_last = true;
    }
    out->Resize(os->last.width, os->last.height);
    std::memcpy(out->rgba.data(), os->last.rgba.data(), os->last.rgba.size());
    return true;
  }

  const double t = std::max(0.0, source_time_seconds);
  if (!os->started || t < os->last_time ||
      (os->have_last && t > os->last_time + kSeekThresholdSeconds)) {
    os->SeekTo(t);
  }

  // Keep the latest frame whose time is <= t; one decoded-ahead frame is
  // held in `pending` for the next call.
  while (true) {
    if (os->have_pending) {
      if (os->pending_time > t) break;
      std::swap(os->last, os->pending);
      os->last_time = os->pending_time;
      os->have_last = true;
      os->have_pending = false;
    }
    if (os->eof) break;
    double ft = 0.0;
    if (!os->DecodeNext(&ft, error)) {
      os->eof = true;
      break;
    }
    if (!os->Convert(&os->pending)) {
      if (error) *error = "pixel conversion failed";
      return false;
    }
    os->pending_time = ft;
    os->have_pending = true;
  }

  const PixelBuffer* chosen = os->have_last ? &os->last
                              : os->have_pending ? &os->pending
                                                 : nullptr;
  if (!chosen) {
    if (error && error->empty()) *error = "no frame at " + std::to_string(t) + "s";
    return false;
  }
  out->Resize(chosen->width, chosen->height);
  std::memcpy(out->rgba.data(), chosen->rgba.data(), chosen->rgba.size());
  return true;
}

}  // namespace reelforge::frame
