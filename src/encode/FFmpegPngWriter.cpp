// Repository: ReelForge
// Component: Frame Image Writer
// Purpose: Writes one composited frame to a PNG file.
// Copyright (c) 2025 ReelForge

#include "reelforge/encode/FrameImageWriter.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/frame.h>
#include <libavutil/imgutils.h>
}

#include "reelforge/decode/FFmpegInput.hpp"

namespace reelforge::encode {

using decode::AvErrorToString;

FFmpegPngWriter::~FFmpegPngWriter() {
  Free();
}

void FFmpegPngWriter::Free() {
  if (packet_) av_packet_free(&packet_);
  if (frame_) av_frame_free(&frame_);
  if (codec_ctx_) avcodec_free_context(&codec_ctx_);
}

bool FFmpegPngWriter::EnsureCodec(int width, int height, std::string* error) {
  if (codec_ctx_ && codec_ctx_->width == width && codec_ctx_->height == height) {
    return true;
  }
  Free();

  const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_PNG);
  if (!codec) {
    if (error) *error = "png encoder not available";
    return false;
  }
  codec_ctx_ = avcodec_alloc_context3(codec);
  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!codec_ctx_ || !frame_ || !packet_) {
    if (error) *error = "png encoder allocation failed";
    Free();
    return false;
  }
  codec_ctx_->width = width;
  codec_ctx_->height = height;
  codec_ctx_->pix_fmt = AV_PIX_FMT_RGBA;
  codec_ctx_->time_base = AVRational{1, 25};
  int ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    if (error) *error = "png avcodec_open2: " + AvErrorToString(ret);
    Free();
    return false;
  }
  return true;
}

bool FFmpegPngWriter::WriteImage(const pipeline::PixelBuffer& pixels,
                                 const std::string& path, std::string* error) {
  if (!EnsureCodec(pixels.width, pixels.height, error)) return false;

  // Frame borrows the pixel buffer; the png encoder copies synchronously.
  av_frame_unref(frame_);
  frame_->format = AV_PIX_FMT_RGBA;
  frame_->width = pixels.width;
  frame_->height = pixels.height;
  frame_->data[0] = const_cast<uint8_t*>(pixels.rgba.data());
  frame_->linesize[0] = pixels.width * 4;

  int ret = avcodec_send_frame(codec_ctx_, frame_);
  frame_->data[0] = nullptr;
  if (ret < 0) {
    if (error) *error = "png send_frame: " + AvErrorToString(ret);
    return false;
  }
  ret = avcodec_receive_packet(codec_ctx_, packet_);
  if (ret < 0) {
    if (error) *error = "png receive_packet: " + AvErrorToString(ret);
    return false;
  }

  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) {
    if (error) *error = "cannot open " + path + ": " + std::strerror(errno);
    av_packet_unref(packet_);
    return false;
  }
  size_t written = std::fwrite(packet_->data, 1, static_cast<size_t>(packet_->size), f);
  bool ok = written == static_cast<size_t>(packet_->size);
  ok = (std::fclose(f) == 0) && ok;
  av_packet_unref(packet_);
  if (!ok && error) *error = "short write to " + path;
  return ok;
}

}  // namespace reelforge::encode
