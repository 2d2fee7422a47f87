// Repository: ReelForge
// Component: FFmpeg Input
// Purpose: Opens an AVFormatContext from a file path or an in-memory blob.
// Copyright (c) 2025 ReelForge

#include "reelforge/decode/FFmpegInput.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavformat/avio.h>
#include <libavutil/error.h>
#include <libavutil/mem.h>
#include <libavutil/pixdesc.h>
}

#include "reelforge/util/Logger.hpp"

namespace reelforge::decode {

namespace {
constexpr int kAvioBufferSize = 64 * 1024;
}  // namespace

std::string AvErrorToString(int errnum) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(errnum, errbuf, sizeof(errbuf));
  return std::string(errbuf);
}

FFmpegInput::~FFmpegInput() {
  Close();
}

int FFmpegInput::InterruptThunk(void* opaque) {
  auto* self = static_cast<FFmpegInput*>(opaque);
  return (self->abort_ && self->abort_->load(std::memory_order_acquire)) ? 1 : 0;
}

int FFmpegInput::ReadThunk(void* opaque, uint8_t* buf, int buf_size) {
  auto* self = static_cast<FFmpegInput*>(opaque);
  const auto& bytes = *self->blob_;
  int64_t remaining = static_cast<int64_t>(bytes.size()) - self->blob_pos_;
  if (remaining <= 0) return AVERROR_EOF;
  int n = static_cast<int>(std::min<int64_t>(remaining, buf_size));
  std::memcpy(buf, bytes.data() + self->blob_pos_, static_cast<size_t>(n));
  self->blob_pos_ += n;
  return n;
}

int64_t FFmpegInput::SeekThunk(void* opaque, int64_t offset, int whence) {
  auto* self = static_cast<FFmpegInput*>(opaque);
  const int64_t size = static_cast<int64_t>(self->blob_->size());
  if (whence & AVSEEK_SIZE) return size;
  int64_t target = 0;
  switch (whence & ~AVSEEK_FORCE) {
    case SEEK_SET: target = offset; break;
    case SEEK_CUR: target = self->blob_pos_ + offset; break;
    case SEEK_END: target = size + offset; break;
    default: return AVERROR(EINVAL);
  }
  if (target < 0 || target > size) return AVERROR(EINVAL);
  self->blob_pos_ = target;
  return target;
}

bool FFmpegInput::Open(const pipeline::ResolvedSource& source,
                       const std::atomic<bool>* abort, std::string* error) {
  Close();
  abort_ = abort;

  format_ctx_ = avformat_alloc_context();
  if (!format_ctx_) {
    if (error) *error = "failed to allocate format context";
    return false;
  }
  format_ctx_->interrupt_callback.callback = &FFmpegInput::InterruptThunk;
  format_ctx_->interrupt_callback.opaque = this;

  const char* url = nullptr;
  if (source.IsFile()) {
    label_ = source.file_path;
    url = source.file_path.c_str();
  } else if (source.IsBlob()) {
    label_ = "<blob " + std::to_string(source.blob->size()) + " bytes>";
    blob_ = source.blob;
    blob_pos_ = 0;
    auto* buffer = static_cast<unsigned char*>(av_malloc(kAvioBufferSize));
    if (!buffer) {
      if (error) *error = "failed to allocate AVIO buffer";
      Close();
      return false;
    }
    avio_ctx_ = avio_alloc_context(buffer, kAvioBufferSize, 0, this,
                                   &FFmpegInput::ReadThunk, nullptr,
                                   &FFmpegInput::SeekThunk);
    if (!avio_ctx_) {
      av_free(buffer);
      if (error) *error = "failed to allocate AVIO context";
      Close();
      return false;
    }
    format_ctx_->pb = avio_ctx_;
    format_ctx_->flags |= AVFMT_FLAG_CUSTOM_IO;
  } else {
    if (error) *error = "source resolved to neither a file nor a blob";
    Close();
    return false;
  }

  int ret = avformat_open_input(&format_ctx_, url, nullptr, nullptr);
  if (ret < 0) {
    // avformat_open_input frees the context on failure.
    format_ctx_ = nullptr;
    if (error) *error = "open_input failed for " + label_ + ": " + AvErrorToString(ret);
    Close();
    return false;
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    if (error) {
      *error = "find_stream_info failed for " + label_ + ": " + AvErrorToString(ret);
    }
    Close();
    return false;
  }
  return true;
}

void FFmpegInput::Close() {
  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
    format_ctx_ = nullptr;
  }
  if (avio_ctx_) {
    av_freep(&avio_ctx_->buffer);
    avio_context_free(&avio_ctx_);
    avio_ctx_ = nullptr;
  }
  blob_.reset();
  blob_pos_ = 0;
}

bool DescribeVideoStream(const pipeline::ResolvedSource& source, std::string* signature,
                         std::string* error) {
  FFmpegInput input;
  if (!input.Open(source, nullptr, error)) return false;
  AVFormatContext* fmt = input.format();
  const int index = av_find_best_stream(fmt, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (index < 0) {
    if (error) *error = "no video stream in " + input.label();
    return false;
  }
  const AVStream* stream = fmt->streams[index];
  const AVCodecParameters* par = stream->codecpar;
  const char* pix = av_get_pix_fmt_name(static_cast<AVPixelFormat>(par->format));
  std::ostringstream oss;
  oss << avcodec_get_name(par->codec_id) << " " << par->width << "x" << par->height << " "
      << (pix ? pix : "unknown") << " " << stream->avg_frame_rate.num << "/"
      << stream->avg_frame_rate.den;
  *signature = oss.str();
  return true;
}

}  // namespace reelforge::decode
