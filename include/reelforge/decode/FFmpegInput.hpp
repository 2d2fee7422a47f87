// Repository: ReelForge
// Component: FFmpeg Input
// Purpose: Opens an AVFormatContext from a file path or an in-memory blob.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_DECODE_FFMPEG_INPUT_HPP_
#define REELFORGE_DECODE_FFMPEG_INPUT_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "reelforge/pipeline/ExportTypes.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVIOContext;

namespace reelforge::decode {

// FFmpegInput owns a demuxer context for one resolved source.
//
// Blob sources are read through a custom AVIOContext (read + seek thunks
// over the shared, immutable byte vector). An optional abort flag is wired
// into the interrupt callback so blocking demux calls return promptly when
// a decode is abandoned.
class FFmpegInput {
 public:
  FFmpegInput() = default;
  ~FFmpegInput();

  FFmpegInput(const FFmpegInput&) = delete;
  FFmpegInput& operator=(const FFmpegInput&) = delete;

  bool Open(const pipeline::ResolvedSource& source, const std::atomic<bool>* abort,
            std::string* error);
  void Close();

  AVFormatContext* format() const { return format_ctx_; }
  const std::string& label() const { return label_; }

 private:
  static int ReadThunk(void* opaque, uint8_t* buf, int buf_size);
  static int64_t SeekThunk(void* opaque, int64_t offset, int whence);
  static int InterruptThunk(void* opaque);

  AVFormatContext* format_ctx_ = nullptr;
  AVIOContext* avio_ctx_ = nullptr;
  std::shared_ptr<const std::vector<uint8_t>> blob_;
  int64_t blob_pos_ = 0;
  const std::atomic<bool>* abort_ = nullptr;
  std::string label_;
};

// Codec, size, pixel format and frame rate of the best video stream as one
// comparable string, e.g. "h264 1280x720 yuv420p 30/1". Sources whose
// signatures match can be joined by the concat demuxer without re-encoding.
bool DescribeVideoStream(const pipeline::ResolvedSource& source, std::string* signature,
                         std::string* error);

// av_strerror wrapped into a std::string.
std::string AvErrorToString(int errnum);

}  // namespace reelforge::decode

#endif  // REELFORGE_DECODE_FFMPEG_INPUT_HPP_
