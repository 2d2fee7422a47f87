// Repository: ReelForge
// Component: Frame Image Writer
// Purpose: Writes one composited frame to an image file.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_ENCODE_FRAME_IMAGE_WRITER_HPP_
#define REELFORGE_ENCODE_FRAME_IMAGE_WRITER_HPP_

#include <string>

#include "reelforge/pipeline/ExportTypes.hpp"

struct AVCodecContext;
struct AVFrame;
struct AVPacket;

namespace reelforge::encode {

class IFrameImageWriter {
 public:
  virtual ~IFrameImageWriter() = default;

  virtual bool WriteImage(const pipeline::PixelBuffer& pixels, const std::string& path,
                          std::string* error) = 0;
};

// Lossless PNG through FFmpeg's png encoder. The codec context is kept
// while the frame size stays the same.
class FFmpegPngWriter : public IFrameImageWriter {
 public:
  FFmpegPngWriter() = default;
  ~FFmpegPngWriter() override;

  FFmpegPngWriter(const FFmpegPngWriter&) = delete;
  FFmpegPngWriter& operator=(const FFmpegPngWriter&) = delete;

  bool WriteImage(const pipeline::PixelBuffer& pixels, const std::string& path,
                  std::string* error) override;

 private:
  bool EnsureCodec(int width, int height, std::string* error);
  void Free();

  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
};

// Lossless PNG through libpng's simplified API. Used when the build has
// no FFmpeg so the external engine can still hand frames to the encoder.
class LibPngWriter : public IFrameImageWriter {
 public:
  bool WriteImage(const pipeline::PixelBuffer& pixels, const std::string& path,
                  std::string* error) override;
};

}  // namespace reelforge::encode

#endif  // REELFORGE_ENCODE_FRAME_IMAGE_WRITER_HPP_
