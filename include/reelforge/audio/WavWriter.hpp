// Repository: ReelForge
// Component: WAV Writer
// Purpose: Writes mixed PCM to a 16-bit little-endian WAV file.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_AUDIO_WAV_WRITER_HPP_
#define REELFORGE_AUDIO_WAV_WRITER_HPP_

#include <cstdint>
#include <fstream>
#include <string>

#include "reelforge/pipeline/ExportTypes.hpp"

namespace reelforge::audio {

// Appends PCM blocks to a WAV file as they are mixed. The RIFF and data
// sizes are written as zero by Open() and patched by Finish(), so a file
// that was never finished is recognisably truncated.
class WavStreamWriter {
 public:
  WavStreamWriter() = default;
  ~WavStreamWriter();

  WavStreamWriter(const WavStreamWriter&) = delete;
  WavStreamWriter& operator=(const WavStreamWriter&) = delete;

  bool Open(const std::string& path, int sample_rate, int channels, std::string* error);

  // Samples are interleaved; a partial frame at the end is rejected.
  bool Append(const float* samples, size_t sample_count, std::string* error);
  bool Append(const pipeline::PcmBuffer& pcm, std::string* error);

  bool Finish(std::string* error);

  uint64_t data_bytes() const { return data_bytes_; }
  bool is_open() const { return out_.is_open(); }

 private:
  std::ofstream out_;
  std::string path_;
  int sample_rate_ = 0;
  int channels_ = 0;
  uint64_t data_bytes_ = 0;
};

// Float samples are clipped to [-1, 1] and quantised to int16.
bool WriteWav16(const std::string& path, const pipeline::PcmBuffer& pcm,
                std::string* error);

}  // namespace reelforge::audio

#endif  // REELFORGE_AUDIO_WAV_WRITER_HPP_
