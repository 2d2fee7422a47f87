// Repository: ReelForge
// Component: Encoder Progress Parser
// Purpose: Extracts frame/time progress from the encoder's stderr stats.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_IPC_FFMPEG_PROGRESS_PARSER_HPP_
#define REELFORGE_IPC_FFMPEG_PROGRESS_PARSER_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace reelforge::ipc {

struct EncoderProgress {
  int64_t frame = -1;          // -1 when the line had no frame= field
  double time_seconds = -1.0;  // -1 when the line had no time= field
};

// Stats lines look like
//   frame=  120 fps= 60 q=28.0 size=  256kB time=00:00:04.00 bitrate=...
// and are terminated by '\r' (or '\n' for the last one). Feed() accepts
// arbitrary chunks and returns the progress of every completed line.
class FfmpegProgressParser {
 public:
  std::vector<EncoderProgress> Feed(const std::string& chunk);

  // Parses one line; nullopt when it carries neither field.
  static std::optional<EncoderProgress> ParseLine(const std::string& line);

 private:
  std::string partial_;
};

}  // namespace reelforge::ipc

#endif  // REELFORGE_IPC_FFMPEG_PROGRESS_PARSER_HPP_
