// Repository: ReelForge
// Component: Encoder Args Builder
// Purpose: Validates an encode request and turns it into the encoder
//          binary's argument list.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_IPC_ENCODER_ARGS_BUILDER_HPP_
#define REELFORGE_IPC_ENCODER_ARGS_BUILDER_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "export_host.pb.h"

namespace reelforge::ipc {

// Image sequence naming shared by the engine and the host (0-based).
inline constexpr const char* kFramePattern = "frame-%04d.png";
inline constexpr const char* kConcatListName = "concat-list.txt";

std::string FrameFilePath(const std::string& dir, int64_t index);

// Returns an empty string when the request is usable, otherwise the reason.
std::string ValidateEncodeRequest(const exporthost::EncodeRequest& request);

// Returns the path of the first missing frame in [0, frame_count), or an
// empty string when the sequence is contiguous.
std::string FindFirstMissingFrame(const std::string& dir, int64_t frame_count);

// Returns the first copy segment that is not a regular file, or an empty
// string.
std::string FindFirstMissingSegment(const exporthost::EncodeRequest& request);

// Concat demuxer script: one "file '<path>'" line per segment, with each
// single quote written as '\''.
std::string ConcatListContent(const exporthost::EncodeRequest& request);
std::string ConcatListPath(const exporthost::EncodeRequest& request);

// Full argv (encoder path first):
//   -y -framerate F -i <dir>/frame-%04d.png
//   one -i per audio file (or an anullsrc input when there is none)
//   adelay per offset input, amix=inputs=N:duration=longest for several
//   codec, preset and CRF for the container and quality preset
//   -pix_fmt yuv420p [-movflags +faststart] -t <duration> <output>
// With copy segments the video input is the single segment or the concat
// list (-f concat -safe 0) and the video codec is "copy"; audio is encoded
// as above.
std::vector<std::string> BuildEncoderArgs(const exporthost::EncodeRequest& request);

}  // namespace reelforge::ipc

#endif  // REELFORGE_IPC_ENCODER_ARGS_BUILDER_HPP_
