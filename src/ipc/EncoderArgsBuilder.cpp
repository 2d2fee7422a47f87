// Repository: ReelForge
// Component: Encoder Args Builder
// Purpose: Validates an encode request and turns it into the encoder
//          binary's argument list.
// Copyright (c) 2025 ReelForge

#include "reelforge/ipc/EncoderArgsBuilder.hpp"

#include <cinttypes>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <sstream>

#include "reelforge/pipeline/ExportTypes.hpp"

namespace reelforge::ipc {

namespace {

std::string FormatSeconds(double seconds) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(3) << seconds;
  return oss.str();
}

int64_t OffsetMillis(double seconds) {
  return seconds > 0.0 ? static_cast<int64_t>(std::llround(seconds * 1000.0)) : 0;
}

}  // namespace

std::string FrameFilePath(const std::string& dir, int64_t index) {
  char name[32];
  std::snprintf(name, sizeof(name), "frame-%04" PRId64 ".png", index);
  return (std::filesystem::path(dir) / name).string();
}

std::string ValidateEncodeRequest(const exporthost::EncodeRequest& request) {
  if (request.frame_dir().empty()) return "frame_dir is empty";
  if (request.copy_segments_size() == 0 && request.frame_count() <= 0) {
    return "frame_count must be positive";
  }
  for (const auto& segment : request.copy_segments()) {
    if (segment.path().empty()) return "copy segment with empty path";
  }
  if (request.width() <= 0 || request.height() <= 0) return "invalid resolution";
  if (request.fps() <= 0) return "invalid fps";
  if (request.output_path().empty()) return "output_path is empty";
  if (request.duration_seconds() <= 0.0) return "duration must be positive";
  if (request.encoder_path().empty()) return "encoder_path is empty";
  if (!pipeline::ParseContainerFormat(request.format())) {
    return "unsupported format '" + request.format() + "'";
  }
  if (!pipeline::ParseQualityPreset(request.quality_preset())) {
    return "unknown quality preset '" + request.quality_preset() + "'";
  }
  for (const auto& audio : request.audio_files()) {
    if (audio.path().empty()) return "audio input with empty path";
    if (audio.start_offset_seconds() < 0.0) return "negative audio offset";
  }
  return "";
}

std::string FindFirstMissingFrame(const std::string& dir, int64_t frame_count) {
  std::error_code ec;
  for (int64_t i = 0; i < frame_count; ++i) {
    const std::string path = FrameFilePath(dir, i);
    if (!std::filesystem::is_regular_file(path, ec)) return path;
  }
  return "";
}

std::string FindFirstMissingSegment(const exporthost::EncodeRequest& request) {
  std::error_code ec;
  for (const auto& segment : request.copy_segments()) {
    if (!std::filesystem::is_regular_file(segment.path(), ec)) return segment.path();
  }
  return "";
}

std::string ConcatListContent(const exporthost::EncodeRequest& request) {
  std::string content;
  for (const auto& segment : request.copy_segments()) {
    content += "file '";
    for (char c : segment.path()) {
      if (c == '\'') {
        content += "'\\''";
      } else {
        content += c;
      }
    }
    content += "'\n";
  }
  return content;
}

std::string ConcatListPath(const exporthost::EncodeRequest& request) {
  return (std::filesystem::path(request.frame_dir()) / kConcatListName).string();
}

std::vector<std::string> BuildEncoderArgs(const exporthost::EncodeRequest& request) {
  const auto format =
      pipeline::ParseContainerFormat(request.format()).value_or(pipeline::ContainerFormat::kMp4);
  const auto quality = pipeline::ParseQualityPreset(request.quality_preset())
                           .value_or(pipeline::QualityPreset::kMedium);
  const pipeline::QualityParams params = pipeline::QualityParamsFor(quality);
  const std::string duration = FormatSeconds(request.duration_seconds());

  const bool copy = request.copy_segments_size() > 0;

  std::vector<std::string> args = {request.encoder_path(), "-hide_banner", "-nostdin", "-y"};
  if (!copy) {
    args.insert(args.end(),
                {"-framerate", std::to_string(request.fps()), "-start_number", "0", "-i",
                 (std::filesystem::path(request.frame_dir()) / kFramePattern).string()});
  } else if (request.copy_segments_size() == 1) {
    args.insert(args.end(), {"-i", request.copy_segments(0).path()});
  } else {
    args.insert(args.end(), {"-f", "concat", "-safe", "0", "-i", ConcatListPath(request)});
  }

  const int audio_count = request.audio_files_size();
  if (audio_count == 0) {
    args.insert(args.end(),
                {"-f", "lavfi", "-t", duration, "-i",
                 "anullsrc=channel_layout=stereo:sample_rate=" +
                     std::to_string(pipeline::kMixSampleRate)});
  } else {
    for (const auto& audio : request.audio_files()) {
      args.insert(args.end(), {"-i", audio.path()});
    }
  }

  // Audio inputs start at index 1; the image sequence is input 0.
  bool needs_filter = audio_count > 1;
  for (const auto& audio : request.audio_files()) {
    if (OffsetMillis(audio.start_offset_seconds()) > 0) needs_filter = true;
  }

  args.insert(args.end(), {"-map", "0:v:0"});
  if (needs_filter) {
    std::ostringstream graph;
    std::string mix_inputs;
    for (int i = 0; i < audio_count; ++i) {
      const int64_t delay = OffsetMillis(request.audio_files(i).start_offset_seconds());
      const std::string label = "[a" + std::to_string(i) + "]";
      graph << "[" << (i + 1) << ":a]";
      if (delay > 0) {
        graph << "adelay=" << delay << "|" << delay;
      } else {
        graph << "anull";
      }
      graph << label << ";";
      mix_inputs += label;
    }
    if (audio_count > 1) {
      graph << mix_inputs << "amix=inputs=" << audio_count << ":duration=longest[aout]";
    } else {
      graph << mix_inputs << "anull[aout]";
    }
    args.insert(args.end(), {"-filter_complex", graph.str(), "-map", "[aout]"});
  } else {
    args.insert(args.end(), {"-map", "1:a"});
  }

  if (copy) {
    args.insert(args.end(), {"-c:v", "copy"});
    if (format == pipeline::ContainerFormat::kWebm) {
      args.insert(args.end(), {"-c:a", "libopus", "-b:a", "128k"});
    } else {
      args.insert(args.end(), {"-c:a", "aac", "-b:a", "128k"});
    }
    args.insert(args.end(), {"-ar", std::to_string(pipeline::kMixSampleRate), "-ac", "2"});
  } else {
    if (format == pipeline::ContainerFormat::kWebm) {
      args.insert(args.end(), {"-c:v", "libvpx-vp9", "-crf", std::to_string(params.vp9_crf),
                               "-b:v", "0", "-c:a", "libopus", "-b:a", "128k"});
    } else {
      args.insert(args.end(),
                  {"-c:v", "libx264", "-preset", params.x264_preset, "-crf",
                   std::to_string(params.h264_crf), "-c:a", "aac", "-b:a", "128k"});
    }
    args.insert(args.end(), {"-ar", std::to_string(pipeline::kMixSampleRate), "-ac", "2",
                             "-pix_fmt", "yuv420p"});
  }
  if (format == pipeline::ContainerFormat::kMp4) {
    args.insert(args.end(), {"-movflags", "+faststart"});
  }
  args.insert(args.end(), {"-t", duration, request.output_path()});
  return args;
}

}  // namespace reelforge::ipc
