// Repository: ReelForge
// Component: Encoder Progress Parser
// Purpose: Extracts frame/time progress from the encoder's stderr stats.
// Copyright (c) 2025 ReelForge

#include "reelforge/ipc/FfmpegProgressParser.hpp"

#include <regex>

namespace reelforge::ipc {

namespace {

// Unterminated tails longer than this are not stats lines.
constexpr size_t kMaxPartialLine = 4096;

const std::regex& FrameRegex() {
  static const std::regex re(R"(frame=\s*(\d{1,15}))");
  return re;
}

const std::regex& TimeRegex() {
  static const std::regex re(R"(time=(-?)(\d{1,9}):(\d{1,2}):(\d{1,2}(?:\.\d{1,6})?))");
  return re;
}

}  // namespace

std::optional<EncoderProgress> FfmpegProgressParser::ParseLine(const std::string& line) {
  EncoderProgress progress;
  bool found = false;
  std::smatch match;
  if (std::regex_search(line, match, FrameRegex())) {
    progress.frame = std::stoll(match[1].str());
    found = true;
  }
  if (std::regex_search(line, match, TimeRegex())) {
    // Negative times show up before the first packet is muxed.
    if (match[1].str().empty()) {
      progress.time_seconds = std::stod(match[2].str()) * 3600.0 +
                              std::stod(match[3].str()) * 60.0 + std::stod(match[4].str());
      found = true;
    }
  }
  if (!found) return std::nullopt;
  return progress;
}

std::vector<EncoderProgress> FfmpegProgressParser::Feed(const std::string& chunk) {
  std::vector<EncoderProgress> out;
  for (char c : chunk) {
    if (c == '\r' || c == '\n') {
      if (!partial_.empty()) {
        if (auto progress = ParseLine(partial_)) out.push_back(*progress);
        partial_.clear();
      }
      continue;
    }
    if (partial_.size() < kMaxPartialLine) partial_.push_back(c);
  }
  return out;
}

}  // namespace reelforge::ipc
