// Repository: ReelForge
// Component: Export Types
// Purpose: Shared data model for the export pipeline.
// Copyright (c) 2025 ReelForge

#include "reelforge/pipeline/ExportTypes.hpp"

#include <algorithm>
#include <cmath>

namespace reelforge::pipeline {

int64_t ExportSettings::TotalFrames() const {
  if (fps <= 0 || duration_seconds <= 0.0) return 1;
  // Epsilon absorbs float error for durations that are whole frame multiples.
  double frames = std::ceil(duration_seconds * fps - 1e-9);
  return std::max<int64_t>(1, static_cast<int64_t>(frames));
}

QualityParams QualityParamsFor(QualityPreset preset) {
  switch (preset) {
    case QualityPreset::kHigh:
      return QualityParams{18, "slow", 24, 8'000'000};
    case QualityPreset::kMedium:
      return QualityParams{23, "fast", 32, 5'000'000};
    case QualityPreset::kLow:
      return QualityParams{28, "veryfast", 40, 2'500'000};
  }
  return QualityParams{23, "fast", 32, 5'000'000};
}

const char* ContainerFormatToString(ContainerFormat format) {
  switch (format) {
    case ContainerFormat::kMp4: return "mp4";
    case ContainerFormat::kWebm: return "webm";
  }
  return "unknown";
}

const char* ContainerExtension(ContainerFormat format) {
  return format == ContainerFormat::kWebm ? ".webm" : ".mp4";
}

const char* QualityPresetToString(QualityPreset preset) {
  switch (preset) {
    case QualityPreset::kHigh: return "high";
    case QualityPreset::kMedium: return "medium";
    case QualityPreset::kLow: return "low";
  }
  return "unknown";
}

std::optional<QualityPreset> ParseQualityPreset(const std::string& text) {
  if (text == "high") return QualityPreset::kHigh;
  if (text == "medium") return QualityPreset::kMedium;
  if (text == "low") return QualityPreset::kLow;
  return std::nullopt;
}

std::optional<ContainerFormat> ParseContainerFormat(const std::string& text) {
  if (text == "mp4") return ContainerFormat::kMp4;
  if (text == "webm") return ContainerFormat::kWebm;
  return std::nullopt;
}

const char* JobStateToString(JobState state) {
  switch (state) {
    case JobState::kQueued: return "Queued";
    case JobState::kPreparing: return "Preparing";
    case JobState::kEncoding: return "Encoding";
    case JobState::kMuxing: return "Muxing";
    case JobState::kCompleted: return "Completed";
    case JobState::kFailed: return "Failed";
    case JobState::kCancelled: return "Cancelled";
  }
  return "Unknown";
}

const char* ExportErrorToString(ExportError error) {
  switch (error) {
    case ExportError::kNone: return "None";
    case ExportError::kUnsupportedEnvironment: return "UnsupportedEnvironment";
    case ExportError::kEngineInitialization: return "EngineInitializationError";
    case ExportError::kSourceDecode: return "SourceDecodeError";
    case ExportError::kSubprocessFailure: return "SubprocessFailure";
    case ExportError::kTimeout: return "Timeout";
    case ExportError::kCancelled: return "Cancelled";
    case ExportError::kInvalidSettings: return "InvalidSettings";
    case ExportError::kIo: return "IoError";
    case ExportError::kRejected: return "Rejected";
  }
  return "Unknown";
}

void PixelBuffer::Resize(int w, int h) {
  if (w == width && h == height && !rgba.empty()) return;
  width = w;
  height = h;
  // resize() keeps capacity, so alternating sizes stop reallocating.
  rgba.resize(static_cast<size_t>(w) * static_cast<size_t>(h) * 4);
}

SourceResolver FilePathResolver() {
  return [](const std::string& source_ref) -> std::optional<ResolvedSource> {
    if (source_ref.empty()) return std::nullopt;
    ResolvedSource src;
    src.file_path = source_ref;
    return src;
  };
}

std::string NormalizeSettings(ExportSettings* settings) {
  if (settings->width <= 0 || settings->height <= 0) {
    return "resolution must be positive";
  }
  if (settings->width % 2 != 0 || settings->height % 2 != 0) {
    return "resolution must be even (yuv420p)";
  }
  if (settings->fps < 1 || settings->fps > 120) {
    return "fps must be within [1, 120]";
  }
  if (settings->output_path.empty()) {
    return "output path is empty";
  }
  if (!(settings->duration_seconds > kMinExportDurationSeconds)) {
    settings->duration_seconds = kMinExportDurationSeconds;
  }
  settings->duration_seconds =
      std::min(settings->duration_seconds, kMaxExportDurationSeconds);
  return "";
}

std::string ValidateElements(const std::vector<TimelineElement>& elements) {
  // Bound on element timing and placement; far beyond any real timeline.
  constexpr double kLimit = 1e7;
  for (const TimelineElement& e : elements) {
    const VisualTransform& t = e.transform;
    const double values[] = {e.start_time, e.duration, e.trim_in, e.trim_out, e.volume,
                             e.pan, t.x, t.y, t.scale, t.rotation_degrees, t.opacity};
    for (double v : values) {
      if (!std::isfinite(v) || std::fabs(v) > kLimit) {
        return "element '" + e.id + "' has a non-finite or out-of-range value";
      }
    }
    if (e.duration < 0.0 || e.trim_in < 0.0 || e.trim_out < 0.0) {
      return "element '" + e.id + "' has a negative duration or trim";
    }
  }
  return "";
}

}  // namespace reelforge::pipeline
