// Repository: ReelForge
// Component: Export Types
// Purpose: Shared data model for the export pipeline (timeline input,
//          settings, job states, error taxonomy, frame and PCM buffers).
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_PIPELINE_EXPORT_TYPES_HPP_
#define REELFORGE_PIPELINE_EXPORT_TYPES_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace reelforge::pipeline {

// Mixing format used end-to-end: 48 kHz interleaved float stereo.
inline constexpr int kMixSampleRate = 48000;
inline constexpr int kMixChannels = 2;

inline constexpr double kMinExportDurationSeconds = 0.1;
inline constexpr double kMaxExportDurationSeconds = 7200.0;

// =============================================================================
// Timeline input (read-only, owned by the caller)
// =============================================================================

enum class ElementKind {
  kVisual = 0,
  kAudio,
  kBoth,
};

struct VisualTransform {
  double x = 0.0;                 // centre offset in output pixels
  double y = 0.0;
  double scale = 1.0;             // multiplies the contain-fit scale
  double rotation_degrees = 0.0;  // clockwise around the element centre
  double opacity = 1.0;           // [0, 1]
};

struct TimelineElement {
  std::string id;
  ElementKind kind = ElementKind::kVisual;
  std::string source_ref;
  int track_index = 0;
  double start_time = 0.0;  // seconds on the export timeline
  double duration = 0.0;    // seconds on the export timeline
  double trim_in = 0.0;     // seconds skipped at the head of the source
  double trim_out = 0.0;    // seconds skipped at the tail of the source
  double volume = 1.0;
  double pan = 0.0;         // [-1, 1], 0 = centre
  bool muted = false;
  VisualTransform transform;

  bool HasVisual() const {
    return kind == ElementKind::kVisual || kind == ElementKind::kBoth;
  }
  bool HasAudio() const {
    return kind == ElementKind::kAudio || kind == ElementKind::kBoth;
  }
  double EndTime() const { return start_time + duration; }

  // Half-open interval [start_time, start_time + duration).
  bool IsActiveAt(double t) const { return t >= start_time && t < EndTime(); }
};

// =============================================================================
// Settings
// =============================================================================

enum class ContainerFormat {
  kMp4 = 0,   // H.264 + AAC
  kWebm,      // VP9 + Opus
};

enum class QualityPreset {
  kHigh = 0,
  kMedium,
  kLow,
};

struct ExportSettings {
  int width = 1920;
  int height = 1080;
  int fps = 30;
  ContainerFormat format = ContainerFormat::kMp4;
  QualityPreset quality = QualityPreset::kMedium;
  double duration_seconds = 0.0;
  std::string output_path;
  // The caller asserts the visual sources already carry the output codec,
  // resolution and frame rate. The external engine then concatenates them
  // with stream copy instead of re-encoding, when the timeline allows it.
  bool allow_stream_copy = false;

  // ceil(duration * fps), at least one frame.
  int64_t TotalFrames() const;
  double FrameTimestamp(int64_t index) const {
    return static_cast<double>(index) / static_cast<double>(fps);
  }
};

// Encoder parameters per quality preset.
struct QualityParams {
  int h264_crf;
  const char* x264_preset;
  int vp9_crf;
  int64_t video_bitrate;  // bits/s, used by bitrate-driven (streaming) encoders
};

QualityParams QualityParamsFor(QualityPreset preset);

const char* ContainerFormatToString(ContainerFormat format);
const char* ContainerExtension(ContainerFormat format);
const char* QualityPresetToString(QualityPreset preset);
std::optional<QualityPreset> ParseQualityPreset(const std::string& text);
std::optional<ContainerFormat> ParseContainerFormat(const std::string& text);

// =============================================================================
// Job state and errors
// =============================================================================

enum class JobState {
  kQueued = 0,
  kPreparing,
  kEncoding,
  kMuxing,
  kCompleted,
  kFailed,
  kCancelled,
};

const char* JobStateToString(JobState state);

inline bool IsTerminal(JobState state) {
  return state == JobState::kCompleted || state == JobState::kFailed ||
         state == JobState::kCancelled;
}

enum class ExportError {
  kNone = 0,
  kUnsupportedEnvironment,
  kEngineInitialization,
  kSourceDecode,
  kSubprocessFailure,
  kTimeout,
  kCancelled,
  kInvalidSettings,
  kIo,
  kRejected,  // submission refused by the concurrency policy
};

const char* ExportErrorToString(ExportError error);

// Outcome of one fallible pipeline step.
struct EngineStatus {
  bool ok = true;
  ExportError error = ExportError::kNone;
  std::string message;     // human-readable reason
  std::string diagnostic;  // low-level detail (stderr tail, av_strerror, ...)

  static EngineStatus Success() { return EngineStatus{}; }

  static EngineStatus Failure(ExportError err, std::string msg,
                              std::string diag = "") {
    EngineStatus s;
    s.ok = false;
    s.error = err;
    s.message = std::move(msg);
    s.diagnostic = std::move(diag);
    return s;
  }
};

// Non-fatal, per-source problem recorded on an otherwise successful job.
struct ExportWarning {
  std::string element_id;
  ExportError error = ExportError::kSourceDecode;
  std::string message;
};

struct ExportResult {
  uint64_t job_id = 0;
  JobState state = JobState::kQueued;
  ExportError error = ExportError::kNone;
  std::string message;
  std::string diagnostic;
  std::string output_path;
  std::string backend;
  std::vector<ExportWarning> warnings;

  bool Succeeded() const { return state == JobState::kCompleted; }

  // "Exported with gaps": completed, but some source degraded.
  bool HasGaps() const { return Succeeded() && !warnings.empty(); }
};

// =============================================================================
// Capability profile
// =============================================================================

struct CapabilityProfile {
  bool has_native_process = false;
  bool has_shared_memory = false;
  bool has_hardware_decode = false;
  uint64_t estimated_ram_bytes = 0;
  int performance_score = 0;  // [0, 100]
  // Working-set estimate for one job at the requested resolution.
  uint64_t estimated_job_memory_bytes = 0;
};

// =============================================================================
// Media buffers
// =============================================================================

// Tightly packed RGBA8, stride = width * 4.
struct PixelBuffer {
  int width = 0;
  int height = 0;
  std::vector<uint8_t> rgba;

  // Reallocates only when the size changes.
  void Resize(int w, int h);
  size_t ByteSize() const { return rgba.size(); }
  uint8_t* Pixel(int x, int y) {
    return rgba.data() + (static_cast<size_t>(y) * width + x) * 4;
  }
  const uint8_t* Pixel(int x, int y) const {
    return rgba.data() + (static_cast<size_t>(y) * width + x) * 4;
  }
};

// One frame handed to an encoder; the pixels are borrowed for the call only.
struct EncodedFrame {
  int64_t index = 0;
  double timestamp_seconds = 0.0;
  const PixelBuffer* pixels = nullptr;
};

// Interleaved float PCM.
struct PcmBuffer {
  int sample_rate = kMixSampleRate;
  int channels = kMixChannels;
  std::vector<float> samples;

  size_t FrameCount() const {
    return channels > 0 ? samples.size() / static_cast<size_t>(channels) : 0;
  }
  double DurationSeconds() const {
    return sample_rate > 0
               ? static_cast<double>(FrameCount()) / static_cast<double>(sample_rate)
               : 0.0;
  }
};

// =============================================================================
// Source access
// =============================================================================

// A resolved byte source: either a file on disk or an in-memory blob.
struct ResolvedSource {
  std::string file_path;
  std::shared_ptr<const std::vector<uint8_t>> blob;

  bool IsFile() const { return !file_path.empty(); }
  bool IsBlob() const { return blob != nullptr; }
};

// (sourceRef) -> Blob|FilePath; nullopt when the reference cannot be resolved.
using SourceResolver =
    std::function<std::optional<ResolvedSource>(const std::string& source_ref)>;

// Resolver that treats every sourceRef as a file path.
SourceResolver FilePathResolver();

// (progress in [0,1], state)
using ProgressCallback = std::function<void(double, JobState)>;

// Returns an empty string when the settings are usable; otherwise the reason.
// Clamps duration into [kMinExportDurationSeconds, kMaxExportDurationSeconds].
std::string NormalizeSettings(ExportSettings* settings);

// Returns an empty string when every element's timing, mix and transform
// values are finite and in range; otherwise the reason, naming the element.
std::string ValidateElements(const std::vector<TimelineElement>& elements);

}  // namespace reelforge::pipeline

#endif  // REELFORGE_PIPELINE_EXPORT_TYPES_HPP_
