// Repository: ReelForge
// Component: Export Command-Line Harness
// Purpose: Builds a timeline from flags and runs one export through the
//          coordinator.
// Copyright (c) 2025 ReelForge
//
// Diagnostics and scripting entry point. Exit codes:
//   0   export completed
//   1   export failed, or bad arguments
//   130 interrupted (SIGINT/SIGTERM cancels the job)

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "reelforge/engine/BackendEngine.hpp"
#include "reelforge/pipeline/ExportConfig.hpp"
#include "reelforge/pipeline/ExportTypes.hpp"
#include "reelforge/runtime/ExportCoordinator.hpp"

namespace {

using reelforge::engine::EngineCandidate;
using reelforge::engine::EngineKind;
using reelforge::engine::EngineTier;
using reelforge::pipeline::ElementKind;
using reelforge::pipeline::JobState;
using reelforge::pipeline::TimelineElement;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct ClipArg {
  std::string path;
  double start = 0.0;
  double duration = -1.0;  // -1 = until the end of the export
  int track = 0;
  double volume = 1.0;
};

struct CliArgs {
  reelforge::pipeline::ExportSettings settings;
  std::string engine = "auto";
  std::vector<ClipArg> videos;
  std::vector<ClipArg> audios;
  bool quiet = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " --output PATH --duration SECONDS [OPTIONS]\n"
            << "\n"
            << "Renders a timeline built from the command line into one video file.\n"
            << "\n"
            << "OUTPUT OPTIONS:\n"
            << "  --output PATH              Destination file\n"
            << "  --duration SECONDS         Export duration (0.1 .. 7200)\n"
            << "  --width N / --height N     Canvas size (default 1920x1080, even)\n"
            << "  --fps N                    Frame rate (default 30)\n"
            << "  --quality high|medium|low  Encoder preset (default medium)\n"
            << "  --format mp4|webm          Container (default mp4)\n"
            << "  --engine NAME              auto|external|software|recorder (default auto)\n"
            << "\n"
            << "TIMELINE:\n"
            << "  --video PATH@START[:DUR[:TRACK]]   Visual clip (image or video)\n"
            << "  --audio PATH@START[:DUR[:VOLUME]]  Audio clip\n"
            << "\n"
            << "  --stream-copy              Join untransformed back-to-back video\n"
            << "                             clips without re-encoding when possible\n"
            << "  --quiet                    No progress lines\n"
            << "  --help                     Show this help message\n"
            << "\n"
            << "ENVIRONMENT:\n"
            << "  REELFORGE_HOST_PATH, REELFORGE_FFMPEG_PATH, REELFORGE_TEMP_ROOT,\n"
            << "  REELFORGE_ENCODE_TIMEOUT_MS, REELFORGE_DEBUG\n"
            << "\n"
            << "EXAMPLE:\n"
            << "  " << program_name << " --output /tmp/out.mp4 --duration 5 \\\n"
            << "      --video still.png@0 --audio music.wav@1:3:0.5\n"
            << "\n";
}

bool ParseDouble(const std::string& text, double* out) {
  if (text.empty()) return false;
  char* end = nullptr;
  double v = std::strtod(text.c_str(), &end);
  if (end == nullptr || *end != '\0') return false;
  *out = v;
  return true;
}

bool ParseInt(const std::string& text, int* out) {
  if (text.empty()) return false;
  char* end = nullptr;
  long v = std::strtol(text.c_str(), &end, 10);
  if (end == nullptr || *end != '\0') return false;
  *out = static_cast<int>(v);
  return true;
}

// PATH@START[:A[:B]]. The last '@' separates the path, so paths may contain
// '@'. `last_is_volume` selects whether B is a volume or a track index.
bool ParseClip(const std::string& text, bool last_is_volume, ClipArg* clip) {
  size_t at = text.rfind('@');
  if (at == std::string::npos || at == 0) return false;
  clip->path = text.substr(0, at);

  std::vector<std::string> fields;
  std::string rest = text.substr(at + 1);
  size_t pos = 0;
  while (true) {
    size_t colon = rest.find(':', pos);
    fields.push_back(rest.substr(pos, colon == std::string::npos ? std::string::npos
                                                                 : colon - pos));
    if (colon == std::string::npos) break;
    pos = colon + 1;
  }
  if (fields.size() > 3) return false;

  if (!ParseDouble(fields[0], &clip->start) || clip->start < 0.0) return false;
  if (fields.size() >= 2 && !ParseDouble(fields[1], &clip->duration)) return false;
  if (fields.size() == 3) {
    if (last_is_volume) {
      if (!ParseDouble(fields[2], &clip->volume)) return false;
    } else if (!ParseInt(fields[2], &clip->track)) {
      return false;
    }
  }
  return true;
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  bool have_output = false;
  bool have_duration = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--output" && has_value) {
      args.settings.output_path = argv[++i];
      have_output = true;
    } else if (arg == "--duration" && has_value) {
      if (!ParseDouble(argv[++i], &args.settings.duration_seconds)) {
        args.error = "Invalid --duration";
        return args;
      }
      have_duration = true;
    } else if (arg == "--width" && has_value) {
      if (!ParseInt(argv[++i], &args.settings.width)) {
        args.error = "Invalid --width";
        return args;
      }
    } else if (arg == "--height" && has_value) {
      if (!ParseInt(argv[++i], &args.settings.height)) {
        args.error = "Invalid --height";
        return args;
      }
    } else if (arg == "--fps" && has_value) {
      if (!ParseInt(argv[++i], &args.settings.fps)) {
        args.error = "Invalid --fps";
        return args;
      }
    } else if (arg == "--quality" && has_value) {
      auto preset = reelforge::pipeline::ParseQualityPreset(argv[++i]);
      if (!preset) {
        args.error = "Invalid --quality (expected high, medium or low)";
        return args;
      }
      args.settings.quality = *preset;
    } else if (arg == "--format" && has_value) {
      auto format = reelforge::pipeline::ParseContainerFormat(argv[++i]);
      if (!format) {
        args.error = "Invalid --format (expected mp4 or webm)";
        return args;
      }
      args.settings.format = *format;
    } else if (arg == "--engine" && has_value) {
      args.engine = argv[++i];
      if (args.engine != "auto" && args.engine != "external" && args.engine != "software" &&
          args.engine != "recorder") {
        args.error = "Invalid --engine: " + args.engine;
        return args;
      }
    } else if (arg == "--video" && has_value) {
      ClipArg clip;
      if (!ParseClip(argv[++i], /*last_is_volume=*/false, &clip)) {
        args.error = std::string("Invalid --video: ") + argv[i];
        return args;
      }
      args.videos.push_back(clip);
    } else if (arg == "--audio" && has_value) {
      ClipArg clip;
      if (!ParseClip(argv[++i], /*last_is_volume=*/true, &clip)) {
        args.error = std::string("Invalid --audio: ") + argv[i];
        return args;
      }
      args.audios.push_back(clip);
    } else if (arg == "--stream-copy") {
      args.settings.allow_stream_copy = true;
    } else if (arg == "--quiet") {
      args.quiet = true;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (!have_output) {
    args.error = "Must specify --output";
    return args;
  }
  if (!have_duration) {
    args.error = "Must specify --duration";
    return args;
  }

  args.valid = true;
  return args;
}

// =============================================================================
// Timeline and engine order
// =============================================================================

std::vector<TimelineElement> BuildTimeline(const CliArgs& args) {
  std::vector<TimelineElement> elements;
  double total = args.settings.duration_seconds;

  int n = 0;
  for (const auto& clip : args.videos) {
    TimelineElement e;
    e.id = "video-" + std::to_string(n++);
    e.kind = ElementKind::kVisual;
    e.source_ref = clip.path;
    e.track_index = clip.track;
    e.start_time = clip.start;
    e.duration = clip.duration >= 0.0 ? clip.duration : total - clip.start;
    elements.push_back(e);
  }
  n = 0;
  for (const auto& clip : args.audios) {
    TimelineElement e;
    e.id = "audio-" + std::to_string(n++);
    e.kind = ElementKind::kAudio;
    e.source_ref = clip.path;
    e.start_time = clip.start;
    e.duration = clip.duration >= 0.0 ? clip.duration : total - clip.start;
    e.volume = clip.volume;
    elements.push_back(e);
  }
  return elements;
}

std::vector<EngineCandidate> EngineOrderFor(const std::string& engine) {
  if (engine == "external") return {{EngineKind::kExternalProcess, EngineTier::kHigh}};
  if (engine == "software") return {{EngineKind::kSoftwareEncoder, EngineTier::kMid}};
  if (engine == "recorder") {
    return {{EngineKind::kSandboxedRecorder, EngineTier::kHigh},
            {EngineKind::kSandboxedRecorder, EngineTier::kBaseline}};
  }
  return {};
}

// The export host is installed next to this binary unless overridden.
void ResolveHostBinary(reelforge::pipeline::ExportPipelineConfig* config) {
  if (std::getenv("REELFORGE_HOST_PATH") != nullptr) return;
  std::error_code ec;
  auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec) return;
  auto sibling = self.parent_path() / "reelforge_export_host";
  if (std::filesystem::exists(sibling, ec)) {
    config->host_binary_path = sibling.string();
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  auto config = reelforge::pipeline::ExportPipelineConfig::FromEnvironment();
  ResolveHostBinary(&config);

  reelforge::runtime::ExportCoordinator coordinator(
      config, reelforge::runtime::DefaultServices(config));

  reelforge::runtime::ExportRequest request;
  request.settings = args.settings;
  request.elements = BuildTimeline(args);
  request.preferred_order = EngineOrderFor(args.engine);
  if (!args.quiet) {
    request.on_progress = [](double progress, JobState state) {
      std::cout << "[reelforge_export] " << reelforge::pipeline::JobStateToString(state)
                << " " << std::fixed << std::setprecision(1) << progress * 100.0 << "%"
                << std::endl;
    };
  }

  auto submitted = coordinator.Submit(std::move(request));
  if (!submitted.accepted) {
    std::cerr << "Error: export refused: " << submitted.message << "\n";
    return 1;
  }

  bool interrupted = false;
  while (true) {
    auto state = coordinator.GetState(submitted.job_id);
    if (!state || reelforge::pipeline::IsTerminal(*state)) break;
    if (!interrupted && g_termination_requested.load(std::memory_order_acquire)) {
      std::cerr << "\n[reelforge_export] interrupted, cancelling job " << submitted.job_id
                << "...\n";
      interrupted = true;
      coordinator.Cancel(submitted.job_id);
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  auto result = coordinator.Wait(submitted.job_id);
  coordinator.Shutdown();

  for (const auto& warning : result.warnings) {
    std::cerr << "[reelforge_export] warning: " << warning.element_id << ": "
              << warning.message << "\n";
  }

  switch (result.state) {
    case JobState::kCompleted:
      std::cout << "[reelforge_export] wrote " << result.output_path << " using "
                << result.backend << (result.HasGaps() ? " (with gaps)" : "") << "\n";
      return 0;
    case JobState::kCancelled:
      std::cerr << "[reelforge_export] cancelled\n";
      return interrupted ? 130 : 1;
    default:
      std::cerr << "[reelforge_export] failed ("
                << reelforge::pipeline::ExportErrorToString(result.error)
                << "): " << result.message << "\n";
      if (!result.diagnostic.empty()) {
        std::cerr << result.diagnostic << "\n";
      }
      return 1;
  }
}
