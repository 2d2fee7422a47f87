// Repository: ReelForge
// Component: External Process Engine
// Purpose: Renders frames to disk and drives the native encoder through
//          the reelforge_export_host subprocess.
// Copyright (c) 2025 ReelForge

#include "reelforge/engine/ExternalProcessEngine.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sstream>

#include <poll.h>

#include "export_host.pb.h"
#include "reelforge/capture/CaptureStreamBuilder.hpp"
#include "reelforge/ipc/ExportHostChannel.hpp"
#include "reelforge/util/Logger.hpp"

namespace reelforge::engine {

using pipeline::EngineStatus;
using pipeline::ExportError;
using pipeline::JobState;

namespace {

constexpr int kPollIntervalMs = 50;

std::string JobTag(uint64_t job_id) {
  return "job" + std::to_string(job_id);
}

}  // namespace

ExternalProcessEngine::ExternalProcessEngine(ExternalProcessOptions options,
                                             FrameImageWriterFactory writer_factory)
    : options_(std::move(options)), writer_factory_(std::move(writer_factory)) {}

ExternalProcessEngine::~ExternalProcessEngine() {
  Release();
}

EngineStatus ExternalProcessEngine::Initialize(const pipeline::ExportSettings& settings) {
  if (!util::IsExecutableOnPath(options_.host_binary_path)) {
    return EngineStatus::Failure(ExportError::kEngineInitialization,
                                 "export host not found: " + options_.host_binary_path);
  }
  if (!util::IsExecutableOnPath(options_.encoder_binary_path)) {
    return EngineStatus::Failure(ExportError::kEngineInitialization,
                                 "encoder binary not found: " + options_.encoder_binary_path);
  }
  writer_ = writer_factory_ ? writer_factory_() : nullptr;
  if (!writer_) {
    return EngineStatus::Failure(ExportError::kEngineInitialization,
                                 "no frame image writer available");
  }
  cancel_requested_.store(false, std::memory_order_release);

  std::ostringstream oss;
  oss << "[ExternalProcessEngine] initialized host=" << options_.host_binary_path
      << " encoder=" << options_.encoder_binary_path << " " << settings.width << "x"
      << settings.height << "@" << settings.fps;
  util::Logger::Info(oss.str());
  return EngineStatus::Success();
}

EngineStatus ExternalProcessEngine::Encode(EngineContext& ctx) {
  if (!writer_) {
    return EngineStatus::Failure(ExportError::kEngineInitialization,
                                 "external engine used before Initialize()");
  }

  std::string error;
  if (!temp_dir_.Create(options_.temp_root, JobTag(ctx.job_id), &error)) {
    return EngineStatus::Failure(ExportError::kIo, "cannot create job directory", error);
  }
  frame_dir_ = (std::filesystem::path(temp_dir_.path()) / "frames").string();
  std::error_code ec;
  std::filesystem::create_directories(frame_dir_, ec);
  if (ec) {
    return Teardown(EngineStatus::Failure(ExportError::kIo,
                                          "cannot create frame directory", ec.message()));
  }

  capture::DiskCapture disk(ctx.settings, ctx.frames, ctx.mixer, writer_.get(), frame_dir_);
  const double total = static_cast<double>(std::max<int64_t>(disk.total_frames(), 1));
  frames_written_ = 0;
  // Stream copy takes the video from the sources; only the mix is rendered.
  const bool copy = !ctx.stream_copy_segments.empty();
  while (!copy && disk.HasNext()) {
    EngineStatus interrupted = CheckInterrupted(ctx, cancel_requested_);
    if (!interrupted.ok) return Teardown(interrupted);
    if (!disk.WriteNextFrame(&error)) {
      return Teardown(EngineStatus::Failure(
          ExportError::kIo, "cannot write frame " + std::to_string(disk.next_index()),
          error));
    }
    ++frames_written_;
    ctx.ReportProgress(JobState::kEncoding, frames_written_ / total);
  }

  if (!disk.WriteAudio(&audio_path_, &error)) {
    return Teardown(EngineStatus::Failure(ExportError::kIo, "cannot write audio mix", error));
  }
  temp_output_path_ =
      (std::filesystem::path(temp_dir_.path()) /
       (std::string("output") + pipeline::ContainerExtension(ctx.settings.format)))
          .string();

  std::ostringstream oss;
  if (copy) {
    oss << "stream copy of " << ctx.stream_copy_segments.size() << " segment(s), mix at "
        << audio_path_;
  } else {
    oss << "wrote " << frames_written_ << " frames to " << frame_dir_;
  }
  util::JobLog("ExternalProcessEngine", ctx.job_id).Info(oss.str());
  ctx.ReportProgress(JobState::kEncoding, 1.0);
  return EngineStatus::Success();
}

EngineStatus ExternalProcessEngine::Mux(EngineContext& ctx) {
  if (!temp_dir_.IsValid()) {
    return EngineStatus::Failure(ExportError::kIo, "no rendered frames to encode");
  }
  EngineStatus status = RunHost(ctx);
  if (!status.ok) return Teardown(status);

  status = DeliverOutputFile(temp_output_path_, ctx.settings.output_path);
  if (!status.ok) return Teardown(status);

  ctx.ReportProgress(JobState::kMuxing, 1.0);
  Release();
  return EngineStatus::Success();
}

EngineStatus ExternalProcessEngine::RunHost(EngineContext& ctx) {
  const util::JobLog job_log("ExternalProcessEngine", ctx.job_id);
  util::SpawnOptions spawn;
  spawn.argv = {options_.host_binary_path};
  spawn.new_process_group = true;

  std::string error;
  host_ = util::ChildProcess::Spawn(spawn, &error);
  if (!host_) {
    return EngineStatus::Failure(ExportError::kSubprocessFailure,
                                 "cannot start export host", error);
  }

  exporthost::EncodeRequest request;
  request.set_session_id(JobTag(ctx.job_id));
  request.set_frame_dir(frame_dir_);
  request.set_frame_count(ctx.stream_copy_segments.empty() ? ctx.settings.TotalFrames() : 0);
  for (const auto& path : ctx.stream_copy_segments) {
    request.add_copy_segments()->set_path(path);
  }
  auto* audio = request.add_audio_files();
  audio->set_path(audio_path_);
  audio->set_start_offset_seconds(0.0);
  request.set_width(ctx.settings.width);
  request.set_height(ctx.settings.height);
  request.set_fps(ctx.settings.fps);
  request.set_quality_preset(pipeline::QualityPresetToString(ctx.settings.quality));
  request.set_format(pipeline::ContainerFormatToString(ctx.settings.format));
  request.set_output_path(temp_output_path_);
  request.set_duration_seconds(ctx.settings.duration_seconds);
  request.set_encoder_path(options_.encoder_binary_path);

  if (!ipc::WriteMessage(host_->stdin_fd(), request, &error)) {
    std::string host_stderr;
    host_->Terminate();
    util::DrainFd(host_->stderr_fd(), &host_stderr);
    host_.reset();
    return EngineStatus::Failure(ExportError::kSubprocessFailure,
                                 "cannot send encode request: " + error, host_stderr);
  }
  host_->CloseStdin();

  ipc::MessageFrameReader reader;
  exporthost::HostMessage message;
  exporthost::HostResult result;
  bool have_result = false;
  std::string stderr_tail;
  bool stdout_open = true;
  bool stderr_open = true;
  const double total_frames =
      static_cast<double>(std::max<int64_t>(ctx.settings.TotalFrames(), 1));

  auto abort_host = [this, &stderr_tail](EngineStatus status) {
    host_->Terminate();
    host_.reset();
    if (status.diagnostic.empty()) status.diagnostic = stderr_tail;
    return status;
  };

  while (stdout_open || stderr_open) {
    EngineStatus interrupted = CheckInterrupted(ctx, cancel_requested_);
    if (!interrupted.ok) {
      job_log.Info("killing export host: " + interrupted.message);
      return abort_host(interrupted);
    }

    struct pollfd fds[2];
    fds[0].fd = stdout_open ? host_->stdout_fd() : -1;
    fds[0].events = POLLIN;
    fds[0].revents = 0;
    fds[1].fd = stderr_open ? host_->stderr_fd() : -1;
    fds[1].events = POLLIN;
    fds[1].revents = 0;
    int ready = poll(fds, 2, kPollIntervalMs);
    if (ready < 0 && errno != EINTR) {
      return abort_host(EngineStatus::Failure(ExportError::kSubprocessFailure,
                                              std::string("poll failed: ") +
                                                  std::strerror(errno)));
    }
    if (ready <= 0) continue;

    if (stderr_open && fds[1].revents != 0) {
      std::string chunk;
      stderr_open = util::DrainFd(host_->stderr_fd(), &chunk);
      util::AppendTail(&stderr_tail, chunk);
    }
    if (stdout_open && fds[0].revents != 0) {
      std::string chunk;
      stdout_open = util::DrainFd(host_->stdout_fd(), &chunk);
      reader.Append(chunk);
      for (;;) {
        auto next = reader.Next(&message);
        if (next == ipc::MessageFrameReader::Status::kNeedMore) break;
        if (next == ipc::MessageFrameReader::Status::kMalformed) {
          return abort_host(EngineStatus::Failure(ExportError::kSubprocessFailure,
                                                  "malformed message from export host"));
        }
        if (message.has_progress()) {
          const double fraction =
              static_cast<double>(message.progress().frame()) / total_frames;
          ctx.ReportProgress(JobState::kMuxing, std::clamp(fraction, 0.0, 1.0));
        } else if (message.has_result()) {
          result = message.result();
          have_result = true;
        }
      }
    }
  }

  util::ExitStatus exit = host_->Wait();
  host_.reset();

  if (have_result && result.outcome_case() == exporthost::HostResult::kOutputPath &&
      exit.Succeeded()) {
    job_log.Info("export host finished");
    return EngineStatus::Success();
  }

  std::string message_text;
  std::string diagnostic = stderr_tail;
  if (have_result && result.outcome_case() == exporthost::HostResult::kError) {
    message_text = "export failed: " + result.error();
    if (!result.diagnostic().empty()) diagnostic = result.diagnostic();
  } else {
    message_text = "export host exited without a result (" + exit.Describe() + ")";
  }
  job_log.Error(message_text);
  return EngineStatus::Failure(ExportError::kSubprocessFailure, message_text, diagnostic);
}

void ExternalProcessEngine::Cancel() {
  cancel_requested_.store(true, std::memory_order_release);
}

EngineStatus ExternalProcessEngine::Teardown(EngineStatus status) {
  Release();
  return status;
}

void ExternalProcessEngine::Release() {
  if (host_) {
    host_->Terminate();
    host_.reset();
  }
  if (temp_dir_.IsValid() && !temp_dir_.Remove()) {
    util::Logger::Warn("[ExternalProcessEngine] could not remove job directory " +
                       temp_dir_.path());
  }
  frame_dir_.clear();
  audio_path_.clear();
  temp_output_path_.clear();
}

}  // namespace reelforge::engine
