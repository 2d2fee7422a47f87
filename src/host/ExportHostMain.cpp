// Repository: ReelForge
// Component: Export Host
// Purpose: Out-of-process encode host. Reads one EncodeRequest from stdin,
//          drives the encoder binary over the rendered frame sequence and
//          streams progress and the result back on stdout.
// Copyright (c) 2025 ReelForge
//
// Protocol: length-delimited messages from export_host.proto. stdin carries
// exactly one EncodeRequest; stdout carries HostMessage frames only. All
// logging (and the encoder's own stdout) goes to stderr.
//
// Exit codes: 0 success, 1 encode failure (result sent), 2 protocol error.

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include "export_host.pb.h"
#include "reelforge/ipc/EncoderArgsBuilder.hpp"
#include "reelforge/ipc/ExportHostChannel.hpp"
#include "reelforge/ipc/FfmpegProgressParser.hpp"
#include "reelforge/util/ChildProcess.hpp"
#include "reelforge/util/Logger.hpp"

namespace {

using reelforge::util::Logger;

constexpr int kPollIntervalMs = 100;

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

void InstallSignalHandlers() {
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = SignalHandler;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

// Moves the protocol channel off fd 1 so nothing else can write into it.
int DetachChannel() {
  int channel = fcntl(STDOUT_FILENO, F_DUPFD_CLOEXEC, 3);
  if (channel < 0) return -1;
  if (dup2(STDERR_FILENO, STDOUT_FILENO) < 0) {
    ::close(channel);
    return -1;
  }
  return channel;
}

class HostSession {
 public:
  explicit HostSession(int channel_fd) : channel_fd_(channel_fd) {}

  int Run();

 private:
  int Fail(const std::string& error, const std::string& diagnostic = "");
  bool WriteConcatList() const;
  bool SendProgress(const reelforge::ipc::EncoderProgress& progress);
  bool SendResult(const reelforge::exporthost::HostResult& result);
  void Log(const std::string& line) const {
    Logger::Info("[ExportHost] session=" + request_.session_id() + " " + line);
  }

  int channel_fd_;
  reelforge::exporthost::EncodeRequest request_;
  int64_t last_frame_sent_ = -1;
};

bool HostSession::SendResult(const reelforge::exporthost::HostResult& result) {
  reelforge::exporthost::HostMessage message;
  *message.mutable_result() = result;
  std::string error;
  if (!reelforge::ipc::WriteMessage(channel_fd_, message, &error)) {
    Logger::Error("[ExportHost] cannot send result: " + error);
    return false;
  }
  return true;
}

bool HostSession::SendProgress(const reelforge::ipc::EncoderProgress& progress) {
  if (progress.frame >= 0 && progress.frame == last_frame_sent_) return true;
  reelforge::exporthost::HostMessage message;
  auto* body = message.mutable_progress();
  body->set_frame(progress.frame);
  body->set_time_seconds(progress.time_seconds);
  last_frame_sent_ = progress.frame;
  std::string error;
  return reelforge::ipc::WriteMessage(channel_fd_, message, &error);
}

int HostSession::Fail(const std::string& error, const std::string& diagnostic) {
  Logger::Error("[ExportHost] session=" + request_.session_id() + " " + error);
  reelforge::exporthost::HostResult result;
  result.set_error(error);
  result.set_diagnostic(diagnostic);
  return SendResult(result) ? 1 : 2;
}

bool HostSession::WriteConcatList() const {
  std::ofstream out(reelforge::ipc::ConcatListPath(request_), std::ios::trunc);
  out << reelforge::ipc::ConcatListContent(request_);
  out.close();
  return static_cast<bool>(out);
}

int HostSession::Run() {
  bool clean_eof = false;
  std::string read_error;
  if (!reelforge::ipc::ReadMessage(STDIN_FILENO, &request_, &clean_eof, &read_error)) {
    Logger::Error("[ExportHost] no encode request: " + read_error);
    return 2;
  }

  std::string invalid = reelforge::ipc::ValidateEncodeRequest(request_);
  if (!invalid.empty()) {
    return Fail("invalid encode request: " + invalid);
  }

  if (request_.copy_segments_size() > 0) {
    std::string missing = reelforge::ipc::FindFirstMissingSegment(request_);
    if (!missing.empty()) {
      return Fail("missing copy segment " + missing);
    }
    if (request_.copy_segments_size() > 1 && !WriteConcatList()) {
      return Fail("cannot write " + reelforge::ipc::ConcatListPath(request_));
    }
  } else {
    // The encoder's image2 demuxer stops at the first gap without an error,
    // which would yield a silently truncated file.
    std::string missing =
        reelforge::ipc::FindFirstMissingFrame(request_.frame_dir(), request_.frame_count());
    if (!missing.empty()) {
      return Fail("missing frame file " + missing);
    }
  }

  reelforge::util::SpawnOptions options;
  options.argv = reelforge::ipc::BuildEncoderArgs(request_);
  // Stay in the host's group: killing the host group takes the encoder along.
  options.new_process_group = false;
  options.pipe_stdin = false;
  options.pipe_stdout = false;
  options.pipe_stderr = true;

  {
    std::ostringstream oss;
    oss << "starting encoder:";
    for (const auto& arg : options.argv) oss << " " << arg;
    Log(oss.str());
  }

  std::string spawn_error;
  auto encoder = reelforge::util::ChildProcess::Spawn(options, &spawn_error);
  if (!encoder) {
    return Fail("cannot start encoder: " + spawn_error);
  }

  reelforge::ipc::FfmpegProgressParser parser;
  std::string stderr_tail;
  bool open = true;
  while (open) {
    if (g_termination_requested.load(std::memory_order_acquire)) {
      encoder->Terminate();
      return Fail("host terminated", stderr_tail);
    }
    struct pollfd pfd;
    pfd.fd = encoder->stderr_fd();
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ready = poll(&pfd, 1, kPollIntervalMs);
    if (ready < 0 && errno != EINTR) {
      encoder->Terminate();
      return Fail(std::string("poll failed: ") + std::strerror(errno), stderr_tail);
    }
    if (ready <= 0) continue;

    std::string chunk;
    open = reelforge::util::DrainFd(encoder->stderr_fd(), &chunk);
    if (chunk.empty()) continue;
    reelforge::util::AppendTail(&stderr_tail, chunk);
    for (const auto& progress : parser.Feed(chunk)) {
      if (!SendProgress(progress)) {
        // Engine side is gone; nobody is left to deliver to.
        encoder->Terminate();
        Logger::Error("[ExportHost] channel closed, encoder stopped");
        return 2;
      }
    }
  }

  reelforge::util::ExitStatus status = encoder->Wait();
  if (!status.Succeeded()) {
    return Fail("encoder failed: " + status.Describe(), stderr_tail);
  }

  std::error_code ec;
  if (!std::filesystem::is_regular_file(request_.output_path(), ec) ||
      std::filesystem::file_size(request_.output_path(), ec) == 0) {
    return Fail("encoder produced no output at " + request_.output_path(), stderr_tail);
  }

  if (request_.copy_segments_size() > 0) {
    Log("joined " + std::to_string(request_.copy_segments_size()) + " segment(s) into " +
        request_.output_path());
  } else {
    Log("encoded " + std::to_string(request_.frame_count()) + " frames to " +
        request_.output_path());
  }
  reelforge::exporthost::HostResult result;
  result.set_output_path(request_.output_path());
  return SendResult(result) ? 0 : 2;
}

}  // namespace

int main() {
  GOOGLE_PROTOBUF_VERIFY_VERSION;
  InstallSignalHandlers();

  int channel = DetachChannel();
  if (channel < 0) {
    Logger::Error(std::string("[ExportHost] cannot set up channel: ") + std::strerror(errno));
    return 2;
  }

  HostSession session(channel);
  int rc = session.Run();
  ::close(channel);
  google::protobuf::ShutdownProtobufLibrary();
  return rc;
}
