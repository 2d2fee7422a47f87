// Repository: ReelForge
// Component: Capture Stream Builder
// Purpose: Combines Frame Source and Audio Mixer output into the shape a
//          backend consumes.
// Copyright (c) 2025 ReelForge

#include "reelforge/capture/CaptureStreamBuilder.hpp"

#include <algorithm>
#include <cinttypes>
#include <cmath>
#include <cstdio>
#include <filesystem>

#include "reelforge/audio/WavWriter.hpp"
#include "reelforge/util/Logger.hpp"

namespace reelforge::capture {

using pipeline::EncodedFrame;
using pipeline::kMixSampleRate;
using pipeline::PcmBuffer;

namespace {

constexpr int64_t kNanosPerSecond = 1'000'000'000;
constexpr auto kPacingSlice = std::chrono::milliseconds(5);
constexpr int64_t kWavBlockFrames = kMixSampleRate;

int64_t AudioFrameCount(const pipeline::ExportSettings& settings,
                        const audio::AudioMixer* mixer) {
  if (mixer) return mixer->OutputFrameCount();
  return static_cast<int64_t>(std::llround(settings.duration_seconds * kMixSampleRate));
}

PcmBuffer MixWindow(const audio::AudioMixer* mixer, const AudioWindow& w) {
  if (mixer) return mixer->MixFrames(w.start_frame, w.end_frame);
  PcmBuffer silent;
  if (w.end_frame > w.start_frame) {
    silent.samples.assign(
        static_cast<size_t>(w.end_frame - w.start_frame) * pipeline::kMixChannels, 0.0f);
  }
  return silent;
}

}  // namespace

AudioWindow AudioWindowForFrame(int64_t index, int64_t total_video_frames, int fps,
                                int64_t total_audio_frames) {
  AudioWindow w;
  w.start_frame = std::min(total_audio_frames, (index * kMixSampleRate) / fps);
  if (index + 1 >= total_video_frames) {
    w.end_frame = total_audio_frames;
  } else {
    w.end_frame = std::min(total_audio_frames, ((index + 1) * kMixSampleRate) / fps);
  }
  w.end_frame = std::max(w.start_frame, w.end_frame);
  return w;
}

// =============================================================================
// FrameSequence
// =============================================================================

FrameSequence::FrameSequence(const pipeline::ExportSettings& settings,
                             frame::FrameSource* frames, const audio::AudioMixer* mixer)
    : settings_(settings),
      frames_(frames),
      mixer_(mixer),
      total_frames_(settings.TotalFrames()),
      total_audio_frames_(AudioFrameCount(settings, mixer)) {}

bool FrameSequence::Next(EncodedFrame* frame, PcmBuffer* audio) {
  if (!HasNext()) return false;
  const int64_t i = next_index_++;

  *audio = MixWindow(mixer_, AudioWindowForFrame(i, total_frames_, settings_.fps,
                                                 total_audio_frames_));

  frame->index = i;
  frame->timestamp_seconds = settings_.FrameTimestamp(i);
  frame->pixels = &frames_->RenderFrame(frame->timestamp_seconds);
  return true;
}

// =============================================================================
// LiveCaptureStream
// =============================================================================

LiveCaptureStream::LiveCaptureStream(const pipeline::ExportSettings& settings,
                                     frame::FrameSource* frames,
                                     audio::LiveAudioGraph* graph)
    : settings_(settings),
      frames_(frames),
      graph_(graph),
      total_frames_(settings.TotalFrames()) {}

LiveCaptureStream::~LiveCaptureStream() {
  Stop();
}

bool LiveCaptureStream::Start(TickSink sink) {
  if (thread_.joinable()) return false;
  sink_ = std::move(sink);
  stop_requested_.store(false, std::memory_order_release);
  finished_.store(false, std::memory_order_release);
  frames_pushed_.store(0, std::memory_order_release);
  start_time_ = std::chrono::steady_clock::now();
  thread_ = std::thread(&LiveCaptureStream::Run, this);
  return true;
}

void LiveCaptureStream::Run() {
  const int64_t fps = settings_.fps;
  for (int64_t i = 0; i < total_frames_; ++i) {
    const auto deadline =
        start_time_ + std::chrono::nanoseconds((i * kNanosPerSecond) / fps);
    while (!stop_requested_.load(std::memory_order_acquire)) {
      auto now = std::chrono::steady_clock::now();
      if (now >= deadline) break;
      std::this_thread::sleep_for(
          std::min<std::chrono::steady_clock::duration>(deadline - now, kPacingSlice));
    }
    if (stop_requested_.load(std::memory_order_acquire)) break;

    const double tick_end = (i + 1 >= total_frames_)
                                ? settings_.duration_seconds
                                : settings_.FrameTimestamp(i + 1);
    PcmBuffer pcm = graph_ ? graph_->Pull(tick_end) : PcmBuffer{};

    EncodedFrame frame;
    frame.index = i;
    frame.timestamp_seconds = settings_.FrameTimestamp(i);
    frame.pixels = &frames_->RenderFrame(frame.timestamp_seconds);
    if (!sink_(frame, pcm)) break;
    frames_pushed_.fetch_add(1, std::memory_order_acq_rel);
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    finished_.store(true, std::memory_order_release);
  }
  finished_cv_.notify_all();
}

void LiveCaptureStream::Stop() {
  stop_requested_.store(true, std::memory_order_release);
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool LiveCaptureStream::WaitFinished(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return finished_cv_.wait_for(lock, timeout, [this] {
    return finished_.load(std::memory_order_acquire);
  });
}

double LiveCaptureStream::ElapsedSeconds() const {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_)
      .count();
}

// =============================================================================
// DiskCapture
// =============================================================================

DiskCapture::DiskCapture(const pipeline::ExportSettings& settings,
                         frame::FrameSource* frames, const audio::AudioMixer* mixer,
                         encode::IFrameImageWriter* writer, std::string directory)
    : settings_(settings),
      frames_(frames),
      mixer_(mixer),
      writer_(writer),
      directory_(std::move(directory)),
      total_frames_(settings.TotalFrames()) {}

std::string DiskCapture::FrameFileName(int64_t index) {
  char name[32];
  std::snprintf(name, sizeof(name), "frame-%04" PRId64 ".png", index);
  return name;
}

bool DiskCapture::WriteNextFrame(std::string* error) {
  if (!HasNext()) return false;
  const int64_t i = next_index_;
  const auto& pixels = frames_->RenderFrame(settings_.FrameTimestamp(i));
  const std::string path = (std::filesystem::path(directory_) / FrameFileName(i)).string();
  if (!writer_->WriteImage(pixels, path, error)) {
    return false;
  }
  ++next_index_;
  return true;
}

bool DiskCapture::WriteAudio(std::string* path_out, std::string* error) {
  const int64_t total_audio = AudioFrameCount(settings_, mixer_);
  const std::string path = (std::filesystem::path(directory_) / kAudioFileName).string();
  audio::WavStreamWriter wav;
  if (!wav.Open(path, kMixSampleRate, pipeline::kMixChannels, error)) return false;
  // One second of mix is resident at a time.
  for (int64_t start = 0; start < total_audio; start += kWavBlockFrames) {
    const int64_t end = std::min(total_audio, start + kWavBlockFrames);
    if (!wav.Append(MixWindow(mixer_, AudioWindow{start, end}), error)) return false;
  }
  if (!wav.Finish(error)) return false;
  if (path_out) *path_out = path;
  return true;
}

// =============================================================================
// CaptureStreamBuilder
// =============================================================================

CaptureStreamBuilder::CaptureStreamBuilder(const pipeline::ExportSettings& settings,
                                           frame::FrameSource* frames,
                                           audio::AudioMixer* mixer)
    : settings_(settings), frames_(frames), mixer_(mixer) {}

std::unique_ptr<FrameSequence> CaptureStreamBuilder::BuildFrameSequence() const {
  return std::make_unique<FrameSequence>(settings_, frames_, mixer_);
}

std::unique_ptr<LiveCaptureStream> CaptureStreamBuilder::BuildLiveStream(
    audio::LiveAudioGraph* graph) const {
  if (mixer_ && !mixer_->AttachToLiveGraph(graph)) {
    util::Logger::Error("[CaptureStreamBuilder] mixer not prepared; live graph not attached");
    return nullptr;
  }
  if (!mixer_ && graph) {
    // No mixer: the graph renders silence for the whole duration.
    const int64_t total = AudioFrameCount(settings_, nullptr);
    graph->Connect(
        [](int64_t start_frame, int64_t end_frame) {
          return MixWindow(nullptr, AudioWindow{start_frame, end_frame});
        },
        total);
  }
  return std::make_unique<LiveCaptureStream>(settings_, frames_, graph);
}

std::unique_ptr<DiskCapture> CaptureStreamBuilder::BuildDiskCapture(
    const std::string& directory, encode::IFrameImageWriter* writer) const {
  return std::make_unique<DiskCapture>(settings_, frames_, mixer_, writer, directory);
}

}  // namespace reelforge::capture
