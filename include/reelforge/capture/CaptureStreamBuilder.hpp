// Repository: ReelForge
// Component: Capture Stream Builder
// Purpose: Combines Frame Source and Audio Mixer output into the shape a
//          backend consumes: ordered frame+PCM sequence, paced live
//          stream, or numbered files on disk.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_CAPTURE_CAPTURE_STREAM_BUILDER_HPP_
#define REELFORGE_CAPTURE_CAPTURE_STREAM_BUILDER_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "reelforge/audio/AudioMixer.hpp"
#include "reelforge/audio/LiveAudioGraph.hpp"
#include "reelforge/encode/FrameImageWriter.hpp"
#include "reelforge/frame/FrameSource.hpp"
#include "reelforge/pipeline/ExportTypes.hpp"

namespace reelforge::capture {

// Audio span that belongs to video frame `index`: [start, end) in mix-rate
// sample frames. The last frame's span runs to the end of the mix so the
// concatenated windows cover exactly the job duration.
struct AudioWindow {
  int64_t start_frame = 0;
  int64_t end_frame = 0;
};

AudioWindow AudioWindowForFrame(int64_t index, int64_t total_video_frames, int fps,
                                int64_t total_audio_frames);

// Deterministic (frame, PCM window) pairs in strictly increasing timestamp
// order. For each step the audio window is mixed before the frame is
// rendered.
class FrameSequence {
 public:
  FrameSequence(const pipeline::ExportSettings& settings, frame::FrameSource* frames,
                const audio::AudioMixer* mixer);

  int64_t total_frames() const { return total_frames_; }
  int64_t next_index() const { return next_index_; }
  bool HasNext() const { return next_index_ < total_frames_; }

  // `frame->pixels` points into the Frame Source canvas and is valid until
  // the next call.
  bool Next(pipeline::EncodedFrame* frame, pipeline::PcmBuffer* audio);

 private:
  pipeline::ExportSettings settings_;
  frame::FrameSource* frames_;
  const audio::AudioMixer* mixer_;
  int64_t total_frames_;
  int64_t total_audio_frames_;
  int64_t next_index_ = 0;
};

// LiveCaptureStream pushes frames at the target rate in real time. A paced
// thread sleeps to absolute deadlines start + i/fps (integer nanosecond
// arithmetic, no drift), pulls the audio accumulated up to the end of the
// tick from the live graph and hands both to the sink.
class LiveCaptureStream {
 public:
  // Return false to stop the stream.
  using TickSink =
      std::function<bool(const pipeline::EncodedFrame&, const pipeline::PcmBuffer&)>;

  LiveCaptureStream(const pipeline::ExportSettings& settings, frame::FrameSource* frames,
                    audio::LiveAudioGraph* graph);
  ~LiveCaptureStream();

  LiveCaptureStream(const LiveCaptureStream&) = delete;
  LiveCaptureStream& operator=(const LiveCaptureStream&) = delete;

  bool Start(TickSink sink);

  // Stops frame pushes and joins the pacing thread. Idempotent.
  void Stop();

  // Waits until every frame was pushed (or the sink refused one).
  bool WaitFinished(std::chrono::milliseconds timeout);

  bool finished() const { return finished_.load(std::memory_order_acquire); }
  int64_t frames_pushed() const { return frames_pushed_.load(std::memory_order_acquire); }
  int64_t total_frames() const { return total_frames_; }
  // Wall-clock seconds since Start().
  double ElapsedSeconds() const;

 private:
  void Run();

  pipeline::ExportSettings settings_;
  frame::FrameSource* frames_;
  audio::LiveAudioGraph* graph_;
  int64_t total_frames_;

  TickSink sink_;
  std::thread thread_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> finished_{false};
  std::atomic<int64_t> frames_pushed_{0};
  std::chrono::steady_clock::time_point start_time_;

  std::mutex mutex_;
  std::condition_variable finished_cv_;
};

// DiskCapture writes frames as frame-%04d.png (0-based) and the full mix
// as one WAV into a directory owned by the caller. The WAV is mixed and
// written one second at a time.
class DiskCapture {
 public:
  static constexpr const char* kFramePattern = "frame-%04d.png";
  static constexpr const char* kAudioFileName = "audio-mix.wav";

  DiskCapture(const pipeline::ExportSettings& settings, frame::FrameSource* frames,
              const audio::AudioMixer* mixer, encode::IFrameImageWriter* writer,
              std::string directory);

  static std::string FrameFileName(int64_t index);

  int64_t total_frames() const { return total_frames_; }
  int64_t next_index() const { return next_index_; }
  bool HasNext() const { return next_index_ < total_frames_; }
  const std::string& directory() const { return directory_; }

  bool WriteNextFrame(std::string* error);

  // Writes the mix for the whole job; `path_out` receives the file path.
  bool WriteAudio(std::string* path_out, std::string* error);

 private:
  pipeline::ExportSettings settings_;
  frame::FrameSource* frames_;
  const audio::AudioMixer* mixer_;
  encode::IFrameImageWriter* writer_;
  std::string directory_;
  int64_t total_frames_;
  int64_t next_index_ = 0;
};

// Builds the three capture shapes from one job's Frame Source and mixer.
class CaptureStreamBuilder {
 public:
  CaptureStreamBuilder(const pipeline::ExportSettings& settings, frame::FrameSource* frames,
                       audio::AudioMixer* mixer);

  std::unique_ptr<FrameSequence> BuildFrameSequence() const;

  // Attaches the mixer to `graph` and returns a stream pulling from it.
  // Returns nullptr when the mixer is not prepared.
  std::unique_ptr<LiveCaptureStream> BuildLiveStream(audio::LiveAudioGraph* graph) const;

  std::unique_ptr<DiskCapture> BuildDiskCapture(const std::string& directory,
                                                encode::IFrameImageWriter* writer) const;

 private:
  pipeline::ExportSettings settings_;
  frame::FrameSource* frames_;
  audio::AudioMixer* mixer_;
};

}  // namespace reelforge::capture

#endif  // REELFORGE_CAPTURE_CAPTURE_STREAM_BUILDER_HPP_
