// Repository: ReelForge
// Component: Audio Mixer
// Purpose: Schedules every audio-bearing element on the export timeline and
//          renders the mix as PCM ranges or into a live graph.
// Copyright (c) 2025 ReelForge

#include "reelforge/audio/AudioMixer.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <sstream>
#include <thread>

#include "reelforge/util/Logger.hpp"

namespace reelforge::audio {

using pipeline::EngineStatus;
using pipeline::ExportError;
using pipeline::ExportWarning;
using pipeline::kMixChannels;
using pipeline::kMixSampleRate;
using pipeline::PcmBuffer;
using pipeline::TimelineElement;

namespace {

constexpr auto kWaitSlice = std::chrono::milliseconds(20);

int64_t SecondsToFrames(double seconds) {
  return static_cast<int64_t>(std::llround(seconds * kMixSampleRate));
}

}  // namespace

AudioMixer::AudioMixer(MixerConfig config,
                       std::shared_ptr<IAudioDecoder> decoder,
                       std::shared_ptr<AudioDecodeCache> cache,
                       pipeline::SourceResolver resolver)
    : config_(config),
      decoder_(std::move(decoder)),
      cache_(std::move(cache)),
      resolver_(std::move(resolver)) {}

AudioMixer::~AudioMixer() {
  Release();
}

DecodeWindow AudioMixer::SourceWindowFor(const TimelineElement& element,
                                         double job_duration_seconds) {
  const double trim = std::max(0.0, element.trim_in);
  // A clip starting before zero is cut at the job start.
  const double lead = std::max(0.0, -element.start_time);
  const double playing =
      std::min(element.duration, job_duration_seconds - element.start_time) - lead;
  DecodeWindow window;
  window.start_seconds = trim + lead;
  window.duration_seconds = std::max(0.0, playing);
  return window;
}

AudioMixer::DecodeOutcome AudioMixer::DecodeWithTimeout(
    const TimelineElement& element, const pipeline::ResolvedSource& source,
    const DecodeWindow& window, const std::atomic<bool>* cancel) {
  DecodeOutcome outcome;
  std::atomic<bool> abort{false};
  std::mutex done_mutex;
  std::condition_variable done_cv;
  bool done = false;

  auto decode_fn = [this, &source, &window, &abort](DecodedAudio* out, std::string* error) {
    if (!decoder_) {
      *error = "no audio decoder available";
      return false;
    }
    return decoder_->Decode(source, window, abort, out, error);
  };

  std::thread worker([&]() {
    std::string error;
    std::shared_ptr<const DecodedAudio> audio;
    if (cache_) {
      audio = cache_->GetOrDecode(element.source_ref, window, abort, decode_fn, &error);
    } else {
      auto decoded = std::make_shared<DecodedAudio>();
      if (decode_fn(decoded.get(), &error)) audio = decoded;
    }
    std::lock_guard<std::mutex> lock(done_mutex);
    outcome.audio = std::move(audio);
    outcome.error = std::move(error);
    done = true;
    done_cv.notify_all();
  });

  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(config_.decode_timeout_ms);
  {
    std::unique_lock<std::mutex> lock(done_mutex);
    while (!done) {
      if (cancel && cancel->load(std::memory_order_acquire)) {
        outcome.cancelled = true;
        break;
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        outcome.timed_out = true;
        break;
      }
      done_cv.wait_for(lock, kWaitSlice);
    }
  }

  if (outcome.timed_out || outcome.cancelled) {
    abort.store(true, std::memory_order_release);
  }
  worker.join();

  if (outcome.timed_out || outcome.cancelled) {
    // A decode that raced past the deadline is discarded all the same.
    outcome.audio.reset();
  }
  return outcome;
}

EngineStatus AudioMixer::Prepare(const std::vector<TimelineElement>& elements,
                                 double job_duration_seconds,
                                 const std::atomic<bool>* cancel) {
  Release();
  job_duration_ = std::max(0.0, job_duration_seconds);
  warnings_.clear();

  for (const auto& element : elements) {
    if (!element.HasAudio() || element.muted || element.duration <= 0.0) continue;
    if (element.start_time >= job_duration_) continue;

    if (cancel && cancel->load(std::memory_order_acquire)) {
      Release();
      return EngineStatus::Failure(ExportError::kCancelled, "audio preparation cancelled");
    }

    AudioSourceHandle handle;
    handle.element_id = element.id;
    handle.scheduled_start = element.start_time;
    handle.clip_duration = element.duration;
    handle.trim_in = std::max(0.0, element.trim_in);
    handle.gain = std::clamp(element.volume, 0.0, 1.0);
    handle.pan = std::clamp(element.pan, -1.0, 1.0);

    std::string failure;
    std::optional<pipeline::ResolvedSource> source =
        resolver_ ? resolver_(element.source_ref) : std::nullopt;
    if (!source) {
      failure = "source '" + element.source_ref + "' could not be resolved";
    } else {
      DecodeOutcome outcome = DecodeWithTimeout(
          element, *source, SourceWindowFor(element, job_duration_), cancel);
      if (outcome.cancelled) {
        Release();
        return EngineStatus::Failure(ExportError::kCancelled,
                                     "audio preparation cancelled");
      }
      if (outcome.timed_out) {
        failure = "decode exceeded " + std::to_string(config_.decode_timeout_ms) + " ms";
      } else if (!outcome.audio) {
        failure = outcome.error.empty() ? "decode failed" : outcome.error;
      } else {
        handle.decoded = outcome.audio;
      }
    }

    if (!failure.empty()) {
      if (config_.fail_on_decode_error) {
        util::Logger::Error("[AudioMixer] element=" + element.id +
                            " decode failed (strict): " + failure);
        Release();
        return EngineStatus::Failure(ExportError::kSourceDecode,
                                     "audio source '" + element.id + "' failed to decode",
                                     failure);
      }
      util::Logger::Warn("[AudioMixer] element=" + element.id +
                         " degraded to silence: " + failure);
      warnings_.push_back(ExportWarning{element.id, ExportError::kSourceDecode,
                                        "audio replaced with silence: " + failure});
    }
    handles_.push_back(std::move(handle));
  }

  prepared_ = true;
  std::ostringstream oss;
  oss << "[AudioMixer] prepared sources=" << handles_.size()
      << " degraded=" << warnings_.size() << " duration=" << job_duration_ << "s";
  util::Logger::Info(oss.str());
  return EngineStatus::Success();
}

int64_t AudioMixer::OutputFrameCount() const {
  return SecondsToFrames(job_duration_);
}

double AudioMixer::ContentDurationSeconds() const {
  double latest = 0.0;
  for (const auto& h : handles_) {
    latest = std::max(latest, h.scheduled_start + h.clip_duration);
  }
  return std::min(job_duration_, latest);
}

PcmBuffer AudioMixer::MixRange(double start_seconds, double end_seconds) const {
  return MixFrames(SecondsToFrames(start_seconds), SecondsToFrames(end_seconds));
}

PcmBuffer AudioMixer::MixFrames(int64_t start_frame, int64_t end_frame) const {
  PcmBuffer out;
  out.sample_rate = kMixSampleRate;
  out.channels = kMixChannels;
  start_frame = std::max<int64_t>(0, start_frame);
  if (end_frame <= start_frame) return out;
  out.samples.assign(static_cast<size_t>(end_frame - start_frame) * kMixChannels, 0.0f);

  for (const auto& h : handles_) {
    if (!h.decoded) continue;
    const auto& src = h.decoded->pcm;
    const int64_t src_frames = static_cast<int64_t>(src.FrameCount());
    const int64_t sched = SecondsToFrames(h.scheduled_start);
    const int64_t len = SecondsToFrames(h.clip_duration);
    const int64_t trim = SecondsToFrames(h.trim_in);
    // The decoded span may begin after the source start.
    const int64_t origin = SecondsToFrames(h.decoded->start_seconds);

    const int64_t lo = std::max(start_frame, sched);
    const int64_t hi = std::min(end_frame, sched + len);
    if (lo >= hi) continue;

    // Linear pan: the far channel is attenuated, centre leaves both at gain.
    const float gain_l = static_cast<float>(h.gain * (h.pan > 0.0 ? 1.0 - h.pan : 1.0));
    const float gain_r = static_cast<float>(h.gain * (h.pan < 0.0 ? 1.0 + h.pan : 1.0));

    for (int64_t n = lo; n < hi; ++n) {
      const int64_t s = n - sched + trim - origin;
      if (s < 0) continue;
      if (s >= src_frames) break;
      const size_t dst = static_cast<size_t>(n - start_frame) * kMixChannels;
      const size_t idx = static_cast<size_t>(s) * kMixChannels;
      out.samples[dst] += src.samples[idx] * gain_l;
      out.samples[dst + 1] += src.samples[idx + 1] * gain_r;
    }
  }

  const float master = static_cast<float>(config_.master_gain);
  for (float& sample : out.samples) {
    sample = std::clamp(sample * master, -1.0f, 1.0f);
  }
  return out;
}

bool AudioMixer::AttachToLiveGraph(LiveAudioGraph* destination) {
  if (!prepared_ || destination == nullptr) return false;
  destination->Connect(
      [this](int64_t start_frame, int64_t end_frame) {
        return MixFrames(start_frame, end_frame);
      },
      OutputFrameCount());
  live_graph_ = destination;
  return true;
}

void AudioMixer::DetachLiveGraph() {
  if (live_graph_) {
    live_graph_->Release();
    live_graph_ = nullptr;
  }
}

void AudioMixer::Release() {
  DetachLiveGraph();
  handles_.clear();
  prepared_ = false;
}

}  // namespace reelforge::audio
