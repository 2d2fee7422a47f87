// Repository: ReelForge
// Component: Audio Mixer
// Purpose: Schedules every audio-bearing element on the export timeline and
//          renders the mix as PCM ranges or into a live graph.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_AUDIO_AUDIO_MIXER_HPP_
#define REELFORGE_AUDIO_AUDIO_MIXER_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "reelforge/audio/AudioDecodeCache.hpp"
#include "reelforge/audio/AudioDecoder.hpp"
#include "reelforge/audio/LiveAudioGraph.hpp"
#include "reelforge/pipeline/ExportTypes.hpp"

namespace reelforge::audio {

// One scheduled source. `decoded` is null when the source degraded to
// silence; its window then contributes nothing.
struct AudioSourceHandle {
  std::string element_id;
  std::shared_ptr<const DecodedAudio> decoded;
  double scheduled_start = 0.0;
  double clip_duration = 0.0;
  double trim_in = 0.0;
  double gain = 1.0;
  double pan = 0.0;
};

struct MixerConfig {
  int decode_timeout_ms = 10000;
  bool fail_on_decode_error = false;
  double master_gain = 1.0;
};

// AudioMixer
//
// Prepare() decodes the part of every audio-bearing element's source that
// plays inside the job (through the shared cache when one is given). Each decode runs on its own thread bounded by
// `decode_timeout_ms`; a source that fails or times out keeps its handle
// with no samples and is recorded as a warning. In strict mode the first
// such failure fails Prepare() instead.
//
// Mixing: for every handle overlapping the requested range, gain-scaled
// (and panned) samples are summed at their timeline offset, master gain is
// applied and the result is clipped to [-1, 1]. Output always spans the
// requested range; positions with no source are silence, so a job with no
// audio elements still yields a silent track of the full job duration.
//
// Thread safety: Prepare() and Release() from the owning thread only.
// MixRange()/MixFrames() are const and may run concurrently once prepared.
class AudioMixer {
 public:
  AudioMixer(MixerConfig config,
             std::shared_ptr<IAudioDecoder> decoder,
             std::shared_ptr<AudioDecodeCache> cache,
             pipeline::SourceResolver resolver);
  ~AudioMixer();

  AudioMixer(const AudioMixer&) = delete;
  AudioMixer& operator=(const AudioMixer&) = delete;

  // Source span an element plays within a job of `job_duration_seconds`.
  static DecodeWindow SourceWindowFor(const pipeline::TimelineElement& element,
                                      double job_duration_seconds);

  // Fails only in strict mode (kSourceDecode) or when `cancel` is raised
  // (kCancelled). Decode threads are joined before returning either way.
  pipeline::EngineStatus Prepare(const std::vector<pipeline::TimelineElement>& elements,
                                 double job_duration_seconds,
                                 const std::atomic<bool>* cancel = nullptr);

  pipeline::PcmBuffer MixRange(double start_seconds, double end_seconds) const;
  pipeline::PcmBuffer MixFrames(int64_t start_frame, int64_t end_frame) const;

  // Binds this mixer as `destination`'s render function for the whole job
  // duration. Returns false before Prepare() succeeded.
  bool AttachToLiveGraph(LiveAudioGraph* destination);

  // Disconnects the attached graph, if any. The graph may be destroyed
  // afterwards.
  void DetachLiveGraph();

  // Detaches any live graph and drops decoded buffers. Idempotent.
  void Release();

  bool prepared() const { return prepared_; }
  double OutputDurationSeconds() const { return job_duration_; }
  int64_t OutputFrameCount() const;
  // min(job duration, latest end of any scheduled audio element)
  double ContentDurationSeconds() const;

  const std::vector<AudioSourceHandle>& sources() const { return handles_; }
  const std::vector<pipeline::ExportWarning>& warnings() const { return warnings_; }

 private:
  struct DecodeOutcome {
    std::shared_ptr<const DecodedAudio> audio;
    std::string error;
    bool timed_out = false;
    bool cancelled = false;
  };

  DecodeOutcome DecodeWithTimeout(const pipeline::TimelineElement& element,
                                  const pipeline::ResolvedSource& source,
                                  const DecodeWindow& window,
                                  const std::atomic<bool>* cancel);

  MixerConfig config_;
  std::shared_ptr<IAudioDecoder> decoder_;
  std::shared_ptr<AudioDecodeCache> cache_;
  pipeline::SourceResolver resolver_;

  std::vector<AudioSourceHandle> handles_;
  std::vector<pipeline::ExportWarning> warnings_;
  double job_duration_ = 0.0;
  bool prepared_ = false;
  LiveAudioGraph* live_graph_ = nullptr;
};

}  // namespace reelforge::audio

#endif  // REELFORGE_AUDIO_AUDIO_MIXER_HPP_
