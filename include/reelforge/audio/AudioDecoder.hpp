// Repository: ReelForge
// Component: Audio Decoder
// Purpose: Decodes an audio-bearing source to 48 kHz float stereo PCM.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_AUDIO_AUDIO_DECODER_HPP_
#define REELFORGE_AUDIO_AUDIO_DECODER_HPP_

#include <atomic>
#include <string>

#include "reelforge/pipeline/ExportTypes.hpp"

namespace reelforge::audio {

// Span of source time a decode must produce. A negative duration runs to
// the end of the source.
struct DecodeWindow {
  double start_seconds = 0.0;
  double duration_seconds = -1.0;

  bool ToEnd() const { return duration_seconds < 0.0; }
  // +infinity when ToEnd().
  double EndSeconds() const;
  // True when `other` lies inside this window.
  bool Covers(const DecodeWindow& other) const;
};

// Decoded span of a source at the mix format. Immutable once cached.
struct DecodedAudio {
  // Source time of the first frame in `pcm`.
  double start_seconds = 0.0;
  pipeline::PcmBuffer pcm;
  // What the decode was asked for. `pcm` ends early when the source does,
  // in which case `reached_end` is set.
  DecodeWindow window;
  bool reached_end = false;

  // True when every frame of `request` is either in `pcm` or past the end
  // of the source.
  bool Covers(const DecodeWindow& request) const;
  size_t ByteSize() const { return pcm.samples.size() * sizeof(float); }
};

// IAudioDecoder turns the `window` span of one resolved source into PCM at
// the mix format, filling `out->start_seconds`, `out->window` and
// `out->reached_end`. Implementations must check `abort` between packets
// and return false promptly once it is raised; the mixer joins the decode
// thread after raising it, so a decoder that ignores the flag stalls
// Prepare().
class IAudioDecoder {
 public:
  virtual ~IAudioDecoder() = default;

  virtual bool Decode(const pipeline::ResolvedSource& source,
                      const DecodeWindow& window,
                      const std::atomic<bool>& abort,
                      DecodedAudio* out,
                      std::string* error) = 0;
};

// libavformat/libavcodec decoder with libswresample conversion. Seeks to
// the window start and stops reading once the window end was produced.
class FFmpegAudioDecoder : public IAudioDecoder {
 public:
  FFmpegAudioDecoder() = default;
  ~FFmpegAudioDecoder() override = default;

  bool Decode(const pipeline::ResolvedSource& source,
              const DecodeWindow& window,
              const std::atomic<bool>& abort,
              DecodedAudio* out,
              std::string* error) override;
};

}  // namespace reelforge::audio

#endif  // REELFORGE_AUDIO_AUDIO_DECODER_HPP_
