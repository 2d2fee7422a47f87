// Repository: ReelForge
// Component: Audio Mixer Contract Tests
// Purpose: Scheduling, gain and pan, silence substitution for broken
//          sources, decode timeouts, the shared decode cache and the live
//          graph binding.
// Copyright (c) 2025 ReelForge

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "reelforge/audio/AudioDecodeCache.hpp"
#include "reelforge/audio/AudioMixer.hpp"
#include "reelforge/audio/LiveAudioGraph.hpp"
#include "fixtures/SyntheticAudioDecoder.h"

using namespace reelforge;
using pipeline::ElementKind;
using pipeline::ExportError;
using pipeline::TimelineElement;
using tests::fixtures::RampSample;
using tests::fixtures::SyntheticAudioDecoder;

namespace {

constexpr float kTolerance = 1e-4f;

audio::DecodeWindow Window(double start, double duration = -1.0) {
  audio::DecodeWindow window;
  window.start_seconds = start;
  window.duration_seconds = duration;
  return window;
}

// Decode function producing `seconds` of constant signal for `window`.
audio::AudioDecodeCache::DecodeFn ConstantDecode(const audio::DecodeWindow& window,
                                                 double seconds, bool reached_end = false) {
  return [window, seconds, reached_end](audio::DecodedAudio* out, std::string*) {
    out->start_seconds = window.start_seconds;
    out->window = window;
    out->reached_end = reached_end;
    out->pcm.samples.assign(static_cast<size_t>(seconds * pipeline::kMixSampleRate) * 2, 0.5f);
    return true;
  };
}

TimelineElement AudioClip(const std::string& id, const std::string& ref, double start,
                          double duration, double volume = 1.0) {
  TimelineElement e;
  e.id = id;
  e.kind = ElementKind::kAudio;
  e.source_ref = ref;
  e.start_time = start;
  e.duration = duration;
  e.volume = volume;
  return e;
}

class AudioMixerContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    decoder_ = std::make_shared<SyntheticAudioDecoder>();
    cache_ = std::make_shared<audio::AudioDecodeCache>();
  }

  std::unique_ptr<audio::AudioMixer> MakeMixer(audio::MixerConfig config = {}) {
    return std::make_unique<audio::AudioMixer>(config, decoder_, cache_,
                                               pipeline::FilePathResolver());
  }

  // Left/right sample of the single mixed frame at `t`.
  static std::pair<float, float> SampleAt(const audio::AudioMixer& mixer, double t) {
    const int64_t frame = static_cast<int64_t>(std::llround(t * pipeline::kMixSampleRate));
    pipeline::PcmBuffer pcm = mixer.MixFrames(frame, frame + 1);
    EXPECT_EQ(pcm.FrameCount(), 1u);
    if (pcm.FrameCount() != 1) return {0.0f, 0.0f};
    return {pcm.samples[0], pcm.samples[1]};
  }

  std::shared_ptr<SyntheticAudioDecoder> decoder_;
  std::shared_ptr<audio::AudioDecodeCache> cache_;
};

}  // namespace

// =============================================================================
// Scheduling and summing
// =============================================================================

TEST_F(AudioMixerContractTest, OverlappingClipsAreScheduledAndSummed) {
  auto mixer = MakeMixer();
  std::vector<TimelineElement> elements = {
      AudioClip("a1", "ramp:10", 0.0, 5.0),
      AudioClip("a2", "ramp:10", 2.0, 3.0, 0.5),
  };
  ASSERT_TRUE(mixer->Prepare(elements, 5.0).ok);
  EXPECT_EQ(mixer->sources().size(), 2u);
  EXPECT_TRUE(mixer->warnings().empty());

  // a1 at source time 2.5 plus a2 at source time 0.5 at half volume.
  const float expected = RampSample(2.5) + RampSample(0.5) * 0.5f;
  auto [l, r] = SampleAt(*mixer, 2.5);
  EXPECT_NEAR(l, expected, kTolerance);
  EXPECT_NEAR(r, expected, kTolerance);

  // Before a2 starts only a1 is heard.
  auto [l1, r1] = SampleAt(*mixer, 1.0);
  EXPECT_NEAR(l1, RampSample(1.0), kTolerance);
  EXPECT_NEAR(r1, RampSample(1.0), kTolerance);
}

TEST_F(AudioMixerContractTest, OutputSpansFullDurationWithTrailingSilence) {
  auto mixer = MakeMixer();
  ASSERT_TRUE(mixer->Prepare({AudioClip("a1", "const:0.5:10", 0.0, 1.0)}, 3.0).ok);

  EXPECT_EQ(mixer->OutputFrameCount(), 3 * pipeline::kMixSampleRate);
  EXPECT_DOUBLE_EQ(mixer->ContentDurationSeconds(), 1.0);

  pipeline::PcmBuffer all = mixer->MixRange(0.0, 3.0);
  EXPECT_EQ(all.FrameCount(), static_cast<size_t>(3 * pipeline::kMixSampleRate));
  EXPECT_NEAR(SampleAt(*mixer, 0.5).first, 0.5f, kTolerance);
  EXPECT_FLOAT_EQ(SampleAt(*mixer, 2.0).first, 0.0f);
}

TEST_F(AudioMixerContractTest, NoAudioElementsYieldsSilence) {
  auto mixer = MakeMixer();
  TimelineElement visual;
  visual.id = "v1";
  visual.kind = ElementKind::kVisual;
  visual.source_ref = "color:1,2,3";
  visual.duration = 2.0;
  ASSERT_TRUE(mixer->Prepare({visual}, 2.0).ok);
  EXPECT_TRUE(mixer->sources().empty());
  EXPECT_DOUBLE_EQ(mixer->ContentDurationSeconds(), 0.0);

  pipeline::PcmBuffer pcm = mixer->MixRange(0.0, 2.0);
  ASSERT_EQ(pcm.FrameCount(), static_cast<size_t>(2 * pipeline::kMixSampleRate));
  for (float s : pcm.samples) ASSERT_FLOAT_EQ(s, 0.0f);
  EXPECT_EQ(decoder_->decode_calls(), 0);
}

TEST_F(AudioMixerContractTest, SkipsMutedEmptyAndLateElements) {
  auto mixer = MakeMixer();
  TimelineElement muted = AudioClip("muted", "const:0.5:5", 0.0, 2.0);
  muted.muted = true;
  std::vector<TimelineElement> elements = {
      muted,
      AudioClip("empty", "const:0.5:5", 0.0, 0.0),
      AudioClip("late", "const:0.5:5", 4.0, 1.0),
  };
  ASSERT_TRUE(mixer->Prepare(elements, 2.0).ok);
  EXPECT_TRUE(mixer->sources().empty());
  EXPECT_EQ(decoder_->decode_calls(), 0);
}

TEST_F(AudioMixerContractTest, SumIsClippedToUnitRange) {
  auto mixer = MakeMixer();
  ASSERT_TRUE(mixer->Prepare({AudioClip("a", "const:0.8:2", 0.0, 2.0),
                              AudioClip("b", "const:0.7:2", 0.0, 2.0)},
                             2.0)
                  .ok);
  EXPECT_FLOAT_EQ(SampleAt(*mixer, 1.0).first, 1.0f);
}

TEST_F(AudioMixerContractTest, VolumeIsClampedAndPanIsLinear) {
  auto mixer = MakeMixer();
  TimelineElement right = AudioClip("right", "const:0.5:2", 0.0, 1.0, 3.0);
  right.pan = 1.0;
  TimelineElement left = AudioClip("left", "const:0.5:2", 1.0, 1.0);
  left.pan = -0.5;
  ASSERT_TRUE(mixer->Prepare({right, left}, 2.0).ok);

  auto [rl, rr] = SampleAt(*mixer, 0.5);
  EXPECT_NEAR(rl, 0.0f, kTolerance);
  EXPECT_NEAR(rr, 0.5f, kTolerance);  // volume 3.0 clamped to 1.0

  auto [ll, lr] = SampleAt(*mixer, 1.5);
  EXPECT_NEAR(ll, 0.5f, kTolerance);
  EXPECT_NEAR(lr, 0.25f, kTolerance);
}

TEST_F(AudioMixerContractTest, TrimInOffsetsSourceTime) {
  auto mixer = MakeMixer();
  TimelineElement clip = AudioClip("a", "ramp:10", 1.0, 2.0);
  clip.trim_in = 2.0;
  ASSERT_TRUE(mixer->Prepare({clip}, 3.0).ok);
  // Timeline 1.5s is 0.5s into the clip, 2.5s into the source.
  EXPECT_NEAR(SampleAt(*mixer, 1.5).first, RampSample(2.5), kTolerance);
}

// =============================================================================
// Broken sources
// =============================================================================

TEST_F(AudioMixerContractTest, FailedSourceBecomesSilenceWithWarning) {
  auto mixer = MakeMixer();
  ASSERT_TRUE(mixer->Prepare({AudioClip("broken", "fail", 0.0, 2.0),
                              AudioClip("good", "const:0.25:2", 0.0, 2.0)},
                             2.0)
                  .ok);
  ASSERT_EQ(mixer->warnings().size(), 1u);
  EXPECT_EQ(mixer->warnings()[0].element_id, "broken");
  EXPECT_EQ(mixer->warnings()[0].error, ExportError::kSourceDecode);
  EXPECT_NE(mixer->warnings()[0].message.find("audio replaced with silence"),
            std::string::npos);
  // The broken clip keeps its slot but contributes nothing.
  EXPECT_EQ(mixer->sources().size(), 2u);
  EXPECT_NEAR(SampleAt(*mixer, 1.0).first, 0.25f, kTolerance);
}

TEST_F(AudioMixerContractTest, UnresolvableSourceBecomesSilence) {
  audio::AudioMixer mixer({}, decoder_, cache_,
                          [](const std::string&) -> std::optional<pipeline::ResolvedSource> {
                            return std::nullopt;
                          });
  ASSERT_TRUE(mixer.Prepare({AudioClip("a", "const:0.5:2", 0.0, 2.0)}, 2.0).ok);
  ASSERT_EQ(mixer.warnings().size(), 1u);
  EXPECT_NE(mixer.warnings()[0].message.find("could not be resolved"), std::string::npos);
  EXPECT_EQ(decoder_->decode_calls(), 0);
}

TEST_F(AudioMixerContractTest, HangingDecodeTimesOut) {
  audio::MixerConfig config;
  config.decode_timeout_ms = 100;
  auto mixer = MakeMixer(config);

  const auto start = std::chrono::steady_clock::now();
  ASSERT_TRUE(mixer->Prepare({AudioClip("stuck", "hang", 0.0, 1.0)}, 1.0).ok);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  EXPECT_LT(elapsed, std::chrono::seconds(5));
  ASSERT_EQ(mixer->warnings().size(), 1u);
  EXPECT_NE(mixer->warnings()[0].message.find("exceeded"), std::string::npos);
  EXPECT_FALSE(cache_->Contains("hang"));
}

TEST_F(AudioMixerContractTest, StrictModeFailsTheJob) {
  audio::MixerConfig config;
  config.fail_on_decode_error = true;
  auto mixer = MakeMixer(config);

  auto status = mixer->Prepare({AudioClip("broken", "fail", 0.0, 1.0)}, 1.0);
  EXPECT_FALSE(status.ok);
  EXPECT_EQ(status.error, ExportError::kSourceDecode);
  EXPECT_FALSE(mixer->prepared());
  EXPECT_TRUE(mixer->sources().empty());
}

TEST_F(AudioMixerContractTest, RaisedCancelStopsPreparation) {
  auto mixer = MakeMixer();
  std::atomic<bool> cancel{true};
  auto status = mixer->Prepare({AudioClip("a", "const:0.5:2", 0.0, 2.0)}, 2.0, &cancel);
  EXPECT_FALSE(status.ok);
  EXPECT_EQ(status.error, ExportError::kCancelled);
  EXPECT_FALSE(mixer->prepared());
}

TEST_F(AudioMixerContractTest, CancelDuringHangingDecodeReturnsPromptly) {
  auto mixer = MakeMixer();
  std::atomic<bool> cancel{false};
  std::thread canceller([&cancel]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    cancel.store(true);
  });
  auto status = mixer->Prepare({AudioClip("stuck", "hang", 0.0, 1.0)}, 1.0, &cancel);
  canceller.join();
  EXPECT_EQ(status.error, ExportError::kCancelled);
}

// =============================================================================
// Decode cache
// =============================================================================

TEST_F(AudioMixerContractTest, SharedSourceIsDecodedOnce) {
  auto mixer = MakeMixer();
  ASSERT_TRUE(mixer->Prepare({AudioClip("a", "const:0.1:4", 0.0, 2.0),
                              AudioClip("b", "const:0.1:4", 1.0, 2.0)},
                             3.0)
                  .ok);
  EXPECT_EQ(decoder_->decode_calls(), 1);
  EXPECT_EQ(cache_->decode_count(), 1u);

  // A second job over the same cache reuses the entry.
  auto second = MakeMixer();
  ASSERT_TRUE(second->Prepare({AudioClip("c", "const:0.1:4", 0.0, 1.0)}, 1.0).ok);
  EXPECT_EQ(decoder_->decode_calls(), 1);
}

TEST(AudioDecodeCacheContract, ConcurrentReadersShareOneDecode) {
  audio::AudioDecodeCache cache;
  std::atomic<bool> abort{false};
  std::atomic<int> calls{0};
  auto slow_decode = [&calls](audio::DecodedAudio* out, std::string*) {
    calls.fetch_add(1);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    out->pcm.samples.assign(96, 0.5f);
    return true;
  };

  std::vector<std::shared_ptr<const audio::DecodedAudio>> results(4);
  std::vector<std::thread> threads;
  for (size_t i = 0; i < results.size(); ++i) {
    threads.emplace_back([&, i]() {
      std::string error;
      results[i] = cache.GetOrDecode("shared", Window(0.0), abort, slow_decode, &error);
    });
  }
  for (auto& t : threads) t.join();

  EXPECT_EQ(calls.load(), 1);
  for (const auto& r : results) {
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r.get(), results[0].get());
  }
}

TEST(AudioDecodeCacheContract, FailuresAreNotCached) {
  audio::AudioDecodeCache cache;
  std::atomic<bool> abort{false};
  std::string error;
  auto failing = [](audio::DecodedAudio*, std::string* e) {
    *e = "boom";
    return false;
  };
  EXPECT_EQ(cache.GetOrDecode("k", Window(0.0), abort, failing, &error), nullptr);
  EXPECT_EQ(error, "boom");
  EXPECT_FALSE(cache.Contains("k"));
  EXPECT_EQ(cache.size(), 0u);

  auto ok = [](audio::DecodedAudio* out, std::string*) {
    out->pcm.samples.assign(2, 0.0f);
    return true;
  };
  EXPECT_NE(cache.GetOrDecode("k", Window(0.0), abort, ok, &error), nullptr);
  EXPECT_EQ(cache.decode_count(), 2u);
  cache.Clear();
  EXPECT_FALSE(cache.Contains("k"));
  EXPECT_EQ(cache.bytes(), 0u);
}

TEST(AudioDecodeCacheContract, CoveringEntryServesNarrowerWindows) {
  audio::AudioDecodeCache cache;
  std::atomic<bool> abort{false};
  std::string error;
  auto wide = cache.GetOrDecode("src", Window(1.0, 4.0), abort,
                                ConstantDecode(Window(1.0, 4.0), 4.0), &error);
  ASSERT_NE(wide, nullptr);

  auto inner = cache.GetOrDecode("src", Window(2.0, 1.5), abort,
                                 ConstantDecode(Window(2.0, 1.5), 1.5), &error);
  EXPECT_EQ(inner.get(), wide.get());
  EXPECT_EQ(cache.decode_count(), 1u);
  EXPECT_TRUE(cache.Contains("src", Window(1.0, 4.0)));
  EXPECT_FALSE(cache.Contains("src", Window(0.5, 1.0)));
  EXPECT_FALSE(cache.Contains("src", Window(4.0, 2.0)));

  // A window reaching past the decoded span needs its own decode, which
  // supersedes the narrower entry.
  auto longer = cache.GetOrDecode("src", Window(0.0), abort,
                                  ConstantDecode(Window(0.0), 6.0, true), &error);
  ASSERT_NE(longer, nullptr);
  EXPECT_NE(longer.get(), wide.get());
  EXPECT_EQ(cache.decode_count(), 2u);
  EXPECT_EQ(cache.size(), 1u);
  EXPECT_EQ(cache.bytes(), longer->ByteSize());

  // The source ended inside the last decode, so any later start is covered.
  EXPECT_TRUE(cache.Contains("src", Window(5.0, 10.0)));
}

TEST(AudioDecodeCacheContract, LeastRecentlyUsedEntryIsEvictedPastBudget) {
  const size_t one_second = static_cast<size_t>(pipeline::kMixSampleRate) * 2 * sizeof(float);
  audio::AudioDecodeCache cache(3 * one_second);
  std::atomic<bool> abort{false};
  std::string error;
  for (const char* key : {"a", "b", "c"}) {
    ASSERT_NE(cache.GetOrDecode(key, Window(0.0, 1.0), abort,
                                ConstantDecode(Window(0.0, 1.0), 1.0), &error),
              nullptr);
  }
  EXPECT_EQ(cache.bytes(), 3 * one_second);

  // Touch "a" so "b" is the oldest.
  ASSERT_NE(cache.GetOrDecode("a", Window(0.0, 1.0), abort,
                              ConstantDecode(Window(0.0, 1.0), 1.0), &error),
            nullptr);
  auto held = cache.GetOrDecode("b", Window(0.0, 0.5), abort,
                                ConstantDecode(Window(0.0, 0.5), 0.5), &error);
  ASSERT_NE(held, nullptr);
  EXPECT_EQ(cache.decode_count(), 3u);

  ASSERT_NE(cache.GetOrDecode("d", Window(0.0, 1.0), abort,
                              ConstantDecode(Window(0.0, 1.0), 1.0), &error),
            nullptr);
  EXPECT_EQ(cache.eviction_count(), 1u);
  EXPECT_TRUE(cache.Contains("a"));
  EXPECT_TRUE(cache.Contains("c"));
  EXPECT_TRUE(cache.Contains("d"));
  EXPECT_LE(cache.bytes(), cache.byte_budget());
  EXPECT_FALSE(cache.Contains("b"));
  // Eviction drops the cache's reference only.
  EXPECT_EQ(held->pcm.FrameCount(), static_cast<size_t>(pipeline::kMixSampleRate));
}

TEST(AudioDecodeCacheContract, DecodeLargerThanBudgetIsNotRetained) {
  audio::AudioDecodeCache cache(1024);
  std::atomic<bool> abort{false};
  std::string error;
  auto big = cache.GetOrDecode("big", Window(0.0, 1.0), abort,
                               ConstantDecode(Window(0.0, 1.0), 1.0), &error);
  ASSERT_NE(big, nullptr);
  EXPECT_FALSE(cache.Contains("big"));
  EXPECT_EQ(cache.bytes(), 0u);
  EXPECT_EQ(cache.size(), 0u);
}

TEST_F(AudioMixerContractTest, OnlyThePlayedSpanIsDecoded) {
  auto mixer = MakeMixer();
  TimelineElement trimmed = AudioClip("trimmed", "ramp:600", 1.0, 10.0, 0.5);
  trimmed.trim_in = 30.0;
  TimelineElement early = AudioClip("early", "ramp:600", -2.0, 4.0, 0.5);
  ASSERT_TRUE(mixer->Prepare({trimmed, early}, 3.0).ok);

  const auto windows = decoder_->windows();
  ASSERT_EQ(windows.size(), 2u);
  // Starts 30s into the source and is cut at the job end.
  EXPECT_DOUBLE_EQ(windows[0].start_seconds, 30.0);
  EXPECT_DOUBLE_EQ(windows[0].duration_seconds, 2.0);
  // Starts before the job: the first two seconds never play.
  EXPECT_DOUBLE_EQ(windows[1].start_seconds, 2.0);
  EXPECT_DOUBLE_EQ(windows[1].duration_seconds, 2.0);

  ASSERT_EQ(mixer->sources().size(), 2u);
  for (const auto& source : mixer->sources()) {
    ASSERT_NE(source.decoded, nullptr);
    EXPECT_LE(source.decoded->pcm.FrameCount(),
              static_cast<size_t>(2 * pipeline::kMixSampleRate));
  }

  // Timeline 1.5s: 0.5s into the trimmed clip (source 30.5s) plus 3.5s into
  // the early clip.
  EXPECT_NEAR(SampleAt(*mixer, 1.5).first, 0.5f * (RampSample(30.5) + RampSample(3.5)),
              kTolerance);
  EXPECT_NEAR(SampleAt(*mixer, 0.5).first, 0.5f * RampSample(2.5), kTolerance);
}

// =============================================================================
// Live graph
// =============================================================================

TEST_F(AudioMixerContractTest, AttachRequiresPreparedMixer) {
  auto mixer = MakeMixer();
  audio::LiveAudioGraph graph;
  EXPECT_FALSE(mixer->AttachToLiveGraph(&graph));
  EXPECT_FALSE(graph.IsConnected());
}

TEST_F(AudioMixerContractTest, LiveGraphPullsContiguousRanges) {
  auto mixer = MakeMixer();
  ASSERT_TRUE(mixer->Prepare({AudioClip("a", "const:0.5:2", 0.0, 2.0)}, 1.0).ok);
  audio::LiveAudioGraph graph;
  ASSERT_TRUE(mixer->AttachToLiveGraph(&graph));
  EXPECT_EQ(graph.total_frames(), pipeline::kMixSampleRate);

  pipeline::PcmBuffer first = graph.Pull(0.25);
  EXPECT_EQ(first.FrameCount(), static_cast<size_t>(pipeline::kMixSampleRate / 4));
  EXPECT_TRUE(graph.Pull(0.25).samples.empty());
  EXPECT_TRUE(graph.Pull(0.1).samples.empty());

  // Pulling past the end stops at the job duration.
  pipeline::PcmBuffer rest = graph.Pull(10.0);
  EXPECT_EQ(rest.FrameCount(), static_cast<size_t>(pipeline::kMixSampleRate * 3 / 4));
  EXPECT_EQ(graph.cursor_frames(), graph.total_frames());
  EXPECT_NEAR(rest.samples.front(), 0.5f, kTolerance);
}

TEST_F(AudioMixerContractTest, ReleaseDisconnectsLiveGraph) {
  auto mixer = MakeMixer();
  ASSERT_TRUE(mixer->Prepare({AudioClip("a", "const:0.5:2", 0.0, 2.0)}, 1.0).ok);
  audio::LiveAudioGraph graph;
  ASSERT_TRUE(mixer->AttachToLiveGraph(&graph));

  mixer->Release();
  EXPECT_FALSE(graph.IsConnected());
  EXPECT_TRUE(graph.Pull(0.5).samples.empty());
  EXPECT_FALSE(mixer->prepared());
  mixer->Release();
}
