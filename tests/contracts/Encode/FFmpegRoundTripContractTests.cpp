// Repository: ReelForge
// Component: FFmpeg Round Trip Contract Tests
// Purpose: Real decoders, encoders and the export host run end to end on
//          short generated media; the outputs are demuxed back and their
//          stream spans compared with the requested duration.
// Copyright (c) 2025 ReelForge

#include <gtest/gtest.h>

#ifdef REELFORGE_FFMPEG_AVAILABLE

#include <algorithm>
#include <atomic>
#include <cmath>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
}

#include "reelforge/audio/AudioDecoder.hpp"
#include "reelforge/audio/WavWriter.hpp"
#include "reelforge/decode/FFmpegInput.hpp"
#include "reelforge/encode/FrameImageWriter.hpp"
#include "reelforge/frame/VisualSourceProvider.hpp"
#include "reelforge/runtime/ExportCoordinator.hpp"
#include "reelforge/util/ChildProcess.hpp"
#include "reelforge/util/ScopedTempDir.hpp"

using namespace reelforge;
using engine::EngineCandidate;
using engine::EngineKind;
using engine::EngineTier;
using pipeline::ElementKind;
using pipeline::TimelineElement;

namespace {

namespace fs = std::filesystem;

constexpr double kAacFrameSeconds = 1024.0 / pipeline::kMixSampleRate;

struct StreamSpans {
  double video = -1.0;
  double audio = -1.0;
  std::string video_codec;
};

// End of the last packet per stream, measured from zero so encoder priming
// does not count.
StreamSpans MeasureStreams(const std::string& path) {
  StreamSpans spans;
  decode::FFmpegInput input;
  pipeline::ResolvedSource source;
  source.file_path = path;
  std::string error;
  if (!input.Open(source, nullptr, &error)) {
    ADD_FAILURE() << error;
    return spans;
  }
  AVFormatContext* fmt = input.format();
  std::vector<double> end(fmt->nb_streams, -1.0);
  AVPacket* packet = av_packet_alloc();
  while (av_read_frame(fmt, packet) >= 0) {
    const AVStream* stream = fmt->streams[packet->stream_index];
    if (packet->pts != AV_NOPTS_VALUE) {
      const double tb = av_q2d(stream->time_base);
      end[packet->stream_index] =
          std::max(end[packet->stream_index], (packet->pts + packet->duration) * tb);
    }
    av_packet_unref(packet);
  }
  av_packet_free(&packet);
  for (unsigned i = 0; i < fmt->nb_streams; ++i) {
    const AVCodecParameters* par = fmt->streams[i]->codecpar;
    if (par->codec_type == AVMEDIA_TYPE_VIDEO && spans.video < 0.0) {
      spans.video = end[i];
      spans.video_codec = avcodec_get_name(par->codec_id);
    } else if (par->codec_type == AVMEDIA_TYPE_AUDIO && spans.audio < 0.0) {
      spans.audio = end[i];
    }
  }
  return spans;
}

// Left channel rises linearly from 0 to 0.5 over the file; right is silent.
float RampAt(double t, double seconds) {
  return static_cast<float>(0.5 * t / seconds);
}

std::string WriteRampWav(const std::string& dir, double seconds) {
  pipeline::PcmBuffer pcm;
  const auto frames = static_cast<size_t>(std::llround(seconds * pipeline::kMixSampleRate));
  pcm.samples.assign(frames * 2, 0.0f);
  for (size_t i = 0; i < frames; ++i) {
    pcm.samples[i * 2] = RampAt(static_cast<double>(i) / pipeline::kMixSampleRate, seconds);
  }
  const std::string path = (fs::path(dir) / "ramp.wav").string();
  std::string error;
  EXPECT_TRUE(audio::WriteWav16(path, pcm, &error)) << error;
  return path;
}

std::string WriteSolidPng(const std::string& dir, int width, int height) {
  pipeline::PixelBuffer pixels;
  pixels.Resize(width, height);
  for (size_t i = 0; i < pixels.rgba.size(); i += 4) {
    pixels.rgba[i] = 200;
    pixels.rgba[i + 1] = 40;
    pixels.rgba[i + 2] = 10;
    pixels.rgba[i + 3] = 255;
  }
  const std::string path = (fs::path(dir) / "still.png").string();
  encode::FFmpegPngWriter writer;
  std::string error;
  EXPECT_TRUE(writer.WriteImage(pixels, path, &error)) << error;
  return path;
}

TimelineElement Still(const std::string& path, double start, double duration) {
  TimelineElement e;
  e.id = "still";
  e.kind = ElementKind::kVisual;
  e.source_ref = path;
  e.start_time = start;
  e.duration = duration;
  return e;
}

TimelineElement Track(const std::string& path, double duration) {
  TimelineElement e;
  e.id = "track";
  e.kind = ElementKind::kAudio;
  e.source_ref = path;
  e.duration = duration;
  return e;
}

class FFmpegRoundTripContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(media_.Create("", "rt-media", nullptr));
    ASSERT_TRUE(out_.Create("", "rt-out", nullptr));
    ASSERT_TRUE(temp_root_.Create("", "rt-root", nullptr));
  }

  pipeline::ExportResult Export(const std::vector<TimelineElement>& elements,
                                pipeline::ExportSettings settings, EngineCandidate candidate) {
    pipeline::ExportPipelineConfig config;
    config.temp_root = temp_root_.path();
    config.host_binary_path = REELFORGE_TEST_HOST_BINARY;
    runtime::ExportServices services = runtime::DefaultServices(config);
    services.capability_probe = [](const pipeline::ExportSettings&) {
      pipeline::CapabilityProfile profile;
      profile.has_native_process = true;
      profile.has_shared_memory = true;
      profile.performance_score = 80;
      return profile;
    };
    runtime::ExportCoordinator coordinator(config, services);
    runtime::ExportRequest request;
    request.settings = std::move(settings);
    request.elements = elements;
    request.preferred_order = {candidate};
    auto submitted = coordinator.Submit(std::move(request));
    EXPECT_TRUE(submitted.accepted) << submitted.message;
    return coordinator.Wait(submitted.job_id);
  }

  pipeline::ExportSettings Settings(double duration, const std::string& name) const {
    pipeline::ExportSettings s;
    s.width = 64;
    s.height = 36;
    s.fps = 30;
    s.duration_seconds = duration;
    s.output_path = (fs::path(out_.path()) / name).string();
    return s;
  }

  util::ScopedTempDir media_;
  util::ScopedTempDir out_;
  util::ScopedTempDir temp_root_;
};

}  // namespace

// =============================================================================
// Sources
// =============================================================================

TEST_F(FFmpegRoundTripContractTest, WindowedDecodeMatchesTheWrittenWav) {
  const std::string wav = WriteRampWav(media_.path(), 3.0);
  audio::FFmpegAudioDecoder decoder;
  pipeline::ResolvedSource source;
  source.file_path = wav;
  audio::DecodeWindow window;
  window.start_seconds = 1.0;
  window.duration_seconds = 0.5;
  std::atomic<bool> abort{false};
  audio::DecodedAudio decoded;
  std::string error;
  ASSERT_TRUE(decoder.Decode(source, window, abort, &decoded, &error)) << error;

  EXPECT_LE(decoded.start_seconds, 1.0 + 1e-6);
  EXPECT_TRUE(decoded.Covers(window));
  EXPECT_FALSE(decoded.reached_end);
  // Far less than the whole file is resident.
  EXPECT_LT(decoded.pcm.DurationSeconds(), 1.5);

  const double tolerance = 2.0 / 32767.0;
  for (double t : {1.0, 1.25, 1.49}) {
    const auto frame =
        static_cast<size_t>(std::llround((t - decoded.start_seconds) * pipeline::kMixSampleRate));
    ASSERT_LT(frame, decoded.pcm.FrameCount());
    EXPECT_NEAR(decoded.pcm.samples[frame * 2], RampAt(t, 3.0), tolerance) << "t=" << t;
    EXPECT_NEAR(decoded.pcm.samples[frame * 2 + 1], 0.0f, tolerance);
  }

  audio::DecodedAudio tail;
  window.start_seconds = 2.5;
  window.duration_seconds = -1.0;
  ASSERT_TRUE(decoder.Decode(source, window, abort, &tail, &error)) << error;
  EXPECT_TRUE(tail.reached_end);
  EXPECT_NEAR(tail.start_seconds + tail.pcm.DurationSeconds(), 3.0, 0.01);
}

TEST_F(FFmpegRoundTripContractTest, StillImageSamplesToItsPixels) {
  const std::string png = WriteSolidPng(media_.path(), 8, 6);
  frame::FFmpegVisualSource visual(pipeline::FilePathResolver());
  pipeline::PixelBuffer pixels;
  std::string error;
  ASSERT_TRUE(visual.SampleFrame(Still(png, 0.0, 1.0), 0.5, &pixels, &error)) << error;
  ASSERT_EQ(pixels.width, 8);
  ASSERT_EQ(pixels.height, 6);
  const uint8_t* p = pixels.Pixel(3, 2);
  EXPECT_EQ(p[0], 200);
  EXPECT_EQ(p[1], 40);
  EXPECT_EQ(p[2], 10);
  EXPECT_EQ(p[3], 255);
}

// =============================================================================
// In-process encoders
// =============================================================================

TEST_F(FFmpegRoundTripContractTest, SilentTimelineStillGetsAnAudioTrack) {
  const std::string png = WriteSolidPng(media_.path(), 32, 18);
  auto result = Export({Still(png, 0.0, 5.0)}, Settings(5.0, "silent.mp4"),
                       {EngineKind::kSoftwareEncoder, EngineTier::kMid});
  ASSERT_TRUE(result.Succeeded()) << result.message << " " << result.diagnostic;
  EXPECT_EQ(result.backend, "SoftwareEncoder");

  const StreamSpans spans = MeasureStreams(result.output_path);
  EXPECT_EQ(spans.video_codec, "h264");
  EXPECT_NEAR(spans.video, 5.0, 1.0 / 30.0);
  ASSERT_GT(spans.audio, 0.0) << "no audio stream";
  EXPECT_NEAR(spans.audio, spans.video, 1.0 / 30.0 + kAacFrameSeconds);
}

TEST_F(FFmpegRoundTripContractTest, SoftwareEncoderMuxesAudioAsLongAsVideo) {
  const std::string png = WriteSolidPng(media_.path(), 32, 18);
  const std::string wav = WriteRampWav(media_.path(), 3.0);
  auto settings = Settings(2.0, "mixed.webm");
  settings.format = pipeline::ContainerFormat::kWebm;
  auto result = Export({Still(png, 0.0, 2.0), Track(wav, 2.0)}, settings,
                       {EngineKind::kSoftwareEncoder, EngineTier::kMid});
  ASSERT_TRUE(result.Succeeded()) << result.message << " " << result.diagnostic;

  const StreamSpans spans = MeasureStreams(result.output_path);
  EXPECT_EQ(spans.video_codec, "vp9");
  EXPECT_NEAR(spans.video, 2.0, 1.0 / 30.0);
  EXPECT_NEAR(spans.audio, spans.video, 1.0 / 30.0 + kAacFrameSeconds);
}

TEST_F(FFmpegRoundTripContractTest, SandboxedRecorderProducesAPlayableFile) {
  const std::string png = WriteSolidPng(media_.path(), 32, 18);
  const std::string wav = WriteRampWav(media_.path(), 3.0);
  auto result = Export({Still(png, 0.0, 1.0), Track(wav, 1.0)}, Settings(1.0, "live.mp4"),
                       {EngineKind::kSandboxedRecorder, EngineTier::kBaseline});
  ASSERT_TRUE(result.Succeeded()) << result.message << " " << result.diagnostic;
  EXPECT_EQ(result.backend.rfind("SandboxedRecorder", 0), 0u) << result.backend;

  const StreamSpans spans = MeasureStreams(result.output_path);
  EXPECT_NEAR(spans.video, 1.0, 1.0 / 30.0);
  EXPECT_NEAR(spans.audio, spans.video, 1.0 / 30.0 + kAacFrameSeconds);
}

// =============================================================================
// External engine and export host
// =============================================================================

TEST_F(FFmpegRoundTripContractTest, ExternalEngineEncodesThroughTheHost) {
  if (!util::IsExecutableOnPath("ffmpeg")) GTEST_SKIP() << "ffmpeg binary not on PATH";
  const std::string png = WriteSolidPng(media_.path(), 32, 18);
  const std::string wav = WriteRampWav(media_.path(), 3.0);
  auto result = Export({Still(png, 0.0, 2.0), Track(wav, 2.0)}, Settings(2.0, "ext.mp4"),
                       {EngineKind::kExternalProcess, EngineTier::kHigh});
  ASSERT_TRUE(result.Succeeded()) << result.message << " " << result.diagnostic;
  EXPECT_EQ(result.backend, "ExternalProcess");

  const StreamSpans spans = MeasureStreams(result.output_path);
  EXPECT_EQ(spans.video_codec, "h264");
  EXPECT_NEAR(spans.video, 2.0, 1.0 / 30.0);
  EXPECT_NEAR(spans.audio, spans.video, 1.0 / 30.0 + kAacFrameSeconds);
  EXPECT_TRUE(fs::is_empty(temp_root_.path()));
}

TEST_F(FFmpegRoundTripContractTest, StreamCopyJoinsIdenticalSegments) {
  if (!util::IsExecutableOnPath("ffmpeg")) GTEST_SKIP() << "ffmpeg binary not on PATH";
  const std::string png = WriteSolidPng(media_.path(), 32, 18);
  auto segment = Export({Still(png, 0.0, 1.0)}, Settings(1.0, "segment.mp4"),
                        {EngineKind::kSoftwareEncoder, EngineTier::kMid});
  ASSERT_TRUE(segment.Succeeded()) << segment.message;

  auto settings = Settings(2.0, "joined.mp4");
  settings.allow_stream_copy = true;
  auto result = Export({Still(segment.output_path, 0.0, 1.0), Still(segment.output_path, 1.0, 1.0)},
                       settings, {EngineKind::kExternalProcess, EngineTier::kHigh});
  ASSERT_TRUE(result.Succeeded()) << result.message << " " << result.diagnostic;

  const StreamSpans spans = MeasureStreams(result.output_path);
  EXPECT_EQ(spans.video_codec, "h264");
  EXPECT_NEAR(spans.video, 2.0, 2.0 / 30.0);
  EXPECT_GT(spans.audio, 0.0);
}

#endif  // REELFORGE_FFMPEG_AVAILABLE
