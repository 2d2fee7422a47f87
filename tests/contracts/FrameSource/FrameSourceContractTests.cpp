// Repository: ReelForge
// Component: Frame Source Contract Tests
// Purpose: Active-interval selection, track order, contain-fit placement,
//          opacity blending, determinism and blank-source warnings.
// Copyright (c) 2025 ReelForge

#include <gtest/gtest.h>

#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "reelforge/frame/FrameSource.hpp"
#include "fixtures/FakeVisualSource.h"

using namespace reelforge;
using pipeline::ElementKind;
using pipeline::TimelineElement;
using tests::fixtures::FakeVisualSource;

namespace {

// 32x16 canvas: a square 16x16 source contain-fits to the centre 16x16.
pipeline::ExportSettings CanvasSettings() {
  pipeline::ExportSettings s;
  s.width = 32;
  s.height = 16;
  s.fps = 10;
  s.duration_seconds = 5.0;
  s.output_path = "/tmp/unused.mp4";
  return s;
}

TimelineElement Visual(const std::string& id, const std::string& ref, int track,
                       double start, double duration) {
  TimelineElement e;
  e.id = id;
  e.kind = ElementKind::kVisual;
  e.source_ref = ref;
  e.track_index = track;
  e.start_time = start;
  e.duration = duration;
  return e;
}

void ExpectRgb(const pipeline::PixelBuffer& frame, int x, int y, int r, int g, int b) {
  const uint8_t* p = frame.Pixel(x, y);
  EXPECT_EQ(p[0], r) << "at " << x << "," << y;
  EXPECT_EQ(p[1], g) << "at " << x << "," << y;
  EXPECT_EQ(p[2], b) << "at " << x << "," << y;
  EXPECT_EQ(p[3], 255) << "at " << x << "," << y;
}

}  // namespace

// =============================================================================
// Canvas
// =============================================================================

TEST(FrameSourceContract, EmptyTimelineRendersBlack) {
  frame::FrameSource source(CanvasSettings(), {}, std::make_shared<FakeVisualSource>());
  const auto& frame = source.RenderFrame(1.0);
  ASSERT_EQ(frame.width, 32);
  ASSERT_EQ(frame.height, 16);
  ExpectRgb(frame, 0, 0, 0, 0, 0);
  ExpectRgb(frame, 31, 15, 0, 0, 0);
}

TEST(FrameSourceContract, NullProviderRendersBlack) {
  frame::FrameSource source(CanvasSettings(), {Visual("v", "color:255,0,0", 0, 0.0, 5.0)},
                            nullptr);
  ExpectRgb(source.RenderFrame(1.0), 16, 8, 0, 0, 0);
}

TEST(FrameSourceContract, SourceIsContainFittedAndCentred) {
  frame::FrameSource source(CanvasSettings(), {Visual("v", "color:255,0,0", 0, 0.0, 5.0)},
                            std::make_shared<FakeVisualSource>());
  const auto& frame = source.RenderFrame(0.0);
  ExpectRgb(frame, 8, 0, 255, 0, 0);
  ExpectRgb(frame, 23, 15, 255, 0, 0);
  // Pillarbox bars stay black.
  ExpectRgb(frame, 7, 8, 0, 0, 0);
  ExpectRgb(frame, 24, 8, 0, 0, 0);
}

TEST(FrameSourceContract, OffsetMovesTheSource) {
  TimelineElement e = Visual("v", "color:0,255,0", 0, 0.0, 5.0);
  e.transform.x = 8.0;
  frame::FrameSource source(CanvasSettings(), {e}, std::make_shared<FakeVisualSource>());
  const auto& frame = source.RenderFrame(0.0);
  ExpectRgb(frame, 8, 8, 0, 0, 0);
  ExpectRgb(frame, 16, 8, 0, 255, 0);
  ExpectRgb(frame, 31, 8, 0, 255, 0);
}

// =============================================================================
// Activity and ordering
// =============================================================================

TEST(FrameSourceContract, ActiveIntervalIsHalfOpen) {
  frame::FrameSource source(CanvasSettings(), {Visual("v", "color:255,0,0", 0, 1.0, 2.0)},
                            std::make_shared<FakeVisualSource>());
  EXPECT_TRUE(source.ActiveElementIds(0.99).empty());
  EXPECT_EQ(source.ActiveElementIds(1.0), std::vector<std::string>{"v"});
  EXPECT_EQ(source.ActiveElementIds(2.99), std::vector<std::string>{"v"});
  EXPECT_TRUE(source.ActiveElementIds(3.0).empty());

  ExpectRgb(source.RenderFrame(3.0), 16, 8, 0, 0, 0);
  ExpectRgb(source.RenderFrame(2.0), 16, 8, 255, 0, 0);
}

TEST(FrameSourceContract, HigherTrackDrawsOnTopAndTiesKeepInputOrder) {
  std::vector<TimelineElement> elements = {
      Visual("top", "color:0,0,255", 2, 0.0, 5.0),
      Visual("first", "color:255,0,0", 1, 0.0, 5.0),
      Visual("second", "color:0,255,0", 1, 0.0, 5.0),
  };
  frame::FrameSource source(CanvasSettings(), elements, std::make_shared<FakeVisualSource>());
  EXPECT_EQ(source.ActiveElementIds(1.0),
            (std::vector<std::string>{"first", "second", "top"}));
  ExpectRgb(source.RenderFrame(1.0), 16, 8, 0, 0, 255);
}

TEST(FrameSourceContract, AudioOnlyElementsAreNotDrawn) {
  TimelineElement audio = Visual("a", "color:255,255,255", 5, 0.0, 5.0);
  audio.kind = ElementKind::kAudio;
  TimelineElement both = Visual("b", "color:9,9,9", 0, 0.0, 5.0);
  both.kind = ElementKind::kBoth;
  frame::FrameSource source(CanvasSettings(), {audio, both},
                            std::make_shared<FakeVisualSource>());
  EXPECT_EQ(source.ActiveElementIds(1.0), std::vector<std::string>{"b"});
  ExpectRgb(source.RenderFrame(1.0), 16, 8, 9, 9, 9);
}

// =============================================================================
// Blending and determinism
// =============================================================================

TEST(FrameSourceContract, OpacityBlendsOverBackground) {
  TimelineElement e = Visual("v", "color:255,255,255", 0, 0.0, 5.0);
  e.transform.opacity = 0.5;
  frame::FrameSource source(CanvasSettings(), {e}, std::make_shared<FakeVisualSource>());
  ExpectRgb(source.RenderFrame(0.0), 16, 8, 128, 128, 128);

  e.transform.opacity = 0.0;
  frame::FrameSource hidden(CanvasSettings(), {e}, std::make_shared<FakeVisualSource>());
  ExpectRgb(hidden.RenderFrame(0.0), 16, 8, 0, 0, 0);
}

TEST(FrameSourceContract, SameTimestampSamePixels) {
  TimelineElement e = Visual("v", "color:200,100,50", 0, 0.0, 5.0);
  e.transform.rotation_degrees = 30.0;
  e.transform.scale = 0.7;
  e.transform.opacity = 0.8;
  frame::FrameSource source(CanvasSettings(), {e}, std::make_shared<FakeVisualSource>());

  const std::vector<uint8_t> first = source.RenderFrame(1.5).rgba;
  source.RenderFrame(3.0);
  const std::vector<uint8_t> again = source.RenderFrame(1.5).rgba;
  EXPECT_EQ(first, again);
}

TEST(FrameSourceContract, SourceTimeIncludesTrimIn) {
  auto provider = std::make_shared<FakeVisualSource>();
  TimelineElement e = Visual("v", "color:1,1,1", 0, 2.0, 3.0);
  e.trim_in = 4.0;
  frame::FrameSource source(CanvasSettings(), {e}, provider);
  source.RenderFrame(2.5);

  auto samples = provider->samples();
  ASSERT_EQ(samples.size(), 1u);
  EXPECT_EQ(samples[0].element_id, "v");
  EXPECT_DOUBLE_EQ(samples[0].source_time, 4.5);
}

// =============================================================================
// Broken sources
// =============================================================================

TEST(FrameSourceContract, BrokenSourceIsLeftBlankAndWarnedOnce) {
  std::vector<TimelineElement> elements = {
      Visual("ok", "color:0,255,0", 0, 0.0, 5.0),
      Visual("broken", "missing.mov", 1, 0.0, 5.0),
  };
  frame::FrameSource source(CanvasSettings(), elements, std::make_shared<FakeVisualSource>());
  for (int i = 0; i < 5; ++i) {
    ExpectRgb(source.RenderFrame(i * 0.5), 16, 8, 0, 255, 0);
  }
  ASSERT_EQ(source.warnings().size(), 1u);
  EXPECT_EQ(source.warnings()[0].element_id, "broken");
  EXPECT_NE(source.warnings()[0].message.find("visual source left blank"), std::string::npos);
}

// =============================================================================
// Degenerate transforms
// =============================================================================

TEST(FrameSourceContract, NonFiniteAndHugeTransformsDrawNothing) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();
  std::vector<TimelineElement> elements = {Visual("base", "color:0,0,255", 0, 0.0, 5.0)};
  for (int i = 0; i < 6; ++i) {
    elements.push_back(Visual("bad" + std::to_string(i), "color:255,0,0", 1, 0.0, 5.0));
  }
  elements[1].transform.x = nan;
  elements[2].transform.scale = inf;
  elements[3].transform.rotation_degrees = nan;
  elements[4].transform.opacity = nan;
  elements[5].transform.x = 1e300;
  elements[6].transform.y = -1e300;

  frame::FrameSource source(CanvasSettings(), elements, std::make_shared<FakeVisualSource>());
  const auto& frame = source.RenderFrame(1.0);
  ExpectRgb(frame, 16, 8, 0, 0, 255);
  ExpectRgb(frame, 0, 0, 0, 0, 0);
  EXPECT_TRUE(source.warnings().empty());
}

TEST(FrameSourceContract, HugeScaleCoversTheCanvas) {
  std::vector<TimelineElement> elements = {Visual("big", "color:0,255,0", 0, 0.0, 5.0)};
  elements[0].transform.scale = 1e12;
  frame::FrameSource source(CanvasSettings(), elements, std::make_shared<FakeVisualSource>());
  const auto& frame = source.RenderFrame(1.0);
  ExpectRgb(frame, 0, 0, 0, 255, 0);
  ExpectRgb(frame, 31, 15, 0, 255, 0);
}
