// Repository: ReelForge
// Component: Progress Reporter Contract Tests
// Purpose: Phase bands, monotonic delivery, coalescing and the single
//          terminal event.
// Copyright (c) 2025 ReelForge

#include <gtest/gtest.h>

#include <chrono>
#include <thread>
#include <utility>
#include <vector>

#include "reelforge/pipeline/ProgressReporter.hpp"

using namespace reelforge;
using pipeline::JobState;
using pipeline::ProgressReporter;

namespace {

struct Recorded {
  std::vector<std::pair<double, JobState>> events;

  pipeline::ProgressCallback Callback() {
    return [this](double v, JobState s) { events.emplace_back(v, s); };
  }
};

}  // namespace

// =============================================================================
// Phase bands
// =============================================================================

TEST(ProgressReporterContract, PhaseBands) {
  EXPECT_DOUBLE_EQ(ProgressReporter::MapToOverall(JobState::kPreparing, 1.0), 0.05);
  EXPECT_DOUBLE_EQ(ProgressReporter::MapToOverall(JobState::kEncoding, 0.0), 0.05);
  EXPECT_DOUBLE_EQ(ProgressReporter::MapToOverall(JobState::kEncoding, 1.0), 0.90);
  EXPECT_DOUBLE_EQ(ProgressReporter::MapToOverall(JobState::kMuxing, 1.0), 0.99);
  EXPECT_DOUBLE_EQ(ProgressReporter::MapToOverall(JobState::kEncoding, 7.0), 0.90);
  EXPECT_DOUBLE_EQ(ProgressReporter::MapToOverall(JobState::kEncoding, -1.0), 0.05);
}

// =============================================================================
// Monotonic delivery
// =============================================================================

TEST(ProgressReporterContract, NeverDecreases) {
  Recorded rec;
  ProgressReporter reporter(rec.Callback(), 0, 0.0);

  reporter.ReportPhase(JobState::kEncoding, 0.5);
  reporter.ReportPhase(JobState::kEncoding, 0.2);
  reporter.ReportPhase(JobState::kEncoding, 0.6);
  // A later phase starting at fraction 0 still sits above the encoding band.
  reporter.ReportPhase(JobState::kMuxing, 0.0);

  ASSERT_GE(rec.events.size(), 2u);
  for (size_t i = 1; i < rec.events.size(); ++i) {
    EXPECT_GE(rec.events[i].first, rec.events[i - 1].first) << "event " << i;
  }
  EXPECT_DOUBLE_EQ(reporter.progress(), 0.90);
}

TEST(ProgressReporterContract, StaysBelowOneUntilCompleted) {
  Recorded rec;
  ProgressReporter reporter(rec.Callback(), 0, 0.0);
  reporter.ReportPhase(JobState::kMuxing, 1.0);
  EXPECT_LE(reporter.progress(), pipeline::kMaxNonTerminalProgress);

  reporter.ReportTerminal(JobState::kCompleted);
  EXPECT_DOUBLE_EQ(reporter.progress(), 1.0);
  ASSERT_FALSE(rec.events.empty());
  EXPECT_DOUBLE_EQ(rec.events.back().first, 1.0);
  EXPECT_EQ(rec.events.back().second, JobState::kCompleted);
}

// =============================================================================
// Coalescing
// =============================================================================

TEST(ProgressReporterContract, CoalescesSmallStepsWithinInterval) {
  Recorded rec;
  ProgressReporter reporter(rec.Callback(), 60'000, 0.05);

  reporter.ReportPhase(JobState::kEncoding, 0.0);  // first report always goes out
  for (int i = 1; i <= 10; ++i) {
    reporter.ReportPhase(JobState::kEncoding, 0.001 * i);
  }
  EXPECT_EQ(rec.events.size(), 1u);

  reporter.ReportPhase(JobState::kEncoding, 0.2);  // moved by >= delta
  EXPECT_EQ(rec.events.size(), 2u);

  reporter.ReportPhase(JobState::kMuxing, 0.0);  // state change
  EXPECT_EQ(rec.events.size(), 3u);
  EXPECT_EQ(rec.events.back().second, JobState::kMuxing);
  EXPECT_EQ(reporter.delivered_count(), 3u);
}

TEST(ProgressReporterContract, IntervalReleasesSmallSteps) {
  Recorded rec;
  ProgressReporter reporter(rec.Callback(), 20, 0.5);

  reporter.ReportPhase(JobState::kEncoding, 0.10);
  reporter.ReportPhase(JobState::kEncoding, 0.11);
  EXPECT_EQ(rec.events.size(), 1u);

  std::this_thread::sleep_for(std::chrono::milliseconds(40));
  reporter.ReportPhase(JobState::kEncoding, 0.12);
  EXPECT_EQ(rec.events.size(), 2u);
}

// =============================================================================
// Terminal event
// =============================================================================

TEST(ProgressReporterContract, TerminalDeliveredExactlyOnce) {
  Recorded rec;
  ProgressReporter reporter(rec.Callback(), 60'000, 0.5);

  reporter.ReportPhase(JobState::kEncoding, 0.3);
  reporter.ReportTerminal(JobState::kCancelled);
  reporter.ReportTerminal(JobState::kFailed);
  reporter.ReportPhase(JobState::kMuxing, 1.0);

  ASSERT_EQ(rec.events.size(), 2u);
  EXPECT_EQ(rec.events.back().second, JobState::kCancelled);
  EXPECT_TRUE(reporter.terminal());
  EXPECT_EQ(reporter.state(), JobState::kCancelled);
  // Failure keeps the progress reached so far.
  EXPECT_DOUBLE_EQ(rec.events.back().first, rec.events.front().first);
}

TEST(ProgressReporterContract, NullCallbackIsAllowed) {
  ProgressReporter reporter(nullptr, 0, 0.0);
  reporter.ReportPhase(JobState::kPreparing, 1.0);
  reporter.ReportTerminal(JobState::kCompleted);
  EXPECT_EQ(reporter.delivered_count(), 2u);
}
