// Repository: ReelForge
// Component: Progress Reporter
// Purpose: Monotonic, coalesced job progress delivery.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_PIPELINE_PROGRESS_REPORTER_HPP_
#define REELFORGE_PIPELINE_PROGRESS_REPORTER_HPP_

#include <chrono>
#include <cstdint>
#include <mutex>

#include "reelforge/pipeline/ExportTypes.hpp"

namespace reelforge::pipeline {

// Highest progress value reported before the job completes.
inline constexpr double kMaxNonTerminalProgress = 0.99;

// ProgressReporter sits between the coordinator and the caller's callback.
//
// - Progress never decreases and stays below 1.0 until Completed.
// - Calls are coalesced: a report is delivered when the state changed, the
//   value moved by at least `min_delta`, or `min_interval` elapsed since the
//   last delivery.
// - The terminal state is delivered exactly once; every later call is
//   dropped and the callback is released right after delivery.
//
// The callback runs on the reporting thread while the reporter's mutex is
// held, so deliveries are totally ordered. It must not call back into the
// reporter.
class ProgressReporter {
 public:
  ProgressReporter(ProgressCallback callback, int min_interval_ms, double min_delta);

  // `fraction` is the completion of the current phase in [0, 1]; it is
  // mapped into that phase's band of the overall progress.
  void ReportPhase(JobState state, double fraction);

  // Delivers the terminal state. Completed forces 1.0.
  void ReportTerminal(JobState state);

  double progress() const;
  JobState state() const;
  bool terminal() const;
  uint64_t delivered_count() const;

  // Overall progress band for a phase: Preparing [0, 0.05], Encoding
  // [0.05, 0.90], Muxing [0.90, 0.99].
  static double MapToOverall(JobState state, double fraction);

 private:
  void DeliverLocked(double value, JobState state, bool force);

  ProgressCallback callback_;
  std::chrono::milliseconds min_interval_;
  double min_delta_;

  mutable std::mutex mutex_;
  double progress_ = 0.0;
  double last_delivered_ = -1.0;
  JobState state_ = JobState::kQueued;
  JobState last_delivered_state_ = JobState::kQueued;
  bool any_delivered_ = false;
  bool terminal_ = false;
  uint64_t delivered_count_ = 0;
  std::chrono::steady_clock::time_point last_delivery_time_;
};

}  // namespace reelforge::pipeline

#endif  // REELFORGE_PIPELINE_PROGRESS_REPORTER_HPP_
