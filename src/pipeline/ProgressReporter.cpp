// Repository: ReelForge
// Component: Progress Reporter
// Purpose: Monotonic, coalesced job progress delivery.
// Copyright (c) 2025 ReelForge

#include "reelforge/pipeline/ProgressReporter.hpp"

#include <algorithm>
#include <cmath>

namespace reelforge::pipeline {

ProgressReporter::ProgressReporter(ProgressCallback callback, int min_interval_ms,
                                   double min_delta)
    : callback_(std::move(callback)),
      min_interval_(std::max(0, min_interval_ms)),
      min_delta_(std::max(0.0, min_delta)) {}

double ProgressReporter::MapToOverall(JobState state, double fraction) {
  double f = std::clamp(std::isfinite(fraction) ? fraction : 0.0, 0.0, 1.0);
  switch (state) {
    case JobState::kQueued:
      return 0.0;
    case JobState::kPreparing:
      return 0.05 * f;
    case JobState::kEncoding:
      return 0.05 + 0.85 * f;
    case JobState::kMuxing:
      return 0.90 + (kMaxNonTerminalProgress - 0.90) * f;
    case JobState::kCompleted:
      return 1.0;
    case JobState::kFailed:
    case JobState::kCancelled:
      return 0.0;
  }
  return 0.0;
}

void ProgressReporter::ReportPhase(JobState state, double fraction) {
  if (IsTerminal(state)) {
    ReportTerminal(state);
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (terminal_) return;

  double value = std::min(MapToOverall(state, fraction), kMaxNonTerminalProgress);
  progress_ = std::max(progress_, value);
  state_ = state;
  DeliverLocked(progress_, state_, false);
}

void ProgressReporter::ReportTerminal(JobState state) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (terminal_) return;
  terminal_ = true;
  state_ = state;
  if (state == JobState::kCompleted) {
    progress_ = 1.0;
  }
  DeliverLocked(progress_, state_, true);
  // Nothing is delivered after the terminal event.
  callback_ = nullptr;
}

void ProgressReporter::DeliverLocked(double value, JobState state, bool force) {
  auto now = std::chrono::steady_clock::now();
  if (!force && any_delivered_) {
    bool state_changed = state != last_delivered_state_;
    bool moved = (value - last_delivered_) >= min_delta_;
    bool interval_elapsed = (now - last_delivery_time_) >= min_interval_;
    if (value <= last_delivered_ && !state_changed) return;
    if (!state_changed && !moved && !interval_elapsed) return;
  }
  any_delivered_ = true;
  last_delivered_ = value;
  last_delivered_state_ = state;
  last_delivery_time_ = now;
  ++delivered_count_;
  if (callback_) {
    callback_(value, state);
  }
}

double ProgressReporter::progress() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return progress_;
}

JobState ProgressReporter::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

bool ProgressReporter::terminal() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return terminal_;
}

uint64_t ProgressReporter::delivered_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return delivered_count_;
}

}  // namespace reelforge::pipeline
