// Repository: ReelForge
// Component: Export Job
// Purpose: One export request with its state machine, progress, cancel
//          flag and result.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_RUNTIME_EXPORT_JOB_HPP_
#define REELFORGE_RUNTIME_EXPORT_JOB_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "reelforge/engine/BackendEngine.hpp"
#include "reelforge/pipeline/ExportConfig.hpp"
#include "reelforge/pipeline/ExportTypes.hpp"
#include "reelforge/pipeline/ProgressReporter.hpp"

namespace reelforge::runtime {

struct ExportRequest {
  pipeline::ExportSettings settings;
  std::vector<pipeline::TimelineElement> elements;
  // Null means every sourceRef is a file path.
  pipeline::SourceResolver resolver;
  pipeline::ProgressCallback on_progress;
  // Empty means the default order for the configured execution context.
  std::vector<engine::EngineCandidate> preferred_order;
};

// ExportJob
//
// Legal transitions:
//   Queued -> Preparing -> Encoding -> Muxing -> Completed
//   any non-terminal -> Failed | Cancelled
// Anything else is refused and counted in illegal_transition_total().
//
// Mutated only by the coordinator. RequestCancel() and the accessors are
// safe from any thread.
class ExportJob {
 public:
  ExportJob(uint64_t id, ExportRequest request, const pipeline::ExportPipelineConfig& config);

  ExportJob(const ExportJob&) = delete;
  ExportJob& operator=(const ExportJob&) = delete;

  uint64_t id() const { return id_; }
  ExportRequest& request() { return request_; }
  const ExportRequest& request() const { return request_; }
  std::chrono::system_clock::time_point created_at() const { return created_at_; }

  static bool IsLegalTransition(pipeline::JobState from, pipeline::JobState to);
  bool TransitionTo(pipeline::JobState next);
  pipeline::JobState state() const;
  uint64_t illegal_transition_total() const;

  // Phase progress while the job is in `phase`; dropped otherwise.
  void ReportPhase(pipeline::JobState phase, double fraction);
  double progress() const { return reporter_.progress(); }

  std::string backend() const;
  void set_backend(const std::string& backend);

  // Raises the cancel flag and forwards to the running engine, if any.
  void RequestCancel();
  bool cancel_requested() const { return cancel_.load(std::memory_order_acquire); }
  const std::atomic<bool>* cancel_flag() const { return &cancel_; }

  void AttachEngine(engine::IBackendEngine* engine);
  void DetachEngine();

  // Moves the job to `result.state`, delivers the terminal progress event,
  // drops the request's elements and callbacks and wakes waiters. Called
  // once, after teardown finished; false when the job was already terminal.
  bool Finish(pipeline::ExportResult result);
  bool finished() const;
  pipeline::ExportResult WaitResult() const;

 private:
  const uint64_t id_;
  ExportRequest request_;
  const std::chrono::system_clock::time_point created_at_;
  pipeline::ProgressReporter reporter_;
  std::atomic<bool> cancel_{false};

  mutable std::mutex mutex_;
  mutable std::condition_variable done_cv_;
  pipeline::JobState state_ = pipeline::JobState::kQueued;
  uint64_t illegal_transition_total_ = 0;
  std::string backend_;
  engine::IBackendEngine* engine_ = nullptr;
  bool finished_ = false;
  pipeline::ExportResult result_;
};

}  // namespace reelforge::runtime

#endif  // REELFORGE_RUNTIME_EXPORT_JOB_HPP_
