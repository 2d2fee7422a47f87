// Repository: ReelForge
// Component: Export Job
// Purpose: One export request with its state machine, progress, cancel
//          flag and result.
// Copyright (c) 2025 ReelForge

#include "reelforge/runtime/ExportJob.hpp"

#include <utility>

#include "reelforge/util/Logger.hpp"

namespace reelforge::runtime {

using pipeline::JobState;

ExportJob::ExportJob(uint64_t id, ExportRequest request,
                     const pipeline::ExportPipelineConfig& config)
    : id_(id),
      request_(std::move(request)),
      created_at_(std::chrono::system_clock::now()),
      reporter_(request_.on_progress, config.progress_min_interval_ms,
                config.progress_min_delta) {}

bool ExportJob::IsLegalTransition(JobState from, JobState to) {
  if (pipeline::IsTerminal(from)) return false;
  if (to == JobState::kFailed || to == JobState::kCancelled) return true;
  switch (from) {
    case JobState::kQueued: return to == JobState::kPreparing;
    case JobState::kPreparing: return to == JobState::kEncoding;
    case JobState::kEncoding: return to == JobState::kMuxing;
    case JobState::kMuxing: return to == JobState::kCompleted;
    default: return false;
  }
}

bool ExportJob::TransitionTo(JobState next) {
  JobState from;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    from = state_;
    if (!IsLegalTransition(from, next)) {
      ++illegal_transition_total_;
      util::JobLog("ExportJob", id_).Error(std::string("illegal transition ") +
                                           pipeline::JobStateToString(from) + " -> " +
                                           pipeline::JobStateToString(next));
      return false;
    }
    state_ = next;
  }
  util::JobLog("ExportJob", id_).Debug(std::string(pipeline::JobStateToString(from)) + " -> " +
                                       pipeline::JobStateToString(next));
  if (!pipeline::IsTerminal(next)) {
    reporter_.ReportPhase(next, 0.0);
  }
  return true;
}

JobState ExportJob::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

uint64_t ExportJob::illegal_transition_total() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return illegal_transition_total_;
}

void ExportJob::ReportPhase(JobState phase, double fraction) {
  if (state() != phase) return;
  reporter_.ReportPhase(phase, fraction);
}

std::string ExportJob::backend() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return backend_;
}

void ExportJob::set_backend(const std::string& backend) {
  std::lock_guard<std::mutex> lock(mutex_);
  backend_ = backend;
}

void ExportJob::RequestCancel() {
  cancel_.store(true, std::memory_order_release);
  std::lock_guard<std::mutex> lock(mutex_);
  if (engine_) engine_->Cancel();
}

void ExportJob::AttachEngine(engine::IBackendEngine* engine) {
  std::lock_guard<std::mutex> lock(mutex_);
  engine_ = engine;
}

void ExportJob::DetachEngine() {
  std::lock_guard<std::mutex> lock(mutex_);
  engine_ = nullptr;
}

bool ExportJob::Finish(pipeline::ExportResult result) {
  if (!TransitionTo(result.state)) {
    // Already terminal; the first outcome stands.
    return false;
  }
  result.job_id = id_;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (result.backend.empty()) result.backend = backend_;
  }
  reporter_.ReportTerminal(result.state);

  // Only the coordinator touches request_, and it is done with it here.
  ExportRequest released;
  released.settings = request_.settings;
  std::swap(request_, released);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    result_ = std::move(result);
    finished_ = true;
  }
  done_cv_.notify_all();
  return true;
}

bool ExportJob::finished() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return finished_;
}

pipeline::ExportResult ExportJob::WaitResult() const {
  std::unique_lock<std::mutex> lock(mutex_);
  done_cv_.wait(lock, [this] { return finished_; });
  return result_;
}

}  // namespace reelforge::runtime
