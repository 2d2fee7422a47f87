// Repository: ReelForge
// Component: Export Coordinator
// Purpose: Owns export jobs, runs them one at a time and guarantees
//          teardown on every exit path.
// Copyright (c) 2025 ReelForge

#include "reelforge/runtime/ExportCoordinator.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <utility>

#include "reelforge/audio/AudioMixer.hpp"
#include "reelforge/engine/CapabilityProbe.hpp"
#include "reelforge/engine/EngineSelector.hpp"
#include "reelforge/frame/FrameSource.hpp"
#include "reelforge/util/Logger.hpp"
#include "reelforge/util/ScopedTempDir.hpp"

namespace reelforge::runtime {

using pipeline::EngineStatus;
using pipeline::ExportError;
using pipeline::ExportResult;
using pipeline::JobState;

namespace {

constexpr char kComponent[] = "ExportCoordinator";

ExportResult CancelledResult(const std::string& message) {
  ExportResult result;
  result.state = JobState::kCancelled;
  result.error = ExportError::kCancelled;
  result.message = message;
  return result;
}

}  // namespace

ExportCoordinator::ExportCoordinator(pipeline::ExportPipelineConfig config,
                                     ExportServices services)
    : config_(std::move(config)), services_(std::move(services)) {
  util::SweepStaleTempDirs(config_.temp_root);
  worker_ = std::thread(&ExportCoordinator::WorkerLoop, this);
}

ExportCoordinator::~ExportCoordinator() {
  Shutdown();
}

SubmitResult ExportCoordinator::Submit(ExportRequest request) {
  SubmitResult submit;
  std::shared_ptr<ExportJob> job;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
      submit.error = ExportError::kRejected;
      submit.message = "coordinator is shut down";
      return submit;
    }
    if (config_.concurrency_policy == pipeline::ConcurrencyPolicy::kReject &&
        (running_ || !queue_.empty())) {
      submit.error = ExportError::kRejected;
      submit.message = "another export is in progress";
      util::Logger::Warn("[ExportCoordinator] submission rejected: " + submit.message);
      return submit;
    }
    const uint64_t id = next_job_id_++;
    job = std::make_shared<ExportJob>(id, std::move(request), config_);
    jobs_.emplace(id, job);
    queue_.push_back(job);
    submit.accepted = true;
    submit.job_id = id;
  }
  cv_.notify_all();
  util::JobLog(kComponent, submit.job_id).Info("queued");
  return submit;
}

std::shared_ptr<ExportJob> ExportCoordinator::FindJob(uint64_t job_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = jobs_.find(job_id);
  return it == jobs_.end() ? nullptr : it->second;
}

std::optional<ExportCoordinator::FinishedJob> ExportCoordinator::FindFinished(
    uint64_t job_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = finished_.find(job_id);
  if (it == finished_.end()) return std::nullopt;
  return it->second;
}

void ExportCoordinator::Cancel(uint64_t job_id) {
  std::shared_ptr<ExportJob> job;
  bool was_queued = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(job_id);
    if (it == jobs_.end()) return;
    job = it->second;
    auto queued = std::find(queue_.begin(), queue_.end(), job);
    if (queued != queue_.end()) {
      queue_.erase(queued);
      was_queued = true;
    }
  }
  if (job->finished()) return;

  util::JobLog(kComponent, job_id).Info("cancel requested");
  job->RequestCancel();
  if (was_queued) {
    Retire(job, CancelledResult("export cancelled before it started"));
    return;
  }
  // The worker owns the job; wait for its teardown.
  job->WaitResult();
}

ExportResult ExportCoordinator::Wait(uint64_t job_id) {
  std::shared_ptr<ExportJob> job = FindJob(job_id);
  if (!job) {
    // Released jobs move to the history under the same lock.
    if (auto finished = FindFinished(job_id)) return finished->result;
    ExportResult result;
    result.job_id = job_id;
    result.state = JobState::kFailed;
    result.error = ExportError::kInvalidSettings;
    result.message = "unknown job " + std::to_string(job_id);
    return result;
  }
  return job->WaitResult();
}

std::optional<JobState> ExportCoordinator::GetState(uint64_t job_id) const {
  if (std::shared_ptr<ExportJob> job = FindJob(job_id)) return job->state();
  if (auto finished = FindFinished(job_id)) return finished->result.state;
  return std::nullopt;
}

std::optional<double> ExportCoordinator::GetProgress(uint64_t job_id) const {
  if (std::shared_ptr<ExportJob> job = FindJob(job_id)) return job->progress();
  if (auto finished = FindFinished(job_id)) return finished->progress;
  return std::nullopt;
}

uint64_t ExportCoordinator::illegal_transition_total() const {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t total = retired_illegal_transitions_;
  for (const auto& entry : jobs_) total += entry.second->illegal_transition_total();
  return total;
}

size_t ExportCoordinator::pending_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size() + (running_ ? 1 : 0);
}

size_t ExportCoordinator::tracked_job_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return jobs_.size();
}

void ExportCoordinator::Retire(const std::shared_ptr<ExportJob>& job, ExportResult result) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_ == job) running_.reset();
  }
  if (!job->Finish(std::move(result))) return;

  FinishedJob record;
  record.result = job->WaitResult();
  record.progress = job->progress();

  std::lock_guard<std::mutex> lock(mutex_);
  if (config_.finished_job_history > 0) {
    finished_[job->id()] = std::move(record);
    finished_order_.push_back(job->id());
    while (finished_order_.size() > config_.finished_job_history) {
      finished_.erase(finished_order_.front());
      finished_order_.pop_front();
    }
  }
  retired_illegal_transitions_ += job->illegal_transition_total();
  jobs_.erase(job->id());
}

void ExportCoordinator::Shutdown() {
  std::deque<std::shared_ptr<ExportJob>> pending;
  std::shared_ptr<ExportJob> running;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
    pending.swap(queue_);
    running = running_;
  }
  cv_.notify_all();

  for (const auto& job : pending) {
    job->RequestCancel();
    Retire(job, CancelledResult("coordinator shut down"));
  }
  if (running) running->RequestCancel();
  if (worker_.joinable()) worker_.join();
}

void ExportCoordinator::WorkerLoop() {
  for (;;) {
    std::shared_ptr<ExportJob> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
      if (queue_.empty()) return;
      job = queue_.front();
      queue_.pop_front();
      running_ = job;
    }
    Retire(job, RunJob(job));
  }
}

ExportResult ExportCoordinator::RunJob(const std::shared_ptr<ExportJob>& job) {
  const uint64_t id = job->id();
  const util::JobLog job_log(kComponent, id);
  ExportRequest& request = job->request();

  std::string invalid = pipeline::NormalizeSettings(&request.settings);
  if (invalid.empty()) invalid = pipeline::ValidateElements(request.elements);
  if (!invalid.empty()) {
    job_log.Error("invalid settings: " + invalid);
    ExportResult result;
    result.state = JobState::kFailed;
    result.error = ExportError::kInvalidSettings;
    result.message = "invalid export settings: " + invalid;
    return result;
  }
  if (job->cancel_requested() || !job->TransitionTo(JobState::kPreparing)) {
    return CancelledResult("export cancelled before it started");
  }

  const pipeline::ExportSettings& settings = request.settings;
  pipeline::SourceResolver resolver =
      request.resolver ? request.resolver : pipeline::FilePathResolver();

  std::shared_ptr<frame::IVisualSourceProvider> visual =
      services_.visual_source_factory ? services_.visual_source_factory(resolver) : nullptr;
  auto frames = std::make_unique<frame::FrameSource>(settings, request.elements, visual);

  audio::MixerConfig mixer_config;
  mixer_config.decode_timeout_ms = config_.source_decode_timeout_ms;
  mixer_config.fail_on_decode_error = config_.fail_on_source_decode_error;
  mixer_config.master_gain = config_.master_gain;
  auto mixer = std::make_unique<audio::AudioMixer>(mixer_config, services_.audio_decoder,
                                                   services_.decode_cache, resolver);
  std::unique_ptr<engine::IBackendEngine> engine;

  EngineStatus status = [&]() -> EngineStatus {
    EngineStatus s = mixer->Prepare(request.elements, settings.duration_seconds,
                                    job->cancel_flag());
    if (!s.ok) return s;
    job->ReportPhase(JobState::kPreparing, 0.5);

    const pipeline::CapabilityProfile profile =
        services_.capability_probe ? services_.capability_probe(settings)
                                   : engine::ProbeCapabilities(config_, settings);
    const std::vector<engine::EngineCandidate> order =
        request.preferred_order.empty()
            ? engine::EngineSelector::DefaultOrder(config_.execution_context)
            : request.preferred_order;

    engine::EngineSelector selector(services_.engine_factory);
    engine::EngineSelection selection =
        selector.SelectAndInitialize(profile, order, settings, job->cancel_flag());
    if (!selection.status.ok) return selection.status;

    engine = std::move(selection.engine);
    job->set_backend(engine->name());
    job->AttachEngine(engine.get());
    if (job->cancel_requested()) {
      return EngineStatus::Failure(ExportError::kCancelled, "export cancelled");
    }
    job->ReportPhase(JobState::kPreparing, 1.0);

    if (!job->TransitionTo(JobState::kEncoding)) {
      return EngineStatus::Failure(ExportError::kIo, "job refused to enter Encoding");
    }
    engine::EngineContext ctx;
    ctx.job_id = id;
    ctx.settings = settings;
    ctx.frames = frames.get();
    ctx.mixer = mixer.get();
    if (settings.allow_stream_copy) {
      engine::StreamCopyPlan plan = engine::PlanStreamCopy(settings, request.elements, resolver,
                                                           services_.video_inspector);
      if (plan.eligible) {
        job_log.Info("stream copy of " + std::to_string(plan.segments.size()) + " segment(s)");
        ctx.stream_copy_segments = std::move(plan.segments);
      } else {
        job_log.Info("rendering frames: " + plan.reason);
      }
    }
    ctx.cancel = job->cancel_flag();
    ctx.deadline = std::chrono::steady_clock::now() +
                   std::chrono::milliseconds(
                       config_.EffectiveEncodeTimeoutMs(settings.duration_seconds));
    ctx.progress = [job](JobState phase, double fraction) {
      job->ReportPhase(phase, fraction);
    };

    s = engine->Encode(ctx);
    if (!s.ok) return s;

    if (!job->TransitionTo(JobState::kMuxing)) {
      return EngineStatus::Failure(ExportError::kIo, "job refused to enter Muxing");
    }
    return engine->Mux(ctx);
  }();

  // Teardown before anything becomes observable as terminal.
  std::vector<pipeline::ExportWarning> warnings = mixer->warnings();
  warnings.insert(warnings.end(), frames->warnings().begin(), frames->warnings().end());
  job->DetachEngine();
  if (engine) {
    engine->Release();
    engine.reset();
  }
  mixer->Release();
  mixer.reset();
  frames->Release();
  frames.reset();
  visual.reset();

  ExportResult result;
  result.warnings = std::move(warnings);
  if (status.ok) {
    result.state = JobState::kCompleted;
    result.output_path = settings.output_path;
    std::ostringstream oss;
    oss << "completed backend=" << job->backend() << " output=" << settings.output_path;
    if (!result.warnings.empty()) oss << " (exported with " << result.warnings.size() << " gap(s))";
    job_log.Info(oss.str());
  } else if (status.error == ExportError::kCancelled || job->cancel_requested()) {
    result = CancelledResult(status.message.empty() ? "export cancelled" : status.message);
    job_log.Info("cancelled");
  } else {
    result.state = JobState::kFailed;
    result.error = status.error;
    result.message = status.message;
    result.diagnostic = status.diagnostic;
    job_log.Error(std::string("failed: ") + pipeline::ExportErrorToString(status.error) + ": " +
                  status.message);
  }
  return result;
}

}  // namespace reelforge::runtime
