// Repository: ReelForge
// Component: Export Coordinator
// Purpose: Owns export jobs, runs them one at a time and guarantees
//          teardown on every exit path.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_RUNTIME_EXPORT_COORDINATOR_HPP_
#define REELFORGE_RUNTIME_EXPORT_COORDINATOR_HPP_

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>

#include "reelforge/audio/AudioDecodeCache.hpp"
#include "reelforge/audio/AudioDecoder.hpp"
#include "reelforge/engine/BackendEngine.hpp"
#include "reelforge/engine/StreamCopyPlanner.hpp"
#include "reelforge/frame/VisualSourceProvider.hpp"
#include "reelforge/pipeline/ExportConfig.hpp"
#include "reelforge/pipeline/ExportTypes.hpp"
#include "reelforge/runtime/ExportJob.hpp"

namespace reelforge::runtime {

// Collaborators the coordinator builds jobs from. Tests replace any of
// them with fakes.
struct ExportServices {
  std::shared_ptr<audio::IAudioDecoder> audio_decoder;
  // Shared across jobs; may be null.
  std::shared_ptr<audio::AudioDecodeCache> decode_cache;
  std::function<std::shared_ptr<frame::IVisualSourceProvider>(pipeline::SourceResolver)>
      visual_source_factory;
  engine::EngineFactory engine_factory;
  // Null means ProbeCapabilities() against the coordinator's config.
  std::function<pipeline::CapabilityProfile(const pipeline::ExportSettings&)>
      capability_probe;
  // Compares source encodings before a stream copy is planned. Null trusts
  // ExportSettings::allow_stream_copy.
  engine::VideoStreamInspector video_inspector;
};

// Production services: FFmpeg decoders, encoders and image writer, the
// three engines wired to `config`.
ExportServices DefaultServices(const pipeline::ExportPipelineConfig& config);

struct SubmitResult {
  bool accepted = false;
  uint64_t job_id = 0;
  pipeline::ExportError error = pipeline::ExportError::kNone;
  std::string message;
};

// ExportCoordinator
//
// A single worker thread runs jobs in submission order, so at most one job
// is ever past Queued. With ConcurrencyPolicy::kReject a submission is
// refused while another job is queued or running.
//
// Per job the worker: validates settings, prepares the mixer and Frame
// Source (Preparing), selects and initializes an engine, runs Encode()
// (Encoding) and Mux() (Muxing), then releases the engine, mixer and
// Frame Source before the terminal state is published.
//
// A job stops counting as running before its terminal state is published,
// so once Wait() or Cancel() returned the coordinator is idle. Finished jobs
// are then released; their result and final progress stay answerable for
// the newest `finished_job_history` ids.
//
// Cancel() blocks until that teardown finished. It must not be called from
// inside a progress callback.
class ExportCoordinator {
 public:
  ExportCoordinator(pipeline::ExportPipelineConfig config, ExportServices services);
  ~ExportCoordinator();

  ExportCoordinator(const ExportCoordinator&) = delete;
  ExportCoordinator& operator=(const ExportCoordinator&) = delete;

  SubmitResult Submit(ExportRequest request);

  // Idempotent; a no-op for unknown or finished jobs.
  void Cancel(uint64_t job_id);

  // Blocks until the job finished. Unknown ids yield a Failed result.
  pipeline::ExportResult Wait(uint64_t job_id);

  std::optional<pipeline::JobState> GetState(uint64_t job_id) const;
  std::optional<double> GetProgress(uint64_t job_id) const;

  // Cancels queued and running jobs and joins the worker. Idempotent.
  void Shutdown();

  // Sum over all jobs, released ones included.
  uint64_t illegal_transition_total() const;
  size_t pending_count() const;
  // Jobs still holding their request: queued, running or being retired.
  size_t tracked_job_count() const;
  const pipeline::ExportPipelineConfig& config() const { return config_; }

 private:
  struct FinishedJob {
    pipeline::ExportResult result;
    double progress = 0.0;
  };

  void WorkerLoop();
  pipeline::ExportResult RunJob(const std::shared_ptr<ExportJob>& job);
  // Clears running_, publishes `result` and moves the job into the history.
  void Retire(const std::shared_ptr<ExportJob>& job, pipeline::ExportResult result);
  std::shared_ptr<ExportJob> FindJob(uint64_t job_id) const;
  std::optional<FinishedJob> FindFinished(uint64_t job_id) const;

  const pipeline::ExportPipelineConfig config_;
  ExportServices services_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::shared_ptr<ExportJob>> queue_;
  std::unordered_map<uint64_t, std::shared_ptr<ExportJob>> jobs_;
  std::shared_ptr<ExportJob> running_;
  std::map<uint64_t, FinishedJob> finished_;
  std::deque<uint64_t> finished_order_;
  uint64_t retired_illegal_transitions_ = 0;
  uint64_t next_job_id_ = 1;
  bool shutdown_ = false;
  std::thread worker_;
};

}  // namespace reelforge::runtime

#endif  // REELFORGE_RUNTIME_EXPORT_COORDINATOR_HPP_
