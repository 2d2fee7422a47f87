// Repository: ReelForge
// Component: Export Pipeline Config
// Purpose: Tunables for the export pipeline, with environment overrides.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_PIPELINE_EXPORT_CONFIG_HPP_
#define REELFORGE_PIPELINE_EXPORT_CONFIG_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

namespace reelforge::pipeline {

// Which default engine order applies (see EngineSelector::DefaultOrder).
enum class ExecutionContext {
  kNative = 0,  // native binaries may be spawned
  kSandboxed,   // in-process facilities only
};

// What Submit() does while another job is queued or running.
enum class ConcurrencyPolicy {
  kQueue = 0,
  kReject,
};

struct ExportPipelineConfig {
  // Per-job temp directories are created below this root.
  std::string temp_root;

  // Out-of-process encode host and the encoder binary it drives.
  std::string host_binary_path = "reelforge_export_host";
  std::string encoder_binary_path = "ffmpeg";

  // Audio preparation.
  int source_decode_timeout_ms = 10000;
  // Byte budget of the shared decoded-audio cache; least recently used
  // entries are evicted past it.
  size_t audio_cache_budget_bytes = 512u * 1024u * 1024u;
  bool fail_on_source_decode_error = false;
  double master_gain = 1.0;

  // Scheduling.
  ConcurrencyPolicy concurrency_policy = ConcurrencyPolicy::kQueue;
  ExecutionContext execution_context = ExecutionContext::kNative;
  // Terminal results kept for Wait/GetState after a job is released.
  // Oldest first out; 0 keeps none.
  size_t finished_job_history = 32;

  // In-process software encoder buffering.
  size_t software_queue_depth = 8;
  size_t frame_memory_ceiling_bytes = 256u * 1024u * 1024u;

  // Wall-clock budget for Encoding + Muxing. 0 = derive from duration.
  int64_t encode_timeout_ms = 0;

  // Progress callback coalescing.
  int progress_min_interval_ms = 100;
  double progress_min_delta = 0.01;

  // Effective timeout for a job of the given duration.
  int64_t EffectiveEncodeTimeoutMs(double duration_seconds) const;

  // Defaults with REELFORGE_* environment overrides applied.
  static ExportPipelineConfig FromEnvironment();
};

}  // namespace reelforge::pipeline

#endif  // REELFORGE_PIPELINE_EXPORT_CONFIG_HPP_
