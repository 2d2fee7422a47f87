// Repository: ReelForge
// Component: Export Pipeline Config
// Purpose: Tunables for the export pipeline, with environment overrides.
// Copyright (c) 2025 ReelForge

#include "reelforge/pipeline/ExportConfig.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

#include "reelforge/util/Logger.hpp"

namespace reelforge::pipeline {

namespace {

const char* Env(const char* name) {
  const char* v = std::getenv(name);
  return (v != nullptr && v[0] != '\0') ? v : nullptr;
}

bool ParseInt64(const char* name, const char* text, int64_t* out) {
  char* end = nullptr;
  long long v = std::strtoll(text, &end, 10);
  if (end == text || *end != '\0' || v < 0) {
    util::Logger::Warn(std::string("[ExportConfig] ignoring ") + name + "=" + text +
                       " (expected non-negative integer)");
    return false;
  }
  *out = static_cast<int64_t>(v);
  return true;
}

}  // namespace

int64_t ExportPipelineConfig::EffectiveEncodeTimeoutMs(double duration_seconds) const {
  if (encode_timeout_ms > 0) return encode_timeout_ms;
  return 60'000 + static_cast<int64_t>(duration_seconds * 20'000.0);
}

ExportPipelineConfig ExportPipelineConfig::FromEnvironment() {
  ExportPipelineConfig config;

  std::error_code ec;
  auto tmp = std::filesystem::temp_directory_path(ec);
  config.temp_root = ec ? "/tmp" : tmp.string();

  if (const char* v = Env("REELFORGE_TEMP_ROOT")) config.temp_root = v;
  if (const char* v = Env("REELFORGE_HOST_PATH")) config.host_binary_path = v;
  if (const char* v = Env("REELFORGE_FFMPEG_PATH")) config.encoder_binary_path = v;

  int64_t n = 0;
  if (const char* v = Env("REELFORGE_DECODE_TIMEOUT_MS")) {
    if (ParseInt64("REELFORGE_DECODE_TIMEOUT_MS", v, &n)) {
      config.source_decode_timeout_ms = static_cast<int>(n);
    }
  }
  if (const char* v = Env("REELFORGE_ENCODE_TIMEOUT_MS")) {
    if (ParseInt64("REELFORGE_ENCODE_TIMEOUT_MS", v, &n)) config.encode_timeout_ms = n;
  }
  if (const char* v = Env("REELFORGE_FRAME_MEMORY_MB")) {
    if (ParseInt64("REELFORGE_FRAME_MEMORY_MB", v, &n) && n > 0) {
      config.frame_memory_ceiling_bytes = static_cast<size_t>(n) * 1024u * 1024u;
    }
  }
  if (const char* v = Env("REELFORGE_AUDIO_CACHE_MB")) {
    if (ParseInt64("REELFORGE_AUDIO_CACHE_MB", v, &n)) {
      config.audio_cache_budget_bytes = static_cast<size_t>(n) * 1024u * 1024u;
    }
  }
  if (const char* v = Env("REELFORGE_JOB_HISTORY")) {
    if (ParseInt64("REELFORGE_JOB_HISTORY", v, &n)) {
      config.finished_job_history = static_cast<size_t>(n);
    }
  }
  if (const char* v = Env("REELFORGE_STRICT_DECODE")) {
    std::string s(v);
    config.fail_on_source_decode_error = (s == "1" || s == "true" || s == "yes");
  }
  if (const char* v = Env("REELFORGE_CONCURRENCY")) {
    std::string s(v);
    if (s == "reject") {
      config.concurrency_policy = ConcurrencyPolicy::kReject;
    } else if (s == "queue") {
      config.concurrency_policy = ConcurrencyPolicy::kQueue;
    } else {
      util::Logger::Warn("[ExportConfig] ignoring REELFORGE_CONCURRENCY=" + s);
    }
  }
  return config;
}

}  // namespace reelforge::pipeline
