// Repository: ReelForge
// Component: Capability Probe
// Purpose: Builds the per-job capability profile the engine selector
//          evaluates.
// Copyright (c) 2025 ReelForge

#include "reelforge/engine/CapabilityProbe.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <thread>
#include <vector>

#include <unistd.h>

#include "reelforge/util/ChildProcess.hpp"
#include "reelforge/util/Logger.hpp"

namespace reelforge::engine {

namespace {

constexpr uint64_t kGiB = 1024ull * 1024ull * 1024ull;
constexpr int kBenchmarkSize = 256;
constexpr int kBenchmarkPasses = 8;
// Canvas, two queued copies, encoder reference frames.
constexpr uint64_t kFrameWorkingSetFactor = 10;

uint64_t PhysicalMemoryBytes() {
  const long pages = sysconf(_SC_PHYS_PAGES);
  const long page_size = sysconf(_SC_PAGESIZE);
  if (pages <= 0 || page_size <= 0) return 0;
  return static_cast<uint64_t>(pages) * static_cast<uint64_t>(page_size);
}

}  // namespace

int ComputePerformanceScore(const ProbeFacts& facts) {
  double score = 0.0;
  score += std::min(3.0 * facts.cpu_cores, 30.0);
  score += std::min(3.0 * (static_cast<double>(facts.ram_bytes) / kGiB), 25.0);
  score += 5.0 + std::min(std::max(facts.compositing_mpix_per_sec, 0.0) / 10.0, 20.0);
  if (facts.has_hardware_decode) score += 8.0;
  if (facts.has_shared_memory) score += 6.0;
  if (facts.has_native_process) score += 4.0;
  return std::clamp(static_cast<int>(score), 0, 100);
}

uint64_t EstimateJobMemoryBytes(const pipeline::ExportSettings& settings) {
  const uint64_t frame_bytes =
      static_cast<uint64_t>(std::max(settings.width, 0)) *
      static_cast<uint64_t>(std::max(settings.height, 0)) * 4;
  const uint64_t mix_bytes =
      static_cast<uint64_t>(std::max(settings.duration_seconds, 0.0) * pipeline::kMixSampleRate) *
      pipeline::kMixChannels * sizeof(float);
  return frame_bytes * kFrameWorkingSetFactor + mix_bytes;
}

pipeline::CapabilityProfile BuildCapabilityProfile(const ProbeFacts& facts,
                                                   const pipeline::ExportSettings& settings) {
  pipeline::CapabilityProfile profile;
  profile.has_native_process = facts.has_native_process;
  profile.has_shared_memory = facts.has_shared_memory;
  profile.has_hardware_decode = facts.has_hardware_decode;
  profile.estimated_ram_bytes = facts.ram_bytes;
  profile.performance_score = ComputePerformanceScore(facts);
  profile.estimated_job_memory_bytes = EstimateJobMemoryBytes(settings);
  return profile;
}

double MeasureCompositingThroughput() {
  const size_t bytes = static_cast<size_t>(kBenchmarkSize) * kBenchmarkSize * 4;
  std::vector<uint8_t> dst(bytes, 0);
  std::vector<uint8_t> src(bytes);
  for (size_t i = 0; i < bytes; ++i) src[i] = static_cast<uint8_t>((i * 37) & 0xFF);

  const auto start = std::chrono::steady_clock::now();
  for (int pass = 0; pass < kBenchmarkPasses; ++pass) {
    for (size_t i = 0; i < bytes; i += 4) {
      const uint32_t a = src[i + 3];
      const uint32_t inv = 255 - a;
      dst[i] = static_cast<uint8_t>((src[i] * a + dst[i] * inv + 127) / 255);
      dst[i + 1] = static_cast<uint8_t>((src[i + 1] * a + dst[i + 1] * inv + 127) / 255);
      dst[i + 2] = static_cast<uint8_t>((src[i + 2] * a + dst[i + 2] * inv + 127) / 255);
      dst[i + 3] = 255;
    }
  }
  const double seconds =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
  // Keep the result observable so the loop is not optimized out.
  volatile uint8_t sink = dst[bytes / 2];
  (void)sink;
  if (seconds <= 0.0) return 1000.0;
  const double pixels = static_cast<double>(kBenchmarkSize) * kBenchmarkSize * kBenchmarkPasses;
  return pixels / seconds / 1e6;
}

pipeline::CapabilityProfile ProbeCapabilities(const pipeline::ExportPipelineConfig& config,
                                              const pipeline::ExportSettings& settings) {
  ProbeFacts facts;
  facts.cpu_cores = std::max(1u, std::thread::hardware_concurrency());
  facts.ram_bytes = PhysicalMemoryBytes();
  facts.compositing_mpix_per_sec = MeasureCompositingThroughput();
  facts.has_native_process = util::IsExecutableOnPath(config.host_binary_path) &&
                             util::IsExecutableOnPath(config.encoder_binary_path);
  facts.has_shared_memory = access("/dev/shm", W_OK) == 0;
  facts.has_hardware_decode = access("/dev/dri/renderD128", R_OK) == 0;

  pipeline::CapabilityProfile profile = BuildCapabilityProfile(facts, settings);

  std::ostringstream oss;
  oss << "[CapabilityProbe] cores=" << facts.cpu_cores
      << " ram=" << (facts.ram_bytes / (1024 * 1024)) << "MiB"
      << " native=" << facts.has_native_process << " shm=" << facts.has_shared_memory
      << " hwdec=" << facts.has_hardware_decode << " score=" << profile.performance_score;
  util::Logger::Debug(oss.str());
  return profile;
}

}  // namespace reelforge::engine
