// Repository: ReelForge
// Component: Capability Probe
// Purpose: Builds the per-job capability profile the engine selector
//          evaluates.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_ENGINE_CAPABILITY_PROBE_HPP_
#define REELFORGE_ENGINE_CAPABILITY_PROBE_HPP_

#include <cstdint>

#include "reelforge/pipeline/ExportConfig.hpp"
#include "reelforge/pipeline/ExportTypes.hpp"

namespace reelforge::engine {

// Raw facts about the machine; the profile is derived from these.
struct ProbeFacts {
  unsigned cpu_cores = 1;
  uint64_t ram_bytes = 0;
  double compositing_mpix_per_sec = 0.0;
  bool has_native_process = false;
  bool has_shared_memory = false;
  bool has_hardware_decode = false;
};

// Score in [0, 100]:
//   cores      min(3 * cores, 30)
//   memory     min(3 * GiB, 25)
//   compositor 5 + min(mpix/s / 10, 20)
//   bonuses    hardware decode 8, shared memory 6, native process 4
int ComputePerformanceScore(const ProbeFacts& facts);

// Raw frame working set (canvas, queued copies, encoder references) plus
// the float mix for the whole duration.
uint64_t EstimateJobMemoryBytes(const pipeline::ExportSettings& settings);

pipeline::CapabilityProfile BuildCapabilityProfile(const ProbeFacts& facts,
                                                   const pipeline::ExportSettings& settings);

// Measures how fast this machine blends RGBA pixels, in megapixels/second.
double MeasureCompositingThroughput();

// Gathers ProbeFacts for this machine and builds the profile. Native
// process support requires both the export host and the encoder binary.
pipeline::CapabilityProfile ProbeCapabilities(const pipeline::ExportPipelineConfig& config,
                                              const pipeline::ExportSettings& settings);

}  // namespace reelforge::engine

#endif  // REELFORGE_ENGINE_CAPABILITY_PROBE_HPP_
