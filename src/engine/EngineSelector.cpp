// Repository: ReelForge
// Component: Engine Selector
// Purpose: Maps a capability profile and a preference order to one backend
//          engine, falling back when initialization fails.
// Copyright (c) 2025 ReelForge

#include "reelforge/engine/EngineSelector.hpp"

#include <algorithm>
#include <sstream>

#include "reelforge/util/Logger.hpp"

namespace reelforge::engine {

using pipeline::CapabilityProfile;
using pipeline::EngineStatus;
using pipeline::ExportError;

EngineSelector::EngineSelector(EngineFactory factory) : factory_(std::move(factory)) {}

std::vector<EngineCandidate> EngineSelector::DefaultOrder(pipeline::ExecutionContext context) {
  if (context == pipeline::ExecutionContext::kNative) {
    return {
        {EngineKind::kExternalProcess, EngineTier::kHigh},
        {EngineKind::kSoftwareEncoder, EngineTier::kMid},
        {EngineKind::kSandboxedRecorder, EngineTier::kBaseline},
    };
  }
  return {
      {EngineKind::kSandboxedRecorder, EngineTier::kHigh},
      {EngineKind::kSoftwareEncoder, EngineTier::kMid},
      {EngineKind::kSandboxedRecorder, EngineTier::kBaseline},
  };
}

EngineCandidate EngineSelector::Fallback() {
  return {EngineKind::kSandboxedRecorder, EngineTier::kBaseline};
}

bool EngineSelector::IsSupported(const EngineCandidate& candidate,
                                 const CapabilityProfile& profile) {
  switch (candidate.kind) {
    case EngineKind::kExternalProcess:
      return profile.has_native_process;
    case EngineKind::kSoftwareEncoder:
      return profile.has_shared_memory && profile.performance_score >= kMidTierMinScore;
    case EngineKind::kSandboxedRecorder:
      switch (candidate.tier) {
        case EngineTier::kBaseline:
          return true;
        case EngineTier::kMid:
          return profile.performance_score >= kMidTierMinScore;
        case EngineTier::kHigh:
          return profile.has_hardware_decode &&
                 profile.estimated_ram_bytes >= kHighTierMinRamBytes &&
                 profile.performance_score >= kHighTierMinScore &&
                 static_cast<double>(profile.estimated_job_memory_bytes) <
                     kHighTierMaxRamShare * static_cast<double>(profile.estimated_ram_bytes);
      }
  }
  return false;
}

std::vector<EngineCandidate> EngineSelector::WithFallback(std::vector<EngineCandidate> order) {
  if (std::find(order.begin(), order.end(), Fallback()) == order.end()) {
    order.push_back(Fallback());
  }
  return order;
}

EngineCandidate EngineSelector::Select(const CapabilityProfile& profile,
                                       const std::vector<EngineCandidate>& preferred_order) {
  for (const auto& candidate : WithFallback(preferred_order)) {
    if (IsSupported(candidate, profile)) return candidate;
  }
  // Unreachable: the fallback is always supported.
  return Fallback();
}

EngineSelection EngineSelector::SelectAndInitialize(
    const CapabilityProfile& profile, const std::vector<EngineCandidate>& preferred_order,
    const pipeline::ExportSettings& settings, const std::atomic<bool>* cancel) const {
  EngineSelection selection;
  std::vector<std::string> failures;

  for (const auto& candidate : WithFallback(preferred_order)) {
    if (!IsSupported(candidate, profile)) {
      util::Logger::Debug("[EngineSelector] " + candidate.Describe() + " not supported");
      continue;
    }
    if (cancel != nullptr && cancel->load(std::memory_order_acquire)) {
      selection.status = EngineStatus::Failure(ExportError::kCancelled, "export cancelled");
      return selection;
    }

    std::unique_ptr<IBackendEngine> engine = factory_ ? factory_(candidate) : nullptr;
    EngineStatus status =
        engine ? engine->Initialize(settings)
               : EngineStatus::Failure(ExportError::kEngineInitialization,
                                       "no implementation available");
    if (status.ok) {
      if (!failures.empty()) {
        util::Logger::Warn("[EngineSelector] degraded mode: exporting with " +
                           candidate.Describe() + " after " +
                           std::to_string(failures.size()) + " failed candidate(s)");
      } else {
        util::Logger::Info("[EngineSelector] selected " + candidate.Describe());
      }
      selection.engine = std::move(engine);
      selection.candidate = candidate;
      selection.status = status;
      selection.degraded = std::move(failures);
      return selection;
    }

    std::string failure = candidate.Describe() + ": " + status.message;
    util::Logger::Warn("[EngineSelector] degraded mode: " + failure +
                       "; trying next candidate");
    failures.push_back(failure);
    if (engine) engine->Release();
  }

  std::ostringstream oss;
  oss << "no backend engine could be initialized";
  for (const auto& f : failures) oss << "; " << f;
  util::Logger::Error("[EngineSelector] " + oss.str());
  selection.status = EngineStatus::Failure(ExportError::kEngineInitialization, oss.str());
  selection.degraded = std::move(failures);
  return selection;
}

}  // namespace reelforge::engine
