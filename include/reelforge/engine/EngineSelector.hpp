// Repository: ReelForge
// Component: Engine Selector
// Purpose: Maps a capability profile and a preference order to one backend
//          engine, falling back when initialization fails.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_ENGINE_ENGINE_SELECTOR_HPP_
#define REELFORGE_ENGINE_ENGINE_SELECTOR_HPP_

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "reelforge/engine/BackendEngine.hpp"
#include "reelforge/pipeline/ExportConfig.hpp"
#include "reelforge/pipeline/ExportTypes.hpp"

namespace reelforge::engine {

// Thresholds used by IsSupported().
inline constexpr int kMidTierMinScore = 40;
inline constexpr int kHighTierMinScore = 80;
inline constexpr uint64_t kHighTierMinRamBytes = 16ull * 1024ull * 1024ull * 1024ull;
inline constexpr double kHighTierMaxRamShare = 0.4;

struct EngineSelection {
  std::unique_ptr<IBackendEngine> engine;   // null when status failed
  EngineCandidate candidate;
  pipeline::EngineStatus status;
  // One entry per candidate that was supported but failed to initialize.
  std::vector<std::string> degraded;
};

// EngineSelector
//
// Select() is pure: the same profile and order always yield the same
// candidate. The order is walked front to back and the first candidate
// whose predicate holds wins. The baseline recorder is appended when the
// order does not contain it, and its predicate always holds, so selection
// never fails for an unsupported environment.
//
// SelectAndInitialize() builds and initializes candidates in the same
// order. A candidate that fails to initialize is released, a degraded-mode
// warning is logged, and the next supported candidate is tried. When none
// initializes the status is kEngineInitialization.
class EngineSelector {
 public:
  explicit EngineSelector(EngineFactory factory);

  static std::vector<EngineCandidate> DefaultOrder(pipeline::ExecutionContext context);
  static EngineCandidate Fallback();
  static bool IsSupported(const EngineCandidate& candidate,
                          const pipeline::CapabilityProfile& profile);

  static EngineCandidate Select(const pipeline::CapabilityProfile& profile,
                                const std::vector<EngineCandidate>& preferred_order);

  EngineSelection SelectAndInitialize(const pipeline::CapabilityProfile& profile,
                                      const std::vector<EngineCandidate>& preferred_order,
                                      const pipeline::ExportSettings& settings,
                                      const std::atomic<bool>* cancel = nullptr) const;

 private:
  static std::vector<EngineCandidate> WithFallback(std::vector<EngineCandidate> order);

  EngineFactory factory_;
};

}  // namespace reelforge::engine

#endif  // REELFORGE_ENGINE_ENGINE_SELECTOR_HPP_
