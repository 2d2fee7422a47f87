// Repository: ReelForge
// Component: Backend Engine Contract
// Purpose: Shared helpers for the encode strategies.
// Copyright (c) 2025 ReelForge

#include "reelforge/engine/BackendEngine.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

#include "reelforge/util/Logger.hpp"

namespace reelforge::engine {

using pipeline::EngineStatus;
using pipeline::ExportError;

const char* EngineKindToString(EngineKind kind) {
  switch (kind) {
    case EngineKind::kSandboxedRecorder: return "SandboxedRecorder";
    case EngineKind::kSoftwareEncoder: return "SoftwareEncoder";
    case EngineKind::kExternalProcess: return "ExternalProcess";
  }
  return "Unknown";
}

const char* EngineTierToString(EngineTier tier) {
  switch (tier) {
    case EngineTier::kBaseline: return "baseline";
    case EngineTier::kMid: return "mid";
    case EngineTier::kHigh: return "high";
  }
  return "unknown";
}

std::string EngineCandidate::Describe() const {
  std::string out = EngineKindToString(kind);
  if (kind == EngineKind::kSandboxedRecorder) {
    out += "(";
    out += EngineTierToString(tier);
    out += ")";
  }
  return out;
}

EngineStatus CheckInterrupted(const EngineContext& ctx,
                              const std::atomic<bool>& engine_cancel) {
  if (ctx.CancelRequested() || engine_cancel.load(std::memory_order_acquire)) {
    return EngineStatus::Failure(ExportError::kCancelled, "export cancelled");
  }
  if (ctx.DeadlineExceeded()) {
    return EngineStatus::Failure(ExportError::kTimeout,
                                 "export exceeded its wall-clock budget");
  }
  return EngineStatus::Success();
}

EngineStatus DeliverOutputFile(const std::string& from, const std::string& to) {
  namespace fs = std::filesystem;
  std::error_code ec;
  fs::rename(from, to, ec);
  if (!ec) return EngineStatus::Success();

  // EXDEV and friends: copy, then drop the source.
  std::error_code copy_ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, copy_ec);
  if (copy_ec) {
    return EngineStatus::Failure(ExportError::kIo, "cannot write output file " + to,
                                 copy_ec.message());
  }
  std::error_code rm_ec;
  fs::remove(from, rm_ec);
  if (rm_ec) {
    util::Logger::Warn("[BackendEngine] could not remove " + from + ": " + rm_ec.message());
  }
  return EngineStatus::Success();
}

EngineStatus DeliverOutputBlob(const std::vector<uint8_t>& blob, const std::string& path) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return EngineStatus::Failure(ExportError::kIo, "cannot open output file " + path,
                                 std::strerror(errno));
  }
  out.write(reinterpret_cast<const char*>(blob.data()),
            static_cast<std::streamsize>(blob.size()));
  out.close();
  if (!out) {
    return EngineStatus::Failure(ExportError::kIo, "short write to output file " + path);
  }
  return EngineStatus::Success();
}

}  // namespace reelforge::engine
