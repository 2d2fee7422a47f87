// Repository: ReelForge
// Component: Stream Copy Planner
// Purpose: Decides whether a timeline's video can be joined from its source
//          files with stream copy instead of being rendered and re-encoded.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_ENGINE_STREAM_COPY_PLANNER_HPP_
#define REELFORGE_ENGINE_STREAM_COPY_PLANNER_HPP_

#include <functional>
#include <string>
#include <vector>

#include "reelforge/pipeline/ExportTypes.hpp"

namespace reelforge::engine {

// (source, signature out, error out) -> false when the source has no
// readable video stream. Equal signatures mean the concat demuxer can join
// the files without re-encoding.
using VideoStreamInspector = std::function<bool(const pipeline::ResolvedSource&,
                                                std::string*, std::string*)>;

struct StreamCopyPlan {
  bool eligible = false;
  std::vector<std::string> segments;  // source files in timeline order
  std::string reason;                 // why the plan was refused
};

// A timeline qualifies when every visual element
//   - resolves to a file,
//   - has an identity transform and no trim,
// and the visual elements, sorted by start, run back to back from 0 to the
// export duration without overlap or gap (half a frame of slack). Audio is
// unaffected: the mix is still rendered and encoded alongside the copy.
// Without an inspector the caller's allow_stream_copy is trusted for codec
// compatibility.
StreamCopyPlan PlanStreamCopy(const pipeline::ExportSettings& settings,
                              const std::vector<pipeline::TimelineElement>& elements,
                              const pipeline::SourceResolver& resolver,
                              const VideoStreamInspector& inspector = nullptr);

}  // namespace reelforge::engine

#endif  // REELFORGE_ENGINE_STREAM_COPY_PLANNER_HPP_
