// Repository: ReelForge
// Component: Stream Copy Planner
// Purpose: Decides whether a timeline's video can be joined from its source
//          files with stream copy instead of being rendered and re-encoded.
// Copyright (c) 2025 ReelForge

#include "reelforge/engine/StreamCopyPlanner.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace reelforge::engine {

namespace {

bool IsIdentity(const pipeline::VisualTransform& t) {
  return t.x == 0.0 && t.y == 0.0 && t.scale == 1.0 && t.rotation_degrees == 0.0 &&
         t.opacity == 1.0;
}

StreamCopyPlan Refuse(std::string reason) {
  StreamCopyPlan plan;
  plan.reason = std::move(reason);
  return plan;
}

}  // namespace

StreamCopyPlan PlanStreamCopy(const pipeline::ExportSettings& settings,
                              const std::vector<pipeline::TimelineElement>& elements,
                              const pipeline::SourceResolver& resolver,
                              const VideoStreamInspector& inspector) {
  if (!settings.allow_stream_copy) return Refuse("stream copy not allowed");
  if (!resolver) return Refuse("no source resolver");

  std::vector<const pipeline::TimelineElement*> visuals;
  for (const auto& e : elements) {
    if (e.HasVisual()) visuals.push_back(&e);
  }
  if (visuals.empty()) return Refuse("no visual elements");
  std::stable_sort(visuals.begin(), visuals.end(),
                   [](const pipeline::TimelineElement* a, const pipeline::TimelineElement* b) {
                     return a->start_time < b->start_time;
                   });

  const double slack = 0.5 / settings.fps;
  StreamCopyPlan plan;
  double cursor = 0.0;
  std::string reference_signature;
  for (const auto* e : visuals) {
    if (!IsIdentity(e->transform)) return Refuse("element '" + e->id + "' is transformed");
    if (e->trim_in != 0.0 || e->trim_out != 0.0) {
      return Refuse("element '" + e->id + "' is trimmed");
    }
    if (std::fabs(e->start_time - cursor) > slack) {
      return Refuse(e->start_time < cursor ? "element '" + e->id + "' overlaps its predecessor"
                                           : "gap before element '" + e->id + "'");
    }
    const auto resolved = resolver(e->source_ref);
    if (!resolved || !resolved->IsFile()) {
      return Refuse("element '" + e->id + "' is not a file source");
    }
    if (inspector) {
      std::string signature;
      std::string error;
      if (!inspector(*resolved, &signature, &error)) {
        return Refuse("cannot inspect '" + e->id + "': " + error);
      }
      if (reference_signature.empty()) {
        reference_signature = signature;
      } else if (signature != reference_signature) {
        return Refuse("element '" + e->id + "' is encoded as " + signature + ", not " +
                      reference_signature);
      }
    }
    plan.segments.push_back(resolved->file_path);
    cursor = e->EndTime();
  }
  if (cursor + slack < settings.duration_seconds) return Refuse("video ends before the export");

  plan.eligible = true;
  return plan;
}

}  // namespace reelforge::engine
