// Repository: ReelForge
// Component: Frame Source
// Purpose: Deterministic compositing of one output frame per timestamp.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_FRAME_FRAME_SOURCE_HPP_
#define REELFORGE_FRAME_FRAME_SOURCE_HPP_

#include <memory>
#include <set>
#include <string>
#include <vector>

#include "reelforge/frame/VisualSourceProvider.hpp"
#include "reelforge/pipeline/ExportTypes.hpp"

namespace reelforge::frame {

// FrameSource renders the composited picture at a timestamp from an
// immutable snapshot of the timeline.
//
// - Only elements with a visual part whose [start, start + duration)
//   contains the timestamp take part.
// - Elements are drawn in ascending track index (ties keep input order);
//   the highest track ends up on top.
// - Each source picture is contain-fitted into the canvas, then the
//   element transform (scale, centre offset, rotation, opacity) applies.
//   Destination pixels are inverse-mapped and sampled nearest-neighbour,
//   blended source-over onto an opaque black background.
//
// The canvas and the per-element scratch picture are reused between calls;
// the returned reference is valid until the next RenderFrame().
//
// A source the provider cannot sample is left out of the composite and
// reported once as a warning.
class FrameSource {
 public:
  FrameSource(const pipeline::ExportSettings& settings,
              std::vector<pipeline::TimelineElement> elements,
              std::shared_ptr<IVisualSourceProvider> provider);

  FrameSource(const FrameSource&) = delete;
  FrameSource& operator=(const FrameSource&) = delete;

  const pipeline::PixelBuffer& RenderFrame(double timestamp_seconds);

  // Ids of the elements RenderFrame() composites at `timestamp_seconds`,
  // in draw order.
  std::vector<std::string> ActiveElementIds(double timestamp_seconds) const;

  const std::vector<pipeline::ExportWarning>& warnings() const { return warnings_; }
  int width() const { return width_; }
  int height() const { return height_; }

  // Releases the canvas and scratch storage.
  void Release();

 private:
  void Composite(const pipeline::TimelineElement& element,
                 const pipeline::PixelBuffer& src);

  int width_;
  int height_;
  // Visual elements pre-sorted into draw order.
  std::vector<pipeline::TimelineElement> draw_order_;
  std::shared_ptr<IVisualSourceProvider> provider_;

  pipeline::PixelBuffer canvas_;
  pipeline::PixelBuffer scratch_;
  std::vector<pipeline::ExportWarning> warnings_;
  std::set<std::string> warned_ids_;
};

}  // namespace reelforge::frame

#endif  // REELFORGE_FRAME_FRAME_SOURCE_HPP_
