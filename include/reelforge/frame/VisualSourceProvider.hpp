// Repository: ReelForge
// Component: Visual Source Provider
// Purpose: Samples the picture of a timeline element at a source time.
// Copyright (c) 2025 ReelForge

#ifndef REELFORGE_FRAME_VISUAL_SOURCE_PROVIDER_HPP_
#define REELFORGE_FRAME_VISUAL_SOURCE_PROVIDER_HPP_

#include <map>
#include <memory>
#include <string>

#include "reelforge/pipeline/ExportTypes.hpp"

namespace reelforge::frame {

// IVisualSourceProvider fills `out` with the element's source picture at
// `source_time_seconds`, as RGBA at the source's own dimensions.
//
// Must be deterministic: the same element and source time always yield the
// same pixels. Returns false with `error` when the source cannot be sampled.
class IVisualSourceProvider {
 public:
  virtual ~IVisualSourceProvider() = default;

  virtual bool SampleFrame(const pipeline::TimelineElement& element,
                           double source_time_seconds,
                           pipeline::PixelBuffer* out,
                           std::string* error) = 0;
};

// FFmpeg-backed provider. Still images are decoded once and reused; video
// sources are kept open per sourceRef and sampled by seeking to the nearest
// preceding keyframe and decoding forward to the requested time.
class FFmpegVisualSource : public IVisualSourceProvider {
 public:
  explicit FFmpegVisualSource(pipeline::SourceResolver resolver);
  ~FFmpegVisualSource() override;

  FFmpegVisualSource(const FFmpegVisualSource&) = delete;
  FFmpegVisualSource& operator=(const FFmpegVisualSource&) = delete;

  bool SampleFrame(const pipeline::TimelineElement& element,
                   double source_time_seconds,
                   pipeline::PixelBuffer* out,
                   std::string* error) override;

 private:
  struct OpenSource;

  OpenSource* GetOrOpen(const std::string& source_ref, std::string* error);

  pipeline::SourceResolver resolver_;
  std::map<std::string, std::unique_ptr<OpenSource>> sources_;
};

}  // namespace reelforge::frame

#endif  // REELFORGE_FRAME_VISUAL_SOURCE_PROVIDER_HPP_
