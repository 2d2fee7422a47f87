// Repository: ReelForge
// Component: Frame Source
// Purpose: Deterministic compositing of one output frame per timestamp.
// Copyright (c) 2025 ReelForge

#include "reelforge/frame/FrameSource.hpp"

#include <algorithm>
#include <cmath>

#include "reelforge/util/Logger.hpp"

namespace reelforge::frame {

using pipeline::PixelBuffer;
using pipeline::TimelineElement;

namespace {
constexpr double kPi = 3.14159265358979323846;
}  // namespace

FrameSource::FrameSource(const pipeline::ExportSettings& settings,
                         std::vector<TimelineElement> elements,
                         std::shared_ptr<IVisualSourceProvider> provider)
    : width_(settings.width),
      height_(settings.height),
      provider_(std::move(provider)) {
  for (auto& e : elements) {
    if (e.HasVisual() && e.duration > 0.0) {
      draw_order_.push_back(std::move(e));
    }
  }
  std::stable_sort(draw_order_.begin(), draw_order_.end(),
                   [](const TimelineElement& a, const TimelineElement& b) {
                     return a.track_index < b.track_index;
                   });
  canvas_.Resize(width_, height_);
}

std::vector<std::string> FrameSource::ActiveElementIds(double timestamp_seconds) const {
  std::vector<std::string> ids;
  for (const auto& e : draw_order_) {
    if (e.IsActiveAt(timestamp_seconds)) ids.push_back(e.id);
  }
  return ids;
}

const PixelBuffer& FrameSource::RenderFrame(double timestamp_seconds) {
  canvas_.Resize(width_, height_);
  uint8_t* p = canvas_.rgba.data();
  const size_t pixels = static_cast<size_t>(width_) * static_cast<size_t>(height_);
  for (size_t i = 0; i < pixels; ++i, p += 4) {
    p[0] = 0;
    p[1] = 0;
    p[2] = 0;
    p[3] = 255;
  }

  if (!provider_) return canvas_;

  for (const auto& element : draw_order_) {
    if (!element.IsActiveAt(timestamp_seconds)) continue;
    const double source_time = element.trim_in + (timestamp_seconds - element.start_time);

    std::string error;
    if (!provider_->SampleFrame(element, source_time, &scratch_, &error)) {
      if (warned_ids_.insert(element.id).second) {
        util::Logger::Warn("[FrameSource] element=" + element.id +
                           " left blank: " + error);
        warnings_.push_back(pipeline::ExportWarning{
            element.id, pipeline::ExportError::kSourceDecode,
            "visual source left blank: " + error});
      }
      continue;
    }
    Composite(element, scratch_);
  }
  return canvas_;
}

void FrameSource::Composite(const TimelineElement& element, const PixelBuffer& src) {
  if (src.width <= 0 || src.height <= 0 || src.rgba.empty()) return;
  const auto& tf = element.transform;

  const double opacity = std::clamp(tf.opacity, 0.0, 1.0);
  if (!(opacity > 0.0)) return;

  const double fit = std::min(static_cast<double>(width_) / src.width,
                              static_cast<double>(height_) / src.height) *
                     tf.scale;
  if (!(fit > 0.0)) return;
  const double inv = 1.0 / fit;

  const double cx = width_ / 2.0 + tf.x;
  const double cy = height_ / 2.0 + tf.y;
  const double theta = tf.rotation_degrees * kPi / 180.0;
  const double c = std::cos(theta);
  const double s = std::sin(theta);

  // Bounding box of the rotated, scaled source.
  const double hw = src.width * fit / 2.0;
  const double hh = src.height * fit / 2.0;
  const double ex = std::abs(c) * hw + std::abs(s) * hh;
  const double ey = std::abs(s) * hw + std::abs(c) * hh;
  if (!std::isfinite(cx) || !std::isfinite(cy) || !std::isfinite(ex) ||
      !std::isfinite(ey) || !std::isfinite(inv) || !std::isfinite(c) || !std::isfinite(s)) {
    return;
  }
  // Clamp in floating point; the bounds may lie far outside int range.
  const double w = static_cast<double>(width_);
  const double h = static_cast<double>(height_);
  const int x0 = static_cast<int>(std::clamp(std::floor(cx - ex), 0.0, w));
  const int x1 = static_cast<int>(std::clamp(std::ceil(cx + ex), 0.0, w));
  const int y0 = static_cast<int>(std::clamp(std::floor(cy - ey), 0.0, h));
  const int y1 = static_cast<int>(std::clamp(std::ceil(cy + ey), 0.0, h));

  const double half_sw = src.width / 2.0;
  const double half_sh = src.height / 2.0;

  for (int py = y0; py < y1; ++py) {
    const double dy = py + 0.5 - cy;
    uint8_t* dst = canvas_.Pixel(x0, py);
    for (int px = x0; px < x1; ++px, dst += 4) {
      const double dx = px + 0.5 - cx;
      const double u = (c * dx + s * dy) * inv + half_sw;
      const double v = (-s * dx + c * dy) * inv + half_sh;
      if (u < 0.0 || v < 0.0 || u >= src.width || v >= src.height) continue;

      const uint8_t* sp = src.Pixel(static_cast<int>(u), static_cast<int>(v));
      const int a = static_cast<int>(std::lround(sp[3] * opacity));
      if (a <= 0) continue;
      if (a >= 255) {
        dst[0] = sp[0];
        dst[1] = sp[1];
        dst[2] = sp[2];
        continue;
      }
      for (int ch = 0; ch < 3; ++ch) {
        dst[ch] = static_cast<uint8_t>((sp[ch] * a + dst[ch] * (255 - a) + 127) / 255);
      }
    }
  }
}

void FrameSource::Release() {
  canvas_.rgba.clear();
  canvas_.rgba.shrink_to_fit();
  canvas_.width = 0;
  canvas_.height = 0;
  scratch_.rgba.clear();
  scratch_.rgba.shrink_to_fit();
  scratch_.width = 0;
  scratch_.height = 0;
}

}  // namespace reelforge::frame
