// Fake visual provider: "color:R,G,B" yields a solid 16x16 opaque picture,
// "broken" fails to sample. Records every sample request.

#ifndef REELFORGE_TESTS_FIXTURES_FAKE_VISUAL_SOURCE_H_
#define REELFORGE_TESTS_FIXTURES_FAKE_VISUAL_SOURCE_H_

#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include "reelforge/frame/VisualSourceProvider.hpp"
#include "reelforge/pipeline/ExportTypes.hpp"

namespace reelforge::tests::fixtures {

class FakeVisualSource : public frame::IVisualSourceProvider {
 public:
  struct Sample {
    std::string element_id;
    double source_time = 0.0;
  };

  static constexpr int kSize = 16;

  bool SampleFrame(const pipeline::TimelineElement& element, double source_time_seconds,
                   pipeline::PixelBuffer* out, std::string* error) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      samples_.push_back(Sample{element.id, source_time_seconds});
    }
    int r = 0, g = 0, b = 0;
    if (std::sscanf(element.source_ref.c_str(), "color:%d,%d,%d", &r, &g, &b) != 3) {
      *error = "cannot sample " + element.source_ref;
      return false;
    }
    out->Resize(kSize, kSize);
    for (size_t i = 0; i < out->rgba.size(); i += 4) {
      out->rgba[i] = static_cast<uint8_t>(r);
      out->rgba[i + 1] = static_cast<uint8_t>(g);
      out->rgba[i + 2] = static_cast<uint8_t>(b);
      out->rgba[i + 3] = 255;
    }
    return true;
  }

  std::vector<Sample> samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<Sample> samples_;
};

}  // namespace reelforge::tests::fixtures

#endif  // REELFORGE_TESTS_FIXTURES_FAKE_VISUAL_SOURCE_H_
