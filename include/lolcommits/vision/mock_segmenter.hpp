#pragma once

#include <lolcommits/vision/segmenter.hpp>
#include <optional>

namespace lolcommits::vision {

/// Segmenter returning a configured mask (for tests/demo).
/// Without a configured mask every pixel gets the fill probability.
class MockSegmenter : public ISegmenter {
 public:
  explicit MockSegmenter(float fill = 1.f) : fill_(fill) {}

  /// Mask to return on infer(); resampled to the frame size when it differs.
  void set_mask(lolcommits::core::SegmentationMask mask);

  /// Make infer() fail with the given error (e.g. InferenceError).
  void set_failure(lolcommits::core::PipelineError error) { failure_ = error; }

  [[nodiscard]] std::expected<lolcommits::core::SegmentationMask,
                              lolcommits::core::PipelineError>
  infer(const lolcommits::core::Frame& input) const override;

 private:
  float fill_;
  std::optional<lolcommits::core::SegmentationMask> mask_;
  std::optional<lolcommits::core::PipelineError> failure_;
};

}  // namespace lolcommits::vision
