#include <lolcommits/vision/mock_segmenter.hpp>
#include <lolcommits/vision/mask_resample.hpp>
#include <lolcommits/core/error.hpp>

namespace lolcommits::vision {

void MockSegmenter::set_mask(lolcommits::core::SegmentationMask mask) {
  mask_ = std::move(mask);
}

std::expected<lolcommits::core::SegmentationMask, lolcommits::core::PipelineError>
MockSegmenter::infer(const lolcommits::core::Frame& input) const {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  if (failure_) {
    return std::unexpected(*failure_);
  }
  if (mask_) {
    return resample_mask(*mask_, input.width(), input.height());
  }
  return lolcommits::core::SegmentationMask(input.width(), input.height(),
                                            lolcommits::core::clamp_probability(fill_));
}

}  // namespace lolcommits::vision
