#include <lolcommits/vision/mask_resample.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <vector>

namespace lolcommits::vision {

std::expected<lolcommits::core::SegmentationMask, lolcommits::core::PipelineError> resample_mask(
    const lolcommits::core::SegmentationMask& mask,
    std::uint32_t width,
    std::uint32_t height) {
  using lolcommits::core::PipelineError;
  using lolcommits::core::SegmentationMask;

  if (width == 0 || height == 0) return std::unexpected(PipelineError::InvalidFrame);
  if (mask.empty() || !mask.consistent()) {
    spdlog::error("malformed segmentation mask: {}x{} with {} value(s)", mask.width(),
                  mask.height(), mask.values().size());
    return std::unexpected(PipelineError::InferenceError);
  }
  if (mask.width() == width && mask.height() == height) {
    std::vector<float> copy(mask.values().begin(), mask.values().end());
    for (float& v : copy) v = lolcommits::core::clamp_probability(v);
    return SegmentationMask(width, height, std::move(copy));
  }

  cv::Mat resized;
  cv::resize(detail::mask_to_mat(mask), resized,
             cv::Size(static_cast<int>(width), static_cast<int>(height)),
             0, 0, cv::INTER_LINEAR);
  return detail::mat_to_mask(resized);
}

}  // namespace lolcommits::vision
