#include <lolcommits/core/segmentation_mask.hpp>

namespace lolcommits::core {

std::optional<MaskCentroid> SegmentationMask::center_of_mass(float noise_floor) const {
  double sum_x = 0.0;
  double sum_y = 0.0;
  double total = 0.0;

  for (std::uint32_t y = 0; y < height_; ++y) {
    const float* row = values_.data() + static_cast<std::size_t>(y) * width_;
    for (std::uint32_t x = 0; x < width_; ++x) {
      const float w = clamp_probability(row[x]);
      if (w <= noise_floor) continue;
      sum_x += static_cast<double>(x) * w;
      sum_y += static_cast<double>(y) * w;
      total += w;
    }
  }

  if (total <= 0.0) {
    return std::nullopt;
  }
  return MaskCentroid{sum_x / total, sum_y / total, total};
}

}  // namespace lolcommits::core
