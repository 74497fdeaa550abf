#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace lolcommits::core {

/// Intensity-weighted centroid of a mask, in pixel coordinates.
struct MaskCentroid {
  double x{0.0};
  double y{0.0};
  double mass{0.0};
};

/// Per-pixel foreground probability in [0, 1], row-major.
/// Continuous field: consumers decide on any thresholding.
class SegmentationMask {
 public:
  SegmentationMask() = default;

  /// Mask filled with a constant probability.
  SegmentationMask(std::uint32_t width, std::uint32_t height, float fill = 0.f)
      : width_(width),
        height_(height),
        values_(static_cast<std::size_t>(width) * height, fill) {}

  /// Takes ownership of values; values.size() must equal width * height.
  SegmentationMask(std::uint32_t width, std::uint32_t height, std::vector<float> values)
      : width_(width), height_(height), values_(std::move(values)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] bool empty() const noexcept { return values_.empty(); }

  [[nodiscard]] std::span<float> values() noexcept { return values_; }
  [[nodiscard]] std::span<const float> values() const noexcept { return values_; }

  [[nodiscard]] float at(std::uint32_t x, std::uint32_t y) const noexcept {
    return values_[static_cast<std::size_t>(y) * width_ + x];
  }
  void set(std::uint32_t x, std::uint32_t y, float value) noexcept {
    values_[static_cast<std::size_t>(y) * width_ + x] = value;
  }

  /// True if the value count matches the dimensions.
  [[nodiscard]] bool consistent() const noexcept {
    return values_.size() == static_cast<std::size_t>(width_) * height_;
  }

  /// Weighted centroid over pixels whose probability exceeds noise_floor.
  /// Returns nullopt when no pixel carries weight (no subject detected).
  [[nodiscard]] std::optional<MaskCentroid> center_of_mass(float noise_floor = 0.f) const;

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  std::vector<float> values_;
};

/// Clamp a raw probability to [0, 1]; NaN maps to 0.
[[nodiscard]] inline float clamp_probability(float p) noexcept {
  if (!(p > 0.f)) return 0.f;  // also catches NaN
  return p > 1.f ? 1.f : p;
}

}  // namespace lolcommits::core
