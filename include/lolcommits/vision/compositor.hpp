#pragma once

#include <lolcommits/core/background.hpp>
#include <lolcommits/core/composite_image.hpp>
#include <lolcommits/core/error.hpp>
#include <lolcommits/core/frame.hpp>
#include <lolcommits/core/segmentation_mask.hpp>
#include <cstdint>
#include <expected>

namespace lolcommits::vision {

struct CompositorOptions {
  bool center_person{true};
  /// Mask values at or below this are ignored when locating the subject.
  float centroid_noise_floor{0.1f};
};

/// Integer translation applied to the foreground (and its mask).
struct PixelOffset {
  int dx{0};
  int dy{0};

  bool operator==(const PixelOffset&) const = default;
};

/// Offset that moves the mask centroid onto the geometric center ((w-1)/2, (h-1)/2),
/// rounded to the nearest pixel. Zero when the mask carries no mass.
[[nodiscard]] PixelOffset compute_recentering_offset(const lolcommits::core::SegmentationMask& mask,
                                                     float noise_floor);

/// Background as an RGB8 frame of the given size: a solid fill, or the image
/// stretched with bilinear interpolation. InvalidFrame for an undecodable image.
[[nodiscard]] std::expected<lolcommits::core::Frame, lolcommits::core::PipelineError>
render_background(const lolcommits::core::BackgroundSpec& background,
                  std::uint32_t width,
                  std::uint32_t height);

/// Blends frame over background through the mask:
///   out = mask * frame + (1 - mask) * background, rounded and clamped, alpha 255.
/// The mask is resampled to the frame size first when it differs. With
/// center_person, foreground and mask are shifted by compute_recentering_offset;
/// pixels uncovered by the shift show the background.
class Compositor {
 public:
  explicit Compositor(CompositorOptions options = {}) : options_(options) {}

  [[nodiscard]] std::expected<lolcommits::core::CompositeImage, lolcommits::core::PipelineError>
  composite(const lolcommits::core::Frame& frame,
            const lolcommits::core::SegmentationMask& mask,
            const lolcommits::core::BackgroundSpec& background) const;

  [[nodiscard]] const CompositorOptions& options() const noexcept { return options_; }

 private:
  CompositorOptions options_;
};

}  // namespace lolcommits::vision
