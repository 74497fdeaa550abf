#pragma once

#include <lolcommits/core/error.hpp>
#include <lolcommits/core/segmentation_mask.hpp>
#include <cstdint>
#include <expected>

namespace lolcommits::vision {

/// Resamples a mask to (width, height) with bilinear interpolation, pixel-center
/// aligned (OpenCV INTER_LINEAR). Same size returns a copy. Output is clamped to [0, 1].
///
/// An empty mask, or one whose value count does not match its dimensions, is
/// InferenceError. A zero target size is InvalidFrame.
[[nodiscard]] std::expected<lolcommits::core::SegmentationMask, lolcommits::core::PipelineError>
resample_mask(const lolcommits::core::SegmentationMask& mask,
              std::uint32_t width,
              std::uint32_t height);

}  // namespace lolcommits::vision
