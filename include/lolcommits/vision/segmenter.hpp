#pragma once

#include <lolcommits/core/error.hpp>
#include <lolcommits/core/frame.hpp>
#include <lolcommits/core/segmentation_mask.hpp>
#include <expected>

namespace lolcommits::vision {

/// Abstract person segmenter: Frame -> SegmentationMask on the frame's pixel grid.
/// Implementations are immutable once loaded, so one instance can be shared
/// (std::shared_ptr<const ISegmenter>) across pipeline runs and threads.
class ISegmenter {
 public:
  virtual ~ISegmenter() = default;

  /// Single-frame inference. The returned mask has the frame's width and height.
  [[nodiscard]] virtual std::expected<lolcommits::core::SegmentationMask,
                                      lolcommits::core::PipelineError>
  infer(const lolcommits::core::Frame& input) const = 0;

  /// Optional: validate frame format/dimensions before infer. Default: accept valid frames.
  [[nodiscard]] virtual std::expected<void, lolcommits::core::PipelineError>
  validate_input(const lolcommits::core::Frame& input) const {
    if (!input.valid()) {
      return std::unexpected(lolcommits::core::PipelineError::InvalidFrame);
    }
    return {};
  }

  /// Optional: warmup run (e.g. dummy inference). Call once after construction. Default: no-op.
  virtual void warmup() const {}
};

}  // namespace lolcommits::vision
