#pragma once

#include <lolcommits/core/frame.hpp>
#include <lolcommits/core/segmentation_mask.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace lolcommits::vision::detail {

/// Wrap a Frame as a cv::Mat view (no copy). Returns nullopt if format unsupported.
std::optional<cv::Mat> frame_to_mat(const lolcommits::core::Frame& frame);

/// Convert cv::Mat to Frame (copy).
lolcommits::core::Frame mat_to_frame(const cv::Mat& mat,
                                     lolcommits::core::PixelFormat format);

/// Any supported Frame -> RGB8 Frame (copy). Returns nullopt if format unsupported.
std::optional<lolcommits::core::Frame> to_rgb8(const lolcommits::core::Frame& frame);

/// Wrap a mask as a CV_32FC1 view (no copy).
cv::Mat mask_to_mat(const lolcommits::core::SegmentationMask& mask);

/// Copy a CV_32FC1 Mat into a mask, clamping values to [0, 1].
lolcommits::core::SegmentationMask mat_to_mask(const cv::Mat& mat);

}  // namespace lolcommits::vision::detail
