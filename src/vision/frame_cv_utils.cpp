#include "frame_cv_utils.hpp"
#include <lolcommits/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace lolcommits::vision::detail {

namespace lc = lolcommits::core;

std::optional<cv::Mat> frame_to_mat(const lc::Frame& frame) {
  if (!frame.valid()) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  const std::size_t step = static_cast<std::size_t>(frame.width()) * frame.channels();
  void* data = const_cast<std::byte*>(frame.data().data());

  switch (frame.format()) {
    case lc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data, step);
    case lc::PixelFormat::RGB8:
    case lc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data, step);
    case lc::PixelFormat::RGBA8:
    case lc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data, step);
    case lc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

lc::Frame mat_to_frame(const cv::Mat& mat, lc::PixelFormat format) {
  if (mat.empty()) return lc::Frame();

  const cv::Mat contiguous = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(contiguous.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(contiguous.rows);
  const std::size_t len = contiguous.total() * contiguous.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), contiguous.ptr(), len);
  return lc::Frame(w, h, format, std::move(buffer));
}

std::optional<lc::Frame> to_rgb8(const lc::Frame& frame) {
  auto mat_in = frame_to_mat(frame);
  if (!mat_in) return std::nullopt;

  if (frame.format() == lc::PixelFormat::RGB8) {
    std::vector<std::byte> buf(frame.data().begin(), frame.data().end());
    return lc::Frame(frame.width(), frame.height(), lc::PixelFormat::RGB8, std::move(buf));
  }

  int code = -1;
  switch (frame.format()) {
    case lc::PixelFormat::BGR8:
      code = cv::COLOR_BGR2RGB;
      break;
    case lc::PixelFormat::RGBA8:
      code = cv::COLOR_RGBA2RGB;
      break;
    case lc::PixelFormat::BGRA8:
      code = cv::COLOR_BGRA2RGB;
      break;
    case lc::PixelFormat::Grayscale8:
      code = cv::COLOR_GRAY2RGB;
      break;
    default:
      return std::nullopt;
  }

  cv::Mat mat_out;
  cv::cvtColor(*mat_in, mat_out, code);
  return mat_to_frame(mat_out, lc::PixelFormat::RGB8);
}

cv::Mat mask_to_mat(const lc::SegmentationMask& mask) {
  return cv::Mat(static_cast<int>(mask.height()), static_cast<int>(mask.width()), CV_32FC1,
                 const_cast<float*>(mask.values().data()));
}

lc::SegmentationMask mat_to_mask(const cv::Mat& mat) {
  cv::Mat single;
  if (mat.type() == CV_32FC1) {
    single = mat;
  } else {
    mat.convertTo(single, CV_32FC1);
  }

  const auto w = static_cast<std::uint32_t>(single.cols);
  const auto h = static_cast<std::uint32_t>(single.rows);
  std::vector<float> values(static_cast<std::size_t>(w) * h);
  for (int y = 0; y < single.rows; ++y) {
    const float* row = single.ptr<float>(y);
    float* dst = values.data() + static_cast<std::size_t>(y) * w;
    for (int x = 0; x < single.cols; ++x) {
      dst[x] = lc::clamp_probability(row[x]);
    }
  }
  return lc::SegmentationMask(w, h, std::move(values));
}

}  // namespace lolcommits::vision::detail
