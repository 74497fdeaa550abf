#include <lolcommits/vision/compositor.hpp>
#include <lolcommits/vision/mask_resample.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <variant>
#include <vector>

namespace lolcommits::vision {

namespace {

namespace lc = lolcommits::core;

std::uint8_t blend_channel(float alpha, std::uint8_t fg, std::uint8_t bg) noexcept {
  const float v = alpha * static_cast<float>(fg) + (1.f - alpha) * static_cast<float>(bg);
  const long rounded = std::lround(v);
  return static_cast<std::uint8_t>(std::clamp(rounded, 0L, 255L));
}

lc::Frame solid_frame(const lc::Rgb& color, std::uint32_t width, std::uint32_t height) {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  std::vector<std::byte> buffer(pixels * 3);
  for (std::size_t i = 0; i < pixels; ++i) {
    buffer[i * 3 + 0] = static_cast<std::byte>(color.r);
    buffer[i * 3 + 1] = static_cast<std::byte>(color.g);
    buffer[i * 3 + 2] = static_cast<std::byte>(color.b);
  }
  return lc::Frame(width, height, lc::PixelFormat::RGB8, std::move(buffer));
}

}  // namespace

PixelOffset compute_recentering_offset(const lc::SegmentationMask& mask, float noise_floor) {
  if (mask.empty() || !mask.consistent()) return {};
  const auto centroid = mask.center_of_mass(noise_floor);
  if (!centroid) return {};

  const double center_x = (static_cast<double>(mask.width()) - 1.0) / 2.0;
  const double center_y = (static_cast<double>(mask.height()) - 1.0) / 2.0;
  return PixelOffset{static_cast<int>(std::lround(center_x - centroid->x)),
                     static_cast<int>(std::lround(center_y - centroid->y))};
}

std::expected<lc::Frame, lc::PipelineError> render_background(const lc::BackgroundSpec& background,
                                                              std::uint32_t width,
                                                              std::uint32_t height) {
  if (const auto* color = std::get_if<lc::Rgb>(&background)) {
    return solid_frame(*color, width, height);
  }

  const auto& image = std::get<lc::Frame>(background);
  auto rgb = detail::to_rgb8(image);
  if (!rgb) return std::unexpected(lc::PipelineError::InvalidFrame);
  if (rgb->width() == width && rgb->height() == height) return std::move(*rgb);

  auto mat = detail::frame_to_mat(*rgb);
  if (!mat) return std::unexpected(lc::PipelineError::InvalidFrame);
  cv::Mat stretched;
  cv::resize(*mat, stretched, cv::Size(static_cast<int>(width), static_cast<int>(height)),
             0, 0, cv::INTER_LINEAR);
  return detail::mat_to_frame(stretched, lc::PixelFormat::RGB8);
}

std::expected<lc::CompositeImage, lc::PipelineError> Compositor::composite(
    const lc::Frame& frame,
    const lc::SegmentationMask& mask,
    const lc::BackgroundSpec& background) const {
  if (!frame.valid()) return std::unexpected(lc::PipelineError::InvalidFrame);
  auto fg = detail::to_rgb8(frame);
  if (!fg) return std::unexpected(lc::PipelineError::InvalidFrame);

  const std::uint32_t w = frame.width();
  const std::uint32_t h = frame.height();

  if (mask.empty() || !mask.consistent()) {
    spdlog::error("malformed segmentation mask: {}x{} with {} value(s)", mask.width(),
                  mask.height(), mask.values().size());
    return std::unexpected(lc::PipelineError::InferenceError);
  }

  const lc::SegmentationMask* alpha = &mask;
  lc::SegmentationMask resampled;
  if (mask.width() != w || mask.height() != h) {
    spdlog::debug("resampling mask {}x{} to frame {}x{}", mask.width(), mask.height(), w, h);
    auto r = resample_mask(mask, w, h);
    if (!r) return std::unexpected(r.error());
    resampled = std::move(*r);
    alpha = &resampled;
  }

  auto bg = render_background(background, w, h);
  if (!bg) return std::unexpected(bg.error());

  PixelOffset offset;
  if (options_.center_person) {
    offset = compute_recentering_offset(*alpha, options_.centroid_noise_floor);
    spdlog::debug("recentering subject by ({}, {})", offset.dx, offset.dy);
  }

  lc::CompositeImage out(w, h);
  for (std::uint32_t y = 0; y < h; ++y) {
    const long sy = static_cast<long>(y) - offset.dy;
    for (std::uint32_t x = 0; x < w; ++x) {
      const long sx = static_cast<long>(x) - offset.dx;
      const std::uint8_t* b = bg->pixel(x, y);
      std::uint8_t* o = out.pixel(x, y);

      if (sx < 0 || sy < 0 || sx >= static_cast<long>(w) || sy >= static_cast<long>(h)) {
        o[0] = b[0];
        o[1] = b[1];
        o[2] = b[2];
        o[3] = 255;
        continue;
      }

      const auto ux = static_cast<std::uint32_t>(sx);
      const auto uy = static_cast<std::uint32_t>(sy);
      const float a = lc::clamp_probability(alpha->at(ux, uy));
      const std::uint8_t* f = fg->pixel(ux, uy);
      o[0] = blend_channel(a, f[0], b[0]);
      o[1] = blend_channel(a, f[1], b[1]);
      o[2] = blend_channel(a, f[2], b[2]);
      o[3] = 255;
    }
  }
  return out;
}

}  // namespace lolcommits::vision
