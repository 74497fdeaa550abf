#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace lolcommits::core {

/// RGBA8 working buffer of the pipeline. Move-only: exactly one owner at a time,
/// passed from Compositor to ChyronRenderer to the PNG encoder.
class CompositeImage {
 public:
  static constexpr std::size_t kChannels = 4;

  CompositeImage() = default;

  /// Opaque black image of the given size.
  CompositeImage(std::uint32_t width, std::uint32_t height);

  /// Takes ownership of an RGBA buffer; rgba.size() must equal width*height*4.
  CompositeImage(std::uint32_t width, std::uint32_t height, std::vector<std::uint8_t> rgba)
      : width_(width), height_(height), rgba_(std::move(rgba)) {}

  CompositeImage(const CompositeImage&) = delete;
  CompositeImage& operator=(const CompositeImage&) = delete;
  CompositeImage(CompositeImage&&) noexcept = default;
  CompositeImage& operator=(CompositeImage&&) noexcept = default;

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] bool empty() const noexcept { return rgba_.empty(); }
  [[nodiscard]] std::size_t stride() const noexcept { return static_cast<std::size_t>(width_) * kChannels; }

  [[nodiscard]] std::span<std::uint8_t> data() noexcept { return rgba_; }
  [[nodiscard]] std::span<const std::uint8_t> data() const noexcept { return rgba_; }

  [[nodiscard]] std::uint8_t* pixel(std::uint32_t x, std::uint32_t y) noexcept {
    return rgba_.data() + static_cast<std::size_t>(y) * stride() + static_cast<std::size_t>(x) * kChannels;
  }
  [[nodiscard]] const std::uint8_t* pixel(std::uint32_t x, std::uint32_t y) const noexcept {
    return rgba_.data() + static_cast<std::size_t>(y) * stride() + static_cast<std::size_t>(x) * kChannels;
  }

  /// Explicit deep copy (tests and debugging); stages move instead.
  [[nodiscard]] CompositeImage clone() const {
    return CompositeImage(width_, height_, rgba_);
  }

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  std::vector<std::uint8_t> rgba_;
};

inline CompositeImage::CompositeImage(std::uint32_t width, std::uint32_t height)
    : width_(width), height_(height), rgba_(static_cast<std::size_t>(width) * height * kChannels, 0) {
  for (std::size_t i = kChannels - 1; i < rgba_.size(); i += kChannels) {
    rgba_[i] = 255;
  }
}

/// Encoded PNG bytes; written exactly once by the persister.
struct OutputArtifact {
  std::vector<std::uint8_t> png_bytes;
};

}  // namespace lolcommits::core
