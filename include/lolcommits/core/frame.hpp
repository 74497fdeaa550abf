#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace lolcommits::core {

/// Memory: Frame owns a single contiguous buffer (std::vector<std::byte>);
/// move semantics and RAII throughout. Use data() for std::span views (non-owning).
/// A captured Frame is passed between stages by move or const reference, never
/// shared mutably.

/// Pixel layout / format. All formats are 8 bits per channel, interleaved.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
};

/// Bytes per pixel for a format (0 for Unknown).
[[nodiscard]] std::size_t bytes_per_pixel(PixelFormat format) noexcept;

/// Single camera frame: dimensions, format, and owned buffer (row-major, tightly packed).
class Frame {
 public:
  Frame() = default;

  Frame(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }
  [[nodiscard]] std::size_t channels() const noexcept { return bytes_per_pixel(format_); }

  /// Mutable view of the buffer (owned).
  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// True if format is known and the buffer holds at least width*height pixels.
  [[nodiscard]] bool valid() const noexcept;

  /// Pointer to the first channel of pixel (x, y). No bounds checking.
  [[nodiscard]] const std::uint8_t* pixel(std::uint32_t x, std::uint32_t y) const noexcept {
    const std::size_t offset =
        (static_cast<std::size_t>(y) * width_ + x) * bytes_per_pixel(format_);
    return reinterpret_cast<const std::uint8_t*>(buffer_.data()) + offset;
  }

  /// Minimum bytes required for given dimensions and format (for validation).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

}  // namespace lolcommits::core
