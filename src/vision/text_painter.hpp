#pragma once

#include <lolcommits/core/background.hpp>
#include <lolcommits/core/composite_image.hpp>
#include <lolcommits/core/error.hpp>
#include <lolcommits/vision/font_resolver.hpp>
#include <ft2build.h>
#include FT_FREETYPE_H
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace lolcommits::vision::detail {

/// Drawing is clipped to this rectangle: [x0, x1) x [y0, y1).
struct ClipRect {
  int x0{0};
  int y0{0};
  int x1{0};
  int y1{0};
};

struct FtLibraryDeleter {
  void operator()(FT_Library lib) const noexcept { FT_Done_FreeType(lib); }
};
using FtLibraryPtr = std::unique_ptr<std::remove_pointer_t<FT_Library>, FtLibraryDeleter>;

struct FtFaceDeleter {
  void operator()(FT_Face face) const noexcept { FT_Done_Face(face); }
};
using FtFacePtr = std::unique_ptr<std::remove_pointer_t<FT_Face>, FtFaceDeleter>;

/// One FreeType library instance; faces opened from it must not outlive it.
[[nodiscard]] std::expected<FtLibraryPtr, lolcommits::core::PipelineError> open_freetype();

/// A sized font face that measures and draws UTF-8 text onto RGBA images.
class TextFace {
 public:
  /// FontResolutionError if FreeType cannot open the file.
  [[nodiscard]] static std::expected<TextFace, lolcommits::core::PipelineError>
  open(FT_Library library, const FontAsset& asset, float pixel_size);

  /// Advance width of the text in pixels, kerning included.
  [[nodiscard]] int measure(std::u32string_view text) const;

  /// Entry n is the advance width of the first n code points; size() + 1 entries.
  [[nodiscard]] std::vector<int> prefix_widths(std::u32string_view text) const;

  /// Distance from the top of the line to the baseline, in pixels.
  [[nodiscard]] int ascender() const noexcept;
  /// Full line height in pixels.
  [[nodiscard]] int line_height() const noexcept;

  /// Draws text with its line top at top_y. Glyph coverage is blended over the
  /// destination; pixels outside clip are never written. Returns the advance.
  int draw(lolcommits::core::CompositeImage& image,
           int x,
           int top_y,
           std::u32string_view text,
           const lolcommits::core::Rgb& color,
           const ClipRect& clip) const;

 private:
  explicit TextFace(FtFacePtr face) : face_(std::move(face)) {}

  FtFacePtr face_;
};

/// UTF-8 to code points; malformed bytes become U+FFFD.
[[nodiscard]] std::u32string to_codepoints(std::string_view utf8);

/// Longest prefix of text that fits max_width, with "…" appended when cut.
/// Empty if not even the ellipsis fits.
[[nodiscard]] std::u32string ellipsize(const TextFace& face, std::u32string_view text, int max_width);

/// Blends color over every pixel inside rect with the given opacity; alpha is kept.
void fill_rect(lolcommits::core::CompositeImage& image,
               const ClipRect& rect,
               const lolcommits::core::Rgb& color,
               float opacity);

}  // namespace lolcommits::vision::detail
