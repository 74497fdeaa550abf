#include "text_painter.hpp"
#include <lolcommits/core/utf8.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace lolcommits::vision::detail {

namespace {

namespace lc = lolcommits::core;

constexpr char32_t kReplacement = 0xFFFD;
constexpr char32_t kEllipsis = 0x2026;

std::uint8_t mix(float a, std::uint8_t src, std::uint8_t dst) noexcept {
  const long v = std::lround(a * static_cast<float>(src) + (1.f - a) * static_cast<float>(dst));
  return static_cast<std::uint8_t>(std::clamp(v, 0L, 255L));
}

std::size_t sequence_length(unsigned char lead) noexcept {
  if (lead < 0x80) return 1;
  if ((lead & 0xE0) == 0xC0) return 2;
  if ((lead & 0xF0) == 0xE0) return 3;
  if ((lead & 0xF8) == 0xF0) return 4;
  return 1;
}

std::uint8_t coverage_at(const FT_Bitmap& bitmap, unsigned row, unsigned col) noexcept {
  const unsigned char* line = bitmap.buffer + static_cast<long>(row) * bitmap.pitch;
  switch (bitmap.pixel_mode) {
    case FT_PIXEL_MODE_GRAY:
      return line[col];
    case FT_PIXEL_MODE_MONO:
      return ((line[col / 8] >> (7 - col % 8)) & 1) ? 255 : 0;
    default:
      return 0;
  }
}

void blit(lc::CompositeImage& image,
          const FT_Bitmap& bitmap,
          int left,
          int top,
          const lc::Rgb& color,
          const ClipRect& clip) {
  const int x0 = std::max({clip.x0, left, 0});
  const int y0 = std::max({clip.y0, top, 0});
  const int x1 = std::min({clip.x1, left + static_cast<int>(bitmap.width),
                           static_cast<int>(image.width())});
  const int y1 = std::min({clip.y1, top + static_cast<int>(bitmap.rows),
                           static_cast<int>(image.height())});
  for (int y = y0; y < y1; ++y) {
    for (int x = x0; x < x1; ++x) {
      const std::uint8_t c = coverage_at(bitmap, static_cast<unsigned>(y - top),
                                         static_cast<unsigned>(x - left));
      if (c == 0) continue;
      const float a = static_cast<float>(c) / 255.f;
      std::uint8_t* px = image.pixel(static_cast<std::uint32_t>(x), static_cast<std::uint32_t>(y));
      px[0] = mix(a, color.r, px[0]);
      px[1] = mix(a, color.g, px[1]);
      px[2] = mix(a, color.b, px[2]);
    }
  }
}

}  // namespace

std::expected<FtLibraryPtr, lc::PipelineError> open_freetype() {
  FT_Library library = nullptr;
  if (FT_Init_FreeType(&library) != 0) {
    spdlog::error("could not initialize FreeType");
    return std::unexpected(lc::PipelineError::FontResolutionError);
  }
  return FtLibraryPtr(library);
}

std::expected<TextFace, lc::PipelineError> TextFace::open(FT_Library library,
                                                          const FontAsset& asset,
                                                          float pixel_size) {
  FT_Face raw = nullptr;
  if (FT_New_Face(library, asset.file.c_str(), asset.face_index, &raw) != 0) {
    spdlog::warn("FreeType could not open {}", asset.file.string());
    return std::unexpected(lc::PipelineError::FontResolutionError);
  }
  FtFacePtr face(raw);

  const auto px = static_cast<FT_UInt>(std::max(1L, std::lround(pixel_size)));
  if (FT_Set_Pixel_Sizes(face.get(), 0, px) != 0) {
    // Bitmap-only fonts (e.g. color emoji) only offer fixed strikes.
    if (face->num_fixed_sizes <= 0 || FT_Select_Size(face.get(), 0) != 0) {
      spdlog::warn("font {} cannot be sized to {}px", asset.file.string(), px);
      return std::unexpected(lc::PipelineError::FontResolutionError);
    }
  }
  return TextFace(std::move(face));
}

int TextFace::ascender() const noexcept {
  return static_cast<int>((face_->size->metrics.ascender + 63) >> 6);
}

int TextFace::line_height() const noexcept {
  return static_cast<int>((face_->size->metrics.height + 63) >> 6);
}

int TextFace::measure(std::u32string_view text) const {
  return prefix_widths(text).back();
}

std::vector<int> TextFace::prefix_widths(std::u32string_view text) const {
  FT_Face face = face_.get();
  const bool kerning = FT_HAS_KERNING(face);
  std::vector<int> widths;
  widths.reserve(text.size() + 1);
  widths.push_back(0);
  FT_Pos pen = 0;
  FT_UInt prev = 0;
  for (char32_t c : text) {
    const FT_UInt glyph = FT_Get_Char_Index(face, c);
    if (kerning && prev != 0 && glyph != 0) {
      FT_Vector delta;
      if (FT_Get_Kerning(face, prev, glyph, FT_KERNING_DEFAULT, &delta) == 0) pen += delta.x;
    }
    if (FT_Load_Glyph(face, glyph, FT_LOAD_DEFAULT) == 0) {
      pen += face->glyph->advance.x;
    }
    prev = glyph;
    widths.push_back(static_cast<int>((pen + 32) >> 6));
  }
  return widths;
}

int TextFace::draw(lc::CompositeImage& image,
                   int x,
                   int top_y,
                   std::u32string_view text,
                   const lc::Rgb& color,
                   const ClipRect& clip) const {
  FT_Face face = face_.get();
  const bool kerning = FT_HAS_KERNING(face);
  const int baseline = top_y + ascender();
  FT_Pos pen = static_cast<FT_Pos>(x) * 64;
  FT_UInt prev = 0;
  for (char32_t c : text) {
    const FT_UInt glyph = FT_Get_Char_Index(face, c);
    if (kerning && prev != 0 && glyph != 0) {
      FT_Vector delta;
      if (FT_Get_Kerning(face, prev, glyph, FT_KERNING_DEFAULT, &delta) == 0) pen += delta.x;
    }
    prev = glyph;
    if (FT_Load_Glyph(face, glyph, FT_LOAD_RENDER) != 0) continue;

    const FT_GlyphSlot slot = face->glyph;
    const int left = static_cast<int>((pen + 32) >> 6) + slot->bitmap_left;
    blit(image, slot->bitmap, left, baseline - slot->bitmap_top, color, clip);
    pen += slot->advance.x;
  }
  return static_cast<int>((pen + 32) >> 6) - x;
}

std::u32string to_codepoints(std::string_view utf8) {
  if (auto decoded = lc::decode_utf8(utf8)) {
    return std::u32string(decoded->begin(), decoded->end());
  }
  std::u32string out;
  std::size_t i = 0;
  while (i < utf8.size()) {
    const std::size_t len =
        std::min(sequence_length(static_cast<unsigned char>(utf8[i])), utf8.size() - i);
    auto one = lc::decode_utf8(utf8.substr(i, len));
    if (one && one->size() == 1) {
      out.push_back(one->front());
      i += len;
    } else {
      out.push_back(kReplacement);
      ++i;
    }
  }
  return out;
}

std::u32string ellipsize(const TextFace& face, std::u32string_view text, int max_width) {
  if (max_width <= 0) return {};
  const std::vector<int> widths = face.prefix_widths(text);
  if (widths.back() <= max_width) return std::u32string(text);

  const int ellipsis_width = face.measure(std::u32string_view(&kEllipsis, 1));
  if (ellipsis_width > max_width) return {};

  std::size_t n = text.size();
  while (n > 0 && widths[n] + ellipsis_width > max_width) --n;

  // Kerning against the ellipsis and pixel rounding can shift the total by a
  // pixel, so the chosen cut is confirmed and stepped back if needed.
  for (;; --n) {
    std::u32string_view head = text.substr(0, n);
    while (!head.empty() && head.back() == U' ') head.remove_suffix(1);
    std::u32string candidate(head);
    candidate.push_back(kEllipsis);
    if (face.measure(candidate) <= max_width) return candidate;
    if (n == 0) return {};
  }
}

void fill_rect(lc::CompositeImage& image, const ClipRect& rect, const lc::Rgb& color, float opacity) {
  const float a = std::clamp(opacity, 0.f, 1.f);
  const int x0 = std::max(rect.x0, 0);
  const int y0 = std::max(rect.y0, 0);
  const int x1 = std::min(rect.x1, static_cast<int>(image.width()));
  const int y1 = std::min(rect.y1, static_cast<int>(image.height()));
  for (int y = y0; y < y1; ++y) {
    for (int x = x0; x < x1; ++x) {
      std::uint8_t* px = image.pixel(static_cast<std::uint32_t>(x), static_cast<std::uint32_t>(y));
      px[0] = mix(a, color.r, px[0]);
      px[1] = mix(a, color.g, px[1]);
      px[2] = mix(a, color.b, px[2]);
    }
  }
}

}  // namespace lolcommits::vision::detail
