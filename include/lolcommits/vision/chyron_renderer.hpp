#pragma once

#include <lolcommits/core/background.hpp>
#include <lolcommits/core/chyron_style.hpp>
#include <lolcommits/core/commit_metadata.hpp>
#include <lolcommits/core/composite_image.hpp>
#include <lolcommits/core/error.hpp>
#include <lolcommits/vision/font_resolver.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace lolcommits::vision {

/// Diff-stat number for the overlay: 950 -> "950", 1500 -> "1.5k", 2300000 -> "2.3M".
/// Values that would print as "1000.0k" are promoted to "1.0M".
[[nodiscard]] std::string format_stat_number(std::uint64_t n);

/// Badge color for a recognized conventional-commit type; nullopt otherwise.
[[nodiscard]] std::optional<lolcommits::core::Rgb> badge_color_for(std::string_view commit_type) noexcept;

/// Font per text role after fallback.
struct ResolvedFonts {
  FontAsset default_font;
  FontAsset message;
  FontAsset info;
  FontAsset sha;
  FontAsset stats;
};

/// Draws the bottom overlay band ("chyron"):
///
///   [FEAT] message text…                           abc1234
///   scope • repo • branch                          (3) +120 -4
///
/// The band is kBandHeight pixels (the whole image when shorter) and its fill is
/// blended with the style opacity. Text is drawn opaque with anti-aliased edges.
/// Only pixels inside the band are modified.
class ChyronRenderer {
 public:
  static constexpr std::uint32_t kBandHeight = 80;
  static constexpr int kMarginLeft = 15;
  static constexpr int kMarginRight = 30;
  static constexpr int kTitleOffset = 10;
  static constexpr int kInfoOffset = 45;
  static constexpr int kStatGap = 10;
  static constexpr std::size_t kShortShaLength = 7;

  ChyronRenderer(lolcommits::core::ChyronStyle style,
                 std::shared_ptr<const IFontResolver> resolver);

  /// Role font if configured and resolvable, else the default font (with a warning).
  /// FontResolutionError when the default font itself cannot be resolved.
  [[nodiscard]] std::expected<ResolvedFonts, lolcommits::core::PipelineError> resolve_fonts() const;

  [[nodiscard]] std::expected<void, lolcommits::core::PipelineError> render(
      lolcommits::core::CompositeImage& image,
      const lolcommits::core::CommitMetadata& commit) const;

  [[nodiscard]] const lolcommits::core::ChyronStyle& style() const noexcept { return style_; }

 private:
  lolcommits::core::ChyronStyle style_;
  std::shared_ptr<const IFontResolver> resolver_;
};

}  // namespace lolcommits::vision
