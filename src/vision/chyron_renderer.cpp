#include <lolcommits/vision/chyron_renderer.hpp>
#include "text_painter.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>
#include <vector>

namespace lolcommits::vision {

namespace {

namespace lc = lolcommits::core;

constexpr int kBadgePadX = 6;
constexpr int kBadgeGap = 10;

struct ColoredText {
  std::u32string text;
  lc::Rgb color;
};

std::string uppercase(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

std::string info_line(const lc::CommitMetadata& commit) {
  std::string out;
  for (const std::string* part : {&commit.scope, &commit.repo_name, &commit.branch_name}) {
    if (part->empty()) continue;
    if (!out.empty()) out += " • ";
    out += *part;
  }
  return out;
}

}  // namespace

std::string format_stat_number(std::uint64_t n) {
  if (n < 1000) return fmt::format("{}", n);
  // 999950 and up would print as "1000.0k".
  if (n < 999'950) return fmt::format("{:.1f}k", static_cast<double>(n) / 1000.0);
  return fmt::format("{:.1f}M", static_cast<double>(n) / 1'000'000.0);
}

std::optional<lc::Rgb> badge_color_for(std::string_view commit_type) noexcept {
  if (commit_type == "feat") return lc::Rgb{46, 160, 67};
  if (commit_type == "fix") return lc::Rgb{215, 58, 73};
  if (commit_type == "docs") return lc::Rgb{3, 102, 214};
  if (commit_type == "style") return lc::Rgb{111, 66, 193};
  if (commit_type == "refactor") return lc::Rgb{227, 98, 9};
  if (commit_type == "perf") return lc::Rgb{191, 135, 0};
  if (commit_type == "test") return lc::Rgb{0, 128, 128};
  if (commit_type == "build") return lc::Rgb{88, 96, 105};
  if (commit_type == "ci") return lc::Rgb{36, 41, 47};
  if (commit_type == "chore") return lc::Rgb{106, 115, 125};
  if (commit_type == "revert") return lc::Rgb{179, 29, 40};
  return std::nullopt;
}

ChyronRenderer::ChyronRenderer(lc::ChyronStyle style, std::shared_ptr<const IFontResolver> resolver)
    : style_(std::move(style)), resolver_(std::move(resolver)) {}

std::expected<ResolvedFonts, lc::PipelineError> ChyronRenderer::resolve_fonts() const {
  if (!resolver_) return std::unexpected(lc::PipelineError::FontResolutionError);

  auto default_font = resolver_->resolve(style_.default_font_name);
  if (!default_font) {
    spdlog::error("default font '{}' could not be resolved", style_.default_font_name);
    return std::unexpected(lc::PipelineError::FontResolutionError);
  }

  auto role_font = [&](lc::TextRole role) -> FontAsset {
    const std::string& name = style_.font_name(role);
    if (name == style_.default_font_name) return *default_font;
    auto asset = resolver_->resolve(name);
    if (asset) return *asset;
    spdlog::warn("{} font '{}' not found, using '{}'", lc::to_string(role), name,
                 style_.default_font_name);
    return *default_font;
  };

  ResolvedFonts fonts;
  fonts.default_font = *default_font;
  fonts.message = role_font(lc::TextRole::Message);
  fonts.info = role_font(lc::TextRole::Info);
  fonts.sha = role_font(lc::TextRole::Sha);
  fonts.stats = role_font(lc::TextRole::Stats);
  return fonts;
}

std::expected<void, lc::PipelineError> ChyronRenderer::render(
    lc::CompositeImage& image,
    const lc::CommitMetadata& commit) const {
  if (image.empty()) return std::unexpected(lc::PipelineError::InvalidFrame);

  auto fonts = resolve_fonts();
  if (!fonts) return std::unexpected(fonts.error());

  auto library = detail::open_freetype();
  if (!library) return std::unexpected(library.error());

  auto open_face = [&](const FontAsset& asset, lc::TextRole role,
                       float size) -> std::expected<detail::TextFace, lc::PipelineError> {
    auto face = detail::TextFace::open(library->get(), asset, size);
    if (face || asset.file == fonts->default_font.file) return face;
    spdlog::warn("{} font {} unusable, using default font", lc::to_string(role),
                 asset.file.string());
    return detail::TextFace::open(library->get(), fonts->default_font, size);
  };

  auto message_face = open_face(fonts->message, lc::TextRole::Message, style_.title_font_size);
  if (!message_face) return std::unexpected(message_face.error());
  auto sha_face = open_face(fonts->sha, lc::TextRole::Sha, style_.title_font_size);
  if (!sha_face) return std::unexpected(sha_face.error());
  auto info_face = open_face(fonts->info, lc::TextRole::Info, style_.info_font_size);
  if (!info_face) return std::unexpected(info_face.error());
  auto stats_face = open_face(fonts->stats, lc::TextRole::Stats, style_.info_font_size);
  if (!stats_face) return std::unexpected(stats_face.error());

  const int width = static_cast<int>(image.width());
  const int height = static_cast<int>(image.height());
  const int band_height = std::min(static_cast<int>(kBandHeight), height);
  const int y0 = height - band_height;
  const detail::ClipRect band{0, y0, width, height};

  detail::fill_rect(image, band, style_.band_color, style_.opacity);

  const int title_y = y0 + kTitleOffset;
  const int info_y = y0 + kInfoOffset;

  // Right column: short SHA above the stats, both starting at the same x.
  const std::u32string sha =
      detail::to_codepoints(std::string_view(commit.sha).substr(0, kShortShaLength));

  std::vector<ColoredText> stats;
  if (commit.stats.files_changed > 0) {
    stats.push_back({detail::to_codepoints("(" + format_stat_number(commit.stats.files_changed) + ")"),
                     style_.files_color});
  }
  if (commit.stats.insertions > 0) {
    stats.push_back({detail::to_codepoints("+" + format_stat_number(commit.stats.insertions)),
                     style_.insertions_color});
  }
  if (commit.stats.deletions > 0) {
    stats.push_back({detail::to_codepoints("-" + format_stat_number(commit.stats.deletions)),
                     style_.deletions_color});
  }

  int stats_width = 0;
  for (std::size_t i = 0; i < stats.size(); ++i) {
    stats_width += stats_face->measure(stats[i].text) + (i + 1 < stats.size() ? kStatGap : 0);
  }
  const int sha_width = sha.empty() ? 0 : sha_face->measure(sha);
  const int column_x = width - kMarginRight - std::max(stats_width, sha_width);

  if (!sha.empty()) {
    sha_face->draw(image, column_x, title_y, sha, style_.sha_color, band);
  }
  int x = column_x;
  for (const ColoredText& part : stats) {
    x += stats_face->draw(image, x, info_y, part.text, part.color, band) + kStatGap;
  }

  // Left column stops short of the right column.
  const int text_right = column_x - kMarginLeft;
  int title_x = kMarginLeft;

  const std::string_view subject = lc::first_line(commit.message);
  std::string message(subject);
  const auto badge_color = lc::is_recognized_commit_type(commit.commit_type)
                               ? badge_color_for(commit.commit_type)
                               : std::nullopt;
  if (badge_color) {
    const std::u32string label = detail::to_codepoints(uppercase(commit.commit_type));
    const int badge_width = info_face->measure(label) + 2 * kBadgePadX;
    if (title_x + badge_width <= text_right) {
      const int badge_height = message_face->line_height();
      detail::fill_rect(image, {title_x, title_y, title_x + badge_width, title_y + badge_height},
                        *badge_color, 1.f);
      const int label_top = title_y + (badge_height - info_face->line_height()) / 2;
      info_face->draw(image, title_x + kBadgePadX, label_top, label, style_.message_color, band);
      title_x += badge_width + kBadgeGap;
    }
    message = lc::strip_commit_prefix(subject);
  }

  const std::u32string title =
      detail::ellipsize(*message_face, detail::to_codepoints(message), text_right - title_x);
  message_face->draw(image, title_x, title_y, title, style_.message_color, band);

  const std::u32string info = detail::ellipsize(*info_face, detail::to_codepoints(info_line(commit)),
                                                text_right - kMarginLeft);
  info_face->draw(image, kMarginLeft, info_y, info, style_.info_color, band);

  spdlog::debug("chyron drawn: band y={} h={}, right column x={}", y0, band_height, column_x);
  return {};
}

}  // namespace lolcommits::vision
