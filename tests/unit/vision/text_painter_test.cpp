#include "text_painter.hpp"
#include <lolcommits/core/composite_image.hpp>
#include <lolcommits/vision/font_resolver.hpp>
#include <gtest/gtest.h>
#include <string>

namespace lc = lolcommits::core;
namespace lv = lolcommits::vision;
namespace ld = lolcommits::vision::detail;

TEST(TextPainter, CodepointsReplaceMalformedBytes) {
  EXPECT_EQ(ld::to_codepoints("ab"), U"ab");
  EXPECT_EQ(ld::to_codepoints("\xE2\x80\xA2"), U"•");
  EXPECT_EQ(ld::to_codepoints("a\xFFz"), U"a\uFFFDz");
}

TEST(TextPainter, FillRectIsClippedToImage) {
  lc::CompositeImage img(10, 10);
  ld::fill_rect(img, {-5, 8, 20, 20}, lc::Rgb{200, 100, 50}, 1.f);
  EXPECT_EQ(img.pixel(0, 9)[0], 200);
  EXPECT_EQ(img.pixel(9, 8)[1], 100);
  EXPECT_EQ(img.pixel(5, 7)[0], 0);
  EXPECT_EQ(img.pixel(0, 9)[3], 255);
}

TEST(TextPainter, EllipsizeFitsWidth) {
  auto resolver = lv::FontconfigFontResolver::create();
  if (!resolver) GTEST_SKIP() << "fontconfig configuration not available";
  auto asset = (*resolver)->resolve("monospace");
  if (!asset) GTEST_SKIP() << "no monospace font available";

  auto library = ld::open_freetype();
  ASSERT_TRUE(library.has_value());
  auto face = ld::TextFace::open(library->get(), *asset, 20.f);
  ASSERT_TRUE(face.has_value());

  const std::u32string text = U"a fairly long commit subject that will not fit";
  EXPECT_EQ(ld::ellipsize(*face, text, 100000), text);

  const int max_width = face->measure(text) / 2;
  const std::u32string cut = ld::ellipsize(*face, text, max_width);
  ASSERT_FALSE(cut.empty());
  EXPECT_EQ(cut.back(), U'…');
  EXPECT_LE(face->measure(cut), max_width);
  EXPECT_TRUE(ld::ellipsize(*face, text, 0).empty());

  lc::CompositeImage img(200, 40);
  const int advance = face->draw(img, 0, 0, U"Hi", lc::Rgb{255, 255, 255}, {0, 0, 200, 40});
  EXPECT_GT(advance, 0);
  EXPECT_NEAR(advance, face->measure(U"Hi"), 1);
}

TEST(TextPainter, EllipsizeLongLineKeepsAFittingPrefix) {
  auto resolver = lv::FontconfigFontResolver::create();
  if (!resolver) GTEST_SKIP() << "fontconfig configuration not available";
  auto asset = (*resolver)->resolve("monospace");
  if (!asset) GTEST_SKIP() << "no monospace font available";

  auto library = ld::open_freetype();
  ASSERT_TRUE(library.has_value());
  auto face = ld::TextFace::open(library->get(), *asset, 16.f);
  ASSERT_TRUE(face.has_value());

  std::u32string text;
  for (int i = 0; i < 4000; ++i) text.push_back(U'a' + static_cast<char32_t>(i % 26));

  const auto widths = face->prefix_widths(text);
  ASSERT_EQ(widths.size(), text.size() + 1);
  EXPECT_EQ(widths.front(), 0);
  EXPECT_EQ(widths.back(), face->measure(text));

  const int max_width = 640;
  const std::u32string cut = ld::ellipsize(*face, text, max_width);
  ASSERT_GE(cut.size(), 2u);
  EXPECT_EQ(cut.back(), U'\u2026');
  EXPECT_EQ(text.compare(0, cut.size() - 1, cut, 0, cut.size() - 1), 0);
  EXPECT_LE(face->measure(cut), max_width);
  EXPECT_GT(face->measure(cut), max_width - 3 * face->measure(U"m"));
}
