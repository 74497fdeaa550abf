#include <lolcommits/core/error.hpp>
#include <lolcommits/vision/font_resolver.hpp>
#include <gtest/gtest.h>
#include <filesystem>

namespace lc = lolcommits::core;
namespace lv = lolcommits::vision;

TEST(FontResolver, GenericFamilies) {
  EXPECT_TRUE(lv::is_generic_font_family("monospace"));
  EXPECT_TRUE(lv::is_generic_font_family("Sans-Serif"));
  EXPECT_TRUE(lv::is_generic_font_family("serif"));
  EXPECT_FALSE(lv::is_generic_font_family("DejaVu Sans Mono"));
  EXPECT_FALSE(lv::is_generic_font_family(""));
}

TEST(FontResolver, UnknownFamilyIsFontResolutionError) {
  auto resolver = lv::FontconfigFontResolver::create();
  if (!resolver) {
    GTEST_SKIP() << "fontconfig configuration not available";
  }
  auto asset = (*resolver)->resolve("No Such Font Family 7f3a91");
  ASSERT_FALSE(asset.has_value());
  EXPECT_EQ(asset.error(), lc::PipelineError::FontResolutionError);
}

TEST(FontResolver, EmptyNameIsFontResolutionError) {
  auto resolver = lv::FontconfigFontResolver::create();
  if (!resolver) {
    GTEST_SKIP() << "fontconfig configuration not available";
  }
  auto asset = (*resolver)->resolve("");
  ASSERT_FALSE(asset.has_value());
  EXPECT_EQ(asset.error(), lc::PipelineError::FontResolutionError);
}

TEST(FontResolver, MonospaceResolvesToExistingFile) {
  auto resolver = lv::FontconfigFontResolver::create();
  if (!resolver) {
    GTEST_SKIP() << "fontconfig configuration not available";
  }
  auto asset = (*resolver)->resolve("monospace");
  if (!asset) {
    GTEST_SKIP() << "no fonts installed";
  }
  EXPECT_TRUE(std::filesystem::is_regular_file(asset->file));
  EXPECT_GE(asset->face_index, 0);
  EXPECT_FALSE(asset->family.empty());

  // The family fontconfig reports resolves to itself.
  auto again = (*resolver)->resolve(asset->family);
  ASSERT_TRUE(again.has_value());
  EXPECT_EQ(again->family, asset->family);
}
