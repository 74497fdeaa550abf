#include <lolcommits/core/segmentation_mask.hpp>
#include <gtest/gtest.h>
#include <cmath>
#include <limits>

namespace lc = lolcommits::core;

TEST(SegmentationMask, FillConstructor) {
  lc::SegmentationMask m(4, 3, 0.5f);
  EXPECT_EQ(m.width(), 4u);
  EXPECT_EQ(m.height(), 3u);
  EXPECT_TRUE(m.consistent());
  EXPECT_EQ(m.values().size(), 12u);
  EXPECT_FLOAT_EQ(m.at(3, 2), 0.5f);
}

TEST(SegmentationMask, SetAndAt) {
  lc::SegmentationMask m(2, 2);
  m.set(1, 0, 0.25f);
  EXPECT_FLOAT_EQ(m.at(1, 0), 0.25f);
  EXPECT_FLOAT_EQ(m.values()[1], 0.25f);
}

TEST(SegmentationMask, InconsistentValues) {
  lc::SegmentationMask m(3, 3, std::vector<float>(4, 1.f));
  EXPECT_FALSE(m.consistent());
}

TEST(SegmentationMask, CenterOfMassEmptyMaskIsNullopt) {
  lc::SegmentationMask m(8, 8, 0.f);
  EXPECT_FALSE(m.center_of_mass().has_value());
}

TEST(SegmentationMask, CenterOfMassSinglePixel) {
  lc::SegmentationMask m(10, 10);
  m.set(7, 2, 1.f);
  auto c = m.center_of_mass();
  ASSERT_TRUE(c.has_value());
  EXPECT_DOUBLE_EQ(c->x, 7.0);
  EXPECT_DOUBLE_EQ(c->y, 2.0);
  EXPECT_DOUBLE_EQ(c->mass, 1.0);
}

TEST(SegmentationMask, CenterOfMassIsWeighted) {
  lc::SegmentationMask m(4, 1);
  m.set(0, 0, 1.f);
  m.set(3, 0, 0.5f);
  auto c = m.center_of_mass();
  ASSERT_TRUE(c.has_value());
  EXPECT_NEAR(c->x, (0.0 * 1.0 + 3.0 * 0.5) / 1.5, 1e-9);
}

TEST(SegmentationMask, NoiseFloorIgnoresFaintPixels) {
  lc::SegmentationMask m(10, 1);
  m.set(1, 0, 1.f);
  m.set(9, 0, 0.05f);
  auto c = m.center_of_mass(0.1f);
  ASSERT_TRUE(c.has_value());
  EXPECT_DOUBLE_EQ(c->x, 1.0);

  lc::SegmentationMask faint(4, 4, 0.1f);
  EXPECT_FALSE(faint.center_of_mass(0.1f).has_value());
}

TEST(SegmentationMask, ClampProbability) {
  EXPECT_FLOAT_EQ(lc::clamp_probability(-0.5f), 0.f);
  EXPECT_FLOAT_EQ(lc::clamp_probability(0.3f), 0.3f);
  EXPECT_FLOAT_EQ(lc::clamp_probability(1.7f), 1.f);
  EXPECT_FLOAT_EQ(lc::clamp_probability(std::numeric_limits<float>::quiet_NaN()), 0.f);
}
