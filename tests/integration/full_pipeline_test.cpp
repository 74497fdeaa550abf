#include <lolcommits/app/config.hpp>
#include <lolcommits/app/pipeline_runner.hpp>
#include <lolcommits/core/background.hpp>
#include <lolcommits/core/commit_metadata.hpp>
#include <lolcommits/core/frame.hpp>
#include <lolcommits/core/segmentation_mask.hpp>
#include <lolcommits/io/png_metadata.hpp>
#include <lolcommits/vision/chyron_renderer.hpp>
#include <lolcommits/vision/compositor.hpp>
#include <lolcommits/vision/font_resolver.hpp>
#include <lolcommits/vision/frame_source.hpp>
#include <lolcommits/vision/mock_segmenter.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>

namespace {

namespace la = lolcommits::app;
namespace lc = lolcommits::core;
namespace li = lolcommits::io;
namespace lv = lolcommits::vision;
namespace fs = std::filesystem;

constexpr std::uint32_t kWidth = 640;
constexpr std::uint32_t kHeight = 480;

lc::Frame gradient_frame() {
  std::vector<std::byte> buf(static_cast<std::size_t>(kWidth) * kHeight * 3);
  for (std::uint32_t y = 0; y < kHeight; ++y) {
    for (std::uint32_t x = 0; x < kWidth; ++x) {
      const std::size_t i = (static_cast<std::size_t>(y) * kWidth + x) * 3;
      buf[i] = static_cast<std::byte>(x % 256);
      buf[i + 1] = static_cast<std::byte>(y % 256);
      buf[i + 2] = std::byte{90};
    }
  }
  return lc::Frame(kWidth, kHeight, lc::PixelFormat::RGB8, std::move(buf));
}

/// Person-shaped blob: radius 100 around the image center.
lc::SegmentationMask blob_mask() {
  std::vector<float> values(static_cast<std::size_t>(kWidth) * kHeight, 0.f);
  for (std::uint32_t y = 0; y < kHeight; ++y) {
    for (std::uint32_t x = 0; x < kWidth; ++x) {
      const double dx = x - 319.5;
      const double dy = y - 239.5;
      if (dx * dx + dy * dy <= 100.0 * 100.0) values[static_cast<std::size_t>(y) * kWidth + x] = 1.f;
    }
  }
  return lc::SegmentationMask(kWidth, kHeight, std::move(values));
}

class FixedFrameSource : public lv::IFrameSource {
 public:
  std::expected<lc::Frame, lc::PipelineError> capture() override { return gradient_frame(); }
};

lc::CommitMetadata feature_commit() {
  lc::CommitMetadata c;
  c.repo_name = "integration";
  c.sha = "0123456789abcdef0123456789abcdef01234567";
  c.message = "feat: add thing";
  c.commit_type = lc::parse_commit_type(c.message);
  c.scope = lc::parse_commit_scope(c.message);
  c.timestamp = "2026-10-19 12:34:56";
  c.branch_name = "main";
  c.author = "Ada";
  c.stats.files_changed = 3;
  c.stats.insertions = 120;
  c.stats.deletions = 4;
  return c;
}

std::vector<std::uint8_t> read_bytes(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

std::shared_ptr<const lv::IFontResolver> system_resolver_or_null() {
  auto resolver = lv::FontconfigFontResolver::create();
  if (!resolver) return nullptr;
  if (!(*resolver)->resolve("monospace")) return nullptr;
  return *resolver;
}

class FullPipelineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = fs::temp_directory_path() /
           ("lolcommits_integration_" + std::to_string(::getpid()) + "_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(dir_);
    fs::create_directories(dir_);

    auto segmenter = std::make_shared<lv::MockSegmenter>();
    segmenter->set_mask(blob_mask());
    deps_.segmenter = segmenter;
    deps_.frame_source = &source_;
    config_ = la::default_config();
    config_.background = "#204060";
  }
  void TearDown() override { fs::remove_all(dir_); }

  /// What the compositor alone produces for the same inputs.
  lc::CompositeImage reference_composite() const {
    lv::Compositor compositor(la::compositor_options(config_));
    auto image = compositor.composite(gradient_frame(), blob_mask(),
                                      lc::BackgroundSpec{lc::Rgb{0x20, 0x40, 0x60}});
    EXPECT_TRUE(image.has_value());
    return std::move(*image);
  }

  li::DecodedArtifact decode(const fs::path& path) const {
    const auto bytes = read_bytes(path);
    auto decoded = li::decode_png_artifact(bytes);
    EXPECT_TRUE(decoded.has_value());
    return std::move(*decoded);
  }

  fs::path dir_;
  FixedFrameSource source_;
  la::PipelineDeps deps_;
  la::PipelineConfig config_;
};

}  // namespace

TEST_F(FullPipelineTest, WithoutChyronMatchesCompositor) {
  config_.enable_chyron = false;
  auto written = la::run_lolcommit(config_, deps_, feature_commit(), dir_ / "plain.png");
  ASSERT_TRUE(written.has_value()) << written.error().stage;

  const li::DecodedArtifact artifact = decode(*written);
  const lc::CompositeImage expected = reference_composite();
  ASSERT_EQ(artifact.image.width(), kWidth);
  ASSERT_EQ(artifact.image.height(), kHeight);
  EXPECT_TRUE(std::equal(expected.data().begin(), expected.data().end(),
                         artifact.image.data().begin()));

  // Person pixel keeps the camera color; a corner shows the background.
  const std::uint8_t* person = artifact.image.pixel(320, 240);
  EXPECT_EQ(person[0], 320 % 256);
  EXPECT_EQ(person[1], 240);
  EXPECT_EQ(person[2], 90);
  const std::uint8_t* corner = artifact.image.pixel(0, 0);
  EXPECT_EQ(corner[0], 0x20);
  EXPECT_EQ(corner[1], 0x40);
  EXPECT_EQ(corner[2], 0x60);
  EXPECT_EQ(corner[3], 255);
}

TEST_F(FullPipelineTest, ChyronOnlyTouchesTheBand) {
  auto resolver = system_resolver_or_null();
  if (!resolver) GTEST_SKIP() << "no system font available";
  deps_.font_resolver = resolver;

  auto written = la::run_lolcommit(config_, deps_, feature_commit(), dir_ / "chyron.png");
  ASSERT_TRUE(written.has_value()) << written.error().stage;

  const li::DecodedArtifact artifact = decode(*written);
  const lc::CompositeImage expected = reference_composite();
  const std::uint32_t band_top = kHeight - lv::ChyronRenderer::kBandHeight;

  const std::size_t above_band = static_cast<std::size_t>(band_top) * expected.stride();
  EXPECT_TRUE(std::equal(expected.data().begin(), expected.data().begin() + above_band,
                         artifact.image.data().begin()));
  EXPECT_FALSE(std::equal(expected.data().begin() + above_band, expected.data().end(),
                          artifact.image.data().begin() + above_band));
}

TEST_F(FullPipelineTest, MetadataSurvivesTheRoundTrip) {
  config_.enable_chyron = false;
  auto written = la::run_lolcommit(config_, deps_, feature_commit(), dir_ / "meta.png");
  ASSERT_TRUE(written.has_value());

  auto restored = li::load_commit_metadata(*written);
  ASSERT_TRUE(restored.has_value());
  EXPECT_EQ(*restored, feature_commit());
  EXPECT_EQ(restored->commit_type, "feat");
  EXPECT_TRUE(restored->scope.empty());
  EXPECT_EQ(restored->diff_stats_string(), "3 files changed, 120 insertions(+), 4 deletions(-)");
}
