#ifdef LOLCOMMITS_HAS_TBB

#include <lolcommits/app/config.hpp>
#include <lolcommits/app/pipeline_runner_tbb.hpp>
#include <lolcommits/core/commit_metadata.hpp>
#include <lolcommits/core/error.hpp>
#include <lolcommits/core/frame.hpp>
#include <lolcommits/io/png_metadata.hpp>
#include <lolcommits/vision/frame_source.hpp>
#include <lolcommits/vision/mock_segmenter.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>

namespace la = lolcommits::app;
namespace lc = lolcommits::core;
namespace li = lolcommits::io;
namespace lv = lolcommits::vision;
namespace fs = std::filesystem;

namespace {

class CountingFrameSource : public lv::IFrameSource {
 public:
  explicit CountingFrameSource(std::optional<lc::PipelineError> error = std::nullopt)
      : error_(error) {}

  std::expected<lc::Frame, lc::PipelineError> capture() override {
    calls++;
    if (error_) return std::unexpected(*error_);
    return lc::Frame(32, 24, lc::PixelFormat::RGB8, std::vector<std::byte>(32 * 24 * 3, std::byte{200}));
  }

  std::atomic<int> calls{0};

 private:
  std::optional<lc::PipelineError> error_;
};

lc::CommitMetadata make_commit() {
  lc::CommitMetadata c;
  c.repo_name = "tbb";
  c.sha = "feedface";
  c.message = "perf: capture in parallel";
  c.commit_type = "perf";
  c.timestamp = "2026-10-19 11:11:11";
  return c;
}

fs::path scratch_dir(const std::string& name) {
  const fs::path dir =
      fs::temp_directory_path() / ("lolcommits_tbb_" + std::to_string(::getpid()) + "_" + name);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

}  // namespace

TEST(PipelineRunnerTbbTest, ConcurrentCaptureWritesSameArtifact) {
  const fs::path dir = scratch_dir("ok");
  CountingFrameSource source;
  la::PipelineDeps deps;
  deps.frame_source = &source;
  deps.segmenter = std::make_shared<const lv::MockSegmenter>();
  la::PipelineConfig config = la::default_config();
  config.enable_chyron = false;

  std::vector<std::string> stages;
  la::StageTimingCallback cb = [&stages](std::size_t, std::string_view name, double) {
    stages.emplace_back(name);
  };
  auto written = la::run_lolcommit_tbb(config, deps, make_commit(), dir / "a.png", &cb);
  ASSERT_TRUE(written.has_value());
  EXPECT_EQ(source.calls.load(), 1);
  EXPECT_EQ(stages, (std::vector<std::string>{"segmentation", "composite", "encode", "persist"}));

  auto seq = la::run_lolcommit(config, deps, make_commit(), dir / "b.png");
  ASSERT_TRUE(seq.has_value());

  auto a = li::read_png_metadata(*written);
  auto b = li::read_png_metadata(*seq);
  ASSERT_TRUE(a.has_value() && a->has_value());
  ASSERT_TRUE(b.has_value() && b->has_value());
  EXPECT_EQ(**a, **b);
  fs::remove_all(dir);
}

TEST(PipelineRunnerTbbTest, BackgroundFailureWinsOverCaptureFailure) {
  const fs::path dir = scratch_dir("fail");
  CountingFrameSource source(lc::PipelineError::DeviceBusy);
  la::PipelineDeps deps;
  deps.frame_source = &source;
  deps.segmenter = std::make_shared<const lv::MockSegmenter>();
  la::PipelineConfig config = la::default_config();
  config.enable_chyron = false;
  config.background = "/nonexistent/lolcommits_bg_12345.png";

  auto concurrent = la::run_lolcommit_tbb(config, deps, make_commit(), dir / "a.png");
  auto sequential = la::run_lolcommit(config, deps, make_commit(), dir / "b.png");
  ASSERT_FALSE(concurrent.has_value());
  ASSERT_FALSE(sequential.has_value());
  EXPECT_EQ(concurrent.error().stage, "background");
  EXPECT_EQ(concurrent.error().error, lc::PipelineError::BackgroundLoadError);
  EXPECT_EQ(concurrent.error().stage, sequential.error().stage);
  EXPECT_EQ(concurrent.error().error, sequential.error().error);
  EXPECT_TRUE(fs::is_empty(dir));
  fs::remove_all(dir);
}

TEST(PipelineRunnerTbbTest, CaptureFailureWithGoodBackground) {
  const fs::path dir = scratch_dir("busy");
  CountingFrameSource source(lc::PipelineError::DeviceBusy);
  la::PipelineDeps deps;
  deps.frame_source = &source;
  deps.segmenter = std::make_shared<const lv::MockSegmenter>();
  la::PipelineConfig config = la::default_config();
  config.enable_chyron = false;

  auto written = la::run_lolcommit_tbb(config, deps, make_commit(), dir / "a.png");
  ASSERT_FALSE(written.has_value());
  EXPECT_EQ(written.error().stage, "capture");
  EXPECT_EQ(written.error().error, lc::PipelineError::DeviceBusy);
  EXPECT_TRUE(fs::is_empty(dir));
  fs::remove_all(dir);
}

TEST(PipelineRunnerTbbTest, BackgroundFailureAfterGoodCapture) {
  const fs::path dir = scratch_dir("bg");
  CountingFrameSource source;
  la::PipelineDeps deps;
  deps.frame_source = &source;
  deps.segmenter = std::make_shared<const lv::MockSegmenter>();
  la::PipelineConfig config = la::default_config();
  config.enable_chyron = false;
  config.background = "/nonexistent/lolcommits_bg_12345.png";

  auto written = la::run_lolcommit_tbb(config, deps, make_commit(), dir / "a.png");
  ASSERT_FALSE(written.has_value());
  EXPECT_EQ(written.error().stage, "background");
  EXPECT_EQ(written.error().error, lc::PipelineError::BackgroundLoadError);
  fs::remove_all(dir);
}

#endif  // LOLCOMMITS_HAS_TBB
