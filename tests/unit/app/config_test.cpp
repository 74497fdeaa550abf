#include <lolcommits/app/config.hpp>
#include <lolcommits/app/logging.hpp>
#include <lolcommits/core/error.hpp>
#include <spdlog/spdlog.h>
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace la = lolcommits::app;
namespace lc = lolcommits::core;
namespace fs = std::filesystem;

namespace {

fs::path write_config(const std::string& name, const std::string& contents) {
  const fs::path p = fs::temp_directory_path() /
                     ("lolcommits_cfg_" + std::to_string(::getpid()) + "_" + name + ".conf");
  std::ofstream out(p);
  out << contents;
  return p;
}

}  // namespace

TEST(Config, Defaults) {
  const la::PipelineConfig c = la::default_config();
  EXPECT_EQ(c.camera_device, "0");
  EXPECT_EQ(c.backend_type, la::SegmenterBackendType::Mock);
  EXPECT_EQ(c.background, "#1e1e1e");
  EXPECT_TRUE(c.center_person);
  EXPECT_TRUE(c.enable_chyron);
  EXPECT_EQ(c.default_font_name, "monospace");
  EXPECT_FLOAT_EQ(c.chyron_opacity, 0.75f);
  EXPECT_EQ(c.log_level, "info");
  EXPECT_TRUE(la::validate_config(c).has_value());
}

TEST(Config, MissingFileGivesDefaults) {
  const la::PipelineConfig c = la::load_config("/nonexistent/lolcommits_12345.conf");
  EXPECT_EQ(c.camera_device, "0");
  EXPECT_EQ(c.capture_timeout_ms, 5000u);
}

TEST(Config, LoadKeyValueFile) {
  const fs::path p = write_config("load",
                                  "# camera\n"
                                  "camera_device = /dev/video2\n"
                                  "camera_warmup_frames=5\n"
                                  "camera_width=1280\n"
                                  "\n"
                                  "backend_type=onnx\n"
                                  "model_path=/models/u2netp.onnx\n"
                                  "background=beach\n"
                                  "center_person=false\n"
                                  "sha_font_name=Fira Code\n"
                                  "chyron_opacity=0.5\n"
                                  "images_dir=/tmp/lol\n"
                                  "unknown_key=ignored\n");
  const la::PipelineConfig c = la::load_config(p.string());
  fs::remove(p);

  EXPECT_EQ(c.camera_device, "/dev/video2");
  EXPECT_EQ(c.camera_warmup_frames, 5u);
  ASSERT_TRUE(c.camera_width.has_value());
  EXPECT_EQ(*c.camera_width, 1280u);
  EXPECT_FALSE(c.camera_height.has_value());
  EXPECT_EQ(c.backend_type, la::SegmenterBackendType::Onnx);
  EXPECT_EQ(c.model_path, "/models/u2netp.onnx");
  EXPECT_EQ(c.background, "beach");
  EXPECT_FALSE(c.center_person);
  ASSERT_TRUE(c.sha_font_name.has_value());
  EXPECT_EQ(*c.sha_font_name, "Fira Code");
  EXPECT_FLOAT_EQ(c.chyron_opacity, 0.5f);
  EXPECT_EQ(c.images_dir, "/tmp/lol");
  EXPECT_TRUE(la::validate_config(c).has_value());
}

TEST(Config, MalformedValuesThrow) {
  const fs::path bad_bool = write_config("bool", "enable_chyron=maybe\n");
  EXPECT_THROW(la::load_config(bad_bool.string()), std::invalid_argument);
  fs::remove(bad_bool);

  const fs::path bad_backend = write_config("backend", "backend_type=tensorflow\n");
  EXPECT_THROW(la::load_config(bad_backend.string()), std::invalid_argument);
  fs::remove(bad_backend);

  const fs::path bad_number = write_config("number", "title_font_size=large\n");
  EXPECT_THROW(la::load_config(bad_number.string()), std::invalid_argument);
  fs::remove(bad_number);
}

TEST(Config, ValidateRejectsBadValues) {
  auto check = [](auto mutate) {
    la::PipelineConfig c = la::default_config();
    mutate(c);
    auto v = la::validate_config(c);
    return v.has_value() ? lc::PipelineError::None : v.error();
  };
  EXPECT_EQ(check([](la::PipelineConfig& c) { c.chyron_opacity = 1.5f; }),
            lc::PipelineError::InvalidConfig);
  EXPECT_EQ(check([](la::PipelineConfig& c) { c.chyron_opacity = -0.1f; }),
            lc::PipelineError::InvalidConfig);
  EXPECT_EQ(check([](la::PipelineConfig& c) { c.title_font_size = 0.f; }),
            lc::PipelineError::InvalidConfig);
  EXPECT_EQ(check([](la::PipelineConfig& c) { c.backend_type = la::SegmenterBackendType::Onnx; }),
            lc::PipelineError::InvalidConfig);
  EXPECT_EQ(check([](la::PipelineConfig& c) { c.background.clear(); }),
            lc::PipelineError::InvalidConfig);
  EXPECT_EQ(check([](la::PipelineConfig& c) { c.default_font_name.clear(); }),
            lc::PipelineError::InvalidConfig);
  EXPECT_EQ(check([](la::PipelineConfig& c) { c.capture_timeout_ms = 0; }),
            lc::PipelineError::InvalidConfig);
  EXPECT_EQ(check([](la::PipelineConfig& c) { c.chyron_opacity = 0.f; }), lc::PipelineError::None);
}

TEST(Config, DerivedOptions) {
  la::PipelineConfig c = la::default_config();
  c.default_font_name = "DejaVu Sans Mono";
  c.info_font_name = "DejaVu Sans";
  c.chyron_opacity = 0.6f;
  c.camera_device = "1";
  c.capture_timeout_ms = 2500;
  c.camera_fps = 30.0;
  c.center_person = false;
  c.inference_threads = 0;

  const lc::ChyronStyle style = la::chyron_style(c);
  EXPECT_EQ(style.font_name(lc::TextRole::Info), "DejaVu Sans");
  EXPECT_EQ(style.font_name(lc::TextRole::Sha), "DejaVu Sans Mono");
  EXPECT_FLOAT_EQ(style.opacity, 0.6f);

  const auto cam = la::camera_options(c);
  EXPECT_EQ(cam.device, "1");
  EXPECT_EQ(cam.capture_timeout.count(), 2500);
  ASSERT_TRUE(cam.fps.has_value());
  EXPECT_DOUBLE_EQ(*cam.fps, 30.0);

  EXPECT_FALSE(la::compositor_options(c).center_person);
  EXPECT_EQ(la::segmenter_options(c).intra_op_threads, 1);
}

TEST(Logging, LevelFromConfig) {
  if (std::getenv("SPDLOG_LEVEL")) {
    GTEST_SKIP() << "SPDLOG_LEVEL overrides the configured level";
  }
  la::init_logging("warn");
  EXPECT_EQ(spdlog::get_level(), spdlog::level::warn);
  la::init_logging("nonsense");
  EXPECT_EQ(spdlog::get_level(), spdlog::level::info);
  la::init_logging("off");
  EXPECT_EQ(spdlog::get_level(), spdlog::level::off);
  la::init_logging("info");
  ASSERT_NE(spdlog::default_logger(), nullptr);
  EXPECT_EQ(spdlog::default_logger()->name(), "lolcommits");
}
