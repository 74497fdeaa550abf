#pragma once

#include <lolcommits/core/chyron_style.hpp>
#include <lolcommits/core/error.hpp>
#include <lolcommits/vision/compositor.hpp>
#include <lolcommits/vision/frame_source.hpp>
#include <lolcommits/vision/onnx_segmenter.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>

namespace lolcommits::app {

/// Segmentation backend type: mock (whole frame is foreground) or onnx (real model).
enum class SegmenterBackendType {
  Mock,
  Onnx,
};

/// Pipeline configuration: camera, model, background, overlay, output.
struct PipelineConfig {
  // Camera
  std::string camera_device{"0"};
  std::uint32_t camera_warmup_frames{3};
  std::uint32_t capture_timeout_ms{5000};
  std::optional<std::uint32_t> camera_width;
  std::optional<std::uint32_t> camera_height;
  std::optional<double> camera_fps;

  // Segmentation
  SegmenterBackendType backend_type{SegmenterBackendType::Mock};
  std::string model_path;
  float normalize_mean{0.f};
  float normalize_scale{1.f / 255.f};
  int inference_threads{1};

  // Compositing
  std::string background{"#1e1e1e"};  // "#rrggbb" or image path / XDG data name
  bool center_person{true};

  // Chyron
  bool enable_chyron{true};
  std::string default_font_name{"monospace"};
  std::optional<std::string> message_font_name;
  std::optional<std::string> info_font_name;
  std::optional<std::string> sha_font_name;
  std::optional<std::string> stats_font_name;
  float chyron_opacity{0.75f};
  float title_font_size{28.f};
  float info_font_size{18.f};

  // Output
  std::string images_dir;  // empty: default_images_dir()
  std::string log_level{"info"};
};

/// Load config from a simple key=value file (one per line, '#' comments) on top of
/// the defaults. A missing file yields the defaults. Malformed values throw
/// std::invalid_argument (or std::out_of_range for numbers that do not fit).
PipelineConfig load_config(const std::string& path);

/// Default config when no file is provided.
PipelineConfig default_config();

/// Range and consistency checks: opacity in [0, 1], positive font sizes,
/// onnx backend with a model_path, non-empty background. InvalidConfig otherwise.
[[nodiscard]] std::expected<void, lolcommits::core::PipelineError> validate_config(
    const PipelineConfig& config);

[[nodiscard]] lolcommits::core::ChyronStyle chyron_style(const PipelineConfig& config);
[[nodiscard]] lolcommits::vision::CameraOptions camera_options(const PipelineConfig& config);
[[nodiscard]] lolcommits::vision::CompositorOptions compositor_options(const PipelineConfig& config);
[[nodiscard]] lolcommits::vision::OnnxSegmenterOptions segmenter_options(const PipelineConfig& config);

}  // namespace lolcommits::app
