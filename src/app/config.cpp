#include <lolcommits/app/config.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace lolcommits::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

bool parse_bool(const std::string& key, std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
  if (value == "false" || value == "0" || value == "no" || value == "off") return false;
  throw std::invalid_argument("config: " + key + " expects true or false, got '" + value + "'");
}

std::uint32_t parse_u32(const std::string& value) {
  const unsigned long v = std::stoul(value);
  if (v > UINT32_MAX) throw std::out_of_range(value);
  return static_cast<std::uint32_t>(v);
}

std::optional<std::string> optional_string(const std::string& value) {
  if (value.empty()) return std::nullopt;
  return value;
}

}  // namespace

PipelineConfig default_config() {
  return PipelineConfig{};
}

PipelineConfig load_config(const std::string& path) {
  PipelineConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    spdlog::debug("config {} not found, using defaults", path);
    return c;
  }

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "camera_device") c.camera_device = value;
    else if (key == "camera_warmup_frames") c.camera_warmup_frames = parse_u32(value);
    else if (key == "capture_timeout_ms") c.capture_timeout_ms = parse_u32(value);
    else if (key == "camera_width") c.camera_width = parse_u32(value);
    else if (key == "camera_height") c.camera_height = parse_u32(value);
    else if (key == "camera_fps") c.camera_fps = std::stod(value);
    else if (key == "backend_type") {
      if (value == "onnx") c.backend_type = SegmenterBackendType::Onnx;
      else if (value == "mock") c.backend_type = SegmenterBackendType::Mock;
      else throw std::invalid_argument("config: unknown backend_type '" + value + "'");
    }
    else if (key == "model_path") c.model_path = value;
    else if (key == "normalize_mean") c.normalize_mean = std::stof(value);
    else if (key == "normalize_scale") c.normalize_scale = std::stof(value);
    else if (key == "inference_threads") c.inference_threads = std::stoi(value);
    else if (key == "background") c.background = value;
    else if (key == "center_person") c.center_person = parse_bool(key, value);
    else if (key == "enable_chyron") c.enable_chyron = parse_bool(key, value);
    else if (key == "default_font_name") c.default_font_name = value;
    else if (key == "message_font_name") c.message_font_name = optional_string(value);
    else if (key == "info_font_name") c.info_font_name = optional_string(value);
    else if (key == "sha_font_name") c.sha_font_name = optional_string(value);
    else if (key == "stats_font_name") c.stats_font_name = optional_string(value);
    else if (key == "chyron_opacity") c.chyron_opacity = std::stof(value);
    else if (key == "title_font_size") c.title_font_size = std::stof(value);
    else if (key == "info_font_size") c.info_font_size = std::stof(value);
    else if (key == "images_dir") c.images_dir = value;
    else if (key == "log_level") c.log_level = value;
    else spdlog::warn("config {}: unknown key '{}'", path, key);
  }
  return c;
}

std::expected<void, lolcommits::core::PipelineError> validate_config(const PipelineConfig& config) {
  using lolcommits::core::PipelineError;
  if (!(config.chyron_opacity >= 0.f && config.chyron_opacity <= 1.f)) {
    spdlog::error("chyron_opacity must be within [0, 1], got {}", config.chyron_opacity);
    return std::unexpected(PipelineError::InvalidConfig);
  }
  if (!(config.title_font_size > 0.f) || !(config.info_font_size > 0.f)) {
    spdlog::error("font sizes must be positive");
    return std::unexpected(PipelineError::InvalidConfig);
  }
  if (config.backend_type == SegmenterBackendType::Onnx && config.model_path.empty()) {
    spdlog::error("backend_type=onnx requires model_path to be set");
    return std::unexpected(PipelineError::InvalidConfig);
  }
  if (config.background.empty()) {
    spdlog::error("background must not be empty");
    return std::unexpected(PipelineError::InvalidConfig);
  }
  if (config.default_font_name.empty()) {
    spdlog::error("default_font_name must not be empty");
    return std::unexpected(PipelineError::InvalidConfig);
  }
  if (config.capture_timeout_ms == 0) {
    spdlog::error("capture_timeout_ms must be positive");
    return std::unexpected(PipelineError::InvalidConfig);
  }
  return {};
}

lolcommits::core::ChyronStyle chyron_style(const PipelineConfig& config) {
  lolcommits::core::ChyronStyle style;
  style.default_font_name = config.default_font_name;
  style.message_font_name = config.message_font_name;
  style.info_font_name = config.info_font_name;
  style.sha_font_name = config.sha_font_name;
  style.stats_font_name = config.stats_font_name;
  style.opacity = config.chyron_opacity;
  style.title_font_size = config.title_font_size;
  style.info_font_size = config.info_font_size;
  return style;
}

lolcommits::vision::CameraOptions camera_options(const PipelineConfig& config) {
  lolcommits::vision::CameraOptions options;
  options.device = config.camera_device;
  options.warmup_frames = config.camera_warmup_frames;
  options.capture_timeout = std::chrono::milliseconds(config.capture_timeout_ms);
  options.width = config.camera_width;
  options.height = config.camera_height;
  options.fps = config.camera_fps;
  return options;
}

lolcommits::vision::CompositorOptions compositor_options(const PipelineConfig& config) {
  lolcommits::vision::CompositorOptions options;
  options.center_person = config.center_person;
  return options;
}

lolcommits::vision::OnnxSegmenterOptions segmenter_options(const PipelineConfig& config) {
  lolcommits::vision::OnnxSegmenterOptions options;
  options.normalize_mean = config.normalize_mean;
  options.normalize_scale = config.normalize_scale;
  options.intra_op_threads = std::max(1, config.inference_threads);
  return options;
}

}  // namespace lolcommits::app
