#include <lolcommits/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <lolcommits/core/frame.hpp>
#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>
#include <array>
#include <cstdlib>
#include <sstream>
#include <system_error>
#include <vector>

namespace lolcommits::vision {

namespace {

namespace lc = lolcommits::core;
namespace fs = std::filesystem;

std::string env_or(const char* name, std::string fallback) {
  const char* value = std::getenv(name);
  if (value && value[0] != '\0') return value;
  return fallback;
}

std::vector<fs::path> data_dirs() {
  std::vector<fs::path> dirs;
  const char* home = std::getenv("HOME");
  const std::string data_home =
      env_or("XDG_DATA_HOME", home ? std::string(home) + "/.local/share" : std::string());
  if (!data_home.empty()) dirs.emplace_back(data_home);

  std::istringstream system_dirs(env_or("XDG_DATA_DIRS", "/usr/local/share:/usr/share"));
  std::string dir;
  while (std::getline(system_dirs, dir, ':')) {
    if (!dir.empty()) dirs.emplace_back(dir);
  }
  return dirs;
}

bool is_file(const fs::path& p) {
  std::error_code ec;
  return fs::is_regular_file(p, ec);
}

}  // namespace

std::optional<lc::Frame> load_frame_from_image(const std::string& path) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_COLOR);
  if (mat.empty()) return std::nullopt;

  lc::PixelFormat format = lc::PixelFormat::BGR8;
  if (mat.channels() == 1) format = lc::PixelFormat::Grayscale8;

  return detail::to_rgb8(detail::mat_to_frame(mat, format));
}

std::optional<fs::path> resolve_background_path(std::string_view name) {
  if (name.empty()) return std::nullopt;
  const fs::path direct(name);
  if (is_file(direct)) return direct;
  if (direct.has_parent_path()) return std::nullopt;

  const std::string file_name =
      direct.has_extension() ? std::string(name) : std::string(name) + ".png";
  static constexpr std::array<const char*, 4> kSubdirs = {"", "backgrounds", "pixmaps",
                                                          "wallpapers"};
  for (const fs::path& base : data_dirs()) {
    for (const char* sub : kSubdirs) {
      fs::path candidate = base / "lolcommits" / sub / file_name;
      if (is_file(candidate)) return candidate;
      candidate = base / sub / file_name;
      if (sub[0] != '\0' && is_file(candidate)) return candidate;
    }
  }
  return std::nullopt;
}

std::expected<lc::BackgroundSpec, lc::PipelineError> load_background(std::string_view value) {
  if (value.starts_with('#')) {
    auto color = lc::parse_hex_color(value);
    if (!color) {
      spdlog::error("invalid background color '{}'", value);
      return std::unexpected(lc::PipelineError::BackgroundLoadError);
    }
    return lc::BackgroundSpec{*color};
  }

  const auto path = resolve_background_path(value);
  if (!path) {
    spdlog::error("background '{}' not found", value);
    return std::unexpected(lc::PipelineError::BackgroundLoadError);
  }
  auto frame = load_frame_from_image(path->string());
  if (!frame) {
    spdlog::error("could not decode background {}", path->string());
    return std::unexpected(lc::PipelineError::BackgroundLoadError);
  }
  spdlog::debug("background {} ({}x{})", path->string(), frame->width(), frame->height());
  return lc::BackgroundSpec{std::move(*frame)};
}

}  // namespace lolcommits::vision
