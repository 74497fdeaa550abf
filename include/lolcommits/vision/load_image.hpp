#pragma once

#include <lolcommits/core/background.hpp>
#include <lolcommits/core/error.hpp>
#include <lolcommits/core/frame.hpp>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace lolcommits::vision {

/// Load an image file into an RGB8 Frame. Returns nullopt on failure.
std::optional<lolcommits::core::Frame> load_frame_from_image(const std::string& path);

/// Locate a background by path, or by bare name ("beach" or "beach.png") in the XDG
/// data directories: $XDG_DATA_HOME (~/.local/share), then $XDG_DATA_DIRS
/// (/usr/local/share:/usr/share), each also under backgrounds/, pixmaps/, wallpapers/.
std::optional<std::filesystem::path> resolve_background_path(std::string_view name);

/// "#rrggbb" -> solid color; anything else is resolved and decoded as an image.
/// Unresolvable or undecodable image: BackgroundLoadError.
[[nodiscard]] std::expected<lolcommits::core::BackgroundSpec, lolcommits::core::PipelineError>
load_background(std::string_view value);

}  // namespace lolcommits::vision
