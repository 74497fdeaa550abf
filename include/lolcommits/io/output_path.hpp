#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>

namespace lolcommits::io {

/// "{repo}-{YYYYmmdd-HHMMSS}-{sha}.png" in local time. Path separators and NUL
/// in the repo name and the sha are replaced with '_'.
[[nodiscard]] std::string output_filename(std::string_view repo_name,
                                          std::string_view sha,
                                          std::chrono::system_clock::time_point when);

/// "%Y-%m-%d %H:%M:%S" in local time (CommitMetadata::timestamp format).
[[nodiscard]] std::string format_commit_timestamp(std::chrono::system_clock::time_point when);

/// $XDG_DATA_HOME/lolcommits/images, falling back to ~/.local/share/lolcommits/images.
[[nodiscard]] std::filesystem::path default_images_dir();

}  // namespace lolcommits::io
