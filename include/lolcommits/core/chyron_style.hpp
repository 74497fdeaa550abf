#pragma once

#include <lolcommits/core/background.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lolcommits::core {

/// Text roles of the chyron; each may use its own font.
enum class TextRole : std::uint8_t {
  Message,
  Info,
  Sha,
  Stats,
};

[[nodiscard]] std::string_view to_string(TextRole role) noexcept;

/// Overlay appearance, supplied whole by configuration.
struct ChyronStyle {
  std::string default_font_name{"monospace"};
  std::optional<std::string> message_font_name;
  std::optional<std::string> info_font_name;
  std::optional<std::string> sha_font_name;
  std::optional<std::string> stats_font_name;

  float title_font_size{28.f};
  float info_font_size{18.f};
  float opacity{0.75f};  // applied to the band fill only

  Rgb band_color{0, 0, 0};
  Rgb message_color{255, 255, 255};
  Rgb info_color{180, 180, 180};
  Rgb sha_color{255, 255, 0};
  Rgb files_color{255, 255, 0};
  Rgb insertions_color{0, 255, 0};
  Rgb deletions_color{255, 0, 0};

  /// Configured font for a role, else default_font_name.
  [[nodiscard]] const std::string& font_name(TextRole role) const noexcept;
};

}  // namespace lolcommits::core
