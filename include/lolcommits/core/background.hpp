#pragma once

#include <lolcommits/core/frame.hpp>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace lolcommits::core {

/// 8-bit RGB color.
struct Rgb {
  std::uint8_t r{0};
  std::uint8_t g{0};
  std::uint8_t b{0};

  bool operator==(const Rgb&) const = default;
};

/// Parses "#rrggbb" or "rrggbb" (case-insensitive). nullopt on malformed input.
[[nodiscard]] std::optional<Rgb> parse_hex_color(std::string_view text) noexcept;

/// Background to composite behind the subject: a solid color or a decoded image.
/// Image backgrounds are stretched to the frame size by the compositor.
/// Resolved once per run and never mutated.
using BackgroundSpec = std::variant<Rgb, Frame>;

}  // namespace lolcommits::core
