#include <lolcommits/core/background.hpp>
#include <lolcommits/core/chyron_style.hpp>
#include <cstddef>

namespace lolcommits::core {

namespace {

int hex_value(char c) noexcept {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

std::optional<Rgb> parse_hex_color(std::string_view text) noexcept {
  if (!text.empty() && text.front() == '#') text.remove_prefix(1);
  if (text.size() != 6) return std::nullopt;

  std::uint8_t channels[3]{};
  for (std::size_t i = 0; i < 3; ++i) {
    const int hi = hex_value(text[i * 2]);
    const int lo = hex_value(text[i * 2 + 1]);
    if (hi < 0 || lo < 0) return std::nullopt;
    channels[i] = static_cast<std::uint8_t>(hi * 16 + lo);
  }
  return Rgb{channels[0], channels[1], channels[2]};
}

std::string_view to_string(TextRole role) noexcept {
  switch (role) {
    case TextRole::Message:
      return "message";
    case TextRole::Info:
      return "info";
    case TextRole::Sha:
      return "sha";
    case TextRole::Stats:
      return "stats";
  }
  return "unknown";
}

const std::string& ChyronStyle::font_name(TextRole role) const noexcept {
  const std::optional<std::string>* configured = nullptr;
  switch (role) {
    case TextRole::Message:
      configured = &message_font_name;
      break;
    case TextRole::Info:
      configured = &info_font_name;
      break;
    case TextRole::Sha:
      configured = &sha_font_name;
      break;
    case TextRole::Stats:
      configured = &stats_font_name;
      break;
  }
  if (configured && configured->has_value() && !(*configured)->empty()) {
    return **configured;
  }
  return default_font_name;
}

}  // namespace lolcommits::core
