#pragma once

#include <optional>
#include <string_view>
#include <vector>

namespace lolcommits::core {

/// Decodes UTF-8 into code points. nullopt on malformed input
/// (overlong forms, surrogates, truncated sequences, values above U+10FFFF).
[[nodiscard]] std::optional<std::vector<char32_t>> decode_utf8(std::string_view text);

[[nodiscard]] inline bool is_valid_utf8(std::string_view text) {
  return decode_utf8(text).has_value();
}

}  // namespace lolcommits::core
