#include <lolcommits/core/commit_metadata.hpp>
#include <algorithm>
#include <array>
#include <string>
#include <vector>

namespace lolcommits::core {

namespace {

std::string_view trim(std::string_view s) noexcept {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string_view::npos) return {};
  const auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string plural(std::uint32_t n, std::string_view word) {
  std::string out = std::to_string(n);
  out += ' ';
  out += word;
  if (n != 1) out += 's';
  return out;
}

constexpr std::array<std::string_view, 11> kRecognizedTypes = {
    "feat", "fix", "docs", "style", "refactor", "perf",
    "test", "build", "ci", "chore", "revert",
};

}  // namespace

std::string CommitMetadata::diff_stats_string() const {
  if (stats.empty()) {
    return {};
  }

  std::string out = plural(stats.files_changed, "file") + " changed";
  if (stats.insertions > 0) {
    out += ", " + plural(stats.insertions, "insertion") + "(+)";
  }
  if (stats.deletions > 0) {
    out += ", " + plural(stats.deletions, "deletion") + "(-)";
  }
  return out;
}

std::string_view first_line(std::string_view message) noexcept {
  const auto nl = message.find('\n');
  std::string_view line = nl == std::string_view::npos ? message : message.substr(0, nl);
  if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
  return line;
}

std::string parse_commit_type(std::string_view message) {
  const std::string_view line = first_line(message);
  const auto colon = line.find(':');
  if (colon == std::string_view::npos) {
    return "commit";
  }

  std::string_view prefix = line.substr(0, colon);
  if (const auto paren = prefix.find('('); paren != std::string_view::npos) {
    prefix = prefix.substr(0, paren);
  }
  // "feat!: breaking" marks a breaking change; the type is still "feat".
  if (!prefix.empty() && prefix.back() == '!') prefix.remove_suffix(1);
  return std::string(trim(prefix));
}

std::string parse_commit_scope(std::string_view message) {
  const std::string_view line = first_line(message);
  const auto colon = line.find(':');
  if (colon == std::string_view::npos) return {};

  const std::string_view prefix = line.substr(0, colon);
  const auto open = prefix.find('(');
  const auto close = prefix.find(')');
  if (open == std::string_view::npos || close == std::string_view::npos || close < open) {
    return {};
  }
  return std::string(trim(prefix.substr(open + 1, close - open - 1)));
}

std::string strip_commit_prefix(std::string_view message) {
  const auto colon = message.find(':');
  if (colon == std::string_view::npos) {
    return std::string(message);
  }
  return std::string(trim(message.substr(colon + 1)));
}

bool is_recognized_commit_type(std::string_view type) noexcept {
  return std::find(kRecognizedTypes.begin(), kRecognizedTypes.end(), type) !=
         kRecognizedTypes.end();
}

}  // namespace lolcommits::core
