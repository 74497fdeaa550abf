#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lolcommits::core {

/// Diff statistics of one commit.
struct DiffStats {
  std::uint32_t files_changed{0};
  std::uint32_t insertions{0};
  std::uint32_t deletions{0};

  [[nodiscard]] bool empty() const noexcept {
    return files_changed == 0 && insertions == 0 && deletions == 0;
  }

  bool operator==(const DiffStats&) const = default;
};

/// Commit record supplied by the git integration; read-only to the pipeline.
struct CommitMetadata {
  std::string repo_name;
  std::string sha;
  std::string message;
  std::string commit_type;  // conventional-commit type, "commit" if none
  std::string scope;        // may be empty
  std::string timestamp;    // "%Y-%m-%d %H:%M:%S"
  std::string branch_name;
  std::optional<std::string> author;
  DiffStats stats{};

  /// e.g. "2 files changed, 15 insertions(+), 3 deletions(-)"; empty if no stats.
  [[nodiscard]] std::string diff_stats_string() const;

  bool operator==(const CommitMetadata&) const = default;
};

/// "feat(ui): add thing" -> "feat"; no colon on the first line -> "commit".
[[nodiscard]] std::string parse_commit_type(std::string_view message);

/// "feat(ui): add thing" -> "ui"; empty if absent.
[[nodiscard]] std::string parse_commit_scope(std::string_view message);

/// "feat(ui): add thing" -> "add thing"; unchanged if there is no prefix.
[[nodiscard]] std::string strip_commit_prefix(std::string_view message);

/// First line of a (possibly multi-line) commit message.
[[nodiscard]] std::string_view first_line(std::string_view message) noexcept;

/// True for the conventional-commit types that get a badge
/// (feat, fix, docs, style, refactor, perf, test, build, ci, chore, revert).
[[nodiscard]] bool is_recognized_commit_type(std::string_view type) noexcept;

}  // namespace lolcommits::core
