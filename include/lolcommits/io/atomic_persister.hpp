#pragma once

#include <lolcommits/core/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <span>

namespace lolcommits::io {

/// Called with the fully written temporary file just before it is renamed into place.
/// An error aborts the commit: the temporary file is removed and the target is untouched.
using PreCommitHook =
    std::function<std::expected<void, lolcommits::core::PipelineError>(const std::filesystem::path&)>;

/// Crash-safe file writer.
///
/// persist() writes to a hidden temporary file (".{name}.XXXXXX") in the target's
/// directory, fsyncs it, sets mode 0644, closes it and renames it over the target,
/// then fsyncs the directory. Readers see either the old file or the complete new one.
/// Any failure before the rename unlinks the temporary file. Errors: PersistError.
class AtomicPersister {
 public:
  AtomicPersister() = default;

  void set_pre_commit_hook(PreCommitHook hook) { hook_ = std::move(hook); }

  /// Returns the final path on success.
  [[nodiscard]] std::expected<std::filesystem::path, lolcommits::core::PipelineError> persist(
      std::span<const std::uint8_t> bytes,
      const std::filesystem::path& target) const;

 private:
  PreCommitHook hook_;
};

}  // namespace lolcommits::io
