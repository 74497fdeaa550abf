#pragma once

#include <lolcommits/app/pipeline_runner.hpp>
#include <lolcommits/core/commit_metadata.hpp>
#include <lolcommits/core/error.hpp>
#include <expected>
#include <filesystem>
#include <optional>

#ifdef LOLCOMMITS_HAS_TBB

namespace lolcommits::app {

/// Same result as run_lolcommit, but the camera capture and the background image
/// decode run concurrently in a tbb::task_group before the remaining stages.
///
/// Failures keep the sequential precedence: a background failure is reported before a
/// capture failure when both occur. The frame source is only touched by one task.
[[nodiscard]] std::expected<std::filesystem::path, lolcommits::core::PipelineFailure>
run_lolcommit_tbb(const PipelineConfig& config,
                  const PipelineDeps& deps,
                  lolcommits::core::CommitMetadata commit,
                  std::optional<std::filesystem::path> output_path = std::nullopt,
                  StageTimingCallback* timing_cb = nullptr);

}  // namespace lolcommits::app

#endif  // LOLCOMMITS_HAS_TBB
