#pragma once

#include <lolcommits/app/config.hpp>
#include <lolcommits/core/background.hpp>
#include <lolcommits/core/commit_metadata.hpp>
#include <lolcommits/core/error.hpp>
#include <lolcommits/core/pipeline.hpp>
#include <lolcommits/io/atomic_persister.hpp>
#include <lolcommits/vision/font_resolver.hpp>
#include <lolcommits/vision/frame_source.hpp>
#include <lolcommits/vision/segmenter.hpp>
#include <chrono>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>

namespace lolcommits::app {

/// Optional per-stage timing: (stage_index, stage_name, duration_ms).
using StageTimingCallback = lolcommits::core::StageTimingCallback;

/// Collaborators of one lolcommit run. The frame source is borrowed; the segmenter
/// and font resolver are shared, immutable and reusable across runs.
struct PipelineDeps {
  lolcommits::vision::IFrameSource* frame_source{nullptr};
  std::shared_ptr<const lolcommits::vision::ISegmenter> segmenter;
  std::shared_ptr<const lolcommits::vision::IFontResolver> font_resolver;
  lolcommits::io::PreCommitHook pre_commit_hook;
};

/// Loads the configured segmenter: MockSegmenter, or OnnxSegmenter with warmup.
[[nodiscard]] std::expected<std::shared_ptr<const lolcommits::vision::ISegmenter>,
                            lolcommits::core::PipelineError>
make_segmenter(const PipelineConfig& config);

/// Stages in order: [capture], segmentation, composite, [chyron], encode, persist.
/// Capture is left out when include_capture is false (frame already in the context);
/// chyron is left out when config.enable_chyron is false.
[[nodiscard]] lolcommits::core::Pipeline build_pipeline(const PipelineConfig& config,
                                                        const PipelineDeps& deps,
                                                        lolcommits::core::BackgroundSpec background,
                                                        bool include_capture = true);

/// Explicit output path if given, else {images_dir}/{output_filename(...)}.
[[nodiscard]] std::filesystem::path resolve_output_path(
    const PipelineConfig& config,
    const lolcommits::core::CommitMetadata& commit,
    const std::optional<std::filesystem::path>& output_path,
    std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

/// Checks the config and dependencies; stage "config" with InvalidConfig otherwise.
[[nodiscard]] std::expected<void, lolcommits::core::PipelineFailure> check_run_inputs(
    const PipelineConfig& config,
    const PipelineDeps& deps);

/// Fresh context with the commit and its resolved output path.
[[nodiscard]] std::expected<lolcommits::core::PipelineContext, lolcommits::core::PipelineFailure>
prepare_context(const PipelineConfig& config,
                lolcommits::core::CommitMetadata commit,
                const std::optional<std::filesystem::path>& output_path);

/// Runs one lolcommit end to end and returns the written file.
/// Background resolution failures are reported as stage "background".
[[nodiscard]] std::expected<std::filesystem::path, lolcommits::core::PipelineFailure>
run_lolcommit(const PipelineConfig& config,
              const PipelineDeps& deps,
              lolcommits::core::CommitMetadata commit,
              std::optional<std::filesystem::path> output_path = std::nullopt,
              StageTimingCallback* timing_cb = nullptr);

}  // namespace lolcommits::app
