#include <lolcommits/app/pipeline_runner_tbb.hpp>

#ifdef LOLCOMMITS_HAS_TBB

#include <lolcommits/core/background.hpp>
#include <lolcommits/core/frame.hpp>
#include <lolcommits/core/pipeline.hpp>
#include <lolcommits/vision/load_image.hpp>
#include <spdlog/spdlog.h>
#include <tbb/task_group.h>
#include <utility>

namespace lolcommits::app {

namespace lc = lolcommits::core;

std::expected<std::filesystem::path, lc::PipelineFailure> run_lolcommit_tbb(
    const PipelineConfig& config,
    const PipelineDeps& deps,
    lc::CommitMetadata commit,
    std::optional<std::filesystem::path> output_path,
    StageTimingCallback* timing_cb) {
  if (auto ok = check_run_inputs(config, deps); !ok) return std::unexpected(ok.error());

  // Each task writes only its own result slot.
  std::optional<std::expected<lc::Frame, lc::PipelineError>> frame;
  std::optional<std::expected<lc::BackgroundSpec, lc::PipelineError>> background;

  tbb::task_group group;
  group.run([&frame, source = deps.frame_source] { frame.emplace(source->capture()); });
  group.run([&background, &config] {
    background.emplace(lolcommits::vision::load_background(config.background));
  });
  group.wait();

  // Same precedence as run_lolcommit, which resolves the background before capturing.
  if (!*background) {
    return std::unexpected(lc::PipelineFailure{"background", background->error()});
  }
  if (!*frame) return std::unexpected(lc::PipelineFailure{"capture", frame->error()});
  spdlog::debug("capture and background load finished concurrently");

  auto context = prepare_context(config, std::move(commit), output_path);
  if (!context) return std::unexpected(context.error());
  context->frame = std::move(**frame);

  lc::Pipeline pipeline =
      build_pipeline(config, deps, std::move(**background), /*include_capture=*/false);
  auto result = pipeline.run(*context, timing_cb);
  if (!result) return std::unexpected(result.error());
  if (!context->written_path) {
    return std::unexpected(lc::PipelineFailure{"persist", lc::PipelineError::PersistError});
  }
  return *context->written_path;
}

}  // namespace lolcommits::app

#endif  // LOLCOMMITS_HAS_TBB
