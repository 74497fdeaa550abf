#include <lolcommits/app/pipeline_runner.hpp>
#include <lolcommits/app/lolcommit_stages.hpp>
#include <lolcommits/io/output_path.hpp>
#include <lolcommits/vision/load_image.hpp>
#include <lolcommits/vision/mock_segmenter.hpp>
#include <lolcommits/vision/onnx_segmenter.hpp>
#include <spdlog/spdlog.h>
#include <system_error>

namespace lolcommits::app {

namespace lc = lolcommits::core;
namespace lv = lolcommits::vision;

std::expected<std::shared_ptr<const lv::ISegmenter>, lc::PipelineError> make_segmenter(
    const PipelineConfig& config) {
  if (config.backend_type == SegmenterBackendType::Onnx) {
    if (config.model_path.empty()) {
      spdlog::error("backend_type=onnx requires model_path to be set");
      return std::unexpected(lc::PipelineError::InvalidConfig);
    }
    auto onnx = lv::OnnxSegmenter::load(config.model_path, segmenter_options(config));
    if (!onnx) return std::unexpected(onnx.error());
    (*onnx)->warmup();
    return std::shared_ptr<const lv::ISegmenter>(std::move(*onnx));
  }
  return std::shared_ptr<const lv::ISegmenter>(std::make_shared<const lv::MockSegmenter>());
}

lc::Pipeline build_pipeline(const PipelineConfig& config,
                            const PipelineDeps& deps,
                            lc::BackgroundSpec background,
                            bool include_capture) {
  lc::Pipeline pipeline;
  if (include_capture && deps.frame_source) {
    pipeline.add_stage(std::make_unique<CaptureStage>(*deps.frame_source));
  }
  pipeline.add_stage(std::make_unique<SegmentationStage>(deps.segmenter));
  pipeline.add_stage(std::make_unique<CompositeStage>(lv::Compositor(compositor_options(config)),
                                                      std::move(background)));
  if (config.enable_chyron) {
    pipeline.add_stage(std::make_unique<ChyronStage>(
        lv::ChyronRenderer(chyron_style(config), deps.font_resolver)));
  }
  pipeline.add_stage(std::make_unique<EncodeStage>());

  lolcommits::io::AtomicPersister persister;
  if (deps.pre_commit_hook) persister.set_pre_commit_hook(deps.pre_commit_hook);
  pipeline.add_stage(std::make_unique<PersistStage>(std::move(persister)));
  return pipeline;
}

std::filesystem::path resolve_output_path(const PipelineConfig& config,
                                          const lc::CommitMetadata& commit,
                                          const std::optional<std::filesystem::path>& output_path,
                                          std::chrono::system_clock::time_point now) {
  if (output_path && !output_path->empty()) return *output_path;
  const std::filesystem::path dir = config.images_dir.empty()
                                        ? lolcommits::io::default_images_dir()
                                        : std::filesystem::path(config.images_dir);
  return dir / lolcommits::io::output_filename(commit.repo_name, commit.sha, now);
}

std::expected<void, lc::PipelineFailure> check_run_inputs(const PipelineConfig& config,
                                                          const PipelineDeps& deps) {
  if (auto valid = validate_config(config); !valid) {
    return std::unexpected(lc::PipelineFailure{"config", valid.error()});
  }
  if (!deps.frame_source || !deps.segmenter) {
    spdlog::error("run needs a frame source and a segmenter");
    return std::unexpected(lc::PipelineFailure{"config", lc::PipelineError::InvalidConfig});
  }
  if (config.enable_chyron && !deps.font_resolver) {
    spdlog::error("chyron enabled but no font resolver given");
    return std::unexpected(lc::PipelineFailure{"config", lc::PipelineError::InvalidConfig});
  }
  return {};
}

std::expected<lc::PipelineContext, lc::PipelineFailure> prepare_context(
    const PipelineConfig& config,
    lc::CommitMetadata commit,
    const std::optional<std::filesystem::path>& output_path) {
  lc::PipelineContext context;
  context.output_path = resolve_output_path(config, commit, output_path);
  context.commit = std::move(commit);

  // The default images directory is created on first use; explicit paths are not.
  if (!output_path) {
    std::error_code ec;
    std::filesystem::create_directories(context.output_path.parent_path(), ec);
    if (ec) {
      spdlog::error("cannot create {}: {}", context.output_path.parent_path().string(), ec.message());
      return std::unexpected(lc::PipelineFailure{"persist", lc::PipelineError::PersistError});
    }
  }
  return context;
}

std::expected<std::filesystem::path, lc::PipelineFailure> run_lolcommit(
    const PipelineConfig& config,
    const PipelineDeps& deps,
    lc::CommitMetadata commit,
    std::optional<std::filesystem::path> output_path,
    StageTimingCallback* timing_cb) {
  if (auto ok = check_run_inputs(config, deps); !ok) return std::unexpected(ok.error());

  auto background = lv::load_background(config.background);
  if (!background) {
    return std::unexpected(lc::PipelineFailure{"background", background.error()});
  }

  auto context = prepare_context(config, std::move(commit), output_path);
  if (!context) return std::unexpected(context.error());

  lc::Pipeline pipeline = build_pipeline(config, deps, std::move(*background));
  auto result = pipeline.run(*context, timing_cb);
  if (!result) return std::unexpected(result.error());
  if (!context->written_path) {
    return std::unexpected(lc::PipelineFailure{"persist", lc::PipelineError::PersistError});
  }
  return *context->written_path;
}

}  // namespace lolcommits::app
