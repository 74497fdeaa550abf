#include <lolcommits/app/lolcommit_stages.hpp>
#include <lolcommits/io/png_metadata.hpp>
#include <spdlog/spdlog.h>

namespace lolcommits::app {

namespace lc = lolcommits::core;

std::expected<void, lc::PipelineError> CaptureStage::process(lc::PipelineContext& context) {
  auto frame = source_.capture();
  if (!frame) return std::unexpected(frame.error());
  context.frame = std::move(*frame);
  return {};
}

std::expected<void, lc::PipelineError> SegmentationStage::process(lc::PipelineContext& context) {
  if (!context.frame) return std::unexpected(lc::PipelineError::InvalidFrame);
  if (!segmenter_) return std::unexpected(lc::PipelineError::InvalidConfig);
  auto mask = segmenter_->infer(*context.frame);
  if (!mask) return std::unexpected(mask.error());
  context.mask = std::move(*mask);
  return {};
}

std::expected<void, lc::PipelineError> CompositeStage::process(lc::PipelineContext& context) {
  if (!context.frame || !context.mask) return std::unexpected(lc::PipelineError::InvalidFrame);
  auto image = compositor_.composite(*context.frame, *context.mask, background_);
  if (!image) return std::unexpected(image.error());
  context.composite = std::move(*image);
  context.frame.reset();
  context.mask.reset();
  return {};
}

std::expected<void, lc::PipelineError> ChyronStage::process(lc::PipelineContext& context) {
  if (!context.composite) return std::unexpected(lc::PipelineError::InvalidFrame);
  return renderer_.render(*context.composite, context.commit);
}

std::expected<void, lc::PipelineError> EncodeStage::process(lc::PipelineContext& context) {
  if (!context.composite) return std::unexpected(lc::PipelineError::InvalidFrame);
  auto artifact = lolcommits::io::encode_png_with_metadata(*context.composite, context.commit);
  if (!artifact) return std::unexpected(artifact.error());
  context.artifact = std::move(*artifact);
  context.composite.reset();
  return {};
}

std::expected<void, lc::PipelineError> PersistStage::process(lc::PipelineContext& context) {
  if (!context.artifact || context.output_path.empty()) {
    spdlog::error("nothing to persist or no output path");
    return std::unexpected(lc::PipelineError::PersistError);
  }
  auto written = persister_.persist(context.artifact->png_bytes, context.output_path);
  if (!written) return std::unexpected(written.error());
  context.written_path = std::move(*written);
  return {};
}

}  // namespace lolcommits::app
