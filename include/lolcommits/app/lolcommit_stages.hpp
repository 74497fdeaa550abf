#pragma once

#include <lolcommits/core/background.hpp>
#include <lolcommits/core/pipeline_stage.hpp>
#include <lolcommits/io/atomic_persister.hpp>
#include <lolcommits/vision/chyron_renderer.hpp>
#include <lolcommits/vision/compositor.hpp>
#include <lolcommits/vision/frame_source.hpp>
#include <lolcommits/vision/segmenter.hpp>
#include <memory>
#include <string_view>

namespace lolcommits::app {

/// Fills context.frame from a frame source (non-owning; the source must outlive the stage).
class CaptureStage : public lolcommits::core::IPipelineStage {
 public:
  explicit CaptureStage(lolcommits::vision::IFrameSource& source) : source_(source) {}

  [[nodiscard]] std::string_view name() const noexcept override { return "capture"; }
  [[nodiscard]] std::expected<void, lolcommits::core::PipelineError> process(
      lolcommits::core::PipelineContext& context) override;

 private:
  lolcommits::vision::IFrameSource& source_;
};

/// context.frame -> context.mask.
class SegmentationStage : public lolcommits::core::IPipelineStage {
 public:
  explicit SegmentationStage(std::shared_ptr<const lolcommits::vision::ISegmenter> segmenter)
      : segmenter_(std::move(segmenter)) {}

  [[nodiscard]] std::string_view name() const noexcept override { return "segmentation"; }
  [[nodiscard]] std::expected<void, lolcommits::core::PipelineError> process(
      lolcommits::core::PipelineContext& context) override;

 private:
  std::shared_ptr<const lolcommits::vision::ISegmenter> segmenter_;
};

/// context.frame + context.mask -> context.composite. Consumes frame and mask.
class CompositeStage : public lolcommits::core::IPipelineStage {
 public:
  CompositeStage(lolcommits::vision::Compositor compositor,
                 lolcommits::core::BackgroundSpec background)
      : compositor_(compositor), background_(std::move(background)) {}

  [[nodiscard]] std::string_view name() const noexcept override { return "composite"; }
  [[nodiscard]] std::expected<void, lolcommits::core::PipelineError> process(
      lolcommits::core::PipelineContext& context) override;

 private:
  lolcommits::vision::Compositor compositor_;
  lolcommits::core::BackgroundSpec background_;
};

/// Draws the overlay band onto context.composite in place.
class ChyronStage : public lolcommits::core::IPipelineStage {
 public:
  explicit ChyronStage(lolcommits::vision::ChyronRenderer renderer)
      : renderer_(std::move(renderer)) {}

  [[nodiscard]] std::string_view name() const noexcept override { return "chyron"; }
  [[nodiscard]] std::expected<void, lolcommits::core::PipelineError> process(
      lolcommits::core::PipelineContext& context) override;

 private:
  lolcommits::vision::ChyronRenderer renderer_;
};

/// context.composite -> context.artifact (PNG with commit metadata). Consumes composite.
class EncodeStage : public lolcommits::core::IPipelineStage {
 public:
  [[nodiscard]] std::string_view name() const noexcept override { return "encode"; }
  [[nodiscard]] std::expected<void, lolcommits::core::PipelineError> process(
      lolcommits::core::PipelineContext& context) override;
};

/// Writes context.artifact to context.output_path atomically; sets context.written_path.
class PersistStage : public lolcommits::core::IPipelineStage {
 public:
  explicit PersistStage(lolcommits::io::AtomicPersister persister)
      : persister_(std::move(persister)) {}

  [[nodiscard]] std::string_view name() const noexcept override { return "persist"; }
  [[nodiscard]] std::expected<void, lolcommits::core::PipelineError> process(
      lolcommits::core::PipelineContext& context) override;

 private:
  lolcommits::io::AtomicPersister persister_;
};

}  // namespace lolcommits::app
