#pragma once

#include <lolcommits/core/commit_metadata.hpp>
#include <lolcommits/core/composite_image.hpp>
#include <lolcommits/core/error.hpp>
#include <lolcommits/core/frame.hpp>
#include <lolcommits/core/segmentation_mask.hpp>
#include <expected>
#include <filesystem>
#include <optional>
#include <string_view>

namespace lolcommits::core {

/// State of one pipeline run. Created fresh per commit; each stage moves its
/// input out of one slot and its output into the next, so no buffer is shared.
struct PipelineContext {
  CommitMetadata commit;
  std::filesystem::path output_path;

  std::optional<Frame> frame;
  std::optional<SegmentationMask> mask;
  std::optional<CompositeImage> composite;
  std::optional<OutputArtifact> artifact;
  std::optional<std::filesystem::path> written_path;
};

/// Abstract pipeline stage: consume the previous stage's slot, fill the next one.
class IPipelineStage {
 public:
  virtual ~IPipelineStage() = default;

  /// Short stage name used in failure reports and timing logs.
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  [[nodiscard]] virtual std::expected<void, PipelineError> process(
      PipelineContext& context) = 0;
};

}  // namespace lolcommits::core
