#pragma once

#include <lolcommits/core/error.hpp>
#include <lolcommits/core/pipeline_stage.hpp>
#include <expected>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace lolcommits::core {

/// Callback for per-stage timing: (stage_index, stage_name, duration_ms). Optional; pass to run().
using StageTimingCallback =
    std::function<void(std::size_t stage_index, std::string_view stage_name, double duration_ms)>;

/// Runs a sequence of stages in strict order on one PipelineContext.
/// The first failing stage aborts the run; later stages never execute.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<IPipelineStage> stage);

  /// Run all stages on the context.
  /// If timing_cb is non-null, it is called after each stage that ran.
  [[nodiscard]] std::expected<void, PipelineFailure> run(
      PipelineContext& context,
      StageTimingCallback* timing_cb = nullptr);

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  std::vector<std::unique_ptr<IPipelineStage>> stages_;
};

}  // namespace lolcommits::core
