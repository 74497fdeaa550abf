#include <lolcommits/core/pipeline.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <string>

namespace lolcommits::core {

void Pipeline::add_stage(std::unique_ptr<IPipelineStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::expected<void, PipelineFailure> Pipeline::run(
    PipelineContext& context,
    StageTimingCallback* timing_cb) {
  if (stages_.empty()) {
    return std::unexpected(PipelineFailure{"pipeline", PipelineError::InvalidConfig});
  }

  for (std::size_t i = 0; i < stages_.size(); ++i) {
    IPipelineStage& stage = *stages_[i];

    const auto stage_start = std::chrono::steady_clock::now();
    auto result = stage.process(context);
    const auto stage_end = std::chrono::steady_clock::now();
    const double ms =
        std::chrono::duration<double, std::milli>(stage_end - stage_start).count();

    spdlog::debug("stage {} ({}) finished in {:.1f} ms", i, stage.name(), ms);
    if (timing_cb) {
      (*timing_cb)(i, stage.name(), ms);
    }

    if (!result) {
      spdlog::error("stage {} failed: {}", stage.name(), to_string(result.error()));
      return std::unexpected(PipelineFailure{std::string(stage.name()), result.error()});
    }
  }
  return {};
}

}  // namespace lolcommits::core
