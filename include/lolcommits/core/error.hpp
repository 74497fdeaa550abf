#pragma once

#include <string>
#include <string_view>

namespace lolcommits::core {

/// Pipeline error codes; used with std::expected for recoverable failures.
enum class PipelineError {
  None = 0,
  InvalidFrame,
  InvalidConfig,
  // camera layer
  DeviceUnavailable,
  DeviceBusy,
  CaptureTimeout,
  // segmentation layer
  ModelLoadError,
  InferenceError,
  // compositing / rendering
  BackgroundLoadError,
  FontResolutionError,
  // encoding and I/O
  MetadataEncodingError,
  ArtifactDecodeError,
  PersistError,
};

/// Stable, human-readable name for an error code (e.g. "DeviceBusy").
[[nodiscard]] std::string_view to_string(PipelineError error) noexcept;

/// Terminal failure of a pipeline run: which stage failed and why.
struct PipelineFailure {
  std::string stage;
  PipelineError error{PipelineError::None};
};

}  // namespace lolcommits::core
