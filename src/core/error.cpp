#include <lolcommits/core/error.hpp>

namespace lolcommits::core {

std::string_view to_string(PipelineError error) noexcept {
  switch (error) {
    case PipelineError::None:
      return "None";
    case PipelineError::InvalidFrame:
      return "InvalidFrame";
    case PipelineError::InvalidConfig:
      return "InvalidConfig";
    case PipelineError::DeviceUnavailable:
      return "DeviceUnavailable";
    case PipelineError::DeviceBusy:
      return "DeviceBusy";
    case PipelineError::CaptureTimeout:
      return "CaptureTimeout";
    case PipelineError::ModelLoadError:
      return "ModelLoadError";
    case PipelineError::InferenceError:
      return "InferenceError";
    case PipelineError::BackgroundLoadError:
      return "BackgroundLoadError";
    case PipelineError::FontResolutionError:
      return "FontResolutionError";
    case PipelineError::MetadataEncodingError:
      return "MetadataEncodingError";
    case PipelineError::ArtifactDecodeError:
      return "ArtifactDecodeError";
    case PipelineError::PersistError:
      return "PersistError";
  }
  return "Unknown";
}

}  // namespace lolcommits::core
