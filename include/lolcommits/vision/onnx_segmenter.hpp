#pragma once

#include <lolcommits/core/error.hpp>
#include <lolcommits/core/frame.hpp>
#include <lolcommits/vision/segmenter.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lolcommits::vision {

/// Preprocessing and runtime knobs for OnnxSegmenter.
struct OnnxSegmenterOptions {
  std::string input_name;   // empty: first model input
  std::string output_name;  // empty: first model output (U2-Net "d0")
  float normalize_mean{0.f};
  float normalize_scale{1.f / 255.f};
  int intra_op_threads{1};
};

/// (height, width) of a single-channel probability map with shape [1,1,H,W], [1,H,W,1],
/// [1,H,W] or [H,W]; nullopt for any other layout. Dimensions are not range-checked.
[[nodiscard]] std::optional<std::pair<int64_t, int64_t>> segmentation_output_dims(
    const std::vector<int64_t>& shape);

/// ONNX Runtime person segmenter (U2-Net style salient-object model).
///
/// Expected model: one float image input, [1,3,H,W] (NCHW) or [1,H,W,3] (NHWC);
/// dynamic spatial dims default to 320x320. The first (or named) output is a
/// single-channel probability map: [1,1,H,W], [1,H,W], [1,H,W,1] or [H,W].
///
/// infer() converts the frame to RGB, resizes it to the model input with bilinear
/// interpolation, applies (x - mean) * scale, and resamples the output map back to
/// the frame's grid (see resample_mask). Any other output layout is InferenceError.
class OnnxSegmenter : public ISegmenter {
 public:
  /// Loads the model. Throws Ort::Exception if the file is missing or not a valid
  /// model, std::runtime_error if its input/output layout is unsupported.
  explicit OnnxSegmenter(const std::filesystem::path& model_path,
                         OnnxSegmenterOptions options = {});

  ~OnnxSegmenter() override;

  OnnxSegmenter(const OnnxSegmenter&) = delete;
  OnnxSegmenter& operator=(const OnnxSegmenter&) = delete;

  /// Non-throwing factory: any load failure becomes ModelLoadError.
  [[nodiscard]] static std::expected<std::shared_ptr<const OnnxSegmenter>,
                                     lolcommits::core::PipelineError>
  load(const std::filesystem::path& model_path, OnnxSegmenterOptions options = {});

  [[nodiscard]] std::expected<lolcommits::core::SegmentationMask,
                              lolcommits::core::PipelineError>
  infer(const lolcommits::core::Frame& input) const override;

  void warmup() const override;

  [[nodiscard]] std::uint32_t input_width() const noexcept;
  [[nodiscard]] std::uint32_t input_height() const noexcept;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace lolcommits::vision
