#include <lolcommits/vision/onnx_segmenter.hpp>
#include <lolcommits/vision/mask_resample.hpp>
#include "frame_cv_utils.hpp"
#include <lolcommits/core/error.hpp>
#include <lolcommits/core/frame.hpp>
#include <onnxruntime_cxx_api.h>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>
#include <array>
#include <cstdint>
#include <cstring>
#include <expected>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace lolcommits::vision {

namespace {

namespace lc = lolcommits::core;

constexpr int64_t kNumChannels = 3;
constexpr std::uint32_t kDefaultModelSize = 320;

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

/// Copy HWC (height, width, channels) float buffer to NCHW (batch, channels, height, width).
void HwcToNchw(const float* hwc, std::uint32_t h, std::uint32_t w, float* nchw) {
  const std::size_t hw = static_cast<std::size_t>(h) * w;
  for (std::uint32_t y = 0; y < h; ++y) {
    for (std::uint32_t x = 0; x < w; ++x) {
      const std::size_t src_idx = (static_cast<std::size_t>(y) * w + x) * kNumChannels;
      nchw[0 * hw + y * w + x] = hwc[src_idx + 0];
      nchw[1 * hw + y * w + x] = hwc[src_idx + 1];
      nchw[2 * hw + y * w + x] = hwc[src_idx + 2];
    }
  }
}

std::uint32_t dim_or_default(int64_t d) {
  return d > 0 ? static_cast<std::uint32_t>(d) : kDefaultModelSize;
}

}  // namespace

std::optional<std::pair<int64_t, int64_t>> segmentation_output_dims(
    const std::vector<int64_t>& shape) {
  if (shape.size() == 4u && shape[0] == 1 && shape[1] == 1) {
    return std::make_pair(shape[2], shape[3]);  // [1,1,H,W]
  }
  if (shape.size() == 4u && shape[0] == 1 && shape[3] == 1) {
    return std::make_pair(shape[1], shape[2]);  // [1,H,W,1]
  }
  if (shape.size() == 3u && shape[0] == 1) {
    return std::make_pair(shape[1], shape[2]);  // [1,H,W]
  }
  if (shape.size() == 2u) {
    return std::make_pair(shape[0], shape[1]);  // [H,W]
  }
  return std::nullopt;
}

struct OnnxSegmenter::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "lolcommits"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  OnnxSegmenterOptions options;
  std::string input_name;
  std::string output_name;

  std::uint32_t input_height{kDefaultModelSize};
  std::uint32_t input_width{kDefaultModelSize};
  bool input_is_nchw{true};

  explicit Impl(OnnxSegmenterOptions opts) : options(std::move(opts)) {
    session_options.SetIntraOpNumThreads(options.intra_op_threads);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }
};

OnnxSegmenter::OnnxSegmenter(const std::filesystem::path& model_path,
                             OnnxSegmenterOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxSegmenter: model has no inputs");
  }
  if (impl_->session.GetOutputCount() == 0) {
    throw std::runtime_error("OnnxSegmenter: model has no outputs");
  }

  impl_->input_name = impl_->options.input_name.empty()
                          ? std::string(impl_->session.GetInputNameAllocated(0, allocator).get())
                          : impl_->options.input_name;
  impl_->output_name = impl_->options.output_name.empty()
                           ? std::string(impl_->session.GetOutputNameAllocated(0, allocator).get())
                           : impl_->options.output_name;

  Ort::TypeInfo input_type = impl_->session.GetInputTypeInfo(0);
  const auto shape_info = input_type.GetTensorTypeAndShapeInfo();
  std::vector<int64_t> dims = shape_info.GetShape();
  if (dims.size() != 4u) {
    throw std::runtime_error("OnnxSegmenter: expected 4D input");
  }
  // NCHW: [1, C, H, W] or NHWC: [1, H, W, C]
  if (dims[1] == kNumChannels) {
    impl_->input_is_nchw = true;
    impl_->input_height = dim_or_default(dims[2]);
    impl_->input_width = dim_or_default(dims[3]);
  } else if (dims[3] == kNumChannels) {
    impl_->input_is_nchw = false;
    impl_->input_height = dim_or_default(dims[1]);
    impl_->input_width = dim_or_default(dims[2]);
  } else {
    throw std::runtime_error("OnnxSegmenter: expected input shape [1,3,H,W] or [1,H,W,3]");
  }

  spdlog::debug("segmentation model {} loaded: input {} {}x{} ({}), output {}",
                model_path.string(), impl_->input_name, impl_->input_width,
                impl_->input_height, impl_->input_is_nchw ? "NCHW" : "NHWC",
                impl_->output_name);
}

OnnxSegmenter::~OnnxSegmenter() = default;

std::expected<std::shared_ptr<const OnnxSegmenter>, lc::PipelineError>
OnnxSegmenter::load(const std::filesystem::path& model_path, OnnxSegmenterOptions options) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(model_path, ec)) {
    spdlog::error("segmentation model not found: {}", model_path.string());
    return std::unexpected(lc::PipelineError::ModelLoadError);
  }
  try {
    return std::make_shared<const OnnxSegmenter>(model_path, std::move(options));
  } catch (const std::exception& e) {
    spdlog::error("failed to load segmentation model {}: {}", model_path.string(), e.what());
    return std::unexpected(lc::PipelineError::ModelLoadError);
  }
}

std::uint32_t OnnxSegmenter::input_width() const noexcept { return impl_->input_width; }
std::uint32_t OnnxSegmenter::input_height() const noexcept { return impl_->input_height; }

std::expected<lc::SegmentationMask, lc::PipelineError>
OnnxSegmenter::infer(const lc::Frame& input) const {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  auto rgb = detail::to_rgb8(input);
  if (!rgb) {
    return std::unexpected(lc::PipelineError::InvalidFrame);
  }
  auto mat_rgb = detail::frame_to_mat(*rgb);
  if (!mat_rgb) {
    return std::unexpected(lc::PipelineError::InvalidFrame);
  }

  const std::uint32_t h = impl_->input_height;
  const std::uint32_t w = impl_->input_width;

  cv::Mat resized;
  cv::resize(*mat_rgb, resized, cv::Size(static_cast<int>(w), static_cast<int>(h)),
             0, 0, cv::INTER_LINEAR);
  cv::Mat input_float;
  const double scale = impl_->options.normalize_scale;
  resized.convertTo(input_float, CV_32FC3, scale, -impl_->options.normalize_mean * scale);
  if (!input_float.isContinuous()) {
    input_float = input_float.clone();
  }
  const float* hwc = input_float.ptr<float>();

  const std::size_t num_floats = static_cast<std::size_t>(kNumChannels) * h * w;
  std::vector<float> tensor_data(num_floats);
  std::array<int64_t, 4> shape{};
  if (impl_->input_is_nchw) {
    HwcToNchw(hwc, h, w, tensor_data.data());
    shape = {1, kNumChannels, static_cast<int64_t>(h), static_cast<int64_t>(w)};
  } else {
    std::memcpy(tensor_data.data(), hwc, num_floats * sizeof(float));
    shape = {1, static_cast<int64_t>(h), static_cast<int64_t>(w), kNumChannels};
  }

  Ort::MemoryInfo mem_info = CpuMemoryInfo();
  Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
      mem_info, tensor_data.data(), num_floats, shape.data(), shape.size());

  const char* input_names_c[] = {impl_->input_name.c_str()};
  const char* output_names_c[] = {impl_->output_name.c_str()};
  Ort::RunOptions run_options;

  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->session.Run(run_options, input_names_c, &input_tensor, 1,
                                 output_names_c, 1);
  } catch (const Ort::Exception& e) {
    spdlog::error("segmentation inference failed: {}", e.what());
    return std::unexpected(lc::PipelineError::InferenceError);
  }

  if (outputs.size() != 1u || !outputs[0].IsTensor()) {
    return std::unexpected(lc::PipelineError::InferenceError);
  }
  const auto out_info = outputs[0].GetTensorTypeAndShapeInfo();
  if (out_info.GetElementType() != ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
    spdlog::error("segmentation output is not a float tensor");
    return std::unexpected(lc::PipelineError::InferenceError);
  }
  const std::vector<int64_t> out_shape = out_info.GetShape();
  const auto dims = segmentation_output_dims(out_shape);
  if (!dims || dims->first <= 0 || dims->second <= 0 ||
      static_cast<std::size_t>(dims->first * dims->second) != out_info.GetElementCount()) {
    spdlog::error("unexpected segmentation output shape (rank {})", out_shape.size());
    return std::unexpected(lc::PipelineError::InferenceError);
  }

  const auto mh = static_cast<std::uint32_t>(dims->first);
  const auto mw = static_cast<std::uint32_t>(dims->second);
  const float* data = outputs[0].GetTensorData<float>();
  std::vector<float> values(static_cast<std::size_t>(mw) * mh);
  for (std::size_t i = 0; i < values.size(); ++i) {
    values[i] = lc::clamp_probability(data[i]);
  }
  spdlog::debug("segmentation output {}x{}, resampling to {}x{}", mw, mh,
                input.width(), input.height());

  return resample_mask(lc::SegmentationMask(mw, mh, std::move(values)),
                       input.width(), input.height());
}

void OnnxSegmenter::warmup() const {
  const std::size_t num_bytes =
      lc::Frame::min_bytes(impl_->input_width, impl_->input_height, lc::PixelFormat::RGB8);
  std::vector<std::byte> buffer(num_bytes, std::byte{0});
  lc::Frame frame(impl_->input_width, impl_->input_height, lc::PixelFormat::RGB8,
                  std::move(buffer));
  auto result = infer(frame);
  if (!result) {
    spdlog::warn("segmentation warmup failed: {}", lc::to_string(result.error()));
  }
}

}  // namespace lolcommits::vision
