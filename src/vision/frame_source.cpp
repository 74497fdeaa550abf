#include <lolcommits/vision/frame_source.hpp>
#include <lolcommits/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#ifdef __linux__
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <linux/videodev2.h>
#include <sys/ioctl.h>
#include <unistd.h>
#endif

namespace lolcommits::vision {

namespace {

namespace lc = lolcommits::core;
namespace fs = std::filesystem;

bool all_digits(std::string_view s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

std::optional<int> parse_index(std::string_view s) {
  int value = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return value;
}

#ifdef __linux__
int xioctl(int fd, unsigned long req, void* arg) {
  int r;
  do {
    r = ioctl(fd, req, arg);
  } while (r == -1 && errno == EINTR);
  return r;
}
#endif

std::string describe(const CameraDevice& device) {
  if (device.kind == CameraDevice::Kind::Url) return device.url;
  if (!device.node.empty()) return device.node.string();
  return "camera " + std::to_string(device.index);
}

}  // namespace

std::expected<CameraDevice, lc::PipelineError> parse_camera_device(std::string_view device) {
  CameraDevice out;
  if (all_digits(device)) {
    const auto index = parse_index(device);
    if (!index) return std::unexpected(lc::PipelineError::DeviceUnavailable);
    out.kind = CameraDevice::Kind::Index;
    out.index = *index;
    out.node = fs::path("/dev") / ("video" + std::to_string(*index));
    return out;
  }

  if (device.starts_with("/dev/")) {
    std::error_code ec;
    const fs::path resolved = fs::canonical(fs::path(device), ec);
    if (ec) {
      spdlog::error("camera device {} not found", device);
      return std::unexpected(lc::PipelineError::DeviceUnavailable);
    }
    const std::string name = resolved.filename().string();
    constexpr std::string_view kPrefix = "video";
    const auto index = name.starts_with(kPrefix) && all_digits(std::string_view(name).substr(kPrefix.size()))
                           ? parse_index(std::string_view(name).substr(kPrefix.size()))
                           : std::nullopt;
    if (!index) {
      spdlog::error("camera device {} resolves to {}, not a video node", device, resolved.string());
      return std::unexpected(lc::PipelineError::DeviceUnavailable);
    }
    out.kind = CameraDevice::Kind::Index;
    out.index = *index;
    out.node = resolved;
    return out;
  }

  out.kind = CameraDevice::Kind::Url;
  out.url = std::string(device);
  return out;
}

DeviceProbe probe_video_device(const fs::path& node) {
#ifdef __linux__
  const int fd = ::open(node.c_str(), O_RDWR | O_NONBLOCK);
  if (fd < 0) {
    const int err = errno;
    spdlog::debug("probe {}: open failed: {}", node.string(), std::strerror(err));
    if (err == EBUSY) return DeviceProbe::Busy;
    return DeviceProbe::Unavailable;
  }

  v4l2_requestbuffers req;
  std::memset(&req, 0, sizeof(req));
  req.count = 0;
  req.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  req.memory = V4L2_MEMORY_MMAP;
  DeviceProbe probe = DeviceProbe::Available;
  if (xioctl(fd, VIDIOC_REQBUFS, &req) < 0 && errno == EBUSY) {
    probe = DeviceProbe::Busy;
  }
  ::close(fd);
  return probe;
#else
  (void)node;
  return DeviceProbe::Available;
#endif
}

namespace {

class OpenCvCaptureDevice : public ICaptureDevice {
 public:
  DeviceProbe availability(const CameraDevice& device) override {
    if (device.kind != CameraDevice::Kind::Index) return DeviceProbe::Available;
    return probe_video_device(device.node);
  }

  bool open(const CameraDevice& device, const CameraOptions& options) override {
    const int timeout_ms = static_cast<int>(options.capture_timeout.count());
    const std::vector<int> params{cv::CAP_PROP_OPEN_TIMEOUT_MSEC, timeout_ms,
                                  cv::CAP_PROP_READ_TIMEOUT_MSEC, timeout_ms};
    const bool opened = device.kind == CameraDevice::Kind::Index
                            ? cap_.open(device.index, cv::CAP_ANY, params)
                            : cap_.open(device.url, cv::CAP_ANY, params);
    if (!opened || !cap_.isOpened()) return false;

    if (options.width) cap_.set(cv::CAP_PROP_FRAME_WIDTH, static_cast<double>(*options.width));
    if (options.height) cap_.set(cv::CAP_PROP_FRAME_HEIGHT, static_cast<double>(*options.height));
    if (options.fps) cap_.set(cv::CAP_PROP_FPS, *options.fps);
    return true;
  }

  bool grab(std::chrono::milliseconds timeout) override {
    cap_.set(cv::CAP_PROP_READ_TIMEOUT_MSEC, static_cast<double>(timeout.count()));
    return cap_.grab();
  }

  std::optional<lc::Frame> retrieve() override {
    cv::Mat mat;
    if (!cap_.retrieve(mat) || mat.empty()) return std::nullopt;
    lc::PixelFormat format = lc::PixelFormat::BGR8;
    if (mat.channels() == 1) format = lc::PixelFormat::Grayscale8;
    else if (mat.channels() == 4) format = lc::PixelFormat::BGRA8;
    return detail::mat_to_frame(mat, format);
  }

  void close() noexcept override { cap_.release(); }

 private:
  cv::VideoCapture cap_;
};

/// Closes the device when capture() returns.
class DeviceSession {
 public:
  explicit DeviceSession(ICaptureDevice& device) : device_(device) {}
  ~DeviceSession() { device_.close(); }

  DeviceSession(const DeviceSession&) = delete;
  DeviceSession& operator=(const DeviceSession&) = delete;

 private:
  ICaptureDevice& device_;
};

}  // namespace

std::unique_ptr<ICaptureDevice> make_opencv_capture_device() {
  return std::make_unique<OpenCvCaptureDevice>();
}

CameraFrameSource::CameraFrameSource(CameraOptions options)
    : CameraFrameSource(std::move(options), make_opencv_capture_device()) {}

CameraFrameSource::CameraFrameSource(CameraOptions options, std::unique_ptr<ICaptureDevice> device)
    : options_(std::move(options)), device_(std::move(device)) {}

std::expected<lc::Frame, lc::PipelineError> CameraFrameSource::capture() {
  if (!device_) return std::unexpected(lc::PipelineError::DeviceUnavailable);
  auto device = parse_camera_device(options_.device);
  if (!device) return std::unexpected(device.error());
  const std::string label = describe(*device);

  switch (device_->availability(*device)) {
    case DeviceProbe::Busy:
      spdlog::warn("{} is busy (in use by another process)", label);
      return std::unexpected(lc::PipelineError::DeviceBusy);
    case DeviceProbe::Unavailable:
      spdlog::error("{} is not available", label);
      return std::unexpected(lc::PipelineError::DeviceUnavailable);
    case DeviceProbe::Available:
      break;
  }

  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + options_.capture_timeout;
  const auto timeout_ms = options_.capture_timeout.count();

  if (!device_->open(*device, options_)) {
    device_->close();
    spdlog::error("could not open {}", label);
    return std::unexpected(lc::PipelineError::DeviceUnavailable);
  }
  DeviceSession session(*device_);

  // Warm-up frames are grabbed and dropped; the next one is kept.
  const std::uint32_t total = options_.warmup_frames + 1;
  for (std::uint32_t i = 0; i < total; ++i) {
    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
    if (remaining.count() <= 0) {
      spdlog::error("{}: no frame within {} ms", label, timeout_ms);
      return std::unexpected(lc::PipelineError::CaptureTimeout);
    }
    if (!device_->grab(remaining)) {
      spdlog::error("{}: grab failed after {} frame(s)", label, i);
      return std::unexpected(lc::PipelineError::CaptureTimeout);
    }
  }
  if (clock::now() > deadline) {
    spdlog::error("{}: no frame within {} ms", label, timeout_ms);
    return std::unexpected(lc::PipelineError::CaptureTimeout);
  }

  auto frame = device_->retrieve();
  if (!frame) {
    spdlog::error("{}: retrieved an empty frame", label);
    return std::unexpected(lc::PipelineError::CaptureTimeout);
  }
  auto rgb = detail::to_rgb8(*frame);
  if (!rgb) return std::unexpected(lc::PipelineError::InvalidFrame);

  spdlog::info("captured {}x{} frame from {} ({} warm-up frame(s) skipped)", rgb->width(),
               rgb->height(), label, options_.warmup_frames);
  return std::move(*rgb);
}

std::expected<lc::Frame, lc::PipelineError> ImageFileFrameSource::capture() {
  auto frame = load_frame_from_image(path_.string());
  if (!frame) {
    spdlog::error("could not decode input image {}", path_.string());
    return std::unexpected(lc::PipelineError::DeviceUnavailable);
  }
  spdlog::debug("loaded input image {} ({}x{})", path_.string(), frame->width(), frame->height());
  return std::move(*frame);
}

}  // namespace lolcommits::vision
