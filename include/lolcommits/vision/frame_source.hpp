#pragma once

#include <lolcommits/core/error.hpp>
#include <lolcommits/core/frame.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace lolcommits::vision {

/// Produces exactly one usable frame per capture() call.
class IFrameSource {
 public:
  virtual ~IFrameSource() = default;

  /// Returns an RGB8 frame, or DeviceUnavailable / DeviceBusy / CaptureTimeout.
  [[nodiscard]] virtual std::expected<lolcommits::core::Frame, lolcommits::core::PipelineError>
  capture() = 0;
};

/// Camera acquisition settings.
struct CameraOptions {
  std::string device{"0"};  // index, /dev/videoN (symlinks allowed) or stream URL
  std::uint32_t warmup_frames{3};
  std::chrono::milliseconds capture_timeout{5000};
  std::optional<std::uint32_t> width;
  std::optional<std::uint32_t> height;
  std::optional<double> fps;
};

/// A parsed camera device string.
struct CameraDevice {
  enum class Kind : std::uint8_t { Index, Url };

  Kind kind{Kind::Index};
  int index{0};
  std::filesystem::path node;  // resolved /dev/videoN when known
  std::string url;
};

/// "2" -> index 2; "/dev/video1" or a symlink to it -> index 1; anything else -> URL.
/// A /dev path that does not exist or is not a videoN node is DeviceUnavailable.
[[nodiscard]] std::expected<CameraDevice, lolcommits::core::PipelineError>
parse_camera_device(std::string_view device);

/// Result of probing a V4L2 node before handing it to OpenCV.
enum class DeviceProbe : std::uint8_t {
  Available,
  Busy,
  Unavailable,
};

/// Opens the node non-blocking and asks for zero buffers; EBUSY means another
/// process is streaming from it. Always Available on non-Linux systems.
[[nodiscard]] DeviceProbe probe_video_device(const std::filesystem::path& node);

/// Capture backend behind CameraFrameSource. One capture() call brackets
/// open() ... close(); grab() is called once per warm-up frame plus once for the kept frame.
class ICaptureDevice {
 public:
  virtual ~ICaptureDevice() = default;

  /// Checked before open(); Busy and Unavailable abort the capture.
  [[nodiscard]] virtual DeviceProbe availability(const CameraDevice& device) = 0;

  [[nodiscard]] virtual bool open(const CameraDevice& device, const CameraOptions& options) = 0;

  /// Waits at most `timeout` for the next frame. False on failure or timeout.
  [[nodiscard]] virtual bool grab(std::chrono::milliseconds timeout) = 0;

  /// Decodes the last grabbed frame in any supported format; nullopt if empty.
  [[nodiscard]] virtual std::optional<lolcommits::core::Frame> retrieve() = 0;

  virtual void close() noexcept = 0;
};

/// cv::VideoCapture device, with a V4L2 busy check for /dev/videoN nodes.
[[nodiscard]] std::unique_ptr<ICaptureDevice> make_opencv_capture_device();

/// Webcam source. The device is opened only for the duration of capture() and is
/// closed on every exit path.
class CameraFrameSource : public IFrameSource {
 public:
  explicit CameraFrameSource(CameraOptions options);
  CameraFrameSource(CameraOptions options, std::unique_ptr<ICaptureDevice> device);

  [[nodiscard]] std::expected<lolcommits::core::Frame, lolcommits::core::PipelineError>
  capture() override;

  [[nodiscard]] const CameraOptions& options() const noexcept { return options_; }

 private:
  CameraOptions options_;
  std::unique_ptr<ICaptureDevice> device_;
};

/// Still image used in place of a camera (--input). Undecodable file: DeviceUnavailable.
class ImageFileFrameSource : public IFrameSource {
 public:
  explicit ImageFileFrameSource(std::filesystem::path path) : path_(std::move(path)) {}

  [[nodiscard]] std::expected<lolcommits::core::Frame, lolcommits::core::PipelineError>
  capture() override;

 private:
  std::filesystem::path path_;
};

}  // namespace lolcommits::vision
