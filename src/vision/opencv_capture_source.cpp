#include <healthcam/vision/opencv_capture_source.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/videoio.hpp>
#include <spdlog/spdlog.h>

namespace healthcam::vision {

namespace hc = healthcam::core;

struct OpenCvCaptureSource::Impl {
  mutable std::mutex mutex;
  cv::VideoCapture capture;
  int requested_width{0};
  int requested_height{0};
  std::uint64_t next_sequence{1};
};

OpenCvCaptureSource::OpenCvCaptureSource(int requested_width, int requested_height)
    : impl_(std::make_unique<Impl>()) {
  impl_->requested_width = requested_width;
  impl_->requested_height = requested_height;
}

OpenCvCaptureSource::~OpenCvCaptureSource() { close(); }

std::expected<void, hc::PipelineError> OpenCvCaptureSource::open(int device_id) {
  std::lock_guard lock(impl_->mutex);
  if (impl_->capture.isOpened()) {
    impl_->capture.release();
  }
  try {
    if (!impl_->capture.open(device_id)) {
      return std::unexpected(hc::PipelineError::DeviceUnavailable);
    }
  } catch (const cv::Exception& e) {
    spdlog::error("OpenCvCaptureSource: opening device {} threw: {}", device_id, e.what());
    return std::unexpected(hc::PipelineError::DeviceUnavailable);
  }
  impl_->capture.set(cv::CAP_PROP_FRAME_WIDTH, impl_->requested_width);
  impl_->capture.set(cv::CAP_PROP_FRAME_HEIGHT, impl_->requested_height);
  impl_->next_sequence = 1;
  spdlog::info("Camera {} opened ({}, {}x{})", device_id, impl_->capture.getBackendName(),
               static_cast<int>(impl_->capture.get(cv::CAP_PROP_FRAME_WIDTH)),
               static_cast<int>(impl_->capture.get(cv::CAP_PROP_FRAME_HEIGHT)));
  return {};
}

std::expected<hc::Frame, hc::PipelineError> OpenCvCaptureSource::read_frame() {
  std::lock_guard lock(impl_->mutex);
  if (!impl_->capture.isOpened()) {
    return std::unexpected(hc::PipelineError::CaptureError);
  }
  cv::Mat mat;
  try {
    if (!impl_->capture.read(mat) || mat.empty()) {
      return std::unexpected(hc::PipelineError::CaptureError);
    }
  } catch (const cv::Exception& e) {
    spdlog::error("OpenCvCaptureSource: read threw: {}", e.what());
    return std::unexpected(hc::PipelineError::CaptureError);
  }
  const auto format = mat.channels() == 1 ? hc::PixelFormat::Grayscale8 : hc::PixelFormat::BGR8;
  return detail::mat_to_frame(mat, format, impl_->next_sequence++);
}

void OpenCvCaptureSource::close() {
  std::lock_guard lock(impl_->mutex);
  if (impl_->capture.isOpened()) {
    impl_->capture.release();
    spdlog::info("Camera released");
  }
}

bool OpenCvCaptureSource::is_open() const {
  std::lock_guard lock(impl_->mutex);
  return impl_->capture.isOpened();
}

std::string OpenCvCaptureSource::backend_name() const {
  std::lock_guard lock(impl_->mutex);
  if (!impl_->capture.isOpened()) return "closed";
  try {
    return impl_->capture.getBackendName();
  } catch (const cv::Exception&) {
    return "unknown";
  }
}

}  // namespace healthcam::vision
