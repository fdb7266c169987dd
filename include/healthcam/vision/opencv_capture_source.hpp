#pragma once

#include <healthcam/vision/capture_source.hpp>
#include <cstdint>
#include <memory>
#include <mutex>

namespace healthcam::vision {

/// cv::VideoCapture device. Frames are BGR8 and numbered from 1 in read order.
/// read_frame() and close() may be called from different threads; close()
/// waits for an in-flight read to return.
class OpenCvCaptureSource : public ICaptureSource {
 public:
  OpenCvCaptureSource(int requested_width = 1280, int requested_height = 720);
  ~OpenCvCaptureSource() override;

  OpenCvCaptureSource(const OpenCvCaptureSource&) = delete;
  OpenCvCaptureSource& operator=(const OpenCvCaptureSource&) = delete;

  [[nodiscard]] std::expected<void, healthcam::core::PipelineError> open(int device_id) override;

  [[nodiscard]] std::expected<healthcam::core::Frame, healthcam::core::PipelineError>
  read_frame() override;

  void close() override;

  [[nodiscard]] bool is_open() const override;

  [[nodiscard]] std::string backend_name() const override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace healthcam::vision
