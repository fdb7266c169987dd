#pragma once

#include <healthcam/vision/frame_display.hpp>
#include <string>

namespace healthcam::vision {

/// highgui window (imshow / waitKey).
class OpenCvWindow : public IFrameDisplay {
 public:
  explicit OpenCvWindow(std::string title);
  ~OpenCvWindow() override;

  OpenCvWindow(const OpenCvWindow&) = delete;
  OpenCvWindow& operator=(const OpenCvWindow&) = delete;

  void show(const healthcam::core::Frame& frame) override;
  [[nodiscard]] int poll_key(int wait_ms) override;
  void close() override;

 private:
  std::string title_;
  bool open_{false};
};

}  // namespace healthcam::vision
