#include <healthcam/vision/opencv_window.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/highgui.hpp>
#include <spdlog/spdlog.h>

namespace healthcam::vision {

OpenCvWindow::OpenCvWindow(std::string title) : title_(std::move(title)) {}

OpenCvWindow::~OpenCvWindow() { close(); }

void OpenCvWindow::show(const healthcam::core::Frame& frame) {
  auto bgr = detail::frame_to_bgr(frame);
  if (!bgr) {
    spdlog::debug("OpenCvWindow: skipping frame in unsupported format");
    return;
  }
  if (!open_) {
    cv::namedWindow(title_, cv::WINDOW_AUTOSIZE);
    open_ = true;
  }
  cv::imshow(title_, *bgr);
}

int OpenCvWindow::poll_key(int wait_ms) {
  const int key = cv::waitKey(wait_ms < 1 ? 1 : wait_ms);
  return key < 0 ? -1 : (key & 0xFF);
}

void OpenCvWindow::close() {
  if (open_) {
    cv::destroyWindow(title_);
    open_ = false;
  }
}

}  // namespace healthcam::vision
