#include "frame_cv_utils.hpp"
#include <healthcam/core/frame.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace healthcam::vision::detail {

namespace hc = healthcam::core;

std::optional<cv::Mat> frame_to_mat(const hc::Frame& frame) {
  if (!frame.is_complete()) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  const std::size_t step = frame.row_bytes();
  auto* pixels = const_cast<std::byte*>(frame.data().data());

  switch (frame.format()) {
    case hc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, pixels, step);
    case hc::PixelFormat::RGB8:
    case hc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, pixels, step);
    case hc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, pixels, step);
    case hc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

hc::Frame mat_to_frame(const cv::Mat& mat, hc::PixelFormat format,
                       std::uint64_t sequence) {
  if (mat.empty()) return hc::Frame();

  const cv::Mat continuous = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(continuous.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(continuous.rows);
  const std::size_t len = continuous.total() * continuous.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), continuous.ptr(), len);
  return hc::Frame(w, h, format, std::move(buffer), sequence);
}

std::optional<cv::Mat> frame_to_gray(const hc::Frame& frame) {
  auto mat = frame_to_mat(frame);
  if (!mat) return std::nullopt;

  cv::Mat gray;
  switch (frame.format()) {
    case hc::PixelFormat::Grayscale8:
      gray = mat->clone();
      break;
    case hc::PixelFormat::RGB8:
      cv::cvtColor(*mat, gray, cv::COLOR_RGB2GRAY);
      break;
    case hc::PixelFormat::BGR8:
      cv::cvtColor(*mat, gray, cv::COLOR_BGR2GRAY);
      break;
    case hc::PixelFormat::BGRA8:
      cv::cvtColor(*mat, gray, cv::COLOR_BGRA2GRAY);
      break;
    case hc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
  return gray;
}

std::optional<cv::Mat> frame_to_bgr(const hc::Frame& frame) {
  auto mat = frame_to_mat(frame);
  if (!mat) return std::nullopt;

  cv::Mat bgr;
  switch (frame.format()) {
    case hc::PixelFormat::BGR8:
      return mat;
    case hc::PixelFormat::RGB8:
      cv::cvtColor(*mat, bgr, cv::COLOR_RGB2BGR);
      break;
    case hc::PixelFormat::BGRA8:
      cv::cvtColor(*mat, bgr, cv::COLOR_BGRA2BGR);
      break;
    case hc::PixelFormat::Grayscale8:
      cv::cvtColor(*mat, bgr, cv::COLOR_GRAY2BGR);
      break;
    case hc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
  return bgr;
}

}  // namespace healthcam::vision::detail
