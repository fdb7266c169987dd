#pragma once

#include <healthcam/core/frame.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace healthcam::vision::detail {

/// Wrap Frame pixels in a cv::Mat header (no copy; the Mat aliases the frame
/// buffer and must not outlive it). Returns nullopt if format unsupported.
std::optional<cv::Mat> frame_to_mat(const healthcam::core::Frame& frame);

/// Convert cv::Mat to Frame (copy).
healthcam::core::Frame mat_to_frame(const cv::Mat& mat,
                                    healthcam::core::PixelFormat format,
                                    std::uint64_t sequence = 0);

/// Single-channel copy of \p frame for detectors and measurements.
std::optional<cv::Mat> frame_to_gray(const healthcam::core::Frame& frame);

/// Three-channel BGR copy (or alias when already BGR) of \p frame.
std::optional<cv::Mat> frame_to_bgr(const healthcam::core::Frame& frame);

}  // namespace healthcam::vision::detail
