#include <healthcam/vision/overlay.hpp>
#include "frame_cv_utils.hpp"
#include <healthcam/core/assessment.hpp>
#include <healthcam/core/indicator.hpp>
#include <opencv2/imgproc.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <string>

namespace healthcam::vision {

namespace hc = healthcam::core;
namespace ind = healthcam::core::indicators;

namespace {

const cv::Scalar kWhite(255, 255, 255);
const cv::Scalar kRed(0, 0, 255);
const cv::Scalar kBoxBlue(255, 0, 0);
constexpr int kFont = cv::FONT_HERSHEY_SIMPLEX;

cv::Scalar to_scalar(OverlayColor c) { return cv::Scalar(c.b, c.g, c.r); }

double eye_bags_level(const std::string& label) {
  if (label == "None to minimal") return 0.1;
  if (label == "Mild") return 0.3;
  return 0.9;
}

/// Indicator lines stacked upward from just above the face box.
void draw_indicators(cv::Mat& img, const hc::SessionResult& result) {
  const auto& box = result.region.bbox;
  const int x = static_cast<int>(box.x);
  int y = static_cast<int>(box.y) - 10;
  const auto line = [&](const std::string& text, const cv::Scalar& color) {
    cv::putText(img, text, cv::Point(x, y), kFont, 0.5, color, 1);
    y -= 20;
  };
  const auto& s = result.indicators;

  if (const auto v = s.numeric(ind::kFacialSymmetry)) {
    line(fmt::format("Symmetry: {:.2f}", *v), to_scalar(indicator_color(*v, 0.7, 0.9)));
  }
  if (const auto label = s.label(ind::kEyeFatigue)) {
    const double level = hc::fatigue_level(*label).value_or(0.5);
    line("Eye Fatigue: " + *label, to_scalar(indicator_color(1.0 - level, 0.3, 0.7)));
  }
  if (const auto v = s.numeric(ind::kFacialFullness)) {
    // Mid-range fullness is best.
    line(fmt::format("Facial Fullness: {:.2f}", *v),
         to_scalar(indicator_color(1.0 - std::abs(*v - 0.5) * 2.0, 0.3, 0.7)));
  }
  if (const auto note = s.label(ind::kSkinToneNote)) {
    line("Skin: " + *note, kWhite);
  }
  if (const auto label = s.label(ind::kEyeBagsEvaluation)) {
    line("Eye Bags: " + *label,
         to_scalar(indicator_color(1.0 - eye_bags_level(*label), 0.3, 0.7)));
  }
  if (const auto label = s.label(ind::kSymmetryEvaluation)) {
    line("Symmetry Evaluation: " + *label, kWhite);
  }
  if (const auto label = s.label(ind::kFullnessEvaluation)) {
    line("Fullness Evaluation: " + *label, kWhite);
  }
}

}  // namespace

OverlayColor indicator_color(double value, double yellow_threshold,
                             double green_threshold) noexcept {
  value = std::clamp(value, 0.0, 1.0);
  if (value < yellow_threshold) {
    const auto g = static_cast<std::uint8_t>(255.0 * (value / yellow_threshold));
    return {0, g, 255};
  }
  if (value < green_threshold) {
    const double factor = (value - yellow_threshold) / (green_threshold - yellow_threshold);
    return {0, 255, static_cast<std::uint8_t>(255.0 * (1.0 - factor))};
  }
  return {0, 255, 0};
}

hc::Frame render_overlay(const hc::Frame& frame, const OverlayState& state) {
  auto bgr = detail::frame_to_bgr(frame);
  if (!bgr) return frame;
  cv::Mat img = bgr->clone();

  if (state.show_results && state.result) {
    const auto& result = *state.result;
    const auto& b = result.region.bbox;
    cv::rectangle(img, cv::Rect(static_cast<int>(b.x), static_cast<int>(b.y),
                                static_cast<int>(b.w), static_cast<int>(b.h)),
                  kBoxBlue, 2);
    draw_indicators(img, result);

    const int bottom = img.rows;
    cv::putText(img, "Health Status: " + std::string(hc::status_name(result.status)),
                cv::Point(10, bottom - 70), kFont, 0.7, kWhite, 2);
    if (result.score) {
      cv::putText(img, fmt::format("Health Score: {:.1f}/10", *result.score),
                  cv::Point(10, bottom - 40), kFont, 0.7, kWhite, 2);
    }
    if (!result.recommendations.empty()) {
      cv::putText(img, "Recommendation: " + result.recommendations.front(),
                  cv::Point(10, bottom - 10), kFont, 0.5, kWhite, 1);
    }
  }

  cv::putText(img, fmt::format("Capture FPS: {:.1f}", state.capture_fps), cv::Point(10, 30),
              kFont, 0.7, kRed, 2);
  cv::putText(img, fmt::format("Analysis FPS: {:.1f}", state.analysis_fps), cv::Point(10, 60),
              kFont, 0.7, kRed, 2);
  cv::putText(img, "Using: " + (state.backend.empty() ? std::string("CPU") : state.backend),
              cv::Point(10, 90), kFont, 0.7, kRed, 2);
  cv::putText(img,
              std::string("Primary face detected: ") + (state.face_detected ? "Yes" : "No"),
              cv::Point(10, 120), kFont, 0.7, kRed, 2);

  if (state.countdown_remaining) {
    const int secs = static_cast<int>(std::ceil(std::max(0.0, *state.countdown_remaining)));
    cv::putText(img, std::to_string(secs), cv::Point(img.cols / 2 - 20, img.rows / 2), kFont,
                3.0, kRed, 5);
  }
  if (!state.session_message.empty()) {
    cv::putText(img, state.session_message, cv::Point(10, 150), kFont, 0.6, kWhite, 2);
  }

  return detail::mat_to_frame(img, hc::PixelFormat::BGR8, frame.sequence());
}

}  // namespace healthcam::vision
