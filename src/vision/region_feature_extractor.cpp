#include <healthcam/vision/region_feature_extractor.hpp>
#include "frame_cv_utils.hpp"
#include <healthcam/core/error.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/objdetect.hpp>
#include <algorithm>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <vector>

namespace healthcam::vision {

namespace hc = healthcam::core;
namespace m = measurements;

namespace {

constexpr double kGoldenRatio = 1.618;

/// Region clipped to the image; empty rect if they do not overlap.
cv::Rect clip_region(const hc::BBox& box, int cols, int rows) {
  const cv::Rect rect(static_cast<int>(std::lround(box.x)), static_cast<int>(std::lround(box.y)),
                      static_cast<int>(std::lround(box.w)), static_cast<int>(std::lround(box.h)));
  return rect & cv::Rect(0, 0, cols, rows);
}

/// 1 - mean absolute difference between the left half and the mirrored right half.
double mirror_similarity(const cv::Mat& gray) {
  const int half = gray.cols / 2;
  if (half == 0) return 1.0;
  const cv::Mat left = gray(cv::Rect(0, 0, half, gray.rows));
  cv::Mat right;
  cv::flip(gray(cv::Rect(gray.cols - half, 0, half, gray.rows)), right, 1);
  cv::Mat diff;
  cv::absdiff(left, right, diff);
  return 1.0 - cv::mean(diff)[0] / 255.0;
}

/// Row index of the darkest smoothed row in [lo, hi) of \p profile.
std::optional<int> darkest_row(const std::vector<double>& profile, int lo, int hi) {
  lo = std::max(lo, 0);
  hi = std::min(hi, static_cast<int>(profile.size()));
  if (hi <= lo) return std::nullopt;
  return static_cast<int>(std::min_element(profile.begin() + lo, profile.begin() + hi) -
                          profile.begin());
}

std::vector<double> row_profile(const cv::Mat& gray) {
  cv::Mat blurred;
  cv::GaussianBlur(gray, blurred, cv::Size(5, 5), 0);
  cv::Mat rows;
  cv::reduce(blurred, rows, 1, cv::REDUCE_AVG, CV_64F);
  return std::vector<double>(rows.begin<double>(), rows.end<double>());
}

/// Fraction of the eye width covered by rows that are mostly dark (iris, lashes).
double eye_openness(const cv::Mat& eye_gray) {
  cv::Mat dark;
  cv::threshold(eye_gray, dark, 0, 255, cv::THRESH_BINARY_INV | cv::THRESH_OTSU);
  int dark_rows = 0;
  for (int r = 0; r < dark.rows; ++r) {
    if (cv::countNonZero(dark.row(r)) > dark.cols / 5) ++dark_rows;
  }
  return eye_gray.cols > 0 ? static_cast<double>(dark_rows) / eye_gray.cols : 0.0;
}

}  // namespace

struct RegionFeatureExtractor::Impl {
  RegionExtractorOptions options;
  std::optional<cv::CascadeClassifier> eye_cascade;

  void add_skin(const cv::Mat& face_bgr, const cv::Mat& face_gray, hc::MeasurementBundle& out) const;
  void add_eyes(const cv::Mat& face_gray, hc::MeasurementBundle& out);
  void add_ratios(const cv::Mat& face_gray, hc::MeasurementBundle& out) const;
};

RegionFeatureExtractor::RegionFeatureExtractor(RegionExtractorOptions options)
    : impl_(std::make_unique<Impl>()) {
  impl_->options = std::move(options);
  if (!impl_->options.eye_cascade_path.empty()) {
    cv::CascadeClassifier cascade;
    if (!cascade.load(impl_->options.eye_cascade_path)) {
      throw std::runtime_error("RegionFeatureExtractor: cannot load eye cascade " +
                               impl_->options.eye_cascade_path);
    }
    impl_->eye_cascade = std::move(cascade);
  }
}

RegionFeatureExtractor::~RegionFeatureExtractor() = default;

void RegionFeatureExtractor::Impl::add_skin(const cv::Mat& face_bgr, const cv::Mat& face_gray,
                                            hc::MeasurementBundle& out) const {
  // Central patch avoids hair and background at the box border.
  const cv::Rect inner(face_bgr.cols / 4, face_bgr.rows / 4, face_bgr.cols / 2,
                       face_bgr.rows / 2);
  cv::Mat hsv;
  cv::cvtColor(face_bgr(inner), hsv, cv::COLOR_BGR2HSV);
  const int step = std::max(1, std::min(hsv.rows, hsv.cols) / 30);
  cv::Scalar sum(0, 0, 0);
  int samples = 0;
  for (int r = 0; r < hsv.rows; r += step) {
    for (int c = 0; c < hsv.cols; c += step) {
      const auto& px = hsv.at<cv::Vec3b>(r, c);
      sum += cv::Scalar(px[0], px[1], px[2]);
      ++samples;
    }
  }
  if (samples > 0) {
    out.set(m::kSkin, m::kSkinTone,
            std::vector<double>{sum[0] / samples, sum[1] / samples, sum[2] / samples});
  }

  cv::Scalar mean;
  cv::Scalar stddev;
  cv::meanStdDev(face_gray(inner), mean, stddev);
  out.set(m::kSkin, m::kTexture, stddev[0]);
}

void RegionFeatureExtractor::Impl::add_eyes(const cv::Mat& face_gray,
                                            hc::MeasurementBundle& out) {
  const double face_h = face_gray.rows;
  if (eye_cascade) {
    const cv::Mat upper = face_gray(cv::Rect(0, 0, face_gray.cols, face_gray.rows / 2));
    std::vector<cv::Rect> eyes;
    eye_cascade->detectMultiScale(upper, eyes, 1.1, 5, 0,
                                  cv::Size(face_gray.cols / 10, face_gray.cols / 10));
    if (eyes.size() >= 2) {
      // Two largest, ordered left to right in the image.
      std::sort(eyes.begin(), eyes.end(),
                [](const cv::Rect& a, const cv::Rect& b) { return a.area() > b.area(); });
      eyes.resize(2);
      std::sort(eyes.begin(), eyes.end(),
                [](const cv::Rect& a, const cv::Rect& b) { return a.x < b.x; });
      const cv::Rect& left = eyes[0];
      const cv::Rect& right = eyes[1];

      out.set(m::kMetrics, m::kLeftEyeWidth, static_cast<double>(left.width));
      out.set(m::kMetrics, m::kRightEyeWidth, static_cast<double>(right.width));
      out.set(m::kMetrics, m::kEyeWidthRatio,
              right.width > 0 ? static_cast<double>(left.width) / right.width : 0.0);

      const double dy = std::abs((left.y + left.height / 2.0) - (right.y + right.height / 2.0));
      out.set(m::kSymmetry, m::kEyesLevel, 1.0 - std::min(1.0, dy / face_h * 10.0));

      out.set(m::kEyes, m::kOpenness,
              (eye_openness(upper(left)) + eye_openness(upper(right))) / 2.0);

      // Under-eye band against the cheek band below it; darker bands score higher.
      const int band_h = std::max(1, left.height / 3);
      const cv::Rect under(left.x, left.y + left.height, left.width, band_h);
      const cv::Rect cheek(left.x, left.y + left.height + band_h, left.width, band_h);
      const cv::Rect bounds(0, 0, face_gray.cols, face_gray.rows);
      if ((under & bounds) == under && (cheek & bounds) == cheek) {
        const double under_mean = cv::mean(face_gray(under))[0];
        const double cheek_mean = cv::mean(face_gray(cheek))[0];
        if (cheek_mean > 0.0) {
          out.set(m::kEyes, m::kBags,
                  std::max(0.0, (cheek_mean - under_mean) / cheek_mean * 100.0));
        }
      }
      return;
    }
  }

  // Without eye positions: mirror similarity of the eye band.
  const int top = face_gray.rows / 5;
  const int height = std::max(1, face_gray.rows / 4);
  out.set(m::kSymmetry, m::kEyesLevel,
          mirror_similarity(face_gray(cv::Rect(0, top, face_gray.cols, height))));
}

void RegionFeatureExtractor::Impl::add_ratios(const cv::Mat& face_gray,
                                              hc::MeasurementBundle& out) const {
  const auto profile = row_profile(face_gray);
  const int h = face_gray.rows;
  const auto eye_row = darkest_row(profile, h / 5, h / 2);
  if (!eye_row) return;
  const auto brow_row = darkest_row(profile, h / 10, *eye_row - h / 20);
  const auto mouth_row = darkest_row(profile, (h * 13) / 20, (h * 9) / 10);
  if (!brow_row || !mouth_row) return;

  const double upper = *eye_row - *brow_row;
  const double lower = *mouth_row - *eye_row;
  if (upper <= 0.0 || lower <= 0.0) return;
  const double ratio = lower / upper;
  out.set(m::kFacialRatios, m::kTopThirdRatio, ratio);
  out.set(m::kFacialRatios, m::kTopGoldenRatioDiff, std::abs(ratio - kGoldenRatio));
}

std::expected<hc::MeasurementBundle, hc::PipelineError> RegionFeatureExtractor::extract(
    const hc::Frame& frame, const hc::DetectedRegion& region) {
  auto bgr = detail::frame_to_bgr(frame);
  if (!bgr) {
    return std::unexpected(hc::PipelineError::InvalidFrame);
  }
  const cv::Rect rect = clip_region(region.bbox, bgr->cols, bgr->rows);
  if (rect.area() <= 0) {
    return std::unexpected(hc::PipelineError::ExtractionFailed);
  }

  hc::MeasurementBundle out;
  out.set(m::kMetrics, m::kFaceWidth, static_cast<double>(rect.width));
  out.set(m::kMetrics, m::kFaceHeight, static_cast<double>(rect.height));
  out.set(m::kMetrics, m::kFaceWidthHeightRatio,
          static_cast<double>(rect.width) / static_cast<double>(rect.height));

  const auto min_px = static_cast<int>(impl_->options.min_region_px);
  if (rect.width < min_px || rect.height < min_px) {
    return out;
  }

  try {
    const cv::Mat face_bgr = (*bgr)(rect);
    cv::Mat face_gray;
    cv::cvtColor(face_bgr, face_gray, cv::COLOR_BGR2GRAY);

    out.set(m::kSymmetry, m::kOverallSymmetry, mirror_similarity(face_gray));
    impl_->add_eyes(face_gray, out);
    impl_->add_skin(face_bgr, face_gray, out);
    impl_->add_ratios(face_gray, out);
  } catch (const cv::Exception&) {
    return std::unexpected(hc::PipelineError::ExtractionFailed);
  }
  return out;
}

}  // namespace healthcam::vision
