#include <healthcam/vision/cascade_face_detector.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <opencv2/objdetect.hpp>
#include <stdexcept>
#include <vector>

namespace healthcam::vision {

struct CascadeFaceDetector::Impl {
  cv::CascadeClassifier classifier;
  CascadeOptions options;
};

CascadeFaceDetector::CascadeFaceDetector(const std::string& cascade_path,
                                         CascadeOptions options)
    : impl_(std::make_unique<Impl>()) {
  impl_->options = options;
  if (!impl_->classifier.load(cascade_path)) {
    throw std::runtime_error("CascadeFaceDetector: cannot load cascade '" + cascade_path + "'");
  }
}

CascadeFaceDetector::~CascadeFaceDetector() = default;

std::expected<std::vector<healthcam::core::DetectedRegion>, healthcam::core::PipelineError>
CascadeFaceDetector::detect(const healthcam::core::Frame& input) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  auto gray = detail::frame_to_gray(input);
  if (!gray) {
    return std::unexpected(healthcam::core::PipelineError::InvalidFrame);
  }
  cv::equalizeHist(*gray, *gray);

  std::vector<cv::Rect> faces;
  const int min_size = impl_->options.min_size;
  try {
    impl_->classifier.detectMultiScale(*gray, faces, impl_->options.scale_factor,
                                       impl_->options.min_neighbors, 0,
                                       cv::Size(min_size, min_size));
  } catch (const cv::Exception&) {
    return std::unexpected(healthcam::core::PipelineError::DetectionFailed);
  }

  std::vector<healthcam::core::DetectedRegion> regions;
  regions.reserve(faces.size());
  for (const auto& r : faces) {
    regions.push_back({{static_cast<float>(r.x), static_cast<float>(r.y),
                        static_cast<float>(r.width), static_cast<float>(r.height)},
                       1.f});
  }
  return regions;
}

}  // namespace healthcam::vision
