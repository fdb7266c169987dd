#include <healthcam/vision/mock_face_detector.hpp>

namespace healthcam::vision {

void MockFaceDetector::set_regions(std::vector<healthcam::core::DetectedRegion> regions) {
  std::lock_guard lock(mutex_);
  regions_ = std::move(regions);
}

void MockFaceDetector::set_failure(std::optional<healthcam::core::PipelineError> error) {
  std::lock_guard lock(mutex_);
  failure_ = error;
}

std::expected<std::vector<healthcam::core::DetectedRegion>, healthcam::core::PipelineError>
MockFaceDetector::detect(const healthcam::core::Frame& input) {
  ++detect_calls_;
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  std::lock_guard lock(mutex_);
  if (failure_) {
    return std::unexpected(*failure_);
  }
  return regions_;
}

}  // namespace healthcam::vision
