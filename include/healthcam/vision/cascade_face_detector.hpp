#pragma once

#include <healthcam/vision/face_detector.hpp>
#include <memory>
#include <string>

namespace healthcam::vision {

/// Tuning of the multi-scale cascade search.
struct CascadeOptions {
  double scale_factor{1.1};
  int min_neighbors{5};
  int min_size{30};  // pixels, square
};

/// OpenCV Haar/LBP cascade face detector. Cascades report no score, so every
/// region carries confidence 1.0.
class CascadeFaceDetector : public IFaceDetector {
 public:
  /// \throws std::runtime_error if the cascade file cannot be loaded.
  explicit CascadeFaceDetector(const std::string& cascade_path,
                               CascadeOptions options = {});
  ~CascadeFaceDetector() override;

  CascadeFaceDetector(const CascadeFaceDetector&) = delete;
  CascadeFaceDetector& operator=(const CascadeFaceDetector&) = delete;

  [[nodiscard]] std::expected<std::vector<healthcam::core::DetectedRegion>,
                              healthcam::core::PipelineError>
  detect(const healthcam::core::Frame& input) override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace healthcam::vision
