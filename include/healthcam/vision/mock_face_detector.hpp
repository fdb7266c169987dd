#pragma once

#include <healthcam/vision/face_detector.hpp>
#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <vector>

namespace healthcam::vision {

/// Detector returning configurable synthetic regions (for tests/demo).
class MockFaceDetector : public IFaceDetector {
 public:
  /// Regions to return on every subsequent detect() call.
  void set_regions(std::vector<healthcam::core::DetectedRegion> regions);

  /// Make detect() fail with \p error until cleared with nullopt.
  void set_failure(std::optional<healthcam::core::PipelineError> error);

  [[nodiscard]] std::expected<std::vector<healthcam::core::DetectedRegion>,
                              healthcam::core::PipelineError>
  detect(const healthcam::core::Frame& input) override;

  [[nodiscard]] std::size_t detect_calls() const noexcept { return detect_calls_.load(); }

 private:
  mutable std::mutex mutex_;
  std::vector<healthcam::core::DetectedRegion> regions_;
  std::optional<healthcam::core::PipelineError> failure_;
  std::atomic<std::size_t> detect_calls_{0};
};

}  // namespace healthcam::vision
