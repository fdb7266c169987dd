#pragma once

#include <healthcam/core/error.hpp>
#include <healthcam/core/frame.hpp>
#include <healthcam/core/region.hpp>
#include <expected>
#include <string>
#include <vector>

namespace healthcam::vision {

/// Abstract face detector: Frame -> zero or more DetectedRegions in frame
/// pixel coordinates. No bounded run time is assumed by callers.
/// Instances are used from one thread at a time; give each task its own.
class IFaceDetector {
 public:
  virtual ~IFaceDetector() = default;

  [[nodiscard]] virtual std::expected<std::vector<healthcam::core::DetectedRegion>,
                                      healthcam::core::PipelineError>
  detect(const healthcam::core::Frame& input) = 0;

  /// Optional: validate frame format/dimensions before detect. Default: reject empty frames.
  [[nodiscard]] virtual std::expected<void, healthcam::core::PipelineError>
  validate_input(const healthcam::core::Frame& input) const {
    if (input.empty()) {
      return std::unexpected(healthcam::core::PipelineError::InvalidFrame);
    }
    return {};
  }

  /// Compute backend in use, shown in the performance overlay ("CPU", "CUDA").
  [[nodiscard]] virtual std::string backend_name() const { return "CPU"; }

  /// Optional: warmup run (e.g. dummy inference). Call once after construction. Default: no-op.
  virtual void warmup() {}
};

}  // namespace healthcam::vision
