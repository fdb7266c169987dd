#pragma once

#include <healthcam/core/error.hpp>
#include <healthcam/core/frame.hpp>
#include <healthcam/core/measurement.hpp>
#include <healthcam/core/region.hpp>
#include <expected>

namespace healthcam::vision {

/// Abstract feature extractor: (Frame, primary region) -> MeasurementBundle.
/// The bundle may be partially populated; callers check groups before use.
class IFeatureExtractor {
 public:
  virtual ~IFeatureExtractor() = default;

  [[nodiscard]] virtual std::expected<healthcam::core::MeasurementBundle,
                                      healthcam::core::PipelineError>
  extract(const healthcam::core::Frame& frame,
          const healthcam::core::DetectedRegion& region) = 0;
};

/// Measurement group and key names written by the shipped extractor and read
/// by the shipped scorer.
namespace measurements {
inline constexpr const char* kMetrics = "metrics";
inline constexpr const char* kSymmetry = "symmetry";
inline constexpr const char* kSkin = "skin";
inline constexpr const char* kFacialRatios = "facial_ratios";
inline constexpr const char* kEyes = "eyes";

inline constexpr const char* kFaceWidth = "face_width";
inline constexpr const char* kFaceHeight = "face_height";
inline constexpr const char* kFaceWidthHeightRatio = "face_width_height_ratio";
inline constexpr const char* kLeftEyeWidth = "left_eye_width";
inline constexpr const char* kRightEyeWidth = "right_eye_width";
inline constexpr const char* kEyeWidthRatio = "eye_width_ratio";
inline constexpr const char* kOverallSymmetry = "overall_symmetry";
inline constexpr const char* kEyesLevel = "eyes_level";
inline constexpr const char* kSkinTone = "skin_tone";  // {hue, saturation, value}
inline constexpr const char* kTexture = "texture";
inline constexpr const char* kTopThirdRatio = "top_third_ratio";
inline constexpr const char* kTopGoldenRatioDiff = "top_golden_ratio_diff";
inline constexpr const char* kOpenness = "openness";
inline constexpr const char* kBags = "bags";
}  // namespace measurements

}  // namespace healthcam::vision
