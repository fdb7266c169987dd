#pragma once

#include <healthcam/vision/feature_extractor.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace healthcam::vision {

struct RegionExtractorOptions {
  /// Optional eye cascade; enables the `eyes` group and eye-based eye-level symmetry.
  std::string eye_cascade_path;
  /// Regions narrower or shorter than this only get the `metrics` group.
  std::uint32_t min_region_px{40};
};

/// Landmark-free measurements of a face region using OpenCV image statistics:
/// - metrics: region width/height (and eye widths when eyes are found)
/// - symmetry: mirror similarity of the two face halves, eye-level similarity
/// - skin: mean HSV of a subsampled central patch, grey-level standard deviation
/// - facial_ratios: brow/eye/mouth rows from the row-intensity profile
/// - eyes: openness (dark-band height over eye width) and under-eye darkness
class RegionFeatureExtractor : public IFeatureExtractor {
 public:
  /// \throws std::runtime_error if eye_cascade_path is set but cannot be loaded.
  explicit RegionFeatureExtractor(RegionExtractorOptions options = {});
  ~RegionFeatureExtractor() override;

  RegionFeatureExtractor(const RegionFeatureExtractor&) = delete;
  RegionFeatureExtractor& operator=(const RegionFeatureExtractor&) = delete;

  [[nodiscard]] std::expected<healthcam::core::MeasurementBundle,
                              healthcam::core::PipelineError>
  extract(const healthcam::core::Frame& frame,
          const healthcam::core::DetectedRegion& region) override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace healthcam::vision
