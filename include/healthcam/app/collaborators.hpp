#pragma once

#include <healthcam/app/config.hpp>
#include <healthcam/vision/face_detector.hpp>
#include <healthcam/vision/feature_extractor.hpp>
#include <healthcam/vision/indicator_scorer.hpp>
#include <functional>
#include <memory>

namespace healthcam::app {

/// Builds fresh collaborator instances; each pipeline task gets its own.
struct PipelineFactory {
  std::function<std::unique_ptr<healthcam::vision::IFaceDetector>()> make_detector;
  std::function<std::unique_ptr<healthcam::vision::IFeatureExtractor>()> make_extractor;
  std::function<std::unique_ptr<healthcam::vision::IIndicatorScorer>()> make_scorer;
};

/// Factory for the detector selected in \p config, RegionFeatureExtractor and
/// HeuristicScorer. The returned functions throw what the constructors throw
/// (missing cascade or model).
[[nodiscard]] PipelineFactory make_pipeline_factory(const AppConfig& config);

}  // namespace healthcam::app
