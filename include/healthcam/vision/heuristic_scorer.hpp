#pragma once

#include <healthcam/vision/indicator_scorer.hpp>

namespace healthcam::vision {

/// Reference ranges of the heuristic classifications.
struct HeuristicRanges {
  double symmetry_low{0.6};
  double symmetry_normal{0.8};
  double eyes_level_note{0.85};
  double eye_bags_mild{20.0};
  double eye_bags_moderate{40.0};
  double fullness_low{0.3};
  double fullness_normal{0.7};
};

/// Threshold-based scorer over the groups written by RegionFeatureExtractor.
/// Groups missing from the bundle produce no indicators; the scorer never
/// fills in placeholder values. Stateless, safe to share.
class HeuristicScorer : public IIndicatorScorer {
 public:
  explicit HeuristicScorer(HeuristicRanges ranges = {}) : ranges_(ranges) {}

  [[nodiscard]] std::expected<healthcam::core::IndicatorSet, healthcam::core::PipelineError>
  score(const healthcam::core::MeasurementBundle& bundle) override;

 private:
  HeuristicRanges ranges_;
};

}  // namespace healthcam::vision
