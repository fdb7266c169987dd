#pragma once

#include <healthcam/core/error.hpp>
#include <healthcam/core/indicator.hpp>
#include <healthcam/core/measurement.hpp>
#include <expected>

namespace healthcam::vision {

/// Abstract scorer: MeasurementBundle -> named indicators plus advisory notes.
class IIndicatorScorer {
 public:
  virtual ~IIndicatorScorer() = default;

  [[nodiscard]] virtual std::expected<healthcam::core::IndicatorSet,
                                      healthcam::core::PipelineError>
  score(const healthcam::core::MeasurementBundle& bundle) = 0;
};

}  // namespace healthcam::vision
