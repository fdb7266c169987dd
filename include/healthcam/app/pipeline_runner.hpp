#pragma once

#include <healthcam/core/error.hpp>
#include <healthcam/core/frame.hpp>
#include <healthcam/core/region.hpp>
#include <healthcam/core/session_result.hpp>
#include <healthcam/core/trend_aggregator.hpp>
#include <healthcam/vision/face_detector.hpp>
#include <healthcam/vision/feature_extractor.hpp>
#include <healthcam/vision/indicator_scorer.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <string>

namespace healthcam::app {

/// Optional per-stage timing: (stage_index, duration_ms); stages are
/// 0 detect, 1 extract, 2 score.
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Collaborators of one analysis pass. Caller keeps ownership; each instance
/// is used from one thread at a time.
struct AnalysisStages {
  healthcam::vision::IFaceDetector& detector;
  healthcam::vision::IFeatureExtractor& extractor;
  healthcam::vision::IIndicatorScorer& scorer;
};

/// Runs detection and selects the primary (largest) region.
/// NoFaceDetected when the detector finds nothing. A std::exception thrown by a
/// collaborator is logged and reported as that stage's error (DetectionFailed,
/// ExtractionFailed or ScoringFailed), here and in analyse_region().
[[nodiscard]] std::expected<healthcam::core::DetectedRegion, healthcam::core::PipelineError>
detect_primary(healthcam::vision::IFaceDetector& detector,
               const healthcam::core::Frame& frame,
               StageTimingCallback* timing_cb = nullptr);

/// Extraction, scoring, trend update, aggregate score, status and
/// recommendations for an already selected region. Records into \p trends.
[[nodiscard]] std::expected<healthcam::core::SessionResult, healthcam::core::PipelineError>
analyse_region(const AnalysisStages& stages,
               healthcam::core::TrendAggregator& trends,
               const healthcam::core::Frame& frame,
               const healthcam::core::DetectedRegion& region,
               const std::string& session_id,
               StageTimingCallback* timing_cb = nullptr);

/// detect_primary() followed by analyse_region().
[[nodiscard]] std::expected<healthcam::core::SessionResult, healthcam::core::PipelineError>
run_analysis_cycle(const AnalysisStages& stages,
                   healthcam::core::TrendAggregator& trends,
                   const healthcam::core::Frame& frame,
                   const std::string& session_id,
                   StageTimingCallback* timing_cb = nullptr);

}  // namespace healthcam::app
