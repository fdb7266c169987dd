#include <healthcam/app/pipeline_runner.hpp>
#include <healthcam/core/assessment.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <exception>

namespace healthcam::app {

namespace hc = healthcam::core;

namespace {

/// Calls \p fn and reports its duration to \p timing_cb as stage \p index.
template <typename Fn>
auto timed(std::size_t index, StageTimingCallback* timing_cb, Fn&& fn) {
  const auto stage_start = std::chrono::steady_clock::now();
  auto result = fn();
  if (timing_cb) {
    const auto stage_end = std::chrono::steady_clock::now();
    const double ms = std::chrono::duration<double, std::milli>(stage_end - stage_start).count();
    (*timing_cb)(index, ms);
  }
  return result;
}

/// Calls \p fn; a std::exception it throws becomes \p on_throw.
template <typename Fn>
auto guarded(hc::PipelineError on_throw, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const std::exception& e) {
    spdlog::warn("{}: {}", hc::error_name(on_throw), e.what());
    return std::unexpected(on_throw);
  }
}

}  // namespace

std::expected<hc::DetectedRegion, hc::PipelineError> detect_primary(
    healthcam::vision::IFaceDetector& detector, const hc::Frame& frame,
    StageTimingCallback* timing_cb) {
  auto regions = timed(0, timing_cb, [&] {
    return guarded(hc::PipelineError::DetectionFailed, [&] { return detector.detect(frame); });
  });
  if (!regions) {
    return std::unexpected(regions.error());
  }
  auto primary = hc::select_primary_region(*regions);
  if (!primary) {
    return std::unexpected(hc::PipelineError::NoFaceDetected);
  }
  return *primary;
}

std::expected<hc::SessionResult, hc::PipelineError> analyse_region(
    const AnalysisStages& stages, hc::TrendAggregator& trends, const hc::Frame& frame,
    const hc::DetectedRegion& region, const std::string& session_id,
    StageTimingCallback* timing_cb) {
  auto bundle = timed(1, timing_cb, [&] {
    return guarded(hc::PipelineError::ExtractionFailed,
                   [&] { return stages.extractor.extract(frame, region); });
  });
  if (!bundle) {
    return std::unexpected(bundle.error());
  }
  auto indicators = timed(2, timing_cb, [&] {
    return guarded(hc::PipelineError::ScoringFailed, [&] { return stages.scorer.score(*bundle); });
  });
  if (!indicators) {
    return std::unexpected(indicators.error());
  }

  trends.record(*indicators);

  hc::SessionResult result;
  result.timestamp = hc::make_timestamp();
  result.frame_id = frame.sequence();
  result.session_id = session_id;
  result.region = region;
  result.measurements = std::move(*bundle);
  result.score = hc::aggregate_score(*indicators);
  result.status = hc::classify_status(result.score);
  result.recommendations = hc::build_recommendations(*indicators);
  result.indicators = std::move(*indicators);
  result.trends = trends.trends();
  return result;
}

std::expected<hc::SessionResult, hc::PipelineError> run_analysis_cycle(
    const AnalysisStages& stages, hc::TrendAggregator& trends, const hc::Frame& frame,
    const std::string& session_id, StageTimingCallback* timing_cb) {
  auto region = detect_primary(stages.detector, frame, timing_cb);
  if (!region) {
    return std::unexpected(region.error());
  }
  return analyse_region(stages, trends, frame, *region, session_id, timing_cb);
}

}  // namespace healthcam::app
