#pragma once

#include <healthcam/core/assessment.hpp>
#include <healthcam/core/history_window.hpp>
#include <healthcam/core/indicator.hpp>
#include <healthcam/core/measurement.hpp>
#include <healthcam/core/region.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace healthcam::core {

/// One analysis outcome: created once per analysis cycle (continuous mode) or
/// once per completed countdown (session mode), never modified afterwards and
/// queued for persistence exactly once.
struct SessionResult {
  std::string timestamp;  // local time, YYYYmmdd_HHMMSS
  std::uint64_t frame_id{0};
  std::string session_id;
  DetectedRegion region{};
  MeasurementBundle measurements;
  IndicatorSet indicators;
  /// Aggregate 0-10 score; absent when no weighted indicator was present.
  std::optional<double> score;
  HealthStatus status{HealthStatus::InsufficientData};
  std::vector<std::string> recommendations;
  /// Trend per metric, for metrics with enough history at creation time.
  std::map<std::string, Trend> trends;
};

/// Current local time formatted as YYYYmmdd_HHMMSS.
[[nodiscard]] std::string make_timestamp();

}  // namespace healthcam::core
