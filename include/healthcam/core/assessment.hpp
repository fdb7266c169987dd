#pragma once

#include <healthcam/core/indicator.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace healthcam::core {

/// Ordered status bands of the aggregate score, plus an explicit state for
/// "nothing scorable was measured".
enum class HealthStatus : std::uint8_t {
  Excellent,   // >= 8.5
  Good,        // >= 7.0
  Fair,        // >= 5.5
  Concerning,  // >= 4.0
  Poor,
  InsufficientData,
};

[[nodiscard]] std::string_view status_name(HealthStatus status) noexcept;
[[nodiscard]] std::optional<HealthStatus> parse_status(std::string_view name) noexcept;

/// Indicators that take part in the aggregate score.
enum class ScoredMetric : std::uint8_t {
  FacialSymmetry,
  EyesLevelSymmetry,
  EyeFatigue,
  SkinTexture,
  GoldenRatioHarmony,
};

struct MetricWeight {
  ScoredMetric metric;
  std::string_view indicator;
  double weight;
};

/// Fixed weight table, heaviest first.
[[nodiscard]] std::span<const MetricWeight> metric_weights() noexcept;

/// Numeric proxy for an eye-fatigue label (Minimal/Low 0.1, Mild 0.3,
/// Moderate 0.6, High/Severe 0.9). Unknown labels give nullopt.
[[nodiscard]] std::optional<double> fatigue_level(std::string_view label) noexcept;

/// 0-10 sub-score of an eye-fatigue label: Low 10, Moderate 7, High 4, any
/// other label 8.
[[nodiscard]] double fatigue_score(std::string_view label) noexcept;

/// 0-10 sub-score of one metric, or nullopt if the indicator is absent.
/// Symmetry, eye-level symmetry and harmony scale by 10; skin texture scores
/// max(0, 1 - texture / 100) * 10.
[[nodiscard]] std::optional<double> metric_score(ScoredMetric metric,
                                                 const IndicatorSet& indicators);

/// Weighted mean of the sub-scores of the metrics present in \p indicators.
/// Absent metrics carry no weight. Rounded to one decimal; nullopt when no
/// metric is present.
[[nodiscard]] std::optional<double> aggregate_score(const IndicatorSet& indicators);

[[nodiscard]] HealthStatus classify_status(std::optional<double> score) noexcept;

/// Runs the fixed, ordered recommendation rules against \p indicators. Every
/// rule is independent; advice appears in rule order. When no rule fires the
/// list holds the single maintenance recommendation.
[[nodiscard]] std::vector<std::string> build_recommendations(const IndicatorSet& indicators);

inline constexpr std::string_view kMaintenanceRecommendation =
    "Maintain healthy habits and adequate rest";

}  // namespace healthcam::core
