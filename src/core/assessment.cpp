#include <healthcam/core/assessment.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>

namespace healthcam::core {

namespace {

constexpr std::array<MetricWeight, 5> kWeights{{
    {ScoredMetric::FacialSymmetry, indicators::kFacialSymmetry, 2.5},
    {ScoredMetric::EyesLevelSymmetry, indicators::kEyesLevelSymmetry, 1.5},
    {ScoredMetric::EyeFatigue, indicators::kEyeFatigue, 1.2},
    {ScoredMetric::SkinTexture, indicators::kSkinTexture, 1.0},
    {ScoredMetric::GoldenRatioHarmony, indicators::kGoldenRatioHarmony, 0.8},
}};

bool contains_ignore_case(std::string_view text, std::string_view needle) {
  const auto it = std::search(
      text.begin(), text.end(), needle.begin(), needle.end(),
      [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
      });
  return it != text.end();
}

bool fatigue_elevated(const IndicatorSet& s) {
  const auto label = s.label(indicators::kEyeFatigue);
  return label && (*label == "Moderate" || *label == "Severe" || *label == "High");
}

bool symmetry_low(const IndicatorSet& s) {
  const auto v = s.numeric(indicators::kFacialSymmetry);
  return v && *v < 0.7;
}

bool texture_rough(const IndicatorSet& s) {
  const auto v = s.numeric(indicators::kSkinTexture);
  return v && *v > 30.0;
}

bool tone_yellowish(const IndicatorSet& s) {
  const auto note = s.label(indicators::kSkinToneNote);
  return note && contains_ignore_case(*note, "yellowish");
}

bool eye_bags_prominent(const IndicatorSet& s) {
  const auto label = s.label(indicators::kEyeBagsEvaluation);
  return label && (contains_ignore_case(*label, "moderate") ||
                   contains_ignore_case(*label, "severe"));
}

bool fullness_high(const IndicatorSet& s) {
  const auto v = s.numeric(indicators::kFacialFullness);
  return v && *v > 0.9;
}

struct RecommendationRule {
  bool (*fires)(const IndicatorSet&);
  std::string_view advice;
  std::string_view follow_up;  // empty when the rule gives one line
};

constexpr std::array<RecommendationRule, 6> kRules{{
    {fatigue_elevated, "Take a break from screen time",
     "Apply the 20-20-20 rule (look 20ft away for 20s every 20min)"},
    {symmetry_low, "Check for sleeping position issues",
     "Consider facial exercises to improve muscle tone"},
    {texture_rough, "Consider hydration and skincare routine", {}},
    {tone_yellowish, "Consider checking liver health & hydration", {}},
    {eye_bags_prominent, "Improve sleep quality and duration",
     "Consider reducing salt intake"},
    {fullness_high, "Monitor for fluid retention/edema", {}},
}};

}  // namespace

std::string_view status_name(HealthStatus status) noexcept {
  switch (status) {
    case HealthStatus::Excellent:
      return "Excellent";
    case HealthStatus::Good:
      return "Good";
    case HealthStatus::Fair:
      return "Fair";
    case HealthStatus::Concerning:
      return "Concerning";
    case HealthStatus::Poor:
      return "Poor";
    case HealthStatus::InsufficientData:
      return "Insufficient data";
  }
  return "Unknown";
}

std::optional<HealthStatus> parse_status(std::string_view name) noexcept {
  for (auto status : {HealthStatus::Excellent, HealthStatus::Good, HealthStatus::Fair,
                      HealthStatus::Concerning, HealthStatus::Poor,
                      HealthStatus::InsufficientData}) {
    if (status_name(status) == name) return status;
  }
  return std::nullopt;
}

std::span<const MetricWeight> metric_weights() noexcept { return kWeights; }

std::optional<double> fatigue_level(std::string_view label) noexcept {
  if (label == "Minimal" || label == "Low") return 0.1;
  if (label == "Mild") return 0.3;
  if (label == "Moderate") return 0.6;
  if (label == "High" || label == "Severe") return 0.9;
  return std::nullopt;
}

double fatigue_score(std::string_view label) noexcept {
  if (label == "Low") return 10.0;
  if (label == "Moderate") return 7.0;
  if (label == "High") return 4.0;
  return 8.0;
}

std::optional<double> metric_score(ScoredMetric metric, const IndicatorSet& s) {
  switch (metric) {
    case ScoredMetric::FacialSymmetry: {
      const auto v = s.numeric(indicators::kFacialSymmetry);
      if (!v) return std::nullopt;
      return std::clamp(*v, 0.0, 1.0) * 10.0;
    }
    case ScoredMetric::EyesLevelSymmetry: {
      const auto v = s.numeric(indicators::kEyesLevelSymmetry);
      if (!v) return std::nullopt;
      return std::clamp(*v, 0.0, 1.0) * 10.0;
    }
    case ScoredMetric::EyeFatigue: {
      const auto label = s.label(indicators::kEyeFatigue);
      if (!label) return std::nullopt;
      return fatigue_score(*label);
    }
    case ScoredMetric::SkinTexture: {
      const auto v = s.numeric(indicators::kSkinTexture);
      if (!v) return std::nullopt;
      // Grey-level deviation; 0 is perfectly smooth, 100 and above scores 0.
      return std::max(0.0, 1.0 - *v / 100.0) * 10.0;
    }
    case ScoredMetric::GoldenRatioHarmony: {
      const auto v = s.numeric(indicators::kGoldenRatioHarmony);
      if (!v) return std::nullopt;
      return std::clamp(*v, 0.0, 1.0) * 10.0;
    }
  }
  return std::nullopt;
}

std::optional<double> aggregate_score(const IndicatorSet& s) {
  double weighted = 0.0;
  double total_weight = 0.0;
  for (const auto& entry : kWeights) {
    const auto sub = metric_score(entry.metric, s);
    if (!sub) continue;
    weighted += *sub * entry.weight;
    total_weight += entry.weight;
  }
  if (total_weight <= 0.0) return std::nullopt;
  return std::round(weighted / total_weight * 10.0) / 10.0;
}

HealthStatus classify_status(std::optional<double> score) noexcept {
  if (!score) return HealthStatus::InsufficientData;
  if (*score >= 8.5) return HealthStatus::Excellent;
  if (*score >= 7.0) return HealthStatus::Good;
  if (*score >= 5.5) return HealthStatus::Fair;
  if (*score >= 4.0) return HealthStatus::Concerning;
  return HealthStatus::Poor;
}

std::vector<std::string> build_recommendations(const IndicatorSet& s) {
  std::vector<std::string> out;
  for (const auto& rule : kRules) {
    if (!rule.fires(s)) continue;
    out.emplace_back(rule.advice);
    if (!rule.follow_up.empty()) out.emplace_back(rule.follow_up);
  }
  if (out.empty()) out.emplace_back(kMaintenanceRecommendation);
  return out;
}

}  // namespace healthcam::core
