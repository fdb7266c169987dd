#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace healthcam::core {

/// Indicator carrying a value together with its own explanatory note
/// (e.g. an estimated stress level).
struct StructuredIndicator {
  double value{0.0};
  std::string note;
};

/// One indicator value: numeric score, classification label, or structured.
using IndicatorValue = std::variant<double, std::string, StructuredIndicator>;

/// Names of the indicators the pipeline knows how to weight, trend and turn
/// into recommendations. Scorers may emit further names; they are persisted
/// and displayed but not aggregated.
namespace indicators {
inline constexpr std::string_view kFacialSymmetry = "facial_symmetry";
inline constexpr std::string_view kSymmetryEvaluation = "symmetry_evaluation";
inline constexpr std::string_view kEyesLevelSymmetry = "eyes_level_symmetry";
inline constexpr std::string_view kEyeOpenness = "eye_openness";
inline constexpr std::string_view kEyeFatigue = "eye_fatigue";
inline constexpr std::string_view kEyeBagsEvaluation = "eye_bags_evaluation";
inline constexpr std::string_view kSkinTexture = "skin_texture";
inline constexpr std::string_view kTextureNote = "texture_note";
inline constexpr std::string_view kSkinToneNote = "skin_tone_note";
inline constexpr std::string_view kFacialFullness = "facial_fullness";
inline constexpr std::string_view kFullnessEvaluation = "fullness_evaluation";
inline constexpr std::string_view kGoldenRatioHarmony = "golden_ratio_harmony";
}  // namespace indicators

/// Indicators produced by one scoring pass plus free-text advisory notes.
struct IndicatorSet {
  std::map<std::string, IndicatorValue, std::less<>> values;
  std::vector<std::string> notes;

  void set(std::string_view name, IndicatorValue value);

  [[nodiscard]] bool contains(std::string_view name) const;

  /// Numeric value of \p name: the double itself or StructuredIndicator::value.
  /// Labels are not converted here.
  [[nodiscard]] std::optional<double> numeric(std::string_view name) const;

  [[nodiscard]] std::optional<std::string> label(std::string_view name) const;

  [[nodiscard]] bool empty() const noexcept { return values.empty(); }
};

}  // namespace healthcam::core
