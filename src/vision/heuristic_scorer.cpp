#include <healthcam/vision/heuristic_scorer.hpp>
#include <healthcam/vision/feature_extractor.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace healthcam::vision {

namespace hc = healthcam::core;
namespace ind = healthcam::core::indicators;
namespace m = measurements;

namespace {

std::string skin_tone_note(double hue, double sat, double val) {
  if (hue >= 20.0 && hue <= 40.0 && sat > 100.0) {
    return "Yellowish tint detected - may indicate bilirubin variations";
  }
  if (val < 150.0 && sat < 50.0) {
    return "Pale complexion detected - may relate to circulation or blood metrics";
  }
  if ((hue <= 10.0 || (hue >= 170.0 && hue <= 180.0)) && sat > 100.0) {
    return "Increased skin redness detected - may indicate inflammatory response";
  }
  return "Normal skin tone variation detected";
}

std::string texture_note(double texture) {
  if (texture > 60.0) {
    return "Significant skin texture variation detected - consider hydration assessment";
  }
  if (texture > 40.0) return "Moderate skin texture variation - may indicate mild dehydration";
  if (texture > 20.0) return "Normal skin texture detected";
  return "Smooth skin texture detected - good hydration indicators";
}

}  // namespace

std::expected<hc::IndicatorSet, hc::PipelineError> HeuristicScorer::score(
    const hc::MeasurementBundle& bundle) {
  hc::IndicatorSet out;

  if (const auto sym = bundle.scalar(m::kSymmetry, m::kOverallSymmetry)) {
    if (!std::isfinite(*sym)) return std::unexpected(hc::PipelineError::ScoringFailed);
    out.set(ind::kFacialSymmetry, *sym);
    if (*sym < ranges_.symmetry_low) {
      out.set(ind::kSymmetryEvaluation, std::string("Low symmetry"));
    } else if (*sym < ranges_.symmetry_normal) {
      out.set(ind::kSymmetryEvaluation, std::string("Moderate symmetry"));
    } else {
      out.set(ind::kSymmetryEvaluation, std::string("High symmetry"));
    }
    if (*sym < 0.6) {
      out.notes.emplace_back(
          "Significant facial asymmetry detected - consider assessment if recent change");
    } else if (*sym < 0.7) {
      out.notes.emplace_back(
          "Facial asymmetry detected - can be normal variation or may indicate muscle imbalance");
    }

    // Proxy score on the 5-25 scale of the lab value it loosely mirrors.
    const double stress = std::round((12.0 + (1.0 - *sym) * 13.0) * 10.0) / 10.0;
    out.set("estimated_stress_level",
            hc::StructuredIndicator{stress,
                                    "Estimated from facial symmetry, not an actual lab value"});
  }

  if (const auto level = bundle.scalar(m::kSymmetry, m::kEyesLevel)) {
    out.set(ind::kEyesLevelSymmetry, *level);
    if (*level < ranges_.eyes_level_note) {
      out.notes.emplace_back(
          "Eye level asymmetry noted - may indicate musculoskeletal alignment factors");
    }
  }

  if (const auto openness = bundle.scalar(m::kEyes, m::kOpenness)) {
    out.set(ind::kEyeOpenness, *openness);
    if (*openness < 0.2) {
      out.set(ind::kEyeFatigue, std::string("High"));
      out.notes.emplace_back(
          "Signs of significant eye fatigue detected - consider rest and screen time reduction");
    } else if (*openness < 0.3) {
      out.set(ind::kEyeFatigue, std::string("Moderate"));
      out.notes.emplace_back("Moderate eye fatigue indicators - consider short breaks");
    } else {
      out.set(ind::kEyeFatigue, std::string("Low"));
    }
  }

  if (const auto bags = bundle.scalar(m::kEyes, m::kBags)) {
    out.set("eye_bags", *bags);
    if (*bags < ranges_.eye_bags_mild) {
      out.set(ind::kEyeBagsEvaluation, std::string("None to minimal"));
    } else if (*bags < ranges_.eye_bags_moderate) {
      out.set(ind::kEyeBagsEvaluation, std::string("Mild"));
    } else {
      out.set(ind::kEyeBagsEvaluation, std::string("Moderate to severe"));
      out.notes.emplace_back(
          "Prominent eye bags may indicate fluid retention, allergies, or sleep factors");
    }
  }

  if (const auto tone = bundle.vector(m::kSkin, m::kSkinTone); tone && tone->size() == 3u) {
    out.set(ind::kSkinToneNote, skin_tone_note((*tone)[0], (*tone)[1], (*tone)[2]));
  }
  if (const auto texture = bundle.scalar(m::kSkin, m::kTexture)) {
    out.set(ind::kSkinTexture, *texture);
    out.set(ind::kTextureNote, texture_note(*texture));
  }

  const auto width = bundle.scalar(m::kMetrics, m::kFaceWidth);
  const auto height = bundle.scalar(m::kMetrics, m::kFaceHeight);
  if (width && height) {
    const double perimeter = 2.0 * (*width + *height);
    if (perimeter > 0.0) {
      const double fullness = std::min(1.0, (*width * *height) / (perimeter * perimeter) * 1000.0);
      out.set(ind::kFacialFullness, fullness);
      if (fullness < ranges_.fullness_low) {
        out.set(ind::kFullnessEvaluation,
                std::string("Low facial fullness - may indicate low body fat percentage"));
      } else if (fullness < ranges_.fullness_normal) {
        out.set(ind::kFullnessEvaluation,
                std::string("Moderate facial fullness - within healthy parameters"));
      } else {
        out.set(ind::kFullnessEvaluation,
                std::string("High facial fullness - within normal variation"));
      }
    }
  }

  if (const auto diff = bundle.scalar(m::kFacialRatios, m::kTopGoldenRatioDiff)) {
    out.set(ind::kGoldenRatioHarmony, std::max(0.0, 1.0 - *diff));
  }

  return out;
}

}  // namespace healthcam::vision
