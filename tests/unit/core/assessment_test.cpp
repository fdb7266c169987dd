#include <healthcam/core/assessment.hpp>
#include <healthcam/core/indicator.hpp>
#include <gtest/gtest.h>
#include <string>

namespace hc = healthcam::core;
namespace ind = healthcam::core::indicators;

TEST(Assessment, EmptySetIsInsufficientData) {
  hc::IndicatorSet empty;
  const auto score = hc::aggregate_score(empty);
  EXPECT_FALSE(score.has_value());
  EXPECT_EQ(hc::classify_status(score), hc::HealthStatus::InsufficientData);
}

TEST(Assessment, AbsentMetricsCarryNoWeight) {
  hc::IndicatorSet s;
  s.set(ind::kFacialSymmetry, 0.78);
  const auto score = hc::aggregate_score(s);
  ASSERT_TRUE(score.has_value());
  EXPECT_DOUBLE_EQ(*score, 7.8);
  EXPECT_EQ(hc::classify_status(score), hc::HealthStatus::Good);
}

TEST(Assessment, WeightedMeanOfPresentMetrics) {
  hc::IndicatorSet s;
  s.set(ind::kFacialSymmetry, 0.9);              // 9.0 * 2.5
  s.set(ind::kEyeFatigue, std::string("High"));  // 4.0 * 1.2
  const auto score = hc::aggregate_score(s);
  ASSERT_TRUE(score.has_value());
  EXPECT_DOUBLE_EQ(*score, 7.4);  // 27.3 / 3.7 = 7.378...
}

TEST(Assessment, SubScoreMappings) {
  hc::IndicatorSet s;
  s.set(ind::kFacialSymmetry, 0.78);
  s.set(ind::kEyesLevelSymmetry, 0.85);
  s.set(ind::kSkinTexture, 35.0);
  s.set(ind::kGoldenRatioHarmony, 0.6);
  EXPECT_DOUBLE_EQ(*hc::metric_score(hc::ScoredMetric::FacialSymmetry, s), 7.8);
  EXPECT_DOUBLE_EQ(*hc::metric_score(hc::ScoredMetric::EyesLevelSymmetry, s), 8.5);
  EXPECT_DOUBLE_EQ(*hc::metric_score(hc::ScoredMetric::SkinTexture, s), 6.5);
  EXPECT_DOUBLE_EQ(*hc::metric_score(hc::ScoredMetric::GoldenRatioHarmony, s), 6.0);
  EXPECT_FALSE(hc::metric_score(hc::ScoredMetric::EyeFatigue, s).has_value());
}

TEST(Assessment, FatigueLabelScores) {
  EXPECT_DOUBLE_EQ(hc::fatigue_score("Low"), 10.0);
  EXPECT_DOUBLE_EQ(hc::fatigue_score("Moderate"), 7.0);
  EXPECT_DOUBLE_EQ(hc::fatigue_score("High"), 4.0);
  EXPECT_DOUBLE_EQ(hc::fatigue_score("Sleepy"), 8.0);

  hc::IndicatorSet s;
  s.set(ind::kEyeFatigue, std::string("High"));
  const auto score = hc::aggregate_score(s);
  ASSERT_TRUE(score.has_value());
  EXPECT_DOUBLE_EQ(*score, 4.0);
  EXPECT_EQ(hc::classify_status(score), hc::HealthStatus::Concerning);
}

TEST(Assessment, SubScoresAreBounded) {
  hc::IndicatorSet s;
  s.set(ind::kFacialSymmetry, 1.2);
  s.set(ind::kSkinTexture, 150.0);
  EXPECT_DOUBLE_EQ(*hc::metric_score(hc::ScoredMetric::FacialSymmetry, s), 10.0);
  EXPECT_DOUBLE_EQ(*hc::metric_score(hc::ScoredMetric::SkinTexture, s), 0.0);
}

TEST(Assessment, ScoreIsRoundedBeforeBanding) {
  hc::IndicatorSet s;
  s.set(ind::kSkinTexture, 30.4);  // 6.96
  const auto score = hc::aggregate_score(s);
  ASSERT_TRUE(score.has_value());
  EXPECT_DOUBLE_EQ(*score, 7.0);
  EXPECT_EQ(hc::classify_status(score), hc::HealthStatus::Good);
}

TEST(Assessment, StatusBands) {
  EXPECT_EQ(hc::classify_status(9.0), hc::HealthStatus::Excellent);
  EXPECT_EQ(hc::classify_status(8.5), hc::HealthStatus::Excellent);
  EXPECT_EQ(hc::classify_status(7.0), hc::HealthStatus::Good);
  EXPECT_EQ(hc::classify_status(5.5), hc::HealthStatus::Fair);
  EXPECT_EQ(hc::classify_status(4.0), hc::HealthStatus::Concerning);
  EXPECT_EQ(hc::classify_status(3.99), hc::HealthStatus::Poor);
}

TEST(Assessment, WeightsHeaviestFirst) {
  const auto weights = hc::metric_weights();
  ASSERT_EQ(weights.size(), 5u);
  for (std::size_t i = 1; i < weights.size(); ++i) {
    EXPECT_GE(weights[i - 1].weight, weights[i].weight);
  }
}

TEST(Recommendations, MaintenanceWhenNothingFires) {
  hc::IndicatorSet s;
  s.set(ind::kFacialSymmetry, 0.95);
  const auto recs = hc::build_recommendations(s);
  ASSERT_EQ(recs.size(), 1u);
  EXPECT_EQ(recs[0], hc::kMaintenanceRecommendation);
}

TEST(Recommendations, RulesFireInOrder) {
  hc::IndicatorSet s;
  s.set(ind::kFacialFullness, 0.95);
  s.set(ind::kEyeFatigue, std::string("Moderate"));
  s.set(ind::kSkinTexture, 45.0);
  const auto recs = hc::build_recommendations(s);
  ASSERT_EQ(recs.size(), 4u);
  EXPECT_EQ(recs[0], "Take a break from screen time");
  EXPECT_EQ(recs[2], "Consider hydration and skincare routine");
  EXPECT_EQ(recs[3], "Monitor for fluid retention/edema");
}

TEST(Recommendations, YellowishToneIsCaseInsensitive) {
  hc::IndicatorSet s;
  s.set(ind::kSkinToneNote, std::string("YELLOWISH tint detected"));
  const auto recs = hc::build_recommendations(s);
  ASSERT_EQ(recs.size(), 1u);
  EXPECT_EQ(recs[0], "Consider checking liver health & hydration");
}

TEST(HealthStatus, NamesRoundTrip) {
  for (auto st : {hc::HealthStatus::Excellent, hc::HealthStatus::Good, hc::HealthStatus::Fair,
                  hc::HealthStatus::Concerning, hc::HealthStatus::Poor,
                  hc::HealthStatus::InsufficientData}) {
    EXPECT_EQ(hc::parse_status(hc::status_name(st)), st);
  }
}
