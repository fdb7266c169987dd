#include <healthcam/core/indicator.hpp>
#include <healthcam/core/trend_aggregator.hpp>
#include <gtest/gtest.h>
#include <string>

namespace hc = healthcam::core;
namespace ind = healthcam::core::indicators;

TEST(TrendAggregator, RecordsNumericAndFatigueOnly) {
  hc::TrendAggregator agg;
  hc::IndicatorSet s;
  s.set(ind::kFacialSymmetry, 0.8);
  s.set(ind::kEyeFatigue, std::string("Moderate"));
  s.set(ind::kSkinToneNote, std::string("Normal skin tone variation detected"));
  s.set("estimated_stress_level", hc::StructuredIndicator{14.0, "estimate"});

  EXPECT_EQ(agg.record(s), 3u);
  EXPECT_EQ(agg.metric_count(), 3u);
  ASSERT_NE(agg.window(ind::kEyeFatigue), nullptr);
  EXPECT_DOUBLE_EQ(agg.window(ind::kEyeFatigue)->samples().back(), 0.6);
  EXPECT_EQ(agg.window(ind::kSkinToneNote), nullptr);
}

TEST(TrendAggregator, TrendsOnlyWithEnoughHistory) {
  hc::TrendAggregator agg;
  for (int i = 0; i < 9; ++i) {
    hc::IndicatorSet s;
    s.set(ind::kFacialSymmetry, 0.1 * i);
    agg.record(s);
  }
  EXPECT_TRUE(agg.trends().empty());

  hc::IndicatorSet last;
  last.set(ind::kFacialSymmetry, 0.9);
  agg.record(last);
  const auto trends = agg.trends();
  ASSERT_EQ(trends.size(), 1u);
  EXPECT_EQ(trends.at(std::string(ind::kFacialSymmetry)), hc::Trend::Increasing);
}

TEST(TrendAggregator, MissingMetricHasNoTrend) {
  hc::TrendAggregator agg;
  EXPECT_FALSE(agg.trend("facial_symmetry").has_value());
}
