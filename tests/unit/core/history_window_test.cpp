#include <healthcam/core/history_window.hpp>
#include <gtest/gtest.h>
#include <stdexcept>

namespace hc = healthcam::core;

TEST(HistoryWindow, ZeroCapacityThrows) {
  EXPECT_THROW(hc::HistoryWindow(0), std::invalid_argument);
}

TEST(HistoryWindow, EvictsOldestFirst) {
  hc::HistoryWindow w(3);
  for (double v : {1.0, 2.0, 3.0, 4.0, 5.0}) w.push(v);
  ASSERT_EQ(w.size(), 3u);
  EXPECT_DOUBLE_EQ(w.samples().front(), 3.0);
  EXPECT_DOUBLE_EQ(w.samples().back(), 5.0);
}

TEST(HistoryWindow, DefaultCapacityIsThirty) {
  hc::HistoryWindow w;
  for (int i = 0; i < 45; ++i) w.push(i);
  EXPECT_EQ(w.size(), 30u);
  EXPECT_DOUBLE_EQ(w.samples().front(), 15.0);
}

TEST(ClassifyTrend, NeedsTenSamples) {
  hc::HistoryWindow w;
  for (int i = 0; i < 9; ++i) w.push(i);
  EXPECT_FALSE(hc::classify_trend(w).has_value());
  w.push(9);
  EXPECT_TRUE(hc::classify_trend(w).has_value());
}

TEST(ClassifyTrend, ConstantIsStable) {
  hc::HistoryWindow w;
  for (int i = 0; i < 12; ++i) w.push(0.8);
  EXPECT_EQ(hc::classify_trend(w), hc::Trend::Stable);
}

TEST(ClassifyTrend, RisingAndFalling) {
  hc::HistoryWindow up;
  hc::HistoryWindow down;
  for (int i = 0; i < 10; ++i) {
    up.push(i * 0.1);
    down.push(1.0 - i * 0.1);
  }
  // Oldest five average 0.2, newest five 0.7.
  EXPECT_EQ(hc::classify_trend(up), hc::Trend::Increasing);
  EXPECT_EQ(hc::classify_trend(down), hc::Trend::Decreasing);
}

TEST(ClassifyTrend, SmallShiftIsStable) {
  hc::HistoryWindow w;
  for (int i = 0; i < 5; ++i) w.push(0.5);
  for (int i = 0; i < 5; ++i) w.push(0.65);
  EXPECT_EQ(hc::classify_trend(w), hc::Trend::Stable);
}

TEST(Trend, NamesRoundTrip) {
  for (auto t : {hc::Trend::Stable, hc::Trend::Increasing, hc::Trend::Decreasing}) {
    EXPECT_EQ(hc::parse_trend(hc::trend_name(t)), t);
  }
  EXPECT_FALSE(hc::parse_trend("Sideways").has_value());
}
