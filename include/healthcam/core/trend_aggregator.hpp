#pragma once

#include <healthcam/core/history_window.hpp>
#include <healthcam/core/indicator.hpp>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace healthcam::core {

/// Per-metric history of indicator values with trend classification.
/// Not thread-safe: owned by the single task that records into it.
class TrendAggregator {
 public:
  explicit TrendAggregator(std::size_t capacity = HistoryWindow::kDefaultCapacity);

  /// Appends every numeric indicator of \p indicators (plain or structured) to
  /// its window. Eye-fatigue labels are appended through fatigue_level();
  /// other labels are skipped. Returns the number of samples appended.
  std::size_t record(const IndicatorSet& indicators);

  [[nodiscard]] std::optional<Trend> trend(std::string_view metric) const;

  /// Trends of all metrics with enough history.
  [[nodiscard]] std::map<std::string, Trend> trends() const;

  /// nullptr if \p metric was never recorded.
  [[nodiscard]] const HistoryWindow* window(std::string_view metric) const;

  [[nodiscard]] std::size_t metric_count() const noexcept { return windows_.size(); }

 private:
  void append(std::string_view metric, double value);

  std::size_t capacity_;
  std::map<std::string, HistoryWindow, std::less<>> windows_;
};

}  // namespace healthcam::core
