#include <healthcam/core/trend_aggregator.hpp>
#include <healthcam/core/assessment.hpp>
#include <variant>

namespace healthcam::core {

TrendAggregator::TrendAggregator(std::size_t capacity) : capacity_(capacity) {
  // Fail at construction rather than on the first append.
  (void)HistoryWindow(capacity_);
}

std::size_t TrendAggregator::record(const IndicatorSet& set) {
  std::size_t appended = 0;
  for (const auto& [name, value] : set.values) {
    std::optional<double> sample;
    if (const auto* d = std::get_if<double>(&value)) {
      sample = *d;
    } else if (const auto* s = std::get_if<StructuredIndicator>(&value)) {
      sample = s->value;
    } else if (name == indicators::kEyeFatigue) {
      sample = fatigue_level(std::get<std::string>(value));
    }
    if (!sample) continue;
    append(name, *sample);
    ++appended;
  }
  return appended;
}

void TrendAggregator::append(std::string_view metric, double value) {
  auto it = windows_.find(metric);
  if (it == windows_.end()) {
    it = windows_.emplace(std::string(metric), HistoryWindow(capacity_)).first;
  }
  it->second.push(value);
}

std::optional<Trend> TrendAggregator::trend(std::string_view metric) const {
  const auto* w = window(metric);
  if (w == nullptr) return std::nullopt;
  return classify_trend(*w);
}

std::map<std::string, Trend> TrendAggregator::trends() const {
  std::map<std::string, Trend> out;
  for (const auto& [name, w] : windows_) {
    if (const auto t = classify_trend(w)) out.emplace(name, *t);
  }
  return out;
}

const HistoryWindow* TrendAggregator::window(std::string_view metric) const {
  const auto it = windows_.find(metric);
  return it == windows_.end() ? nullptr : &it->second;
}

}  // namespace healthcam::core
