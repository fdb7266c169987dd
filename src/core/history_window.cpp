#include <healthcam/core/history_window.hpp>
#include <iterator>
#include <numeric>
#include <stdexcept>

namespace healthcam::core {

std::string_view trend_name(Trend trend) noexcept {
  switch (trend) {
    case Trend::Stable:
      return "Stable";
    case Trend::Increasing:
      return "Increasing";
    case Trend::Decreasing:
      return "Decreasing";
  }
  return "Unknown";
}

std::optional<Trend> parse_trend(std::string_view name) noexcept {
  for (auto trend : {Trend::Stable, Trend::Increasing, Trend::Decreasing}) {
    if (trend_name(trend) == name) return trend;
  }
  return std::nullopt;
}

HistoryWindow::HistoryWindow(std::size_t capacity) : capacity_(capacity) {
  if (capacity_ == 0) {
    throw std::invalid_argument("HistoryWindow: capacity must be positive");
  }
}

void HistoryWindow::push(double value) {
  samples_.push_back(value);
  while (samples_.size() > capacity_) {
    samples_.pop_front();
  }
}

std::optional<Trend> classify_trend(const HistoryWindow& window) {
  const auto& samples = window.samples();
  if (samples.size() < kTrendMinSamples) return std::nullopt;

  const auto span = static_cast<std::ptrdiff_t>(kTrendSpan);
  const double earliest =
      std::accumulate(samples.begin(), std::next(samples.begin(), span), 0.0) /
      static_cast<double>(kTrendSpan);
  const double recent =
      std::accumulate(std::prev(samples.end(), span), samples.end(), 0.0) /
      static_cast<double>(kTrendSpan);

  const double shift = recent - earliest;
  if (shift > kTrendThreshold) return Trend::Increasing;
  if (shift < -kTrendThreshold) return Trend::Decreasing;
  return Trend::Stable;
}

}  // namespace healthcam::core
