#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string_view>

namespace healthcam::core {

/// Direction of a metric over its retained history.
enum class Trend : std::uint8_t {
  Stable,
  Increasing,
  Decreasing,
};

[[nodiscard]] std::string_view trend_name(Trend trend) noexcept;
[[nodiscard]] std::optional<Trend> parse_trend(std::string_view name) noexcept;

/// Bounded per-metric sample history. Appending beyond capacity evicts the
/// oldest sample first. Used for trend comparison only; samples carry no
/// identity across frames.
class HistoryWindow {
 public:
  static constexpr std::size_t kDefaultCapacity = 30;

  /// \throws std::invalid_argument if \p capacity is 0.
  explicit HistoryWindow(std::size_t capacity = kDefaultCapacity);

  void push(double value);

  [[nodiscard]] std::size_t size() const noexcept { return samples_.size(); }
  [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
  [[nodiscard]] bool empty() const noexcept { return samples_.empty(); }

  /// Oldest first.
  [[nodiscard]] const std::deque<double>& samples() const noexcept { return samples_; }

 private:
  std::size_t capacity_;
  std::deque<double> samples_;
};

/// Samples required before a trend is reported.
inline constexpr std::size_t kTrendMinSamples = 10;
/// Samples averaged at each end of the window.
inline constexpr std::size_t kTrendSpan = 5;
/// Mean shift that must be exceeded to leave Stable.
inline constexpr double kTrendThreshold = 0.2;

/// Compares the mean of the newest kTrendSpan samples with the mean of the
/// oldest kTrendSpan retained samples. This is a two-window mean shift, not a
/// regression: shifts within +/-kTrendThreshold read as Stable.
/// Returns nullopt with fewer than kTrendMinSamples samples.
[[nodiscard]] std::optional<Trend> classify_trend(const HistoryWindow& window);

}  // namespace healthcam::core
