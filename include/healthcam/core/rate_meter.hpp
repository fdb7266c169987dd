#pragma once

#include <cstddef>
#include <deque>

namespace healthcam::core {

/// Cycles per second averaged over the most recent cycle durations.
/// Not thread-safe; owners publish rate() through an atomic for other threads.
class RateMeter {
 public:
  static constexpr std::size_t kDefaultWindow = 30;

  explicit RateMeter(std::size_t window = kDefaultWindow) : window_(window == 0 ? 1 : window) {}

  void add(double seconds);

  /// 0 until a positive duration was recorded.
  [[nodiscard]] double rate() const noexcept;

 private:
  std::size_t window_;
  std::deque<double> durations_;
  double sum_{0.0};
};

}  // namespace healthcam::core
