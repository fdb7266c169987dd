#include <healthcam/core/rate_meter.hpp>

namespace healthcam::core {

void RateMeter::add(double seconds) {
  if (seconds < 0.0) return;
  durations_.push_back(seconds);
  sum_ += seconds;
  while (durations_.size() > window_) {
    sum_ -= durations_.front();
    durations_.pop_front();
  }
}

double RateMeter::rate() const noexcept {
  if (durations_.empty() || sum_ <= 0.0) return 0.0;
  return static_cast<double>(durations_.size()) / sum_;
}

}  // namespace healthcam::core
