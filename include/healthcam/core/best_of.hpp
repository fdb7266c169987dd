#pragma once

#include <functional>
#include <optional>
#include <utility>

namespace healthcam::core {

/// Reducer that keeps the best value offered so far. A candidate replaces the
/// current best only if it is strictly better under \p Less (less(best, c)),
/// so among equal candidates the first one offered is kept.
template <typename T, typename Less = std::less<T>>
class BestOf {
 public:
  explicit BestOf(Less less = Less{}) : less_(std::move(less)) {}

  /// Returns true if \p candidate became the new best.
  bool offer(T candidate) {
    if (best_ && !less_(*best_, candidate)) return false;
    best_ = std::move(candidate);
    return true;
  }

  [[nodiscard]] const std::optional<T>& best() const noexcept { return best_; }
  [[nodiscard]] bool empty() const noexcept { return !best_.has_value(); }

  void reset() noexcept { best_.reset(); }

  /// Moves the best value out and resets.
  [[nodiscard]] std::optional<T> take() {
    std::optional<T> out = std::move(best_);
    best_.reset();
    return out;
  }

 private:
  Less less_;
  std::optional<T> best_;
};

}  // namespace healthcam::core
