#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

namespace healthcam::core {

/// Single-value mailbox with most-recent-wins semantics.
///
/// publish() overwrites any unread value unconditionally and never waits on a
/// reader. take_latest() hands out a copy, so the slot may be overwritten the
/// instant after a reader returns. The mutex is held only for the copy in or
/// out; a reader never observes a partially written value.
///
/// Readers are not guaranteed to see every value: under load intermediate
/// values are dropped, which bounds memory to one value and bounds latency to
/// one publish.
template <typename T>
class LatestSlot {
 public:
  LatestSlot() = default;

  LatestSlot(const LatestSlot&) = delete;
  LatestSlot& operator=(const LatestSlot&) = delete;

  void publish(T value) {
    std::lock_guard lock(mutex_);
    latest_ = std::move(value);
    ++version_;
  }

  /// Copy of the most recent value, or nullopt if nothing was published yet.
  [[nodiscard]] std::optional<T> take_latest() const {
    std::lock_guard lock(mutex_);
    return latest_;
  }

  /// Like take_latest(), but nullopt unless a value newer than \p seen_version
  /// was published. On success \p seen_version is advanced to the version
  /// returned.
  [[nodiscard]] std::optional<T> take_newer(std::uint64_t& seen_version) const {
    std::lock_guard lock(mutex_);
    if (!latest_ || version_ == seen_version) return std::nullopt;
    seen_version = version_;
    return latest_;
  }

  /// Number of publishes so far.
  [[nodiscard]] std::uint64_t version() const {
    std::lock_guard lock(mutex_);
    return version_;
  }

  void clear() {
    std::lock_guard lock(mutex_);
    latest_.reset();
  }

 private:
  mutable std::mutex mutex_;
  std::optional<T> latest_;
  std::uint64_t version_{0};
};

}  // namespace healthcam::core
