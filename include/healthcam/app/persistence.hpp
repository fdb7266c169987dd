#pragma once

#include <healthcam/core/session_result.hpp>
#include <healthcam/storage/storage_backend.hpp>
#include <tbb/concurrent_queue.h>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace healthcam::app {

/// Unbounded multi-producer queue of results awaiting persistence.
/// enqueue() and drain_into() never block.
class PersistenceQueue {
 public:
  void enqueue(healthcam::core::SessionResult record);

  /// Moves every currently queued record to the back of \p out.
  /// Returns the number moved.
  std::size_t drain_into(std::vector<healthcam::core::SessionResult>& out);

  [[nodiscard]] bool empty() const { return queue_.empty(); }

 private:
  tbb::concurrent_queue<healthcam::core::SessionResult> queue_;
};

/// Builds `<dir>/<prefix><stamp>` paths. Timestamps have one-second
/// resolution, so a stamp equal to the previous call's gets `_1`, `_2`, ...
/// appended and no name is handed out twice. One thread per instance.
class StampedNamer {
 public:
  [[nodiscard]] std::filesystem::path next(const std::filesystem::path& dir,
                                           std::string_view prefix,
                                           const std::string& stamp);

 private:
  std::string last_stamp_;
  std::size_t repeats_{0};
};

/// Where and how often the flusher persists.
struct FlushPolicy {
  std::filesystem::path output_dir{"data"};
  healthcam::storage::OutputFormat format{healthcam::storage::OutputFormat::Json};
  std::chrono::duration<double> interval{10.0};
  std::string file_prefix{"health_analysis_"};
};

enum class FlushOutcome {
  Idle,     // nothing accumulated
  Waiting,  // records accumulated, interval not yet elapsed
  Saved,
  Failed,   // accumulator kept for the next interval
};

/// Drains the queue into an in-memory accumulator and saves it as one batch
/// once the flush interval has elapsed since the last attempt.
///
/// On success the accumulator is cleared; on failure it is kept whole and
/// retried at the next interval together with records that arrived since.
/// A backend that never recovers makes the accumulator grow without bound;
/// the size is logged with every failure.
///
/// tick(), flush_now() and run() belong to one thread; pending() and the
/// counters are for that thread or for after run() returned.
class Flusher {
 public:
  using Clock = std::chrono::steady_clock;

  Flusher(PersistenceQueue& queue,
          healthcam::storage::IStorageBackend& backend,
          FlushPolicy policy,
          Clock::time_point start = Clock::now());

  /// One loop step at time \p now.
  FlushOutcome tick(Clock::time_point now);

  /// Drains and saves regardless of the interval (used on shutdown).
  FlushOutcome flush_now();

  /// Calls tick() every \p poll until \p running is false, then flush_now().
  void run(const std::atomic<bool>& running, std::chrono::milliseconds poll);

  [[nodiscard]] std::size_t pending() const noexcept { return accumulator_.size(); }
  [[nodiscard]] std::size_t saved_records() const noexcept { return saved_records_; }
  [[nodiscard]] std::size_t failed_attempts() const noexcept { return failed_attempts_; }
  [[nodiscard]] const std::optional<std::filesystem::path>& last_path() const noexcept {
    return last_path_;
  }

 private:
  FlushOutcome save();
  std::filesystem::path next_base_path();

  PersistenceQueue& queue_;
  healthcam::storage::IStorageBackend& backend_;
  FlushPolicy policy_;
  Clock::time_point last_attempt_;
  std::vector<healthcam::core::SessionResult> accumulator_;
  std::size_t saved_records_{0};
  std::size_t failed_attempts_{0};
  std::optional<std::filesystem::path> last_path_;
  StampedNamer namer_;
};

}  // namespace healthcam::app
