#pragma once

#include <healthcam/app/persistence.hpp>
#include <healthcam/app/pipeline_runner.hpp>
#include <healthcam/core/frame.hpp>
#include <healthcam/core/latest_slot.hpp>
#include <healthcam/core/rate_meter.hpp>
#include <healthcam/core/session_result.hpp>
#include <healthcam/core/trend_aggregator.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace healthcam::app {

/// Counters the worker publishes for the render loop.
struct AnalysisStatus {
  std::atomic<double> fps{0.0};
  std::atomic<bool> face_detected{false};
  std::atomic<std::uint64_t> published{0};
  std::atomic<std::uint64_t> failed{0};
};

enum class CycleOutcome {
  NoFrame,    // nothing newer than the last analysed frame
  NoFace,
  Published,
  Failed,     // collaborator error or exception; logged
};

/// Background analysis task.
///
/// Each cycle takes the newest frame from the frame slot (never the same frame
/// twice), runs detection, primary-region selection, extraction and scoring,
/// updates the trend history, then publishes the SessionResult to the result
/// slot and enqueues it for persistence. A failing cycle is logged and skipped;
/// it never stops the loop.
///
/// The trend history is owned by the worker and only touched from its thread.
class AnalysisWorker {
 public:
  AnalysisWorker(const healthcam::core::LatestSlot<healthcam::core::Frame>& frames,
                 healthcam::core::LatestSlot<healthcam::core::SessionResult>& results,
                 PersistenceQueue& queue,
                 AnalysisStages stages,
                 std::string session_id,
                 std::chrono::milliseconds idle_sleep = std::chrono::milliseconds(10));

  /// Loops until \p running is false, sleeping idle_sleep when no new frame.
  void run(const std::atomic<bool>& running);

  /// One cycle without sleeping.
  CycleOutcome run_once();

  [[nodiscard]] const AnalysisStatus& status() const noexcept { return status_; }

  /// For inspection once the worker has stopped.
  [[nodiscard]] const healthcam::core::TrendAggregator& trends() const noexcept { return trends_; }

 private:
  const healthcam::core::LatestSlot<healthcam::core::Frame>& frames_;
  healthcam::core::LatestSlot<healthcam::core::SessionResult>& results_;
  PersistenceQueue& queue_;
  AnalysisStages stages_;
  std::string session_id_;
  std::chrono::milliseconds idle_sleep_;

  std::uint64_t seen_version_{0};
  healthcam::core::TrendAggregator trends_;
  healthcam::core::RateMeter rate_;
  AnalysisStatus status_;
};

}  // namespace healthcam::app
