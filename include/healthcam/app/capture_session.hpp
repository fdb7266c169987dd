#pragma once

#include <healthcam/app/persistence.hpp>
#include <healthcam/app/pipeline_runner.hpp>
#include <healthcam/core/best_of.hpp>
#include <healthcam/core/error.hpp>
#include <healthcam/core/frame.hpp>
#include <healthcam/core/region.hpp>
#include <healthcam/core/session_result.hpp>
#include <healthcam/core/trend_aggregator.hpp>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace healthcam::app {

enum class SessionState {
  Idle,
  Armed,     // countdown running
  Captured,  // result available
  Aborted,   // user quit
};

[[nodiscard]] std::string_view state_name(SessionState state) noexcept;

/// A frame seen during the countdown with its primary region.
struct CaptureCandidate {
  healthcam::core::Frame frame;
  healthcam::core::DetectedRegion region;
};

/// Orders candidates by primary-region area.
struct SmallerRegion {
  bool operator()(const CaptureCandidate& a, const CaptureCandidate& b) const noexcept {
    return a.region.bbox.area() < b.region.bbox.area();
  }
};

/// Interactive one-shot capture: Idle -> Armed (countdown) -> Captured.
///
/// While armed every frame is run through detection and the frame with the
/// largest primary region so far is kept (a later frame replaces it only if
/// strictly larger). When the countdown expires the kept frame is analysed
/// once, synchronously, and the result is enqueued for persistence exactly
/// once. If no region was seen during the countdown the session returns to
/// Idle with NoFaceDetected as last_failure() and produces nothing.
/// quit() from Idle or Armed ends in Aborted.
///
/// Driven from the render thread; the collaborators in \p stages must not be
/// shared with the analysis worker.
class CaptureSession {
 public:
  using Clock = std::chrono::steady_clock;
  using CapturedCallback = std::function<void(const healthcam::core::SessionResult&)>;

  CaptureSession(AnalysisStages stages,
                 PersistenceQueue& queue,
                 std::chrono::duration<double> countdown,
                 std::string session_id);

  /// Idle -> Armed, countdown starting at \p now. From Captured the previous
  /// result is discarded first. Returns false in Armed or Aborted.
  bool trigger(Clock::time_point now);

  /// Feeds one live frame; completes the session once the countdown elapsed.
  SessionState on_frame(const healthcam::core::Frame& frame, Clock::time_point now);

  /// Idle/Armed -> Aborted. No effect once Captured.
  void quit();

  /// Captured -> Idle, keeping nothing. Returns false in other states.
  bool reset();

  [[nodiscard]] SessionState state() const noexcept { return state_; }

  /// Seconds left while Armed.
  [[nodiscard]] std::optional<double> remaining(Clock::time_point now) const;

  [[nodiscard]] const std::optional<healthcam::core::SessionResult>& result() const noexcept {
    return result_;
  }

  /// Why the last countdown produced no result.
  [[nodiscard]] std::optional<healthcam::core::PipelineError> last_failure() const noexcept {
    return last_failure_;
  }

  void set_on_captured(CapturedCallback callback) { on_captured_ = std::move(callback); }

 private:
  void offer(const healthcam::core::Frame& frame);
  void complete();

  AnalysisStages stages_;
  PersistenceQueue& queue_;
  std::chrono::duration<double> countdown_;
  std::string session_id_;

  SessionState state_{SessionState::Idle};
  Clock::time_point armed_at_{};
  healthcam::core::BestOf<CaptureCandidate, SmallerRegion> best_;
  healthcam::core::TrendAggregator trends_;
  std::optional<healthcam::core::SessionResult> result_;
  std::optional<healthcam::core::PipelineError> last_failure_;
  CapturedCallback on_captured_;
};

}  // namespace healthcam::app
