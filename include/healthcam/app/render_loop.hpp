#pragma once

#include <healthcam/app/analysis_worker.hpp>
#include <healthcam/app/capture_session.hpp>
#include <healthcam/core/error.hpp>
#include <healthcam/core/frame.hpp>
#include <healthcam/core/latest_slot.hpp>
#include <healthcam/core/rate_meter.hpp>
#include <healthcam/core/session_result.hpp>
#include <healthcam/vision/capture_source.hpp>
#include <healthcam/vision/frame_display.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string>

namespace healthcam::app {

struct RenderOptions {
  std::uint32_t frame_skip{1};  // display every Nth frame
  bool overlay{true};
  int key_wait_ms{1};
  std::string backend{"CPU"};
};

/// Keys handled by the render loop.
namespace keys {
inline constexpr int kQuit = 'q';
inline constexpr int kEscape = 27;
inline constexpr int kCapture = ' ';
inline constexpr int kToggleOverlay = 'o';
}  // namespace keys

/// Foreground loop: reads the camera at display cadence, publishes each frame
/// to the frame slot, draws the latest published result (possibly stale) and
/// performance counters, and handles keys. Quitting or a capture error clears
/// the shared running flag, which stops every other task.
///
/// Must run on the thread that owns the display.
class RenderLoop {
 public:
  /// \p session (session mode) and \p analysis (continuous mode) are optional.
  RenderLoop(healthcam::vision::ICaptureSource& capture,
             healthcam::vision::IFrameDisplay& display,
             healthcam::core::LatestSlot<healthcam::core::Frame>& frames,
             const healthcam::core::LatestSlot<healthcam::core::SessionResult>& results,
             RenderOptions options,
             CaptureSession* session = nullptr,
             const AnalysisStatus* analysis = nullptr);

  /// Runs until \p running is false. CaptureError if a read fails.
  [[nodiscard]] std::expected<void, healthcam::core::PipelineError> run(
      std::atomic<bool>& running);

  /// One cycle: read, publish, display, key handling.
  [[nodiscard]] std::expected<void, healthcam::core::PipelineError> step(
      std::atomic<bool>& running);

  [[nodiscard]] double capture_fps() const noexcept { return rate_.rate(); }
  [[nodiscard]] std::uint64_t frames_read() const noexcept { return frames_read_; }
  [[nodiscard]] std::uint64_t frames_shown() const noexcept { return frames_shown_; }
  [[nodiscard]] bool overlay_enabled() const noexcept { return options_.overlay; }

 private:
  void handle_key(int key, std::atomic<bool>& running);
  std::string session_message() const;

  healthcam::vision::ICaptureSource& capture_;
  healthcam::vision::IFrameDisplay& display_;
  healthcam::core::LatestSlot<healthcam::core::Frame>& frames_;
  const healthcam::core::LatestSlot<healthcam::core::SessionResult>& results_;
  RenderOptions options_;
  CaptureSession* session_;
  const AnalysisStatus* analysis_;

  healthcam::core::RateMeter rate_;
  std::chrono::steady_clock::time_point last_cycle_{};
  std::uint64_t frames_read_{0};
  std::uint64_t frames_shown_{0};
};

}  // namespace healthcam::app
