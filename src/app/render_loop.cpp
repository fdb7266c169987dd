#include <healthcam/app/render_loop.hpp>
#include <healthcam/vision/overlay.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

namespace healthcam::app {

namespace hc = healthcam::core;

RenderLoop::RenderLoop(healthcam::vision::ICaptureSource& capture,
                       healthcam::vision::IFrameDisplay& display,
                       hc::LatestSlot<hc::Frame>& frames,
                       const hc::LatestSlot<hc::SessionResult>& results, RenderOptions options,
                       CaptureSession* session, const AnalysisStatus* analysis)
    : capture_(capture),
      display_(display),
      frames_(frames),
      results_(results),
      options_(std::move(options)),
      session_(session),
      analysis_(analysis) {
  if (options_.frame_skip == 0) options_.frame_skip = 1;
}

std::expected<void, hc::PipelineError> RenderLoop::run(std::atomic<bool>& running) {
  std::expected<void, hc::PipelineError> status;
  while (running.load()) {
    status = step(running);
    if (!status) break;
  }
  display_.close();
  return status;
}

std::expected<void, hc::PipelineError> RenderLoop::step(std::atomic<bool>& running) {
  auto frame = capture_.read_frame();
  if (!frame) {
    spdlog::error("Camera read failed ({}); stopping", hc::error_name(frame.error()));
    running.store(false);
    return std::unexpected(hc::PipelineError::CaptureError);
  }
  ++frames_read_;

  const auto now = std::chrono::steady_clock::now();
  if (frames_read_ > 1) {
    rate_.add(std::chrono::duration<double>(now - last_cycle_).count());
  }
  last_cycle_ = now;

  frames_.publish(*frame);
  if (session_) session_->on_frame(*frame, now);

  if (frames_read_ % options_.frame_skip == 0) {
    if (options_.overlay) {
      healthcam::vision::OverlayState overlay;
      if (session_) {
        overlay.result = session_->result();
        overlay.face_detected = session_->result().has_value();
        overlay.countdown_remaining = session_->remaining(now);
        overlay.session_message = session_message();
      } else {
        overlay.result = results_.take_latest();
      }
      if (analysis_) {
        overlay.analysis_fps = analysis_->fps.load();
        overlay.face_detected = analysis_->face_detected.load();
      }
      overlay.capture_fps = rate_.rate();
      overlay.backend = options_.backend;
      display_.show(healthcam::vision::render_overlay(*frame, overlay));
    } else {
      display_.show(*frame);
    }
    ++frames_shown_;
  }

  handle_key(display_.poll_key(options_.key_wait_ms), running);
  return {};
}

void RenderLoop::handle_key(int key, std::atomic<bool>& running) {
  switch (key) {
    case keys::kQuit:
    case keys::kEscape:
      if (session_) session_->quit();
      running.store(false);
      spdlog::info("Quit requested");
      break;
    case keys::kCapture:
      if (session_) session_->trigger(std::chrono::steady_clock::now());
      break;
    case keys::kToggleOverlay:
      options_.overlay = !options_.overlay;
      break;
    default:
      break;
  }
}

std::string RenderLoop::session_message() const {
  switch (session_->state()) {
    case SessionState::Idle:
      return session_->last_failure() ? "No face detected - press SPACE to try again"
                                      : "Press SPACE to capture";
    case SessionState::Armed:
      return "Hold still...";
    case SessionState::Captured:
      return "Captured - press SPACE for a new capture, Q to quit";
    case SessionState::Aborted:
      return {};
  }
  return {};
}

}  // namespace healthcam::app
