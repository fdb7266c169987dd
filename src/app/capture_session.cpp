#include <healthcam/app/capture_session.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace healthcam::app {

namespace hc = healthcam::core;

std::string_view state_name(SessionState state) noexcept {
  switch (state) {
    case SessionState::Idle:
      return "Idle";
    case SessionState::Armed:
      return "Armed";
    case SessionState::Captured:
      return "Captured";
    case SessionState::Aborted:
      return "Aborted";
  }
  return "Unknown";
}

CaptureSession::CaptureSession(AnalysisStages stages, PersistenceQueue& queue,
                               std::chrono::duration<double> countdown, std::string session_id)
    : stages_(stages),
      queue_(queue),
      countdown_(countdown),
      session_id_(std::move(session_id)) {}

bool CaptureSession::trigger(Clock::time_point now) {
  if (state_ == SessionState::Captured) reset();
  if (state_ != SessionState::Idle) return false;
  best_.reset();
  last_failure_.reset();
  armed_at_ = now;
  state_ = SessionState::Armed;
  spdlog::info("Capture countdown started ({:.1f}s)", countdown_.count());
  return true;
}

SessionState CaptureSession::on_frame(const hc::Frame& frame, Clock::time_point now) {
  if (state_ != SessionState::Armed) return state_;
  if (now - armed_at_ >= countdown_) {
    complete();
  } else {
    offer(frame);
  }
  return state_;
}

void CaptureSession::quit() {
  if (state_ == SessionState::Idle || state_ == SessionState::Armed) {
    best_.reset();
    state_ = SessionState::Aborted;
    spdlog::info("Capture session aborted");
  }
}

bool CaptureSession::reset() {
  if (state_ != SessionState::Captured) return false;
  result_.reset();
  state_ = SessionState::Idle;
  return true;
}

std::optional<double> CaptureSession::remaining(Clock::time_point now) const {
  if (state_ != SessionState::Armed) return std::nullopt;
  const std::chrono::duration<double> elapsed = now - armed_at_;
  return std::max(0.0, (countdown_ - elapsed).count());
}

void CaptureSession::offer(const hc::Frame& frame) {
  auto region = detect_primary(stages_.detector, frame);
  if (region) {
    best_.offer(CaptureCandidate{frame, *region});
  } else if (region.error() != hc::PipelineError::NoFaceDetected) {
    spdlog::debug("Countdown frame {} skipped: {}", frame.sequence(),
                  hc::error_name(region.error()));
  }
}

void CaptureSession::complete() {
  auto best = best_.take();
  if (!best) {
    last_failure_ = hc::PipelineError::NoFaceDetected;
    state_ = SessionState::Idle;
    spdlog::info("Capture failed: no face detected during the countdown");
    return;
  }

  auto result = analyse_region(stages_, trends_, best->frame, best->region, session_id_);
  if (!result) {
    last_failure_ = result.error();
    state_ = SessionState::Idle;
    spdlog::warn("Capture analysis failed: {}", hc::error_name(result.error()));
    return;
  }
  result_ = std::move(*result);

  state_ = SessionState::Captured;
  queue_.enqueue(*result_);
  spdlog::info("Captured frame {}: {}", result_->frame_id, hc::status_name(result_->status));
  if (on_captured_) on_captured_(*result_);
}

}  // namespace healthcam::app
