#include <healthcam/app/analysis_worker.hpp>
#include <healthcam/core/error.hpp>
#include <spdlog/spdlog.h>
#include <exception>
#include <thread>

namespace healthcam::app {

namespace hc = healthcam::core;

AnalysisWorker::AnalysisWorker(const hc::LatestSlot<hc::Frame>& frames,
                               hc::LatestSlot<hc::SessionResult>& results,
                               PersistenceQueue& queue, AnalysisStages stages,
                               std::string session_id, std::chrono::milliseconds idle_sleep)
    : frames_(frames),
      results_(results),
      queue_(queue),
      stages_(stages),
      session_id_(std::move(session_id)),
      idle_sleep_(idle_sleep) {}

void AnalysisWorker::run(const std::atomic<bool>& running) {
  spdlog::info("Analysis worker started ({})", stages_.detector.backend_name());
  while (running.load()) {
    if (run_once() == CycleOutcome::NoFrame) {
      std::this_thread::sleep_for(idle_sleep_);
    }
  }
  spdlog::info("Analysis worker stopped after {} results", status_.published.load());
}

CycleOutcome AnalysisWorker::run_once() {
  auto frame = frames_.take_newer(seen_version_);
  if (!frame) return CycleOutcome::NoFrame;

  const auto start = std::chrono::steady_clock::now();
  CycleOutcome outcome = CycleOutcome::Failed;
  try {
    auto result = run_analysis_cycle(stages_, trends_, *frame, session_id_);
    if (result) {
      status_.face_detected.store(true);
      results_.publish(*result);
      queue_.enqueue(std::move(*result));
      status_.published.fetch_add(1);
      outcome = CycleOutcome::Published;
    } else if (result.error() == hc::PipelineError::NoFaceDetected) {
      status_.face_detected.store(false);
      outcome = CycleOutcome::NoFace;
    } else {
      spdlog::warn("Analysis of frame {} failed: {}", frame->sequence(),
                   hc::error_name(result.error()));
    }
  } catch (const std::exception& e) {
    spdlog::warn("Analysis of frame {} threw: {}", frame->sequence(), e.what());
  }
  if (outcome == CycleOutcome::Failed) {
    status_.face_detected.store(false);
    status_.failed.fetch_add(1);
  }

  rate_.add(std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count());
  status_.fps.store(rate_.rate());
  return outcome;
}

}  // namespace healthcam::app
