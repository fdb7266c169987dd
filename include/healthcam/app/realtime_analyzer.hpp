#pragma once

#include <healthcam/app/collaborators.hpp>
#include <healthcam/app/config.hpp>
#include <healthcam/core/error.hpp>
#include <healthcam/storage/storage_backend.hpp>
#include <healthcam/vision/capture_source.hpp>
#include <healthcam/vision/frame_display.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>

namespace healthcam::app {

/// Summary of a finished run.
struct RunSummary {
  std::uint64_t frames_read{0};
  std::uint64_t results{0};
  std::size_t records_saved{0};
  std::size_t records_unsaved{0};
};

/// Owns the pipeline for one run: the render loop on the calling thread, the
/// analysis worker (continuous mode) and the persistence flusher on their own
/// threads, and the capture device.
///
/// Shutdown: the running flag is cleared (quit key, capture error or
/// request_stop()). The worker gets shutdown_timeout_ms to finish its cycle,
/// then the flusher gets its own shutdown_timeout_ms for the final flush, then
/// the device is released. A worker still inside a collaborator call at that
/// point is detached and its cycle is lost; it owns what it still uses, so
/// run() returns without waiting on it. The flusher is always joined, since
/// saved_records must be final when run() returns.
class RealtimeAnalyzer {
 public:
  RealtimeAnalyzer(AppConfig config,
                   std::unique_ptr<healthcam::vision::ICaptureSource> capture,
                   std::unique_ptr<healthcam::vision::IFrameDisplay> display,
                   PipelineFactory factory,
                   std::unique_ptr<healthcam::storage::IStorageBackend> storage);

  /// Blocks until the run ends. DeviceUnavailable if the camera cannot be
  /// opened, CaptureError if a read fails mid-run.
  [[nodiscard]] std::expected<RunSummary, healthcam::core::PipelineError> run();

  /// Safe from any thread.
  void request_stop() noexcept { running_.store(false); }

  [[nodiscard]] bool running() const noexcept { return running_.load(); }

 private:
  AppConfig config_;
  std::unique_ptr<healthcam::vision::ICaptureSource> capture_;
  std::unique_ptr<healthcam::vision::IFrameDisplay> display_;
  PipelineFactory factory_;
  std::unique_ptr<healthcam::storage::IStorageBackend> storage_;
  std::atomic<bool> running_{false};
};

}  // namespace healthcam::app
