#include <healthcam/app/realtime_analyzer.hpp>
#include <healthcam/app/analysis_worker.hpp>
#include <healthcam/app/capture_session.hpp>
#include <healthcam/app/persistence.hpp>
#include <healthcam/app/render_loop.hpp>
#include <healthcam/core/latest_slot.hpp>
#include <healthcam/storage/report_writer.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <thread>

namespace healthcam::app {

namespace hc = healthcam::core;

namespace {

/// Everything the analysis worker touches. The worker thread holds a reference
/// so the state outlives run() when the worker misses the shutdown budget and
/// is detached.
struct SharedPipeline {
  std::unique_ptr<healthcam::vision::IFaceDetector> detector;
  std::unique_ptr<healthcam::vision::IFeatureExtractor> extractor;
  std::unique_ptr<healthcam::vision::IIndicatorScorer> scorer;
  hc::LatestSlot<hc::Frame> frames;
  hc::LatestSlot<hc::SessionResult> results;
  PersistenceQueue queue;
  std::atomic<bool> running{true};
  std::optional<AnalysisWorker> worker;
  std::promise<void> worker_done;

  [[nodiscard]] AnalysisStages stages() { return {*detector, *extractor, *scorer}; }
};

}  // namespace

RealtimeAnalyzer::RealtimeAnalyzer(AppConfig config,
                                   std::unique_ptr<healthcam::vision::ICaptureSource> capture,
                                   std::unique_ptr<healthcam::vision::IFrameDisplay> display,
                                   PipelineFactory factory,
                                   std::unique_ptr<healthcam::storage::IStorageBackend> storage)
    : config_(std::move(config)),
      capture_(std::move(capture)),
      display_(std::move(display)),
      factory_(std::move(factory)),
      storage_(std::move(storage)) {}

std::expected<RunSummary, hc::PipelineError> RealtimeAnalyzer::run() {
  const std::string session_id = hc::make_timestamp();
  auto pipeline = std::make_shared<SharedPipeline>();

  // One collaborator set per task.
  pipeline->detector = factory_.make_detector();
  pipeline->extractor = factory_.make_extractor();
  pipeline->scorer = factory_.make_scorer();

  FlushPolicy policy;
  policy.output_dir = config_.output_dir;
  policy.format = config_.output_format;
  policy.interval = std::chrono::duration<double>(config_.flush_interval_s);
  Flusher flusher(pipeline->queue, *storage_, policy);

  if (auto opened = capture_->open(config_.device_index); !opened) {
    spdlog::error("Camera {} unavailable", config_.device_index);
    return std::unexpected(hc::PipelineError::DeviceUnavailable);
  }

  std::optional<CaptureSession> session;
  std::uint64_t captures = 0;
  StampedNamer report_names;
  if (config_.mode == RunMode::Continuous) {
    pipeline->worker.emplace(pipeline->frames, pipeline->results, pipeline->queue,
                             pipeline->stages(), session_id,
                             std::chrono::milliseconds(config_.idle_sleep_ms));
  } else {
    session.emplace(pipeline->stages(), pipeline->queue,
                    std::chrono::duration<double>(config_.countdown_s), session_id);
    session->set_on_captured([&](const hc::SessionResult& result) {
      ++captures;
      auto path = report_names.next(config_.output_dir, "health_report_", result.timestamp);
      path += ".md";
      if (auto written = healthcam::storage::write_health_report(result, path)) {
        spdlog::info("Health report written to {}", written->string());
      } else {
        spdlog::warn("Health report {} not written", path.string());
      }
    });
  }

  RenderOptions options;
  options.frame_skip = config_.frame_skip;
  options.overlay = config_.overlay;
  options.backend = pipeline->detector->backend_name();
  RenderLoop render(*capture_, *display_, pipeline->frames, pipeline->results, options,
                    session ? &*session : nullptr,
                    pipeline->worker ? &pipeline->worker->status() : nullptr);

  running_.store(true);
  spdlog::info("Pipeline started ({} mode, detector backend {})", mode_name(config_.mode),
               options.backend);

  std::future<void> worker_future = pipeline->worker_done.get_future();
  std::thread worker_thread;
  if (pipeline->worker) {
    worker_thread = std::thread([pipeline] {
      pipeline->worker->run(pipeline->running);
      pipeline->worker_done.set_value();
    });
  } else {
    pipeline->worker_done.set_value();
  }

  // The flusher outlives the worker so the worker's last result is flushed.
  std::atomic<bool> flushing{true};
  std::promise<void> flusher_done;
  std::future<void> flusher_future = flusher_done.get_future();
  std::thread flusher_thread([&] {
    flusher.run(flushing, std::chrono::milliseconds(config_.flush_poll_ms));
    flusher_done.set_value();
  });

  std::expected<void, hc::PipelineError> rendered;
  std::exception_ptr render_failure;
  try {
    rendered = render.run(running_);
  } catch (...) {
    render_failure = std::current_exception();
  }
  running_.store(false);
  pipeline->running.store(false);

  // Worker and flusher each get the full budget, one after the other.
  const std::chrono::milliseconds budget(config_.shutdown_timeout_ms);
  const bool worker_stopped = worker_future.wait_for(budget) == std::future_status::ready;
  if (!worker_stopped) {
    spdlog::warn("Analysis worker still busy after {} ms; abandoning its current cycle",
                 budget.count());
  }
  flushing.store(false);
  if (flusher_future.wait_for(budget) != std::future_status::ready) {
    spdlog::warn("Final flush still running after {} ms; waiting for it", budget.count());
  }
  capture_->close();
  flusher_thread.join();
  if (worker_thread.joinable()) {
    if (worker_stopped) {
      worker_thread.join();
    } else {
      worker_thread.detach();
    }
  }

  RunSummary summary;
  summary.frames_read = render.frames_read();
  summary.results = pipeline->worker ? pipeline->worker->status().published.load() : captures;
  if (!pipeline->queue.empty()) {
    // Enqueued after the final flush by a worker that missed its budget.
    (void)flusher.flush_now();
  }
  summary.records_saved = flusher.saved_records();
  summary.records_unsaved =
      summary.results > summary.records_saved ? summary.results - summary.records_saved : 0;
  spdlog::info("Pipeline stopped: {} frames, {} results, {} records saved", summary.frames_read,
               summary.results, summary.records_saved);

  if (render_failure) {
    std::rethrow_exception(render_failure);
  }
  if (!rendered) {
    return std::unexpected(rendered.error());
  }
  return summary;
}

}  // namespace healthcam::app
