/**
 * healthcam-cli: Live face-health analysis from a camera.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/healthcam_cli [--config path] [--mode continuous|session] [--camera N]
 *        ./build/healthcam_cli --view data/health_analysis_<timestamp>.json
 * Keys:  q/ESC quit, SPACE start capture countdown (session mode), o toggle overlay.
 */

#include <healthcam/app/collaborators.hpp>
#include <healthcam/app/config.hpp>
#include <healthcam/app/realtime_analyzer.hpp>
#include <healthcam/core/assessment.hpp>
#include <healthcam/core/error.hpp>
#include <healthcam/storage/file_storage_backend.hpp>
#include <healthcam/vision/opencv_capture_source.hpp>
#include <healthcam/vision/opencv_window.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

std::atomic<healthcam::app::RealtimeAnalyzer*> g_analyzer{nullptr};

void on_signal(int) {
  if (auto* analyzer = g_analyzer.load()) analyzer->request_stop();
}

int view_file(const std::string& path) {
  healthcam::storage::FileStorageBackend storage;
  auto records = storage.load(path);
  if (!records) {
    std::cerr << "Cannot load " << path << ": " << healthcam::core::error_name(records.error())
              << "\n";
    return 1;
  }
  std::cout << records->size() << " records in " << path << "\n";
  for (const auto& r : *records) {
    std::cout << r.timestamp << " frame=" << r.frame_id << " status="
              << healthcam::core::status_name(r.status);
    if (r.score) std::cout << " score=" << *r.score;
    std::cout << " indicators=" << r.indicators.values.size() << "\n";
    for (const auto& rec : r.recommendations) {
      std::cout << "  - " << rec << "\n";
    }
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string mode_override;
  std::string camera_override;
  std::string output_override;
  std::string format_override;
  std::string view_path;
  bool force_cpu = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--mode" && i + 1 < argc) {
      mode_override = argv[++i];
    } else if (arg == "--camera" && i + 1 < argc) {
      camera_override = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      output_override = argv[++i];
    } else if (arg == "--format" && i + 1 < argc) {
      format_override = argv[++i];
    } else if (arg == "--view" && i + 1 < argc) {
      view_path = argv[++i];
    } else if (arg == "--cpu") {
      force_cpu = true;
    } else if (arg == "--help" || arg == "-h") {
      std::cout << "Usage: healthcam_cli [options]\n"
                << "  --config <path>   Config (key=value file); default: built-in\n"
                << "  --mode <mode>     continuous | session (countdown capture)\n"
                << "  --camera <index>  Camera device index\n"
                << "  --output <dir>    Output directory for persisted results\n"
                << "  --format <fmt>    json | csv | spreadsheet\n"
                << "  --cpu             Disable GPU acceleration\n"
                << "  --view <file>     Print a persisted results file and exit\n";
      return 0;
    } else {
      std::cerr << "Unknown argument " << arg << " (see --help)\n";
      return 1;
    }
  }

  if (!view_path.empty()) {
    return view_file(view_path);
  }

  healthcam::app::AppConfig cfg = config_path.empty() ? healthcam::app::default_config()
                                                      : healthcam::app::load_config(config_path);
  healthcam::app::apply_log_level(cfg.log_level);

  if (!mode_override.empty()) {
    if (mode_override == "continuous") {
      cfg.mode = healthcam::app::RunMode::Continuous;
    } else if (mode_override == "session") {
      cfg.mode = healthcam::app::RunMode::Session;
    } else {
      std::cerr << "Unknown --mode " << mode_override << " (use continuous or session)\n";
      return 1;
    }
  }
  if (!camera_override.empty()) {
    try {
      cfg.device_index = std::stoi(camera_override);
    } catch (const std::exception&) {
      std::cerr << "--camera expects a device index\n";
      return 1;
    }
  }
  if (!output_override.empty()) cfg.output_dir = output_override;
  if (!format_override.empty()) {
    const auto format = healthcam::storage::parse_format(format_override);
    if (!format) {
      std::cerr << "Unknown --format " << format_override << " (use json, csv or spreadsheet)\n";
      return 1;
    }
    cfg.output_format = *format;
  }
  if (force_cpu) cfg.use_gpu = false;

  if (auto valid = healthcam::app::validate_config(cfg); !valid) {
    std::cerr << "Invalid configuration\n";
    return 1;
  }

  try {
    healthcam::app::RealtimeAnalyzer analyzer(
        cfg, std::make_unique<healthcam::vision::OpenCvCaptureSource>(),
        std::make_unique<healthcam::vision::OpenCvWindow>(cfg.window_title),
        healthcam::app::make_pipeline_factory(cfg),
        std::make_unique<healthcam::storage::FileStorageBackend>());

    g_analyzer.store(&analyzer);
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    auto summary = analyzer.run();
    g_analyzer.store(nullptr);
    if (!summary) {
      std::cerr << "Pipeline error: " << healthcam::core::error_name(summary.error()) << "\n";
      return 1;
    }
    std::cout << "Processed " << summary->frames_read << " frames, " << summary->results
              << " results, " << summary->records_saved << " records saved\n";
    if (summary->records_unsaved > 0) {
      std::cerr << summary->records_unsaved << " records could not be saved\n";
      return 2;
    }
  } catch (const std::exception& e) {
    g_analyzer.store(nullptr);
    spdlog::error("Fatal: {}", e.what());
    return 1;
  }
  return 0;
}
