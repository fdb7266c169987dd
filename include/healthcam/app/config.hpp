#pragma once

#include <healthcam/core/error.hpp>
#include <healthcam/storage/storage_backend.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace healthcam::app {

/// Continuous analysis, or interactive one-shot countdown capture.
enum class RunMode {
  Continuous,
  Session,
};

/// Face detector implementation: Haar cascade, ONNX model, or scripted mock.
enum class DetectorType {
  Cascade,
  Onnx,
  Mock,
};

/// Application configuration: device, detector, persistence, timing.
struct AppConfig {
  RunMode mode{RunMode::Continuous};
  int device_index{0};

  std::string output_dir{"data"};
  healthcam::storage::OutputFormat output_format{healthcam::storage::OutputFormat::Json};
  double flush_interval_s{10.0};

  bool use_gpu{true};
  std::uint32_t frame_skip{1};  // render every Nth captured frame
  bool overlay{true};

  DetectorType detector{DetectorType::Cascade};
  std::string cascade_path;
  std::string eye_cascade_path;
  std::string model_path;
  float confidence_threshold{0.5f};

  double countdown_s{3.0};
  std::uint32_t idle_sleep_ms{10};
  std::uint32_t flush_poll_ms{100};
  std::uint32_t shutdown_timeout_ms{2000};

  std::string window_title{"Health Analysis"};
  std::string log_level{"info"};
};

/// Load config from a simple key=value file (one per line, '#' comments) on
/// top of default_config(). Unknown keys are ignored; malformed values are
/// logged and left at their default.
AppConfig load_config(const std::string& path);

/// Default config when no file is provided.
AppConfig default_config();

/// InvalidConfig if a value is out of range (frame_skip 0, non-positive
/// interval or countdown, ONNX detector without a model path).
[[nodiscard]] std::expected<void, healthcam::core::PipelineError> validate_config(
    const AppConfig& config);

/// Sets the spdlog level from a name (trace, debug, info, warn, error, off).
void apply_log_level(const std::string& level);

[[nodiscard]] std::string_view mode_name(RunMode mode) noexcept;

}  // namespace healthcam::app
