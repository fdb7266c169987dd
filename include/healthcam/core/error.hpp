#pragma once

#include <string_view>

namespace healthcam::core {

/// Pipeline error codes; used with std::expected for recoverable failures.
enum class PipelineError {
  None = 0,
  InvalidFrame,
  InvalidConfig,
  DeviceUnavailable,  // fatal at startup
  CaptureError,       // per read; ends the render loop
  NoFaceDetected,
  DetectionFailed,
  ExtractionFailed,
  ScoringFailed,
  StorageError,       // per flush; retried with retained data
  UnsupportedFormat,
};

/// Stable name for logs and CLI output.
[[nodiscard]] std::string_view error_name(PipelineError error) noexcept;

}  // namespace healthcam::core
