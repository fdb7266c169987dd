#include <healthcam/core/error.hpp>

namespace healthcam::core {

std::string_view error_name(PipelineError error) noexcept {
  switch (error) {
    case PipelineError::None:
      return "None";
    case PipelineError::InvalidFrame:
      return "InvalidFrame";
    case PipelineError::InvalidConfig:
      return "InvalidConfig";
    case PipelineError::DeviceUnavailable:
      return "DeviceUnavailable";
    case PipelineError::CaptureError:
      return "CaptureError";
    case PipelineError::NoFaceDetected:
      return "NoFaceDetected";
    case PipelineError::DetectionFailed:
      return "DetectionFailed";
    case PipelineError::ExtractionFailed:
      return "ExtractionFailed";
    case PipelineError::ScoringFailed:
      return "ScoringFailed";
    case PipelineError::StorageError:
      return "StorageError";
    case PipelineError::UnsupportedFormat:
      return "UnsupportedFormat";
  }
  return "Unknown";
}

}  // namespace healthcam::core
