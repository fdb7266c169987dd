#pragma once

#include <healthcam/core/error.hpp>
#include <healthcam/core/frame.hpp>
#include <expected>
#include <string>

namespace healthcam::vision {

/// Pull-based camera wrapper owning the device handle.
/// open() fails with DeviceUnavailable; read_frame() fails with CaptureError on
/// a read failure (disconnect, end of stream). No internal retry: the caller
/// decides whether a failed read ends its loop. close() is idempotent.
class ICaptureSource {
 public:
  virtual ~ICaptureSource() = default;

  [[nodiscard]] virtual std::expected<void, healthcam::core::PipelineError> open(int device_id) = 0;

  [[nodiscard]] virtual std::expected<healthcam::core::Frame, healthcam::core::PipelineError>
  read_frame() = 0;

  virtual void close() = 0;

  [[nodiscard]] virtual bool is_open() const = 0;

  /// Capture API in use, for logs ("V4L2", "MSMF", ...).
  [[nodiscard]] virtual std::string backend_name() const { return "unknown"; }
};

}  // namespace healthcam::vision
