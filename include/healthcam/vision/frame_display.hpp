#pragma once

#include <healthcam/core/frame.hpp>

namespace healthcam::vision {

/// Display surface driven by the render loop. Implementations own UI resources
/// and must be used from the thread that created them.
class IFrameDisplay {
 public:
  virtual ~IFrameDisplay() = default;

  virtual void show(const healthcam::core::Frame& frame) = 0;

  /// Waits up to \p wait_ms for a key press; -1 when none.
  [[nodiscard]] virtual int poll_key(int wait_ms) = 0;

  virtual void close() = 0;
};

}  // namespace healthcam::vision
