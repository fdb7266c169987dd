#pragma once

#include <healthcam/core/frame.hpp>
#include <healthcam/core/session_result.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace healthcam::vision {

/// Overlay colour, BGR.
struct OverlayColor {
  std::uint8_t b{0};
  std::uint8_t g{0};
  std::uint8_t r{0};

  friend bool operator==(const OverlayColor&, const OverlayColor&) = default;
};

/// Red below \p yellow_threshold, shading to yellow, then to green at
/// \p green_threshold and above. \p value is on a 0-1 scale, higher is better.
[[nodiscard]] OverlayColor indicator_color(double value, double yellow_threshold = 0.4,
                                           double green_threshold = 0.7) noexcept;

/// Everything the render loop draws over a display frame.
struct OverlayState {
  /// Latest published analysis result; may be several cycles stale.
  std::optional<healthcam::core::SessionResult> result;
  bool show_results{true};
  double capture_fps{0.0};
  double analysis_fps{0.0};
  std::string backend;
  /// Whether the most recent analysed frame had a primary face.
  bool face_detected{false};
  /// Seconds left in an armed capture countdown.
  std::optional<double> countdown_remaining;
  /// Status line for the capture session (e.g. "Press SPACE to capture").
  std::string session_message;
};

/// BGR copy of \p frame with \p state drawn on it. Frames in an unsupported
/// format come back unchanged.
[[nodiscard]] healthcam::core::Frame render_overlay(const healthcam::core::Frame& frame,
                                                    const OverlayState& state);

}  // namespace healthcam::vision
