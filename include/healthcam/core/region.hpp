#pragma once

#include <optional>
#include <span>

namespace healthcam::core {

/// Axis-aligned bounding box in frame pixel coordinates.
struct BBox {
  float x{0.f};
  float y{0.f};
  float w{0.f};
  float h{0.f};

  [[nodiscard]] float area() const noexcept { return w * h; }
};

/// One detected subject: location and detector confidence in [0, 1].
struct DetectedRegion {
  BBox bbox{};
  float confidence{0.f};
};

/// Picks the region with the largest bounding-box area.
/// Ties go to the region seen first in \p regions; the tie-break is arbitrary
/// and only keeps the choice deterministic for a given detector output order.
/// Returns nullopt when \p regions is empty.
[[nodiscard]] std::optional<DetectedRegion> select_primary_region(
    std::span<const DetectedRegion> regions);

}  // namespace healthcam::core
