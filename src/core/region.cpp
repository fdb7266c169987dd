#include <healthcam/core/region.hpp>

namespace healthcam::core {

std::optional<DetectedRegion> select_primary_region(
    std::span<const DetectedRegion> regions) {
  const DetectedRegion* best = nullptr;
  for (const auto& region : regions) {
    // Strictly greater: an equal area never displaces an earlier region.
    if (best == nullptr || region.bbox.area() > best->bbox.area()) {
      best = &region;
    }
  }
  if (best == nullptr) return std::nullopt;
  return *best;
}

}  // namespace healthcam::core
