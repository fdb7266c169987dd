#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace healthcam::core {

/// A single measured value: a scalar (distance, ratio) or a vector sample
/// (e.g. an HSV colour sample).
using MeasurementValue = std::variant<double, std::vector<double>>;

/// Named values of one measurement group ("metrics", "symmetry", "skin", ...).
using MeasurementGroup = std::map<std::string, MeasurementValue>;

/// Measurements produced for the primary region of one frame.
/// Groups can be missing when the extractor could not compute them
/// (e.g. the region is too small); consumers must check before use.
struct MeasurementBundle {
  std::map<std::string, MeasurementGroup> groups;

  void set(const std::string& group, const std::string& key, MeasurementValue value);

  [[nodiscard]] bool has_group(const std::string& group) const;
  [[nodiscard]] std::optional<double> scalar(const std::string& group,
                                             const std::string& key) const;
  [[nodiscard]] std::optional<std::vector<double>> vector(const std::string& group,
                                                          const std::string& key) const;
  [[nodiscard]] bool empty() const noexcept { return groups.empty(); }
};

}  // namespace healthcam::core
