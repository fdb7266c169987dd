#include <healthcam/core/measurement.hpp>

namespace healthcam::core {

void MeasurementBundle::set(const std::string& group, const std::string& key,
                            MeasurementValue value) {
  groups[group][key] = std::move(value);
}

bool MeasurementBundle::has_group(const std::string& group) const {
  return groups.find(group) != groups.end();
}

std::optional<double> MeasurementBundle::scalar(const std::string& group,
                                                const std::string& key) const {
  const auto g = groups.find(group);
  if (g == groups.end()) return std::nullopt;
  const auto v = g->second.find(key);
  if (v == g->second.end()) return std::nullopt;
  if (const auto* d = std::get_if<double>(&v->second)) return *d;
  return std::nullopt;
}

std::optional<std::vector<double>> MeasurementBundle::vector(
    const std::string& group, const std::string& key) const {
  const auto g = groups.find(group);
  if (g == groups.end()) return std::nullopt;
  const auto v = g->second.find(key);
  if (v == g->second.end()) return std::nullopt;
  if (const auto* values = std::get_if<std::vector<double>>(&v->second)) return *values;
  return std::nullopt;
}

}  // namespace healthcam::core
