#include <healthcam/core/indicator.hpp>

namespace healthcam::core {

void IndicatorSet::set(std::string_view name, IndicatorValue value) {
  auto it = values.find(name);
  if (it == values.end()) {
    values.emplace(std::string(name), std::move(value));
  } else {
    it->second = std::move(value);
  }
}

bool IndicatorSet::contains(std::string_view name) const {
  return values.find(name) != values.end();
}

std::optional<double> IndicatorSet::numeric(std::string_view name) const {
  const auto it = values.find(name);
  if (it == values.end()) return std::nullopt;
  if (const auto* d = std::get_if<double>(&it->second)) return *d;
  if (const auto* s = std::get_if<StructuredIndicator>(&it->second)) return s->value;
  return std::nullopt;
}

std::optional<std::string> IndicatorSet::label(std::string_view name) const {
  const auto it = values.find(name);
  if (it == values.end()) return std::nullopt;
  if (const auto* text = std::get_if<std::string>(&it->second)) return *text;
  return std::nullopt;
}

}  // namespace healthcam::core
