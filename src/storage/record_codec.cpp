#include <healthcam/storage/record_codec.hpp>
#include <healthcam/core/assessment.hpp>
#include <healthcam/core/history_window.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <charconv>
#include <map>
#include <optional>
#include <set>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <variant>

namespace healthcam::storage {

namespace hc = healthcam::core;
using nlohmann::json;

namespace {

constexpr std::string_view kListSeparator = "; ";
constexpr std::string_view kNoteSuffix = ".note";

const std::vector<std::string>& fixed_columns() {
  static const std::vector<std::string> columns{
      "timestamp", "frame_id", "session_id", "region_x", "region_y", "region_w", "region_h",
      "region_confidence", "score", "status", "recommendations", "notes"};
  return columns;
}

std::string join(const std::vector<std::string>& items, std::string_view sep) {
  std::string out;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out += sep;
    out += items[i];
  }
  return out;
}

std::vector<std::string> split(std::string_view text, std::string_view sep) {
  std::vector<std::string> out;
  if (text.empty()) return out;
  std::size_t start = 0;
  while (true) {
    const auto pos = text.find(sep, start);
    if (pos == std::string_view::npos) {
      out.emplace_back(text.substr(start));
      break;
    }
    out.emplace_back(text.substr(start, pos - start));
    start = pos + sep.size();
  }
  return out;
}

std::optional<double> parse_double(std::string_view text) {
  double value = 0.0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) return std::nullopt;
  return value;
}

std::optional<std::uint64_t> parse_u64(std::string_view text) {
  std::uint64_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) return std::nullopt;
  return value;
}

json indicator_to_json(const hc::IndicatorValue& value) {
  return std::visit(
      [](const auto& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, hc::StructuredIndicator>) {
          return json{{"value", v.value}, {"note", v.note}};
        } else {
          return json(v);
        }
      },
      value);
}

}  // namespace

json record_to_json(const hc::SessionResult& record) {
  json measurements = json::object();
  for (const auto& [group, values] : record.measurements.groups) {
    json g = json::object();
    for (const auto& [key, value] : values) {
      std::visit([&](const auto& v) { g[key] = v; }, value);
    }
    measurements[group] = std::move(g);
  }

  json indicators = json::object();
  for (const auto& [name, value] : record.indicators.values) {
    indicators[name] = indicator_to_json(value);
  }

  json trends = json::object();
  for (const auto& [metric, trend] : record.trends) {
    trends[metric] = std::string(hc::trend_name(trend));
  }

  const auto& b = record.region.bbox;
  return json{
      {"timestamp", record.timestamp},
      {"frame_id", record.frame_id},
      {"session_id", record.session_id},
      {"region", {{"x", b.x}, {"y", b.y}, {"w", b.w}, {"h", b.h},
                  {"confidence", record.region.confidence}}},
      {"measurements", std::move(measurements)},
      {"indicators", std::move(indicators)},
      {"notes", record.indicators.notes},
      {"score", record.score ? json(*record.score) : json(nullptr)},
      {"status", std::string(hc::status_name(record.status))},
      {"recommendations", record.recommendations},
      {"trends", std::move(trends)},
  };
}

std::expected<hc::SessionResult, hc::PipelineError> record_from_json(const json& j) {
  try {
    hc::SessionResult r;
    r.timestamp = j.at("timestamp").get<std::string>();
    r.frame_id = j.value("frame_id", std::uint64_t{0});
    r.session_id = j.value("session_id", std::string{});

    if (const auto it = j.find("region"); it != j.end() && it->is_object()) {
      r.region.bbox.x = it->value("x", 0.f);
      r.region.bbox.y = it->value("y", 0.f);
      r.region.bbox.w = it->value("w", 0.f);
      r.region.bbox.h = it->value("h", 0.f);
      r.region.confidence = it->value("confidence", 0.f);
    }

    if (const auto it = j.find("measurements"); it != j.end()) {
      for (const auto& [group, values] : it->items()) {
        for (const auto& [key, value] : values.items()) {
          if (value.is_array()) {
            r.measurements.set(group, key, value.get<std::vector<double>>());
          } else {
            r.measurements.set(group, key, value.get<double>());
          }
        }
      }
    }

    if (const auto it = j.find("indicators"); it != j.end()) {
      for (const auto& [name, value] : it->items()) {
        if (value.is_number()) {
          r.indicators.set(name, value.get<double>());
        } else if (value.is_string()) {
          r.indicators.set(name, value.get<std::string>());
        } else if (value.is_object()) {
          r.indicators.set(name, hc::StructuredIndicator{value.at("value").get<double>(),
                                                         value.value("note", std::string{})});
        } else {
          return std::unexpected(hc::PipelineError::StorageError);
        }
      }
    }
    r.indicators.notes = j.value("notes", std::vector<std::string>{});

    if (const auto it = j.find("score"); it != j.end() && it->is_number()) {
      r.score = it->get<double>();
    }
    const auto status = hc::parse_status(j.value("status", std::string{}));
    if (!status) return std::unexpected(hc::PipelineError::StorageError);
    r.status = *status;
    r.recommendations = j.value("recommendations", std::vector<std::string>{});

    if (const auto it = j.find("trends"); it != j.end()) {
      for (const auto& [metric, value] : it->items()) {
        if (const auto trend = hc::parse_trend(value.get<std::string>())) {
          r.trends.emplace(metric, *trend);
        }
      }
    }
    return r;
  } catch (const json::exception&) {
    return std::unexpected(hc::PipelineError::StorageError);
  }
}

FlatRow flatten_record(const hc::SessionResult& record) {
  FlatRow row;
  const auto& b = record.region.bbox;
  row.emplace_back("timestamp", record.timestamp);
  row.emplace_back("frame_id", std::to_string(record.frame_id));
  row.emplace_back("session_id", record.session_id);
  row.emplace_back("region_x", fmt::format("{}", b.x));
  row.emplace_back("region_y", fmt::format("{}", b.y));
  row.emplace_back("region_w", fmt::format("{}", b.w));
  row.emplace_back("region_h", fmt::format("{}", b.h));
  row.emplace_back("region_confidence", fmt::format("{}", record.region.confidence));
  row.emplace_back("score", record.score ? fmt::format("{}", *record.score) : std::string{});
  row.emplace_back("status", std::string(hc::status_name(record.status)));
  row.emplace_back("recommendations", join(record.recommendations, kListSeparator));
  row.emplace_back("notes", join(record.indicators.notes, kListSeparator));

  for (const auto& [group, values] : record.measurements.groups) {
    for (const auto& [key, value] : values) {
      std::string cell;
      if (const auto* d = std::get_if<double>(&value)) {
        cell = fmt::format("{}", *d);
      } else {
        cell = fmt::format("{}", fmt::join(std::get<std::vector<double>>(value), " "));
      }
      row.emplace_back("m." + group + "." + key, std::move(cell));
    }
  }
  for (const auto& [name, value] : record.indicators.values) {
    if (const auto* d = std::get_if<double>(&value)) {
      row.emplace_back("i." + name, fmt::format("{}", *d));
    } else if (const auto* s = std::get_if<std::string>(&value)) {
      row.emplace_back("i." + name, *s);
    } else {
      const auto& structured = std::get<hc::StructuredIndicator>(value);
      row.emplace_back("i." + name, fmt::format("{}", structured.value));
      row.emplace_back("i." + name + std::string(kNoteSuffix), structured.note);
    }
  }
  for (const auto& [metric, trend] : record.trends) {
    row.emplace_back("t." + metric, std::string(hc::trend_name(trend)));
  }
  return row;
}

std::vector<std::string> collect_columns(std::span<const FlatRow> rows) {
  std::vector<std::string> columns = fixed_columns();
  const std::set<std::string> fixed(columns.begin(), columns.end());
  std::set<std::string> extra;
  for (const auto& row : rows) {
    for (const auto& [column, value] : row) {
      if (!fixed.contains(column)) extra.insert(column);
    }
  }
  columns.insert(columns.end(), extra.begin(), extra.end());
  return columns;
}

std::expected<hc::SessionResult, hc::PipelineError> unflatten_record(
    std::span<const std::string> columns, std::span<const std::string> cells) {
  if (cells.size() > columns.size()) {
    return std::unexpected(hc::PipelineError::StorageError);
  }
  const auto fail = std::unexpected(hc::PipelineError::StorageError);

  hc::SessionResult r;
  // Structured indicators are split over two columns; join them at the end.
  std::map<std::string, std::string> indicator_notes;
  for (std::size_t i = 0; i < cells.size(); ++i) {
    const std::string& column = columns[i];
    const std::string& cell = cells[i];
    if (cell.empty()) continue;

    if (column == "timestamp") {
      r.timestamp = cell;
    } else if (column == "frame_id") {
      const auto id = parse_u64(cell);
      if (!id) return fail;
      r.frame_id = *id;
    } else if (column == "session_id") {
      r.session_id = cell;
    } else if (column.starts_with("region_")) {
      const auto v = parse_double(cell);
      if (!v) return fail;
      const auto f = static_cast<float>(*v);
      if (column == "region_x") r.region.bbox.x = f;
      else if (column == "region_y") r.region.bbox.y = f;
      else if (column == "region_w") r.region.bbox.w = f;
      else if (column == "region_h") r.region.bbox.h = f;
      else if (column == "region_confidence") r.region.confidence = f;
    } else if (column == "score") {
      r.score = parse_double(cell);
      if (!r.score) return fail;
    } else if (column == "status") {
      const auto status = hc::parse_status(cell);
      if (!status) return fail;
      r.status = *status;
    } else if (column == "recommendations") {
      r.recommendations = split(cell, kListSeparator);
    } else if (column == "notes") {
      r.indicators.notes = split(cell, kListSeparator);
    } else if (column.starts_with("m.")) {
      const auto dot = column.find('.', 2);
      if (dot == std::string::npos) return fail;
      const std::string group = column.substr(2, dot - 2);
      const std::string key = column.substr(dot + 1);
      if (cell.find(' ') != std::string::npos) {
        std::vector<double> sample;
        for (const auto& part : split(cell, " ")) {
          const auto v = parse_double(part);
          if (!v) return fail;
          sample.push_back(*v);
        }
        r.measurements.set(group, key, std::move(sample));
      } else {
        const auto v = parse_double(cell);
        if (!v) return fail;
        r.measurements.set(group, key, *v);
      }
    } else if (column.starts_with("i.")) {
      const std::string name = column.substr(2);
      if (name.ends_with(kNoteSuffix)) {
        indicator_notes[name.substr(0, name.size() - kNoteSuffix.size())] = cell;
      } else if (const auto v = parse_double(cell)) {
        r.indicators.set(name, *v);
      } else {
        r.indicators.set(name, cell);
      }
    } else if (column.starts_with("t.")) {
      if (const auto trend = hc::parse_trend(cell)) {
        r.trends.emplace(column.substr(2), *trend);
      }
    }
  }

  for (const auto& [name, note] : indicator_notes) {
    const auto value = r.indicators.numeric(name);
    if (!value) return fail;
    r.indicators.set(name, hc::StructuredIndicator{*value, note});
  }
  return r;
}

}  // namespace healthcam::storage
