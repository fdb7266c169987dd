#include <healthcam/app/config.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <string_view>

namespace healthcam::app {

namespace {

constexpr const char* kDefaultCascade =
    "/usr/share/opencv4/haarcascades/haarcascade_frontalface_default.xml";

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

bool parse_bool(const std::string& value, bool fallback) {
  if (value == "1" || value == "true" || value == "on" || value == "yes") return true;
  if (value == "0" || value == "false" || value == "off" || value == "no") return false;
  spdlog::warn("config: '{}' is not a boolean", value);
  return fallback;
}

/// Runs \p assign, logging instead of propagating std::stoul/std::stod failures.
void numeric(const std::string& key, const std::string& value, const std::function<void()>& assign) {
  try {
    assign();
  } catch (const std::invalid_argument&) {
    spdlog::warn("config: {} = '{}' is not a number; keeping default", key, value);
  } catch (const std::out_of_range&) {
    spdlog::warn("config: {} = '{}' is out of range; keeping default", key, value);
  }
}

}  // namespace

AppConfig default_config() {
  AppConfig c;
  c.cascade_path = kDefaultCascade;
  return c;
}

AppConfig load_config(const std::string& path) {
  AppConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    spdlog::warn("config: cannot read {}; using defaults", path);
    return c;
  }

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "mode") {
      if (value == "continuous") c.mode = RunMode::Continuous;
      else if (value == "session") c.mode = RunMode::Session;
      else spdlog::warn("config: unknown mode '{}'", value);
    }
    else if (key == "device_index") numeric(key, value, [&] { c.device_index = std::stoi(value); });
    else if (key == "output_dir") c.output_dir = value;
    else if (key == "output_format") {
      if (const auto format = healthcam::storage::parse_format(value)) c.output_format = *format;
      else spdlog::warn("config: unknown output_format '{}'", value);
    }
    else if (key == "flush_interval_s") numeric(key, value, [&] { c.flush_interval_s = std::stod(value); });
    else if (key == "use_gpu") c.use_gpu = parse_bool(value, c.use_gpu);
    else if (key == "frame_skip") numeric(key, value, [&] { c.frame_skip = static_cast<std::uint32_t>(std::stoul(value)); });
    else if (key == "overlay") c.overlay = parse_bool(value, c.overlay);
    else if (key == "detector") {
      if (value == "cascade") c.detector = DetectorType::Cascade;
      else if (value == "onnx") c.detector = DetectorType::Onnx;
      else if (value == "mock") c.detector = DetectorType::Mock;
      else spdlog::warn("config: unknown detector '{}'", value);
    }
    else if (key == "cascade_path") c.cascade_path = value;
    else if (key == "eye_cascade_path") c.eye_cascade_path = value;
    else if (key == "model_path") c.model_path = value;
    else if (key == "confidence_threshold") numeric(key, value, [&] { c.confidence_threshold = std::stof(value); });
    else if (key == "countdown_s") numeric(key, value, [&] { c.countdown_s = std::stod(value); });
    else if (key == "idle_sleep_ms") numeric(key, value, [&] { c.idle_sleep_ms = static_cast<std::uint32_t>(std::stoul(value)); });
    else if (key == "flush_poll_ms") numeric(key, value, [&] { c.flush_poll_ms = static_cast<std::uint32_t>(std::stoul(value)); });
    else if (key == "shutdown_timeout_ms") numeric(key, value, [&] { c.shutdown_timeout_ms = static_cast<std::uint32_t>(std::stoul(value)); });
    else if (key == "window_title") c.window_title = value;
    else if (key == "log_level") c.log_level = value;
  }
  return c;
}

std::expected<void, healthcam::core::PipelineError> validate_config(const AppConfig& c) {
  const auto invalid = [](std::string_view what) {
    spdlog::error("config: {}", what);
    return std::unexpected(healthcam::core::PipelineError::InvalidConfig);
  };
  if (c.frame_skip == 0) return invalid("frame_skip must be at least 1");
  if (!(c.flush_interval_s > 0.0)) return invalid("flush_interval_s must be positive");
  if (!(c.countdown_s > 0.0)) return invalid("countdown_s must be positive");
  if (c.confidence_threshold < 0.f || c.confidence_threshold > 1.f) {
    return invalid("confidence_threshold must be within [0, 1]");
  }
  if (c.detector == DetectorType::Onnx && c.model_path.empty()) {
    return invalid("detector=onnx needs model_path");
  }
  if (c.detector == DetectorType::Cascade && c.cascade_path.empty()) {
    return invalid("detector=cascade needs cascade_path");
  }
  return {};
}

void apply_log_level(const std::string& level) {
  const auto parsed = spdlog::level::from_str(level);
  // from_str maps unknown names to off; only accept "off" when asked for.
  if (parsed == spdlog::level::off && level != "off") {
    spdlog::warn("config: unknown log_level '{}'", level);
    return;
  }
  spdlog::set_level(parsed);
}

std::string_view mode_name(RunMode mode) noexcept {
  switch (mode) {
    case RunMode::Continuous:
      return "continuous";
    case RunMode::Session:
      return "session";
  }
  return "unknown";
}

}  // namespace healthcam::app
