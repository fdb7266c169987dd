#include <healthcam/storage/report_writer.hpp>
#include <healthcam/core/assessment.hpp>
#include <healthcam/core/history_window.hpp>
#include <healthcam/core/indicator.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iterator>
#include <string_view>
#include <system_error>

namespace healthcam::storage {

namespace hc = healthcam::core;
namespace ind = healthcam::core::indicators;
namespace fs = std::filesystem;

namespace {

constexpr std::string_view kInsufficient = "Insufficient data: not measured in this capture.";

std::string_view status_summary(hc::HealthStatus status) {
  switch (status) {
    case hc::HealthStatus::Excellent:
      return "Facial analysis indicates excellent overall health markers.";
    case hc::HealthStatus::Good:
      return "Facial analysis shows good health indicators with minor variations from optimal "
             "ranges.";
    case hc::HealthStatus::Fair:
      return "Facial analysis reveals some health indicators that may benefit from attention.";
    case hc::HealthStatus::Concerning:
    case hc::HealthStatus::Poor:
      return "Facial analysis indicates several markers outside their usual ranges.";
    case hc::HealthStatus::InsufficientData:
      return "No scorable indicator was measured, so no overall score is given.";
  }
  return "";
}

std::string_view symmetry_interpretation(double symmetry) {
  if (symmetry >= 0.9) return "Excellent facial symmetry.";
  if (symmetry >= 0.8) return "Good facial symmetry, within normal parameters.";
  if (symmetry >= 0.7) return "Moderate facial asymmetry; minor asymmetry is common.";
  return "Notable facial asymmetry; this can be natural variation.";
}

std::string_view texture_interpretation(double texture) {
  if (texture < 20.0) return "Even skin surface with minimal texture variation.";
  if (texture < 40.0) return "Normal skin texture.";
  if (texture < 60.0) return "Elevated skin texture; may indicate mild dehydration.";
  return "High skin texture variation.";
}

void append_trend(std::string& out, const hc::SessionResult& result, std::string_view metric) {
  if (const auto it = result.trends.find(std::string(metric)); it != result.trends.end()) {
    fmt::format_to(std::back_inserter(out), "**Trend:** {}\n\n", hc::trend_name(it->second));
  }
}

}  // namespace

std::string format_health_report(const hc::SessionResult& result) {
  const auto& s = result.indicators;
  std::string out;
  auto w = std::back_inserter(out);

  fmt::format_to(w, "# Facial Analysis Health Report\n\n");
  fmt::format_to(w, "Analysis Time: {}\n\n", result.timestamp);
  if (!result.session_id.empty()) {
    fmt::format_to(w, "Session: {}\n\n", result.session_id);
  }

  fmt::format_to(w, "## Summary\n\n");
  if (result.score) {
    fmt::format_to(w, "**Overall Facial Health Score: {:.1f}/10** - {}\n\n", *result.score,
                   hc::status_name(result.status));
  } else {
    fmt::format_to(w, "**Overall Facial Health Score: n/a** - {}\n\n",
                   hc::status_name(result.status));
  }
  fmt::format_to(w, "{}\n\n", status_summary(result.status));

  fmt::format_to(w, "## Facial Symmetry\n\n");
  if (const auto sym = s.numeric(ind::kFacialSymmetry)) {
    fmt::format_to(w, "**Symmetry Score:** {:.2f}/1.0\n\n", *sym);
    fmt::format_to(w, "**Interpretation:** {}\n\n", symmetry_interpretation(*sym));
    append_trend(out, result, ind::kFacialSymmetry);
  } else {
    fmt::format_to(w, "{}\n\n", kInsufficient);
  }
  if (const auto level = s.numeric(ind::kEyesLevelSymmetry)) {
    fmt::format_to(w, "**Eye Level Symmetry:** {:.2f}/1.0\n\n", *level);
  }

  fmt::format_to(w, "## Eye Analysis\n\n");
  const auto fatigue = s.label(ind::kEyeFatigue);
  const auto bags = s.label(ind::kEyeBagsEvaluation);
  const auto openness = s.numeric(ind::kEyeOpenness);
  if (!fatigue && !bags && !openness) {
    fmt::format_to(w, "{}\n\n", kInsufficient);
  }
  if (fatigue) {
    fmt::format_to(w, "**Eye Fatigue Level:** {}\n\n", *fatigue);
    append_trend(out, result, ind::kEyeFatigue);
  }
  if (bags) fmt::format_to(w, "**Eye Bags Assessment:** {}\n\n", *bags);
  if (openness) fmt::format_to(w, "**Eye Openness Ratio:** {:.2f}\n\n", *openness);

  fmt::format_to(w, "## Skin Analysis\n\n");
  const auto texture = s.numeric(ind::kSkinTexture);
  const auto tone = s.label(ind::kSkinToneNote);
  if (!texture && !tone) {
    fmt::format_to(w, "{}\n\n", kInsufficient);
  }
  if (texture) {
    fmt::format_to(w, "**Skin Texture Score:** {:.2f}\n\n", *texture);
    fmt::format_to(w, "**Interpretation:** {}\n\n", texture_interpretation(*texture));
  }
  if (tone) fmt::format_to(w, "**Skin Tone Assessment:** {}\n\n", *tone);

  fmt::format_to(w, "## Facial Proportions\n\n");
  const auto fullness = s.numeric(ind::kFacialFullness);
  const auto harmony = s.numeric(ind::kGoldenRatioHarmony);
  if (!fullness && !harmony) {
    fmt::format_to(w, "{}\n\n", kInsufficient);
  }
  if (fullness) {
    fmt::format_to(w, "**Facial Fullness:** {:.2f}\n\n", *fullness);
    if (const auto eval = s.label(ind::kFullnessEvaluation)) {
      fmt::format_to(w, "{}\n\n", *eval);
    }
  }
  if (harmony) fmt::format_to(w, "**Golden Ratio Harmony:** {:.2f}\n\n", *harmony);

  if (!s.notes.empty()) {
    fmt::format_to(w, "## Notes\n\n");
    for (const auto& note : s.notes) fmt::format_to(w, "- {}\n", note);
    fmt::format_to(w, "\n");
  }

  fmt::format_to(w, "## Recommendations\n\n");
  for (const auto& rec : result.recommendations) fmt::format_to(w, "- {}\n", rec);
  fmt::format_to(w, "\n*These indicators are statistical heuristics, not a medical diagnosis.*\n");
  return out;
}

std::expected<fs::path, hc::PipelineError> write_health_report(const hc::SessionResult& result,
                                                               const fs::path& path) {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) return std::unexpected(hc::PipelineError::StorageError);
  }
  fs::path temp = path;
  temp += ".tmp";
  {
    std::ofstream out(temp, std::ios::trunc);
    if (!out) return std::unexpected(hc::PipelineError::StorageError);
    out << format_health_report(result);
    if (!out.flush()) {
      out.close();
      fs::remove(temp, ec);
      return std::unexpected(hc::PipelineError::StorageError);
    }
  }
  fs::rename(temp, path, ec);
  if (ec) {
    spdlog::warn("Report: cannot write {}: {}", path.string(), ec.message());
    std::error_code ignored;
    fs::remove(temp, ignored);
    return std::unexpected(hc::PipelineError::StorageError);
  }
  return path;
}

}  // namespace healthcam::storage
