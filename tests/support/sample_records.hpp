// Sample SessionResults and a scratch directory for storage tests.
#pragma once

#include <healthcam/core/assessment.hpp>
#include <healthcam/core/history_window.hpp>
#include <healthcam/core/indicator.hpp>
#include <healthcam/core/session_result.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace healthcam::test {

inline healthcam::core::SessionResult sample_record(std::uint64_t frame_id) {
  namespace hc = healthcam::core;
  namespace ind = healthcam::core::indicators;
  hc::SessionResult r;
  r.timestamp = "20240102_030405";
  r.frame_id = frame_id;
  r.session_id = "20240102_030000";
  r.region = {{10.f, 20.f, 200.f, 220.f}, 0.9f};
  r.measurements.set("metrics", "face_width", 200.0);
  r.measurements.set("skin", "skin_tone", std::vector<double>{12.0, 80.5, 190.0});
  r.indicators.set(ind::kFacialSymmetry, 0.87);
  r.indicators.set(ind::kEyeFatigue, std::string("Low"));
  r.indicators.set(ind::kSkinToneNote, std::string("Normal, \"even\" tone"));
  r.indicators.set("estimated_stress_level", hc::StructuredIndicator{13.7, "estimate only"});
  r.indicators.notes = {"first note", "second note"};
  r.score = 8.3;
  r.status = hc::HealthStatus::Good;
  r.recommendations = {"Take a break from screen time", "Maintain healthy habits"};
  r.trends = {{std::string(ind::kFacialSymmetry), hc::Trend::Stable}};
  return r;
}

/// Fresh directory under the system temp dir, removed on destruction.
class ScratchDir {
 public:
  ScratchDir() {
    static std::atomic<int> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            ("healthcam_test_" + std::to_string(stamp) + "_" + std::to_string(++counter));
    std::filesystem::create_directories(path_);
  }
  ~ScratchDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  ScratchDir(const ScratchDir&) = delete;
  ScratchDir& operator=(const ScratchDir&) = delete;

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

 private:
  std::filesystem::path path_;
};

}  // namespace healthcam::test
