// Scripted collaborators shared by the app and integration tests.
#pragma once

#include <healthcam/core/error.hpp>
#include <healthcam/core/frame.hpp>
#include <healthcam/core/indicator.hpp>
#include <healthcam/core/measurement.hpp>
#include <healthcam/core/session_result.hpp>
#include <healthcam/storage/storage_backend.hpp>
#include <healthcam/vision/capture_source.hpp>
#include <healthcam/vision/feature_extractor.hpp>
#include <healthcam/vision/frame_display.hpp>
#include <healthcam/vision/indicator_scorer.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace healthcam::test {

inline healthcam::core::Frame make_bgr_frame(std::uint32_t w, std::uint32_t h,
                                             std::uint64_t sequence = 0,
                                             std::byte fill = std::byte{128}) {
  const auto n = healthcam::core::Frame::min_bytes(w, h, healthcam::core::PixelFormat::BGR8);
  return healthcam::core::Frame(w, h, healthcam::core::PixelFormat::BGR8,
                                std::vector<std::byte>(n, fill), sequence);
}

/// Camera producing numbered 64x48 grey frames; fails with CaptureError after
/// \p frames reads (never, if 0).
class FakeCapture : public healthcam::vision::ICaptureSource {
 public:
  explicit FakeCapture(std::uint64_t frames = 0, bool can_open = true,
                       std::chrono::milliseconds read_delay = std::chrono::milliseconds(0))
      : limit_(frames), can_open_(can_open), read_delay_(read_delay) {}

  std::expected<void, healthcam::core::PipelineError> open(int) override {
    if (!can_open_) return std::unexpected(healthcam::core::PipelineError::DeviceUnavailable);
    open_ = true;
    return {};
  }

  std::expected<healthcam::core::Frame, healthcam::core::PipelineError> read_frame() override {
    if (!open_ || (limit_ != 0 && reads_ >= limit_)) {
      return std::unexpected(healthcam::core::PipelineError::CaptureError);
    }
    if (read_delay_.count() > 0) std::this_thread::sleep_for(read_delay_);
    ++reads_;
    return make_bgr_frame(64, 48, reads_);
  }

  void close() override {
    open_ = false;
    ++close_calls;
  }

  bool is_open() const override { return open_; }

  std::atomic<int> close_calls{0};

 private:
  std::uint64_t limit_;
  bool can_open_;
  std::chrono::milliseconds read_delay_;
  std::atomic<bool> open_{false};
  std::uint64_t reads_{0};
};

/// Display that records what was shown and replays scripted key presses.
class FakeDisplay : public healthcam::vision::IFrameDisplay {
 public:
  void show(const healthcam::core::Frame& frame) override { shown.push_back(frame.sequence()); }

  int poll_key(int) override {
    ++polls;
    if (keys.empty()) return -1;
    const int key = keys.front();
    keys.pop_front();
    return key;
  }

  void close() override { closed = true; }

  std::deque<int> keys;
  std::vector<std::uint64_t> shown;
  std::size_t polls{0};
  bool closed{false};
};

/// Extractor returning a fixed bundle, or an error, or throwing.
class FakeExtractor : public healthcam::vision::IFeatureExtractor {
 public:
  std::expected<healthcam::core::MeasurementBundle, healthcam::core::PipelineError> extract(
      const healthcam::core::Frame& frame, const healthcam::core::DetectedRegion&) override {
    std::lock_guard lock(mutex_);
    extracted_frames.push_back(frame.sequence());
    if (throw_on_extract) throw std::runtime_error("extractor exploded");
    if (failure) return std::unexpected(*failure);
    return bundle;
  }

  std::vector<std::uint64_t> frames() const {
    std::lock_guard lock(mutex_);
    return extracted_frames;
  }

  healthcam::core::MeasurementBundle bundle;
  std::optional<healthcam::core::PipelineError> failure;
  bool throw_on_extract{false};

 private:
  mutable std::mutex mutex_;
  std::vector<std::uint64_t> extracted_frames;
};

/// Scorer returning a fixed indicator set, or an error, or throwing.
class FakeScorer : public healthcam::vision::IIndicatorScorer {
 public:
  std::expected<healthcam::core::IndicatorSet, healthcam::core::PipelineError> score(
      const healthcam::core::MeasurementBundle&) override {
    ++calls;
    if (throw_on_score) throw std::runtime_error("scorer exploded");
    if (failure) return std::unexpected(*failure);
    return indicators;
  }

  healthcam::core::IndicatorSet indicators;
  std::optional<healthcam::core::PipelineError> failure;
  bool throw_on_score{false};
  std::atomic<std::size_t> calls{0};
};

/// In-memory storage; can be told to fail the next N saves.
class FakeStorage : public healthcam::storage::IStorageBackend {
 public:
  std::expected<std::filesystem::path, healthcam::core::PipelineError> save(
      std::span<const healthcam::core::SessionResult> records,
      const std::filesystem::path& base_path,
      healthcam::storage::OutputFormat format) override {
    std::lock_guard lock(mutex_);
    ++save_calls;
    if (fail_next > 0) {
      --fail_next;
      return std::unexpected(healthcam::core::PipelineError::StorageError);
    }
    batches.emplace_back(records.begin(), records.end());
    std::filesystem::path target = base_path;
    target += healthcam::storage::format_extension(format);
    paths.push_back(target);
    return target;
  }

  std::expected<std::vector<healthcam::core::SessionResult>, healthcam::core::PipelineError>
  load(const std::filesystem::path&) override {
    return std::unexpected(healthcam::core::PipelineError::UnsupportedFormat);
  }

  std::size_t batch_count() const {
    std::lock_guard lock(mutex_);
    return batches.size();
  }

  std::size_t fail_next{0};
  std::size_t save_calls{0};
  std::vector<std::vector<healthcam::core::SessionResult>> batches;
  std::vector<std::filesystem::path> paths;

 private:
  mutable std::mutex mutex_;
};

/// Indicators that score well on every weighted metric.
inline healthcam::core::IndicatorSet healthy_indicators() {
  namespace ind = healthcam::core::indicators;
  healthcam::core::IndicatorSet s;
  s.set(ind::kFacialSymmetry, 0.92);
  s.set(ind::kEyesLevelSymmetry, 0.9);
  s.set(ind::kEyeFatigue, std::string("Low"));
  s.set(ind::kSkinTexture, 10.0);
  s.set(ind::kGoldenRatioHarmony, 0.95);
  return s;
}

}  // namespace healthcam::test
